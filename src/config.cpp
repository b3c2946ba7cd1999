#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace querybus {

namespace {

config parse_config(const YAML::Node& root) {
    config cfg;

    // Operational
    if (auto n = root["log_level"]) {
        cfg.log_level = n.as<std::string>();
        if (!is_valid_log_level(cfg.log_level)) {
            throw std::runtime_error("config: invalid 'log_level': " + cfg.log_level);
        }
    }
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (cfg.stats_interval_seconds <= 0) {
        throw std::runtime_error("config: 'stats_interval_seconds' must be positive");
    }

    if (auto n = root["worker_threads"]) cfg.worker_threads = n.as<unsigned int>();

    // Dispatch
    if (auto n = root["scatter_gather_timeout_ms"]) cfg.scatter_gather_timeout_ms = n.as<uint32_t>();

    if (auto bp = root["backpressure"]) {
        if (!bp.IsMap()) throw std::runtime_error("config: 'backpressure' must be a map");
        if (auto n = bp["strategy"]) {
            auto strategy = parse_overflow_strategy(n.as<std::string>());
            if (!strategy) {
                throw std::runtime_error("config: invalid 'backpressure.strategy': " + n.as<std::string>());
            }
            cfg.updates.strategy = *strategy;
        }
        if (auto n = bp["buffer_size"]) {
            auto size = n.as<uint64_t>();
            if (size == 0) throw std::runtime_error("config: 'backpressure.buffer_size' must be positive");
            cfg.updates.buffer_size = static_cast<std::size_t>(size);
        }
    }

    // Demo feed
    if (auto n = root["emit_interval_ms"]) cfg.emit_interval_ms = n.as<uint32_t>();
    if (cfg.emit_interval_ms == 0) {
        throw std::runtime_error("config: 'emit_interval_ms' must be positive");
    }

    // Symbols (required)
    if (auto symbols = root["symbols"]) {
        if (!symbols.IsSequence()) throw std::runtime_error("config: 'symbols' must be a list");
        for (const auto& item : symbols) {
            cfg.symbols.push_back(item.as<std::string>());
        }
    } else {
        throw std::runtime_error("config: 'symbols' is required");
    }

    if (cfg.symbols.empty()) {
        throw std::runtime_error("config: 'symbols' must not be empty");
    }

    return cfg;
}

} // anonymous namespace

bool is_valid_log_level(const std::string& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

config load_config(const std::string& path) {
    return parse_config(YAML::LoadFile(path));
}

config load_config_string(const std::string& yaml) {
    return parse_config(YAML::Load(yaml));
}

} // namespace querybus
