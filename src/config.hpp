#pragma once

#include "backpressure.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace querybus {

struct config {
    // Operational
    std::string log_level = "info";
    int stats_interval_seconds = 10;

    // Worker threads for scatter-gather and deferred results (0 = hardware_concurrency)
    unsigned int worker_threads = 0;

    // Shared deadline of one scatter-gather call
    uint32_t scatter_gather_timeout_ms = 1000;

    // Backpressure of the demo's subscription queries
    backpressure updates;

    // Demo price feed
    uint32_t emit_interval_ms = 500;
    std::vector<std::string> symbols;
};

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse config from YAML text. Throws on error.
config load_config_string(const std::string& yaml);

// Returns true for the levels log_level accepts.
bool is_valid_log_level(const std::string& level);

} // namespace querybus
