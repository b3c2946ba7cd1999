#include "config.hpp"
#include "demo_engine.hpp"
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    cxxopts::Options options("querybus_demo",
        "In-process query bus demo: direct, scatter-gather and subscription queries");

    options.add_options()
        ("c,config", "YAML config with the symbols to serve", cxxopts::value<std::string>())
        ("w,workers", "Worker threads, 0 for one per core", cxxopts::value<unsigned int>())
        ("l,log-level", "debug, info, warn or error", cxxopts::value<std::string>())
        ("h,help", "Show usage");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 1;
    }
    const auto& args = *parsed;

    if (args.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    if (!args.count("config")) {
        std::cerr << "--config is required\n" << options.help() << std::endl;
        return 1;
    }

    auto console = spdlog::stdout_color_mt("querybus");

    querybus::config cfg;
    try {
        cfg = querybus::load_config(args["config"].as<std::string>());
        if (args.count("workers")) cfg.worker_threads = args["workers"].as<unsigned int>();
        if (args.count("log-level")) {
            auto level = args["log-level"].as<std::string>();
            if (!querybus::is_valid_log_level(level)) {
                throw std::runtime_error("unknown log level '" + level + "'");
            }
            cfg.log_level = level;
        }
    } catch (const std::exception& e) {
        console->error("startup: {}", e.what());
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    console->info("querybus_demo: {} symbols, workers={}, scatter-gather {}ms, updates {} every {}ms",
                  cfg.symbols.size(), cfg.worker_threads, cfg.scatter_gather_timeout_ms,
                  querybus::to_string(cfg.updates.strategy), cfg.emit_interval_ms);

    asio::io_context ioc(1);
    auto engine = std::make_shared<querybus::demo_engine>(ioc, cfg, console);

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, int signo) {
        console->info("signal {}, completing subscriptions", signo);
        engine->stop();
        ioc.stop();
    });

    engine->start();
    ioc.run();

    // Dropping the engine stops the bus and joins its workers
    engine.reset();
    console->info("querybus_demo stopped");
    return 0;
}
