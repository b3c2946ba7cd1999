#include "config.hpp"
#include "backpressure.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(config_parsing, parse_overflow_strategy) {
    EXPECT_EQ(querybus::parse_overflow_strategy("buffer"), querybus::overflow_strategy::buffer);
    EXPECT_EQ(querybus::parse_overflow_strategy("drop"),   querybus::overflow_strategy::drop);
    EXPECT_EQ(querybus::parse_overflow_strategy("latest"), querybus::overflow_strategy::latest);
    EXPECT_EQ(querybus::parse_overflow_strategy("error"),  querybus::overflow_strategy::error);
    EXPECT_EQ(querybus::parse_overflow_strategy("ignore"), querybus::overflow_strategy::ignore);
    EXPECT_FALSE(querybus::parse_overflow_strategy("block").has_value());
}

TEST(config_parsing, strategy_names_round_trip) {
    for (auto s : {querybus::overflow_strategy::buffer, querybus::overflow_strategy::drop,
                   querybus::overflow_strategy::latest, querybus::overflow_strategy::error,
                   querybus::overflow_strategy::ignore}) {
        EXPECT_EQ(querybus::parse_overflow_strategy(querybus::to_string(s)), s);
    }
}

TEST(config_parsing, minimal_config_uses_defaults) {
    auto cfg = querybus::load_config_string("symbols: [ACME]\n");

    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.worker_threads, 0u);
    EXPECT_EQ(cfg.scatter_gather_timeout_ms, 1000u);
    EXPECT_EQ(cfg.updates.strategy, querybus::overflow_strategy::buffer);
    EXPECT_EQ(cfg.updates.buffer_size, querybus::unbounded_buffer);
    EXPECT_EQ(cfg.emit_interval_ms, 500u);
    EXPECT_EQ(cfg.stats_interval_seconds, 10);
    ASSERT_EQ(cfg.symbols.size(), 1u);
    EXPECT_EQ(cfg.symbols[0], "ACME");
}

TEST(config_parsing, full_config) {
    auto cfg = querybus::load_config_string(
        "log_level: debug\n"
        "worker_threads: 4\n"
        "scatter_gather_timeout_ms: 250\n"
        "backpressure:\n"
        "  strategy: latest\n"
        "  buffer_size: 64\n"
        "emit_interval_ms: 100\n"
        "stats_interval_seconds: 5\n"
        "symbols:\n"
        "  - ACME\n"
        "  - INITECH\n");

    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.worker_threads, 4u);
    EXPECT_EQ(cfg.scatter_gather_timeout_ms, 250u);
    EXPECT_EQ(cfg.updates.strategy, querybus::overflow_strategy::latest);
    EXPECT_EQ(cfg.updates.buffer_size, 64u);
    EXPECT_EQ(cfg.emit_interval_ms, 100u);
    EXPECT_EQ(cfg.stats_interval_seconds, 5);
    EXPECT_EQ(cfg.symbols, (std::vector<std::string>{"ACME", "INITECH"}));
}

TEST(config_parsing, symbols_are_required) {
    EXPECT_THROW(querybus::load_config_string("log_level: info\n"), std::runtime_error);
    EXPECT_THROW(querybus::load_config_string("symbols: []\n"), std::runtime_error);
    EXPECT_THROW(querybus::load_config_string("symbols: ACME\n"), std::runtime_error);
}

TEST(config_parsing, rejects_unknown_strategy) {
    EXPECT_THROW(querybus::load_config_string(
        "symbols: [ACME]\n"
        "backpressure:\n"
        "  strategy: block\n"), std::runtime_error);
}

TEST(config_parsing, rejects_invalid_values) {
    EXPECT_THROW(querybus::load_config_string("symbols: [ACME]\nlog_level: loud\n"), std::runtime_error);
    EXPECT_THROW(querybus::load_config_string(
        "symbols: [ACME]\nbackpressure:\n  buffer_size: 0\n"), std::runtime_error);
    EXPECT_THROW(querybus::load_config_string("symbols: [ACME]\nemit_interval_ms: 0\n"), std::runtime_error);
}

TEST(config_parsing, missing_file_throws) {
    EXPECT_THROW(querybus::load_config("/nonexistent/querybus.yaml"), std::exception);
}
