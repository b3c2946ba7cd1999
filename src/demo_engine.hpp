#pragma once

#include "config.hpp"
#include "message_monitor.hpp"
#include "query_bus.hpp"
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace querybus {

// Price feed demo wired on a query_bus: a direct "price" query with a
// fallback handler, a "quote" scatter-gather over two venues, and one
// "price" subscription query per configured symbol fed from a timer.
class demo_engine {
public:
    demo_engine(asio::io_context& ioc, const config& cfg,
                std::shared_ptr<spdlog::logger> log);

    // Register handlers, run the sample queries, open the subscriptions
    // and start the emit and stats loops.
    void start();

    // Complete every open subscription query. Called during shutdown.
    void stop();

private:
    void register_handlers();
    void run_sample_queries();
    void open_subscriptions();

    std::optional<double> price_of(const std::string& symbol);

    // Random-walk every price and emit it to matching subscriptions
    asio::awaitable<void> emit_loop();

    // Periodic stats logging
    asio::awaitable<void> stats_loop();

    asio::io_context& m_ioc;
    config m_cfg;
    std::shared_ptr<spdlog::logger> m_log;

    std::shared_ptr<counting_message_monitor> m_query_monitor;
    std::shared_ptr<counting_message_monitor> m_update_monitor;
    query_bus m_bus;

    std::vector<registration> m_registrations;
    std::vector<subscription_query_result> m_subscriptions;
    std::vector<std::shared_ptr<update_subscription>> m_consumers;

    std::mutex m_prices_mutex;
    std::map<std::string, double> m_prices;
    std::mt19937 m_rng{std::random_device{}()};

    std::atomic<bool> m_stopped{false};
    std::atomic<uint64_t> m_updates_received{0};
};

} // namespace querybus
