#include "demo_engine.hpp"
#include "errors.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <algorithm>
#include <chrono>
#include <future>
#include <thread>
#include <utility>

namespace querybus {

using nlohmann::json;

demo_engine::demo_engine(asio::io_context& ioc, const config& cfg,
                         std::shared_ptr<spdlog::logger> log)
    : m_ioc(ioc), m_cfg(cfg), m_log(std::move(log)),
      m_query_monitor(std::make_shared<counting_message_monitor>()),
      m_update_monitor(std::make_shared<counting_message_monitor>()),
      m_bus(m_log, bus_options{m_query_monitor, m_update_monitor, nullptr, nullptr, cfg.worker_threads})
{
    double start_price = 100.0;
    for (const auto& symbol : m_cfg.symbols) {
        m_prices[symbol] = start_price;
        start_price += 10.0;
    }

    // Tag every query with a correlation id
    m_registrations.push_back(m_bus.register_dispatch_interceptor(
        [](std::shared_ptr<const query_message> query) {
            if (query->metadata().count("correlation_id")) return query;
            return query->and_metadata({{"correlation_id", query->identifier()}});
        }));

    auto logging = std::make_shared<logging_interceptor>(m_log);
    m_registrations.push_back(m_bus.register_dispatch_interceptor(
        [logging](std::shared_ptr<const query_message> query) {
            return logging->on_dispatch(std::move(query));
        }));
    m_registrations.push_back(m_bus.register_handler_interceptor(logging));
}

std::optional<double> demo_engine::price_of(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(m_prices_mutex);
    auto it = m_prices.find(symbol);
    if (it == m_prices.end()) return std::nullopt;
    return it->second;
}

void demo_engine::start() {
    register_handlers();
    run_sample_queries();
    open_subscriptions();

    asio::co_spawn(m_ioc, emit_loop(), asio::detached);
    asio::co_spawn(m_ioc, stats_loop(), asio::detached);

    m_log->info("Demo engine started ({} symbols, {} handlers, {} subscription queries)",
               m_cfg.symbols.size(), m_bus.registry().subscription_count(),
               m_subscriptions.size());
}

void demo_engine::stop() {
    if (m_stopped.exchange(true)) return;

    m_bus.emitter().complete([](const subscription_query_message&) { return true; });
    m_log->info("Completed {} subscription queries", m_subscriptions.size());
}

void demo_engine::register_handlers() {
    // Price feed: declines symbols it does not track
    m_registrations.push_back(m_bus.subscribe("price", typeid(json), make_handler(
        [this](const query_message& query) -> std::any {
            auto symbol = query.payload_as<json>().at("symbol").get<std::string>();
            auto price = price_of(symbol);
            if (!price) throw handler_declined("symbol not tracked: " + symbol);
            return json{{"symbol", symbol}, {"price", *price}, {"source", "feed"}};
        })));

    // Fallback: answers every symbol, without a price
    m_registrations.push_back(m_bus.subscribe("price", typeid(json), make_handler(
        [](const query_message& query) -> std::any {
            const auto& request = query.payload_as<json>();
            return json{{"symbol", request.value("symbol", "")}, {"price", nullptr}, {"source", "fallback"}};
        })));

    // Venue A quotes synchronously
    m_registrations.push_back(m_bus.subscribe("quote", typeid(json), make_handler(
        [this](const query_message& query) -> std::any {
            auto symbol = query.payload_as<json>().at("symbol").get<std::string>();
            auto price = price_of(symbol);
            if (!price) throw handler_declined("symbol not quoted: " + symbol);
            return json{{"venue", "venue-a"}, {"symbol", symbol},
                        {"bid", *price - 0.01}, {"ask", *price + 0.01}};
        })));

    // Venue B answers with a deferred result
    m_registrations.push_back(m_bus.subscribe("quote", typeid(json), make_handler(
        [this](const query_message& query) -> std::any {
            auto symbol = query.payload_as<json>().at("symbol").get<std::string>();
            auto price = price_of(symbol);
            if (!price) throw handler_declined("symbol not quoted: " + symbol);

            double mid = *price;
            deferred_result pending = std::async(std::launch::async, [symbol, mid]() -> std::any {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                return json{{"venue", "venue-b"}, {"symbol", symbol},
                            {"bid", mid - 0.02}, {"ask", mid + 0.02}};
            }).share();
            return pending;
        })));
}

void demo_engine::run_sample_queries() {
    const auto& symbol = m_cfg.symbols.front();

    for (const auto& requested : {symbol, std::string("UNLISTED")}) {
        try {
            auto response = m_bus.query(make_query(
                "price", json{{"symbol", requested}}, instance_of<json>())).get();
            m_log->info("price({}) = {}", requested, response.payload_as<json>().dump());
        } catch (const std::exception&) {
            m_log->error("price({}) failed: {}", requested, describe(std::current_exception()));
        }
    }

    auto quotes = m_bus.scatter_gather(
        make_query("quote", json{{"symbol", symbol}}, instance_of<json>()),
        std::chrono::milliseconds(m_cfg.scatter_gather_timeout_ms));

    std::size_t collected = 0;
    for (const auto& quote : quotes) {
        m_log->info("quote({}) = {}", symbol, quote.payload_as<json>().dump());
        ++collected;
    }
    m_log->info("Scatter-gather for '{}' collected {} quotes", symbol, collected);
}

void demo_engine::open_subscriptions() {
    for (const auto& symbol : m_cfg.symbols) {
        auto result = m_bus.subscription_query(
            make_subscription_query("price", json{{"symbol", symbol}},
                                    instance_of<json>(), instance_of<json>()),
            m_cfg.updates);

        try {
            auto initial = result.initial_result().get();
            m_log->info("Initial price for {}: {}", symbol, initial.payload_as<json>().dump());
        } catch (const std::exception&) {
            m_log->warn("No initial price for {}: {}", symbol, describe(std::current_exception()));
        }

        update_consumer consumer;
        consumer.on_next = [this, symbol](const update_ptr& update) {
            m_updates_received.fetch_add(1, std::memory_order_relaxed);
            m_log->debug("{} -> {}", symbol, update->payload_as<json>().dump());
        };
        consumer.on_error = [this, symbol](std::exception_ptr error) {
            m_log->warn("Updates for {} failed: {}", symbol, describe(error));
        };
        consumer.on_complete = [this, symbol] {
            m_log->info("Updates for {} completed", symbol);
        };

        try {
            m_consumers.push_back(result.updates().subscribe(std::move(consumer)));
        } catch (const std::logic_error& e) {
            m_log->error("Cannot follow updates for {}: {}", symbol, e.what());
            continue;
        }
        m_subscriptions.push_back(std::move(result));
    }
}

asio::awaitable<void> demo_engine::emit_loop() {
    asio::steady_timer timer(co_await asio::this_coro::executor);
    std::normal_distribution<double> step(0.0, 0.5);

    while (!m_stopped.load()) {
        timer.expires_after(std::chrono::milliseconds(m_cfg.emit_interval_ms));
        co_await timer.async_wait(asio::use_awaitable);
        if (m_stopped.load()) break;

        std::vector<std::pair<std::string, double>> ticks;
        {
            std::lock_guard<std::mutex> lock(m_prices_mutex);
            for (auto& [symbol, price] : m_prices) {
                price = std::max(0.01, price + step(m_rng));
                ticks.emplace_back(symbol, price);
            }
        }

        for (const auto& tick : ticks) {
            const std::string symbol = tick.first;
            m_bus.emitter().emit(
                payload_matches<json>([symbol](const json& request) {
                    return request.value("symbol", "") == symbol;
                }),
                make_update(json{{"symbol", symbol}, {"price", tick.second}}));
        }
    }
}

asio::awaitable<void> demo_engine::stats_loop() {
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (!m_stopped.load()) {
        timer.expires_after(std::chrono::seconds(m_cfg.stats_interval_seconds));
        co_await timer.async_wait(asio::use_awaitable);

        auto qs = m_query_monitor->get_stats();
        auto us = m_update_monitor->get_stats();
        auto ws = m_bus.workers().get_stats();

        m_log->info("stats: queries={} succeeded={} failed={} ignored={} updates={} offered={} dropped={} "
                    "update_failures={} received={} sessions={} queue_depth={}",
                   qs.ingested, qs.succeeded, qs.failed, qs.ignored,
                   us.ingested, us.succeeded, us.ignored, us.failed,
                   m_updates_received.load(),
                   m_bus.emitter().active_sessions(),
                   ws.queue_depth);
    }
}

} // namespace querybus
