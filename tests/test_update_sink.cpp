#include "update_sink.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <memory>
#include <vector>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// Collects everything a sink hands to its consumer.
struct recorder {
    std::vector<int> values;
    int completions = 0;
    std::vector<std::exception_ptr> errors;

    querybus::update_consumer consumer() {
        querybus::update_consumer c;
        c.on_next = [this](const querybus::update_ptr& u) { values.push_back(u->payload_as<int>()); };
        c.on_error = [this](std::exception_ptr e) { errors.push_back(e); };
        c.on_complete = [this] { ++completions; };
        return c;
    }
};

querybus::backpressure with(querybus::overflow_strategy strategy,
                            std::size_t buffer_size = querybus::unbounded_buffer) {
    return querybus::backpressure{strategy, buffer_size};
}

void offer(querybus::update_sink& sink, std::initializer_list<int> values) {
    for (int v : values) sink.next(querybus::make_update(v));
    sink.drain();
}

} // namespace

TEST(update_sink, delivers_in_order_with_unbounded_demand) {
    recorder r;
    querybus::update_sink sink({}, r.consumer(), querybus::unbounded_demand, make_log());

    offer(sink, {1, 2, 3});
    EXPECT_EQ(r.values, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(sink.requested(), querybus::unbounded_demand);
}

TEST(update_sink, delivers_only_what_was_requested) {
    recorder r;
    querybus::update_sink sink({}, r.consumer(), 1, make_log());

    offer(sink, {1, 2, 3});
    EXPECT_EQ(r.values, (std::vector<int>{1}));
    EXPECT_EQ(sink.queued(), 2u);
    EXPECT_EQ(sink.requested(), 0);

    sink.request(1);
    EXPECT_EQ(r.values, (std::vector<int>{1, 2}));

    sink.request(5);
    EXPECT_EQ(r.values, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(sink.requested(), 4);
}

TEST(update_sink, completion_waits_for_queued_updates) {
    recorder r;
    querybus::update_sink sink({}, r.consumer(), 0, make_log());

    sink.next(querybus::make_update(1));
    sink.next(querybus::make_update(2));
    sink.complete();
    sink.drain();
    EXPECT_TRUE(r.values.empty());
    EXPECT_EQ(r.completions, 0);
    EXPECT_FALSE(sink.is_terminated());

    sink.request(2);
    EXPECT_EQ(r.values, (std::vector<int>{1, 2}));
    EXPECT_EQ(r.completions, 1);
    EXPECT_TRUE(sink.is_terminated());
}

TEST(update_sink, error_discards_queued_updates) {
    recorder r;
    querybus::update_sink sink({}, r.consumer(), 0, make_log());

    sink.next(querybus::make_update(1));
    sink.error(std::make_exception_ptr(std::runtime_error("source failed")));
    sink.drain();

    EXPECT_TRUE(r.values.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_THROW(std::rethrow_exception(r.errors[0]), std::runtime_error);
    EXPECT_TRUE(sink.is_terminated());
}

TEST(update_sink, no_signals_after_termination) {
    recorder r;
    querybus::update_sink sink({}, r.consumer(), querybus::unbounded_demand, make_log());

    sink.complete();
    sink.drain();
    EXPECT_FALSE(sink.next(querybus::make_update(1)));
    sink.error(std::make_exception_ptr(std::runtime_error("late")));
    sink.drain();

    EXPECT_TRUE(r.values.empty());
    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(r.completions, 1);
}

TEST(update_sink, drop_discards_updates_beyond_demand) {
    recorder r;
    querybus::update_sink sink(with(querybus::overflow_strategy::drop), r.consumer(), 1, make_log());

    EXPECT_TRUE(sink.next(querybus::make_update(1)));
    EXPECT_FALSE(sink.next(querybus::make_update(2)));
    sink.drain();
    sink.request(1);

    EXPECT_EQ(r.values, (std::vector<int>{1}));
}

TEST(update_sink, latest_keeps_newest_update_beyond_demand) {
    recorder r;
    querybus::update_sink sink(with(querybus::overflow_strategy::latest), r.consumer(), 0, make_log());

    offer(sink, {1, 2, 3});
    EXPECT_EQ(sink.queued(), 1u);

    sink.request(1);
    EXPECT_EQ(r.values, (std::vector<int>{3}));
}

TEST(update_sink, error_strategy_rejects_update_without_demand) {
    recorder r;
    querybus::update_sink sink(with(querybus::overflow_strategy::error), r.consumer(), 0, make_log());

    EXPECT_THROW(sink.next(querybus::make_update(1)), querybus::update_delivery_failure);
}

TEST(update_sink, bounded_buffer_overflows) {
    recorder r;
    querybus::update_sink sink(with(querybus::overflow_strategy::buffer, 2), r.consumer(), 0, make_log());

    EXPECT_TRUE(sink.next(querybus::make_update(1)));
    EXPECT_TRUE(sink.next(querybus::make_update(2)));
    EXPECT_THROW(sink.next(querybus::make_update(3)), querybus::update_delivery_failure);
}

TEST(update_sink, ignore_delivers_regardless_of_demand) {
    recorder r;
    querybus::update_sink sink(with(querybus::overflow_strategy::ignore), r.consumer(), 0, make_log());

    offer(sink, {1, 2});
    EXPECT_EQ(r.values, (std::vector<int>{1, 2}));
}

TEST(update_sink, throwing_consumer_terminates_with_delivery_failure) {
    recorder r;
    auto consumer = r.consumer();
    consumer.on_next = [](const querybus::update_ptr&) { throw std::runtime_error("consumer bug"); };
    querybus::update_sink sink({}, consumer, querybus::unbounded_demand, make_log());

    sink.next(querybus::make_update(1));
    sink.next(querybus::make_update(2));
    EXPECT_FALSE(sink.drain());

    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_THROW(std::rethrow_exception(r.errors[0]), querybus::update_delivery_failure);
    EXPECT_TRUE(sink.is_terminated());
    EXPECT_EQ(sink.queued(), 0u);
}

TEST(update_sink, consumer_may_request_from_callback) {
    std::vector<int> values;
    std::shared_ptr<querybus::update_sink> sink;

    querybus::update_consumer consumer;
    consumer.on_next = [&](const querybus::update_ptr& u) {
        values.push_back(u->payload_as<int>());
        sink->request(1);
    };
    sink = std::make_shared<querybus::update_sink>(querybus::backpressure{}, consumer, 1, make_log());

    offer(*sink, {1, 2, 3});
    EXPECT_EQ(values, (std::vector<int>{1, 2, 3}));
}

TEST(update_sink, cancel_runs_dispose_hook_once) {
    recorder r;
    querybus::update_sink sink({}, r.consumer(), 0, make_log());
    int disposed = 0;
    sink.on_dispose([&disposed] { ++disposed; });

    sink.next(querybus::make_update(1));
    sink.cancel();
    sink.cancel();
    sink.request(1);

    EXPECT_EQ(disposed, 1);
    EXPECT_TRUE(r.values.empty());
    EXPECT_EQ(r.completions, 0);
    EXPECT_FALSE(sink.next(querybus::make_update(2)));
}

TEST(update_sink, completion_runs_dispose_hook) {
    recorder r;
    querybus::update_sink sink({}, r.consumer(), querybus::unbounded_demand, make_log());
    int disposed = 0;
    sink.on_dispose([&disposed] { ++disposed; });

    sink.complete();
    sink.drain();
    EXPECT_EQ(disposed, 1);

    // A hook added after disposal runs at once
    sink.on_dispose([&disposed] { ++disposed; });
    EXPECT_EQ(disposed, 2);
}

TEST(update_sink, monitor_sees_delivery_outcomes) {
    auto monitor = std::make_shared<querybus::counting_message_monitor>();
    recorder r;
    querybus::update_sink sink(with(querybus::overflow_strategy::latest), r.consumer(), 0, make_log());

    auto offer_monitored = [&](int v) {
        auto update = querybus::make_update(v);
        return sink.next(update, monitor->on_message_ingested(*update));
    };

    // Demand 0: the second update replaces the first
    EXPECT_TRUE(offer_monitored(1));
    EXPECT_TRUE(offer_monitored(2));
    EXPECT_EQ(monitor->get_stats().ignored, 1u);
    EXPECT_EQ(monitor->get_stats().succeeded, 0u);

    sink.request(1);
    EXPECT_EQ(r.values, (std::vector<int>{2}));
    EXPECT_EQ(monitor->get_stats().succeeded, 1u);

    EXPECT_TRUE(offer_monitored(3));
    sink.cancel();
    EXPECT_EQ(monitor->get_stats().ignored, 2u);
}

TEST(update_sink, consumer_failure_reaches_the_monitor) {
    auto monitor = std::make_shared<querybus::counting_message_monitor>();
    recorder r;
    auto consumer = r.consumer();
    consumer.on_next = [](const querybus::update_ptr&) { throw 42; };
    querybus::update_sink sink({}, consumer, querybus::unbounded_demand, make_log());

    auto update = querybus::make_update(1);
    sink.next(update, monitor->on_message_ingested(*update));
    EXPECT_FALSE(sink.drain());

    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_THROW(std::rethrow_exception(r.errors[0]), querybus::update_delivery_failure);
    EXPECT_EQ(monitor->get_stats().failed, 1u);
    EXPECT_TRUE(sink.is_terminated());
}
