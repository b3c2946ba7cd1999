#include "deferred_watcher.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <any>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// Spin until `done` holds or a second has passed.
template <typename F>
bool eventually(F done) {
    auto until = std::chrono::steady_clock::now() + 1s;
    while (!done()) {
        if (std::chrono::steady_clock::now() > until) return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

} // namespace

TEST(deferred_watcher, calls_on_ready_once_result_arrives) {
    querybus::deferred_watcher watcher(make_log());
    watcher.start();

    std::promise<std::any> inner;
    std::atomic<int> ready{0};
    std::atomic<int> abandoned{0};
    watcher.add({inner.get_future().share(), [&ready] { ++ready; }, [&abandoned] { ++abandoned; }});

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(ready.load(), 0);
    EXPECT_EQ(watcher.get_stats().pending, 1u);

    inner.set_value(std::any(std::string("late")));
    EXPECT_TRUE(eventually([&] { return ready.load() == 1; }));

    watcher.stop();
    EXPECT_EQ(abandoned.load(), 0);
    EXPECT_EQ(watcher.get_stats().completed, 1u);
    EXPECT_EQ(watcher.get_stats().pending, 0u);
}

TEST(deferred_watcher, stop_abandons_outstanding_results) {
    querybus::deferred_watcher watcher(make_log());
    watcher.start();

    std::promise<std::any> never;
    std::atomic<int> ready{0};
    std::atomic<int> abandoned{0};
    watcher.add({never.get_future().share(), [&ready] { ++ready; }, [&abandoned] { ++abandoned; }});

    watcher.stop();
    EXPECT_EQ(ready.load(), 0);
    EXPECT_EQ(abandoned.load(), 1);
    EXPECT_EQ(watcher.get_stats().abandoned, 1u);
}

TEST(deferred_watcher, rejects_invalid_watches) {
    querybus::deferred_watcher watcher(make_log());

    std::promise<std::any> inner;
    auto result = inner.get_future().share();
    EXPECT_THROW(watcher.add({result, [] {}, [] {}}), std::runtime_error);

    watcher.start();
    EXPECT_THROW(watcher.add({querybus::deferred_result{}, [] {}, [] {}}), std::invalid_argument);
    EXPECT_THROW(watcher.add({result, nullptr, [] {}}), std::invalid_argument);
    watcher.stop();
}

TEST(deferred_watcher, failing_callback_does_not_stop_the_watcher) {
    querybus::deferred_watcher watcher(make_log());
    watcher.start();

    std::promise<std::any> first;
    first.set_value(std::any(1));
    watcher.add({first.get_future().share(), [] { throw 7; }, [] {}});

    std::promise<std::any> second;
    second.set_value(std::any(2));
    std::atomic<bool> delivered{false};
    watcher.add({second.get_future().share(), [&delivered] { delivered = true; }, [] {}});

    EXPECT_TRUE(eventually([&] { return delivered.load(); }));
    watcher.stop();
    EXPECT_EQ(watcher.get_stats().completed, 2u);
}
