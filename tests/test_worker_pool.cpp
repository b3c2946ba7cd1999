#include "worker_pool.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace

TEST(worker_pool, runs_submitted_tasks) {
    querybus::worker_pool pool(2, make_log());
    pool.start();

    std::atomic<int> done{0};
    std::promise<void> last;
    for (int i = 0; i < 9; ++i) {
        pool.submit([&done] { ++done; });
    }
    pool.submit([&last] { last.set_value(); });

    last.get_future().wait();
    pool.stop();

    EXPECT_EQ(done.load(), 9);
    EXPECT_EQ(pool.get_stats().executed, 10u);
    EXPECT_EQ(pool.get_stats().failed, 0u);
}

TEST(worker_pool, failing_task_is_counted_and_pool_survives) {
    querybus::worker_pool pool(1, make_log());
    pool.start();

    pool.submit([] { throw std::runtime_error("task failed"); });

    std::promise<int> after;
    pool.submit([&after] { after.set_value(1); });
    EXPECT_EQ(after.get_future().get(), 1);

    pool.stop();
    EXPECT_EQ(pool.get_stats().failed, 1u);
    EXPECT_EQ(pool.get_stats().executed, 2u);
}

TEST(worker_pool, submit_requires_running_pool) {
    querybus::worker_pool pool(1, make_log());

    EXPECT_THROW(pool.submit([] {}), std::runtime_error);

    pool.start();
    EXPECT_TRUE(pool.is_running());
    pool.stop();
    EXPECT_FALSE(pool.is_running());
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
}

TEST(worker_pool, empty_task_is_rejected) {
    querybus::worker_pool pool(1, make_log());
    pool.start();

    EXPECT_THROW(pool.submit(querybus::worker_pool::task{}), std::invalid_argument);
}

TEST(worker_pool, zero_threads_uses_hardware_concurrency) {
    querybus::worker_pool pool(0, make_log());

    unsigned int expected = std::thread::hardware_concurrency();
    EXPECT_EQ(pool.thread_count(), expected > 0 ? expected : 1u);
}

TEST(worker_pool, start_and_stop_are_idempotent) {
    querybus::worker_pool pool(2, make_log());
    pool.start();
    pool.start();
    EXPECT_EQ(pool.thread_count(), 2u);

    pool.stop();
    pool.stop();
    EXPECT_FALSE(pool.is_running());
}

TEST(worker_pool, non_standard_exception_is_counted) {
    querybus::worker_pool pool(1, make_log());
    pool.start();

    pool.submit([] { throw 42; });

    std::promise<int> after;
    pool.submit([&after] { after.set_value(1); });
    EXPECT_EQ(after.get_future().get(), 1);

    pool.stop();
    EXPECT_EQ(pool.get_stats().failed, 1u);
}
