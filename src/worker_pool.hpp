#pragma once

#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace querybus {

// Fixed set of threads running submitted tasks. Runs scatter-gather handler
// attempts and the continuations of deferred handler results.
class worker_pool {
public:
    using task = std::function<void()>;

    struct stats {
        uint64_t executed = 0;
        uint64_t failed = 0;
        std::size_t queue_depth = 0;
    };

    // thread_count 0 = hardware_concurrency
    worker_pool(unsigned int thread_count, std::shared_ptr<spdlog::logger> log);
    ~worker_pool();

    // Spawn the worker threads. Later calls are no-ops.
    void start();

    // Signal workers to stop, drain the queue, and join threads.
    void stop();

    // Enqueue a task. Throws std::runtime_error if the pool is not running.
    void submit(task t);

    bool is_running() const { return m_running.load(std::memory_order_relaxed); }
    unsigned int thread_count() const { return m_thread_count; }

    // Approximate queue depth.
    std::size_t queue_depth() const;

    // Atomically read aggregate stats from all workers.
    stats get_stats() const;

private:
    void worker_loop(unsigned int worker_id);

    std::shared_ptr<spdlog::logger> m_log;

    unsigned int m_thread_count;
    std::atomic<bool> m_running{false};

    // Empty task = poison pill
    moodycamel::BlockingConcurrentQueue<task> m_queue;
    std::vector<std::thread> m_threads;

    // Aggregate stats (relaxed atomics)
    std::atomic<uint64_t> m_executed{0};
    std::atomic<uint64_t> m_failed{0};
};

} // namespace querybus
