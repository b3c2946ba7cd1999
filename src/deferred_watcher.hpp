#pragma once

#include "query_handler.hpp"
#include <concurrentqueue/moodycamel/blockingconcurrentqueue.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace querybus {

// Waits for deferred handler results on one thread of its own, so no worker
// is held while a handler's answer is outstanding.
//
// Every watch gets exactly one callback: on_ready once its result is ready,
// or on_abandoned if the watcher stops first. Callbacks run on the watcher
// thread and must not block.
class deferred_watcher {
public:
    struct watch {
        deferred_result result;
        std::function<void()> on_ready;
        std::function<void()> on_abandoned;
    };

    struct stats {
        uint64_t completed = 0;
        uint64_t abandoned = 0;
        uint64_t pending = 0;
    };

    deferred_watcher(std::shared_ptr<spdlog::logger> log,
                     std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1));
    ~deferred_watcher();

    void start();

    // Abandon everything still outstanding and join the thread.
    void stop();

    // Throws std::invalid_argument for an invalid result or a missing
    // callback, std::runtime_error if the watcher is not running.
    void add(watch w);

    bool is_running() const { return m_running.load(std::memory_order_relaxed); }
    stats get_stats() const;

private:
    void watch_loop();

    std::shared_ptr<spdlog::logger> m_log;
    const std::chrono::milliseconds m_poll_interval;
    std::atomic<bool> m_running{false};

    // A watch without on_ready is the stop signal
    moodycamel::BlockingConcurrentQueue<watch> m_incoming;
    std::thread m_thread;

    std::atomic<uint64_t> m_completed{0};
    std::atomic<uint64_t> m_abandoned{0};
    std::atomic<uint64_t> m_pending{0};
};

} // namespace querybus
