#pragma once

#include "backpressure.hpp"
#include "message.hpp"
#include "message_monitor.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>

namespace querybus {

// Callbacks of the single consumer of an update stream. Never invoked
// concurrently with each other; any of them may be left empty.
struct update_consumer {
    std::function<void(const update_ptr&)> on_next;
    std::function<void(std::exception_ptr)> on_error;
    std::function<void()> on_complete;
};

// Live endpoint of an attached subscription query session.
//
// Producers offer signals with next()/complete()/error() and then call
// drain(); the consumer adds demand with request(). Signals are queued in
// offer order and handed to the consumer outside the sink's lock, by
// whichever thread drains first. Completion waits until queued updates are
// delivered; an error is delivered at once and discards queued updates.
//
// An update queued with a monitor callback reports its final outcome there:
// success once the consumer took it, failure if the consumer threw, ignored
// if it was replaced or discarded before delivery.
class update_sink {
public:
    update_sink(backpressure bp, update_consumer consumer, int64_t initial_demand,
                std::shared_ptr<spdlog::logger> log);

    // Queue an update. Returns false if it was dropped by the overflow
    // strategy or the sink is already finishing.
    // Throws update_delivery_failure on overflow under the error strategy
    // or when a bounded buffer is full.
    bool next(update_ptr update, std::shared_ptr<monitor_callback> monitor = nullptr);

    void complete();
    void error(std::exception_ptr cause);

    // Hand queued signals to the consumer as far as demand allows.
    // Returns false if the consumer threw while handling an update; the sink
    // then terminates with an update_delivery_failure.
    bool drain();

    // Add demand and drain. n <= 0 is ignored.
    void request(int64_t n);

    // Detach the consumer; no further callbacks are made.
    void cancel();

    // Runs once, when the sink terminates (completion, error or cancel).
    void on_dispose(std::function<void()> hook);

    // Outstanding demand
    int64_t requested() const;
    std::size_t queued() const;
    bool is_terminated() const;

private:
    struct queued_update {
        update_ptr update;
        std::shared_ptr<monitor_callback> monitor;
    };

    void dispose();
    static void report_discarded(std::deque<queued_update>& discarded);

    std::shared_ptr<spdlog::logger> m_log;
    const backpressure m_bp;
    update_consumer m_consumer;

    mutable std::mutex m_mutex;
    std::deque<queued_update> m_queue;
    int64_t m_demand;
    bool m_draining = false;
    bool m_done = false;            // completion pending behind queued updates
    std::exception_ptr m_error;     // error pending, delivered next
    bool m_terminated = false;      // terminal signal delivered, or cancelled
    bool m_disposed = false;
    std::function<void()> m_dispose_hook;
};

} // namespace querybus
