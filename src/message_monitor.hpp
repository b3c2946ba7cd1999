#pragma once

#include "message.hpp"
#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>

namespace querybus {

// Outcome reporter for one ingested message.
class monitor_callback {
public:
    virtual ~monitor_callback() = default;
    virtual void report_success() = 0;
    virtual void report_failure(std::exception_ptr cause) = 0;
    virtual void report_ignored() = 0;
};

// Notified of every message the bus ingests. Implementations must tolerate
// concurrent calls from any thread.
class message_monitor {
public:
    virtual ~message_monitor() = default;
    virtual std::shared_ptr<monitor_callback> on_message_ingested(const message& msg) = 0;
};

class no_op_message_monitor final : public message_monitor {
public:
    static std::shared_ptr<no_op_message_monitor> instance();

    std::shared_ptr<monitor_callback> on_message_ingested(const message& msg) override;
};

// Counts outcomes with relaxed atomics. Used by the demo's stats loop and by tests.
class counting_message_monitor final : public message_monitor {
public:
    struct stats {
        uint64_t ingested = 0;
        uint64_t succeeded = 0;
        uint64_t failed = 0;
        uint64_t ignored = 0;
    };

    counting_message_monitor();

    std::shared_ptr<monitor_callback> on_message_ingested(const message& msg) override;

    stats get_stats() const;

private:
    struct counters {
        std::atomic<uint64_t> ingested{0};
        std::atomic<uint64_t> succeeded{0};
        std::atomic<uint64_t> failed{0};
        std::atomic<uint64_t> ignored{0};
    };

    // Shared with outstanding callbacks
    std::shared_ptr<counters> m_counters;
};

} // namespace querybus
