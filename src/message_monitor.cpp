#include "message_monitor.hpp"

namespace querybus {

namespace {

class no_op_callback final : public monitor_callback {
public:
    void report_success() override {}
    void report_failure(std::exception_ptr) override {}
    void report_ignored() override {}
};

} // anonymous namespace

std::shared_ptr<no_op_message_monitor> no_op_message_monitor::instance() {
    static auto monitor = std::make_shared<no_op_message_monitor>();
    return monitor;
}

std::shared_ptr<monitor_callback> no_op_message_monitor::on_message_ingested(const message&) {
    static auto callback = std::make_shared<no_op_callback>();
    return callback;
}

namespace {

template <typename Counters>
class counting_callback final : public monitor_callback {
public:
    explicit counting_callback(std::shared_ptr<Counters> counters)
        : m_counters(std::move(counters)) {}

    void report_success() override {
        m_counters->succeeded.fetch_add(1, std::memory_order_relaxed);
    }

    void report_failure(std::exception_ptr) override {
        m_counters->failed.fetch_add(1, std::memory_order_relaxed);
    }

    void report_ignored() override {
        m_counters->ignored.fetch_add(1, std::memory_order_relaxed);
    }

private:
    std::shared_ptr<Counters> m_counters;
};

} // anonymous namespace

counting_message_monitor::counting_message_monitor()
    : m_counters(std::make_shared<counters>())
{}

std::shared_ptr<monitor_callback> counting_message_monitor::on_message_ingested(const message&) {
    m_counters->ingested.fetch_add(1, std::memory_order_relaxed);
    return std::make_shared<counting_callback<counters>>(m_counters);
}

counting_message_monitor::stats counting_message_monitor::get_stats() const {
    return {
        m_counters->ingested.load(std::memory_order_relaxed),
        m_counters->succeeded.load(std::memory_order_relaxed),
        m_counters->failed.load(std::memory_order_relaxed),
        m_counters->ignored.load(std::memory_order_relaxed)
    };
}

} // namespace querybus
