#include "update_sink.hpp"
#include "errors.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace querybus {

update_sink::update_sink(backpressure bp, update_consumer consumer, int64_t initial_demand,
                         std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)),
      m_bp(bp),
      m_consumer(std::move(consumer)),
      m_demand(std::max<int64_t>(initial_demand, 0))
{}

bool update_sink::next(update_ptr update, std::shared_ptr<monitor_callback> monitor) {
    std::shared_ptr<monitor_callback> displaced;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_terminated || m_done || m_error) return false;

        const std::size_t pending = m_queue.size();
        const bool has_demand = m_demand == unbounded_demand
            || static_cast<int64_t>(pending) < m_demand;

        if (has_demand || m_bp.strategy == overflow_strategy::ignore) {
            m_queue.push_back({std::move(update), std::move(monitor)});
            return true;
        }

        // Everything queued beyond the consumer's demand
        const std::size_t overflow = pending - static_cast<std::size_t>(m_demand);

        switch (m_bp.strategy) {
            case overflow_strategy::buffer:
                if (overflow >= m_bp.buffer_size) {
                    throw update_delivery_failure(fmt::format(
                        "update buffer full ({} updates waiting for demand)", overflow));
                }
                m_queue.push_back({std::move(update), std::move(monitor)});
                return true;

            case overflow_strategy::drop:
                m_log->debug("Dropping update {}: no outstanding demand", update->identifier());
                return false;

            case overflow_strategy::latest:
                if (overflow > 0) {
                    displaced = std::move(m_queue.back().monitor);
                    m_queue.back() = {std::move(update), std::move(monitor)};
                } else {
                    m_queue.push_back({std::move(update), std::move(monitor)});
                }
                break;

            case overflow_strategy::error:
                throw update_delivery_failure("update emitted without outstanding demand");

            case overflow_strategy::ignore:
                m_queue.push_back({std::move(update), std::move(monitor)});
                break;
        }
    }

    if (displaced) displaced->report_ignored();
    return true;
}

void update_sink::complete() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_terminated || m_done || m_error) return;
    m_done = true;
}

void update_sink::error(std::exception_ptr cause) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_terminated || m_done || m_error) return;
    m_error = std::move(cause);
}

bool update_sink::drain() {
    std::unique_lock<std::mutex> lock(m_mutex);
    // Another thread is delivering; it re-checks the queue after every callback
    if (m_draining) return true;
    m_draining = true;

    bool consumer_ok = true;
    while (!m_terminated) {
        if (m_error) {
            auto cause = m_error;
            m_terminated = true;
            auto discarded = std::move(m_queue);
            m_queue.clear();
            lock.unlock();
            report_discarded(discarded);
            if (m_consumer.on_error) {
                try {
                    m_consumer.on_error(cause);
                } catch (...) {
                    m_log->error("Update consumer failed while handling an error: {}",
                                describe(std::current_exception()));
                }
            }
            lock.lock();
            break;
        }

        const bool can_deliver = !m_queue.empty()
            && (m_demand > 0 || m_bp.strategy == overflow_strategy::ignore);

        if (can_deliver) {
            auto item = std::move(m_queue.front());
            m_queue.pop_front();
            if (m_demand > 0 && m_demand != unbounded_demand) --m_demand;
            lock.unlock();

            try {
                if (m_consumer.on_next) m_consumer.on_next(item.update);
            } catch (...) {
                auto failure = std::make_exception_ptr(update_delivery_failure(
                    fmt::format("consumer failed to handle update {}", item.update->identifier()),
                    std::current_exception()));
                m_log->error("Update consumer failed on update {}: {}",
                            item.update->identifier(), describe(std::current_exception()));
                if (item.monitor) item.monitor->report_failure(failure);
                consumer_ok = false;
                lock.lock();
                if (!m_terminated) m_error = failure;
                continue;
            }

            if (item.monitor) item.monitor->report_success();
            lock.lock();
            continue;
        }

        if (m_queue.empty() && m_done) {
            m_terminated = true;
            lock.unlock();
            if (m_consumer.on_complete) {
                try {
                    m_consumer.on_complete();
                } catch (...) {
                    m_log->error("Update consumer failed on completion: {}",
                                describe(std::current_exception()));
                }
            }
            lock.lock();
        }
        break;
    }

    m_draining = false;
    const bool terminated = m_terminated;
    lock.unlock();

    if (terminated) dispose();
    return consumer_ok;
}

void update_sink::request(int64_t n) {
    if (n <= 0) return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_terminated) return;
        if (m_demand != unbounded_demand) {
            m_demand = n >= unbounded_demand - m_demand ? unbounded_demand : m_demand + n;
        }
    }
    drain();
}

void update_sink::cancel() {
    std::deque<queued_update> discarded;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_terminated) return;
        m_terminated = true;
        discarded.swap(m_queue);
    }
    report_discarded(discarded);
    dispose();
}

void update_sink::report_discarded(std::deque<queued_update>& discarded) {
    for (auto& item : discarded) {
        if (item.monitor) item.monitor->report_ignored();
    }
}

void update_sink::on_dispose(std::function<void()> hook) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_disposed) {
        m_dispose_hook = std::move(hook);
        return;
    }
    lock.unlock();
    if (hook) hook();
}

void update_sink::dispose() {
    std::function<void()> hook;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_disposed) return;
        m_disposed = true;
        hook = std::move(m_dispose_hook);
    }
    if (hook) hook();
}

int64_t update_sink::requested() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_terminated) return 0;
    if (m_demand == unbounded_demand) return unbounded_demand;
    return std::max<int64_t>(0, m_demand - static_cast<int64_t>(m_queue.size()));
}

std::size_t update_sink::queued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool update_sink::is_terminated() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_terminated;
}

} // namespace querybus
