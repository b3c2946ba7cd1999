#include "deferred_watcher.hpp"
#include "errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace querybus {

namespace {

bool is_ready(const deferred_result& result) {
    return result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // anonymous namespace

deferred_watcher::deferred_watcher(std::shared_ptr<spdlog::logger> log,
                                   std::chrono::milliseconds poll_interval)
    : m_log(std::move(log)),
      m_poll_interval(std::max(poll_interval, std::chrono::milliseconds(1)))
{}

deferred_watcher::~deferred_watcher() {
    stop();
}

void deferred_watcher::start() {
    if (m_running.exchange(true)) return;
    m_thread = std::thread(&deferred_watcher::watch_loop, this);
}

void deferred_watcher::stop() {
    if (!m_running.exchange(false)) return;
    m_incoming.enqueue(watch{});
    if (m_thread.joinable()) m_thread.join();
}

void deferred_watcher::add(watch w) {
    if (!w.result.valid()) throw std::invalid_argument("deferred_watcher: invalid result");
    if (!w.on_ready || !w.on_abandoned) throw std::invalid_argument("deferred_watcher: missing callback");
    if (!m_running.load(std::memory_order_relaxed)) {
        throw std::runtime_error("deferred_watcher: not running");
    }
    m_pending.fetch_add(1, std::memory_order_relaxed);
    m_incoming.enqueue(std::move(w));
}

deferred_watcher::stats deferred_watcher::get_stats() const {
    return {
        m_completed.load(std::memory_order_relaxed),
        m_abandoned.load(std::memory_order_relaxed),
        m_pending.load(std::memory_order_relaxed)
    };
}

void deferred_watcher::watch_loop() {
    m_log->debug("Deferred watcher started");

    std::vector<watch> outstanding;
    bool stopping = false;

    auto take = [&](watch& w) {
        if (!w.on_ready) {
            stopping = true;
        } else {
            outstanding.push_back(std::move(w));
        }
    };

    while (!stopping) {
        // Poll often while results are outstanding, otherwise just wait for work
        auto timeout = outstanding.empty() ? std::chrono::milliseconds(100) : m_poll_interval;
        watch w;
        if (m_incoming.wait_dequeue_timed(w, timeout)) {
            take(w);
        } else if (!m_running.load(std::memory_order_relaxed)) {
            break;
        }
        while (!stopping && m_incoming.try_dequeue(w)) take(w);

        auto ready = std::stable_partition(outstanding.begin(), outstanding.end(),
                                           [](const watch& o) { return !is_ready(o.result); });
        for (auto it = ready; it != outstanding.end(); ++it) {
            try {
                it->on_ready();
            } catch (...) {
                m_log->error("Deferred result callback failed: {}", describe(std::current_exception()));
            }
            m_completed.fetch_add(1, std::memory_order_relaxed);
            m_pending.fetch_sub(1, std::memory_order_relaxed);
        }
        outstanding.erase(ready, outstanding.end());
    }

    // Whatever is still waiting, including watches queued behind the stop signal
    watch late;
    while (m_incoming.try_dequeue(late)) {
        if (late.on_ready) outstanding.push_back(std::move(late));
    }
    if (!outstanding.empty()) {
        m_log->warn("Deferred watcher stopping with {} results outstanding", outstanding.size());
    }
    for (auto& o : outstanding) {
        try {
            o.on_abandoned();
        } catch (...) {
            m_log->error("Deferred abandon callback failed: {}", describe(std::current_exception()));
        }
        m_abandoned.fetch_add(1, std::memory_order_relaxed);
        m_pending.fetch_sub(1, std::memory_order_relaxed);
    }

    m_log->debug("Deferred watcher stopped");
}

} // namespace querybus
