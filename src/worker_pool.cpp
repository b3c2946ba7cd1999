#include "worker_pool.hpp"
#include <chrono>
#include <stdexcept>

namespace querybus {

worker_pool::worker_pool(unsigned int thread_count, std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log)),
      m_thread_count(thread_count > 0 ? thread_count
                                      : std::thread::hardware_concurrency())
{
    if (m_thread_count == 0) m_thread_count = 1;
}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::start() {
    if (m_running.exchange(true)) return; // already started

    m_threads.reserve(m_thread_count);
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_threads.emplace_back(&worker_pool::worker_loop, this, i);
    }
    m_log->info("Worker pool started with {} threads", m_thread_count);
}

void worker_pool::stop() {
    if (!m_running.exchange(false)) return; // already stopped

    // Enqueue poison pills (empty tasks), one per thread
    for (unsigned int i = 0; i < m_thread_count; ++i) {
        m_queue.enqueue(task{});
    }

    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
    m_log->info("Worker pool stopped");
}

void worker_pool::submit(task t) {
    if (!t) throw std::invalid_argument("worker_pool: empty task");
    if (!m_running.load(std::memory_order_relaxed)) {
        throw std::runtime_error("worker_pool: not running");
    }
    m_queue.enqueue(std::move(t));
}

std::size_t worker_pool::queue_depth() const {
    return m_queue.size_approx();
}

worker_pool::stats worker_pool::get_stats() const {
    return {
        m_executed.load(std::memory_order_relaxed),
        m_failed.load(std::memory_order_relaxed),
        m_queue.size_approx()
    };
}

void worker_pool::worker_loop(unsigned int worker_id) {
    m_log->debug("Worker {} started", worker_id);

    task t;
    while (true) {
        // Block with timeout so a pool that is stopping is noticed even when idle
        bool got = m_queue.wait_dequeue_timed(t, std::chrono::milliseconds(100));

        if (!got) {
            if (!m_running.load(std::memory_order_relaxed)) break;
            continue;
        }

        // Empty task = poison pill
        if (!t) break;

        try {
            t();
        } catch (const std::exception& e) {
            m_failed.fetch_add(1, std::memory_order_relaxed);
            m_log->error("Worker {} task failed: {}", worker_id, e.what());
        } catch (...) {
            m_failed.fetch_add(1, std::memory_order_relaxed);
            m_log->error("Worker {} task failed with a non-standard exception", worker_id);
        }
        m_executed.fetch_add(1, std::memory_order_relaxed);
        t = nullptr;
    }

    m_log->debug("Worker {} stopped", worker_id);
}

} // namespace querybus
