#pragma once

#include "message.hpp"
#include <any>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace querybus {

// Transactional scope around one handler attempt. Created fresh for every
// attempt and never shared between candidates or calls.
class unit_of_work {
public:
    enum class phase { not_started, started, committed, rolled_back, cleaned_up };

    explicit unit_of_work(std::shared_ptr<const query_message> query);

    unit_of_work(const unit_of_work&) = delete;
    unit_of_work& operator=(const unit_of_work&) = delete;

    // Start, run `fn`, then commit. If `fn` (or a commit hook) throws, the
    // unit rolls back and the exception propagates. Cleanup hooks always run.
    template <typename F>
    auto execute_with_result(F&& fn) -> decltype(fn());

    const query_message& query() const { return *m_query; }
    const std::shared_ptr<const query_message>& query_ptr() const { return m_query; }

    void on_commit(std::function<void(unit_of_work&)> hook);
    void on_rollback(std::function<void(unit_of_work&, std::exception_ptr)> hook);
    void on_cleanup(std::function<void(unit_of_work&)> hook);

    // Per-attempt scratch space for interceptors
    std::map<std::string, std::any>& resources() { return m_resources; }

    phase current_phase() const { return m_phase; }
    bool is_rolled_back() const { return m_phase == phase::rolled_back || m_rolled_back; }

private:
    void start();
    void commit();
    void rollback(std::exception_ptr cause);
    void cleanup();

    std::shared_ptr<const query_message> m_query;
    phase m_phase = phase::not_started;
    bool m_rolled_back = false;
    std::map<std::string, std::any> m_resources;
    std::vector<std::function<void(unit_of_work&)>> m_commit_hooks;
    std::vector<std::function<void(unit_of_work&, std::exception_ptr)>> m_rollback_hooks;
    std::vector<std::function<void(unit_of_work&)>> m_cleanup_hooks;
};

template <typename F>
auto unit_of_work::execute_with_result(F&& fn) -> decltype(fn()) {
    start();
    try {
        auto result = fn();
        commit();
        cleanup();
        return result;
    } catch (...) {
        rollback(std::current_exception());
        cleanup();
        throw;
    }
}

} // namespace querybus
