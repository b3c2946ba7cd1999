#include "unit_of_work.hpp"
#include <stdexcept>

namespace querybus {

unit_of_work::unit_of_work(std::shared_ptr<const query_message> query)
    : m_query(std::move(query))
{
    if (!m_query) throw std::invalid_argument("unit_of_work: null query");
}

void unit_of_work::on_commit(std::function<void(unit_of_work&)> hook) {
    m_commit_hooks.push_back(std::move(hook));
}

void unit_of_work::on_rollback(std::function<void(unit_of_work&, std::exception_ptr)> hook) {
    m_rollback_hooks.push_back(std::move(hook));
}

void unit_of_work::on_cleanup(std::function<void(unit_of_work&)> hook) {
    m_cleanup_hooks.push_back(std::move(hook));
}

void unit_of_work::start() {
    if (m_phase != phase::not_started) {
        throw std::logic_error("unit_of_work: already started");
    }
    m_phase = phase::started;
}

void unit_of_work::commit() {
    for (auto& hook : m_commit_hooks) {
        hook(*this);
    }
    m_phase = phase::committed;
}

void unit_of_work::rollback(std::exception_ptr cause) {
    m_rolled_back = true;
    m_phase = phase::rolled_back;
    // Hooks run in reverse registration order, innermost scope first
    for (auto it = m_rollback_hooks.rbegin(); it != m_rollback_hooks.rend(); ++it) {
        (*it)(*this, cause);
    }
}

void unit_of_work::cleanup() {
    for (auto& hook : m_cleanup_hooks) {
        hook(*this);
    }
    m_phase = phase::cleaned_up;
}

} // namespace querybus
