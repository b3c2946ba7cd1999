#include "update_emitter.hpp"
#include "errors.hpp"
#include "update_stream.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace querybus {

query_filter query_named(std::string query_name) {
    return [name = std::move(query_name)](const subscription_query_message& query) {
        return query.query_name() == name;
    };
}

update_emitter::update_emitter(std::shared_ptr<message_monitor> update_monitor,
                               std::shared_ptr<spdlog::logger> log)
    : m_update_monitor(std::move(update_monitor)), m_log(std::move(log))
{
    if (!m_update_monitor) m_update_monitor = no_op_message_monitor::instance();
}

update_stream update_emitter::open_session(session_key query, backpressure bp) {
    if (!query) throw std::invalid_argument("open_session: null query");

    auto session = std::make_shared<update_session>(query);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto [it, inserted] = m_sessions.emplace(query.get(), session);
        if (!inserted) {
            throw std::logic_error(fmt::format(
                "subscription query '{}' [{}] already has an open session",
                query->query_name(), query->identifier()));
        }
    }

    m_log->debug("Opened session for subscription query '{}' [{}]",
                query->query_name(), query->identifier());
    return update_stream(weak_from_this(), session, bp);
}

std::shared_ptr<update_session> update_emitter::find_session(const subscription_query_message& query) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(&query);
    return it == m_sessions.end() ? nullptr : it->second;
}

bool update_emitter::has_session(const subscription_query_message& query) const {
    return find_session(query) != nullptr;
}

std::size_t update_emitter::active_sessions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

std::vector<std::shared_ptr<update_session>> update_emitter::matching(const query_filter& filter) const {
    std::vector<std::shared_ptr<update_session>> all;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        all.reserve(m_sessions.size());
        for (const auto& [key, session] : m_sessions) all.push_back(session);
    }

    // Filters are caller code; run them outside the table lock
    std::vector<std::shared_ptr<update_session>> result;
    for (auto& session : all) {
        if (filter(*session->query)) result.push_back(std::move(session));
    }
    return result;
}

void update_emitter::remove_session(const update_session& session) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(session.query.get());
    if (it != m_sessions.end() && it->second.get() == &session) {
        m_sessions.erase(it);
        m_log->debug("Closed session for subscription query '{}' [{}]",
                    session.query->query_name(), session.query->identifier());
    }
}

std::exception_ptr update_emitter::offer(update_sink& sink, const update_ptr& update) {
    auto monitor = m_update_monitor->on_message_ingested(*update);
    try {
        // Once queued, the sink reports how the delivery ended
        if (!sink.next(update, monitor)) monitor->report_ignored();
        return nullptr;
    } catch (const update_delivery_failure&) {
        auto error = std::current_exception();
        monitor->report_failure(error);
        return error;
    }
}

void update_emitter::fail_session(const update_session& session, update_sink& sink,
                                  std::exception_ptr error) {
    m_log->error("Failed to deliver update for subscription query '{}' [{}]: {}",
                session.query->query_name(), session.query->identifier(), describe(error));
    remove_session(session);
    sink.error(std::move(error));
    sink.drain();
}

void update_emitter::emit(const query_filter& filter, update_ptr update) {
    if (!update) throw std::invalid_argument("emit: null update");

    for (const auto& session : matching(filter)) {
        std::shared_ptr<update_sink> sink;
        std::exception_ptr failure;
        {
            std::lock_guard<std::mutex> lock(session->mutex);
            if (auto* pending = std::get_if<pending_state>(&session->state)) {
                if (!pending->closed) {
                    pending->actions.push_back(emit_action{update});
                    m_log->debug("Buffered update {} for pending subscription query [{}] ({} buffered)",
                                update->identifier(), session->query->identifier(),
                                pending->actions.size());
                }
                continue;
            }
            sink = std::get<attached_state>(session->state).sink;
            failure = offer(*sink, update);
        }

        if (failure) {
            fail_session(*session, *sink, failure);
        } else {
            sink->drain();
        }
    }
}

void update_emitter::complete(const query_filter& filter) {
    finish(filter, nullptr);
}

void update_emitter::complete_exceptionally(const query_filter& filter, std::exception_ptr cause) {
    if (!cause) throw std::invalid_argument("complete_exceptionally: null cause");
    finish(filter, std::move(cause));
}

void update_emitter::finish(const query_filter& filter, std::exception_ptr cause) {
    for (const auto& session : matching(filter)) {
        std::shared_ptr<update_sink> sink;
        {
            std::lock_guard<std::mutex> lock(session->mutex);
            if (auto* pending = std::get_if<pending_state>(&session->state)) {
                if (!pending->closed) {
                    if (cause) {
                        pending->actions.push_back(error_action{cause});
                    } else {
                        pending->actions.push_back(complete_action{});
                    }
                    pending->closed = true;
                }
                continue;
            }
            sink = std::get<attached_state>(session->state).sink;
            if (cause) {
                sink->error(cause);
            } else {
                sink->complete();
            }
        }

        remove_session(*session);
        sink->drain();
    }
}

std::map<session_key, int64_t> update_emitter::requested_from_downstream(const query_filter& filter) const {
    std::map<session_key, int64_t> result;
    for (const auto& session : matching(filter)) {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (const auto* attached = std::get_if<attached_state>(&session->state)) {
            result.emplace(session->query, attached->sink->requested());
        } else {
            result.emplace(session->query, 0);
        }
    }
    return result;
}

std::shared_ptr<update_sink> update_emitter::attach(const std::shared_ptr<update_session>& session,
                                                    const backpressure& bp, update_consumer consumer,
                                                    int64_t initial_request) {
    const session_key& query = session->query;
    if (find_session(*query) != session) {
        throw std::logic_error(fmt::format(
            "subscription query '{}' [{}] has no open session",
            query->query_name(), query->identifier()));
    }

    auto sink = std::make_shared<update_sink>(bp, std::move(consumer), initial_request, m_log);
    sink->on_dispose([weak_self = weak_from_this(), weak_session = std::weak_ptr<update_session>(session)] {
        auto self = weak_self.lock();
        auto s = weak_session.lock();
        if (self && s) self->remove_session(*s);
    });

    std::exception_ptr failure;
    bool terminal = false;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        auto* pending = std::get_if<pending_state>(&session->state);
        if (!pending) {
            throw std::logic_error(fmt::format(
                "subscription query '{}' [{}] already has a consumer",
                query->query_name(), query->identifier()));
        }

        auto actions = std::move(pending->actions);
        session->state = attached_state{sink};

        m_log->debug("Attached consumer to subscription query '{}' [{}], replaying {} actions",
                    query->query_name(), query->identifier(), actions.size());

        for (const auto& action : actions) {
            if (failure) break;
            std::visit([&](const auto& a) {
                using action_type = std::decay_t<decltype(a)>;
                if constexpr (std::is_same_v<action_type, emit_action>) {
                    failure = offer(*sink, a.update);
                } else if constexpr (std::is_same_v<action_type, complete_action>) {
                    sink->complete();
                    terminal = true;
                } else {
                    sink->error(a.cause);
                    terminal = true;
                }
            }, action);
        }
    }

    if (failure) {
        fail_session(*session, *sink, failure);
    } else {
        if (terminal) remove_session(*session);
        sink->drain();
    }
    return sink;
}

bool update_emitter::discard_pending(update_session& session) {
    std::lock_guard<std::mutex> lock(session.mutex);
    if (!std::holds_alternative<pending_state>(session.state)) return false;
    remove_session(session);
    return true;
}

} // namespace querybus
