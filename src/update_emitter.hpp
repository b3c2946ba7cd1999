#pragma once

#include "backpressure.hpp"
#include "message.hpp"
#include "message_monitor.hpp"
#include "update_sink.hpp"
#include <spdlog/spdlog.h>
#include <any>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace querybus {

class update_stream;

// Sessions are keyed by the identity of the query instance.
using session_key = std::shared_ptr<const subscription_query_message>;

// Selects the subscription query sessions an emission is aimed at.
using query_filter = std::function<bool(const subscription_query_message&)>;

// Matches sessions whose query has the given name.
query_filter query_named(std::string query_name);

// Matches sessions whose payload is a Q satisfying `pred`.
template <typename Q, typename P>
query_filter payload_matches(P pred) {
    return [pred = std::move(pred)](const subscription_query_message& query) {
        const auto* payload = std::any_cast<Q>(&query.payload());
        return payload != nullptr && pred(*payload);
    };
}

// Actions recorded for a session whose stream has no consumer yet,
// replayed in arrival order when one attaches.
struct emit_action { update_ptr update; };
struct complete_action {};
struct error_action { std::exception_ptr cause; };

using deferred_action = std::variant<emit_action, complete_action, error_action>;

struct pending_state {
    std::vector<deferred_action> actions;
    bool closed = false;  // a terminal action has been recorded
};

struct attached_state {
    std::shared_ptr<update_sink> sink;
};

struct update_session {
    explicit update_session(session_key q) : query(std::move(q)) {}

    const session_key query;
    std::mutex mutex;
    std::variant<pending_state, attached_state> state;
};

// Producer side of subscription queries. Owns the session table and routes
// emitted updates to pending buffers or live sinks.
//
// Lock order: session, then session table or sink. The table lock is never
// held while taking a session lock. Consumer callbacks run outside all of them.
// Always owned by a shared_ptr; streams and sinks hold weak references back.
class update_emitter : public std::enable_shared_from_this<update_emitter> {
public:
    update_emitter(std::shared_ptr<message_monitor> update_monitor,
                   std::shared_ptr<spdlog::logger> log);

    // Deliver `update` once to every session matching `filter`. Delivery
    // failures end the affected session and are never thrown from here.
    void emit(const query_filter& filter, update_ptr update);

    template <typename U>
        requires (!std::is_convertible_v<U, update_ptr>)
    void emit(const query_filter& filter, U update) {
        emit(filter, make_update(std::move(update)));
    }

    void complete(const query_filter& filter);
    void complete_exceptionally(const query_filter& filter, std::exception_ptr cause);

    // Outstanding demand of each matching session; zero while still pending.
    std::map<session_key, int64_t> requested_from_downstream(const query_filter& filter) const;

    std::size_t active_sessions() const;
    bool has_session(const subscription_query_message& query) const;

    // Open a pending session for `query`. Throws std::logic_error if one is
    // already open for the same instance.
    update_stream open_session(session_key query, backpressure bp);

private:
    friend class update_stream;

    // Pending -> attached: install a sink and replay buffered actions.
    std::shared_ptr<update_sink> attach(const std::shared_ptr<update_session>& session,
                                        const backpressure& bp, update_consumer consumer,
                                        int64_t initial_request);

    // Remove the session if nobody has attached to it. Returns true if removed.
    bool discard_pending(update_session& session);

    std::shared_ptr<update_session> find_session(const subscription_query_message& query) const;
    std::vector<std::shared_ptr<update_session>> matching(const query_filter& filter) const;
    void remove_session(const update_session& session);

    // Offer one update to a live sink. A rejected update is reported to the
    // update monitor here; an accepted one when the sink delivers or discards
    // it. Returns the delivery failure, if any.
    std::exception_ptr offer(update_sink& sink, const update_ptr& update);

    void fail_session(const update_session& session, update_sink& sink, std::exception_ptr error);
    void finish(const query_filter& filter, std::exception_ptr cause);

    std::shared_ptr<message_monitor> m_update_monitor;
    std::shared_ptr<spdlog::logger> m_log;

    mutable std::mutex m_mutex;
    std::unordered_map<const subscription_query_message*, std::shared_ptr<update_session>> m_sessions;
};

} // namespace querybus
