#pragma once

#include "backpressure.hpp"
#include "copy_on_write_list.hpp"
#include "deferred_watcher.hpp"
#include "error_handler.hpp"
#include "interceptors.hpp"
#include "message.hpp"
#include "message_monitor.hpp"
#include "query_handler.hpp"
#include "registration.hpp"
#include "response_stream.hpp"
#include "subscription_registry.hpp"
#include "transaction_manager.hpp"
#include "update_emitter.hpp"
#include "update_stream.hpp"
#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <any>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace querybus {

// Collaborators of a query bus. Anything left null gets its default.
struct bus_options {
    std::shared_ptr<message_monitor> monitor;          // queries; default no-op
    std::shared_ptr<message_monitor> update_monitor;   // subscription updates; default no-op
    std::shared_ptr<transaction_manager> transactions; // none = no transaction per attempt
    std::shared_ptr<query_invocation_error_handler> error_handler; // default logs a warning
    unsigned int worker_threads = 0;                   // 0 = hardware_concurrency
};

// Initial result plus update stream of one subscription query.
class subscription_query_result {
public:
    subscription_query_result(std::future<query_response> initial, update_stream updates)
        : m_initial(std::move(initial)), m_updates(std::move(updates)) {}

    std::future<query_response>& initial_result() { return m_initial; }
    update_stream& updates() { return m_updates; }

    // Stop receiving updates. The initial result is unaffected.
    void cancel() { m_updates.close(); }

private:
    std::future<query_response> m_initial;
    update_stream m_updates;
};

// In-process query bus: direct queries with decline fallback,
// scatter-gather under a shared deadline, and subscription queries.
//
// Failures are delivered through the returned futures, never thrown from
// query() or subscription_query() themselves.
class query_bus {
public:
    explicit query_bus(std::shared_ptr<spdlog::logger> log, bus_options options = {});
    ~query_bus();

    query_bus(const query_bus&) = delete;
    query_bus& operator=(const query_bus&) = delete;

    registration subscribe(const std::string& query_name, std::type_index declared_type,
                           std::shared_ptr<query_handler> handler);

    // Subscribe a plain function of the payload: R fn(const Q&).
    template <typename Q, typename R, typename F>
    registration subscribe(const std::string& query_name, F fn) {
        return subscribe(query_name, typeid(R), make_handler(
            [fn = std::move(fn)](const query_message& query) -> std::any {
                return std::any(R(fn(query.payload_as<Q>())));
            }));
    }

    // Answer from the first candidate that does not decline.
    std::future<query_response> query(std::shared_ptr<const query_message> query_msg);

    template <typename R, typename Q>
    std::future<query_response> query(std::string query_name, Q payload) {
        return query(make_query(std::move(query_name), std::move(payload), instance_of<R>()));
    }

    // Ask every candidate, all within `timeout` of now.
    template <typename Rep, typename Period>
    response_stream scatter_gather(std::shared_ptr<const query_message> query_msg,
                                   std::chrono::duration<Rep, Period> timeout) {
        return scatter_gather_until(std::move(query_msg), std::chrono::steady_clock::now()
            + std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout));
    }

    response_stream scatter_gather_until(std::shared_ptr<const query_message> query_msg,
                                         std::chrono::steady_clock::time_point deadline);

    subscription_query_result subscription_query(
        std::shared_ptr<const subscription_query_message> query_msg, backpressure bp = {});

    registration register_dispatch_interceptor(dispatch_interceptor interceptor);
    registration register_handler_interceptor(std::shared_ptr<handler_interceptor> interceptor);

    update_emitter& emitter() { return *m_emitter; }
    subscription_registry& registry() { return *m_registry; }
    const worker_pool& workers() const { return *m_workers; }
    const deferred_watcher& watcher() const { return *m_watcher; }

private:
    using response_promise = std::shared_ptr<std::promise<query_response>>;

    // Run the dispatch interceptors over `query_msg`.
    std::shared_ptr<const query_message> intercept(std::shared_ptr<const query_message> query_msg) const;

    // Try candidates in order until one does not decline.
    void dispatch_first(const std::shared_ptr<const query_message>& query_msg,
                        const std::vector<query_subscription>& candidates,
                        const std::shared_ptr<monitor_callback>& monitor,
                        const response_promise& promise,
                        const std::string& exhausted_message);

    // Settle the promise once a deferred handler result is ready. Never
    // blocks the calling thread.
    void complete_deferred(const std::shared_ptr<const query_message>& query_msg,
                           deferred_result pending,
                           const std::shared_ptr<monitor_callback>& monitor,
                           const response_promise& promise);

    std::shared_ptr<spdlog::logger> m_log;

    std::shared_ptr<message_monitor> m_monitor;
    std::shared_ptr<query_invocation_error_handler> m_error_handler;

    std::shared_ptr<subscription_registry> m_registry;
    std::shared_ptr<update_emitter> m_emitter;
    std::shared_ptr<worker_pool> m_workers;
    std::shared_ptr<deferred_watcher> m_watcher;

    // Shared so registrations can outlive the bus
    std::shared_ptr<copy_on_write_list<const dispatch_interceptor>> m_dispatch_interceptors;
    std::shared_ptr<copy_on_write_list<handler_interceptor>> m_handler_interceptors;
};

} // namespace querybus
