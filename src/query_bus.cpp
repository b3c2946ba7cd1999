#include "query_bus.hpp"
#include "errors.hpp"
#include <fmt/format.h>
#include <deque>
#include <functional>
#include <optional>
#include <stdexcept>

namespace querybus {

namespace {

using interceptor_list = interceptor_chain::interceptor_list;

// One attempt of one handler: a fresh unit of work around the interceptor chain.
std::any invoke_handler(const std::shared_ptr<const query_message>& query,
                        query_handler& handler, const interceptor_list& interceptors) {
    unit_of_work uow(query);
    return uow.execute_with_result([&] {
        interceptor_chain chain(uow, interceptors, handler);
        return chain.proceed();
    });
}

std::any unwrap_deferred(const query_message& query, const deferred_result& pending) {
    try {
        return pending.get();
    } catch (...) {
        throw query_execution_exception(
            fmt::format("Error while waiting for the result of query '{}': {}",
                        query.query_name(), describe(std::current_exception())),
            std::current_exception());
    }
}

// The deferred result inside `raw`, which must have a shared state to wait on.
deferred_result checked_deferred(const query_message& query, const std::any& raw) {
    auto pending = std::any_cast<const deferred_result&>(raw);
    if (!pending.valid()) {
        throw query_execution_exception(
            fmt::format("Handler for query '{}' returned an empty deferred result", query.query_name()),
            nullptr);
    }
    return pending;
}

// Shape a raw handler result as the query asked.
query_response convert_result(const query_message& query, const std::any& raw) {
    try {
        return query_response(query.expected_response_type().convert(raw));
    } catch (const std::bad_any_cast&) {
        throw handler_execution_failure(
            fmt::format("Result of type {} for query '{}' does not fit {}",
                        type_name(raw.type()), query.query_name(),
                        query.expected_response_type().describe()),
            std::current_exception());
    }
}

// Whatever the handler threw, as the failure of that handler.
std::exception_ptr handler_failure(const query_message& query, std::exception_ptr error) {
    return std::make_exception_ptr(handler_execution_failure(
        fmt::format("Handler for query '{}' failed: {}", query.query_name(), describe(error)),
        error));
}

void fail(monitor_callback& monitor, std::promise<query_response>& promise,
          std::exception_ptr error) {
    monitor.report_failure(error);
    promise.set_exception(std::move(error));
}

std::string no_handler_message(const query_message& query) {
    return fmt::format("No handler found for [{}] with response type [{}]",
                       query.query_name(), query.expected_response_type().describe());
}

// Convert `pending` once it is ready and hand the outcome to exactly one of
// the callbacks. Ready results complete on the calling thread; the rest are
// left to the watcher.
void watch_deferred(deferred_watcher& watcher, const std::shared_ptr<const query_message>& query,
                    deferred_result pending,
                    std::function<void(query_response)> on_value,
                    std::function<void(std::exception_ptr)> on_error) {
    auto on_ready = [query, pending, on_value, on_error] {
        query_response response;
        try {
            response = convert_result(*query, unwrap_deferred(*query, pending));
        } catch (...) {
            on_error(std::current_exception());
            return;
        }
        on_value(std::move(response));
    };

    if (pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        on_ready();
        return;
    }

    auto on_abandoned = [query, on_error] {
        on_error(std::make_exception_ptr(query_execution_exception(
            fmt::format("Query bus stopped before the deferred result of query '{}' was ready",
                        query->query_name()),
            nullptr)));
    };
    watcher.add({std::move(pending), std::move(on_ready), std::move(on_abandoned)});
}

// Everything a lazy scatter-gather attempt needs, shared by all of them.
struct scatter_context {
    std::shared_ptr<const query_message> query;
    std::shared_ptr<const interceptor_list> interceptors;
    std::chrono::steady_clock::time_point deadline;
    std::shared_ptr<message_monitor> monitor;
    std::shared_ptr<query_invocation_error_handler> error_handler;
    std::shared_ptr<worker_pool> workers;
    std::shared_ptr<deferred_watcher> watcher;
};

// Run the handler on a worker and wait for it until the deadline.
query_response await_handler(const scatter_context& ctx, const std::shared_ptr<query_handler>& handler) {
    if (std::chrono::steady_clock::now() >= ctx.deadline) {
        throw scatter_gather_timeout(fmt::format(
            "Deadline passed before a handler for query '{}' could be invoked",
            ctx.query->query_name()));
    }

    auto promise = std::make_shared<std::promise<query_response>>();
    auto future = promise->get_future();

    ctx.workers->submit([query = ctx.query, interceptors = ctx.interceptors,
                         watcher = ctx.watcher, handler, promise] {
        std::any raw;
        try {
            raw = invoke_handler(query, *handler, *interceptors);
        } catch (const handler_declined&) {
            promise->set_exception(std::current_exception());
            return;
        } catch (...) {
            promise->set_exception(handler_failure(*query, std::current_exception()));
            return;
        }

        try {
            if (raw.type() == typeid(deferred_result)) {
                watch_deferred(*watcher, query, checked_deferred(*query, raw),
                               [promise](query_response response) { promise->set_value(std::move(response)); },
                               [promise](std::exception_ptr error) { promise->set_exception(std::move(error)); });
            } else {
                promise->set_value(convert_result(*query, raw));
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    // An abandoned attempt keeps running; its result goes nowhere
    if (future.wait_until(ctx.deadline) != std::future_status::ready) {
        throw scatter_gather_timeout(fmt::format(
            "Handler for query '{}' did not answer before the deadline",
            ctx.query->query_name()));
    }
    return future.get();
}

std::optional<query_response> attempt_handler(const scatter_context& ctx,
                                              const std::shared_ptr<query_handler>& handler) {
    auto monitor = ctx.monitor->on_message_ingested(*ctx.query);
    try {
        auto response = await_handler(ctx, handler);
        monitor->report_success();
        return response;
    } catch (...) {
        auto error = std::current_exception();
        monitor->report_failure(error);
        // May rethrow to escalate
        ctx.error_handler->on_error(error, *ctx.query, *handler);
        return std::nullopt;
    }
}

} // anonymous namespace

query_bus::query_bus(std::shared_ptr<spdlog::logger> log, bus_options options)
    : m_log(log ? std::move(log) : spdlog::default_logger()),
      m_monitor(options.monitor ? std::move(options.monitor)
                                : no_op_message_monitor::instance()),
      m_error_handler(options.error_handler
                          ? std::move(options.error_handler)
                          : std::make_shared<logging_query_invocation_error_handler>(m_log)),
      m_registry(std::make_shared<subscription_registry>(m_log)),
      m_emitter(std::make_shared<update_emitter>(std::move(options.update_monitor), m_log)),
      m_workers(std::make_shared<worker_pool>(options.worker_threads, m_log)),
      m_watcher(std::make_shared<deferred_watcher>(m_log)),
      m_dispatch_interceptors(std::make_shared<copy_on_write_list<const dispatch_interceptor>>()),
      m_handler_interceptors(std::make_shared<copy_on_write_list<handler_interceptor>>())
{
    if (options.transactions) {
        m_handler_interceptors->add(
            std::make_shared<transaction_managing_interceptor>(std::move(options.transactions)));
    }
    m_workers->start();
    m_watcher->start();
}

query_bus::~query_bus() {
    // Workers first, they may still hand results to the watcher
    m_workers->stop();
    m_watcher->stop();
}

registration query_bus::subscribe(const std::string& query_name, std::type_index declared_type,
                                  std::shared_ptr<query_handler> handler) {
    return m_registry->subscribe(query_name, declared_type, std::move(handler));
}

registration query_bus::register_dispatch_interceptor(dispatch_interceptor interceptor) {
    if (!interceptor) throw std::invalid_argument("register_dispatch_interceptor: empty interceptor");

    auto item = std::make_shared<const dispatch_interceptor>(std::move(interceptor));
    m_dispatch_interceptors->add(item);

    std::weak_ptr<copy_on_write_list<const dispatch_interceptor>> weak = m_dispatch_interceptors;
    const dispatch_interceptor* raw = item.get();
    return registration([weak, raw] {
        auto list = weak.lock();
        return list ? list->remove(raw) : false;
    });
}

registration query_bus::register_handler_interceptor(std::shared_ptr<handler_interceptor> interceptor) {
    if (!interceptor) throw std::invalid_argument("register_handler_interceptor: null interceptor");

    const handler_interceptor* raw = interceptor.get();
    m_handler_interceptors->add(std::move(interceptor));

    std::weak_ptr<copy_on_write_list<handler_interceptor>> weak = m_handler_interceptors;
    return registration([weak, raw] {
        auto list = weak.lock();
        return list ? list->remove(raw) : false;
    });
}

std::shared_ptr<const query_message> query_bus::intercept(std::shared_ptr<const query_message> query_msg) const {
    auto interceptors = m_dispatch_interceptors->snapshot();
    for (const auto& interceptor : *interceptors) {
        query_msg = (*interceptor)(std::move(query_msg));
        if (!query_msg) throw std::logic_error("dispatch interceptor returned no query");
    }
    return query_msg;
}

std::future<query_response> query_bus::query(std::shared_ptr<const query_message> query_msg) {
    if (!query_msg) throw std::invalid_argument("query: null query");

    auto monitor = m_monitor->on_message_ingested(*query_msg);
    auto promise = std::make_shared<std::promise<query_response>>();
    auto future = promise->get_future();

    std::shared_ptr<const query_message> intercepted;
    try {
        intercepted = intercept(query_msg);
    } catch (...) {
        fail(*monitor, *promise, std::current_exception());
        return future;
    }

    auto candidates = m_registry->handlers_for(*intercepted);
    m_log->debug("Query '{}' [{}] has {} candidate handlers",
                intercepted->query_name(), intercepted->identifier(), candidates.size());

    if (candidates.empty()) {
        fail(*monitor, *promise, std::make_exception_ptr(no_handler_found(no_handler_message(*intercepted))));
        return future;
    }

    dispatch_first(intercepted, candidates, monitor, promise,
                   fmt::format("No suitable handler was found for [{}] with response type [{}]",
                               intercepted->query_name(),
                               intercepted->expected_response_type().describe()));
    return future;
}

void query_bus::dispatch_first(const std::shared_ptr<const query_message>& query_msg,
                               const std::vector<query_subscription>& candidates,
                               const std::shared_ptr<monitor_callback>& monitor,
                               const response_promise& promise,
                               const std::string& exhausted_message) {
    auto interceptors = m_handler_interceptors->snapshot();

    for (const auto& candidate : candidates) {
        std::any raw;
        try {
            raw = invoke_handler(query_msg, *candidate.handler, *interceptors);
        } catch (const handler_declined& e) {
            m_log->debug("Handler declined query '{}' [{}]: {}",
                        query_msg->query_name(), query_msg->identifier(), e.what());
            continue;
        } catch (...) {
            fail(*monitor, *promise, handler_failure(*query_msg, std::current_exception()));
            return;
        }

        query_response response;
        try {
            if (raw.type() == typeid(deferred_result)) {
                complete_deferred(query_msg, checked_deferred(*query_msg, raw), monitor, promise);
                return;
            }
            response = convert_result(*query_msg, raw);
        } catch (const std::exception&) {
            fail(*monitor, *promise, std::current_exception());
            return;
        }
        monitor->report_success();
        promise->set_value(std::move(response));
        return;
    }

    fail(*monitor, *promise, std::make_exception_ptr(no_suitable_handler_found(exhausted_message)));
}

void query_bus::complete_deferred(const std::shared_ptr<const query_message>& query_msg,
                                  deferred_result pending,
                                  const std::shared_ptr<monitor_callback>& monitor,
                                  const response_promise& promise) {
    try {
        watch_deferred(*m_watcher, query_msg, std::move(pending),
                       [monitor, promise](query_response response) {
                           monitor->report_success();
                           promise->set_value(std::move(response));
                       },
                       [monitor, promise](std::exception_ptr error) {
                           fail(*monitor, *promise, std::move(error));
                       });
    } catch (const std::exception& e) {
        fail(*monitor, *promise, std::make_exception_ptr(query_execution_exception(
            fmt::format("Cannot wait for the deferred result of query '{}': {}",
                        query_msg->query_name(), e.what()),
            std::current_exception())));
    }
}

response_stream query_bus::scatter_gather_until(std::shared_ptr<const query_message> query_msg,
                                                std::chrono::steady_clock::time_point deadline) {
    if (!query_msg) throw std::invalid_argument("scatter_gather: null query");

    auto intercepted = intercept(std::move(query_msg));
    auto candidates = m_registry->handlers_for(*intercepted);

    if (candidates.empty()) {
        m_log->debug("Scatter-gather query '{}' [{}] has no handlers",
                    intercepted->query_name(), intercepted->identifier());
        m_monitor->on_message_ingested(*intercepted)->report_ignored();
        return response_stream();
    }

    auto ctx = std::make_shared<const scatter_context>(scatter_context{
        intercepted, m_handler_interceptors->snapshot(), deadline,
        m_monitor, m_error_handler, m_workers, m_watcher});

    std::deque<response_stream::attempt> attempts;
    for (const auto& candidate : candidates) {
        attempts.emplace_back([ctx, handler = candidate.handler] {
            return attempt_handler(*ctx, handler);
        });
    }
    return response_stream(std::move(attempts));
}

subscription_query_result query_bus::subscription_query(
    std::shared_ptr<const subscription_query_message> query_msg, backpressure bp) {
    if (!query_msg) throw std::invalid_argument("subscription_query: null query");

    auto monitor = m_monitor->on_message_ingested(*query_msg);
    auto promise = std::make_shared<std::promise<query_response>>();
    auto future = promise->get_future();

    std::shared_ptr<const subscription_query_message> intercepted;
    update_stream updates;
    try {
        intercepted = std::dynamic_pointer_cast<const subscription_query_message>(intercept(query_msg));
        if (!intercepted) {
            throw std::logic_error(fmt::format(
                "dispatch interceptor turned subscription query '{}' into a plain query",
                query_msg->query_name()));
        }
        // Before the initial result, so concurrent emissions are buffered
        updates = m_emitter->open_session(intercepted, bp);
    } catch (...) {
        fail(*monitor, *promise, std::current_exception());
        return subscription_query_result(std::move(future), update_stream());
    }

    auto candidates = m_registry->handlers_for(*intercepted);
    if (candidates.empty()) {
        fail(*monitor, *promise, std::make_exception_ptr(no_handler_found(no_handler_message(*intercepted))));
    } else {
        dispatch_first(intercepted, candidates, monitor, promise,
                       fmt::format("No suitable handler was found for [{}] with response type [{}] "
                                   "and update type [{}]",
                                   intercepted->query_name(),
                                   intercepted->expected_response_type().describe(),
                                   intercepted->update_response_type().describe()));
    }
    return subscription_query_result(std::move(future), std::move(updates));
}

} // namespace querybus
