#pragma once

#include "query_handler.hpp"
#include "transaction_manager.hpp"
#include "unit_of_work.hpp"
#include <spdlog/spdlog.h>
#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace querybus {

// Rewrites an outgoing query before routing (e.g. adds metadata).
// Runs once per call, whatever the dispatch pattern.
using dispatch_interceptor = std::function<
    std::shared_ptr<const query_message>(std::shared_ptr<const query_message>)>;

class interceptor_chain;

// Wraps every individual handler attempt.
class handler_interceptor {
public:
    virtual ~handler_interceptor() = default;

    // Call chain.proceed() to continue to the next interceptor / the handler.
    virtual std::any handle(unit_of_work& uow, interceptor_chain& chain) = 0;
};

// Walks the handler interceptors in registration order, then invokes the handler.
class interceptor_chain {
public:
    using interceptor_list = std::vector<std::shared_ptr<handler_interceptor>>;

    interceptor_chain(unit_of_work& uow, const interceptor_list& interceptors,
                      query_handler& handler);

    std::any proceed();

private:
    unit_of_work& m_uow;
    const interceptor_list& m_interceptors;
    query_handler& m_handler;
    std::size_t m_next = 0;
};

// Binds a transaction to each attempt: committed with the unit of work,
// rolled back with it.
class transaction_managing_interceptor final : public handler_interceptor {
public:
    explicit transaction_managing_interceptor(std::shared_ptr<transaction_manager> manager);

    std::any handle(unit_of_work& uow, interceptor_chain& chain) override;

private:
    std::shared_ptr<transaction_manager> m_manager;
};

// Logs dispatched queries and handler outcomes.
class logging_interceptor final : public handler_interceptor {
public:
    explicit logging_interceptor(std::shared_ptr<spdlog::logger> log);

    std::any handle(unit_of_work& uow, interceptor_chain& chain) override;

    // Usable as a dispatch_interceptor; returns the query unchanged.
    std::shared_ptr<const query_message> on_dispatch(std::shared_ptr<const query_message> query);

private:
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace querybus
