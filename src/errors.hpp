#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace querybus {

// Base of every error the bus produces.
class query_bus_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No subscription exists for the query name / response type at all.
class no_handler_found : public query_bus_error {
public:
    using query_bus_error::query_bus_error;
};

// Subscriptions exist, but every candidate declined this particular query.
class no_suitable_handler_found : public query_bus_error {
public:
    using query_bus_error::query_bus_error;
};

// Thrown by a handler (or handler interceptor) that cannot answer this
// specific query instance. The bus moves on to the next candidate; this
// never reaches the caller of query().
class handler_declined : public query_bus_error {
public:
    handler_declined() : query_bus_error("handler declined the query") {}
    using query_bus_error::query_bus_error;
};

// An error that carries the exception that caused it.
class wrapped_error : public query_bus_error {
public:
    wrapped_error(const std::string& what, std::exception_ptr cause)
        : query_bus_error(what), m_cause(std::move(cause)) {}

    std::exception_ptr cause() const noexcept { return m_cause; }

    // Rethrow the cause; throws *this if there is none.
    [[noreturn]] void rethrow_cause() const;

private:
    std::exception_ptr m_cause;
};

// A genuine failure of the handler chosen to answer a query.
class handler_execution_failure : public wrapped_error {
public:
    using wrapped_error::wrapped_error;
};

// Failure while waiting for a handler's deferred result.
class query_execution_exception : public wrapped_error {
public:
    using wrapped_error::wrapped_error;
};

// Failure pushing one update to one subscriber. The cause is null when the
// sink rejected the update itself (backpressure overflow).
class update_delivery_failure : public wrapped_error {
public:
    explicit update_delivery_failure(const std::string& what,
                                     std::exception_ptr cause = nullptr)
        : wrapped_error(what, std::move(cause)) {}
};

// A scatter-gather attempt that was skipped or abandoned at the deadline.
class scatter_gather_timeout : public query_bus_error {
public:
    using query_bus_error::query_bus_error;
};

// One-line description of an exception for log output.
std::string describe(std::exception_ptr error);

} // namespace querybus
