#pragma once

#include "message.hpp"
#include <any>
#include <future>
#include <memory>
#include <utility>

namespace querybus {

// A handler may return this (inside the std::any) when its answer is still
// being computed. The bus waits for it and converts the eventual value.
using deferred_result = std::shared_future<std::any>;

class query_handler {
public:
    virtual ~query_handler() = default;

    // Answer the query with a raw result (converted by the query's
    // response_type). Throw handler_declined to let the next candidate try.
    virtual std::any handle(const query_message& query) = 0;
};

template <typename F>
class function_query_handler final : public query_handler {
public:
    explicit function_query_handler(F fn) : m_fn(std::move(fn)) {}

    std::any handle(const query_message& query) override { return m_fn(query); }

private:
    F m_fn;
};

// Wrap a callable `std::any(const query_message&)` as a handler.
template <typename F>
std::shared_ptr<query_handler> make_handler(F fn) {
    return std::make_shared<function_query_handler<F>>(std::move(fn));
}

} // namespace querybus
