#pragma once

#include "query_handler.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <memory>

namespace querybus {

// Decides what happens to a scatter-gather handler failure. The failing
// handler's contribution is dropped either way; throwing from on_error
// escalates the failure to whoever is reading the response stream.
class query_invocation_error_handler {
public:
    virtual ~query_invocation_error_handler() = default;
    virtual void on_error(std::exception_ptr error, const query_message& query,
                          const query_handler& handler) = 0;
};

class logging_query_invocation_error_handler final : public query_invocation_error_handler {
public:
    explicit logging_query_invocation_error_handler(std::shared_ptr<spdlog::logger> log);

    void on_error(std::exception_ptr error, const query_message& query,
                  const query_handler& handler) override;

private:
    std::shared_ptr<spdlog::logger> m_log;
};

class ignoring_query_invocation_error_handler final : public query_invocation_error_handler {
public:
    void on_error(std::exception_ptr, const query_message&, const query_handler&) override {}
};

// Rethrows the handler's error.
class propagating_query_invocation_error_handler final : public query_invocation_error_handler {
public:
    void on_error(std::exception_ptr error, const query_message& query,
                  const query_handler& handler) override;
};

} // namespace querybus
