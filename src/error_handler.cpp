#include "error_handler.hpp"
#include "errors.hpp"

namespace querybus {

logging_query_invocation_error_handler::logging_query_invocation_error_handler(
    std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{}

void logging_query_invocation_error_handler::on_error(std::exception_ptr error,
                                                      const query_message& query,
                                                      const query_handler& /*handler*/) {
    m_log->warn("Handler for query '{}' [{}] failed during scatter-gather: {}",
               query.query_name(), query.identifier(), describe(error));
}

void propagating_query_invocation_error_handler::on_error(std::exception_ptr error,
                                                          const query_message& /*query*/,
                                                          const query_handler& /*handler*/) {
    std::rethrow_exception(error);
}

} // namespace querybus
