#include "interceptors.hpp"
#include "errors.hpp"
#include <stdexcept>

namespace querybus {

interceptor_chain::interceptor_chain(unit_of_work& uow,
                                     const interceptor_list& interceptors,
                                     query_handler& handler)
    : m_uow(uow), m_interceptors(interceptors), m_handler(handler)
{}

std::any interceptor_chain::proceed() {
    if (m_next < m_interceptors.size()) {
        auto& interceptor = m_interceptors[m_next++];
        return interceptor->handle(m_uow, *this);
    }
    return m_handler.handle(m_uow.query());
}

transaction_managing_interceptor::transaction_managing_interceptor(
    std::shared_ptr<transaction_manager> manager)
    : m_manager(std::move(manager))
{
    if (!m_manager) throw std::invalid_argument("transaction_managing_interceptor: null manager");
}

std::any transaction_managing_interceptor::handle(unit_of_work& uow, interceptor_chain& chain) {
    std::shared_ptr<transaction> tx = m_manager->start_transaction();
    uow.on_commit([tx](unit_of_work&) { tx->commit(); });
    uow.on_rollback([tx](unit_of_work&, std::exception_ptr) { tx->rollback(); });
    return chain.proceed();
}

logging_interceptor::logging_interceptor(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{}

std::any logging_interceptor::handle(unit_of_work& uow, interceptor_chain& chain) {
    const auto& query = uow.query();
    m_log->info("Handling query '{}' [{}]", query.query_name(), query.identifier());
    try {
        auto result = chain.proceed();
        m_log->info("Query '{}' [{}] handled", query.query_name(), query.identifier());
        return result;
    } catch (const handler_declined&) {
        m_log->debug("Query '{}' [{}] declined by handler", query.query_name(), query.identifier());
        throw;
    } catch (const std::exception& e) {
        m_log->warn("Query '{}' [{}] failed: {}", query.query_name(), query.identifier(), e.what());
        throw;
    } catch (...) {
        m_log->warn("Query '{}' [{}] failed with a non-standard exception",
                   query.query_name(), query.identifier());
        throw;
    }
}

std::shared_ptr<const query_message> logging_interceptor::on_dispatch(
    std::shared_ptr<const query_message> query)
{
    m_log->info("Dispatching query '{}' [{}] expecting {}",
               query->query_name(), query->identifier(),
               query->expected_response_type().describe());
    return query;
}

} // namespace querybus
