#include "response_stream.hpp"
#include <utility>

namespace querybus {

response_stream::response_stream(std::deque<attempt> attempts)
    : m_attempts(std::move(attempts))
{}

std::optional<query_response> response_stream::next() {
    while (!m_attempts.empty()) {
        auto current = std::move(m_attempts.front());
        m_attempts.pop_front();

        if (auto response = current()) return response;
    }
    return std::nullopt;
}

std::vector<query_response> response_stream::collect() {
    std::vector<query_response> responses;
    while (auto response = next()) {
        responses.push_back(std::move(*response));
    }
    return responses;
}

} // namespace querybus
