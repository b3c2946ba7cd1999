#include "message.hpp"
#include <fmt/format.h>
#include <cstdint>
#include <random>
#include <stdexcept>

namespace querybus {

namespace {

// Random 128-bit identifier, hex encoded.
std::string generate_identifier() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    uint64_t hi = engine();
    uint64_t lo = engine();
    return fmt::format("{:016x}{:016x}", hi, lo);
}

} // anonymous namespace

message::message(std::any payload, metadata_map metadata)
    : m_identifier(generate_identifier()),
      m_payload(std::move(payload)),
      m_metadata(std::move(metadata))
{}

message::message(const message& other, metadata_map metadata)
    : m_identifier(other.m_identifier),
      m_payload(other.m_payload),
      m_metadata(std::move(metadata))
{}

query_message::query_message(std::string query_name, std::any payload,
                             std::shared_ptr<const response_type> expected,
                             metadata_map metadata)
    : message(std::move(payload), std::move(metadata)),
      m_query_name(std::move(query_name)),
      m_response_type(std::move(expected))
{
    if (m_query_name.empty()) throw std::invalid_argument("query_message: empty query name");
    if (!m_response_type) throw std::invalid_argument("query_message: missing response type");
}

query_message::query_message(const query_message& other, metadata_map metadata)
    : message(other, std::move(metadata)),
      m_query_name(other.m_query_name),
      m_response_type(other.m_response_type)
{}

std::shared_ptr<const query_message> query_message::and_metadata(const metadata_map& extra) const {
    metadata_map merged = metadata();
    for (const auto& [key, value] : extra) {
        merged[key] = value;
    }
    return copy_with(std::move(merged));
}

std::shared_ptr<const query_message> query_message::with_metadata(metadata_map metadata) const {
    return copy_with(std::move(metadata));
}

std::shared_ptr<const query_message> query_message::copy_with(metadata_map metadata) const {
    return std::shared_ptr<const query_message>(new query_message(*this, std::move(metadata)));
}

subscription_query_message::subscription_query_message(
    std::string query_name, std::any payload,
    std::shared_ptr<const response_type> initial,
    std::shared_ptr<const response_type> update,
    metadata_map metadata)
    : query_message(std::move(query_name), std::move(payload),
                    std::move(initial), std::move(metadata)),
      m_update_type(std::move(update))
{
    if (!m_update_type) throw std::invalid_argument("subscription_query_message: missing update type");
}

subscription_query_message::subscription_query_message(
    const subscription_query_message& other, metadata_map metadata)
    : query_message(other, std::move(metadata)),
      m_update_type(other.m_update_type)
{}

std::shared_ptr<const query_message> subscription_query_message::copy_with(metadata_map metadata) const {
    return std::shared_ptr<const query_message>(
        new subscription_query_message(*this, std::move(metadata)));
}

} // namespace querybus
