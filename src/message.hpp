#pragma once

#include "response_type.hpp"
#include <any>
#include <map>
#include <memory>
#include <string>
#include <typeindex>

namespace querybus {

using metadata_map = std::map<std::string, std::string>;

// Immutable envelope around a payload. Messages are shared as
// shared_ptr<const ...>; their identity is the instance, not the content.
class message {
public:
    message(std::any payload, metadata_map metadata = {});
    virtual ~message() = default;

    const std::string& identifier() const { return m_identifier; }
    const std::any& payload() const { return m_payload; }
    std::type_index payload_type() const { return m_payload.type(); }
    const metadata_map& metadata() const { return m_metadata; }

    // Typed payload access. Throws std::bad_any_cast on a type mismatch.
    template <typename T>
    const T& payload_as() const { return std::any_cast<const T&>(m_payload); }

protected:
    // Copy keeping identifier and payload, replacing metadata.
    message(const message& other, metadata_map metadata);

private:
    std::string m_identifier;
    std::any m_payload;
    metadata_map m_metadata;
};

class query_message : public message {
public:
    query_message(std::string query_name, std::any payload,
                  std::shared_ptr<const response_type> expected,
                  metadata_map metadata = {});

    const std::string& query_name() const { return m_query_name; }
    const response_type& expected_response_type() const { return *m_response_type; }
    const std::shared_ptr<const response_type>& expected_response_type_ptr() const {
        return m_response_type;
    }

    // New instance with `extra` merged over the current metadata.
    std::shared_ptr<const query_message> and_metadata(const metadata_map& extra) const;

    // New instance with its metadata replaced by `metadata`.
    std::shared_ptr<const query_message> with_metadata(metadata_map metadata) const;

protected:
    query_message(const query_message& other, metadata_map metadata);

    // Keeps the dynamic type when interceptors rewrite metadata.
    virtual std::shared_ptr<const query_message> copy_with(metadata_map metadata) const;

private:
    std::string m_query_name;
    std::shared_ptr<const response_type> m_response_type;
};

// A query answered by an initial result plus a stream of updates.
class subscription_query_message : public query_message {
public:
    subscription_query_message(std::string query_name, std::any payload,
                               std::shared_ptr<const response_type> initial,
                               std::shared_ptr<const response_type> update,
                               metadata_map metadata = {});

    const response_type& update_response_type() const { return *m_update_type; }

protected:
    subscription_query_message(const subscription_query_message& other, metadata_map metadata);

    std::shared_ptr<const query_message> copy_with(metadata_map metadata) const override;

private:
    std::shared_ptr<const response_type> m_update_type;
};

// One incremental update for subscription queries.
class subscription_query_update_message : public message {
public:
    using message::message;
};

using update_ptr = std::shared_ptr<const subscription_query_update_message>;

// Converted answer to a query.
class query_response {
public:
    query_response() = default;
    explicit query_response(std::any payload, metadata_map metadata = {})
        : m_payload(std::move(payload)), m_metadata(std::move(metadata)) {}

    // True when the handler answered with nothing.
    bool is_null() const { return !m_payload.has_value(); }

    const std::any& payload() const { return m_payload; }
    std::type_index payload_type() const { return m_payload.type(); }
    const metadata_map& metadata() const { return m_metadata; }

    template <typename T>
    T payload_as() const { return std::any_cast<T>(m_payload); }

private:
    std::any m_payload;
    metadata_map m_metadata;
};

template <typename Q>
std::shared_ptr<const query_message> make_query(
    std::string query_name, Q payload,
    std::shared_ptr<const response_type> expected, metadata_map metadata = {})
{
    return std::make_shared<const query_message>(
        std::move(query_name), std::any(std::move(payload)),
        std::move(expected), std::move(metadata));
}

template <typename Q>
std::shared_ptr<const subscription_query_message> make_subscription_query(
    std::string query_name, Q payload,
    std::shared_ptr<const response_type> initial,
    std::shared_ptr<const response_type> update, metadata_map metadata = {})
{
    return std::make_shared<const subscription_query_message>(
        std::move(query_name), std::any(std::move(payload)),
        std::move(initial), std::move(update), std::move(metadata));
}

template <typename U>
update_ptr make_update(U payload, metadata_map metadata = {}) {
    return std::make_shared<const subscription_query_update_message>(
        std::any(std::move(payload)), std::move(metadata));
}

} // namespace querybus
