#pragma once

#include "registration.hpp"
#include "registry_snapshot.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace querybus {

// Maps query names to their handlers.
// Uses RCU-style snapshot swapping: dispatchers get a lock-free shared_ptr<const registry_snapshot>,
// writers serialize via mutex and atomically publish new snapshots.
// Always owned by a shared_ptr; registrations hold a weak reference back.
class subscription_registry : public std::enable_shared_from_this<subscription_registry> {
public:
    explicit subscription_registry(std::shared_ptr<spdlog::logger> log);

    // Register `handler` for `query_name`, declaring the type it produces.
    // Registering the same (name, type, handler) again adds nothing and
    // returns a handle to the existing entry.
    registration subscribe(const std::string& query_name,
                           std::type_index declared_type,
                           std::shared_ptr<query_handler> handler);

    // Returns true if the entry existed. The name disappears with its last entry.
    bool unsubscribe(const std::string& query_name,
                     std::type_index declared_type,
                     const std::weak_ptr<query_handler>& handler);

    // Candidates for `query` whose declared type its response type accepts,
    // in registration order.
    std::vector<query_subscription> handlers_for(const query_message& query) const;

    // Get an immutable snapshot for lock-free concurrent reads.
    std::shared_ptr<const registry_snapshot> snapshot() const;

    // Stats
    std::size_t subscription_count() const;
    std::vector<std::string> query_names() const;

private:
    // Publish the writer-side table as a new snapshot.
    void publish_snapshot();

    std::shared_ptr<spdlog::logger> m_log;

    // Serializes all write operations (subscribe/unsubscribe).
    std::mutex m_write_mutex;

    // Current snapshot; atomic load/store for lock-free reader access.
    std::shared_ptr<const registry_snapshot> m_snapshot;

    // Writer-only state (protected by m_write_mutex)
    std::unordered_map<std::string, std::vector<query_subscription>> m_subscriptions;
};

} // namespace querybus
