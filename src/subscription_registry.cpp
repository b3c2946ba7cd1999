#include "subscription_registry.hpp"
#include <algorithm>
#include <stdexcept>

namespace querybus {

namespace {

// Handlers are compared by ownership, so a stale handle never matches a
// new handler that happens to reuse a freed address.
bool same_entry(const query_subscription& sub, std::type_index declared_type,
                const std::weak_ptr<query_handler>& handler) {
    return sub.declared_type == declared_type
        && !sub.handler.owner_before(handler) && !handler.owner_before(sub.handler);
}

} // anonymous namespace

subscription_registry::subscription_registry(std::shared_ptr<spdlog::logger> log)
    : m_log(std::move(log))
{
    // Publish an initial empty snapshot
    publish_snapshot();
}

void subscription_registry::publish_snapshot() {
    auto snap = std::make_shared<registry_snapshot>();
    snap->subscriptions = m_subscriptions;
    for (const auto& [name, subs] : m_subscriptions) {
        snap->subscription_count += subs.size();
    }

    std::atomic_store(&m_snapshot,
                      std::shared_ptr<const registry_snapshot>(std::move(snap)));
}

registration subscription_registry::subscribe(const std::string& query_name,
                                              std::type_index declared_type,
                                              std::shared_ptr<query_handler> handler) {
    if (!handler) throw std::invalid_argument("subscribe: null handler for '" + query_name + "'");

    std::weak_ptr<query_handler> weak_handler = handler;
    {
        std::lock_guard<std::mutex> lock(m_write_mutex);

        auto& subs = m_subscriptions[query_name];
        auto existing = std::find_if(subs.begin(), subs.end(), [&](const query_subscription& s) {
            return same_entry(s, declared_type, weak_handler);
        });

        if (existing != subs.end()) {
            m_log->debug("Handler already subscribed to '{}' for {}", query_name, type_name(declared_type));
        } else {
            subs.push_back(query_subscription{declared_type, std::move(handler)});
            publish_snapshot();
            m_log->info("Subscribed handler to '{}' for {} ({} handlers)",
                       query_name, type_name(declared_type), subs.size());
        }
    }

    std::weak_ptr<subscription_registry> weak = weak_from_this();
    return registration([weak, query_name, declared_type, weak_handler] {
        auto self = weak.lock();
        return self ? self->unsubscribe(query_name, declared_type, weak_handler) : false;
    });
}

bool subscription_registry::unsubscribe(const std::string& query_name,
                                        std::type_index declared_type,
                                        const std::weak_ptr<query_handler>& handler) {
    std::lock_guard<std::mutex> lock(m_write_mutex);

    auto it = m_subscriptions.find(query_name);
    if (it == m_subscriptions.end()) return false;

    auto& subs = it->second;
    auto entry = std::find_if(subs.begin(), subs.end(), [&](const query_subscription& s) {
        return same_entry(s, declared_type, handler);
    });
    if (entry == subs.end()) return false;

    subs.erase(entry);
    if (subs.empty()) {
        // No more handlers, drop the name entirely
        m_subscriptions.erase(it);
        m_log->info("Unsubscribed last handler for '{}'", query_name);
    } else {
        m_log->info("Unsubscribed handler for '{}', {} remain", query_name, subs.size());
    }

    publish_snapshot();
    return true;
}

std::vector<query_subscription> subscription_registry::handlers_for(const query_message& query) const {
    auto snap = snapshot();
    std::vector<query_subscription> result;

    auto it = snap->subscriptions.find(query.query_name());
    if (it == snap->subscriptions.end()) return result;

    const auto& expected = query.expected_response_type();
    for (const auto& sub : it->second) {
        if (expected.matches(sub.declared_type)) result.push_back(sub);
    }
    return result;
}

std::shared_ptr<const registry_snapshot> subscription_registry::snapshot() const {
    return std::atomic_load(&m_snapshot);
}

std::size_t subscription_registry::subscription_count() const {
    return std::atomic_load(&m_snapshot)->subscription_count;
}

std::vector<std::string> subscription_registry::query_names() const {
    auto snap = snapshot();
    std::vector<std::string> names;
    names.reserve(snap->subscriptions.size());
    for (const auto& [name, subs] : snap->subscriptions) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace querybus
