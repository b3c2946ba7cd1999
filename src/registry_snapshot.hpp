#pragma once

#include "query_handler.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace querybus {

struct query_subscription {
    // Type the handler declared it produces
    std::type_index declared_type;
    std::shared_ptr<query_handler> handler;
};

// Immutable snapshot of the routing table.
// Shared by dispatching threads via shared_ptr<const registry_snapshot>.
struct registry_snapshot {
    // query name -> subscriptions in registration order
    std::unordered_map<std::string, std::vector<query_subscription>> subscriptions;

    std::size_t subscription_count = 0;
};

} // namespace querybus
