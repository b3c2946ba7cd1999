#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace querybus {

inline constexpr std::size_t unbounded_buffer = std::numeric_limits<std::size_t>::max();
inline constexpr int64_t unbounded_demand = std::numeric_limits<int64_t>::max();

// What an update sink does with an update the consumer has not asked for yet.
enum class overflow_strategy {
    buffer,  // queue it, up to buffer_size; beyond that is a delivery failure
    drop,    // discard it
    latest,  // keep only the newest one
    error,   // delivery failure
    ignore   // deliver it anyway
};

struct backpressure {
    overflow_strategy strategy = overflow_strategy::buffer;
    std::size_t buffer_size = unbounded_buffer;
};

// Parse overflow_strategy from string. Returns nullopt if invalid.
std::optional<overflow_strategy> parse_overflow_strategy(const std::string& s);

std::string to_string(overflow_strategy strategy);

} // namespace querybus
