#include "backpressure.hpp"

namespace querybus {

std::optional<overflow_strategy> parse_overflow_strategy(const std::string& s) {
    if (s == "buffer") return overflow_strategy::buffer;
    if (s == "drop")   return overflow_strategy::drop;
    if (s == "latest") return overflow_strategy::latest;
    if (s == "error")  return overflow_strategy::error;
    if (s == "ignore") return overflow_strategy::ignore;
    return std::nullopt;
}

std::string to_string(overflow_strategy strategy) {
    switch (strategy) {
        case overflow_strategy::buffer: return "buffer";
        case overflow_strategy::drop:   return "drop";
        case overflow_strategy::latest: return "latest";
        case overflow_strategy::error:  return "error";
        case overflow_strategy::ignore: return "ignore";
    }
    return "unknown";
}

} // namespace querybus
