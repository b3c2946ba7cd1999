#pragma once

#include "message.hpp"
#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <optional>
#include <vector>

namespace querybus {

// Lazy, single-pass sequence of scatter-gather responses. Each pending
// attempt runs only when the consumer pulls past the previous response.
class response_stream {
public:
    // Runs one handler attempt; nullopt means it contributed nothing.
    using attempt = std::function<std::optional<query_response>()>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = query_response;
        using difference_type = std::ptrdiff_t;
        using pointer = const query_response*;
        using reference = const query_response&;

        iterator() = default;
        explicit iterator(response_stream* stream) : m_stream(stream) { advance(); }

        reference operator*() const { return *m_current; }
        pointer operator->() const { return &*m_current; }

        iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        bool operator==(const iterator& other) const {
            return !m_current.has_value() && !other.m_current.has_value();
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void advance() { m_current = m_stream ? m_stream->next() : std::nullopt; }

        response_stream* m_stream = nullptr;
        std::optional<query_response> m_current;
    };

    response_stream() = default;
    explicit response_stream(std::deque<attempt> attempts);

    // Next successful response, or nullopt when every attempt has run.
    // An escalating error handler's exception propagates from here; the
    // failed attempt is consumed and later calls continue with the rest.
    std::optional<query_response> next();

    // Pull everything that is left.
    std::vector<query_response> collect();

    std::size_t remaining_attempts() const { return m_attempts.size(); }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::deque<attempt> m_attempts;
};

} // namespace querybus
