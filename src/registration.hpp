#pragma once

#include <atomic>
#include <functional>
#include <memory>

namespace querybus {

// Revocation handle returned by subscribe() and the interceptor
// registration calls. Copies share state; cancel() acts at most once.
class registration {
public:
    registration() = default;

    explicit registration(std::function<bool()> cancel_fn)
        : m_state(std::make_shared<state>())
    {
        m_state->cancel_fn = std::move(cancel_fn);
    }

    // Returns true if this call removed the registered item.
    bool cancel() {
        if (!m_state || m_state->cancelled.exchange(true)) return false;
        auto fn = std::move(m_state->cancel_fn);
        return fn ? fn() : false;
    }

    bool is_active() const {
        return m_state && !m_state->cancelled.load();
    }

private:
    struct state {
        std::atomic<bool> cancelled{false};
        std::function<bool()> cancel_fn;
    };

    std::shared_ptr<state> m_state;
};

} // namespace querybus
