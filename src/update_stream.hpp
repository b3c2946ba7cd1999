#pragma once

#include "backpressure.hpp"
#include "update_emitter.hpp"
#include "update_sink.hpp"
#include <cstdint>
#include <memory>

namespace querybus {

// Consumer's handle on an attached update stream.
class update_subscription {
public:
    explicit update_subscription(std::shared_ptr<update_sink> sink);

    // Ask for n more updates. Safe to call from inside the consumer callbacks.
    void request(int64_t n);

    // Stop receiving updates and close the session.
    void cancel();

    int64_t requested() const;
    bool is_terminated() const;

private:
    std::shared_ptr<update_sink> m_sink;
};

// Update half of a subscription query result. Move-only; accepts exactly
// one consumer. Dropping a stream that never got a consumer closes its
// pending session; dropping one that did leaves the consumer attached.
class update_stream {
public:
    update_stream() = default;
    update_stream(std::weak_ptr<update_emitter> emitter, const std::shared_ptr<update_session>& session,
                  backpressure bp);
    ~update_stream();

    update_stream(update_stream&& other) noexcept;
    update_stream& operator=(update_stream&& other) noexcept;
    update_stream(const update_stream&) = delete;
    update_stream& operator=(const update_stream&) = delete;

    // Attach `consumer`, replaying everything emitted since the query was
    // issued. Throws std::logic_error if the stream already has a consumer,
    // is not bound to a session, or its session is gone.
    std::shared_ptr<update_subscription> subscribe(update_consumer consumer,
                                                   int64_t initial_request = unbounded_demand);

    const session_key& query() const { return m_query; }
    bool is_bound() const { return m_query != nullptr; }
    bool is_attached() const { return m_subscription != nullptr; }

    // Cancel the consumer, or discard the session if none is attached.
    void close();

private:
    void release();

    std::weak_ptr<update_emitter> m_emitter;
    // The session this stream was opened with; another session for the same
    // query instance is never touched.
    std::weak_ptr<update_session> m_session;
    session_key m_query;
    backpressure m_bp;
    std::shared_ptr<update_subscription> m_subscription;
};

} // namespace querybus
