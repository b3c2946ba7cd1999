#include "update_stream.hpp"
#include <stdexcept>
#include <utility>

namespace querybus {

update_subscription::update_subscription(std::shared_ptr<update_sink> sink)
    : m_sink(std::move(sink))
{}

void update_subscription::request(int64_t n) {
    m_sink->request(n);
}

void update_subscription::cancel() {
    m_sink->cancel();
}

int64_t update_subscription::requested() const {
    return m_sink->requested();
}

bool update_subscription::is_terminated() const {
    return m_sink->is_terminated();
}

update_stream::update_stream(std::weak_ptr<update_emitter> emitter,
                             const std::shared_ptr<update_session>& session, backpressure bp)
    : m_emitter(std::move(emitter)), m_session(session), m_query(session->query), m_bp(bp)
{}

update_stream::~update_stream() {
    release();
}

update_stream::update_stream(update_stream&& other) noexcept
    : m_emitter(std::move(other.m_emitter)),
      m_session(std::move(other.m_session)),
      m_query(std::move(other.m_query)),
      m_bp(other.m_bp),
      m_subscription(std::move(other.m_subscription))
{
    other.m_query.reset();
}

update_stream& update_stream::operator=(update_stream&& other) noexcept {
    if (this != &other) {
        release();
        m_emitter = std::move(other.m_emitter);
        m_session = std::move(other.m_session);
        m_query = std::move(other.m_query);
        m_bp = other.m_bp;
        m_subscription = std::move(other.m_subscription);
        other.m_query.reset();
    }
    return *this;
}

void update_stream::release() {
    if (m_subscription) return;
    auto session = m_session.lock();
    m_session.reset();
    if (!session) return;
    if (auto emitter = m_emitter.lock()) {
        emitter->discard_pending(*session);
    }
}

std::shared_ptr<update_subscription> update_stream::subscribe(update_consumer consumer,
                                                              int64_t initial_request) {
    if (!m_query) throw std::logic_error("update stream is not bound to a subscription query");
    if (m_subscription) throw std::logic_error("update stream already has a consumer");

    auto emitter = m_emitter.lock();
    if (!emitter) throw std::logic_error("update emitter no longer exists");

    auto session = m_session.lock();
    if (!session) {
        throw std::logic_error("subscription query '" + m_query->query_name() + "' [" +
                               m_query->identifier() + "] has no open session");
    }

    auto sink = emitter->attach(session, m_bp, std::move(consumer), initial_request);
    m_subscription = std::make_shared<update_subscription>(std::move(sink));
    return m_subscription;
}

void update_stream::close() {
    if (m_subscription) {
        m_subscription->cancel();
    } else {
        release();
    }
}

} // namespace querybus
