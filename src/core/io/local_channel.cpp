/**
 * @file   local_channel.cpp
 * @brief  Implements LocalChannel: queue hand-off between two ends.
 *
 * @date   2026-10-19
 */

#include "local_channel.hpp"

namespace provider_bridge::io {

LocalChannel::Pair LocalChannel::createPair() {
    auto a = std::make_shared<Queue>();
    auto b = std::make_shared<Queue>();
    std::shared_ptr<LocalChannel> left(new LocalChannel(a, b));
    std::shared_ptr<LocalChannel> right(new LocalChannel(b, a));
    return {left, right};
}

LocalChannel::LocalChannel(std::shared_ptr<Queue> inbox,
                           std::shared_ptr<Queue> outbox) noexcept
  : m_inbox(std::move(inbox))
  , m_outbox(std::move(outbox))
{}

LocalChannel::~LocalChannel() noexcept {
    close();
}

void LocalChannel::closeQueue(Queue &q) noexcept {
    {
        std::lock_guard<std::mutex> lk(q.mtx);
        q.closed = true;
    }
    q.cv.notify_all();
}

bool LocalChannel::send(Packet &&pkt) noexcept {
    {
        std::lock_guard<std::mutex> lk(m_outbox->mtx);
        if (m_outbox->closed) return false;
        try {
            m_outbox->packets.push_back(std::move(pkt));
        }
        catch (const std::bad_alloc&) {
            return false;
        }
    }
    m_outbox->cv.notify_one();
    return true;
}

bool LocalChannel::poll(Packet &pkt) noexcept {
    std::lock_guard<std::mutex> lk(m_inbox->mtx);
    if (m_inbox->packets.empty()) return false;
    pkt = std::move(m_inbox->packets.front());
    m_inbox->packets.pop_front();
    return true;
}

bool LocalChannel::waitFor(Packet &pkt, std::chrono::milliseconds timeout) noexcept {
    std::unique_lock<std::mutex> lk(m_inbox->mtx);
    m_inbox->cv.wait_for(lk, timeout, [&]{
        return m_inbox->closed || !m_inbox->packets.empty();
    });
    if (m_inbox->packets.empty()) return false;
    pkt = std::move(m_inbox->packets.front());
    m_inbox->packets.pop_front();
    return true;
}

void LocalChannel::close() noexcept {
    closeQueue(*m_outbox);
    closeQueue(*m_inbox);
}

bool LocalChannel::isOpen() const noexcept {
    std::lock_guard<std::mutex> lk(m_inbox->mtx);
    return !m_inbox->closed;
}

} // namespace provider_bridge::io
