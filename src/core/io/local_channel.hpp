/**
 * @file   local_channel.hpp
 * @brief  Declares LocalChannel: an in-process IChannel pair for a provider
 *         tree hosted on a worker thread.
 *
 * Packets are moved through a mutex-protected queue, so transferred buffers
 * reach the peer by pointer, never by copy.
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_IO_LOCAL_CHANNEL_HPP
#define PROVIDER_BRIDGE_IO_LOCAL_CHANNEL_HPP

#include "channel.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace provider_bridge::io {

/**
 * @class LocalChannel
 * @brief One end of an in-process channel pair.
 */
class LocalChannel final : public IChannel {
public:
    using Pair = std::pair<std::shared_ptr<LocalChannel>, std::shared_ptr<LocalChannel>>;

    /**
     * @brief Create two connected ends; what one sends the other receives.
     */
    static Pair createPair();

    ~LocalChannel() noexcept override;

    bool send(Packet &&pkt) noexcept override;
    bool poll(Packet &pkt) noexcept override;
    bool waitFor(Packet &pkt, std::chrono::milliseconds timeout) noexcept override;

    /**
     * @brief Close both directions. The peer drains what was already queued,
     *        then observes the channel as closed.
     */
    void close() noexcept override;
    bool isOpen() const noexcept override;

private:
    struct Queue {
        std::mutex              mtx;
        std::condition_variable cv;
        std::deque<Packet>      packets;
        bool                    closed{false};
    };

    LocalChannel(std::shared_ptr<Queue> inbox, std::shared_ptr<Queue> outbox) noexcept;

    static void closeQueue(Queue &q) noexcept;

    std::shared_ptr<Queue> m_inbox;   ///< Packets addressed to this end
    std::shared_ptr<Queue> m_outbox;  ///< Packets addressed to the peer
};

} // namespace provider_bridge::io

#endif // PROVIDER_BRIDGE_IO_LOCAL_CHANNEL_HPP
