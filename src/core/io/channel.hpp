/**
 * @file   channel.hpp
 * @brief  Defines the abstract IChannel interface and the Packet struct
 *         carried by every bridge transport.
 *
 * A Packet is one JSON envelope plus zero or more out-of-band byte buffers.
 * Buffers are handed over with the packet: after send() the sender must not
 * read or reuse them.
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_IO_CHANNEL_HPP
#define PROVIDER_BRIDGE_IO_CHANNEL_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../types.hpp"

namespace provider_bridge::io {

/**
 * @struct Packet
 * @brief A self-contained JSON envelope with its transferred buffers.
 *
 * Buffer references inside the JSON are indices into `transfers`.
 */
struct Packet {
    std::string             json;      ///< Serialized envelope
    std::vector<ByteBuffer> transfers; ///< Buffers moved with the envelope
};

/**
 * @class IChannel
 * @brief Abstract bidirectional packet transport.
 *
 * send() may be called from any thread. poll()/waitFor() are called from a
 * single servicing thread. Delivery is reliable and in order while the
 * channel is open.
 */
class IChannel {
public:
    /**
     * @brief Virtual destructor.
     */
    virtual ~IChannel() = default;

    /**
     * @brief Send a packet, taking ownership of its buffers.
     *
     * @param pkt  The Packet to send; left in a moved-from state.
     * @return     True on success; false if the channel is closed or broken.
     */
    virtual bool send(Packet &&pkt) noexcept = 0;

    /**
     * @brief Non-blocking poll for an incoming packet.
     *
     * @param[out] pkt  The Packet to fill if data is available.
     * @return          True if a packet was received and pkt is populated.
     */
    virtual bool poll(Packet &pkt) noexcept = 0;

    /**
     * @brief Wait up to `timeout` for an incoming packet.
     *
     * @param[out] pkt     The Packet to fill if data arrives.
     * @param      timeout Maximum time to wait.
     * @return             True if a packet was received.
     */
    virtual bool waitFor(Packet &pkt, std::chrono::milliseconds timeout) noexcept = 0;

    /**
     * @brief Close the channel. Pending incoming packets may still be polled.
     */
    virtual void close() noexcept = 0;

    /**
     * @return False once the channel was closed locally or by the peer.
     */
    virtual bool isOpen() const noexcept = 0;
};

/**
 * @typedef ChannelPtr
 * @brief Shared pointer alias for IChannel.
 */
using ChannelPtr = std::shared_ptr<IChannel>;

} // namespace provider_bridge::io

#endif // PROVIDER_BRIDGE_IO_CHANNEL_HPP
