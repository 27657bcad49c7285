/**
 * @file   socket_channel.hpp
 * @brief  Declares SocketChannel: a stream-socket IChannel transport for a
 *         provider tree hosted in a child process or on a network peer, and
 *         SocketListener, which accepts one such channel.
 *
 * Each packet is framed as
 *   u32 jsonLength | json | u32 bufferCount | { u64 length | bytes }*
 * with all integers little-endian.
 *
 * Addresses are "unix:/path/to/socket" or "tcp:host:port".
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_IO_SOCKET_CHANNEL_HPP
#define PROVIDER_BRIDGE_IO_SOCKET_CHANNEL_HPP

#include "channel.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace provider_bridge::io {

/**
 * @class SocketChannel
 * @brief Final implementation of IChannel over a connected stream socket.
 */
class SocketChannel final : public IChannel {
public:
    /// Upper bound for any single length field in a frame.
    static constexpr std::uint64_t MAX_FIELD_BYTES = 1ULL << 30;

    /**
     * @brief Adopt an already connected socket (e.g. one end of socketpair()).
     * @param fd  Connected stream socket; owned and closed by the channel.
     */
    explicit SocketChannel(int fd) noexcept;

    /**
     * @brief Closes the socket if open.
     */
    ~SocketChannel() noexcept override;

    SocketChannel(const SocketChannel&) = delete;
    SocketChannel& operator=(const SocketChannel&) = delete;

    /**
     * @brief Connect to a listening bridge endpoint.
     * @param address  "unix:/path" or "tcp:host:port".
     * @param err      Optional out-param receiving the failure reason.
     * @return         Connected channel, or nullptr on failure.
     */
    static std::shared_ptr<SocketChannel> connect(const std::string& address,
                                                  std::string* err = nullptr);

    bool send(Packet &&pkt) noexcept override;
    bool poll(Packet &pkt) noexcept override;
    bool waitFor(Packet &pkt, std::chrono::milliseconds timeout) noexcept override;
    void close() noexcept override;
    bool isOpen() const noexcept override;

private:
    bool writeAll(const void* data, std::size_t len) noexcept;
    bool readAvailable() noexcept;
    bool extractFrame(Packet &pkt) noexcept;
    void markBroken(const char* why) noexcept;

    int                       m_fd{-1};           /**< Socket FD or -1 when closed */
    std::atomic_bool          m_open{false};
    std::mutex                m_sendMtx;          /**< Serializes whole frames */
    std::mutex                m_recvMtx;          /**< Guards m_rx */
    std::vector<std::uint8_t> m_rx;               /**< Bytes received, not yet framed */
    static constexpr std::size_t BUF_SIZE = 64 * 1024; /**< recv() chunk */
};

/**
 * @class SocketListener
 * @brief Listening socket that hands out SocketChannels.
 */
class SocketListener {
public:
    /**
     * @brief Bind and listen on `address`.
     * @note noexcept: on failure the listener stays invalid (isListening() false).
     */
    explicit SocketListener(const std::string& address) noexcept;

    /**
     * @brief Closes the listening socket and removes a Unix socket path.
     */
    ~SocketListener() noexcept;

    SocketListener(const SocketListener&) = delete;
    SocketListener& operator=(const SocketListener&) = delete;

    bool isListening() const noexcept { return m_fd >= 0; }

    /** @return Reason of the last failure, empty if none. */
    const std::string& error() const noexcept { return m_error; }

    /**
     * @brief Wait up to `timeout` for one peer.
     * @return The accepted channel, or nullptr on timeout or error.
     */
    std::shared_ptr<SocketChannel> accept(std::chrono::milliseconds timeout) noexcept;

private:
    int         m_fd{-1};
    std::string m_unixPath;  /**< Unlinked on destruction when non-empty */
    std::string m_error;
};

} // namespace provider_bridge::io

#endif // PROVIDER_BRIDGE_IO_SOCKET_CHANNEL_HPP
