/**
 * @file   rpc.hpp
 * @brief  Declares Rpc: topic-addressed request/response and fire-and-forget
 *         events on top of an IChannel.
 *
 * Envelopes (JSON):
 *   request   {"topic": name, "id": n, "data": ...}
 *   event     {"topic": name, "data": ...}              (no reply)
 *   response  {"topic": "$$RESPONSE", "id": n, "data": ...}
 *   error     {"topic": "$$ERROR", "id": n, "data": {"kind", "message"}}
 *
 * Buffers travel in Packet::transfers; payloads refer to them by index.
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_IO_RPC_HPP
#define PROVIDER_BRIDGE_IO_RPC_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

#include "channel.hpp"
#include "../errors.hpp"

namespace provider_bridge::io {

/**
 * @struct Message
 * @brief  Request or reply payload: JSON data plus transferred buffers.
 */
struct Message {
    nlohmann::json          data;
    std::vector<ByteBuffer> transfers;
};

/**
 * @class Responder
 * @brief Completes one incoming request, from any thread, exactly once.
 *
 * Copies share state. If the last copy goes away without resolve() or
 * reject(), the caller receives a ProtocolError reply. Responders of events
 * (which have no id) send nothing.
 */
class Responder {
public:
    Responder() = default;

    /** @brief Reply with `reply`; its buffers are handed to the channel. */
    void resolve(Message reply);

    /** @brief Reply with an error. */
    void reject(ErrorKind kind, const std::string& message);

    /** @return True once resolve() or reject() has run. */
    bool completed() const noexcept;

private:
    friend class Rpc;
    struct State;
    explicit Responder(std::shared_ptr<State> state) : m_state(std::move(state)) {}

    std::shared_ptr<State> m_state;
};

/**
 * @class Rpc
 * @brief Request/response correlation and handler dispatch over a channel.
 *
 * pumpFor() must be driven by one servicing thread; handlers run on it.
 * send(), notify() and Responder completion are thread-safe.
 */
class Rpc {
public:
    using Handler = std::function<void(Message request, Responder responder)>;

    static constexpr const char* RESPONSE_TOPIC = "$$RESPONSE";
    static constexpr const char* ERROR_TOPIC    = "$$ERROR";

    explicit Rpc(ChannelPtr channel);

    /**
     * @brief Fails every pending request with ChannelFailure.
     */
    ~Rpc();

    Rpc(const Rpc&) = delete;
    Rpc& operator=(const Rpc&) = delete;

    /**
     * @brief Register the handler for `topic`.
     * @throws std::logic_error if a handler is already registered.
     */
    void receive(const std::string& topic, Handler handler);

    /** @brief Unregister the handler for `topic`, if any. */
    void removeHandler(const std::string& topic);

    /**
     * @brief Send a request; the future yields the reply or throws BridgeError.
     */
    std::future<Message> send(const std::string& topic,
                              nlohmann::json data,
                              std::vector<ByteBuffer> transfers = {});

    /**
     * @brief Send an event; no reply is expected.
     * @return False if the channel refused the packet.
     */
    bool notify(const std::string& topic, nlohmann::json data);

    /**
     * @brief Wait up to `timeout` and service at most one incoming packet.
     * @return True if a packet was serviced.
     */
    bool pumpFor(std::chrono::milliseconds timeout);

    /** @return True while the underlying channel is open. */
    bool isOpen() const noexcept;

    /** @brief Close the channel and fail all pending requests. */
    void close();

    /** @return Number of requests still waiting for a reply. */
    std::size_t pendingCount() const;

private:
    void dispatch(Packet &&pkt);
    void settle(std::uint64_t id, bool isError, nlohmann::json data,
                std::vector<ByteBuffer> transfers);
    void failPending(const std::string& reason);

    ChannelPtr                                         m_channel;
    mutable std::mutex                                 m_mtx;       // guards the maps
    std::unordered_map<std::string, Handler>           m_handlers;
    std::unordered_map<std::uint64_t, std::promise<Message>> m_pending;
    std::uint64_t                                      m_nextId{1};
};

} // namespace provider_bridge::io

#endif // PROVIDER_BRIDGE_IO_RPC_HPP
