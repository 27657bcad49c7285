/**
 * @file   remote_endpoint.hpp
 * @brief  Declares RemoteEndpoint: the side of the bridge that lives beside
 *         the hosted provider tree.
 *
 * RemoteEndpoint answers the "initialize", "getMessages" and "close"
 * requests of an Rpc by driving the single Provider it owns, and forwards
 * the provider's extension-point callbacks as "extensionPointCallback"
 * events.
 *
 * Threading: Rpc handlers run on the channel-servicing thread and only
 * validate and enqueue. Provider calls run in order on a RequestWorker.
 * Extension-point callbacks may come from any thread; they are queued and
 * sent by flushEvents(), which the servicing loop calls, and before every
 * reply.
 *
 * Lifecycle: Idle → Initialized → Closed. A second initialize, a request
 * before initialize and any request after close are rejected with a
 * ProtocolError. Failures are request-scoped: neither the channel nor the
 * provider is torn down by a failed request.
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_REMOTE_ENDPOINT_HPP
#define PROVIDER_BRIDGE_REMOTE_ENDPOINT_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>

#include "event_queue.hpp"
#include "provider.hpp"
#include "request_worker.hpp"
#include "io/rpc.hpp"

namespace provider_bridge {

/**
 * @class RemoteEndpoint
 * @brief Translates bridge requests into calls on the owned Provider.
 */
class RemoteEndpoint {
public:
    enum class State { Idle, Initialized, Closed };

    /**
     * @brief Register the bridge handlers on `rpc`.
     * @param rpc      Request/response layer; must outlive the endpoint.
     * @param factory  Builds the provider tree from the caller's descriptor.
     */
    RemoteEndpoint(io::Rpc& rpc, ProviderFactory factory);

    /**
     * @brief Unregisters the handlers, finishes queued requests and closes
     *        the provider if the caller never did.
     */
    ~RemoteEndpoint();

    RemoteEndpoint(const RemoteEndpoint&) = delete;
    RemoteEndpoint& operator=(const RemoteEndpoint&) = delete;

    /**
     * @brief Send every queued extension-point event, oldest first.
     * @return Number of events sent.
     */
    std::size_t flushEvents();

    /** @return True once the provider has been closed. */
    bool closed() const noexcept { return m_providerClosed; }

    State state() const noexcept { return m_state; }

private:
    void onInitialize(io::Message request, io::Responder responder);
    void onGetMessages(io::Message request, io::Responder responder);
    void onClose(io::Message request, io::Responder responder);

    bool checkReady(const char* method, io::Responder& responder) const;
    void pushEvent(const char* type, nlohmann::json data);
    void closeProvider();
    void sealEvents();

    template <class Fn>
    void runOnWorker(const char* method, io::Responder responder, Fn fn);

    io::Rpc&                  m_rpc;
    ProviderFactory           m_factory;
    ExtensionPoint            m_extensionPoint;   // shared by reference with m_provider
    EventQueue                m_events;
    std::mutex                m_flushMtx;         // orders event sends against close
    std::unique_ptr<Provider> m_provider;         // touched on the worker only
    std::atomic<State>        m_state{State::Idle};
    std::atomic_bool          m_providerClosed{false};
    RequestWorker             m_worker{"endpoint"};  // declared last: joined first
};

} // namespace provider_bridge

#endif // PROVIDER_BRIDGE_REMOTE_ENDPOINT_HPP
