/**
 * @file   remote_provider.hpp
 * @brief  Declares RemoteProvider: the caller-side stub that presents a
 *         provider hosted behind a channel as a local Provider.
 *
 * RemoteProvider owns an Rpc on the given channel and a service thread that
 * pumps it, so replies and extension-point events are received while a
 * call blocks waiting for its reply.
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_REMOTE_PROVIDER_HPP
#define PROVIDER_BRIDGE_REMOTE_PROVIDER_HPP

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

#include "provider.hpp"
#include "io/channel.hpp"
#include "io/rpc.hpp"

namespace provider_bridge {

/**
 * @class RemoteProvider
 * @brief Provider whose calls are forwarded to a RemoteEndpoint.
 *
 * Failed replies are rethrown as BridgeError with the remote kind and
 * message. Only raw messages can be requested.
 */
class RemoteProvider final : public Provider {
public:
    /**
     * @param channel  Channel connected to the hosting side.
     * @param child    Descriptor of the provider tree to build remotely.
     * @param pollInterval  How long the service thread waits per pump.
     */
    RemoteProvider(io::ChannelPtr channel,
                   ProviderDescriptor child,
                   std::chrono::milliseconds pollInterval = std::chrono::milliseconds(10));

    /**
     * @brief Stops the service thread; pending calls fail with ChannelFailure.
     */
    ~RemoteProvider() override;

    RemoteProvider(const RemoteProvider&) = delete;
    RemoteProvider& operator=(const RemoteProvider&) = delete;

    InitializationResult initialize(ExtensionPoint& extensionPoint) override;

    /**
     * @throws BridgeError (ContractViolation) if parsed or object topics are
     *         requested; the bridge carries raw records only.
     */
    MessageBatch getMessages(Time start, Time end,
                             const GetMessagesTopics& topics) override;

    void close() override;

private:
    void serviceLoop();
    void onExtensionEvent(const nlohmann::json& data);

    io::Rpc                   m_rpc;
    ProviderDescriptor        m_child;
    std::chrono::milliseconds m_pollInterval;
    std::mutex                m_extMtx;               // guards m_extensionPoint
    ExtensionPoint*           m_extensionPoint{nullptr};
    std::atomic_bool          m_stop{false};
    std::thread               m_service;              // started last
};

} // namespace provider_bridge

#endif // PROVIDER_BRIDGE_REMOTE_PROVIDER_HPP
