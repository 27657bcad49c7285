/**
 * @file   remote_provider.cpp
 * @brief  Implements RemoteProvider: request encoding, blocking waits on
 *         replies, and dispatch of extension-point events by type.
 *
 * @date   2026-10-19
 */

#include "remote_provider.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "wire_format.hpp"

#include <exception>

namespace provider_bridge {

RemoteProvider::RemoteProvider(io::ChannelPtr channel,
                               ProviderDescriptor child,
                               std::chrono::milliseconds pollInterval)
  : m_rpc(std::move(channel))
  , m_child(std::move(child))
  , m_pollInterval(pollInterval)
{
    m_rpc.receive(wire::EVENT_EXTENSION_POINT, [this](io::Message ev, io::Responder) {
        onExtensionEvent(ev.data);
    });
    m_service = std::thread([this]{ serviceLoop(); });
}

RemoteProvider::~RemoteProvider() {
    m_stop = true;
    if (m_service.joinable())
        m_service.join();
}

void RemoteProvider::serviceLoop() {
    while (!m_stop) {
        if (!m_rpc.pumpFor(m_pollInterval) && !m_rpc.isOpen())
            break;
    }
}

InitializationResult RemoteProvider::initialize(ExtensionPoint& extensionPoint) {
    {
        std::lock_guard<std::mutex> lk(m_extMtx);
        m_extensionPoint = &extensionPoint;
    }

    // get() rethrows the BridgeError set by Rpc on an error reply
    auto reply = m_rpc.send(wire::METHOD_INITIALIZE,
                            nlohmann::json{{"childDescriptor", m_child}}).get();
    try {
        return reply.data.get<InitializationResult>();
    }
    catch (const nlohmann::json::exception& e) {
        throw BridgeError(ErrorKind::ProtocolError,
                          std::string("Malformed initialize reply: ") + e.what());
    }
    catch (const std::out_of_range& e) {
        throw BridgeError(ErrorKind::ProtocolError,
                          std::string("Malformed initialize reply: ") + e.what());
    }
}

MessageBatch RemoteProvider::getMessages(Time start, Time end,
                                         const GetMessagesTopics& topics)
{
    if (topics.parsedMessages || topics.objects) {
        throw BridgeError(ErrorKind::ContractViolation,
            "Only raw messages can be requested across the bridge");
    }

    wire::GetMessagesRequest req;
    req.start  = start;
    req.end    = end;
    req.topics = topics.rawMessages.value_or(std::vector<std::string>{});

    auto reply = m_rpc.send(wire::METHOD_GET_MESSAGES,
                            wire::encodeGetMessagesRequest(req)).get();
    MessageBatch batch;
    batch.rawMessages = wire::decodeMessageBatch(std::move(reply));
    return batch;
}

void RemoteProvider::close() {
    auto reply = m_rpc.send(wire::METHOD_CLOSE, nlohmann::json::object());
    // Events sent before the reply have been dispatched once get() returns
    std::exception_ptr failure;
    try {
        reply.get();
    }
    catch (const std::exception&) {
        failure = std::current_exception();
    }
    {
        std::lock_guard<std::mutex> lk(m_extMtx);
        m_extensionPoint = nullptr;
    }
    if (failure) std::rethrow_exception(failure);
}

void RemoteProvider::onExtensionEvent(const nlohmann::json& data) {
    const std::string type = data.value("type", std::string{});
    const nlohmann::json payload = data.contains("data") ? data.at("data") : nlohmann::json();

    std::lock_guard<std::mutex> lk(m_extMtx);
    if (!m_extensionPoint) {
        qCDebug(lcRpc) << "extension event" << type.c_str() << "without a listener";
        return;
    }

    if (type == wire::CALLBACK_PROGRESS) {
        if (m_extensionPoint->progressCallback)
            m_extensionPoint->progressCallback(payload.get<Progress>());
    }
    else if (type == wire::CALLBACK_METADATA) {
        if (m_extensionPoint->reportMetadataCallback)
            m_extensionPoint->reportMetadataCallback(payload);
    }
    else if (type == wire::CALLBACK_NOTIFY) {
        if (m_extensionPoint->notifyPlayerManager)
            m_extensionPoint->notifyPlayerManager(payload);
    }
    else {
        qCWarning(lcRpc) << "unknown extension event type" << type.c_str();
    }
}

} // namespace provider_bridge
