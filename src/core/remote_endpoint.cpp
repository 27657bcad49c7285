/**
 * @file   remote_endpoint.cpp
 * @brief  Implements RemoteEndpoint: request validation, lifecycle checks,
 *         provider calls on the worker, payload shape enforcement and
 *         extension-point forwarding.
 *
 * @date   2026-10-19
 */

#include "remote_endpoint.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "wire_format.hpp"

#include <chrono>

namespace provider_bridge {

RemoteEndpoint::RemoteEndpoint(io::Rpc& rpc, ProviderFactory factory)
  : m_rpc(rpc)
  , m_factory(std::move(factory))
{
    // Slots only queue; the servicing loop or the next reply sends them
    m_extensionPoint.progressCallback = [this](const Progress& p) {
        pushEvent(wire::CALLBACK_PROGRESS, nlohmann::json(p));
    };
    m_extensionPoint.reportMetadataCallback = [this](const ProviderMetadata& m) {
        pushEvent(wire::CALLBACK_METADATA, m);
    };
    m_extensionPoint.notifyPlayerManager = [this](const NotifyPlayerManagerData& d) {
        pushEvent(wire::CALLBACK_NOTIFY, d);
    };

    m_rpc.receive(wire::METHOD_INITIALIZE, [this](io::Message req, io::Responder res) {
        onInitialize(std::move(req), std::move(res));
    });
    m_rpc.receive(wire::METHOD_GET_MESSAGES, [this](io::Message req, io::Responder res) {
        onGetMessages(std::move(req), std::move(res));
    });
    m_rpc.receive(wire::METHOD_CLOSE, [this](io::Message req, io::Responder res) {
        onClose(std::move(req), std::move(res));
    });
}

RemoteEndpoint::~RemoteEndpoint() {
    m_rpc.removeHandler(wire::METHOD_INITIALIZE);
    m_rpc.removeHandler(wire::METHOD_GET_MESSAGES);
    m_rpc.removeHandler(wire::METHOD_CLOSE);

    // Runs after every queued request; m_worker joins on destruction
    m_worker.post([this] {
        if (m_providerClosed) return;
        try {
            closeProvider();
        }
        catch (const std::exception& e) {
            qCWarning(lcEndpoint) << "provider failed to close on shutdown:" << e.what();
        }
    });
}

template <class Fn>
void RemoteEndpoint::runOnWorker(const char* method, io::Responder responder, Fn fn) {
    const bool accepted = m_worker.post([this, method, responder, fn]() mutable {
        try {
            fn(responder);
        }
        catch (const BridgeError& e) {
            qCWarning(lcEndpoint) << method << "failed:" << errorKindName(e.kind()) << e.what();
            flushEvents();
            responder.reject(e.kind(), e.what());
        }
        catch (const std::exception& e) {
            qCWarning(lcEndpoint) << method << "failed in provider:" << e.what();
            flushEvents();
            responder.reject(ErrorKind::ProviderFailure, e.what());
        }
    });
    if (!accepted)
        responder.reject(ErrorKind::ProtocolError, "Endpoint is shutting down");
}

// ----------------------------------------------------------------------------
// Handlers (servicing thread)
// ----------------------------------------------------------------------------

void RemoteEndpoint::onInitialize(io::Message request, io::Responder responder) {
    ProviderDescriptor descriptor;
    try {
        request.data.at("childDescriptor").get_to(descriptor);
    }
    catch (const nlohmann::json::exception& e) {
        throw BridgeError(ErrorKind::ProtocolError,
                          std::string("Malformed initialize request: ") + e.what());
    }

    State expected = State::Idle;
    if (!m_state.compare_exchange_strong(expected, State::Initialized)) {
        responder.reject(ErrorKind::ProtocolError,
                         expected == State::Closed ? "Provider closed"
                                                   : "Provider already initialized");
        return;
    }

    qCInfo(lcEndpoint) << "initialize" << descriptor.name.c_str();
    runOnWorker(wire::METHOD_INITIALIZE, std::move(responder),
        [this, descriptor](io::Responder& r) {
            // Nothing was built: a new initialize may follow unless close came first
            auto backToIdle = [this] {
                State initialized = State::Initialized;
                m_state.compare_exchange_strong(initialized, State::Idle);
            };
            try {
                m_provider = m_factory(descriptor);
            }
            catch (const std::exception&) {
                backToIdle();
                throw;
            }
            if (!m_provider) {
                backToIdle();
                throw BridgeError(ErrorKind::ProviderFailure,
                                  "Factory produced no provider for '" + descriptor.name + "'");
            }

            InitializationResult result = m_provider->initialize(m_extensionPoint);
            flushEvents();
            r.resolve(io::Message{nlohmann::json(result), {}});
        });
}

void RemoteEndpoint::onGetMessages(io::Message request, io::Responder responder) {
    auto args = wire::decodeGetMessagesRequest(request.data);
    if (!checkReady(wire::METHOD_GET_MESSAGES, responder)) return;

    runOnWorker(wire::METHOD_GET_MESSAGES, std::move(responder),
        [this, args](io::Responder& r) {
            if (!m_provider)
                throw BridgeError(ErrorKind::ProtocolError, "Provider not initialized");

            GetMessagesTopics topics;
            topics.rawMessages = args.topics;

            const auto t0 = std::chrono::steady_clock::now();
            MessageBatch batch = m_provider->getMessages(args.start, args.end, topics);
            io::Message reply = wire::encodeMessageBatch(std::move(batch));

            qCDebug(lcEndpoint) << "getMessages"
                                << args.start.sec << args.start.nsec << "→"
                                << args.end.sec << args.end.nsec
                                << "records=" << reply.data["messages"].size()
                                << "buffers=" << reply.transfers.size()
                                << "in" << std::chrono::duration_cast<std::chrono::milliseconds>(
                                               std::chrono::steady_clock::now() - t0).count() << "ms";
            flushEvents();
            r.resolve(std::move(reply));
        });
}

void RemoteEndpoint::onClose(io::Message, io::Responder responder) {
    State expected = State::Initialized;
    if (!m_state.compare_exchange_strong(expected, State::Closed)) {
        responder.reject(ErrorKind::ProtocolError,
                         expected == State::Closed ? "Provider closed"
                                                   : "close before initialize");
        return;
    }

    qCInfo(lcEndpoint) << "close";
    runOnWorker(wire::METHOD_CLOSE, std::move(responder), [this](io::Responder& r) {
        closeProvider();
        r.resolve(io::Message{nlohmann::json::object(), {}});
    });
}

bool RemoteEndpoint::checkReady(const char* method, io::Responder& responder) const {
    switch (m_state.load()) {
      case State::Idle:
        responder.reject(ErrorKind::ProtocolError,
                         std::string(method) + " before initialize");
        return false;
      case State::Closed:
        responder.reject(ErrorKind::ProtocolError, "Provider closed");
        return false;
      case State::Initialized:
        break;
    }
    return true;
}

// ----------------------------------------------------------------------------
// Worker side
// ----------------------------------------------------------------------------

void RemoteEndpoint::closeProvider() {
    try {
        if (m_provider) m_provider->close();
    }
    catch (const std::exception&) {
        sealEvents();
        m_provider.reset();
        throw;
    }
    sealEvents();
    m_provider.reset();
}

void RemoteEndpoint::sealEvents() {
    std::lock_guard<std::mutex> lk(m_flushMtx);
    m_providerClosed = true;
    m_events.seal();
}

// ----------------------------------------------------------------------------
// Extension point
// ----------------------------------------------------------------------------

void RemoteEndpoint::pushEvent(const char* type, nlohmann::json data) {
    if (m_providerClosed || !m_events.push(ExtensionEvent{type, std::move(data)}))
        qCDebug(lcEndpoint) << "dropping" << type << "after close";
}

std::size_t RemoteEndpoint::flushEvents() {
    std::lock_guard<std::mutex> lk(m_flushMtx);
    auto events = m_events.drain();
    for (auto& ev : events) {
        if (!m_rpc.notify(wire::EVENT_EXTENSION_POINT,
                          wire::encodeExtensionEvent(ev.type, std::move(ev.data))))
            qCWarning(lcEndpoint) << "could not forward" << ev.type.c_str();
    }
    return events.size();
}

} // namespace provider_bridge
