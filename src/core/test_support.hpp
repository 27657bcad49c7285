/**
 * @file   test_support.hpp
 * @brief  Helpers shared by the endpoint and end-to-end tests: a provider
 *         whose behaviour is scripted per test, and a thread that hosts a
 *         RemoteEndpoint on one end of a channel.
 *
 * @date   2026-10-19
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "provider.hpp"
#include "remote_endpoint.hpp"
#include "io/rpc.hpp"

namespace provider_bridge::test_support {

/**
 * @struct Script
 * @brief  Behaviour and call log of a ScriptedProvider. Hooks left empty
 *         fall back to an empty result.
 */
struct Script {
    std::function<InitializationResult(ExtensionPoint&)>                 onInitialize;
    std::function<MessageBatch(Time, Time, const GetMessagesTopics&)>   onGetMessages;
    std::function<void()>                                                onClose;

    std::mutex                             mtx;
    ExtensionPoint*                        extensionPoint{nullptr};
    std::vector<std::pair<Time, Time>>     ranges;
    std::vector<GetMessagesTopics>         topics;
    int                                    closeCalls{0};
};

class ScriptedProvider final : public Provider {
public:
    explicit ScriptedProvider(std::shared_ptr<Script> script)
      : m_script(std::move(script))
    {}

    InitializationResult initialize(ExtensionPoint& extensionPoint) override {
        {
            std::lock_guard<std::mutex> lk(m_script->mtx);
            m_script->extensionPoint = &extensionPoint;
        }
        return m_script->onInitialize ? m_script->onInitialize(extensionPoint)
                                      : InitializationResult{};
    }

    MessageBatch getMessages(Time start, Time end, const GetMessagesTopics& topics) override {
        {
            std::lock_guard<std::mutex> lk(m_script->mtx);
            m_script->ranges.emplace_back(start, end);
            m_script->topics.push_back(topics);
        }
        if (m_script->onGetMessages)
            return m_script->onGetMessages(start, end, topics);
        MessageBatch batch;
        batch.rawMessages.emplace();
        return batch;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lk(m_script->mtx);
            ++m_script->closeCalls;
        }
        if (m_script->onClose) m_script->onClose();
    }

private:
    std::shared_ptr<Script> m_script;
};

/// Factory building a ScriptedProvider for descriptors named "scripted".
inline ProviderFactory scriptedFactory(std::shared_ptr<Script> script) {
    return [script](const ProviderDescriptor& d) -> std::unique_ptr<Provider> {
        if (d.name != "scripted")
            throw UnknownProviderError(d.name);
        return std::make_unique<ScriptedProvider>(script);
    };
}

/**
 * @class HostThread
 * @brief Runs a RemoteEndpoint on `channel`, servicing it on its own thread
 *        the way the host executable does.
 */
class HostThread {
public:
    HostThread(io::ChannelPtr channel, ProviderFactory factory)
      : m_rpc(std::move(channel))
      , m_endpoint(m_rpc, std::move(factory))
      , m_thread([this]{ run(); })
    {}

    ~HostThread() {
        m_stop = true;
        m_thread.join();
    }

    RemoteEndpoint& endpoint() { return m_endpoint; }

private:
    void run() {
        while (!m_stop) {
            m_rpc.pumpFor(std::chrono::milliseconds(1));
            m_endpoint.flushEvents();
        }
    }

    io::Rpc           m_rpc;
    RemoteEndpoint    m_endpoint;
    std::atomic_bool  m_stop{false};
    std::thread       m_thread;
};

} // namespace provider_bridge::test_support
