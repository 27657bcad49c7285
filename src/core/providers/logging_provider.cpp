/**
 * @file   logging_provider.cpp
 * @brief  Implements LoggingProvider.
 *
 * @date   2026-10-19
 */

#include "logging_provider.hpp"
#include "../logging.hpp"

#include <chrono>
#include <stdexcept>

namespace provider_bridge::providers {

namespace {

using Clock = std::chrono::steady_clock;

qint64 elapsedMs(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

} // namespace

LoggingProvider::LoggingProvider(std::unique_ptr<Provider> child, std::string label)
  : m_child(std::move(child))
  , m_label(std::move(label))
{
    if (!m_child)
        throw std::invalid_argument("LoggingProvider needs a child");
}

InitializationResult LoggingProvider::initialize(ExtensionPoint& extensionPoint) {
    const auto t0 = Clock::now();
    try {
        InitializationResult r = m_child->initialize(extensionPoint);
        qCDebug(lcProvider).nospace() << "[" << m_label.c_str() << "] initialize: "
                                      << r.topics.size() << " topics in "
                                      << elapsedMs(t0) << " ms";
        return r;
    }
    catch (const std::exception& e) {
        qCWarning(lcProvider).nospace() << "[" << m_label.c_str() << "] initialize failed: "
                                        << e.what();
        throw;
    }
}

MessageBatch LoggingProvider::getMessages(Time start, Time end,
                                          const GetMessagesTopics& topics)
{
    const auto t0 = Clock::now();
    try {
        MessageBatch batch = m_child->getMessages(start, end, topics);
        qCDebug(lcProvider).nospace() << "[" << m_label.c_str() << "] getMessages "
                                      << start.sec << "." << start.nsec << " - "
                                      << end.sec << "." << end.nsec << ": "
                                      << (batch.rawMessages ? batch.rawMessages->size() : 0)
                                      << " raw in " << elapsedMs(t0) << " ms";
        return batch;
    }
    catch (const std::exception& e) {
        qCWarning(lcProvider).nospace() << "[" << m_label.c_str() << "] getMessages failed: "
                                        << e.what();
        throw;
    }
}

void LoggingProvider::close() {
    qCDebug(lcProvider).nospace() << "[" << m_label.c_str() << "] close";
    m_child->close();
}

} // namespace provider_bridge::providers
