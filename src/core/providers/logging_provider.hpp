/**
 * @file   logging_provider.hpp
 * @brief  Declares LoggingProvider, a pass-through wrapper that logs every
 *         call made to its single child and how long it took.
 *
 * @date   2026-10-19
 */

#pragma once

#include <memory>
#include <string>

#include "../provider.hpp"

namespace provider_bridge::providers {

class LoggingProvider final : public Provider {
public:
    /**
     * @param child  Provider every call is forwarded to.
     * @param label  Prefix of every log line.
     */
    LoggingProvider(std::unique_ptr<Provider> child, std::string label);

    InitializationResult initialize(ExtensionPoint& extensionPoint) override;
    MessageBatch getMessages(Time start, Time end,
                             const GetMessagesTopics& topics) override;
    void close() override;

private:
    std::unique_ptr<Provider> m_child;
    std::string               m_label;
};

} // namespace provider_bridge::providers
