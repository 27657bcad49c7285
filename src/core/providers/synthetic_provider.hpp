/**
 * @file   synthetic_provider.hpp
 * @brief  Declares SyntheticProvider: a deterministic raw-message generator
 *         used by the host executable and for smoke testing a bridge.
 *
 * Every topic publishes at `frequencyHz` from `start` to `end`. Records of
 * one getMessages() call are packed `chunkMessages` at a time into shared
 * buffers, so several records reference one physical buffer.
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_PROVIDERS_SYNTHETIC_PROVIDER_HPP
#define PROVIDER_BRIDGE_PROVIDERS_SYNTHETIC_PROVIDER_HPP

#include <cstddef>
#include <vector>
#include <nlohmann/json.hpp>

#include "../provider.hpp"

namespace provider_bridge::providers {

/**
 * @struct SyntheticOptions
 * @brief  Arguments of the "synthetic" provider descriptor.
 */
struct SyntheticOptions {
    Time               start{0, 0};
    Time               end{10, 0};
    std::vector<Topic> topics{Topic{"/synthetic", "raw/bytes"}};
    double             frequencyHz{10.0};
    std::size_t        payloadBytes{64};
    std::size_t        chunkMessages{16};

    /// Upper bound on messages per topic over the whole range.
    static constexpr double MAX_MESSAGES_PER_TOPIC = 1e9;
    /// Upper bound on one chunk buffer, the socket transport's field limit.
    static constexpr std::size_t MAX_CHUNK_BYTES = std::size_t{1} << 30;

    /**
     * @brief Read options from descriptor args; missing keys keep defaults.
     * @throws BridgeError (ProviderFailure) on invalid values.
     */
    static SyntheticOptions fromJson(const nlohmann::json& args);
};

/**
 * @class SyntheticProvider
 * @brief Produces raw records only; parsed and object requests are ignored.
 */
class SyntheticProvider final : public Provider {
public:
    explicit SyntheticProvider(SyntheticOptions options);

    InitializationResult initialize(ExtensionPoint& extensionPoint) override;
    MessageBatch getMessages(Time start, Time end,
                             const GetMessagesTopics& topics) override;
    void close() override;

    /** @return Messages a topic publishes over the whole range. */
    std::size_t messagesPerTopic() const noexcept;

private:
    /** @return Receive time of the k-th message of every topic. */
    Time timeOf(std::size_t k) const noexcept;

    SyntheticOptions m_opts;
    bool             m_closed{false};
};

} // namespace provider_bridge::providers

#endif // PROVIDER_BRIDGE_PROVIDERS_SYNTHETIC_PROVIDER_HPP
