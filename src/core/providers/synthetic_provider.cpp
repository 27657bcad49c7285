/**
 * @file   synthetic_provider.cpp
 * @brief  Implements SyntheticProvider: option parsing, message timing and
 *         chunked buffer packing.
 *
 * @date   2026-10-19
 */

#include "synthetic_provider.hpp"
#include "../errors.hpp"
#include "../logging.hpp"

#include <algorithm>
#include <cmath>
#include <memory>

namespace provider_bridge::providers {

SyntheticOptions SyntheticOptions::fromJson(const nlohmann::json& args) {
    SyntheticOptions o;
    try {
        if (args.contains("start"))         args.at("start").get_to(o.start);
        if (args.contains("end"))           args.at("end").get_to(o.end);
        if (args.contains("topics"))        args.at("topics").get_to(o.topics);
        if (args.contains("frequencyHz"))   args.at("frequencyHz").get_to(o.frequencyHz);
        if (args.contains("payloadBytes"))  args.at("payloadBytes").get_to(o.payloadBytes);
        if (args.contains("chunkMessages")) args.at("chunkMessages").get_to(o.chunkMessages);
    }
    catch (const nlohmann::json::exception& e) {
        throw BridgeError(ErrorKind::ProviderFailure,
                          std::string("Invalid synthetic provider args: ") + e.what());
    }
    catch (const std::out_of_range& e) {
        throw BridgeError(ErrorKind::ProviderFailure,
                          std::string("Invalid synthetic provider args: ") + e.what());
    }

    if (!(o.frequencyHz > 0.0) || !std::isfinite(o.frequencyHz))
        throw BridgeError(ErrorKind::ProviderFailure, "synthetic: frequencyHz must be > 0");
    if (o.payloadBytes == 0 || o.chunkMessages == 0)
        throw BridgeError(ErrorKind::ProviderFailure,
                          "synthetic: payloadBytes and chunkMessages must be > 0");
    if (o.payloadBytes > MAX_CHUNK_BYTES / o.chunkMessages)
        throw BridgeError(ErrorKind::ProviderFailure,
                          "synthetic: payloadBytes * chunkMessages exceeds 1 GiB");
    if (o.end < o.start)
        throw BridgeError(ErrorKind::ProviderFailure, "synthetic: end precedes start");

    const double spanSec = static_cast<double>(o.end.toNanoseconds() -
                                               o.start.toNanoseconds()) / 1e9;
    if (spanSec * o.frequencyHz + 1.0 > MAX_MESSAGES_PER_TOPIC)
        throw BridgeError(ErrorKind::ProviderFailure,
                          "synthetic: range and frequency exceed 1e9 messages per topic");
    return o;
}

SyntheticProvider::SyntheticProvider(SyntheticOptions options)
  : m_opts(std::move(options))
{}

Time SyntheticProvider::timeOf(std::size_t k) const noexcept {
    const double offsetNs = std::round(static_cast<double>(k) * 1e9 / m_opts.frequencyHz);
    return Time::fromNanoseconds(m_opts.start.toNanoseconds() +
                                 static_cast<std::uint64_t>(offsetNs));
}

std::size_t SyntheticProvider::messagesPerTopic() const noexcept {
    const double spanNs = static_cast<double>(m_opts.end.toNanoseconds() -
                                              m_opts.start.toNanoseconds());
    auto n = static_cast<std::size_t>(std::floor(spanNs * m_opts.frequencyHz / 1e9)) + 1;
    // Rounding in timeOf() may push the last candidate past the end
    while (n > 0 && timeOf(n - 1) > m_opts.end) --n;
    return n;
}

InitializationResult SyntheticProvider::initialize(ExtensionPoint& extensionPoint) {
    InitializationResult result;
    result.start  = m_opts.start;
    result.end    = m_opts.end;
    result.topics = m_opts.topics;
    for (auto const& t : m_opts.topics)
        result.messageDefinitions[t.datatype] = "uint8[] data";

    const std::size_t total = messagesPerTopic() * m_opts.topics.size();
    if (extensionPoint.reportMetadataCallback) {
        extensionPoint.reportMetadataCallback(nlohmann::json{
            {"type",             "initializationPerformance"},
            {"dataProviderType", "synthetic"},
            {"totalMessages",    total}
        });
    }
    // Everything is generated on demand, so the whole range counts as loaded
    if (extensionPoint.progressCallback)
        extensionPoint.progressCallback(Progress{{FractionRange{0.0, 1.0}}});

    qCDebug(lcProvider) << "synthetic provider ready:" << m_opts.topics.size()
                        << "topics," << total << "messages";
    return result;
}

MessageBatch SyntheticProvider::getMessages(Time start, Time end,
                                            const GetMessagesTopics& topics)
{
    if (m_closed)
        throw BridgeError(ErrorKind::ProviderFailure, "synthetic provider is closed");

    MessageBatch batch;
    batch.rawMessages.emplace();
    if (!topics.rawMessages || start > end)
        return batch;

    // Requested topics in declaration order
    std::vector<std::string> wanted;
    for (auto const& t : m_opts.topics) {
        if (std::find(topics.rawMessages->begin(), topics.rawMessages->end(), t.name)
                != topics.rawMessages->end())
            wanted.push_back(t.name);
    }
    if (wanted.empty()) return batch;

    // Candidate index range, widened by one to absorb rounding
    const std::size_t count = messagesPerTopic();
    const double f = m_opts.frequencyHz;
    const auto base = static_cast<double>(m_opts.start.toNanoseconds());
    // Clamped to [0, count] so the casts below stay in range
    auto indexAt = [&](Time t) {
        const double k = (static_cast<double>(t.toNanoseconds()) - base) * f / 1e9;
        return std::clamp(k, 0.0, static_cast<double>(count));
    };
    std::size_t kLo = static_cast<std::size_t>(std::floor(indexAt(start)));
    std::size_t kHi = std::min(count, static_cast<std::size_t>(std::ceil(indexAt(end))) + 2);
    if (kLo > 0) --kLo;

    auto& out = *batch.rawMessages;
    ByteBuffer chunk;
    std::size_t inChunk = 0;
    for (std::size_t k = kLo; k < kHi; ++k) {
        const Time t = timeOf(k);
        if (t < start || t > end) continue;

        for (std::size_t ti = 0; ti < wanted.size(); ++ti) {
            if (!chunk || inChunk == m_opts.chunkMessages) {
                chunk = std::make_shared<std::vector<std::uint8_t>>();
                chunk->reserve(m_opts.chunkMessages * m_opts.payloadBytes);
                inChunk = 0;
            }
            const std::size_t offset = chunk->size();
            for (std::size_t b = 0; b < m_opts.payloadBytes; ++b)
                chunk->push_back(static_cast<std::uint8_t>((k + ti * 31 + b) & 0xFF));

            out.push_back(RawMessage{wanted[ti], t, chunk, offset, m_opts.payloadBytes});
            ++inChunk;
        }
    }
    return batch;
}

void SyntheticProvider::close() {
    m_closed = true;
}

} // namespace provider_bridge::providers
