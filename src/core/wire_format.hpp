/**
 * @file   wire_format.hpp
 * @brief  JSON payloads of the bridge methods: the getMessages request, the
 *         raw-message reply with its transfer set, and extension-point events.
 *
 * A raw record crosses the channel as
 *   {"topic", "receiveTime": {"sec","nsec"}, "buffer": i, "offset", "length"}
 * where `buffer` indexes the reply's transferred buffers.
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_WIRE_FORMAT_HPP
#define PROVIDER_BRIDGE_WIRE_FORMAT_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "types.hpp"
#include "io/rpc.hpp"

namespace provider_bridge::wire {

/// Method and event names on the channel.
constexpr const char* METHOD_INITIALIZE       = "initialize";
constexpr const char* METHOD_GET_MESSAGES     = "getMessages";
constexpr const char* METHOD_CLOSE            = "close";
constexpr const char* EVENT_EXTENSION_POINT   = "extensionPointCallback";

/// Extension-point event kinds.
constexpr const char* CALLBACK_PROGRESS       = "progressCallback";
constexpr const char* CALLBACK_METADATA       = "reportMetadataCallback";
constexpr const char* CALLBACK_NOTIFY         = "notifyPlayerManager";

/**
 * @struct GetMessagesRequest
 * @brief  Arguments of a getMessages call, exactly as the caller sent them.
 */
struct GetMessagesRequest {
    Time                     start;
    Time                     end;
    std::vector<std::string> topics;
};

nlohmann::json encodeGetMessagesRequest(const GetMessagesRequest& request);

/**
 * @brief Parse a getMessages payload without reordering or clamping the range.
 * @throws BridgeError (ProtocolError) on a malformed payload.
 */
GetMessagesRequest decodeGetMessagesRequest(const nlohmann::json& data);

/**
 * @brief Turn a provider batch into a reply, consuming it.
 *
 * Moves each distinct physical buffer into the reply's transfers exactly
 * once; the batch holds no buffer afterwards.
 *
 * @throws BridgeError (ContractViolation) if the batch carries parsed or
 *         object records, or a raw record whose view is outside its buffer.
 */
io::Message encodeMessageBatch(MessageBatch&& batch);

/**
 * @brief Rebuild raw records from a reply produced by encodeMessageBatch().
 * @throws BridgeError (ProtocolError) on a malformed reply.
 */
std::vector<RawMessage> decodeMessageBatch(io::Message&& reply);

/** @return The payload of an extensionPointCallback event. */
nlohmann::json encodeExtensionEvent(const std::string& type, nlohmann::json data);

} // namespace provider_bridge::wire

#endif // PROVIDER_BRIDGE_WIRE_FORMAT_HPP
