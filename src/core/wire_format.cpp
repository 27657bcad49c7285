/**
 * @file   wire_format.cpp
 * @brief  Implements the bridge payload encoders and decoders.
 *
 * @date   2026-10-19
 */

#include "wire_format.hpp"
#include "errors.hpp"
#include "transfer_set.hpp"

namespace provider_bridge::wire {

nlohmann::json encodeGetMessagesRequest(const GetMessagesRequest& request) {
    return nlohmann::json{
        {"start",  request.start},
        {"end",    request.end},
        {"topics", request.topics}
    };
}

GetMessagesRequest decodeGetMessagesRequest(const nlohmann::json& data) {
    try {
        GetMessagesRequest out;
        data.at("start").get_to(out.start);
        data.at("end").get_to(out.end);
        data.at("topics").get_to(out.topics);
        return out;
    }
    catch (const nlohmann::json::exception& e) {
        throw BridgeError(ErrorKind::ProtocolError,
                          std::string("Malformed getMessages request: ") + e.what());
    }
    catch (const std::out_of_range& e) {
        throw BridgeError(ErrorKind::ProtocolError,
                          std::string("Malformed getMessages request: ") + e.what());
    }
}

io::Message encodeMessageBatch(MessageBatch&& batch) {
    if (batch.parsedMessages || batch.objects) {
        throw BridgeError(ErrorKind::ContractViolation,
            "The bridge only accepts raw messages; parse them on the receiving side");
    }

    std::vector<RawMessage> raw;
    if (batch.rawMessages) raw = std::move(*batch.rawMessages);
    batch.rawMessages.reset();

    TransferSet transfers;
    nlohmann::json messages = nlohmann::json::array();
    for (auto& m : raw) {
        if (!m.isValidView()) {
            throw BridgeError(ErrorKind::ContractViolation,
                "Raw message on '" + m.topic + "' does not reference a valid buffer range");
        }
        const std::size_t idx = transfers.add(std::move(m.buffer));
        messages.push_back({
            {"topic",       m.topic},
            {"receiveTime", m.receiveTime},
            {"buffer",      idx},
            {"offset",      m.offset},
            {"length",      m.length}
        });
    }
    raw.clear();

    io::Message reply;
    reply.data = {
        {"messages",      std::move(messages)},
        {"transferHints", transfers.size()}
    };
    reply.transfers = transfers.release();
    return reply;
}

std::vector<RawMessage> decodeMessageBatch(io::Message&& reply) {
    std::vector<RawMessage> out;
    try {
        const auto& messages = reply.data.at("messages");
        const auto hints = reply.data.at("transferHints").get<std::size_t>();
        if (hints != reply.transfers.size()) {
            throw BridgeError(ErrorKind::ProtocolError,
                "Reply announces " + std::to_string(hints) + " buffers but carries " +
                std::to_string(reply.transfers.size()));
        }

        out.reserve(messages.size());
        for (auto const& jm : messages) {
            RawMessage m;
            jm.at("topic").get_to(m.topic);
            jm.at("receiveTime").get_to(m.receiveTime);
            const auto idx = jm.at("buffer").get<std::size_t>();
            jm.at("offset").get_to(m.offset);
            jm.at("length").get_to(m.length);
            if (idx >= reply.transfers.size()) {
                throw BridgeError(ErrorKind::ProtocolError,
                    "Record on '" + m.topic + "' references missing buffer " + std::to_string(idx));
            }
            m.buffer = reply.transfers[idx];
            if (!m.isValidView()) {
                throw BridgeError(ErrorKind::ProtocolError,
                    "Record on '" + m.topic + "' lies outside its buffer");
            }
            out.push_back(std::move(m));
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw BridgeError(ErrorKind::ProtocolError,
                          std::string("Malformed getMessages reply: ") + e.what());
    }
    catch (const std::out_of_range& e) {
        throw BridgeError(ErrorKind::ProtocolError,
                          std::string("Malformed getMessages reply: ") + e.what());
    }
    reply.transfers.clear();
    return out;
}

nlohmann::json encodeExtensionEvent(const std::string& type, nlohmann::json data) {
    return nlohmann::json{{"type", type}, {"data", std::move(data)}};
}

} // namespace provider_bridge::wire
