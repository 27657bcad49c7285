/**
 * @file   rpc.cpp
 * @brief  Implements Rpc: envelope encoding, handler dispatch, reply
 *         correlation and Responder completion.
 *
 * @date   2026-10-19
 */

#include "rpc.hpp"
#include "../logging.hpp"

#include <atomic>
#include <stdexcept>

namespace provider_bridge::io {

namespace {

// Serialize an envelope; invalid UTF-8 in payload strings is replaced
std::string dumpEnvelope(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

// ----------------------------------------------------------------------------
// Responder
// ----------------------------------------------------------------------------

struct Responder::State {
    ChannelPtr       channel;
    std::string      topic;
    std::uint64_t    id{0};
    bool             expectsReply{false};
    std::atomic_bool done{false};

    ~State() {
        if (!expectsReply || done.exchange(true)) return;
        qCWarning(lcRpc) << "request" << topic.c_str() << "#" << id
                         << "dropped without a reply";
        sendError(ErrorKind::ProtocolError,
                  "Request '" + topic + "' was dropped without a reply");
    }

    bool sendPacket(Packet &&pkt) noexcept {
        if (channel->send(std::move(pkt))) return true;
        qCWarning(lcRpc) << "could not send reply for" << topic.c_str() << "#" << id;
        return false;
    }

    void sendError(ErrorKind kind, const std::string& message) noexcept {
        try {
            nlohmann::json env = {
                {"topic", Rpc::ERROR_TOPIC},
                {"id",    id},
                {"data",  {{"kind", errorKindName(kind)}, {"message", message}}}
            };
            sendPacket(Packet{dumpEnvelope(env), {}});
        }
        catch (const std::exception& e) {
            qCCritical(lcRpc) << "cannot encode error reply:" << e.what();
        }
    }
};

void Responder::resolve(Message reply) {
    if (!m_state) return;
    if (m_state->done.exchange(true)) {
        qCWarning(lcRpc) << "request" << m_state->topic.c_str() << "completed twice";
        return;
    }
    if (!m_state->expectsReply) return;

    nlohmann::json env = {
        {"topic", Rpc::RESPONSE_TOPIC},
        {"id",    m_state->id},
        {"data",  std::move(reply.data)}
    };
    std::string text;
    try {
        text = dumpEnvelope(env);
    }
    catch (const nlohmann::json::exception& e) {
        m_state->sendError(ErrorKind::ProtocolError,
                           std::string("Reply could not be encoded: ") + e.what());
        return;
    }
    // A refusal on an open channel means the frame exceeds the transport limits
    if (!m_state->sendPacket(Packet{std::move(text), std::move(reply.transfers)})
        && m_state->channel->isOpen())
        m_state->sendError(ErrorKind::ProtocolError, "Reply too large for transport");
}

void Responder::reject(ErrorKind kind, const std::string& message) {
    if (!m_state) return;
    if (m_state->done.exchange(true)) {
        qCWarning(lcRpc) << "request" << m_state->topic.c_str() << "completed twice";
        return;
    }
    if (!m_state->expectsReply) {
        qCWarning(lcRpc) << "event" << m_state->topic.c_str() << "failed:" << message.c_str();
        return;
    }
    m_state->sendError(kind, message);
}

bool Responder::completed() const noexcept {
    return m_state && m_state->done;
}

// ----------------------------------------------------------------------------
// Rpc
// ----------------------------------------------------------------------------

Rpc::Rpc(ChannelPtr channel)
  : m_channel(std::move(channel))
{
    if (!m_channel)
        throw std::invalid_argument("Rpc needs a channel");
}

Rpc::~Rpc() {
    failPending("RPC endpoint destroyed");
}

void Rpc::receive(const std::string& topic, Handler handler) {
    std::lock_guard<std::mutex> lk(m_mtx);
    if (!m_handlers.emplace(topic, std::move(handler)).second)
        throw std::logic_error("Handler already registered for topic: " + topic);
}

void Rpc::removeHandler(const std::string& topic) {
    std::lock_guard<std::mutex> lk(m_mtx);
    m_handlers.erase(topic);
}

std::future<Message> Rpc::send(const std::string& topic,
                               nlohmann::json data,
                               std::vector<ByteBuffer> transfers)
{
    std::promise<Message> promise;
    auto future = promise.get_future();
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        id = m_nextId++;
        m_pending.emplace(id, std::move(promise));
    }

    nlohmann::json env = {
        {"topic", topic},
        {"id",    id},
        {"data",  std::move(data)}
    };
    qCDebug(lcRpc) << "->" << topic.c_str() << "#" << id
                   << "buffers=" << transfers.size();

    if (!m_channel->send(Packet{dumpEnvelope(env), std::move(transfers)})) {
        std::lock_guard<std::mutex> lk(m_mtx);
        auto it = m_pending.find(id);
        if (it != m_pending.end()) {
            it->second.set_exception(std::make_exception_ptr(
                BridgeError(ErrorKind::ChannelFailure,
                            "Channel refused request '" + topic + "'")));
            m_pending.erase(it);
        }
    }
    return future;
}

bool Rpc::notify(const std::string& topic, nlohmann::json data) {
    nlohmann::json env = {{"topic", topic}, {"data", std::move(data)}};
    return m_channel->send(Packet{dumpEnvelope(env), {}});
}

bool Rpc::pumpFor(std::chrono::milliseconds timeout) {
    Packet pkt;
    if (m_channel->waitFor(pkt, timeout)) {
        dispatch(std::move(pkt));
        return true;
    }
    if (!m_channel->isOpen())
        failPending("Channel closed");
    return false;
}

bool Rpc::isOpen() const noexcept {
    return m_channel->isOpen();
}

void Rpc::close() {
    m_channel->close();
    failPending("Channel closed");
}

std::size_t Rpc::pendingCount() const {
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_pending.size();
}

void Rpc::dispatch(Packet &&pkt) {
    auto j = nlohmann::json::parse(pkt.json, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("topic") || !j["topic"].is_string()) {
        qCWarning(lcRpc) << "dropping malformed envelope of" << pkt.json.size() << "bytes";
        return;
    }
    const std::string topic = j["topic"].get<std::string>();
    const bool hasId = j.contains("id") && j["id"].is_number_unsigned();
    nlohmann::json data = j.contains("data") ? std::move(j["data"]) : nlohmann::json();

    // ---------- replies to our own requests ---------------------------------
    if (topic == RESPONSE_TOPIC || topic == ERROR_TOPIC) {
        if (!hasId) {
            qCWarning(lcRpc) << "dropping reply without id";
            return;
        }
        settle(j["id"].get<std::uint64_t>(), topic == ERROR_TOPIC,
               std::move(data), std::move(pkt.transfers));
        return;
    }

    // ---------- incoming requests and events --------------------------------
    auto state = std::make_shared<Responder::State>();
    state->channel = m_channel;
    state->topic   = topic;
    if (hasId) {
        state->id           = j["id"].get<std::uint64_t>();
        state->expectsReply = true;
    }
    Responder responder(state);
    state.reset();

    Handler handler;
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        auto it = m_handlers.find(topic);
        if (it != m_handlers.end()) handler = it->second;
    }
    if (!handler) {
        qCWarning(lcRpc) << "no handler for" << topic.c_str();
        responder.reject(ErrorKind::ProtocolError,
                         "No handler registered for '" + topic + "'");
        return;
    }

    qCDebug(lcRpc) << "<-" << topic.c_str() << "buffers=" << pkt.transfers.size();
    try {
        handler(Message{std::move(data), std::move(pkt.transfers)}, responder);
    }
    catch (const BridgeError& e) {
        if (!responder.completed()) responder.reject(e.kind(), e.what());
    }
    catch (const nlohmann::json::exception& e) {
        if (!responder.completed())
            responder.reject(ErrorKind::ProtocolError,
                             "Malformed '" + topic + "' request: " + e.what());
    }
    catch (const std::exception& e) {
        if (!responder.completed()) responder.reject(ErrorKind::ProviderFailure, e.what());
    }
}

void Rpc::settle(std::uint64_t id, bool isError, nlohmann::json data,
                 std::vector<ByteBuffer> transfers)
{
    std::promise<Message> promise;
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        auto it = m_pending.find(id);
        if (it == m_pending.end()) {
            qCWarning(lcRpc) << "reply for unknown request #" << id;
            return;
        }
        promise = std::move(it->second);
        m_pending.erase(it);
    }

    if (isError) {
        ErrorKind kind = ErrorKind::ProviderFailure;
        std::string message = "Remote request failed";
        if (data.is_object()) {
            kind    = errorKindFromName(data.value("kind", std::string{}));
            message = data.value("message", message);
        }
        promise.set_exception(std::make_exception_ptr(BridgeError(kind, message)));
        return;
    }
    promise.set_value(Message{std::move(data), std::move(transfers)});
}

void Rpc::failPending(const std::string& reason) {
    std::unordered_map<std::uint64_t, std::promise<Message>> pending;
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        pending.swap(m_pending);
    }
    for (auto& kv : pending)
        kv.second.set_exception(std::make_exception_ptr(
            BridgeError(ErrorKind::ChannelFailure, reason)));
}

} // namespace provider_bridge::io
