// test_wire_format.cpp
#include <gtest/gtest.h>

#include <functional>
#include <memory>

#include "errors.hpp"
#include "wire_format.hpp"

using namespace provider_bridge;
using nlohmann::json;

namespace {

ByteBuffer makeBuffer(std::size_t size) {
    auto buf = std::make_shared<std::vector<std::uint8_t>>(size);
    for (std::size_t i = 0; i < size; ++i)
        (*buf)[i] = static_cast<std::uint8_t>(i & 0xFF);
    return buf;
}

ErrorKind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    }
    catch (const BridgeError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "no BridgeError thrown";
    return ErrorKind::ProviderFailure;
}

} // namespace

TEST(WireFormat, RecordsSharingABufferTransferItOnce) {
    auto buf = makeBuffer(4096);
    MessageBatch batch;
    batch.rawMessages = std::vector<RawMessage>{
        {"/a", Time{1, 0},   buf, 0,    100},
        {"/b", Time{1, 500}, buf, 2048, 100},
    };

    io::Message reply = wire::encodeMessageBatch(std::move(batch));

    ASSERT_EQ(reply.transfers.size(), 1u);
    EXPECT_EQ(reply.transfers[0].get(), buf.get());
    EXPECT_EQ(reply.data.at("transferHints").get<std::size_t>(), 1u);
    ASSERT_EQ(reply.data.at("messages").size(), 2u);
    EXPECT_EQ(reply.data["messages"][1]["buffer"].get<std::size_t>(), 0u);
    EXPECT_EQ(reply.data["messages"][1]["offset"].get<std::size_t>(), 2048u);
}

TEST(WireFormat, EncodedReplyHasNoParsedOrObjectFields) {
    MessageBatch batch;
    batch.rawMessages.emplace();
    io::Message reply = wire::encodeMessageBatch(std::move(batch));

    EXPECT_FALSE(reply.data.contains("parsedMessages"));
    EXPECT_FALSE(reply.data.contains("objects"));
    EXPECT_TRUE(reply.data.at("messages").empty());
    EXPECT_TRUE(reply.transfers.empty());
}

TEST(WireFormat, ParsedOrObjectPayloadIsAContractViolation) {
    EXPECT_EQ(kindOf([] {
        MessageBatch b;
        b.rawMessages.emplace();
        b.parsedMessages = std::vector<ParsedMessage>{{"/t", Time{}, json::object()}};
        wire::encodeMessageBatch(std::move(b));
    }), ErrorKind::ContractViolation);

    // Present but empty still counts
    EXPECT_EQ(kindOf([] {
        MessageBatch b;
        b.objects.emplace();
        wire::encodeMessageBatch(std::move(b));
    }), ErrorKind::ContractViolation);
}

TEST(WireFormat, ViewOutsideBufferIsAContractViolation) {
    EXPECT_EQ(kindOf([] {
        MessageBatch b;
        b.rawMessages = std::vector<RawMessage>{{"/t", Time{}, makeBuffer(10), 8, 4}};
        wire::encodeMessageBatch(std::move(b));
    }), ErrorKind::ContractViolation);

    EXPECT_EQ(kindOf([] {
        MessageBatch b;
        b.rawMessages = std::vector<RawMessage>{{"/t", Time{}, nullptr, 0, 0}};
        wire::encodeMessageBatch(std::move(b));
    }), ErrorKind::ContractViolation);
}

TEST(WireFormat, DecodeRebuildsViewsOnTheTransferredBuffers) {
    auto buf = makeBuffer(64);
    MessageBatch batch;
    batch.rawMessages = std::vector<RawMessage>{
        {"/a", Time{2, 1}, buf, 10, 4},
        {"/a", Time{2, 2}, buf, 20, 4},
    };
    auto decoded = wire::decodeMessageBatch(wire::encodeMessageBatch(std::move(batch)));

    ASSERT_EQ(decoded.size(), 2u);
    EXPECT_EQ(decoded[0].buffer.get(), buf.get());
    EXPECT_EQ(decoded[1].buffer.get(), buf.get());
    EXPECT_EQ(decoded[1].receiveTime, (Time{2, 2}));
    EXPECT_EQ(decoded[1].data()[0], 20);
}

TEST(WireFormat, DecodeRejectsInconsistentReplies) {
    io::Message wrongHints;
    wrongHints.data = {{"messages", json::array()}, {"transferHints", 2}};
    wrongHints.transfers.push_back(makeBuffer(4));
    EXPECT_EQ(kindOf([&] { wire::decodeMessageBatch(std::move(wrongHints)); }),
              ErrorKind::ProtocolError);

    io::Message badIndex;
    badIndex.data = {
        {"messages", json::array({ {{"topic", "/t"}, {"receiveTime", Time{}},
                                    {"buffer", 3}, {"offset", 0}, {"length", 1}} })},
        {"transferHints", 1}
    };
    badIndex.transfers.push_back(makeBuffer(4));
    EXPECT_EQ(kindOf([&] { wire::decodeMessageBatch(std::move(badIndex)); }),
              ErrorKind::ProtocolError);

    io::Message notJson;
    notJson.data = "oops";
    EXPECT_EQ(kindOf([&] { wire::decodeMessageBatch(std::move(notJson)); }),
              ErrorKind::ProtocolError);
}

TEST(WireFormat, GetMessagesRequestKeepsReversedRanges) {
    wire::GetMessagesRequest req{Time{5, 0}, Time{1, 0}, {"/a", "/b"}};
    auto back = wire::decodeGetMessagesRequest(wire::encodeGetMessagesRequest(req));

    EXPECT_EQ(back.start, (Time{5, 0}));
    EXPECT_EQ(back.end, (Time{1, 0}));
    EXPECT_EQ(back.topics, req.topics);
}

TEST(WireFormat, MalformedGetMessagesRequestIsAProtocolError) {
    EXPECT_EQ(kindOf([] { wire::decodeGetMessagesRequest(json{{"start", 1}}); }),
              ErrorKind::ProtocolError);
    EXPECT_EQ(kindOf([] { wire::decodeGetMessagesRequest(json::array()); }),
              ErrorKind::ProtocolError);
}

TEST(WireFormat, TimesOutsideTheirRangeAreRejected) {
    auto request = [](json start) {
        return json{{"start", start}, {"end", {{"sec", 2}, {"nsec", 0}}},
                    {"topics", json::array({"/a"})}};
    };
    for (json bad : {json{{"sec", -1}, {"nsec", 0}},
                     json{{"sec", 4294967296ULL}, {"nsec", 0}},
                     json{{"sec", 1}, {"nsec", 1000000000}},
                     json{{"sec", 1}, {"nsec", -5}},
                     json{{"sec", 1.5}, {"nsec", 0}}}) {
        EXPECT_EQ(kindOf([&] { wire::decodeGetMessagesRequest(request(bad)); }),
                  ErrorKind::ProtocolError) << bad.dump();
    }

    // The extremes of the valid range pass through untouched
    auto back = wire::decodeGetMessagesRequest(
        request(json{{"sec", 4294967295ULL}, {"nsec", 999999999}}));
    EXPECT_EQ(back.start, (Time{4294967295u, 999999999u}));
}

TEST(WireFormat, ExtensionEventCarriesTypeAndData) {
    auto ev = wire::encodeExtensionEvent(wire::CALLBACK_METADATA,
                                         json{{"type", "initializationPerformance"}});
    EXPECT_EQ(ev.at("type"), "reportMetadataCallback");
    EXPECT_EQ(ev.at("data").at("type"), "initializationPerformance");
}
