// test_remote_provider.cpp
#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/socket.h>

#include "provider_registry.hpp"
#include "remote_provider.hpp"
#include "test_support.hpp"
#include "io/local_channel.hpp"
#include "io/socket_channel.hpp"

using namespace provider_bridge;
using namespace provider_bridge::test_support;
using nlohmann::json;

namespace {

ProviderDescriptor syntheticTree() {
    ProviderDescriptor synthetic;
    synthetic.name = "synthetic";
    synthetic.args = {
        {"start",         {{"sec", 100}, {"nsec", 0}}},
        {"end",           {{"sec", 102}, {"nsec", 0}}},
        {"topics",        json::array({ {{"name", "/imu"},  {"datatype", "raw/imu"}},
                                        {{"name", "/gps"},  {"datatype", "raw/gps"}} })},
        {"frequencyHz",   5},
        {"payloadBytes",  32},
        {"chunkMessages", 8}
    };
    return ProviderDescriptor{"logging", json{{"label", "e2e"}}, {synthetic}};
}

GetMessagesTopics raw(std::vector<std::string> names) {
    GetMessagesTopics t;
    t.rawMessages = std::move(names);
    return t;
}

/// Registry with the bundled providers, alive for the whole test.
class BridgeFixture : public ::testing::Test {
protected:
    BridgeFixture() { registerBuiltinProviders(registry); }

    ProviderRegistry registry;
};

} // namespace

TEST_F(BridgeFixture, SyntheticTreeThroughLocalChannel) {
    auto channels = io::LocalChannel::createPair();
    HostThread host(channels.second, registry.factory());
    RemoteProvider remote(channels.first, syntheticTree());

    std::vector<json> metadata;
    std::vector<Progress> progress;
    ExtensionPoint ext;
    ext.reportMetadataCallback = [&](const ProviderMetadata& m) { metadata.push_back(m); };
    ext.progressCallback = [&](const Progress& p) { progress.push_back(p); };

    InitializationResult init = remote.initialize(ext);
    EXPECT_EQ(init.start, (Time{100, 0}));
    EXPECT_EQ(init.end, (Time{102, 0}));
    ASSERT_EQ(init.topics.size(), 2u);
    EXPECT_EQ(init.topics[1], (Topic{"/gps", "raw/gps"}));

    // Events emitted while initializing were delivered before the result
    ASSERT_EQ(metadata.size(), 1u);
    EXPECT_EQ(metadata[0].at("type"), "initializationPerformance");
    EXPECT_EQ(progress.size(), 1u);

    MessageBatch batch = remote.getMessages(Time{100, 0}, Time{102, 0}, raw({"/imu", "/gps"}));
    ASSERT_TRUE(batch.rawMessages);
    EXPECT_FALSE(batch.parsedMessages);
    EXPECT_FALSE(batch.objects);
    ASSERT_EQ(batch.rawMessages->size(), 22u);  // 11 per topic at 5 Hz over 2 s

    std::set<const void*> buffers;
    for (auto const& m : *batch.rawMessages) {
        EXPECT_TRUE(m.isValidView());
        EXPECT_EQ(m.length, 32u);
        buffers.insert(m.buffer.get());
    }
    EXPECT_EQ(buffers.size(), 3u);  // ceil(22 / 8)

    remote.close();
    EXPECT_TRUE(host.endpoint().closed());
}

TEST_F(BridgeFixture, SyntheticTreeThroughSocketPair) {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
    auto hostEnd   = std::make_shared<io::SocketChannel>(fds[0]);
    auto callerEnd = std::make_shared<io::SocketChannel>(fds[1]);

    HostThread host(hostEnd, registry.factory());
    RemoteProvider remote(callerEnd, syntheticTree());

    ExtensionPoint ext;
    remote.initialize(ext);
    MessageBatch batch = remote.getMessages(Time{101, 0}, Time{101, 400000000}, raw({"/gps"}));
    ASSERT_EQ(batch.rawMessages->size(), 3u);  // 101.0 101.2 101.4
    EXPECT_EQ(batch.rawMessages->back().receiveTime, (Time{101, 400000000}));

    // Records of one chunk still share one buffer after crossing the socket
    EXPECT_EQ((*batch.rawMessages)[0].buffer.get(), (*batch.rawMessages)[2].buffer.get());
    remote.close();
}

TEST_F(BridgeFixture, RemoteErrorsKeepTheirKind) {
    auto channels = io::LocalChannel::createPair();
    HostThread host(channels.second, registry.factory());
    RemoteProvider remote(channels.first, ProviderDescriptor{"no-such-provider"});

    ExtensionPoint ext;
    try {
        remote.initialize(ext);
        FAIL() << "expected BridgeError";
    }
    catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProviderFailure);
        EXPECT_STREQ(e.what(), "Unknown provider: no-such-provider");
    }
}

TEST_F(BridgeFixture, ParsedTopicsAreRefusedBeforeSending) {
    auto script = std::make_shared<Script>();
    auto channels = io::LocalChannel::createPair();
    HostThread host(channels.second, scriptedFactory(script));
    RemoteProvider remote(channels.first, ProviderDescriptor{"scripted"});

    ExtensionPoint ext;
    remote.initialize(ext);

    GetMessagesTopics topics = raw({"/a"});
    topics.parsedMessages = std::vector<std::string>{"/a"};
    try {
        remote.getMessages(Time{0, 0}, Time{1, 0}, topics);
        FAIL() << "expected BridgeError";
    }
    catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ContractViolation);
    }
    std::lock_guard<std::mutex> lk(script->mtx);
    EXPECT_TRUE(script->ranges.empty());
}

TEST_F(BridgeFixture, ContractViolationOnTheHostReachesTheCaller) {
    auto script = std::make_shared<Script>();
    script->onGetMessages = [](Time, Time, const GetMessagesTopics&) {
        MessageBatch b;
        b.parsedMessages.emplace();
        return b;
    };
    auto channels = io::LocalChannel::createPair();
    HostThread host(channels.second, scriptedFactory(script));
    RemoteProvider remote(channels.first, ProviderDescriptor{"scripted"});

    ExtensionPoint ext;
    remote.initialize(ext);
    try {
        remote.getMessages(Time{0, 0}, Time{1, 0}, raw({"/a"}));
        FAIL() << "expected BridgeError";
    }
    catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ContractViolation);
    }
}

TEST_F(BridgeFixture, CallsAfterCloseAreRejected) {
    auto channels = io::LocalChannel::createPair();
    HostThread host(channels.second, registry.factory());
    RemoteProvider remote(channels.first, syntheticTree());

    ExtensionPoint ext;
    remote.initialize(ext);
    remote.close();

    try {
        remote.getMessages(Time{100, 0}, Time{101, 0}, raw({"/imu"}));
        FAIL() << "expected BridgeError";
    }
    catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProtocolError);
        EXPECT_STREQ(e.what(), "Provider closed");
    }
}

TEST_F(BridgeFixture, ClosedChannelIsAChannelFailure) {
    auto channels = io::LocalChannel::createPair();
    RemoteProvider remote(channels.first, syntheticTree());
    channels.second->close();

    ExtensionPoint ext;
    try {
        remote.initialize(ext);
        FAIL() << "expected BridgeError";
    }
    catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ChannelFailure);
    }
}
