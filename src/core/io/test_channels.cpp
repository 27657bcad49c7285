// test_channels.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <sys/socket.h>

#include "local_channel.hpp"
#include "socket_channel.hpp"

using namespace std::chrono_literals;
using namespace provider_bridge;
using namespace provider_bridge::io;

namespace {

ByteBuffer bytes(std::initializer_list<std::uint8_t> init) {
    return std::make_shared<std::vector<std::uint8_t>>(init);
}

std::pair<std::shared_ptr<SocketChannel>, std::shared_ptr<SocketChannel>> socketPair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0)
        return {};
    return {std::make_shared<SocketChannel>(fds[0]), std::make_shared<SocketChannel>(fds[1])};
}

} // namespace

// -----------------------------------------------------------------------------
// LocalChannel
// -----------------------------------------------------------------------------

TEST(LocalChannel, BuffersArriveByPointer) {
    auto [a, b] = LocalChannel::createPair();
    auto buf = bytes({1, 2, 3});

    Packet out{R"({"topic":"x"})", {buf}};
    ASSERT_TRUE(a->send(std::move(out)));

    Packet in;
    ASSERT_TRUE(b->waitFor(in, 100ms));
    EXPECT_EQ(in.json, R"({"topic":"x"})");
    ASSERT_EQ(in.transfers.size(), 1u);
    EXPECT_EQ(in.transfers[0].get(), buf.get());
    EXPECT_FALSE(b->poll(in));
}

TEST(LocalChannel, KeepsOrderInBothDirections) {
    auto [a, b] = LocalChannel::createPair();
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(a->send(Packet{std::to_string(i), {}}));
    ASSERT_TRUE(b->send(Packet{"back", {}}));

    Packet in;
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(b->poll(in));
        EXPECT_EQ(in.json, std::to_string(i));
    }
    ASSERT_TRUE(a->poll(in));
    EXPECT_EQ(in.json, "back");
}

TEST(LocalChannel, CloseDrainsThenReportsClosed) {
    auto [a, b] = LocalChannel::createPair();
    ASSERT_TRUE(a->send(Packet{"last", {}}));
    a->close();

    EXPECT_FALSE(a->isOpen());
    EXPECT_FALSE(b->isOpen());
    EXPECT_FALSE(b->send(Packet{"nope", {}}));

    Packet in;
    ASSERT_TRUE(b->poll(in));
    EXPECT_EQ(in.json, "last");
    EXPECT_FALSE(b->waitFor(in, 50ms));
}

TEST(LocalChannel, WaitForWakesOnSend) {
    auto [a, b] = LocalChannel::createPair();
    std::thread sender([ch = a] {
        std::this_thread::sleep_for(20ms);
        ch->send(Packet{"late", {}});
    });

    Packet in;
    EXPECT_TRUE(b->waitFor(in, 2s));
    EXPECT_EQ(in.json, "late");
    sender.join();
}

// -----------------------------------------------------------------------------
// SocketChannel
// -----------------------------------------------------------------------------

TEST(SocketChannel, FramesJsonAndBuffers) {
    auto [a, b] = socketPair();
    ASSERT_TRUE(a && b);

    auto big = std::make_shared<std::vector<std::uint8_t>>(200000);
    for (std::size_t i = 0; i < big->size(); ++i)
        (*big)[i] = static_cast<std::uint8_t>(i * 7);
    auto empty = std::make_shared<std::vector<std::uint8_t>>();

    ASSERT_TRUE(a->send(Packet{R"({"topic":"t","id":1})", {bytes({9, 8, 7}), empty, big}}));

    Packet in;
    ASSERT_TRUE(b->waitFor(in, 2s));
    EXPECT_EQ(in.json, R"({"topic":"t","id":1})");
    ASSERT_EQ(in.transfers.size(), 3u);
    EXPECT_EQ(*in.transfers[0], (std::vector<std::uint8_t>{9, 8, 7}));
    EXPECT_TRUE(in.transfers[1]->empty());
    EXPECT_EQ(*in.transfers[2], *big);
}

TEST(SocketChannel, SeveralFramesInOneRead) {
    auto [a, b] = socketPair();
    ASSERT_TRUE(a && b);
    ASSERT_TRUE(a->send(Packet{"one", {}}));
    ASSERT_TRUE(a->send(Packet{"two", {bytes({1})}}));
    ASSERT_TRUE(a->send(Packet{"three", {}}));

    Packet in;
    ASSERT_TRUE(b->waitFor(in, 1s));
    EXPECT_EQ(in.json, "one");
    ASSERT_TRUE(b->waitFor(in, 1s));
    EXPECT_EQ(in.json, "two");
    ASSERT_TRUE(b->waitFor(in, 1s));
    EXPECT_EQ(in.json, "three");
    EXPECT_FALSE(b->poll(in));
}

TEST(SocketChannel, PeerHangupClosesAfterDraining) {
    auto [a, b] = socketPair();
    ASSERT_TRUE(a && b);
    ASSERT_TRUE(a->send(Packet{"bye", {}}));
    a.reset();  // destructor closes the socket

    Packet in;
    ASSERT_TRUE(b->waitFor(in, 1s));
    EXPECT_EQ(in.json, "bye");
    EXPECT_FALSE(b->waitFor(in, 1s));
    EXPECT_FALSE(b->isOpen());
    EXPECT_FALSE(b->send(Packet{"x", {}}));
}

TEST(SocketChannel, OversizedLengthBreaksTheChannel) {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    SocketChannel reader(fds[0]);

    const std::uint8_t garbage[4] = {0xFF, 0xFF, 0xFF, 0xFF};
    ASSERT_EQ(::write(fds[1], garbage, sizeof(garbage)), 4);

    Packet in;
    EXPECT_FALSE(reader.waitFor(in, 1s));
    EXPECT_FALSE(reader.isOpen());
    ::close(fds[1]);
}

TEST(SocketChannel, OverLimitPacketIsRefusedWithoutBreakingTheChannel) {
    auto [a, b] = socketPair();
    ASSERT_TRUE(a && b);

    auto empty = bytes({});
    Packet tooMany{"big", std::vector<ByteBuffer>((1u << 20) + 1, empty)};
    EXPECT_FALSE(a->send(std::move(tooMany)));
    EXPECT_TRUE(a->isOpen());

    // Nothing of the refused frame reached the peer
    ASSERT_TRUE(a->send(Packet{"small", {bytes({7})}}));
    Packet in;
    ASSERT_TRUE(b->waitFor(in, 1s));
    EXPECT_EQ(in.json, "small");
    EXPECT_TRUE(b->isOpen());
}

TEST(SocketChannel, ListenerAcceptsAUnixPeer) {
    const std::string path = ::testing::TempDir() + "pb_test_" + std::to_string(::getpid()) + ".sock";
    SocketListener listener("unix:" + path);
    ASSERT_TRUE(listener.isListening()) << listener.error();

    std::string err;
    auto client = SocketChannel::connect("unix:" + path, &err);
    ASSERT_TRUE(client) << err;
    auto server = listener.accept(2s);
    ASSERT_TRUE(server) << listener.error();

    ASSERT_TRUE(client->send(Packet{"hello", {bytes({42})}}));
    Packet in;
    ASSERT_TRUE(server->waitFor(in, 2s));
    EXPECT_EQ(in.json, "hello");
    EXPECT_EQ(in.transfers.at(0)->at(0), 42);
}

TEST(SocketChannel, BadAddressesAreReported) {
    std::string err;
    EXPECT_FALSE(SocketChannel::connect("carrier-pigeon:home", &err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(SocketChannel::connect("tcp:127.0.0.1:notaport", &err));

    SocketListener listener("tcp:127.0.0.1");
    EXPECT_FALSE(listener.isListening());
    EXPECT_FALSE(listener.error().empty());
}
