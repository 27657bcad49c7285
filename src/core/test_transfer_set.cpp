// test_transfer_set.cpp
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "transfer_set.hpp"

using namespace provider_bridge;

namespace {

ByteBuffer makeBuffer(std::size_t size) {
    return std::make_shared<std::vector<std::uint8_t>>(size, std::uint8_t{0});
}

} // namespace

TEST(TransferSet, SameBufferIsAddedOnce) {
    auto buf = makeBuffer(4096);
    TransferSet set;

    EXPECT_EQ(set.add(buf), 0u);
    EXPECT_EQ(set.add(buf), 0u);
    EXPECT_EQ(set.size(), 1u);
    EXPECT_EQ(set.totalBytes(), 4096u);
}

TEST(TransferSet, EqualContentsAreStillDistinct) {
    auto a = makeBuffer(16);
    auto b = makeBuffer(16);
    TransferSet set;

    EXPECT_EQ(set.add(a), 0u);
    EXPECT_EQ(set.add(b), 1u);
    EXPECT_EQ(set.add(a), 0u);
    EXPECT_EQ(set.size(), 2u);
    EXPECT_TRUE(set.contains(a));
    EXPECT_TRUE(set.contains(b));
}

TEST(TransferSet, ReleaseKeepsInsertionOrderAndEmpties) {
    auto a = makeBuffer(1);
    auto b = makeBuffer(2);
    TransferSet set;
    set.add(b);
    set.add(a);
    set.add(b);

    auto out = set.release();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].get(), b.get());
    EXPECT_EQ(out[1].get(), a.get());
    EXPECT_TRUE(set.empty());
    EXPECT_FALSE(set.contains(a));
}

TEST(TransferSet, AddConsumesTheReference) {
    auto buf = makeBuffer(8);
    std::weak_ptr<std::vector<std::uint8_t>> watch = buf;
    {
        TransferSet set;
        set.add(std::move(buf));
        EXPECT_FALSE(watch.expired());
    }
    EXPECT_TRUE(watch.expired());
}

TEST(TransferSet, NullBufferIsRejected) {
    TransferSet set;
    EXPECT_THROW(set.add(nullptr), std::invalid_argument);
    EXPECT_TRUE(set.empty());
}
