// STRATA - Chain Event Tests
// Copyright (c) 2024 STRATA Developers
// MIT License

#include <gtest/gtest.h>
#include "strata/chain/events.h"
#include "test_util.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace strata;
using namespace strata::test;

class ChainEventsTest : public ::testing::Test {
protected:
    ChainEvents events_;
};

TEST_F(ChainEventsTest, DeliversToEverySubscriberInOrder) {
    std::vector<std::string> calls;
    events_.SubscribeNewTip([&](int32_t height, const BlockHash&) {
        calls.push_back("a" + std::to_string(height));
    });
    events_.SubscribeNewTip([&](int32_t height, const BlockHash&) {
        calls.push_back("b" + std::to_string(height));
    });

    events_.NotifyNewTip(7, BlockHash());
    EXPECT_EQ(calls, (std::vector<std::string>{"a7", "b7"}));
}

TEST_F(ChainEventsTest, BlockEventsCarryTheBlock) {
    Block block;
    block.vtx.push_back(MakeCoinbase(3, COIN, KeyScript(MINER_KEY)));
    const BlockHash hash = block.GetHash();

    int32_t connectedHeight = -1;
    BlockHash disconnectedHash;
    size_t disconnectedTxs = 0;
    events_.SubscribeBlockConnected([&](const Block&, int32_t height) { connectedHeight = height; });
    events_.SubscribeBlockDisconnected([&](const BlockHash& h, const Block& b) {
        disconnectedHash = h;
        disconnectedTxs = b.vtx.size();
    });

    events_.NotifyBlockConnected(block, 3);
    events_.NotifyBlockDisconnected(hash, block);
    EXPECT_EQ(connectedHeight, 3);
    EXPECT_EQ(disconnectedHash, hash);
    EXPECT_EQ(disconnectedTxs, 1u);
}

TEST_F(ChainEventsTest, Unsubscribe) {
    int calls = 0;
    auto id = events_.SubscribeMempoolAccepted([&](const TxHash&) { ++calls; });
    EXPECT_EQ(events_.SubscriberCount(), 1u);

    events_.NotifyMempoolAccepted(TxHash());
    EXPECT_TRUE(events_.Unsubscribe(id));
    EXPECT_FALSE(events_.Unsubscribe(id));
    events_.NotifyMempoolAccepted(TxHash());

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(events_.SubscriberCount(), 0u);
}

TEST_F(ChainEventsTest, ThrowingSubscriberDoesNotStopOthers) {
    bool reached = false;
    events_.SubscribeNewTip([](int32_t, const BlockHash&) { throw std::runtime_error("boom"); });
    events_.SubscribeNewTip([&](int32_t, const BlockHash&) { reached = true; });

    EXPECT_NO_THROW(events_.NotifyNewTip(1, BlockHash()));
    EXPECT_TRUE(reached);
}

TEST_F(ChainEventsTest, CallbackMaySubscribe) {
    int inner = 0;
    events_.SubscribeNewTip([&](int32_t, const BlockHash&) {
        events_.SubscribeNewTip([&](int32_t, const BlockHash&) { ++inner; });
    });

    events_.NotifyNewTip(1, BlockHash());
    EXPECT_EQ(inner, 0);
    EXPECT_EQ(events_.SubscriberCount(), 2u);
    events_.NotifyNewTip(2, BlockHash());
    EXPECT_EQ(inner, 1);
}
