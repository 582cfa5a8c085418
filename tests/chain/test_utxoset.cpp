// STRATA - UTXO Set Tests
// Copyright (c) 2024 STRATA Developers
// MIT License

#include <gtest/gtest.h>
#include "strata/chain/utxoset.h"
#include "strata/db/coinstore.h"
#include "strata/db/memorydb.h"
#include "test_util.h"

using namespace strata;
using namespace strata::test;

// ============================================================================
// Test Fixture
// ============================================================================

class UtxoSetTest : public ::testing::Test {
protected:
    UtxoSetTest() : store_(db_), utxo_(store_) {}

    /// Block at height whose coinbase pays value and which carries txs
    Block MakeBlock(int32_t height, const std::vector<TransactionRef>& txs = {},
                    Amount value = 50 * COIN) {
        Block block;
        block.nTime = 1704067200 + static_cast<uint32_t>(height) * 30;
        block.nBits = 0x207fffff;
        block.hashPrevBlock = utxo_.GetBestBlock();
        block.vtx.push_back(MakeCoinbase(height, value, KeyScript(MINER_KEY)));
        block.vtx.insert(block.vtx.end(), txs.begin(), txs.end());
        block.hashMerkleRoot = block.ComputeMerkleRoot();
        return block;
    }

    /// Apply a coinbase-only block at height and return its coinbase outpoint
    OutPoint Fund(int32_t height, Amount value = 50 * COIN) {
        Block block = MakeBlock(height, {}, value);
        UndoRecord undo;
        UtxoStatus s = utxo_.ApplyBlock(block, height, undo);
        EXPECT_TRUE(s.ok()) << s.ToString();
        return OutPoint(block.vtx[0]->GetHash(), 0);
    }

    db::MemoryDatabase db_;
    db::CoinStore store_;
    UtxoSet utxo_;
};

// ============================================================================
// Apply
// ============================================================================

TEST_F(UtxoSetTest, ApplyAddsOutputsAndSpendsInputs) {
    const OutPoint funding = Fund(1);
    auto tx = Spend({funding}, MINER_KEY, {20 * COIN, 29 * COIN});
    Block block = MakeBlock(2, {tx});

    UndoRecord undo;
    ASSERT_TRUE(utxo_.ApplyBlock(block, 2, undo).ok());

    EXPECT_FALSE(utxo_.HaveCoin(funding));
    auto out0 = utxo_.GetCoin(OutPoint(tx->GetHash(), 0));
    ASSERT_TRUE(out0.has_value());
    EXPECT_EQ(out0->GetAmount(), 20 * COIN);
    EXPECT_EQ(out0->nHeight, 2);
    EXPECT_FALSE(out0->IsCoinBase());
    EXPECT_EQ(utxo_.GetBestBlock(), block.GetHash());

    EXPECT_EQ(undo.block, block.GetHash());
    EXPECT_EQ(undo.height, 2);
    ASSERT_EQ(undo.spent.size(), 1u);
    EXPECT_EQ(undo.spent[0].outpoint, funding);
    EXPECT_EQ(undo.spent[0].coin.GetAmount(), 50 * COIN);
    EXPECT_TRUE(undo.spent[0].coin.IsCoinBase());
    EXPECT_EQ(undo.created.size(), 3u);
}

TEST_F(UtxoSetTest, OutputSpentInSameBlockIsInNeitherList) {
    const OutPoint funding = Fund(1);
    auto parent = Spend(funding, MINER_KEY, 40 * COIN, 0x02);
    auto child = Spend(OutPoint(parent->GetHash(), 0), 0x02, 39 * COIN, 0x03);
    Block block = MakeBlock(2, {parent, child});

    UndoRecord undo;
    ASSERT_TRUE(utxo_.ApplyBlock(block, 2, undo).ok());

    const OutPoint transient(parent->GetHash(), 0);
    EXPECT_FALSE(utxo_.HaveCoin(transient));
    EXPECT_TRUE(utxo_.HaveCoin(OutPoint(child->GetHash(), 0)));
    for (const auto& spent : undo.spent) {
        EXPECT_NE(spent.outpoint, transient);
    }
    for (const auto& created : undo.created) {
        EXPECT_NE(created, transient);
    }
    EXPECT_EQ(undo.spent.size(), 1u);
    EXPECT_EQ(undo.created.size(), 2u);
}

TEST_F(UtxoSetTest, MissingInputLeavesSetUntouched) {
    Fund(1);
    const auto before = DumpDatabase(db_);
    const BlockHash best = utxo_.GetBestBlock();

    auto tx = Spend(OutPoint(TxHash(), 0), MINER_KEY, COIN);
    UndoRecord undo;
    UtxoStatus s = utxo_.ApplyBlock(MakeBlock(2, {tx}), 2, undo);

    EXPECT_FALSE(s.ok());
    EXPECT_EQ(s.validation, ValidationError::MISSING_UTXO);
    EXPECT_FALSE(s.IsFatal());
    EXPECT_EQ(DumpDatabase(db_), before);
    EXPECT_EQ(utxo_.GetBestBlock(), best);
}

TEST_F(UtxoSetTest, DoubleSpendWithinBlockRejected) {
    const OutPoint funding = Fund(1);
    auto a = Spend(funding, MINER_KEY, COIN, 0x02, 1);
    auto b = Spend(funding, MINER_KEY, COIN, 0x02, 2);

    UndoRecord undo;
    UtxoStatus s = utxo_.ApplyBlock(MakeBlock(2, {a, b}), 2, undo);
    EXPECT_EQ(s.validation, ValidationError::MISSING_UTXO);
    EXPECT_TRUE(utxo_.HaveCoin(funding));
}

TEST_F(UtxoSetTest, StorageFailureReported) {
    const OutPoint funding = Fund(1);
    const BlockHash best = utxo_.GetBestBlock();
    db_.SetFailWrites(true);

    UndoRecord undo;
    UtxoStatus s = utxo_.ApplyBlock(MakeBlock(2, {Spend(funding, MINER_KEY, COIN)}), 2, undo);
    EXPECT_EQ(s.storage, StorageError::IO_FAILURE);
    EXPECT_FALSE(s.IsFatal());

    db_.SetFailWrites(false);
    EXPECT_TRUE(utxo_.HaveCoin(funding));
    EXPECT_EQ(utxo_.GetBestBlock(), best);
}

// ============================================================================
// Undo
// ============================================================================

TEST_F(UtxoSetTest, UndoRestoresByteIdenticalState) {
    const OutPoint a = Fund(1);
    const OutPoint b = Fund(2, 25 * COIN);
    const auto before = DumpDatabase(db_);
    const auto commitBefore = utxo_.Commit();

    auto t1 = Spend({a, b}, MINER_KEY, {30 * COIN, 44 * COIN}, 0x02);
    auto t2 = Spend(OutPoint(t1->GetHash(), 1), 0x02, 43 * COIN, 0x03);
    Block block = MakeBlock(3, {t1, t2}, 50 * COIN + 1 * COIN);

    UndoRecord undo;
    ASSERT_TRUE(utxo_.ApplyBlock(block, 3, undo).ok());
    ASSERT_NE(DumpDatabase(db_), before);

    UndoRecord stored;
    ASSERT_TRUE(utxo_.ReadUndo(block.GetHash(), stored).ok());
    EXPECT_EQ(stored, undo);

    UtxoStatus s = utxo_.UndoBlock(stored);
    ASSERT_TRUE(s.ok()) << s.ToString();

    EXPECT_EQ(DumpDatabase(db_), before);
    EXPECT_TRUE(utxo_.HaveCoin(a));
    EXPECT_TRUE(utxo_.HaveCoin(b));
    EXPECT_FALSE(utxo_.HaveCoin(OutPoint(t1->GetHash(), 0)));
    EXPECT_FALSE(utxo_.HaveCoin(OutPoint(t2->GetHash(), 0)));

    auto commitAfter = utxo_.Commit();
    ASSERT_TRUE(commitBefore && commitAfter);
    EXPECT_EQ(commitAfter->root, commitBefore->root);
}

TEST_F(UtxoSetTest, UndoToEmptySet) {
    const auto empty = DumpDatabase(db_);
    Block block = MakeBlock(0);
    UndoRecord undo;
    ASSERT_TRUE(utxo_.ApplyBlock(block, 0, undo).ok());
    EXPECT_TRUE(undo.prev.IsNull());

    ASSERT_TRUE(utxo_.UndoBlock(undo).ok());
    EXPECT_EQ(DumpDatabase(db_), empty);
    EXPECT_TRUE(utxo_.GetBestBlock().IsNull());
}

TEST_F(UtxoSetTest, UndoOfNonTipBlockIsCorruption) {
    Fund(1);
    Block block = MakeBlock(2);
    UndoRecord first;
    ASSERT_TRUE(utxo_.ApplyBlock(block, 2, first).ok());
    UndoRecord second;
    ASSERT_TRUE(utxo_.ApplyBlock(MakeBlock(3), 3, second).ok());

    const auto before = DumpDatabase(db_);
    UtxoStatus s = utxo_.UndoBlock(first);
    EXPECT_EQ(s.chain, ChainError::UNDO_CORRUPTION);
    EXPECT_TRUE(s.IsFatal());
    EXPECT_EQ(DumpDatabase(db_), before);
}

TEST_F(UtxoSetTest, UndoWithMissingCreatedCoinIsCorruption) {
    Fund(1);
    UndoRecord undo;
    ASSERT_TRUE(utxo_.ApplyBlock(MakeBlock(2), 2, undo).ok());

    undo.created.emplace_back(TxHash(), 9);
    UtxoStatus s = utxo_.UndoBlock(undo);
    EXPECT_EQ(s.chain, ChainError::UNDO_CORRUPTION);
}

TEST_F(UtxoSetTest, UndoWithPresentSpentCoinIsCorruption) {
    const OutPoint funding = Fund(1);
    UndoRecord undo;
    ASSERT_TRUE(utxo_.ApplyBlock(MakeBlock(2), 2, undo).ok());

    undo.spent.emplace_back(funding, Coin(TxOut(50 * COIN, KeyScript(MINER_KEY)), 1, true));
    UtxoStatus s = utxo_.UndoBlock(undo);
    EXPECT_EQ(s.chain, ChainError::UNDO_CORRUPTION);
    EXPECT_TRUE(utxo_.HaveCoin(funding));
}

TEST_F(UtxoSetTest, CorruptUndoRecordDetected) {
    Fund(1);
    Block block = MakeBlock(2);
    UndoRecord undo;
    ASSERT_TRUE(utxo_.ApplyBlock(block, 2, undo).ok());

    const std::string key = db::CoinStore::UndoKey(block.GetHash());
    std::string value;
    ASSERT_TRUE(db_.Get(key, &value).ok());
    value[0] ^= 0x01;
    db_.CorruptValue(key, value);

    UndoRecord read;
    UtxoStatus s = utxo_.ReadUndo(block.GetHash(), read);
    EXPECT_EQ(s.storage, StorageError::CORRUPTION);
    EXPECT_TRUE(s.IsFatal());
}

// ============================================================================
// Commitment
// ============================================================================

TEST_F(UtxoSetTest, CommitmentSummarizesSet) {
    Fund(1, 10 * COIN);
    Fund(2, 15 * COIN);

    auto commitment = utxo_.Commit();
    ASSERT_TRUE(commitment.has_value());
    EXPECT_EQ(commitment->count, 2u);
    EXPECT_EQ(commitment->totalValue, 25 * COIN);
    EXPECT_EQ(commitment->height, 2);
    EXPECT_FALSE(commitment->root.IsNull());
}

TEST_F(UtxoSetTest, CommitmentIndependentOfHistory) {
    // Same final coins reached through different blocks
    db::MemoryDatabase otherDb;
    db::CoinStore otherStore(otherDb);
    UtxoSet other(otherStore);

    Block block1 = MakeBlock(1, {}, 10 * COIN);
    UndoRecord undo;
    ASSERT_TRUE(utxo_.ApplyBlock(block1, 1, undo).ok());
    ASSERT_TRUE(utxo_.ApplyBlock(MakeBlock(2, {}, 5 * COIN), 2, undo).ok());
    ASSERT_TRUE(utxo_.UndoBlock(undo).ok());

    ASSERT_TRUE(other.ApplyBlock(block1, 1, undo).ok());

    EXPECT_EQ(utxo_.Commit()->root, other.Commit()->root);
}

TEST_F(UtxoSetTest, EmptyCommitment) {
    EXPECT_FALSE(utxo_.GetCommitment().has_value());
    auto commitment = utxo_.Commit();
    ASSERT_TRUE(commitment.has_value());
    EXPECT_EQ(commitment->count, 0u);
    EXPECT_EQ(commitment->totalValue, 0);
    EXPECT_EQ(commitment->height, -1);
    EXPECT_TRUE(commitment->block.IsNull());
}

TEST_F(UtxoSetTest, CommitmentTracksAppliedTip) {
    Fund(1, 10 * COIN);
    Block block = MakeBlock(2, {}, 15 * COIN);
    UndoRecord undo;
    ASSERT_TRUE(utxo_.ApplyBlock(block, 2, undo).ok());
    EXPECT_EQ(utxo_.GetBestHeight(), 2);

    auto atTwo = utxo_.Commit();
    ASSERT_TRUE(atTwo.has_value());
    EXPECT_EQ(atTwo->height, 2);
    EXPECT_EQ(atTwo->block, block.GetHash());
    EXPECT_EQ(utxo_.GetCommitment()->root, atTwo->root);

    ASSERT_TRUE(utxo_.UndoBlock(undo).ok());
    EXPECT_EQ(utxo_.GetBestHeight(), 1);

    // The stored commitment stays until the next Commit()
    EXPECT_EQ(utxo_.GetCommitment()->height, 2);
    auto atOne = utxo_.Commit();
    EXPECT_EQ(atOne->height, 1);
    EXPECT_EQ(atOne->count, 1u);
    EXPECT_EQ(utxo_.GetCommitment()->height, 1);
}

TEST_F(UtxoSetTest, BestHeightSurvivesReopen) {
    Fund(1);
    Fund(2);
    UtxoSet reopened(store_);
    EXPECT_EQ(reopened.GetBestHeight(), 2);
    EXPECT_EQ(reopened.GetBestBlock(), utxo_.GetBestBlock());
}

// ============================================================================
// Cache
// ============================================================================

TEST(UtxoSetCacheTest, CacheStaysBounded) {
    db::MemoryDatabase db;
    db::CoinStore store(db);
    UtxoSet utxo(store, 8);

    MutableTransaction mtx;
    mtx.vin.emplace_back(OutPoint(), Script{0x01, 0x02});
    for (int i = 0; i < 40; ++i) {
        mtx.vout.emplace_back(COIN, KeyScript(static_cast<uint8_t>(i)));
    }
    Block block;
    block.vtx.push_back(MakeTransactionRef(std::move(mtx)));
    block.hashMerkleRoot = block.ComputeMerkleRoot();

    UndoRecord undo;
    ASSERT_TRUE(utxo.ApplyBlock(block, 1, undo).ok());
    EXPECT_LE(utxo.CacheSize(), utxo.CacheCapacity());

    const TxHash txid = block.vtx[0]->GetHash();
    for (uint32_t i = 0; i < 40; ++i) {
        auto coin = utxo.GetCoin(OutPoint(txid, i));
        ASSERT_TRUE(coin.has_value()) << i;
        EXPECT_EQ(coin->GetScriptPubKey(), KeyScript(static_cast<uint8_t>(i)));
    }
    EXPECT_LE(utxo.CacheSize(), utxo.CacheCapacity());
}

TEST(UtxoSetCacheTest, ReopenSeesCommittedState) {
    db::MemoryDatabase db;
    db::CoinStore store(db);
    BlockHash best;
    OutPoint coinbase;
    {
        UtxoSet utxo(store);
        Block block;
        block.vtx.push_back(MakeCoinbase(1, COIN, KeyScript(MINER_KEY)));
        block.hashMerkleRoot = block.ComputeMerkleRoot();
        UndoRecord undo;
        ASSERT_TRUE(utxo.ApplyBlock(block, 1, undo).ok());
        ASSERT_TRUE(utxo.Flush().ok());
        best = block.GetHash();
        coinbase = OutPoint(block.vtx[0]->GetHash(), 0);
    }
    UtxoSet reopened(store);
    EXPECT_EQ(reopened.GetBestBlock(), best);
    EXPECT_TRUE(reopened.HaveCoin(coinbase));
}
