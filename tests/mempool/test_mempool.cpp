// STRATA - Mempool Tests
// Copyright (c) 2024 STRATA Developers
// MIT License

#include <gtest/gtest.h>
#include "strata/mempool/mempool.h"
#include "test_util.h"

#include <atomic>
#include <map>
#include <set>
#include <thread>
#include <vector>

using namespace strata;
using namespace strata::test;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/// Confirmed coins held in a plain map
class MapCoinsView : public CoinsView {
public:
    std::optional<Coin> GetCoin(const OutPoint& outpoint) const override {
        auto it = coins_.find(outpoint);
        if (it == coins_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Add a confirmed coin locked by key and return its outpoint
    OutPoint Add(Amount value, uint8_t key = MINER_KEY, int32_t height = 1, bool coinbase = false) {
        MutableTransaction mtx;
        mtx.vin.emplace_back(OutPoint(TxHash(), 0));
        mtx.vout.emplace_back(value, KeyScript(key));
        mtx.nLockTime = next_++;
        OutPoint outpoint(mtx.GetHash(), 0);
        coins_[outpoint] = Coin(TxOut(value, KeyScript(key)), height, coinbase);
        return outpoint;
    }

    void Remove(const OutPoint& outpoint) { coins_.erase(outpoint); }

    /// Confirm the outputs of tx
    void Confirm(const Transaction& tx, int32_t height = 1) {
        for (uint32_t i = 0; i < tx.vout.size(); ++i) {
            coins_[OutPoint(tx.GetHash(), i)] = Coin(tx.vout[i], height, false);
        }
    }

private:
    std::map<OutPoint, Coin> coins_;
    uint32_t next_{0};
};

constexpr Amount FUNDING = 1000000;
constexpr int64_t NOW = 1704067200;

} // namespace

class MempoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        Reset(MempoolLimits());
    }

    void Reset(MempoolLimits limits) {
        pool_.reset();
        pool_ = std::make_unique<Mempool>(view_, verifier_, std::move(limits), nullptr, 100);
        pool_->SetChainTip(10, NOW - 3600);
    }

    /// One input from key 1, one output to key 2
    TransactionRef Pay(const OutPoint& from, Amount value, uint8_t fromKey = MINER_KEY,
                       uint8_t toKey = 0x02) {
        return Spend(from, fromKey, value, toKey);
    }

    MapCoinsView view_;
    TestVerifier verifier_;
    std::unique_ptr<Mempool> pool_;
};

// ============================================================================
// Admission
// ============================================================================

TEST_F(MempoolTest, AcceptsValidTransaction) {
    const OutPoint coin = view_.Add(FUNDING);
    auto tx = Spend({coin}, MINER_KEY, {600000, 390000});

    MempoolAcceptResult r = pool_->Submit(tx, NOW);
    ASSERT_TRUE(r.accepted) << r.ToString();
    EXPECT_EQ(r.txid, tx->GetHash());

    // Inputs equal outputs plus fee
    EXPECT_EQ(r.fee, FUNDING - tx->GetValueOut());
    EXPECT_EQ(r.fee, 10000);

    EXPECT_TRUE(pool_->Exists(tx->GetHash()));
    EXPECT_EQ(pool_->Size(), 1u);
    EXPECT_EQ(pool_->TotalBytes(), tx->GetTotalSize());
    EXPECT_EQ(pool_->GetSpender(coin)->GetHash(), tx->GetHash());
    EXPECT_EQ(*pool_->GetFeeRate(tx->GetHash()), FeeRate(10000, tx->GetTotalSize()));

    auto entry = pool_->GetEntry(tx->GetHash());
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->time, NOW);
    EXPECT_EQ(entry->entryHeight, 11);
    EXPECT_TRUE(pool_->CheckConsistency());
}

TEST_F(MempoolTest, AcceptsChildOfPoolTransaction) {
    const OutPoint coin = view_.Add(FUNDING);
    auto parent = Pay(coin, 990000);
    auto child = Pay(OutPoint(parent->GetHash(), 0), 980000, 0x02, 0x03);

    ASSERT_TRUE(pool_->Submit(parent, NOW).accepted);
    MempoolAcceptResult r = pool_->Submit(child, NOW);
    ASSERT_TRUE(r.accepted) << r.ToString();
    EXPECT_EQ(r.fee, 10000);

    auto entry = pool_->GetEntry(parent->GetHash());
    EXPECT_EQ(entry->countWithDescendants, 2u);
    EXPECT_EQ(entry->feesWithDescendants, 20000);
    EXPECT_TRUE(entry->children.count(child->GetHash()));
    EXPECT_TRUE(pool_->CheckConsistency());
}

TEST_F(MempoolTest, RejectsDuplicate) {
    auto tx = Pay(view_.Add(FUNDING), 990000);
    ASSERT_TRUE(pool_->Submit(tx, NOW).accepted);

    MempoolAcceptResult r = pool_->Submit(tx, NOW);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.error, MempoolError::CONFLICT);
    EXPECT_EQ(r.rejectReason, "txn-already-in-mempool");
}

TEST_F(MempoolTest, RejectsMissingInput) {
    const OutPoint coin = view_.Add(FUNDING);
    view_.Remove(coin);
    auto tx = Pay(coin, 990000);
    MempoolAcceptResult r = pool_->Submit(tx, NOW);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.validation, ValidationError::MISSING_UTXO);
    EXPECT_EQ(pool_->Size(), 0u);
}

TEST_F(MempoolTest, RejectsOverspend) {
    auto tx = Pay(view_.Add(FUNDING), FUNDING + 1);
    EXPECT_EQ(pool_->Submit(tx, NOW).validation, ValidationError::INSUFFICIENT_VALUE);
}

TEST_F(MempoolTest, RejectsBadProof) {
    auto tx = Pay(view_.Add(FUNDING, 0x07), 990000, MINER_KEY);
    EXPECT_EQ(pool_->Submit(tx, NOW).validation, ValidationError::SIGNATURE_INVALID);
}

TEST_F(MempoolTest, RejectsFeeBelowMinimum) {
    auto tx = Pay(view_.Add(FUNDING), FUNDING - 1);
    MempoolAcceptResult r = pool_->Submit(tx, NOW);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.error, MempoolError::FEE_TOO_LOW);
}

TEST_F(MempoolTest, RejectsCoinbase) {
    auto coinbase = MakeCoinbase(11, COIN, KeyScript(MINER_KEY));
    EXPECT_EQ(pool_->Submit(coinbase, NOW).validation, ValidationError::MALFORMED_COINBASE);
}

TEST_F(MempoolTest, RejectsImmatureCoinbaseSpend) {
    const OutPoint coin = view_.Add(FUNDING, MINER_KEY, 10, true);
    MempoolAcceptResult r = pool_->Submit(Pay(coin, 990000), NOW);
    EXPECT_EQ(r.validation, ValidationError::LOCKTIME_NOT_SATISFIED);
    EXPECT_EQ(r.rejectReason, "bad-txns-premature-spend-of-coinbase");
}

TEST_F(MempoolTest, RejectsUndecodableBytes) {
    MempoolAcceptResult r = pool_->SubmitBytes({0xff, 0x00}, NOW);
    EXPECT_EQ(r.validation, ValidationError::MALFORMED_TRANSACTION);
}

TEST_F(MempoolTest, SubmitBytes) {
    MutableTransaction mtx(*Pay(view_.Add(FUNDING), 990000));
    MempoolAcceptResult r = pool_->SubmitBytes(SerializeToBytes(mtx), NOW);
    EXPECT_TRUE(r.accepted) << r.ToString();
}

// ============================================================================
// Conflicts & Replacement
// ============================================================================

TEST_F(MempoolTest, NoDoubleSpendWithoutReplacement) {
    MempoolLimits limits;
    limits.enableReplacement = false;
    Reset(limits);

    const OutPoint coin = view_.Add(FUNDING);
    auto first = Spend(coin, MINER_KEY, 990000, 0x02, 1);
    auto second = Spend(coin, MINER_KEY, 900000, 0x02, 2);

    ASSERT_TRUE(pool_->Submit(first, NOW).accepted);
    MempoolAcceptResult r = pool_->Submit(second, NOW);
    EXPECT_EQ(r.error, MempoolError::CONFLICT);
    EXPECT_EQ(r.rejectReason, "txn-mempool-conflict");
    EXPECT_EQ(pool_->GetSpender(coin)->GetHash(), first->GetHash());
}

TEST_F(MempoolTest, ReplacementEvictsOriginalAndDescendants) {
    const OutPoint coin = view_.Add(FUNDING);
    auto a = Pay(coin, 990000);
    auto b = Pay(OutPoint(a->GetHash(), 0), 980000, 0x02, 0x03);
    auto c = Pay(OutPoint(b->GetHash(), 0), 970000, 0x03, 0x04);
    ASSERT_TRUE(pool_->Submit(a, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(b, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(c, NOW).accepted);

    auto replacement = Spend(coin, MINER_KEY, 960000, 0x05);
    MempoolAcceptResult r = pool_->Submit(replacement, NOW);
    ASSERT_TRUE(r.accepted) << r.ToString();

    std::set<TxHash> replaced(r.replaced.begin(), r.replaced.end());
    EXPECT_EQ(replaced, (std::set<TxHash>{a->GetHash(), b->GetHash(), c->GetHash()}));
    EXPECT_FALSE(pool_->Exists(a->GetHash()));
    EXPECT_FALSE(pool_->Exists(b->GetHash()));
    EXPECT_FALSE(pool_->Exists(c->GetHash()));
    EXPECT_TRUE(pool_->Exists(replacement->GetHash()));
    EXPECT_EQ(pool_->Size(), 1u);
    EXPECT_EQ(pool_->GetSpender(coin)->GetHash(), replacement->GetHash());
    EXPECT_TRUE(pool_->CheckConsistency());
}

TEST_F(MempoolTest, ReplacementNeedsHigherAbsoluteFee) {
    const OutPoint coin = view_.Add(FUNDING);
    auto a = Pay(coin, 990000);
    auto b = Pay(OutPoint(a->GetHash(), 0), 980000, 0x02, 0x03);
    ASSERT_TRUE(pool_->Submit(a, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(b, NOW).accepted);

    // Beats a alone, not a plus b
    auto replacement = Spend(coin, MINER_KEY, 985000, 0x05);
    MempoolAcceptResult r = pool_->Submit(replacement, NOW);
    EXPECT_EQ(r.error, MempoolError::REPLACEMENT_REJECTED);
    EXPECT_TRUE(pool_->Exists(a->GetHash()));
    EXPECT_TRUE(pool_->Exists(b->GetHash()));
}

TEST_F(MempoolTest, ReplacementNeedsHigherFeeRate) {
    const OutPoint coin = view_.Add(FUNDING);
    auto a = Pay(coin, 990000);
    ASSERT_TRUE(pool_->Submit(a, NOW).accepted);

    // Higher fee, but under the percentage bump
    auto replacement = Spend(coin, MINER_KEY, 989500, 0x05);
    MempoolAcceptResult r = pool_->Submit(replacement, NOW);
    EXPECT_EQ(r.error, MempoolError::REPLACEMENT_REJECTED);
    EXPECT_NE(r.rejectReason.find("insufficient fee rate"), std::string::npos);
    EXPECT_TRUE(pool_->Exists(a->GetHash()));
}

TEST_F(MempoolTest, ReplacementLimitedInCount) {
    MempoolLimits limits;
    limits.maxReplacements = 1;
    Reset(limits);

    const OutPoint coin = view_.Add(FUNDING);
    auto a = Pay(coin, 990000);
    auto b = Pay(OutPoint(a->GetHash(), 0), 980000, 0x02, 0x03);
    ASSERT_TRUE(pool_->Submit(a, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(b, NOW).accepted);

    MempoolAcceptResult r = pool_->Submit(Spend(coin, MINER_KEY, 500000, 0x05), NOW);
    EXPECT_EQ(r.error, MempoolError::REPLACEMENT_REJECTED);
    EXPECT_EQ(pool_->Size(), 2u);
}

TEST_F(MempoolTest, ReplacementMayNotSpendWhatItReplaces) {
    const OutPoint coin = view_.Add(FUNDING);
    const OutPoint other = view_.Add(FUNDING);
    auto a = Spend({coin}, MINER_KEY, {500000, 490000});
    ASSERT_TRUE(pool_->Submit(a, NOW).accepted);

    MutableTransaction mtx;
    mtx.vin.emplace_back(other);
    mtx.vin.emplace_back(OutPoint(a->GetHash(), 0));
    mtx.vin.emplace_back(coin);
    mtx.vout.emplace_back(1000000, KeyScript(0x05));
    auto bad = SignTransaction(std::move(mtx), {KeyScript(MINER_KEY), KeyScript(0x02), KeyScript(MINER_KEY)});

    MempoolAcceptResult r = pool_->Submit(bad, NOW);
    EXPECT_EQ(r.error, MempoolError::REPLACEMENT_REJECTED);
    EXPECT_EQ(r.rejectReason, "replacement-spends-conflicting-tx");
}

// ============================================================================
// Capacity
// ============================================================================

TEST_F(MempoolTest, EvictsLowestDescendantScore) {
    MempoolLimits limits;
    limits.maxTransactions = 3;
    Reset(limits);

    // Low fee parent carried by a high fee child
    auto parent = Pay(view_.Add(FUNDING), FUNDING - 1000);
    auto child = Pay(OutPoint(parent->GetHash(), 0), FUNDING - 51000, 0x02, 0x03);
    auto loner = Pay(view_.Add(FUNDING), FUNDING - 10000);
    ASSERT_TRUE(pool_->Submit(parent, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(child, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(loner, NOW).accepted);

    auto newcomer = Pay(view_.Add(FUNDING), FUNDING - 20000);
    MempoolAcceptResult r = pool_->Submit(newcomer, NOW);
    ASSERT_TRUE(r.accepted) << r.ToString();

    EXPECT_EQ(pool_->Size(), 3u);
    EXPECT_FALSE(pool_->Exists(loner->GetHash()));
    EXPECT_TRUE(pool_->Exists(parent->GetHash()));
    EXPECT_TRUE(pool_->Exists(child->GetHash()));
    EXPECT_TRUE(pool_->CheckConsistency());
}

TEST_F(MempoolTest, FullRejectsCheapNewcomer) {
    MempoolLimits limits;
    limits.maxTransactions = 2;
    Reset(limits);

    ASSERT_TRUE(pool_->Submit(Pay(view_.Add(FUNDING), FUNDING - 10000), NOW).accepted);
    ASSERT_TRUE(pool_->Submit(Pay(view_.Add(FUNDING), FUNDING - 10000), NOW).accepted);

    MempoolAcceptResult r = pool_->Submit(Pay(view_.Add(FUNDING), FUNDING - 5000), NOW);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.error, MempoolError::FULL);
    EXPECT_EQ(pool_->Size(), 2u);
}

TEST_F(MempoolTest, ByteLimitEvictsWholePackage) {
    // Package rate of parent is below its child's own rate
    auto parent = Pay(view_.Add(FUNDING), FUNDING - 1000);
    auto child = Pay(OutPoint(parent->GetHash(), 0), FUNDING - 4000, 0x02, 0x03);
    auto rich = Pay(view_.Add(FUNDING), FUNDING - 50000);

    MempoolLimits limits;
    limits.maxBytes = parent->GetTotalSize() + child->GetTotalSize() + rich->GetTotalSize() - 1;
    Reset(limits);

    ASSERT_TRUE(pool_->Submit(parent, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(child, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(rich, NOW).accepted);

    EXPECT_TRUE(pool_->Exists(rich->GetHash()));
    EXPECT_FALSE(pool_->Exists(parent->GetHash()));
    EXPECT_FALSE(pool_->Exists(child->GetHash()));
    EXPECT_LE(pool_->TotalBytes(), limits.maxBytes);
    EXPECT_TRUE(pool_->CheckConsistency());
}

// ============================================================================
// Expiry
// ============================================================================

TEST_F(MempoolTest, ExpireRemovesOldEntriesWithDescendants) {
    MempoolLimits limits;
    limits.ttl = 100;
    Reset(limits);

    auto old = Pay(view_.Add(FUNDING), 990000);
    auto young = Pay(OutPoint(old->GetHash(), 0), 980000, 0x02, 0x03);
    auto other = Pay(view_.Add(FUNDING), 990000);
    ASSERT_TRUE(pool_->Submit(old, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(young, NOW + 90).accepted);
    ASSERT_TRUE(pool_->Submit(other, NOW + 50).accepted);

    EXPECT_EQ(pool_->Expire(NOW + 100), 0u);
    EXPECT_EQ(pool_->Expire(NOW + 101), 2u);
    EXPECT_FALSE(pool_->Exists(old->GetHash()));
    EXPECT_FALSE(pool_->Exists(young->GetHash()));
    EXPECT_TRUE(pool_->Exists(other->GetHash()));
    EXPECT_TRUE(pool_->CheckConsistency());
}

TEST_F(MempoolTest, SpendingExpiredParentRejected) {
    MempoolLimits limits;
    limits.ttl = 100;
    Reset(limits);

    auto parent = Pay(view_.Add(FUNDING), 990000);
    ASSERT_TRUE(pool_->Submit(parent, NOW).accepted);

    auto child = Pay(OutPoint(parent->GetHash(), 0), 980000, 0x02, 0x03);
    MempoolAcceptResult r = pool_->Submit(child, NOW + 200);
    EXPECT_FALSE(r.accepted);
    EXPECT_EQ(r.error, MempoolError::EXPIRED);
}

// ============================================================================
// Prioritized View
// ============================================================================

TEST_F(MempoolTest, PrioritizedViewOrdersByPackageRate) {
    auto low = Pay(view_.Add(FUNDING), FUNDING - 2000);
    auto mid = Pay(view_.Add(FUNDING), FUNDING - 20000);
    auto parent = Pay(view_.Add(FUNDING), FUNDING - 1000);
    auto child = Pay(OutPoint(parent->GetHash(), 0), FUNDING - 81000, 0x02, 0x03);
    for (const auto& tx : {low, mid, parent, child}) {
        ASSERT_TRUE(pool_->Submit(tx, NOW).accepted);
    }

    PrioritizedView view = pool_->GetPrioritizedView(1000000);
    std::vector<TxHash> order;
    while (TransactionRef tx = view.Next()) {
        order.push_back(tx->GetHash());
    }

    std::vector<TxHash> expected{parent->GetHash(), child->GetHash(), mid->GetHash(), low->GetHash()};
    EXPECT_EQ(order, expected);
    EXPECT_EQ(view.BytesUsed(), pool_->TotalBytes());
}

TEST_F(MempoolTest, PrioritizedViewRespectsByteBudget) {
    auto a = Pay(view_.Add(FUNDING), FUNDING - 30000);
    auto b = Pay(view_.Add(FUNDING), FUNDING - 20000);
    auto bChild = Pay(OutPoint(b->GetHash(), 0), FUNDING - 90000, 0x02, 0x03);
    ASSERT_TRUE(pool_->Submit(a, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(b, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(bChild, NOW).accepted);

    // Room for one transaction: the two-transaction package cannot fit
    PrioritizedView view = pool_->GetPrioritizedView(a->GetTotalSize());
    TransactionRef first = view.Next();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->GetHash(), a->GetHash());
    EXPECT_EQ(view.Next(), nullptr);
    EXPECT_LE(view.BytesUsed(), view.MaxBytes());
}

TEST_F(MempoolTest, PrioritizedViewIsASnapshot) {
    auto a = Pay(view_.Add(FUNDING), 990000);
    ASSERT_TRUE(pool_->Submit(a, NOW).accepted);
    PrioritizedView view = pool_->GetPrioritizedView(1000000);

    ASSERT_TRUE(pool_->Submit(Pay(view_.Add(FUNDING), 900000), NOW).accepted);
    pool_->Clear();

    TransactionRef first = view.Next();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->GetHash(), a->GetHash());
    EXPECT_EQ(view.Next(), nullptr);
}

// ============================================================================
// Block Handling
// ============================================================================

TEST_F(MempoolTest, RemoveForBlockDropsMinedAndConflicting) {
    const OutPoint c1 = view_.Add(FUNDING);
    const OutPoint c2 = view_.Add(FUNDING);
    auto mined = Pay(c1, 990000);
    auto loser = Spend(c2, MINER_KEY, 990000, 0x02, 1);
    auto loserChild = Pay(OutPoint(loser->GetHash(), 0), 980000, 0x02, 0x03);
    auto survivor = Pay(view_.Add(FUNDING), 990000);
    for (const auto& tx : {mined, loser, loserChild, survivor}) {
        ASSERT_TRUE(pool_->Submit(tx, NOW).accepted);
    }

    auto winner = Spend(c2, MINER_KEY, 900000, 0x04, 2);
    Block block;
    block.vtx.push_back(MakeCoinbase(11, COIN, KeyScript(MINER_KEY)));
    block.vtx.push_back(mined);
    block.vtx.push_back(winner);

    pool_->RemoveForBlock(block);

    EXPECT_EQ(pool_->Size(), 1u);
    EXPECT_TRUE(pool_->Exists(survivor->GetHash()));
    EXPECT_EQ(pool_->GetSpender(c1), nullptr);
    EXPECT_EQ(pool_->GetSpender(c2), nullptr);
    EXPECT_TRUE(pool_->CheckConsistency());
}

TEST_F(MempoolTest, ReaddForDisconnect) {
    const OutPoint stillThere = view_.Add(FUNDING);
    const OutPoint gone = view_.Add(FUNDING);
    auto readded = Pay(stillThere, 990000);
    auto dropped = Pay(gone, 990000);
    view_.Remove(gone);

    pool_->ReaddForDisconnect({readded, dropped}, NOW);

    EXPECT_TRUE(pool_->Exists(readded->GetHash()));
    EXPECT_FALSE(pool_->Exists(dropped->GetHash()));
}

TEST_F(MempoolTest, ReaddPurgesEntriesWhoseInputsVanished) {
    const OutPoint coin = view_.Add(FUNDING);
    auto tx = Pay(coin, 990000);
    auto child = Pay(OutPoint(tx->GetHash(), 0), 980000, 0x02, 0x03);
    ASSERT_TRUE(pool_->Submit(tx, NOW).accepted);
    ASSERT_TRUE(pool_->Submit(child, NOW).accepted);

    view_.Remove(coin);
    pool_->ReaddForDisconnect({}, NOW);

    EXPECT_EQ(pool_->Size(), 0u);
    EXPECT_TRUE(pool_->CheckConsistency());
}

TEST_F(MempoolTest, ReaddedParentLinksChildrenAlreadyInPool) {
    const OutPoint coin = view_.Add(FUNDING);
    auto parent = Pay(coin, 990000);
    auto child = Pay(OutPoint(parent->GetHash(), 0), 980000, 0x02, 0x03);

    // The child arrived while its parent was confirmed
    view_.Confirm(*parent);
    ASSERT_TRUE(pool_->Submit(child, NOW).accepted);

    // The parent's block is disconnected
    view_.Remove(OutPoint(parent->GetHash(), 0));
    pool_->ReaddForDisconnect({parent}, NOW);

    ASSERT_TRUE(pool_->Exists(parent->GetHash()));
    ASSERT_TRUE(pool_->Exists(child->GetHash()));
    auto parentEntry = pool_->GetEntry(parent->GetHash());
    auto childEntry = pool_->GetEntry(child->GetHash());
    EXPECT_TRUE(parentEntry->children.count(child->GetHash()));
    EXPECT_TRUE(childEntry->parents.count(parent->GetHash()));
    EXPECT_EQ(parentEntry->countWithDescendants, 2u);
    EXPECT_EQ(parentEntry->sizeWithDescendants, parent->GetTotalSize() + child->GetTotalSize());
    EXPECT_EQ(parentEntry->feesWithDescendants, 20000);
    EXPECT_TRUE(pool_->CheckConsistency());

    // Parent first even though the child was inserted earlier
    PrioritizedView view = pool_->GetPrioritizedView(1000000);
    ASSERT_EQ(view.Next(), parent);
    ASSERT_EQ(view.Next(), child);
    EXPECT_EQ(view.Next(), nullptr);

    // Replacing the parent takes the child with it
    auto replacement = Spend(coin, MINER_KEY, 900000, 0x04, 1);
    MempoolAcceptResult r = pool_->Submit(replacement, NOW);
    ASSERT_TRUE(r.accepted) << r.ToString();
    EXPECT_EQ(r.replaced.size(), 2u);
    EXPECT_FALSE(pool_->Exists(child->GetHash()));
    EXPECT_EQ(pool_->Size(), 1u);
    EXPECT_TRUE(pool_->CheckConsistency());
}

TEST_F(MempoolTest, ReaddRetriesChildBeforeParent) {
    const OutPoint coin = view_.Add(FUNDING);
    auto parent = Pay(coin, 990000);
    auto child = Pay(OutPoint(parent->GetHash(), 0), 980000, 0x02, 0x03);

    pool_->ReaddForDisconnect({child, parent}, NOW);

    EXPECT_TRUE(pool_->Exists(parent->GetHash()));
    EXPECT_TRUE(pool_->Exists(child->GetHash()));
    EXPECT_EQ(pool_->GetEntry(parent->GetHash())->countWithDescendants, 2u);
    EXPECT_TRUE(pool_->CheckConsistency());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(MempoolTest, ConcurrentSubmissionsKeepOneSpenderPerCoin) {
    constexpr int COINS = 32;
    constexpr int THREADS = 4;
    std::vector<OutPoint> coins;
    for (int i = 0; i < COINS; ++i) {
        coins.push_back(view_.Add(FUNDING));
    }

    // Every thread spends every coin with its own fee
    std::vector<std::vector<TransactionRef>> work(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        for (int i = 0; i < COINS; ++i) {
            work[t].push_back(Spend(coins[i], MINER_KEY, FUNDING - 10000 * (t + 1), 0x02,
                                    static_cast<uint32_t>(t)));
        }
    }

    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            for (const auto& tx : work[t]) {
                if (pool_->Submit(tx, NOW).accepted) {
                    ++accepted;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_GE(accepted.load(), COINS);
    EXPECT_EQ(pool_->Size(), static_cast<size_t>(COINS));
    EXPECT_TRUE(pool_->CheckConsistency());
    for (const OutPoint& coin : coins) {
        EXPECT_NE(pool_->GetSpender(coin), nullptr);
    }
}

TEST_F(MempoolTest, ConcurrentDescendantsOfSharedParentKeepTotals) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 4;
    const OutPoint coin = view_.Add(FUNDING);
    auto parent = Spend({coin}, MINER_KEY,
                        std::vector<Amount>(THREADS * PER_THREAD, 60000), 0x02);
    ASSERT_TRUE(pool_->Submit(parent, NOW).accepted);

    // Each thread hangs a child and a grandchild off its own outputs
    std::vector<std::vector<TransactionRef>> work(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        for (int i = 0; i < PER_THREAD; ++i) {
            const uint32_t n = static_cast<uint32_t>(t * PER_THREAD + i);
            auto child = Pay(OutPoint(parent->GetHash(), n), 50000, 0x02, 0x03);
            auto grandchild = Pay(OutPoint(child->GetHash(), 0), 40000, 0x03, 0x04);
            work[t].push_back(child);
            work[t].push_back(grandchild);
        }
    }

    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            for (const auto& tx : work[t]) {
                if (pool_->Submit(tx, NOW).accepted) {
                    ++accepted;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(accepted.load(), THREADS * PER_THREAD * 2);
    auto entry = pool_->GetEntry(parent->GetHash());
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->countWithDescendants, 1u + THREADS * PER_THREAD * 2);
    EXPECT_EQ(entry->children.size(), static_cast<size_t>(THREADS * PER_THREAD));
    EXPECT_TRUE(pool_->CheckConsistency());
}
