// STRATA - Validation Tests
// Copyright (c) 2024 STRATA Developers
// MIT License

#include <gtest/gtest.h>
#include "strata/consensus/validation.h"
#include "strata/util/threadpool.h"
#include "test_util.h"

#include <map>
#include <optional>
#include <vector>

namespace strata {
namespace test {

using consensus::ValidationState;

namespace {

constexpr Amount FUNDING = 10 * COIN;

/// Coins held in a plain map
class MapView : public CoinsView {
public:
    std::optional<Coin> GetCoin(const OutPoint& outpoint) const override {
        auto it = coins_.find(outpoint);
        if (it == coins_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    OutPoint Add(Amount value, uint8_t key = MINER_KEY, int32_t height = 1,
                 bool coinbase = false) {
        TxHash hash;
        hash[0] = static_cast<uint8_t>(++counter_);
        hash[1] = static_cast<uint8_t>(counter_ >> 8);
        hash[31] = 0x42;
        OutPoint outpoint(hash, 0);
        coins_[outpoint] = Coin(TxOut(value, KeyScript(key)), height, coinbase);
        return outpoint;
    }

private:
    std::map<OutPoint, Coin> coins_;
    uint32_t counter_{0};
};

consensus::TxContext ContextAt(int32_t spendHeight) {
    consensus::TxContext ctx;
    ctx.spendHeight = spendHeight;
    ctx.lockTimeCutoff = 1704067200;
    ctx.coinbaseMaturity = 100;
    return ctx;
}

MutableTransaction SimpleTx() {
    MutableTransaction mtx;
    TxHash hash;
    hash[0] = 0x01;
    mtx.vin.emplace_back(OutPoint(hash, 0));
    mtx.vout.emplace_back(1000, KeyScript(0x02));
    return mtx;
}

/// Block over txs with a valid merkle root and coinbase at height
Block AssembleBlock(int32_t height, Amount coinbaseValue, const std::vector<TransactionRef>& txs) {
    Block block;
    block.nVersion = 1;
    block.nTime = 1704067200;
    block.nBits = 0x207fffff;
    block.vtx.push_back(MakeCoinbase(height, coinbaseValue, KeyScript(MINER_KEY)));
    block.vtx.insert(block.vtx.end(), txs.begin(), txs.end());
    block.hashMerkleRoot = block.ComputeMerkleRoot();
    return block;
}

} // namespace

// ============================================================================
// CheckTransaction
// ============================================================================

class CheckTransactionTest : public ::testing::Test {
protected:
    std::string Reject(const MutableTransaction& mtx, size_t maxSize = 1000 * 1000) {
        ValidationState state;
        if (consensus::CheckTransaction(Transaction(mtx), state, maxSize)) {
            return "";
        }
        EXPECT_TRUE(state.IsInvalid());
        return state.GetRejectReason();
    }
};

TEST_F(CheckTransactionTest, AcceptsWellFormed) {
    EXPECT_EQ(Reject(SimpleTx()), "");
}

TEST_F(CheckTransactionTest, ShapeRules) {
    MutableTransaction noInputs = SimpleTx();
    noInputs.vin.clear();
    EXPECT_EQ(Reject(noInputs), "bad-txns-vin-empty");

    MutableTransaction noOutputs = SimpleTx();
    noOutputs.vout.clear();
    EXPECT_EQ(Reject(noOutputs), "bad-txns-vout-empty");

    EXPECT_EQ(Reject(SimpleTx(), 10), "bad-txns-oversize");

    MutableTransaction nullPrevout = SimpleTx();
    nullPrevout.vin.emplace_back(OutPoint());
    EXPECT_EQ(Reject(nullPrevout), "bad-txns-prevout-null");
}

TEST_F(CheckTransactionTest, OutputValues) {
    MutableTransaction negative = SimpleTx();
    negative.vout[0].nValue = -1;
    EXPECT_EQ(Reject(negative), "bad-txns-vout-negative");

    MutableTransaction tooLarge = SimpleTx();
    tooLarge.vout[0].nValue = MAX_MONEY + 1;
    EXPECT_EQ(Reject(tooLarge), "bad-txns-vout-toolarge");

    MutableTransaction totalTooLarge = SimpleTx();
    totalTooLarge.vout[0].nValue = MAX_MONEY;
    totalTooLarge.vout.emplace_back(MAX_MONEY, KeyScript(0x02));
    EXPECT_EQ(Reject(totalTooLarge), "bad-txns-txouttotal-toolarge");
}

TEST_F(CheckTransactionTest, DuplicateInputs) {
    MutableTransaction mtx = SimpleTx();
    mtx.vin.push_back(mtx.vin[0]);

    ValidationState state;
    EXPECT_FALSE(consensus::CheckTransaction(Transaction(mtx), state));
    EXPECT_EQ(state.GetError(), ValidationError::DOUBLE_SPEND);
}

TEST_F(CheckTransactionTest, CoinbaseScriptLength) {
    MutableTransaction coinbase;
    coinbase.vin.emplace_back(OutPoint(), Script{0x01});
    coinbase.vout.emplace_back(50 * COIN, KeyScript(MINER_KEY));
    EXPECT_EQ(Reject(coinbase), "bad-cb-length");

    coinbase.vin[0].scriptSig = Script{0x01, 0x02};
    EXPECT_EQ(Reject(coinbase), "");

    coinbase.vin[0].scriptSig = Script(std::vector<uint8_t>(101, 0x00));
    EXPECT_EQ(Reject(coinbase), "bad-cb-length");
}

// ============================================================================
// Finality and Signature Hash
// ============================================================================

TEST(FinalityTest, LockTimeByHeightAndTime) {
    MutableTransaction mtx = SimpleTx();
    mtx.vin[0].nSequence = 0;

    mtx.nLockTime = 0;
    EXPECT_TRUE(consensus::IsFinalTx(Transaction(mtx), 1, 0));

    mtx.nLockTime = 50;
    EXPECT_FALSE(consensus::IsFinalTx(Transaction(mtx), 50, 0));
    EXPECT_TRUE(consensus::IsFinalTx(Transaction(mtx), 51, 0));

    mtx.nLockTime = consensus::LOCKTIME_THRESHOLD + 100;
    EXPECT_FALSE(consensus::IsFinalTx(Transaction(mtx), 1000000, consensus::LOCKTIME_THRESHOLD));
    EXPECT_TRUE(consensus::IsFinalTx(Transaction(mtx), 1, consensus::LOCKTIME_THRESHOLD + 101));

    // Final sequences override the lock time
    mtx.vin[0].nSequence = TxIn::SEQUENCE_FINAL;
    EXPECT_TRUE(consensus::IsFinalTx(Transaction(mtx), 1, 0));
}

TEST(SignatureHashTest, IgnoresProofsCoversIndex) {
    MutableTransaction mtx = SimpleTx();
    TxHash other;
    other[0] = 0x09;
    mtx.vin.emplace_back(OutPoint(other, 1));
    const Transaction unsignedTx(mtx);

    mtx.vin[0].scriptSig = Script{0xde, 0xad};
    const Transaction signedTx(mtx);

    EXPECT_EQ(consensus::SignatureHash(unsignedTx, 0, unsignedTx.vin[0].prevout),
              consensus::SignatureHash(signedTx, 0, signedTx.vin[0].prevout));
    EXPECT_NE(consensus::SignatureHash(unsignedTx, 0, unsignedTx.vin[0].prevout),
              consensus::SignatureHash(unsignedTx, 1, unsignedTx.vin[1].prevout));
}

// ============================================================================
// ValidateTransaction
// ============================================================================

class ValidateTransactionTest : public ::testing::Test {
protected:
    bool Validate(const TransactionRef& tx, const consensus::TxContext& ctx) {
        state_ = ValidationState();
        fee_ = -1;
        return consensus::ValidateTransaction(*tx, view_, ctx, verifier_, state_, fee_);
    }

    MapView view_;
    TestVerifier verifier_;
    ValidationState state_;
    Amount fee_{0};
};

TEST_F(ValidateTransactionTest, ComputesFee) {
    OutPoint coin = view_.Add(FUNDING);
    EXPECT_TRUE(Validate(Spend(coin, MINER_KEY, FUNDING - 500), ContextAt(10)));
    EXPECT_EQ(fee_, 500);
}

TEST_F(ValidateTransactionTest, MissingInput) {
    TxHash hash;
    hash[0] = 0xee;
    EXPECT_FALSE(Validate(Spend(OutPoint(hash, 3), MINER_KEY, 1), ContextAt(10)));
    EXPECT_EQ(state_.GetError(), ValidationError::MISSING_UTXO);
}

TEST_F(ValidateTransactionTest, AlreadySpentInBatch) {
    OutPoint coin = view_.Add(FUNDING);
    SpentTracker spent;
    spent.Insert(coin);
    consensus::TxContext ctx = ContextAt(10);
    ctx.spent = &spent;

    EXPECT_FALSE(Validate(Spend(coin, MINER_KEY, 1), ctx));
    EXPECT_EQ(state_.GetError(), ValidationError::DOUBLE_SPEND);
}

TEST_F(ValidateTransactionTest, CoinbaseMaturity) {
    OutPoint coin = view_.Add(FUNDING, MINER_KEY, 5, true);
    EXPECT_FALSE(Validate(Spend(coin, MINER_KEY, 1), ContextAt(104)));
    EXPECT_EQ(state_.GetRejectReason(), "bad-txns-premature-spend-of-coinbase");
    EXPECT_TRUE(Validate(Spend(coin, MINER_KEY, 1), ContextAt(105)));
}

TEST_F(ValidateTransactionTest, OutputsExceedInputs) {
    OutPoint coin = view_.Add(FUNDING);
    EXPECT_FALSE(Validate(Spend(coin, MINER_KEY, FUNDING + 1), ContextAt(10)));
    EXPECT_EQ(state_.GetError(), ValidationError::INSUFFICIENT_VALUE);
    EXPECT_EQ(state_.GetRejectReason(), "bad-txns-in-belowout");
}

TEST_F(ValidateTransactionTest, AbsoluteLockTime) {
    OutPoint coin = view_.Add(FUNDING);
    MutableTransaction mtx;
    mtx.vin.emplace_back(coin);
    mtx.vin[0].nSequence = TxIn::SEQUENCE_FINAL - 1;
    mtx.vout.emplace_back(FUNDING, KeyScript(0x02));
    mtx.nLockTime = 50;
    auto tx = SignTransaction(mtx, {KeyScript(MINER_KEY)});

    EXPECT_FALSE(Validate(tx, ContextAt(50)));
    EXPECT_EQ(state_.GetRejectReason(), "bad-txns-nonfinal");
    EXPECT_TRUE(Validate(tx, ContextAt(51)));
}

TEST_F(ValidateTransactionTest, RelativeHeightLock) {
    OutPoint coin = view_.Add(FUNDING, MINER_KEY, 8);
    MutableTransaction mtx;
    mtx.vin.emplace_back(coin);
    mtx.vin[0].nSequence = 5;
    mtx.vout.emplace_back(FUNDING, KeyScript(0x02));
    auto tx = SignTransaction(mtx, {KeyScript(MINER_KEY)});

    EXPECT_FALSE(Validate(tx, ContextAt(12)));
    EXPECT_EQ(state_.GetError(), ValidationError::LOCKTIME_NOT_SATISFIED);
    EXPECT_TRUE(Validate(tx, ContextAt(13)));

    // Version 1 ignores sequence locks
    mtx.version = 1;
    EXPECT_TRUE(Validate(SignTransaction(mtx, {KeyScript(MINER_KEY)}), ContextAt(9)));
}

TEST_F(ValidateTransactionTest, BadSignature) {
    OutPoint coin = view_.Add(FUNDING, MINER_KEY);
    EXPECT_FALSE(Validate(Spend(coin, 0x07, FUNDING), ContextAt(10)));
    EXPECT_EQ(state_.GetError(), ValidationError::SIGNATURE_INVALID);
}

TEST_F(ValidateTransactionTest, CoinbaseNotAllowed) {
    EXPECT_FALSE(Validate(MakeCoinbase(10, COIN, KeyScript(MINER_KEY)), ContextAt(10)));
    EXPECT_EQ(state_.GetError(), ValidationError::MALFORMED_COINBASE);
}

// ============================================================================
// Headers and Blocks
// ============================================================================

TEST(BlockValidationTest, ProofOfWork) {
    const auto params = consensus::Params::RegTest();
    EXPECT_TRUE(consensus::CheckProofOfWork(BlockHash(), params.nPowLimitBits, params));

    BlockHash high;
    for (size_t i = 0; i < high.size(); ++i) {
        high[i] = 0xff;
    }
    EXPECT_FALSE(consensus::CheckProofOfWork(high, params.nPowLimitBits, params));

    // Targets above the limit, zero, negative or overflowing
    EXPECT_FALSE(consensus::CheckProofOfWork(BlockHash(), 0x2100ffff, params));
    EXPECT_FALSE(consensus::CheckProofOfWork(BlockHash(), 0, params));
    EXPECT_FALSE(consensus::CheckProofOfWork(BlockHash(), 0x04923456, params));
    EXPECT_FALSE(consensus::CheckProofOfWork(BlockHash(), 0xff123456, params));
}

TEST(BlockValidationTest, AcceptsMinedBlock) {
    const auto params = consensus::Params::RegTest();
    Block block = AssembleBlock(1, COIN, {});
    MineBlock(block, params);

    ValidationState state;
    EXPECT_TRUE(consensus::CheckBlock(block, state, params)) << state.ToString();
}

TEST(BlockValidationTest, RejectsInsufficientWork) {
    const auto params = consensus::Params::Main();
    Block block = AssembleBlock(1, COIN, {});
    block.nBits = params.nPowLimitBits;
    while (consensus::CheckProofOfWork(block.GetHash(), block.nBits, params)) {
        ++block.nNonce;
    }

    ValidationState state;
    EXPECT_FALSE(consensus::CheckBlock(block, state, params));
    EXPECT_EQ(state.GetRejectReason(), "high-hash");

    block.nBits = 0;
    EXPECT_FALSE(consensus::CheckBlockHeader(block, state, params));
    EXPECT_EQ(state.GetRejectReason(), "bad-diffbits");
}

TEST(BlockValidationTest, StructuralRules) {
    const auto params = consensus::Params::RegTest();
    const auto tx = Spend(OutPoint(TxHash::FromHex(std::string(64, '1')), 0), MINER_KEY, 100);
    ValidationState state;

    Block empty;
    EXPECT_FALSE(consensus::CheckBlock(empty, state, params, false));
    EXPECT_EQ(state.GetRejectReason(), "bad-blk-length");

    Block badRoot = AssembleBlock(1, COIN, {tx});
    badRoot.hashMerkleRoot.SetNull();
    EXPECT_FALSE(consensus::CheckBlock(badRoot, state, params, false));
    EXPECT_EQ(state.GetError(), ValidationError::INVALID_MERKLE_ROOT);

    const auto other = Spend(OutPoint(TxHash::FromHex(std::string(64, '2')), 0), MINER_KEY, 100);
    Block duplicated = AssembleBlock(1, COIN, {other, tx, tx});
    EXPECT_FALSE(consensus::CheckBlock(duplicated, state, params, false));
    EXPECT_EQ(state.GetRejectReason(), "bad-txns-duplicate");

    Block noCoinbase;
    noCoinbase.vtx.push_back(tx);
    noCoinbase.hashMerkleRoot = noCoinbase.ComputeMerkleRoot();
    EXPECT_FALSE(consensus::CheckBlock(noCoinbase, state, params, false));
    EXPECT_EQ(state.GetRejectReason(), "bad-cb-missing");

    Block twoCoinbases = AssembleBlock(1, COIN, {MakeCoinbase(1, COIN, KeyScript(0x02), 1)});
    EXPECT_FALSE(consensus::CheckBlock(twoCoinbases, state, params, false));
    EXPECT_EQ(state.GetRejectReason(), "bad-cb-multiple");
}

TEST(BlockValidationTest, ContextualHeader) {
    const auto params = consensus::Params::RegTest();
    BlockHeader header;
    header.nBits = params.nPowLimitBits;
    header.nTime = 1000;

    consensus::ParentContext parent;
    parent.height = 5;
    parent.medianTimePast = 999;
    parent.requiredBits = params.nPowLimitBits;

    ValidationState state;
    EXPECT_TRUE(consensus::ContextualCheckBlockHeader(header, parent, params, 1000, state));

    parent.requiredBits = 0x1f00ffff;
    EXPECT_FALSE(consensus::ContextualCheckBlockHeader(header, parent, params, 1000, state));
    EXPECT_EQ(state.GetRejectReason(), "bad-diffbits");
    parent.requiredBits = params.nPowLimitBits;

    parent.medianTimePast = 1000;
    EXPECT_FALSE(consensus::ContextualCheckBlockHeader(header, parent, params, 1000, state));
    EXPECT_EQ(state.GetRejectReason(), "time-too-old");
    parent.medianTimePast = 999;

    const int64_t now = 1000 - params.nMaxFutureBlockTime - 1;
    EXPECT_FALSE(consensus::ContextualCheckBlockHeader(header, parent, params, now, state));
    EXPECT_EQ(state.GetRejectReason(), "time-too-new");
}

// ============================================================================
// ConnectBlockTransactions
// ============================================================================

class ConnectBlockTest : public ::testing::Test {
protected:
    static constexpr int32_t HEIGHT = 200;

    bool Connect(const Block& block, util::ThreadPool* pool) {
        state_ = ValidationState();
        fees_ = -1;
        return consensus::ConnectBlockTransactions(block, HEIGHT, 1704067200, view_, verifier_,
                                                   params_, pool, 0, state_, fees_);
    }

    Amount Subsidy() const { return consensus::GetBlockSubsidy(HEIGHT, params_); }

    consensus::Params params_ = consensus::Params::RegTest();
    MapView view_;
    TestVerifier verifier_;
    ValidationState state_;
    Amount fees_{0};
};

TEST_F(ConnectBlockTest, CollectsFeesAcrossChainedSpends) {
    OutPoint a = view_.Add(FUNDING);
    OutPoint b = view_.Add(FUNDING);
    auto parent = Spend(a, MINER_KEY, FUNDING - 100, MINER_KEY);
    auto child = Spend(OutPoint(parent->GetHash(), 0), MINER_KEY, FUNDING - 300);
    auto other = Spend(b, MINER_KEY, FUNDING - 1000);

    Block block = AssembleBlock(HEIGHT, Subsidy() + 1300, {parent, child, other});
    EXPECT_TRUE(Connect(block, nullptr)) << state_.ToString();
    EXPECT_EQ(fees_, 1300);
}

TEST_F(ConnectBlockTest, CoinbaseMayNotOverclaim) {
    OutPoint a = view_.Add(FUNDING);
    auto tx = Spend(a, MINER_KEY, FUNDING - 100);
    Block block = AssembleBlock(HEIGHT, Subsidy() + 101, {tx});
    EXPECT_FALSE(Connect(block, nullptr));
    EXPECT_EQ(state_.GetRejectReason(), "bad-cb-amount");
}

TEST_F(ConnectBlockTest, DoubleSpendInsideBlock) {
    OutPoint a = view_.Add(FUNDING);
    auto first = Spend(a, MINER_KEY, FUNDING - 100, 0x02, 1);
    auto second = Spend(a, MINER_KEY, FUNDING - 200, 0x02, 2);
    Block block = AssembleBlock(HEIGHT, Subsidy(), {first, second});

    EXPECT_FALSE(Connect(block, nullptr));
    EXPECT_EQ(state_.GetError(), ValidationError::DOUBLE_SPEND);

    util::ThreadPool pool(4);
    EXPECT_FALSE(Connect(block, &pool));
    EXPECT_EQ(state_.GetError(), ValidationError::DOUBLE_SPEND);
}

TEST_F(ConnectBlockTest, ChildBeforeParentIsMissing) {
    OutPoint a = view_.Add(FUNDING);
    auto parent = Spend(a, MINER_KEY, FUNDING - 100, MINER_KEY);
    auto child = Spend(OutPoint(parent->GetHash(), 0), MINER_KEY, FUNDING - 300);
    Block block = AssembleBlock(HEIGHT, Subsidy(), {child, parent});

    EXPECT_FALSE(Connect(block, nullptr));
    EXPECT_EQ(state_.GetError(), ValidationError::MISSING_UTXO);
}

TEST_F(ConnectBlockTest, ParallelMatchesSequential) {
    std::vector<TransactionRef> txs;
    Amount expectedFees = 0;
    for (int i = 0; i < 40; ++i) {
        OutPoint coin = view_.Add(FUNDING);
        auto tx = Spend(coin, MINER_KEY, FUNDING - 10 * (i + 1), MINER_KEY);
        expectedFees += 10 * (i + 1);
        txs.push_back(tx);
        if (i % 5 == 0) {
            auto next = Spend(OutPoint(tx->GetHash(), 0), MINER_KEY, FUNDING - 10 * (i + 1) - 7);
            expectedFees += 7;
            txs.push_back(next);
        }
    }
    Block block = AssembleBlock(HEIGHT, Subsidy() + expectedFees, txs);

    util::ThreadPool pool(4);
    ASSERT_TRUE(Connect(block, nullptr)) << state_.ToString();
    EXPECT_EQ(fees_, expectedFees);
    ASSERT_TRUE(Connect(block, &pool)) << state_.ToString();
    EXPECT_EQ(fees_, expectedFees);
}

TEST_F(ConnectBlockTest, ParallelReportsFirstFailureInBlockOrder) {
    std::vector<TransactionRef> txs;
    for (int i = 0; i < 30; ++i) {
        OutPoint coin = view_.Add(FUNDING);
        if (i == 7) {
            txs.push_back(Spend(coin, 0x09, FUNDING));
        } else if (i == 20) {
            TxHash unknown;
            unknown[0] = 0xab;
            unknown[2] = 0xcd;
            txs.push_back(Spend(OutPoint(unknown, 0), MINER_KEY, 1));
        } else {
            txs.push_back(Spend(coin, MINER_KEY, FUNDING));
        }
    }
    Block block = AssembleBlock(HEIGHT, Subsidy(), txs);

    util::ThreadPool pool(4);
    for (int round = 0; round < 5; ++round) {
        EXPECT_FALSE(Connect(block, &pool));
        EXPECT_EQ(state_.GetError(), ValidationError::SIGNATURE_INVALID);
    }
    EXPECT_FALSE(Connect(block, nullptr));
    EXPECT_EQ(state_.GetError(), ValidationError::SIGNATURE_INVALID);
}

} // namespace test
} // namespace strata
