// STRATA - Validation Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/consensus/validation.h"
#include "strata/core/arith.h"
#include "strata/core/merkle.h"
#include "strata/crypto/sha256.h"
#include "strata/util/logging.h"
#include "strata/util/threadpool.h"

#include <future>
#include <numeric>
#include <set>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace strata {
namespace consensus {

// ============================================================================
// ValidationState Implementation
// ============================================================================

std::string ValidationState::ToString() const {
    std::ostringstream ss;
    switch (mode_) {
        case Mode::VALID:
            ss << "Valid";
            break;
        case Mode::INVALID:
            ss << "Invalid: " << strata::ToString(error_) << " " << rejectReason_;
            if (!debugMessage_.empty()) {
                ss << " (" << debugMessage_ << ")";
            }
            break;
        case Mode::ERROR:
            ss << "Error: " << rejectReason_;
            break;
    }
    return ss.str();
}

// ============================================================================
// Signature Hash
// ============================================================================

Hash256 SignatureHash(const Transaction& tx, uint32_t inputIndex, const OutPoint& prevout) {
    DataStream ss;
    Serialize(ss, tx.version);
    WriteCompactSize(ss, tx.vin.size());
    for (const auto& txin : tx.vin) {
        Serialize(ss, txin.prevout);
        Serialize(ss, txin.nSequence);
    }
    Serialize(ss, tx.vout);
    Serialize(ss, tx.nLockTime);
    Serialize(ss, inputIndex);
    Serialize(ss, prevout);
    return DoubleSHA256(ss.data(), ss.size());
}

// ============================================================================
// Transaction Validation
// ============================================================================

bool CheckTransaction(const Transaction& tx, ValidationState& state, size_t maxTxSize) {
    if (tx.vin.empty()) {
        return state.Invalid(ValidationError::MALFORMED_TRANSACTION, "bad-txns-vin-empty",
                             "transaction has no inputs");
    }
    if (tx.vout.empty()) {
        return state.Invalid(ValidationError::MALFORMED_TRANSACTION, "bad-txns-vout-empty",
                             "transaction has no outputs");
    }
    if (tx.GetTotalSize() > maxTxSize) {
        return state.Invalid(ValidationError::SIZE_EXCEEDED, "bad-txns-oversize",
                             std::to_string(tx.GetTotalSize()) + " bytes");
    }

    Amount totalOut = 0;
    for (const auto& txout : tx.vout) {
        if (txout.nValue < 0) {
            return state.Invalid(ValidationError::INSUFFICIENT_VALUE, "bad-txns-vout-negative",
                                 "output value negative");
        }
        if (txout.nValue > MAX_MONEY) {
            return state.Invalid(ValidationError::INSUFFICIENT_VALUE, "bad-txns-vout-toolarge",
                                 "output value too large");
        }
        totalOut += txout.nValue;
        if (!MoneyRange(totalOut)) {
            return state.Invalid(ValidationError::INSUFFICIENT_VALUE,
                                 "bad-txns-txouttotal-toolarge", "total output value too large");
        }
    }

    std::set<OutPoint> vInOutPoints;
    for (const auto& txin : tx.vin) {
        if (!vInOutPoints.insert(txin.prevout).second) {
            return state.Invalid(ValidationError::DOUBLE_SPEND, "bad-txns-inputs-duplicate",
                                 "duplicate input " + txin.prevout.ToString());
        }
    }

    if (tx.IsCoinBase()) {
        size_t cbSize = tx.vin[0].scriptSig.size();
        if (cbSize < 2 || cbSize > 100) {
            return state.Invalid(ValidationError::MALFORMED_COINBASE, "bad-cb-length",
                                 "coinbase script wrong size");
        }
    } else {
        for (const auto& txin : tx.vin) {
            if (txin.prevout.IsNull()) {
                return state.Invalid(ValidationError::MALFORMED_TRANSACTION,
                                     "bad-txns-prevout-null", "non-coinbase with null input");
            }
        }
    }

    return true;
}

bool IsFinalTx(const Transaction& tx, int32_t height, int64_t lockTimeCutoff) {
    if (tx.nLockTime == 0) {
        return true;
    }
    const int64_t limit = tx.nLockTime < LOCKTIME_THRESHOLD ? static_cast<int64_t>(height)
                                                            : lockTimeCutoff;
    if (static_cast<int64_t>(tx.nLockTime) < limit) {
        return true;
    }
    for (const auto& txin : tx.vin) {
        if (txin.nSequence != TxIn::SEQUENCE_FINAL) {
            return false;
        }
    }
    return true;
}

bool ValidateTransaction(const Transaction& tx, const CoinsView& view, const TxContext& ctx,
                         const SignatureVerifier& verifier, ValidationState& state,
                         Amount& fee) {
    if (tx.IsCoinBase()) {
        return state.Invalid(ValidationError::MALFORMED_COINBASE, "bad-cb-unexpected",
                             "coinbase outside the first block position");
    }

    std::vector<Coin> coins;
    coins.reserve(tx.vin.size());
    Amount valueIn = 0;
    for (const auto& txin : tx.vin) {
        if (ctx.spent && ctx.spent->Contains(txin.prevout)) {
            return state.Invalid(ValidationError::DOUBLE_SPEND, "bad-txns-inputs-spent",
                                 txin.prevout.ToString() + " already spent in this batch");
        }
        StorageError readError = StorageError::NONE;
        std::optional<Coin> coin = view.FetchCoin(txin.prevout, readError);
        if (readError != StorageError::NONE) {
            return state.StorageFailure(readError, "coin read failed for " + txin.prevout.ToString());
        }
        if (!coin) {
            return state.Invalid(ValidationError::MISSING_UTXO, "bad-txns-inputs-missing",
                                 txin.prevout.ToString());
        }
        if (!coin->IsMature(ctx.spendHeight, ctx.coinbaseMaturity)) {
            return state.Invalid(ValidationError::LOCKTIME_NOT_SATISFIED,
                                 "bad-txns-premature-spend-of-coinbase",
                                 "coinbase from height " + std::to_string(coin->nHeight));
        }
        valueIn += coin->GetAmount();
        if (!MoneyRange(coin->GetAmount()) || !MoneyRange(valueIn)) {
            return state.Invalid(ValidationError::INSUFFICIENT_VALUE,
                                 "bad-txns-inputvalues-outofrange");
        }
        coins.push_back(std::move(*coin));
    }

    const Amount valueOut = tx.GetValueOut();
    if (valueIn < valueOut) {
        return state.Invalid(ValidationError::INSUFFICIENT_VALUE, "bad-txns-in-belowout",
                             "in " + std::to_string(valueIn) + " < out " +
                                 std::to_string(valueOut));
    }

    if (!IsFinalTx(tx, ctx.spendHeight, ctx.lockTimeCutoff)) {
        return state.Invalid(ValidationError::LOCKTIME_NOT_SATISFIED, "bad-txns-nonfinal",
                             "nLockTime " + std::to_string(tx.nLockTime));
    }

    // Height-based relative locks; time-based ones carry the type flag and
    // are not enforced
    if (tx.version >= 2) {
        for (size_t i = 0; i < tx.vin.size(); ++i) {
            const uint32_t seq = tx.vin[i].nSequence;
            if ((seq & TxIn::SEQUENCE_LOCKTIME_DISABLE_FLAG) ||
                (seq & TxIn::SEQUENCE_LOCKTIME_TYPE_FLAG)) {
                continue;
            }
            const int32_t lock = static_cast<int32_t>(seq & TxIn::SEQUENCE_LOCKTIME_MASK);
            if (ctx.spendHeight - coins[i].nHeight < lock) {
                return state.Invalid(ValidationError::LOCKTIME_NOT_SATISFIED,
                                     "bad-txns-relative-locktime",
                                     "input " + std::to_string(i) + " needs " +
                                         std::to_string(lock) + " confirmations");
            }
        }
    }

    for (uint32_t i = 0; i < tx.vin.size(); ++i) {
        const Hash256 message = SignatureHash(tx, i, tx.vin[i].prevout);
        if (!verifier.Verify(coins[i].GetScriptPubKey(), tx.vin[i].scriptSig, message)) {
            return state.Invalid(ValidationError::SIGNATURE_INVALID, "bad-txns-signature",
                                 "input " + std::to_string(i) + " of " +
                                     tx.GetHash().ToHex());
        }
    }

    fee = valueIn - valueOut;
    return true;
}

// ============================================================================
// Block Header Validation
// ============================================================================

bool CheckProofOfWork(const BlockHash& hash, uint32_t nBits, const Params& params) {
    bool negative = false;
    bool overflow = false;
    ArithUint256 target;
    target.SetCompact(nBits, &negative, &overflow);

    ArithUint256 limit;
    limit.SetCompact(params.nPowLimitBits);

    if (negative || overflow || target.IsZero() || target > limit) {
        return false;
    }
    return UintToArith256(hash) <= target;
}

bool CheckBlockHeader(const BlockHeader& header, ValidationState& state, const Params& params) {
    if (header.nBits == 0) {
        return state.Invalid(ValidationError::INVALID_PROOF_OF_WORK, "bad-diffbits",
                             "difficulty bits not set");
    }
    if (!CheckProofOfWork(header.GetHash(), header.nBits, params)) {
        return state.Invalid(ValidationError::INVALID_PROOF_OF_WORK, "high-hash",
                             "proof of work failed");
    }
    return true;
}

bool ContextualCheckBlockHeader(const BlockHeader& header, const ParentContext& parent,
                                const Params& params, int64_t now, ValidationState& state) {
    if (header.nBits != parent.requiredBits) {
        return state.Invalid(ValidationError::INVALID_PROOF_OF_WORK, "bad-diffbits",
                             "incorrect proof of work target");
    }
    if (header.GetBlockTime() <= parent.medianTimePast) {
        return state.Invalid(ValidationError::INVALID_TIMESTAMP, "time-too-old",
                             "block's timestamp is too early");
    }
    if (header.GetBlockTime() > now + params.nMaxFutureBlockTime) {
        return state.Invalid(ValidationError::INVALID_TIMESTAMP, "time-too-new",
                             "block timestamp too far in the future");
    }
    return true;
}

// ============================================================================
// Block Validation
// ============================================================================

bool CheckBlock(const Block& block, ValidationState& state, const Params& params,
                bool checkPoW) {
    if (checkPoW && !CheckBlockHeader(block, state, params)) {
        return false;
    }

    if (block.vtx.empty()) {
        return state.Invalid(ValidationError::MALFORMED_COINBASE, "bad-blk-length",
                             "block has no transactions");
    }

    bool mutated = false;
    Hash256 computedMerkle = BlockMerkleRoot(block, &mutated);
    if (computedMerkle != block.hashMerkleRoot) {
        return state.Invalid(ValidationError::INVALID_MERKLE_ROOT, "bad-txnmrklroot",
                             "merkle root mismatch");
    }
    if (mutated) {
        return state.Invalid(ValidationError::INVALID_MERKLE_ROOT, "bad-txns-duplicate",
                             "duplicate transaction");
    }

    if (block.GetTotalSize() > params.nMaxBlockSize) {
        return state.Invalid(ValidationError::SIZE_EXCEEDED, "bad-blk-length",
                             "block too large");
    }

    if (!block.vtx[0]->IsCoinBase()) {
        return state.Invalid(ValidationError::MALFORMED_COINBASE, "bad-cb-missing",
                             "first transaction is not coinbase");
    }
    for (size_t i = 1; i < block.vtx.size(); ++i) {
        if (block.vtx[i]->IsCoinBase()) {
            return state.Invalid(ValidationError::MALFORMED_COINBASE, "bad-cb-multiple",
                                 "multiple coinbase transactions");
        }
    }

    for (const auto& tx : block.vtx) {
        if (!CheckTransaction(*tx, state, params.nMaxTxSize)) {
            return false;
        }
    }

    return true;
}

// ============================================================================
// Block Transactions
// ============================================================================

namespace {

/// Outcome for one transaction of a block
struct TxResult {
    bool evaluated{false};
    bool valid{false};
    Amount fee{0};
    ValidationState state;
};

/// Validate txs (block indices, ascending) against a private overlay,
/// stopping at the first failure
void ValidateGroup(const Block& block, const std::vector<size_t>& txs, int32_t height,
                   int64_t lockTimeCutoff, const CoinsView& view,
                   const SignatureVerifier& verifier, const Params& params,
                   std::vector<TxResult>& results) {
    CoinsViewOverlay overlay(view);
    TxContext ctx;
    ctx.spendHeight = height;
    ctx.lockTimeCutoff = lockTimeCutoff;
    ctx.coinbaseMaturity = params.nCoinbaseMaturity;
    ctx.spent = &overlay.Spent();

    for (size_t index : txs) {
        const Transaction& tx = *block.vtx[index];
        TxResult& result = results[index];
        result.evaluated = true;
        try {
            result.valid = ValidateTransaction(tx, overlay, ctx, verifier, result.state,
                                               result.fee);
        } catch (const std::exception& e) {
            result.valid = false;
            result.state.Error(std::string("validation threw: ") + e.what());
        }
        if (!result.valid) {
            return;
        }
        overlay.ApplyTransaction(tx, height);
    }
}

class DisjointSets {
public:
    explicit DisjointSets(size_t n) : parent_(n) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    size_t Find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    /// The smaller root wins so a group is named by its first transaction
    void Union(size_t a, size_t b) {
        a = Find(a);
        b = Find(b);
        if (a == b) return;
        if (b < a) std::swap(a, b);
        parent_[b] = a;
    }

private:
    std::vector<size_t> parent_;
};

/// Non-coinbase transactions grouped by intra-block dependency; each group
/// lists block indices in ascending order
std::vector<std::vector<size_t>> PartitionTransactions(const Block& block) {
    const size_t n = block.vtx.size();
    DisjointSets sets(n);

    std::unordered_map<TxHash, size_t, Hash256Hasher> txIndex;
    for (size_t i = 1; i < n; ++i) {
        txIndex.emplace(block.vtx[i]->GetHash(), i);
    }

    std::unordered_map<OutPoint, size_t, OutPointHasher> firstSpender;
    for (size_t i = 1; i < n; ++i) {
        for (const auto& txin : block.vtx[i]->vin) {
            auto producer = txIndex.find(txin.prevout.hash);
            if (producer != txIndex.end()) {
                sets.Union(i, producer->second);
            }
            auto spender = firstSpender.emplace(txin.prevout, i);
            if (!spender.second) {
                sets.Union(i, spender.first->second);
            }
        }
    }

    std::unordered_map<size_t, size_t> groupOf;
    std::vector<std::vector<size_t>> groups;
    for (size_t i = 1; i < n; ++i) {
        size_t root = sets.Find(i);
        auto it = groupOf.find(root);
        if (it == groupOf.end()) {
            it = groupOf.emplace(root, groups.size()).first;
            groups.emplace_back();
        }
        groups[it->second].push_back(i);
    }
    return groups;
}

} // namespace

bool ConnectBlockTransactions(const Block& block, int32_t height, int64_t lockTimeCutoff,
                              const CoinsView& view, const SignatureVerifier& verifier,
                              const Params& params, util::ThreadPool* pool,
                              size_t parallelThreshold, ValidationState& state, Amount& fees) {
    if (block.vtx.empty() || !block.vtx[0]->IsCoinBase()) {
        return state.Invalid(ValidationError::MALFORMED_COINBASE, "bad-cb-missing",
                             "first transaction is not coinbase");
    }

    const size_t n = block.vtx.size();
    std::vector<TxResult> results(n);

    if (pool && pool->IsRunning() && n > parallelThreshold && n > 2) {
        STRATA_LOG_TIMER(util::LogCategory::BENCH, "ConnectBlockTransactions(parallel)");
        std::vector<std::vector<size_t>> groups = PartitionTransactions(block);
        std::vector<std::future<void>> pending;
        pending.reserve(groups.size());
        for (const auto& group : groups) {
            try {
                pending.push_back(pool->Submit([&block, &group, height, lockTimeCutoff, &view,
                                                &verifier, &params, &results]() {
                    ValidateGroup(block, group, height, lockTimeCutoff, view, verifier, params,
                                  results);
                }));
            } catch (const std::runtime_error& e) {
                LOG_DEBUG(util::LogCategory::VALIDATION)
                    << "Pool refused group, validating inline: " << e.what();
                ValidateGroup(block, group, height, lockTimeCutoff, view, verifier, params,
                              results);
            }
        }
        for (auto& f : pending) {
            f.get();
        }
        LOG_DEBUG(util::LogCategory::VALIDATION) << "Validated " << (n - 1) << " txs in "
                                                 << groups.size() << " groups";
    } else {
        std::vector<size_t> all(n - 1);
        std::iota(all.begin(), all.end(), 1);
        ValidateGroup(block, all, height, lockTimeCutoff, view, verifier, params, results);
    }

    // Merge in block order
    fees = 0;
    for (size_t i = 1; i < n; ++i) {
        const TxResult& result = results[i];
        if (!result.evaluated) {
            return state.Error("transaction " + std::to_string(i) + " was not evaluated");
        }
        if (!result.valid) {
            state = result.state;
            return false;
        }
        fees += result.fee;
        if (!MoneyRange(fees)) {
            return state.Invalid(ValidationError::INSUFFICIENT_VALUE,
                                 "bad-txns-accumulated-fee-outofrange");
        }
    }

    const Amount subsidy = GetBlockSubsidy(height, params);
    const Amount coinbaseOut = block.vtx[0]->GetValueOut();
    if (coinbaseOut > subsidy + fees) {
        return state.Invalid(ValidationError::MALFORMED_COINBASE, "bad-cb-amount",
                             "coinbase pays " + std::to_string(coinbaseOut) + " > " +
                                 std::to_string(subsidy + fees));
    }
    return true;
}

} // namespace consensus
} // namespace strata
