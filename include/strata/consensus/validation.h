// STRATA - Validation Header
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// This file defines validation functions for blocks and transactions.

#ifndef STRATA_CONSENSUS_VALIDATION_H
#define STRATA_CONSENSUS_VALIDATION_H

#include "strata/chain/coins.h"
#include "strata/consensus/params.h"
#include "strata/core/block.h"
#include "strata/core/errors.h"
#include "strata/core/transaction.h"
#include "strata/core/types.h"
#include <cstddef>
#include <string>

namespace strata {

namespace util {
class ThreadPool;
}

namespace consensus {

// ============================================================================
// Validation State
// ============================================================================

/// Result state from validation operations
class ValidationState {
public:
    enum class Mode {
        VALID,      ///< Everything ok
        INVALID,    ///< Consensus rule violation
        ERROR       ///< Runtime failure unrelated to the data (verifier threw, etc.)
    };

private:
    Mode mode_ = Mode::VALID;
    ValidationError error_ = ValidationError::NONE;
    StorageError storage_ = StorageError::NONE;
    std::string rejectReason_;
    std::string debugMessage_;

public:
    bool IsValid() const { return mode_ == Mode::VALID; }
    bool IsInvalid() const { return mode_ == Mode::INVALID; }
    bool IsError() const { return mode_ == Mode::ERROR; }

    /// Typed rule that failed; NONE unless IsInvalid()
    ValidationError GetError() const { return error_; }

    /// Store failure behind an ERROR state, or NONE
    StorageError GetStorageError() const { return storage_; }

    /// Short machine-readable code, e.g. "bad-txns-in-belowout"
    const std::string& GetRejectReason() const { return rejectReason_; }

    const std::string& GetDebugMessage() const { return debugMessage_; }

    /// Mark as invalid; always returns false
    bool Invalid(ValidationError error, const std::string& rejectReason,
                 const std::string& debugMessage = "") {
        mode_ = Mode::INVALID;
        error_ = error;
        rejectReason_ = rejectReason;
        debugMessage_ = debugMessage;
        return false;
    }

    /// Mark as error; always returns false
    bool Error(const std::string& message) {
        mode_ = Mode::ERROR;
        rejectReason_ = message;
        return false;
    }

    /// Mark as error caused by the coin store; always returns false
    bool StorageFailure(StorageError error, const std::string& message) {
        mode_ = Mode::ERROR;
        storage_ = error;
        rejectReason_ = message;
        return false;
    }

    std::string ToString() const;
};

// ============================================================================
// Signature Verification
// ============================================================================

/**
 * The single signature capability the core depends on. The scheme behind
 * it is opaque: locking conditions and proofs are plain bytes.
 * Implementations must be safe to call from several threads at once.
 */
class SignatureVerifier {
public:
    virtual ~SignatureVerifier() = default;

    virtual bool Verify(const Script& lockingCondition, const Script& unlockingProof,
                        const Hash256& message) const = 0;
};

/**
 * Message signed by input inputIndex: double SHA-256 over the transaction
 * with all unlocking proofs omitted, followed by the input index and the
 * outpoint it spends.
 */
Hash256 SignatureHash(const Transaction& tx, uint32_t inputIndex, const OutPoint& prevout);

// ============================================================================
// Transaction Validation
// ============================================================================

/// Below this nLockTime is a height, at or above a Unix time
constexpr uint32_t LOCKTIME_THRESHOLD = 500000000;

/// Where a transaction is being evaluated
struct TxContext {
    /// Height of the block that would include the transaction
    int32_t spendHeight{0};

    /// Time-based nLockTime must be below this (median time past)
    int64_t lockTimeCutoff{0};

    int coinbaseMaturity{100};

    /// Outpoints already consumed earlier in the same batch, if tracked
    const SpentTracker* spent{nullptr};
};

/**
 * Context-free transaction rules: non-empty inputs and outputs, size
 * limit, output values in range, no duplicate inputs, coinbase script of
 * 2..100 bytes, no null prevout outside a coinbase.
 */
bool CheckTransaction(const Transaction& tx, ValidationState& state,
                      size_t maxTxSize = 1000 * 1000);

/// nLockTime satisfied at height / cutoff, or every input final
bool IsFinalTx(const Transaction& tx, int32_t height, int64_t lockTimeCutoff);

/**
 * Validate a non-coinbase transaction's inputs against view.
 *
 * Checks in order: every prevout unconsumed in this batch (DOUBLE_SPEND)
 * and present (MISSING_UTXO), coinbase maturity, input sum covers output
 * sum (INSUFFICIENT_VALUE), absolute and height-based relative locks
 * (LOCKTIME_NOT_SATISFIED), then every proof (SIGNATURE_INVALID).
 *
 * @param fee Set to inputs minus outputs on success
 */
bool ValidateTransaction(const Transaction& tx, const CoinsView& view, const TxContext& ctx,
                         const SignatureVerifier& verifier, ValidationState& state,
                         Amount& fee);

// ============================================================================
// Block Validation
// ============================================================================

/// Proof of work: target from nBits is sane and within powLimit, hash <= target
bool CheckProofOfWork(const BlockHash& hash, uint32_t nBits, const Params& params);

/// Context-free header rules
bool CheckBlockHeader(const BlockHeader& header, ValidationState& state, const Params& params);

/**
 * Context-free block rules: header, merkle root (including duplicate
 * subtree mutation), size, exactly one coinbase in first position, and
 * CheckTransaction for every transaction.
 */
bool CheckBlock(const Block& block, ValidationState& state, const Params& params,
                bool checkPoW = true);

/// What a header is checked against: facts about its parent
struct ParentContext {
    int32_t height{0};

    /// Median time past of the parent and up to ten ancestors
    int64_t medianTimePast{0};

    /// Difficulty adjuster output for the child of this parent
    uint32_t requiredBits{0};
};

/**
 * nBits must equal parent.requiredBits; the timestamp must be above the
 * parent's median time past and at most nMaxFutureBlockTime past now.
 */
bool ContextualCheckBlockHeader(const BlockHeader& header, const ParentContext& parent,
                                const Params& params, int64_t now, ValidationState& state);

/**
 * Validate every transaction of block against view as if connected at
 * height. Each transaction sees the outputs of earlier ones in the block.
 * The coinbase may claim at most the subsidy plus all fees.
 *
 * With pool set and more than parallelThreshold transactions, the
 * transactions are split into groups joined by intra-block spends and
 * shared prevouts; each group is validated in block order by one pool
 * task. The reported failure and fee total match the sequential path.
 *
 * @param fees Set to the sum of all fees on success
 */
bool ConnectBlockTransactions(const Block& block, int32_t height, int64_t lockTimeCutoff,
                              const CoinsView& view, const SignatureVerifier& verifier,
                              const Params& params, util::ThreadPool* pool,
                              size_t parallelThreshold, ValidationState& state, Amount& fees);

} // namespace consensus
} // namespace strata

#endif // STRATA_CONSENSUS_VALIDATION_H
