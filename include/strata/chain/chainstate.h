// STRATA - Chain State Header
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// This file defines the chain state manager: the single writer that owns
// the block tree, the active chain and the UTXO set, and moves the tip by
// extending it or by reorganizing onto a branch with more work.

#ifndef STRATA_CHAIN_CHAINSTATE_H
#define STRATA_CHAIN_CHAINSTATE_H

#include "strata/chain/blockindex.h"
#include "strata/chain/events.h"
#include "strata/chain/orphans.h"
#include "strata/chain/utxoset.h"
#include "strata/consensus/checkpoints.h"
#include "strata/consensus/difficulty.h"
#include "strata/consensus/params.h"
#include "strata/consensus/validation.h"
#include "strata/core/block.h"
#include "strata/core/errors.h"
#include "strata/db/blockstore.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace strata {

namespace util {
class ThreadPool;
}

// ============================================================================
// Configuration
// ============================================================================

struct ChainConfig {
    /// Blocks with an unknown parent held at most
    size_t maxOrphans{OrphanPool::DEFAULT_MAX_ORPHANS};

    /// Depth of the rolling checkpoint behind the tip; 0 disables it
    int32_t checkpointInterval{1000};

    /// Blocks with more transactions than this validate on the pool
    size_t parallelThreshold{64};

    /// Coin set commitment is recomputed every this many blocks; 0 disables it
    int32_t commitmentInterval{1000};

    /// Seconds since the epoch; defaults to the system clock
    std::function<int64_t()> clock;
};

// ============================================================================
// ChainResult
// ============================================================================

/**
 * Outcome of submitting a block. A block is accepted when it is stored in
 * the block tree, whether or not it became (part of) the active chain.
 */
struct ChainResult {
    bool accepted{false};

    /// Block was already known (or already held as an orphan)
    bool duplicate{false};

    /// The active tip moved
    bool tipChanged{false};

    ValidationError validation{ValidationError::NONE};
    ChainError chain{ChainError::NONE};
    StorageError storage{StorageError::NONE};

    /// Reject reason or status message
    std::string message;

    BlockHash hash;
    int32_t height{-1};

    /// Non-coinbase transactions of blocks that left the active chain, in
    /// chain order from the fork point up
    std::vector<TransactionRef> disconnectedTxs;

    bool IsSuccess() const { return accepted; }

    static ChainResult Accepted(const BlockHash& hash, int32_t height, bool tipChanged) {
        ChainResult r;
        r.accepted = true;
        r.tipChanged = tipChanged;
        r.hash = hash;
        r.height = height;
        return r;
    }

    static ChainResult Duplicate(const BlockHash& hash) {
        ChainResult r;
        r.accepted = true;
        r.duplicate = true;
        r.hash = hash;
        r.message = "duplicate";
        return r;
    }

    static ChainResult Invalid(const BlockHash& hash, const consensus::ValidationState& state) {
        ChainResult r;
        r.hash = hash;
        r.validation = state.GetError();
        r.message = state.GetRejectReason();
        return r;
    }

    static ChainResult Rejected(const BlockHash& hash, ChainError error, std::string message) {
        ChainResult r;
        r.hash = hash;
        r.chain = error;
        r.message = std::move(message);
        return r;
    }

    static ChainResult Storage(const BlockHash& hash, StorageError error, std::string message) {
        ChainResult r;
        r.hash = hash;
        r.storage = error;
        r.message = std::move(message);
        return r;
    }

    std::string ToString() const;
};

// ============================================================================
// ChainSnapshot
// ============================================================================

/// Immutable view of the active tip, replaced on every tip change
struct ChainSnapshot {
    int32_t height{-1};
    BlockHash tip;
    ArithUint256 chainWork;
    uint64_t generation{0};
    /// Median time past of the tip
    int64_t medianTimePast{0};
};

// ============================================================================
// ChainStateManager
// ============================================================================

/**
 * Owns the block tree and the active chain.
 *
 * All mutations run under one reentrant lock: a block is checked, stored,
 * and either connected on top of the tip or, when its branch carries
 * strictly more work, activated by a reorganization. A failed
 * reorganization restores the previous chain. Readers use GetSnapshot(),
 * which never blocks.
 *
 * Undo data that does not match the coin set, or a corrupt store, halts
 * the manager; every later block is refused with UNDO_CORRUPTION.
 *
 * Events are delivered after the lock is released.
 */
class ChainStateManager {
public:
    /// utxo, blocks, verifier and pool must outlive the manager; pool may be null
    ChainStateManager(const consensus::Params& params,
                      UtxoSet& utxo,
                      db::BlockStore& blocks,
                      const consensus::SignatureVerifier& verifier,
                      util::ThreadPool* pool = nullptr,
                      ChainConfig config = ChainConfig());

    ~ChainStateManager() = default;

    ChainStateManager(const ChainStateManager&) = delete;
    ChainStateManager& operator=(const ChainStateManager&) = delete;

    // ========================================================================
    // Initialization
    // ========================================================================

    /// Connect genesis as the first block; fails if a chain already exists
    ChainResult Initialize(const Block& genesis);

    /**
     * Rebuild the block tree and active chain from the block store.
     * @return false if the store is empty or disagrees with the coin set
     */
    bool LoadFromStore();

    // ========================================================================
    // Block Processing
    // ========================================================================

    ChainResult ProcessBlock(const Block& block);

    /// Decode then ProcessBlock; undecodable bytes are MALFORMED_TRANSACTION
    ChainResult ProcessBlockBytes(const std::vector<uint8_t>& bytes);

    // ========================================================================
    // Queries
    // ========================================================================

    std::shared_ptr<const ChainSnapshot> GetSnapshot() const;

    int32_t GetHeight() const { return GetSnapshot()->height; }
    BlockHash GetTip() const { return GetSnapshot()->tip; }
    uint64_t GetGeneration() const { return GetSnapshot()->generation; }

    bool IsHalted() const { return m_halted.load(); }

    /// Index entries are never freed while the manager lives
    const BlockIndex* GetBlockIndex(const BlockHash& hash) const;

    /// Active chain block at height, or null
    const BlockIndex* GetActiveIndex(int32_t height) const;

    bool IsInActiveChain(const BlockHash& hash) const;

    /// Stored block data
    bool ReadBlock(const BlockHash& hash, Block& block) const;

    /// Timestamps of index and its ancestors, oldest first
    std::vector<int64_t> GetAncestorTimestamps(const BlockIndex* index, size_t count) const;

    /// nBits a child of parent must carry
    uint32_t NextWorkRequired(const BlockIndex* parent) const;

    size_t OrphanCount() const;
    size_t BlockIndexSize() const;

    const consensus::Params& GetParams() const { return m_params; }
    const consensus::CheckpointManager& GetCheckpoints() const { return m_checkpoints; }

    /// Add a fixed checkpoint at runtime
    void AddCheckpoint(int32_t height, const BlockHash& hash);

    ChainEvents& Events() { return m_events; }

private:
    /// Event queued under the lock and fired after it is released
    struct PendingEvent {
        enum class Kind { CONNECTED, DISCONNECTED };
        Kind kind;
        Block block;
        BlockHash hash;
        int32_t height;
    };

    /// Outcome of connecting or disconnecting one block
    struct StepResult {
        bool ok{true};
        bool fatal{false};
        consensus::ValidationState state;
        ChainResult failure;
    };

    ChainResult ProcessBlockLocked(const Block& block, uint64_t startGeneration,
                                   std::vector<PendingEvent>& events);

    /// Feed children of hash back through ProcessBlockLocked
    void ProcessOrphans(const BlockHash& hash, std::vector<PendingEvent>& events);

    BlockIndex* LookupBlockIndex(const BlockHash& hash) const;

    /// Create and persist the index entry for a checked block
    BlockIndex* AddToBlockIndex(const Block& block, BlockIndex* parent, db::Status& status);

    StepResult ConnectTip(BlockIndex* pindex, const Block& block,
                          std::vector<PendingEvent>& events);
    StepResult DisconnectTip(std::vector<PendingEvent>& events,
                             std::vector<TransactionRef>& disconnectedTxs);

    /// Make candidate the tip, moving through fork
    ChainResult Reorganize(BlockIndex* candidate, const Block& candidateBlock,
                           const BlockIndex* fork, std::vector<PendingEvent>& events);

    /// Mark pindex failed and every known descendant as FAILED_CHILD
    void InvalidateBlock(BlockIndex* pindex);

    void PersistIndex(const BlockIndex* pindex);
    void UpdateTip(BlockIndex* pindex);
    void PublishSnapshot();
    ChainResult Halt(const BlockHash& hash, const std::string& reason);
    void FireEvents(const std::vector<PendingEvent>& events);

    /// Refresh the coin set commitment when the tip reached an interval boundary
    void UpdateCommitment(int32_t heightBefore, int32_t heightAfter);
    int64_t Now() const;

    const consensus::Params& m_params;
    UtxoSet& m_utxo;
    db::BlockStore& m_blocks;
    const consensus::SignatureVerifier& m_verifier;
    util::ThreadPool* m_pool;
    ChainConfig m_config;

    /// Serializes every mutation
    mutable std::recursive_mutex m_cs;

    BlockMap m_blockIndex;
    Chain m_chain;
    OrphanPool m_orphans;
    consensus::CheckpointManager m_checkpoints;
    consensus::DifficultyAdjuster m_difficulty;
    /// Block whose timestamp is last in m_difficulty's window
    const BlockIndex* m_windowTip{nullptr};
    uint64_t m_nextSequenceId{1};
    uint64_t m_generation{0};

    std::atomic<bool> m_halted{false};
    std::shared_ptr<const ChainSnapshot> m_snapshot;

    ChainEvents m_events;
};

} // namespace strata

#endif // STRATA_CHAIN_CHAINSTATE_H
