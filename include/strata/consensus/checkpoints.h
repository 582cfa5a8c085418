// STRATA - Block Checkpoints
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// Known-good block hashes at fixed heights. A reorganization may never
// disconnect a block at or below the highest checkpoint, and a block that
// contradicts a checkpoint is invalid.
//
// Checkpoints come from the consensus parameters, may be added at runtime,
// and one rolling checkpoint follows the tip at a fixed depth.

#ifndef STRATA_CONSENSUS_CHECKPOINTS_H
#define STRATA_CONSENSUS_CHECKPOINTS_H

#include "strata/consensus/params.h"
#include "strata/core/types.h"
#include <map>
#include <optional>
#include <string>

namespace strata {

class BlockIndex;

namespace consensus {

// ============================================================================
// Checkpoint Data Structure
// ============================================================================

struct Checkpoint {
    int32_t height{0};
    BlockHash hash;

    Checkpoint() = default;
    Checkpoint(int32_t h, const BlockHash& bh) : height(h), hash(bh) {}

    /// hashHex is display order; throws std::invalid_argument
    Checkpoint(int32_t h, const std::string& hashHex);

    bool Matches(int32_t blockHeight, const BlockHash& blockHash) const {
        return height == blockHeight && hash == blockHash;
    }
};

enum class CheckpointResult {
    /// Block matches the checkpoint, or there is none at its height
    VALID,
    /// A checkpoint pins a different hash at this height
    HASH_MISMATCH,
    INVALID_HEIGHT,
};

const char* CheckpointResultToString(CheckpointResult result);

// ============================================================================
// Checkpoint Manager
// ============================================================================

/**
 * Usage:
 *   CheckpointManager mgr;
 *   mgr.LoadFromParams(params);
 *   mgr.SetRollingDepth(1000);
 *
 *   if (mgr.ValidateBlock(height, hash) != CheckpointResult::VALID) {
 *       // reject
 *   }
 *
 * Not thread-safe.
 */
class CheckpointManager {
public:
    CheckpointManager() = default;

    // ========================================================================
    // Checkpoint Loading
    // ========================================================================

    void LoadFromParams(const Params& params);

    void AddCheckpoint(const Checkpoint& checkpoint);
    void AddCheckpoint(int32_t height, const BlockHash& hash);

    bool RemoveCheckpoint(int32_t height);

    /// Drop fixed checkpoints and the rolling one
    void Clear();

    // ========================================================================
    // Rolling Checkpoint
    // ========================================================================

    /// Pin the block this many blocks below the tip; 0 disables
    void SetRollingDepth(int32_t depth) { rollingDepth_ = depth; }
    int32_t GetRollingDepth() const { return rollingDepth_; }

    /// Move the rolling checkpoint after a tip change
    void UpdateForTip(const BlockIndex* tip);

    std::optional<Checkpoint> GetRollingCheckpoint() const { return rolling_; }

    // ========================================================================
    // Checkpoint Queries
    // ========================================================================

    std::optional<Checkpoint> GetCheckpoint(int32_t height) const;
    bool HasCheckpoint(int32_t height) const;

    /// Highest fixed checkpoint
    std::optional<Checkpoint> GetLastCheckpoint() const;

    const std::map<int32_t, Checkpoint>& GetCheckpoints() const { return checkpoints_; }
    size_t NumCheckpoints() const { return checkpoints_.size(); }

    // ========================================================================
    // Block Validation
    // ========================================================================

    CheckpointResult ValidateBlock(int32_t height, const BlockHash& hash) const;
    CheckpointResult ValidateBlock(const BlockIndex* pindex) const;

    /// False at or below the highest fixed or rolling checkpoint
    bool CanReorgAtHeight(int32_t height) const;

    /// Highest protected height, or -1 when nothing is pinned
    int32_t GetReorgProtectionHeight() const;

private:
    std::map<int32_t, Checkpoint> checkpoints_;
    std::optional<Checkpoint> rolling_;
    int32_t rollingDepth_{0};
};

} // namespace consensus
} // namespace strata

#endif // STRATA_CONSENSUS_CHECKPOINTS_H
