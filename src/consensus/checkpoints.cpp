// STRATA - Block Checkpoints Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/consensus/checkpoints.h"
#include "strata/chain/blockindex.h"
#include "strata/util/logging.h"

#include <algorithm>
#include <stdexcept>

namespace strata {
namespace consensus {

// ============================================================================
// Checkpoint Implementation
// ============================================================================

Checkpoint::Checkpoint(int32_t h, const std::string& hashHex)
    : height(h), hash(BlockHash::FromHex(hashHex)) {}

const char* CheckpointResultToString(CheckpointResult result) {
    switch (result) {
        case CheckpointResult::VALID:
            return "VALID";
        case CheckpointResult::HASH_MISMATCH:
            return "HASH_MISMATCH";
        case CheckpointResult::INVALID_HEIGHT:
            return "INVALID_HEIGHT";
        default:
            return "UNKNOWN";
    }
}

// ============================================================================
// CheckpointManager Implementation
// ============================================================================

void CheckpointManager::LoadFromParams(const Params& params) {
    for (const auto& entry : params.checkpoints) {
        AddCheckpoint(entry.first, entry.second);
    }
    LOG_DEBUG(util::LogCategory::CHAIN) << "Loaded " << params.checkpoints.size()
                                        << " checkpoints for " << params.strNetworkID;
}

void CheckpointManager::AddCheckpoint(const Checkpoint& checkpoint) {
    checkpoints_[checkpoint.height] = checkpoint;
}

void CheckpointManager::AddCheckpoint(int32_t height, const BlockHash& hash) {
    AddCheckpoint(Checkpoint(height, hash));
}

bool CheckpointManager::RemoveCheckpoint(int32_t height) {
    return checkpoints_.erase(height) > 0;
}

void CheckpointManager::Clear() {
    checkpoints_.clear();
    rolling_.reset();
}

void CheckpointManager::UpdateForTip(const BlockIndex* tip) {
    if (rollingDepth_ <= 0 || !tip || tip->nHeight < rollingDepth_) {
        return;
    }
    const int32_t height = tip->nHeight - rollingDepth_;
    if (rolling_ && rolling_->height >= height) {
        return;
    }
    const BlockIndex* pinned = tip->GetAncestor(height);
    if (pinned) {
        rolling_ = Checkpoint(height, pinned->GetBlockHash());
    }
}

std::optional<Checkpoint> CheckpointManager::GetCheckpoint(int32_t height) const {
    auto it = checkpoints_.find(height);
    if (it == checkpoints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CheckpointManager::HasCheckpoint(int32_t height) const {
    return checkpoints_.count(height) > 0;
}

std::optional<Checkpoint> CheckpointManager::GetLastCheckpoint() const {
    if (checkpoints_.empty()) {
        return std::nullopt;
    }
    return checkpoints_.rbegin()->second;
}

CheckpointResult CheckpointManager::ValidateBlock(int32_t height,
                                                  const BlockHash& hash) const {
    if (height < 0) {
        return CheckpointResult::INVALID_HEIGHT;
    }

    auto it = checkpoints_.find(height);
    if (it != checkpoints_.end() && it->second.hash != hash) {
        LOG_WARN(util::LogCategory::VALIDATION)
            << "Checkpoint mismatch at height " << height
            << ": expected " << it->second.hash.ToHex()
            << ", got " << hash.ToHex();
        return CheckpointResult::HASH_MISMATCH;
    }
    if (rolling_ && rolling_->height == height && rolling_->hash != hash) {
        LOG_WARN(util::LogCategory::VALIDATION)
            << "Block " << hash.ToHex() << " conflicts with rolling checkpoint at height "
            << height;
        return CheckpointResult::HASH_MISMATCH;
    }
    return CheckpointResult::VALID;
}

CheckpointResult CheckpointManager::ValidateBlock(const BlockIndex* pindex) const {
    if (!pindex) {
        return CheckpointResult::INVALID_HEIGHT;
    }
    return ValidateBlock(pindex->nHeight, pindex->GetBlockHash());
}

bool CheckpointManager::CanReorgAtHeight(int32_t height) const {
    return height > GetReorgProtectionHeight();
}

int32_t CheckpointManager::GetReorgProtectionHeight() const {
    int32_t height = -1;
    if (!checkpoints_.empty()) {
        height = checkpoints_.rbegin()->first;
    }
    if (rolling_) {
        height = std::max(height, rolling_->height);
    }
    return height;
}

} // namespace consensus
} // namespace strata
