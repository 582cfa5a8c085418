// STRATA - Orphan Block Pool Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/chain/orphans.h"
#include "strata/util/logging.h"
#include <algorithm>

namespace strata {

bool OrphanPool::Add(const Block& block) {
    if (maxOrphans_ == 0) {
        return false;
    }
    const BlockHash hash = block.GetHash();
    if (Contains(hash)) {
        return false;
    }

    while (orphans_.size() >= maxOrphans_ && !byAge_.empty()) {
        const BlockHash oldest = byAge_.begin()->second;
        LOG_DEBUG(util::LogCategory::CHAIN) << "Orphan pool full, dropping " << oldest.ToHex();
        Erase(oldest);
    }

    const uint64_t sequence = nextSequence_++;
    orphans_.emplace(hash, Entry{block, sequence});
    byParent_.emplace(block.hashPrevBlock, hash);
    byAge_.emplace(sequence, hash);
    return true;
}

std::vector<Block> OrphanPool::TakeChildren(const BlockHash& parentHash) {
    std::vector<std::pair<uint64_t, BlockHash>> children;
    auto range = byParent_.equal_range(parentHash);
    for (auto it = range.first; it != range.second; ++it) {
        auto entry = orphans_.find(it->second);
        if (entry != orphans_.end()) {
            children.emplace_back(entry->second.sequence, it->second);
        }
    }
    std::sort(children.begin(), children.end());

    std::vector<Block> blocks;
    blocks.reserve(children.size());
    for (const auto& child : children) {
        blocks.push_back(orphans_.at(child.second).block);
        Erase(child.second);
    }
    return blocks;
}

void OrphanPool::Clear() {
    orphans_.clear();
    byParent_.clear();
    byAge_.clear();
}

void OrphanPool::Erase(const BlockHash& hash) {
    auto it = orphans_.find(hash);
    if (it == orphans_.end()) {
        return;
    }
    auto range = byParent_.equal_range(it->second.block.hashPrevBlock);
    for (auto p = range.first; p != range.second; ++p) {
        if (p->second == hash) {
            byParent_.erase(p);
            break;
        }
    }
    byAge_.erase(it->second.sequence);
    orphans_.erase(it);
}

} // namespace strata
