// STRATA - Orphan Block Pool
// Copyright (c) 2024 STRATA Developers
// MIT License

#ifndef STRATA_CHAIN_ORPHANS_H
#define STRATA_CHAIN_ORPHANS_H

#include "strata/core/block.h"
#include "strata/core/types.h"
#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

namespace strata {

/**
 * Blocks whose parent is not yet known, indexed by parent hash so they can
 * be connected as soon as the parent arrives. Bounded: the oldest orphan is
 * dropped when a new one would exceed the limit. Not thread-safe; owned by
 * the chain state manager.
 */
class OrphanPool {
public:
    static constexpr size_t DEFAULT_MAX_ORPHANS = 100;

    explicit OrphanPool(size_t maxOrphans = DEFAULT_MAX_ORPHANS)
        : maxOrphans_(maxOrphans) {}

    /// False if already held or the pool holds nothing (limit 0)
    bool Add(const Block& block);

    bool Contains(const BlockHash& hash) const { return orphans_.count(hash) > 0; }

    /// Remove and return every orphan whose parent is parentHash, oldest first
    std::vector<Block> TakeChildren(const BlockHash& parentHash);

    size_t Size() const { return orphans_.size(); }
    size_t MaxSize() const { return maxOrphans_; }
    void Clear();

private:
    struct Entry {
        Block block;
        uint64_t sequence;
    };

    void Erase(const BlockHash& hash);

    size_t maxOrphans_;
    uint64_t nextSequence_{0};
    std::unordered_map<BlockHash, Entry, Hash256Hasher> orphans_;
    std::unordered_multimap<BlockHash, BlockHash, Hash256Hasher> byParent_;
    std::map<uint64_t, BlockHash> byAge_;
};

} // namespace strata

#endif // STRATA_CHAIN_ORPHANS_H
