// STRATA - Block Store
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// Blocks and their index entries, kept in a key-value database:
//   'b' + block hash -> serialized block
//   'B' + block hash -> DiskBlockIndex
//   'H'              -> hash of the active chain tip

#ifndef STRATA_DB_BLOCKSTORE_H
#define STRATA_DB_BLOCKSTORE_H

#include "strata/chain/blockindex.h"
#include "strata/core/block.h"
#include "strata/db/database.h"
#include <functional>
#include <optional>

namespace strata {
namespace db {

class BlockStore {
public:
    /// db must outlive the store
    explicit BlockStore(Database& db) : db_(db) {}

    BlockStore(const BlockStore&) = delete;
    BlockStore& operator=(const BlockStore&) = delete;

    // ========================================================================
    // Block Data
    // ========================================================================

    Status WriteBlock(const Block& block);

    /// NotFound if absent, Corruption if the stored bytes do not decode
    Status ReadBlock(const BlockHash& hash, Block& block) const;

    bool HaveBlock(const BlockHash& hash) const;

    // ========================================================================
    // Block Index
    // ========================================================================

    Status WriteIndex(const BlockHash& hash, const DiskBlockIndex& entry);

    Status ReadIndex(const BlockHash& hash, DiskBlockIndex& entry) const;

    /**
     * Visit every stored index entry in key order.
     * @return Corruption on an undecodable entry, otherwise the iterator status
     */
    Status ForEachIndex(
        const std::function<void(const BlockHash&, const DiskBlockIndex&)>& func) const;

    // ========================================================================
    // Best Chain
    // ========================================================================

    Status WriteBestChain(const BlockHash& hash);

    std::optional<BlockHash> ReadBestChain() const;

    Status Flush() { return db_.Sync(); }

private:
    Database& db_;
};

} // namespace db
} // namespace strata

#endif // STRATA_DB_BLOCKSTORE_H
