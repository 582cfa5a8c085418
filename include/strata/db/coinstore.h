// STRATA - Coin Store
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// Persistent layout of the UTXO set inside a key-value database:
//   'C' + outpoint   -> coin
//   'u' + block hash -> undo record || SHA-256(undo record)
//   'c'              -> hash of the block the coin set reflects

#ifndef STRATA_DB_COINSTORE_H
#define STRATA_DB_COINSTORE_H

#include "strata/chain/coins.h"
#include "strata/chain/undo.h"
#include "strata/db/database.h"
#include <functional>

namespace strata {
namespace db {

class CoinStore {
public:
    /// db must outlive the store
    explicit CoinStore(Database& db) : db_(db) {}

    CoinStore(const CoinStore&) = delete;
    CoinStore& operator=(const CoinStore&) = delete;

    // ========================================================================
    // Reads
    // ========================================================================

    /// NotFound if the outpoint is unspent-absent, Corruption if undecodable
    Status GetCoin(const OutPoint& outpoint, Coin& coin) const;

    bool HaveCoin(const OutPoint& outpoint) const;

    /// NotFound before the first block is connected
    Status GetBestBlock(BlockHash& hash) const;

    /// Corruption if the record fails its checksum or does not decode
    Status ReadUndo(const BlockHash& hash, UndoRecord& undo) const;

    bool HaveUndo(const BlockHash& hash) const;

    /**
     * Visit every coin in key order. Stops early when func returns false.
     * @return Corruption if a stored coin cannot be decoded
     */
    Status ForEachCoin(const std::function<bool(const OutPoint&, const Coin&)>& func) const;

    // ========================================================================
    // Batched Writes
    // ========================================================================

    static void PutCoin(WriteBatch& batch, const OutPoint& outpoint, const Coin& coin);
    static void EraseCoin(WriteBatch& batch, const OutPoint& outpoint);
    static void PutUndo(WriteBatch& batch, const UndoRecord& undo);
    static void EraseUndo(WriteBatch& batch, const BlockHash& hash);
    static void SetBestBlock(WriteBatch& batch, const BlockHash& hash);
    static void EraseBestBlock(WriteBatch& batch);

    /// Apply a batch atomically
    Status Commit(WriteBatch& batch, bool sync = false);

    Status Sync() { return db_.Sync(); }

    Database& GetDatabase() { return db_; }

    static std::string CoinKey(const OutPoint& outpoint) {
        return MakeKey(prefix::COIN, outpoint);
    }
    static std::string UndoKey(const BlockHash& hash) {
        return MakeKey(prefix::UNDO, hash);
    }

private:
    Database& db_;
};

} // namespace db
} // namespace strata

#endif // STRATA_DB_COINSTORE_H
