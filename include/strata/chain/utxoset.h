// STRATA - UTXO Set
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// The authoritative set of spendable outputs: a bounded read cache over a
// CoinStore, with block-at-a-time apply and undo.

#ifndef STRATA_CHAIN_UTXOSET_H
#define STRATA_CHAIN_UTXOSET_H

#include "strata/chain/coins.h"
#include "strata/chain/undo.h"
#include "strata/core/block.h"
#include "strata/core/errors.h"
#include "strata/db/coinstore.h"
#include <atomic>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace strata {

// ============================================================================
// UtxoStatus
// ============================================================================

/// Outcome of a UTXO set mutation. At most one error field is set.
struct UtxoStatus {
    ValidationError validation{ValidationError::NONE};
    ChainError chain{ChainError::NONE};
    StorageError storage{StorageError::NONE};
    std::string message;

    bool ok() const {
        return validation == ValidationError::NONE &&
               chain == ChainError::NONE &&
               storage == StorageError::NONE;
    }

    bool IsFatal() const {
        return chain == ChainError::UNDO_CORRUPTION || storage == StorageError::CORRUPTION;
    }

    static UtxoStatus Ok() { return UtxoStatus(); }

    static UtxoStatus MissingUtxo(const OutPoint& outpoint) {
        UtxoStatus s;
        s.validation = ValidationError::MISSING_UTXO;
        s.message = "missing coin " + outpoint.ToString();
        return s;
    }

    static UtxoStatus UndoCorruption(std::string msg) {
        UtxoStatus s;
        s.chain = ChainError::UNDO_CORRUPTION;
        s.message = std::move(msg);
        return s;
    }

    static UtxoStatus Storage(const db::Status& status) {
        UtxoStatus s;
        s.storage = db::ToStorageError(status);
        s.message = status.ToString();
        return s;
    }

    static UtxoStatus Storage(StorageError error, std::string msg) {
        UtxoStatus s;
        s.storage = error;
        s.message = std::move(msg);
        return s;
    }

    std::string ToString() const;
};

// ============================================================================
// UtxoCommitment
// ============================================================================

/// Digest of the whole coin set as of one applied block
struct UtxoCommitment {
    Hash256 root;
    uint64_t count{0};
    Amount totalValue{0};
    int32_t height{-1};
    BlockHash block;
};

// ============================================================================
// UtxoSet
// ============================================================================

/**
 * Coin set backed by a CoinStore.
 *
 * Reads may come from any thread. The cache only ever holds coins that are
 * committed to the store, so evicting an entry never loses data. Mutations
 * are serialized by an internal write mutex and write the coin changes, the
 * undo record and the best-block marker in a single batch.
 */
class UtxoSet : public CoinsView {
public:
    static constexpr size_t DEFAULT_CACHE_CAPACITY = 450000;

    /// store must outlive the set
    UtxoSet(db::CoinStore& store, size_t cacheCapacity = DEFAULT_CACHE_CAPACITY);

    UtxoSet(const UtxoSet&) = delete;
    UtxoSet& operator=(const UtxoSet&) = delete;

    // ========================================================================
    // CoinsView
    // ========================================================================

    std::optional<Coin> GetCoin(const OutPoint& outpoint) const override;
    bool HaveCoin(const OutPoint& outpoint) const override;

    /// A coin record the store cannot read or decode sets error instead of
    /// reading as absent
    std::optional<Coin> FetchCoin(const OutPoint& outpoint, StorageError& error) const override;

    // ========================================================================
    // Mutation
    // ========================================================================

    /**
     * Spend every non-coinbase input of block and add every output.
     * An output created and spent inside the same block appears in neither
     * list of the undo record.
     *
     * @param undo Filled with what is needed to reverse the block
     * @return MISSING_UTXO (nothing applied) if an input is not spendable,
     *         a storage error if a coin read or the batch failed
     */
    UtxoStatus ApplyBlock(const Block& block, int32_t height, UndoRecord& undo);

    /**
     * Reverse a previously applied block. The set must currently be at
     * undo.block, every created outpoint must be present and every spent
     * outpoint absent; otherwise UNDO_CORRUPTION and nothing changes.
     */
    UtxoStatus UndoBlock(const UndoRecord& undo);

    /// NOT_FOUND, or CORRUPTION when the stored record fails its checksum
    UtxoStatus ReadUndo(const BlockHash& hash, UndoRecord& undo) const;

    // ========================================================================
    // Inspection
    // ========================================================================

    /**
     * Scan the store with writes held off and record the result as the
     * latest commitment. Height and block are those of the applied tip.
     * @return nullopt if a stored coin cannot be decoded
     */
    std::optional<UtxoCommitment> Commit();

    /// Result of the last successful Commit()
    std::optional<UtxoCommitment> GetCommitment() const;

    /// Null before the first block is applied
    BlockHash GetBestBlock() const;

    /// Height of GetBestBlock(), -1 before the first block
    int32_t GetBestHeight() const;

    size_t CacheSize() const;
    size_t CacheCapacity() const { return cacheCapacity_; }

    db::Status Flush();

private:
    struct CacheEntry {
        Coin coin;
        mutable std::atomic<uint64_t> lastAccess;

        CacheEntry(const Coin& c, uint64_t stamp) : coin(c), lastAccess(stamp) {}
    };

    using CacheMap = std::unordered_map<OutPoint, CacheEntry, OutPointHasher>;

    /// Store read without touching the cache
    std::optional<Coin> ReadStore(const OutPoint& outpoint, StorageError& error) const;

    /// Caller holds cacheMutex_ exclusively
    void InsertCacheLocked(const OutPoint& outpoint, const Coin& coin) const;
    void EvictLocked() const;

    db::CoinStore& store_;
    const size_t cacheCapacity_;

    mutable std::shared_mutex cacheMutex_;
    mutable CacheMap cache_;
    mutable std::atomic<uint64_t> clock_{0};

    /// Bumped whenever committed coins change, so a reader that raced a
    /// write does not cache what it read before the write
    std::atomic<uint64_t> epoch_{0};

    std::mutex writeMutex_;
    BlockHash bestBlock_;
    int32_t bestHeight_{-1};

    mutable std::mutex commitmentMutex_;
    std::optional<UtxoCommitment> commitment_;
};

} // namespace strata

#endif // STRATA_CHAIN_UTXOSET_H
