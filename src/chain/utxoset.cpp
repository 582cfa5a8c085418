// STRATA - UTXO Set Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/chain/utxoset.h"
#include "strata/core/merkle.h"
#include "strata/crypto/sha256.h"
#include "strata/util/logging.h"
#include <algorithm>
#include <unordered_set>
#include <vector>

namespace strata {

std::string UtxoStatus::ToString() const {
    if (validation != ValidationError::NONE) {
        return strata::ToString(validation) + ": " + message;
    }
    if (chain != ChainError::NONE) {
        return strata::ToString(chain) + ": " + message;
    }
    if (storage != StorageError::NONE) {
        return strata::ToString(storage) + ": " + message;
    }
    return "ok";
}

UtxoSet::UtxoSet(db::CoinStore& store, size_t cacheCapacity)
    : store_(store), cacheCapacity_(std::max<size_t>(cacheCapacity, 1)) {
    BlockHash best;
    db::Status s = store_.GetBestBlock(best);
    if (s.ok()) {
        bestBlock_ = best;
        UndoRecord undo;
        db::Status undoStatus = store_.ReadUndo(best, undo);
        if (undoStatus.ok()) {
            bestHeight_ = undo.height;
        } else {
            LOG_ERROR(util::LogCategory::UTXO) << "Cannot read undo record of best block "
                                               << best.ToHex() << ": " << undoStatus.ToString();
        }
        LOG_INFO(util::LogCategory::UTXO) << "Coin set at block " << best.ToHex() << " height "
                                          << bestHeight_;
    } else if (!s.IsNotFound()) {
        LOG_ERROR(util::LogCategory::UTXO) << "Cannot read coin set best block: " << s.ToString();
    }
}

// ============================================================================
// Reads
// ============================================================================

std::optional<Coin> UtxoSet::ReadStore(const OutPoint& outpoint, StorageError& error) const {
    error = StorageError::NONE;
    Coin coin;
    db::Status s = store_.GetCoin(outpoint, coin);
    if (s.ok()) {
        return coin;
    }
    if (!s.IsNotFound()) {
        error = db::ToStorageError(s);
        LOG_ERROR(util::LogCategory::UTXO) << "Coin read failed for " << outpoint.ToString()
                                           << ": " << s.ToString();
    }
    return std::nullopt;
}

std::optional<Coin> UtxoSet::GetCoin(const OutPoint& outpoint) const {
    StorageError error;
    return FetchCoin(outpoint, error);
}

std::optional<Coin> UtxoSet::FetchCoin(const OutPoint& outpoint, StorageError& error) const {
    error = StorageError::NONE;
    uint64_t epoch;
    {
        std::shared_lock<std::shared_mutex> lock(cacheMutex_);
        auto it = cache_.find(outpoint);
        if (it != cache_.end()) {
            it->second.lastAccess.store(++clock_, std::memory_order_relaxed);
            return it->second.coin;
        }
        epoch = epoch_.load();
    }

    std::optional<Coin> coin = ReadStore(outpoint, error);
    if (coin) {
        std::unique_lock<std::shared_mutex> lock(cacheMutex_);
        if (epoch_.load() == epoch) {
            InsertCacheLocked(outpoint, *coin);
        }
    }
    return coin;
}

bool UtxoSet::HaveCoin(const OutPoint& outpoint) const {
    {
        std::shared_lock<std::shared_mutex> lock(cacheMutex_);
        if (cache_.count(outpoint) > 0) {
            return true;
        }
    }
    return store_.HaveCoin(outpoint);
}

// ============================================================================
// Cache
// ============================================================================

void UtxoSet::InsertCacheLocked(const OutPoint& outpoint, const Coin& coin) const {
    auto result = cache_.try_emplace(outpoint, coin, ++clock_);
    if (!result.second) {
        result.first->second.coin = coin;
        result.first->second.lastAccess.store(clock_.load(), std::memory_order_relaxed);
    }
    if (cache_.size() > cacheCapacity_) {
        EvictLocked();
    }
}

void UtxoSet::EvictLocked() const {
    // Drop roughly the least recently used eighth in one pass
    const size_t target = cacheCapacity_ - cacheCapacity_ / 8;
    if (cache_.size() <= target) {
        return;
    }
    const size_t toEvict = cache_.size() - target;

    std::vector<uint64_t> stamps;
    stamps.reserve(cache_.size());
    for (const auto& entry : cache_) {
        stamps.push_back(entry.second.lastAccess.load(std::memory_order_relaxed));
    }
    std::nth_element(stamps.begin(), stamps.begin() + (toEvict - 1), stamps.end());
    const uint64_t cutoff = stamps[toEvict - 1];

    size_t evicted = 0;
    for (auto it = cache_.begin(); it != cache_.end() && evicted < toEvict;) {
        if (it->second.lastAccess.load(std::memory_order_relaxed) <= cutoff) {
            it = cache_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
}

size_t UtxoSet::CacheSize() const {
    std::shared_lock<std::shared_mutex> lock(cacheMutex_);
    return cache_.size();
}

BlockHash UtxoSet::GetBestBlock() const {
    std::shared_lock<std::shared_mutex> lock(cacheMutex_);
    return bestBlock_;
}

int32_t UtxoSet::GetBestHeight() const {
    std::shared_lock<std::shared_mutex> lock(cacheMutex_);
    return bestHeight_;
}

// ============================================================================
// Apply / Undo
// ============================================================================

UtxoStatus UtxoSet::ApplyBlock(const Block& block, int32_t height, UndoRecord& undo) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    const BlockHash hash = block.GetHash();
    undo.Clear();
    undo.block = hash;
    undo.prev = GetBestBlock();
    undo.height = height;

    // Net effect of the block: a value is a coin to write, nullopt a delete
    std::unordered_map<OutPoint, std::optional<Coin>, OutPointHasher> changes;
    std::unordered_set<OutPoint, OutPointHasher> createdHere;

    for (const auto& tx : block.vtx) {
        if (!tx->IsCoinBase()) {
            for (const auto& input : tx->vin) {
                const OutPoint& prevout = input.prevout;
                auto it = changes.find(prevout);
                if (it != changes.end()) {
                    if (!it->second) {
                        return UtxoStatus::MissingUtxo(prevout);
                    }
                    if (createdHere.erase(prevout) == 0) {
                        undo.spent.emplace_back(prevout, *it->second);
                    }
                    it->second.reset();
                    continue;
                }
                StorageError readError;
                std::optional<Coin> coin = FetchCoin(prevout, readError);
                if (readError != StorageError::NONE) {
                    return UtxoStatus::Storage(readError, "coin read failed for " + prevout.ToString());
                }
                if (!coin) {
                    return UtxoStatus::MissingUtxo(prevout);
                }
                undo.spent.emplace_back(prevout, *coin);
                changes[prevout] = std::nullopt;
            }
        }

        const bool coinbase = tx->IsCoinBase();
        for (uint32_t i = 0; i < tx->vout.size(); ++i) {
            OutPoint outpoint(tx->GetHash(), i);
            changes[outpoint] = Coin(tx->vout[i], height, coinbase);
            createdHere.insert(outpoint);
        }
    }

    for (const auto& tx : block.vtx) {
        for (uint32_t i = 0; i < tx->vout.size(); ++i) {
            OutPoint outpoint(tx->GetHash(), i);
            if (createdHere.count(outpoint) > 0) {
                undo.created.push_back(outpoint);
            }
        }
    }

    db::WriteBatch batch;
    for (const auto& change : changes) {
        if (change.second) {
            db::CoinStore::PutCoin(batch, change.first, *change.second);
        } else {
            db::CoinStore::EraseCoin(batch, change.first);
        }
    }
    db::CoinStore::PutUndo(batch, undo);
    db::CoinStore::SetBestBlock(batch, hash);

    db::Status s = store_.Commit(batch);
    if (!s.ok()) {
        return UtxoStatus::Storage(s);
    }

    {
        std::unique_lock<std::shared_mutex> lock(cacheMutex_);
        ++epoch_;
        for (const auto& change : changes) {
            if (change.second) {
                InsertCacheLocked(change.first, *change.second);
            } else {
                cache_.erase(change.first);
            }
        }
        bestBlock_ = hash;
        bestHeight_ = height;
    }

    LOG_DEBUG(util::LogCategory::UTXO) << "Applied block " << hash.ToHex() << " at height "
                                       << height << ": spent " << undo.spent.size()
                                       << ", created " << undo.created.size();
    return UtxoStatus::Ok();
}

UtxoStatus UtxoSet::UndoBlock(const UndoRecord& undo) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    if (GetBestBlock() != undo.block) {
        return UtxoStatus::UndoCorruption("undo record for " + undo.block.ToHex() +
                                          " does not match coin set tip " +
                                          GetBestBlock().ToHex());
    }
    StorageError readError;
    for (const auto& outpoint : undo.created) {
        const bool present = FetchCoin(outpoint, readError).has_value();
        if (readError != StorageError::NONE) {
            return UtxoStatus::Storage(readError, "coin read failed for " + outpoint.ToString());
        }
        if (!present) {
            return UtxoStatus::UndoCorruption("created coin " + outpoint.ToString() + " is missing");
        }
    }
    for (const auto& spent : undo.spent) {
        const bool present = FetchCoin(spent.outpoint, readError).has_value();
        if (readError != StorageError::NONE) {
            return UtxoStatus::Storage(readError, "coin read failed for " + spent.outpoint.ToString());
        }
        if (present) {
            return UtxoStatus::UndoCorruption("spent coin " + spent.outpoint.ToString() +
                                              " is still present");
        }
    }

    db::WriteBatch batch;
    for (const auto& outpoint : undo.created) {
        db::CoinStore::EraseCoin(batch, outpoint);
    }
    for (const auto& spent : undo.spent) {
        db::CoinStore::PutCoin(batch, spent.outpoint, spent.coin);
    }
    db::CoinStore::EraseUndo(batch, undo.block);
    if (undo.prev.IsNull()) {
        db::CoinStore::EraseBestBlock(batch);
    } else {
        db::CoinStore::SetBestBlock(batch, undo.prev);
    }

    db::Status s = store_.Commit(batch);
    if (!s.ok()) {
        return UtxoStatus::Storage(s);
    }

    {
        std::unique_lock<std::shared_mutex> lock(cacheMutex_);
        ++epoch_;
        for (const auto& outpoint : undo.created) {
            cache_.erase(outpoint);
        }
        for (const auto& spent : undo.spent) {
            InsertCacheLocked(spent.outpoint, spent.coin);
        }
        bestBlock_ = undo.prev;
        bestHeight_ = undo.prev.IsNull() ? -1 : undo.height - 1;
    }

    LOG_DEBUG(util::LogCategory::UTXO) << "Undid block " << undo.block.ToHex()
                                       << ", restored " << undo.spent.size() << " coins";
    return UtxoStatus::Ok();
}

UtxoStatus UtxoSet::ReadUndo(const BlockHash& hash, UndoRecord& undo) const {
    db::Status s = store_.ReadUndo(hash, undo);
    if (!s.ok()) {
        return UtxoStatus::Storage(s);
    }
    return UtxoStatus::Ok();
}

// ============================================================================
// Commitment
// ============================================================================

std::optional<UtxoCommitment> UtxoSet::Commit() {
    STRATA_LOG_TIMER(util::LogCategory::BENCH, "UtxoSet::Commit");
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    UtxoCommitment commitment;
    commitment.height = GetBestHeight();
    commitment.block = GetBestBlock();
    std::vector<Hash256> leaves;

    db::Status s = store_.ForEachCoin([&](const OutPoint& outpoint, const Coin& coin) {
        DataStream ss;
        Serialize(ss, outpoint);
        Serialize(ss, coin);
        leaves.push_back(DoubleSHA256(ss.data(), ss.size()));
        commitment.totalValue += coin.GetAmount();
        return true;
    });
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::UTXO) << "Coin set scan failed: " << s.ToString();
        return std::nullopt;
    }

    commitment.count = leaves.size();
    commitment.root = ComputeMerkleRoot(std::move(leaves));

    {
        std::lock_guard<std::mutex> lock(commitmentMutex_);
        commitment_ = commitment;
    }
    LOG_INFO(util::LogCategory::UTXO) << "Coin set commitment at height " << commitment.height
                                      << ": " << commitment.count << " coins, root "
                                      << commitment.root.ToHex();
    return commitment;
}

std::optional<UtxoCommitment> UtxoSet::GetCommitment() const {
    std::lock_guard<std::mutex> lock(commitmentMutex_);
    return commitment_;
}

db::Status UtxoSet::Flush() {
    return store_.Sync();
}

} // namespace strata
