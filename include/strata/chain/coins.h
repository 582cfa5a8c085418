// STRATA - Coins (UTXO) Header
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// Unspent outputs and the read-only views validation consults.

#ifndef STRATA_CHAIN_COINS_H
#define STRATA_CHAIN_COINS_H

#include "strata/core/errors.h"
#include "strata/core/serialize.h"
#include "strata/core/transaction.h"
#include "strata/core/types.h"
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace strata {

// ============================================================================
// Coin - A single unspent transaction output
// ============================================================================

/**
 * An unspent output together with the height of the block that created it
 * and whether it came from a coinbase transaction.
 */
class Coin {
public:
    TxOut out;
    bool fCoinBase;
    int32_t nHeight;

    Coin() : fCoinBase(false), nHeight(0) {}

    Coin(const TxOut& outIn, int32_t heightIn, bool coinbaseIn)
        : out(outIn), fCoinBase(coinbaseIn), nHeight(heightIn) {}

    Coin(TxOut&& outIn, int32_t heightIn, bool coinbaseIn)
        : out(std::move(outIn)), fCoinBase(coinbaseIn), nHeight(heightIn) {}

    bool IsCoinBase() const { return fCoinBase; }
    Amount GetAmount() const { return out.nValue; }
    const Script& GetScriptPubKey() const { return out.scriptPubKey; }

    /// Coinbase outputs need `maturity` blocks on top before they can be spent
    bool IsMature(int32_t spendHeight, int32_t maturity) const {
        return !fCoinBase || spendHeight - nHeight >= maturity;
    }

    bool operator==(const Coin& other) const {
        return out == other.out &&
               fCoinBase == other.fCoinBase &&
               nHeight == other.nHeight;
    }

    bool operator!=(const Coin& other) const {
        return !(*this == other);
    }
};

// Height and coinbase flag share one CompactSize: (height << 1) | coinbase
template<typename Stream>
void Serialize(Stream& s, const Coin& coin) {
    uint64_t code = (static_cast<uint64_t>(static_cast<uint32_t>(coin.nHeight)) << 1) |
                    (coin.fCoinBase ? 1 : 0);
    WriteCompactSize(s, code);
    Serialize(s, coin.out);
}

template<typename Stream>
void Unserialize(Stream& s, Coin& coin) {
    uint64_t code = ReadCompactSize(s, false);
    coin.nHeight = static_cast<int32_t>(code >> 1);
    coin.fCoinBase = (code & 1) != 0;
    Unserialize(s, coin.out);
}

// ============================================================================
// CoinsView - Read-only UTXO lookup
// ============================================================================

class CoinsView {
public:
    virtual ~CoinsView() = default;

    /// The unspent output at outpoint, or nullopt if it does not exist
    virtual std::optional<Coin> GetCoin(const OutPoint& outpoint) const = 0;

    virtual bool HaveCoin(const OutPoint& outpoint) const {
        return GetCoin(outpoint).has_value();
    }

    /**
     * GetCoin that tells a failed backing read apart from an absent coin.
     * @param error Set to the store failure, or NONE
     */
    virtual std::optional<Coin> FetchCoin(const OutPoint& outpoint, StorageError& error) const {
        error = StorageError::NONE;
        return GetCoin(outpoint);
    }
};

// ============================================================================
// SpentTracker - Outpoints consumed within one validation batch
// ============================================================================

class SpentTracker {
public:
    bool Contains(const OutPoint& outpoint) const { return spent_.count(outpoint) > 0; }

    /// False if outpoint was already recorded
    bool Insert(const OutPoint& outpoint) { return spent_.insert(outpoint).second; }

    void Erase(const OutPoint& outpoint) { spent_.erase(outpoint); }
    size_t Size() const { return spent_.size(); }
    void Clear() { spent_.clear(); }

private:
    std::unordered_set<OutPoint, OutPointHasher> spent_;
};

// ============================================================================
// CoinsViewOverlay - Uncommitted changes layered over a base view
// ============================================================================

/**
 * Applies transactions in memory on top of a base view. Outputs created by
 * applied transactions become visible and their inputs disappear, without
 * touching the base. Not thread-safe.
 */
class CoinsViewOverlay : public CoinsView {
public:
    explicit CoinsViewOverlay(const CoinsView& base) : base_(base) {}

    std::optional<Coin> GetCoin(const OutPoint& outpoint) const override;
    std::optional<Coin> FetchCoin(const OutPoint& outpoint, StorageError& error) const override;

    /// Spend tx's inputs and add its outputs at height
    void ApplyTransaction(const Transaction& tx, int32_t height);

    const SpentTracker& Spent() const { return spent_; }

private:
    const CoinsView& base_;
    std::unordered_map<OutPoint, Coin, OutPointHasher> added_;
    SpentTracker spent_;
};

} // namespace strata

#endif // STRATA_CHAIN_COINS_H
