// STRATA - Transaction Header
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// This file defines the transaction primitives for STRATA.
// Locking conditions and unlocking proofs are opaque byte strings; their
// meaning belongs to the signature verifier, never to the core.

#ifndef STRATA_CORE_TRANSACTION_H
#define STRATA_CORE_TRANSACTION_H

#include "strata/core/types.h"
#include "strata/core/serialize.h"
#include <cstdint>
#include <vector>
#include <string>
#include <memory>
#include <limits>

namespace strata {

// ============================================================================
// Script - Opaque locking condition or unlocking proof
// ============================================================================

class Script : public std::vector<uint8_t> {
public:
    Script() = default;
    Script(std::initializer_list<uint8_t> bytes) : std::vector<uint8_t>(bytes) {}
    explicit Script(std::vector<uint8_t> bytes) : std::vector<uint8_t>(std::move(bytes)) {}
    Script(const uint8_t* begin, const uint8_t* end) : std::vector<uint8_t>(begin, end) {}
};

template<typename Stream>
void Serialize(Stream& s, const Script& script) {
    Serialize(s, static_cast<const std::vector<uint8_t>&>(script));
}

template<typename Stream>
void Unserialize(Stream& s, Script& script) {
    Unserialize(s, static_cast<std::vector<uint8_t>&>(script));
}

// ============================================================================
// OutPoint - Reference to a previous transaction output
// ============================================================================

/// An outpoint - a combination of a transaction hash and an index n into its vout
class OutPoint {
public:
    TxHash hash;
    uint32_t n;

    /// Index value representing a null outpoint
    static constexpr uint32_t NULL_INDEX = std::numeric_limits<uint32_t>::max();

    OutPoint() : hash(), n(NULL_INDEX) {}
    OutPoint(const TxHash& hashIn, uint32_t nIn) : hash(hashIn), n(nIn) {}

    void SetNull() {
        hash.SetNull();
        n = NULL_INDEX;
    }

    bool IsNull() const {
        return hash.IsNull() && n == NULL_INDEX;
    }

    friend bool operator<(const OutPoint& a, const OutPoint& b) {
        if (a.hash != b.hash) return a.hash < b.hash;
        return a.n < b.n;
    }

    friend bool operator==(const OutPoint& a, const OutPoint& b) {
        return a.hash == b.hash && a.n == b.n;
    }

    friend bool operator!=(const OutPoint& a, const OutPoint& b) {
        return !(a == b);
    }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const OutPoint& outpoint) {
    Serialize(s, outpoint.hash);
    Serialize(s, outpoint.n);
}

template<typename Stream>
void Unserialize(Stream& s, OutPoint& outpoint) {
    Unserialize(s, outpoint.hash);
    Unserialize(s, outpoint.n);
}

/// Hash function for OutPoint keys in unordered containers
struct OutPointHasher {
    size_t operator()(const OutPoint& outpoint) const noexcept {
        uint64_t h = outpoint.hash.GetCheapHash();
        h ^= (static_cast<uint64_t>(outpoint.n) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
        return static_cast<size_t>(h);
    }
};

// ============================================================================
// TxIn - Transaction Input
// ============================================================================

/// Spends a previous output. scriptSig carries the unlocking proof.
class TxIn {
public:
    OutPoint prevout;
    Script scriptSig;
    uint32_t nSequence;

    /// Setting nSequence to this value for every input disables nLockTime
    static const uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;

    /// If this flag is set, nSequence is NOT interpreted as a relative lock-time
    static const uint32_t SEQUENCE_LOCKTIME_DISABLE_FLAG = (1U << 31);

    /// Relative lock-time in units of 512 seconds instead of blocks
    static const uint32_t SEQUENCE_LOCKTIME_TYPE_FLAG = (1U << 22);

    /// Mask to extract the lock-time from the sequence field
    static const uint32_t SEQUENCE_LOCKTIME_MASK = 0x0000FFFF;

    TxIn() : nSequence(SEQUENCE_FINAL) {}

    explicit TxIn(const OutPoint& prevoutIn,
                  Script scriptSigIn = Script(),
                  uint32_t nSequenceIn = SEQUENCE_FINAL)
        : prevout(prevoutIn), scriptSig(std::move(scriptSigIn)), nSequence(nSequenceIn) {}

    friend bool operator==(const TxIn& a, const TxIn& b) {
        return a.prevout == b.prevout &&
               a.scriptSig == b.scriptSig &&
               a.nSequence == b.nSequence;
    }

    friend bool operator!=(const TxIn& a, const TxIn& b) {
        return !(a == b);
    }
};

template<typename Stream>
void Serialize(Stream& s, const TxIn& txin) {
    Serialize(s, txin.prevout);
    Serialize(s, txin.scriptSig);
    Serialize(s, txin.nSequence);
}

template<typename Stream>
void Unserialize(Stream& s, TxIn& txin) {
    Unserialize(s, txin.prevout);
    Unserialize(s, txin.scriptSig);
    Unserialize(s, txin.nSequence);
}

// ============================================================================
// TxOut - Transaction Output
// ============================================================================

/// Value plus the locking condition a spender must satisfy
class TxOut {
public:
    Amount nValue;
    Script scriptPubKey;

    TxOut() {
        SetNull();
    }

    TxOut(Amount nValueIn, Script scriptPubKeyIn)
        : nValue(nValueIn), scriptPubKey(std::move(scriptPubKeyIn)) {}

    void SetNull() {
        nValue = -1;
        scriptPubKey.clear();
    }

    bool IsNull() const {
        return nValue == -1;
    }

    friend bool operator==(const TxOut& a, const TxOut& b) {
        return a.nValue == b.nValue && a.scriptPubKey == b.scriptPubKey;
    }

    friend bool operator!=(const TxOut& a, const TxOut& b) {
        return !(a == b);
    }
};

template<typename Stream>
void Serialize(Stream& s, const TxOut& txout) {
    Serialize(s, static_cast<int64_t>(txout.nValue));
    Serialize(s, txout.scriptPubKey);
}

template<typename Stream>
void Unserialize(Stream& s, TxOut& txout) {
    int64_t value;
    Unserialize(s, value);
    txout.nValue = value;
    Unserialize(s, txout.scriptPubKey);
}

// ============================================================================
// MutableTransaction
// ============================================================================

class Transaction;

/// Builder form of a transaction
class MutableTransaction {
public:
    std::vector<TxIn> vin;
    std::vector<TxOut> vout;
    uint32_t version;
    uint32_t nLockTime;

    static const uint32_t CURRENT_VERSION = 2;

    MutableTransaction();
    explicit MutableTransaction(const Transaction& tx);

    /// Compute the txid of the current contents
    TxHash GetHash() const;
};

template<typename Stream>
void Serialize(Stream& s, const MutableTransaction& tx) {
    Serialize(s, tx.version);
    Serialize(s, tx.vin);
    Serialize(s, tx.vout);
    Serialize(s, tx.nLockTime);
}

template<typename Stream>
void Unserialize(Stream& s, MutableTransaction& tx) {
    Unserialize(s, tx.version);
    Unserialize(s, tx.vin);
    Unserialize(s, tx.vout);
    Unserialize(s, tx.nLockTime);
}

// ============================================================================
// Transaction - Immutable Transaction
// ============================================================================

/// Immutable transaction with its txid and serialized size computed once.
class Transaction {
public:
    static const uint32_t CURRENT_VERSION = 2;

    const std::vector<TxIn> vin;
    const std::vector<TxOut> vout;
    const uint32_t version;
    const uint32_t nLockTime;

private:
    const TxHash hash;
    const size_t totalSize;

    TxHash ComputeHash() const;

public:
    explicit Transaction(const MutableTransaction& tx);
    explicit Transaction(MutableTransaction&& tx);

    bool IsNull() const {
        return vin.empty() && vout.empty();
    }

    const TxHash& GetHash() const { return hash; }

    /// Sum of output values; throws std::runtime_error if out of MoneyRange
    Amount GetValueOut() const;

    /// Serialized size in bytes
    size_t GetTotalSize() const { return totalSize; }

    /// A coinbase has exactly one input with a null prevout
    bool IsCoinBase() const {
        return vin.size() == 1 && vin[0].prevout.IsNull();
    }

    friend bool operator==(const Transaction& a, const Transaction& b) {
        return a.GetHash() == b.GetHash();
    }

    friend bool operator!=(const Transaction& a, const Transaction& b) {
        return !(a == b);
    }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const Transaction& tx) {
    Serialize(s, tx.version);
    Serialize(s, tx.vin);
    Serialize(s, tx.vout);
    Serialize(s, tx.nLockTime);
}

// Transaction is immutable; deserialize into a MutableTransaction instead.

/// Shared pointer to an immutable transaction
using TransactionRef = std::shared_ptr<const Transaction>;

template<typename Tx>
inline TransactionRef MakeTransactionRef(Tx&& txIn) {
    return std::make_shared<const Transaction>(std::forward<Tx>(txIn));
}

/// Parse a serialized transaction; throws std::ios_base::failure on
/// truncated input or trailing bytes
TransactionRef DeserializeTransaction(const std::vector<uint8_t>& bytes);

} // namespace strata

#endif // STRATA_CORE_TRANSACTION_H
