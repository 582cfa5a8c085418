// STRATA - Transaction Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/core/transaction.h"
#include "strata/crypto/sha256.h"
#include <sstream>

namespace strata {

const uint32_t TxIn::SEQUENCE_FINAL;
const uint32_t TxIn::SEQUENCE_LOCKTIME_DISABLE_FLAG;
const uint32_t TxIn::SEQUENCE_LOCKTIME_TYPE_FLAG;
const uint32_t TxIn::SEQUENCE_LOCKTIME_MASK;

const uint32_t MutableTransaction::CURRENT_VERSION;
const uint32_t Transaction::CURRENT_VERSION;

namespace {

template<typename Tx>
TxHash HashTransaction(const Tx& tx) {
    DataStream ss;
    Serialize(ss, tx);
    return TxHash(DoubleSHA256(ss.data(), ss.size()));
}

} // namespace

// ============================================================================
// OutPoint
// ============================================================================

std::string OutPoint::ToString() const {
    std::ostringstream ss;
    ss << hash.ToHex().substr(0, 16) << ":" << n;
    return ss.str();
}

// ============================================================================
// MutableTransaction
// ============================================================================

MutableTransaction::MutableTransaction()
    : version(CURRENT_VERSION), nLockTime(0) {}

MutableTransaction::MutableTransaction(const Transaction& tx)
    : vin(tx.vin), vout(tx.vout), version(tx.version), nLockTime(tx.nLockTime) {}

TxHash MutableTransaction::GetHash() const {
    return HashTransaction(*this);
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(const MutableTransaction& tx)
    : vin(tx.vin),
      vout(tx.vout),
      version(tx.version),
      nLockTime(tx.nLockTime),
      hash(ComputeHash()),
      totalSize(GetSerializeSize(*this)) {}

Transaction::Transaction(MutableTransaction&& tx)
    : vin(std::move(tx.vin)),
      vout(std::move(tx.vout)),
      version(tx.version),
      nLockTime(tx.nLockTime),
      hash(ComputeHash()),
      totalSize(GetSerializeSize(*this)) {}

TxHash Transaction::ComputeHash() const {
    return HashTransaction(*this);
}

Amount Transaction::GetValueOut() const {
    Amount total = 0;
    for (const auto& out : vout) {
        if (!MoneyRange(out.nValue)) {
            throw std::runtime_error("TxOut value out of range");
        }
        total += out.nValue;
        if (!MoneyRange(total)) {
            throw std::runtime_error("Total TxOut value out of range");
        }
    }
    return total;
}

std::string Transaction::ToString() const {
    std::ostringstream ss;
    ss << "Transaction(txid=" << hash.ToHex().substr(0, 16)
       << ", vin=" << vin.size()
       << ", vout=" << vout.size()
       << ", size=" << totalSize
       << ", locktime=" << nLockTime << ")";
    return ss.str();
}

TransactionRef DeserializeTransaction(const std::vector<uint8_t>& bytes) {
    DataStream ss(bytes);
    MutableTransaction mtx;
    Unserialize(ss, mtx);
    if (!ss.empty()) {
        throw std::ios_base::failure("trailing bytes after transaction");
    }
    return MakeTransactionRef(std::move(mtx));
}

} // namespace strata
