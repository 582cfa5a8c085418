// STRATA - Error Kinds
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// Typed failure codes shared by validation, chain state, mempool and
// storage. Each module reports failures through result objects carrying
// one of these codes; NONE marks a success.

#ifndef STRATA_CORE_ERRORS_H
#define STRATA_CORE_ERRORS_H

#include <string>

namespace strata {

/// Consensus rule violations of a block or transaction
enum class ValidationError {
    NONE,
    INVALID_PROOF_OF_WORK,
    INVALID_MERKLE_ROOT,
    INVALID_TIMESTAMP,
    MISSING_UTXO,
    DOUBLE_SPEND,
    INSUFFICIENT_VALUE,
    SIGNATURE_INVALID,
    LOCKTIME_NOT_SATISFIED,
    SIZE_EXCEEDED,
    MALFORMED_COINBASE,
    MALFORMED_TRANSACTION,  ///< Shape rules: empty vin/vout, null prevout, undecodable bytes
};

/// Failures of chain state transitions
enum class ChainError {
    NONE,
    UNKNOWN_ANCESTOR,   ///< Parent not known; block held as orphan
    REORG_TOO_DEEP,     ///< Reorganization would cross a checkpoint
    UNDO_CORRUPTION,    ///< Undo data inconsistent with the UTXO set (fatal)
};

/// Mempool admission failures
enum class MempoolError {
    NONE,
    FEE_TOO_LOW,
    CONFLICT,
    REPLACEMENT_REJECTED,
    FULL,
    EXPIRED,
};

/// Key-value store failures
enum class StorageError {
    NONE,
    IO_FAILURE,
    CORRUPTION,
    NOT_FOUND,
};

std::string ToString(ValidationError err);
std::string ToString(ChainError err);
std::string ToString(MempoolError err);
std::string ToString(StorageError err);

} // namespace strata

#endif // STRATA_CORE_ERRORS_H
