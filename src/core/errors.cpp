// STRATA - Error Kinds Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/core/errors.h"

namespace strata {

std::string ToString(ValidationError err) {
    switch (err) {
        case ValidationError::NONE: return "none";
        case ValidationError::INVALID_PROOF_OF_WORK: return "invalid-proof-of-work";
        case ValidationError::INVALID_MERKLE_ROOT: return "invalid-merkle-root";
        case ValidationError::INVALID_TIMESTAMP: return "invalid-timestamp";
        case ValidationError::MISSING_UTXO: return "missing-utxo";
        case ValidationError::DOUBLE_SPEND: return "double-spend";
        case ValidationError::INSUFFICIENT_VALUE: return "insufficient-value";
        case ValidationError::SIGNATURE_INVALID: return "signature-invalid";
        case ValidationError::LOCKTIME_NOT_SATISFIED: return "locktime-not-satisfied";
        case ValidationError::SIZE_EXCEEDED: return "size-exceeded";
        case ValidationError::MALFORMED_COINBASE: return "malformed-coinbase";
        case ValidationError::MALFORMED_TRANSACTION: return "malformed-transaction";
    }
    return "unknown";
}

std::string ToString(ChainError err) {
    switch (err) {
        case ChainError::NONE: return "none";
        case ChainError::UNKNOWN_ANCESTOR: return "unknown-ancestor";
        case ChainError::REORG_TOO_DEEP: return "reorg-too-deep";
        case ChainError::UNDO_CORRUPTION: return "undo-corruption";
    }
    return "unknown";
}

std::string ToString(MempoolError err) {
    switch (err) {
        case MempoolError::NONE: return "none";
        case MempoolError::FEE_TOO_LOW: return "fee-too-low";
        case MempoolError::CONFLICT: return "conflict";
        case MempoolError::REPLACEMENT_REJECTED: return "replacement-rejected";
        case MempoolError::FULL: return "mempool-full";
        case MempoolError::EXPIRED: return "expired";
    }
    return "unknown";
}

std::string ToString(StorageError err) {
    switch (err) {
        case StorageError::NONE: return "none";
        case StorageError::IO_FAILURE: return "io-failure";
        case StorageError::CORRUPTION: return "corruption";
        case StorageError::NOT_FOUND: return "not-found";
    }
    return "unknown";
}

} // namespace strata
