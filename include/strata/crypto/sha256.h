// STRATA - SHA256 Hash Function
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// SHA-256 backed by the OpenSSL EVP digest interface.

#ifndef STRATA_CRYPTO_SHA256_H
#define STRATA_CRYPTO_SHA256_H

#include "strata/core/types.h"

#include <cstdint>
#include <cstddef>
#include <vector>

// Forward declaration to keep OpenSSL headers out of the public interface
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace strata {

/// Incremental SHA-256 hasher
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Feed bytes into the digest
    SHA256& Write(const Byte* data, size_t len);

    /// Write the digest to hash and leave the hasher reset
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Discard any written data
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Single SHA-256
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// SHA256(SHA256(data)), used for txids, block hashes and merkle nodes
Hash256 DoubleSHA256(const Byte* data, size_t len);

inline Hash256 DoubleSHA256(const std::vector<Byte>& data) {
    return DoubleSHA256(data.data(), data.size());
}

} // namespace strata

#endif // STRATA_CRYPTO_SHA256_H
