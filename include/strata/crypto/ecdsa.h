// STRATA - ECDSA Signature Verifier
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// secp256k1 ECDSA through OpenSSL. A locking condition is a SEC1 encoded
// public key (33 byte compressed or 65 byte uncompressed) and an unlocking
// proof is a DER encoded signature over the 32 byte signature hash.

#ifndef STRATA_CRYPTO_ECDSA_H
#define STRATA_CRYPTO_ECDSA_H

#include "strata/consensus/validation.h"
#include "strata/core/types.h"

#include <cstddef>
#include <cstdint>

namespace strata {

constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;
constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;

/// Upper bound on a DER encoded secp256k1 signature
constexpr size_t MAX_DER_SIGNATURE_SIZE = 72;

/// Verify a DER signature over hash with a SEC1 public key
bool VerifyEcdsa(const uint8_t* pubkey, size_t pubkeyLen,
                 const uint8_t* signature, size_t signatureLen,
                 const Hash256& hash);

/// The node's signature capability
class EcdsaVerifier : public consensus::SignatureVerifier {
public:
    bool Verify(const Script& lockingCondition, const Script& unlockingProof,
                const Hash256& message) const override;
};

} // namespace strata

#endif // STRATA_CRYPTO_ECDSA_H
