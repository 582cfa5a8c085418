// STRATA - ECDSA Signature Verifier Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/crypto/ecdsa.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include <memory>

namespace strata {

namespace {

struct EcKeyDeleter {
    void operator()(EC_KEY* key) const { EC_KEY_free(key); }
};

struct EcPointDeleter {
    void operator()(EC_POINT* point) const { EC_POINT_free(point); }
};

bool IsValidPubkeyEncoding(const uint8_t* pubkey, size_t len) {
    if (len == COMPRESSED_PUBKEY_SIZE) {
        return pubkey[0] == 0x02 || pubkey[0] == 0x03;
    }
    if (len == UNCOMPRESSED_PUBKEY_SIZE) {
        return pubkey[0] == 0x04;
    }
    return false;
}

} // namespace

bool VerifyEcdsa(const uint8_t* pubkey, size_t pubkeyLen,
                 const uint8_t* signature, size_t signatureLen,
                 const Hash256& hash) {
    if (!IsValidPubkeyEncoding(pubkey, pubkeyLen)) {
        return false;
    }
    if (signatureLen == 0 || signatureLen > MAX_DER_SIGNATURE_SIZE) {
        return false;
    }

    std::unique_ptr<EC_KEY, EcKeyDeleter> key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!key) {
        return false;
    }

    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    std::unique_ptr<EC_POINT, EcPointDeleter> point(EC_POINT_new(group));
    if (!point) {
        return false;
    }

    // Rejects encodings that are not on the curve
    if (EC_POINT_oct2point(group, point.get(), pubkey, pubkeyLen, nullptr) != 1) {
        return false;
    }
    if (EC_KEY_set_public_key(key.get(), point.get()) != 1) {
        return false;
    }

    return ECDSA_verify(0, hash.data(), static_cast<int>(hash.size()),
                        signature, static_cast<int>(signatureLen), key.get()) == 1;
}

bool EcdsaVerifier::Verify(const Script& lockingCondition, const Script& unlockingProof,
                           const Hash256& message) const {
    if (lockingCondition.empty() || unlockingProof.empty()) {
        return false;
    }
    return VerifyEcdsa(lockingCondition.data(), lockingCondition.size(),
                       unlockingProof.data(), unlockingProof.size(), message);
}

} // namespace strata
