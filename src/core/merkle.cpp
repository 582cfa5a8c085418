// STRATA - Merkle Tree Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/core/merkle.h"
#include "strata/core/block.h"
#include "strata/crypto/sha256.h"
#include <cstring>

namespace strata {

Hash256 HashPair(const Hash256& left, const Hash256& right) {
    Byte combined[64];
    std::memcpy(combined, left.data(), 32);
    std::memcpy(combined + 32, right.data(), 32);
    return DoubleSHA256(combined, sizeof(combined));
}

Hash256 ComputeMerkleRoot(std::vector<Hash256> hashes, bool* mutated) {
    bool mutation = false;
    if (hashes.empty()) {
        if (mutated) *mutated = false;
        return Hash256();
    }

    while (hashes.size() > 1) {
        for (size_t pos = 0; pos + 1 < hashes.size(); pos += 2) {
            if (hashes[pos] == hashes[pos + 1]) {
                mutation = true;
            }
        }
        if (hashes.size() & 1) {
            hashes.push_back(hashes.back());
        }
        size_t half = hashes.size() / 2;
        for (size_t i = 0; i < half; ++i) {
            hashes[i] = HashPair(hashes[2 * i], hashes[2 * i + 1]);
        }
        hashes.resize(half);
    }

    if (mutated) *mutated = mutation;
    return hashes[0];
}

Hash256 BlockMerkleRoot(const Block& block, bool* mutated) {
    std::vector<Hash256> leaves;
    leaves.reserve(block.vtx.size());
    for (const auto& tx : block.vtx) {
        leaves.push_back(tx->GetHash());
    }
    return ComputeMerkleRoot(std::move(leaves), mutated);
}

} // namespace strata
