// STRATA - Merkle Tree
// Copyright (c) 2024 STRATA Developers
// MIT License

#ifndef STRATA_CORE_MERKLE_H
#define STRATA_CORE_MERKLE_H

#include "strata/core/types.h"
#include <vector>

namespace strata {

class Block;

/// Double SHA-256 of left || right
Hash256 HashPair(const Hash256& left, const Hash256& right);

/**
 * Compute a Bitcoin-style merkle root. Odd levels duplicate their last
 * element. If mutated is non-null it is set when two identical adjacent
 * nodes are seen, which flags the CVE-2012-2459 malleation.
 * An empty leaf set yields the null hash.
 */
Hash256 ComputeMerkleRoot(std::vector<Hash256> hashes, bool* mutated = nullptr);

/// Merkle root over the txids of block.vtx
Hash256 BlockMerkleRoot(const Block& block, bool* mutated = nullptr);

} // namespace strata

#endif // STRATA_CORE_MERKLE_H
