// STRATA - Block Header
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// This file defines the block primitives for STRATA.

#ifndef STRATA_CORE_BLOCK_H
#define STRATA_CORE_BLOCK_H

#include "strata/core/types.h"
#include "strata/core/transaction.h"
#include "strata/core/serialize.h"
#include <cstdint>
#include <vector>
#include <string>
#include <memory>

namespace strata {

// ============================================================================
// BlockHeader - Block metadata for hashing and chain validation
// ============================================================================

/// Block header. The block hash is the double SHA-256 of the 80-byte
/// serialized header; transactions are committed through hashMerkleRoot.
class BlockHeader {
public:
    /// Block version
    int32_t nVersion;

    /// Hash of the previous block header
    BlockHash hashPrevBlock;

    /// Merkle root of all transactions in the block
    Hash256 hashMerkleRoot;

    /// Block creation time (Unix timestamp)
    uint32_t nTime;

    /// Difficulty target in compact format
    uint32_t nBits;

    /// Nonce used to satisfy proof-of-work
    uint32_t nNonce;

    BlockHeader() {
        SetNull();
    }

    void SetNull() {
        nVersion = 0;
        hashPrevBlock.SetNull();
        hashMerkleRoot.SetNull();
        nTime = 0;
        nBits = 0;
        nNonce = 0;
    }

    /// nBits == 0 indicates an uninitialized header
    bool IsNull() const {
        return nBits == 0;
    }

    BlockHash GetHash() const;

    int64_t GetBlockTime() const {
        return static_cast<int64_t>(nTime);
    }

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const BlockHeader& header) {
    Serialize(s, header.nVersion);
    Serialize(s, header.hashPrevBlock);
    Serialize(s, header.hashMerkleRoot);
    Serialize(s, header.nTime);
    Serialize(s, header.nBits);
    Serialize(s, header.nNonce);
}

template<typename Stream>
void Unserialize(Stream& s, BlockHeader& header) {
    Unserialize(s, header.nVersion);
    Unserialize(s, header.hashPrevBlock);
    Unserialize(s, header.hashMerkleRoot);
    Unserialize(s, header.nTime);
    Unserialize(s, header.nBits);
    Unserialize(s, header.nNonce);
}

// ============================================================================
// Block - Complete block with header and transactions
// ============================================================================

class Block : public BlockHeader {
public:
    /// Transactions in this block (first must be coinbase)
    std::vector<TransactionRef> vtx;

    Block() {
        SetNull();
    }

    explicit Block(const BlockHeader& header) : BlockHeader(header) {}

    void SetNull() {
        BlockHeader::SetNull();
        vtx.clear();
    }

    BlockHeader GetBlockHeader() const {
        return static_cast<const BlockHeader&>(*this);
    }

    /// Merkle root of vtx; sets *mutated when duplicate subtrees are found
    Hash256 ComputeMerkleRoot(bool* mutated = nullptr) const;

    /// Serialized size of the whole block
    size_t GetTotalSize() const;

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const Block& block) {
    Serialize(s, static_cast<const BlockHeader&>(block));
    WriteCompactSize(s, block.vtx.size());
    for (const auto& tx : block.vtx) {
        Serialize(s, *tx);
    }
}

template<typename Stream>
void Unserialize(Stream& s, Block& block) {
    Unserialize(s, static_cast<BlockHeader&>(block));
    uint64_t txCount = ReadCompactSize(s);
    block.vtx.clear();
    block.vtx.reserve(std::min<uint64_t>(txCount, 100000));
    for (uint64_t i = 0; i < txCount; ++i) {
        MutableTransaction mtx;
        Unserialize(s, mtx);
        block.vtx.push_back(MakeTransactionRef(std::move(mtx)));
    }
}

/// Parse a serialized block; throws std::ios_base::failure on malformed input
Block DeserializeBlock(const std::vector<uint8_t>& bytes);

/// Build the genesis block: a single coinbase paying genesisReward to an
/// empty locking condition. Its proof of work is never checked.
Block CreateGenesisBlock(uint32_t nTime, uint32_t nNonce, uint32_t nBits,
                         int32_t nVersion, Amount genesisReward);

} // namespace strata

#endif // STRATA_CORE_BLOCK_H
