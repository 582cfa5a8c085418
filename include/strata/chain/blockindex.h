// STRATA - Block Index Header
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// This file defines the block index and the active chain structures used
// for fork choice.

#ifndef STRATA_CHAIN_BLOCKINDEX_H
#define STRATA_CHAIN_BLOCKINDEX_H

#include "strata/core/arith.h"
#include "strata/core/block.h"
#include "strata/core/serialize.h"
#include "strata/core/types.h"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

// ============================================================================
// Block Status Flags
// ============================================================================

/**
 * Block validation status flags.
 * The low bits record how far validation has progressed; the upper bits
 * record data availability and failure.
 */
enum class BlockStatus : uint32_t {
    UNKNOWN = 0,

    VALID_HEADER = 1,       // PoW and context-free header rules
    VALID_TREE = 2,         // Parent known, difficulty and timestamp ok
    VALID_TRANSACTIONS = 3, // Merkle root, size and coinbase shape ok
    VALID_CHAIN = 4,        // Connected: spends, values and proofs ok

    VALID_MASK = 0x07,

    HAVE_DATA = 0x08,       // Full block stored
    HAVE_UNDO = 0x10,       // Undo record stored

    FAILED_VALID = 0x20,    // Block itself failed validation
    FAILED_CHILD = 0x40,    // Descends from a failed block
    FAILED_MASK = 0x60,
};

inline BlockStatus operator|(BlockStatus a, BlockStatus b) {
    return static_cast<BlockStatus>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline BlockStatus operator&(BlockStatus a, BlockStatus b) {
    return static_cast<BlockStatus>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline BlockStatus operator~(BlockStatus a) {
    return static_cast<BlockStatus>(~static_cast<uint32_t>(a));
}

inline BlockStatus& operator|=(BlockStatus& a, BlockStatus b) {
    a = a | b;
    return a;
}

inline bool HasStatus(BlockStatus status, BlockStatus flag) {
    return (status & flag) == flag;
}

inline BlockStatus GetValidityLevel(BlockStatus status) {
    return status & BlockStatus::VALID_MASK;
}

// ============================================================================
// BlockIndex
// ============================================================================

/**
 * In-memory node of the block tree. Every header the node has accepted gets
 * one, whether or not it is on the active chain. Owned by a BlockMap; the
 * pprev/pskip pointers never dangle while the map lives.
 */
class BlockIndex {
public:
    /// Points at the key of this entry in the owning BlockMap
    const BlockHash* phashBlock{nullptr};

    BlockIndex* pprev{nullptr};

    /// Ancestor further back, for O(log n) GetAncestor
    BlockIndex* pskip{nullptr};

    int32_t nHeight{0};

    /// Total work of the chain ending at this block
    ArithUint256 nChainWork;

    unsigned int nTx{0};

    BlockStatus nStatus{BlockStatus::UNKNOWN};

    // Header fields
    int32_t nVersion{0};
    Hash256 hashMerkleRoot;
    uint32_t nTime{0};
    uint32_t nBits{0};
    uint32_t nNonce{0};

    /// Arrival order; earlier blocks win ties in chain work
    uint64_t nSequenceId{0};

    BlockIndex() = default;

    explicit BlockIndex(const BlockHeader& header)
        : nVersion(header.nVersion),
          hashMerkleRoot(header.hashMerkleRoot),
          nTime(header.nTime),
          nBits(header.nBits),
          nNonce(header.nNonce) {}

    BlockHash GetBlockHash() const {
        return phashBlock ? *phashBlock : BlockHash();
    }

    BlockHeader GetBlockHeader() const;

    int64_t GetBlockTime() const { return static_cast<int64_t>(nTime); }

    /// Median timestamp of this block and up to ten ancestors
    int64_t GetMedianTimePast() const;

    bool IsValid(BlockStatus upTo = BlockStatus::VALID_TRANSACTIONS) const {
        if (IsFailed()) return false;
        return GetValidityLevel(nStatus) >= GetValidityLevel(upTo);
    }

    /// Raise the validity level; false if failed or already at least upTo
    bool RaiseValidity(BlockStatus upTo) {
        if (IsFailed()) return false;
        if (GetValidityLevel(nStatus) >= GetValidityLevel(upTo)) return false;
        nStatus = (nStatus & ~BlockStatus::VALID_MASK) | GetValidityLevel(upTo);
        return true;
    }

    bool IsFailed() const {
        return (nStatus & BlockStatus::FAILED_MASK) != BlockStatus::UNKNOWN;
    }

    bool HaveData() const { return HasStatus(nStatus, BlockStatus::HAVE_DATA); }

    /// Set pskip from pprev; call once pprev and nHeight are final
    void BuildSkip();

    BlockIndex* GetAncestor(int height);
    const BlockIndex* GetAncestor(int height) const;

    std::string ToString() const;
};

/// Timestamps of index and its ancestors, oldest first, at most count
std::vector<int64_t> GetAncestorTimestamps(const BlockIndex* index, size_t count);

// ============================================================================
// Chain - The active chain as a height-indexed vector
// ============================================================================

class Chain {
public:
    Chain() = default;

    BlockIndex* Genesis() const {
        return vChain.empty() ? nullptr : vChain[0];
    }

    BlockIndex* Tip() const {
        return vChain.empty() ? nullptr : vChain.back();
    }

    BlockIndex* operator[](int height) const {
        if (height < 0 || height >= static_cast<int>(vChain.size())) {
            return nullptr;
        }
        return vChain[height];
    }

    /// -1 when empty
    int Height() const { return static_cast<int>(vChain.size()) - 1; }

    bool Contains(const BlockIndex* pindex) const {
        return pindex && (*this)[pindex->nHeight] == pindex;
    }

    /// Successor of pindex on this chain, or nullptr
    BlockIndex* Next(const BlockIndex* pindex) const {
        if (!Contains(pindex)) return nullptr;
        return (*this)[pindex->nHeight + 1];
    }

    /// Last block of this chain that is an ancestor of pindex
    const BlockIndex* FindFork(const BlockIndex* pindex) const;

    void SetTip(BlockIndex* pindex);

private:
    std::vector<BlockIndex*> vChain;
};

// ============================================================================
// BlockMap
// ============================================================================

using BlockMap = std::unordered_map<BlockHash, std::unique_ptr<BlockIndex>, Hash256Hasher>;

/// Deepest block both pa and pb descend from
const BlockIndex* LastCommonAncestor(const BlockIndex* pa, const BlockIndex* pb);

// ============================================================================
// DiskBlockIndex - Persistent form of a BlockIndex
// ============================================================================

/**
 * What the block store keeps per index entry. Pointers are rebuilt on load
 * from hashPrev; chain work is recomputed from nBits.
 */
struct DiskBlockIndex {
    BlockHeader header;
    int32_t nHeight{0};
    uint32_t nStatus{0};
    unsigned int nTx{0};
    uint64_t nSequenceId{0};

    DiskBlockIndex() = default;
    explicit DiskBlockIndex(const BlockIndex& index);
};

template<typename Stream>
void Serialize(Stream& s, const DiskBlockIndex& idx) {
    Serialize(s, idx.header);
    Serialize(s, idx.nHeight);
    Serialize(s, idx.nStatus);
    Serialize(s, static_cast<uint32_t>(idx.nTx));
    Serialize(s, idx.nSequenceId);
}

template<typename Stream>
void Unserialize(Stream& s, DiskBlockIndex& idx) {
    Unserialize(s, idx.header);
    Unserialize(s, idx.nHeight);
    Unserialize(s, idx.nStatus);
    uint32_t ntx;
    Unserialize(s, ntx);
    idx.nTx = ntx;
    Unserialize(s, idx.nSequenceId);
}

} // namespace strata

#endif // STRATA_CHAIN_BLOCKINDEX_H
