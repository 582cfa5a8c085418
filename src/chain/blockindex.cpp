// STRATA - Block Index Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/chain/blockindex.h"
#include <algorithm>
#include <sstream>

namespace strata {

namespace {

constexpr int MEDIAN_TIME_SPAN = 11;

/// Turn off the lowest set bit
int InvertLowestOne(int n) { return n & (n - 1); }

/// Height pskip should point at for a block at height
int GetSkipHeight(int height) {
    if (height < 2) {
        return 0;
    }
    // Odd heights jump further back than their even neighbours, which keeps
    // the average walk logarithmic.
    return (height & 1) ? InvertLowestOne(InvertLowestOne(height - 1)) + 1
                        : InvertLowestOne(height);
}

} // namespace

// ============================================================================
// BlockIndex Implementation
// ============================================================================

BlockHeader BlockIndex::GetBlockHeader() const {
    BlockHeader header;
    header.nVersion = nVersion;
    if (pprev) {
        header.hashPrevBlock = pprev->GetBlockHash();
    }
    header.hashMerkleRoot = hashMerkleRoot;
    header.nTime = nTime;
    header.nBits = nBits;
    header.nNonce = nNonce;
    return header;
}

int64_t BlockIndex::GetMedianTimePast() const {
    std::vector<int64_t> times;
    times.reserve(MEDIAN_TIME_SPAN);

    const BlockIndex* pindex = this;
    for (int i = 0; i < MEDIAN_TIME_SPAN && pindex; ++i) {
        times.push_back(pindex->GetBlockTime());
        pindex = pindex->pprev;
    }

    std::sort(times.begin(), times.end());
    return times[times.size() / 2];
}

void BlockIndex::BuildSkip() {
    if (pprev) {
        pskip = pprev->GetAncestor(GetSkipHeight(nHeight));
    }
}

BlockIndex* BlockIndex::GetAncestor(int height) {
    if (height > nHeight || height < 0) {
        return nullptr;
    }

    BlockIndex* pwalk = this;
    int heightWalk = nHeight;
    while (heightWalk > height) {
        int heightSkip = GetSkipHeight(heightWalk);
        int heightSkipPrev = GetSkipHeight(heightWalk - 1);
        if (pwalk->pskip &&
            (heightSkip == height ||
             (heightSkip > height && !(heightSkipPrev < heightSkip - 2 &&
                                       heightSkipPrev >= height)))) {
            pwalk = pwalk->pskip;
            heightWalk = heightSkip;
        } else if (pwalk->pprev) {
            pwalk = pwalk->pprev;
            heightWalk--;
        } else {
            return nullptr;
        }
    }
    return pwalk;
}

const BlockIndex* BlockIndex::GetAncestor(int height) const {
    return const_cast<BlockIndex*>(this)->GetAncestor(height);
}

std::string BlockIndex::ToString() const {
    std::ostringstream ss;
    ss << "BlockIndex(hash=";
    if (phashBlock) {
        ss << phashBlock->ToHex().substr(0, 16) << "...";
    } else {
        ss << "null";
    }
    ss << ", height=" << nHeight
       << ", time=" << nTime
       << ", bits=" << std::hex << nBits << std::dec
       << ", nTx=" << nTx
       << ", work=" << nChainWork.ToString()
       << ", status=" << static_cast<uint32_t>(nStatus)
       << ")";
    return ss.str();
}

std::vector<int64_t> GetAncestorTimestamps(const BlockIndex* index, size_t count) {
    std::vector<int64_t> times;
    times.reserve(count);
    for (const BlockIndex* p = index; p && times.size() < count; p = p->pprev) {
        times.push_back(p->GetBlockTime());
    }
    std::reverse(times.begin(), times.end());
    return times;
}

// ============================================================================
// Chain Implementation
// ============================================================================

void Chain::SetTip(BlockIndex* pindex) {
    if (!pindex) {
        vChain.clear();
        return;
    }

    vChain.resize(pindex->nHeight + 1);
    while (pindex && vChain[pindex->nHeight] != pindex) {
        vChain[pindex->nHeight] = pindex;
        pindex = pindex->pprev;
    }
}

const BlockIndex* Chain::FindFork(const BlockIndex* pindex) const {
    if (!pindex) return nullptr;

    if (pindex->nHeight > Height()) {
        pindex = pindex->GetAncestor(Height());
    }
    while (pindex && !Contains(pindex)) {
        pindex = pindex->pprev;
    }
    return pindex;
}

// ============================================================================
// Utility Functions
// ============================================================================

const BlockIndex* LastCommonAncestor(const BlockIndex* pa, const BlockIndex* pb) {
    if (!pa || !pb) return nullptr;

    if (pa->nHeight > pb->nHeight) {
        pa = pa->GetAncestor(pb->nHeight);
    } else if (pb->nHeight > pa->nHeight) {
        pb = pb->GetAncestor(pa->nHeight);
    }

    while (pa != pb && pa && pb) {
        pa = pa->pprev;
        pb = pb->pprev;
    }
    return pa;
}

DiskBlockIndex::DiskBlockIndex(const BlockIndex& index)
    : header(index.GetBlockHeader()),
      nHeight(index.nHeight),
      nStatus(static_cast<uint32_t>(index.nStatus)),
      nTx(index.nTx),
      nSequenceId(index.nSequenceId) {}

} // namespace strata
