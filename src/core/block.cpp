// STRATA - Block Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/core/block.h"
#include "strata/core/merkle.h"
#include "strata/crypto/sha256.h"
#include <sstream>
#include <iomanip>
#include <cstring>

namespace strata {

// ============================================================================
// BlockHeader Implementation
// ============================================================================

BlockHash BlockHeader::GetHash() const {
    DataStream ss;
    Serialize(ss, *this);
    return BlockHash(DoubleSHA256(ss.data(), ss.size()));
}

std::string BlockHeader::ToString() const {
    std::ostringstream ss;
    ss << "BlockHeader(hash=" << GetHash().ToHex().substr(0, 16)
       << ", prev=" << hashPrevBlock.ToHex().substr(0, 16)
       << ", time=" << nTime
       << ", bits=0x" << std::hex << nBits << std::dec
       << ", nonce=" << nNonce << ")";
    return ss.str();
}

// ============================================================================
// Block Implementation
// ============================================================================

Hash256 Block::ComputeMerkleRoot(bool* mutated) const {
    return BlockMerkleRoot(*this, mutated);
}

size_t Block::GetTotalSize() const {
    return GetSerializeSize(*this);
}

std::string Block::ToString() const {
    std::ostringstream ss;
    ss << "Block(hash=" << GetHash().ToHex().substr(0, 16)
       << ", prev=" << hashPrevBlock.ToHex().substr(0, 16)
       << ", time=" << nTime
       << ", bits=0x" << std::hex << nBits << std::dec
       << ", txs=" << vtx.size() << ")";
    return ss.str();
}

Block DeserializeBlock(const std::vector<uint8_t>& bytes) {
    DataStream ss(bytes);
    Block block;
    Unserialize(ss, block);
    if (!ss.empty()) {
        throw std::ios_base::failure("trailing bytes after block");
    }
    return block;
}

// ============================================================================
// Genesis Block Creation
// ============================================================================

Block CreateGenesisBlock(uint32_t nTime, uint32_t nNonce, uint32_t nBits,
                         int32_t nVersion, Amount genesisReward) {
    static const char* kGenesisTag = "strata genesis";

    MutableTransaction coinbase;
    coinbase.version = 1;
    Script tag(reinterpret_cast<const uint8_t*>(kGenesisTag),
               reinterpret_cast<const uint8_t*>(kGenesisTag) + std::strlen(kGenesisTag));
    coinbase.vin.emplace_back(OutPoint(), tag, TxIn::SEQUENCE_FINAL);
    coinbase.vout.emplace_back(genesisReward, Script());

    Block genesis;
    genesis.nVersion = nVersion;
    genesis.nTime = nTime;
    genesis.nBits = nBits;
    genesis.nNonce = nNonce;
    genesis.vtx.push_back(MakeTransactionRef(std::move(coinbase)));
    genesis.hashMerkleRoot = genesis.ComputeMerkleRoot();
    return genesis;
}

} // namespace strata
