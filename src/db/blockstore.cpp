// STRATA - Block Store Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/db/blockstore.h"
#include "strata/util/logging.h"

namespace strata {
namespace db {

// ============================================================================
// Block Data
// ============================================================================

Status BlockStore::WriteBlock(const Block& block) {
    Status s = db_.Put(MakeKey(prefix::BLOCK, block.GetHash()), SerializeToString(block));
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to write block "
                                         << block.GetHash().ToHex() << ": " << s.ToString();
    }
    return s;
}

Status BlockStore::ReadBlock(const BlockHash& hash, Block& block) const {
    std::string value;
    Status s = db_.Get(MakeKey(prefix::BLOCK, hash), &value);
    if (!s.ok()) {
        return s;
    }
    if (!DeserializeFromString(value, block)) {
        return Status::Corruption("undecodable block " + hash.ToHex());
    }
    if (block.GetHash() != hash) {
        return Status::Corruption("block stored under the wrong hash " + hash.ToHex());
    }
    return Status::Ok();
}

bool BlockStore::HaveBlock(const BlockHash& hash) const {
    return db_.Exists(MakeKey(prefix::BLOCK, hash));
}

// ============================================================================
// Block Index
// ============================================================================

Status BlockStore::WriteIndex(const BlockHash& hash, const DiskBlockIndex& entry) {
    return db_.Put(MakeKey(prefix::BLOCK_INDEX, hash), SerializeToString(entry));
}

Status BlockStore::ReadIndex(const BlockHash& hash, DiskBlockIndex& entry) const {
    std::string value;
    Status s = db_.Get(MakeKey(prefix::BLOCK_INDEX, hash), &value);
    if (!s.ok()) {
        return s;
    }
    if (!DeserializeFromString(value, entry)) {
        return Status::Corruption("undecodable index entry " + hash.ToHex());
    }
    return Status::Ok();
}

Status BlockStore::ForEachIndex(
    const std::function<void(const BlockHash&, const DiskBlockIndex&)>& func) const {
    auto iter = db_.NewIterator();
    const std::string start = MakeKey(prefix::BLOCK_INDEX);
    for (iter->Seek(Slice(start)); iter->Valid(); iter->Next()) {
        Slice key = iter->key();
        if (key.empty() || key[0] != prefix::BLOCK_INDEX) {
            break;
        }

        BlockHash hash;
        DiskBlockIndex entry;
        if (!DeserializeFromString(std::string(key.data() + 1, key.size() - 1), hash) ||
            !DeserializeFromString(iter->value().ToString(), entry)) {
            return Status::Corruption("undecodable block index entry");
        }
        func(hash, entry);
    }
    return iter->status();
}

// ============================================================================
// Best Chain
// ============================================================================

Status BlockStore::WriteBestChain(const BlockHash& hash) {
    return db_.Put(MakeKey(prefix::BEST_CHAIN), SerializeToString(hash));
}

std::optional<BlockHash> BlockStore::ReadBestChain() const {
    std::string value;
    if (!db_.Get(MakeKey(prefix::BEST_CHAIN), &value).ok()) {
        return std::nullopt;
    }
    BlockHash hash;
    if (!DeserializeFromString(value, hash)) {
        return std::nullopt;
    }
    return hash;
}

} // namespace db
} // namespace strata
