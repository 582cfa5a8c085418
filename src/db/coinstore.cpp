// STRATA - Coin Store Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/db/coinstore.h"
#include "strata/crypto/sha256.h"
#include "strata/util/logging.h"

namespace strata {
namespace db {

namespace {

constexpr size_t CHECKSUM_SIZE = 32;

} // namespace

// ============================================================================
// Reads
// ============================================================================

Status CoinStore::GetCoin(const OutPoint& outpoint, Coin& coin) const {
    std::string value;
    Status s = db_.Get(CoinKey(outpoint), &value);
    if (!s.ok()) {
        return s;
    }
    if (!DeserializeFromString(value, coin)) {
        return Status::Corruption("undecodable coin " + outpoint.ToString());
    }
    return Status::Ok();
}

bool CoinStore::HaveCoin(const OutPoint& outpoint) const {
    return db_.Exists(CoinKey(outpoint));
}

Status CoinStore::GetBestBlock(BlockHash& hash) const {
    std::string value;
    Status s = db_.Get(MakeKey(prefix::COINS_TIP), &value);
    if (!s.ok()) {
        return s;
    }
    if (!DeserializeFromString(value, hash)) {
        return Status::Corruption("undecodable best block marker");
    }
    return Status::Ok();
}

Status CoinStore::ReadUndo(const BlockHash& hash, UndoRecord& undo) const {
    std::string value;
    Status s = db_.Get(UndoKey(hash), &value);
    if (!s.ok()) {
        return s;
    }
    if (value.size() < CHECKSUM_SIZE) {
        return Status::Corruption("undo record too short for " + hash.ToHex());
    }

    const size_t payloadSize = value.size() - CHECKSUM_SIZE;
    const auto* payload = reinterpret_cast<const Byte*>(value.data());
    Hash256 expected = SHA256Hash(payload, payloadSize);
    if (std::memcmp(expected.data(), payload + payloadSize, CHECKSUM_SIZE) != 0) {
        LOG_ERROR(util::LogCategory::DB) << "Undo checksum mismatch for block " << hash.ToHex();
        return Status::Corruption("undo checksum mismatch for " + hash.ToHex());
    }

    if (!DeserializeFromString(value.substr(0, payloadSize), undo)) {
        return Status::Corruption("undecodable undo record for " + hash.ToHex());
    }
    if (undo.block != hash) {
        return Status::Corruption("undo record keyed under the wrong block " + hash.ToHex());
    }
    return Status::Ok();
}

bool CoinStore::HaveUndo(const BlockHash& hash) const {
    return db_.Exists(UndoKey(hash));
}

Status CoinStore::ForEachCoin(
    const std::function<bool(const OutPoint&, const Coin&)>& func) const {
    auto iter = db_.NewIterator();
    const std::string start = MakeKey(prefix::COIN);
    for (iter->Seek(Slice(start)); iter->Valid(); iter->Next()) {
        Slice key = iter->key();
        if (key.empty() || key[0] != prefix::COIN) {
            break;
        }

        OutPoint outpoint;
        Coin coin;
        if (!DeserializeFromString(std::string(key.data() + 1, key.size() - 1), outpoint) ||
            !DeserializeFromString(iter->value().ToString(), coin)) {
            return Status::Corruption("undecodable coin entry");
        }
        if (!func(outpoint, coin)) {
            break;
        }
    }
    return iter->status();
}

// ============================================================================
// Batched Writes
// ============================================================================

void CoinStore::PutCoin(WriteBatch& batch, const OutPoint& outpoint, const Coin& coin) {
    batch.Put(CoinKey(outpoint), SerializeToString(coin));
}

void CoinStore::EraseCoin(WriteBatch& batch, const OutPoint& outpoint) {
    batch.Delete(CoinKey(outpoint));
}

void CoinStore::PutUndo(WriteBatch& batch, const UndoRecord& undo) {
    std::string value = SerializeToString(undo);
    Hash256 checksum = SHA256Hash(reinterpret_cast<const Byte*>(value.data()), value.size());
    value.append(reinterpret_cast<const char*>(checksum.data()), CHECKSUM_SIZE);
    batch.Put(UndoKey(undo.block), value);
}

void CoinStore::EraseUndo(WriteBatch& batch, const BlockHash& hash) {
    batch.Delete(UndoKey(hash));
}

void CoinStore::SetBestBlock(WriteBatch& batch, const BlockHash& hash) {
    batch.Put(MakeKey(prefix::COINS_TIP), SerializeToString(hash));
}

void CoinStore::EraseBestBlock(WriteBatch& batch) {
    batch.Delete(MakeKey(prefix::COINS_TIP));
}

Status CoinStore::Commit(WriteBatch& batch, bool sync) {
    WriteOptions options;
    options.sync = sync;
    Status s = db_.Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Coin store batch of " << batch.Count()
                                         << " ops failed: " << s.ToString();
    }
    return s;
}

} // namespace db
} // namespace strata
