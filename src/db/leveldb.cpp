// STRATA - LevelDB Backend Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/db/leveldb.h"

namespace strata {
namespace db {

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const leveldb::FilterPolicy* filter,
                                 const std::filesystem::path& path)
    : db_(db), cache_(cache), filter_policy_(filter), path_(path) {}

LevelDBDatabase::~LevelDBDatabase() {
    // The DB references the cache and filter policy; close it first
    db_.reset();
    cache_.reset();
    filter_policy_.reset();
}

leveldb::ReadOptions LevelDBDatabase::MakeReadOptions(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    lo.fill_cache = opts.fill_cache;
    return lo;
}

leveldb::WriteOptions LevelDBDatabase::MakeWriteOptions(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    leveldb::Slice lkey(key.data(), key.size());
    return FromLevelDBStatus(db_->Get(MakeReadOptions(options), lkey, value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    leveldb::Slice lkey(key.data(), key.size());
    leveldb::Slice lval(value.data(), value.size());
    return FromLevelDBStatus(db_->Put(MakeWriteOptions(options), lkey, lval));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    leveldb::Slice lkey(key.data(), key.size());
    return FromLevelDBStatus(db_->Delete(MakeWriteOptions(options), lkey));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return FromLevelDBStatus(db_->Write(MakeWriteOptions(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
}

Status LevelDBDatabase::Sync() {
    // An empty synchronous batch flushes the log to disk
    leveldb::WriteBatch empty;
    leveldb::WriteOptions lo;
    lo.sync = true;
    return FromLevelDBStatus(db_->Write(lo, &empty));
}

void LevelDBDatabase::Compact() {
    db_->CompactRange(nullptr, nullptr);
}

std::string LevelDBDatabase::GetStats() const {
    std::string stats;
    if (!db_->GetProperty("leveldb.stats", &stats)) {
        return "";
    }
    return stats;
}

} // namespace db
} // namespace strata
