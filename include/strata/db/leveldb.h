// STRATA - LevelDB Backend
// Copyright (c) 2024 STRATA Developers
// MIT License

#ifndef STRATA_DB_LEVELDB_H
#define STRATA_DB_LEVELDB_H

#include "strata/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>

namespace strata {
namespace db {

/// Translate a LevelDB status into a db::Status
Status FromLevelDBStatus(const leveldb::Status& s);

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;

public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDBStatus(iter_->status()); }
};

// ============================================================================
// LevelDB Database
// ============================================================================

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of db, cache and filter
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path);
    ~LevelDBDatabase() override;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    Status Sync() override;
    void Compact() override;
    std::string GetStats() const override;

    const std::filesystem::path& GetPath() const { return path_; }

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    std::filesystem::path path_;

    static leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts);
    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts);
};

} // namespace db
} // namespace strata

#endif // STRATA_DB_LEVELDB_H
