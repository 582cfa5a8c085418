// STRATA - In-Memory Database
// Copyright (c) 2024 STRATA Developers
// MIT License

#ifndef STRATA_DB_MEMORYDB_H
#define STRATA_DB_MEMORYDB_H

#include "strata/db/database.h"
#include <atomic>
#include <map>
#include <mutex>

namespace strata {
namespace db {

/**
 * Ordered in-memory store with the same atomicity as the LevelDB backend.
 *
 * Failure injection: SetFailWrites(true) makes every mutating call return
 * an I/O error without touching the data, which lets callers exercise their
 * rollback paths.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;
    void Clear();

    void SetFailWrites(bool fail) { failWrites_.store(fail); }

    /// Overwrite a raw value; used to simulate on-disk corruption
    void CorruptValue(const std::string& key, const std::string& value);

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
    std::atomic<bool> failWrites_{false};
};

/// Iterator over a private copy of the map
class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace db
} // namespace strata

#endif // STRATA_DB_MEMORYDB_H
