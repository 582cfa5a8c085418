// STRATA - Database Abstraction Layer
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// Abstract ordered key-value store used for the coin set, undo records and
// the block store. LevelDB is the production backend; MemoryDatabase
// satisfies the same contract for tests and ephemeral nodes.

#ifndef STRATA_DB_DATABASE_H
#define STRATA_DB_DATABASE_H

#include "strata/core/errors.h"
#include "strata/core/serialize.h"
#include "strata/core/types.h"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <ios>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace strata {
namespace db {

// ============================================================================
// Database Status - Result of database operations
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };

private:
    Code code_;
    std::string message_;

public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;
};

/// Map a store status onto the storage error kinds
StorageError ToStorageError(const Status& status);

// ============================================================================
// Slice - A non-owning reference to a byte range
// ============================================================================

class Slice {
private:
    const char* data_;
    size_t size_;

public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const std::vector<uint8_t>& v)
        : data_(reinterpret_cast<const char*>(v.data())), size_(v.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    char operator[](size_t n) const { return data_[n]; }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    std::string ToString() const { return std::string(data_, size_); }
    std::vector<uint8_t> ToVector() const {
        return std::vector<uint8_t>(data_, data_ + size_);
    }

    int compare(const Slice& b) const {
        size_t min_len = std::min(size_, b.size_);
        int r = min_len ? std::memcmp(data_, b.data_, min_len) : 0;
        if (r == 0) {
            if (size_ < b.size_) r = -1;
            else if (size_ > b.size_) r = +1;
        }
        return r;
    }

    bool operator==(const Slice& b) const { return compare(b) == 0; }
    bool operator!=(const Slice& b) const { return !(*this == b); }
    bool operator<(const Slice& b) const { return compare(b) < 0; }
};

// ============================================================================
// Database Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;

    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;
    int max_open_files = 1000;
    size_t block_size = 4 * 1024;

    /// LRU cache size for blocks (default 8MB)
    size_t block_cache_size = 8 * 1024 * 1024;

    bool compression = true;

    /// Bloom filter bits per key (0 to disable)
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    bool verify_checksums = false;
    bool fill_cache = true;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch - Atomic batch of write operations
// ============================================================================

/// Writes applied all-or-nothing by Database::Write, in insertion order
class WriteBatch {
private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;

public:
    WriteBatch() = default;

    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }
    bool Empty() const { return operations_.empty(); }

    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

    size_t ApproximateSize() const {
        size_t size = 0;
        for (const auto& [key, value] : operations_) {
            size += key.size();
            if (value) size += value->size();
        }
        return size;
    }
};

// ============================================================================
// Iterator - Ordered traversal
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;

    /// Valid only while the iterator is positioned on the entry
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;

    virtual Status status() const = 0;
};

// ============================================================================
// Database - Abstract key-value store
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }

    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }

    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }

    /// Apply a batch atomically: either every operation lands or none does
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }

    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;
    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }

    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }

    /// Force buffered writes to durable storage
    virtual Status Sync() { return Status::Ok(); }

    virtual void Compact() {}

    virtual std::string GetStats() const { return ""; }
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/// Open (or create) a LevelDB database at path
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

Status DestroyDatabase(const std::filesystem::path& path);

Status RepairDatabase(const std::filesystem::path& path);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

/// Decode a stored record; false on truncated input or trailing bytes
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Unserialize(ss, obj);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

// ============================================================================
// Key Prefixes for Database Namespacing
// ============================================================================

namespace prefix {
    // Coin store
    constexpr char COIN = 'C';            // outpoint -> coin
    constexpr char COINS_TIP = 'c';       // -> best block hash for coins
    constexpr char UNDO = 'u';            // block hash -> undo record + checksum

    // Block store
    constexpr char BLOCK = 'b';           // block hash -> block data
    constexpr char BLOCK_INDEX = 'B';     // block hash -> block index record
    constexpr char BEST_CHAIN = 'H';      // -> hash of best chain tip
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

template<typename T>
std::string MakeKey(char prefix, const T& obj) {
    std::string result;
    result.push_back(prefix);
    DataStream ss;
    Serialize(ss, obj);
    result.append(reinterpret_cast<const char*>(ss.data()), ss.size());
    return result;
}

} // namespace db
} // namespace strata

#endif // STRATA_DB_DATABASE_H
