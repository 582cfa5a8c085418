// STRATA - Database Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/db/database.h"
#include "strata/db/leveldb.h"
#include "strata/util/logging.h"

namespace strata {
namespace db {

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND: result = "NotFound: "; break;
        case CORRUPTION: result = "Corruption: "; break;
        case NOT_SUPPORTED: result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR: result = "IOError: "; break;
        default: result = "Unknown: "; break;
    }
    return result + message_;
}

StorageError ToStorageError(const Status& status) {
    switch (status.code()) {
        case Status::OK: return StorageError::NONE;
        case Status::NOT_FOUND: return StorageError::NOT_FOUND;
        case Status::CORRUPTION: return StorageError::CORRUPTION;
        default: return StorageError::IO_FAILURE;
    }
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError("cannot create " + path.string() + ": " + ec.message()),
                    nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;
    lo.block_size = options.block_size;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }

    lo.compression = options.compression ?
        leveldb::kSnappyCompression : leveldb::kNoCompression;

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        delete cache;
        delete filter;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        return {FromLevelDBStatus(s), nullptr};
    }

    LOG_INFO(util::LogCategory::DB) << "Opened LevelDB at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, cache, filter, path)};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return FromLevelDBStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

Status RepairDatabase(const std::filesystem::path& path) {
    return FromLevelDBStatus(leveldb::RepairDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace strata
