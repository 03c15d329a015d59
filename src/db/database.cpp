// TOKENLEDGER - Database Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/db/database.h"
#include "tokenledger/db/leveldb.h"
#include "tokenledger/util/logging.h"

#include <leveldb/write_batch.h>

namespace tokenledger {
namespace db {

std::string Status::ToString() const {
    static const char* const kNames[] = {
        "OK", "NotFound", "Corruption", "IOError", "InvalidArgument"
    };
    std::string out = kNames[code_];
    if (!message_.empty()) {
        out += ": " + message_;
    }
    return out;
}

Status FromLevelDB(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

// ============================================================================
// LevelDBDatabase
// ============================================================================

leveldb::WriteOptions LevelDBDatabase::WriteOpts() const {
    leveldb::WriteOptions opts;
    opts.sync = syncWrites_;
    return opts;
}

Status LevelDBDatabase::Get(const std::string& key, std::string* value) const {
    return FromLevelDB(db_->Get(leveldb::ReadOptions(), key, value));
}

Status LevelDBDatabase::Put(const std::string& key, const std::string& value) {
    return FromLevelDB(db_->Put(WriteOpts(), key, value));
}

Status LevelDBDatabase::Delete(const std::string& key) {
    return FromLevelDB(db_->Delete(WriteOpts(), key));
}

Status LevelDBDatabase::Write(const WriteBatch& batch) {
    leveldb::WriteBatch native;
    batch.ForEach([&native](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            native.Put(key, *value);
        } else {
            native.Delete(key);
        }
    });
    return FromLevelDB(db_->Write(WriteOpts(), &native));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator() const {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(leveldb::ReadOptions()));
}

// ============================================================================
// Factory
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path, const Options& options)
{
    if (options.createIfMissing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError(path.string() + ": " + ec.message()), nullptr};
        }
    }

    std::unique_ptr<leveldb::Cache> cache;
    if (options.cacheBytes > 0) {
        cache.reset(leveldb::NewLRUCache(options.cacheBytes));
    }
    std::unique_ptr<const leveldb::FilterPolicy> filter;
    if (options.bloomBitsPerKey > 0) {
        filter.reset(leveldb::NewBloomFilterPolicy(options.bloomBitsPerKey));
    }

    leveldb::Options native;
    native.create_if_missing = options.createIfMissing;
    native.block_cache = cache.get();
    native.filter_policy = filter.get();

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(native, path.string(), &raw);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot open " << path.string() << ": " << s.ToString();
        return {FromLevelDB(s), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened ledger store at " << path.string();
    return {Status::Ok(),
            std::make_unique<LevelDBDatabase>(path, options, cache.release(),
                                              filter.release(), raw)};
}

} // namespace db
} // namespace tokenledger
