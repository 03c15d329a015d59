// TOKENLEDGER - LevelDB Backend
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#ifndef TOKENLEDGER_DB_LEVELDB_H
#define TOKENLEDGER_DB_LEVELDB_H

#include "tokenledger/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>

#include <filesystem>
#include <memory>

namespace tokenledger {
namespace db {

Status FromLevelDB(const leveldb::Status& s);

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* it) : it_(it) {}

    bool Valid() const override { return it_->Valid(); }
    void SeekToFirst() override { it_->SeekToFirst(); }
    void Seek(const std::string& target) override { it_->Seek(target); }
    void Next() override { it_->Next(); }

    std::string key() const override { return it_->key().ToString(); }
    std::string value() const override { return it_->value().ToString(); }

    Status status() const override { return FromLevelDB(it_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> it_;
};

/**
 * Ledger records in a LevelDB directory. Owns the block cache and filter
 * policy handed to leveldb::DB::Open; db_ is declared last so it is closed
 * before either is released.
 */
class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(std::filesystem::path path, const Options& options,
                    leveldb::Cache* cache, const leveldb::FilterPolicy* filter,
                    leveldb::DB* db)
        : path_(std::move(path))
        , syncWrites_(options.syncWrites)
        , cache_(cache)
        , filter_(filter)
        , db_(db) {}

    Status Get(const std::string& key, std::string* value) const override;
    Status Put(const std::string& key, const std::string& value) override;
    Status Delete(const std::string& key) override;
    Status Write(const WriteBatch& batch) override;
    std::unique_ptr<Iterator> NewIterator() const override;

    std::string Name() const override { return "leveldb:" + path_.string(); }

private:
    leveldb::WriteOptions WriteOpts() const;

    std::filesystem::path path_;
    bool syncWrites_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_;
    std::unique_ptr<leveldb::DB> db_;
};

} // namespace db
} // namespace tokenledger

#endif // TOKENLEDGER_DB_LEVELDB_H
