// TOKENLEDGER - In-Memory Database
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Sorted-map backend for scratch simulator runs and tests.

#ifndef TOKENLEDGER_DB_MEMORYDB_H
#define TOKENLEDGER_DB_MEMORYDB_H

#include "tokenledger/db/database.h"

#include <map>

namespace tokenledger {
namespace db {

class MemoryDatabase : public Database {
public:
    using Map = std::map<std::string, std::string>;

    Status Get(const std::string& key, std::string* value) const override;
    Status Put(const std::string& key, const std::string& value) override;
    Status Delete(const std::string& key) override;
    Status Write(const WriteBatch& batch) override;

    /// Reads the live map; any write invalidates open iterators
    std::unique_ptr<Iterator> NewIterator() const override;

    std::string Name() const override { return "memory"; }

    size_t Size() const { return records_.size(); }

private:
    Map records_;
};

} // namespace db
} // namespace tokenledger

#endif // TOKENLEDGER_DB_MEMORYDB_H
