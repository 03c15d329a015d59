// TOKENLEDGER - Database Abstraction Layer
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Ordered key-value store underneath the ledger state. LevelDBDatabase keeps
// records on disk, MemoryDatabase keeps them in a sorted map.

#ifndef TOKENLEDGER_DB_DATABASE_H
#define TOKENLEDGER_DB_DATABASE_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tokenledger {
namespace db {

// ============================================================================
// Status
// ============================================================================

/**
 * Storage-level result. The ledger maps anything other than OK and
 * NOT_FOUND onto its own STORAGE_ERROR.
 */
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND,
        CORRUPTION,
        IO_ERROR,
        INVALID_ARGUMENT,
    };

    Status() = default;
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = {}) { return Status(NOT_FOUND, std::move(msg)); }
    static Status Corruption(std::string msg) { return Status(CORRUPTION, std::move(msg)); }
    static Status IOError(std::string msg) { return Status(IO_ERROR, std::move(msg)); }
    static Status InvalidArgument(std::string msg) {
        return Status(INVALID_ARGUMENT, std::move(msg));
    }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    Code code_{OK};
    std::string message_;
};

// ============================================================================
// Options
// ============================================================================

/// Settings for the on-disk backend
struct Options {
    bool createIfMissing{true};

    /// fsync every committed batch
    bool syncWrites{false};

    /// Block cache in bytes, 0 for none
    size_t cacheBytes{4 * 1024 * 1024};

    /// Bloom filter bits per key, 0 for none
    int bloomBitsPerKey{10};
};

// ============================================================================
// WriteBatch
// ============================================================================

/**
 * Puts and deletes applied as one unit. Later operations on the same key
 * win over earlier ones.
 */
class WriteBatch {
public:
    void Put(std::string key, std::string value) {
        ops_.emplace_back(std::move(key), std::move(value));
    }

    void Delete(std::string key) {
        ops_.emplace_back(std::move(key), std::nullopt);
    }

    size_t Count() const { return ops_.size(); }
    bool Empty() const { return ops_.empty(); }

    /// Calls fn(key, value) in insertion order; a null value is a delete
    template<typename Fn>
    void ForEach(Fn&& fn) const {
        for (const auto& op : ops_) {
            fn(op.first, op.second);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> ops_;
};

// ============================================================================
// Iterator
// ============================================================================

/// Forward cursor over keys in byte order
class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;

    /// Position at the first key not less than target
    virtual void Seek(const std::string& target) = 0;
    virtual void Next() = 0;

    virtual std::string key() const = 0;
    virtual std::string value() const = 0;

    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const std::string& key, std::string* value) const = 0;
    virtual Status Put(const std::string& key, const std::string& value) = 0;
    virtual Status Delete(const std::string& key) = 0;

    /// Apply every operation in the batch or none of them
    virtual Status Write(const WriteBatch& batch) = 0;

    virtual std::unique_ptr<Iterator> NewIterator() const = 0;

    /// Backend description for log lines
    virtual std::string Name() const = 0;
};

/**
 * Open (or create) a LevelDB store at path.
 * @return status and, on success, the database
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

} // namespace db
} // namespace tokenledger

#endif // TOKENLEDGER_DB_DATABASE_H
