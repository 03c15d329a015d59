// TOKENLEDGER - In-Memory Database Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/db/memorydb.h"

namespace tokenledger {
namespace db {

namespace {

class MapIterator : public Iterator {
public:
    explicit MapIterator(const MemoryDatabase::Map& records)
        : records_(records), pos_(records.end()) {}

    bool Valid() const override { return pos_ != records_.end(); }
    void SeekToFirst() override { pos_ = records_.begin(); }
    void Seek(const std::string& target) override { pos_ = records_.lower_bound(target); }
    void Next() override { ++pos_; }

    std::string key() const override { return pos_->first; }
    std::string value() const override { return pos_->second; }

    Status status() const override { return Status::Ok(); }

private:
    const MemoryDatabase::Map& records_;
    MemoryDatabase::Map::const_iterator pos_;
};

} // namespace

Status MemoryDatabase::Get(const std::string& key, std::string* value) const {
    auto it = records_.find(key);
    if (it == records_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const std::string& key, const std::string& value) {
    records_[key] = value;
    return Status::Ok();
}

Status MemoryDatabase::Delete(const std::string& key) {
    records_.erase(key);
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteBatch& batch) {
    batch.ForEach([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            records_[key] = *value;
        } else {
            records_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator() const {
    return std::make_unique<MapIterator>(records_);
}

} // namespace db
} // namespace tokenledger
