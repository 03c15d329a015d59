// TOKENLEDGER - Database Tests
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "tokenledger/db/database.h"
#include "tokenledger/db/memorydb.h"
#include "tokenledger/db/records.h"
#include "tokenledger/staking/reward_accumulator.h"
#include <filesystem>
#include <random>

using namespace tokenledger::db;

// ============================================================================
// Test Utilities
// ============================================================================

class LevelDBTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("tokenledger_db_test_" + std::to_string(dis(gen)));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> Open() {
        auto [status, db] = OpenDatabase(testDir_ / "ledger");
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
};

static bool Has(const Database& db, const std::string& key) {
    std::string value;
    return db.Get(key, &value).ok();
}

// ============================================================================
// LevelDB
// ============================================================================

TEST_F(LevelDBTest, OpenCreatesDirectory) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    EXPECT_TRUE(std::filesystem::is_directory(testDir_ / "ledger"));
    EXPECT_EQ(db->Name().rfind("leveldb:", 0), 0u);
}

TEST_F(LevelDBTest, PutGetDelete) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put("key1", "value1").ok());

    std::string value;
    ASSERT_TRUE(db->Get("key1", &value).ok());
    EXPECT_EQ(value, "value1");

    ASSERT_TRUE(db->Delete("key1").ok());
    EXPECT_TRUE(db->Get("key1", &value).IsNotFound());
}

TEST_F(LevelDBTest, BatchLastWriteWins) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    ASSERT_TRUE(db->Put("gone", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Put("a", "3");
    batch.Delete("gone");
    EXPECT_EQ(batch.Count(), 4u);
    ASSERT_TRUE(db->Write(batch).ok());

    std::string value;
    ASSERT_TRUE(db->Get("a", &value).ok());
    EXPECT_EQ(value, "3");
    ASSERT_TRUE(db->Get("b", &value).ok());
    EXPECT_EQ(value, "2");
    EXPECT_FALSE(Has(*db, "gone"));
}

TEST_F(LevelDBTest, IteratorIsOrdered) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put("c", "3").ok());
    ASSERT_TRUE(db->Put("a", "1").ok());
    ASSERT_TRUE(db->Put("b", "2").ok());

    auto it = db->NewIterator();
    std::vector<std::string> keys;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        keys.push_back(it->key());
    }
    EXPECT_TRUE(it->status().ok());
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(LevelDBTest, RecordsSurviveReopen) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        ASSERT_TRUE(db->Put("persist", "yes").ok());
    }
    auto db = Open();
    ASSERT_NE(db, nullptr);
    std::string value;
    ASSERT_TRUE(db->Get("persist", &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(LevelDBTest, SyncWritesOption) {
    Options opts;
    opts.syncWrites = true;
    opts.cacheBytes = 0;
    opts.bloomBitsPerKey = 0;
    auto [status, db] = OpenDatabase(testDir_ / "synced", opts);
    ASSERT_TRUE(status.ok()) << status.ToString();
    EXPECT_TRUE(db->Put("k", "v").ok());
}

// ============================================================================
// Memory Database
// ============================================================================

TEST(MemoryDatabaseTest, Basic) {
    MemoryDatabase db;
    EXPECT_EQ(db.Name(), "memory");

    ASSERT_TRUE(db.Put("k", "v").ok());
    EXPECT_EQ(db.Size(), 1u);

    std::string value;
    ASSERT_TRUE(db.Get("k", &value).ok());
    EXPECT_EQ(value, "v");

    ASSERT_TRUE(db.Delete("k").ok());
    EXPECT_TRUE(db.Get("k", &value).IsNotFound());
    EXPECT_EQ(db.Size(), 0u);
}

TEST(MemoryDatabaseTest, IteratorSeek) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("a1", "1").ok());
    ASSERT_TRUE(db.Put("b1", "2").ok());
    ASSERT_TRUE(db.Put("b2", "3").ok());

    auto it = db.NewIterator();
    it->Seek("b");
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->key(), "b1");
    it->Next();
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->value(), "3");
    it->Next();
    EXPECT_FALSE(it->Valid());
}

TEST(MemoryDatabaseTest, BatchWrite) {
    MemoryDatabase db;
    WriteBatch batch;
    batch.Put("x", "1");
    batch.Delete("x");
    batch.Put("y", "2");
    ASSERT_TRUE(db.Write(batch).ok());
    EXPECT_FALSE(Has(db, "x"));
    EXPECT_TRUE(Has(db, "y"));
}

// ============================================================================
// Records
// ============================================================================

TEST(RecordsTest, EncodeDecode) {
    tokenledger::staking::StakerInfo info;
    info.stakedAmount = 1000;
    info.lastStakeTimestamp = 1700000000;
    info.tierIndex = 2;

    tokenledger::staking::StakerInfo loaded;
    ASSERT_TRUE(DecodeRecord(EncodeRecord(info), &loaded));
    EXPECT_EQ(loaded, info);
}

TEST(RecordsTest, DecodeRejectsTruncatedAndTrailing) {
    std::string bytes = EncodeRecord(tokenledger::staking::StakerInfo());

    tokenledger::staking::StakerInfo loaded;
    EXPECT_FALSE(DecodeRecord(bytes.substr(0, bytes.size() - 1), &loaded));
    EXPECT_FALSE(DecodeRecord(bytes + "x", &loaded));
}

TEST(RecordsTest, KeyLayout) {
    tokenledger::Address addr;
    addr[0] = 0x42;

    std::string key = RecordKey(RecordKind::Balance, addr);
    ASSERT_EQ(key.size(), 21u);
    EXPECT_EQ(key[0], 'a');
    EXPECT_EQ(static_cast<uint8_t>(key[1]), 0x42);

    EXPECT_EQ(RecordKey(RecordKind::Globals), "G");
    EXPECT_EQ(RecordKey(RecordKind::Allowance, addr, addr).size(), 41u);
}

TEST(DatabaseStatusTest, Codes) {
    EXPECT_TRUE(Status::Ok().ok());
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_TRUE(Status::NotFound().IsNotFound());
    EXPECT_EQ(Status::Corruption("bad").code(), Status::CORRUPTION);
    EXPECT_EQ(Status::IOError("disk").ToString(), "IOError: disk");
}
