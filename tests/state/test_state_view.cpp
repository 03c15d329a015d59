// TOKENLEDGER - State View Tests
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "tokenledger/db/memorydb.h"
#include "tokenledger/db/records.h"
#include "tokenledger/state/state_view.h"
#include <filesystem>
#include <random>

using namespace tokenledger;
using namespace tokenledger::state;

namespace {

Address MakeAddress(uint8_t fill) {
    Address addr;
    addr[0] = 0x20;
    addr[19] = fill;
    return addr;
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class StateViewTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto memory = std::make_unique<db::MemoryDatabase>();
        memory_ = memory.get();
        view_ = std::make_unique<StateViewDB>(std::move(memory));
        alice_ = MakeAddress(0xA1);
        bob_ = MakeAddress(0xB0);
    }

    db::MemoryDatabase* memory_{nullptr};
    std::unique_ptr<StateViewDB> view_;
    Address alice_;
    Address bob_;
};

// ============================================================================
// StateViewDB
// ============================================================================

TEST_F(StateViewTest, MissingRecordsReadAsDefaults) {
    Amount balance = 99;
    ASSERT_TRUE(view_->GetBalance(alice_, &balance).ok());
    EXPECT_EQ(balance, 0u);

    Amount allowance = 99;
    ASSERT_TRUE(view_->GetAllowance(alice_, bob_, &allowance).ok());
    EXPECT_EQ(allowance, 0u);

    bool exempt = true;
    ASSERT_TRUE(view_->GetFeeExempt(alice_, &exempt).ok());
    EXPECT_FALSE(exempt);

    std::optional<staking::StakerInfo> staker;
    ASSERT_TRUE(view_->GetStaker(alice_, &staker).ok());
    EXPECT_FALSE(staker.has_value());

    std::optional<GlobalState> globals;
    ASSERT_TRUE(view_->GetGlobals(&globals).ok());
    EXPECT_FALSE(globals.has_value());

    staking::TierTable tiers;
    ASSERT_TRUE(view_->GetTiers(&tiers).ok());
    EXPECT_TRUE(tiers.Empty());
}

TEST_F(StateViewTest, BatchWriteAndRead) {
    StateChanges changes;
    changes.balances[alice_] = 500;
    changes.allowances[AllowanceKey(alice_, bob_)] = 70;
    changes.feeExempt[bob_] = true;

    staking::StakerInfo info;
    info.stakedAmount = 300;
    info.tierIndex = 1;
    changes.stakers[alice_] = info;

    GlobalState globals;
    globals.totalSupply = 800;
    changes.globals = globals;

    ASSERT_TRUE(view_->BatchWrite(changes).ok());
    EXPECT_EQ(view_->GetWriteCount(), 5u);

    Amount balance = 0;
    ASSERT_TRUE(view_->GetBalance(alice_, &balance).ok());
    EXPECT_EQ(balance, 500u);

    Amount allowance = 0;
    ASSERT_TRUE(view_->GetAllowance(alice_, bob_, &allowance).ok());
    EXPECT_EQ(allowance, 70u);
    ASSERT_TRUE(view_->GetAllowance(bob_, alice_, &allowance).ok());
    EXPECT_EQ(allowance, 0u);

    std::optional<staking::StakerInfo> staker;
    ASSERT_TRUE(view_->GetStaker(alice_, &staker).ok());
    ASSERT_TRUE(staker.has_value());
    EXPECT_EQ(*staker, info);

    std::optional<GlobalState> loaded;
    ASSERT_TRUE(view_->GetGlobals(&loaded).ok());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->totalSupply, 800u);
}

TEST_F(StateViewTest, ZeroValuesAreDeleted) {
    StateChanges changes;
    changes.balances[alice_] = 500;
    changes.allowances[AllowanceKey(alice_, bob_)] = 70;
    changes.feeExempt[bob_] = true;
    ASSERT_TRUE(view_->BatchWrite(changes).ok());
    EXPECT_EQ(memory_->Size(), 3u);

    StateChanges clear;
    clear.balances[alice_] = 0;
    clear.allowances[AllowanceKey(alice_, bob_)] = 0;
    clear.feeExempt[bob_] = false;
    ASSERT_TRUE(view_->BatchWrite(clear).ok());
    EXPECT_EQ(memory_->Size(), 0u);
}

TEST_F(StateViewTest, StateHashTracksContents) {
    Hash256 empty = view_->GetStateHash();

    StateChanges changes;
    changes.balances[alice_] = 1;
    ASSERT_TRUE(view_->BatchWrite(changes).ok());
    Hash256 one = view_->GetStateHash();
    EXPECT_NE(one, empty);

    changes.balances[alice_] = 0;
    ASSERT_TRUE(view_->BatchWrite(changes).ok());
    EXPECT_EQ(view_->GetStateHash(), empty);
}

TEST_F(StateViewTest, CorruptRecordIsStorageError) {
    ASSERT_TRUE(memory_->Put(db::RecordKey(db::RecordKind::Balance, alice_), "x").ok());
    Amount balance = 0;
    EXPECT_TRUE(view_->GetBalance(alice_, &balance) == Status::STORAGE_ERROR);
}

// ============================================================================
// StateViewCache
// ============================================================================

TEST_F(StateViewTest, CacheShadowsBase) {
    StateChanges changes;
    changes.balances[alice_] = 500;
    ASSERT_TRUE(view_->BatchWrite(changes).ok());

    StateViewCache cache(view_.get());
    cache.SetBalance(alice_, 200);
    cache.SetBalance(bob_, 300);

    Amount balance = 0;
    ASSERT_TRUE(cache.GetBalance(alice_, &balance).ok());
    EXPECT_EQ(balance, 200u);
    ASSERT_TRUE(view_->GetBalance(alice_, &balance).ok());
    EXPECT_EQ(balance, 500u);
    ASSERT_TRUE(view_->GetBalance(bob_, &balance).ok());
    EXPECT_EQ(balance, 0u);
}

TEST_F(StateViewTest, CacheFlushCommits) {
    StateViewCache cache(view_.get());
    cache.SetBalance(alice_, 200);
    cache.SetFeeExempt(bob_, true);
    EXPECT_TRUE(cache.HasChanges());

    ASSERT_TRUE(cache.Flush().ok());
    EXPECT_FALSE(cache.HasChanges());

    Amount balance = 0;
    ASSERT_TRUE(view_->GetBalance(alice_, &balance).ok());
    EXPECT_EQ(balance, 200u);
    bool exempt = false;
    ASSERT_TRUE(view_->GetFeeExempt(bob_, &exempt).ok());
    EXPECT_TRUE(exempt);
}

TEST_F(StateViewTest, CacheResetDiscards) {
    Hash256 before = view_->GetStateHash();

    StateViewCache cache(view_.get());
    cache.SetBalance(alice_, 200);
    GlobalState globals;
    globals.totalSupply = 200;
    cache.SetGlobals(globals);
    cache.Reset();

    EXPECT_FALSE(cache.HasChanges());
    ASSERT_TRUE(cache.Flush().ok());
    EXPECT_EQ(view_->GetStateHash(), before);
}

TEST_F(StateViewTest, NestedCaches) {
    StateViewCache outer(view_.get());
    {
        StateViewCache inner(&outer);
        inner.SetBalance(alice_, 42);
        ASSERT_TRUE(inner.Flush().ok());
    }

    Amount balance = 0;
    ASSERT_TRUE(outer.GetBalance(alice_, &balance).ok());
    EXPECT_EQ(balance, 42u);
    ASSERT_TRUE(view_->GetBalance(alice_, &balance).ok());
    EXPECT_EQ(balance, 0u);

    ASSERT_TRUE(outer.Flush().ok());
    ASSERT_TRUE(view_->GetBalance(alice_, &balance).ok());
    EXPECT_EQ(balance, 42u);
}

// ============================================================================
// Persistence
// ============================================================================

class StateViewPersistenceTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("tokenledger_state_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<StateViewDB> OpenView() {
        auto [status, database] = db::OpenDatabase(testDir_ / "state");
        EXPECT_TRUE(status.ok()) << status.ToString();
        if (!database) {
            return nullptr;
        }
        return std::make_unique<StateViewDB>(std::move(database));
    }
};

TEST_F(StateViewPersistenceTest, ReloadRestoresRecordsAndHash) {
    Address alice = MakeAddress(0xA1);
    Hash256 hash;

    {
        auto view = OpenView();
        ASSERT_NE(view, nullptr);

        StateChanges changes;
        changes.balances[alice] = 12345;

        vesting::VestingSchedule schedule;
        schedule.totalAmount = 1000;
        schedule.vestingDuration = 1000;
        changes.schedules[alice] = schedule;

        staking::TierTable tiers;
        ASSERT_TRUE(tiers.AddTier(staking::Tier("Bronze", 100, 10000)).ok());
        changes.tiers = tiers;

        ASSERT_TRUE(view->BatchWrite(changes).ok());
        hash = view->GetStateHash();
    }

    auto view = OpenView();
    ASSERT_NE(view, nullptr);
    EXPECT_EQ(view->GetStateHash(), hash);

    Amount balance = 0;
    ASSERT_TRUE(view->GetBalance(alice, &balance).ok());
    EXPECT_EQ(balance, 12345u);

    std::optional<vesting::VestingSchedule> schedule;
    ASSERT_TRUE(view->GetSchedule(alice, &schedule).ok());
    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->totalAmount, 1000u);

    staking::TierTable tiers;
    ASSERT_TRUE(view->GetTiers(&tiers).ok());
    EXPECT_EQ(tiers.Size(), 1u);
}
