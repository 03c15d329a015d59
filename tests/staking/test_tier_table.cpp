// TOKENLEDGER - Staking Tier Table Tests
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "tokenledger/core/serialize.h"
#include "tokenledger/staking/tier_table.h"

using namespace tokenledger;
using namespace tokenledger::staking;

// ============================================================================
// Test Fixture
// ============================================================================

class TierTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(table_.AddTier(Tier("Bronze", 100, 10000)).ok());
        ASSERT_TRUE(table_.AddTier(Tier("Silver", 500, 12000, {"vote"})).ok());
        ASSERT_TRUE(table_.AddTier(Tier("Gold", 1000, 15000, {"vote", "propose"})).ok());
    }

    TierTable table_;
};

// ============================================================================
// Classification
// ============================================================================

TEST_F(TierTableTest, StakeProgression) {
    // 100 -> 500 -> 1000 walks up through every tier
    EXPECT_EQ(table_.TierFor(100), 0u);
    EXPECT_EQ(table_.TierFor(500), 1u);
    EXPECT_EQ(table_.TierFor(1000), 2u);
}

TEST_F(TierTableTest, BoundariesAndBelowLowest) {
    EXPECT_EQ(table_.TierFor(0), 0u);
    EXPECT_EQ(table_.TierFor(99), 0u);
    EXPECT_EQ(table_.TierFor(499), 0u);
    EXPECT_EQ(table_.TierFor(999), 1u);
    EXPECT_EQ(table_.TierFor(MAX_SUPPLY), 2u);
}

TEST_F(TierTableTest, ClassificationIsMonotonic) {
    size_t previous = 0;
    for (Amount stake = 0; stake <= 2000; stake += 7) {
        size_t tier = table_.TierFor(stake);
        EXPECT_GE(tier, previous);
        previous = tier;
    }
}

TEST(TierTableEmptyTest, EmptyTableResolvesToBaseMultiplier) {
    TierTable table;
    EXPECT_TRUE(table.Empty());
    EXPECT_EQ(table.TierFor(123456), 0u);
    EXPECT_EQ(table.MultiplierFor(0), BASE_MULTIPLIER_BPS);
    EXPECT_FALSE(table.HasCapability(0, "vote"));
    EXPECT_EQ(table.GetTier(0), nullptr);
}

// ============================================================================
// Capabilities and Multipliers
// ============================================================================

TEST_F(TierTableTest, Multipliers) {
    EXPECT_EQ(table_.MultiplierFor(0), 10000u);
    EXPECT_EQ(table_.MultiplierFor(2), 15000u);
    EXPECT_EQ(table_.MultiplierFor(7), BASE_MULTIPLIER_BPS);
}

TEST_F(TierTableTest, Capabilities) {
    EXPECT_FALSE(table_.HasCapability(0, "vote"));
    EXPECT_TRUE(table_.HasCapability(1, "vote"));
    EXPECT_FALSE(table_.HasCapability(1, "propose"));
    EXPECT_TRUE(table_.HasCapability(2, "propose"));
    EXPECT_FALSE(table_.HasCapability(9, "vote"));
}

// ============================================================================
// Mutation
// ============================================================================

TEST_F(TierTableTest, AddTierMustExceedHighest) {
    Status s = table_.AddTier(Tier("Platinum", 1000, 20000));
    EXPECT_TRUE(s == Status::TIER_ORDERING_VIOLATION);
    s = table_.AddTier(Tier("Platinum", 900, 20000));
    EXPECT_TRUE(s == Status::TIER_ORDERING_VIOLATION);
    EXPECT_EQ(table_.Size(), 3u);

    EXPECT_TRUE(table_.AddTier(Tier("Platinum", 1001, 20000)).ok());
    EXPECT_EQ(table_.Size(), 4u);
}

TEST_F(TierTableTest, InvalidTierDefinitions) {
    EXPECT_TRUE(table_.AddTier(Tier("", 5000, 20000)) == Status::INVALID_TIER);
    EXPECT_TRUE(table_.AddTier(Tier("Lead", 5000, 9999)) == Status::INVALID_TIER);
}

TEST_F(TierTableTest, UpdateTierKeepsOrdering) {
    // Silver must stay strictly between 100 and 1000
    EXPECT_TRUE(table_.UpdateTier(1, Tier("Silver", 100, 12000)) == Status::TIER_ORDERING_VIOLATION);
    EXPECT_TRUE(table_.UpdateTier(1, Tier("Silver", 1000, 12000)) == Status::TIER_ORDERING_VIOLATION);
    EXPECT_TRUE(table_.UpdateTier(1, Tier("Silver", 101, 13000)).ok());
    EXPECT_EQ(table_.GetTier(1)->minimumStake, 101u);
    EXPECT_EQ(table_.GetTier(1)->rewardMultiplierBps, 13000u);
}

TEST_F(TierTableTest, UpdateEndTiersHaveOpenBounds) {
    EXPECT_TRUE(table_.UpdateTier(0, Tier("Bronze", 0, 10000)).ok());
    EXPECT_TRUE(table_.UpdateTier(2, Tier("Gold", 1000000, 15000)).ok());
    EXPECT_TRUE(table_.IsConsistent());
}

TEST_F(TierTableTest, UpdateOutOfRange) {
    EXPECT_TRUE(table_.UpdateTier(3, Tier("Ghost", 5000, 10000)) == Status::INVALID_TIER);
}

// ============================================================================
// Serialization
// ============================================================================

TEST_F(TierTableTest, SerializedTableReloads) {
    DataStream ss;
    ss << table_;

    TierTable loaded;
    ss >> loaded;
    EXPECT_TRUE(ss.empty());
    ASSERT_EQ(loaded.Size(), 3u);
    EXPECT_EQ(*loaded.GetTier(2), *table_.GetTier(2));
    EXPECT_TRUE(loaded.IsConsistent());
}
