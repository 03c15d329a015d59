// TOKENLEDGER - Staking Reward Accumulator Tests
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "tokenledger/staking/reward_accumulator.h"

#include <cstdint>

using namespace tokenledger;
using namespace tokenledger::staking;

namespace {

constexpr Timestamp T0 = 1700000000;
constexpr Duration THIRTY_DAYS = 30 * SECONDS_PER_DAY;

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class RewardAccumulatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_.rewardRatePerSecondPerUnit = 1000000000000000ULL;  // 1e15
        params_.minStakingDuration = 7 * SECONDS_PER_DAY;
        params_.earlyUnstakeFeeBps = 500;
    }

    StakingParams params_;
    TierTable tiers_;
    RewardAccumulator acc_{params_, tiers_};
    StakerInfo info_;
};

// ============================================================================
// Accrual
// ============================================================================

TEST_F(RewardAccumulatorTest, ThirtyDaysAtBaseMultiplier) {
    ASSERT_TRUE(acc_.Stake(info_, 100, T0).ok());

    Amount pending = 0;
    ASSERT_TRUE(acc_.PendingRewards(info_, T0 + THIRTY_DAYS, &pending).ok());
    EXPECT_EQ(pending, 259200u);

    ASSERT_TRUE(acc_.Settle(info_, T0 + THIRTY_DAYS).ok());
    EXPECT_EQ(info_.accumulatedRewards, 259200u);
    EXPECT_EQ(info_.lastClaimTimestamp, T0 + THIRTY_DAYS);
}

TEST_F(RewardAccumulatorTest, TierMultiplierScalesReward) {
    ASSERT_TRUE(tiers_.AddTier(Tier("Bronze", 50, 15000)).ok());
    ASSERT_TRUE(acc_.Stake(info_, 100, T0).ok());
    EXPECT_EQ(info_.tierIndex, 0u);

    Amount pending = 0;
    ASSERT_TRUE(acc_.PendingRewards(info_, T0 + THIRTY_DAYS, &pending).ok());
    EXPECT_EQ(pending, 388800u);
}

TEST_F(RewardAccumulatorTest, SettleIsIdempotent) {
    ASSERT_TRUE(acc_.Stake(info_, 100, T0).ok());
    ASSERT_TRUE(acc_.Settle(info_, T0 + 1000).ok());
    StakerInfo once = info_;
    ASSERT_TRUE(acc_.Settle(info_, T0 + 1000).ok());
    EXPECT_EQ(info_, once);
}

TEST_F(RewardAccumulatorTest, ClockBehindWindowAccruesNothing) {
    ASSERT_TRUE(acc_.Stake(info_, 100, T0).ok());
    ASSERT_TRUE(acc_.Settle(info_, T0 + 1000).ok());
    Amount before = info_.accumulatedRewards;

    ASSERT_TRUE(acc_.Settle(info_, T0 + 10).ok());
    EXPECT_EQ(info_.accumulatedRewards, before);
    EXPECT_EQ(info_.lastClaimTimestamp, T0 + 1000);
}

TEST_F(RewardAccumulatorTest, TopUpSettlesAtOldStake) {
    ASSERT_TRUE(acc_.Stake(info_, 100, T0).ok());
    ASSERT_TRUE(acc_.Stake(info_, 100, T0 + THIRTY_DAYS).ok());
    EXPECT_EQ(info_.accumulatedRewards, 259200u);
    EXPECT_EQ(info_.stakedAmount, 200u);

    Amount pending = 0;
    ASSERT_TRUE(acc_.PendingRewards(info_, T0 + 2 * THIRTY_DAYS, &pending).ok());
    EXPECT_EQ(pending, 259200u + 518400u);
}

TEST_F(RewardAccumulatorTest, RestakeFromZeroRestartsWindow) {
    ASSERT_TRUE(acc_.Stake(info_, 100, T0).ok());
    UnstakeResult result;
    ASSERT_TRUE(acc_.Unstake(info_, 100, T0 + THIRTY_DAYS, &result).ok());
    EXPECT_EQ(info_.accumulatedRewards, 259200u);

    // Idle for thirty days with nothing staked
    ASSERT_TRUE(acc_.Stake(info_, 100, T0 + 2 * THIRTY_DAYS).ok());
    EXPECT_EQ(info_.lastClaimTimestamp, T0 + 2 * THIRTY_DAYS);
    EXPECT_EQ(info_.accumulatedRewards, 259200u);
}

TEST_F(RewardAccumulatorTest, RateChangeAppliesAtNextSettle) {
    ASSERT_TRUE(acc_.Stake(info_, 100, T0).ok());
    params_.rewardRatePerSecondPerUnit = 2000000000000000ULL;

    Amount pending = 0;
    ASSERT_TRUE(acc_.PendingRewards(info_, T0 + THIRTY_DAYS, &pending).ok());
    EXPECT_EQ(pending, 518400u);
}

TEST_F(RewardAccumulatorTest, OverflowIsReported) {
    params_.rewardRatePerSecondPerUnit = UINT64_MAX;
    ASSERT_TRUE(acc_.Stake(info_, MAX_SUPPLY, T0).ok());

    Amount pending = 0;
    Status s = acc_.PendingRewards(info_, T0 + 100 * 365 * SECONDS_PER_DAY, &pending);
    EXPECT_TRUE(s == Status::ARITHMETIC_OVERFLOW);
}

// ============================================================================
// Stake / Unstake
// ============================================================================

TEST_F(RewardAccumulatorTest, StakeZeroRejected) {
    EXPECT_TRUE(acc_.Stake(info_, 0, T0) == Status::INVALID_AMOUNT);
    EXPECT_FALSE(info_.IsStaking());
}

TEST_F(RewardAccumulatorTest, TierFollowsStakeAmount) {
    ASSERT_TRUE(tiers_.AddTier(Tier("Bronze", 100, 10000)).ok());
    ASSERT_TRUE(tiers_.AddTier(Tier("Silver", 500, 12000)).ok());
    ASSERT_TRUE(tiers_.AddTier(Tier("Gold", 1000, 15000)).ok());

    ASSERT_TRUE(acc_.Stake(info_, 100, T0).ok());
    EXPECT_EQ(info_.tierIndex, 0u);
    ASSERT_TRUE(acc_.Stake(info_, 400, T0 + 1).ok());
    EXPECT_EQ(info_.tierIndex, 1u);
    ASSERT_TRUE(acc_.Stake(info_, 500, T0 + 2).ok());
    EXPECT_EQ(info_.tierIndex, 2u);

    UnstakeResult result;
    ASSERT_TRUE(acc_.Unstake(info_, 1000, T0 + 3, &result).ok());
    EXPECT_EQ(info_.tierIndex, 0u);
}

TEST_F(RewardAccumulatorTest, EarlyUnstakePaysFee) {
    ASSERT_TRUE(acc_.Stake(info_, 1000, T0).ok());

    UnstakeResult result;
    ASSERT_TRUE(acc_.Unstake(info_, 1000, T0 + 3 * SECONDS_PER_DAY, &result).ok());
    EXPECT_EQ(result.fee, 50u);
    EXPECT_EQ(result.transferOut, 950u);
    EXPECT_EQ(info_.stakedAmount, 0u);
}

TEST_F(RewardAccumulatorTest, MatureUnstakeIsFree) {
    ASSERT_TRUE(acc_.Stake(info_, 1000, T0).ok());

    UnstakeResult result;
    ASSERT_TRUE(acc_.Unstake(info_, 400, T0 + 7 * SECONDS_PER_DAY, &result).ok());
    EXPECT_EQ(result.fee, 0u);
    EXPECT_EQ(result.transferOut, 400u);
    EXPECT_EQ(info_.stakedAmount, 600u);
}

TEST_F(RewardAccumulatorTest, TopUpRestartsMinimumDuration) {
    ASSERT_TRUE(acc_.Stake(info_, 1000, T0).ok());
    ASSERT_TRUE(acc_.Stake(info_, 1000, T0 + 6 * SECONDS_PER_DAY).ok());

    UnstakeResult result;
    ASSERT_TRUE(acc_.Unstake(info_, 1000, T0 + 8 * SECONDS_PER_DAY, &result).ok());
    EXPECT_EQ(result.fee, 50u);
}

TEST_F(RewardAccumulatorTest, UnboundedMinimumDurationKeepsEveryUnstakeEarly) {
    params_.minStakingDuration = INT64_MAX;
    ASSERT_TRUE(acc_.Stake(info_, 1000, 1000).ok());

    UnstakeResult result;
    ASSERT_TRUE(acc_.Unstake(info_, 1000, 2000, &result).ok());
    EXPECT_EQ(result.fee, 50u);
    EXPECT_EQ(result.transferOut, 950u);
}

TEST_F(RewardAccumulatorTest, UnstakeBeyondStake) {
    ASSERT_TRUE(acc_.Stake(info_, 100, T0).ok());
    StakerInfo before = info_;

    UnstakeResult result;
    EXPECT_TRUE(acc_.Unstake(info_, 101, T0 + 10, &result) == Status::INSUFFICIENT_STAKE);
    EXPECT_TRUE(acc_.Unstake(info_, 0, T0 + 10, &result) == Status::INVALID_AMOUNT);
    EXPECT_EQ(info_, before);
}

// ============================================================================
// Claim
// ============================================================================

TEST_F(RewardAccumulatorTest, ClaimPaysAndResets) {
    ASSERT_TRUE(acc_.Stake(info_, 100, T0).ok());

    Amount claimed = 0;
    ASSERT_TRUE(acc_.Claim(info_, T0 + THIRTY_DAYS, &claimed).ok());
    EXPECT_EQ(claimed, 259200u);
    EXPECT_EQ(info_.accumulatedRewards, 0u);
    EXPECT_EQ(info_.totalClaimed, 259200u);
    EXPECT_EQ(info_.lastClaimTimestamp, T0 + THIRTY_DAYS);

    EXPECT_TRUE(acc_.Claim(info_, T0 + THIRTY_DAYS, &claimed) == Status::NOTHING_TO_CLAIM);
}

TEST_F(RewardAccumulatorTest, ClaimWithoutStake) {
    Amount claimed = 0;
    EXPECT_TRUE(acc_.Claim(info_, T0, &claimed) == Status::NOTHING_TO_CLAIM);
}

TEST_F(RewardAccumulatorTest, ClaimAfterFullUnstake) {
    ASSERT_TRUE(acc_.Stake(info_, 100, T0).ok());
    UnstakeResult result;
    ASSERT_TRUE(acc_.Unstake(info_, 100, T0 + THIRTY_DAYS, &result).ok());

    Amount claimed = 0;
    ASSERT_TRUE(acc_.Claim(info_, T0 + 2 * THIRTY_DAYS, &claimed).ok());
    EXPECT_EQ(claimed, 259200u);
}
