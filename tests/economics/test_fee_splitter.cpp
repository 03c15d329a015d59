// TOKENLEDGER - Transfer Fee Splitter Tests
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "tokenledger/economics/fee_splitter.h"

using namespace tokenledger;
using namespace tokenledger::economics;

namespace {

FeeDistribution MakeDistribution(uint32_t burn, uint32_t rewards, uint32_t dev) {
    FeeDistribution d;
    d.burnRatio = burn;
    d.rewardsRatio = rewards;
    d.devRatio = dev;
    return d;
}

void ExpectConserved(const FeeSplit& split, Amount gross) {
    EXPECT_EQ(split.net + split.burn + split.rewards + split.dev, gross);
    EXPECT_EQ(split.burn + split.rewards + split.dev, split.fee);
}

} // namespace

// ============================================================================
// Distribution
// ============================================================================

TEST(FeeDistributionTest, DefaultsSumToHundred) {
    FeeDistribution d;
    EXPECT_EQ(d.burnRatio, DEFAULT_BURN_RATIO);
    EXPECT_EQ(d.rewardsRatio, DEFAULT_REWARDS_RATIO);
    EXPECT_EQ(d.devRatio, DEFAULT_DEV_RATIO);
    EXPECT_TRUE(d.IsValid());
}

TEST(FeeDistributionTest, InvalidSums) {
    EXPECT_FALSE(MakeDistribution(50, 25, 24).IsValid());
    EXPECT_FALSE(MakeDistribution(50, 50, 1).IsValid());
    EXPECT_TRUE(MakeDistribution(100, 0, 0).IsValid());
}

// ============================================================================
// Configuration
// ============================================================================

class FeeSplitterTest : public ::testing::Test {
protected:
    FeeSplitter splitter_;
};

TEST_F(FeeSplitterTest, DefaultConfiguration) {
    EXPECT_EQ(splitter_.GetFeeBps(), DEFAULT_TRANSFER_FEE_BPS);
    EXPECT_EQ(splitter_.GetDistribution(), FeeDistribution());
}

TEST_F(FeeSplitterTest, FeeAboveMaximumRejected) {
    EXPECT_TRUE(splitter_.SetFeeBps(MAX_TRANSFER_FEE_BPS).ok());
    Status s = splitter_.SetFeeBps(MAX_TRANSFER_FEE_BPS + 1);
    EXPECT_TRUE(s == Status::INVALID_AMOUNT);
    EXPECT_EQ(splitter_.GetFeeBps(), MAX_TRANSFER_FEE_BPS);
}

TEST_F(FeeSplitterTest, BadDistributionRejectedAndNotApplied) {
    Status s = splitter_.SetDistribution(MakeDistribution(60, 30, 20));
    EXPECT_TRUE(s == Status::INVALID_RATIO);
    EXPECT_EQ(splitter_.GetDistribution(), FeeDistribution());
}

// ============================================================================
// Splitting
// ============================================================================

TEST_F(FeeSplitterTest, DefaultSplit) {
    // 1% of 10000 = 100, split 50/25/25
    FeeSplit split = splitter_.Apply(10000, false);
    EXPECT_EQ(split.fee, 100u);
    EXPECT_EQ(split.net, 9900u);
    EXPECT_EQ(split.burn, 50u);
    EXPECT_EQ(split.rewards, 25u);
    EXPECT_EQ(split.dev, 25u);
    EXPECT_EQ(split.dust, 0u);
    ExpectConserved(split, 10000);
}

TEST_F(FeeSplitterTest, DustGoesToBurn) {
    // fee = 3; floor shares 1/0/0 leave 2 units of dust
    FeeSplit split = splitter_.Apply(300, false);
    EXPECT_EQ(split.fee, 3u);
    EXPECT_EQ(split.rewards, 0u);
    EXPECT_EQ(split.dev, 0u);
    EXPECT_EQ(split.dust, 2u);
    EXPECT_EQ(split.burn, 3u);
    ExpectConserved(split, 300);
}

TEST_F(FeeSplitterTest, ExemptTransferPaysNothing) {
    FeeSplit split = splitter_.Apply(10000, true);
    EXPECT_EQ(split.fee, 0u);
    EXPECT_EQ(split.net, 10000u);
    ExpectConserved(split, 10000);
}

TEST_F(FeeSplitterTest, SmallAmountRoundsFeeToZero) {
    FeeSplit split = splitter_.Apply(99, false);
    EXPECT_EQ(split.fee, 0u);
    EXPECT_EQ(split.net, 99u);
}

TEST_F(FeeSplitterTest, ZeroFeeRate) {
    ASSERT_TRUE(splitter_.SetFeeBps(0).ok());
    FeeSplit split = splitter_.Apply(1000000, false);
    EXPECT_EQ(split.fee, 0u);
    EXPECT_EQ(split.net, 1000000u);
}

TEST_F(FeeSplitterTest, ConservationAcrossAmounts) {
    ASSERT_TRUE(splitter_.SetFeeBps(337).ok());
    ASSERT_TRUE(splitter_.SetDistribution(MakeDistribution(33, 33, 34)).ok());

    for (Amount gross : {Amount(1), Amount(97), Amount(12345), Amount(999999937),
                         MAX_SUPPLY}) {
        FeeSplit split = splitter_.Apply(gross, false);
        ExpectConserved(split, gross);
        EXPECT_EQ(split.fee, splitter_.ComputeFee(gross));
        EXPECT_LE(split.dust, 2u);
    }
}

TEST_F(FeeSplitterTest, MaximumFeeOnMaximumSupply) {
    ASSERT_TRUE(splitter_.SetFeeBps(MAX_TRANSFER_FEE_BPS).ok());
    FeeSplit split = splitter_.Apply(MAX_SUPPLY, false);
    EXPECT_EQ(split.fee, MAX_SUPPLY / 10);
    ExpectConserved(split, MAX_SUPPLY);
}
