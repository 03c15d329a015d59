// TOKENLEDGER - Ledger Configuration Tests
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "tokenledger/ledger/ledger_config.h"

namespace tokenledger {
namespace ledger {
namespace test {

namespace {

const char* ALICE_HEX = "0x00112233445566778899aabbccddeeff00112233";
const char* BOB_HEX = "ffeeddccbbaa99887766554433221100ffeeddcc";

} // namespace

class LedgerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        RegisterLedgerConfigKeys(config_);
    }

    Status Load(const std::string& content) {
        auto result = config_.ParseString(content, "test.conf");
        EXPECT_TRUE(result.success) << result.errorMessage;
        return LoadLedgerConfig(config_, &params_);
    }

    util::ConfigManager config_;
    LedgerParams params_;
};

// ============================================================================
// Defaults and Values
// ============================================================================

TEST_F(LedgerConfigTest, EmptyConfigGivesDefaults) {
    ASSERT_TRUE(Load("").ok());
    EXPECT_EQ(params_.transferFeeBps, economics::DEFAULT_TRANSFER_FEE_BPS);
    EXPECT_EQ(params_.feeDistribution.burnRatio, economics::DEFAULT_BURN_RATIO);
    EXPECT_EQ(params_.feeDistribution.rewardsRatio, economics::DEFAULT_REWARDS_RATIO);
    EXPECT_EQ(params_.feeDistribution.devRatio, economics::DEFAULT_DEV_RATIO);
    EXPECT_TRUE(params_.devWallet.IsNull());
    EXPECT_EQ(params_.staking.earlyUnstakeFeeBps, staking::DEFAULT_EARLY_UNSTAKE_FEE_BPS);
    EXPECT_EQ(params_.staking.minStakingDuration, staking::DEFAULT_MIN_STAKING_DURATION);
    EXPECT_TRUE(params_.tiers.empty());
    EXPECT_TRUE(params_.feeExempt.empty());
}

TEST_F(LedgerConfigTest, FullConfig) {
    Status s = Load(
        "transferfeebps=200\n"
        "burnratio=40\n"
        "rewardsratio=40\n"
        "devratio=20\n"
        "devwallet=" + std::string(ALICE_HEX) + "\n"
        "feeexempt=" + std::string(BOB_HEX) + "\n"
        "rewardrate=1000000000000000\n"
        "minstakingduration=86400\n"
        "earlyunstakefeebps=250\n"
        "[tier.1]\n"
        "name=Silver\n"
        "minimumstake=500\n"
        "multiplierbps=12000\n"
        "capabilities=vote\n"
        "[tier.0]\n"
        "name=Bronze\n"
        "minimumstake=100\n");
    ASSERT_TRUE(s.ok()) << s.ToString();

    EXPECT_EQ(params_.transferFeeBps, 200u);
    EXPECT_EQ(params_.feeDistribution.burnRatio, 40u);
    EXPECT_EQ(params_.feeDistribution.devRatio, 20u);
    EXPECT_EQ(params_.devWallet, Address::FromHex(ALICE_HEX));
    ASSERT_EQ(params_.feeExempt.size(), 1u);
    EXPECT_EQ(params_.feeExempt[0], Address::FromHex(BOB_HEX));
    EXPECT_EQ(params_.staking.rewardRatePerSecondPerUnit, 1000000000000000ULL);
    EXPECT_EQ(params_.staking.minStakingDuration, 86400);
    EXPECT_EQ(params_.staking.earlyUnstakeFeeBps, 250u);

    // Sections are ordered by their number, not by file order
    ASSERT_EQ(params_.tiers.size(), 2u);
    EXPECT_EQ(params_.tiers[0].name, "Bronze");
    EXPECT_EQ(params_.tiers[0].rewardMultiplierBps, staking::BASE_MULTIPLIER_BPS);
    EXPECT_EQ(params_.tiers[1].name, "Silver");
    EXPECT_TRUE(params_.tiers[1].HasCapability("vote"));

    EXPECT_TRUE(config_.Validate().empty());
}

TEST_F(LedgerConfigTest, TierNumbersOrderNumerically) {
    ASSERT_TRUE(Load(
        "[tier.10]\nname=Gold\nminimumstake=1000\n"
        "[tier.2]\nname=Silver\nminimumstake=500\n").ok());
    ASSERT_EQ(params_.tiers.size(), 2u);
    EXPECT_EQ(params_.tiers[0].name, "Silver");
    EXPECT_EQ(params_.tiers[1].name, "Gold");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(LedgerConfigTest, BadNumbers) {
    EXPECT_TRUE(Load("transferfeebps=lots\n") == Status::INVALID_AMOUNT);
}

TEST_F(LedgerConfigTest, FeeAboveMaximum) {
    EXPECT_TRUE(Load("transferfeebps=1001\n") == Status::INVALID_AMOUNT);
}

TEST_F(LedgerConfigTest, EarlyFeeAboveMaximum) {
    EXPECT_TRUE(Load("earlyunstakefeebps=2501\n") == Status::INVALID_AMOUNT);
}

TEST_F(LedgerConfigTest, RatiosMustSumToHundred) {
    EXPECT_TRUE(Load("burnratio=60\n") == Status::INVALID_RATIO);
}

TEST_F(LedgerConfigTest, RatioAboveHundred) {
    EXPECT_TRUE(Load("burnratio=101\n") == Status::INVALID_RATIO);
}

TEST_F(LedgerConfigTest, MalformedAddress) {
    EXPECT_TRUE(Load("devwallet=0x1234\n") == Status::INVALID_ADDRESS);
}

TEST_F(LedgerConfigTest, InternalDevWallet) {
    EXPECT_TRUE(Load("devwallet=0x0000000000000000000000000000000000000002\n") ==
                Status::INVALID_ADDRESS);
}

TEST_F(LedgerConfigTest, UnnumberedTierSection) {
    EXPECT_TRUE(Load("[tier.gold]\nname=Gold\nminimumstake=1\n") == Status::INVALID_TIER);
}

TEST_F(LedgerConfigTest, TierWithoutName) {
    EXPECT_TRUE(Load("[tier.0]\nminimumstake=1\n") == Status::INVALID_TIER);
}

TEST_F(LedgerConfigTest, TierOrdering) {
    EXPECT_TRUE(Load(
        "[tier.0]\nname=Gold\nminimumstake=1000\n"
        "[tier.1]\nname=Silver\nminimumstake=500\n") == Status::TIER_ORDERING_VIOLATION);
}

TEST_F(LedgerConfigTest, ParseAddressAcceptsBothForms) {
    Address a;
    Address b;
    ASSERT_TRUE(ParseAddress(" 0x00112233445566778899aabbccddeeff00112233 ", &a).ok());
    ASSERT_TRUE(ParseAddress("00112233445566778899aabbccddeeff00112233", &b).ok());
    EXPECT_EQ(a, b);
    EXPECT_TRUE(ParseAddress("zz112233445566778899aabbccddeeff00112233", &a) ==
                Status::INVALID_ADDRESS);
}

} // namespace test
} // namespace ledger
} // namespace tokenledger
