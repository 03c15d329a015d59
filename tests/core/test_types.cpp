// TOKENLEDGER - Core Types Tests
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "tokenledger/core/status.h"
#include "tokenledger/core/types.h"

#include <set>
#include <stdexcept>

using namespace tokenledger;

// ============================================================================
// Hash Types
// ============================================================================

TEST(TypesTest, DefaultAddressIsNull) {
    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.size(), 20u);
}

TEST(TypesTest, HexRoundTrip) {
    const std::string hex = "00112233445566778899aabbccddeeff00112233";
    Address addr = Address::FromHex(hex);
    EXPECT_FALSE(addr.IsNull());
    EXPECT_EQ(addr.ToHex(), hex);
    EXPECT_EQ(Address::FromHex("0x" + hex), addr);
}

TEST(TypesTest, FromHexRejectsMalformedInput) {
    EXPECT_THROW(Address::FromHex("1234"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex("zz112233445566778899aabbccddeeff00112233"),
                 std::invalid_argument);
}

TEST(TypesTest, AddressOrderingIsStrictWeak) {
    std::array<Byte, 20> low{};
    std::array<Byte, 20> high{};
    low[19] = 1;
    high[19] = 2;
    Address a(low);
    Address b(high);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_FALSE(a < a);
}

// ============================================================================
// Reserved Accounts
// ============================================================================

TEST(TypesTest, ReservedAccountsAreDistinctAndInternal) {
    std::set<Address> reserved{StakingPoolAddress(), RewardPoolAddress(), VestingEscrowAddress()};
    EXPECT_EQ(reserved.size(), 3u);

    EXPECT_TRUE(IsInternalAddress(Address()));
    EXPECT_TRUE(IsInternalAddress(StakingPoolAddress()));
    EXPECT_TRUE(IsInternalAddress(RewardPoolAddress()));
    EXPECT_TRUE(IsInternalAddress(VestingEscrowAddress()));
}

TEST(TypesTest, OrdinaryAccountIsExternal) {
    std::array<Byte, 20> data{};
    data[0] = 0x01;
    data[19] = 0x01;  // differs from the staking pool in the last byte
    EXPECT_FALSE(IsInternalAddress(Address(data)));
}

TEST(TypesTest, SupplyRange) {
    EXPECT_TRUE(SupplyRange(0));
    EXPECT_TRUE(SupplyRange(MAX_SUPPLY));
    EXPECT_FALSE(SupplyRange(MAX_SUPPLY + 1));
}

// ============================================================================
// Status
// ============================================================================

TEST(StatusTest, OkStatus) {
    Status s = Status::Ok();
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.code(), Status::OK);
    EXPECT_EQ(s.ToString(), "OK");
}

TEST(StatusTest, ErrorCarriesCodeAndMessage) {
    Status s = Status::InsufficientBalance("needs 10");
    EXPECT_FALSE(s.ok());
    EXPECT_TRUE(s == Status::INSUFFICIENT_BALANCE);
    EXPECT_EQ(s.message(), "needs 10");
    EXPECT_EQ(s.ToString(), "InsufficientBalance: needs 10");
}

TEST(StatusTest, ErrorWithoutMessage) {
    EXPECT_EQ(Status::NothingToClaim().ToString(), "NothingToClaim");
    EXPECT_EQ(Status::ReentrantCall().ToString(), "ReentrantCall");
    EXPECT_EQ(Status::TierOrderingViolation().ToString(), "TierOrderingViolation");
}
