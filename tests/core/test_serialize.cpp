// TOKENLEDGER - Serialization Tests
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "tokenledger/core/serialize.h"
#include "tokenledger/core/types.h"

#include <ios>
#include <set>
#include <string>
#include <vector>

using namespace tokenledger;

// ============================================================================
// Integer Encoding
// ============================================================================

TEST(SerializeTest, Uint64IsLittleEndian) {
    DataStream ss;
    ss << static_cast<uint64_t>(0x0102030405060708ULL);

    ASSERT_EQ(ss.size(), 8u);
    EXPECT_EQ(ss.data()[0], 0x08);
    EXPECT_EQ(ss.data()[7], 0x01);
}

TEST(SerializeTest, NegativeTimestampSurvives) {
    DataStream ss;
    Timestamp in = -42;
    ss << in;

    Timestamp out = 0;
    ss >> out;
    EXPECT_EQ(out, -42);
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, BoolIsOneByte) {
    DataStream ss;
    ss << true << false;
    ASSERT_EQ(ss.size(), 2u);

    bool a = false;
    bool b = true;
    ss >> a >> b;
    EXPECT_TRUE(a);
    EXPECT_FALSE(b);
}

// ============================================================================
// Compact Size
// ============================================================================

TEST(SerializeTest, CompactSizeBoundaries) {
    struct Case { uint64_t value; size_t bytes; };
    for (const Case& c : {Case{0, 1}, Case{252, 1}, Case{253, 3}, Case{0xFFFF, 3},
                          Case{0x10000, 5}, Case{0xFFFFFFFFULL, 5}}) {
        DataStream ss;
        WriteCompactSize(ss, c.value);
        EXPECT_EQ(ss.size(), c.bytes) << c.value;
    }
}

TEST(SerializeTest, NonCanonicalCompactSizeRejected) {
    // 0xFD prefix carrying a value below 253
    const uint8_t raw[] = {0xFD, 0x10, 0x00};
    DataStream ss(raw, sizeof(raw));
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

// ============================================================================
// Strings, Hashes and Containers
// ============================================================================

TEST(SerializeTest, StringIsLengthPrefixed) {
    DataStream ss;
    ss << std::string("gold");
    ASSERT_EQ(ss.size(), 5u);
    EXPECT_EQ(ss.data()[0], 4);

    std::string out;
    ss >> out;
    EXPECT_EQ(out, "gold");
}

TEST(SerializeTest, AddressIsRawBytes) {
    Address addr = Address::FromHex("00112233445566778899aabbccddeeff00112233");
    DataStream ss;
    ss << addr;
    EXPECT_EQ(ss.size(), Address::SIZE);

    Address out;
    ss >> out;
    EXPECT_EQ(out, addr);
}

TEST(SerializeTest, StringSetKeepsOrder) {
    std::set<std::string> caps{"vote", "boost", "governance"};
    DataStream ss;
    ss << caps;

    std::set<std::string> out;
    ss >> out;
    EXPECT_EQ(out, caps);
}

TEST(SerializeTest, VectorOfIntegers) {
    std::vector<uint32_t> in{1, 2, 3};
    DataStream ss;
    ss << in;
    EXPECT_EQ(ss.size(), 1u + 3 * 4);

    std::vector<uint32_t> out;
    ss >> out;
    EXPECT_EQ(out, in);
}

TEST(SerializeTest, ReadPastEndThrows) {
    DataStream ss;
    ss << static_cast<uint32_t>(7);

    uint64_t out = 0;
    EXPECT_THROW(ss >> out, std::ios_base::failure);
}
