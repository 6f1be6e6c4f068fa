// QUORUM - Core Types Tests
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include <gtest/gtest.h>
#include "quorum/core/types.h"
#include "quorum/core/hex.h"

#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace quorum {
namespace test {

// ============================================================================
// Hex Tests
// ============================================================================

TEST(HexTest, BytesToHexIsLowercase) {
    std::vector<Byte> data = {0x00, 0xAB, 0xcd, 0xEF, 0x7f};
    EXPECT_EQ(BytesToHex(data), "00abcdef7f");
    EXPECT_EQ(BytesToHex(std::vector<Byte>{}), "");
}

TEST(HexTest, HexToBytesAcceptsPrefixAndMixedCase) {
    std::vector<Byte> expected = {0xde, 0xad, 0xbe, 0xef};
    EXPECT_EQ(HexToBytes("deadbeef"), expected);
    EXPECT_EQ(HexToBytes("0xDeAdBeEf"), expected);
    EXPECT_TRUE(HexToBytes("0x").empty());
}

TEST(HexTest, HexToBytesRejectsMalformed) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_TRUE(IsValidHex("0x00FF"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0x"));
    EXPECT_FALSE(IsValidHex("0f0"));
    EXPECT_FALSE(IsValidHex("g0"));
}

TEST(HexTest, StripHexPrefix) {
    EXPECT_EQ(StripHexPrefix("0x12"), "12");
    EXPECT_EQ(StripHexPrefix("0X12"), "12");
    EXPECT_EQ(StripHexPrefix("12"), "12");
}

// ============================================================================
// Hash256 Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    EXPECT_EQ(h.size(), 32u);
    for (size_t i = 0; i < Hash256::SIZE; ++i) {
        EXPECT_EQ(h[i], 0);
    }
}

TEST(Hash256Test, ShortInputIsZeroExtended) {
    Byte data[3] = {1, 2, 3};
    Hash256 h(data, sizeof(data));
    EXPECT_EQ(h[0], 1);
    EXPECT_EQ(h[2], 3);
    EXPECT_EQ(h[3], 0);
    EXPECT_EQ(h[31], 0);
}

TEST(Hash256Test, HexRoundTrip) {
    std::string hex = "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470";
    Hash256 h = Hash256::FromHex(hex);
    EXPECT_EQ(h[0], 0xc5);
    EXPECT_EQ(h[31], 0x70);
    EXPECT_EQ(h.ToHex(), hex);
    EXPECT_EQ(Hash256::FromHex("0x" + hex), h);
}

TEST(Hash256Test, FromHexRejectsWrongLength) {
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Hash256::FromHex(std::string(66, '0')), std::invalid_argument);
}

TEST(Hash256Test, OrderingAndSetNull) {
    Hash256 a;
    Hash256 b;
    b[31] = 1;
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);

    b.SetNull();
    EXPECT_EQ(a, b);
}

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, SizeIs20Bytes) {
    EXPECT_EQ(Address::SIZE, 20u);
    EXPECT_TRUE(Address().IsNull());
}

TEST(AddressTest, ToStringCarriesPrefix) {
    Address address = Address::FromHex("7E5F4552091A69125D5DFCB7B8C2659029395BDF");
    EXPECT_EQ(address.ToHex(), "7e5f4552091a69125d5dfcb7b8c2659029395bdf");
    EXPECT_EQ(address.ToString(), "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
    EXPECT_EQ(Address::FromHex(address.ToString()), address);
}

TEST(AddressTest, FromHexRejectsHashLength) {
    EXPECT_THROW(Address::FromHex(std::string(64, 'a')), std::invalid_argument);
}

TEST(AddressTest, UsableAsMapKey) {
    std::map<Address, int> balances;
    Address one = Address::FromHex("0x0000000000000000000000000000000000000001");
    Address two = Address::FromHex("0x0000000000000000000000000000000000000002");
    balances[two] = 2;
    balances[one] = 1;
    EXPECT_EQ(balances.begin()->first, one);
    EXPECT_EQ(balances[two], 2);
}

// ============================================================================
// Checked Arithmetic Tests
// ============================================================================

TEST(CheckedMathTest, AddChecked) {
    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();
    ASSERT_TRUE(AddChecked(2, 3).has_value());
    EXPECT_EQ(*AddChecked(2, 3), 5u);
    ASSERT_TRUE(AddChecked(MAX, 0).has_value());
    EXPECT_EQ(*AddChecked(MAX, 0), MAX);
    EXPECT_FALSE(AddChecked(MAX, 1).has_value());
    EXPECT_FALSE(AddChecked(MAX - 5, 10).has_value());
}

TEST(CheckedMathTest, SubChecked) {
    ASSERT_TRUE(SubChecked(5, 5).has_value());
    EXPECT_EQ(*SubChecked(5, 5), 0u);
    EXPECT_EQ(*SubChecked(10, 1), 9u);
    EXPECT_FALSE(SubChecked(0, 1).has_value());
}

} // namespace test
} // namespace quorum
