// QUORUM - Key and Compact Signature Tests
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include <gtest/gtest.h>
#include "quorum/crypto/keys.h"
#include "quorum/crypto/keccak.h"
#include "quorum/core/hex.h"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

namespace quorum {
namespace test {

namespace {

PrivateKey KeyFromHex(const std::string& hex) {
    std::vector<Byte> bytes = HexToBytes(hex);
    return PrivateKey(bytes.data(), bytes.size());
}

PrivateKey SmallKey(Byte value) {
    std::array<Byte, PrivateKey::SIZE> secret{};
    secret[PrivateKey::SIZE - 1] = value;
    return PrivateKey(secret.data(), secret.size());
}

} // anonymous namespace

// ============================================================================
// PrivateKey Tests
// ============================================================================

TEST(PrivateKeyTest, DefaultIsInvalid) {
    PrivateKey key;
    EXPECT_FALSE(key.IsValid());
    EXPECT_FALSE(key.GetPublicKey().IsValid());
    EXPECT_TRUE(key.SignCompact(Hash256()).empty());
}

TEST(PrivateKeyTest, RejectsOutOfRangeSecrets) {
    EXPECT_FALSE(SmallKey(0).IsValid());
    // Curve order n and above
    EXPECT_FALSE(KeyFromHex("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141").IsValid());
    EXPECT_FALSE(KeyFromHex("ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff").IsValid());
    EXPECT_TRUE(KeyFromHex("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364140").IsValid());
}

TEST(PrivateKeyTest, RejectsWrongLength) {
    std::vector<Byte> shortSecret(31, 0x01);
    EXPECT_FALSE(PrivateKey(shortSecret.data(), shortSecret.size()).IsValid());
}

// ============================================================================
// PublicKey Tests
// ============================================================================

TEST(PublicKeyTest, KnownAddressForKeyOne) {
    PrivateKey key = SmallKey(1);
    ASSERT_TRUE(key.IsValid());

    PublicKey pubkey = key.GetPublicKey();
    ASSERT_TRUE(pubkey.IsValid());
    EXPECT_EQ(pubkey.data()[0], 0x04);
    EXPECT_EQ(pubkey.GetAddress().ToString(), "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
}

TEST(PublicKeyTest, RejectsNonUncompressedEncoding) {
    std::vector<Byte> compressed(33, 0x02);
    EXPECT_FALSE(PublicKey(compressed.data(), compressed.size()).IsValid());
    EXPECT_TRUE(PublicKey().GetAddress().IsNull());
}

// ============================================================================
// Compact Signature Tests
// ============================================================================

TEST(CompactSignatureTest, SignAndRecover) {
    PrivateKey key = SmallKey(7);
    Hash256 hash = Keccak256Hash(std::string("ballot"));

    std::vector<Byte> signature = key.SignCompact(hash);
    ASSERT_EQ(signature.size(), COMPACT_SIGNATURE_SIZE);
    EXPECT_TRUE(signature[64] == 27 || signature[64] == 28);

    auto recovered = PublicKey::RecoverCompact(hash, signature);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, key.GetPublicKey());
}

TEST(CompactSignatureTest, SignatureIsLowS) {
    // n / 2
    std::vector<Byte> halfOrder =
        HexToBytes("7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a0");
    PrivateKey key = SmallKey(9);
    for (int i = 0; i < 8; ++i) {
        Hash256 hash = Keccak256Hash(std::string("message ") + std::to_string(i));
        std::vector<Byte> signature = key.SignCompact(hash);
        ASSERT_EQ(signature.size(), COMPACT_SIGNATURE_SIZE);
        std::vector<Byte> s(signature.begin() + 32, signature.begin() + 64);
        EXPECT_LE(s, halfOrder);
    }
}

TEST(CompactSignatureTest, RawRecoveryIdAccepted) {
    PrivateKey key = SmallKey(5);
    Hash256 hash = Keccak256Hash(std::string("raw v"));
    std::vector<Byte> signature = key.SignCompact(hash);
    ASSERT_EQ(signature.size(), COMPACT_SIGNATURE_SIZE);

    signature[64] = static_cast<Byte>(signature[64] - 27);
    auto recovered = PublicKey::RecoverCompact(hash, signature);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, key.GetPublicKey());
}

TEST(CompactSignatureTest, RejectsMalformedSignatures) {
    PrivateKey key = SmallKey(5);
    Hash256 hash = Keccak256Hash(std::string("malformed"));
    std::vector<Byte> signature = key.SignCompact(hash);
    ASSERT_EQ(signature.size(), COMPACT_SIGNATURE_SIZE);

    std::vector<Byte> truncated(signature.begin(), signature.end() - 1);
    EXPECT_FALSE(PublicKey::RecoverCompact(hash, truncated).has_value());

    std::vector<Byte> badV = signature;
    badV[64] = 31;
    EXPECT_FALSE(PublicKey::RecoverCompact(hash, badV).has_value());

    std::vector<Byte> zeroR = signature;
    std::fill(zeroR.begin(), zeroR.begin() + 32, 0);
    EXPECT_FALSE(PublicKey::RecoverCompact(hash, zeroR).has_value());
}

TEST(CompactSignatureTest, DifferentHashRecoversDifferentKey) {
    PrivateKey key = SmallKey(11);
    Hash256 signedHash = Keccak256Hash(std::string("for"));
    Hash256 otherHash = Keccak256Hash(std::string("against"));

    auto recovered = PublicKey::RecoverCompact(otherHash, key.SignCompact(signedHash));
    if (recovered) {
        EXPECT_NE(*recovered, key.GetPublicKey());
    }
}

} // namespace test
} // namespace quorum
