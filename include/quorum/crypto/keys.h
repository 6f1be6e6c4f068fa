// QUORUM - secp256k1 Keys
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Recoverable ECDSA over secp256k1, backed by OpenSSL libcrypto.
//
// Compact signature layout (65 bytes): r (32) || s (32) || v (1),
// v in {27, 28} (0 and 1 are accepted on input). Account addresses are the
// last 20 bytes of Keccak-256 over the uncompressed public key (x || y).

#ifndef QUORUM_CRYPTO_KEYS_H
#define QUORUM_CRYPTO_KEYS_H

#include <quorum/core/types.h>

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace quorum {

/// Size of a compact recoverable signature
constexpr size_t COMPACT_SIGNATURE_SIZE = 65;

// ============================================================================
// Public Key
// ============================================================================

/**
 * Uncompressed secp256k1 public key (0x04 || x || y).
 */
class PublicKey {
public:
    static constexpr size_t SIZE = 65;

    /// Creates an invalid key
    PublicKey();

    /// Import an uncompressed point; the result is invalid if the bytes do
    /// not describe a point on the curve
    PublicKey(const Byte* data, size_t len);

    /// Check if this holds a point on the curve
    bool IsValid() const { return valid_; }

    const Byte* data() const { return data_.data(); }
    constexpr size_t size() const { return SIZE; }

    /// Account address derived from this key
    Address GetAddress() const;

    /// Recover the signing key from a 32-byte digest and compact signature
    static std::optional<PublicKey> RecoverCompact(const Hash256& hash,
                                                   const std::vector<Byte>& signature);

    bool operator==(const PublicKey& other) const;
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    std::array<Byte, SIZE> data_;
    bool valid_{false};
};

// ============================================================================
// Private Key
// ============================================================================

/**
 * secp256k1 secret scalar. Wiped on destruction.
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = 32;

    /// Creates an invalid key
    PrivateKey();

    /// Import a 32-byte big-endian scalar; invalid unless 0 < d < n
    PrivateKey(const Byte* data, size_t len);

    ~PrivateKey();

    PrivateKey(const PrivateKey& other) = default;
    PrivateKey& operator=(const PrivateKey& other) = default;

    bool IsValid() const { return valid_; }

    /// Compute the matching public key
    PublicKey GetPublicKey() const;

    /// Sign a 32-byte digest, producing a low-s compact signature with
    /// v in {27, 28}. Returns an empty vector if signing fails.
    std::vector<Byte> SignCompact(const Hash256& hash) const;

private:
    std::array<Byte, SIZE> data_;
    bool valid_{false};
};

} // namespace quorum

#endif // QUORUM_CRYPTO_KEYS_H
