// QUORUM - Keccak-256 Hash Function
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Keccak-256 with the original (pre-FIPS 202) multi-rate padding, the
// variant used for Ethereum-style selectors, typed-data digests and
// address derivation. This is NOT SHA3-256.

#ifndef QUORUM_CRYPTO_KECCAK_H
#define QUORUM_CRYPTO_KECCAK_H

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "quorum/core/types.h"

namespace quorum {

/// Keccak-256 hasher class
class Keccak256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Sponge rate in bytes (1600 - 2 * 256 bits)
    static constexpr size_t RATE = 136;

    /// Default constructor - initializes to empty state
    Keccak256();

    /// Absorb data
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    Keccak256& Write(const Byte* data, size_t len);

    /// Absorb another hash
    Keccak256& Write(const Hash256& hash) {
        return Write(hash.data(), hash.size());
    }

    /// Pad, permute and write the digest
    /// @param hash Output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    /// @return Reference to this hasher (for chaining)
    Keccak256& Reset();

private:
    /// Sponge state (25 x 64-bit lanes)
    uint64_t state_[25];

    /// Buffer for a partial block
    Byte buffer_[RATE];

    /// Bytes currently in buffer_
    size_t buffered_;

    /// XOR a full block into the state and permute
    void AbsorbBlock(const Byte block[RATE]);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute Keccak-256 of data in a single call
Hash256 Keccak256Hash(const Byte* data, size_t len);

/// Compute Keccak-256 of a vector
inline Hash256 Keccak256Hash(const std::vector<Byte>& data) {
    return Keccak256Hash(data.data(), data.size());
}

/// Compute Keccak-256 of the bytes of a string
inline Hash256 Keccak256Hash(const std::string& str) {
    return Keccak256Hash(reinterpret_cast<const Byte*>(str.data()), str.size());
}

/// First four bytes of Keccak-256 of a function signature,
/// e.g. "transfer(address,uint256)" -> a9059cbb
std::array<Byte, 4> FunctionSelector(const std::string& signature);

} // namespace quorum

#endif // QUORUM_CRYPTO_KECCAK_H
