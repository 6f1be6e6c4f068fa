// QUORUM - Core Types
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Value types shared by the crypto and governance layers.

#ifndef QUORUM_CORE_TYPES_H
#define QUORUM_CORE_TYPES_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace quorum {

using Byte = uint8_t;

/// Position on the monotonic ordering clock (block height)
using Checkpoint = uint64_t;

/// Token-weighted voting power
using Weight = uint64_t;

/// a + b, or nullopt on overflow
inline std::optional<uint64_t> AddChecked(uint64_t a, uint64_t b) {
    if (b > std::numeric_limits<uint64_t>::max() - a) {
        return std::nullopt;
    }
    return a + b;
}

/// a - b, or nullopt on underflow
inline std::optional<uint64_t> SubChecked(uint64_t a, uint64_t b) {
    return b > a ? std::nullopt : std::optional<uint64_t>(a - b);
}

/**
 * N bytes in natural (big-endian) order, as 32-byte ABI words and 20-byte
 * account addresses are written. Zero-initialised; ordered bytewise so it
 * can key a std::map.
 */
template<size_t N>
class FixedBytes {
public:
    static constexpr size_t SIZE = N;

    FixedBytes() noexcept : bytes_{} {}

    /// Copies min(len, N) bytes; the rest stay zero
    FixedBytes(const Byte* src, size_t len) noexcept : bytes_{} {
        if (src) {
            std::copy(src, src + std::min(len, N), bytes_.begin());
        }
    }

    bool IsNull() const noexcept {
        return std::all_of(bytes_.begin(), bytes_.end(), [](Byte b) { return b == 0; });
    }
    void SetNull() noexcept { bytes_.fill(0); }

    constexpr size_t size() const noexcept { return N; }
    Byte* data() noexcept { return bytes_.data(); }
    const Byte* data() const noexcept { return bytes_.data(); }

    Byte* begin() noexcept { return bytes_.data(); }
    Byte* end() noexcept { return bytes_.data() + N; }
    const Byte* begin() const noexcept { return bytes_.data(); }
    const Byte* end() const noexcept { return bytes_.data() + N; }

    Byte& operator[](size_t i) { return bytes_[i]; }
    Byte operator[](size_t i) const { return bytes_[i]; }

    friend bool operator==(const FixedBytes& a, const FixedBytes& b) { return a.bytes_ == b.bytes_; }
    friend bool operator!=(const FixedBytes& a, const FixedBytes& b) { return a.bytes_ != b.bytes_; }
    friend bool operator<(const FixedBytes& a, const FixedBytes& b) { return a.bytes_ < b.bytes_; }

    /// Lowercase hex, no prefix
    std::string ToHex() const;
    /// 0x-prefixed lowercase hex
    std::string ToString() const { return "0x" + ToHex(); }

    /// Exactly 2*N hex digits, optional 0x prefix; throws std::invalid_argument
    static FixedBytes FromHex(const std::string& hex);

private:
    std::array<Byte, N> bytes_;
};

/// Keccak digests and ABI words
using Hash256 = FixedBytes<32>;

/// Account and contract identifiers
using Address = FixedBytes<20>;

extern template class FixedBytes<32>;
extern template class FixedBytes<20>;

} // namespace quorum

#endif // QUORUM_CORE_TYPES_H
