// QUORUM - Core Types
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/core/types.h"
#include "quorum/core/hex.h"

#include <stdexcept>
#include <vector>

namespace quorum {

template<size_t N>
std::string FixedBytes<N>::ToHex() const {
    return BytesToHex(bytes_.data(), N);
}

template<size_t N>
FixedBytes<N> FixedBytes<N>::FromHex(const std::string& hex) {
    const std::string digits = StripHexPrefix(hex);
    if (digits.size() != 2 * N) {
        throw std::invalid_argument("expected " + std::to_string(2 * N) +
                                    " hex digits, got " + std::to_string(digits.size()));
    }
    const std::vector<Byte> raw = HexToBytes(digits);
    return FixedBytes(raw.data(), raw.size());
}

template class FixedBytes<32>;
template class FixedBytes<20>;

} // namespace quorum
