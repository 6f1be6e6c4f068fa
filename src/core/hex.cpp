// QUORUM - Hex Encoding
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/core/hex.h"

#include <algorithm>
#include <stdexcept>

namespace quorum {

namespace {

constexpr char DIGITS[] = "0123456789abcdef";

/// 0-15, or -1 for a non-hex character
int Nibble(char c) {
    switch (c) {
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
            return c - '0';
        case 'a': case 'b': case 'c': case 'd': case 'e': case 'f':
            return 10 + (c - 'a');
        case 'A': case 'B': case 'C': case 'D': case 'E': case 'F':
            return 10 + (c - 'A');
        default:
            return -1;
    }
}

} // anonymous namespace

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string out(2 * len, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = DIGITS[data[i] >> 4];
        out[2 * i + 1] = DIGITS[data[i] & 0xf];
    }
    return out;
}

std::string StripHexPrefix(const std::string& hex) {
    bool prefixed = hex.size() >= 2 && hex[0] == '0' && (hex[1] | 0x20) == 'x';
    return prefixed ? hex.substr(2) : hex;
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    const std::string digits = StripHexPrefix(hex);
    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("odd number of hex digits");
    }

    std::vector<uint8_t> out(digits.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = Nibble(digits[2 * i]);
        int lo = Nibble(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("non-hex character at offset " + std::to_string(2 * i));
        }
        out[i] = static_cast<uint8_t>(hi << 4 | lo);
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    const std::string digits = StripHexPrefix(str);
    return !digits.empty() && digits.size() % 2 == 0 &&
           std::all_of(digits.begin(), digits.end(), [](char c) { return Nibble(c) >= 0; });
}

} // namespace quorum
