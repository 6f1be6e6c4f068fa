// QUORUM - Hex Encoding
// Copyright (c) 2024 QUORUM Developers
// MIT License

#ifndef QUORUM_CORE_HEX_H
#define QUORUM_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace quorum {

/// Lowercase, no prefix
std::string BytesToHex(const uint8_t* data, size_t len);

inline std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

/// Accepts either case and an optional 0x prefix. Throws
/// std::invalid_argument on an odd digit count or a non-hex character.
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Non-empty, even-length, hex digits only (after an optional 0x)
bool IsValidHex(const std::string& str);

std::string StripHexPrefix(const std::string& hex);

} // namespace quorum

#endif // QUORUM_CORE_HEX_H
