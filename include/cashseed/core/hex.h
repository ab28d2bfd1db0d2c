// CASHSEED - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#ifndef CASHSEED_CORE_HEX_H
#define CASHSEED_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cashseed {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes.
/// Throws KeyError(InvalidEncodingInput) on odd length or a non-hex character.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace cashseed

#endif // CASHSEED_CORE_HEX_H
