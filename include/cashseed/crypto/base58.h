// CASHSEED - Base58 and Base58Check Encoding
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Base58 text encoding with the Bitcoin alphabet. Base58Check appends the
// first four bytes of DoubleSHA256(payload) before encoding.

#ifndef CASHSEED_CRYPTO_BASE58_H
#define CASHSEED_CRYPTO_BASE58_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cashseed {

/// Size of the Base58Check checksum suffix
constexpr size_t BASE58_CHECKSUM_SIZE = 4;

/**
 * Encode raw bytes as Base58 (no checksum).
 * Leading zero bytes become leading '1' characters.
 */
std::string EncodeBase58(const std::vector<uint8_t>& data);

/**
 * Decode Base58 string to bytes.
 * @return Decoded bytes, or nullopt on a character outside the alphabet
 */
std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str);

/**
 * Encode data with Base58Check (payload + 4-byte checksum).
 */
std::string EncodeBase58Check(const std::vector<uint8_t>& payload);

/**
 * Decode Base58Check encoded string.
 * @return Payload without checksum, or nullopt on bad characters, short
 *         input, or checksum mismatch
 */
std::optional<std::vector<uint8_t>> DecodeBase58Check(const std::string& str);

} // namespace cashseed

#endif // CASHSEED_CRYPTO_BASE58_H
