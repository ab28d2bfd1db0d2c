// CASHSEED - CashAddr Encoding
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Bech32-style address text encoding with a 40-bit BCH-code checksum.
// Text form: <prefix>:<payload symbols><8 checksum symbols>, where the
// checksum covers the lower 5 bits of each prefix character, a zero
// separator, and the 5-bit payload.

#ifndef CASHSEED_CRYPTO_CASHADDR_H
#define CASHSEED_CRYPTO_CASHADDR_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cashseed {
namespace cashaddr {

/// Number of 5-bit checksum symbols
constexpr size_t CHECKSUM_SIZE = 8;

/// Symbol alphabet
constexpr const char* CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

/**
 * CashAddr checksum polynomial over 5-bit values.
 * Returns the final accumulator XOR 1, so a string with a valid checksum
 * yields 0.
 */
uint64_t PolyMod(const std::vector<uint8_t>& values);

/// Lower 5 bits of each prefix character followed by the zero separator
std::vector<uint8_t> ExpandPrefix(const std::string& prefix);

/**
 * Regroup bits from fromBits-wide values into toBits-wide values.
 * 
 * @param pad Pad the final group with zeros (encoding). Without padding
 *            any leftover non-zero bits make the conversion fail.
 * @return false on an input value wider than fromBits or bad padding
 */
bool ConvertBits(int fromBits, int toBits, bool pad,
                 const std::vector<uint8_t>& in, std::vector<uint8_t>& out);

/**
 * Encode an 8-bit payload (version byte || hash) under a prefix.
 * 
 * @param prefix Lowercase prefix, e.g. "bitcoincash"
 * @param payload Payload bytes
 * @return "<prefix>:<symbols>"
 */
std::string Encode(const std::string& prefix, const std::vector<uint8_t>& payload);

/// Decoded address content
struct Content {
    std::string prefix;
    std::vector<uint8_t> payload;
};

/**
 * Decode and checksum-verify a CashAddr string.
 * 
 * Accepts all-lowercase or all-uppercase text. A string without a prefix
 * is checked under defaultPrefix.
 * 
 * @return Content, or nullopt on mixed case, unknown symbols, a short
 *         string, or checksum failure
 */
std::optional<Content> Decode(const std::string& str, const std::string& defaultPrefix);

} // namespace cashaddr
} // namespace cashseed

#endif // CASHSEED_CRYPTO_CASHADDR_H
