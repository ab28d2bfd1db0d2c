// CASHSEED - Base58 Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/crypto/base58.h"
#include "cashseed/crypto/hmac.h"
#include "cashseed/crypto/sha256.h"

namespace cashseed {

namespace {

const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

/// Reverse lookup of the alphabet, -1 for characters outside it
int8_t Base58Digit(char c) {
    static const struct Table {
        int8_t map[256];
        Table() {
            for (auto& v : map) v = -1;
            for (int i = 0; BASE58_ALPHABET[i] != '\0'; ++i) {
                map[static_cast<uint8_t>(BASE58_ALPHABET[i])] = static_cast<int8_t>(i);
            }
        }
    } table;
    return table.map[static_cast<uint8_t>(c)];
}

} // namespace

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    size_t zeroes = 0;
    while (zeroes < data.size() && data[zeroes] == 0) {
        ++zeroes;
    }
    
    // log(256) / log(58), rounded up
    size_t size = (data.size() - zeroes) * 138 / 100 + 1;
    std::vector<uint8_t> b58(size);
    size_t length = 0;
    
    for (size_t i = zeroes; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }
    
    auto it = b58.begin() + static_cast<std::ptrdiff_t>(b58.size() - length);
    while (it != b58.end() && *it == 0) {
        ++it;
    }
    
    std::string str;
    str.reserve(zeroes + static_cast<size_t>(b58.end() - it));
    str.assign(zeroes, '1');
    while (it != b58.end()) {
        str += BASE58_ALPHABET[*it++];
    }
    return str;
}

std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str) {
    size_t zeroes = 0;
    while (zeroes < str.size() && str[zeroes] == '1') {
        ++zeroes;
    }
    
    // log(58) / log(256), rounded up
    size_t size = (str.size() - zeroes) * 733 / 1000 + 1;
    std::vector<uint8_t> b256(size);
    size_t length = 0;
    
    for (size_t i = zeroes; i < str.size(); ++i) {
        int carry = Base58Digit(str[i]);
        if (carry < 0) {
            return std::nullopt;
        }
        size_t j = 0;
        for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }
    
    auto it = b256.begin() + static_cast<std::ptrdiff_t>(b256.size() - length);
    while (it != b256.end() && *it == 0) {
        ++it;
    }
    
    std::vector<uint8_t> result;
    result.reserve(zeroes + static_cast<size_t>(b256.end() - it));
    result.assign(zeroes, 0x00);
    result.insert(result.end(), it, b256.end());
    return result;
}

std::string EncodeBase58Check(const std::vector<uint8_t>& payload) {
    Hash256 hash = DoubleSHA256(payload.data(), payload.size());
    
    std::vector<uint8_t> withChecksum = payload;
    withChecksum.insert(withChecksum.end(), hash.begin(), hash.begin() + BASE58_CHECKSUM_SIZE);
    return EncodeBase58(withChecksum);
}

std::optional<std::vector<uint8_t>> DecodeBase58Check(const std::string& str) {
    auto data = DecodeBase58(str);
    if (!data || data->size() < BASE58_CHECKSUM_SIZE) {
        return std::nullopt;
    }
    
    std::vector<uint8_t> payload(data->begin(), data->end() - BASE58_CHECKSUM_SIZE);
    Hash256 hash = DoubleSHA256(payload.data(), payload.size());
    
    if (!ConstantTimeCompare(hash.data(), data->data() + payload.size(), BASE58_CHECKSUM_SIZE)) {
        return std::nullopt;
    }
    return payload;
}

} // namespace cashseed
