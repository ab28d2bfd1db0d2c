// CASHSEED - CashAddr Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/crypto/cashaddr.h"

#include <cctype>
#include <cstring>

namespace cashseed {
namespace cashaddr {

namespace {

int8_t SymbolValue(char c) {
    const char* pos = std::strchr(CHARSET, c);
    if (c == '\0' || pos == nullptr) {
        return -1;
    }
    return static_cast<int8_t>(pos - CHARSET);
}

std::vector<uint8_t> CreateChecksum(const std::string& prefix,
                                    const std::vector<uint8_t>& payload5) {
    std::vector<uint8_t> values = ExpandPrefix(prefix);
    values.insert(values.end(), payload5.begin(), payload5.end());
    values.resize(values.size() + CHECKSUM_SIZE, 0);
    
    uint64_t mod = PolyMod(values);
    std::vector<uint8_t> ret(CHECKSUM_SIZE);
    for (size_t i = 0; i < CHECKSUM_SIZE; ++i) {
        ret[i] = static_cast<uint8_t>((mod >> (5 * (7 - i))) & 0x1f);
    }
    return ret;
}

} // namespace

uint64_t PolyMod(const std::vector<uint8_t>& values) {
    uint64_t c = 1;
    for (uint8_t d : values) {
        uint8_t c0 = static_cast<uint8_t>(c >> 35);
        c = ((c & 0x07ffffffffULL) << 5) ^ d;
        if (c0 & 0x01) c ^= 0x98f2bc8e61ULL;
        if (c0 & 0x02) c ^= 0x79b76d99e2ULL;
        if (c0 & 0x04) c ^= 0xf33e5fb3c4ULL;
        if (c0 & 0x08) c ^= 0xae2eabe2a8ULL;
        if (c0 & 0x10) c ^= 0x1e4f43e470ULL;
    }
    return c ^ 1;
}

std::vector<uint8_t> ExpandPrefix(const std::string& prefix) {
    std::vector<uint8_t> ret;
    ret.reserve(prefix.size() + 1);
    for (char c : prefix) {
        ret.push_back(static_cast<uint8_t>(c) & 0x1f);
    }
    ret.push_back(0);
    return ret;
}

bool ConvertBits(int fromBits, int toBits, bool pad,
                 const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << toBits) - 1;
    const uint32_t maxAcc = (1u << (fromBits + toBits - 1)) - 1;
    
    for (uint8_t value : in) {
        if ((value >> fromBits) != 0) {
            return false;
        }
        acc = ((acc << fromBits) | value) & maxAcc;
        bits += fromBits;
        while (bits >= toBits) {
            bits -= toBits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }
    
    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (toBits - bits)) & maxv));
        }
    } else if (bits >= fromBits || ((acc << (toBits - bits)) & maxv) != 0) {
        return false;
    }
    return true;
}

std::string Encode(const std::string& prefix, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> payload5;
    ConvertBits(8, 5, true, payload, payload5);
    
    std::vector<uint8_t> checksum = CreateChecksum(prefix, payload5);
    
    std::string result = prefix + ":";
    result.reserve(result.size() + payload5.size() + checksum.size());
    for (uint8_t v : payload5) {
        result += CHARSET[v];
    }
    for (uint8_t v : checksum) {
        result += CHARSET[v];
    }
    return result;
}

std::optional<Content> Decode(const std::string& str, const std::string& defaultPrefix) {
    bool hasLower = false;
    bool hasUpper = false;
    for (char c : str) {
        if (std::islower(static_cast<unsigned char>(c))) hasLower = true;
        if (std::isupper(static_cast<unsigned char>(c))) hasUpper = true;
    }
    if (hasLower && hasUpper) {
        return std::nullopt;
    }
    
    std::string lower = str;
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    
    std::string prefix = defaultPrefix;
    std::string body = lower;
    size_t colon = lower.rfind(':');
    if (colon != std::string::npos) {
        prefix = lower.substr(0, colon);
        body = lower.substr(colon + 1);
    }
    if (prefix.empty() || body.size() <= CHECKSUM_SIZE) {
        return std::nullopt;
    }
    
    std::vector<uint8_t> values;
    values.reserve(body.size());
    for (char c : body) {
        int8_t v = SymbolValue(c);
        if (v < 0) {
            return std::nullopt;
        }
        values.push_back(static_cast<uint8_t>(v));
    }
    
    std::vector<uint8_t> checked = ExpandPrefix(prefix);
    checked.insert(checked.end(), values.begin(), values.end());
    if (PolyMod(checked) != 0) {
        return std::nullopt;
    }
    
    values.resize(values.size() - CHECKSUM_SIZE);
    Content content;
    content.prefix = prefix;
    if (!ConvertBits(5, 8, false, values, content.payload)) {
        return std::nullopt;
    }
    return content;
}

} // namespace cashaddr
} // namespace cashseed
