// CASHSEED - BIP39 Mnemonic Codec Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/wallet/mnemonic.h"
#include "cashseed/core/error.h"
#include "cashseed/core/random.h"
#include "cashseed/crypto/hmac.h"
#include "cashseed/crypto/sha256.h"
#include "cashseed/util/logging.h"

#include <algorithm>
#include <sstream>

namespace cashseed {
namespace wallet {

namespace {

/// Write the low `count` bits of value, most significant first
void WriteBits(std::vector<Byte>& out, size_t& bitPos, uint32_t value, size_t count) {
    for (size_t j = count; j-- > 0;) {
        if ((value >> j) & 1) {
            out[bitPos / 8] |= static_cast<Byte>(1 << (7 - (bitPos % 8)));
        }
        ++bitPos;
    }
}

} // namespace

// ============================================================================
// Helpers
// ============================================================================

bool IsValidWordCount(size_t wordCount) {
    return wordCount >= MIN_MNEMONIC_WORDS && wordCount <= MAX_MNEMONIC_WORDS &&
           wordCount % 3 == 0;
}

size_t EntropySizeForWordCount(size_t wordCount) {
    if (!IsValidWordCount(wordCount)) {
        throw KeyError(ErrorCode::InvalidMnemonicLength,
                       "unsupported word count " + std::to_string(wordCount));
    }
    return (wordCount * BITS_PER_WORD - ChecksumBitsForWordCount(wordCount)) / 8;
}

size_t ChecksumBitsForWordCount(size_t wordCount) {
    return wordCount / 3;
}

size_t FinalWordFreeBits(size_t wordCount) {
    return BITS_PER_WORD - ChecksumBitsForWordCount(wordCount);
}

std::string JoinMnemonic(const std::vector<std::string>& words) {
    std::string result;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) result += ' ';
        result += words[i];
    }
    return result;
}

std::vector<std::string> SplitMnemonic(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream stream(text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

// ============================================================================
// MnemonicCodec
// ============================================================================

std::vector<uint16_t> MnemonicCodec::LookupIndices(const std::vector<std::string>& words) const {
    std::vector<uint16_t> indices;
    indices.reserve(words.size());
    for (size_t i = 0; i < words.size(); ++i) {
        auto idx = wordList_.IndexOf(words[i]);
        if (!idx) {
            // Position only: the word itself is secret
            throw KeyError(ErrorCode::InvalidMnemonicWord,
                           "word " + std::to_string(i + 1) + " is not in the word list");
        }
        indices.push_back(*idx);
    }
    return indices;
}

std::vector<std::string> MnemonicCodec::EntropyToMnemonic(const std::vector<Byte>& entropy) const {
    size_t len = entropy.size();
    if (len < 16 || len > 32 || len % 4 != 0) {
        throw KeyError(ErrorCode::InvalidEncodingInput,
                       "entropy must be 16, 20, 24, 28 or 32 bytes, got " + std::to_string(len));
    }
    
    Hash256 hash = SHA256Hash(entropy);
    
    // Checksum is at most 8 bits, so one hash byte covers it
    size_t checksumBits = len / 4;
    size_t wordCount = (len * 8 + checksumBits) / BITS_PER_WORD;
    
    std::vector<Byte> data(entropy);
    data.push_back(hash[0]);
    
    std::vector<std::string> words;
    words.reserve(wordCount);
    size_t bitPos = 0;
    
    for (size_t i = 0; i < wordCount; ++i) {
        uint16_t index = 0;
        for (int j = 10; j >= 0; --j) {
            size_t byteIdx = bitPos / 8;
            size_t bitIdx = 7 - (bitPos % 8);
            if (data[byteIdx] & (1 << bitIdx)) {
                index |= static_cast<uint16_t>(1 << j);
            }
            ++bitPos;
        }
        words.push_back(wordList_.Word(index));
    }
    
    SecureClear(data);
    return words;
}

std::vector<Byte> MnemonicCodec::MnemonicToEntropy(const std::vector<std::string>& words) const {
    std::vector<uint16_t> indices = LookupIndices(words);
    
    size_t totalBits = indices.size() * BITS_PER_WORD;
    if (!IsValidWordCount(indices.size())) {
        throw KeyError(ErrorCode::InvalidMnemonicLength,
                       "mnemonic carries " + std::to_string(totalBits) +
                       " bits, expected 132, 165, 198, 231 or 264");
    }
    
    size_t checksumBits = ChecksumBitsForWordCount(indices.size());
    size_t entropyBits = totalBits - checksumBits;
    
    std::vector<Byte> entropy(entropyBits / 8, 0);
    size_t bitPos = 0;
    for (size_t i = 0; i + 1 < indices.size(); ++i) {
        WriteBits(entropy, bitPos, indices[i], BITS_PER_WORD);
    }
    // The final word holds the last entropy bits followed by the checksum
    uint16_t last = indices.back();
    WriteBits(entropy, bitPos, last >> checksumBits, BITS_PER_WORD - checksumBits);
    
    uint32_t checksum = last & ((1u << checksumBits) - 1);
    Hash256 hash = SHA256Hash(entropy);
    uint32_t expected = hash[0] >> (8 - checksumBits);
    
    if (checksum != expected) {
        SecureClear(entropy);
        throw KeyError(ErrorCode::ChecksumMismatch, "mnemonic checksum does not match");
    }
    
    return entropy;
}

void MnemonicCodec::Verify(const std::vector<std::string>& words) const {
    std::vector<Byte> entropy = MnemonicToEntropy(words);
    SecureClear(entropy);
}

bool MnemonicCodec::IsValid(const std::vector<std::string>& words) const {
    try {
        Verify(words);
        return true;
    } catch (const KeyError&) {
        return false;
    }
}

std::vector<std::string> MnemonicCodec::GenerateRandom(size_t numWords) const {
    std::vector<Byte> entropy = GetStrongRandBytes(EntropySizeForWordCount(numWords));
    std::vector<std::string> words = EntropyToMnemonic(entropy);
    SecureClear(entropy);
    
    LOG_DEBUG(util::LogCategory::MNEMONIC) << "Generated " << numWords << "-word mnemonic";
    return words;
}

std::vector<std::string> MnemonicCodec::ComputeFinalWord(
    const std::vector<std::string>& precedingWords,
    const std::string& finalBits) const {
    
    std::vector<uint16_t> indices = LookupIndices(precedingWords);
    
    size_t wordCount = indices.size() + 1;
    if (!IsValidWordCount(wordCount)) {
        throw KeyError(ErrorCode::InvalidMnemonicLength,
                       "expected 11, 14, 17, 20 or 23 preceding words, got " +
                       std::to_string(indices.size()));
    }
    
    size_t freeBits = FinalWordFreeBits(wordCount);
    if (finalBits.size() != freeBits) {
        throw KeyError(ErrorCode::InvalidEncodingInput,
                       "expected " + std::to_string(freeBits) + " final bits, got " +
                       std::to_string(finalBits.size()));
    }
    if (finalBits.find_first_not_of("01") != std::string::npos) {
        throw KeyError(ErrorCode::InvalidEncodingInput, "final bits must be '0' or '1'");
    }
    
    // (wordCount - 1) * 11 + freeBits is exactly the entropy length
    std::vector<Byte> entropy(EntropySizeForWordCount(wordCount), 0);
    size_t bitPos = 0;
    for (uint16_t idx : indices) {
        WriteBits(entropy, bitPos, idx, BITS_PER_WORD);
    }
    for (char c : finalBits) {
        WriteBits(entropy, bitPos, c == '1' ? 1 : 0, 1);
    }
    
    std::vector<std::string> words = EntropyToMnemonic(entropy);
    SecureClear(entropy);
    
    LOG_DEBUG(util::LogCategory::MNEMONIC) << "Computed final word for "
                                           << wordCount << "-word mnemonic";
    return words;
}

// ============================================================================
// Seed Derivation
// ============================================================================

std::array<Byte, BIP39_SEED_SIZE> MnemonicToSeed(const std::vector<std::string>& words,
                                                 const std::string& passphrase) {
    CASHSEED_LOG_TIMER(util::LogCategory::SEED, "PBKDF2 seed derivation");
    
    std::string sentence = JoinMnemonic(words);
    std::string salt = "mnemonic" + passphrase;
    
    std::vector<Byte> derived = PBKDF2_SHA512(sentence, salt, BIP39_PBKDF2_ROUNDS,
                                              BIP39_SEED_SIZE);
    
    std::array<Byte, BIP39_SEED_SIZE> seed{};
    std::copy(derived.begin(), derived.end(), seed.begin());
    
    SecureClear(derived);
    SecureClear(sentence);
    SecureClear(salt);
    return seed;
}

} // namespace wallet
} // namespace cashseed
