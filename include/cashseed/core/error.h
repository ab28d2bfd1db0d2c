// CASHSEED - Error Codes
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Every failure raised by mnemonic handling, key derivation and address
// encoding carries one of these codes so callers can decide on recovery
// (re-edit a word, discard an entry, reject a pasted key).

#ifndef CASHSEED_CORE_ERROR_H
#define CASHSEED_CORE_ERROR_H

#include <stdexcept>
#include <string>

namespace cashseed {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    /// Word is not in the word list
    InvalidMnemonicWord,
    /// Mnemonic bit length is not 132, 165, 198, 231 or 264
    InvalidMnemonicLength,
    /// Recomputed checksum disagrees with the final word
    ChecksumMismatch,
    /// Derived scalar is zero or not below the curve order
    ScalarOutOfRange,
    /// Extended key string fails its checksum or has bad fields
    MalformedExtendedKey,
    /// Hardened index passed to public-only derivation
    UnsupportedHardenedPublicDerivation,
    /// Malformed bytes or text passed to an encoder or decoder
    InvalidEncodingInput,
    /// Word list is not 2048 unique words or cannot be read
    InvalidWordList,
    /// Keys requested before a seed was generated
    SeedNotReady,
};

/// Stable name of an error code, e.g. "ChecksumMismatch"
const char* ErrorCodeToString(ErrorCode code);

// ============================================================================
// Exception Type
// ============================================================================

/**
 * Exception raised by every CASHSEED operation that rejects its input.
 *
 * Messages never contain mnemonic words, passphrases, seeds or private keys.
 */
class KeyError : public std::runtime_error {
public:
    KeyError(ErrorCode code, const std::string& message);
    
    /// Failure category
    ErrorCode Code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace cashseed

#endif // CASHSEED_CORE_ERROR_H
