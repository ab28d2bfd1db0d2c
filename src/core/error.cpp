// CASHSEED - Error Codes Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/core/error.h"

namespace cashseed {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidMnemonicWord:                 return "InvalidMnemonicWord";
        case ErrorCode::InvalidMnemonicLength:               return "InvalidMnemonicLength";
        case ErrorCode::ChecksumMismatch:                    return "ChecksumMismatch";
        case ErrorCode::ScalarOutOfRange:                    return "ScalarOutOfRange";
        case ErrorCode::MalformedExtendedKey:                return "MalformedExtendedKey";
        case ErrorCode::UnsupportedHardenedPublicDerivation: return "UnsupportedHardenedPublicDerivation";
        case ErrorCode::InvalidEncodingInput:                return "InvalidEncodingInput";
        case ErrorCode::InvalidWordList:                     return "InvalidWordList";
        case ErrorCode::SeedNotReady:                        return "SeedNotReady";
    }
    return "Unknown";
}

KeyError::KeyError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(ErrorCodeToString(code)) + ": " + message)
    , code_(code) {}

} // namespace cashseed
