// CASHSEED - Secure Random Number Generation Header
// Copyright (c) 2024 CASHSEED Developers
// MIT License
//
// Cryptographically secure random bytes from the operating system.
// Nothing is buffered between calls.

#ifndef CASHSEED_CORE_RANDOM_H
#define CASHSEED_CORE_RANDOM_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cashseed {

/// Fill buffer with cryptographically secure random bytes.
/// Uses getrandom on Linux, arc4random_buf on macOS/BSD, /dev/urandom otherwise.
/// @throws std::runtime_error if the OS source fails
void GetStrongRandBytes(uint8_t* buf, size_t len);

/// Return len fresh random bytes
std::vector<uint8_t> GetStrongRandBytes(size_t len);

namespace detail {

/// Get entropy from OS - implementation is platform-specific
/// Returns true on success, false on failure
bool GetOSEntropy(uint8_t* buf, size_t len);

} // namespace detail

} // namespace cashseed

#endif // CASHSEED_CORE_RANDOM_H
