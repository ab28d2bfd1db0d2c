// CASHSEED - Secure Random Number Generation Implementation
// Copyright (c) 2024 CASHSEED Developers
// MIT License

#include "cashseed/core/random.h"

#include <cerrno>
#include <fstream>
#include <stdexcept>

#if defined(__linux__)
    #include <sys/random.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #include <stdlib.h>  // arc4random_buf
#endif

namespace cashseed {

namespace detail {

namespace {

bool ReadDevURandom(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;
    urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    return urandom.good();
}

} // namespace

bool GetOSEntropy(uint8_t* buf, size_t len) {
    if (len == 0) return true;

#if defined(__linux__)
    // getrandom() may return short counts for large requests or on signals
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret < 0) {
            if (errno == EINTR) continue;
            if (errno == ENOSYS) return ReadDevURandom(buf + filled, len - filled);
            return false;
        }
        filled += static_cast<size_t>(ret);
    }
    return true;

#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    arc4random_buf(buf, len);
    return true;

#else
    return ReadDevURandom(buf, len);
#endif
}

} // namespace detail

void GetStrongRandBytes(uint8_t* buf, size_t len) {
    if (!detail::GetOSEntropy(buf, len)) {
        throw std::runtime_error("Failed to get random bytes from OS");
    }
}

std::vector<uint8_t> GetStrongRandBytes(size_t len) {
    std::vector<uint8_t> result(len);
    GetStrongRandBytes(result.data(), len);
    return result;
}

} // namespace cashseed
