// VEIL - Random Number Generation Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/core/random.h"
#include "veil/crypto/sha256.h"
#include <cstring>
#include <stdexcept>

#if defined(__linux__)
    #include <sys/random.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #include <stdlib.h>
#else
    #include <fstream>
#endif

namespace veil {

namespace detail {

bool GetOSEntropy(Byte* buf, size_t len) {
    if (len == 0) return true;

#if defined(__linux__)
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret <= 0) return false;
        filled += static_cast<size_t>(ret);
    }
    return true;
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    arc4random_buf(buf, len);
    return true;
#else
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;
    urandom.read(reinterpret_cast<char*>(buf), len);
    return urandom.good();
#endif
}

} // namespace detail

void GetRandBytes(Byte* buf, size_t len) {
    if (!detail::GetOSEntropy(buf, len)) {
        throw std::runtime_error("Failed to get random bytes from OS");
    }
}

uint64_t GetRandUint64() {
    uint64_t result;
    GetRandBytes(reinterpret_cast<Byte*>(&result), sizeof(result));
    return result;
}

// ============================================================================
// DeterministicRng
// ============================================================================

DeterministicRng::DeterministicRng(uint64_t seed) {
    seed_.fill(0);
    for (int i = 0; i < 8; ++i) {
        seed_[i] = static_cast<Byte>(seed >> (8 * i));
    }
}

DeterministicRng::DeterministicRng(const std::array<Byte, 32>& seed) : seed_(seed) {}

void DeterministicRng::Fill(Byte* buf, size_t len) {
    while (len > 0) {
        if (blockPos_ == block_.size()) {
            Byte ctr[8];
            for (int i = 0; i < 8; ++i) {
                ctr[i] = static_cast<Byte>(counter_ >> (8 * i));
            }
            ++counter_;
            SHA256 hasher;
            hasher.Write(seed_.data(), seed_.size()).Write(ctr, sizeof(ctr));
            hasher.Finalize(block_.data());
            blockPos_ = 0;
        }
        size_t take = std::min(len, block_.size() - blockPos_);
        std::memcpy(buf, block_.data() + blockPos_, take);
        blockPos_ += take;
        buf += take;
        len -= take;
    }
}

} // namespace veil
