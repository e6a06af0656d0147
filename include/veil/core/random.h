// VEIL - Random Number Generation Header
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// OS entropy plus the Rng interface that signing and proving take, so
// tests can substitute a seeded deterministic stream.

#ifndef VEIL_CORE_RANDOM_H
#define VEIL_CORE_RANDOM_H

#include "veil/core/types.h"
#include <array>
#include <cstdint>
#include <cstddef>

namespace veil {

// ============================================================================
// Core Random Functions
// ============================================================================

/// Fill buffer with cryptographically secure random bytes from the OS
void GetRandBytes(Byte* buf, size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

// ============================================================================
// Rng Interface
// ============================================================================

/**
 * Source of randomness handed to randomized operations
 */
class Rng {
public:
    virtual ~Rng() = default;

    /// Fill `len` bytes
    virtual void Fill(Byte* buf, size_t len) = 0;

    uint64_t NextUint64() {
        Byte b[8];
        Fill(b, sizeof(b));
        uint64_t v = 0;
        for (int i = 7; i >= 0; --i) {
            v = (v << 8) | b[i];
        }
        return v;
    }
};

/// Rng backed by OS entropy
class OsRng : public Rng {
public:
    void Fill(Byte* buf, size_t len) override { GetRandBytes(buf, len); }
};

/// Reproducible Rng: SHA-256 in counter mode over a 32-byte seed
class DeterministicRng : public Rng {
public:
    explicit DeterministicRng(uint64_t seed);
    explicit DeterministicRng(const std::array<Byte, 32>& seed);

    void Fill(Byte* buf, size_t len) override;

private:
    std::array<Byte, 32> seed_;
    uint64_t counter_{0};
    std::array<Byte, 32> block_{};
    size_t blockPos_{32};
};

namespace detail {

/// Get entropy from OS; false on failure
bool GetOSEntropy(Byte* buf, size_t len);

} // namespace detail

} // namespace veil

#endif // VEIL_CORE_RANDOM_H
