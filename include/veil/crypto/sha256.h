// VEIL - SHA-256 Hash Function
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP digest interface.

#ifndef VEIL_CRYPTO_SHA256_H
#define VEIL_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>
#include "veil/core/types.h"

namespace veil {

/**
 * SHA-256 hasher class
 */
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output; the hasher must be Reset
    /// before reuse
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Ctx;
    std::unique_ptr<Ctx> ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute SHA256(SHA256(data))
Hash256 DoubleSHA256(const Byte* data, size_t len);

inline Hash256 DoubleSHA256(const std::vector<Byte>& data) {
    return DoubleSHA256(data.data(), data.size());
}

} // namespace veil

#endif // VEIL_CRYPTO_SHA256_H
