// VEIL - SHA-256 Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/crypto/sha256.h"

#include <openssl/evp.h>
#include <stdexcept>

namespace veil {

struct SHA256::Ctx {
    EVP_MD_CTX* md{nullptr};

    Ctx() : md(EVP_MD_CTX_new()) {
        if (!md) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
    }

    ~Ctx() { EVP_MD_CTX_free(md); }
};

SHA256::SHA256() : ctx_(std::make_unique<Ctx>()) {
    Reset();
}

SHA256::~SHA256() = default;

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_->md, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return *this;
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_->md, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_->md, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 out;
    SHA256 hasher;
    hasher.Write(data, len).Finalize(out.data());
    return out;
}

Hash256 DoubleSHA256(const Byte* data, size_t len) {
    Hash256 first = SHA256Hash(data, len);
    return SHA256Hash(first.data(), first.size());
}

} // namespace veil
