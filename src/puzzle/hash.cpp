// VEIL - Puzzle Hashing
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/puzzle/hash.h"
#include "veil/crypto/sha256.h"
#include <cstring>

namespace veil {
namespace puzzle {

namespace {

constexpr const char* POLYNOMIAL_DOMAIN = "VeilCoinbasePolynomial0";
constexpr const char* POINT_DOMAIN = "VeilCoinbasePoint0";
constexpr const char* CHALLENGE_DOMAIN = "VeilCoinbaseChallenges0";

} // namespace

std::vector<Field> HashToFields(const std::string& domain, const std::vector<Byte>& input, size_t count) {
    // Absorb the domain and input once, then squeeze with a counter
    SHA256 hasher;
    uint8_t domainLen = static_cast<uint8_t>(domain.size());
    hasher.Write(&domainLen, 1);
    hasher.Write(reinterpret_cast<const Byte*>(domain.data()), domain.size());
    if (!input.empty()) {
        hasher.Write(input.data(), input.size());
    }
    Byte seed[SHA256::OUTPUT_SIZE];
    hasher.Finalize(seed);

    std::vector<Field> out;
    out.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        Byte wide[2 * SHA256::OUTPUT_SIZE];
        for (uint64_t half = 0; half < 2; ++half) {
            Byte block[SHA256::OUTPUT_SIZE + 8];
            std::memcpy(block, seed, SHA256::OUTPUT_SIZE);
            uint64_t counter = 2 * i + half;
            for (size_t b = 0; b < 8; ++b) {
                block[SHA256::OUTPUT_SIZE + b] = static_cast<Byte>(counter >> (8 * b));
            }
            Hash256 digest = SHA256Hash(block, sizeof(block));
            std::memcpy(wide + half * SHA256::OUTPUT_SIZE, digest.data(), SHA256::OUTPUT_SIZE);
        }
        out.push_back(Field::FromBytes(wide, sizeof(wide)));
    }
    return out;
}

DensePolynomial HashToPolynomial(const std::vector<Byte>& input, uint32_t degree) {
    return DensePolynomial(HashToFields(POLYNOMIAL_DOMAIN, input, static_cast<size_t>(degree) + 1));
}

Field HashCommitment(const KZGCommitment& commitment) {
    return HashToFields(POINT_DOMAIN, commitment.ToBytes(), 1)[0];
}

std::vector<Field> HashCommitments(const std::vector<KZGCommitment>& commitments) {
    std::vector<Byte> input;
    for (const auto& c : commitments) {
        auto bytes = c.ToBytes();
        input.insert(input.end(), bytes.begin(), bytes.end());
    }
    return HashToFields(CHALLENGE_DOMAIN, input, commitments.size() + 1);
}

} // namespace puzzle
} // namespace veil
