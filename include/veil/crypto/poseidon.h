// VEIL - Poseidon Hash Function
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Algebraic sponge over the BN254 scalar field at rates 2, 4 and 8.
// Based on: "Poseidon: A New Hash Function for Zero-Knowledge Proof Systems"
// https://eprint.iacr.org/2019/458

#ifndef VEIL_CRYPTO_POSEIDON_H
#define VEIL_CRYPTO_POSEIDON_H

#include <cstdint>
#include <vector>
#include "veil/crypto/field.h"
#include "veil/crypto/group.h"

namespace veil {

// ============================================================================
// Poseidon Parameters
// ============================================================================

/**
 * Permutation parameters for one rate (capacity is always 1)
 */
struct PoseidonParameters {
    size_t rate;
    size_t fullRounds;
    size_t partialRounds;

    /// One row of `width()` constants per round
    std::vector<std::vector<FieldElement>> roundConstants;

    /// width x width MDS matrix
    std::vector<std::vector<FieldElement>> mds;

    size_t width() const { return rate + 1; }
    size_t totalRounds() const { return fullRounds + partialRounds; }

    /// Shared parameters for rate 2, 4 or 8, generated once per process
    static const PoseidonParameters& ForRate(size_t rate);
};

// ============================================================================
// Poseidon Sponge
// ============================================================================

/**
 * Duplex sponge; the rate occupies the first `rate` state slots and the
 * capacity slot carries the domain separator
 */
class PoseidonSponge {
public:
    PoseidonSponge(const PoseidonParameters& params, const FieldElement& domain);

    PoseidonSponge& Absorb(const FieldElement& element);
    PoseidonSponge& Absorb(const std::vector<FieldElement>& elements);

    FieldElement Squeeze();
    std::vector<FieldElement> Squeeze(size_t count);

private:
    const PoseidonParameters& params_;
    std::vector<FieldElement> state_;
    size_t pos_{0};
    bool squeezing_{false};

    void Permute();
    void AddRoundConstants(size_t roundIdx);
    void MixColumns();
};

// ============================================================================
// Poseidon Hash
// ============================================================================

/// Poseidon hash at a fixed rate with the domain "Poseidon<rate>"
class Poseidon {
public:
    explicit Poseidon(size_t rate);

    size_t Rate() const { return params_.rate; }

    /// Hash to one field element
    FieldElement Hash(const std::vector<FieldElement>& input) const;

    /// Hash to `numOutputs` field elements
    std::vector<FieldElement> HashMany(const std::vector<FieldElement>& input, size_t numOutputs) const;

    /// Hash to a scalar
    Scalar HashToScalar(const std::vector<FieldElement>& input) const;

    /// Hash to a group element: the sum of two independent curve maps
    Point HashToGroup(const std::vector<FieldElement>& input) const;

private:
    const PoseidonParameters& params_;
    FieldElement domain_;
};

} // namespace veil

#endif // VEIL_CRYPTO_POSEIDON_H
