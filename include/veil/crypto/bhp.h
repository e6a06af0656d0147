// VEIL - BHP Hash
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Bowe-Hopwood windowed Pedersen hash over bit strings. Input bits are
// read in 3-bit chunks; chunk (b0, b1, b2) contributes
// (1 + b0 + 2*b1) * (b2 ? -1 : 1) times its segment base.

#ifndef VEIL_CRYPTO_BHP_H
#define VEIL_CRYPTO_BHP_H

#include <array>
#include <string>
#include <vector>
#include "veil/core/types.h"
#include "veil/crypto/field.h"
#include "veil/crypto/group.h"

namespace veil {

class BHP {
public:
    static constexpr size_t BITS_PER_CHUNK = 3;

    /// Generate `numWindows` x `windowSize` segment bases for `domain`
    BHP(const std::string& domain, size_t numWindows, size_t windowSize);

    /// Largest input accepted by a single evaluation
    size_t MaxInputBits() const { return numWindows_ * windowSize_ * BITS_PER_CHUNK; }

    /// Hash to a curve point. Inputs longer than MaxInputBits() are chained:
    /// each later block is prefixed with the previous digest's x-coordinate.
    Point HashUncompressed(const Bits& input) const;

    /// x-coordinate of HashUncompressed
    Field Hash(const Bits& input) const;

    /// Hiding commitment: x-coordinate of HashUncompressed(input) + r * R
    Field Commit(const Bits& input, const Scalar& randomizer) const;

    const Point& RandomizerBase() const { return randomizerBase_; }

private:
    size_t numWindows_;
    size_t windowSize_;

    /// Per chunk: base, 2*base, 3*base, 4*base
    std::vector<std::array<Point, 4>> lookup_;

    Point randomizerBase_;

    Point HashBlock(const Bits& input) const;
};

} // namespace veil

#endif // VEIL_CRYPTO_BHP_H
