// VEIL - BHP Hash Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/crypto/bhp.h"
#include "veil/core/errors.h"

#include <algorithm>
#include <string>

namespace veil {

BHP::BHP(const std::string& domain, size_t numWindows, size_t windowSize)
    : numWindows_(numWindows)
    , windowSize_(windowSize)
    , randomizerBase_(Point::HashToGroup(domain + "Randomizer")) {
    if (numWindows == 0 || windowSize == 0) {
        throw Error("BHP requires at least one window and one segment");
    }
    if (MaxInputBits() <= Field::SIZE_IN_BITS) {
        throw Error("BHP input size must exceed one field element for chaining");
    }

    // Consecutive segments in a window are spaced 2^4 apart so that chunk
    // magnitudes (at most 4) never collide across segments
    const Scalar sixteen = Scalar::FromUint64(16);
    lookup_.reserve(numWindows * windowSize);
    for (size_t w = 0; w < numWindows; ++w) {
        Point base = Point::HashToGroup(domain + ".window." + std::to_string(w));
        for (size_t j = 0; j < windowSize; ++j) {
            Point twice = base + base;
            Point thrice = twice + base;
            Point four = twice + twice;
            lookup_.push_back({base, twice, thrice, four});
            base = base * sixteen;
        }
    }
}

Point BHP::HashBlock(const Bits& input) const {
    if (input.size() > MaxInputBits()) {
        throw Error("BHP input exceeds " + std::to_string(MaxInputBits()) + " bits");
    }
    Point acc;
    for (size_t chunk = 0; chunk * BITS_PER_CHUNK < input.size(); ++chunk) {
        size_t i = chunk * BITS_PER_CHUNK;
        bool b0 = input[i];
        bool b1 = i + 1 < input.size() && input[i + 1];
        bool b2 = i + 2 < input.size() && input[i + 2];
        const Point& term = lookup_[chunk][(b0 ? 1 : 0) + (b1 ? 2 : 0)];
        acc = b2 ? acc - term : acc + term;
    }
    return acc;
}

Point BHP::HashUncompressed(const Bits& input) const {
    const size_t maxBits = MaxInputBits();
    if (input.size() <= maxBits) {
        return HashBlock(input);
    }

    Point digest = HashBlock(Bits(input.begin(), input.begin() + maxBits));
    const size_t stride = maxBits - Field::SIZE_IN_BITS;
    for (size_t offset = maxBits; offset < input.size(); offset += stride) {
        size_t end = std::min(input.size(), offset + stride);
        Bits block = digest.ToXField().ToBitsLE();
        block.insert(block.end(), input.begin() + offset, input.begin() + end);
        digest = HashBlock(block);
    }
    return digest;
}

Field BHP::Hash(const Bits& input) const {
    return HashUncompressed(input).ToXField();
}

Field BHP::Commit(const Bits& input, const Scalar& randomizer) const {
    return (HashUncompressed(input) + randomizerBase_ * randomizer).ToXField();
}

} // namespace veil
