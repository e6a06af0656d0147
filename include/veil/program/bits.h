// VEIL - Bit Encoding Helpers
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Helpers shared by the program value encodings: a cursor over
// little-endian bits and the packing of bit strings into field elements.

#ifndef VEIL_PROGRAM_BITS_H
#define VEIL_PROGRAM_BITS_H

#include <cstdint>
#include <optional>
#include <vector>
#include "veil/core/types.h"
#include "veil/crypto/field.h"

namespace veil {

/**
 * Sequential reader over a little-endian bit string. Reading past the end
 * throws DecodeError.
 */
class BitReader {
public:
    explicit BitReader(const Bits& bits) : bits_(bits) {}

    bool ReadBit();
    uint64_t ReadUint(size_t count);
    Bits ReadBits(size_t count);

    size_t Remaining() const { return bits_.size() - pos_; }
    bool AtEnd() const { return pos_ == bits_.size(); }

private:
    const Bits& bits_;
    size_t pos_{0};
};

/// Pack bits into field elements of SIZE_IN_DATA_BITS bits each, after
/// appending a terminating 1 bit
std::vector<Field> PackBitsToFields(const Bits& bits);

/// Inverse of PackBitsToFields; nullopt if the terminator is missing
std::optional<Bits> UnpackFieldsToBits(const std::vector<Field>& fields);

} // namespace veil

#endif // VEIL_PROGRAM_BITS_H
