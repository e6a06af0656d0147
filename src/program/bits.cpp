// VEIL - Bit Encoding Helpers
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/program/bits.h"
#include "veil/core/errors.h"

#include <algorithm>

namespace veil {

bool BitReader::ReadBit() {
    if (pos_ >= bits_.size()) {
        throw DecodeError("Unexpected end of bit string");
    }
    return bits_[pos_++];
}

uint64_t BitReader::ReadUint(size_t count) {
    uint64_t v = 0;
    for (size_t i = 0; i < count; ++i) {
        if (ReadBit()) {
            v |= (uint64_t(1) << i);
        }
    }
    return v;
}

Bits BitReader::ReadBits(size_t count) {
    if (count > Remaining()) {
        throw DecodeError("Unexpected end of bit string");
    }
    Bits out(bits_.begin() + pos_, bits_.begin() + pos_ + count);
    pos_ += count;
    return out;
}

std::vector<Field> PackBitsToFields(const Bits& bits) {
    Bits padded = bits;
    padded.push_back(true);

    std::vector<Field> fields;
    const size_t chunk = Field::SIZE_IN_DATA_BITS;
    for (size_t offset = 0; offset < padded.size(); offset += chunk) {
        size_t end = std::min(padded.size(), offset + chunk);
        fields.push_back(Field::FromBitsLE(Bits(padded.begin() + offset, padded.begin() + end)));
    }
    return fields;
}

std::optional<Bits> UnpackFieldsToBits(const std::vector<Field>& fields) {
    Bits bits;
    bits.reserve(fields.size() * Field::SIZE_IN_DATA_BITS);
    for (const auto& f : fields) {
        Bits fb = f.ToBitsLE();
        // A packed element never sets the bit above the data bits
        if (fb[Field::SIZE_IN_DATA_BITS]) {
            return std::nullopt;
        }
        bits.insert(bits.end(), fb.begin(), fb.begin() + Field::SIZE_IN_DATA_BITS);
    }
    while (!bits.empty() && !bits.back()) {
        bits.pop_back();
    }
    if (bits.empty()) {
        return std::nullopt;
    }
    bits.pop_back();
    return bits;
}

} // namespace veil
