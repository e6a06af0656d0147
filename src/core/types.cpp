// VEIL - Core Types Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/core/types.h"
#include "veil/core/hex.h"

namespace veil {

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    auto bytes = HexToBytes(hex);
    if (!bytes || bytes->size() != SIZE) {
        throw std::invalid_argument("Invalid hex string for hash");
    }
    return BaseHash(bytes->data(), SIZE);
}

template class BaseHash<256>;

std::vector<Byte> BitsToBytesLE(const Bits& bits) {
    std::vector<Byte> out((bits.size() + 7) / 8, 0);
    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i]) {
            out[i / 8] |= static_cast<Byte>(1u << (i % 8));
        }
    }
    return out;
}

} // namespace veil
