// VEIL - Hex Encoding/Decoding
// Copyright (c) 2024 VEIL Developers
// MIT License

#ifndef VEIL_CORE_HEX_H
#define VEIL_CORE_HEX_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <array>

namespace veil {

/// Convert bytes to lowercase hex
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Parse hex (optionally 0x-prefixed); nullopt on odd length or bad digit
std::optional<std::vector<uint8_t>> HexToBytes(const std::string& hex);

} // namespace veil

#endif // VEIL_CORE_HEX_H
