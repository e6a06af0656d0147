// VEIL - Core Types Header
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// This file defines fundamental types used throughout VEIL.

#ifndef VEIL_CORE_TYPES_H
#define VEIL_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace veil {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Little-endian bit vector (bit i of the value is element i)
using Bits = std::vector<bool>;

/// Microcredits carried by a record (must fit in 52 bits)
using Gates = uint64_t;

/// Number of low bits a gates value may occupy
constexpr unsigned GATES_BITS = 52;

/// Check that a gates value has no bit set at or above bit 52
inline bool GatesInRange(Gates value) {
    return (value >> GATES_BITS) == 0;
}

// ============================================================================
// Span - Non-owning view of contiguous memory
// ============================================================================

template<typename T>
class Span {
public:
    using value_type = T;
    using pointer = T*;
    using reference = T&;
    using iterator = pointer;
    using size_type = std::size_t;

    constexpr Span() noexcept : data_(nullptr), size_(0) {}

    constexpr Span(pointer data, size_type size) noexcept
        : data_(data), size_(size) {}

    template<size_t N>
    constexpr Span(const std::array<std::remove_const_t<T>, N>& arr) noexcept
        : data_(arr.data()), size_(N) {}

    Span(const std::vector<std::remove_const_t<T>>& vec) noexcept
        : data_(vec.data()), size_(vec.size()) {}

    constexpr pointer data() const noexcept { return data_; }
    constexpr size_type size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr reference operator[](size_type idx) const { return data_[idx]; }

    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + size_; }

    constexpr Span subspan(size_type offset, size_type count) const {
        return Span(data_ + offset, count);
    }

private:
    pointer data_;
    size_type size_;
};

// ============================================================================
// Hash Templates
// ============================================================================

/**
 * Fixed-size opaque digest
 */
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    bool IsNull() const noexcept {
        return std::all_of(data_.begin(), data_.end(), [](Byte b) { return b == 0; });
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex in storage order
    std::string ToHex() const;

    /// Parse from hex in storage order
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/**
 * 256-bit hash (32 bytes)
 */
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

// ============================================================================
// Bit Helpers
// ============================================================================

/// Append the low `count` bits of `value` in little-endian order
inline void AppendBitsLE(Bits& out, uint64_t value, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        out.push_back(((value >> i) & 1) != 0);
    }
}

/// Append every byte of a buffer, least significant bit first
inline void AppendBytesLE(Bits& out, const Byte* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        AppendBitsLE(out, data[i], 8);
    }
}

/// Pack little-endian bits into bytes (final byte zero padded)
std::vector<Byte> BitsToBytesLE(const Bits& bits);

} // namespace veil

#endif // VEIL_CORE_TYPES_H
