// VEIL - Serialization Header
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Little-endian serialization primitives. Every VEIL wire format is
// fixed-width little-endian; element counts are explicit u16 or u32
// prefixes chosen by each type.

#ifndef VEIL_CORE_SERIALIZE_H
#define VEIL_CORE_SERIALIZE_H

#include "veil/core/types.h"
#include "veil/core/errors.h"
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <array>
#include <ios>
#include <type_traits>

namespace veil {

// ============================================================================
// Endianness Helpers
// ============================================================================

namespace detail {

inline uint16_t htole16(uint16_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap16(host);
#else
    return host;
#endif
}

inline uint32_t htole32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t htole64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;

    explicit DataStream(const std::vector<Byte>& data) : data_(data) {}

    explicit DataStream(std::vector<Byte>&& data) : data_(std::move(data)) {}

    DataStream(const Byte* data, size_t len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }

    bool empty() const noexcept { return size() == 0; }

    /// Pointer to unread data
    const Byte* data() const noexcept { return data_.data() + readPos_; }

    /// Entire buffer, read or not
    const std::vector<Byte>& Data() const noexcept { return data_; }

    void Write(const Byte* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const Byte*>(src), len);
    }

    void Read(Byte* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + readPos_, len);
        readPos_ += len;
    }

    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<Byte*>(dst), len);
    }

    void Rewind() { readPos_ = 0; }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<Byte> data_;
    size_t readPos_ = 0;
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata16(Stream& s, uint16_t obj) {
    obj = detail::htole16(obj);
    s.Write(reinterpret_cast<const Byte*>(&obj), 2);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::htole32(obj);
    s.Write(reinterpret_cast<const Byte*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::htole64(obj);
    s.Write(reinterpret_cast<const Byte*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint16_t ser_readdata16(Stream& s) {
    uint16_t obj;
    s.Read(reinterpret_cast<Byte*>(&obj), 2);
    return detail::htole16(obj);
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<Byte*>(&obj), 4);
    return detail::htole32(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<Byte*>(&obj), 8);
    return detail::htole64(obj);
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint16_t a) { ser_writedata16(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint16_t& a) { a = ser_readdata16(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

/// Booleans are one byte, 0 or 1; anything else is rejected
template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) {
    uint8_t v = ser_readdata8(s);
    if (v > 1) {
        throw DecodeError("Invalid boolean byte");
    }
    a = (v == 1);
}

template<typename Stream, size_t N>
void Serialize(Stream& s, const std::array<Byte, N>& arr) {
    s.Write(arr.data(), N);
}

template<typename Stream, size_t N>
void Unserialize(Stream& s, std::array<Byte, N>& arr) {
    s.Read(arr.data(), N);
}

template<typename Stream>
void Serialize(Stream& s, const Hash256& hash) {
    s.Write(hash.data(), Hash256::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash256& hash) {
    s.Read(hash.data(), Hash256::SIZE);
}

/// Types carrying their own member Serialize/Unserialize
template<typename Stream, typename T>
auto Serialize(Stream& s, const T& obj) -> decltype(obj.Serialize(s), void()) {
    obj.Serialize(s);
}

template<typename Stream, typename T>
auto Unserialize(Stream& s, T& obj) -> decltype(obj.Unserialize(s), void()) {
    obj.Unserialize(s);
}

// ============================================================================
// Counted Sequences
// ============================================================================

/// Write a u16 element count followed by each element
template<typename Stream, typename T>
void SerializeU16Vector(Stream& s, const std::vector<T>& v) {
    if (v.size() > 0xFFFF) {
        throw std::length_error("Sequence too long for a u16 count");
    }
    ser_writedata16(s, static_cast<uint16_t>(v.size()));
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void UnserializeU16Vector(Stream& s, std::vector<T>& v) {
    uint16_t count = ser_readdata16(s);
    v.clear();
    v.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

/// Raw byte string with a u32 length prefix
template<typename Stream>
void SerializeBytes32(Stream& s, const std::vector<Byte>& bytes) {
    ser_writedata32(s, static_cast<uint32_t>(bytes.size()));
    if (!bytes.empty()) {
        s.Write(bytes.data(), bytes.size());
    }
}

template<typename Stream>
void UnserializeBytes32(Stream& s, std::vector<Byte>& bytes) {
    uint32_t len = ser_readdata32(s);
    if (len > s.size()) {
        throw std::ios_base::failure("Byte string length exceeds remaining data");
    }
    bytes.resize(len);
    if (len > 0) {
        s.Read(bytes.data(), len);
    }
}

// ============================================================================
// Whole-Buffer Helpers
// ============================================================================

template<typename T>
std::vector<Byte> ToBytesLE(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return ss.Data();
}

/// Decode a complete buffer. Stream underflow and trailing bytes both
/// surface as DecodeError.
template<typename T>
T FromBytesLE(const Byte* data, size_t len) {
    DataStream ss(data, len);
    T obj;
    try {
        Unserialize(ss, obj);
    } catch (const std::ios_base::failure& e) {
        throw DecodeError(e.what());
    }
    if (!ss.empty()) {
        throw DecodeError("Trailing bytes after decoding");
    }
    return obj;
}

template<typename T>
T FromBytesLE(const std::vector<Byte>& data) {
    return FromBytesLE<T>(data.data(), data.size());
}

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace veil

#endif // VEIL_CORE_SERIALIZE_H
