// VEIL - Prime-Order Group
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// The signing group: secp256k1 points and scalars modulo the curve order,
// backed by OpenSSL's EC and BN APIs. Point x-coordinates enter the BN254
// scalar field by little-endian reduction.

#ifndef VEIL_CRYPTO_GROUP_H
#define VEIL_CRYPTO_GROUP_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include "veil/core/types.h"
#include "veil/core/random.h"
#include "veil/core/serialize.h"
#include "veil/crypto/field.h"

namespace veil {

/// Curve order n (big-endian)
extern const std::array<Byte, 32> CURVE_ORDER;

// ============================================================================
// Scalar (256-bit integer mod n)
// ============================================================================

class Scalar {
public:
    static constexpr size_t SIZE = 32;

    Scalar();

    /// Big-endian bytes, reduced modulo n
    static Scalar FromBytesBE(const Byte* data, size_t len);

    /// Canonical 32-byte little-endian encoding (must be below n)
    static std::optional<Scalar> FromBytesLE(const Byte* data, size_t len);

    static Scalar FromUint64(uint64_t value);

    /// Field elements are always below n, so this never reduces
    static Scalar FromField(const Field& field);

    /// Uniform scalar drawn from `rng`
    static Scalar Random(Rng& rng);

    /// Value reduced into the BN254 scalar field
    Field ToField() const;

    std::array<Byte, SIZE> ToBytesBE() const { return data_; }
    std::array<Byte, SIZE> ToBytesLE() const;

    bool IsZero() const;

    Scalar operator+(const Scalar& other) const;
    Scalar operator-(const Scalar& other) const;
    Scalar operator*(const Scalar& other) const;
    Scalar operator-() const;

    Scalar Inverse() const;

    bool operator==(const Scalar& other) const { return data_ == other.data_; }
    bool operator!=(const Scalar& other) const { return data_ != other.data_; }

    template<typename Stream>
    void Serialize(Stream& s) const {
        auto bytes = ToBytesLE();
        s.Write(bytes.data(), bytes.size());
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        std::array<Byte, SIZE> bytes;
        s.Read(bytes.data(), bytes.size());
        auto scalar = FromBytesLE(bytes.data(), bytes.size());
        if (!scalar) {
            throw DecodeError("Non-canonical scalar");
        }
        *this = *scalar;
    }

private:
    /// Big-endian, always below n
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Point (secp256k1 curve point)
// ============================================================================

class Point {
public:
    /// Compressed encoding size; the identity encodes as all zeros
    static constexpr size_t COMPRESSED_SIZE = 33;

    /// Point at infinity
    Point();
    ~Point();

    Point(const Point& other);
    Point& operator=(const Point& other);
    Point(Point&& other);
    Point& operator=(Point&& other);

    static Point Generator();

    /// scalar * G
    static Point MulGenerator(const Scalar& scalar);

    /// Deterministically map a field element onto the curve (try-and-increment)
    static Point MapToGroup(const Field& input);

    /// Deterministic base point for a named domain
    static Point HashToGroup(const std::string& domain);

    static std::optional<Point> FromCompressed(const Byte* data, size_t len);

    std::array<Byte, COMPRESSED_SIZE> ToCompressed() const;

    /// Affine x-coordinate reduced into the field (zero for the identity)
    Field ToXField() const;

    /// Bits of the compressed encoding
    Bits ToBitsLE() const;

    bool IsInfinity() const;

    Point operator+(const Point& other) const;
    Point operator-(const Point& other) const;
    Point operator-() const;
    Point operator*(const Scalar& scalar) const;

    Point& operator+=(const Point& other);

    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        auto bytes = ToCompressed();
        s.Write(bytes.data(), bytes.size());
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        std::array<Byte, COMPRESSED_SIZE> bytes;
        s.Read(bytes.data(), bytes.size());
        auto point = FromCompressed(bytes.data(), bytes.size());
        if (!point) {
            throw DecodeError("Invalid group element encoding");
        }
        *this = std::move(*point);
    }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

inline Point operator*(const Scalar& scalar, const Point& point) {
    return point * scalar;
}

} // namespace veil

#endif // VEIL_CRYPTO_GROUP_H
