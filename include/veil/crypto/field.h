// VEIL - Finite Field Arithmetic
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Arithmetic over the BN254 scalar field. Every hash, identifier,
// commitment and polynomial coefficient in VEIL lives in this field; the
// pairing library used by the coinbase puzzle is configured for the same
// modulus.

#ifndef VEIL_CRYPTO_FIELD_H
#define VEIL_CRYPTO_FIELD_H

#include <cstdint>
#include <array>
#include <optional>
#include <string>
#include "veil/core/types.h"
#include "veil/core/serialize.h"

namespace veil {

// ============================================================================
// 256-bit Unsigned Integer (for field arithmetic)
// ============================================================================

/**
 * 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
 */
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;

    /// Limbs in little-endian order (limb[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;

    constexpr Uint256() : limbs{0, 0, 0, 0} {}

    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}

    explicit constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}

    /// Construct from up to 32 little-endian bytes
    explicit Uint256(const Byte* data, size_t len);

    /// Parse big-endian hex (optional 0x prefix)
    static Uint256 FromHex(const std::string& hex);

    /// Big-endian hex, 64 characters
    std::string ToHex() const;

    /// Little-endian bytes
    std::array<Byte, 32> ToBytes() const;

    bool IsZero() const;

    /// Value of bit `i` (0 = least significant)
    bool Bit(size_t i) const { return ((limbs[i / 64] >> (i % 64)) & 1) != 0; }

    bool operator==(const Uint256& other) const { return limbs == other.limbs; }
    bool operator!=(const Uint256& other) const { return limbs != other.limbs; }
    bool operator<(const Uint256& other) const;
    bool operator<=(const Uint256& other) const { return !(other < *this); }
    bool operator>(const Uint256& other) const { return other < *this; }
    bool operator>=(const Uint256& other) const { return !(*this < other); }

    Uint256 operator<<(int shift) const;
    Uint256 operator>>(int shift) const;

    static Uint256 Add(const Uint256& a, const Uint256& b, bool& carry);
    static Uint256 Sub(const Uint256& a, const Uint256& b, bool& borrow);
    static Uint256 Mul(const Uint256& a, const Uint256& b, Uint256& high);
};

// ============================================================================
// Field Element over BN254 scalar field
// ============================================================================

/**
 * Element of the BN254 scalar field
 * r = 21888242871839275222246405745257275088548364400416034343698204186575808495617
 */
class FieldElement {
public:
    /// The BN254 scalar field modulus
    static const Uint256 MODULUS;

    /// R = 2^256 mod r (Montgomery radix)
    static const Uint256 R;

    /// R^2 mod r
    static const Uint256 R2;

    /// -r^(-1) mod 2^64
    static const uint64_t INV;

    /// Bits needed to represent any element
    static constexpr size_t SIZE_IN_BITS = 254;

    /// Bits that always fit below the modulus
    static constexpr size_t SIZE_IN_DATA_BITS = 253;

    /// Encoded size in bytes
    static constexpr size_t SIZE_IN_BYTES = 32;

    /// Largest k with 2^k dividing r - 1
    static constexpr size_t TWO_ADICITY = 28;

    /// Multiplicative generator of the field
    static constexpr uint64_t GENERATOR = 5;

    /// Internal value in Montgomery form
    Uint256 value;

    FieldElement();

    /// Construct from an integer, reducing modulo r
    explicit FieldElement(const Uint256& val);

    explicit FieldElement(uint64_t val);

    static FieldElement Zero();
    static FieldElement One();

    /// Canonical integer representation
    Uint256 ToUint256() const;

    /// Canonical 32-byte little-endian encoding
    std::array<Byte, 32> ToBytes() const;

    /// Little-endian bytes of any length, reduced modulo r
    static FieldElement FromBytes(const Byte* data, size_t len);

    /// Exactly 32 bytes that must already be below the modulus
    static std::optional<FieldElement> FromCanonicalBytes(const Byte* data, size_t len);

    static FieldElement FromHex(const std::string& hex);

    /// Big-endian hex of the canonical value
    std::string ToHex() const { return ToUint256().ToHex(); }

    /// Domain separator: the ASCII bytes of `tag` read little-endian
    static FieldElement FromDomain(const std::string& tag);

    /// Canonical value as SIZE_IN_BITS little-endian bits
    Bits ToBitsLE() const;

    /// Little-endian bits, reduced modulo r
    static FieldElement FromBitsLE(const Bits& bits);

    /// Primitive 2^logSize-th root of unity; logSize <= TWO_ADICITY
    static FieldElement RootOfUnity(size_t logSize);

    bool IsZero() const;
    bool IsOne() const { return *this == One(); }

    bool operator==(const FieldElement& other) const;
    bool operator!=(const FieldElement& other) const;

    /// Ordering of canonical values (for use as an ordered map key)
    bool operator<(const FieldElement& other) const;

    FieldElement operator+(const FieldElement& other) const;
    FieldElement operator-(const FieldElement& other) const;
    FieldElement operator*(const FieldElement& other) const;
    FieldElement operator-() const;

    FieldElement& operator+=(const FieldElement& other);
    FieldElement& operator-=(const FieldElement& other);
    FieldElement& operator*=(const FieldElement& other);

    FieldElement Square() const;

    FieldElement Pow(const Uint256& exp) const;
    FieldElement Pow(uint64_t exp) const { return Pow(Uint256(exp)); }

    /// Inverse (returns 0 if this is 0)
    FieldElement Inverse() const;

    /// S-box for Poseidon: x^5
    FieldElement PoseidonSbox() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        auto bytes = ToBytes();
        s.Write(bytes.data(), bytes.size());
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        std::array<Byte, 32> bytes;
        s.Read(bytes.data(), bytes.size());
        auto fe = FromCanonicalBytes(bytes.data(), bytes.size());
        if (!fe) {
            throw DecodeError("Non-canonical field element");
        }
        *this = *fe;
    }

private:
    static Uint256 MontMul(const Uint256& a, const Uint256& b);
    static Uint256 MontReduce(const Uint256& lo, const Uint256& hi);
    static Uint256 ModAdd(const Uint256& a, const Uint256& b);
    static Uint256 ModSub(const Uint256& a, const Uint256& b);
};

/// Field used throughout the transaction core
using Field = FieldElement;

} // namespace veil

#endif // VEIL_CRYPTO_FIELD_H
