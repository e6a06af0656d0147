// VEIL - Finite Field Arithmetic Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Montgomery arithmetic over the BN254 scalar field

#include "veil/crypto/field.h"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace veil {

// ============================================================================
// BN254 Scalar Field Constants
// ============================================================================

// r = 0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001
const Uint256 FieldElement::MODULUS{
    0x43e1f593f0000001ULL,
    0x2833e84879b97091ULL,
    0xb85045b68181585dULL,
    0x30644e72e131a029ULL
};

// R = 2^256 mod r
const Uint256 FieldElement::R{
    0xac96341c4ffffffbULL,
    0x36fc76959f60cd29ULL,
    0x666ea36f7879462eULL,
    0x0e0a77c19a07df2fULL
};

// R^2 mod r
const Uint256 FieldElement::R2{
    0x1bb8e645ae216da7ULL,
    0x53fe3ab1e35c59e3ULL,
    0x8c49833d53bb8085ULL,
    0x0216d0b17f4e44a5ULL
};

const uint64_t FieldElement::INV = 0xc2e1f593efffffffULL;

namespace {

uint64_t ReadLimbLE(const Byte* p) {
    uint64_t v = 0;
    for (int k = 7; k >= 0; --k) {
        v = (v << 8) | p[k];
    }
    return v;
}

void WriteLimbLE(uint64_t v, Byte* p) {
    for (int k = 0; k < 8; ++k) {
        p[k] = static_cast<Byte>(v >> (8 * k));
    }
}

uint8_t HexNibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    throw std::invalid_argument("Invalid hex character");
}

} // namespace

// ============================================================================
// Uint256 Implementation
// ============================================================================

Uint256::Uint256(const Byte* data, size_t len) : limbs{0, 0, 0, 0} {
    Byte temp[32] = {0};
    std::memcpy(temp, data, std::min(len, size_t(32)));
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        limbs[i] = ReadLimbLE(temp + 8 * i);
    }
}

Uint256 Uint256::FromHex(const std::string& hex) {
    std::string h = hex;
    if (h.size() >= 2 && h[0] == '0' && (h[1] == 'x' || h[1] == 'X')) {
        h = h.substr(2);
    }
    if (h.size() > 64) {
        throw std::invalid_argument("Hex string too long for 256-bit value");
    }
    h.insert(0, 64 - h.size(), '0');

    Byte bytes[32];
    for (size_t i = 0; i < 32; ++i) {
        size_t idx = (31 - i) * 2;
        bytes[i] = static_cast<Byte>((HexNibble(h[idx]) << 4) | HexNibble(h[idx + 1]));
    }
    return Uint256(bytes, 32);
}

std::string Uint256::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";
    auto bytes = ToBytes();
    std::string result;
    result.reserve(64);
    for (size_t i = 32; i-- > 0;) {
        result.push_back(hexChars[bytes[i] >> 4]);
        result.push_back(hexChars[bytes[i] & 0x0F]);
    }
    return result;
}

std::array<Byte, 32> Uint256::ToBytes() const {
    std::array<Byte, 32> result;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        WriteLimbLE(limbs[i], result.data() + 8 * i);
    }
    return result;
}

bool Uint256::IsZero() const {
    return (limbs[0] | limbs[1] | limbs[2] | limbs[3]) == 0;
}

bool Uint256::operator<(const Uint256& other) const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] != other.limbs[i]) return limbs[i] < other.limbs[i];
    }
    return false;
}

Uint256 Uint256::Add(const Uint256& a, const Uint256& b, bool& carry) {
    Uint256 result;
    uint64_t c = 0;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        __uint128_t sum = static_cast<__uint128_t>(a.limbs[i]) + b.limbs[i] + c;
        result.limbs[i] = static_cast<uint64_t>(sum);
        c = static_cast<uint64_t>(sum >> 64);
    }
    carry = (c != 0);
    return result;
}

Uint256 Uint256::Sub(const Uint256& a, const Uint256& b, bool& borrow) {
    Uint256 result;
    uint64_t bw = 0;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        __uint128_t diff = static_cast<__uint128_t>(a.limbs[i]) - b.limbs[i] - bw;
        result.limbs[i] = static_cast<uint64_t>(diff);
        bw = static_cast<uint64_t>((diff >> 127) & 1);
    }
    borrow = (bw != 0);
    return result;
}

Uint256 Uint256::Mul(const Uint256& a, const Uint256& b, Uint256& high) {
    // Schoolbook 4x4 limbs, row by row with carry propagation
    uint64_t t[8] = {0};
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        uint64_t carry = 0;
        for (size_t j = 0; j < NUM_LIMBS; ++j) {
            __uint128_t cur = static_cast<__uint128_t>(a.limbs[i]) * b.limbs[j] +
                              t[i + j] + carry;
            t[i + j] = static_cast<uint64_t>(cur);
            carry = static_cast<uint64_t>(cur >> 64);
        }
        t[i + NUM_LIMBS] = carry;
    }
    high = Uint256(t[4], t[5], t[6], t[7]);
    return Uint256(t[0], t[1], t[2], t[3]);
}

Uint256 Uint256::operator<<(int shift) const {
    if (shift <= 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;
    for (int i = 3; i >= limbShift; --i) {
        result.limbs[i] = limbs[i - limbShift] << bitShift;
        if (bitShift != 0 && i > limbShift) {
            result.limbs[i] |= limbs[i - limbShift - 1] >> (64 - bitShift);
        }
    }
    return result;
}

Uint256 Uint256::operator>>(int shift) const {
    if (shift <= 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;
    for (int i = 0; i < 4 - limbShift; ++i) {
        result.limbs[i] = limbs[i + limbShift] >> bitShift;
        if (bitShift != 0 && i + limbShift + 1 < 4) {
            result.limbs[i] |= limbs[i + limbShift + 1] << (64 - bitShift);
        }
    }
    return result;
}

// ============================================================================
// FieldElement Implementation
// ============================================================================

FieldElement::FieldElement() : value() {}

FieldElement::FieldElement(const Uint256& val) : value(MontMul(val, R2)) {}

FieldElement::FieldElement(uint64_t val) : value(MontMul(Uint256(val), R2)) {}

FieldElement FieldElement::Zero() {
    return FieldElement();
}

FieldElement FieldElement::One() {
    FieldElement fe;
    fe.value = R;
    return fe;
}

Uint256 FieldElement::ToUint256() const {
    return MontReduce(value, Uint256());
}

std::array<Byte, 32> FieldElement::ToBytes() const {
    return ToUint256().ToBytes();
}

FieldElement FieldElement::FromBytes(const Byte* data, size_t len) {
    if (len <= 32) {
        return FieldElement(Uint256(data, len));
    }
    // Horner over 32-byte chunks, most significant chunk first
    const FieldElement shift(R);  // 2^256 mod r
    FieldElement acc = Zero();
    size_t chunks = (len + 31) / 32;
    for (size_t c = chunks; c-- > 0;) {
        size_t offset = c * 32;
        size_t n = std::min(size_t(32), len - offset);
        acc = acc * shift + FieldElement(Uint256(data + offset, n));
    }
    return acc;
}

std::optional<FieldElement> FieldElement::FromCanonicalBytes(const Byte* data, size_t len) {
    if (len != SIZE_IN_BYTES) {
        return std::nullopt;
    }
    Uint256 v(data, len);
    if (v >= MODULUS) {
        return std::nullopt;
    }
    return FieldElement(v);
}

FieldElement FieldElement::FromHex(const std::string& hex) {
    return FieldElement(Uint256::FromHex(hex));
}

FieldElement FieldElement::FromDomain(const std::string& tag) {
    return FromBytes(reinterpret_cast<const Byte*>(tag.data()), tag.size());
}

Bits FieldElement::ToBitsLE() const {
    Uint256 v = ToUint256();
    Bits bits(SIZE_IN_BITS);
    for (size_t i = 0; i < SIZE_IN_BITS; ++i) {
        bits[i] = v.Bit(i);
    }
    return bits;
}

FieldElement FieldElement::FromBitsLE(const Bits& bits) {
    std::vector<Byte> bytes = BitsToBytesLE(bits);
    return FromBytes(bytes.data(), bytes.size());
}

FieldElement FieldElement::RootOfUnity(size_t logSize) {
    if (logSize > TWO_ADICITY) {
        throw std::invalid_argument("Requested root of unity exceeds the field's two-adicity");
    }
    bool borrow;
    Uint256 exp = Uint256::Sub(MODULUS, Uint256(1), borrow) >> static_cast<int>(TWO_ADICITY);
    FieldElement root = FieldElement(GENERATOR).Pow(exp);
    for (size_t i = logSize; i < TWO_ADICITY; ++i) {
        root = root.Square();
    }
    return root;
}

bool FieldElement::IsZero() const {
    return value.IsZero();
}

bool FieldElement::operator==(const FieldElement& other) const {
    return value == other.value;
}

bool FieldElement::operator!=(const FieldElement& other) const {
    return value != other.value;
}

bool FieldElement::operator<(const FieldElement& other) const {
    return ToUint256() < other.ToUint256();
}

Uint256 FieldElement::ModAdd(const Uint256& a, const Uint256& b) {
    bool carry;
    Uint256 sum = Uint256::Add(a, b, carry);
    if (carry || sum >= MODULUS) {
        bool borrow;
        sum = Uint256::Sub(sum, MODULUS, borrow);
    }
    return sum;
}

Uint256 FieldElement::ModSub(const Uint256& a, const Uint256& b) {
    bool borrow;
    Uint256 diff = Uint256::Sub(a, b, borrow);
    if (borrow) {
        bool carry;
        diff = Uint256::Add(diff, MODULUS, carry);
    }
    return diff;
}

Uint256 FieldElement::MontMul(const Uint256& a, const Uint256& b) {
    Uint256 hi;
    Uint256 lo = Uint256::Mul(a, b, hi);
    return MontReduce(lo, hi);
}

Uint256 FieldElement::MontReduce(const Uint256& lo, const Uint256& hi) {
    // Word-by-word REDC over the 512-bit input (lo, hi)
    uint64_t t[9] = {lo.limbs[0], lo.limbs[1], lo.limbs[2], lo.limbs[3],
                     hi.limbs[0], hi.limbs[1], hi.limbs[2], hi.limbs[3], 0};
    for (size_t i = 0; i < 4; ++i) {
        uint64_t m = t[i] * INV;
        uint64_t carry = 0;
        for (size_t j = 0; j < 4; ++j) {
            __uint128_t cur = static_cast<__uint128_t>(m) * MODULUS.limbs[j] + t[i + j] + carry;
            t[i + j] = static_cast<uint64_t>(cur);
            carry = static_cast<uint64_t>(cur >> 64);
        }
        for (size_t k = i + 4; carry != 0 && k < 9; ++k) {
            __uint128_t cur = static_cast<__uint128_t>(t[k]) + carry;
            t[k] = static_cast<uint64_t>(cur);
            carry = static_cast<uint64_t>(cur >> 64);
        }
    }

    Uint256 result(t[4], t[5], t[6], t[7]);
    if (t[8] != 0 || result >= MODULUS) {
        bool borrow;
        result = Uint256::Sub(result, MODULUS, borrow);
    }
    return result;
}

FieldElement FieldElement::operator+(const FieldElement& other) const {
    FieldElement result;
    result.value = ModAdd(value, other.value);
    return result;
}

FieldElement FieldElement::operator-(const FieldElement& other) const {
    FieldElement result;
    result.value = ModSub(value, other.value);
    return result;
}

FieldElement FieldElement::operator*(const FieldElement& other) const {
    FieldElement result;
    result.value = MontMul(value, other.value);
    return result;
}

FieldElement FieldElement::operator-() const {
    if (IsZero()) return *this;
    FieldElement result;
    bool borrow;
    result.value = Uint256::Sub(MODULUS, value, borrow);
    return result;
}

FieldElement& FieldElement::operator+=(const FieldElement& other) {
    value = ModAdd(value, other.value);
    return *this;
}

FieldElement& FieldElement::operator-=(const FieldElement& other) {
    value = ModSub(value, other.value);
    return *this;
}

FieldElement& FieldElement::operator*=(const FieldElement& other) {
    value = MontMul(value, other.value);
    return *this;
}

FieldElement FieldElement::Square() const {
    return (*this) * (*this);
}

FieldElement FieldElement::Pow(const Uint256& exp) const {
    // Left-to-right square-and-multiply
    FieldElement result = One();
    bool started = false;
    for (size_t i = 256; i-- > 0;) {
        if (started) {
            result = result.Square();
        }
        if (exp.Bit(i)) {
            result *= *this;
            started = true;
        }
    }
    return result;
}

FieldElement FieldElement::Inverse() const {
    if (IsZero()) return Zero();
    bool borrow;
    Uint256 pMinus2 = Uint256::Sub(MODULUS, Uint256(2), borrow);
    return Pow(pMinus2);
}

FieldElement FieldElement::PoseidonSbox() const {
    FieldElement x4 = Square().Square();
    return x4 * (*this);
}

} // namespace veil
