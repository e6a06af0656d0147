// VEIL - Literals
// Copyright (c) 2024 VEIL Developers
// MIT License

#ifndef VEIL_PROGRAM_LITERAL_H
#define VEIL_PROGRAM_LITERAL_H

#include <cstdint>
#include <string>
#include <variant>
#include "veil/account/keys.h"
#include "veil/core/serialize.h"
#include "veil/crypto/field.h"
#include "veil/crypto/group.h"
#include "veil/program/bits.h"

namespace veil {

/// Literal type tags; the numeric value is the encoding tag
enum class LiteralType : uint8_t {
    Address = 0,
    Boolean = 1,
    Field = 2,
    U8 = 3,
    U16 = 4,
    U32 = 5,
    U64 = 6,
    I64 = 7,
    Scalar = 8,
};

class Literal {
public:
    /// Alternatives are ordered as LiteralType
    using Storage = std::variant<Address, bool, Field, uint8_t, uint16_t, uint32_t, uint64_t, int64_t, Scalar>;

    Literal() : value_(std::in_place_index<1>, false) {}

    static Literal FromAddress(const Address& v) { return Literal(Storage(std::in_place_index<0>, v)); }
    static Literal FromBool(bool v) { return Literal(Storage(std::in_place_index<1>, v)); }
    static Literal FromField(const Field& v) { return Literal(Storage(std::in_place_index<2>, v)); }
    static Literal FromU8(uint8_t v) { return Literal(Storage(std::in_place_index<3>, v)); }
    static Literal FromU16(uint16_t v) { return Literal(Storage(std::in_place_index<4>, v)); }
    static Literal FromU32(uint32_t v) { return Literal(Storage(std::in_place_index<5>, v)); }
    static Literal FromU64(uint64_t v) { return Literal(Storage(std::in_place_index<6>, v)); }
    static Literal FromI64(int64_t v) { return Literal(Storage(std::in_place_index<7>, v)); }
    static Literal FromScalar(const Scalar& v) { return Literal(Storage(std::in_place_index<8>, v)); }

    LiteralType Type() const { return static_cast<LiteralType>(value_.index()); }
    const Storage& Value() const { return value_; }

    /// Throws ValueKindError when the literal holds another type
    const Address& AsAddress() const;
    uint64_t AsU64() const;

    /// Value bits only (no type tag)
    Bits ToBitsLE() const;

    /// Parse `Type()`-typed value bits
    static Literal FromBitsLE(LiteralType type, BitReader& reader);

    std::string ToString() const;

    bool operator==(const Literal& other) const;
    bool operator!=(const Literal& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata8(s, static_cast<uint8_t>(Type()));
        std::visit([&s](const auto& v) { ::veil::Serialize(s, v); }, value_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t tag = ser_readdata8(s);
        switch (static_cast<LiteralType>(tag)) {
            case LiteralType::Address: { Address v; ::veil::Unserialize(s, v); *this = FromAddress(v); break; }
            case LiteralType::Boolean: { bool v; ::veil::Unserialize(s, v); *this = FromBool(v); break; }
            case LiteralType::Field: { Field v; ::veil::Unserialize(s, v); *this = FromField(v); break; }
            case LiteralType::U8: { uint8_t v; ::veil::Unserialize(s, v); *this = FromU8(v); break; }
            case LiteralType::U16: { uint16_t v; ::veil::Unserialize(s, v); *this = FromU16(v); break; }
            case LiteralType::U32: { uint32_t v; ::veil::Unserialize(s, v); *this = FromU32(v); break; }
            case LiteralType::U64: { uint64_t v; ::veil::Unserialize(s, v); *this = FromU64(v); break; }
            case LiteralType::I64: { int64_t v; ::veil::Unserialize(s, v); *this = FromI64(v); break; }
            case LiteralType::Scalar: { Scalar v; ::veil::Unserialize(s, v); *this = FromScalar(v); break; }
            default: throw DecodeError("Invalid literal type " + std::to_string(tag));
        }
    }

private:
    explicit Literal(Storage value) : value_(std::move(value)) {}

    Storage value_;
};

} // namespace veil

#endif // VEIL_PROGRAM_LITERAL_H
