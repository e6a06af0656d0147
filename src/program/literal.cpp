// VEIL - Literals
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/program/literal.h"
#include "veil/core/errors.h"
#include "veil/core/hex.h"

namespace veil {

namespace {

template<typename T>
struct AlwaysFalse : std::false_type {};

} // namespace

const Address& Literal::AsAddress() const {
    if (const auto* v = std::get_if<Address>(&value_)) {
        return *v;
    }
    throw ValueKindError("Expected an address literal");
}

uint64_t Literal::AsU64() const {
    if (const auto* v = std::get_if<uint64_t>(&value_)) {
        return *v;
    }
    throw ValueKindError("Expected a u64 literal");
}

Bits Literal::ToBitsLE() const {
    Bits bits;
    std::visit([&bits](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Address>) {
            bits = v.ToGroup().ToBitsLE();
        } else if constexpr (std::is_same_v<T, bool>) {
            bits.push_back(v);
        } else if constexpr (std::is_same_v<T, Field>) {
            bits = v.ToBitsLE();
        } else if constexpr (std::is_same_v<T, Scalar>) {
            auto le = v.ToBytesLE();
            AppendBytesLE(bits, le.data(), le.size());
        } else if constexpr (std::is_integral_v<T>) {
            AppendBitsLE(bits, static_cast<uint64_t>(v), sizeof(T) * 8);
        } else {
            static_assert(AlwaysFalse<T>::value, "unhandled literal type");
        }
    }, value_);
    return bits;
}

Literal Literal::FromBitsLE(LiteralType type, BitReader& reader) {
    switch (type) {
        case LiteralType::Address: {
            Bits bits = reader.ReadBits(Point::COMPRESSED_SIZE * 8);
            auto bytes = BitsToBytesLE(bits);
            auto point = Point::FromCompressed(bytes.data(), bytes.size());
            if (!point) {
                throw DecodeError("Invalid address literal");
            }
            return FromAddress(Address(*point));
        }
        case LiteralType::Boolean:
            return FromBool(reader.ReadBit());
        case LiteralType::Field: {
            Bits bits = reader.ReadBits(Field::SIZE_IN_BITS);
            auto bytes = BitsToBytesLE(bits);
            auto field = Field::FromCanonicalBytes(bytes.data(), bytes.size());
            if (!field) {
                throw DecodeError("Non-canonical field literal");
            }
            return FromField(*field);
        }
        case LiteralType::U8: return FromU8(static_cast<uint8_t>(reader.ReadUint(8)));
        case LiteralType::U16: return FromU16(static_cast<uint16_t>(reader.ReadUint(16)));
        case LiteralType::U32: return FromU32(static_cast<uint32_t>(reader.ReadUint(32)));
        case LiteralType::U64: return FromU64(reader.ReadUint(64));
        case LiteralType::I64: return FromI64(static_cast<int64_t>(reader.ReadUint(64)));
        case LiteralType::Scalar: {
            Bits bits = reader.ReadBits(256);
            auto bytes = BitsToBytesLE(bits);
            auto scalar = Scalar::FromBytesLE(bytes.data(), bytes.size());
            if (!scalar) {
                throw DecodeError("Non-canonical scalar literal");
            }
            return FromScalar(*scalar);
        }
    }
    throw DecodeError("Invalid literal type");
}

std::string Literal::ToString() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Address>) {
            return v.ToString();
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, Field>) {
            return "0x" + v.ToHex() + "field";
        } else if constexpr (std::is_same_v<T, Scalar>) {
            return "0x" + BytesToHex(v.ToBytesBE()) + "scalar";
        } else if constexpr (std::is_same_v<T, uint8_t>) {
            return std::to_string(static_cast<unsigned>(v)) + "u8";
        } else if constexpr (std::is_same_v<T, uint16_t>) {
            return std::to_string(v) + "u16";
        } else if constexpr (std::is_same_v<T, uint32_t>) {
            return std::to_string(v) + "u32";
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            return std::to_string(v) + "u64";
        } else {
            return std::to_string(v) + "i64";
        }
    }, value_);
}

bool Literal::operator==(const Literal& other) const {
    return value_ == other.value_;
}

} // namespace veil
