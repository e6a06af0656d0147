// VEIL - Plaintext and Ciphertext
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/program/plaintext.h"
#include "veil/core/errors.h"
#include "veil/network/network.h"

namespace veil {

// ============================================================================
// Plaintext
// ============================================================================

const Literal& Plaintext::GetLiteral() const {
    if (isStruct_) {
        throw ValueKindError("Expected a literal plaintext, found a struct");
    }
    return literal_;
}

const Plaintext* Plaintext::Find(const Identifier& name) const {
    for (const auto& m : members_) {
        if (m.first == name) {
            return &m.second;
        }
    }
    return nullptr;
}

Bits Plaintext::ToBitsLE() const {
    Bits bits;
    bits.push_back(isStruct_);
    if (!isStruct_) {
        Bits value = literal_.ToBitsLE();
        AppendBitsLE(bits, static_cast<uint8_t>(literal_.Type()), 8);
        AppendBitsLE(bits, value.size(), 16);
        bits.insert(bits.end(), value.begin(), value.end());
        return bits;
    }
    if (members_.size() > 0xFF) {
        throw Error("Plaintext struct has too many members");
    }
    AppendBitsLE(bits, members_.size(), 8);
    for (const auto& m : members_) {
        Bits name = m.first.ToBitsLE();
        Bits value = m.second.ToBitsLE();
        if (value.size() > 0xFFFF) {
            throw Error("Plaintext member exceeds the encodable size");
        }
        bits.insert(bits.end(), name.begin(), name.end());
        AppendBitsLE(bits, value.size(), 16);
        bits.insert(bits.end(), value.begin(), value.end());
    }
    return bits;
}

Plaintext Plaintext::FromBitsLE(BitReader& reader) {
    bool isStruct = reader.ReadBit();
    if (!isStruct) {
        auto type = static_cast<LiteralType>(reader.ReadUint(8));
        size_t size = static_cast<size_t>(reader.ReadUint(16));
        size_t before = reader.Remaining();
        Literal literal = Literal::FromBitsLE(type, reader);
        if (before - reader.Remaining() != size) {
            throw DecodeError("Literal size mismatch in plaintext bits");
        }
        return Plaintext(literal);
    }
    size_t count = static_cast<size_t>(reader.ReadUint(8));
    Members members;
    members.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        Identifier name = Identifier::FromBitsLE(reader);
        size_t size = static_cast<size_t>(reader.ReadUint(16));
        size_t before = reader.Remaining();
        Plaintext member = FromBitsLE(reader);
        if (before - reader.Remaining() != size) {
            throw DecodeError("Member size mismatch in plaintext bits");
        }
        members.emplace_back(std::move(name), std::move(member));
    }
    return Plaintext(std::move(members));
}

Plaintext Plaintext::FromFields(const std::vector<Field>& fields) {
    auto bits = UnpackFieldsToBits(fields);
    if (!bits) {
        throw DecodeError("Malformed plaintext field packing");
    }
    BitReader reader(*bits);
    Plaintext plaintext = FromBitsLE(reader);
    if (!reader.AtEnd()) {
        throw DecodeError("Trailing bits after plaintext");
    }
    return plaintext;
}

Ciphertext Plaintext::EncryptSymmetric(const Field& key) const {
    std::vector<Field> fields = ToFields();
    std::vector<Field> randomizers = SymmetricRandomizers(key, fields.size());
    for (size_t i = 0; i < fields.size(); ++i) {
        fields[i] += randomizers[i];
    }
    return Ciphertext(std::move(fields));
}

bool Plaintext::operator==(const Plaintext& other) const {
    if (isStruct_ != other.isStruct_) {
        return false;
    }
    return isStruct_ ? members_ == other.members_ : literal_ == other.literal_;
}

// ============================================================================
// Ciphertext
// ============================================================================

std::vector<Field> SymmetricRandomizers(const Field& key, size_t count) {
    return network::HashManyPSD8({network::EncryptionDomain(), key}, count);
}

Bits Ciphertext::ToBitsLE() const {
    Bits bits;
    AppendBitsLE(bits, fields_.size(), 16);
    for (const auto& f : fields_) {
        Bits fb = f.ToBitsLE();
        bits.insert(bits.end(), fb.begin(), fb.end());
    }
    return bits;
}

Plaintext Ciphertext::Decrypt(const std::vector<Field>& randomizers) const {
    if (randomizers.size() != fields_.size()) {
        throw Error("Randomizer count does not match the ciphertext size");
    }
    std::vector<Field> fields(fields_.size());
    for (size_t i = 0; i < fields_.size(); ++i) {
        fields[i] = fields_[i] - randomizers[i];
    }
    return Plaintext::FromFields(fields);
}

Plaintext Ciphertext::DecryptSymmetric(const Field& key) const {
    return Decrypt(SymmetricRandomizers(key, fields_.size()));
}

} // namespace veil
