// VEIL - Plaintext and Ciphertext
// Copyright (c) 2024 VEIL Developers
// MIT License

#ifndef VEIL_PROGRAM_PLAINTEXT_H
#define VEIL_PROGRAM_PLAINTEXT_H

#include <utility>
#include <vector>
#include "veil/core/serialize.h"
#include "veil/crypto/field.h"
#include "veil/program/bits.h"
#include "veil/program/identifier.h"
#include "veil/program/literal.h"

namespace veil {

class Ciphertext;

// ============================================================================
// Plaintext
// ============================================================================

/**
 * A literal, or a struct of named plaintext members in declaration order
 */
class Plaintext {
public:
    using Members = std::vector<std::pair<Identifier, Plaintext>>;

    Plaintext() = default;
    explicit Plaintext(const Literal& literal) : literal_(literal) {}
    explicit Plaintext(Members members) : isStruct_(true), members_(std::move(members)) {}

    bool IsLiteral() const { return !isStruct_; }
    bool IsStruct() const { return isStruct_; }

    /// Throws ValueKindError on a struct
    const Literal& GetLiteral() const;
    const Members& GetMembers() const { return members_; }

    /// Struct member by name, or nullptr
    const Plaintext* Find(const Identifier& name) const;

    /// Self-describing bit encoding:
    ///   literal: 0 | u8 type | u16 size | value bits
    ///   struct:  1 | u8 count | (identifier | u16 size | member bits)*
    Bits ToBitsLE() const;
    static Plaintext FromBitsLE(BitReader& reader);

    std::vector<Field> ToFields() const { return PackBitsToFields(ToBitsLE()); }

    /// Throws DecodeError if the fields do not hold a plaintext
    static Plaintext FromFields(const std::vector<Field>& fields);

    /// Add HashManyPSD8([encryption_domain, key], n) to the packed fields
    Ciphertext EncryptSymmetric(const Field& key) const;

    bool operator==(const Plaintext& other) const;
    bool operator!=(const Plaintext& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata8(s, isStruct_ ? 1 : 0);
        if (!isStruct_) {
            ::veil::Serialize(s, literal_);
            return;
        }
        ser_writedata8(s, static_cast<uint8_t>(members_.size()));
        for (const auto& m : members_) {
            ::veil::Serialize(s, m.first);
            ::veil::Serialize(s, m.second);
        }
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t variant = ser_readdata8(s);
        if (variant == 0) {
            Literal literal;
            ::veil::Unserialize(s, literal);
            *this = Plaintext(literal);
        } else if (variant == 1) {
            uint8_t count = ser_readdata8(s);
            Members members;
            for (uint8_t i = 0; i < count; ++i) {
                Identifier name;
                Plaintext member;
                ::veil::Unserialize(s, name);
                ::veil::Unserialize(s, member);
                members.emplace_back(std::move(name), std::move(member));
            }
            *this = Plaintext(std::move(members));
        } else {
            throw DecodeError("Failed to decode plaintext variant");
        }
    }

private:
    bool isStruct_{false};
    Literal literal_;
    Members members_;
};

// ============================================================================
// Ciphertext
// ============================================================================

/// Field elements of an encrypted plaintext
class Ciphertext {
public:
    Ciphertext() = default;
    explicit Ciphertext(std::vector<Field> fields) : fields_(std::move(fields)) {}

    const std::vector<Field>& ToFields() const { return fields_; }
    size_t Size() const { return fields_.size(); }

    /// u16 count followed by each element's bits
    Bits ToBitsLE() const;

    /// Throws DecodeError if the key does not yield a well-formed plaintext
    Plaintext DecryptSymmetric(const Field& key) const;

    /// Subtract caller-supplied randomizers (used for record entries)
    Plaintext Decrypt(const std::vector<Field>& randomizers) const;

    bool operator==(const Ciphertext& other) const { return fields_ == other.fields_; }
    bool operator!=(const Ciphertext& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const { SerializeU16Vector(s, fields_); }

    template<typename Stream>
    void Unserialize(Stream& s) { UnserializeU16Vector(s, fields_); }

private:
    std::vector<Field> fields_;
};

/// Symmetric encryption randomizers for `key`
std::vector<Field> SymmetricRandomizers(const Field& key, size_t count);

} // namespace veil

#endif // VEIL_PROGRAM_PLAINTEXT_H
