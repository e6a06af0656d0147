// VEIL - Program Identifiers
// Copyright (c) 2024 VEIL Developers
// MIT License

#ifndef VEIL_PROGRAM_IDENTIFIER_H
#define VEIL_PROGRAM_IDENTIFIER_H

#include <cstdint>
#include <optional>
#include <string>
#include "veil/core/types.h"
#include "veil/core/serialize.h"
#include "veil/crypto/field.h"
#include "veil/program/bits.h"

namespace veil {

// ============================================================================
// Identifier
// ============================================================================

/**
 * Name of a program, function, record or struct member: a letter followed
 * by letters, digits or '_', at most 31 bytes
 */
class Identifier {
public:
    static constexpr size_t MAX_SIZE = 31;

    Identifier() = default;

    /// Throws Error on an invalid name
    explicit Identifier(const std::string& name);

    static std::optional<Identifier> FromString(const std::string& name);
    static bool IsValid(const std::string& name);

    const std::string& ToString() const { return name_; }

    /// Name bytes read as a little-endian field element
    Field ToField() const;

    /// u8 length followed by the name bytes
    Bits ToBitsLE() const;
    static Identifier FromBitsLE(BitReader& reader);

    bool operator==(const Identifier& other) const { return name_ == other.name_; }
    bool operator!=(const Identifier& other) const { return name_ != other.name_; }
    bool operator<(const Identifier& other) const { return name_ < other.name_; }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata8(s, static_cast<uint8_t>(name_.size()));
        s.Write(name_.data(), name_.size());
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t len = ser_readdata8(s);
        std::string name(len, '\0');
        if (len > 0) {
            s.Read(&name[0], len);
        }
        auto id = FromString(name);
        if (!id) {
            throw DecodeError("Invalid identifier");
        }
        *this = *id;
    }

private:
    std::string name_;
};

// ============================================================================
// ProgramID
// ============================================================================

/**
 * `name.network`, e.g. "token.aleo"
 */
class ProgramID {
public:
    ProgramID() = default;
    ProgramID(const Identifier& name, const Identifier& network) : name_(name), network_(network) {}

    static std::optional<ProgramID> FromString(const std::string& str);

    const Identifier& Name() const { return name_; }
    const Identifier& Network() const { return network_; }

    std::string ToString() const { return name_.ToString() + "." + network_.ToString(); }

    Bits ToBitsLE() const;

    bool operator==(const ProgramID& other) const {
        return name_ == other.name_ && network_ == other.network_;
    }
    bool operator!=(const ProgramID& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::veil::Serialize(s, name_);
        ::veil::Serialize(s, network_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::veil::Unserialize(s, name_);
        ::veil::Unserialize(s, network_);
    }

private:
    Identifier name_;
    Identifier network_;
};

// ============================================================================
// ValueType
// ============================================================================

/// Declared type of a function input or output
class ValueType {
public:
    enum class Kind : uint8_t {
        Constant = 0,
        Public = 1,
        Private = 2,
        Record = 3,
        ExternalRecord = 4,
    };

    ValueType() = default;

    static ValueType Constant(const std::string& plaintextType);
    static ValueType Public(const std::string& plaintextType);
    static ValueType Private(const std::string& plaintextType);
    static ValueType Record(const Identifier& recordName);
    static ValueType ExternalRecord(const ProgramID& program, const Identifier& recordName);

    /// "u64.public", "token.record", "token.aleo/token.record"
    static std::optional<ValueType> FromString(const std::string& str);

    Kind GetKind() const { return kind_; }

    /// Plaintext type name for Constant/Public/Private
    const std::string& PlaintextType() const { return plaintextType_; }

    /// Record name for Record/ExternalRecord
    const Identifier& RecordName() const { return recordName_; }

    /// Owning program for ExternalRecord
    const ProgramID& ExternalProgram() const { return externalProgram_; }

    std::string ToString() const;

private:
    Kind kind_{Kind::Constant};
    std::string plaintextType_;
    Identifier recordName_;
    ProgramID externalProgram_;
};

} // namespace veil

#endif // VEIL_PROGRAM_IDENTIFIER_H
