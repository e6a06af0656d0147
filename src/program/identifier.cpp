// VEIL - Program Identifiers
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/program/identifier.h"
#include "veil/core/errors.h"

#include <cctype>

namespace veil {

// ============================================================================
// Identifier
// ============================================================================

Identifier::Identifier(const std::string& name) : name_(name) {
    if (!IsValid(name)) {
        throw Error("Invalid identifier '" + name + "'");
    }
}

bool Identifier::IsValid(const std::string& name) {
    if (name.empty() || name.size() > MAX_SIZE) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

std::optional<Identifier> Identifier::FromString(const std::string& name) {
    if (!IsValid(name)) {
        return std::nullopt;
    }
    return Identifier(name);
}

Field Identifier::ToField() const {
    return Field::FromDomain(name_);
}

Bits Identifier::ToBitsLE() const {
    Bits bits;
    AppendBitsLE(bits, name_.size(), 8);
    AppendBytesLE(bits, reinterpret_cast<const Byte*>(name_.data()), name_.size());
    return bits;
}

Identifier Identifier::FromBitsLE(BitReader& reader) {
    size_t len = static_cast<size_t>(reader.ReadUint(8));
    std::string name;
    name.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        name.push_back(static_cast<char>(reader.ReadUint(8)));
    }
    auto id = FromString(name);
    if (!id) {
        throw DecodeError("Invalid identifier in bit encoding");
    }
    return *id;
}

// ============================================================================
// ProgramID
// ============================================================================

std::optional<ProgramID> ProgramID::FromString(const std::string& str) {
    auto dot = str.find('.');
    if (dot == std::string::npos || str.find('.', dot + 1) != std::string::npos) {
        return std::nullopt;
    }
    auto name = Identifier::FromString(str.substr(0, dot));
    auto network = Identifier::FromString(str.substr(dot + 1));
    if (!name || !network) {
        return std::nullopt;
    }
    return ProgramID(*name, *network);
}

Bits ProgramID::ToBitsLE() const {
    Bits bits = name_.ToBitsLE();
    Bits net = network_.ToBitsLE();
    bits.insert(bits.end(), net.begin(), net.end());
    return bits;
}

// ============================================================================
// ValueType
// ============================================================================

ValueType ValueType::Constant(const std::string& plaintextType) {
    ValueType t;
    t.kind_ = Kind::Constant;
    t.plaintextType_ = plaintextType;
    return t;
}

ValueType ValueType::Public(const std::string& plaintextType) {
    ValueType t = Constant(plaintextType);
    t.kind_ = Kind::Public;
    return t;
}

ValueType ValueType::Private(const std::string& plaintextType) {
    ValueType t = Constant(plaintextType);
    t.kind_ = Kind::Private;
    return t;
}

ValueType ValueType::Record(const Identifier& recordName) {
    ValueType t;
    t.kind_ = Kind::Record;
    t.recordName_ = recordName;
    return t;
}

ValueType ValueType::ExternalRecord(const ProgramID& program, const Identifier& recordName) {
    ValueType t;
    t.kind_ = Kind::ExternalRecord;
    t.recordName_ = recordName;
    t.externalProgram_ = program;
    return t;
}

std::optional<ValueType> ValueType::FromString(const std::string& str) {
    auto dot = str.rfind('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    std::string head = str.substr(0, dot);
    std::string mode = str.substr(dot + 1);

    if (mode == "record") {
        auto slash = head.find('/');
        if (slash == std::string::npos) {
            auto name = Identifier::FromString(head);
            if (!name) return std::nullopt;
            return Record(*name);
        }
        auto program = ProgramID::FromString(head.substr(0, slash));
        auto name = Identifier::FromString(head.substr(slash + 1));
        if (!program || !name) return std::nullopt;
        return ExternalRecord(*program, *name);
    }

    if (!Identifier::IsValid(head)) {
        return std::nullopt;
    }
    if (mode == "constant") return Constant(head);
    if (mode == "public") return Public(head);
    if (mode == "private") return Private(head);
    return std::nullopt;
}

std::string ValueType::ToString() const {
    switch (kind_) {
        case Kind::Constant: return plaintextType_ + ".constant";
        case Kind::Public: return plaintextType_ + ".public";
        case Kind::Private: return plaintextType_ + ".private";
        case Kind::Record: return recordName_.ToString() + ".record";
        case Kind::ExternalRecord:
            return externalProgram_.ToString() + "/" + recordName_.ToString() + ".record";
    }
    return "unknown";
}

} // namespace veil
