// VEIL - Transition Outputs
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// The public form of a function output as recorded in a transition.
// Record outputs travel encrypted; their checksum binds the ciphertext.

#ifndef VEIL_TRANSITION_OUTPUT_H
#define VEIL_TRANSITION_OUTPUT_H

#include <cstdint>
#include <optional>
#include <variant>
#include "veil/core/serialize.h"
#include "veil/crypto/field.h"
#include "veil/crypto/group.h"
#include "veil/program/identifier.h"
#include "veil/program/plaintext.h"
#include "veil/program/record.h"
#include "veil/transition/input.h"

namespace veil {

namespace output {

struct Constant {
    Field hash;
    std::optional<Plaintext> plaintext;
    bool operator==(const Constant& other) const { return hash == other.hash && plaintext == other.plaintext; }
};

struct Public {
    Field hash;
    std::optional<Plaintext> plaintext;
    bool operator==(const Public& other) const { return hash == other.hash && plaintext == other.plaintext; }
};

struct Private {
    Field hash;
    std::optional<Ciphertext> ciphertext;
    bool operator==(const Private& other) const { return hash == other.hash && ciphertext == other.ciphertext; }
};

struct Record {
    Field commitment;
    Field checksum;
    std::optional<RecordCiphertext> record;
    bool operator==(const Record& other) const {
        return commitment == other.commitment && checksum == other.checksum && record == other.record;
    }
};

struct ExternalRecord {
    Field hash;
    bool operator==(const ExternalRecord& other) const { return hash == other.hash; }
};

} // namespace output

class Output {
public:
    /// Variant index matches ValueType::Kind
    using Variant = std::variant<output::Constant,
                                 output::Public,
                                 output::Private,
                                 output::Record,
                                 output::ExternalRecord>;

    Output() = default;
    Output(Variant value) : value_(std::move(value)) {}

    ValueType::Kind GetKind() const { return static_cast<ValueType::Kind>(value_.index()); }
    uint8_t VariantIndex() const { return static_cast<uint8_t>(value_.index()); }
    const Variant& Get() const { return value_; }

    /// The hash, or the commitment for a record
    const Field& ID() const;

    /// Commitment of a record output, or nullptr
    const Field* Commitment() const;

    /// Nonce of an attached record ciphertext, or nullptr
    const Point* Nonce() const;

    /// Attached record ciphertext, or nullptr
    const RecordCiphertext* GetRecord() const;

    /// Recompute the hash or checksum of an attached payload. Outputs
    /// without a payload, and external records, are trivially valid.
    bool Verify(const Field& functionID, const Field& tcm, size_t index) const;

    bool operator==(const Output& other) const { return value_ == other.value_; }
    bool operator!=(const Output& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata8(s, VariantIndex());
        switch (value_.index()) {
            case 0: {
                const auto& v = std::get<output::Constant>(value_);
                ::veil::Serialize(s, v.hash);
                detail::SerializeOptional(s, v.plaintext);
                break;
            }
            case 1: {
                const auto& v = std::get<output::Public>(value_);
                ::veil::Serialize(s, v.hash);
                detail::SerializeOptional(s, v.plaintext);
                break;
            }
            case 2: {
                const auto& v = std::get<output::Private>(value_);
                ::veil::Serialize(s, v.hash);
                detail::SerializeOptional(s, v.ciphertext);
                break;
            }
            case 3: {
                const auto& v = std::get<output::Record>(value_);
                ::veil::Serialize(s, v.commitment);
                ::veil::Serialize(s, v.checksum);
                detail::SerializeOptional(s, v.record);
                break;
            }
            default:
                ::veil::Serialize(s, std::get<output::ExternalRecord>(value_).hash);
                break;
        }
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t variant = ser_readdata8(s);
        switch (variant) {
            case 0: {
                output::Constant v;
                ::veil::Unserialize(s, v.hash);
                detail::UnserializeOptional(s, v.plaintext);
                value_ = std::move(v);
                break;
            }
            case 1: {
                output::Public v;
                ::veil::Unserialize(s, v.hash);
                detail::UnserializeOptional(s, v.plaintext);
                value_ = std::move(v);
                break;
            }
            case 2: {
                output::Private v;
                ::veil::Unserialize(s, v.hash);
                detail::UnserializeOptional(s, v.ciphertext);
                value_ = std::move(v);
                break;
            }
            case 3: {
                output::Record v;
                ::veil::Unserialize(s, v.commitment);
                ::veil::Unserialize(s, v.checksum);
                detail::UnserializeOptional(s, v.record);
                value_ = std::move(v);
                break;
            }
            case 4: {
                output::ExternalRecord v;
                ::veil::Unserialize(s, v.hash);
                value_ = v;
                break;
            }
            default:
                throw DecodeError("Failed to decode output variant " + std::to_string(variant));
        }
    }

private:
    Variant value_;
};

} // namespace veil

#endif // VEIL_TRANSITION_OUTPUT_H
