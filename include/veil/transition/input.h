// VEIL - Transition Inputs
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// The public form of a request input as recorded in a transition.
// Plaintext and ciphertext payloads are optional so that pruned
// transitions keep only the hashes.

#ifndef VEIL_TRANSITION_INPUT_H
#define VEIL_TRANSITION_INPUT_H

#include <cstdint>
#include <optional>
#include <variant>
#include "veil/core/serialize.h"
#include "veil/crypto/field.h"
#include "veil/program/identifier.h"
#include "veil/program/plaintext.h"

namespace veil {

namespace input {

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
    Field serialNumber;
    Field tag;
    bool operator==(const Record& other) const {
        return serialNumber == other.serialNumber && tag == other.tag;
    }
};

struct ExternalRecord {
    Field hash;
    bool operator==(const ExternalRecord& other) const { return hash == other.hash; }
};

} // namespace input

class Input {
public:
    /// Variant index matches ValueType::Kind
    using Variant = std::variant<input::Constant,
                                 input::Public,
                                 input::Private,
                                 input::Record,
                                 input::ExternalRecord>;

    Input() = default;
    Input(Variant value) : value_(std::move(value)) {}

    ValueType::Kind GetKind() const { return static_cast<ValueType::Kind>(value_.index()); }
    uint8_t VariantIndex() const { return static_cast<uint8_t>(value_.index()); }
    const Variant& Get() const { return value_; }

    /// The hash, or the serial number for a record
    const Field& ID() const;

    /// Serial number of a record input, or nullptr
    const Field* SerialNumber() const;

    /// Tag of a record input, or nullptr
    const Field* Tag() const;

    /// Recompute the hash of an attached plaintext or ciphertext. Inputs
    /// without a payload, and record inputs, are trivially valid.
    bool Verify(const Field& functionID, const Field& tcm, size_t index) const;

    bool operator==(const Input& other) const { return value_ == other.value_; }
    bool operator!=(const Input& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const;

    template<typename Stream>
    void Unserialize(Stream& s);

private:
    Variant value_;
};

namespace detail {

/// HashPSD8([function_id, plaintext fields, tcm, index]), the ID of a
/// constant or public input or output
Field HashPlaintextPayload(const Field& functionID, const Plaintext& plaintext,
                           const Field& tcm, size_t index);

template<typename Stream, typename T>
void SerializeOptional(Stream& s, const std::optional<T>& value) {
    ::veil::Serialize(s, value.has_value());
    if (value) {
        ::veil::Serialize(s, *value);
    }
}

template<typename Stream, typename T>
void UnserializeOptional(Stream& s, std::optional<T>& value) {
    bool exists = false;
    ::veil::Unserialize(s, exists);
    value.reset();
    if (exists) {
        T item;
        ::veil::Unserialize(s, item);
        value = std::move(item);
    }
}

} // namespace detail

template<typename Stream>
void Input::Serialize(Stream& s) const {
    ser_writedata8(s, VariantIndex());
    switch (value_.index()) {
        case 0: {
            const auto& v = std::get<input::Constant>(value_);
            ::veil::Serialize(s, v.hash);
            detail::SerializeOptional(s, v.plaintext);
            break;
        }
        case 1: {
            const auto& v = std::get<input::Public>(value_);
            ::veil::Serialize(s, v.hash);
            detail::SerializeOptional(s, v.plaintext);
            break;
        }
        case 2: {
            const auto& v = std::get<input::Private>(value_);
            ::veil::Serialize(s, v.hash);
            detail::SerializeOptional(s, v.ciphertext);
            break;
        }
        case 3: {
            const auto& v = std::get<input::Record>(value_);
            ::veil::Serialize(s, v.serialNumber);
            ::veil::Serialize(s, v.tag);
            break;
        }
        default:
            ::veil::Serialize(s, std::get<input::ExternalRecord>(value_).hash);
            break;
    }
}

template<typename Stream>
void Input::Unserialize(Stream& s) {
    uint8_t variant = ser_readdata8(s);
    switch (variant) {
        case 0: {
            input::Constant v;
            ::veil::Unserialize(s, v.hash);
            detail::UnserializeOptional(s, v.plaintext);
            value_ = std::move(v);
            break;
        }
        case 1: {
            input::Public v;
            ::veil::Unserialize(s, v.hash);
            detail::UnserializeOptional(s, v.plaintext);
            value_ = std::move(v);
            break;
        }
        case 2: {
            input::Private v;
            ::veil::Unserialize(s, v.hash);
            detail::UnserializeOptional(s, v.ciphertext);
            value_ = std::move(v);
            break;
        }
        case 3: {
            input::Record v;
            ::veil::Unserialize(s, v.serialNumber);
            ::veil::Unserialize(s, v.tag);
            value_ = v;
            break;
        }
        case 4: {
            input::ExternalRecord v;
            ::veil::Unserialize(s, v.hash);
            value_ = v;
            break;
        }
        default:
            throw DecodeError("Failed to decode input variant " + std::to_string(variant));
    }
}

} // namespace veil

#endif // VEIL_TRANSITION_INPUT_H
