// VEIL - Input IDs
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Per-input identifiers bound into a request's signature, one variant per
// declared input visibility. Parameterized on the execution environment
// so the same definitions serve the native and circuit paths.

#ifndef VEIL_REQUEST_INPUT_ID_H
#define VEIL_REQUEST_INPUT_ID_H

#include <type_traits>
#include <variant>
#include "veil/circuit/env.h"
#include "veil/core/serialize.h"
#include "veil/program/identifier.h"

namespace veil {

namespace input_id {

/// HashPSD8([function_id, input fields, tcm, index])
template<typename E>
struct Constant {
    typename E::Field hash;
};

/// HashPSD8([function_id, input fields, tcm, index])
template<typename E>
struct Public {
    typename E::Field hash;
};

/**
 * HashPSD8(ciphertext fields) of the input encrypted under
 * HashPSD4([function_id, tvk, index])
 */
template<typename E>
struct Private {
    typename E::Field hash;
};

template<typename E>
struct Record {
    typename E::Field commitment;
    typename E::Group gamma;
    typename E::Field serialNumber;
    typename E::Field tag;
};

/// HashPSD8([function_id, record fields, tvk, index])
template<typename E>
struct ExternalRecord {
    typename E::Field hash;
};

// Equality is only available where the environment's types compare
// directly, i.e. on the native path

template<typename E>
bool operator==(const Constant<E>& a, const Constant<E>& b) { return a.hash == b.hash; }

template<typename E>
bool operator==(const Public<E>& a, const Public<E>& b) { return a.hash == b.hash; }

template<typename E>
bool operator==(const Private<E>& a, const Private<E>& b) { return a.hash == b.hash; }

template<typename E>
bool operator==(const Record<E>& a, const Record<E>& b) {
    return a.commitment == b.commitment && a.gamma == b.gamma &&
           a.serialNumber == b.serialNumber && a.tag == b.tag;
}

template<typename E>
bool operator==(const ExternalRecord<E>& a, const ExternalRecord<E>& b) { return a.hash == b.hash; }

} // namespace input_id

/// Variant index matches ValueType::Kind
template<typename E>
using BasicInputID = std::variant<input_id::Constant<E>,
                                  input_id::Public<E>,
                                  input_id::Private<E>,
                                  input_id::Record<E>,
                                  input_id::ExternalRecord<E>>;

using InputID = BasicInputID<circuit::NativeEnv>;

inline ValueType::Kind KindOf(const InputID& id) {
    return static_cast<ValueType::Kind>(id.index());
}

template<typename Stream>
void SerializeInputID(Stream& s, const InputID& id) {
    ser_writedata8(s, static_cast<uint8_t>(id.index()));
    if (const auto* record = std::get_if<input_id::Record<circuit::NativeEnv>>(&id)) {
        ::veil::Serialize(s, record->commitment);
        ::veil::Serialize(s, record->gamma);
        ::veil::Serialize(s, record->serialNumber);
        ::veil::Serialize(s, record->tag);
        return;
    }
    std::visit([&s](const auto& v) {
        if constexpr (!std::is_same_v<std::decay_t<decltype(v)>, input_id::Record<circuit::NativeEnv>>) {
            ::veil::Serialize(s, v.hash);
        }
    }, id);
}

template<typename Stream>
InputID UnserializeInputID(Stream& s) {
    using E = circuit::NativeEnv;
    uint8_t variant = ser_readdata8(s);
    Field hash;
    switch (variant) {
        case 0: ::veil::Unserialize(s, hash); return input_id::Constant<E>{hash};
        case 1: ::veil::Unserialize(s, hash); return input_id::Public<E>{hash};
        case 2: ::veil::Unserialize(s, hash); return input_id::Private<E>{hash};
        case 3: {
            input_id::Record<E> record;
            ::veil::Unserialize(s, record.commitment);
            ::veil::Unserialize(s, record.gamma);
            ::veil::Unserialize(s, record.serialNumber);
            ::veil::Unserialize(s, record.tag);
            return record;
        }
        case 4: ::veil::Unserialize(s, hash); return input_id::ExternalRecord<E>{hash};
        default:
            throw DecodeError("Failed to decode input ID variant");
    }
}

} // namespace veil

#endif // VEIL_REQUEST_INPUT_ID_H
