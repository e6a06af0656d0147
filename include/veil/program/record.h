// VEIL - Records
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// A record is an owned, encryptable set of named entries. The owner and
// the gates balance each carry their own visibility; a record commits to
// its program and name, and spends through a serial number derived from
// gamma = H(commitment) * sk_sig.

#ifndef VEIL_PROGRAM_RECORD_H
#define VEIL_PROGRAM_RECORD_H

#include <cstdint>
#include <utility>
#include <vector>
#include "veil/account/keys.h"
#include "veil/core/serialize.h"
#include "veil/core/types.h"
#include "veil/crypto/field.h"
#include "veil/crypto/group.h"
#include "veil/program/identifier.h"
#include "veil/program/plaintext.h"

namespace veil {

/// Visibility of a record component
enum class Visibility : uint8_t {
    Constant = 0,
    Public = 1,
    Private = 2,
};

class RecordCiphertext;

// ============================================================================
// Record (plaintext)
// ============================================================================

/**
 * A plaintext record: owner, gates, named entries and the nonce that
 * encryption and serial numbers derive from.
 */
class Record {
public:
    struct Entry {
        Visibility mode{Visibility::Private};
        Plaintext value;

        bool operator==(const Entry& other) const { return mode == other.mode && value == other.value; }
    };
    using Entries = std::vector<std::pair<Identifier, Entry>>;

    Record() = default;

    /// Throws Error if owner or gates visibility is Constant
    Record(const Address& owner, Visibility ownerMode, Gates gates, Visibility gatesMode,
           Entries entries, const Point& nonce);

    const Address& Owner() const { return owner_; }
    Visibility OwnerMode() const { return ownerMode_; }
    Gates GetGates() const { return gates_; }
    Visibility GatesMode() const { return gatesMode_; }
    const Entries& Data() const { return data_; }
    const Point& Nonce() const { return nonce_; }

    /// Bits 52..63 of the gates value are all zero
    bool HasValidGates() const { return GatesInRange(gates_); }

    Bits ToBitsLE() const;
    std::vector<Field> ToFields() const { return PackBitsToFields(ToBitsLE()); }

    /// HashBHP1024(program_id bits | record_name bits | record bits)
    Field ToCommitment(const ProgramID& programID, const Identifier& recordName) const;

    /// Encrypt the private components under `randomizer`; the nonce must
    /// already equal randomizer * G
    RecordCiphertext Encrypt(const Scalar& randomizer) const;

    /// CommitBHP1024((serial_number_domain, commitment) bits,
    ///               HashToScalarPSD2([serial_number_domain, gamma.x]))
    static Field SerialNumberFromGamma(const Point& gamma, const Field& commitment);

    /// HashPSD2([sk_tag, commitment])
    static Field Tag(const Field& skTag, const Field& commitment);

    bool operator==(const Record& other) const;
    bool operator!=(const Record& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata8(s, static_cast<uint8_t>(ownerMode_));
        ::veil::Serialize(s, owner_);
        ser_writedata8(s, static_cast<uint8_t>(gatesMode_));
        ser_writedata64(s, gates_);
        ser_writedata8(s, static_cast<uint8_t>(data_.size()));
        for (const auto& e : data_) {
            ::veil::Serialize(s, e.first);
            ser_writedata8(s, static_cast<uint8_t>(e.second.mode));
            ::veil::Serialize(s, e.second.value);
        }
        ::veil::Serialize(s, nonce_);
    }

    template<typename Stream>
    void Unserialize(Stream& s);

private:
    Address owner_;
    Visibility ownerMode_{Visibility::Private};
    Gates gates_{0};
    Visibility gatesMode_{Visibility::Private};
    Entries data_;
    Point nonce_;
};

// ============================================================================
// RecordCiphertext
// ============================================================================

class RecordCiphertext {
public:
    /// Public components are kept in the clear, private ones as ciphertext
    struct Entry {
        Visibility mode{Visibility::Private};
        Plaintext plaintext;
        Ciphertext ciphertext;

        bool operator==(const Entry& other) const {
            return mode == other.mode && plaintext == other.plaintext && ciphertext == other.ciphertext;
        }
    };
    using Entries = std::vector<std::pair<Identifier, Entry>>;

    RecordCiphertext() = default;

    Visibility OwnerMode() const { return ownerMode_; }
    Visibility GatesMode() const { return gatesMode_; }
    const Entries& Data() const { return data_; }
    const Point& Nonce() const { return nonce_; }

    /// rvk = (nonce * view_key).x, then strip the randomizers
    Record Decrypt(const ViewKey& viewKey) const;

    /// True if `viewKey` belongs to the record owner
    bool IsOwner(const ViewKey& viewKey) const;

    Bits ToBitsLE() const;

    bool operator==(const RecordCiphertext& other) const;
    bool operator!=(const RecordCiphertext& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata8(s, static_cast<uint8_t>(ownerMode_));
        if (ownerMode_ == Visibility::Private) {
            ::veil::Serialize(s, ownerCiphertext_);
        } else {
            ::veil::Serialize(s, ownerPublic_);
        }
        ser_writedata8(s, static_cast<uint8_t>(gatesMode_));
        if (gatesMode_ == Visibility::Private) {
            ::veil::Serialize(s, gatesCiphertext_);
        } else {
            ser_writedata64(s, gatesPublic_);
        }
        ser_writedata8(s, static_cast<uint8_t>(data_.size()));
        for (const auto& e : data_) {
            ::veil::Serialize(s, e.first);
            ser_writedata8(s, static_cast<uint8_t>(e.second.mode));
            if (e.second.mode == Visibility::Private) {
                ::veil::Serialize(s, e.second.ciphertext);
            } else {
                ::veil::Serialize(s, e.second.plaintext);
            }
        }
        ::veil::Serialize(s, nonce_);
    }

    template<typename Stream>
    void Unserialize(Stream& s);

private:
    friend class Record;

    Visibility ownerMode_{Visibility::Private};
    Address ownerPublic_;
    Ciphertext ownerCiphertext_;
    Visibility gatesMode_{Visibility::Private};
    Gates gatesPublic_{0};
    Ciphertext gatesCiphertext_;
    Entries data_;
    Point nonce_;

    /// Number of randomizers the private components consume
    size_t PrivateFieldCount() const;
};

namespace detail {

template<typename Stream>
Visibility ReadVisibility(Stream& s, bool allowConstant) {
    uint8_t v = ser_readdata8(s);
    if (v > 2 || (!allowConstant && v == 0)) {
        throw DecodeError("Invalid visibility tag " + std::to_string(v));
    }
    return static_cast<Visibility>(v);
}

} // namespace detail

template<typename Stream>
void Record::Unserialize(Stream& s) {
    Visibility ownerMode = detail::ReadVisibility(s, false);
    Address owner;
    ::veil::Unserialize(s, owner);
    Visibility gatesMode = detail::ReadVisibility(s, false);
    Gates gates = ser_readdata64(s);
    uint8_t count = ser_readdata8(s);
    Entries entries;
    for (uint8_t i = 0; i < count; ++i) {
        Identifier name;
        ::veil::Unserialize(s, name);
        Entry entry;
        entry.mode = detail::ReadVisibility(s, true);
        ::veil::Unserialize(s, entry.value);
        entries.emplace_back(std::move(name), std::move(entry));
    }
    Point nonce;
    ::veil::Unserialize(s, nonce);
    *this = Record(owner, ownerMode, gates, gatesMode, std::move(entries), nonce);
}

template<typename Stream>
void RecordCiphertext::Unserialize(Stream& s) {
    RecordCiphertext r;
    r.ownerMode_ = detail::ReadVisibility(s, false);
    if (r.ownerMode_ == Visibility::Private) {
        ::veil::Unserialize(s, r.ownerCiphertext_);
    } else {
        ::veil::Unserialize(s, r.ownerPublic_);
    }
    r.gatesMode_ = detail::ReadVisibility(s, false);
    if (r.gatesMode_ == Visibility::Private) {
        ::veil::Unserialize(s, r.gatesCiphertext_);
    } else {
        r.gatesPublic_ = ser_readdata64(s);
    }
    uint8_t count = ser_readdata8(s);
    for (uint8_t i = 0; i < count; ++i) {
        Identifier name;
        ::veil::Unserialize(s, name);
        Entry entry;
        entry.mode = detail::ReadVisibility(s, true);
        if (entry.mode == Visibility::Private) {
            ::veil::Unserialize(s, entry.ciphertext);
        } else {
            ::veil::Unserialize(s, entry.plaintext);
        }
        r.data_.emplace_back(std::move(name), std::move(entry));
    }
    ::veil::Unserialize(s, r.nonce_);
    *this = std::move(r);
}

} // namespace veil

#endif // VEIL_PROGRAM_RECORD_H
