// VEIL - Values
// Copyright (c) 2024 VEIL Developers
// MIT License

#ifndef VEIL_PROGRAM_VALUE_H
#define VEIL_PROGRAM_VALUE_H

#include <variant>
#include <vector>
#include "veil/core/serialize.h"
#include "veil/program/plaintext.h"
#include "veil/program/record.h"

namespace veil {

/**
 * A function input or output: a plaintext or a plaintext record
 */
class Value {
public:
    Value() = default;
    Value(const Plaintext& plaintext) : value_(plaintext) {}
    Value(const Record& record) : value_(record) {}

    bool IsPlaintext() const { return std::holds_alternative<Plaintext>(value_); }
    bool IsRecord() const { return std::holds_alternative<Record>(value_); }

    /// nullptr when the value holds the other kind
    const Plaintext* AsPlaintext() const { return std::get_if<Plaintext>(&value_); }
    const Record* AsRecord() const { return std::get_if<Record>(&value_); }

    std::vector<Field> ToFields() const;

    bool operator==(const Value& other) const { return value_ == other.value_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata8(s, static_cast<uint8_t>(value_.index()));
        std::visit([&s](const auto& v) { ::veil::Serialize(s, v); }, value_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t tag = ser_readdata8(s);
        if (tag == 0) {
            Plaintext p;
            ::veil::Unserialize(s, p);
            value_ = std::move(p);
        } else if (tag == 1) {
            Record r;
            ::veil::Unserialize(s, r);
            value_ = std::move(r);
        } else {
            throw DecodeError("Failed to decode value variant");
        }
    }

private:
    std::variant<Plaintext, Record> value_;
};

} // namespace veil

#endif // VEIL_PROGRAM_VALUE_H
