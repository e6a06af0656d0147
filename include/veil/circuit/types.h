// VEIL - Circuit Types
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Constrained counterparts of the native field, scalar, group and boolean
// types. Each holds its witness value and mode; operations compute the
// witness natively and record their constraints with the Environment.

#ifndef VEIL_CIRCUIT_TYPES_H
#define VEIL_CIRCUIT_TYPES_H

#include "veil/circuit/environment.h"
#include "veil/crypto/field.h"
#include "veil/crypto/group.h"

namespace veil {
namespace circuit {

// ============================================================================
// Boolean
// ============================================================================

class Boolean {
public:
    Boolean() = default;
    Boolean(Mode mode, bool value) : value_(value), mode_(mode) { Environment::NewVariable(mode); }

    static Boolean Constant(bool value) { return Boolean(Mode::Constant, value); }

    bool Eject() const { return value_; }
    Mode GetMode() const { return mode_; }

    Boolean operator&(const Boolean& other) const {
        Mode m = CombineModes(mode_, other.mode_);
        if (m != Mode::Constant) Environment::Enforce(true, "Boolean::and");
        return Boolean(m, value_ && other.value_);
    }

    Boolean operator|(const Boolean& other) const {
        Mode m = CombineModes(mode_, other.mode_);
        if (m != Mode::Constant) Environment::Enforce(true, "Boolean::or");
        return Boolean(m, value_ || other.value_);
    }

    Boolean operator!() const { return Boolean(mode_, !value_); }

    Boolean& operator&=(const Boolean& other) { return *this = *this & other; }

private:
    bool value_{false};
    Mode mode_{Mode::Constant};
};

// ============================================================================
// Field
// ============================================================================

class Field {
public:
    Field() = default;
    Field(Mode mode, const veil::Field& value) : value_(value), mode_(mode) { Environment::NewVariable(mode); }

    static Field Constant(const veil::Field& value) { return Field(Mode::Constant, value); }

    const veil::Field& Eject() const { return value_; }
    Mode GetMode() const { return mode_; }

    Field operator+(const Field& other) const {
        return Field(CombineModes(mode_, other.mode_), value_ + other.value_);
    }

    Field operator-(const Field& other) const {
        return Field(CombineModes(mode_, other.mode_), value_ - other.value_);
    }

    Field operator*(const Field& other) const {
        Mode m = CombineModes(mode_, other.mode_);
        if (m != Mode::Constant) Environment::Enforce(true, "Field::mul");
        return Field(m, value_ * other.value_);
    }

    Boolean IsEqual(const Field& other) const {
        Mode m = CombineModes(mode_, other.mode_);
        if (m != Mode::Constant) Environment::Enforce(true, "Field::is_equal", 2);
        return Boolean(m, value_ == other.value_);
    }

private:
    veil::Field value_;
    Mode mode_{Mode::Constant};
};

// ============================================================================
// Scalar
// ============================================================================

class Scalar {
public:
    Scalar() = default;
    Scalar(Mode mode, const veil::Scalar& value) : value_(value), mode_(mode) { Environment::NewVariable(mode); }

    static Scalar Constant(const veil::Scalar& value) { return Scalar(Mode::Constant, value); }

    const veil::Scalar& Eject() const { return value_; }
    Mode GetMode() const { return mode_; }

    Boolean IsEqual(const Scalar& other) const {
        Mode m = CombineModes(mode_, other.mode_);
        if (m != Mode::Constant) Environment::Enforce(true, "Scalar::is_equal", 2);
        return Boolean(m, value_ == other.value_);
    }

private:
    veil::Scalar value_;
    Mode mode_{Mode::Constant};
};

// ============================================================================
// Group
// ============================================================================

class Group {
public:
    Group() = default;
    Group(Mode mode, const Point& value) : value_(value), mode_(mode) { Environment::NewVariable(mode); }

    static Group Constant(const Point& value) { return Group(Mode::Constant, value); }

    const Point& Eject() const { return value_; }
    Mode GetMode() const { return mode_; }

    Group operator+(const Group& other) const {
        Mode m = CombineModes(mode_, other.mode_);
        if (m != Mode::Constant) Environment::Enforce(true, "Group::add", 6);
        return Group(m, value_ + other.value_);
    }

    Group operator*(const Scalar& scalar) const {
        Mode m = CombineModes(mode_, scalar.GetMode());
        if (m != Mode::Constant) Environment::Enforce(true, "Group::mul", 256 * 6);
        return Group(m, value_ * scalar.Eject());
    }

    Field ToXCoordinate() const { return Field(mode_, value_.ToXField()); }

    Boolean IsEqual(const Group& other) const {
        Mode m = CombineModes(mode_, other.mode_);
        if (m != Mode::Constant) Environment::Enforce(true, "Group::is_equal", 4);
        return Boolean(m, value_ == other.value_);
    }

private:
    Point value_;
    Mode mode_{Mode::Constant};
};

} // namespace circuit
} // namespace veil

#endif // VEIL_CIRCUIT_TYPES_H
