// VEIL - Execution Environments
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Policy types the request and transition checks are written against.
// NativeEnv computes on plain values; CircuitEnv computes the same values
// on circuit types and records the constraints each gadget would emit.
// Both produce identical results for identical inputs.

#ifndef VEIL_CIRCUIT_ENV_H
#define VEIL_CIRCUIT_ENV_H

#include <string>
#include <vector>
#include "veil/circuit/environment.h"
#include "veil/circuit/types.h"
#include "veil/core/errors.h"
#include "veil/core/types.h"
#include "veil/network/network.h"

namespace veil {
namespace circuit {

// ============================================================================
// NativeEnv
// ============================================================================

struct NativeEnv {
    using Field = veil::Field;
    using Scalar = veil::Scalar;
    using Group = veil::Point;
    using Boolean = bool;

    static Boolean Constant(bool value) { return value; }
    static Field Constant(const veil::Field& value) { return value; }
    static Scalar Constant(const veil::Scalar& value) { return value; }
    static Group Constant(const veil::Point& value) { return value; }

    static Boolean Inject(Mode, bool value) { return value; }
    static Field Inject(Mode, const veil::Field& value) { return value; }
    static Scalar Inject(Mode, const veil::Scalar& value) { return value; }
    static Group Inject(Mode, const veil::Point& value) { return value; }

    static bool Eject(Boolean value) { return value; }
    static const veil::Field& Eject(const Field& value) { return value; }

    static Boolean And(Boolean a, Boolean b) { return a && b; }

    static Boolean IsEqual(const Field& a, const Field& b) { return a == b; }
    static Boolean IsEqual(const Scalar& a, const Scalar& b) { return a == b; }
    static Boolean IsEqual(const Group& a, const Group& b) { return a == b; }

    static Field ToX(const Group& point) { return point.ToXField(); }
    static Bits ToBits(const Field& value) { return value.ToBitsLE(); }

    static Group MulGenerator(const Scalar& scalar) { return network::GScalarMultiply(scalar); }

    static Boolean GatesInRange(Gates gates) { return veil::GatesInRange(gates); }

    static Field HashPSD2(const std::vector<Field>& input) { return network::HashPSD2(input); }
    static Field HashPSD4(const std::vector<Field>& input) { return network::HashPSD4(input); }
    static Field HashPSD8(const std::vector<Field>& input) { return network::HashPSD8(input); }

    static std::vector<Field> HashManyPSD8(const std::vector<Field>& input, size_t n) {
        return network::HashManyPSD8(input, n);
    }

    static Scalar HashToScalarPSD2(const std::vector<Field>& input) { return network::HashToScalarPSD2(input); }
    static Scalar HashToScalarPSD4(const std::vector<Field>& input) { return network::HashToScalarPSD4(input); }
    static Scalar HashToScalarPSD8(const std::vector<Field>& input) { return network::HashToScalarPSD8(input); }

    static Group HashToGroupPSD2(const std::vector<Field>& input) { return network::HashToGroupPSD2(input); }

    static Field HashBHP1024(const Bits& input) { return network::HashBHP1024(input); }
    static Field CommitBHP1024(const Bits& input, const Scalar& randomizer) {
        return network::CommitBHP1024(input, randomizer);
    }

    /// Structural failure: the native path throws the given error type
    template<typename Err>
    [[noreturn]] static void Halt(const std::string& message) {
        throw Err(message);
    }
};

// ============================================================================
// CircuitEnv
// ============================================================================

struct CircuitEnv {
    using Field = circuit::Field;
    using Scalar = circuit::Scalar;
    using Group = circuit::Group;
    using Boolean = circuit::Boolean;

    static Boolean Constant(bool value) { return Boolean::Constant(value); }
    static Field Constant(const veil::Field& value) { return Field::Constant(value); }
    static Scalar Constant(const veil::Scalar& value) { return Scalar::Constant(value); }
    static Group Constant(const veil::Point& value) { return Group::Constant(value); }

    static Boolean Inject(Mode mode, bool value) { return Boolean(mode, value); }
    static Field Inject(Mode mode, const veil::Field& value) { return Field(mode, value); }
    static Scalar Inject(Mode mode, const veil::Scalar& value) { return Scalar(mode, value); }
    static Group Inject(Mode mode, const veil::Point& value) { return Group(mode, value); }

    static bool Eject(const Boolean& value) { return value.Eject(); }
    static const veil::Field& Eject(const Field& value) { return value.Eject(); }

    static Boolean And(const Boolean& a, const Boolean& b) { return a & b; }

    static Boolean IsEqual(const Field& a, const Field& b) { return a.IsEqual(b); }
    static Boolean IsEqual(const Scalar& a, const Scalar& b) { return a.IsEqual(b); }
    static Boolean IsEqual(const Group& a, const Group& b) { return a.IsEqual(b); }

    static Field ToX(const Group& point) { return point.ToXCoordinate(); }

    static Bits ToBits(const Field& value) {
        if (value.GetMode() != Mode::Constant) {
            Environment::Enforce(true, "Field::to_bits_le", veil::Field::SIZE_IN_BITS);
        }
        return value.Eject().ToBitsLE();
    }

    static Group MulGenerator(const Scalar& scalar) {
        return Group::Constant(network::Generator()) * scalar;
    }

    static Boolean GatesInRange(Gates gates) {
        Environment::Enforce(true, "gates::range", 64);
        return Boolean(Mode::Private, veil::GatesInRange(gates));
    }

    static Field HashPSD2(const std::vector<Field>& input) {
        return Field(Track(input, "psd2::hash"), network::HashPSD2(Eject(input)));
    }

    static Field HashPSD4(const std::vector<Field>& input) {
        return Field(Track(input, "psd4::hash"), network::HashPSD4(Eject(input)));
    }

    static Field HashPSD8(const std::vector<Field>& input) {
        return Field(Track(input, "psd8::hash"), network::HashPSD8(Eject(input)));
    }

    static std::vector<Field> HashManyPSD8(const std::vector<Field>& input, size_t n) {
        Mode mode = Track(input, "psd8::hash_many");
        std::vector<Field> out;
        out.reserve(n);
        for (const auto& value : network::HashManyPSD8(Eject(input), n)) {
            out.emplace_back(mode, value);
        }
        return out;
    }

    static Scalar HashToScalarPSD2(const std::vector<Field>& input) {
        return Scalar(Track(input, "psd2::hash_to_scalar"), network::HashToScalarPSD2(Eject(input)));
    }

    static Scalar HashToScalarPSD4(const std::vector<Field>& input) {
        return Scalar(Track(input, "psd4::hash_to_scalar"), network::HashToScalarPSD4(Eject(input)));
    }

    static Scalar HashToScalarPSD8(const std::vector<Field>& input) {
        return Scalar(Track(input, "psd8::hash_to_scalar"), network::HashToScalarPSD8(Eject(input)));
    }

    static Group HashToGroupPSD2(const std::vector<Field>& input) {
        return Group(Track(input, "psd2::hash_to_group"), network::HashToGroupPSD2(Eject(input)));
    }

    /// Bit inputs are witnesses taken from values already in the circuit
    static Field HashBHP1024(const Bits& input) {
        Environment::Enforce(true, "bhp1024::hash", input.size());
        return Field(Mode::Private, network::HashBHP1024(input));
    }

    static Field CommitBHP1024(const Bits& input, const Scalar& randomizer) {
        Environment::Enforce(true, "bhp1024::commit", input.size() + 256);
        return Field(Mode::Private, network::CommitBHP1024(input, randomizer.Eject()));
    }

    template<typename Err>
    [[noreturn]] static void Halt(const std::string& message) {
        Environment::Halt(message);
    }

private:
    static std::vector<veil::Field> Eject(const std::vector<Field>& input) {
        std::vector<veil::Field> out;
        out.reserve(input.size());
        for (const auto& f : input) {
            out.push_back(f.Eject());
        }
        return out;
    }

    /// Mode of a gadget output; records the gadget unless all inputs are constant
    static Mode Track(const std::vector<Field>& input, const char* gadget) {
        Mode mode = Mode::Constant;
        for (const auto& f : input) {
            mode = CombineModes(mode, f.GetMode());
        }
        if (mode != Mode::Constant) {
            Environment::Enforce(true, gadget, input.size());
        }
        return mode;
    }
};

} // namespace circuit
} // namespace veil

#endif // VEIL_CIRCUIT_ENV_H
