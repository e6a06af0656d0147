// VEIL - Circuit Environment
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Bookkeeping for the constrained execution path. Circuit values carry a
// mode and their native value; every gadget and assertion is recorded in
// a per-thread constraint log that can be inspected and reset.

#ifndef VEIL_CIRCUIT_ENVIRONMENT_H
#define VEIL_CIRCUIT_ENVIRONMENT_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace veil {
namespace circuit {

/// Visibility of a circuit variable
enum class Mode : uint8_t {
    Constant = 0,
    Public = 1,
    Private = 2,
};

/// Constant only if both operands are constant
inline Mode CombineModes(Mode a, Mode b) {
    return (a == Mode::Constant && b == Mode::Constant) ? Mode::Constant : Mode::Private;
}

/**
 * Per-thread circuit bookkeeping: variable counts by mode, constraint
 * count and the first unsatisfied constraint.
 */
class Environment {
public:
    /// Register a new variable of the given mode
    static void NewVariable(Mode mode);

    /// Record `count` constraints produced by `gadget`; `satisfied` is
    /// false when the witness violates them
    static void Enforce(bool satisfied, const char* gadget, size_t count = 1);

    static size_t NumConstants();
    static size_t NumPublic();
    static size_t NumPrivate();
    static size_t NumConstraints();

    /// False once any enforced constraint was violated
    static bool IsSatisfied();

    /// Gadget name of the first violated constraint, empty if none
    static std::string FirstViolation();

    /// Clear the log for this thread
    static void Reset();

    /// Abort the computation; throws CircuitHalt
    [[noreturn]] static void Halt(const std::string& message);
};

} // namespace circuit
} // namespace veil

#endif // VEIL_CIRCUIT_ENVIRONMENT_H
