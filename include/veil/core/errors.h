// VEIL - Error Types
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Exception hierarchy for structural failures. Cryptographic check
// failures on verification paths are reported as `false`, never thrown.

#ifndef VEIL_CORE_ERRORS_H
#define VEIL_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace veil {

/// Base class of every exception raised by VEIL
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Input and type lists of different lengths
class CardinalityError : public Error {
public:
    using Error::Error;
};

/// A value of the wrong kind for its declared type (record vs plaintext)
class ValueKindError : public Error {
public:
    using Error::Error;
};

/// Malformed or corrupted byte encoding
class DecodeError : public Error {
public:
    using Error::Error;
};

/// Signer-side check failure (owner mismatch, gates overflow, hash mismatch)
class CheckError : public Error {
public:
    using Error::Error;
};

/// Coinbase puzzle failure (mode, limits, duplicates, target)
class PuzzleError : public Error {
public:
    using Error::Error;
};

/// Storage backend or consistency failure
class StorageError : public Error {
public:
    using Error::Error;
};

/// Unrecoverable condition on the constrained execution path
class CircuitHalt : public Error {
public:
    explicit CircuitHalt(const std::string& what) : Error("circuit halted: " + what) {}
};

} // namespace veil

#endif // VEIL_CORE_ERRORS_H
