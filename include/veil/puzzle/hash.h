// VEIL - Puzzle Hashing
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// SHA-256 based maps from bytes to field elements and polynomials used
// by the coinbase puzzle's Fiat-Shamir steps.

#ifndef VEIL_PUZZLE_HASH_H
#define VEIL_PUZZLE_HASH_H

#include <cstdint>
#include <string>
#include <vector>
#include "veil/core/types.h"
#include "veil/crypto/field.h"
#include "veil/puzzle/kzg10.h"
#include "veil/puzzle/polynomial.h"

namespace veil {
namespace puzzle {

/// `count` field elements from SHA-256 in counter mode; each element
/// reduces 64 bytes of output so the result is close to uniform
std::vector<Field> HashToFields(const std::string& domain, const std::vector<Byte>& input, size_t count);

/// Polynomial with `degree + 1` hashed coefficients
DensePolynomial HashToPolynomial(const std::vector<Byte>& input, uint32_t degree);

/// Evaluation point for a single commitment
Field HashCommitment(const KZGCommitment& commitment);

/// One challenge per commitment followed by the accumulator point
std::vector<Field> HashCommitments(const std::vector<KZGCommitment>& commitments);

} // namespace puzzle
} // namespace veil

#endif // VEIL_PUZZLE_HASH_H
