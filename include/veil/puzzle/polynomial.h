// VEIL - Polynomials
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Dense univariate polynomials over the BN254 scalar field and the
// radix-2 evaluation domains used to multiply them.

#ifndef VEIL_PUZZLE_POLYNOMIAL_H
#define VEIL_PUZZLE_POLYNOMIAL_H

#include <cstddef>
#include <optional>
#include <vector>
#include "veil/crypto/field.h"

namespace veil {
namespace puzzle {

// ============================================================================
// DensePolynomial
// ============================================================================

/**
 * Coefficients in increasing degree order, with no trailing zeros
 */
class DensePolynomial {
public:
    DensePolynomial() = default;
    explicit DensePolynomial(std::vector<Field> coeffs);

    static DensePolynomial Zero() { return DensePolynomial(); }

    const std::vector<Field>& Coeffs() const { return coeffs_; }

    bool IsZero() const { return coeffs_.empty(); }

    /// Degree; the zero polynomial reports 0
    size_t Degree() const { return coeffs_.empty() ? 0 : coeffs_.size() - 1; }

    /// Horner evaluation at `point`
    Field Evaluate(const Field& point) const;

    DensePolynomial& operator+=(const DensePolynomial& other);
    DensePolynomial& operator*=(const Field& scalar);

    bool operator==(const DensePolynomial& other) const { return coeffs_ == other.coeffs_; }
    bool operator!=(const DensePolynomial& other) const { return !(*this == other); }

private:
    std::vector<Field> coeffs_;

    void Trim();
};

// ============================================================================
// EvaluationDomain
// ============================================================================

/**
 * Multiplicative subgroup of size 2^k holding at least the requested
 * number of points
 */
class EvaluationDomain {
public:
    /// nullopt when `numCoeffs` is zero or exceeds 2^TWO_ADICITY
    static std::optional<EvaluationDomain> New(size_t numCoeffs);

    size_t Size() const { return size_; }
    size_t LogSize() const { return logSize_; }
    const Field& Generator() const { return groupGen_; }

    /// g^0, g^1, ..., g^(size-1)
    std::vector<Field> Elements() const;

    /// Evaluations at Elements(), in order; `coeffs` may not exceed Size()
    std::vector<Field> FFT(const std::vector<Field>& coeffs) const;

    /// Coefficients of the polynomial with the given evaluations
    std::vector<Field> IFFT(const std::vector<Field>& evals) const;

    /// Pointwise product of two evaluation vectors
    std::vector<Field> MulPolynomialsInEvaluationDomain(const std::vector<Field>& a,
                                                        const std::vector<Field>& b) const;

    bool operator==(const EvaluationDomain& other) const { return size_ == other.size_; }

private:
    EvaluationDomain(size_t size, size_t logSize);

    size_t size_;
    size_t logSize_;
    Field groupGen_;
    Field groupGenInv_;
    Field sizeInv_;

    void Transform(std::vector<Field>& values, const Field& root) const;
};

} // namespace puzzle
} // namespace veil

#endif // VEIL_PUZZLE_POLYNOMIAL_H
