// VEIL - Polynomials
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/puzzle/polynomial.h"
#include "veil/core/errors.h"
#include <string>
#include <utility>

namespace veil {
namespace puzzle {

// ============================================================================
// DensePolynomial
// ============================================================================

DensePolynomial::DensePolynomial(std::vector<Field> coeffs) : coeffs_(std::move(coeffs)) {
    Trim();
}

void DensePolynomial::Trim() {
    while (!coeffs_.empty() && coeffs_.back().IsZero()) {
        coeffs_.pop_back();
    }
}

Field DensePolynomial::Evaluate(const Field& point) const {
    Field result = Field::Zero();
    for (size_t i = coeffs_.size(); i-- > 0;) {
        result = result * point + coeffs_[i];
    }
    return result;
}

DensePolynomial& DensePolynomial::operator+=(const DensePolynomial& other) {
    if (other.coeffs_.size() > coeffs_.size()) {
        coeffs_.resize(other.coeffs_.size(), Field::Zero());
    }
    for (size_t i = 0; i < other.coeffs_.size(); ++i) {
        coeffs_[i] += other.coeffs_[i];
    }
    Trim();
    return *this;
}

DensePolynomial& DensePolynomial::operator*=(const Field& scalar) {
    if (scalar.IsZero()) {
        coeffs_.clear();
        return *this;
    }
    for (auto& c : coeffs_) {
        c *= scalar;
    }
    return *this;
}

// ============================================================================
// EvaluationDomain
// ============================================================================

EvaluationDomain::EvaluationDomain(size_t size, size_t logSize)
    : size_(size)
    , logSize_(logSize)
    , groupGen_(Field::RootOfUnity(logSize))
    , groupGenInv_(groupGen_.Inverse())
    , sizeInv_(Field(static_cast<uint64_t>(size)).Inverse()) {}

std::optional<EvaluationDomain> EvaluationDomain::New(size_t numCoeffs) {
    if (numCoeffs == 0) {
        return std::nullopt;
    }
    size_t logSize = 0;
    while ((size_t(1) << logSize) < numCoeffs) {
        ++logSize;
    }
    if (logSize > Field::TWO_ADICITY) {
        return std::nullopt;
    }
    return EvaluationDomain(size_t(1) << logSize, logSize);
}

std::vector<Field> EvaluationDomain::Elements() const {
    std::vector<Field> out;
    out.reserve(size_);
    Field current = Field::One();
    for (size_t i = 0; i < size_; ++i) {
        out.push_back(current);
        current *= groupGen_;
    }
    return out;
}

void EvaluationDomain::Transform(std::vector<Field>& values, const Field& root) const {
    // Bit-reversal permutation
    for (size_t i = 1, j = 0; i < size_; ++i) {
        size_t bit = size_ >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(values[i], values[j]);
        }
    }

    // Iterative Cooley-Tukey butterflies
    for (size_t len = 2; len <= size_; len <<= 1) {
        Field step = root.Pow(static_cast<uint64_t>(size_ / len));
        for (size_t start = 0; start < size_; start += len) {
            Field w = Field::One();
            for (size_t k = 0; k < len / 2; ++k) {
                Field u = values[start + k];
                Field v = values[start + k + len / 2] * w;
                values[start + k] = u + v;
                values[start + k + len / 2] = u - v;
                w *= step;
            }
        }
    }
}

std::vector<Field> EvaluationDomain::FFT(const std::vector<Field>& coeffs) const {
    if (coeffs.size() > size_) {
        throw PuzzleError("Polynomial has " + std::to_string(coeffs.size()) +
                          " coefficients, more than the domain size " + std::to_string(size_));
    }
    std::vector<Field> values(coeffs);
    values.resize(size_, Field::Zero());
    Transform(values, groupGen_);
    return values;
}

std::vector<Field> EvaluationDomain::IFFT(const std::vector<Field>& evals) const {
    if (evals.size() != size_) {
        throw PuzzleError("Expected " + std::to_string(size_) + " evaluations, found " +
                          std::to_string(evals.size()));
    }
    std::vector<Field> values(evals);
    Transform(values, groupGenInv_);
    for (auto& v : values) {
        v *= sizeInv_;
    }
    return values;
}

std::vector<Field> EvaluationDomain::MulPolynomialsInEvaluationDomain(const std::vector<Field>& a,
                                                                      const std::vector<Field>& b) const {
    if (a.size() != size_ || b.size() != size_) {
        throw PuzzleError("Evaluation vectors do not match the domain size");
    }
    std::vector<Field> out(size_);
    for (size_t i = 0; i < size_; ++i) {
        out[i] = a[i] * b[i];
    }
    return out;
}

} // namespace puzzle
} // namespace veil
