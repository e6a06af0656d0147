// VEIL - KZG10 Polynomial Commitments
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Non-hiding KZG commitments over BN254 using the mcl pairing library.
// mcl is initialized for BN_SNARK1, whose scalar field is the field
// VEIL's polynomials live in, so coefficients convert byte for byte.
//
//   commit:  C  = sum c_i * [beta^i]G
//   open:    pi = commit((p(X) - p(z)) / (X - z))
//   check:   e(C - y*G, H) == e(pi, [beta]H - z*H)

#ifndef VEIL_PUZZLE_KZG10_H
#define VEIL_PUZZLE_KZG10_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <mcl/bn.hpp>
#include "veil/core/serialize.h"
#include "veil/crypto/field.h"
#include "veil/puzzle/polynomial.h"

namespace veil {
namespace puzzle {

using G1 = mcl::bn::G1;
using G2 = mcl::bn::G2;
using Fr = mcl::bn::Fr;

/// Initialize the pairing library once per process
void InitPairing();

Fr ToFr(const Field& value);
Field FromFr(const Fr& value);

namespace detail {

template<typename Stream, typename P>
void SerializePoint(Stream& s, const P& point) {
    uint8_t buf[128];
    size_t n = point.serialize(buf, sizeof(buf));
    if (n == 0) {
        throw Error("Failed to serialize a pairing group element");
    }
    ser_writedata8(s, static_cast<uint8_t>(n));
    s.Write(buf, n);
}

template<typename Stream, typename P>
void UnserializePoint(Stream& s, P& point) {
    uint8_t n = ser_readdata8(s);
    uint8_t buf[255];
    s.Read(buf, n);
    if (point.deserialize(buf, n) != n || !point.isValid()) {
        throw DecodeError("Invalid pairing group element encoding");
    }
}

} // namespace detail

// ============================================================================
// Parameters
// ============================================================================

/**
 * Powers of a secret beta in G1, plus H and beta*H in G2
 */
struct UniversalParams {
    std::vector<G1> powersOfBetaG;
    G2 h;
    G2 betaH;

    size_t MaxDegree() const { return powersOfBetaG.empty() ? 0 : powersOfBetaG.size() - 1; }
};

struct VerifyingKey {
    G1 g;
    G2 h;
    G2 betaH;

    bool operator==(const VerifyingKey& other) const {
        return g == other.g && h == other.h && betaH == other.betaH;
    }
};

// ============================================================================
// Commitments and Proofs
// ============================================================================

struct KZGCommitment {
    G1 point;

    /// Compressed encoding, used for hashing and targets
    std::vector<Byte> ToBytes() const;

    bool operator==(const KZGCommitment& other) const { return point == other.point; }
    bool operator!=(const KZGCommitment& other) const { return !(*this == other); }
    bool operator<(const KZGCommitment& other) const { return ToBytes() < other.ToBytes(); }

    template<typename Stream>
    void Serialize(Stream& s) const { detail::SerializePoint(s, point); }

    template<typename Stream>
    void Unserialize(Stream& s) { detail::UnserializePoint(s, point); }
};

/**
 * Opening proof; a hiding proof also carries the blinding evaluation
 */
struct KZGProof {
    G1 w;
    std::optional<Field> randomV;

    bool IsHiding() const { return randomV.has_value(); }

    bool operator==(const KZGProof& other) const { return w == other.w && randomV == other.randomV; }
    bool operator!=(const KZGProof& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        detail::SerializePoint(s, w);
        ::veil::Serialize(s, randomV.has_value());
        if (randomV) {
            ::veil::Serialize(s, *randomV);
        }
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        detail::UnserializePoint(s, w);
        bool hiding = false;
        ::veil::Unserialize(s, hiding);
        randomV.reset();
        if (hiding) {
            Field v;
            ::veil::Unserialize(s, v);
            randomV = v;
        }
    }
};

// ============================================================================
// KZG10
// ============================================================================

class KZG10 {
public:
    /// Deterministic parameters for development and tests: beta and the
    /// generators are derived from `seed`. Never use for production.
    static UniversalParams Setup(size_t maxDegree, const std::string& seed);

    /// Throws PuzzleError when the polynomial exceeds the parameters
    static KZGCommitment Commit(const std::vector<G1>& powers, const DensePolynomial& polynomial);

    /// Open `polynomial` at `point`; the caller supplies the evaluation
    static KZGProof Open(const std::vector<G1>& powers, const DensePolynomial& polynomial,
                         const Field& point, const Field& evaluation);

    static bool Check(const VerifyingKey& vk, const KZGCommitment& commitment,
                      const Field& point, const Field& evaluation, const KZGProof& proof);

    /// sum scalars_i * bases_i
    static G1 MultiScalarMul(const std::vector<G1>& bases, const std::vector<Field>& scalars);
};

} // namespace puzzle
} // namespace veil

#endif // VEIL_PUZZLE_KZG10_H
