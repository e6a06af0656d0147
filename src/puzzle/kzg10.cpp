// VEIL - KZG10 Polynomial Commitments
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/puzzle/kzg10.h"
#include "veil/core/errors.h"
#include "veil/util/logging.h"
#include <mutex>

namespace veil {
namespace puzzle {

void InitPairing() {
    static std::once_flag once;
    std::call_once(once, []() {
        mcl::bn::initPairing(mcl::BN_SNARK1);
        LOG_DEBUG(util::LogCategory::PUZZLE) << "Pairing initialized for BN_SNARK1";
    });
}

Fr ToFr(const Field& value) {
    auto bytes = value.ToBytes();
    Fr out;
    if (out.deserialize(bytes.data(), bytes.size()) != bytes.size()) {
        throw PuzzleError("Field element does not convert to a pairing scalar");
    }
    return out;
}

Field FromFr(const Fr& value) {
    uint8_t buf[Field::SIZE_IN_BYTES] = {0};
    size_t n = value.serialize(buf, sizeof(buf));
    if (n == 0) {
        throw PuzzleError("Pairing scalar does not convert to a field element");
    }
    auto field = Field::FromCanonicalBytes(buf, sizeof(buf));
    if (!field) {
        throw PuzzleError("Pairing scalar is not a canonical field element");
    }
    return *field;
}

std::vector<Byte> KZGCommitment::ToBytes() const {
    uint8_t buf[128];
    size_t n = point.serialize(buf, sizeof(buf));
    if (n == 0) {
        throw PuzzleError("Failed to serialize a commitment");
    }
    return std::vector<Byte>(buf, buf + n);
}

// ============================================================================
// KZG10
// ============================================================================

UniversalParams KZG10::Setup(size_t maxDegree, const std::string& seed) {
    InitPairing();
    VEIL_LOG_TIMER(util::LogCategory::PUZZLE, "KZG10 setup");

    UniversalParams params;
    G1 g;
    mcl::bn::hashAndMapToG1(g, seed + "/G1");
    mcl::bn::hashAndMapToG2(params.h, seed + "/G2");

    Fr beta;
    std::string betaSeed = seed + "/beta";
    beta.setHashOf(betaSeed.data(), betaSeed.size());

    params.powersOfBetaG.resize(maxDegree + 1);
    params.powersOfBetaG[0] = g;
    for (size_t i = 1; i <= maxDegree; ++i) {
        G1::mul(params.powersOfBetaG[i], params.powersOfBetaG[i - 1], beta);
    }
    G2::mul(params.betaH, params.h, beta);

    LOG_INFO(util::LogCategory::PUZZLE) << "Generated universal parameters up to degree " << maxDegree;
    return params;
}

G1 KZG10::MultiScalarMul(const std::vector<G1>& bases, const std::vector<Field>& scalars) {
    if (scalars.size() > bases.size()) {
        throw PuzzleError("Multi-scalar multiplication needs " + std::to_string(scalars.size()) +
                          " bases, found " + std::to_string(bases.size()));
    }
    G1 acc;
    acc.clear();
    for (size_t i = 0; i < scalars.size(); ++i) {
        if (scalars[i].IsZero()) {
            continue;
        }
        G1 term;
        G1::mul(term, bases[i], ToFr(scalars[i]));
        G1::add(acc, acc, term);
    }
    return acc;
}

KZGCommitment KZG10::Commit(const std::vector<G1>& powers, const DensePolynomial& polynomial) {
    if (polynomial.Coeffs().size() > powers.size()) {
        throw PuzzleError("Polynomial of degree " + std::to_string(polynomial.Degree()) +
                          " exceeds the supported degree " + std::to_string(powers.size() - 1));
    }
    return KZGCommitment{MultiScalarMul(powers, polynomial.Coeffs())};
}

KZGProof KZG10::Open(const std::vector<G1>& powers, const DensePolynomial& polynomial,
                     const Field& point, const Field& evaluation) {
    const auto& coeffs = polynomial.Coeffs();
    if (coeffs.size() > powers.size()) {
        throw PuzzleError("Polynomial of degree " + std::to_string(polynomial.Degree()) +
                          " exceeds the supported degree " + std::to_string(powers.size() - 1));
    }

    // Synthetic division of p(X) - p(z) by (X - z)
    std::vector<Field> quotient;
    if (coeffs.size() > 1) {
        quotient.resize(coeffs.size() - 1);
        Field carry = coeffs.back();
        for (size_t i = coeffs.size() - 1; i-- > 0;) {
            quotient[i] = carry;
            carry = coeffs[i] + carry * point;
        }
        if (carry != evaluation) {
            throw PuzzleError("Opening evaluation does not match the polynomial");
        }
    } else if (polynomial.Evaluate(point) != evaluation) {
        throw PuzzleError("Opening evaluation does not match the polynomial");
    }

    KZGProof proof;
    proof.w = MultiScalarMul(powers, quotient);
    return proof;
}

bool KZG10::Check(const VerifyingKey& vk, const KZGCommitment& commitment,
                  const Field& point, const Field& evaluation, const KZGProof& proof) {
    if (proof.IsHiding()) {
        return false;
    }

    G1 yG;
    G1::mul(yG, vk.g, ToFr(evaluation));
    G1 lhsG1;
    G1::sub(lhsG1, commitment.point, yG);

    G2 zH;
    G2::mul(zH, vk.h, ToFr(point));
    G2 rhsG2;
    G2::sub(rhsG2, vk.betaH, zH);

    mcl::bn::GT lhs;
    mcl::bn::GT rhs;
    mcl::bn::pairing(lhs, lhsG1, vk.h);
    mcl::bn::pairing(rhs, proof.w, rhsG2);
    return lhs == rhs;
}

} // namespace puzzle
} // namespace veil
