// VEIL - Polynomial and KZG Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>
#include "veil/core/errors.h"
#include "veil/puzzle/hash.h"
#include "veil/puzzle/kzg10.h"
#include "veil/puzzle/polynomial.h"

using namespace veil;
using namespace veil::puzzle;

namespace {

DensePolynomial MakePolynomial(size_t numCoeffs, uint64_t seed) {
    std::vector<Field> coeffs;
    for (size_t i = 0; i < numCoeffs; ++i) {
        coeffs.push_back(Field(seed * 31 + i * 7 + 1));
    }
    return DensePolynomial(std::move(coeffs));
}

} // namespace

// ============================================================================
// DensePolynomial Tests
// ============================================================================

TEST(PolynomialTest, TrailingZerosAreTrimmed) {
    DensePolynomial p({Field(uint64_t(1)), Field(uint64_t(2)), Field::Zero(), Field::Zero()});
    EXPECT_EQ(p.Coeffs().size(), 2u);
    EXPECT_EQ(p.Degree(), 1u);

    DensePolynomial zero({Field::Zero()});
    EXPECT_TRUE(zero.IsZero());
    EXPECT_EQ(zero, DensePolynomial::Zero());
}

TEST(PolynomialTest, Evaluate) {
    // 1 + 2x + 3x^2 at x = 2
    DensePolynomial p({Field(uint64_t(1)), Field(uint64_t(2)), Field(uint64_t(3))});
    EXPECT_EQ(p.Evaluate(Field(uint64_t(2))), Field(uint64_t(17)));
    EXPECT_EQ(DensePolynomial::Zero().Evaluate(Field(uint64_t(5))), Field::Zero());
}

TEST(PolynomialTest, AddAndScale) {
    DensePolynomial a({Field(uint64_t(1)), Field(uint64_t(2))});
    DensePolynomial b({Field(uint64_t(3)), Field(uint64_t(4)), Field(uint64_t(5))});
    a += b;
    EXPECT_EQ(a, DensePolynomial({Field(uint64_t(4)), Field(uint64_t(6)), Field(uint64_t(5))}));

    a *= Field(uint64_t(2));
    EXPECT_EQ(a, DensePolynomial({Field(uint64_t(8)), Field(uint64_t(12)), Field(uint64_t(10))}));

    a *= Field::Zero();
    EXPECT_TRUE(a.IsZero());
}

// ============================================================================
// EvaluationDomain Tests
// ============================================================================

TEST(EvaluationDomainTest, SizeIsNextPowerOfTwo) {
    auto domain = EvaluationDomain::New(5);
    ASSERT_TRUE(domain.has_value());
    EXPECT_EQ(domain->Size(), 8u);
    EXPECT_EQ(domain->LogSize(), 3u);
    EXPECT_EQ(domain->Generator().Pow(8), Field::One());
    EXPECT_NE(domain->Generator().Pow(4), Field::One());

    EXPECT_FALSE(EvaluationDomain::New(0).has_value());
    EXPECT_EQ(EvaluationDomain::New(1)->Size(), 1u);
}

TEST(EvaluationDomainTest, FFTMatchesEvaluation) {
    auto domain = EvaluationDomain::New(8);
    ASSERT_TRUE(domain.has_value());
    DensePolynomial p = MakePolynomial(6, 1);

    auto evals = domain->FFT(p.Coeffs());
    auto elements = domain->Elements();
    ASSERT_EQ(evals.size(), domain->Size());
    for (size_t i = 0; i < elements.size(); ++i) {
        EXPECT_EQ(evals[i], p.Evaluate(elements[i])) << "point " << i;
    }
}

TEST(EvaluationDomainTest, IFFTInvertsFFT) {
    auto domain = EvaluationDomain::New(16);
    ASSERT_TRUE(domain.has_value());
    DensePolynomial p = MakePolynomial(11, 2);
    EXPECT_EQ(DensePolynomial(domain->IFFT(domain->FFT(p.Coeffs()))), p);
}

TEST(EvaluationDomainTest, ProductInEvaluationForm) {
    DensePolynomial a = MakePolynomial(4, 3);
    DensePolynomial b = MakePolynomial(4, 4);
    auto domain = EvaluationDomain::New(a.Degree() + b.Degree() + 1);
    ASSERT_TRUE(domain.has_value());

    DensePolynomial product(domain->IFFT(
        domain->MulPolynomialsInEvaluationDomain(domain->FFT(a.Coeffs()), domain->FFT(b.Coeffs()))));
    EXPECT_EQ(product.Degree(), a.Degree() + b.Degree());

    Field x(uint64_t(12345));
    EXPECT_EQ(product.Evaluate(x), a.Evaluate(x) * b.Evaluate(x));
}

// ============================================================================
// Hashing Tests
// ============================================================================

TEST(PuzzleHashTest, HashToFieldsIsDeterministic) {
    std::vector<Byte> input = {1, 2, 3};
    auto a = HashToFields("VEIL.Test", input, 5);
    auto b = HashToFields("VEIL.Test", input, 5);
    ASSERT_EQ(a.size(), 5u);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, HashToFields("VEIL.Other", input, 5));
    EXPECT_NE(a[0], a[1]);
}

TEST(PuzzleHashTest, HashToPolynomialDegree) {
    std::vector<Byte> input = {9, 9, 9};
    DensePolynomial p = HashToPolynomial(input, 15);
    EXPECT_EQ(p.Degree(), 15u);
    EXPECT_EQ(p, HashToPolynomial(input, 15));
}

// ============================================================================
// KZG10 Tests
// ============================================================================

class KZGTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        InitPairing();
        params_ = new UniversalParams(KZG10::Setup(8, "veil-kzg-test"));
    }

    static void TearDownTestSuite() {
        delete params_;
        params_ = nullptr;
    }

    VerifyingKey Key() const {
        return VerifyingKey{params_->powersOfBetaG[0], params_->h, params_->betaH};
    }

    static UniversalParams* params_;
};

UniversalParams* KZGTest::params_ = nullptr;

TEST_F(KZGTest, SetupSize) {
    EXPECT_EQ(params_->MaxDegree(), 8u);
    UniversalParams again = KZG10::Setup(8, "veil-kzg-test");
    EXPECT_EQ(again.powersOfBetaG, params_->powersOfBetaG);
}

TEST_F(KZGTest, OpenAndCheck) {
    DensePolynomial p = MakePolynomial(9, 5);
    KZGCommitment commitment = KZG10::Commit(params_->powersOfBetaG, p);

    Field point(uint64_t(777));
    Field evaluation = p.Evaluate(point);
    KZGProof proof = KZG10::Open(params_->powersOfBetaG, p, point, evaluation);
    EXPECT_FALSE(proof.IsHiding());
    EXPECT_TRUE(KZG10::Check(Key(), commitment, point, evaluation, proof));

    EXPECT_FALSE(KZG10::Check(Key(), commitment, point, evaluation + Field::One(), proof));
    EXPECT_FALSE(KZG10::Check(Key(), commitment, point + Field::One(), evaluation, proof));
}

TEST_F(KZGTest, CommitmentIsLinear) {
    DensePolynomial a = MakePolynomial(5, 6);
    DensePolynomial b = MakePolynomial(7, 7);
    DensePolynomial sum = a;
    sum += b;

    G1 expected = KZG10::MultiScalarMul(
        {KZG10::Commit(params_->powersOfBetaG, a).point, KZG10::Commit(params_->powersOfBetaG, b).point},
        {Field::One(), Field::One()});
    EXPECT_EQ(KZG10::Commit(params_->powersOfBetaG, sum).point, expected);
}

TEST_F(KZGTest, CommitRejectsOversizedPolynomial) {
    EXPECT_THROW(KZG10::Commit(params_->powersOfBetaG, MakePolynomial(10, 8)), PuzzleError);
}

TEST_F(KZGTest, CommitmentEncodingRoundTrip) {
    KZGCommitment commitment = KZG10::Commit(params_->powersOfBetaG, MakePolynomial(3, 9));
    EXPECT_EQ(FromBytesLE<KZGCommitment>(ToBytesLE(commitment)), commitment);

    KZGProof hiding{commitment.point, Field(uint64_t(3))};
    EXPECT_EQ(FromBytesLE<KZGProof>(ToBytesLE(hiding)), hiding);
}
