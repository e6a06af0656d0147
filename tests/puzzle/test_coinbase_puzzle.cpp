// VEIL - Coinbase Puzzle Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>
#include "veil/core/errors.h"
#include "veil/crypto/sha256.h"
#include "veil/puzzle/coinbase_puzzle.h"
#include <algorithm>
#include <limits>
#include <string>

using namespace veil;
using namespace veil::puzzle;

namespace {

constexpr uint32_t TEST_DEGREE = 31;

Hash256 BlockHash(uint32_t epoch) {
    std::string input = "veil-test-block/" + std::to_string(epoch);
    return SHA256Hash(reinterpret_cast<const Byte*>(input.data()), input.size());
}

Address TestAddress(uint64_t seed) {
    return Address::FromPrivateKey(PrivateKey::FromSeed(Field(seed)));
}

} // namespace

class CoinbasePuzzleTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        srs_ = new UniversalParams(CoinbasePuzzle::Setup(PuzzleConfig{TEST_DEGREE}, "veil-puzzle-test"));
    }

    static void TearDownTestSuite() {
        delete srs_;
        srs_ = nullptr;
    }

    void SetUp() override {
        puzzle_ = CoinbasePuzzle::Trim(*srs_, PuzzleConfig{TEST_DEGREE});
        epoch_ = EpochChallenge::New(3, BlockHash(3), TEST_DEGREE);
    }

    std::vector<ProverSolution> ProveMany(size_t count) const {
        std::vector<ProverSolution> solutions;
        for (size_t i = 0; i < count; ++i) {
            solutions.push_back(puzzle_.Prove(epoch_, TestAddress(100 + i), i));
        }
        return solutions;
    }

    static UniversalParams* srs_;
    CoinbasePuzzle puzzle_;
    EpochChallenge epoch_;
};

UniversalParams* CoinbasePuzzleTest::srs_ = nullptr;

// ============================================================================
// Setup
// ============================================================================

TEST(ProductDomainTest, Sizes) {
    EXPECT_EQ(ProductDomain(1).Size(), 4u);
    EXPECT_EQ(ProductDomain(31).Size(), 64u);
    EXPECT_EQ(ProductDomain(32).Size(), 128u);
    EXPECT_THROW(ProductDomain(0), PuzzleError);
}

TEST_F(CoinbasePuzzleTest, SetupCoversProductDegree) {
    EXPECT_EQ(srs_->MaxDegree(), 2u * TEST_DEGREE);
    EXPECT_TRUE(puzzle_.IsProver());
    EXPECT_EQ(puzzle_.ProvingKey().powersOfBetaG.size(), 2u * TEST_DEGREE + 1);
    EXPECT_EQ(puzzle_.ProvingKey().productDomain.Size(), 64u);
}

TEST_F(CoinbasePuzzleTest, TrimRejectsSmallParameters) {
    EXPECT_THROW(CoinbasePuzzle::Trim(*srs_, PuzzleConfig{TEST_DEGREE + 1}), PuzzleError);
    EXPECT_THROW(CoinbasePuzzle::Setup(PuzzleConfig{0}, "x"), PuzzleError);
}

TEST_F(CoinbasePuzzleTest, EpochChallenge) {
    EXPECT_EQ(epoch_.EpochNumber(), 3u);
    EXPECT_EQ(epoch_.Degree(), TEST_DEGREE);
    EXPECT_EQ(epoch_.EpochPolynomial().Degree(), TEST_DEGREE);
    EXPECT_EQ(epoch_.EpochPolynomialEvaluations().size(), 64u);

    EpochChallenge other = EpochChallenge::New(4, BlockHash(4), TEST_DEGREE);
    EXPECT_NE(other.EpochPolynomial(), epoch_.EpochPolynomial());
    EXPECT_THROW(EpochChallenge::New(3, BlockHash(3), 0), PuzzleError);

    EpochChallenge decoded = FromBytesLE<EpochChallenge>(ToBytesLE(epoch_));
    EXPECT_TRUE(decoded == epoch_);
    EXPECT_EQ(decoded.EpochPolynomial(), epoch_.EpochPolynomial());
}

// ============================================================================
// Prover Solutions
// ============================================================================

TEST_F(CoinbasePuzzleTest, ProveAndVerifySingle) {
    Address address = TestAddress(1);
    ProverSolution solution = puzzle_.Prove(epoch_, address, 42);
    EXPECT_EQ(solution.GetAddress(), address);
    EXPECT_EQ(solution.Nonce(), 42u);
    EXPECT_FALSE(solution.Proof().IsHiding());
    EXPECT_GE(solution.ToTarget(), 1u);
    EXPECT_TRUE(solution.Verify(puzzle_.GetVerifyingKey(), epoch_, 0));
}

TEST_F(CoinbasePuzzleTest, ProverSolutionIsDeterministic) {
    Address address = TestAddress(2);
    EXPECT_EQ(puzzle_.Prove(epoch_, address, 7), puzzle_.Prove(epoch_, address, 7));
    EXPECT_NE(puzzle_.Prove(epoch_, address, 7).Commitment(), puzzle_.Prove(epoch_, address, 8).Commitment());
    EXPECT_NE(puzzle_.Prove(epoch_, address, 7).Commitment(),
              puzzle_.Prove(epoch_, TestAddress(3), 7).Commitment());
}

TEST_F(CoinbasePuzzleTest, ProverSolutionFailsForOtherEpochOrNonce) {
    ProverSolution solution = puzzle_.Prove(epoch_, TestAddress(4), 1);
    EpochChallenge other = EpochChallenge::New(9, BlockHash(9), TEST_DEGREE);
    EXPECT_FALSE(solution.Verify(puzzle_.GetVerifyingKey(), other, 0));

    ProverSolution forged(PartialSolution(solution.GetAddress(), 2, solution.Commitment()), solution.Proof());
    EXPECT_FALSE(forged.Verify(puzzle_.GetVerifyingKey(), epoch_, 0));
}

TEST_F(CoinbasePuzzleTest, HidingProverSolutionFails) {
    ProverSolution solution = puzzle_.Prove(epoch_, TestAddress(5), 1);
    KZGProof hiding = solution.Proof();
    hiding.randomV = Field::One();
    ProverSolution forged(solution.Partial(), hiding);
    EXPECT_FALSE(forged.Verify(puzzle_.GetVerifyingKey(), epoch_, 0));
}

TEST_F(CoinbasePuzzleTest, ProofTargetGate) {
    ProverSolution solution = puzzle_.Prove(epoch_, TestAddress(6), 1);
    uint64_t target = solution.ToTarget();
    EXPECT_TRUE(solution.Verify(puzzle_.GetVerifyingKey(), epoch_, target));
    if (target < std::numeric_limits<uint64_t>::max()) {
        EXPECT_FALSE(solution.Verify(puzzle_.GetVerifyingKey(), epoch_, target + 1));
        EXPECT_THROW(puzzle_.Prove(epoch_, TestAddress(6), 1, target + 1), PuzzleError);
    }
    EXPECT_NO_THROW(puzzle_.Prove(epoch_, TestAddress(6), 1, target));
}

TEST_F(CoinbasePuzzleTest, ProofTargetErrorNamesTarget) {
    uint64_t target = puzzle_.Prove(epoch_, TestAddress(6), 2).ToTarget();
    if (target == std::numeric_limits<uint64_t>::max()) {
        GTEST_SKIP();
    }
    try {
        puzzle_.Prove(epoch_, TestAddress(6), 2, target + 1);
        FAIL() << "expected PuzzleError";
    } catch (const PuzzleError& e) {
        EXPECT_NE(std::string(e.what()).find("(" + std::to_string(target + 1) + ")"), std::string::npos);
    }
}

TEST_F(CoinbasePuzzleTest, TargetFromCommitmentHash) {
    ProverSolution solution = puzzle_.Prove(epoch_, TestAddress(7), 1);
    Hash256 digest = DoubleSHA256(solution.Commitment().ToBytes());
    uint64_t divisor = 0;
    for (size_t i = 0; i < 8; ++i) {
        divisor |= static_cast<uint64_t>(digest[i]) << (8 * i);
    }
    ASSERT_NE(divisor, 0u);
    EXPECT_EQ(solution.ToTarget(), std::numeric_limits<uint64_t>::max() / divisor);
}

TEST_F(CoinbasePuzzleTest, EpochDegreeMustMatch) {
    EpochChallenge wrong = EpochChallenge::New(3, BlockHash(3), 7);
    EXPECT_THROW(puzzle_.Prove(wrong, TestAddress(8), 1), PuzzleError);
}

// ============================================================================
// Coinbase Solutions
// ============================================================================

TEST_F(CoinbasePuzzleTest, AccumulateAndVerify) {
    for (size_t count : {1u, 2u, 5u}) {
        auto solutions = ProveMany(count);
        CoinbaseSolution coinbase = puzzle_.AccumulateUnchecked(epoch_, solutions);
        EXPECT_EQ(coinbase.Size(), count);
        EXPECT_FALSE(coinbase.Proof().IsHiding());
        EXPECT_TRUE(puzzle_.Verify(coinbase, epoch_, 0, 0)) << count << " solutions";
    }
}

TEST_F(CoinbasePuzzleTest, VerifierOnlyPuzzle) {
    auto solutions = ProveMany(3);
    CoinbaseSolution coinbase = puzzle_.AccumulateUnchecked(epoch_, solutions);

    CoinbasePuzzle verifier = CoinbasePuzzle::Trim(*srs_, PuzzleConfig{TEST_DEGREE}, true);
    EXPECT_FALSE(verifier.IsProver());
    EXPECT_TRUE(verifier.Verify(coinbase, epoch_, 0, 0));
    EXPECT_THROW(verifier.ProvingKey(), PuzzleError);
    EXPECT_THROW(verifier.Prove(epoch_, TestAddress(1), 1), PuzzleError);
    EXPECT_THROW(verifier.AccumulateUnchecked(epoch_, solutions), PuzzleError);

    CoinbasePuzzle fromKey = CoinbasePuzzle::FromVerifyingKey(puzzle_.GetVerifyingKey());
    EXPECT_TRUE(fromKey.Verify(coinbase, epoch_, 0, 0));
}

TEST_F(CoinbasePuzzleTest, AccumulateRejectsEmptyAndDuplicates) {
    EXPECT_THROW(puzzle_.AccumulateUnchecked(epoch_, {}), PuzzleError);

    auto solutions = ProveMany(2);
    solutions.push_back(solutions[0]);
    EXPECT_THROW(puzzle_.AccumulateUnchecked(epoch_, solutions), PuzzleError);
}

TEST_F(CoinbasePuzzleTest, VerifyRejectsDuplicateCommitments) {
    auto solutions = ProveMany(2);
    CoinbaseSolution coinbase = puzzle_.AccumulateUnchecked(epoch_, solutions);
    std::vector<PartialSolution> partials = coinbase.PartialSolutions();
    partials.push_back(partials[0]);
    CoinbaseSolution duplicated(partials, coinbase.Proof());
    EXPECT_THROW(puzzle_.Verify(duplicated, epoch_, 0, 0), PuzzleError);
}

TEST_F(CoinbasePuzzleTest, VerifyRejectsEmpty) {
    CoinbaseSolution empty({}, KZGProof{});
    EXPECT_THROW(puzzle_.Verify(empty, epoch_, 0, 0), PuzzleError);
}

TEST_F(CoinbasePuzzleTest, VerifyRejectsHidingProof) {
    CoinbaseSolution coinbase = puzzle_.AccumulateUnchecked(epoch_, ProveMany(2));
    KZGProof hiding = coinbase.Proof();
    hiding.randomV = Field(uint64_t(5));
    CoinbaseSolution forged(coinbase.PartialSolutions(), hiding);
    EXPECT_THROW(puzzle_.Verify(forged, epoch_, 0, 0), PuzzleError);
}

TEST_F(CoinbasePuzzleTest, MutatedSolutionFailsCheck) {
    auto solutions = ProveMany(3);
    CoinbaseSolution coinbase = puzzle_.AccumulateUnchecked(epoch_, solutions);

    // Same commitment claimed for another nonce
    std::vector<PartialSolution> partials = coinbase.PartialSolutions();
    partials[1] = PartialSolution(partials[1].GetAddress(), partials[1].Nonce() + 100, partials[1].Commitment());
    EXPECT_FALSE(puzzle_.Verify(CoinbaseSolution(partials, coinbase.Proof()), epoch_, 0, 0));

    // Commitment replaced by one for a different nonce
    partials = coinbase.PartialSolutions();
    ProverSolution other = puzzle_.Prove(epoch_, partials[2].GetAddress(), 999);
    partials[2] = PartialSolution(partials[2].GetAddress(), partials[2].Nonce(), other.Commitment());
    EXPECT_FALSE(puzzle_.Verify(CoinbaseSolution(partials, coinbase.Proof()), epoch_, 0, 0));

    // Proof from a different accumulation
    CoinbaseSolution smaller = puzzle_.AccumulateUnchecked(epoch_, ProveMany(2));
    EXPECT_FALSE(puzzle_.Verify(CoinbaseSolution(coinbase.PartialSolutions(), smaller.Proof()), epoch_, 0, 0));

    // Different epoch
    EpochChallenge epoch = EpochChallenge::New(5, BlockHash(5), TEST_DEGREE);
    EXPECT_FALSE(puzzle_.Verify(coinbase, epoch, 0, 0));
}

TEST_F(CoinbasePuzzleTest, CumulativeTarget) {
    auto solutions = ProveMany(4);
    CoinbaseSolution coinbase = puzzle_.AccumulateUnchecked(epoch_, solutions);

    CumulativeTarget expected = 0;
    uint64_t minimum = std::numeric_limits<uint64_t>::max();
    for (const auto& partial : coinbase.PartialSolutions()) {
        expected += partial.ToTarget();
        minimum = std::min(minimum, partial.ToTarget());
    }
    EXPECT_TRUE(coinbase.ToCumulativeTarget() == expected);

    // Both targets are checked before the pairing
    EXPECT_TRUE(puzzle_.Verify(coinbase, epoch_, minimum, minimum));
    if (minimum < std::numeric_limits<uint64_t>::max()) {
        EXPECT_THROW(puzzle_.Verify(coinbase, epoch_, 0, minimum + 1), PuzzleError);
    }
}

TEST_F(CoinbasePuzzleTest, CoinbaseTargetGate) {
    CoinbaseSolution coinbase = puzzle_.AccumulateUnchecked(epoch_, ProveMany(1));
    uint64_t target = coinbase.PartialSolutions()[0].ToTarget();
    EXPECT_TRUE(puzzle_.Verify(coinbase, epoch_, target, 0));
    if (target < std::numeric_limits<uint64_t>::max()) {
        EXPECT_THROW(puzzle_.Verify(coinbase, epoch_, target + 1, 0), PuzzleError);
    }
}

TEST_F(CoinbasePuzzleTest, CumulativeTargetDoesNotWrap) {
    // A u64 sum of these would wrap; the wide sum keeps growing
    PartialSolution partial = puzzle_.Prove(epoch_, TestAddress(9), 1).Partial();
    std::vector<PartialSolution> partials(3, partial);
    CoinbaseSolution coinbase(partials, KZGProof{});
    EXPECT_TRUE(coinbase.ToCumulativeTarget() == CumulativeTarget(partial.ToTarget()) * 3);
}

TEST_F(CoinbasePuzzleTest, CoinbaseSolutionEncoding) {
    CoinbaseSolution coinbase = puzzle_.AccumulateUnchecked(epoch_, ProveMany(3));
    std::vector<Byte> bytes = ToBytesLE(coinbase);
    CoinbaseSolution decoded = FromBytesLE<CoinbaseSolution>(bytes);
    EXPECT_TRUE(decoded == coinbase);
    EXPECT_TRUE(puzzle_.Verify(decoded, epoch_, 0, 0));

    // Partial-solution count above the limit
    std::vector<Byte> oversized = ToBytesLE(uint32_t(MAX_PROVER_SOLUTIONS + 1));
    EXPECT_THROW(FromBytesLE<CoinbaseSolution>(oversized), DecodeError);
}

// ============================================================================
// Nonce Search
// ============================================================================

TEST_F(CoinbasePuzzleTest, ProveNonceRangeFindsLowestNonce) {
    util::ThreadPool pool(3);
    Address address = TestAddress(10);
    auto found = ProveNonceRange(puzzle_, epoch_, address, 20, 9, 0, pool);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->Nonce(), 20u);
    EXPECT_EQ(*found, puzzle_.Prove(epoch_, address, 20));
}

TEST_F(CoinbasePuzzleTest, ProveNonceRangeHonoursTarget) {
    util::ThreadPool pool(2);
    Address address = TestAddress(11);

    uint64_t best = 0;
    uint64_t bestNonce = 0;
    for (uint64_t nonce = 0; nonce < 6; ++nonce) {
        uint64_t target = puzzle_.Prove(epoch_, address, nonce).ToTarget();
        if (target > best) {
            best = target;
            bestNonce = nonce;
        }
    }

    auto found = ProveNonceRange(puzzle_, epoch_, address, 0, 6, best, pool);
    ASSERT_TRUE(found.has_value());
    EXPECT_GE(found->ToTarget(), best);
    EXPECT_LE(found->Nonce(), bestNonce);

    EXPECT_FALSE(ProveNonceRange(puzzle_, epoch_, address, 0, 0, 0, pool).has_value());
}

TEST_F(CoinbasePuzzleTest, CloneOwnsItsKeys) {
    CoinbasePuzzle copy = puzzle_.Clone();
    ASSERT_TRUE(copy.IsProver());
    EXPECT_NE(&copy.ProvingKey(), &puzzle_.ProvingKey());
    EXPECT_NE(&copy.GetVerifyingKey(), &puzzle_.GetVerifyingKey());
    EXPECT_EQ(copy.Prove(epoch_, TestAddress(13), 4), puzzle_.Prove(epoch_, TestAddress(13), 4));

    CoinbasePuzzle verifier = CoinbasePuzzle::FromVerifyingKey(puzzle_.GetVerifyingKey()).Clone();
    EXPECT_FALSE(verifier.IsProver());
}

TEST_F(CoinbasePuzzleTest, ProveNonceRangeNeedsProver) {
    util::ThreadPool pool(1);
    CoinbasePuzzle verifier = CoinbasePuzzle::FromVerifyingKey(puzzle_.GetVerifyingKey());
    EXPECT_THROW(ProveNonceRange(verifier, epoch_, TestAddress(12), 0, 4, 0, pool), PuzzleError);
}
