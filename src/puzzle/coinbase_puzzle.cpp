// VEIL - Coinbase Puzzle
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/puzzle/coinbase_puzzle.h"
#include "veil/core/errors.h"
#include "veil/crypto/sha256.h"
#include "veil/puzzle/hash.h"
#include "veil/util/logging.h"
#include <algorithm>
#include <atomic>
#include <cassert>
#include <future>
#include <limits>
#include <set>

namespace veil {
namespace puzzle {

EvaluationDomain ProductDomain(uint32_t degree) {
    if (degree == 0) {
        throw PuzzleError("Degree cannot be zero");
    }
    uint64_t productNumCoefficients = 2 * static_cast<uint64_t>(degree) + 1;
    auto domain = EvaluationDomain::New(static_cast<size_t>(productNumCoefficients));
    if (!domain) {
        throw PuzzleError("Invalid degree " + std::to_string(degree));
    }
    return *domain;
}

// ============================================================================
// EpochChallenge
// ============================================================================

EpochChallenge EpochChallenge::New(uint32_t epochNumber, const Hash256& epochBlockHash, uint32_t degree) {
    EvaluationDomain domain = ProductDomain(degree);

    DataStream input;
    input << epochNumber << epochBlockHash;

    EpochChallenge challenge;
    challenge.epochNumber_ = epochNumber;
    challenge.epochBlockHash_ = epochBlockHash;
    challenge.degree_ = degree;
    challenge.epochPolynomial_ = HashToPolynomial(input.Data(), degree);
    if (challenge.epochPolynomial_.Degree() != degree) {
        throw PuzzleError("Epoch polynomial has degree " + std::to_string(challenge.epochPolynomial_.Degree()) +
                          ", expected " + std::to_string(degree));
    }
    challenge.epochPolynomialEvaluations_ = domain.FFT(challenge.epochPolynomial_.Coeffs());
    return challenge;
}

// ============================================================================
// Solutions
// ============================================================================

uint64_t PartialSolution::ToTarget() const {
    Hash256 digest = DoubleSHA256(commitment_.ToBytes());
    uint64_t divisor = 0;
    for (size_t i = 0; i < 8; ++i) {
        divisor |= static_cast<uint64_t>(digest[i]) << (8 * i);
    }
    if (divisor == 0) {
        divisor = 1;
    }
    return std::numeric_limits<uint64_t>::max() / divisor;
}

DensePolynomial PartialSolution::ToProverPolynomial(const EpochChallenge& epoch) const {
    return CoinbasePuzzle::ProverPolynomial(epoch, address_, nonce_);
}

bool ProverSolution::Verify(const VerifyingKey& vk, const EpochChallenge& epoch,
                            uint64_t minimumProofTarget) const {
    if (proof_.IsHiding()) {
        return false;
    }
    uint64_t target = ToTarget();
    if (target < minimumProofTarget) {
        LOG_DEBUG(util::LogCategory::PUZZLE) << "Prover solution target " << target << " is below "
                                             << minimumProofTarget;
        return false;
    }
    Field point = HashCommitment(Commitment());
    Field evaluation = ToProverPolynomial(epoch).Evaluate(point) * epoch.EpochPolynomial().Evaluate(point);
    return KZG10::Check(vk, Commitment(), point, evaluation, proof_);
}

std::vector<KZGCommitment> CoinbaseSolution::PuzzleCommitments() const {
    std::vector<KZGCommitment> out;
    out.reserve(partials_.size());
    for (const auto& p : partials_) {
        out.push_back(p.Commitment());
    }
    return out;
}

CumulativeTarget CoinbaseSolution::ToCumulativeTarget() const {
    const CumulativeTarget max = ~CumulativeTarget(0);
    CumulativeTarget sum = 0;
    for (const auto& p : partials_) {
        CumulativeTarget target = p.ToTarget();
        sum = (max - sum < target) ? max : sum + target;
    }
    return sum;
}

// ============================================================================
// CoinbasePuzzle
// ============================================================================

UniversalParams CoinbasePuzzle::Setup(const PuzzleConfig& config, const std::string& seed) {
    if (config.degree == 0) {
        throw PuzzleError("Degree cannot be zero");
    }
    // The product of two degree-n polynomials has degree 2n
    return KZG10::Setup(2 * static_cast<size_t>(config.degree), seed);
}

CoinbasePuzzle CoinbasePuzzle::Trim(const UniversalParams& srs, const PuzzleConfig& config, bool verifierOnly) {
    EvaluationDomain productDomain = ProductDomain(config.degree);
    size_t required = 2 * static_cast<size_t>(config.degree) + 1;
    if (srs.powersOfBetaG.size() < required) {
        throw PuzzleError("Universal parameters support degree " + std::to_string(srs.MaxDegree()) +
                          ", the puzzle needs " + std::to_string(required - 1));
    }

    auto vk = std::make_shared<CoinbaseVerifyingKey>();
    vk->g = srs.powersOfBetaG[0];
    vk->h = srs.h;
    vk->betaH = srs.betaH;

    CoinbasePuzzle puzzle;
    puzzle.verifyingKey_ = vk;
    if (!verifierOnly) {
        std::vector<G1> powers(srs.powersOfBetaG.begin(), srs.powersOfBetaG.begin() + required);
        puzzle.provingKey_ = std::make_shared<CoinbaseProvingKey>(
            CoinbaseProvingKey{productDomain, std::move(powers), *vk});
    }

    LOG_INFO(util::LogCategory::PUZZLE) << "Trimmed coinbase puzzle to degree " << config.degree
                                        << " (product domain " << productDomain.Size() << ", "
                                        << (verifierOnly ? "verifier" : "prover") << ")";
    return puzzle;
}

CoinbasePuzzle CoinbasePuzzle::FromVerifyingKey(const CoinbaseVerifyingKey& vk) {
    CoinbasePuzzle puzzle;
    puzzle.verifyingKey_ = std::make_shared<CoinbaseVerifyingKey>(vk);
    return puzzle;
}

CoinbasePuzzle CoinbasePuzzle::Clone() const {
    CoinbasePuzzle copy;
    if (provingKey_) {
        copy.provingKey_ = std::make_shared<const CoinbaseProvingKey>(*provingKey_);
    }
    copy.verifyingKey_ = std::make_shared<const CoinbaseVerifyingKey>(*verifyingKey_);
    return copy;
}

const CoinbaseProvingKey& CoinbasePuzzle::ProvingKey() const {
    if (!provingKey_) {
        throw PuzzleError("Cannot fetch the coinbase proving key with a verifier");
    }
    return *provingKey_;
}

void CoinbasePuzzle::CheckEpoch(const EpochChallenge& epoch) const {
    if (epoch.EpochPolynomialEvaluations().size() != provingKey_->productDomain.Size()) {
        throw PuzzleError("Epoch challenge of degree " + std::to_string(epoch.Degree()) +
                          " does not match the puzzle's product domain");
    }
}

DensePolynomial CoinbasePuzzle::ProverPolynomial(const EpochChallenge& epoch, const Address& address,
                                                 uint64_t nonce) {
    DataStream input;
    input << epoch.EpochNumber() << epoch.EpochBlockHash() << address << nonce;
    return HashToPolynomial(input.Data(), epoch.Degree());
}

ProverSolution CoinbasePuzzle::Prove(const EpochChallenge& epoch, const Address& address, uint64_t nonce,
                                     std::optional<uint64_t> minimumProofTarget) const {
    std::optional<ProverSolution> solution = TryProve(epoch, address, nonce, minimumProofTarget.value_or(0));
    if (!solution) {
        throw PuzzleError("Prover solution was below the necessary proof target (" +
                          std::to_string(minimumProofTarget.value_or(0)) + ")");
    }
    return *solution;
}

std::optional<ProverSolution> CoinbasePuzzle::TryProve(const EpochChallenge& epoch, const Address& address,
                                                       uint64_t nonce, uint64_t minimumProofTarget) const {
    if (!provingKey_) {
        throw PuzzleError("Cannot prove the coinbase puzzle with a verifier");
    }
    CheckEpoch(epoch);
    const CoinbaseProvingKey& pk = *provingKey_;

    DensePolynomial polynomial = ProverPolynomial(epoch, address, nonce);

    std::vector<Field> productEvaluations = pk.productDomain.MulPolynomialsInEvaluationDomain(
        pk.productDomain.FFT(polynomial.Coeffs()), epoch.EpochPolynomialEvaluations());
    DensePolynomial product(pk.productDomain.IFFT(productEvaluations));

    KZGCommitment commitment = KZG10::Commit(pk.powersOfBetaG, product);
    PartialSolution partial(address, nonce, commitment);
    if (partial.ToTarget() < minimumProofTarget) {
        return std::nullopt;
    }

    Field point = HashCommitment(commitment);
    Field productEvalAtPoint = polynomial.Evaluate(point) * epoch.EpochPolynomial().Evaluate(point);
    KZGProof proof = KZG10::Open(pk.powersOfBetaG, product, point, productEvalAtPoint);
    if (proof.IsHiding()) {
        throw PuzzleError("The prover solution must contain a non-hiding proof");
    }

    assert(KZG10::Check(pk.verifyingKey, commitment, point, productEvalAtPoint, proof));

    LOG_DEBUG(util::LogCategory::PUZZLE) << "Proved nonce " << nonce << " for epoch " << epoch.EpochNumber()
                                         << " with target " << partial.ToTarget();
    return ProverSolution(partial, proof);
}

CoinbaseSolution CoinbasePuzzle::AccumulateUnchecked(const EpochChallenge& epoch,
                                                     const std::vector<ProverSolution>& solutions) const {
    if (solutions.empty()) {
        throw PuzzleError("Cannot accumulate an empty list of prover solutions.");
    }
    if (solutions.size() > MAX_PROVER_SOLUTIONS) {
        throw PuzzleError("Cannot accumulate beyond " + std::to_string(MAX_PROVER_SOLUTIONS) +
                          " prover solutions, found " + std::to_string(solutions.size()) + ".");
    }
    if (!provingKey_) {
        throw PuzzleError("Cannot accumulate the coinbase puzzle with a verifier");
    }
    CheckEpoch(epoch);
    const CoinbaseProvingKey& pk = *provingKey_;

    std::set<std::vector<Byte>> seen;
    for (const auto& solution : solutions) {
        if (!seen.insert(ToBytesLE(solution)).second) {
            throw PuzzleError("Cannot accumulate duplicate prover solutions");
        }
    }

    std::vector<DensePolynomial> polynomials;
    std::vector<PartialSolution> partials;
    polynomials.reserve(solutions.size());
    partials.reserve(solutions.size());
    for (const auto& solution : solutions) {
        if (solution.Proof().IsHiding()) {
            continue;
        }
        polynomials.push_back(solution.Partial().ToProverPolynomial(epoch));
        partials.push_back(solution.Partial());
    }
    if (partials.empty()) {
        throw PuzzleError("Cannot accumulate only hiding prover solutions");
    }

    std::vector<KZGCommitment> commitments;
    commitments.reserve(partials.size());
    for (const auto& p : partials) {
        commitments.push_back(p.Commitment());
    }
    std::vector<Field> challenges = HashCommitments(commitments);
    if (challenges.size() != partials.size() + 1) {
        throw PuzzleError("Invalid number of challenge points");
    }
    Field accumulatorPoint = challenges.back();
    challenges.pop_back();

    DensePolynomial accumulated;
    for (size_t i = 0; i < polynomials.size(); ++i) {
        polynomials[i] *= challenges[i];
        accumulated += polynomials[i];
    }
    Field productEvalAtPoint =
        accumulated.Evaluate(accumulatorPoint) * epoch.EpochPolynomial().Evaluate(accumulatorPoint);

    std::vector<Field> productEvaluations = pk.productDomain.MulPolynomialsInEvaluationDomain(
        pk.productDomain.FFT(accumulated.Coeffs()), epoch.EpochPolynomialEvaluations());
    DensePolynomial product(pk.productDomain.IFFT(productEvaluations));

    KZGProof proof = KZG10::Open(pk.powersOfBetaG, product, accumulatorPoint, productEvalAtPoint);
    if (proof.IsHiding()) {
        throw PuzzleError("The coinbase proof must be non-hiding");
    }

    LOG_INFO(util::LogCategory::PUZZLE) << "Accumulated " << partials.size() << " prover solutions for epoch "
                                        << epoch.EpochNumber();
    return CoinbaseSolution(std::move(partials), proof);
}

bool CoinbasePuzzle::Verify(const CoinbaseSolution& solution, const EpochChallenge& epoch,
                            uint64_t coinbaseTarget, uint64_t proofTarget) const {
    if (solution.IsEmpty()) {
        throw PuzzleError("The coinbase solution does not contain any partial solutions");
    }
    if (solution.Size() > MAX_PROVER_SOLUTIONS) {
        throw PuzzleError("The coinbase solution exceeds the allowed number of partial solutions. (" +
                          std::to_string(solution.Size()) + " > " + std::to_string(MAX_PROVER_SOLUTIONS) + ")");
    }
    if (solution.Proof().IsHiding()) {
        throw PuzzleError("The coinbase proof must be non-hiding");
    }
    if (solution.ToCumulativeTarget() < static_cast<CumulativeTarget>(coinbaseTarget)) {
        LOG_WARN(util::LogCategory::PUZZLE) << "Coinbase solution misses the coinbase target " << coinbaseTarget;
        throw PuzzleError("The coinbase proof does not meet the coinbase target");
    }

    std::vector<KZGCommitment> commitments = solution.PuzzleCommitments();
    std::set<std::vector<Byte>> seen;
    for (const auto& c : commitments) {
        if (!seen.insert(c.ToBytes()).second) {
            throw PuzzleError("The coinbase solution contains duplicate puzzle commitments");
        }
    }

    std::vector<DensePolynomial> polynomials;
    polynomials.reserve(solution.Size());
    for (const auto& partial : solution.PartialSolutions()) {
        if (partial.ToTarget() < proofTarget) {
            LOG_WARN(util::LogCategory::PUZZLE) << "Partial solution for nonce " << partial.Nonce()
                                                << " misses the proof target " << proofTarget;
            throw PuzzleError("Prover puzzle does not meet the proof target requirements.");
        }
        polynomials.push_back(partial.ToProverPolynomial(epoch));
    }

    std::vector<Field> challenges = HashCommitments(commitments);
    if (challenges.size() != commitments.size() + 1) {
        throw PuzzleError("Invalid number of challenge points");
    }
    Field accumulatorPoint = challenges.back();
    challenges.pop_back();

    Field accumulatorEvaluation = Field::Zero();
    for (size_t i = 0; i < polynomials.size(); ++i) {
        accumulatorEvaluation += polynomials[i].Evaluate(accumulatorPoint) * challenges[i];
    }
    accumulatorEvaluation *= epoch.EpochPolynomial().Evaluate(accumulatorPoint);

    std::vector<G1> bases;
    bases.reserve(commitments.size());
    for (const auto& c : commitments) {
        bases.push_back(c.point);
    }
    KZGCommitment accumulatorCommitment{KZG10::MultiScalarMul(bases, challenges)};

    bool valid = KZG10::Check(*verifyingKey_, accumulatorCommitment, accumulatorPoint, accumulatorEvaluation,
                              solution.Proof());
    LOG_DEBUG(util::LogCategory::PUZZLE) << "Coinbase solution with " << solution.Size()
                                         << " partial solutions is " << (valid ? "valid" : "invalid");
    return valid;
}

// ============================================================================
// Parallel Nonce Search
// ============================================================================

std::optional<ProverSolution> ProveNonceRange(const CoinbasePuzzle& puzzle, const EpochChallenge& epoch,
                                              const Address& address, uint64_t nonceStart, uint64_t count,
                                              uint64_t minimumProofTarget, util::ThreadPool& pool) {
    if (!puzzle.IsProver()) {
        throw PuzzleError("Cannot prove the coinbase puzzle with a verifier");
    }
    uint64_t available = std::numeric_limits<uint64_t>::max() - nonceStart;
    if (count > available) {
        count = available;
    }
    if (count == 0) {
        return std::nullopt;
    }

    // Chunks past one that already found a solution stop early
    auto found = std::make_shared<std::atomic<uint64_t>>(std::numeric_limits<uint64_t>::max());
    auto futures = util::MapChunks(nonceStart, count, pool,
                                   [puzzle, epoch, address, minimumProofTarget, found](uint64_t first, uint64_t last)
                                       -> std::optional<ProverSolution> {
        CoinbasePuzzle worker = puzzle.Clone();
        for (uint64_t nonce = first; nonce < last && found->load() > first; ++nonce) {
            std::optional<ProverSolution> solution = worker.TryProve(epoch, address, nonce, minimumProofTarget);
            if (solution) {
                uint64_t current = found->load();
                while (first < current && !found->compare_exchange_weak(current, first)) {
                }
                return solution;
            }
        }
        return std::nullopt;
    });

    // Chunks are in nonce order, so the first hit is the lowest nonce
    std::optional<ProverSolution> best;
    for (auto& f : futures) {
        std::optional<ProverSolution> hit = f.get();
        if (!best && hit) {
            best = std::move(hit);
        }
    }

    if (best) {
        LOG_INFO(util::LogCategory::PUZZLE) << "Found solution at nonce " << best->Nonce() << " with target "
                                            << best->ToTarget();
    } else {
        LOG_INFO(util::LogCategory::PUZZLE) << "No solution meets target " << minimumProofTarget << " in "
                                            << count << " nonces from " << nonceStart;
    }
    return best;
}

} // namespace puzzle
} // namespace veil
