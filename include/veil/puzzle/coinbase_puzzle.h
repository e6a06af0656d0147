// VEIL - Coinbase Puzzle
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// KZG-based proof of work. A prover hashes (epoch, address, nonce) into
// a polynomial, multiplies it by the epoch polynomial and commits to the
// product; the commitment's hash decides the solution's target. Many
// solutions fold into one CoinbaseSolution with a single opening proof.
//
// The product of two degree-n polynomials has 2n + 1 coefficients, so
// all domain arithmetic uses next_power_of_two(2n + 1).

#ifndef VEIL_PUZZLE_COINBASE_PUZZLE_H
#define VEIL_PUZZLE_COINBASE_PUZZLE_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "veil/account/keys.h"
#include "veil/core/serialize.h"
#include "veil/core/types.h"
#include "veil/crypto/field.h"
#include "veil/puzzle/kzg10.h"
#include "veil/puzzle/polynomial.h"
#include "veil/util/threadpool.h"

namespace veil {
namespace puzzle {

/// Upper bound on solutions in one coinbase solution
constexpr size_t MAX_PROVER_SOLUTIONS = size_t(1) << 20;

/// Sum of proof targets; a u64 sum over MAX_PROVER_SOLUTIONS could wrap
using CumulativeTarget = unsigned __int128;

struct PuzzleConfig {
    /// Degree of the prover and epoch polynomials
    uint32_t degree{0};
};

/// Domain for products of two degree-`degree` polynomials.
/// Throws PuzzleError for a zero or oversized degree.
EvaluationDomain ProductDomain(uint32_t degree);

// ============================================================================
// EpochChallenge
// ============================================================================

class EpochChallenge {
public:
    EpochChallenge() = default;

    /// Hash (epoch_number, block_hash) into the epoch polynomial
    static EpochChallenge New(uint32_t epochNumber, const Hash256& epochBlockHash, uint32_t degree);

    uint32_t EpochNumber() const { return epochNumber_; }
    const Hash256& EpochBlockHash() const { return epochBlockHash_; }
    uint32_t Degree() const { return degree_; }
    const DensePolynomial& EpochPolynomial() const { return epochPolynomial_; }

    /// Epoch polynomial over the product domain
    const std::vector<Field>& EpochPolynomialEvaluations() const { return epochPolynomialEvaluations_; }

    bool operator==(const EpochChallenge& other) const {
        return epochNumber_ == other.epochNumber_ && epochBlockHash_ == other.epochBlockHash_ &&
               degree_ == other.degree_;
    }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata32(s, epochNumber_);
        ::veil::Serialize(s, epochBlockHash_);
        ser_writedata32(s, degree_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint32_t epochNumber = ser_readdata32(s);
        Hash256 blockHash;
        ::veil::Unserialize(s, blockHash);
        uint32_t degree = ser_readdata32(s);
        *this = New(epochNumber, blockHash, degree);
    }

private:
    uint32_t epochNumber_{0};
    Hash256 epochBlockHash_;
    uint32_t degree_{0};
    DensePolynomial epochPolynomial_;
    std::vector<Field> epochPolynomialEvaluations_;
};

// ============================================================================
// Solutions
// ============================================================================

class PartialSolution {
public:
    PartialSolution() = default;
    PartialSolution(const Address& address, uint64_t nonce, const KZGCommitment& commitment)
        : address_(address), nonce_(nonce), commitment_(commitment) {}

    const Address& GetAddress() const { return address_; }
    uint64_t Nonce() const { return nonce_; }
    const KZGCommitment& Commitment() const { return commitment_; }

    /// u64::MAX / u64_le(sha256d(commitment)[0..8]); a zero divisor counts as 1
    uint64_t ToTarget() const;

    /// Recompute this prover's polynomial for `epoch`
    DensePolynomial ToProverPolynomial(const EpochChallenge& epoch) const;

    bool operator==(const PartialSolution& other) const {
        return address_ == other.address_ && nonce_ == other.nonce_ && commitment_ == other.commitment_;
    }
    bool operator!=(const PartialSolution& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::veil::Serialize(s, address_);
        ser_writedata64(s, nonce_);
        ::veil::Serialize(s, commitment_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::veil::Unserialize(s, address_);
        nonce_ = ser_readdata64(s);
        ::veil::Unserialize(s, commitment_);
    }

private:
    Address address_;
    uint64_t nonce_{0};
    KZGCommitment commitment_;
};

class ProverSolution {
public:
    ProverSolution() = default;
    ProverSolution(const PartialSolution& partial, const KZGProof& proof)
        : partial_(partial), proof_(proof) {}

    const PartialSolution& Partial() const { return partial_; }
    const KZGProof& Proof() const { return proof_; }
    const Address& GetAddress() const { return partial_.GetAddress(); }
    uint64_t Nonce() const { return partial_.Nonce(); }
    const KZGCommitment& Commitment() const { return partial_.Commitment(); }

    uint64_t ToTarget() const { return partial_.ToTarget(); }

    /// Check the opening against `vk` and the minimum target. Returns
    /// false for a hiding proof or a target shortfall.
    bool Verify(const VerifyingKey& vk, const EpochChallenge& epoch, uint64_t minimumProofTarget) const;

    bool operator==(const ProverSolution& other) const {
        return partial_ == other.partial_ && proof_ == other.proof_;
    }
    bool operator!=(const ProverSolution& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::veil::Serialize(s, partial_);
        ::veil::Serialize(s, proof_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::veil::Unserialize(s, partial_);
        ::veil::Unserialize(s, proof_);
    }

private:
    PartialSolution partial_;
    KZGProof proof_;
};

class CoinbaseSolution {
public:
    CoinbaseSolution() = default;
    CoinbaseSolution(std::vector<PartialSolution> partials, const KZGProof& proof)
        : partials_(std::move(partials)), proof_(proof) {}

    const std::vector<PartialSolution>& PartialSolutions() const { return partials_; }
    const KZGProof& Proof() const { return proof_; }

    size_t Size() const { return partials_.size(); }
    bool IsEmpty() const { return partials_.empty(); }

    std::vector<KZGCommitment> PuzzleCommitments() const;

    /// Saturating sum of the partial solutions' targets
    CumulativeTarget ToCumulativeTarget() const;

    bool operator==(const CoinbaseSolution& other) const {
        return partials_ == other.partials_ && proof_ == other.proof_;
    }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata32(s, static_cast<uint32_t>(partials_.size()));
        for (const auto& p : partials_) {
            ::veil::Serialize(s, p);
        }
        ::veil::Serialize(s, proof_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint32_t count = ser_readdata32(s);
        if (count > MAX_PROVER_SOLUTIONS) {
            throw DecodeError("Coinbase solution holds " + std::to_string(count) +
                              " partial solutions, above the limit");
        }
        partials_.clear();
        partials_.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            PartialSolution p;
            ::veil::Unserialize(s, p);
            partials_.push_back(std::move(p));
        }
        ::veil::Unserialize(s, proof_);
    }

private:
    std::vector<PartialSolution> partials_;
    KZGProof proof_;
};

// ============================================================================
// Keys
// ============================================================================

struct CoinbaseProvingKey {
    EvaluationDomain productDomain;
    std::vector<G1> powersOfBetaG;
    VerifyingKey verifyingKey;
};

using CoinbaseVerifyingKey = VerifyingKey;

// ============================================================================
// CoinbasePuzzle
// ============================================================================

/**
 * A prover (holding the proving key) or a verifier (holding only the
 * verifying key). The mode is fixed at construction. Copies share
 * the immutable keys; Clone() gives a copy with keys of its own.
 */
class CoinbasePuzzle {
public:
    /// Deterministic development parameters able to commit to products of
    /// degree-`config.degree` polynomials
    static UniversalParams Setup(const PuzzleConfig& config, const std::string& seed);

    /// Throws PuzzleError when the parameters do not cover the degree
    static CoinbasePuzzle Trim(const UniversalParams& srs, const PuzzleConfig& config, bool verifierOnly = false);

    static CoinbasePuzzle FromVerifyingKey(const CoinbaseVerifyingKey& vk);

    bool IsProver() const { return provingKey_ != nullptr; }

    /// Deep copy: the clone owns its own proving and verifying keys
    CoinbasePuzzle Clone() const;

    /// Throws PuzzleError in verifier mode
    const CoinbaseProvingKey& ProvingKey() const;

    const CoinbaseVerifyingKey& GetVerifyingKey() const { return *verifyingKey_; }

    /// Solve for one nonce. Throws PuzzleError in verifier mode, and when
    /// the solution falls below `minimumProofTarget`.
    ProverSolution Prove(const EpochChallenge& epoch, const Address& address, uint64_t nonce,
                         std::optional<uint64_t> minimumProofTarget = std::nullopt) const;

    /// Like Prove, but a solution below `minimumProofTarget` yields nullopt
    std::optional<ProverSolution> TryProve(const EpochChallenge& epoch, const Address& address, uint64_t nonce,
                                           uint64_t minimumProofTarget) const;

    /// Fold already-validated solutions into one opening. Throws
    /// PuzzleError for empty, oversized or duplicated input.
    CoinbaseSolution AccumulateUnchecked(const EpochChallenge& epoch,
                                         const std::vector<ProverSolution>& solutions) const;

    /// Returns the KZG check of the accumulated opening. Throws
    /// PuzzleError when the solution is empty, oversized, hiding, below
    /// the coinbase target, duplicated, or has a partial solution below
    /// `proofTarget`.
    bool Verify(const CoinbaseSolution& solution, const EpochChallenge& epoch,
                uint64_t coinbaseTarget, uint64_t proofTarget) const;

    /// Hash (epoch_number, epoch_block_hash, address, nonce) into a
    /// polynomial of the epoch's degree
    static DensePolynomial ProverPolynomial(const EpochChallenge& epoch, const Address& address, uint64_t nonce);

private:
    std::shared_ptr<const CoinbaseProvingKey> provingKey_;
    std::shared_ptr<const CoinbaseVerifyingKey> verifyingKey_;

    void CheckEpoch(const EpochChallenge& epoch) const;
};

/// Search nonces [nonceStart, nonceStart + count) on `pool` and return the
/// lowest nonce whose solution meets `minimumProofTarget`. Each task works
/// on its own copies of the epoch, address and proving key.
std::optional<ProverSolution> ProveNonceRange(const CoinbasePuzzle& puzzle, const EpochChallenge& epoch,
                                              const Address& address, uint64_t nonceStart, uint64_t count,
                                              uint64_t minimumProofTarget, util::ThreadPool& pool);

} // namespace puzzle
} // namespace veil

#endif // VEIL_PUZZLE_COINBASE_PUZZLE_H
