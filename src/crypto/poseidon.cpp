// VEIL - Poseidon Hash Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/crypto/poseidon.h"
#include "veil/crypto/sha256.h"
#include "veil/core/errors.h"
#include <cstring>
#include <mutex>
#include <string>

namespace veil {

namespace {

/// Round constants from a SHA-256 chain seeded with the width and round count
std::vector<std::vector<FieldElement>> GenerateRoundConstants(size_t width, size_t totalRounds) {
    static const char* domain = "VEIL_POSEIDON_RC";

    Byte params[16];
    for (int i = 0; i < 8; ++i) {
        params[i] = static_cast<Byte>(static_cast<uint64_t>(width) >> (8 * i));
        params[8 + i] = static_cast<Byte>(static_cast<uint64_t>(totalRounds) >> (8 * i));
    }

    Hash256 seed;
    SHA256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>(domain), std::strlen(domain))
          .Write(params, sizeof(params))
          .Finalize(seed.data());

    std::vector<std::vector<FieldElement>> constants(totalRounds);
    uint64_t count = 0;
    for (size_t r = 0; r < totalRounds; ++r) {
        constants[r].reserve(width);
        for (size_t i = 0; i < width; ++i, ++count) {
            Byte ctr[8];
            for (int k = 0; k < 8; ++k) ctr[k] = static_cast<Byte>(count >> (8 * k));

            Hash256 next;
            hasher.Reset().Write(seed.data(), seed.size()).Write(ctr, sizeof(ctr)).Finalize(next.data());
            constants[r].push_back(FieldElement::FromBytes(next.data(), next.size()));
            seed = next;
        }
    }
    return constants;
}

/// Cauchy matrix M[i][j] = 1 / (i + width + j)
std::vector<std::vector<FieldElement>> GenerateMDSMatrix(size_t width) {
    std::vector<std::vector<FieldElement>> mds(width, std::vector<FieldElement>(width));
    for (size_t i = 0; i < width; ++i) {
        for (size_t j = 0; j < width; ++j) {
            mds[i][j] = FieldElement(static_cast<uint64_t>(i + width + j)).Inverse();
        }
    }
    return mds;
}

PoseidonParameters MakeParameters(size_t rate, size_t partialRounds) {
    PoseidonParameters p;
    p.rate = rate;
    p.fullRounds = 8;
    p.partialRounds = partialRounds;
    p.roundConstants = GenerateRoundConstants(p.width(), p.totalRounds());
    p.mds = GenerateMDSMatrix(p.width());
    return p;
}

} // namespace

const PoseidonParameters& PoseidonParameters::ForRate(size_t rate) {
    static const PoseidonParameters rate2 = MakeParameters(2, 57);
    static const PoseidonParameters rate4 = MakeParameters(4, 60);
    static const PoseidonParameters rate8 = MakeParameters(8, 63);
    switch (rate) {
        case 2: return rate2;
        case 4: return rate4;
        case 8: return rate8;
        default: throw Error("Unsupported Poseidon rate: " + std::to_string(rate));
    }
}

// ============================================================================
// PoseidonSponge
// ============================================================================

PoseidonSponge::PoseidonSponge(const PoseidonParameters& params, const FieldElement& domain)
    : params_(params)
    , state_(params.width(), FieldElement::Zero()) {
    state_[params_.rate] = domain;
}

void PoseidonSponge::AddRoundConstants(size_t roundIdx) {
    for (size_t i = 0; i < state_.size(); ++i) {
        state_[i] += params_.roundConstants[roundIdx][i];
    }
}

void PoseidonSponge::MixColumns() {
    std::vector<FieldElement> next(state_.size(), FieldElement::Zero());
    for (size_t i = 0; i < state_.size(); ++i) {
        for (size_t j = 0; j < state_.size(); ++j) {
            next[i] += params_.mds[i][j] * state_[j];
        }
    }
    state_ = std::move(next);
}

void PoseidonSponge::Permute() {
    size_t half = params_.fullRounds / 2;
    for (size_t i = 0; i < params_.totalRounds(); ++i) {
        AddRoundConstants(i);
        bool full = i < half || i >= half + params_.partialRounds;
        if (full) {
            for (auto& s : state_) s = s.PoseidonSbox();
        } else {
            state_[0] = state_[0].PoseidonSbox();
        }
        MixColumns();
    }
}

PoseidonSponge& PoseidonSponge::Absorb(const FieldElement& element) {
    if (squeezing_) {
        // Switching back to absorbing starts a fresh block
        Permute();
        squeezing_ = false;
        pos_ = 0;
    }
    if (pos_ == params_.rate) {
        Permute();
        pos_ = 0;
    }
    state_[pos_++] += element;
    return *this;
}

PoseidonSponge& PoseidonSponge::Absorb(const std::vector<FieldElement>& elements) {
    for (const auto& e : elements) {
        Absorb(e);
    }
    return *this;
}

FieldElement PoseidonSponge::Squeeze() {
    if (!squeezing_ || pos_ == params_.rate) {
        Permute();
        squeezing_ = true;
        pos_ = 0;
    }
    return state_[pos_++];
}

std::vector<FieldElement> PoseidonSponge::Squeeze(size_t count) {
    std::vector<FieldElement> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        out.push_back(Squeeze());
    }
    return out;
}

// ============================================================================
// Poseidon
// ============================================================================

Poseidon::Poseidon(size_t rate)
    : params_(PoseidonParameters::ForRate(rate))
    , domain_(FieldElement::FromDomain("Poseidon" + std::to_string(rate))) {}

std::vector<FieldElement> Poseidon::HashMany(const std::vector<FieldElement>& input,
                                             size_t numOutputs) const {
    // Preimage: [domain, len, 0...] filling one rate block, then the input
    std::vector<FieldElement> preimage;
    preimage.reserve(params_.rate + input.size());
    preimage.push_back(domain_);
    preimage.push_back(FieldElement(static_cast<uint64_t>(input.size())));
    preimage.resize(params_.rate, FieldElement::Zero());
    preimage.insert(preimage.end(), input.begin(), input.end());

    PoseidonSponge sponge(params_, domain_);
    sponge.Absorb(preimage);
    return sponge.Squeeze(numOutputs);
}

FieldElement Poseidon::Hash(const std::vector<FieldElement>& input) const {
    return HashMany(input, 1)[0];
}

Scalar Poseidon::HashToScalar(const std::vector<FieldElement>& input) const {
    return Scalar::FromField(Hash(input));
}

Point Poseidon::HashToGroup(const std::vector<FieldElement>& input) const {
    auto h = HashMany(input, 2);
    return Point::MapToGroup(h[0]) + Point::MapToGroup(h[1]);
}

} // namespace veil
