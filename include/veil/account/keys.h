// VEIL - Account Keys
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Key hierarchy derived from a single field seed:
//
//   PrivateKey  {seed, sk_sig, r_sig}
//   ComputeKey  {pk_sig = sk_sig*G, pr_sig = r_sig*G, sk_prf}
//   ViewKey     sk_sig + r_sig + sk_prf
//   Address     ViewKey*G
//   GraphKey    sk_tag

#ifndef VEIL_ACCOUNT_KEYS_H
#define VEIL_ACCOUNT_KEYS_H

#include <optional>
#include <string>
#include "veil/core/random.h"
#include "veil/core/serialize.h"
#include "veil/crypto/field.h"
#include "veil/crypto/group.h"

namespace veil {

class Address;
class ComputeKey;

// ============================================================================
// PrivateKey
// ============================================================================

class PrivateKey {
public:
    /// Sample a fresh seed from `rng`
    static PrivateKey New(Rng& rng);

    /// Deterministic derivation from a seed
    static PrivateKey FromSeed(const Field& seed);

    const Field& Seed() const { return seed_; }
    const Scalar& SkSig() const { return skSig_; }
    const Scalar& RSig() const { return rSig_; }

private:
    Field seed_;
    Scalar skSig_;
    Scalar rSig_;
};

// ============================================================================
// ComputeKey
// ============================================================================

class ComputeKey {
public:
    ComputeKey() = default;

    /// Rebuild from the two public points; sk_prf is rederived
    ComputeKey(const Point& pkSig, const Point& prSig);

    static ComputeKey FromPrivateKey(const PrivateKey& privateKey);

    const Point& PkSig() const { return pkSig_; }
    const Point& PrSig() const { return prSig_; }
    const Scalar& SkPrf() const { return skPrf_; }

    /// pk_sig + pr_sig + sk_prf*G
    Address ToAddress() const;

    bool operator==(const ComputeKey& other) const {
        return pkSig_ == other.pkSig_ && prSig_ == other.prSig_;
    }
    bool operator!=(const ComputeKey& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::veil::Serialize(s, pkSig_);
        ::veil::Serialize(s, prSig_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        Point pk, pr;
        ::veil::Unserialize(s, pk);
        ::veil::Unserialize(s, pr);
        *this = ComputeKey(pk, pr);
    }

private:
    Point pkSig_;
    Point prSig_;
    Scalar skPrf_;
};

// ============================================================================
// ViewKey
// ============================================================================

class ViewKey {
public:
    ViewKey() = default;
    explicit ViewKey(const Scalar& scalar) : scalar_(scalar) {}

    static ViewKey FromPrivateKey(const PrivateKey& privateKey);

    const Scalar& ToScalar() const { return scalar_; }

    Address ToAddress() const;

private:
    Scalar scalar_;
};

// ============================================================================
// Address
// ============================================================================

class Address {
public:
    Address() = default;
    explicit Address(const Point& point) : point_(point) {}

    static Address FromPrivateKey(const PrivateKey& privateKey);

    const Point& ToGroup() const { return point_; }

    /// x-coordinate, as it appears in signed transcripts
    Field ToField() const { return point_.ToXField(); }

    /// Hex of the compressed point
    std::string ToString() const;
    static std::optional<Address> FromString(const std::string& str);

    bool operator==(const Address& other) const { return point_ == other.point_; }
    bool operator!=(const Address& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const { ::veil::Serialize(s, point_); }

    template<typename Stream>
    void Unserialize(Stream& s) { ::veil::Unserialize(s, point_); }

private:
    Point point_;
};

// ============================================================================
// GraphKey
// ============================================================================

class GraphKey {
public:
    /// sk_tag = HashPSD4([graph_key_domain, (view_key*G).x])
    static GraphKey FromViewKey(const ViewKey& viewKey);

    const Field& SkTag() const { return skTag_; }

private:
    Field skTag_;
};

} // namespace veil

#endif // VEIL_ACCOUNT_KEYS_H
