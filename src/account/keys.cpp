// VEIL - Account Keys Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/account/keys.h"
#include "veil/core/hex.h"
#include "veil/network/network.h"

namespace veil {

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey PrivateKey::New(Rng& rng) {
    Byte wide[64];
    rng.Fill(wide, sizeof(wide));
    return FromSeed(Field::FromBytes(wide, sizeof(wide)));
}

PrivateKey PrivateKey::FromSeed(const Field& seed) {
    PrivateKey key;
    key.seed_ = seed;
    key.skSig_ = network::HashToScalarPSD2({network::AccountSignatureSecretKeyDomain(), seed});
    key.rSig_ = network::HashToScalarPSD2({network::AccountSignatureRandomizerDomain(), seed});
    return key;
}

// ============================================================================
// ComputeKey
// ============================================================================

ComputeKey::ComputeKey(const Point& pkSig, const Point& prSig)
    : pkSig_(pkSig)
    , prSig_(prSig)
    , skPrf_(network::HashToScalarPSD4({pkSig.ToXField(), prSig.ToXField()})) {}

ComputeKey ComputeKey::FromPrivateKey(const PrivateKey& privateKey) {
    return ComputeKey(network::GScalarMultiply(privateKey.SkSig()),
                      network::GScalarMultiply(privateKey.RSig()));
}

Address ComputeKey::ToAddress() const {
    return Address(pkSig_ + prSig_ + network::GScalarMultiply(skPrf_));
}

// ============================================================================
// ViewKey
// ============================================================================

ViewKey ViewKey::FromPrivateKey(const PrivateKey& privateKey) {
    ComputeKey computeKey = ComputeKey::FromPrivateKey(privateKey);
    return ViewKey(privateKey.SkSig() + privateKey.RSig() + computeKey.SkPrf());
}

Address ViewKey::ToAddress() const {
    return Address(network::GScalarMultiply(scalar_));
}

// ============================================================================
// Address
// ============================================================================

Address Address::FromPrivateKey(const PrivateKey& privateKey) {
    return ComputeKey::FromPrivateKey(privateKey).ToAddress();
}

std::string Address::ToString() const {
    return BytesToHex(point_.ToCompressed());
}

std::optional<Address> Address::FromString(const std::string& str) {
    auto bytes = HexToBytes(str);
    if (!bytes) {
        return std::nullopt;
    }
    auto point = Point::FromCompressed(bytes->data(), bytes->size());
    if (!point) {
        return std::nullopt;
    }
    return Address(*point);
}

// ============================================================================
// GraphKey
// ============================================================================

GraphKey GraphKey::FromViewKey(const ViewKey& viewKey) {
    GraphKey key;
    key.skTag_ = network::HashPSD4({network::GraphKeyDomain(), viewKey.ToAddress().ToField()});
    return key;
}

} // namespace veil
