// VEIL - Schnorr Signature Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/account/signature.h"
#include "veil/network/network.h"

namespace veil {

namespace {

Scalar ComputeChallenge(const Point& gR, const ComputeKey& computeKey, const Address& address,
                        const std::vector<Field>& message) {
    std::vector<Field> preimage;
    preimage.reserve(4 + message.size());
    preimage.push_back(gR.ToXField());
    preimage.push_back(computeKey.PkSig().ToXField());
    preimage.push_back(computeKey.PrSig().ToXField());
    preimage.push_back(address.ToField());
    preimage.insert(preimage.end(), message.begin(), message.end());
    return network::HashToScalarPSD8(preimage);
}

} // namespace

Signature Signature::Sign(const PrivateKey& privateKey, const std::vector<Field>& message, Rng& rng) {
    Scalar nonce = Scalar::Random(rng);
    Point gR = network::GScalarMultiply(nonce);

    ComputeKey computeKey = ComputeKey::FromPrivateKey(privateKey);
    Address address = computeKey.ToAddress();

    Scalar challenge = ComputeChallenge(gR, computeKey, address, message);
    Scalar response = nonce - challenge * privateKey.SkSig();
    return Signature(challenge, response, computeKey);
}

Point Signature::ToNoncePoint() const {
    return network::GScalarMultiply(response_) + computeKey_.PkSig() * challenge_;
}

bool Signature::Verify(const Address& address, const std::vector<Field>& message) const {
    if (computeKey_.ToAddress() != address) {
        return false;
    }
    return ComputeChallenge(ToNoncePoint(), computeKey_, address, message) == challenge_;
}

} // namespace veil
