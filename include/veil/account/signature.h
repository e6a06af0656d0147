// VEIL - Schnorr Signature
// Copyright (c) 2024 VEIL Developers
// MIT License

#ifndef VEIL_ACCOUNT_SIGNATURE_H
#define VEIL_ACCOUNT_SIGNATURE_H

#include <vector>
#include "veil/account/keys.h"
#include "veil/core/random.h"
#include "veil/core/serialize.h"

namespace veil {

/**
 * Schnorr signature carrying the signer's compute key.
 *
 * challenge = HashToScalarPSD8([g_r.x, pk_sig.x, pr_sig.x, address.x, message...])
 * response  = r - challenge * sk_sig
 */
class Signature {
public:
    Signature() = default;
    Signature(const Scalar& challenge, const Scalar& response, const ComputeKey& computeKey)
        : challenge_(challenge), response_(response), computeKey_(computeKey) {}

    /// Sign an arbitrary field message
    static Signature Sign(const PrivateKey& privateKey, const std::vector<Field>& message, Rng& rng);

    /// Check the signature over `message` for `address`
    bool Verify(const Address& address, const std::vector<Field>& message) const;

    const Scalar& Challenge() const { return challenge_; }
    const Scalar& Response() const { return response_; }
    const ComputeKey& GetComputeKey() const { return computeKey_; }

    /// g_r recovered as response*G + challenge*pk_sig
    Point ToNoncePoint() const;

    bool operator==(const Signature& other) const {
        return challenge_ == other.challenge_ && response_ == other.response_ &&
               computeKey_ == other.computeKey_;
    }
    bool operator!=(const Signature& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::veil::Serialize(s, challenge_);
        ::veil::Serialize(s, response_);
        ::veil::Serialize(s, computeKey_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::veil::Unserialize(s, challenge_);
        ::veil::Unserialize(s, response_);
        ::veil::Unserialize(s, computeKey_);
    }

private:
    Scalar challenge_;
    Scalar response_;
    ComputeKey computeKey_;
};

} // namespace veil

#endif // VEIL_ACCOUNT_SIGNATURE_H
