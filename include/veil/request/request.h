// VEIL - Requests
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// A request is a signed call of one program function. It carries an ID
// per input, the inputs themselves and a Schnorr signature over
//
//   [tvk, tcm, function_id, per-input contributions...]
//
// where tvk = (tsk*caller).x is the transition view key and
// tcm = HashPSD2([tvk]) commits to it.

#ifndef VEIL_REQUEST_REQUEST_H
#define VEIL_REQUEST_REQUEST_H

#include <cstdint>
#include <optional>
#include <vector>
#include "veil/account/keys.h"
#include "veil/account/signature.h"
#include "veil/core/random.h"
#include "veil/core/serialize.h"
#include "veil/program/identifier.h"
#include "veil/program/value.h"
#include "veil/request/input_id.h"
#include "veil/request/verify.h"

namespace veil {

/**
 * A signed call of one program function: the caller, the input values and
 * their IDs, and the transition keys (tvk, tcm) bound into the signature.
 * The transition secret key stays with the signer and is never encoded.
 */
class Request {
public:
    Request() = default;
    Request(const Address& caller, uint16_t networkID, const ProgramID& programID,
            const Identifier& functionName, std::vector<InputID> inputIDs, std::vector<Value> inputs,
            const Signature& signature, const Field& skTag, const Field& tvk,
            const std::optional<Scalar>& tsk, const Field& tcm);

    /// Sign a call of `functionName` with the given inputs.
    /// Throws CardinalityError when inputs and types differ in length,
    /// ValueKindError when an input does not match its declared kind and
    /// CheckError when a record input is not spendable by the signer.
    static Request Sign(const PrivateKey& privateKey, const ProgramID& programID,
                        const Identifier& functionName, const std::vector<Value>& inputs,
                        const std::vector<ValueType>& inputTypes, Rng& rng);

    /// True if the signature, transition keys and input IDs all check out
    /// against `tpk`. Structural mismatches throw.
    bool Verify(const std::vector<ValueType>& inputTypes, const Point& tpk) const;

    /// Verify against the transition public key recovered from the signature
    bool Verify(const std::vector<ValueType>& inputTypes) const { return Verify(inputTypes, ToTPK()); }

    /// tpk = response*G + challenge*pk_sig
    Point ToTPK() const { return signature_.ToNoncePoint(); }

    Field FunctionID() const { return ComputeFunctionID(networkID_, programID_, functionName_); }

    const Address& Caller() const { return caller_; }
    uint16_t NetworkID() const { return networkID_; }
    const ProgramID& GetProgramID() const { return programID_; }
    const Identifier& FunctionName() const { return functionName_; }
    const std::vector<InputID>& InputIDs() const { return inputIDs_; }
    const std::vector<Value>& Inputs() const { return inputs_; }
    const Signature& GetSignature() const { return signature_; }
    const Field& SkTag() const { return skTag_; }
    const Field& TVK() const { return tvk_; }
    const std::optional<Scalar>& TSK() const { return tsk_; }
    const Field& TCM() const { return tcm_; }

    /// Public parts of the request on the native path
    RequestView<circuit::NativeEnv> ToView() const;

    bool operator==(const Request& other) const;
    bool operator!=(const Request& other) const { return !(*this == other); }

    /// The transition secret key is signer-local and never encoded
    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata16(s, 0);
        ::veil::Serialize(s, caller_);
        ser_writedata16(s, networkID_);
        ::veil::Serialize(s, programID_);
        ::veil::Serialize(s, functionName_);
        ser_writedata16(s, static_cast<uint16_t>(inputIDs_.size()));
        for (const auto& id : inputIDs_) {
            SerializeInputID(s, id);
        }
        SerializeU16Vector(s, inputs_);
        ::veil::Serialize(s, signature_);
        ::veil::Serialize(s, skTag_);
        ::veil::Serialize(s, tvk_);
        ::veil::Serialize(s, tcm_);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        if (ser_readdata16(s) != 0) {
            throw DecodeError("Invalid request version");
        }
        ::veil::Unserialize(s, caller_);
        networkID_ = ser_readdata16(s);
        ::veil::Unserialize(s, programID_);
        ::veil::Unserialize(s, functionName_);
        uint16_t count = ser_readdata16(s);
        inputIDs_.clear();
        for (uint16_t i = 0; i < count; ++i) {
            inputIDs_.push_back(UnserializeInputID(s));
        }
        UnserializeU16Vector(s, inputs_);
        ::veil::Unserialize(s, signature_);
        ::veil::Unserialize(s, skTag_);
        ::veil::Unserialize(s, tvk_);
        ::veil::Unserialize(s, tcm_);
        tsk_.reset();
    }

private:
    Address caller_;
    uint16_t networkID_{0};
    ProgramID programID_;
    Identifier functionName_;
    std::vector<InputID> inputIDs_;
    std::vector<Value> inputs_;
    Signature signature_;
    Field skTag_;
    Field tvk_;
    std::optional<Scalar> tsk_;
    Field tcm_;
};

namespace circuit {

/// Lift a native request into the circuit; the caller, keys and
/// transcript values become `mode` variables, input IDs become private
RequestView<CircuitEnv> InjectRequest(const Request& request, Mode mode);

/// Run the request checks on the constrained path
Boolean VerifyRequest(const Request& request, const std::vector<ValueType>& inputTypes, const Point& tpk);

} // namespace circuit

} // namespace veil

#endif // VEIL_REQUEST_REQUEST_H
