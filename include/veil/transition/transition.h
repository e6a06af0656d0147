// VEIL - Transitions
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// A transition is the public, immutable record of one function call:
// its inputs and outputs in transition form, optional finalize inputs,
// the proof, the transition public key and commitment, and the fee. Its
// ID is the root of the function tree over the inputs and outputs.

#ifndef VEIL_TRANSITION_TRANSITION_H
#define VEIL_TRANSITION_TRANSITION_H

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "veil/core/serialize.h"
#include "veil/crypto/field.h"
#include "veil/crypto/group.h"
#include "veil/program/identifier.h"
#include "veil/program/value.h"
#include "veil/request/request.h"
#include "veil/request/response.h"
#include "veil/transition/input.h"
#include "veil/transition/merkle.h"
#include "veil/transition/output.h"

namespace veil {

// ============================================================================
// Proof
// ============================================================================

/**
 * Proof bytes produced by the external proving system
 */
class Proof {
public:
    Proof() = default;
    explicit Proof(std::vector<Byte> bytes) : bytes_(std::move(bytes)) {}

    const std::vector<Byte>& Bytes() const { return bytes_; }

    bool operator==(const Proof& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Proof& other) const { return bytes_ != other.bytes_; }

    template<typename Stream>
    void Serialize(Stream& s) const { SerializeBytes32(s, bytes_); }

    template<typename Stream>
    void Unserialize(Stream& s) { UnserializeBytes32(s, bytes_); }

private:
    std::vector<Byte> bytes_;
};

// ============================================================================
// Transition
// ============================================================================

/**
 * The inputs, outputs and finalize values of one function call, with the
 * proof and transition keys. Immutable once built; the ID commits to every
 * input and output.
 */
class Transition {
public:
    using Finalize = std::optional<std::vector<Value>>;

    Transition() = default;

    /// Assemble a transition and compute its ID.
    /// Throws Error when the function tree would overflow.
    static Transition New(const ProgramID& programID, const Identifier& functionName,
                          std::vector<Input> inputs, std::vector<Output> outputs,
                          Finalize finalize, Proof proof, const Point& tpk, const Field& tcm, int64_t fee);

    /// Build a transition from a request and its response, re-checking
    /// every input and output ID against the request's transcript.
    /// Throws CheckError on any mismatch.
    static Transition From(const Request& request, const Response& response, Finalize finalize,
                           const std::vector<ValueType>& outputTypes,
                           const std::vector<uint64_t>& outputRegisters,
                           Proof proof, int64_t fee);

    /// Function tree leaves: inputs first, then outputs
    static std::vector<TransitionLeaf> FunctionTreeLeaves(const std::vector<Input>& inputs,
                                                          const std::vector<Output>& outputs);

    const Field& ID() const { return id_; }
    const ProgramID& GetProgramID() const { return programID_; }
    const Identifier& FunctionName() const { return functionName_; }
    const std::vector<Input>& Inputs() const { return inputs_; }
    const std::vector<Output>& Outputs() const { return outputs_; }
    const Finalize& GetFinalize() const { return finalize_; }
    const Proof& GetProof() const { return proof_; }
    const Point& TPK() const { return tpk_; }
    const Field& TCM() const { return tcm_; }
    int64_t Fee() const { return fee_; }

    /// Leaf of the input or output `id`, if present
    std::optional<TransitionLeaf> ToLeaf(const Field& id, bool isInput) const;

    /// Inclusion path of `leaf` in this transition's function tree
    std::vector<Field> ToPath(const TransitionLeaf& leaf) const;

    bool ContainsSerialNumber(const Field& serialNumber) const;
    bool ContainsCommitment(const Field& commitment) const;

    /// Encrypted record with the given commitment, or nullptr
    const RecordCiphertext* FindRecord(const Field& commitment) const;

    std::vector<Field> InputIDs() const;
    std::vector<Field> SerialNumbers() const;
    std::vector<Field> Tags() const;
    std::vector<Field> OutputIDs() const;
    std::vector<Field> Commitments() const;
    std::vector<Point> Nonces() const;
    std::vector<std::pair<Field, RecordCiphertext>> Records() const;

    bool operator==(const Transition& other) const;
    bool operator!=(const Transition& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ser_writedata16(s, 0);
        ::veil::Serialize(s, id_);
        ::veil::Serialize(s, programID_);
        ::veil::Serialize(s, functionName_);
        SerializeU16Vector(s, inputs_);
        SerializeU16Vector(s, outputs_);
        if (finalize_) {
            ser_writedata8(s, 1);
            SerializeU16Vector(s, *finalize_);
        } else {
            ser_writedata8(s, 0);
        }
        ::veil::Serialize(s, proof_);
        ::veil::Serialize(s, tpk_);
        ::veil::Serialize(s, tcm_);
        ::veil::Serialize(s, fee_);
    }

    /// Rebuilds the transition and rejects the buffer if the recomputed
    /// ID differs from the encoded one
    template<typename Stream>
    void Unserialize(Stream& s) {
        if (ser_readdata16(s) != 0) {
            throw DecodeError("Invalid transition version");
        }
        Field id;
        ProgramID programID;
        Identifier functionName;
        std::vector<Input> inputs;
        std::vector<Output> outputs;
        ::veil::Unserialize(s, id);
        ::veil::Unserialize(s, programID);
        ::veil::Unserialize(s, functionName);
        UnserializeU16Vector(s, inputs);
        UnserializeU16Vector(s, outputs);

        Finalize finalize;
        uint8_t finalizeVariant = ser_readdata8(s);
        if (finalizeVariant == 1) {
            std::vector<Value> values;
            UnserializeU16Vector(s, values);
            finalize = std::move(values);
        } else if (finalizeVariant != 0) {
            throw DecodeError("Invalid transition finalize variant (" + std::to_string(finalizeVariant) + ")");
        }

        Proof proof;
        Point tpk;
        Field tcm;
        int64_t fee = 0;
        ::veil::Unserialize(s, proof);
        ::veil::Unserialize(s, tpk);
        ::veil::Unserialize(s, tcm);
        ::veil::Unserialize(s, fee);

        Transition transition;
        try {
            transition = New(programID, functionName, std::move(inputs), std::move(outputs),
                             std::move(finalize), std::move(proof), tpk, tcm, fee);
        } catch (const Error& e) {
            throw DecodeError(e.what());
        }
        if (transition.id_ != id) {
            throw DecodeError("Transition ID is incorrect, possible data corruption");
        }
        *this = std::move(transition);
    }

private:
    Field id_;
    ProgramID programID_;
    Identifier functionName_;
    std::vector<Input> inputs_;
    std::vector<Output> outputs_;
    Finalize finalize_;
    Proof proof_;
    Point tpk_;
    Field tcm_;
    int64_t fee_{0};
};

} // namespace veil

#endif // VEIL_TRANSITION_TRANSITION_H
