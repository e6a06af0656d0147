// VEIL - Transitions
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/transition/transition.h"
#include "veil/core/errors.h"
#include "veil/network/network.h"
#include "veil/util/logging.h"

namespace veil {

namespace {

using E = circuit::NativeEnv;

Input ToTransitionInput(const InputID& inputID, const Value& input, const Field& functionID,
                        const Request& request, size_t index) {
    const Plaintext* plaintext = input.AsPlaintext();
    const Record* record = input.AsRecord();

    switch (KindOf(inputID)) {
        case ValueType::Kind::Constant:
            if (plaintext) {
                Input candidate(input::Constant{std::get<input_id::Constant<E>>(inputID).hash, *plaintext});
                if (!candidate.Verify(functionID, request.TCM(), index)) {
                    throw CheckError("Malformed constant transition input at index " + std::to_string(index));
                }
                return candidate;
            }
            break;
        case ValueType::Kind::Public:
            if (plaintext) {
                Input candidate(input::Public{std::get<input_id::Public<E>>(inputID).hash, *plaintext});
                if (!candidate.Verify(functionID, request.TCM(), index)) {
                    throw CheckError("Malformed public transition input at index " + std::to_string(index));
                }
                return candidate;
            }
            break;
        case ValueType::Kind::Private:
            if (plaintext) {
                const Field& hash = std::get<input_id::Private<E>>(inputID).hash;
                Field inputViewKey = network::HashPSD4({functionID, request.TVK(), Field(static_cast<uint64_t>(index))});
                Ciphertext ciphertext = plaintext->EncryptSymmetric(inputViewKey);
                if (hash != network::HashPSD8(ciphertext.ToFields())) {
                    throw CheckError("The input ciphertext hash is incorrect");
                }
                return Input(input::Private{hash, std::move(ciphertext)});
            }
            break;
        case ValueType::Kind::Record:
            if (record) {
                const auto& id = std::get<input_id::Record<E>>(inputID);
                return Input(input::Record{id.serialNumber, id.tag});
            }
            break;
        case ValueType::Kind::ExternalRecord:
            if (record) {
                return Input(input::ExternalRecord{std::get<input_id::ExternalRecord<E>>(inputID).hash});
            }
            break;
    }
    throw CheckError("Malformed request input at index " + std::to_string(index));
}

Output ToTransitionOutput(const OutputID& outputID, const Value& output, const ValueType& outputType,
                          uint64_t outputRegister, const Field& functionID, const Request& request,
                          size_t numInputs, size_t i) {
    const Plaintext* plaintext = output.AsPlaintext();
    const Record* record = output.AsRecord();
    const size_t index = numInputs + i;

    switch (static_cast<ValueType::Kind>(outputID.index())) {
        case ValueType::Kind::Constant:
            if (plaintext) {
                Output candidate(output::Constant{std::get<output_id::Constant>(outputID).hash, *plaintext});
                if (!candidate.Verify(functionID, request.TCM(), index)) {
                    throw CheckError("Malformed constant transition output at index " + std::to_string(index));
                }
                return candidate;
            }
            break;
        case ValueType::Kind::Public:
            if (plaintext) {
                Output candidate(output::Public{std::get<output_id::Public>(outputID).hash, *plaintext});
                if (!candidate.Verify(functionID, request.TCM(), index)) {
                    throw CheckError("Malformed public transition output at index " + std::to_string(index));
                }
                return candidate;
            }
            break;
        case ValueType::Kind::Private:
            if (plaintext) {
                const Field& hash = std::get<output_id::Private>(outputID).hash;
                Field outputViewKey = network::HashPSD4({functionID, request.TVK(), Field(static_cast<uint64_t>(index))});
                Ciphertext ciphertext = plaintext->EncryptSymmetric(outputViewKey);
                if (hash != network::HashPSD8(ciphertext.ToFields())) {
                    throw CheckError("The output ciphertext hash is incorrect");
                }
                return Output(output::Private{hash, std::move(ciphertext)});
            }
            break;
        case ValueType::Kind::Record:
            if (record) {
                const auto& id = std::get<output_id::Record>(outputID);
                if (outputType.GetKind() != ValueType::Kind::Record) {
                    throw CheckError("Expected a record type at output " + std::to_string(i));
                }
                if (id.commitment != record->ToCommitment(request.GetProgramID(), outputType.RecordName())) {
                    throw CheckError("The output record commitment is incorrect");
                }
                // The randomizer follows the output register, not the output index
                Scalar randomizer = Response::OutputRandomizer(request.TVK(), outputRegister);
                RecordCiphertext ciphertext = record->Encrypt(randomizer);
                if (id.checksum != network::HashBHP1024(ciphertext.ToBitsLE())) {
                    throw CheckError("The output record ciphertext checksum is incorrect");
                }
                return Output(output::Record{id.commitment, id.checksum, std::move(ciphertext)});
            }
            break;
        case ValueType::Kind::ExternalRecord:
            if (record) {
                const Field& hash = std::get<output_id::ExternalRecord>(outputID).hash;
                std::vector<Field> preimage{functionID};
                auto fields = record->ToFields();
                preimage.insert(preimage.end(), fields.begin(), fields.end());
                preimage.push_back(request.TVK());
                preimage.push_back(Field(static_cast<uint64_t>(index)));
                if (hash != network::HashPSD8(preimage)) {
                    throw CheckError("The output external hash is incorrect");
                }
                return Output(output::ExternalRecord{hash});
            }
            break;
    }
    throw CheckError("Malformed response output at index " + std::to_string(index));
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

std::vector<TransitionLeaf> Transition::FunctionTreeLeaves(const std::vector<Input>& inputs,
                                                           const std::vector<Output>& outputs) {
    std::vector<TransitionLeaf> leaves;
    leaves.reserve(inputs.size() + outputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        leaves.push_back(TransitionLeaf{static_cast<uint16_t>(i), inputs[i].VariantIndex(), inputs[i].ID()});
    }
    for (size_t i = 0; i < outputs.size(); ++i) {
        leaves.push_back(TransitionLeaf{static_cast<uint16_t>(inputs.size() + i),
                                        static_cast<uint8_t>(OUTPUT_VARIANT_OFFSET + outputs[i].VariantIndex()),
                                        outputs[i].ID()});
    }
    return leaves;
}

Transition Transition::New(const ProgramID& programID, const Identifier& functionName,
                           std::vector<Input> inputs, std::vector<Output> outputs,
                           Finalize finalize, Proof proof, const Point& tpk, const Field& tcm, int64_t fee) {
    Transition transition;
    transition.id_ = ComputeFunctionTreeRoot(FunctionTreeLeaves(inputs, outputs));
    transition.programID_ = programID;
    transition.functionName_ = functionName;
    transition.inputs_ = std::move(inputs);
    transition.outputs_ = std::move(outputs);
    transition.finalize_ = std::move(finalize);
    transition.proof_ = std::move(proof);
    transition.tpk_ = tpk;
    transition.tcm_ = tcm;
    transition.fee_ = fee;
    return transition;
}

Transition Transition::From(const Request& request, const Response& response, Finalize finalize,
                            const std::vector<ValueType>& outputTypes,
                            const std::vector<uint64_t>& outputRegisters,
                            Proof proof, int64_t fee) {
    const auto& inputIDs = request.InputIDs();
    const auto& requestInputs = request.Inputs();
    const auto& outputIDs = response.OutputIDs();
    const auto& responseOutputs = response.Outputs();

    if (inputIDs.size() != requestInputs.size()) {
        throw CardinalityError(CardinalityMessage(request.GetProgramID(), request.FunctionName(),
                                                  inputIDs.size(), requestInputs.size()));
    }
    if (outputIDs.size() != responseOutputs.size() || outputTypes.size() != responseOutputs.size() ||
        outputRegisters.size() != responseOutputs.size()) {
        throw CardinalityError("Function '" + request.FunctionName().ToString() + "' in the program '" +
                               request.GetProgramID().ToString() + "' expects " +
                               std::to_string(outputTypes.size()) + " outputs, but " +
                               std::to_string(responseOutputs.size()) + " were produced.");
    }

    const Field functionID = request.FunctionID();
    const size_t numInputs = requestInputs.size();

    std::vector<Input> inputs;
    inputs.reserve(numInputs);
    for (size_t i = 0; i < numInputs; ++i) {
        inputs.push_back(ToTransitionInput(inputIDs[i], requestInputs[i], functionID, request, i));
    }

    std::vector<Output> outputs;
    outputs.reserve(responseOutputs.size());
    for (size_t i = 0; i < responseOutputs.size(); ++i) {
        outputs.push_back(ToTransitionOutput(outputIDs[i], responseOutputs[i], outputTypes[i], outputRegisters[i],
                                             functionID, request, numInputs, i));
    }

    Transition transition = New(request.GetProgramID(), request.FunctionName(), std::move(inputs),
                                std::move(outputs), std::move(finalize), std::move(proof),
                                request.ToTPK(), request.TCM(), fee);

    LOG_DEBUG(util::LogCategory::TRANSITION) << "Assembled transition " << transition.id_.ToHex() << " for "
                                             << request.GetProgramID().ToString() << "/"
                                             << request.FunctionName().ToString() << " ("
                                             << transition.inputs_.size() << " inputs, "
                                             << transition.outputs_.size() << " outputs)";
    return transition;
}

// ============================================================================
// Function Tree
// ============================================================================

std::optional<TransitionLeaf> Transition::ToLeaf(const Field& id, bool isInput) const {
    if (isInput) {
        for (size_t i = 0; i < inputs_.size(); ++i) {
            if (inputs_[i].ID() == id) {
                return TransitionLeaf{static_cast<uint16_t>(i), inputs_[i].VariantIndex(), id};
            }
        }
        return std::nullopt;
    }
    for (size_t i = 0; i < outputs_.size(); ++i) {
        if (outputs_[i].ID() == id) {
            return TransitionLeaf{static_cast<uint16_t>(inputs_.size() + i),
                                  static_cast<uint8_t>(OUTPUT_VARIANT_OFFSET + outputs_[i].VariantIndex()), id};
        }
    }
    return std::nullopt;
}

std::vector<Field> Transition::ToPath(const TransitionLeaf& leaf) const {
    return ComputeFunctionTreePath(FunctionTreeLeaves(inputs_, outputs_), leaf.index);
}

// ============================================================================
// Accessors
// ============================================================================

bool Transition::ContainsSerialNumber(const Field& serialNumber) const {
    for (const auto& input : inputs_) {
        const Field* sn = input.SerialNumber();
        if (sn && *sn == serialNumber) {
            return true;
        }
    }
    return false;
}

bool Transition::ContainsCommitment(const Field& commitment) const {
    for (const auto& output : outputs_) {
        const Field* cm = output.Commitment();
        if (cm && *cm == commitment) {
            return true;
        }
    }
    return false;
}

const RecordCiphertext* Transition::FindRecord(const Field& commitment) const {
    for (const auto& output : outputs_) {
        const Field* cm = output.Commitment();
        if (cm && *cm == commitment) {
            return output.GetRecord();
        }
    }
    return nullptr;
}

std::vector<Field> Transition::InputIDs() const {
    std::vector<Field> ids;
    ids.reserve(inputs_.size());
    for (const auto& input : inputs_) {
        ids.push_back(input.ID());
    }
    return ids;
}

std::vector<Field> Transition::SerialNumbers() const {
    std::vector<Field> out;
    for (const auto& input : inputs_) {
        if (const Field* sn = input.SerialNumber()) {
            out.push_back(*sn);
        }
    }
    return out;
}

std::vector<Field> Transition::Tags() const {
    std::vector<Field> out;
    for (const auto& input : inputs_) {
        if (const Field* tag = input.Tag()) {
            out.push_back(*tag);
        }
    }
    return out;
}

std::vector<Field> Transition::OutputIDs() const {
    std::vector<Field> ids;
    ids.reserve(outputs_.size());
    for (const auto& output : outputs_) {
        ids.push_back(output.ID());
    }
    return ids;
}

std::vector<Field> Transition::Commitments() const {
    std::vector<Field> out;
    for (const auto& output : outputs_) {
        if (const Field* cm = output.Commitment()) {
            out.push_back(*cm);
        }
    }
    return out;
}

std::vector<Point> Transition::Nonces() const {
    std::vector<Point> out;
    for (const auto& output : outputs_) {
        if (const Point* nonce = output.Nonce()) {
            out.push_back(*nonce);
        }
    }
    return out;
}

std::vector<std::pair<Field, RecordCiphertext>> Transition::Records() const {
    std::vector<std::pair<Field, RecordCiphertext>> out;
    for (const auto& output : outputs_) {
        const RecordCiphertext* record = output.GetRecord();
        if (record) {
            out.emplace_back(*output.Commitment(), *record);
        }
    }
    return out;
}

bool Transition::operator==(const Transition& other) const {
    return id_ == other.id_ && programID_ == other.programID_ && functionName_ == other.functionName_ &&
           inputs_ == other.inputs_ && outputs_ == other.outputs_ && finalize_ == other.finalize_ &&
           proof_ == other.proof_ && tpk_ == other.tpk_ && tcm_ == other.tcm_ && fee_ == other.fee_;
}

} // namespace veil
