// VEIL - Responses
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/request/response.h"
#include "veil/core/errors.h"
#include "veil/network/network.h"
#include "veil/program/record.h"
#include "veil/request/verify.h"
#include "veil/util/logging.h"

namespace veil {

Scalar Response::OutputRandomizer(const Field& tvk, uint64_t registerLocator) {
    return network::HashToScalarPSD2({tvk, Field(registerLocator)});
}

Response Response::New(uint16_t networkID, const ProgramID& programID, const Identifier& functionName,
                       size_t numInputs, const Field& tvk, const Field& tcm,
                       std::vector<Value> outputs, const std::vector<ValueType>& outputTypes,
                       const std::vector<uint64_t>& outputRegisters) {
    using E = circuit::NativeEnv;
    using Kind = ValueType::Kind;

    if (outputs.size() != outputTypes.size() || outputRegisters.size() != outputTypes.size()) {
        throw CardinalityError("Function '" + functionName.ToString() + "' in the program '" +
                               programID.ToString() + "' expects " + std::to_string(outputTypes.size()) +
                               " outputs, but " + std::to_string(outputs.size()) + " were produced.");
    }

    Field functionID = ComputeFunctionID(networkID, programID, functionName);

    Response response;
    response.outputIDs_.reserve(outputs.size());

    for (size_t i = 0; i < outputs.size(); ++i) {
        const ValueType& type = outputTypes[i];
        const Value& output = outputs[i];
        Field index(static_cast<uint64_t>(numInputs + i));

        switch (type.GetKind()) {
            case Kind::Constant:
            case Kind::Public: {
                const Plaintext& plaintext = detail::RequirePlaintext<E>(output, numInputs + i, type);
                std::vector<Field> preimage{functionID};
                auto fields = plaintext.ToFields();
                preimage.insert(preimage.end(), fields.begin(), fields.end());
                preimage.push_back(tcm);
                preimage.push_back(index);
                Field hash = network::HashPSD8(preimage);
                if (type.GetKind() == Kind::Constant) {
                    response.outputIDs_.emplace_back(output_id::Constant{hash});
                } else {
                    response.outputIDs_.emplace_back(output_id::Public{hash});
                }
                break;
            }
            case Kind::Private: {
                const Plaintext& plaintext = detail::RequirePlaintext<E>(output, numInputs + i, type);
                Field outputViewKey = network::HashPSD4({functionID, tvk, index});
                Ciphertext ciphertext = plaintext.EncryptSymmetric(outputViewKey);
                response.outputIDs_.emplace_back(output_id::Private{network::HashPSD8(ciphertext.ToFields())});
                break;
            }
            case Kind::Record: {
                const Record& record = detail::RequireRecord<E>(output, numInputs + i, type);
                Field commitment = record.ToCommitment(programID, type.RecordName());
                RecordCiphertext encrypted = record.Encrypt(OutputRandomizer(tvk, outputRegisters[i]));
                Field checksum = network::HashBHP1024(encrypted.ToBitsLE());
                response.outputIDs_.emplace_back(output_id::Record{commitment, checksum});
                break;
            }
            case Kind::ExternalRecord: {
                const Record& record = detail::RequireRecord<E>(output, numInputs + i, type);
                std::vector<Field> preimage{functionID};
                auto fields = record.ToFields();
                preimage.insert(preimage.end(), fields.begin(), fields.end());
                preimage.push_back(tvk);
                preimage.push_back(index);
                response.outputIDs_.emplace_back(output_id::ExternalRecord{network::HashPSD8(preimage)});
                break;
            }
        }
    }

    response.outputs_ = std::move(outputs);
    LOG_DEBUG(util::LogCategory::REQUEST) << "Derived " << response.outputIDs_.size() << " output IDs for "
                                          << programID.ToString() << "/" << functionName.ToString();
    return response;
}

} // namespace veil
