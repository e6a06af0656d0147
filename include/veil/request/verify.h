// VEIL - Request Verification
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// The request checks, written once against an execution environment.
// NativeEnv instantiations back Request::Verify; CircuitEnv
// instantiations run the same algorithm over circuit values.

#ifndef VEIL_REQUEST_VERIFY_H
#define VEIL_REQUEST_VERIFY_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "veil/circuit/env.h"
#include "veil/core/errors.h"
#include "veil/network/network.h"
#include "veil/program/identifier.h"
#include "veil/program/value.h"
#include "veil/request/input_id.h"

namespace veil {

/// HashBHP1024(u16 network_id | program_id bits | function_name bits)
Field ComputeFunctionID(uint16_t networkID, const ProgramID& programID, const Identifier& functionName);

inline std::string CardinalityMessage(const ProgramID& programID, const Identifier& functionName,
                                      size_t expected, size_t provided) {
    return "Function '" + functionName.ToString() + "' in the program '" + programID.ToString() +
           "' expects " + std::to_string(expected) + " inputs, but " + std::to_string(provided) +
           " were provided.";
}

/**
 * The public parts of a request, lifted into environment E. Input values
 * stay native; the checks inject them as private witnesses.
 */
template<typename E>
struct RequestView {
    typename E::Group caller;
    uint16_t networkID{0};
    ProgramID programID;
    Identifier functionName;
    std::vector<BasicInputID<E>> inputIDs;
    std::vector<Value> inputs;
    typename E::Scalar challenge;
    typename E::Scalar response;
    typename E::Group pkSig;
    typename E::Group prSig;
    typename E::Field skTag;
    typename E::Field tvk;
    typename E::Field tcm;
    std::optional<typename E::Scalar> tsk;
};

namespace detail {

template<typename E>
std::vector<typename E::Field> InjectFields(const std::vector<Field>& fields) {
    std::vector<typename E::Field> out;
    out.reserve(fields.size());
    for (const auto& f : fields) {
        out.push_back(E::Inject(circuit::Mode::Private, f));
    }
    return out;
}

template<typename E>
const Plaintext& RequirePlaintext(const Value& input, size_t index, const ValueType& type) {
    const Plaintext* plaintext = input.AsPlaintext();
    if (plaintext == nullptr) {
        E::template Halt<ValueKindError>("Expected a plaintext at index " + std::to_string(index) +
                                         " of type '" + type.ToString() + "', found a record");
    }
    return *plaintext;
}

template<typename E>
const Record& RequireRecord(const Value& input, size_t index, const ValueType& type) {
    const Record* record = input.AsRecord();
    if (record == nullptr) {
        E::template Halt<ValueKindError>("Expected a record at index " + std::to_string(index) +
                                         " of type '" + type.ToString() + "', found a plaintext");
    }
    return *record;
}

inline void AppendBits(Bits& out, const Bits& in) {
    out.insert(out.end(), in.begin(), in.end());
}

} // namespace detail

/// Recompute every input ID of `request` from its inputs and compare it
/// with the claimed one. With CreateMessage, also append each input's
/// transcript contribution to `message`; record inputs then need the
/// request's challenge and response to rebuild r*H.
template<typename E, bool CreateMessage>
typename E::Boolean CheckInputIDs(const RequestView<E>& request,
                                  const std::vector<ValueType>& inputTypes,
                                  const typename E::Field& functionID,
                                  std::vector<typename E::Field>* message) {
    using Field = typename E::Field;
    using Group = typename E::Group;
    using Kind = ValueType::Kind;

    if (request.inputIDs.size() != inputTypes.size() || request.inputs.size() != inputTypes.size()) {
        E::template Halt<CardinalityError>(CardinalityMessage(
            request.programID, request.functionName, inputTypes.size(), request.inputs.size()));
    }

    auto valid = E::Constant(true);
    for (size_t i = 0; i < inputTypes.size(); ++i) {
        const ValueType& type = inputTypes[i];
        const Value& input = request.inputs[i];
        const BasicInputID<E>& id = request.inputIDs[i];

        if (id.index() != static_cast<size_t>(type.GetKind())) {
            E::template Halt<ValueKindError>("Input ID " + std::to_string(i) +
                                             " does not match its declared type '" + type.ToString() + "'");
        }

        Field index = E::Constant(veil::Field(static_cast<uint64_t>(i)));

        switch (type.GetKind()) {
            case Kind::Constant:
            case Kind::Public: {
                const Plaintext& plaintext = detail::RequirePlaintext<E>(input, i, type);
                const Field& claimed = type.GetKind() == Kind::Constant
                    ? std::get<input_id::Constant<E>>(id).hash
                    : std::get<input_id::Public<E>>(id).hash;

                std::vector<Field> preimage{functionID};
                auto fields = detail::InjectFields<E>(plaintext.ToFields());
                preimage.insert(preimage.end(), fields.begin(), fields.end());
                preimage.push_back(request.tcm);
                preimage.push_back(index);

                valid = E::And(valid, E::IsEqual(E::HashPSD8(preimage), claimed));
                if constexpr (CreateMessage) {
                    message->push_back(claimed);
                }
                break;
            }
            case Kind::Private: {
                const Plaintext& plaintext = detail::RequirePlaintext<E>(input, i, type);
                const Field& claimed = std::get<input_id::Private<E>>(id).hash;

                Field inputViewKey = E::HashPSD4({functionID, request.tvk, index});
                auto fields = detail::InjectFields<E>(plaintext.ToFields());
                auto randomizers = E::HashManyPSD8(
                    {E::Constant(network::EncryptionDomain()), inputViewKey}, fields.size());
                std::vector<Field> ciphertext;
                ciphertext.reserve(fields.size());
                for (size_t j = 0; j < fields.size(); ++j) {
                    ciphertext.push_back(fields[j] + randomizers[j]);
                }

                valid = E::And(valid, E::IsEqual(E::HashPSD8(ciphertext), claimed));
                if constexpr (CreateMessage) {
                    message->push_back(claimed);
                }
                break;
            }
            case Kind::Record: {
                const Record& record = detail::RequireRecord<E>(input, i, type);
                const auto& claimed = std::get<input_id::Record<E>>(id);

                Bits commitmentPreimage = request.programID.ToBitsLE();
                detail::AppendBits(commitmentPreimage, type.RecordName().ToBitsLE());
                detail::AppendBits(commitmentPreimage, record.ToBitsLE());
                Field commitment = E::HashBHP1024(commitmentPreimage);

                Field domain = E::Constant(network::SerialNumberDomain());
                Group h = E::HashToGroupPSD2({domain, commitment});

                Bits serialPreimage = E::ToBits(domain);
                detail::AppendBits(serialPreimage, E::ToBits(commitment));
                auto serialRandomizer = E::HashToScalarPSD2({domain, E::ToX(claimed.gamma)});
                Field serialNumber = E::CommitBHP1024(serialPreimage, serialRandomizer);

                Field tag = E::HashPSD2({request.skTag, commitment});

                valid = E::And(valid, E::IsEqual(commitment, claimed.commitment));
                valid = E::And(valid, E::IsEqual(serialNumber, claimed.serialNumber));
                valid = E::And(valid, E::IsEqual(tag, claimed.tag));
                valid = E::And(valid, E::IsEqual(E::Inject(circuit::Mode::Private, record.Owner().ToGroup()),
                                                 request.caller));
                valid = E::And(valid, E::GatesInRange(record.GetGates()));

                if constexpr (CreateMessage) {
                    // r*H without r: challenge*gamma + response*H
                    Group hR = claimed.gamma * request.challenge + h * request.response;
                    message->push_back(E::ToX(h));
                    message->push_back(E::ToX(hR));
                    message->push_back(E::ToX(claimed.gamma));
                    message->push_back(claimed.tag);
                }
                break;
            }
            case Kind::ExternalRecord: {
                const Record& record = detail::RequireRecord<E>(input, i, type);
                const Field& claimed = std::get<input_id::ExternalRecord<E>>(id).hash;

                std::vector<Field> preimage{functionID};
                auto fields = detail::InjectFields<E>(record.ToFields());
                preimage.insert(preimage.end(), fields.begin(), fields.end());
                preimage.push_back(request.tvk);
                preimage.push_back(index);

                valid = E::And(valid, E::IsEqual(E::HashPSD8(preimage), claimed));
                if constexpr (CreateMessage) {
                    message->push_back(claimed);
                }
                break;
            }
        }
    }
    return valid;
}

/// Full request check: signature, transition keys and every input ID.
/// Mismatches fold into the returned boolean; structural problems halt.
template<typename E>
typename E::Boolean VerifyRequest(const RequestView<E>& request,
                                  const std::vector<ValueType>& inputTypes,
                                  const typename E::Group& tpk) {
    using Field = typename E::Field;

    Field functionID = E::Constant(ComputeFunctionID(request.networkID, request.programID, request.functionName));

    // g_r = response*G + challenge*pk_sig
    auto gR = E::MulGenerator(request.response) + request.pkSig * request.challenge;
    auto valid = E::IsEqual(gR, tpk);

    if (request.tsk) {
        valid = E::And(valid, E::IsEqual(E::MulGenerator(*request.tsk), tpk));
        valid = E::And(valid, E::IsEqual(E::ToX(request.caller * *request.tsk), request.tvk));
    }

    valid = E::And(valid, E::IsEqual(E::HashPSD2({request.tvk}), request.tcm));

    std::vector<Field> message{E::ToX(gR), E::ToX(request.pkSig), E::ToX(request.prSig),
                               E::ToX(request.caller), request.tvk, request.tcm, functionID};
    valid = E::And(valid, CheckInputIDs<E, true>(request, inputTypes, functionID, &message));

    valid = E::And(valid, E::IsEqual(E::HashToScalarPSD8(message), request.challenge));

    auto skPrf = E::HashToScalarPSD4({E::ToX(request.pkSig), E::ToX(request.prSig)});
    auto candidate = request.pkSig + request.prSig + E::MulGenerator(skPrf);
    valid = E::And(valid, E::IsEqual(candidate, request.caller));

    return valid;
}

} // namespace veil

#endif // VEIL_REQUEST_VERIFY_H
