// VEIL - Requests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/request/request.h"
#include "veil/core/errors.h"
#include "veil/network/network.h"
#include "veil/program/record.h"
#include "veil/util/logging.h"

namespace veil {

Field ComputeFunctionID(uint16_t networkID, const ProgramID& programID, const Identifier& functionName) {
    Bits preimage;
    AppendBitsLE(preimage, networkID, 16);
    detail::AppendBits(preimage, programID.ToBitsLE());
    detail::AppendBits(preimage, functionName.ToBitsLE());
    return network::HashBHP1024(preimage);
}

Request::Request(const Address& caller, uint16_t networkID, const ProgramID& programID,
                 const Identifier& functionName, std::vector<InputID> inputIDs, std::vector<Value> inputs,
                 const Signature& signature, const Field& skTag, const Field& tvk,
                 const std::optional<Scalar>& tsk, const Field& tcm)
    : caller_(caller)
    , networkID_(networkID)
    , programID_(programID)
    , functionName_(functionName)
    , inputIDs_(std::move(inputIDs))
    , inputs_(std::move(inputs))
    , signature_(signature)
    , skTag_(skTag)
    , tvk_(tvk)
    , tsk_(tsk)
    , tcm_(tcm) {}

Request Request::Sign(const PrivateKey& privateKey, const ProgramID& programID,
                      const Identifier& functionName, const std::vector<Value>& inputs,
                      const std::vector<ValueType>& inputTypes, Rng& rng) {
    using E = circuit::NativeEnv;
    using Kind = ValueType::Kind;

    if (inputs.size() != inputTypes.size()) {
        throw CardinalityError(CardinalityMessage(programID, functionName, inputTypes.size(), inputs.size()));
    }

    const Scalar& skSig = privateKey.SkSig();
    ComputeKey computeKey = ComputeKey::FromPrivateKey(privateKey);
    Address caller = computeKey.ToAddress();
    Field skTag = GraphKey::FromViewKey(ViewKey::FromPrivateKey(privateKey)).SkTag();

    // Transition secret key
    Byte wide[64];
    rng.Fill(wide, sizeof(wide));
    Field nonce = Field::FromBytes(wide, sizeof(wide));
    Scalar r = network::HashToScalarPSD4({network::SerialNumberDomain(), skSig.ToField(), nonce});

    Point gR = network::GScalarMultiply(r);
    Field tvk = (caller.ToGroup() * r).ToXField();
    Field tcm = network::HashPSD2({tvk});
    Field functionID = ComputeFunctionID(network::ID, programID, functionName);

    std::vector<Field> message{gR.ToXField(), computeKey.PkSig().ToXField(), computeKey.PrSig().ToXField(),
                               caller.ToField(), tvk, tcm, functionID};
    std::vector<InputID> inputIDs;
    inputIDs.reserve(inputs.size());

    for (size_t i = 0; i < inputs.size(); ++i) {
        const ValueType& type = inputTypes[i];
        const Value& input = inputs[i];
        Field index(static_cast<uint64_t>(i));

        switch (type.GetKind()) {
            case Kind::Constant:
            case Kind::Public: {
                const Plaintext& plaintext = detail::RequirePlaintext<E>(input, i, type);
                std::vector<Field> preimage{functionID};
                auto fields = plaintext.ToFields();
                preimage.insert(preimage.end(), fields.begin(), fields.end());
                preimage.push_back(tcm);
                preimage.push_back(index);
                Field hash = network::HashPSD8(preimage);
                if (type.GetKind() == Kind::Constant) {
                    inputIDs.emplace_back(input_id::Constant<E>{hash});
                } else {
                    inputIDs.emplace_back(input_id::Public<E>{hash});
                }
                message.push_back(hash);
                break;
            }
            case Kind::Private: {
                const Plaintext& plaintext = detail::RequirePlaintext<E>(input, i, type);
                Field inputViewKey = network::HashPSD4({functionID, tvk, index});
                Ciphertext ciphertext = plaintext.EncryptSymmetric(inputViewKey);
                Field hash = network::HashPSD8(ciphertext.ToFields());
                inputIDs.emplace_back(input_id::Private<E>{hash});
                message.push_back(hash);
                break;
            }
            case Kind::Record: {
                const Record& record = detail::RequireRecord<E>(input, i, type);
                if (record.Owner() != caller) {
                    throw CheckError("Input record for '" + programID.ToString() + "' must belong to the signer");
                }
                if (!record.HasValidGates()) {
                    throw CheckError("Input record contains an invalid Aleo balance (in gates)");
                }

                Field commitment = record.ToCommitment(programID, type.RecordName());
                Point h = network::HashToGroupPSD2({network::SerialNumberDomain(), commitment});
                Point hR = h * r;
                Point gamma = h * skSig;
                Field serialNumber = Record::SerialNumberFromGamma(gamma, commitment);
                Field tag = Record::Tag(skTag, commitment);

                inputIDs.emplace_back(input_id::Record<E>{commitment, gamma, serialNumber, tag});
                message.push_back(h.ToXField());
                message.push_back(hR.ToXField());
                message.push_back(gamma.ToXField());
                message.push_back(tag);
                break;
            }
            case Kind::ExternalRecord: {
                const Record& record = detail::RequireRecord<E>(input, i, type);
                std::vector<Field> preimage{functionID};
                auto fields = record.ToFields();
                preimage.insert(preimage.end(), fields.begin(), fields.end());
                preimage.push_back(tvk);
                preimage.push_back(index);
                Field hash = network::HashPSD8(preimage);
                inputIDs.emplace_back(input_id::ExternalRecord<E>{hash});
                message.push_back(hash);
                break;
            }
        }
    }

    Scalar challenge = network::HashToScalarPSD8(message);
    Scalar response = r - challenge * skSig;

    LOG_DEBUG(util::LogCategory::REQUEST) << "Signed " << programID.ToString() << "/"
                                          << functionName.ToString() << " with "
                                          << inputs.size() << " inputs";

    return Request(caller, network::ID, programID, functionName, std::move(inputIDs), inputs,
                   Signature(challenge, response, computeKey), skTag, tvk, r, tcm);
}

RequestView<circuit::NativeEnv> Request::ToView() const {
    RequestView<circuit::NativeEnv> view;
    view.caller = caller_.ToGroup();
    view.networkID = networkID_;
    view.programID = programID_;
    view.functionName = functionName_;
    view.inputIDs = inputIDs_;
    view.inputs = inputs_;
    view.challenge = signature_.Challenge();
    view.response = signature_.Response();
    view.pkSig = signature_.GetComputeKey().PkSig();
    view.prSig = signature_.GetComputeKey().PrSig();
    view.skTag = skTag_;
    view.tvk = tvk_;
    view.tcm = tcm_;
    view.tsk = tsk_;
    return view;
}

bool Request::Verify(const std::vector<ValueType>& inputTypes, const Point& tpk) const {
    bool valid = VerifyRequest<circuit::NativeEnv>(ToView(), inputTypes, tpk);
    if (!valid) {
        LOG_DEBUG(util::LogCategory::REQUEST) << "Request for " << programID_.ToString() << "/"
                                              << functionName_.ToString() << " failed verification";
    }
    return valid;
}

bool Request::operator==(const Request& other) const {
    // tsk is signer-local and not part of a request's identity
    return caller_ == other.caller_ && networkID_ == other.networkID_ &&
           programID_ == other.programID_ && functionName_ == other.functionName_ &&
           inputIDs_ == other.inputIDs_ && inputs_ == other.inputs_ &&
           signature_ == other.signature_ && skTag_ == other.skTag_ && tvk_ == other.tvk_ &&
           tcm_ == other.tcm_;
}

namespace circuit {

namespace {

BasicInputID<CircuitEnv> InjectInputID(const InputID& id) {
    using E = CircuitEnv;
    using N = NativeEnv;
    switch (KindOf(id)) {
        case ValueType::Kind::Constant:
            return input_id::Constant<E>{E::Field(Mode::Public, std::get<input_id::Constant<N>>(id).hash)};
        case ValueType::Kind::Public:
            return input_id::Public<E>{E::Field(Mode::Public, std::get<input_id::Public<N>>(id).hash)};
        case ValueType::Kind::Private:
            return input_id::Private<E>{E::Field(Mode::Public, std::get<input_id::Private<N>>(id).hash)};
        case ValueType::Kind::Record: {
            const auto& record = std::get<input_id::Record<N>>(id);
            return input_id::Record<E>{E::Field(Mode::Public, record.commitment),
                                       E::Group(Mode::Private, record.gamma),
                                       E::Field(Mode::Public, record.serialNumber),
                                       E::Field(Mode::Public, record.tag)};
        }
        case ValueType::Kind::ExternalRecord:
            return input_id::ExternalRecord<E>{
                E::Field(Mode::Public, std::get<input_id::ExternalRecord<N>>(id).hash)};
    }
    Environment::Halt("Unknown input ID variant");
}

} // namespace

RequestView<CircuitEnv> InjectRequest(const Request& request, Mode mode) {
    RequestView<CircuitEnv> view;
    view.caller = Group(mode, request.Caller().ToGroup());
    view.networkID = request.NetworkID();
    view.programID = request.GetProgramID();
    view.functionName = request.FunctionName();
    for (const auto& id : request.InputIDs()) {
        view.inputIDs.push_back(InjectInputID(id));
    }
    view.inputs = request.Inputs();
    view.challenge = Scalar(mode, request.GetSignature().Challenge());
    view.response = Scalar(mode, request.GetSignature().Response());
    view.pkSig = Group(mode, request.GetSignature().GetComputeKey().PkSig());
    view.prSig = Group(mode, request.GetSignature().GetComputeKey().PrSig());
    view.skTag = Field(Mode::Private, request.SkTag());
    view.tvk = Field(Mode::Private, request.TVK());
    view.tcm = Field(Mode::Public, request.TCM());
    if (request.TSK()) {
        view.tsk = Scalar(Mode::Private, *request.TSK());
    }
    return view;
}

Boolean VerifyRequest(const Request& request, const std::vector<ValueType>& inputTypes, const Point& tpk) {
    auto view = InjectRequest(request, Mode::Private);
    Boolean valid = ::veil::VerifyRequest<CircuitEnv>(view, inputTypes, Group(Mode::Public, tpk));
    LOG_DEBUG(util::LogCategory::CIRCUIT) << "Request circuit: " << Environment::NumConstraints()
                                          << " constraints, result " << valid.Eject();
    return valid;
}

} // namespace circuit

} // namespace veil
