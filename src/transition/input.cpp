// VEIL - Transition Inputs
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/transition/input.h"
#include "veil/network/network.h"

namespace veil {

namespace detail {

Field HashPlaintextPayload(const Field& functionID, const Plaintext& plaintext,
                           const Field& tcm, size_t index) {
    std::vector<Field> preimage{functionID};
    auto fields = plaintext.ToFields();
    preimage.insert(preimage.end(), fields.begin(), fields.end());
    preimage.push_back(tcm);
    preimage.push_back(Field(static_cast<uint64_t>(index)));
    return network::HashPSD8(preimage);
}

} // namespace detail

const Field& Input::ID() const {
    switch (value_.index()) {
        case 0: return std::get<input::Constant>(value_).hash;
        case 1: return std::get<input::Public>(value_).hash;
        case 2: return std::get<input::Private>(value_).hash;
        case 3: return std::get<input::Record>(value_).serialNumber;
        default: return std::get<input::ExternalRecord>(value_).hash;
    }
}

const Field* Input::SerialNumber() const {
    const auto* record = std::get_if<input::Record>(&value_);
    return record ? &record->serialNumber : nullptr;
}

const Field* Input::Tag() const {
    const auto* record = std::get_if<input::Record>(&value_);
    return record ? &record->tag : nullptr;
}

bool Input::Verify(const Field& functionID, const Field& tcm, size_t index) const {
    switch (value_.index()) {
        case 0: {
            const auto& v = std::get<input::Constant>(value_);
            return !v.plaintext || v.hash == detail::HashPlaintextPayload(functionID, *v.plaintext, tcm, index);
        }
        case 1: {
            const auto& v = std::get<input::Public>(value_);
            return !v.plaintext || v.hash == detail::HashPlaintextPayload(functionID, *v.plaintext, tcm, index);
        }
        case 2: {
            const auto& v = std::get<input::Private>(value_);
            return !v.ciphertext || v.hash == network::HashPSD8(v.ciphertext->ToFields());
        }
        default:
            return true;
    }
}

} // namespace veil
