// VEIL - Transition Outputs
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/transition/output.h"
#include "veil/network/network.h"

namespace veil {

const Field& Output::ID() const {
    switch (value_.index()) {
        case 0: return std::get<output::Constant>(value_).hash;
        case 1: return std::get<output::Public>(value_).hash;
        case 2: return std::get<output::Private>(value_).hash;
        case 3: return std::get<output::Record>(value_).commitment;
        default: return std::get<output::ExternalRecord>(value_).hash;
    }
}

const Field* Output::Commitment() const {
    const auto* record = std::get_if<output::Record>(&value_);
    return record ? &record->commitment : nullptr;
}

const RecordCiphertext* Output::GetRecord() const {
    const auto* record = std::get_if<output::Record>(&value_);
    return (record && record->record) ? &*record->record : nullptr;
}

const Point* Output::Nonce() const {
    const RecordCiphertext* record = GetRecord();
    return record ? &record->Nonce() : nullptr;
}

bool Output::Verify(const Field& functionID, const Field& tcm, size_t index) const {
    switch (value_.index()) {
        case 0: {
            const auto& v = std::get<output::Constant>(value_);
            return !v.plaintext || v.hash == detail::HashPlaintextPayload(functionID, *v.plaintext, tcm, index);
        }
        case 1: {
            const auto& v = std::get<output::Public>(value_);
            return !v.plaintext || v.hash == detail::HashPlaintextPayload(functionID, *v.plaintext, tcm, index);
        }
        case 2: {
            const auto& v = std::get<output::Private>(value_);
            return !v.ciphertext || v.hash == network::HashPSD8(v.ciphertext->ToFields());
        }
        case 3: {
            const auto& v = std::get<output::Record>(value_);
            return !v.record || v.checksum == network::HashBHP1024(v.record->ToBitsLE());
        }
        default:
            return true;
    }
}

} // namespace veil
