// VEIL - Responses
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// The outputs of a function call together with their output IDs. Output
// i sits at index num_inputs + i of the call's transcript.

#ifndef VEIL_REQUEST_RESPONSE_H
#define VEIL_REQUEST_RESPONSE_H

#include <cstdint>
#include <variant>
#include <vector>
#include "veil/crypto/field.h"
#include "veil/crypto/group.h"
#include "veil/program/identifier.h"
#include "veil/program/value.h"

namespace veil {

namespace output_id {

struct Constant {
    Field hash;
    bool operator==(const Constant& other) const { return hash == other.hash; }
};

struct Public {
    Field hash;
    bool operator==(const Public& other) const { return hash == other.hash; }
};

struct Private {
    Field hash;
    bool operator==(const Private& other) const { return hash == other.hash; }
};

/**
 * Commitment of the plaintext record and HashBHP1024 of its ciphertext bits
 */
struct Record {
    Field commitment;
    Field checksum;
    bool operator==(const Record& other) const {
        return commitment == other.commitment && checksum == other.checksum;
    }
};

struct ExternalRecord {
    Field hash;
    bool operator==(const ExternalRecord& other) const { return hash == other.hash; }
};

} // namespace output_id

/// Variant index matches ValueType::Kind
using OutputID = std::variant<output_id::Constant,
                              output_id::Public,
                              output_id::Private,
                              output_id::Record,
                              output_id::ExternalRecord>;

class Response {
public:
    /// Derive the output IDs of `outputs`. Record outputs are encrypted
    /// under OutputRandomizer(tvk, register), so their nonce must already
    /// equal that randomizer times G.
    static Response New(uint16_t networkID, const ProgramID& programID, const Identifier& functionName,
                        size_t numInputs, const Field& tvk, const Field& tcm,
                        std::vector<Value> outputs, const std::vector<ValueType>& outputTypes,
                        const std::vector<uint64_t>& outputRegisters);

    /// HashToScalarPSD2([tvk, register locator])
    static Scalar OutputRandomizer(const Field& tvk, uint64_t registerLocator);

    const std::vector<OutputID>& OutputIDs() const { return outputIDs_; }
    const std::vector<Value>& Outputs() const { return outputs_; }

private:
    std::vector<OutputID> outputIDs_;
    std::vector<Value> outputs_;
};

} // namespace veil

#endif // VEIL_REQUEST_RESPONSE_H
