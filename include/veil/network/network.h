// VEIL - Network Parameters
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Process-wide cryptographic parameters: domain separators, hash
// instances and generator. Each is built on first use and lives for the
// life of the process.

#ifndef VEIL_NETWORK_NETWORK_H
#define VEIL_NETWORK_NETWORK_H

#include <cstdint>
#include <vector>
#include "veil/core/types.h"
#include "veil/crypto/field.h"
#include "veil/crypto/group.h"
#include "veil/crypto/poseidon.h"
#include "veil/crypto/bhp.h"

namespace veil {
namespace network {

/// Network identifier bound into every function ID
constexpr uint16_t ID = 3;

/// Short network name used in program IDs ("token.aleo")
constexpr const char* NAME = "aleo";

// ============================================================================
// Domain Separators
// ============================================================================

const Field& SerialNumberDomain();
const Field& EncryptionDomain();
const Field& GraphKeyDomain();
const Field& AccountSignatureSecretKeyDomain();
const Field& AccountSignatureRandomizerDomain();

// ============================================================================
// Group
// ============================================================================

const Point& Generator();

/// scalar * G
Point GScalarMultiply(const Scalar& scalar);

// ============================================================================
// Hashes
// ============================================================================

Field HashPSD2(const std::vector<Field>& input);
Field HashPSD4(const std::vector<Field>& input);
Field HashPSD8(const std::vector<Field>& input);

std::vector<Field> HashManyPSD8(const std::vector<Field>& input, size_t numOutputs);

Scalar HashToScalarPSD2(const std::vector<Field>& input);
Scalar HashToScalarPSD4(const std::vector<Field>& input);
Scalar HashToScalarPSD8(const std::vector<Field>& input);

Point HashToGroupPSD2(const std::vector<Field>& input);

Field HashBHP1024(const Bits& input);
Field CommitBHP1024(const Bits& input, const Scalar& randomizer);

} // namespace network
} // namespace veil

#endif // VEIL_NETWORK_NETWORK_H
