// VEIL - Network Parameters
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/network/network.h"

namespace veil {
namespace network {

namespace {

const Poseidon& PSD2() {
    static const Poseidon instance(2);
    return instance;
}

const Poseidon& PSD4() {
    static const Poseidon instance(4);
    return instance;
}

const Poseidon& PSD8() {
    static const Poseidon instance(8);
    return instance;
}

const BHP& BHP1024() {
    static const BHP instance("AleoBHP1024", 8, 54);
    return instance;
}

} // namespace

const Field& SerialNumberDomain() {
    static const Field d = Field::FromDomain("AleoSerialNumber0");
    return d;
}

const Field& EncryptionDomain() {
    static const Field d = Field::FromDomain("AleoSymmetricEncryption0");
    return d;
}

const Field& GraphKeyDomain() {
    static const Field d = Field::FromDomain("AleoGraphKey0");
    return d;
}

const Field& AccountSignatureSecretKeyDomain() {
    static const Field d = Field::FromDomain("AleoAccountSignatureSecretKey0");
    return d;
}

const Field& AccountSignatureRandomizerDomain() {
    static const Field d = Field::FromDomain("AleoAccountSignatureRandomizer0");
    return d;
}

const Point& Generator() {
    static const Point g = Point::Generator();
    return g;
}

Point GScalarMultiply(const Scalar& scalar) {
    return Point::MulGenerator(scalar);
}

Field HashPSD2(const std::vector<Field>& input) { return PSD2().Hash(input); }
Field HashPSD4(const std::vector<Field>& input) { return PSD4().Hash(input); }
Field HashPSD8(const std::vector<Field>& input) { return PSD8().Hash(input); }

std::vector<Field> HashManyPSD8(const std::vector<Field>& input, size_t numOutputs) {
    return PSD8().HashMany(input, numOutputs);
}

Scalar HashToScalarPSD2(const std::vector<Field>& input) { return PSD2().HashToScalar(input); }
Scalar HashToScalarPSD4(const std::vector<Field>& input) { return PSD4().HashToScalar(input); }
Scalar HashToScalarPSD8(const std::vector<Field>& input) { return PSD8().HashToScalar(input); }

Point HashToGroupPSD2(const std::vector<Field>& input) { return PSD2().HashToGroup(input); }

Field HashBHP1024(const Bits& input) { return BHP1024().Hash(input); }

Field CommitBHP1024(const Bits& input, const Scalar& randomizer) {
    return BHP1024().Commit(input, randomizer);
}

} // namespace network
} // namespace veil
