// VEIL - Circuit Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>
#include "veil/circuit/environment.h"
#include "veil/circuit/types.h"
#include "veil/core/errors.h"
#include "veil/program/record.h"
#include "veil/request/request.h"

using namespace veil;

// ============================================================================
// Environment Tests
// ============================================================================

class EnvironmentTest : public ::testing::Test {
protected:
    void SetUp() override { circuit::Environment::Reset(); }
    void TearDown() override { circuit::Environment::Reset(); }
};

TEST_F(EnvironmentTest, CountsVariablesByMode) {
    circuit::Field a(circuit::Mode::Constant, Field(uint64_t(1)));
    circuit::Field b(circuit::Mode::Public, Field(uint64_t(2)));
    circuit::Field c(circuit::Mode::Private, Field(uint64_t(3)));

    EXPECT_EQ(circuit::Environment::NumConstants(), 1u);
    EXPECT_EQ(circuit::Environment::NumPublic(), 1u);
    EXPECT_EQ(circuit::Environment::NumPrivate(), 1u);
    EXPECT_EQ(circuit::Environment::NumConstraints(), 0u);
}

TEST_F(EnvironmentTest, ConstantArithmeticAddsNoConstraints) {
    auto a = circuit::Field::Constant(Field(uint64_t(2)));
    auto b = circuit::Field::Constant(Field(uint64_t(3)));
    auto c = a * b;
    EXPECT_EQ(c.Eject(), Field(uint64_t(6)));
    EXPECT_EQ(c.GetMode(), circuit::Mode::Constant);
    EXPECT_EQ(circuit::Environment::NumConstraints(), 0u);
}

TEST_F(EnvironmentTest, WitnessArithmeticIsConstrained) {
    circuit::Field a(circuit::Mode::Public, Field(uint64_t(2)));
    circuit::Field b(circuit::Mode::Private, Field(uint64_t(3)));
    auto c = a * b;
    EXPECT_EQ(c.Eject(), Field(uint64_t(6)));
    EXPECT_EQ(c.GetMode(), circuit::Mode::Private);
    EXPECT_EQ(circuit::Environment::NumConstraints(), 1u);

    auto eq = c.IsEqual(circuit::Field::Constant(Field(uint64_t(6))));
    EXPECT_TRUE(eq.Eject());
    EXPECT_EQ(circuit::Environment::NumConstraints(), 3u);
}

TEST_F(EnvironmentTest, FirstViolationIsKept) {
    EXPECT_TRUE(circuit::Environment::IsSatisfied());
    circuit::Environment::Enforce(false, "first");
    circuit::Environment::Enforce(false, "second");
    EXPECT_FALSE(circuit::Environment::IsSatisfied());
    EXPECT_EQ(circuit::Environment::FirstViolation(), "first");

    circuit::Environment::Reset();
    EXPECT_TRUE(circuit::Environment::IsSatisfied());
    EXPECT_TRUE(circuit::Environment::FirstViolation().empty());
}

TEST_F(EnvironmentTest, HaltThrows) {
    EXPECT_THROW(circuit::Environment::Halt("bad input"), CircuitHalt);
}

// ============================================================================
// Request Circuit Tests
// ============================================================================

class RequestCircuitTest : public EnvironmentTest {
protected:
    PrivateKey key_ = PrivateKey::FromSeed(Field(uint64_t(21)));
    ProgramID program_{Identifier("token"), Identifier("aleo")};
    Identifier function_{"split"};

    std::vector<ValueType> Types() const {
        return {ValueType::Public("u64"), ValueType::Private("u64"), ValueType::Record(Identifier("token"))};
    }

    std::vector<Value> Inputs() const {
        Record record(Address::FromPrivateKey(key_), Visibility::Private, 40, Visibility::Private, {},
                      Point::MulGenerator(Scalar::FromUint64(3)));
        return {Value(Plaintext(Literal::FromU64(10))), Value(Plaintext(Literal::FromU64(20))), Value(record)};
    }

    Request Sign() {
        DeterministicRng rng(77);
        return Request::Sign(key_, program_, function_, Inputs(), Types(), rng);
    }

    /// Copy of `request` with the given signed parts and no tsk
    static Request Reassemble(const Request& request, std::vector<InputID> inputIDs, const Signature& signature,
                              const Field& tvk, const Field& tcm) {
        return Request(request.Caller(), request.NetworkID(), request.GetProgramID(), request.FunctionName(),
                       std::move(inputIDs), request.Inputs(), signature, request.SkTag(), tvk, std::nullopt, tcm);
    }

    /// Both paths must reject `forged`, and the circuit must say so through
    /// its output rather than by halting
    void ExpectBothReject(const Request& forged) {
        EXPECT_FALSE(forged.Verify(Types()));
        circuit::Environment::Reset();
        EXPECT_FALSE(circuit::VerifyRequest(forged, Types(), forged.ToTPK()).Eject());
    }
};

TEST_F(RequestCircuitTest, AgreesWithNativeOnValidRequest) {
    Request request = Sign();
    ASSERT_TRUE(request.Verify(Types()));

    circuit::Environment::Reset();
    circuit::Boolean valid = circuit::VerifyRequest(request, Types(), request.ToTPK());
    EXPECT_TRUE(valid.Eject());
    EXPECT_GT(circuit::Environment::NumConstraints(), 0u);
    EXPECT_GT(circuit::Environment::NumPrivate(), 0u);
    EXPECT_TRUE(circuit::Environment::IsSatisfied());
}

TEST_F(RequestCircuitTest, AgreesWithNativeOnTamperedRequest) {
    Request request = Sign();
    auto inputs = Inputs();
    inputs[0] = Value(Plaintext(Literal::FromU64(11)));
    Request forged(request.Caller(), request.NetworkID(), request.GetProgramID(), request.FunctionName(),
                   request.InputIDs(), inputs, request.GetSignature(), request.SkTag(), request.TVK(),
                   request.TSK(), request.TCM());

    EXPECT_FALSE(forged.Verify(Types()));
    EXPECT_FALSE(circuit::VerifyRequest(forged, Types(), forged.ToTPK()).Eject());
}

TEST_F(RequestCircuitTest, AgreesWithoutTransitionSecretKey) {
    Request request = Sign();
    Request stripped = Reassemble(request, request.InputIDs(), request.GetSignature(), request.TVK(),
                                  request.TCM());
    EXPECT_TRUE(stripped.Verify(Types()));
    circuit::Environment::Reset();
    EXPECT_TRUE(circuit::VerifyRequest(stripped, Types(), stripped.ToTPK()).Eject());
}

TEST_F(RequestCircuitTest, ChangedTransitionViewKey) {
    Request request = Sign();
    ExpectBothReject(Reassemble(request, request.InputIDs(), request.GetSignature(),
                                request.TVK() + Field(uint64_t(1)), request.TCM()));
}

TEST_F(RequestCircuitTest, ChangedTransitionCommitment) {
    Request request = Sign();
    ExpectBothReject(Reassemble(request, request.InputIDs(), request.GetSignature(), request.TVK(),
                                request.TCM() + Field(uint64_t(1))));
}

TEST_F(RequestCircuitTest, ChangedSignatureResponse) {
    Request request = Sign();
    const Signature& sig = request.GetSignature();
    Signature tampered(sig.Challenge(), sig.Response() + Scalar::FromUint64(1), sig.GetComputeKey());
    ExpectBothReject(Reassemble(request, request.InputIDs(), tampered, request.TVK(), request.TCM()));
}

TEST_F(RequestCircuitTest, ChangedInputIDHash) {
    Request request = Sign();
    std::vector<InputID> ids = request.InputIDs();
    auto& id = std::get<input_id::Public<circuit::NativeEnv>>(ids[0]);
    id.hash = id.hash + Field(uint64_t(1));
    ExpectBothReject(Reassemble(request, std::move(ids), request.GetSignature(), request.TVK(), request.TCM()));
}

TEST_F(RequestCircuitTest, ChangedSerialNumber) {
    Request request = Sign();
    std::vector<InputID> ids = request.InputIDs();
    auto& id = std::get<input_id::Record<circuit::NativeEnv>>(ids[2]);
    id.serialNumber = id.serialNumber + Field(uint64_t(1));
    ExpectBothReject(Reassemble(request, std::move(ids), request.GetSignature(), request.TVK(), request.TCM()));
}

TEST_F(RequestCircuitTest, ChangedTag) {
    Request request = Sign();
    std::vector<InputID> ids = request.InputIDs();
    auto& id = std::get<input_id::Record<circuit::NativeEnv>>(ids[2]);
    id.tag = id.tag + Field(uint64_t(1));
    ExpectBothReject(Reassemble(request, std::move(ids), request.GetSignature(), request.TVK(), request.TCM()));
}

TEST_F(RequestCircuitTest, WrongTransitionPublicKey) {
    Request request = Sign();
    EXPECT_FALSE(circuit::VerifyRequest(request, Types(), Point::Generator()).Eject());
}

TEST_F(RequestCircuitTest, CardinalityMismatchHalts) {
    Request request = Sign();
    auto types = Types();
    types.pop_back();
    EXPECT_THROW(circuit::VerifyRequest(request, types, request.ToTPK()), CircuitHalt);
}

TEST_F(RequestCircuitTest, InjectRequestKeepsValues) {
    Request request = Sign();
    auto view = circuit::InjectRequest(request, circuit::Mode::Private);
    EXPECT_EQ(view.caller.Eject(), request.Caller().ToGroup());
    EXPECT_EQ(view.tvk.Eject(), request.TVK());
    EXPECT_EQ(view.tcm.Eject(), request.TCM());
    EXPECT_EQ(view.inputIDs.size(), request.InputIDs().size());
    ASSERT_TRUE(view.tsk.has_value());
    EXPECT_EQ(view.tsk->Eject(), *request.TSK());
}
