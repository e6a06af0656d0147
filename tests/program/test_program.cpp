// VEIL - Program Value Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>
#include "veil/core/errors.h"
#include "veil/network/network.h"
#include "veil/program/record.h"
#include "veil/program/value.h"

using namespace veil;

// ============================================================================
// Identifier Tests
// ============================================================================

TEST(IdentifierTest, Validity) {
    EXPECT_TRUE(Identifier::IsValid("transfer"));
    EXPECT_TRUE(Identifier::IsValid("a_1"));
    EXPECT_FALSE(Identifier::IsValid(""));
    EXPECT_FALSE(Identifier::IsValid("1abc"));
    EXPECT_FALSE(Identifier::IsValid("has space"));
    EXPECT_FALSE(Identifier::IsValid(std::string(Identifier::MAX_SIZE + 1, 'a')));
    EXPECT_TRUE(Identifier::IsValid(std::string(Identifier::MAX_SIZE, 'a')));

    EXPECT_THROW(Identifier("_bad"), Error);
    EXPECT_FALSE(Identifier::FromString("x-y").has_value());
}

TEST(IdentifierTest, ProgramIDParsing) {
    auto id = ProgramID::FromString("token.aleo");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->Name().ToString(), "token");
    EXPECT_EQ(id->Network().ToString(), "aleo");
    EXPECT_EQ(id->ToString(), "token.aleo");

    EXPECT_FALSE(ProgramID::FromString("token").has_value());
    EXPECT_FALSE(ProgramID::FromString("token.").has_value());
}

TEST(IdentifierTest, ValueTypeParsing) {
    const char* cases[] = {"u64.public", "field.private", "bool.constant", "token.record",
                           "credits.aleo/credits.record"};
    for (const char* str : cases) {
        auto type = ValueType::FromString(str);
        ASSERT_TRUE(type.has_value()) << str;
        EXPECT_EQ(type->ToString(), str);
    }

    auto external = ValueType::FromString("credits.aleo/credits.record");
    EXPECT_EQ(external->GetKind(), ValueType::Kind::ExternalRecord);
    EXPECT_EQ(external->ExternalProgram().ToString(), "credits.aleo");
    EXPECT_EQ(external->RecordName().ToString(), "credits");

    EXPECT_FALSE(ValueType::FromString("u64").has_value());
    EXPECT_FALSE(ValueType::FromString("u64.secret").has_value());
}

// ============================================================================
// Plaintext Tests
// ============================================================================

TEST(PlaintextTest, LiteralStrings) {
    EXPECT_EQ(Literal::FromU64(5).ToString(), "5u64");
    EXPECT_EQ(Literal::FromU8(7).ToString(), "7u8");
    EXPECT_EQ(Literal::FromI64(-3).ToString(), "-3i64");
    EXPECT_EQ(Literal::FromBool(true).ToString(), "true");
}

TEST(PlaintextTest, LiteralTypeChecks) {
    Literal literal = Literal::FromBool(false);
    EXPECT_EQ(literal.Type(), LiteralType::Boolean);
    EXPECT_THROW(literal.AsU64(), ValueKindError);
    EXPECT_EQ(Literal::FromU64(9).AsU64(), 9u);
}

TEST(PlaintextTest, FieldsRoundTrip) {
    Plaintext::Members members;
    members.emplace_back(Identifier("amount"), Plaintext(Literal::FromU64(1000)));
    members.emplace_back(Identifier("flag"), Plaintext(Literal::FromBool(true)));
    members.emplace_back(Identifier("key"), Plaintext(Literal::FromField(Field(uint64_t(77)))));
    Plaintext plaintext(std::move(members));

    Plaintext decoded = Plaintext::FromFields(plaintext.ToFields());
    EXPECT_EQ(decoded, plaintext);
    ASSERT_NE(decoded.Find(Identifier("amount")), nullptr);
    EXPECT_EQ(decoded.Find(Identifier("amount"))->GetLiteral().AsU64(), 1000u);
    EXPECT_EQ(decoded.Find(Identifier("missing")), nullptr);
}

TEST(PlaintextTest, StructHasNoLiteral) {
    Plaintext::Members members;
    members.emplace_back(Identifier("a"), Plaintext(Literal::FromU8(1)));
    Plaintext plaintext(std::move(members));
    EXPECT_TRUE(plaintext.IsStruct());
    EXPECT_THROW(plaintext.GetLiteral(), ValueKindError);
}

TEST(PlaintextTest, SymmetricEncryption) {
    Plaintext plaintext(Literal::FromU64(123456));
    Field key(uint64_t(42));
    Ciphertext ciphertext = plaintext.EncryptSymmetric(key);
    EXPECT_EQ(ciphertext.Size(), plaintext.ToFields().size());
    EXPECT_NE(ciphertext.ToFields(), plaintext.ToFields());
    EXPECT_EQ(ciphertext.DecryptSymmetric(key), plaintext);

    // Encryption is deterministic in the key
    EXPECT_EQ(plaintext.EncryptSymmetric(key), ciphertext);
    EXPECT_NE(plaintext.EncryptSymmetric(Field(uint64_t(43))), ciphertext);
}

TEST(PlaintextTest, ValueKinds) {
    Value value(Plaintext(Literal::FromU64(1)));
    EXPECT_TRUE(value.IsPlaintext());
    EXPECT_FALSE(value.IsRecord());
    EXPECT_EQ(value.AsRecord(), nullptr);
    ASSERT_NE(value.AsPlaintext(), nullptr);
}

TEST(PlaintextTest, ValueDecodeRejectsUnknownVariant) {
    std::vector<Byte> bytes = {0x02};
    EXPECT_THROW(FromBytesLE<Value>(bytes), DecodeError);
}

// ============================================================================
// Record Tests
// ============================================================================

class RecordTest : public ::testing::Test {
protected:
    PrivateKey key_ = PrivateKey::FromSeed(Field(uint64_t(50)));
    Address owner_ = Address::FromPrivateKey(key_);
    Scalar randomizer_ = Scalar::FromUint64(1234);
    ProgramID program_{Identifier("token"), Identifier("aleo")};

    Record MakeRecord(Visibility ownerMode = Visibility::Private, Visibility gatesMode = Visibility::Private) const {
        Record::Entries entries;
        entries.emplace_back(Identifier("amount"),
                             Record::Entry{Visibility::Private, Plaintext(Literal::FromU64(500))});
        entries.emplace_back(Identifier("memo"),
                             Record::Entry{Visibility::Public, Plaintext(Literal::FromU32(9))});
        return Record(owner_, ownerMode, 75, gatesMode, std::move(entries),
                      network::GScalarMultiply(randomizer_));
    }
};

TEST_F(RecordTest, ConstantOwnerOrGatesRejected) {
    EXPECT_THROW(MakeRecord(Visibility::Constant, Visibility::Private), Error);
    EXPECT_THROW(MakeRecord(Visibility::Private, Visibility::Constant), Error);
}

TEST_F(RecordTest, EncryptDecrypt) {
    Record record = MakeRecord();
    RecordCiphertext ciphertext = record.Encrypt(randomizer_);
    EXPECT_EQ(ciphertext.Nonce(), record.Nonce());
    EXPECT_EQ(ciphertext.OwnerMode(), Visibility::Private);

    ViewKey viewKey = ViewKey::FromPrivateKey(key_);
    EXPECT_TRUE(ciphertext.IsOwner(viewKey));
    EXPECT_EQ(ciphertext.Decrypt(viewKey), record);
}

TEST_F(RecordTest, PublicComponentsStayInClear) {
    Record record = MakeRecord(Visibility::Public, Visibility::Public);
    RecordCiphertext ciphertext = record.Encrypt(randomizer_);
    const auto& memo = ciphertext.Data()[1].second;
    EXPECT_EQ(memo.mode, Visibility::Public);
    EXPECT_EQ(memo.plaintext, Plaintext(Literal::FromU32(9)));
    EXPECT_EQ(ciphertext.Decrypt(ViewKey::FromPrivateKey(key_)), record);
}

TEST_F(RecordTest, OtherViewKeyIsNotOwner) {
    RecordCiphertext ciphertext = MakeRecord().Encrypt(randomizer_);
    ViewKey other = ViewKey::FromPrivateKey(PrivateKey::FromSeed(Field(uint64_t(51))));
    EXPECT_FALSE(ciphertext.IsOwner(other));
}

TEST_F(RecordTest, EncryptRequiresMatchingNonce) {
    Record record = MakeRecord();
    EXPECT_THROW(record.Encrypt(Scalar::FromUint64(1)), CheckError);
}

TEST_F(RecordTest, CommitmentBindsProgramAndName) {
    Record record = MakeRecord();
    Field commitment = record.ToCommitment(program_, Identifier("token"));
    EXPECT_EQ(commitment, record.ToCommitment(program_, Identifier("token")));
    EXPECT_NE(commitment, record.ToCommitment(program_, Identifier("coin")));
    EXPECT_NE(commitment, record.ToCommitment(ProgramID(Identifier("other"), Identifier("aleo")),
                                              Identifier("token")));
}

TEST_F(RecordTest, SerialNumberAndTag) {
    Field commitment = MakeRecord().ToCommitment(program_, Identifier("token"));
    Point gamma = Point::MulGenerator(key_.SkSig());
    Field sn = Record::SerialNumberFromGamma(gamma, commitment);
    EXPECT_EQ(sn, Record::SerialNumberFromGamma(gamma, commitment));
    EXPECT_NE(sn, Record::SerialNumberFromGamma(gamma, commitment + Field::One()));

    Field skTag = GraphKey::FromViewKey(ViewKey::FromPrivateKey(key_)).SkTag();
    EXPECT_EQ(Record::Tag(skTag, commitment), network::HashPSD2({skTag, commitment}));
}

TEST_F(RecordTest, GatesRange) {
    Record valid(owner_, Visibility::Private, (Gates(1) << GATES_BITS) - 1, Visibility::Private, {},
                 Point::Generator());
    Record invalid(owner_, Visibility::Private, Gates(1) << GATES_BITS, Visibility::Private, {},
                   Point::Generator());
    EXPECT_TRUE(valid.HasValidGates());
    EXPECT_FALSE(invalid.HasValidGates());
}

TEST_F(RecordTest, EncodingRoundTrip) {
    Record record = MakeRecord();
    EXPECT_EQ(FromBytesLE<Record>(ToBytesLE(record)), record);

    RecordCiphertext ciphertext = record.Encrypt(randomizer_);
    EXPECT_EQ(FromBytesLE<RecordCiphertext>(ToBytesLE(ciphertext)), ciphertext);
}
