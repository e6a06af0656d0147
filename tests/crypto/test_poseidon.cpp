// VEIL - Field and Poseidon Tests
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Tests for BN254 scalar field arithmetic and the Poseidon sponge

#include <gtest/gtest.h>
#include "veil/crypto/field.h"
#include "veil/crypto/poseidon.h"
#include "veil/core/errors.h"
#include "veil/core/serialize.h"

#include <vector>

using namespace veil;

// ============================================================================
// Uint256 Tests
// ============================================================================

TEST(Uint256Test, DefaultConstructorIsZero) {
    Uint256 a;
    EXPECT_TRUE(a.IsZero());
}

TEST(Uint256Test, HexRoundTrip) {
    Uint256 a = Uint256::FromHex("0x0000000000000000000000000000000000000000000000000000000000000001");
    EXPECT_EQ(a.limbs[0], 1ULL);
    EXPECT_EQ(a.ToHex(), "0000000000000000000000000000000000000000000000000000000000000001");
}

TEST(Uint256Test, AdditionCarriesAcrossLimbs) {
    Uint256 a(0xFFFFFFFFFFFFFFFFULL, 0, 0, 0);
    bool carry = true;
    Uint256 c = Uint256::Add(a, Uint256(1), carry);
    EXPECT_EQ(c.limbs[0], 0ULL);
    EXPECT_EQ(c.limbs[1], 1ULL);
    EXPECT_FALSE(carry);
}

TEST(Uint256Test, SubtractionBorrowsAcrossLimbs) {
    bool borrow = true;
    Uint256 c = Uint256::Sub(Uint256(0, 1, 0, 0), Uint256(1), borrow);
    EXPECT_EQ(c.limbs[0], 0xFFFFFFFFFFFFFFFFULL);
    EXPECT_EQ(c.limbs[1], 0ULL);
    EXPECT_FALSE(borrow);
}

// ============================================================================
// FieldElement Tests
// ============================================================================

TEST(FieldElementTest, ZeroAndOne) {
    EXPECT_TRUE(Field::Zero().IsZero());
    EXPECT_TRUE(Field::One().IsOne());
    EXPECT_EQ(Field::One().ToUint256(), Uint256(1));
}

TEST(FieldElementTest, Arithmetic) {
    EXPECT_EQ((Field(1) + Field(2)).ToUint256(), Uint256(3));
    EXPECT_EQ((Field(5) - Field(3)).ToUint256(), Uint256(2));
    EXPECT_EQ((Field(3) * Field(4)).ToUint256(), Uint256(12));
    EXPECT_EQ(Field(5).Square().ToUint256(), Uint256(25));
    EXPECT_EQ(Field(2).PoseidonSbox().ToUint256(), Uint256(32));
    EXPECT_EQ(Field(2).Pow(10).ToUint256(), Uint256(1024));
}

TEST(FieldElementTest, NegationAndInverse) {
    Field a(3);
    EXPECT_TRUE((a + (-a)).IsZero());
    EXPECT_EQ(a * a.Inverse(), Field::One());
}

TEST(FieldElementTest, SubtractionWrapsModulus) {
    Field diff = Field(1) - Field(2);
    EXPECT_EQ(diff + Field(1), Field::Zero());
}

TEST(FieldElementTest, RootOfUnityHasExactOrder) {
    Field omega = Field::RootOfUnity(3);
    EXPECT_EQ(omega.Pow(8), Field::One());
    EXPECT_NE(omega.Pow(4), Field::One());
    EXPECT_THROW(Field::RootOfUnity(Field::TWO_ADICITY + 1), std::invalid_argument);
}

TEST(FieldElementTest, BitsRoundTrip) {
    Field a = Field::FromDomain("bits");
    Bits bits = a.ToBitsLE();
    EXPECT_EQ(bits.size(), Field::SIZE_IN_BITS);
    EXPECT_EQ(Field::FromBitsLE(bits), a);
}

TEST(FieldElementTest, NonCanonicalEncodingRejected) {
    std::vector<Byte> bytes(32, 0xFF);
    EXPECT_FALSE(Field::FromCanonicalBytes(bytes.data(), bytes.size()).has_value());
    EXPECT_THROW(FromBytesLE<Field>(bytes), DecodeError);
}

TEST(FieldElementTest, FromDomainIsDeterministic) {
    EXPECT_EQ(Field::FromDomain("AleoOutputDomain"), Field::FromDomain("AleoOutputDomain"));
    EXPECT_NE(Field::FromDomain("a"), Field::FromDomain("b"));
}

// ============================================================================
// Poseidon Hash Tests
// ============================================================================

TEST(PoseidonTest, HashDeterministic) {
    Poseidon hasher(2);
    std::vector<Field> input = {Field(1), Field(2)};
    EXPECT_EQ(hasher.Hash(input), hasher.Hash(input));
}

TEST(PoseidonTest, HashOrderMatters) {
    Poseidon hasher(2);
    EXPECT_NE(hasher.Hash({Field(1), Field(2)}), hasher.Hash({Field(2), Field(1)}));
}

TEST(PoseidonTest, RateSeparatesDomains) {
    Poseidon p2(2);
    Poseidon p4(4);
    std::vector<Field> input = {Field(7)};
    EXPECT_EQ(p2.Rate(), 2u);
    EXPECT_NE(p2.Hash(input), p4.Hash(input));
}

TEST(PoseidonTest, HashManyDistinctOutputs) {
    Poseidon hasher(4);
    std::vector<Field> input = {Field(3), Field(4), Field(5)};
    auto outputs = hasher.HashMany(input, 3);
    ASSERT_EQ(outputs.size(), 3u);
    EXPECT_NE(outputs[0], outputs[1]);
    EXPECT_NE(outputs[1], outputs[2]);
}

TEST(PoseidonTest, SpongeAbsorbInPiecesMatchesWhole) {
    const auto& params = PoseidonParameters::ForRate(2);
    Field domain = Field::FromDomain("sponge");

    PoseidonSponge a(params, domain);
    a.Absorb({Field(1), Field(2), Field(3)});

    PoseidonSponge b(params, domain);
    b.Absorb(Field(1)).Absorb(Field(2)).Absorb(Field(3));

    EXPECT_EQ(a.Squeeze(), b.Squeeze());
}

TEST(PoseidonTest, HashToGroupIsOnCurve) {
    Poseidon hasher(2);
    Point p = hasher.HashToGroup({Field(9)});
    EXPECT_FALSE(p.IsInfinity());
    EXPECT_EQ(p, hasher.HashToGroup({Field(9)}));
}
