// VEIL - Group and BHP Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>
#include "veil/crypto/group.h"
#include "veil/crypto/bhp.h"
#include "veil/core/errors.h"
#include "veil/core/serialize.h"

using namespace veil;

// ============================================================================
// Scalar Tests
// ============================================================================

TEST(ScalarTest, Arithmetic) {
    Scalar a = Scalar::FromUint64(6);
    Scalar b = Scalar::FromUint64(7);
    EXPECT_EQ(a * b, Scalar::FromUint64(42));
    EXPECT_EQ(a + b - b, a);
    EXPECT_TRUE((a + (-a)).IsZero());
    EXPECT_EQ(a * a.Inverse(), Scalar::FromUint64(1));
}

TEST(ScalarTest, RandomFromSeededRng) {
    DeterministicRng rng1(11);
    DeterministicRng rng2(11);
    EXPECT_EQ(Scalar::Random(rng1), Scalar::Random(rng2));
}

// ============================================================================
// Point Tests
// ============================================================================

TEST(PointTest, DefaultIsIdentity) {
    Point p;
    EXPECT_TRUE(p.IsInfinity());
    EXPECT_EQ(p + Point::Generator(), Point::Generator());
}

TEST(PointTest, ScalarMultiplicationDistributes) {
    Point g = Point::Generator();
    Scalar two = Scalar::FromUint64(2);
    Scalar three = Scalar::FromUint64(3);
    EXPECT_EQ(g * two + g * three, g * Scalar::FromUint64(5));
    EXPECT_EQ(Point::MulGenerator(three), g * three);
    EXPECT_TRUE((g - g).IsInfinity());
}

TEST(PointTest, CompressedRoundTrip) {
    Point p = Point::MulGenerator(Scalar::FromUint64(12345));
    auto bytes = ToBytesLE(p);
    ASSERT_EQ(bytes.size(), Point::COMPRESSED_SIZE);
    EXPECT_EQ(FromBytesLE<Point>(bytes), p);
}

TEST(PointTest, IdentityEncodesAsZeros) {
    auto bytes = ToBytesLE(Point());
    for (Byte b : bytes) {
        EXPECT_EQ(b, 0);
    }
    EXPECT_TRUE(FromBytesLE<Point>(bytes).IsInfinity());
}

TEST(PointTest, InvalidPrefixRejected) {
    std::vector<Byte> bytes(Point::COMPRESSED_SIZE, 0x01);
    bytes[0] = 0x05;
    EXPECT_THROW(FromBytesLE<Point>(bytes), DecodeError);
}

TEST(PointTest, HashToGroupSeparatesDomains) {
    EXPECT_EQ(Point::HashToGroup("a"), Point::HashToGroup("a"));
    EXPECT_NE(Point::HashToGroup("a"), Point::HashToGroup("b"));
}

// ============================================================================
// BHP Tests
// ============================================================================

class BHPTest : public ::testing::Test {
protected:
    BHP bhp_{"VEIL.BHP.Test", 4, 32};
};

TEST_F(BHPTest, Deterministic) {
    Bits input = {true, false, true, true, false};
    EXPECT_EQ(bhp_.Hash(input), bhp_.Hash(input));
}

TEST_F(BHPTest, DifferentInputsDiffer) {
    Bits a = {true, false, true};
    Bits b = {true, true, true};
    EXPECT_NE(bhp_.Hash(a), bhp_.Hash(b));
}

TEST_F(BHPTest, LongInputChained) {
    Bits input(bhp_.MaxInputBits() * 3, true);
    EXPECT_EQ(bhp_.Hash(input), bhp_.Hash(input));
}

TEST_F(BHPTest, CommitDependsOnRandomizer) {
    Bits input = {false, true};
    EXPECT_NE(bhp_.Commit(input, Scalar::FromUint64(1)), bhp_.Commit(input, Scalar::FromUint64(2)));
}

TEST(BHPConstructTest, RejectsEmptyShape) {
    EXPECT_THROW(BHP("VEIL.BHP.Empty", 0, 8), Error);
    EXPECT_THROW(BHP("VEIL.BHP.Small", 2, 8), Error);
}
