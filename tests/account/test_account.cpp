// VEIL - Account Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>
#include "veil/account/keys.h"
#include "veil/account/signature.h"
#include "veil/network/network.h"

using namespace veil;

// ============================================================================
// Key Derivation Tests
// ============================================================================

TEST(KeysTest, SeedDerivationIsDeterministic) {
    PrivateKey a = PrivateKey::FromSeed(Field(uint64_t(1)));
    PrivateKey b = PrivateKey::FromSeed(Field(uint64_t(1)));
    EXPECT_EQ(a.SkSig(), b.SkSig());
    EXPECT_EQ(a.RSig(), b.RSig());
    EXPECT_EQ(Address::FromPrivateKey(a), Address::FromPrivateKey(b));

    PrivateKey c = PrivateKey::FromSeed(Field(uint64_t(2)));
    EXPECT_NE(Address::FromPrivateKey(a), Address::FromPrivateKey(c));
}

TEST(KeysTest, AddressPathsAgree) {
    PrivateKey key = PrivateKey::FromSeed(Field(uint64_t(5)));
    Address address = Address::FromPrivateKey(key);
    EXPECT_EQ(ComputeKey::FromPrivateKey(key).ToAddress(), address);
    EXPECT_EQ(ViewKey::FromPrivateKey(key).ToAddress(), address);
}

TEST(KeysTest, ComputeKeyRebuildsFromPoints) {
    ComputeKey original = ComputeKey::FromPrivateKey(PrivateKey::FromSeed(Field(uint64_t(6))));
    ComputeKey rebuilt(original.PkSig(), original.PrSig());
    EXPECT_EQ(rebuilt, original);
    EXPECT_EQ(rebuilt.SkPrf(), original.SkPrf());
    EXPECT_EQ(rebuilt.ToAddress(), original.ToAddress());
}

TEST(KeysTest, RandomKeysDiffer) {
    DeterministicRng rng(10);
    PrivateKey a = PrivateKey::New(rng);
    PrivateKey b = PrivateKey::New(rng);
    EXPECT_NE(a.Seed(), b.Seed());
    EXPECT_NE(Address::FromPrivateKey(a), Address::FromPrivateKey(b));
}

TEST(KeysTest, AddressStringRoundTrip) {
    Address address = Address::FromPrivateKey(PrivateKey::FromSeed(Field(uint64_t(7))));
    std::string str = address.ToString();
    auto parsed = Address::FromString(str);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, address);

    EXPECT_FALSE(Address::FromString("not-an-address").has_value());
}

TEST(KeysTest, GraphKeyDependsOnViewKey) {
    Field a = GraphKey::FromViewKey(ViewKey::FromPrivateKey(PrivateKey::FromSeed(Field(uint64_t(1))))).SkTag();
    Field b = GraphKey::FromViewKey(ViewKey::FromPrivateKey(PrivateKey::FromSeed(Field(uint64_t(2))))).SkTag();
    EXPECT_NE(a, b);
}

// ============================================================================
// Signature Tests
// ============================================================================

class SignatureTest : public ::testing::Test {
protected:
    PrivateKey key_ = PrivateKey::FromSeed(Field(uint64_t(9)));
    Address address_ = Address::FromPrivateKey(key_);
    std::vector<Field> message_{Field(uint64_t(1)), Field(uint64_t(2)), Field(uint64_t(3))};
    DeterministicRng rng_{1};
};

TEST_F(SignatureTest, SignVerify) {
    Signature sig = Signature::Sign(key_, message_, rng_);
    EXPECT_TRUE(sig.Verify(address_, message_));
    EXPECT_EQ(sig.GetComputeKey(), ComputeKey::FromPrivateKey(key_));
}

TEST_F(SignatureTest, EmptyMessage) {
    Signature sig = Signature::Sign(key_, {}, rng_);
    EXPECT_TRUE(sig.Verify(address_, {}));
    EXPECT_FALSE(sig.Verify(address_, message_));
}

TEST_F(SignatureTest, TamperedMessageFails) {
    Signature sig = Signature::Sign(key_, message_, rng_);
    auto tampered = message_;
    tampered[1] = Field(uint64_t(20));
    EXPECT_FALSE(sig.Verify(address_, tampered));
}

TEST_F(SignatureTest, WrongAddressFails) {
    Signature sig = Signature::Sign(key_, message_, rng_);
    Address other = Address::FromPrivateKey(PrivateKey::FromSeed(Field(uint64_t(10))));
    EXPECT_FALSE(sig.Verify(other, message_));
}

TEST_F(SignatureTest, TamperedResponseFails) {
    Signature sig = Signature::Sign(key_, message_, rng_);
    Signature tampered(sig.Challenge(), sig.Response() + Scalar::FromUint64(1), sig.GetComputeKey());
    EXPECT_FALSE(tampered.Verify(address_, message_));
}

TEST_F(SignatureTest, NoncePointMatchesSigningNonce) {
    Signature a = Signature::Sign(key_, message_, rng_);
    Signature b = Signature::Sign(key_, message_, rng_);
    EXPECT_NE(a.ToNoncePoint(), b.ToNoncePoint());
    EXPECT_NE(a, b);
}

TEST_F(SignatureTest, EncodingRoundTrip) {
    Signature sig = Signature::Sign(key_, message_, rng_);
    Signature decoded = FromBytesLE<Signature>(ToBytesLE(sig));
    EXPECT_EQ(decoded, sig);
    EXPECT_TRUE(decoded.Verify(address_, message_));
}
