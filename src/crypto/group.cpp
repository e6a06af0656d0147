// VEIL - Prime-Order Group Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/crypto/group.h"
#include "veil/crypto/sha256.h"
#include "veil/core/errors.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <cstring>

namespace veil {

const std::array<Byte, 32> CURVE_ORDER = {{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
}};

namespace {

struct BNDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};
struct BNCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;
using BNCtxPtr = std::unique_ptr<BN_CTX, BNCtxDeleter>;

void CheckSSL(int ok, const char* what) {
    if (ok != 1) {
        ERR_clear_error();
        throw Error(std::string("OpenSSL failure: ") + what);
    }
}

template<typename T>
T* CheckAlloc(T* ptr, const char* what) {
    if (!ptr) {
        throw Error(std::string("OpenSSL allocation failed: ") + what);
    }
    return ptr;
}

BNCtxPtr NewCtx() {
    return BNCtxPtr(CheckAlloc(BN_CTX_new(), "BN_CTX"));
}

BNPtr NewBN(const Byte* be, size_t len) {
    return BNPtr(CheckAlloc(BN_bin2bn(be, static_cast<int>(len), nullptr), "BIGNUM"));
}

const BIGNUM* Order() {
    static const BIGNUM* order = BN_bin2bn(CURVE_ORDER.data(), 32, nullptr);
    return CheckAlloc(order, "curve order");
}

/// One secp256k1 group shared by every point for the process lifetime
const EC_GROUP* SharedGroup() {
    static const EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    return CheckAlloc(group, "EC_GROUP");
}

std::array<Byte, 32> ToBE32(const BIGNUM* bn) {
    std::array<Byte, 32> out{};
    CheckSSL(BN_bn2binpad(bn, out.data(), 32) == 32 ? 1 : 0, "BN_bn2binpad");
    return out;
}

template<typename Op>
std::array<Byte, 32> ModOp(const std::array<Byte, 32>& a, const std::array<Byte, 32>& b, Op op) {
    auto ctx = NewCtx();
    auto ba = NewBN(a.data(), 32);
    auto bb = NewBN(b.data(), 32);
    BNPtr r(CheckAlloc(BN_new(), "BIGNUM"));
    CheckSSL(op(r.get(), ba.get(), bb.get(), Order(), ctx.get()), "modular arithmetic");
    return ToBE32(r.get());
}

} // namespace

// ============================================================================
// Scalar Implementation
// ============================================================================

Scalar::Scalar() {
    data_.fill(0);
}

Scalar Scalar::FromBytesBE(const Byte* data, size_t len) {
    auto ctx = NewCtx();
    auto v = NewBN(data, len);
    BNPtr r(CheckAlloc(BN_new(), "BIGNUM"));
    CheckSSL(BN_nnmod(r.get(), v.get(), Order(), ctx.get()), "BN_nnmod");
    Scalar s;
    s.data_ = ToBE32(r.get());
    return s;
}

std::optional<Scalar> Scalar::FromBytesLE(const Byte* data, size_t len) {
    if (len != SIZE) {
        return std::nullopt;
    }
    Scalar s;
    std::reverse_copy(data, data + SIZE, s.data_.begin());
    if (!(s.data_ < CURVE_ORDER)) {
        return std::nullopt;
    }
    return s;
}

Scalar Scalar::FromUint64(uint64_t value) {
    Scalar s;
    for (int i = 0; i < 8; ++i) {
        s.data_[31 - i] = static_cast<Byte>(value >> (i * 8));
    }
    return s;
}

Scalar Scalar::FromField(const Field& field) {
    auto le = field.ToBytes();
    Scalar s;
    std::reverse_copy(le.begin(), le.end(), s.data_.begin());
    return s;
}

Scalar Scalar::Random(Rng& rng) {
    // 512 bits reduced modulo n keeps the bias negligible
    Byte wide[64];
    rng.Fill(wide, sizeof(wide));
    return FromBytesBE(wide, sizeof(wide));
}

Field Scalar::ToField() const {
    auto le = ToBytesLE();
    return Field(Uint256(le.data(), le.size()));
}

std::array<Byte, Scalar::SIZE> Scalar::ToBytesLE() const {
    std::array<Byte, SIZE> le;
    std::reverse_copy(data_.begin(), data_.end(), le.begin());
    return le;
}

bool Scalar::IsZero() const {
    return std::all_of(data_.begin(), data_.end(), [](Byte b) { return b == 0; });
}

Scalar Scalar::operator+(const Scalar& other) const {
    Scalar r;
    r.data_ = ModOp(data_, other.data_, BN_mod_add);
    return r;
}

Scalar Scalar::operator-(const Scalar& other) const {
    Scalar r;
    r.data_ = ModOp(data_, other.data_, BN_mod_sub);
    return r;
}

Scalar Scalar::operator*(const Scalar& other) const {
    Scalar r;
    r.data_ = ModOp(data_, other.data_, BN_mod_mul);
    return r;
}

Scalar Scalar::operator-() const {
    return Scalar() - *this;
}

Scalar Scalar::Inverse() const {
    if (IsZero()) {
        throw Error("Cannot invert the zero scalar");
    }
    auto ctx = NewCtx();
    auto a = NewBN(data_.data(), SIZE);
    BNPtr r(CheckAlloc(BN_new(), "BIGNUM"));
    CheckAlloc(BN_mod_inverse(r.get(), a.get(), Order(), ctx.get()), "BN_mod_inverse");
    Scalar s;
    s.data_ = ToBE32(r.get());
    return s;
}

// ============================================================================
// Point Implementation
// ============================================================================

struct Point::Impl {
    EC_POINT* point{nullptr};

    Impl() {
        point = CheckAlloc(EC_POINT_new(SharedGroup()), "EC_POINT");
        CheckSSL(EC_POINT_set_to_infinity(SharedGroup(), point), "EC_POINT_set_to_infinity");
    }

    Impl(const Impl& other) {
        point = CheckAlloc(EC_POINT_dup(other.point, SharedGroup()), "EC_POINT_dup");
    }

    Impl& operator=(const Impl&) = delete;

    ~Impl() {
        EC_POINT_free(point);
    }
};

Point::Point() : impl_(std::make_unique<Impl>()) {}

Point::~Point() = default;

Point::Point(const Point& other) : impl_(std::make_unique<Impl>(*other.impl_)) {}

Point& Point::operator=(const Point& other) {
    if (this != &other) {
        impl_ = std::make_unique<Impl>(*other.impl_);
    }
    return *this;
}

// A moved-from point is left as the identity so it stays usable
Point::Point(Point&& other) : impl_(std::make_unique<Impl>()) {
    impl_.swap(other.impl_);
}

Point& Point::operator=(Point&& other) {
    impl_.swap(other.impl_);
    return *this;
}

Point Point::Generator() {
    Point result;
    CheckSSL(EC_POINT_copy(result.impl_->point, EC_GROUP_get0_generator(SharedGroup())),
             "EC_POINT_copy");
    return result;
}

Point Point::MulGenerator(const Scalar& scalar) {
    Point result;
    auto ctx = NewCtx();
    auto be = scalar.ToBytesBE();
    auto k = NewBN(be.data(), be.size());
    CheckSSL(EC_POINT_mul(SharedGroup(), result.impl_->point, k.get(), nullptr, nullptr, ctx.get()),
             "EC_POINT_mul");
    return result;
}

namespace {

/// Try successive SHA-256 digests of `prefix || counter` as compressed x
/// coordinates until one lies on the curve
Point TryAndIncrement(const std::vector<Byte>& prefix) {
    auto ctx = NewCtx();
    for (uint32_t counter = 0;; ++counter) {
        Byte ctr[4];
        for (int i = 0; i < 4; ++i) ctr[i] = static_cast<Byte>(counter >> (8 * i));

        SHA256 hasher;
        Hash256 digest;
        hasher.Write(prefix.data(), prefix.size()).Write(ctr, sizeof(ctr)).Finalize(digest.data());

        auto x = NewBN(digest.data(), digest.size());
        EC_POINT* p = CheckAlloc(EC_POINT_new(SharedGroup()), "EC_POINT");
        int yBit = digest[31] & 1;
        if (EC_POINT_set_compressed_coordinates(SharedGroup(), p, x.get(), yBit, ctx.get()) == 1) {
            auto bytes = std::array<Byte, Point::COMPRESSED_SIZE>{};
            size_t n = EC_POINT_point2oct(SharedGroup(), p, POINT_CONVERSION_COMPRESSED,
                                          bytes.data(), bytes.size(), ctx.get());
            EC_POINT_free(p);
            if (n == bytes.size()) {
                auto point = Point::FromCompressed(bytes.data(), bytes.size());
                if (point && !point->IsInfinity()) {
                    return *point;
                }
            }
            continue;
        }
        EC_POINT_free(p);
        ERR_clear_error();
    }
}

} // namespace

Point Point::MapToGroup(const Field& input) {
    static const std::string tag = "VEIL.MapToGroup";
    std::vector<Byte> prefix(tag.begin(), tag.end());
    auto bytes = input.ToBytes();
    prefix.insert(prefix.end(), bytes.begin(), bytes.end());
    return TryAndIncrement(prefix);
}

Point Point::HashToGroup(const std::string& domain) {
    static const std::string tag = "VEIL.HashToGroup";
    std::vector<Byte> prefix(tag.begin(), tag.end());
    prefix.insert(prefix.end(), domain.begin(), domain.end());
    return TryAndIncrement(prefix);
}

std::optional<Point> Point::FromCompressed(const Byte* data, size_t len) {
    if (len != COMPRESSED_SIZE) {
        return std::nullopt;
    }
    Point result;
    if (std::all_of(data, data + len, [](Byte b) { return b == 0; })) {
        return result;
    }
    if (data[0] != 0x02 && data[0] != 0x03) {
        return std::nullopt;
    }
    auto ctx = NewCtx();
    if (EC_POINT_oct2point(SharedGroup(), result.impl_->point, data, len, ctx.get()) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }
    return result;
}

std::array<Byte, Point::COMPRESSED_SIZE> Point::ToCompressed() const {
    std::array<Byte, COMPRESSED_SIZE> out{};
    if (IsInfinity()) {
        return out;
    }
    auto ctx = NewCtx();
    size_t n = EC_POINT_point2oct(SharedGroup(), impl_->point, POINT_CONVERSION_COMPRESSED,
                                  out.data(), out.size(), ctx.get());
    CheckSSL(n == COMPRESSED_SIZE ? 1 : 0, "EC_POINT_point2oct");
    return out;
}

Field Point::ToXField() const {
    if (IsInfinity()) {
        return Field::Zero();
    }
    auto ctx = NewCtx();
    BNPtr x(CheckAlloc(BN_new(), "BIGNUM"));
    CheckSSL(EC_POINT_get_affine_coordinates(SharedGroup(), impl_->point, x.get(), nullptr, ctx.get()),
             "EC_POINT_get_affine_coordinates");
    auto be = ToBE32(x.get());
    std::array<Byte, 32> le;
    std::reverse_copy(be.begin(), be.end(), le.begin());
    return Field(Uint256(le.data(), le.size()));
}

Bits Point::ToBitsLE() const {
    auto bytes = ToCompressed();
    Bits bits;
    bits.reserve(COMPRESSED_SIZE * 8);
    AppendBytesLE(bits, bytes.data(), bytes.size());
    return bits;
}

bool Point::IsInfinity() const {
    return EC_POINT_is_at_infinity(SharedGroup(), impl_->point) == 1;
}

Point Point::operator+(const Point& other) const {
    Point result;
    auto ctx = NewCtx();
    CheckSSL(EC_POINT_add(SharedGroup(), result.impl_->point, impl_->point, other.impl_->point, ctx.get()),
             "EC_POINT_add");
    return result;
}

Point& Point::operator+=(const Point& other) {
    *this = *this + other;
    return *this;
}

Point Point::operator-() const {
    Point result(*this);
    auto ctx = NewCtx();
    CheckSSL(EC_POINT_invert(SharedGroup(), result.impl_->point, ctx.get()), "EC_POINT_invert");
    return result;
}

Point Point::operator-(const Point& other) const {
    return *this + (-other);
}

Point Point::operator*(const Scalar& scalar) const {
    Point result;
    auto ctx = NewCtx();
    auto be = scalar.ToBytesBE();
    auto k = NewBN(be.data(), be.size());
    CheckSSL(EC_POINT_mul(SharedGroup(), result.impl_->point, nullptr, impl_->point, k.get(), ctx.get()),
             "EC_POINT_mul");
    return result;
}

bool Point::operator==(const Point& other) const {
    auto ctx = NewCtx();
    int cmp = EC_POINT_cmp(SharedGroup(), impl_->point, other.impl_->point, ctx.get());
    CheckSSL(cmp >= 0 ? 1 : 0, "EC_POINT_cmp");
    return cmp == 0;
}

} // namespace veil
