// ANCHORZK - BN254 G1 Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/crypto/bn254.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>

#include <cstring>
#include <stdexcept>

namespace anchorzk {
namespace bn254 {

// ============================================================================
// Constants
// ============================================================================

const std::array<uint8_t, 32> BASE_FIELD_MODULUS = {{
    0x30, 0x64, 0x4e, 0x72, 0xe1, 0x31, 0xa0, 0x29,
    0xb8, 0x50, 0x45, 0xb6, 0x81, 0x81, 0x58, 0x5d,
    0x97, 0x81, 0x6a, 0x91, 0x68, 0x71, 0xca, 0x8d,
    0x3c, 0x20, 0x8c, 0x16, 0xd8, 0x7c, 0xfd, 0x47
}};

const std::array<uint8_t, 32> GROUP_ORDER = {{
    0x30, 0x64, 0x4e, 0x72, 0xe1, 0x31, 0xa0, 0x29,
    0xb8, 0x50, 0x45, 0xb6, 0x81, 0x81, 0x58, 0x5d,
    0x28, 0x33, 0xe8, 0x48, 0x79, 0xb9, 0x70, 0x91,
    0x43, 0xe1, 0xf5, 0x93, 0xf0, 0x00, 0x00, 0x01
}};

namespace {

// ============================================================================
// OpenSSL RAII Helpers
// ============================================================================

struct BnFree { void operator()(BIGNUM* bn) const { BN_free(bn); } };
struct BnCtxFree { void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); } };
struct GroupFree { void operator()(EC_GROUP* group) const { EC_GROUP_free(group); } };
struct PointFree { void operator()(EC_POINT* point) const { EC_POINT_free(point); } };

using BnPtr = std::unique_ptr<BIGNUM, BnFree>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxFree>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupFree>;
using PointPtr = std::unique_ptr<EC_POINT, PointFree>;

[[noreturn]] void ThrowOpenSSL(const char* what) {
    ERR_clear_error();
    throw std::runtime_error(std::string("bn254: ") + what);
}

BnCtxPtr NewCtx() {
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) ThrowOpenSSL("BN_CTX_new failed");
    return ctx;
}

BnPtr BigNumFromBytes(const uint8_t* data, size_t len) {
    BnPtr bn(BN_bin2bn(data, static_cast<int>(len), nullptr));
    if (!bn) ThrowOpenSSL("BN_bin2bn failed");
    return bn;
}

BnPtr BigNumFromWord(unsigned long word) {
    BnPtr bn(BN_new());
    if (!bn || BN_set_word(bn.get(), word) != 1) ThrowOpenSSL("BN_set_word failed");
    return bn;
}

BaseFieldElement BigNumToBase(const BIGNUM* bn) {
    std::array<uint8_t, 32> out{};
    if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) != 32) {
        ThrowOpenSSL("BN_bn2binpad failed");
    }
    return BaseFieldElement(out);
}

EC_GROUP* BuildGroup() {
    BnCtxPtr ctx = NewCtx();
    BnPtr p = BigNumFromBytes(BASE_FIELD_MODULUS.data(), BASE_FIELD_MODULUS.size());
    BnPtr order = BigNumFromBytes(GROUP_ORDER.data(), GROUP_ORDER.size());
    BnPtr a = BigNumFromWord(0);
    BnPtr b = BigNumFromWord(CURVE_B);
    BnPtr cofactor = BigNumFromWord(1);
    BnPtr gx = BigNumFromWord(1);
    BnPtr gy = BigNumFromWord(2);

    GroupPtr group(EC_GROUP_new_curve_GFp(p.get(), a.get(), b.get(), ctx.get()));
    if (!group) ThrowOpenSSL("EC_GROUP_new_curve_GFp failed");

    PointPtr generator(EC_POINT_new(group.get()));
    if (!generator ||
        EC_POINT_set_affine_coordinates(group.get(), generator.get(), gx.get(), gy.get(), ctx.get()) != 1 ||
        EC_GROUP_set_generator(group.get(), generator.get(), order.get(), cofactor.get()) != 1) {
        ThrowOpenSSL("generator setup failed");
    }
    return group.release();
}

/// Curve group shared by every point. Only read after construction.
const EC_GROUP* Group() {
    static const GroupPtr group(BuildGroup());
    return group.get();
}

PointPtr NewPoint() {
    PointPtr point(EC_POINT_new(Group()));
    if (!point) ThrowOpenSSL("EC_POINT_new failed");
    return point;
}

BnPtr ScalarToBigNum(const Scalar& scalar) {
    auto bytes = scalar.ToBytes();
    return BigNumFromBytes(bytes.data(), bytes.size());
}

bool AllZero(const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        if (data[i] != 0) return false;
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// BaseFieldElement Implementation
// ============================================================================

BaseFieldElement::BaseFieldElement() {
    data_.fill(0);
}

BaseFieldElement::BaseFieldElement(const uint8_t* data) {
    std::memcpy(data_.data(), data, SIZE);
}

BaseFieldElement::BaseFieldElement(const std::array<uint8_t, SIZE>& data) : data_(data) {}

BaseFieldElement BaseFieldElement::FromUint64(uint64_t value) {
    std::array<uint8_t, SIZE> bytes{};
    for (size_t i = 0; i < 8; ++i) {
        bytes[SIZE - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return BaseFieldElement(bytes);
}

bool BaseFieldElement::IsZero() const {
    return AllZero(data_.data(), SIZE);
}

bool BaseFieldElement::IsValid() const {
    return data_ < BASE_FIELD_MODULUS;
}

std::array<uint8_t, BaseFieldElement::SIZE> BaseFieldElement::ToBytesLE() const {
    std::array<uint8_t, SIZE> out;
    for (size_t i = 0; i < SIZE; ++i) {
        out[i] = data_[SIZE - 1 - i];
    }
    return out;
}

// ============================================================================
// Point Implementation
// ============================================================================

struct Point::Impl {
    PointPtr point;

    Impl() : point(NewPoint()) {
        if (EC_POINT_set_to_infinity(Group(), point.get()) != 1) {
            ThrowOpenSSL("EC_POINT_set_to_infinity failed");
        }
    }

    Impl(const Impl& other) : point(EC_POINT_dup(other.point.get(), Group())) {
        if (!point) ThrowOpenSSL("EC_POINT_dup failed");
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

Point::Point(Point&& other) : impl_(std::make_unique<Impl>()) {
    impl_.swap(other.impl_);
}

Point& Point::operator=(Point&& other) noexcept {
    impl_.swap(other.impl_);
    return *this;
}

std::optional<Point> Point::FromAffine(const BaseFieldElement& x, const BaseFieldElement& y) {
    if (!x.IsValid() || !y.IsValid()) return std::nullopt;

    BnCtxPtr ctx = NewCtx();
    BnPtr bx = BigNumFromBytes(x.data(), BaseFieldElement::SIZE);
    BnPtr by = BigNumFromBytes(y.data(), BaseFieldElement::SIZE);

    Point result;
    if (EC_POINT_set_affine_coordinates(Group(), result.impl_->point.get(),
                                        bx.get(), by.get(), ctx.get()) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }
    return result;
}

std::optional<Point> Point::FromX(const BaseFieldElement& x, bool largestY) {
    std::array<uint8_t, COMPRESSED_SIZE> encoded;
    encoded[0] = 0x02;
    std::memcpy(encoded.data() + 1, x.data(), BaseFieldElement::SIZE);

    auto point = FromCompressed(encoded);
    if (!point || point->IsIdentity()) return std::nullopt;

    // The even root is one of (y, q - y); pick by numeric size
    BaseFieldElement y = *point->AffineY();
    BaseFieldElement negY = *(-*point).AffineY();
    bool haveLargest = negY < y;
    if (haveLargest != largestY) {
        return -*point;
    }
    return point;
}

std::optional<Point> Point::FromCompressed(const uint8_t* data) {
    if (!data) return std::nullopt;
    if (AllZero(data, COMPRESSED_SIZE)) return Point();
    if (data[0] != 0x02 && data[0] != 0x03) return std::nullopt;

    BnCtxPtr ctx = NewCtx();
    Point result;
    if (EC_POINT_oct2point(Group(), result.impl_->point.get(), data, COMPRESSED_SIZE, ctx.get()) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }
    return result;
}

std::optional<Point> Point::FromCompressed(const std::array<uint8_t, COMPRESSED_SIZE>& data) {
    return FromCompressed(data.data());
}

std::optional<Point> Point::FromUncompressed(const uint8_t* data) {
    if (!data) return std::nullopt;
    if (AllZero(data, UNCOMPRESSED_SIZE)) return Point();
    if (data[0] != 0x04) return std::nullopt;

    BnCtxPtr ctx = NewCtx();
    Point result;
    if (EC_POINT_oct2point(Group(), result.impl_->point.get(), data, UNCOMPRESSED_SIZE, ctx.get()) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }
    return result;
}

std::optional<Point> Point::FromBytes(const uint8_t* data, size_t len) {
    if (len == COMPRESSED_SIZE) return FromCompressed(data);
    if (len == UNCOMPRESSED_SIZE) return FromUncompressed(data);
    return std::nullopt;
}

std::optional<Point> Point::FromBytes(const std::vector<uint8_t>& data) {
    return FromBytes(data.data(), data.size());
}

bool Point::IsIdentity() const {
    return EC_POINT_is_at_infinity(Group(), impl_->point.get()) == 1;
}

bool Point::IsOnCurve() const {
    BnCtxPtr ctx = NewCtx();
    int ret = EC_POINT_is_on_curve(Group(), impl_->point.get(), ctx.get());
    if (ret < 0) {
        ERR_clear_error();
        return false;
    }
    return ret == 1;
}

std::optional<BaseFieldElement> Point::AffineX() const {
    if (IsIdentity()) return std::nullopt;

    BnCtxPtr ctx = NewCtx();
    BnPtr x(BN_new());
    if (!x || EC_POINT_get_affine_coordinates(Group(), impl_->point.get(), x.get(), nullptr, ctx.get()) != 1) {
        ThrowOpenSSL("EC_POINT_get_affine_coordinates failed");
    }
    return BigNumToBase(x.get());
}

std::optional<BaseFieldElement> Point::AffineY() const {
    if (IsIdentity()) return std::nullopt;

    BnCtxPtr ctx = NewCtx();
    BnPtr y(BN_new());
    if (!y || EC_POINT_get_affine_coordinates(Group(), impl_->point.get(), nullptr, y.get(), ctx.get()) != 1) {
        ThrowOpenSSL("EC_POINT_get_affine_coordinates failed");
    }
    return BigNumToBase(y.get());
}

std::array<uint8_t, Point::COMPRESSED_SIZE> Point::ToCompressed() const {
    std::array<uint8_t, COMPRESSED_SIZE> result{};
    if (IsIdentity()) return result;

    BnCtxPtr ctx = NewCtx();
    if (EC_POINT_point2oct(Group(), impl_->point.get(), POINT_CONVERSION_COMPRESSED,
                           result.data(), COMPRESSED_SIZE, ctx.get()) != COMPRESSED_SIZE) {
        ThrowOpenSSL("EC_POINT_point2oct failed");
    }
    return result;
}

std::array<uint8_t, Point::UNCOMPRESSED_SIZE> Point::ToUncompressed() const {
    std::array<uint8_t, UNCOMPRESSED_SIZE> result{};
    if (IsIdentity()) return result;

    BnCtxPtr ctx = NewCtx();
    if (EC_POINT_point2oct(Group(), impl_->point.get(), POINT_CONVERSION_UNCOMPRESSED,
                           result.data(), UNCOMPRESSED_SIZE, ctx.get()) != UNCOMPRESSED_SIZE) {
        ThrowOpenSSL("EC_POINT_point2oct failed");
    }
    return result;
}

Point Point::operator+(const Point& other) const {
    BnCtxPtr ctx = NewCtx();
    Point result;
    if (EC_POINT_add(Group(), result.impl_->point.get(), impl_->point.get(),
                     other.impl_->point.get(), ctx.get()) != 1) {
        ThrowOpenSSL("EC_POINT_add failed");
    }
    return result;
}

Point Point::operator-(const Point& other) const {
    return *this + (-other);
}

Point Point::operator-() const {
    BnCtxPtr ctx = NewCtx();
    Point result(*this);
    if (EC_POINT_invert(Group(), result.impl_->point.get(), ctx.get()) != 1) {
        ThrowOpenSSL("EC_POINT_invert failed");
    }
    return result;
}

Point Point::operator*(const Scalar& scalar) const {
    BnCtxPtr ctx = NewCtx();
    BnPtr k = ScalarToBigNum(scalar);
    Point result;
    if (EC_POINT_mul(Group(), result.impl_->point.get(), nullptr,
                     impl_->point.get(), k.get(), ctx.get()) != 1) {
        ThrowOpenSSL("EC_POINT_mul failed");
    }
    return result;
}

bool Point::operator==(const Point& other) const {
    BnCtxPtr ctx = NewCtx();
    int ret = EC_POINT_cmp(Group(), impl_->point.get(), other.impl_->point.get(), ctx.get());
    if (ret < 0) ThrowOpenSSL("EC_POINT_cmp failed");
    return ret == 0;
}

Point Point::Generator() {
    Point result;
    if (EC_POINT_copy(result.impl_->point.get(), EC_GROUP_get0_generator(Group())) != 1) {
        ThrowOpenSSL("EC_POINT_copy failed");
    }
    return result;
}

Point Point::MulGenerator(const Scalar& scalar) {
    BnCtxPtr ctx = NewCtx();
    BnPtr k = ScalarToBigNum(scalar);
    Point result;
    if (EC_POINT_mul(Group(), result.impl_->point.get(), k.get(), nullptr, nullptr, ctx.get()) != 1) {
        ThrowOpenSSL("EC_POINT_mul failed");
    }
    return result;
}

} // namespace bn254
} // namespace anchorzk
