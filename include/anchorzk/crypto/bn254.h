// ANCHORZK - BN254 G1 Group Operations
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// The prime-order group G1 of the BN254 curve, y^2 = x^3 + 3 over the
// base field Fq, generator (1, 2), cofactor 1. Group exponents are
// elements of the scalar field Fr (see field.h).

#ifndef ANCHORZK_CRYPTO_BN254_H
#define ANCHORZK_CRYPTO_BN254_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "anchorzk/core/types.h"
#include "anchorzk/crypto/field.h"

namespace anchorzk {
namespace bn254 {

// ============================================================================
// Constants
// ============================================================================

/// Base field modulus q (big-endian)
extern const std::array<uint8_t, 32> BASE_FIELD_MODULUS;

/// Group order r (big-endian), equal to FieldElement::MODULUS
extern const std::array<uint8_t, 32> GROUP_ORDER;

/// Curve parameter b (a = 0)
constexpr uint32_t CURVE_B = 3;

// ============================================================================
// Base Field Element
// ============================================================================

/**
 * An element of the base field Fq, used for point coordinates.
 * Stored as 32 bytes big-endian. No arithmetic is exposed; coordinates
 * are only produced by the group and consumed by hashing.
 */
class BaseFieldElement {
public:
    static constexpr size_t SIZE = 32;

    /// Zero
    BaseFieldElement();

    /// Construct from bytes (big-endian)
    explicit BaseFieldElement(const uint8_t* data);
    explicit BaseFieldElement(const std::array<uint8_t, SIZE>& data);

    /// Construct from a small integer
    static BaseFieldElement FromUint64(uint64_t value);

    bool IsZero() const;

    /// Check if value < q
    bool IsValid() const;

    /// Check if the least significant bit is set
    bool IsOdd() const { return (data_[SIZE - 1] & 1) != 0; }

    const uint8_t* data() const { return data_.data(); }
    const std::array<uint8_t, SIZE>& ToBytes() const { return data_; }

    /// Little-endian encoding
    std::array<uint8_t, SIZE> ToBytesLE() const;

    bool operator==(const BaseFieldElement& other) const { return data_ == other.data_; }
    bool operator!=(const BaseFieldElement& other) const { return !(*this == other); }

    /// Numeric comparison
    bool operator<(const BaseFieldElement& other) const { return data_ < other.data_; }

private:
    std::array<uint8_t, SIZE> data_;
};

// ============================================================================
// Point (BN254 G1 element)
// ============================================================================

/**
 * A point of BN254 G1, held as an OpenSSL EC_POINT.
 *
 * The identity is a valid value of this type but has no affine
 * coordinates; callers that need coordinates must check IsIdentity().
 * Operations throw std::runtime_error only if OpenSSL itself fails
 * (allocation failure); invalid encodings yield std::nullopt.
 */
class Point {
public:
    /// SEC1 compressed size (02/03 || x)
    static constexpr size_t COMPRESSED_SIZE = 33;

    /// SEC1 uncompressed size (04 || x || y)
    static constexpr size_t UNCOMPRESSED_SIZE = 65;

    /// Identity
    Point();

    /// Construct from affine coordinates; fails if not on the curve
    static std::optional<Point> FromAffine(const BaseFieldElement& x, const BaseFieldElement& y);

    /// Decompress `x`, choosing the numerically larger (`largestY`) or
    /// smaller of the two square roots. Fails if x is not a valid abscissa.
    static std::optional<Point> FromX(const BaseFieldElement& x, bool largestY);

    /// Decode 33 bytes; all-zero bytes decode to the identity
    static std::optional<Point> FromCompressed(const uint8_t* data);
    static std::optional<Point> FromCompressed(const std::array<uint8_t, COMPRESSED_SIZE>& data);

    /// Decode 65 bytes (04 || x || y)
    static std::optional<Point> FromUncompressed(const uint8_t* data);

    /// Parse either format by length
    static std::optional<Point> FromBytes(const uint8_t* data, size_t len);
    static std::optional<Point> FromBytes(const std::vector<uint8_t>& data);

    bool IsIdentity() const;
    bool IsOnCurve() const;

    /// Affine coordinates, or std::nullopt for the identity
    std::optional<BaseFieldElement> AffineX() const;
    std::optional<BaseFieldElement> AffineY() const;

    /// Compressed form; the identity serialises as 33 zero bytes
    std::array<uint8_t, COMPRESSED_SIZE> ToCompressed() const;

    /// Uncompressed form; the identity serialises as 65 zero bytes
    std::array<uint8_t, UNCOMPRESSED_SIZE> ToUncompressed() const;

    Point operator+(const Point& other) const;
    Point operator-(const Point& other) const;
    Point operator-() const;

    /// Scalar multiplication (returns this^scalar in multiplicative notation)
    Point operator*(const Scalar& scalar) const;

    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const { return !(*this == other); }

    /// The canonical generator (1, 2)
    static Point Generator();

    static Point Identity() { return Point(); }

    /// Generator()^scalar
    static Point MulGenerator(const Scalar& scalar);

    Point(const Point& other);
    Point& operator=(const Point& other);
    /// A moved-from point is left as the identity
    Point(Point&& other);
    /// Swaps, so `other` holds this point's previous value
    Point& operator=(Point&& other) noexcept;
    ~Point();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bn254
} // namespace anchorzk

#endif // ANCHORZK_CRYPTO_BN254_H
