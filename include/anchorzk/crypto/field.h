// ANCHORZK - Finite Field Arithmetic
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Arithmetic over the BN254 scalar field Fr. Fr is both the exponent
// field of the G1 group and the native field of the Poseidon hash.

#ifndef ANCHORZK_CRYPTO_FIELD_H
#define ANCHORZK_CRYPTO_FIELD_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "anchorzk/core/types.h"

namespace anchorzk {

// ============================================================================
// 256-bit Unsigned Integer
// ============================================================================

/// 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;
    static constexpr size_t SIZE = 32;

    /// Limbs in little-endian order (limb[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;

    constexpr Uint256() : limbs{0, 0, 0, 0} {}

    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}

    explicit constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}

    /// Read 32 bytes, most significant byte first
    static Uint256 FromBytesBE(const Byte* data);

    /// Read 32 bytes, least significant byte first
    static Uint256 FromBytesLE(const Byte* data);

    /// Parse up to 64 hex digits, optional 0x prefix (throws on bad input)
    static Uint256 FromHex(const std::string& hex);

    std::array<Byte, SIZE> ToBytesBE() const;
    std::array<Byte, SIZE> ToBytesLE() const;

    /// 64 lowercase hex digits, most significant first
    std::string ToHex() const;

    bool IsZero() const;

    /// Value of bit `index` (0 = least significant)
    bool Bit(size_t index) const {
        return (limbs[index / 64] >> (index % 64)) & 1;
    }

    /// Position of the highest set bit plus one (0 for zero)
    size_t BitLength() const;

    bool operator==(const Uint256& other) const { return limbs == other.limbs; }
    bool operator!=(const Uint256& other) const { return limbs != other.limbs; }
    bool operator<(const Uint256& other) const;
    bool operator>=(const Uint256& other) const { return !(*this < other); }

    /// Addition and subtraction with carry/borrow out
    static Uint256 Add(const Uint256& a, const Uint256& b, bool& carry);
    static Uint256 Sub(const Uint256& a, const Uint256& b, bool& borrow);
};

// ============================================================================
// Field Element over BN254 scalar field
// ============================================================================

/// Element of the BN254 scalar field
/// r = 21888242871839275222246405745257275088548364400416034343698204186575808495617
///
/// Values are held in Montgomery form. The canonical external encoding
/// is 32 bytes big-endian with value < r.
class FieldElement {
public:
    static constexpr size_t SIZE = 32;

    /// The BN254 scalar field modulus
    static const Uint256 MODULUS;

    /// R^2 mod r (for Montgomery conversion)
    static const Uint256 R2;

    /// -r^(-1) mod 2^64 (for Montgomery reduction)
    static const uint64_t INV;

    /// Zero
    FieldElement();

    /// Construct from an integer of up to 256 bits, reducing mod r
    explicit FieldElement(const Uint256& val);

    explicit FieldElement(uint64_t val);

    static FieldElement Zero();
    static FieldElement One();

    /// Canonical integer representative in [0, r)
    Uint256 ToUint256() const;

    /// Canonical 32-byte big-endian encoding
    std::array<Byte, SIZE> ToBytes() const;

    /// Decode a canonical 32-byte big-endian encoding; rejects values >= r
    static std::optional<FieldElement> FromCanonicalBytes(const Byte* data, size_t len);

    /// Interpret 32 bytes big-endian and reduce mod r (never fails)
    static FieldElement FromBytesReduced(const Byte* data);

    /// Parse a hex integer and reduce mod r
    static FieldElement FromHex(const std::string& hex);

    /// True when `data` is a 32-byte big-endian value below r
    static bool IsCanonical(const Byte* data, size_t len);

    bool IsZero() const { return value_.IsZero(); }

    bool operator==(const FieldElement& other) const { return value_ == other.value_; }
    bool operator!=(const FieldElement& other) const { return value_ != other.value_; }

    FieldElement operator+(const FieldElement& other) const;
    FieldElement operator-(const FieldElement& other) const;
    FieldElement operator*(const FieldElement& other) const;
    FieldElement operator-() const;

    FieldElement& operator+=(const FieldElement& other);
    FieldElement& operator-=(const FieldElement& other);
    FieldElement& operator*=(const FieldElement& other);

    FieldElement Square() const { return (*this) * (*this); }

    /// Exponentiation by an arbitrary 256-bit exponent
    FieldElement Pow(const Uint256& exp) const;

    /// Multiplicative inverse (returns 0 if this is 0)
    FieldElement Inverse() const;

    /// S-box for Poseidon: x^5
    FieldElement PoseidonSbox() const;

private:
    /// Montgomery form a*R mod r
    Uint256 value_;

    /// Montgomery product a*b*R^-1 mod r (CIOS)
    static Uint256 MontMul(const Uint256& a, const Uint256& b);

    static Uint256 ModAdd(const Uint256& a, const Uint256& b);
    static Uint256 ModSub(const Uint256& a, const Uint256& b);
};

/// Exponents of the G1 group are Fr elements
using Scalar = FieldElement;

} // namespace anchorzk

#endif // ANCHORZK_CRYPTO_FIELD_H
