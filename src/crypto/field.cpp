// ANCHORZK - Finite Field Arithmetic Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Montgomery arithmetic over the BN254 scalar field

#include "anchorzk/crypto/field.h"
#include "anchorzk/core/hex.h"

#include <stdexcept>

namespace anchorzk {

using uint128_t = __uint128_t;

// ============================================================================
// BN254 Scalar Field Constants
// ============================================================================

// r = 0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001
const Uint256 FieldElement::MODULUS{
    0x43e1f593f0000001ULL,
    0x2833e84879b97091ULL,
    0xb85045b68181585dULL,
    0x30644e72e131a029ULL
};

// R2 = 2^512 mod r
const Uint256 FieldElement::R2{
    0x1bb8e645ae216da7ULL,
    0x53fe3ab1e35c59e3ULL,
    0x8c49833d53bb8085ULL,
    0x0216d0b17f4e44a5ULL
};

const uint64_t FieldElement::INV = 0xc2e1f593efffffffULL;

// ============================================================================
// Uint256 Implementation
// ============================================================================

Uint256 Uint256::FromBytesBE(const Byte* data) {
    Uint256 result;
    for (size_t i = 0; i < SIZE; ++i) {
        size_t limb = (SIZE - 1 - i) / 8;
        result.limbs[limb] = (result.limbs[limb] << 8) | data[i];
    }
    return result;
}

Uint256 Uint256::FromBytesLE(const Byte* data) {
    Uint256 result;
    for (size_t i = SIZE; i-- > 0;) {
        size_t limb = i / 8;
        result.limbs[limb] = (result.limbs[limb] << 8) | data[i];
    }
    return result;
}

Uint256 Uint256::FromHex(const std::string& hex) {
    std::string h = hex;
    if (h.size() >= 2 && h[0] == '0' && (h[1] == 'x' || h[1] == 'X')) {
        h = h.substr(2);
    }
    if (h.size() > SIZE * 2) {
        throw std::invalid_argument("Uint256 hex value exceeds 256 bits");
    }
    h.insert(0, SIZE * 2 - h.size(), '0');
    std::vector<Byte> bytes = HexToBytes(h);
    return FromBytesBE(bytes.data());
}

std::array<Byte, Uint256::SIZE> Uint256::ToBytesBE() const {
    std::array<Byte, SIZE> out;
    for (size_t i = 0; i < SIZE; ++i) {
        size_t byteIndex = SIZE - 1 - i;
        out[i] = static_cast<Byte>(limbs[byteIndex / 8] >> (8 * (byteIndex % 8)));
    }
    return out;
}

std::array<Byte, Uint256::SIZE> Uint256::ToBytesLE() const {
    std::array<Byte, SIZE> out;
    for (size_t i = 0; i < SIZE; ++i) {
        out[i] = static_cast<Byte>(limbs[i / 8] >> (8 * (i % 8)));
    }
    return out;
}

std::string Uint256::ToHex() const {
    auto bytes = ToBytesBE();
    return BytesToHex(bytes.data(), bytes.size());
}

bool Uint256::IsZero() const {
    return (limbs[0] | limbs[1] | limbs[2] | limbs[3]) == 0;
}

size_t Uint256::BitLength() const {
    for (size_t i = NUM_LIMBS; i-- > 0;) {
        if (limbs[i] != 0) {
            size_t bits = 64;
            uint64_t top = limbs[i];
            while (!(top >> 63)) {
                top <<= 1;
                --bits;
            }
            return i * 64 + bits;
        }
    }
    return 0;
}

bool Uint256::operator<(const Uint256& other) const {
    for (size_t i = NUM_LIMBS; i-- > 0;) {
        if (limbs[i] != other.limbs[i]) {
            return limbs[i] < other.limbs[i];
        }
    }
    return false;
}

Uint256 Uint256::Add(const Uint256& a, const Uint256& b, bool& carry) {
    Uint256 result;
    uint128_t acc = 0;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        acc += static_cast<uint128_t>(a.limbs[i]) + b.limbs[i];
        result.limbs[i] = static_cast<uint64_t>(acc);
        acc >>= 64;
    }
    carry = acc != 0;
    return result;
}

Uint256 Uint256::Sub(const Uint256& a, const Uint256& b, bool& borrow) {
    Uint256 result;
    uint64_t bw = 0;
    for (size_t i = 0; i < NUM_LIMBS; ++i) {
        uint64_t lhs = a.limbs[i];
        uint64_t diff = lhs - b.limbs[i] - bw;
        bw = (lhs < b.limbs[i]) || (lhs - b.limbs[i] < bw) ? 1 : 0;
        result.limbs[i] = diff;
    }
    borrow = bw != 0;
    return result;
}

// ============================================================================
// FieldElement Implementation
// ============================================================================

FieldElement::FieldElement() : value_() {}

FieldElement::FieldElement(const Uint256& val) : value_(MontMul(val, R2)) {}

FieldElement::FieldElement(uint64_t val) : value_(MontMul(Uint256(val), R2)) {}

FieldElement FieldElement::Zero() {
    return FieldElement();
}

FieldElement FieldElement::One() {
    static const FieldElement one(static_cast<uint64_t>(1));
    return one;
}

Uint256 FieldElement::ToUint256() const {
    return MontMul(value_, Uint256(1));
}

std::array<Byte, FieldElement::SIZE> FieldElement::ToBytes() const {
    return ToUint256().ToBytesBE();
}

bool FieldElement::IsCanonical(const Byte* data, size_t len) {
    if (!data || len != SIZE) return false;
    return Uint256::FromBytesBE(data) < MODULUS;
}

std::optional<FieldElement> FieldElement::FromCanonicalBytes(const Byte* data, size_t len) {
    if (!IsCanonical(data, len)) {
        return std::nullopt;
    }
    return FieldElement(Uint256::FromBytesBE(data));
}

FieldElement FieldElement::FromBytesReduced(const Byte* data) {
    return FieldElement(Uint256::FromBytesBE(data));
}

FieldElement FieldElement::FromHex(const std::string& hex) {
    return FieldElement(Uint256::FromHex(hex));
}

Uint256 FieldElement::ModAdd(const Uint256& a, const Uint256& b) {
    bool carry;
    Uint256 sum = Uint256::Add(a, b, carry);
    if (carry || sum >= MODULUS) {
        bool borrow;
        sum = Uint256::Sub(sum, MODULUS, borrow);
    }
    return sum;
}

Uint256 FieldElement::ModSub(const Uint256& a, const Uint256& b) {
    bool borrow;
    Uint256 diff = Uint256::Sub(a, b, borrow);
    if (borrow) {
        bool carry;
        diff = Uint256::Add(diff, MODULUS, carry);
    }
    return diff;
}

Uint256 FieldElement::MontMul(const Uint256& a, const Uint256& b) {
    // Coarsely integrated operand scanning; t holds N + 2 words
    uint64_t t[Uint256::NUM_LIMBS + 2] = {0, 0, 0, 0, 0, 0};
    constexpr size_t N = Uint256::NUM_LIMBS;

    for (size_t i = 0; i < N; ++i) {
        uint128_t acc = 0;
        for (size_t j = 0; j < N; ++j) {
            acc += static_cast<uint128_t>(a.limbs[j]) * b.limbs[i] + t[j];
            t[j] = static_cast<uint64_t>(acc);
            acc >>= 64;
        }
        acc += t[N];
        t[N] = static_cast<uint64_t>(acc);
        t[N + 1] = static_cast<uint64_t>(acc >> 64);

        uint64_t m = t[0] * INV;
        acc = static_cast<uint128_t>(m) * MODULUS.limbs[0] + t[0];
        acc >>= 64;
        for (size_t j = 1; j < N; ++j) {
            acc += static_cast<uint128_t>(m) * MODULUS.limbs[j] + t[j];
            t[j - 1] = static_cast<uint64_t>(acc);
            acc >>= 64;
        }
        acc += t[N];
        t[N - 1] = static_cast<uint64_t>(acc);
        t[N] = t[N + 1] + static_cast<uint64_t>(acc >> 64);
    }

    Uint256 result(t[0], t[1], t[2], t[3]);
    if (t[N] != 0 || result >= MODULUS) {
        bool borrow;
        result = Uint256::Sub(result, MODULUS, borrow);
    }
    return result;
}

FieldElement FieldElement::operator+(const FieldElement& other) const {
    FieldElement result;
    result.value_ = ModAdd(value_, other.value_);
    return result;
}

FieldElement FieldElement::operator-(const FieldElement& other) const {
    FieldElement result;
    result.value_ = ModSub(value_, other.value_);
    return result;
}

FieldElement FieldElement::operator*(const FieldElement& other) const {
    FieldElement result;
    result.value_ = MontMul(value_, other.value_);
    return result;
}

FieldElement FieldElement::operator-() const {
    return Zero() - *this;
}

FieldElement& FieldElement::operator+=(const FieldElement& other) {
    value_ = ModAdd(value_, other.value_);
    return *this;
}

FieldElement& FieldElement::operator-=(const FieldElement& other) {
    value_ = ModSub(value_, other.value_);
    return *this;
}

FieldElement& FieldElement::operator*=(const FieldElement& other) {
    value_ = MontMul(value_, other.value_);
    return *this;
}

FieldElement FieldElement::Pow(const Uint256& exp) const {
    FieldElement result = One();
    for (size_t i = exp.BitLength(); i-- > 0;) {
        result = result.Square();
        if (exp.Bit(i)) {
            result *= *this;
        }
    }
    return result;
}

FieldElement FieldElement::Inverse() const {
    if (IsZero()) return Zero();

    // Fermat: a^(r-2)
    bool borrow;
    static const Uint256 exponent = Uint256::Sub(MODULUS, Uint256(2), borrow);
    return Pow(exponent);
}

FieldElement FieldElement::PoseidonSbox() const {
    FieldElement x2 = Square();
    FieldElement x4 = x2.Square();
    return x4 * (*this);
}

} // namespace anchorzk
