// ANCHORZK - Base Field to Scalar Field Splitting
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/anchor/field_split.h"

#include <cstring>

namespace anchorzk {
namespace anchor {

namespace {

constexpr size_t HALF = 16;

/// 16 little-endian bytes as an Fr element
FieldElement LimbFromLE(const uint8_t* data) {
    std::array<Byte, 32> wide{};
    std::memcpy(wide.data(), data, HALF);
    return FieldElement(Uint256::FromBytesLE(wide.data()));
}

/// Write the low 16 bytes of `limb` little-endian; false if it needs more
bool LimbToLE(const FieldElement& limb, uint8_t* out) {
    auto bytes = limb.ToUint256().ToBytesLE();
    for (size_t i = HALF; i < bytes.size(); ++i) {
        if (bytes[i] != 0) return false;
    }
    std::memcpy(out, bytes.data(), HALF);
    return true;
}

} // anonymous namespace

SplitElement SplitCoordinate(const bn254::BaseFieldElement& coordinate) {
    auto le = coordinate.ToBytesLE();
    return SplitElement{LimbFromLE(le.data()), LimbFromLE(le.data() + HALF)};
}

std::optional<bn254::BaseFieldElement> ReconstructCoordinate(const FieldElement& low,
                                                             const FieldElement& high) {
    std::array<uint8_t, 32> le{};
    if (!LimbToLE(low, le.data()) || !LimbToLE(high, le.data() + HALF)) {
        return std::nullopt;
    }

    std::array<uint8_t, 32> be;
    for (size_t i = 0; i < be.size(); ++i) {
        be[i] = le[be.size() - 1 - i];
    }
    bn254::BaseFieldElement result(be);
    if (!result.IsValid()) {
        return std::nullopt;
    }
    return result;
}

std::optional<SplitElement> SplitPointX(const bn254::Point& point) {
    auto x = point.AffineX();
    if (!x) return std::nullopt;
    return SplitCoordinate(*x);
}

} // namespace anchor
} // namespace anchorzk
