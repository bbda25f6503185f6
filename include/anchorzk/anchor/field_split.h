// ANCHORZK - Base Field to Scalar Field Splitting
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Point coordinates live in Fq but Poseidon absorbs Fr elements. A
// coordinate is carried into Fr as two 128-bit limbs taken from its
// little-endian encoding: bytes [0,16) form `low`, bytes [16,32) `high`.
// Both limbs are below 2^128 < r, so the mapping is total and lossless.

#ifndef ANCHORZK_ANCHOR_FIELD_SPLIT_H
#define ANCHORZK_ANCHOR_FIELD_SPLIT_H

#include <array>
#include <optional>

#include "anchorzk/crypto/bn254.h"
#include "anchorzk/crypto/field.h"

namespace anchorzk {
namespace anchor {

/// Low and high limbs of a split coordinate
using SplitElement = std::array<FieldElement, 2>;

/// Split a base field element into {low, high}
SplitElement SplitCoordinate(const bn254::BaseFieldElement& coordinate);

/// Inverse of SplitCoordinate. Fails if a limb is >= 2^128 or the
/// recombined value is not below q.
std::optional<bn254::BaseFieldElement> ReconstructCoordinate(const FieldElement& low,
                                                             const FieldElement& high);

/// Split the affine x of `point`; std::nullopt for the identity
std::optional<SplitElement> SplitPointX(const bn254::Point& point);

} // namespace anchor
} // namespace anchorzk

#endif // ANCHORZK_ANCHOR_FIELD_SPLIT_H
