// ANCHORZK - Parameter Setup
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Public generators (G, H, B), secret sampling and anchor derivation.
//
// G is the canonical base point. H and B are derived from seeds by
// hashing to candidate x coordinates until a valid curve point appears,
// so nobody knows a discrete log relation between any two generators.

#ifndef ANCHORZK_ANCHOR_SETUP_H
#define ANCHORZK_ANCHOR_SETUP_H

#include <cstddef>
#include <cstdint>

#include "anchorzk/anchor/errors.h"
#include "anchorzk/core/random.h"
#include "anchorzk/core/types.h"
#include "anchorzk/crypto/bn254.h"
#include "anchorzk/crypto/field.h"

namespace anchorzk {
namespace anchor {

/// Candidates tried per generator before giving up
constexpr uint64_t kMaxGeneratorAttempts = 256;

/// Rejection-sampling attempts per scalar before giving up
constexpr size_t kMaxSampleAttempts = 128;

/// Seeds for the derived generators
struct GeneratorSeeds {
    Bytes h;
    Bytes b;

    /// 32 bytes of 0x00 for H and 32 bytes of 0x01 for B
    static GeneratorSeeds Default();
};

/// The public generator triple
struct Generators {
    bn254::Point g;
    bn254::Point h;
    bn254::Point b;
};

/**
 * Derive a generator from `seed`.
 *
 * For counter = 0, 1, ... the digest SHA256(seed || counter_be64) is read
 * as a little-endian x coordinate whose top byte carries two flags: bit 6
 * marks infinity (rejected) and bit 7 selects the larger y root. The
 * first candidate that decodes to a non-identity point wins.
 *
 * @throws SetupError after kMaxGeneratorAttempts candidates
 */
bn254::Point SampleGenerator(const Bytes& seed);

/**
 * Produce (G, H, B). Deterministic for fixed seeds.
 *
 * @throws SetupError on equal seeds, colliding generators or a sampling
 *         failure
 */
Generators SetupGenerators(const GeneratorSeeds& seeds = GeneratorSeeds::Default());

/// Uniform non-zero scalar. Throws RandomnessError if the source fails or
/// sampling exceeds kMaxSampleAttempts.
Scalar SampleScalar(RandomSource& rng);

/// Sample the enrollment secret s
inline Scalar SampleSecret(RandomSource& rng) { return SampleScalar(rng); }

/// Anchor U = base^secret
bn254::Point ComputeAnchor(const Scalar& secret, const bn254::Point& base);

} // namespace anchor
} // namespace anchorzk

#endif // ANCHORZK_ANCHOR_SETUP_H
