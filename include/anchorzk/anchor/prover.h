// ANCHORZK - Anchored Proof Generation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#ifndef ANCHORZK_ANCHOR_PROVER_H
#define ANCHORZK_ANCHOR_PROVER_H

#include <cstdint>
#include <memory>
#include <optional>

#include "anchorzk/anchor/enrollment_tree.h"
#include "anchorzk/anchor/errors.h"
#include "anchorzk/anchor/proof.h"
#include "anchorzk/anchor/setup.h"
#include "anchorzk/core/random.h"

namespace anchorzk {
namespace anchor {

/// Private and public inputs for one proof
struct ProofInput {
    Scalar secret;       ///< s
    Scalar witness;      ///< w
    Scalar blinding;     ///< r
    Generators generators;
    bn254::Point anchor; ///< U, must equal B^s
    std::shared_ptr<const EnrollmentTree> tree;
};

struct ProofResult {
    AnchorError error{AnchorError::None};
    std::optional<AnchoredProof> proof;

    /// Position of the matched leaf; the index claim for the verifier
    uint64_t leafIndex{0};

    bool ok() const { return error == AnchorError::None && proof.has_value(); }
};

/**
 * Generate an anchored proof for `input.witness`.
 *
 * Steps: commit (C, C'), derive the link point P = G^(s*w) and its leaf,
 * locate the leaf and its Merkle path, then prove DLEQ for
 * (B, U; C, C') and Schnorr for C' - P over H. Nonces come from `rng`.
 *
 * Errors are reported in the result. No partial proof is returned.
 * @throws RandomnessError if `rng` fails
 */
ProofResult GenerateAnchoredProof(const ProofInput& input, RandomSource& rng);

} // namespace anchor
} // namespace anchorzk

#endif // ANCHORZK_ANCHOR_PROVER_H
