// ANCHORZK - Anchored Proof Verification
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#ifndef ANCHORZK_ANCHOR_VERIFIER_H
#define ANCHORZK_ANCHOR_VERIFIER_H

#include <cstdint>
#include <string>

#include "anchorzk/anchor/enrollment_tree.h"
#include "anchorzk/anchor/errors.h"
#include "anchorzk/anchor/proof.h"
#include "anchorzk/anchor/setup.h"

namespace anchorzk {
namespace anchor {

/// Claimed leaf position. Leaf i encodes witness i + 1, so the claim
/// reveals the witness to the verifier.
using MerkleIndexClaim = uint64_t;

/// Public inputs to verification
struct PublicParams {
    Generators generators;
    bn254::Point anchor;   ///< U
    Hash256 root;
    uint64_t totalLeaves{0};

    /// Parameters matching a built tree
    static PublicParams FromTree(const Generators& generators, const EnrollmentTree& tree);
};

struct VerifierOptions {
    /// Report every failure as VerificationStage::Rejected
    bool uniformRejection{false};
};

struct VerificationResult {
    bool valid{false};
    VerificationStage stage{VerificationStage::None};
    std::string reason;

    static VerificationResult Accept() { return {true, VerificationStage::None, ""}; }
    static VerificationResult Reject(VerificationStage stage, std::string reason) {
        return {false, stage, std::move(reason)};
    }
};

/**
 * Verify an anchored proof.
 *
 * Structure is checked first (no identity points), then the Merkle
 * inclusion of leaf_hash at `index`, then DLEQ and finally Schnorr. The
 * first failing check decides the stage. The leaf hash is never
 * recomputed here.
 */
VerificationResult VerifyAnchoredProof(const PublicParams& params,
                                       const AnchoredProof& proof,
                                       MerkleIndexClaim index,
                                       const VerifierOptions& options = {});

} // namespace anchor
} // namespace anchorzk

#endif // ANCHORZK_ANCHOR_VERIFIER_H
