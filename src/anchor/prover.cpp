// ANCHORZK - Anchored Proof Generation Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/anchor/prover.h"
#include "anchorzk/anchor/sigma.h"
#include "anchorzk/util/logging.h"

namespace anchorzk {
namespace anchor {

namespace {

ProofResult Fail(AnchorError error, const char* why) {
    LOG_WARN(util::LogCategory::PROVER) << "Proof generation failed ("
                                        << AnchorErrorToString(error) << "): " << why;
    ProofResult result;
    result.error = error;
    return result;
}

} // anonymous namespace

ProofResult GenerateAnchoredProof(const ProofInput& input, RandomSource& rng) {
    const Generators& gens = input.generators;

    if (!input.tree) {
        return Fail(AnchorError::InvalidInput, "no enrollment tree");
    }
    if (input.secret.IsZero() || input.blinding.IsZero()) {
        return Fail(AnchorError::InvalidInput, "zero secret or blinding");
    }
    if (gens.g.IsIdentity() || gens.h.IsIdentity() || gens.b.IsIdentity()) {
        return Fail(AnchorError::InvalidInput, "identity generator");
    }
    if (input.anchor.IsIdentity() || input.anchor != gens.b * input.secret) {
        return Fail(AnchorError::InvalidInput, "anchor does not match secret");
    }
    if (input.witness.IsZero()) {
        return Fail(AnchorError::RangeMismatch, "witness below enrolled range");
    }

    AnchoredProof proof;

    // Commitments
    proof.commitment = gens.g * input.witness + gens.h * input.blinding;
    proof.modifiedCommitment = proof.commitment * input.secret;
    proof.linkPoint = gens.g * (input.secret * input.witness);
    if (proof.commitment.IsIdentity() || proof.modifiedCommitment.IsIdentity() ||
        proof.linkPoint.IsIdentity()) {
        return Fail(AnchorError::InvalidInput, "identity commitment or link point");
    }

    // Leaf and Merkle path
    auto leaf = ComputeLeafHash(input.anchor, proof.linkPoint);
    if (!leaf) {
        return Fail(AnchorError::InvalidInput, "leaf hash undefined");
    }
    auto index = input.tree->FindLeaf(*leaf);
    if (!index) {
        return Fail(AnchorError::WitnessNotEnrolled, "leaf not in tree");
    }
    auto path = input.tree->Prove(*index);
    if (!path) {
        return Fail(AnchorError::WitnessNotEnrolled, "no path for matched leaf");
    }
    proof.leafHash = *leaf;
    proof.merkleProof = std::move(*path);

    // C' - P = H^(s*r)
    bn254::Point publicBlinding = proof.modifiedCommitment - proof.linkPoint;
    if (publicBlinding.IsIdentity()) {
        return Fail(AnchorError::InvalidInput, "identity public blinding");
    }

    auto dleq = ProveDleq(input.secret,
                          DleqStatement{gens.b, proof.commitment, input.anchor,
                                        proof.modifiedCommitment},
                          rng);
    auto schnorr = ProveSchnorr(input.secret * input.blinding,
                                SchnorrStatement{gens.h, publicBlinding}, rng);
    if (!dleq || !schnorr) {
        return Fail(AnchorError::InvalidInput, "sigma proof undefined");
    }
    proof.dleq = *dleq;
    proof.schnorr = *schnorr;

    LOG_DEBUG(util::LogCategory::PROVER) << "Proof generated for leaf " << *index;

    ProofResult result;
    result.proof = std::move(proof);
    result.leafIndex = *index;
    return result;
}

} // namespace anchor
} // namespace anchorzk
