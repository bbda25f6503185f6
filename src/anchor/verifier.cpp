// ANCHORZK - Anchored Proof Verification Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/anchor/verifier.h"
#include "anchorzk/anchor/sigma.h"
#include "anchorzk/merkle/merkle_tree.h"
#include "anchorzk/util/logging.h"

#include <initializer_list>

namespace anchorzk {
namespace anchor {

PublicParams PublicParams::FromTree(const Generators& generators, const EnrollmentTree& tree) {
    PublicParams params;
    params.generators = generators;
    params.anchor = tree.Anchor();
    params.root = tree.Root();
    params.totalLeaves = tree.LeafCount();
    return params;
}

namespace {

VerificationResult Reject(VerificationStage stage, const std::string& reason,
                          const VerifierOptions& options) {
    LOG_WARN(util::LogCategory::VERIFIER) << "Proof rejected at "
                                          << VerificationStageToString(stage) << ": " << reason;
    if (options.uniformRejection) {
        return VerificationResult::Reject(VerificationStage::Rejected, "proof rejected");
    }
    return VerificationResult::Reject(stage, reason);
}

bool AllOnCurve(std::initializer_list<const bn254::Point*> points) {
    for (const bn254::Point* point : points) {
        if (point->IsIdentity() || !point->IsOnCurve()) return false;
    }
    return true;
}

} // anonymous namespace

VerificationResult VerifyAnchoredProof(const PublicParams& params,
                                       const AnchoredProof& proof,
                                       MerkleIndexClaim index,
                                       const VerifierOptions& options) {
    const Generators& gens = params.generators;

    if (!AllOnCurve({&gens.g, &gens.h, &gens.b, &params.anchor})) {
        return Reject(VerificationStage::Malformed, "invalid public parameters", options);
    }
    if (!AllOnCurve({&proof.commitment, &proof.modifiedCommitment, &proof.linkPoint,
                     &proof.dleq.r1, &proof.dleq.r2, &proof.schnorr.r})) {
        return Reject(VerificationStage::Malformed, "identity or off-curve point", options);
    }

    // Merkle inclusion
    merkle::PoseidonMerkleHasher hasher;
    if (!proof.merkleProof.Verify(hasher, params.root, index, proof.leafHash,
                                  params.totalLeaves)) {
        return Reject(VerificationStage::Merkle, "leaf not included at claimed index", options);
    }

    // C' = C^s with U = B^s
    DleqStatement dleqStatement{gens.b, proof.commitment, params.anchor,
                                proof.modifiedCommitment};
    if (!DleqVerifier::Verify(proof.dleq, dleqStatement)) {
        return Reject(VerificationStage::Dleq, "exponent link failed", options);
    }

    // C' - P = H^(s*r)
    SchnorrStatement schnorrStatement{gens.h, proof.modifiedCommitment - proof.linkPoint};
    if (!SchnorrVerifier::Verify(proof.schnorr, schnorrStatement)) {
        return Reject(VerificationStage::Schnorr, "public blinding relation failed", options);
    }

    LOG_DEBUG(util::LogCategory::VERIFIER) << "Proof accepted for leaf " << index;
    return VerificationResult::Accept();
}

} // namespace anchor
} // namespace anchorzk
