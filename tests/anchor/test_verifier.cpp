// ANCHORZK - Verifier Tests
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include <gtest/gtest.h>
#include "anchorzk/anchor/prover.h"
#include "anchorzk/anchor/setup.h"
#include "anchorzk/anchor/verifier.h"

#include <initializer_list>

namespace anchorzk {
namespace test {

using namespace anchor;
using bn254::Point;

class VerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        input_.generators = SetupGenerators();
        input_.secret = Scalar(0x1111);
        input_.anchor = ComputeAnchor(input_.secret, input_.generators.b);
        input_.witness = Scalar(6);
        input_.blinding = Scalar(0x2222);
        auto built = BuildEnrollmentTree(4, input_.anchor, input_.secret);
        ASSERT_TRUE(built.ok());
        input_.tree = built.tree;

        auto result = GenerateAnchoredProof(input_, rng_);
        ASSERT_TRUE(result.ok());
        proof_ = *result.proof;
        index_ = result.leafIndex;
        params_ = PublicParams::FromTree(input_.generators, *input_.tree);
    }

    VerificationResult Check(const AnchoredProof& proof) const {
        return VerifyAnchoredProof(params_, proof, index_);
    }

    ProofInput input_;
    DeterministicRandomSource rng_{uint64_t{5}};
    AnchoredProof proof_;
    MerkleIndexClaim index_{0};
    PublicParams params_;
};

TEST_F(VerifierTest, AcceptsHonestProof) {
    auto result = Check(proof_);
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.stage, VerificationStage::None);
    EXPECT_STREQ(VerificationStageToString(result.stage), "accepted");
    EXPECT_EQ(index_, 5u);
}

TEST_F(VerifierTest, PublicParamsFromTree) {
    EXPECT_EQ(params_.root, input_.tree->Root());
    EXPECT_EQ(params_.totalLeaves, 16u);
    EXPECT_EQ(params_.anchor, input_.anchor);
}

TEST_F(VerifierTest, WrongIndexClaim) {
    for (MerkleIndexClaim claim : {uint64_t{4}, uint64_t{6}, uint64_t{16}, uint64_t{1} << 40}) {
        auto result = VerifyAnchoredProof(params_, proof_, claim);
        EXPECT_FALSE(result.valid);
        EXPECT_EQ(result.stage, VerificationStage::Merkle) << "claim " << claim;
    }
}

TEST_F(VerifierTest, WrongRootOrSize) {
    PublicParams other = params_;
    other.root[31] ^= 1;
    EXPECT_EQ(VerifyAnchoredProof(other, proof_, index_).stage, VerificationStage::Merkle);

    other = params_;
    other.totalLeaves = 32;
    EXPECT_EQ(VerifyAnchoredProof(other, proof_, index_).stage, VerificationStage::Merkle);
}

TEST_F(VerifierTest, TamperedLeafHash) {
    AnchoredProof bad = proof_;
    bad.leafHash = input_.tree->Leaf(0);
    EXPECT_EQ(Check(bad).stage, VerificationStage::Merkle);
}

TEST_F(VerifierTest, IdentityPointsAreMalformed) {
    AnchoredProof bad = proof_;
    bad.commitment = Point::Identity();
    EXPECT_EQ(Check(bad).stage, VerificationStage::Malformed);

    bad = proof_;
    bad.linkPoint = Point::Identity();
    EXPECT_EQ(Check(bad).stage, VerificationStage::Malformed);

    bad = proof_;
    bad.schnorr.r = Point::Identity();
    EXPECT_EQ(Check(bad).stage, VerificationStage::Malformed);

    PublicParams badParams = params_;
    badParams.anchor = Point::Identity();
    EXPECT_EQ(VerifyAnchoredProof(badParams, proof_, index_).stage,
              VerificationStage::Malformed);
}

TEST_F(VerifierTest, WrongCommitmentFailsDleq) {
    AnchoredProof bad = proof_;
    bad.commitment = bad.commitment + input_.generators.g;
    EXPECT_EQ(Check(bad).stage, VerificationStage::Dleq);

    bad = proof_;
    bad.modifiedCommitment = bad.modifiedCommitment + input_.generators.h;
    EXPECT_EQ(Check(bad).stage, VerificationStage::Dleq);
}

TEST_F(VerifierTest, ForeignAnchorFailsDleq) {
    PublicParams other = params_;
    other.anchor = input_.generators.b * Scalar(0x3333);
    EXPECT_EQ(VerifyAnchoredProof(other, proof_, index_).stage, VerificationStage::Dleq);
}

TEST_F(VerifierTest, WrongLinkPointFailsSchnorr) {
    AnchoredProof bad = proof_;
    bad.linkPoint = input_.generators.g * (input_.secret * Scalar(7));
    EXPECT_EQ(Check(bad).stage, VerificationStage::Schnorr);
}

TEST_F(VerifierTest, TamperedSchnorrResponse) {
    AnchoredProof bad = proof_;
    bad.schnorr.z = bad.schnorr.z + Scalar(1);
    EXPECT_EQ(Check(bad).stage, VerificationStage::Schnorr);
}

TEST_F(VerifierTest, UniformRejectionHidesStage) {
    VerifierOptions options;
    options.uniformRejection = true;

    EXPECT_TRUE(VerifyAnchoredProof(params_, proof_, index_, options).valid);

    AnchoredProof bad = proof_;
    bad.schnorr.z = bad.schnorr.z + Scalar(1);
    auto schnorr = VerifyAnchoredProof(params_, bad, index_, options);
    auto merkle = VerifyAnchoredProof(params_, proof_, index_ + 1, options);

    EXPECT_FALSE(schnorr.valid);
    EXPECT_EQ(schnorr.stage, VerificationStage::Rejected);
    EXPECT_EQ(merkle.stage, VerificationStage::Rejected);
    EXPECT_EQ(schnorr.reason, merkle.reason);
}

TEST_F(VerifierTest, StageNames) {
    EXPECT_STREQ(VerificationStageToString(VerificationStage::Merkle), "merkle");
    EXPECT_STREQ(VerificationStageToString(VerificationStage::Dleq), "dleq");
    EXPECT_STREQ(VerificationStageToString(VerificationStage::Schnorr), "schnorr");
    EXPECT_STREQ(AnchorErrorToString(AnchorError::WitnessNotEnrolled), "witness-not-enrolled");
}

} // namespace test
} // namespace anchorzk
