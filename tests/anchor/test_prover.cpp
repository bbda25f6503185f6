// ANCHORZK - Prover Tests
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include <gtest/gtest.h>
#include "anchorzk/anchor/prover.h"
#include "anchorzk/anchor/setup.h"

namespace anchorzk {
namespace test {

using namespace anchor;
using bn254::Point;

namespace {

class FailingSource : public RandomSource {
public:
    void Fill(uint8_t*, size_t) override {
        throw RandomnessError("entropy unavailable");
    }
};

} // namespace

class ProverTest : public ::testing::Test {
protected:
    void SetUp() override {
        input_.generators = SetupGenerators();
        input_.secret = Scalar(0xabcdef);
        input_.anchor = ComputeAnchor(input_.secret, input_.generators.b);
        input_.witness = Scalar(5);
        input_.blinding = Scalar(0x1234567);
        auto built = BuildEnrollmentTree(4, input_.anchor, input_.secret);
        ASSERT_TRUE(built.ok());
        input_.tree = built.tree;
    }

    ProofInput input_;
    DeterministicRandomSource rng_{uint64_t{99}};
};

TEST_F(ProverTest, ProofCarriesCommitmentsAndLink) {
    auto result = GenerateAnchoredProof(input_, rng_);
    ASSERT_TRUE(result.ok());
    const AnchoredProof& proof = *result.proof;
    const Generators& gens = input_.generators;

    Point c = gens.g * input_.witness + gens.h * input_.blinding;
    EXPECT_EQ(proof.commitment, c);
    EXPECT_EQ(proof.modifiedCommitment, c * input_.secret);
    EXPECT_EQ(proof.linkPoint, gens.g * (input_.secret * input_.witness));
    EXPECT_EQ(proof.modifiedCommitment - proof.linkPoint,
              gens.h * (input_.secret * input_.blinding));

    EXPECT_EQ(result.leafIndex, 4u);
    EXPECT_EQ(proof.leafHash, input_.tree->Leaf(4));
    EXPECT_TRUE(proof.merkleProof.Verify(input_.tree->Hasher(), input_.tree->Root(), 4,
                                         proof.leafHash, input_.tree->LeafCount()));
}

TEST_F(ProverTest, FreshNoncesPerProof) {
    auto a = GenerateAnchoredProof(input_, rng_);
    auto b = GenerateAnchoredProof(input_, rng_);
    ASSERT_TRUE(a.ok() && b.ok());
    EXPECT_EQ(a.proof->commitment, b.proof->commitment);
    EXPECT_NE(a.proof->dleq.r1, b.proof->dleq.r1);
    EXPECT_NE(a.proof->schnorr.r, b.proof->schnorr.r);
}

TEST_F(ProverTest, RangeBoundaries) {
    input_.witness = Scalar(1);
    auto first = GenerateAnchoredProof(input_, rng_);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.leafIndex, 0u);

    input_.witness = Scalar(16);
    auto last = GenerateAnchoredProof(input_, rng_);
    ASSERT_TRUE(last.ok());
    EXPECT_EQ(last.leafIndex, 15u);

    input_.witness = Scalar(17);
    auto outside = GenerateAnchoredProof(input_, rng_);
    EXPECT_EQ(outside.error, AnchorError::WitnessNotEnrolled);
    EXPECT_FALSE(outside.proof.has_value());
}

TEST_F(ProverTest, ZeroWitnessIsRangeMismatch) {
    input_.witness = Scalar(0);
    EXPECT_EQ(GenerateAnchoredProof(input_, rng_).error, AnchorError::RangeMismatch);
}

TEST_F(ProverTest, InvalidInputs) {
    ProofInput zeroSecret = input_;
    zeroSecret.secret = Scalar(0);
    EXPECT_EQ(GenerateAnchoredProof(zeroSecret, rng_).error, AnchorError::InvalidInput);

    ProofInput zeroBlinding = input_;
    zeroBlinding.blinding = Scalar(0);
    EXPECT_EQ(GenerateAnchoredProof(zeroBlinding, rng_).error, AnchorError::InvalidInput);

    ProofInput wrongAnchor = input_;
    wrongAnchor.anchor = input_.generators.b * Scalar(2);
    EXPECT_EQ(GenerateAnchoredProof(wrongAnchor, rng_).error, AnchorError::InvalidInput);

    ProofInput noTree = input_;
    noTree.tree.reset();
    EXPECT_EQ(GenerateAnchoredProof(noTree, rng_).error, AnchorError::InvalidInput);
}

TEST_F(ProverTest, ForeignTreeIsNotEnrolled) {
    Scalar other(0x777);
    auto foreign = BuildEnrollmentTree(4, ComputeAnchor(other, input_.generators.b), other);
    ASSERT_TRUE(foreign.ok());
    input_.tree = foreign.tree;
    EXPECT_EQ(GenerateAnchoredProof(input_, rng_).error, AnchorError::WitnessNotEnrolled);
}

TEST_F(ProverTest, RandomnessFailurePropagates) {
    FailingSource source;
    EXPECT_THROW(GenerateAnchoredProof(input_, source), RandomnessError);
}

} // namespace test
} // namespace anchorzk
