// ANCHORZK - Sigma Protocol Tests
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include <gtest/gtest.h>
#include "anchorzk/anchor/field_split.h"
#include "anchorzk/anchor/setup.h"
#include "anchorzk/anchor/sigma.h"
#include "anchorzk/crypto/poseidon.h"

#include <algorithm>
#include <initializer_list>
#include <vector>

namespace anchorzk {
namespace test {

using namespace anchor;
using bn254::Point;

// ============================================================================
// DLEQ
// ============================================================================

class DleqTest : public ::testing::Test {
protected:
    void SetUp() override {
        gens_ = SetupGenerators();
        secret_ = Scalar(31337);
        Point c = gens_.g * Scalar(5) + gens_.h * Scalar(99);
        statement_ = DleqStatement{gens_.b, c, gens_.b * secret_, c * secret_};
    }

    Generators gens_;
    Scalar secret_;
    DleqStatement statement_;
    DeterministicRandomSource rng_{uint64_t{7}};
};

TEST_F(DleqTest, ValidProofVerifies) {
    auto proof = ProveDleq(secret_, statement_, rng_);
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(DleqVerifier::Verify(*proof, statement_));
}

TEST_F(DleqTest, ResponseIsNoncePlusChallengeTimesSecret) {
    Scalar nonce(4242);
    auto proof = ProveDleqWithNonce(secret_, statement_, nonce);
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->r1, statement_.base1 * nonce);
    EXPECT_EQ(proof->r2, statement_.base2 * nonce);

    auto e = DleqVerifier::ComputeChallenge(statement_.image1, statement_.image2,
                                            proof->r1, proof->r2);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(proof->z, nonce + *e * secret_);
}

TEST_F(DleqTest, ChallengeIsPoseidon8) {
    Point r1 = gens_.g * Scalar(3);
    Point r2 = gens_.g * Scalar(4);
    std::vector<FieldElement> inputs;
    for (const Point* p : {&statement_.image1, &statement_.image2, &r1, &r2}) {
        auto split = SplitPointX(*p);
        ASSERT_TRUE(split.has_value());
        inputs.push_back((*split)[0]);
        inputs.push_back((*split)[1]);
    }
    auto e = DleqVerifier::ComputeChallenge(statement_.image1, statement_.image2, r1, r2);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(*e, PoseidonHash(inputs));
    EXPECT_FALSE(DleqVerifier::ComputeChallenge(Point::Identity(), statement_.image2, r1, r2)
                     .has_value());
}

TEST_F(DleqTest, WrongSecretFails) {
    auto proof = ProveDleq(secret_ + Scalar(1), statement_, rng_);
    ASSERT_TRUE(proof.has_value());
    EXPECT_FALSE(DleqVerifier::Verify(*proof, statement_));
}

TEST_F(DleqTest, MismatchedExponentsFail) {
    DleqStatement bad = statement_;
    bad.image2 = statement_.base2 * (secret_ + Scalar(1));
    auto proof = ProveDleq(secret_, bad, rng_);
    ASSERT_TRUE(proof.has_value());
    EXPECT_FALSE(DleqVerifier::Verify(*proof, bad));
}

TEST_F(DleqTest, TamperedResponseFails) {
    auto proof = *ProveDleq(secret_, statement_, rng_);
    proof.z = proof.z + Scalar(1);
    EXPECT_FALSE(DleqVerifier::Verify(proof, statement_));
}

TEST_F(DleqTest, IdentityStatementRejected) {
    DleqStatement bad = statement_;
    bad.image1 = Point::Identity();
    EXPECT_FALSE(ProveDleq(secret_, bad, rng_).has_value());

    auto proof = *ProveDleq(secret_, statement_, rng_);
    proof.r1 = Point::Identity();
    EXPECT_FALSE(DleqVerifier::Verify(proof, statement_));
}

TEST_F(DleqTest, Serialization) {
    auto proof = *ProveDleq(secret_, statement_, rng_);
    auto bytes = proof.ToBytes();
    ASSERT_EQ(bytes.size(), DleqProof::SIZE);
    EXPECT_EQ(DleqProof::SIZE, 98u);

    auto decoded = DleqProof::FromBytes(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, proof);

    EXPECT_FALSE(DleqProof::FromBytes(bytes.data(), bytes.size() - 1).has_value());

    // z = r is not canonical
    auto wide = bytes;
    auto order = bn254::GROUP_ORDER;
    std::copy(order.begin(), order.end(), wide.end() - 32);
    EXPECT_FALSE(DleqProof::FromBytes(wide.data(), wide.size()).has_value());

    auto badPoint = bytes;
    badPoint[0] = 0x05;
    EXPECT_FALSE(DleqProof::FromBytes(badPoint.data(), badPoint.size()).has_value());
}

// ============================================================================
// Schnorr
// ============================================================================

class SchnorrTest : public ::testing::Test {
protected:
    void SetUp() override {
        gens_ = SetupGenerators();
        witness_ = Scalar(271828);
        statement_ = SchnorrStatement{gens_.h, gens_.h * witness_};
    }

    Generators gens_;
    Scalar witness_;
    SchnorrStatement statement_;
    DeterministicRandomSource rng_{uint64_t{11}};
};

TEST_F(SchnorrTest, ValidProofVerifies) {
    auto proof = ProveSchnorr(witness_, statement_, rng_);
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(SchnorrVerifier::Verify(*proof, statement_));
}

TEST_F(SchnorrTest, KnownNonce) {
    Scalar nonce(1618);
    auto proof = ProveSchnorrWithNonce(witness_, statement_, nonce);
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->r, statement_.base * nonce);

    auto split = SplitPointX(statement_.image);
    auto rsplit = SplitPointX(proof->r);
    ASSERT_TRUE(split && rsplit);
    Scalar e = PoseidonHash({(*split)[0], (*split)[1], (*rsplit)[0], (*rsplit)[1]});
    EXPECT_EQ(SchnorrVerifier::ComputeChallenge(statement_.image, proof->r), e);
    EXPECT_EQ(proof->z, nonce + e * witness_);
}

TEST_F(SchnorrTest, WrongWitnessFails) {
    auto proof = ProveSchnorr(witness_ + Scalar(1), statement_, rng_);
    ASSERT_TRUE(proof.has_value());
    EXPECT_FALSE(SchnorrVerifier::Verify(*proof, statement_));
}

TEST_F(SchnorrTest, WrongBaseFails) {
    auto proof = *ProveSchnorr(witness_, statement_, rng_);
    SchnorrStatement other{gens_.b, statement_.image};
    EXPECT_FALSE(SchnorrVerifier::Verify(proof, other));
}

TEST_F(SchnorrTest, IdentityImageRejected) {
    SchnorrStatement bad{gens_.h, Point::Identity()};
    EXPECT_FALSE(ProveSchnorr(witness_, bad, rng_).has_value());
}

TEST_F(SchnorrTest, Serialization) {
    auto proof = *ProveSchnorr(witness_, statement_, rng_);
    auto bytes = proof.ToBytes();
    ASSERT_EQ(bytes.size(), SchnorrProof::SIZE);
    EXPECT_EQ(SchnorrProof::SIZE, 65u);

    auto decoded = SchnorrProof::FromBytes(bytes.data(), bytes.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, proof);

    bytes.push_back(0);
    EXPECT_FALSE(SchnorrProof::FromBytes(bytes.data(), bytes.size()).has_value());
}

} // namespace test
} // namespace anchorzk
