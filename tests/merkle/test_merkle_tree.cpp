// ANCHORZK - Merkle Tree Tests
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include <gtest/gtest.h>
#include "anchorzk/merkle/merkle_tree.h"
#include "anchorzk/crypto/field.h"
#include "anchorzk/crypto/poseidon.h"
#include "anchorzk/crypto/sha256.h"

#include <memory>
#include <stdexcept>
#include <vector>

namespace anchorzk {
namespace test {

using merkle::MerkleHasher;
using merkle::MerkleProof;
using merkle::MerkleTree;
using merkle::PoseidonMerkleHasher;

namespace {

/// SHA256 hasher so tree shape can be checked independently of Poseidon
class Sha256Hasher : public MerkleHasher {
public:
    Hash256 Hash(const Byte* data, size_t len) const override {
        return SHA256Hash(data, len);
    }
};

Hash256 LeafOf(uint64_t value) {
    return Hash256(FieldElement(value).ToBytes());
}

std::vector<Hash256> MakeLeaves(size_t n) {
    std::vector<Hash256> leaves;
    for (size_t i = 0; i < n; ++i) {
        leaves.push_back(LeafOf(1000 + i));
    }
    return leaves;
}

std::shared_ptr<const MerkleHasher> Sha() { return std::make_shared<Sha256Hasher>(); }
std::shared_ptr<const MerkleHasher> Pos() { return std::make_shared<PoseidonMerkleHasher>(); }

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(MerkleTreeTest, SingleLeafIsRoot) {
    auto leaves = MakeLeaves(1);
    auto tree = MerkleTree::FromLeaves(leaves, Sha());
    EXPECT_EQ(tree.Root(), leaves[0]);
    EXPECT_EQ(tree.Depth(), 0u);
    auto proof = tree.Prove(0);
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(proof->siblings.empty());
    EXPECT_TRUE(proof->Verify(tree.Hasher(), tree.Root(), 0, leaves[0], 1));
}

TEST(MerkleTreeTest, FourLeafRoot) {
    auto leaves = MakeLeaves(4);
    Sha256Hasher h;
    Hash256 expected = h.HashPair(h.HashPair(leaves[0], leaves[1]),
                                  h.HashPair(leaves[2], leaves[3]));
    auto tree = MerkleTree::FromLeaves(leaves, Sha());
    EXPECT_EQ(tree.Root(), expected);
    EXPECT_EQ(tree.Depth(), 2u);
    EXPECT_EQ(tree.LeafCount(), 4u);
}

TEST(MerkleTreeTest, OddNodeIsPromoted) {
    auto leaves = MakeLeaves(3);
    Sha256Hasher h;
    Hash256 expected = h.HashPair(h.HashPair(leaves[0], leaves[1]), leaves[2]);
    auto tree = MerkleTree::FromLeaves(leaves, Sha());
    EXPECT_EQ(tree.Root(), expected);

    auto proof = tree.Prove(2);
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->siblings.size(), 1u);
    EXPECT_TRUE(proof->Verify(h, tree.Root(), 2, leaves[2], 3));
}

TEST(MerkleTreeTest, RejectsEmptyAndNullHasher) {
    EXPECT_THROW(MerkleTree::FromLeaves({}, Sha()), std::invalid_argument);
    EXPECT_THROW(MerkleTree::FromLeaves(MakeLeaves(2), nullptr), std::invalid_argument);
}

TEST(MerkleTreeTest, PoseidonRejectsNonCanonicalLeaf) {
    auto leaves = MakeLeaves(2);
    leaves[1] = Hash256::FromHex("ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
    EXPECT_THROW(MerkleTree::FromLeaves(leaves, Pos()), std::invalid_argument);
}

// ============================================================================
// Proofs
// ============================================================================

TEST(MerkleProofTest, EveryLeafVerifiesForVariousSizes) {
    for (size_t n : {2u, 5u, 7u, 8u, 13u}) {
        auto leaves = MakeLeaves(n);
        auto tree = MerkleTree::FromLeaves(leaves, Pos());
        for (uint64_t i = 0; i < n; ++i) {
            auto proof = tree.Prove(i);
            ASSERT_TRUE(proof.has_value());
            EXPECT_TRUE(proof->Verify(tree.Hasher(), tree.Root(), i, leaves[i], n))
                << "n=" << n << " i=" << i;
        }
    }
}

TEST(MerkleProofTest, WrongIndexOrLeafFails) {
    auto leaves = MakeLeaves(8);
    auto tree = MerkleTree::FromLeaves(leaves, Pos());
    auto proof = tree.Prove(3);
    ASSERT_TRUE(proof.has_value());

    EXPECT_FALSE(proof->Verify(tree.Hasher(), tree.Root(), 2, leaves[3], 8));
    EXPECT_FALSE(proof->Verify(tree.Hasher(), tree.Root(), 3, leaves[4], 8));
    EXPECT_FALSE(proof->Verify(tree.Hasher(), tree.Root(), 8, leaves[3], 8));
    EXPECT_FALSE(proof->Verify(tree.Hasher(), tree.Root(), 3, leaves[3], 0));
}

TEST(MerkleProofTest, PathLengthMustMatch) {
    auto leaves = MakeLeaves(8);
    auto tree = MerkleTree::FromLeaves(leaves, Pos());
    auto proof = *tree.Prove(5);

    MerkleProof shorter = proof;
    shorter.siblings.pop_back();
    EXPECT_FALSE(shorter.ComputeRoot(tree.Hasher(), 5, leaves[5], 8).has_value());

    MerkleProof longer = proof;
    longer.siblings.push_back(leaves[0]);
    EXPECT_FALSE(longer.ComputeRoot(tree.Hasher(), 5, leaves[5], 8).has_value());
}

TEST(MerkleProofTest, NonCanonicalSiblingRejected) {
    auto leaves = MakeLeaves(4);
    auto tree = MerkleTree::FromLeaves(leaves, Pos());
    auto proof = *tree.Prove(0);
    proof.siblings[0] = Hash256::FromHex(
        "ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");
    EXPECT_FALSE(proof.ComputeRoot(tree.Hasher(), 0, leaves[0], 4).has_value());
}

TEST(MerkleProofTest, OutOfRangeProve) {
    auto tree = MerkleTree::FromLeaves(MakeLeaves(4), Pos());
    EXPECT_FALSE(tree.Prove(4).has_value());
}

TEST(MerkleProofTest, Serialization) {
    auto leaves = MakeLeaves(8);
    auto tree = MerkleTree::FromLeaves(leaves, Pos());
    auto proof = *tree.Prove(6);

    auto bytes = proof.ToBytes();
    EXPECT_EQ(bytes.size(), 4u + 3 * 32);
    EXPECT_EQ(bytes[0], 3);

    size_t consumed = 0;
    auto decoded = MerkleProof::FromBytes(bytes.data(), bytes.size(), &consumed);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, proof);
    EXPECT_EQ(consumed, bytes.size());

    EXPECT_FALSE(MerkleProof::FromBytes(bytes.data(), bytes.size() - 1).has_value());

    std::vector<Byte> huge = {65, 0, 0, 0};
    EXPECT_FALSE(MerkleProof::FromBytes(huge.data(), huge.size()).has_value());
}

// ============================================================================
// Lookup
// ============================================================================

TEST(MerkleTreeTest, FindLeaf) {
    auto leaves = MakeLeaves(10);
    auto tree = MerkleTree::FromLeaves(leaves, Pos());
    for (uint64_t i = 0; i < leaves.size(); ++i) {
        auto found = tree.FindLeaf(leaves[i]);
        ASSERT_TRUE(found.has_value());
        EXPECT_EQ(*found, i);
    }
    EXPECT_FALSE(tree.FindLeaf(LeafOf(1)).has_value());
}

TEST(PoseidonMerkleHasherTest, LengthDispatch) {
    PoseidonMerkleHasher hasher;
    Hash256 a = LeafOf(1), b = LeafOf(2);
    EXPECT_EQ(hasher.HashPair(a, b),
              Hash256(PoseidonHash({FieldElement(1), FieldElement(2)}).ToBytes()));
    EXPECT_EQ(hasher.Hash(a.data(), a.size()),
              Hash256(PoseidonHash({FieldElement(1)}).ToBytes()));
    Byte odd[10] = {};
    EXPECT_THROW(hasher.Hash(odd, sizeof(odd)), std::invalid_argument);
}

} // namespace test
} // namespace anchorzk
