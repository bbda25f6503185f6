// ANCHORZK - Enrollment Tree
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// The enrollment tree enumerates every admissible witness x in
// [1, 2^range]. Leaf x-1 commits to the anchor and to the link point
// G^(s*x), so a prover holding s can locate the leaf for its witness
// while the tree itself reveals neither s nor the witness.

#ifndef ANCHORZK_ANCHOR_ENROLLMENT_TREE_H
#define ANCHORZK_ANCHOR_ENROLLMENT_TREE_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "anchorzk/anchor/errors.h"
#include "anchorzk/core/types.h"
#include "anchorzk/crypto/bn254.h"
#include "anchorzk/crypto/field.h"
#include "anchorzk/merkle/merkle_tree.h"

namespace anchorzk {
namespace anchor {

/// First Poseidon input of every leaf
constexpr uint64_t kLeafDomainTag = 1;

/// Largest supported range (2^24 leaves)
constexpr uint32_t kMaxRange = 24;

/// Leaves computed per work unit during a build
constexpr uint64_t kTreeChunkSize = 1024;

/// Poseidon5(kLeafDomainTag, split(anchor.x), split(link.x)) as a
/// big-endian digest. std::nullopt if either point is the identity.
std::optional<Hash256> ComputeLeafHash(const bn254::Point& anchor, const bn254::Point& link);

/**
 * Immutable enrollment tree. Safe for concurrent readers.
 */
class EnrollmentTree {
public:
    EnrollmentTree(uint32_t range, bn254::Point anchor, merkle::MerkleTree tree);

    uint32_t Range() const { return range_; }
    uint64_t LeafCount() const { return tree_.LeafCount(); }
    const Hash256& Root() const { return tree_.Root(); }
    const bn254::Point& Anchor() const { return anchor_; }
    const merkle::MerkleTree& Tree() const { return tree_; }
    const merkle::MerkleHasher& Hasher() const { return tree_.Hasher(); }

    /// Leaf for witness x = index + 1
    const Hash256& Leaf(uint64_t index) const { return tree_.Leaf(index); }

    /// Position of `leaf`, or std::nullopt if not enrolled
    std::optional<uint64_t> FindLeaf(const Hash256& leaf) const { return tree_.FindLeaf(leaf); }

    std::optional<merkle::MerkleProof> Prove(uint64_t index) const { return tree_.Prove(index); }

private:
    uint32_t range_;
    bn254::Point anchor_;
    merkle::MerkleTree tree_;
};

/// Progress and cancellation controls for BuildEnrollmentTree
struct TreeBuildOptions {
    /// 0 builds in the calling thread; n > 0 uses a pool of n workers
    size_t threads{0};

    /// Called on the calling thread after each finished chunk with
    /// (leaves done, total leaves)
    std::function<void(uint64_t, uint64_t)> progress;

    /// Polled between points; a set flag stops the build
    const std::atomic<bool>* cancel{nullptr};
};

struct TreeBuildResult {
    AnchorError error{AnchorError::None};
    std::shared_ptr<const EnrollmentTree> tree;

    bool ok() const { return error == AnchorError::None && tree != nullptr; }
};

/**
 * Build the tree for witnesses 1 .. 2^range.
 *
 * Fails with RangeMismatch for a range outside [1, kMaxRange],
 * InvalidInput for a zero secret or identity anchor, and Cancelled when
 * the cancel flag is raised. Output is independent of the thread count.
 */
TreeBuildResult BuildEnrollmentTree(uint32_t range,
                                    const bn254::Point& anchor,
                                    const Scalar& secret,
                                    const TreeBuildOptions& options = {});

} // namespace anchor
} // namespace anchorzk

#endif // ANCHORZK_ANCHOR_ENROLLMENT_TREE_H
