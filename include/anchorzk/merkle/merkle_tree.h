// ANCHORZK - Merkle Tree with Pluggable Hash
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Binary Merkle tree over 32-byte nodes. Internal nodes are
// Hash(left || right); a node without a right sibling on an odd-sized
// level is promoted unchanged to the next level, so proofs for such
// positions carry fewer siblings than the tree depth.

#ifndef ANCHORZK_MERKLE_MERKLE_TREE_H
#define ANCHORZK_MERKLE_MERKLE_TREE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "anchorzk/core/types.h"

namespace anchorzk {
namespace merkle {

// ============================================================================
// Hasher Capability
// ============================================================================

/**
 * Hash capability used by the tree. Implementations receive either one
 * node (32 bytes) or a concatenated pair (64 bytes).
 */
class MerkleHasher {
public:
    virtual ~MerkleHasher() = default;

    /// Hash arbitrary input. May throw std::invalid_argument for input the
    /// hasher does not accept.
    virtual Hash256 Hash(const Byte* data, size_t len) const = 0;

    /// Whether `node` is acceptable as hasher input
    virtual bool Accepts(const Hash256& node) const { (void)node; return true; }

    /// Hash(left || right)
    Hash256 HashPair(const Hash256& left, const Hash256& right) const;
};

/**
 * Poseidon-backed hasher over canonical big-endian Fr encodings.
 *
 * 64-byte input is split into two field elements and hashed with
 * Poseidon-2; 32-byte input is hashed with Poseidon-1. Any other length
 * or a non-canonical element throws std::invalid_argument. Leaves and
 * internal nodes are separated by input length alone.
 */
class PoseidonMerkleHasher : public MerkleHasher {
public:
    Hash256 Hash(const Byte* data, size_t len) const override;
    bool Accepts(const Hash256& node) const override;
};

// ============================================================================
// Merkle Proof
// ============================================================================

/// Sibling path for one leaf, ordered from the leaf level upwards
struct MerkleProof {
    /// Upper bound on siblings accepted when decoding
    static constexpr size_t MAX_SIBLINGS = 64;

    std::vector<Hash256> siblings;

    MerkleProof() = default;
    explicit MerkleProof(std::vector<Hash256> path) : siblings(std::move(path)) {}

    /// Recompute the root for `leaf` at `index` in a tree of `totalLeaves`.
    /// Returns std::nullopt if the path length does not fit the position
    /// or a node is rejected by the hasher.
    std::optional<Hash256> ComputeRoot(const MerkleHasher& hasher,
                                       uint64_t index,
                                       const Hash256& leaf,
                                       uint64_t totalLeaves) const;

    /// True if ComputeRoot yields `root`
    bool Verify(const MerkleHasher& hasher,
                const Hash256& root,
                uint64_t index,
                const Hash256& leaf,
                uint64_t totalLeaves) const;

    /// count (u32 LE) || siblings
    std::vector<Byte> ToBytes() const;

    /// Decode from the front of `data`; `consumed` receives the bytes used
    static std::optional<MerkleProof> FromBytes(const Byte* data, size_t len,
                                                size_t* consumed = nullptr);

    bool operator==(const MerkleProof& other) const { return siblings == other.siblings; }
    bool operator!=(const MerkleProof& other) const { return !(*this == other); }
};

// ============================================================================
// Merkle Tree
// ============================================================================

/**
 * Immutable Merkle tree built in one pass from its leaves.
 *
 * Safe for concurrent readers once constructed.
 */
class MerkleTree {
public:
    /// Build from a non-empty leaf list. Throws std::invalid_argument for
    /// an empty list or a leaf the hasher rejects.
    static MerkleTree FromLeaves(std::vector<Hash256> leaves,
                                 std::shared_ptr<const MerkleHasher> hasher);

    const Hash256& Root() const { return levels_.back().front(); }

    uint64_t LeafCount() const { return levels_.front().size(); }

    /// Number of hashing levels above the leaves
    size_t Depth() const { return levels_.size() - 1; }

    const std::vector<Hash256>& Leaves() const { return levels_.front(); }

    const Hash256& Leaf(uint64_t index) const { return levels_.front().at(index); }

    const MerkleHasher& Hasher() const { return *hasher_; }

    /// Proof for the leaf at `index`, or std::nullopt if out of range
    std::optional<MerkleProof> Prove(uint64_t index) const;

    /// Position of `leaf`, or std::nullopt if absent
    std::optional<uint64_t> FindLeaf(const Hash256& leaf) const;

private:
    MerkleTree() = default;

    std::shared_ptr<const MerkleHasher> hasher_;

    /// levels_[0] are the leaves, levels_.back() holds only the root
    std::vector<std::vector<Hash256>> levels_;

    /// Leaves sorted by value for FindLeaf
    std::vector<std::pair<Hash256, uint64_t>> sortedLeaves_;
};

} // namespace merkle
} // namespace anchorzk

#endif // ANCHORZK_MERKLE_MERKLE_TREE_H
