// ANCHORZK - Merkle Tree Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/merkle/merkle_tree.h"
#include "anchorzk/crypto/poseidon.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace anchorzk {
namespace merkle {

// ============================================================================
// Hashers
// ============================================================================

Hash256 MerkleHasher::HashPair(const Hash256& left, const Hash256& right) const {
    Byte buffer[2 * Hash256::SIZE];
    std::memcpy(buffer, left.data(), Hash256::SIZE);
    std::memcpy(buffer + Hash256::SIZE, right.data(), Hash256::SIZE);
    return Hash(buffer, sizeof(buffer));
}

namespace {

FieldElement DecodeNode(const Byte* data) {
    auto element = FieldElement::FromCanonicalBytes(data, FieldElement::SIZE);
    if (!element) {
        throw std::invalid_argument("PoseidonMerkleHasher: non-canonical field element");
    }
    return *element;
}

} // anonymous namespace

Hash256 PoseidonMerkleHasher::Hash(const Byte* data, size_t len) const {
    FieldElement digest;
    if (len == 2 * FieldElement::SIZE) {
        digest = PoseidonHash({DecodeNode(data), DecodeNode(data + FieldElement::SIZE)});
    } else if (len == FieldElement::SIZE) {
        digest = PoseidonHash({DecodeNode(data)});
    } else {
        throw std::invalid_argument("PoseidonMerkleHasher: input must be 32 or 64 bytes");
    }
    return Hash256(digest.ToBytes());
}

bool PoseidonMerkleHasher::Accepts(const Hash256& node) const {
    return FieldElement::IsCanonical(node.data(), node.size());
}

// ============================================================================
// MerkleProof
// ============================================================================

std::optional<Hash256> MerkleProof::ComputeRoot(const MerkleHasher& hasher,
                                                uint64_t index,
                                                const Hash256& leaf,
                                                uint64_t totalLeaves) const {
    if (totalLeaves == 0 || index >= totalLeaves) {
        return std::nullopt;
    }
    if (!hasher.Accepts(leaf)) {
        return std::nullopt;
    }
    for (const auto& sibling : siblings) {
        if (!hasher.Accepts(sibling)) {
            return std::nullopt;
        }
    }

    Hash256 current = leaf;
    uint64_t position = index;
    uint64_t levelSize = totalLeaves;
    size_t used = 0;

    while (levelSize > 1) {
        if (position & 1) {
            if (used == siblings.size()) return std::nullopt;
            current = hasher.HashPair(siblings[used++], current);
        } else if (position + 1 < levelSize) {
            if (used == siblings.size()) return std::nullopt;
            current = hasher.HashPair(current, siblings[used++]);
        }
        // else: last node of an odd level, promoted unchanged
        position >>= 1;
        levelSize = (levelSize + 1) / 2;
    }

    if (used != siblings.size()) {
        return std::nullopt;
    }
    return current;
}

bool MerkleProof::Verify(const MerkleHasher& hasher,
                         const Hash256& root,
                         uint64_t index,
                         const Hash256& leaf,
                         uint64_t totalLeaves) const {
    auto computed = ComputeRoot(hasher, index, leaf, totalLeaves);
    return computed && *computed == root;
}

std::vector<Byte> MerkleProof::ToBytes() const {
    std::vector<Byte> out;
    out.reserve(4 + siblings.size() * Hash256::SIZE);
    WriteLE32(out, static_cast<uint32_t>(siblings.size()));
    for (const auto& sibling : siblings) {
        out.insert(out.end(), sibling.begin(), sibling.end());
    }
    return out;
}

std::optional<MerkleProof> MerkleProof::FromBytes(const Byte* data, size_t len, size_t* consumed) {
    if (!data || len < 4) return std::nullopt;

    uint32_t count = ReadLE32(data);
    if (count > MAX_SIBLINGS) return std::nullopt;

    size_t needed = 4 + static_cast<size_t>(count) * Hash256::SIZE;
    if (len < needed) return std::nullopt;

    MerkleProof proof;
    proof.siblings.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        proof.siblings.emplace_back(data + 4 + i * Hash256::SIZE, Hash256::SIZE);
    }
    if (consumed) *consumed = needed;
    return proof;
}

// ============================================================================
// MerkleTree
// ============================================================================

MerkleTree MerkleTree::FromLeaves(std::vector<Hash256> leaves,
                                  std::shared_ptr<const MerkleHasher> hasher) {
    if (!hasher) {
        throw std::invalid_argument("MerkleTree: hasher is required");
    }
    if (leaves.empty()) {
        throw std::invalid_argument("MerkleTree: at least one leaf is required");
    }
    for (const auto& leaf : leaves) {
        if (!hasher->Accepts(leaf)) {
            throw std::invalid_argument("MerkleTree: leaf rejected by hasher");
        }
    }

    MerkleTree tree;
    tree.hasher_ = std::move(hasher);
    tree.levels_.push_back(std::move(leaves));

    while (tree.levels_.back().size() > 1) {
        const auto& level = tree.levels_.back();
        std::vector<Hash256> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            if (i + 1 < level.size()) {
                next.push_back(tree.hasher_->HashPair(level[i], level[i + 1]));
            } else {
                next.push_back(level[i]);
            }
        }
        tree.levels_.push_back(std::move(next));
    }

    const auto& leafLevel = tree.levels_.front();
    tree.sortedLeaves_.reserve(leafLevel.size());
    for (uint64_t i = 0; i < leafLevel.size(); ++i) {
        tree.sortedLeaves_.emplace_back(leafLevel[i], i);
    }
    std::sort(tree.sortedLeaves_.begin(), tree.sortedLeaves_.end());

    return tree;
}

std::optional<MerkleProof> MerkleTree::Prove(uint64_t index) const {
    if (index >= LeafCount()) {
        return std::nullopt;
    }

    MerkleProof proof;
    uint64_t position = index;
    for (size_t depth = 0; depth + 1 < levels_.size(); ++depth) {
        const auto& level = levels_[depth];
        uint64_t sibling = position ^ 1;
        if (sibling < level.size()) {
            proof.siblings.push_back(level[sibling]);
        }
        position >>= 1;
    }
    return proof;
}

std::optional<uint64_t> MerkleTree::FindLeaf(const Hash256& leaf) const {
    auto it = std::lower_bound(sortedLeaves_.begin(), sortedLeaves_.end(), leaf,
        [](const std::pair<Hash256, uint64_t>& entry, const Hash256& value) {
            return entry.first < value;
        });
    if (it == sortedLeaves_.end() || it->first != leaf) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace merkle
} // namespace anchorzk
