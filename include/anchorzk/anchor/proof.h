// ANCHORZK - Anchored Proof Bundle
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Wire layout:
//   C (33) || C' (33) || P (33) || leaf_hash (32)
//   || R1 (33) || R2 (33) || z (32) || R (33) || z' (32)
//   || sibling_count (u32 LE) || siblings (32 each)

#ifndef ANCHORZK_ANCHOR_PROOF_H
#define ANCHORZK_ANCHOR_PROOF_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "anchorzk/anchor/sigma.h"
#include "anchorzk/core/types.h"
#include "anchorzk/crypto/bn254.h"
#include "anchorzk/merkle/merkle_tree.h"

namespace anchorzk {
namespace anchor {

/**
 * Everything a verifier needs besides the public parameters and the
 * claimed leaf index.
 */
struct AnchoredProof {
    /// Size of the fixed part preceding the Merkle path
    static constexpr size_t FIXED_SIZE = 3 * bn254::Point::COMPRESSED_SIZE + Hash256::SIZE +
                                         DleqProof::SIZE + SchnorrProof::SIZE;

    bn254::Point commitment;          ///< C = G^w * H^r
    bn254::Point modifiedCommitment;  ///< C' = C^s
    bn254::Point linkPoint;           ///< P = G^(s*w)
    Hash256 leafHash;
    merkle::MerkleProof merkleProof;
    DleqProof dleq;
    SchnorrProof schnorr;

    std::vector<Byte> ToBytes() const;

    /// Strict decode: no truncation, no trailing bytes, valid points,
    /// canonical scalars, at most MerkleProof::MAX_SIBLINGS siblings
    static std::optional<AnchoredProof> FromBytes(const Byte* data, size_t len);
    static std::optional<AnchoredProof> FromBytes(const std::vector<Byte>& data) {
        return FromBytes(data.data(), data.size());
    }

    std::string ToHex() const;
    static std::optional<AnchoredProof> FromHex(const std::string& hex);

    bool operator==(const AnchoredProof& other) const;
    bool operator!=(const AnchoredProof& other) const { return !(*this == other); }
};

} // namespace anchor
} // namespace anchorzk

#endif // ANCHORZK_ANCHOR_PROOF_H
