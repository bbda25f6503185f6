// ANCHORZK - Anchored Proof Bundle Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/anchor/proof.h"
#include "anchorzk/core/hex.h"

#include <initializer_list>

namespace anchorzk {
namespace anchor {

std::vector<Byte> AnchoredProof::ToBytes() const {
    std::vector<Byte> out;
    out.reserve(FIXED_SIZE + 4 + merkleProof.siblings.size() * Hash256::SIZE);

    for (const bn254::Point* point : {&commitment, &modifiedCommitment, &linkPoint}) {
        auto encoded = point->ToCompressed();
        out.insert(out.end(), encoded.begin(), encoded.end());
    }
    out.insert(out.end(), leafHash.begin(), leafHash.end());

    auto dleqBytes = dleq.ToBytes();
    out.insert(out.end(), dleqBytes.begin(), dleqBytes.end());
    auto schnorrBytes = schnorr.ToBytes();
    out.insert(out.end(), schnorrBytes.begin(), schnorrBytes.end());

    auto pathBytes = merkleProof.ToBytes();
    out.insert(out.end(), pathBytes.begin(), pathBytes.end());
    return out;
}

std::optional<AnchoredProof> AnchoredProof::FromBytes(const Byte* data, size_t len) {
    if (data == nullptr || len < FIXED_SIZE) {
        return std::nullopt;
    }

    AnchoredProof proof;
    size_t offset = 0;

    for (bn254::Point* point : {&proof.commitment, &proof.modifiedCommitment, &proof.linkPoint}) {
        auto decoded = bn254::Point::FromCompressed(data + offset);
        if (!decoded) {
            return std::nullopt;
        }
        *point = *decoded;
        offset += bn254::Point::COMPRESSED_SIZE;
    }

    proof.leafHash = Hash256(data + offset, Hash256::SIZE);
    offset += Hash256::SIZE;

    auto dleq = DleqProof::FromBytes(data + offset, DleqProof::SIZE);
    if (!dleq) {
        return std::nullopt;
    }
    proof.dleq = *dleq;
    offset += DleqProof::SIZE;

    auto schnorr = SchnorrProof::FromBytes(data + offset, SchnorrProof::SIZE);
    if (!schnorr) {
        return std::nullopt;
    }
    proof.schnorr = *schnorr;
    offset += SchnorrProof::SIZE;

    size_t consumed = 0;
    auto path = merkle::MerkleProof::FromBytes(data + offset, len - offset, &consumed);
    if (!path || offset + consumed != len) {
        return std::nullopt;
    }
    proof.merkleProof = std::move(*path);
    return proof;
}

std::string AnchoredProof::ToHex() const {
    return BytesToHex(ToBytes());
}

std::optional<AnchoredProof> AnchoredProof::FromHex(const std::string& hex) {
    auto bytes = TryHexToBytes(hex);
    if (!bytes) {
        return std::nullopt;
    }
    return FromBytes(*bytes);
}

bool AnchoredProof::operator==(const AnchoredProof& other) const {
    return commitment == other.commitment &&
           modifiedCommitment == other.modifiedCommitment &&
           linkPoint == other.linkPoint &&
           leafHash == other.leafHash &&
           merkleProof == other.merkleProof &&
           dleq == other.dleq &&
           schnorr == other.schnorr;
}

} // namespace anchor
} // namespace anchorzk
