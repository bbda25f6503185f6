// ANCHORZK - Sigma Protocols Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/anchor/sigma.h"
#include "anchorzk/anchor/field_split.h"
#include "anchorzk/anchor/setup.h"
#include "anchorzk/crypto/poseidon.h"

#include <initializer_list>

namespace anchorzk {
namespace anchor {

namespace {

void AppendPoint(std::vector<Byte>& out, const bn254::Point& point) {
    auto encoded = point.ToCompressed();
    out.insert(out.end(), encoded.begin(), encoded.end());
}

void AppendScalar(std::vector<Byte>& out, const Scalar& scalar) {
    auto encoded = scalar.ToBytes();
    out.insert(out.end(), encoded.begin(), encoded.end());
}

/// Absorb the split x coordinates of `points` into one Poseidon call
std::optional<Scalar> ChallengeOver(std::initializer_list<const bn254::Point*> points) {
    std::vector<FieldElement> inputs;
    inputs.reserve(points.size() * 2);
    for (const bn254::Point* point : points) {
        auto split = SplitPointX(*point);
        if (!split) {
            return std::nullopt;
        }
        inputs.push_back((*split)[0]);
        inputs.push_back((*split)[1]);
    }
    return PoseidonHash(inputs);
}

bool HasIdentity(std::initializer_list<const bn254::Point*> points) {
    for (const bn254::Point* point : points) {
        if (point->IsIdentity()) return true;
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// DLEQ
// ============================================================================

std::vector<Byte> DleqProof::ToBytes() const {
    std::vector<Byte> out;
    out.reserve(SIZE);
    AppendPoint(out, r1);
    AppendPoint(out, r2);
    AppendScalar(out, z);
    return out;
}

std::optional<DleqProof> DleqProof::FromBytes(const Byte* data, size_t len) {
    if (data == nullptr || len != SIZE) {
        return std::nullopt;
    }
    auto r1 = bn254::Point::FromCompressed(data);
    auto r2 = bn254::Point::FromCompressed(data + bn254::Point::COMPRESSED_SIZE);
    auto z = FieldElement::FromCanonicalBytes(data + 2 * bn254::Point::COMPRESSED_SIZE,
                                              FieldElement::SIZE);
    if (!r1 || !r2 || !z) {
        return std::nullopt;
    }
    return DleqProof{*r1, *r2, *z};
}

std::optional<DleqProof> ProveDleq(const Scalar& secret, const DleqStatement& statement,
                                   RandomSource& rng) {
    return ProveDleqWithNonce(secret, statement, SampleScalar(rng));
}

std::optional<DleqProof> ProveDleqWithNonce(const Scalar& secret,
                                            const DleqStatement& statement,
                                            const Scalar& nonce) {
    DleqProof proof;
    proof.r1 = statement.base1 * nonce;
    proof.r2 = statement.base2 * nonce;

    auto e = DleqVerifier::ComputeChallenge(statement.image1, statement.image2,
                                            proof.r1, proof.r2);
    if (!e) {
        return std::nullopt;
    }
    proof.z = nonce + *e * secret;
    return proof;
}

std::optional<Scalar> DleqVerifier::ComputeChallenge(const bn254::Point& image1,
                                                     const bn254::Point& image2,
                                                     const bn254::Point& r1,
                                                     const bn254::Point& r2) {
    return ChallengeOver({&image1, &image2, &r1, &r2});
}

bool DleqVerifier::Verify(const DleqProof& proof, const DleqStatement& statement) {
    if (HasIdentity({&statement.base1, &statement.base2, &statement.image1,
                     &statement.image2, &proof.r1, &proof.r2})) {
        return false;
    }

    auto e = ComputeChallenge(statement.image1, statement.image2, proof.r1, proof.r2);
    if (!e) {
        return false;
    }

    if (statement.base1 * proof.z != proof.r1 + statement.image1 * *e) {
        return false;
    }
    return statement.base2 * proof.z == proof.r2 + statement.image2 * *e;
}

// ============================================================================
// Schnorr
// ============================================================================

std::vector<Byte> SchnorrProof::ToBytes() const {
    std::vector<Byte> out;
    out.reserve(SIZE);
    AppendPoint(out, r);
    AppendScalar(out, z);
    return out;
}

std::optional<SchnorrProof> SchnorrProof::FromBytes(const Byte* data, size_t len) {
    if (data == nullptr || len != SIZE) {
        return std::nullopt;
    }
    auto r = bn254::Point::FromCompressed(data);
    auto z = FieldElement::FromCanonicalBytes(data + bn254::Point::COMPRESSED_SIZE,
                                              FieldElement::SIZE);
    if (!r || !z) {
        return std::nullopt;
    }
    return SchnorrProof{*r, *z};
}

std::optional<SchnorrProof> ProveSchnorr(const Scalar& witness,
                                         const SchnorrStatement& statement,
                                         RandomSource& rng) {
    return ProveSchnorrWithNonce(witness, statement, SampleScalar(rng));
}

std::optional<SchnorrProof> ProveSchnorrWithNonce(const Scalar& witness,
                                                  const SchnorrStatement& statement,
                                                  const Scalar& nonce) {
    SchnorrProof proof;
    proof.r = statement.base * nonce;

    auto e = SchnorrVerifier::ComputeChallenge(statement.image, proof.r);
    if (!e) {
        return std::nullopt;
    }
    proof.z = nonce + *e * witness;
    return proof;
}

std::optional<Scalar> SchnorrVerifier::ComputeChallenge(const bn254::Point& image,
                                                        const bn254::Point& r) {
    return ChallengeOver({&image, &r});
}

bool SchnorrVerifier::Verify(const SchnorrProof& proof, const SchnorrStatement& statement) {
    if (HasIdentity({&statement.base, &statement.image, &proof.r})) {
        return false;
    }

    auto e = ComputeChallenge(statement.image, proof.r);
    if (!e) {
        return false;
    }
    return statement.base * proof.z == proof.r + statement.image * *e;
}

} // namespace anchor
} // namespace anchorzk
