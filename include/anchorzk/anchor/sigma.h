// ANCHORZK - Sigma Protocols over BN254 G1
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Non-interactive (Fiat-Shamir) sigma proofs used by the anchored proof.
// Challenges are Poseidon hashes over the split x coordinates of the
// statement and commitment points.
//
// - DLEQ: one exponent s links two base/image pairs
// - Schnorr: knowledge of the discrete log of one image

#ifndef ANCHORZK_ANCHOR_SIGMA_H
#define ANCHORZK_ANCHOR_SIGMA_H

#include <cstddef>
#include <optional>
#include <vector>

#include "anchorzk/core/random.h"
#include "anchorzk/core/types.h"
#include "anchorzk/crypto/bn254.h"
#include "anchorzk/crypto/field.h"

namespace anchorzk {
namespace anchor {

// ============================================================================
// DLEQ Proof (Discrete Log Equality)
// ============================================================================

/// Public statement: log_{base1}(image1) == log_{base2}(image2)
struct DleqStatement {
    bn254::Point base1;   ///< B
    bn254::Point base2;   ///< C
    bn254::Point image1;  ///< U = B^s
    bn254::Point image2;  ///< C' = C^s
};

/**
 * DLEQ proof.
 *
 * Protocol (made non-interactive via Fiat-Shamir):
 * 1. Prover picks rho, sends R1 = base1^rho, R2 = base2^rho
 * 2. Challenge e = Poseidon8(split(image1.x), split(image2.x),
 *                            split(R1.x), split(R2.x))
 * 3. Response z = rho + e*s
 * 4. Verifier checks base1^z == R1 * image1^e and base2^z == R2 * image2^e
 */
struct DleqProof {
    static constexpr size_t SIZE = 2 * bn254::Point::COMPRESSED_SIZE + FieldElement::SIZE;

    bn254::Point r1;
    bn254::Point r2;
    Scalar z;

    /// R1 (33) || R2 (33) || z (32)
    std::vector<Byte> ToBytes() const;

    /// Exactly SIZE bytes; rejects bad points and non-canonical z
    static std::optional<DleqProof> FromBytes(const Byte* data, size_t len);

    bool operator==(const DleqProof& other) const {
        return r1 == other.r1 && r2 == other.r2 && z == other.z;
    }
};

/// Prove with a fresh nonce from `rng`. std::nullopt if the statement
/// contains the identity. Throws RandomnessError if `rng` fails.
std::optional<DleqProof> ProveDleq(const Scalar& secret, const DleqStatement& statement,
                                   RandomSource& rng);

/// Deterministic variant for known-answer tests. `nonce` must never be
/// reused with the same secret.
std::optional<DleqProof> ProveDleqWithNonce(const Scalar& secret,
                                            const DleqStatement& statement,
                                            const Scalar& nonce);

class DleqVerifier {
public:
    /// True if `proof` is valid for `statement`. Never throws on
    /// well-formed points.
    static bool Verify(const DleqProof& proof, const DleqStatement& statement);

    /// Fiat-Shamir challenge; std::nullopt if any point is the identity
    static std::optional<Scalar> ComputeChallenge(const bn254::Point& image1,
                                                  const bn254::Point& image2,
                                                  const bn254::Point& r1,
                                                  const bn254::Point& r2);
};

// ============================================================================
// Schnorr Proof (Knowledge of Discrete Log)
// ============================================================================

/// Public statement: prover knows x with image == base^x
struct SchnorrStatement {
    bn254::Point base;   ///< H
    bn254::Point image;  ///< C' - P = H^(s*r)
};

/**
 * Schnorr proof.
 *
 * R = base^rho, e = Poseidon4(split(image.x), split(R.x)), z = rho + e*x.
 * Verifier checks base^z == R * image^e.
 */
struct SchnorrProof {
    static constexpr size_t SIZE = bn254::Point::COMPRESSED_SIZE + FieldElement::SIZE;

    bn254::Point r;
    Scalar z;

    /// R (33) || z (32)
    std::vector<Byte> ToBytes() const;

    static std::optional<SchnorrProof> FromBytes(const Byte* data, size_t len);

    bool operator==(const SchnorrProof& other) const {
        return r == other.r && z == other.z;
    }
};

std::optional<SchnorrProof> ProveSchnorr(const Scalar& witness,
                                         const SchnorrStatement& statement,
                                         RandomSource& rng);

std::optional<SchnorrProof> ProveSchnorrWithNonce(const Scalar& witness,
                                                  const SchnorrStatement& statement,
                                                  const Scalar& nonce);

class SchnorrVerifier {
public:
    static bool Verify(const SchnorrProof& proof, const SchnorrStatement& statement);

    static std::optional<Scalar> ComputeChallenge(const bn254::Point& image,
                                                  const bn254::Point& r);
};

} // namespace anchor
} // namespace anchorzk

#endif // ANCHORZK_ANCHOR_SIGMA_H
