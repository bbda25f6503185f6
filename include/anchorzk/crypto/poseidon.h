// ANCHORZK - Poseidon Hash Function
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// ZK-friendly algebraic hash over the BN254 scalar field
// Based on: "Poseidon: A New Hash Function for Zero-Knowledge Proof Systems"
// https://eprint.iacr.org/2019/458
//
// Fixed-arity construction: for n inputs the state has width t = n + 1,
// is initialised to [0, x_1, ..., x_n], permuted once, and state[0] is
// the output. Round counts follow the reference table for alpha = 5 and
// 128-bit security. Round constants and the MDS matrix are derived
// locally, so digests are NOT interchangeable with circomlib's.

#ifndef ANCHORZK_CRYPTO_POSEIDON_H
#define ANCHORZK_CRYPTO_POSEIDON_H

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include "anchorzk/core/types.h"
#include "anchorzk/crypto/field.h"

namespace anchorzk {

// ============================================================================
// Poseidon Configuration
// ============================================================================

/// Poseidon permutation parameters
struct PoseidonConfig {
    /// State width (t)
    size_t width;

    /// Number of full rounds (R_F)
    size_t fullRounds;

    /// Number of partial rounds (R_P)
    size_t partialRounds;

    size_t totalRounds() const { return fullRounds + partialRounds; }
};

// ============================================================================
// Poseidon Hash Class
// ============================================================================

/// Poseidon hash with a fixed number of inputs
class Poseidon {
public:
    /// Supported arities
    static constexpr size_t MIN_ARITY = 1;
    static constexpr size_t MAX_ARITY = 8;

    /// Output size in bytes (one field element)
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Build parameters for `arity` inputs. Throws std::invalid_argument
    /// outside [MIN_ARITY, MAX_ARITY].
    explicit Poseidon(size_t arity);

    size_t Arity() const { return config_.width - 1; }
    const PoseidonConfig& Config() const { return config_; }

    /// Hash exactly Arity() elements. Throws std::invalid_argument on a
    /// different input count.
    FieldElement Hash(const std::vector<FieldElement>& inputs) const;

    /// Parameters for a given arity
    static PoseidonConfig ConfigForArity(size_t arity);

    /// Shared, lazily built instance for `arity`
    static const Poseidon& ForArity(size_t arity);

private:
    PoseidonConfig config_;

    /// Round constants, width entries per round
    std::vector<FieldElement> roundConstants_;

    /// MDS matrix (width x width, row major)
    std::vector<FieldElement> mds_;

    void Permute(std::vector<FieldElement>& state) const;
    void AddRoundConstants(std::vector<FieldElement>& state, size_t round) const;
    void Mix(std::vector<FieldElement>& state) const;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Hash inputs with the arity equal to inputs.size()
inline FieldElement PoseidonHash(const std::vector<FieldElement>& inputs) {
    return Poseidon::ForArity(inputs.size()).Hash(inputs);
}

} // namespace anchorzk

#endif // ANCHORZK_CRYPTO_POSEIDON_H
