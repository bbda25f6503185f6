// ANCHORZK - Anchored Proof Error Taxonomy
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Setup and randomness failures are exceptional and thrown. Proof
// generation and verification report their outcome in result structs.

#ifndef ANCHORZK_ANCHOR_ERRORS_H
#define ANCHORZK_ANCHOR_ERRORS_H

#include <stdexcept>
#include <string>

#include "anchorzk/core/random.h"

namespace anchorzk {
namespace anchor {

/// Generator derivation did not converge or produced colliding generators
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& what) : std::runtime_error(what) {}
};

using anchorzk::RandomnessError;

/// Failure reasons for tree building and proof generation
enum class AnchorError {
    None = 0,
    InvalidInput,        ///< zero secret/blinding, anchor mismatch, identity intermediate
    RangeMismatch,       ///< range outside [1, kMaxRange] or witness below the range
    WitnessNotEnrolled,  ///< computed leaf absent from the tree
    Cancelled,           ///< tree build cancelled by the caller
};

/// Stage at which a proof was rejected
enum class VerificationStage {
    None = 0,   ///< accepted
    Malformed,  ///< identity or off-curve point in the bundle
    Merkle,
    Dleq,
    Schnorr,
    Rejected,   ///< reason withheld (uniform rejection)
};

const char* AnchorErrorToString(AnchorError error);
const char* VerificationStageToString(VerificationStage stage);

} // namespace anchor
} // namespace anchorzk

#endif // ANCHORZK_ANCHOR_ERRORS_H
