// ANCHORZK - Anchored Proof Error Taxonomy
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/anchor/errors.h"

namespace anchorzk {
namespace anchor {

const char* AnchorErrorToString(AnchorError error) {
    switch (error) {
        case AnchorError::None:               return "none";
        case AnchorError::InvalidInput:       return "invalid-input";
        case AnchorError::RangeMismatch:      return "range-mismatch";
        case AnchorError::WitnessNotEnrolled: return "witness-not-enrolled";
        case AnchorError::Cancelled:          return "cancelled";
    }
    return "unknown";
}

const char* VerificationStageToString(VerificationStage stage) {
    switch (stage) {
        case VerificationStage::None:      return "accepted";
        case VerificationStage::Malformed: return "malformed";
        case VerificationStage::Merkle:    return "merkle";
        case VerificationStage::Dleq:      return "dleq";
        case VerificationStage::Schnorr:   return "schnorr";
        case VerificationStage::Rejected:  return "rejected";
    }
    return "unknown";
}

} // namespace anchor
} // namespace anchorzk
