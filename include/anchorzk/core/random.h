// ANCHORZK - Secure Random Number Generation Header
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Randomness is injected wherever it is consumed. Production code uses
// OsRandomSource (OS entropy); tests use DeterministicRandomSource so
// proofs are reproducible.

#ifndef ANCHORZK_CORE_RANDOM_H
#define ANCHORZK_CORE_RANDOM_H

#include "anchorzk/core/types.h"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace anchorzk {

// ============================================================================
// Errors
// ============================================================================

/// Raised when a random source cannot deliver the requested bytes or
/// rejection sampling runs past its attempt cap.
class RandomnessError : public std::runtime_error {
public:
    explicit RandomnessError(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================================
// Core Random Functions
// ============================================================================

/// Fill buffer from OpenSSL's CSPRNG. Throws RandomnessError on failure.
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

/// Generate random integer in range [0, max) without modulo bias
uint64_t GetRandInt(uint64_t max);

// ============================================================================
// Random Sources
// ============================================================================

/**
 * Capability interface for a byte-oriented random source.
 *
 * Implementations either fill the whole buffer or throw RandomnessError;
 * a partially filled buffer is never returned.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Fill `len` bytes at `buf`
    virtual void Fill(uint8_t* buf, size_t len) = 0;
};

/// Random source backed by GetRandBytes
class OsRandomSource : public RandomSource {
public:
    void Fill(uint8_t* buf, size_t len) override;
};

/**
 * Reproducible random source: SHA256(seed || counter) in counter mode.
 *
 * Only suitable for tests and known-answer vectors.
 */
class DeterministicRandomSource : public RandomSource {
public:
    explicit DeterministicRandomSource(const Bytes& seed);
    explicit DeterministicRandomSource(uint64_t seed);

    void Fill(uint8_t* buf, size_t len) override;

    /// Number of SHA256 blocks produced so far
    uint64_t BlocksUsed() const { return counter_; }

private:
    Bytes seed_;
    uint64_t counter_{0};
    Hash256 block_;
    size_t blockPos_{Hash256::SIZE};
};

} // namespace anchorzk

#endif // ANCHORZK_CORE_RANDOM_H
