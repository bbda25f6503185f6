// ANCHORZK - Secure Random Number Generation Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/core/random.h"
#include "anchorzk/crypto/sha256.h"

#include <algorithm>
#include <climits>
#include <limits>

#include <openssl/rand.h>

namespace anchorzk {

void GetRandBytes(uint8_t* buf, size_t len) {
    // RAND_bytes takes an int length
    while (len > 0) {
        int chunk = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
        if (RAND_bytes(buf, chunk) != 1) {
            throw RandomnessError("RAND_bytes failed");
        }
        buf += chunk;
        len -= static_cast<size_t>(chunk);
    }
}

uint64_t GetRandUint64() {
    uint8_t raw[8];
    GetRandBytes(raw, sizeof(raw));
    return ReadBE64(raw);
}

uint64_t GetRandInt(uint64_t max) {
    if (max <= 1) {
        return 0;
    }
    // Reject the top partial bucket so every residue is equally likely
    const uint64_t limit = std::numeric_limits<uint64_t>::max() - std::numeric_limits<uint64_t>::max() % max;
    for (;;) {
        uint64_t candidate = GetRandUint64();
        if (candidate < limit) {
            return candidate % max;
        }
    }
}

// ============================================================================
// Random Sources
// ============================================================================

void OsRandomSource::Fill(uint8_t* buf, size_t len) {
    GetRandBytes(buf, len);
}

DeterministicRandomSource::DeterministicRandomSource(const Bytes& seed)
    : seed_(seed) {}

DeterministicRandomSource::DeterministicRandomSource(uint64_t seed) {
    WriteBE64(seed_, seed);
}

void DeterministicRandomSource::Fill(uint8_t* buf, size_t len) {
    size_t written = 0;
    while (written < len) {
        if (blockPos_ == Hash256::SIZE) {
            Bytes input = seed_;
            WriteBE64(input, counter_++);
            block_ = SHA256Hash(input);
            blockPos_ = 0;
        }
        size_t take = std::min(len - written, Hash256::SIZE - blockPos_);
        std::copy_n(block_.begin() + blockPos_, take, buf + written);
        blockPos_ += take;
        written += take;
    }
}

} // namespace anchorzk
