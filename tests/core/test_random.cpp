// ANCHORZK - Random Source Tests
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include <gtest/gtest.h>
#include "anchorzk/core/random.h"
#include "anchorzk/crypto/sha256.h"

#include <array>
#include <cstring>
#include <set>
#include <vector>

namespace anchorzk {
namespace test {

// ============================================================================
// OS Randomness
// ============================================================================

TEST(RandomTest, GetRandBytesNonZero) {
    std::array<uint8_t, 32> buf{};
    GetRandBytes(buf.data(), buf.size());

    bool allZero = true;
    for (auto b : buf) {
        if (b != 0) allZero = false;
    }
    EXPECT_FALSE(allZero);
}

TEST(RandomTest, GetRandBytesDifferent) {
    std::array<uint8_t, 32> a{}, b{};
    GetRandBytes(a.data(), a.size());
    GetRandBytes(b.data(), b.size());
    EXPECT_NE(a, b);
}

TEST(RandomTest, GetRandBytesZeroLength) {
    EXPECT_NO_THROW(GetRandBytes(nullptr, 0));
}

TEST(RandomTest, GetRandIntRange) {
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LT(GetRandInt(7), 7u);
    }
    EXPECT_EQ(GetRandInt(1), 0u);
}

TEST(RandomTest, OsRandomSourceFills) {
    OsRandomSource rng;
    std::array<uint8_t, 64> a{}, b{};
    rng.Fill(a.data(), a.size());
    rng.Fill(b.data(), b.size());
    EXPECT_NE(a, b);
}

// ============================================================================
// Deterministic Source
// ============================================================================

TEST(DeterministicRandomTest, SameSeedSameStream) {
    DeterministicRandomSource a(42), b(42);
    std::array<uint8_t, 100> x{}, y{};
    a.Fill(x.data(), x.size());
    b.Fill(y.data(), y.size());
    EXPECT_EQ(x, y);
}

TEST(DeterministicRandomTest, DifferentSeedsDiffer) {
    DeterministicRandomSource a(1), b(2);
    std::array<uint8_t, 32> x{}, y{};
    a.Fill(x.data(), x.size());
    b.Fill(y.data(), y.size());
    EXPECT_NE(x, y);
}

TEST(DeterministicRandomTest, SplitReadsMatchSingleRead) {
    DeterministicRandomSource a(7), b(7);
    std::array<uint8_t, 70> whole{};
    a.Fill(whole.data(), whole.size());

    std::array<uint8_t, 70> parts{};
    b.Fill(parts.data(), 5);
    b.Fill(parts.data() + 5, 40);
    b.Fill(parts.data() + 45, 25);
    EXPECT_EQ(whole, parts);
}

TEST(DeterministicRandomTest, CounterModeBlocks) {
    Bytes seed = {0xaa, 0xbb};
    DeterministicRandomSource rng(seed);
    std::array<uint8_t, 32> out{};
    rng.Fill(out.data(), out.size());
    EXPECT_EQ(rng.BlocksUsed(), 1u);

    Bytes input = seed;
    WriteBE64(input, 0);
    Hash256 expected = SHA256Hash(input);
    EXPECT_EQ(0, std::memcmp(out.data(), expected.data(), out.size()));

    rng.Fill(out.data(), 1);
    EXPECT_EQ(rng.BlocksUsed(), 2u);
}

} // namespace test
} // namespace anchorzk
