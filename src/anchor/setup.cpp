// ANCHORZK - Parameter Setup Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/anchor/setup.h"
#include "anchorzk/crypto/sha256.h"
#include "anchorzk/util/logging.h"

#include <array>
#include <string>

namespace anchorzk {
namespace anchor {

namespace {

constexpr Byte INFINITY_FLAG = 0x40;
constexpr Byte LARGEST_Y_FLAG = 0x80;
constexpr Byte FLAG_MASK = INFINITY_FLAG | LARGEST_Y_FLAG;

/// Decode one hash digest into a curve point candidate
std::optional<bn254::Point> DecodeCandidate(const Hash256& digest) {
    std::array<uint8_t, 32> le = digest.ToArray();
    Byte flags = le[31] & FLAG_MASK;
    if (flags & INFINITY_FLAG) {
        return std::nullopt;
    }
    le[31] &= static_cast<Byte>(~FLAG_MASK);

    std::array<uint8_t, 32> be;
    for (size_t i = 0; i < be.size(); ++i) {
        be[i] = le[be.size() - 1 - i];
    }
    bn254::BaseFieldElement x(be);
    if (!x.IsValid()) {
        return std::nullopt;
    }
    return bn254::Point::FromX(x, (flags & LARGEST_Y_FLAG) != 0);
}

} // anonymous namespace

GeneratorSeeds GeneratorSeeds::Default() {
    GeneratorSeeds seeds;
    seeds.h.assign(32, 0x00);
    seeds.b.assign(32, 0x01);
    return seeds;
}

bn254::Point SampleGenerator(const Bytes& seed) {
    for (uint64_t counter = 0; counter < kMaxGeneratorAttempts; ++counter) {
        Bytes input = seed;
        WriteBE64(input, counter);
        auto candidate = DecodeCandidate(SHA256Hash(input));
        if (candidate && !candidate->IsIdentity()) {
            LOG_DEBUG(util::LogCategory::SETUP)
                << "Generator derived after " << (counter + 1) << " candidate(s)";
            return *candidate;
        }
    }
    throw SetupError("generator sampling exceeded " +
                     std::to_string(kMaxGeneratorAttempts) + " attempts");
}

Generators SetupGenerators(const GeneratorSeeds& seeds) {
    if (seeds.h == seeds.b) {
        throw SetupError("generator seeds for H and B must differ");
    }

    Generators gens{bn254::Point::Generator(), SampleGenerator(seeds.h), SampleGenerator(seeds.b)};

    if (gens.g == gens.h || gens.g == gens.b || gens.h == gens.b) {
        throw SetupError("derived generators collide");
    }

    LOG_INFO(util::LogCategory::SETUP) << "Generators ready";
    return gens;
}

Scalar SampleScalar(RandomSource& rng) {
    std::array<Byte, FieldElement::SIZE> buffer;
    for (size_t attempt = 0; attempt < kMaxSampleAttempts; ++attempt) {
        rng.Fill(buffer.data(), buffer.size());
        // r is a 254-bit prime; mask to 254 bits and reject the tail
        buffer[0] &= 0x3f;
        auto scalar = FieldElement::FromCanonicalBytes(buffer.data(), buffer.size());
        if (scalar && !scalar->IsZero()) {
            return *scalar;
        }
    }
    throw RandomnessError("scalar sampling exceeded " +
                          std::to_string(kMaxSampleAttempts) + " attempts");
}

bn254::Point ComputeAnchor(const Scalar& secret, const bn254::Point& base) {
    return base * secret;
}

} // namespace anchor
} // namespace anchorzk
