// ANCHORZK - Poseidon Hash Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/crypto/poseidon.h"
#include "anchorzk/crypto/sha256.h"

#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>

namespace anchorzk {

namespace {

/// Partial rounds indexed by width t = 2..9
constexpr size_t PARTIAL_ROUNDS[] = {56, 57, 56, 60, 60, 63, 64, 63};

constexpr size_t FULL_ROUNDS = 8;

constexpr const char* ROUND_CONSTANT_DOMAIN = "ANCHORZK_POSEIDON_RC";

/// Round constants from a SHA256 chain seeded with the domain, width and
/// round count. Each digest is read big-endian and reduced mod r.
std::vector<FieldElement> GenerateRoundConstants(size_t width, size_t totalRounds) {
    std::vector<FieldElement> constants;
    constants.reserve(width * totalRounds);

    Bytes header(ROUND_CONSTANT_DOMAIN, ROUND_CONSTANT_DOMAIN + std::strlen(ROUND_CONSTANT_DOMAIN));
    WriteBE64(header, width);
    WriteBE64(header, totalRounds);
    Hash256 seed = SHA256Hash(header);

    for (uint64_t count = 0; count < width * totalRounds; ++count) {
        Bytes input(seed.begin(), seed.end());
        WriteBE64(input, count);
        Hash256 digest = SHA256Hash(input);
        constants.push_back(FieldElement::FromBytesReduced(digest.data()));
        seed = digest;
    }

    return constants;
}

/// Cauchy matrix M[i][j] = 1 / (i + (width + j)), which is MDS
std::vector<FieldElement> GenerateMDSMatrix(size_t width) {
    std::vector<FieldElement> mds(width * width);
    for (size_t i = 0; i < width; ++i) {
        for (size_t j = 0; j < width; ++j) {
            mds[i * width + j] = FieldElement(static_cast<uint64_t>(i + width + j)).Inverse();
        }
    }
    return mds;
}

} // anonymous namespace

// ============================================================================
// Poseidon Implementation
// ============================================================================

PoseidonConfig Poseidon::ConfigForArity(size_t arity) {
    if (arity < MIN_ARITY || arity > MAX_ARITY) {
        throw std::invalid_argument("Poseidon: unsupported arity " + std::to_string(arity));
    }
    return PoseidonConfig{arity + 1, FULL_ROUNDS, PARTIAL_ROUNDS[arity - 1]};
}

Poseidon::Poseidon(size_t arity)
    : config_(ConfigForArity(arity))
    , roundConstants_(GenerateRoundConstants(config_.width, config_.totalRounds()))
    , mds_(GenerateMDSMatrix(config_.width)) {}

const Poseidon& Poseidon::ForArity(size_t arity) {
    if (arity < MIN_ARITY || arity > MAX_ARITY) {
        throw std::invalid_argument("Poseidon: unsupported arity " + std::to_string(arity));
    }

    static std::array<std::once_flag, MAX_ARITY + 1> flags;
    static std::array<std::unique_ptr<Poseidon>, MAX_ARITY + 1> instances;

    std::call_once(flags[arity], [arity]() {
        instances[arity] = std::make_unique<Poseidon>(arity);
    });
    return *instances[arity];
}

void Poseidon::AddRoundConstants(std::vector<FieldElement>& state, size_t round) const {
    const FieldElement* rc = &roundConstants_[round * config_.width];
    for (size_t i = 0; i < config_.width; ++i) {
        state[i] += rc[i];
    }
}

void Poseidon::Mix(std::vector<FieldElement>& state) const {
    std::vector<FieldElement> mixed(config_.width);
    for (size_t i = 0; i < config_.width; ++i) {
        const FieldElement* row = &mds_[i * config_.width];
        for (size_t j = 0; j < config_.width; ++j) {
            mixed[i] += row[j] * state[j];
        }
    }
    state.swap(mixed);
}

void Poseidon::Permute(std::vector<FieldElement>& state) const {
    const size_t halfFull = config_.fullRounds / 2;
    size_t round = 0;

    auto fullRound = [&]() {
        AddRoundConstants(state, round++);
        for (auto& element : state) {
            element = element.PoseidonSbox();
        }
        Mix(state);
    };

    for (size_t i = 0; i < halfFull; ++i) {
        fullRound();
    }
    for (size_t i = 0; i < config_.partialRounds; ++i) {
        AddRoundConstants(state, round++);
        state[0] = state[0].PoseidonSbox();
        Mix(state);
    }
    for (size_t i = 0; i < halfFull; ++i) {
        fullRound();
    }
}

FieldElement Poseidon::Hash(const std::vector<FieldElement>& inputs) const {
    if (inputs.size() != Arity()) {
        throw std::invalid_argument("Poseidon: expected " + std::to_string(Arity()) +
                                    " inputs, got " + std::to_string(inputs.size()));
    }

    std::vector<FieldElement> state;
    state.reserve(config_.width);
    state.push_back(FieldElement::Zero());
    state.insert(state.end(), inputs.begin(), inputs.end());

    Permute(state);
    return state[0];
}

} // namespace anchorzk
