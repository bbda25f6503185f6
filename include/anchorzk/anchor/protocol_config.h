// ANCHORZK - Protocol Configuration
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Maps ConfigManager keys to protocol parameters.
//
//   range=8                 tree range (2^range leaves)
//   threads=0               tree build workers
//   hseed=<64 hex>          seed for H
//   bseed=<64 hex>          seed for B
//   uniformrejection=0      collapse rejection reasons
//   loglevel=info           logger level
//   debug=tree,prover       categories logged at Debug

#ifndef ANCHORZK_ANCHOR_PROTOCOL_CONFIG_H
#define ANCHORZK_ANCHOR_PROTOCOL_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "anchorzk/anchor/setup.h"
#include "anchorzk/util/config.h"
#include "anchorzk/util/logging.h"

namespace anchorzk {
namespace anchor {

namespace ConfigKeys {
    constexpr const char* RANGE = "range";
    constexpr const char* THREADS = "threads";
    constexpr const char* HSEED = "hseed";
    constexpr const char* BSEED = "bseed";
    constexpr const char* UNIFORM_REJECTION = "uniformrejection";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";
}

constexpr uint32_t DEFAULT_RANGE = 8;

struct ProtocolConfig {
    uint32_t range{DEFAULT_RANGE};
    size_t threads{0};
    GeneratorSeeds seeds{GeneratorSeeds::Default()};
    bool uniformRejection{false};
    util::LogLevel logLevel{util::LogLevel::Info};
    std::vector<std::string> debugCategories;
};

/// Register defaults and allowed keys on `config`
void RegisterProtocolKeys(util::ConfigManager& config);

/**
 * Read every protocol key from `config`.
 *
 * @param errors Receives one message per invalid value; the matching
 *        field keeps its default
 * @return The parsed configuration
 */
ProtocolConfig LoadProtocolConfig(const util::ConfigManager& config,
                                  std::vector<std::string>& errors);

/// Semantic checks on a parsed configuration; empty when valid
std::vector<std::string> ValidateProtocolConfig(const ProtocolConfig& config);

} // namespace anchor
} // namespace anchorzk

#endif // ANCHORZK_ANCHOR_PROTOCOL_CONFIG_H
