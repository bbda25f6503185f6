// ANCHORZK - Protocol Configuration Implementation
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include "anchorzk/anchor/protocol_config.h"
#include "anchorzk/anchor/enrollment_tree.h"
#include "anchorzk/core/hex.h"

#include <algorithm>
#include <initializer_list>

namespace anchorzk {
namespace anchor {

namespace {

constexpr uint64_t MAX_THREADS = 256;

void LoadSeed(const util::ConfigManager& config, const char* key, Bytes& out,
              std::vector<std::string>& errors) {
    auto value = config.TryGetString(key);
    if (!value) {
        return;
    }
    auto bytes = TryHexToBytes(*value);
    if (!bytes || bytes->empty()) {
        errors.push_back(std::string(key) + ": expected non-empty hex, got '" + *value + "'");
        return;
    }
    out = std::move(*bytes);
}

/// Comma-separated category list; "all" expands to every known category
void LoadDebugCategories(const std::string& value, std::vector<std::string>& out,
                         std::vector<std::string>& errors) {
    const auto& known = util::KnownLogCategories();
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) {
            comma = value.size();
        }
        std::string name = value.substr(start, comma - start);
        name.erase(0, name.find_first_not_of(" \t"));
        name.erase(name.find_last_not_of(" \t") + 1);
        start = comma + 1;

        if (name.empty()) {
            continue;
        }
        if (name == "all" || name == "1") {
            out = known;
            continue;
        }
        if (std::find(known.begin(), known.end(), name) == known.end()) {
            errors.push_back("debug: unknown category '" + name + "'");
            continue;
        }
        if (std::find(out.begin(), out.end(), name) == out.end()) {
            out.push_back(name);
        }
    }
}

} // anonymous namespace

void RegisterProtocolKeys(util::ConfigManager& config) {
    GeneratorSeeds seeds = GeneratorSeeds::Default();
    config.SetDefault(ConfigKeys::RANGE, std::to_string(DEFAULT_RANGE));
    config.SetDefault(ConfigKeys::THREADS, "0");
    config.SetDefault(ConfigKeys::HSEED, BytesToHex(seeds.h));
    config.SetDefault(ConfigKeys::BSEED, BytesToHex(seeds.b));
    config.SetDefault(ConfigKeys::UNIFORM_REJECTION, "0");
    config.SetDefault(ConfigKeys::LOGLEVEL, "info");

    for (const char* key : {ConfigKeys::RANGE, ConfigKeys::THREADS, ConfigKeys::HSEED,
                            ConfigKeys::BSEED, ConfigKeys::UNIFORM_REJECTION,
                            ConfigKeys::LOGLEVEL, ConfigKeys::DEBUG}) {
        config.AllowKey(key);
    }
}

ProtocolConfig LoadProtocolConfig(const util::ConfigManager& config,
                                  std::vector<std::string>& errors) {
    ProtocolConfig out;

    if (config.HasKey(ConfigKeys::RANGE)) {
        auto range = config.TryGetUInt(ConfigKeys::RANGE);
        if (!range || *range > kMaxRange) {
            errors.push_back("range: expected an integer in [1, " + std::to_string(kMaxRange) +
                             "], got '" + config.GetString(ConfigKeys::RANGE, "") + "'");
        } else {
            out.range = static_cast<uint32_t>(*range);
        }
    }

    if (config.HasKey(ConfigKeys::THREADS)) {
        auto threads = config.TryGetUInt(ConfigKeys::THREADS);
        if (!threads || *threads > MAX_THREADS) {
            errors.push_back("threads: expected an integer in [0, " + std::to_string(MAX_THREADS) +
                             "], got '" + config.GetString(ConfigKeys::THREADS, "") + "'");
        } else {
            out.threads = static_cast<size_t>(*threads);
        }
    }

    LoadSeed(config, ConfigKeys::HSEED, out.seeds.h, errors);
    LoadSeed(config, ConfigKeys::BSEED, out.seeds.b, errors);

    if (config.HasKey(ConfigKeys::UNIFORM_REJECTION)) {
        auto flag = config.TryGetBool(ConfigKeys::UNIFORM_REJECTION);
        if (!flag) {
            errors.push_back("uniformrejection: expected a boolean");
        } else {
            out.uniformRejection = *flag;
        }
    }

    if (auto level = config.TryGetString(ConfigKeys::LOGLEVEL)) {
        if (!util::ParseLogLevel(*level, out.logLevel)) {
            errors.push_back("loglevel: unknown level '" + *level + "'");
        }
    }

    if (auto debug = config.TryGetString(ConfigKeys::DEBUG)) {
        LoadDebugCategories(*debug, out.debugCategories, errors);
    }

    return out;
}

std::vector<std::string> ValidateProtocolConfig(const ProtocolConfig& config) {
    std::vector<std::string> errors;
    if (config.range < 1 || config.range > kMaxRange) {
        errors.push_back("range must be in [1, " + std::to_string(kMaxRange) + "]");
    }
    if (config.threads > MAX_THREADS) {
        errors.push_back("threads must not exceed " + std::to_string(MAX_THREADS));
    }
    if (config.seeds.h.empty() || config.seeds.b.empty()) {
        errors.push_back("generator seeds must not be empty");
    } else if (config.seeds.h == config.seeds.b) {
        errors.push_back("hseed and bseed must differ");
    }
    return errors;
}

} // namespace anchor
} // namespace anchorzk
