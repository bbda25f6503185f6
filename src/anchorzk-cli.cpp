// ANCHORZK - Command Line Tool
// Copyright (c) 2024 AnchorZK Developers
// MIT License
//
// Runs setup, builds an enrollment tree, proves membership for one
// witness and verifies the result.
//
// Usage: anchorzk-cli [-conf=FILE] [-range=N] [-witness=N] [-threads=N]
//                     [-loglevel=LEVEL] [-debug=CATS] [-uniformrejection]

#include "anchorzk/anchor/enrollment_tree.h"
#include "anchorzk/anchor/protocol_config.h"
#include "anchorzk/anchor/prover.h"
#include "anchorzk/anchor/setup.h"
#include "anchorzk/anchor/verifier.h"
#include "anchorzk/core/random.h"
#include "anchorzk/util/config.h"
#include "anchorzk/util/logging.h"

#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

namespace anchorzk {

namespace {

constexpr const char* VERSION = "1.0.0";
constexpr uint64_t DEFAULT_WITNESS = 1;

void PrintHelp() {
    std::cout << "AnchorZK CLI v" << VERSION << "\n\n";
    std::cout << "Usage: anchorzk-cli [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -conf=FILE                 Read options from FILE\n";
    std::cout << "  -range=N                   Tree range, 2^N leaves (default: 8, max: 24)\n";
    std::cout << "  -witness=N                 Witness to prove (default: 1)\n";
    std::cout << "  -threads=N                 Tree build workers (default: 0, inline)\n";
    std::cout << "  -hseed=HEX                 Seed for generator H\n";
    std::cout << "  -bseed=HEX                 Seed for generator B\n";
    std::cout << "  -uniformrejection          Hide the failing verification stage\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error, off\n";
    std::cout << "  -debug=CAT[,CAT...]        log these categories at debug (or 'all')\n";
    std::cout << "\n";
}

void PrintErrors(const std::vector<std::string>& errors) {
    for (const auto& error : errors) {
        std::cerr << "Error: " << error << "\n";
    }
}

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;

    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return 1;
    }
    if (config.GetBool("help", false)) {
        PrintHelp();
        return 0;
    }

    if (auto confFile = config.TryGetString("conf")) {
        parsed = config.ParseFile(*confFile);
        if (!parsed.success) {
            std::cerr << "Error: " << parsed.ToString() << "\n";
            return 1;
        }
    }

    anchor::RegisterProtocolKeys(config);
    for (const char* key : {"conf", "witness", "help"}) {
        config.AllowKey(key);
    }

    std::vector<std::string> errors = config.Validate();
    anchor::ProtocolConfig protocol = anchor::LoadProtocolConfig(config, errors);
    for (auto& error : anchor::ValidateProtocolConfig(protocol)) {
        errors.push_back(std::move(error));
    }
    auto witness = config.TryGetUInt("witness");
    if (config.HasKey("witness") && !witness) {
        errors.push_back("witness: expected a non-negative integer");
    }
    if (!errors.empty()) {
        PrintErrors(errors);
        return 1;
    }

    util::Logger& logger = util::Logger::Instance();
    logger.Initialize();
    logger.SetLevel(protocol.logLevel);
    for (const std::string& category : protocol.debugCategories) {
        logger.SetCategoryLevel(category, util::LogLevel::Debug);
    }

    LogInfoF(util::LogCategory::CONFIG, "range=%u threads=%zu", protocol.range, protocol.threads);

    anchor::Generators gens = anchor::SetupGenerators(protocol.seeds);

    OsRandomSource rng;
    Scalar secret = anchor::SampleSecret(rng);
    bn254::Point anchorPoint = anchor::ComputeAnchor(secret, gens.b);

    anchor::TreeBuildOptions buildOptions;
    buildOptions.threads = protocol.threads;
    buildOptions.progress = [](uint64_t done, uint64_t total) {
        LOG_DEBUG(util::LogCategory::TREE) << "Leaves " << done << "/" << total;
    };

    anchor::TreeBuildResult built =
        anchor::BuildEnrollmentTree(protocol.range, anchorPoint, secret, buildOptions);
    if (!built.ok()) {
        std::cerr << "Error: tree build failed: " << anchor::AnchorErrorToString(built.error) << "\n";
        return 1;
    }

    anchor::ProofInput input;
    input.secret = secret;
    input.witness = Scalar(witness.value_or(DEFAULT_WITNESS));
    input.blinding = anchor::SampleScalar(rng);
    input.generators = gens;
    input.anchor = anchorPoint;
    input.tree = built.tree;

    anchor::ProofResult proved = anchor::GenerateAnchoredProof(input, rng);
    if (!proved.ok()) {
        std::cerr << "Error: proof generation failed: "
                  << anchor::AnchorErrorToString(proved.error) << "\n";
        return 1;
    }

    anchor::VerifierOptions verifyOptions;
    verifyOptions.uniformRejection = protocol.uniformRejection;
    anchor::VerificationResult verdict = anchor::VerifyAnchoredProof(
        anchor::PublicParams::FromTree(gens, *built.tree), *proved.proof,
        proved.leafIndex, verifyOptions);

    std::cout << "root:   " << built.tree->Root().ToHex() << "\n";
    std::cout << "index:  " << proved.leafIndex << "\n";
    std::cout << "proof:  " << proved.proof->ToHex() << "\n";
    std::cout << "result: " << anchor::VerificationStageToString(verdict.stage) << "\n";

    logger.Flush();
    return verdict.valid ? 0 : 1;
}

} // anonymous namespace

} // namespace anchorzk

int main(int argc, char* argv[]) {
    try {
        return anchorzk::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
