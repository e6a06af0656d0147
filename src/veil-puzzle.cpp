// VEIL Coinbase Puzzle Tool
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Sets up a development coinbase puzzle, searches a nonce range for a
// prover solution, accumulates and verifies it, and optionally stores
// the coinbase solution in the database.
//
// Usage: veil-puzzle [-conf=<file>] [-puzzle.degree=<n>] [-puzzle.epoch=<n>] ...

#include "veil/account/keys.h"
#include "veil/core/errors.h"
#include "veil/crypto/sha256.h"
#include "veil/db/database.h"
#include "veil/puzzle/coinbase_puzzle.h"
#include "veil/util/config.h"
#include "veil/util/logging.h"
#include "veil/util/threadpool.h"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

using namespace veil;
using namespace veil::puzzle;
using util::ConfigKeys::SECTION_LOG;
using util::ConfigKeys::SECTION_PUZZLE;
using util::ConfigKeys::SECTION_STORAGE;

namespace {

struct PuzzleOptions {
    uint32_t degree{0};
    uint32_t maxDegree{0};
    std::string seed;
    uint32_t epoch{0};
    uint64_t minimumProofTarget{0};
    size_t threads{1};
    uint64_t nonceStart{0};
    uint64_t nonceCount{0};
    std::string backend;
    std::string datadir;
};

bool LoadConfig(int argc, char* argv[], util::ConfigManager& config) {
    auto result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << std::endl;
        return false;
    }
    if (auto path = config.TryGetString("conf")) {
        result = config.ParseFile(util::ConfigManager::ExpandTilde(*path));
        if (!result.success) {
            std::cerr << "Error: " << result.errorSource << ":" << result.errorLine << ": "
                      << result.errorMessage << std::endl;
            return false;
        }
        // Command-line values win over the file
        result = config.ParseCommandLine(argc, argv);
    }
    return result.success;
}

void SetupLogging(const util::ConfigManager& config) {
    util::LogOptions options;
    options.level = util::LogLevelFromString(config.GetString(util::ConfigKeys::LEVEL, "info", SECTION_LOG));
    options.file = config.GetPath(util::ConfigKeys::FILE, "", SECTION_LOG);
    if (!util::ConfigureLogging(options)) {
        std::cerr << "Warning: cannot open log file " << options.file << std::endl;
    }
}

PuzzleOptions ReadOptions(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;
    PuzzleOptions opts;
    opts.degree = static_cast<uint32_t>(config.GetUInt(keys::DEGREE, 1 << 8, SECTION_PUZZLE));
    opts.maxDegree = static_cast<uint32_t>(config.GetUInt(keys::MAX_DEGREE, 2 * uint64_t(opts.degree), SECTION_PUZZLE));
    opts.seed = config.GetString(keys::SEED, "veil-dev", SECTION_PUZZLE);
    opts.epoch = static_cast<uint32_t>(config.GetUInt(keys::EPOCH, 0, SECTION_PUZZLE));
    opts.minimumProofTarget = config.GetUInt(keys::MINIMUM_PROOF_TARGET, 1, SECTION_PUZZLE);
    opts.threads = static_cast<size_t>(
        config.GetUInt(keys::THREADS, std::max(1u, std::thread::hardware_concurrency()), SECTION_PUZZLE));
    opts.nonceStart = config.GetUInt(keys::NONCE_START, 0, SECTION_PUZZLE);
    opts.nonceCount = config.GetUInt(keys::NONCE_COUNT, 1000, SECTION_PUZZLE);
    opts.backend = config.GetString(keys::BACKEND, "memory", SECTION_STORAGE);
    opts.datadir = config.GetPath(keys::DATADIR, "~/.veil", SECTION_STORAGE);
    return opts;
}

/// Development stand-in for the block hash that opens an epoch
Hash256 EpochBlockHash(const std::string& seed, uint32_t epoch) {
    std::string input = seed + "/epoch/" + std::to_string(epoch);
    return SHA256Hash(reinterpret_cast<const Byte*>(input.data()), input.size());
}

bool StoreSolution(const PuzzleOptions& opts, const CoinbaseSolution& solution) {
    auto [status, database] = db::OpenDatabase(opts.datadir);
    if (!status.ok()) {
        std::cerr << "Error: cannot open database at " << opts.datadir << ": " << status.ToString() << std::endl;
        return false;
    }
    std::string key = db::MakeKey(db::prefix::COINBASE_SOLUTION, opts.epoch);
    std::vector<Byte> bytes = ToBytesLE(solution);
    status = database->Put(db::Slice(key), db::Slice(bytes));
    if (!status.ok()) {
        std::cerr << "Error: cannot store the coinbase solution: " << status.ToString() << std::endl;
        return false;
    }
    LOG_INFO(util::LogCategory::DB) << "Stored coinbase solution for epoch " << opts.epoch << " ("
                                    << bytes.size() << " bytes)";
    return true;
}

int Run(const PuzzleOptions& opts) {
    PuzzleConfig puzzleConfig{opts.degree};
    if (opts.maxDegree < 2 * opts.degree) {
        std::cerr << "Error: max_degree must be at least twice the degree" << std::endl;
        return 1;
    }

    LOG_INFO(util::LogCategory::PUZZLE) << "Setting up puzzle of degree " << opts.degree;
    UniversalParams srs = [&] {
        VEIL_LOG_TIMER(util::LogCategory::PUZZLE, "setup");
        return KZG10::Setup(opts.maxDegree, opts.seed);
    }();
    CoinbasePuzzle puzzle = CoinbasePuzzle::Trim(srs, puzzleConfig);

    EpochChallenge epoch = EpochChallenge::New(opts.epoch, EpochBlockHash(opts.seed, opts.epoch), opts.degree);
    Address address = Address::FromPrivateKey(PrivateKey::FromSeed(Field::FromDomain(opts.seed + "/prover")));

    std::cout << "Epoch:    " << epoch.EpochNumber() << std::endl;
    std::cout << "Address:  " << address.ToString() << std::endl;
    std::cout << "Nonces:   " << opts.nonceStart << " + " << opts.nonceCount << std::endl;

    util::ThreadPool pool(opts.threads);
    auto start = std::chrono::steady_clock::now();
    std::optional<ProverSolution> solution =
        ProveNonceRange(puzzle, epoch, address, opts.nonceStart, opts.nonceCount, opts.minimumProofTarget, pool);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (!solution) {
        std::cout << "No nonce met proof target " << opts.minimumProofTarget << " (" << elapsed << " ms)" << std::endl;
        return 2;
    }
    std::cout << "Nonce:    " << solution->Nonce() << std::endl;
    std::cout << "Target:   " << solution->ToTarget() << " (" << elapsed << " ms)" << std::endl;

    CoinbaseSolution coinbase = puzzle.AccumulateUnchecked(epoch, {*solution});
    bool valid = puzzle.Verify(coinbase, epoch, solution->ToTarget(), opts.minimumProofTarget);
    std::cout << "Verified: " << (valid ? "yes" : "no") << std::endl;
    if (!valid) {
        return 3;
    }

    if (opts.backend == "db") {
        if (!StoreSolution(opts, coinbase)) {
            return 1;
        }
    } else if (opts.backend != "memory") {
        std::cerr << "Error: unknown storage backend '" << opts.backend << "'" << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    util::ConfigManager config;
    if (!LoadConfig(argc, argv, config)) {
        return 1;
    }
    SetupLogging(config);

    PuzzleOptions opts = ReadOptions(config);
    int rc = 1;
    try {
        rc = Run(opts);
    } catch (const Error& e) {
        LOG_ERROR(util::LogCategory::PUZZLE) << e.what();
        std::cerr << "Error: " << e.what() << std::endl;
    }

    util::Logger::Instance().Flush();
    return rc;
}
