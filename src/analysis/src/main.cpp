// ReplayGuard - replay similarity checker
// Compares cursor traces pairwise and reports pairs that are too close

#include "detection/ComparisonEngine.hpp"
#include "io/BatchLoader.hpp"
#include "Constants.hpp"
#include <iostream>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace ReplayGuard;

void printUsage(const char* programName) {
    std::cout << "ReplayGuard v" << Constants::VERSION << "\n"
              << "Usage: " << programName << " --batch <file> [options]\n"
              << "\nOptions:\n"
              << "  --batch <file>        JSON batch of traces (required)\n"
              << "  --threshold <num>     Report pairs below this mean distance (default: "
              << Constants::DEFAULT_SIMILARITY_THRESHOLD << ")\n"
              << "  --mode <mode>         single | double (default: from batch)\n"
              << "  --trusted <name>      Exempt owner from mutual comparison (repeatable)\n"
              << "  --skip-breaks         Collapse idle periods before aligning\n"
              << "  --threads <num>       Comparison worker threads (default: 1)\n"
              << "  --quiet               Only print reported pairs\n"
              << "  --help, -h            Show this help\n";
}

int main(int argc, char* argv[]) {
    try {
        std::string batchPath;
        std::optional<double> threshold;
        std::optional<std::string> mode;
        std::optional<uint32_t> threads;
        std::vector<std::string> trusted;
        bool skipBreaks = false;
        bool quiet = false;

        // Parse command line arguments
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--batch" && i + 1 < argc) {
                batchPath = argv[++i];
            } else if (arg == "--threshold" && i + 1 < argc) {
                threshold = std::atof(argv[++i]);
            } else if (arg == "--mode" && i + 1 < argc) {
                mode = argv[++i];
            } else if (arg == "--trusted" && i + 1 < argc) {
                trusted.emplace_back(argv[++i]);
            } else if (arg == "--skip-breaks") {
                skipBreaks = true;
            } else if (arg == "--threads" && i + 1 < argc) {
                threads = static_cast<uint32_t>(std::atoi(argv[++i]));
            } else if (arg == "--quiet") {
                quiet = true;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        if (batchPath.empty()) {
            std::cerr << "Missing --batch\n";
            printUsage(argv[0]);
            return 1;
        }

        TraceBatch batch = loadBatchFromFile(batchPath);

        // Command line wins over the batch file
        Detection::ComparisonConfig config = batch.config;
        if (threshold) config.threshold = *threshold;
        if (threads) config.workerThreads = *threads;
        if (skipBreaks) config.skipBreaks = true;
        for (auto& owner : trusted) {
            config.trustedOwners.insert(std::move(owner));
        }
        config.verbose = !quiet;

        // Validate before touching any pair
        const auto comparisonMode = Detection::parseComparisonMode(mode.value_or(batch.mode));

        std::optional<Detection::ComparisonEngine> engine;
        if (batch.against) {
            engine.emplace(config, std::move(batch.traces), std::move(*batch.against));
        } else {
            engine.emplace(config, std::move(batch.traces));
        }

        engine->compare(comparisonMode, [](const Detection::ComparisonOutcome& outcome) {
            std::cout << Detection::formatOutcome(outcome) << "\n";
        });

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << "\n";
        return 1;
    }
}
