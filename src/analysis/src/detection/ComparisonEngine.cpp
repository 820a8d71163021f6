// [DETECTION_AGENT] Comparison engine implementation

#include "detection/ComparisonEngine.hpp"
#include "scoring/SimilarityScorer.hpp"
#include "trace/TraceOps.hpp"
#include "errors/Errors.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace ReplayGuard {
namespace Detection {

ComparisonMode parseComparisonMode(std::string_view mode) {
    if (mode == "double") {
        return ComparisonMode::DOUBLE;
    }
    if (mode == "single") {
        return ComparisonMode::SINGLE;
    }
    throw InvalidModeError(std::string(mode));
}

std::string formatOutcome(const ComparisonOutcome& outcome) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1)
        << outcome.meanDistance << " similarity, "
        << outcome.stdDistance << " std deviation ("
        << outcome.ownerA << " vs " << outcome.ownerB << ")";
    return out.str();
}

// ============================================================================
// ComparisonEngine Implementation
// ============================================================================

ComparisonEngine::ComparisonEngine(ComparisonConfig config, std::vector<Trace> traces)
    : config_(std::move(config)), traces1_(std::move(traces)) {}

ComparisonEngine::ComparisonEngine(ComparisonConfig config, std::vector<Trace> traces1,
                                   std::vector<Trace> traces2)
    : config_(std::move(config)), traces1_(std::move(traces1)),
      traces2_(std::move(traces2)) {}

void ComparisonEngine::compare(std::string_view mode, const OutcomeCallback& onOutcome) {
    compare(parseComparisonMode(mode), onOutcome);
}

void ComparisonEngine::compare(ComparisonMode mode, const OutcomeCallback& onOutcome) {
    stats_ = BatchStats{};

    const std::vector<TracePair> pairs = enumeratePairs(mode);
    stats_.pairsEnumerated = static_cast<uint32_t>(pairs.size());

    if (config_.verbose) {
        if (mode == ComparisonMode::DOUBLE) {
            std::cout << "[COMPARE] Comparing first set of replays to second set of replays";
        } else {
            std::cout << "[COMPARE] Comparing first set of replays to itself";
        }
        std::cout << " (" << pairs.size() << " pairs, threshold "
                  << config_.threshold << ")\n";
    }

    const uint32_t workers = std::clamp<uint32_t>(config_.workerThreads, 1,
                                                  Constants::MAX_WORKER_THREADS);
    if (workers > 1) {
        runParallel(pairs, workers, onOutcome);
    } else {
        runSequential(pairs, onOutcome);
    }

    if (config_.verbose) {
        std::cout << "[COMPARE] Batch complete: " << stats_.pairsCompared << " compared, "
                  << stats_.pairsSkipped << " skipped, "
                  << stats_.outcomesReported << " below threshold\n";
    }
}

std::vector<ComparisonOutcome> ComparisonEngine::collect(ComparisonMode mode) {
    std::vector<ComparisonOutcome> outcomes;
    compare(mode, [&outcomes](const ComparisonOutcome& outcome) {
        outcomes.push_back(outcome);
    });
    return outcomes;
}

bool ComparisonEngine::shouldSkipPair(const std::string& ownerA,
                                      const std::string& ownerB) const {
    const auto& trusted = config_.trustedOwners;
    const bool bothTrusted = trusted.count(ownerA) > 0 && trusted.count(ownerB) > 0;
    return bothTrusted || ownerA == ownerB;
}

std::optional<ComparisonOutcome> ComparisonEngine::comparePair(const Trace& a,
                                                               const Trace& b) const {
    SimilarityResult result;
    if (config_.skipBreaks) {
        const AlignedPair aligned = align(
            skipBreaks(a.samples(), config_.breakThresholdMs),
            skipBreaks(b.samples(), config_.breakThresholdMs),
            alignOptions());
        result = scoreSimilarity(stripTime(aligned.clean),
            stripTime(aligned.interpolated), config_.numericPolicy);
    } else {
        result = compareTraces(a, b, alignOptions(), config_.numericPolicy);
    }

    if (!(result.meanDistance < config_.threshold)) {
        return std::nullopt;
    }

    return ComparisonOutcome{a.owner(), b.owner(), result.meanDistance, result.stdDistance};
}

std::vector<ComparisonEngine::TracePair> ComparisonEngine::enumeratePairs(
    ComparisonMode mode) const {
    std::vector<TracePair> pairs;

    switch (mode) {
        case ComparisonMode::DOUBLE: {
            if (!traces2_) {
                throw InputError("double mode needs a second set of replays");
            }
            pairs.reserve(traces1_.size() * traces2_->size());
            for (const auto& first : traces1_) {
                for (const auto& second : *traces2_) {
                    pairs.emplace_back(&first, &second);
                }
            }
            break;
        }
        case ComparisonMode::SINGLE: {
            const size_t n = traces1_.size();
            if (n > 1) {
                pairs.reserve(n * (n - 1) / 2);
            }
            for (size_t i = 0; i < n; ++i) {
                for (size_t j = i + 1; j < n; ++j) {
                    pairs.emplace_back(&traces1_[i], &traces1_[j]);
                }
            }
            break;
        }
        default:
            throw InvalidModeError(std::to_string(static_cast<int>(mode)));
    }

    return pairs;
}

AlignOptions ComparisonEngine::alignOptions() const {
    AlignOptions options;
    options.interpolation = config_.interpolation;
    options.preserveOrder = false;
    options.outlierBound = config_.outlierBound;
    return options;
}

void ComparisonEngine::runSequential(const std::vector<TracePair>& pairs,
                                     const OutcomeCallback& onOutcome) {
    for (const auto& [a, b] : pairs) {
        if (shouldSkipPair(a->owner(), b->owner())) {
            stats_.pairsSkipped++;
            continue;
        }

        auto outcome = comparePair(*a, *b);
        stats_.pairsCompared++;

        if (outcome) {
            stats_.outcomesReported++;
            if (onOutcome) {
                onOutcome(*outcome);
            }
        }
    }
}

void ComparisonEngine::runParallel(const std::vector<TracePair>& pairs, uint32_t workers,
                                   const OutcomeCallback& onOutcome) {
    std::vector<TracePair> work;
    work.reserve(pairs.size());
    for (const auto& pair : pairs) {
        if (shouldSkipPair(pair.first->owner(), pair.second->owner())) {
            stats_.pairsSkipped++;
        } else {
            work.push_back(pair);
        }
    }

    // One slot per pair; each is written by exactly one worker
    std::vector<std::optional<ComparisonOutcome>> results(work.size());
    std::vector<std::exception_ptr> errors(work.size());
    std::atomic<size_t> nextIndex{0};

    auto worker = [&]() {
        for (size_t i = nextIndex.fetch_add(1); i < work.size(); i = nextIndex.fetch_add(1)) {
            try {
                results[i] = comparePair(*work[i].first, *work[i].second);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        }
    };

    const size_t threadCount = std::min<size_t>(workers, work.size());
    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (size_t t = 0; t < threadCount; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Deliver in enumeration order; the first failure ends the batch there
    for (size_t i = 0; i < work.size(); ++i) {
        if (errors[i]) {
            std::cerr << "[COMPARE] Comparison failed: " << work[i].first->owner()
                      << " vs " << work[i].second->owner() << "\n";
            std::rethrow_exception(errors[i]);
        }

        stats_.pairsCompared++;
        if (results[i]) {
            stats_.outcomesReported++;
            if (onOutcome) {
                onOutcome(*results[i]);
            }
        }
    }
}

} // namespace Detection
} // namespace ReplayGuard
