#pragma once

#include "detection/ComparisonConfig.hpp"
#include "alignment/Aligner.hpp"
#include "trace/Trace.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// [DETECTION_AGENT] Pairwise replay comparison
// Enumerates candidate pairs, drops pairs that carry no signal, and reports
// every pair whose aligned cursor traces stay closer than the threshold

namespace ReplayGuard {
namespace Detection {

// [DETECTION_AGENT] Pairing strategies
enum class ComparisonMode : uint8_t {
    DOUBLE = 0,  // Every trace of set 1 against every trace of set 2
    SINGLE = 1   // Every unordered pair within set 1
};

inline const char* comparisonModeToString(ComparisonMode mode) {
    switch (mode) {
        case ComparisonMode::DOUBLE: return "double";
        case ComparisonMode::SINGLE: return "single";
        default: return "unknown";
    }
}

// Throws InvalidModeError for anything but "double" / "single"
ComparisonMode parseComparisonMode(std::string_view mode);

// [DETECTION_AGENT] Reported pair
struct ComparisonOutcome {
    std::string ownerA;
    std::string ownerB;
    double meanDistance{0.0};
    double stdDistance{0.0};
};

// "12.3 similarity, 4.5 std deviation (a vs b)"
std::string formatOutcome(const ComparisonOutcome& outcome);

// [DETECTION_AGENT] Counters for the most recent batch
struct BatchStats {
    uint32_t pairsEnumerated{0};
    uint32_t pairsSkipped{0};
    uint32_t pairsCompared{0};
    uint32_t outcomesReported{0};
};

using OutcomeCallback = std::function<void(const ComparisonOutcome& outcome)>;

// [DETECTION_AGENT] Comparison engine
class ComparisonEngine {
public:
    // Single-set engine; only ComparisonMode::SINGLE can run
    ComparisonEngine(ComparisonConfig config, std::vector<Trace> traces);

    ComparisonEngine(ComparisonConfig config, std::vector<Trace> traces1,
                     std::vector<Trace> traces2);

    // Non-copyable
    ComparisonEngine(const ComparisonEngine&) = delete;
    ComparisonEngine& operator=(const ComparisonEngine&) = delete;

    // Run a batch. Outcomes reach the callback in pair enumeration order.
    // Any error aborts the batch and propagates.
    void compare(ComparisonMode mode, const OutcomeCallback& onOutcome);

    // Parses the mode first; InvalidModeError before any pair is touched
    void compare(std::string_view mode, const OutcomeCallback& onOutcome);

    [[nodiscard]] std::vector<ComparisonOutcome> collect(ComparisonMode mode);

    // Both owners trusted, or the same owner twice
    [[nodiscard]] bool shouldSkipPair(const std::string& ownerA,
        const std::string& ownerB) const;

    // Score one pair; an outcome only if it falls below the threshold
    [[nodiscard]] std::optional<ComparisonOutcome> comparePair(const Trace& a,
        const Trace& b) const;

    [[nodiscard]] const BatchStats& getLastBatchStats() const { return stats_; }

    void setConfig(const ComparisonConfig& config) { config_ = config; }
    [[nodiscard]] const ComparisonConfig& getConfig() const { return config_; }

    [[nodiscard]] size_t firstSetSize() const { return traces1_.size(); }
    [[nodiscard]] size_t secondSetSize() const {
        return traces2_ ? traces2_->size() : 0;
    }

private:
    using TracePair = std::pair<const Trace*, const Trace*>;

    [[nodiscard]] std::vector<TracePair> enumeratePairs(ComparisonMode mode) const;
    [[nodiscard]] AlignOptions alignOptions() const;

    void runSequential(const std::vector<TracePair>& pairs,
        const OutcomeCallback& onOutcome);
    void runParallel(const std::vector<TracePair>& pairs, uint32_t workers,
        const OutcomeCallback& onOutcome);

private:
    ComparisonConfig config_;
    std::vector<Trace> traces1_;
    std::optional<std::vector<Trace>> traces2_;
    BatchStats stats_;
};

} // namespace Detection
} // namespace ReplayGuard
