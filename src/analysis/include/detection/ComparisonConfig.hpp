#pragma once

#include "alignment/Interpolation.hpp"
#include "scoring/NumericPolicy.hpp"
#include "Constants.hpp"
#include <cstdint>
#include <string>
#include <unordered_set>

// [DETECTION_AGENT] Tunable comparison parameters
// Defaults come from Constants.hpp; batch files and the command line
// override them

namespace ReplayGuard {
namespace Detection {

struct ComparisonConfig {
    // ========================================================================
    // REPORTING
    // ========================================================================

    // Pairs whose mean cursor distance is below this are reported
    double threshold = Constants::DEFAULT_SIMILARITY_THRESHOLD;

    // Owners exempt from mutual comparison. A pair is skipped only when
    // both owners are in the set.
    std::unordered_set<std::string> trustedOwners;

    // ========================================================================
    // PREPROCESSING
    // ========================================================================

    // Collapse idle periods before aligning
    bool skipBreaks = false;

    // Gap length treated as a break (milliseconds)
    double breakThresholdMs = Constants::DEFAULT_BREAK_THRESHOLD_MS;

    // ========================================================================
    // ALIGNMENT
    // ========================================================================

    InterpolationKind interpolation = InterpolationKind::LINEAR;

    // Interpolated coordinates beyond this magnitude are discarded
    double outlierBound = Constants::DEFAULT_OUTLIER_BOUND;

    // ========================================================================
    // EXECUTION
    // ========================================================================

    // 1 = compare on the calling thread, outcomes delivered as produced
    uint32_t workerThreads = 1;

    NumericPolicy numericPolicy = NumericPolicy::failFast();

    // Print batch header and summary lines
    bool verbose = true;
};

} // namespace Detection
} // namespace ReplayGuard
