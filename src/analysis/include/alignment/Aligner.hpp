#pragma once

#include "alignment/Interpolation.hpp"
#include "trace/Trace.hpp"
#include "Constants.hpp"
#include <vector>

// [ALIGNMENT_AGENT] Maps two irregularly sampled traces onto one timeline
// The trace with fewer samples (after trimming its head) is the reference:
// its timestamps drive the output and the other trace is interpolated
// onto them.

namespace ReplayGuard {

struct AlignOptions {
    InterpolationKind interpolation{InterpolationKind::LINEAR};

    // Return (result for a, result for b) instead of (reference, source)
    bool preserveOrder{false};

    // Interpolated coordinates beyond this (either axis) are replaced by
    // the reference sample's own coordinates
    double outlierBound{Constants::DEFAULT_OUTLIER_BOUND};
};

// Invariant: clean.size() == interpolated.size() <= min(|a|, |b|)
struct AlignedPair {
    std::vector<Sample> clean;         // Reference samples that could be bracketed
    std::vector<Sample> interpolated;  // Source resampled onto clean's timestamps
    bool flipped{false};               // Reference was the second argument

    [[nodiscard]] size_t size() const { return clean.size(); }
};

// Throws InputError if either input has fewer than 2 samples, or if no
// sample of the earlier-starting input lies after the other's start.
[[nodiscard]] AlignedPair align(const std::vector<Sample>& a,
    const std::vector<Sample>& b, const AlignOptions& options = {});

[[nodiscard]] inline AlignedPair align(const Trace& a, const Trace& b,
    const AlignOptions& options = {}) {
    return align(a.samples(), b.samples(), options);
}

} // namespace ReplayGuard
