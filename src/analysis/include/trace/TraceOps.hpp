#pragma once

#include "trace/Trace.hpp"
#include "Constants.hpp"
#include <glm/glm.hpp>
#include <vector>

// [TRACE_AGENT] Timeline preprocessing applied to a trace before alignment

namespace ReplayGuard {

// Collapse idle periods: every gap longer than breakThresholdMs is removed
// from the timeline. Relative order and non-break intervals are untouched,
// the first sample is never shifted. Output length equals input length.
std::vector<Sample> skipBreaks(const std::vector<Sample>& samples,
    double breakThresholdMs = Constants::DEFAULT_BREAK_THRESHOLD_MS);

// Resample at a fixed rate using linear interpolation. Output timestamps
// are first.t + k * 1000 / frequencyHz for
// k < floor((last.t - first.t) * frequencyHz / 1000).
// Throws InputError for fewer than 2 samples or a non-positive frequency.
std::vector<Sample> resample(const std::vector<Sample>& samples,
    double frequencyHz = Constants::DEFAULT_RESAMPLE_FREQUENCY_HZ);

// Finite-difference velocity (units per millisecond), one entry per
// consecutive pair. Throws NumericFault on a zero time step.
std::vector<glm::dvec2> computeVelocity(const std::vector<Sample>& samples);

} // namespace ReplayGuard
