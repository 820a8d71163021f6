#pragma once

#include <cstddef>
#include <cstdint>

// [ALL-AGENTS] Global constants for ReplayGuard
// All magic numbers MUST be defined here, not scattered in code

namespace ReplayGuard {
namespace Constants {

inline constexpr const char* VERSION = "0.3.0";

// ============================================================================
// PLAYFIELD CONSTANTS
// ============================================================================

// [TRACE_AGENT] Nominal playfield in screen-space units. Coordinates are
// not clamped to it; cursors routinely leave the playfield.
inline constexpr double PLAYFIELD_WIDTH = 512.0;
inline constexpr double PLAYFIELD_HEIGHT = 384.0;

// ============================================================================
// ALIGNMENT CONSTANTS
// ============================================================================

// [ALIGNMENT_AGENT] Interpolated coordinates beyond this magnitude (either
// axis) are treated as extrapolation artifacts and replaced by the
// reference sample. Playfield plus margin.
inline constexpr double DEFAULT_OUTLIER_BOUND = 600.0;

// [ALIGNMENT_AGENT] Minimum samples per trace for a bracket to exist
inline constexpr size_t MIN_SAMPLES_FOR_BRACKET = 2;

// ============================================================================
// PREPROCESSING CONSTANTS
// ============================================================================

// [TRACE_AGENT] Gaps longer than this are breaks (milliseconds)
inline constexpr double DEFAULT_BREAK_THRESHOLD_MS = 1000.0;

// [TRACE_AGENT] Default resample rate (Hz)
inline constexpr double DEFAULT_RESAMPLE_FREQUENCY_HZ = 60.0;

inline constexpr double MS_PER_SECOND = 1000.0;

// ============================================================================
// DETECTION CONSTANTS
// ============================================================================

// [DETECTION_AGENT] Mean cursor distance below which a pair is reported
inline constexpr double DEFAULT_SIMILARITY_THRESHOLD = 18.0;

// [DETECTION_AGENT] Upper bound on comparison workers
inline constexpr uint32_t MAX_WORKER_THREADS = 64;

} // namespace Constants
} // namespace ReplayGuard
