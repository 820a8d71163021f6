#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// [ALIGNMENT_AGENT] Coordinate interpolation between two bracket samples

namespace ReplayGuard {

enum class InterpolationKind : uint8_t {
    LINEAR = 0,       // Weighted by time ratio
    STEP_BEFORE = 1   // Hold the earlier sample (no smoothing)
};

inline const char* interpolationKindToString(InterpolationKind kind) {
    switch (kind) {
        case InterpolationKind::LINEAR: return "linear";
        case InterpolationKind::STEP_BEFORE: return "step-before";
        default: return "unknown";
    }
}

// Accepts the names produced by interpolationKindToString
inline std::optional<InterpolationKind> parseInterpolationKind(std::string_view name) {
    if (name == "linear") {
        return InterpolationKind::LINEAR;
    }
    if (name == "step-before") {
        return InterpolationKind::STEP_BEFORE;
    }
    return std::nullopt;
}

// ratio is 0 at `before` and 1 at `after`; values outside [0, 1] extrapolate
[[nodiscard]] inline glm::dvec2 interpolate(InterpolationKind kind,
    const glm::dvec2& before, const glm::dvec2& after, double ratio) {
    switch (kind) {
        case InterpolationKind::STEP_BEFORE:
            return before;
        case InterpolationKind::LINEAR:
        default:
            return glm::mix(before, after, ratio);
    }
}

} // namespace ReplayGuard
