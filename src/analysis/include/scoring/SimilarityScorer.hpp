#pragma once

#include "alignment/Aligner.hpp"
#include "scoring/NumericPolicy.hpp"
#include <glm/glm.hpp>
#include <vector>

// [SCORING_AGENT] Distance statistics over two aligned coordinate sequences

namespace ReplayGuard {

struct SimilarityResult {
    double meanDistance{0.0};
    double stdDistance{0.0};  // Population standard deviation
};

// Per-index Euclidean distance, longer input truncated to the shorter.
// Throws NumericFault on overflow, invalid operations or empty input.
[[nodiscard]] SimilarityResult scoreSimilarity(const std::vector<glm::dvec2>& first,
    const std::vector<glm::dvec2>& second,
    const NumericPolicy& policy = NumericPolicy::failFast());

// Align, strip time and score
[[nodiscard]] SimilarityResult compareTraces(const Trace& a, const Trace& b,
    const AlignOptions& options = {},
    const NumericPolicy& policy = NumericPolicy::failFast());

} // namespace ReplayGuard
