// [SCORING_AGENT] Mean / standard deviation of cursor distance

#include "scoring/SimilarityScorer.hpp"
#include "errors/Errors.hpp"
#include <cmath>
#include <cstddef>

namespace ReplayGuard {

SimilarityResult scoreSimilarity(const std::vector<glm::dvec2>& first,
                                 const std::vector<glm::dvec2>& second,
                                 const NumericPolicy& policy) {
    // longer always first
    const auto& longer = second.size() > first.size() ? second : first;
    const auto& shorter = second.size() > first.size() ? first : second;
    const size_t n = shorter.size();

    if (n == 0 && policy.failOnInvalid) {
        throw NumericFault("similarity: mean of empty distance sequence");
    }

    FloatingPointGuard guard(policy);

    std::vector<double> distances;
    distances.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        distances.push_back(glm::distance(longer[i], shorter[i]));
    }

    double sum = 0.0;
    for (double d : distances) {
        sum += d;
    }
    const double mean = sum / static_cast<double>(n);

    double sumSq = 0.0;
    for (double d : distances) {
        const double dev = d - mean;
        sumSq += dev * dev;
    }
    const double variance = sumSq / static_cast<double>(n);

    SimilarityResult result;
    result.meanDistance = mean;
    result.stdDistance = std::sqrt(variance);

    guard.check("similarity");

    // Quiet NaN propagates without raising a flag
    if ((policy.failOnInvalid || policy.failOnOverflow) &&
        (!std::isfinite(result.meanDistance) || !std::isfinite(result.stdDistance))) {
        throw NumericFault("similarity: non-finite distance statistic");
    }

    return result;
}

SimilarityResult compareTraces(const Trace& a, const Trace& b,
                               const AlignOptions& options,
                               const NumericPolicy& policy) {
    const AlignedPair aligned = align(a, b, options);
    return scoreSimilarity(stripTime(aligned.clean), stripTime(aligned.interpolated), policy);
}

} // namespace ReplayGuard
