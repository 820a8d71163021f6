// [ALIGNMENT_AGENT] Two-pointer alignment of irregularly sampled traces

#include "alignment/Aligner.hpp"
#include "errors/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <string>
#include <utility>

namespace ReplayGuard {

namespace {

bool isOutlier(const glm::dvec2& pos, double bound) {
    return std::abs(pos.x) > bound || std::abs(pos.y) > bound;
}

} // namespace

AlignedPair align(const std::vector<Sample>& a, const std::vector<Sample>& b,
                  const AlignOptions& options) {
    if (a.size() < Constants::MIN_SAMPLES_FOR_BRACKET ||
        b.size() < Constants::MIN_SAMPLES_FOR_BRACKET) {
        throw InputError("align needs at least 2 samples per trace, got " +
                         std::to_string(a.size()) + " and " + std::to_string(b.size()));
    }

    std::span<const Sample> first(a);
    std::span<const Sample> second(b);
    bool flipped = false;

    // first always starts no later than second
    if (first.front().t > second.front().t) {
        std::swap(first, second);
        flipped = !flipped;
    }

    // Smallest index of first that lies after second's start
    const double secondStart = second.front().t;
    auto after = std::find_if(first.begin(), first.end(),
        [secondStart](const Sample& s) { return s.t > secondStart; });
    if (after == first.end()) {
        throw InputError("traces do not overlap in time");
    }
    const auto i = static_cast<size_t>(std::distance(first.begin(), after));

    // If first is the longer one keep one extra leading sample so it still
    // brackets second's start
    first = first.size() < second.size() ? first.subspan(i) : first.subspan(i - 1);

    // The shorter sequence is the reference
    if (first.size() > second.size()) {
        std::swap(first, second);
        flipped = !flipped;
    }

    const std::span<const Sample> reference = first;
    const std::span<const Sample> source = second;
    const size_t last = source.size() - 1;

    AlignedPair result;
    result.flipped = flipped;
    result.clean.reserve(reference.size());
    result.interpolated.reserve(reference.size());

    size_t j = 0;
    for (const Sample& ref : reference) {
        while (j != last && source[j].t < ref.t) {
            ++j;
        }

        // No right bracket left; nothing after this can be interpolated
        if (j == last) {
            break;
        }

        const Sample& before = source[j];
        const Sample& next = source[j + 1];
        const double dtRef = ref.t - before.t;
        const double dtSource = next.t - before.t;

        Sample inter{ref.t, before.pos};
        if (dtSource != 0.0) {
            const glm::dvec2 pos = interpolate(options.interpolation,
                before.pos, next.pos, dtRef / dtSource);
            inter.pos = isOutlier(pos, options.outlierBound) ? ref.pos : pos;
        }

        result.clean.push_back(ref);
        result.interpolated.push_back(inter);
    }

    if (options.preserveOrder && flipped) {
        std::swap(result.clean, result.interpolated);
    }

    return result;
}

} // namespace ReplayGuard
