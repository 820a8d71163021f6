// [TRACE_AGENT] Break collapsing, fixed-rate resampling and velocity

#include "trace/TraceOps.hpp"
#include "errors/Errors.hpp"
#include <cmath>
#include <cstddef>
#include <string>

namespace ReplayGuard {

std::vector<Sample> skipBreaks(const std::vector<Sample>& samples,
                               double breakThresholdMs) {
    std::vector<Sample> skipped;
    if (samples.empty()) {
        return skipped;
    }
    skipped.reserve(samples.size());

    double totalBreakTime = 0.0;
    double tPrev = samples.front().t;

    for (const auto& sample : samples) {
        const double dt = sample.t - tPrev;

        // The whole gap goes, not just the part above the threshold
        if (dt > breakThresholdMs) {
            totalBreakTime += dt;
        }

        skipped.push_back(Sample{sample.t - totalBreakTime, sample.pos});
        tPrev = sample.t;
    }

    return skipped;
}

std::vector<Sample> resample(const std::vector<Sample>& samples, double frequencyHz) {
    if (samples.size() < Constants::MIN_SAMPLES_FOR_BRACKET) {
        throw InputError("resample needs at least 2 samples, got " +
                         std::to_string(samples.size()));
    }
    if (!std::isfinite(frequencyHz) || frequencyHz <= 0.0) {
        throw InputError("resample frequency must be positive");
    }

    const double step = Constants::MS_PER_SECOND / frequencyHz;
    const double tMin = samples.front().t;
    const double tMax = samples.back().t;
    const auto count = static_cast<size_t>(
        std::floor((tMax - tMin) * frequencyHz / Constants::MS_PER_SECOND));

    std::vector<Sample> resampled;
    resampled.reserve(count);

    // Cursor only moves forward; samples[i - 1].t <= t <= samples[i].t
    size_t i = 1;
    for (size_t k = 0; k < count; ++k) {
        const double t = tMin + static_cast<double>(k) * step;

        while (i < samples.size() - 1 && samples[i].t < t) {
            ++i;
        }

        const Sample& before = samples[i - 1];
        const Sample& after = samples[i];
        const double dtSpan = after.t - before.t;

        if (dtSpan == 0.0) {
            resampled.push_back(Sample{t, before.pos});
            continue;
        }

        const double ratio = (t - before.t) / dtSpan;
        resampled.push_back(Sample{t, glm::mix(before.pos, after.pos, ratio)});
    }

    return resampled;
}

std::vector<glm::dvec2> computeVelocity(const std::vector<Sample>& samples) {
    std::vector<glm::dvec2> velocity;
    if (samples.size() < 2) {
        return velocity;
    }
    velocity.reserve(samples.size() - 1);

    for (size_t i = 1; i < samples.size(); ++i) {
        const double dt = samples[i].t - samples[i - 1].t;
        if (dt == 0.0) {
            throw NumericFault("velocity: zero time step at sample " + std::to_string(i));
        }
        velocity.push_back((samples[i].pos - samples[i - 1].pos) / dt);
    }

    return velocity;
}

} // namespace ReplayGuard
