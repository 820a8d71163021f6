// [TRACE_AGENT] Trace construction

#include "trace/Trace.hpp"
#include "errors/Errors.hpp"
#include <algorithm>
#include <utility>

namespace ReplayGuard {

Trace::Trace(std::string owner, std::vector<Sample> samples)
    : owner_(std::move(owner)), samples_(std::move(samples)) {
    if (samples_.empty()) {
        throw EmptyTraceError(owner_);
    }

    // Replay deltas can be negative; never assume the input is ordered
    std::stable_sort(samples_.begin(), samples_.end(),
        [](const Sample& a, const Sample& b) {
            return a.t < b.t;
        });
}

Trace Trace::fromEvents(std::string owner, const std::vector<CursorEvent>& events) {
    std::vector<Sample> samples;
    samples.reserve(events.size());

    double t = 0.0;
    for (const auto& event : events) {
        t += event.dt;
        samples.push_back(Sample{t, glm::dvec2(event.x, event.y)});
    }

    return Trace(std::move(owner), std::move(samples));
}

std::vector<double> Trace::times() const {
    std::vector<double> out;
    out.reserve(samples_.size());
    for (const auto& sample : samples_) {
        out.push_back(sample.t);
    }
    return out;
}

std::vector<glm::dvec2> Trace::positions() const {
    return stripTime(samples_);
}

std::vector<glm::dvec2> stripTime(const std::vector<Sample>& samples) {
    std::vector<glm::dvec2> out;
    out.reserve(samples.size());
    for (const auto& sample : samples) {
        out.push_back(sample.pos);
    }
    return out;
}

} // namespace ReplayGuard
