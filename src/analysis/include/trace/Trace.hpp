#pragma once

#include <glm/glm.hpp>
#include <string>
#include <vector>
#include <cstddef>

// [TRACE_AGENT] Recorded cursor trace for one player's session
// Built once from per-event time deltas, read-only afterwards

namespace ReplayGuard {

// ============================================================================
// Single cursor sample
// ============================================================================
struct Sample {
    double t{0.0};             // Absolute time (milliseconds)
    glm::dvec2 pos{0.0, 0.0};  // Screen-space cursor position

    bool operator==(const Sample& other) const {
        return t == other.t && pos == other.pos;
    }
};

// Raw replay event as delivered by a replay parser
struct CursorEvent {
    double dt{0.0};  // Time since previous event (milliseconds)
    double x{0.0};
    double y{0.0};
};

// ============================================================================
// Trace
// ============================================================================
class Trace {
public:
    // Samples are stably sorted by timestamp. Throws EmptyTraceError if empty.
    Trace(std::string owner, std::vector<Sample> samples);

    // Cumulative timestamps from event deltas, then sorted
    // Throws EmptyTraceError if events is empty
    static Trace fromEvents(std::string owner, const std::vector<CursorEvent>& events);

    [[nodiscard]] const std::string& owner() const { return owner_; }
    [[nodiscard]] const std::vector<Sample>& samples() const { return samples_; }
    [[nodiscard]] size_t size() const { return samples_.size(); }

    [[nodiscard]] double startTime() const { return samples_.front().t; }
    [[nodiscard]] double endTime() const { return samples_.back().t; }
    [[nodiscard]] double duration() const { return endTime() - startTime(); }

    // Time column and coordinate column as separate sequences
    [[nodiscard]] std::vector<double> times() const;
    [[nodiscard]] std::vector<glm::dvec2> positions() const;

private:
    std::string owner_;
    std::vector<Sample> samples_;
};

// Strip the time column
std::vector<glm::dvec2> stripTime(const std::vector<Sample>& samples);

} // namespace ReplayGuard
