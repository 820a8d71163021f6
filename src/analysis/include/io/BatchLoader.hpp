#pragma once

#include "detection/ComparisonConfig.hpp"
#include "trace/Trace.hpp"
#include <optional>
#include <string>
#include <vector>

// [LOADER_AGENT] JSON batch documents
//
// {
//   "config":  { "threshold": 18, "mode": "single", "trusted": ["a"],
//                "skip_breaks": false, "break_threshold_ms": 1000,
//                "outlier_bound": 600, "interpolation": "linear",
//                "worker_threads": 1 },
//   "traces":  [ { "owner": "a", "events": [[dt, x, y], ...] }, ... ],
//   "against": [ ... ]
// }
//
// Events carry already-decoded replay frames; decoding replay files is
// somebody else's job.

namespace ReplayGuard {

struct TraceBatch {
    Detection::ComparisonConfig config;
    std::string mode;  // Unvalidated; "double" when "against" is present, else "single"
    std::vector<Trace> traces;
    std::optional<std::vector<Trace>> against;
};

// Throws InputError on malformed JSON or missing fields, EmptyTraceError
// for a trace without events
[[nodiscard]] TraceBatch loadBatchFromString(const std::string& text);

// Throws InputError if the file cannot be read
[[nodiscard]] TraceBatch loadBatchFromFile(const std::string& path);

} // namespace ReplayGuard
