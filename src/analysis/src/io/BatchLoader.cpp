// [LOADER_AGENT] Batch document parsing

#include "io/BatchLoader.hpp"
#include "errors/Errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

namespace ReplayGuard {

namespace {

using nlohmann::json;

std::vector<CursorEvent> parseEvents(const json& events, const std::string& owner) {
    if (!events.is_array()) {
        throw InputError("trace '" + owner + "': \"events\" must be an array");
    }

    std::vector<CursorEvent> out;
    out.reserve(events.size());
    for (const auto& event : events) {
        if (!event.is_array() || event.size() != 3) {
            throw InputError("trace '" + owner + "': each event must be [dt, x, y]");
        }
        out.push_back(CursorEvent{
            event[0].get<double>(), event[1].get<double>(), event[2].get<double>()});
    }
    return out;
}

std::vector<Trace> parseTraces(const json& traces, const char* field) {
    if (!traces.is_array()) {
        throw InputError(std::string("\"") + field + "\" must be an array");
    }

    std::vector<Trace> out;
    out.reserve(traces.size());
    for (const auto& entry : traces) {
        const std::string owner = entry.at("owner").get<std::string>();
        out.push_back(Trace::fromEvents(owner, parseEvents(entry.at("events"), owner)));
    }
    return out;
}

void applyConfig(const json& node, Detection::ComparisonConfig& config, std::string& mode) {
    config.threshold = node.value("threshold", config.threshold);
    config.skipBreaks = node.value("skip_breaks", config.skipBreaks);
    config.breakThresholdMs = node.value("break_threshold_ms", config.breakThresholdMs);
    config.outlierBound = node.value("outlier_bound", config.outlierBound);
    config.workerThreads = node.value("worker_threads", config.workerThreads);
    mode = node.value("mode", mode);

    if (node.contains("trusted")) {
        for (const auto& owner : node.at("trusted")) {
            config.trustedOwners.insert(owner.get<std::string>());
        }
    }

    if (node.contains("interpolation")) {
        const auto name = node.at("interpolation").get<std::string>();
        const auto kind = parseInterpolationKind(name);
        if (!kind) {
            throw InputError("unknown interpolation '" + name + "'");
        }
        config.interpolation = *kind;
    }
}

} // namespace

TraceBatch loadBatchFromString(const std::string& text) {
    TraceBatch batch;

    try {
        const json doc = json::parse(text);

        batch.traces = parseTraces(doc.at("traces"), "traces");
        if (doc.contains("against")) {
            batch.against = parseTraces(doc.at("against"), "against");
        }

        batch.mode = batch.against ? "double" : "single";
        if (doc.contains("config")) {
            applyConfig(doc.at("config"), batch.config, batch.mode);
        }
    } catch (const json::exception& e) {
        throw InputError(std::string("malformed batch document: ") + e.what());
    }

    return batch;
}

TraceBatch loadBatchFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw InputError("cannot open batch file " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    TraceBatch batch = loadBatchFromString(buffer.str());
    std::cout << "[LOADER] " << path << ": " << batch.traces.size() << " traces";
    if (batch.against) {
        std::cout << ", " << batch.against->size() << " to compare against";
    }
    std::cout << "\n";
    return batch;
}

} // namespace ReplayGuard
