// [DETECTION_AGENT] Unit tests for pairwise comparison

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "detection/ComparisonEngine.hpp"
#include "errors/Errors.hpp"
#include <cmath>
#include <random>
#include <string>
#include <vector>

using namespace ReplayGuard;
using namespace ReplayGuard::Detection;

namespace {

glm::dvec2 pathAt(double t) {
    return {256.0 + 200.0 * std::sin(t / 500.0), 192.0 + 150.0 * std::cos(t / 700.0)};
}

// Samples 10 ms apart, 3 s by default
Trace pathTrace(const std::string& owner, glm::dvec2 offset = {0.0, 0.0},
                int count = 301) {
    std::vector<Sample> samples;
    for (int i = 0; i < count; ++i) {
        const double t = 10.0 * i;
        samples.push_back(Sample{t, pathAt(t) + offset});
    }
    return Trace(owner, samples);
}

// Same path with a 5 s idle gap after sample 150
Trace pathTraceWithBreak(const std::string& owner) {
    std::vector<Sample> samples;
    for (int i = 0; i <= 300; ++i) {
        const double t = 10.0 * i;
        samples.push_back(Sample{i > 150 ? t + 5000.0 : t, pathAt(t)});
    }
    return Trace(owner, samples);
}

ComparisonConfig quietConfig(double threshold = 10.0) {
    ComparisonConfig config;
    config.threshold = threshold;
    config.verbose = false;
    return config;
}

std::vector<std::pair<std::string, std::string>> ownerPairs(
    const std::vector<ComparisonOutcome>& outcomes) {
    std::vector<std::pair<std::string, std::string>> pairs;
    for (const auto& outcome : outcomes) {
        pairs.emplace_back(outcome.ownerA, outcome.ownerB);
    }
    return pairs;
}

} // namespace

TEST_CASE("Comparison mode parsing", "[detection]") {
    REQUIRE(parseComparisonMode("double") == ComparisonMode::DOUBLE);
    REQUIRE(parseComparisonMode("single") == ComparisonMode::SINGLE);
    REQUIRE_THROWS_AS(parseComparisonMode("triple"), InvalidModeError);
    REQUIRE_THROWS_AS(parseComparisonMode(""), InvalidModeError);
    REQUIRE(std::string(comparisonModeToString(ComparisonMode::SINGLE)) == "single");
}

TEST_CASE("Single-set comparison", "[detection]") {
    std::vector<Trace> traces{
        pathTrace("alice"),
        pathTrace("bob"),
        pathTrace("carol", {100.0, 0.0})
    };
    ComparisonEngine engine(quietConfig(), std::move(traces));

    auto outcomes = engine.collect(ComparisonMode::SINGLE);

    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].ownerA == "alice");
    REQUIRE(outcomes[0].ownerB == "bob");
    REQUIRE(outcomes[0].meanDistance == Catch::Approx(0.0).margin(1e-9));

    const auto& stats = engine.getLastBatchStats();
    REQUIRE(stats.pairsEnumerated == 3);
    REQUIRE(stats.pairsSkipped == 0);
    REQUIRE(stats.pairsCompared == 3);
    REQUIRE(stats.outcomesReported == 1);
}

TEST_CASE("Two-set comparison", "[detection]") {
    std::vector<Trace> suspects{pathTrace("alice")};
    std::vector<Trace> leaderboard{
        pathTrace("bob"),
        pathTrace("carol", {100.0, 0.0}),
        pathTrace("alice")
    };
    ComparisonEngine engine(quietConfig(), std::move(suspects), std::move(leaderboard));

    auto outcomes = engine.collect(ComparisonMode::DOUBLE);

    // alice vs alice is a self-comparison and never scored
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].ownerA == "alice");
    REQUIRE(outcomes[0].ownerB == "bob");

    const auto& stats = engine.getLastBatchStats();
    REQUIRE(stats.pairsEnumerated == 3);
    REQUIRE(stats.pairsSkipped == 1);
    REQUIRE(stats.pairsCompared == 2);
}

TEST_CASE("Double mode needs a second set", "[detection]") {
    ComparisonEngine engine(quietConfig(), {pathTrace("alice"), pathTrace("bob")});
    REQUIRE_THROWS_AS(engine.collect(ComparisonMode::DOUBLE), InputError);
}

TEST_CASE("Unknown mode fails before any pair is compared", "[detection]") {
    ComparisonEngine engine(quietConfig(), {pathTrace("alice"), pathTrace("bob")});

    int calls = 0;
    REQUIRE_THROWS_AS(engine.compare("triple",
        [&calls](const ComparisonOutcome&) { ++calls; }), InvalidModeError);
    REQUIRE(calls == 0);
    REQUIRE(engine.getLastBatchStats().pairsCompared == 0);

    engine.compare("single", [&calls](const ComparisonOutcome&) { ++calls; });
    REQUIRE(calls == 1);
}

TEST_CASE("Trusted owners are never compared with each other", "[detection]") {
    ComparisonConfig config = quietConfig();
    config.trustedOwners = {"alice", "bob"};

    std::vector<Trace> traces{pathTrace("alice"), pathTrace("bob"), pathTrace("dave")};
    ComparisonEngine engine(config, std::move(traces));

    REQUIRE(engine.shouldSkipPair("alice", "bob"));
    REQUIRE(engine.shouldSkipPair("dave", "dave"));
    REQUIRE_FALSE(engine.shouldSkipPair("alice", "dave"));

    auto pairs = ownerPairs(engine.collect(ComparisonMode::SINGLE));

    // One trusted owner is not enough for an exemption
    REQUIRE(pairs.size() == 2);
    REQUIRE(pairs[0] == std::make_pair(std::string("alice"), std::string("dave")));
    REQUIRE(pairs[1] == std::make_pair(std::string("bob"), std::string("dave")));
    REQUIRE(engine.getLastBatchStats().pairsSkipped == 1);
}

TEST_CASE("Outcomes follow enumeration order", "[detection]") {
    std::vector<Trace> traces{
        pathTrace("w"), pathTrace("x"), pathTrace("y"), pathTrace("z")
    };
    ComparisonEngine engine(quietConfig(), std::move(traces));

    auto pairs = ownerPairs(engine.collect(ComparisonMode::SINGLE));

    std::vector<std::pair<std::string, std::string>> expected{
        {"w", "x"}, {"w", "y"}, {"w", "z"}, {"x", "y"}, {"x", "z"}, {"y", "z"}
    };
    REQUIRE(pairs == expected);
}

TEST_CASE("Threshold filtering", "[detection]") {
    ComparisonEngine engine(quietConfig(4.9),
        {pathTrace("alice"), pathTrace("bob", {3.0, 4.0})});

    auto outcomes = engine.collect(ComparisonMode::SINGLE);
    REQUIRE(outcomes.empty());

    engine.setConfig(quietConfig(5.1));
    outcomes = engine.collect(ComparisonMode::SINGLE);
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes[0].meanDistance == Catch::Approx(5.0));

    SECTION("Mean equal to the threshold is not reported") {
        ComparisonEngine exact(quietConfig(0.0), {pathTrace("alice"), pathTrace("carol")});
        REQUIRE(exact.collect(ComparisonMode::SINGLE).empty());
        REQUIRE(exact.getLastBatchStats().pairsCompared == 1);
    }
}

TEST_CASE("Break collapsing before alignment", "[detection][breaks]") {
    ComparisonConfig config = quietConfig(1e9);
    Trace paused = pathTraceWithBreak("alice");
    Trace steady = pathTrace("bob", {0.0, 0.0}, 801);  // Covers the paused trace's span

    ComparisonEngine raw(config, {});
    auto withoutSkip = raw.comparePair(paused, steady);

    config.skipBreaks = true;
    ComparisonEngine collapsed(config, {});
    auto withSkip = collapsed.comparePair(paused, steady);

    REQUIRE(withoutSkip.has_value());
    REQUIRE(withSkip.has_value());
    REQUIRE(withSkip->meanDistance < 5.0);
    REQUIRE(withoutSkip->meanDistance > withSkip->meanDistance);
}

TEST_CASE("Parallel comparison matches sequential", "[detection][threads]") {
    std::mt19937 rng(31337);
    std::uniform_real_distribution<double> jitter(-6.0, 6.0);

    std::vector<Trace> traces;
    for (int i = 0; i < 12; ++i) {
        traces.push_back(pathTrace("player" + std::to_string(i),
                                   {jitter(rng), jitter(rng)}));
    }

    ComparisonConfig sequentialConfig = quietConfig(8.0);
    ComparisonEngine sequential(sequentialConfig, traces);
    auto expected = sequential.collect(ComparisonMode::SINGLE);

    ComparisonConfig parallelConfig = sequentialConfig;
    parallelConfig.workerThreads = 4;
    ComparisonEngine parallel(parallelConfig, traces);
    auto actual = parallel.collect(ComparisonMode::SINGLE);

    REQUIRE_FALSE(expected.empty());
    REQUIRE(ownerPairs(actual) == ownerPairs(expected));
    for (size_t i = 0; i < expected.size(); ++i) {
        REQUIRE(actual[i].meanDistance == Catch::Approx(expected[i].meanDistance));
        REQUIRE(actual[i].stdDistance == Catch::Approx(expected[i].stdDistance));
    }
    REQUIRE(parallel.getLastBatchStats().pairsCompared ==
            sequential.getLastBatchStats().pairsCompared);
}

TEST_CASE("A failing pair aborts the batch", "[detection]") {
    std::vector<Trace> traces{
        pathTrace("alice"),
        Trace("bob", {Sample{0.0, {0.0, 0.0}}}),
        pathTrace("carol")
    };

    SECTION("Sequential") {
        ComparisonEngine engine(quietConfig(), traces);
        REQUIRE_THROWS_AS(engine.collect(ComparisonMode::SINGLE), InputError);
    }

    SECTION("Parallel") {
        ComparisonConfig config = quietConfig();
        config.workerThreads = 3;
        ComparisonEngine engine(config, traces);

        std::vector<ComparisonOutcome> delivered;
        REQUIRE_THROWS_AS(engine.compare(ComparisonMode::SINGLE,
            [&delivered](const ComparisonOutcome& outcome) { delivered.push_back(outcome); }),
            InputError);
        // alice vs bob is the first pair, so nothing was delivered
        REQUIRE(delivered.empty());
    }
}

TEST_CASE("Outcome formatting", "[detection]") {
    ComparisonOutcome outcome{"alice", "bob", 12.34, 4.56};
    REQUIRE(formatOutcome(outcome) == "12.3 similarity, 4.6 std deviation (alice vs bob)");
}
