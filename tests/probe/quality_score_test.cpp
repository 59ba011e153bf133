// AceProxy - AceStream Multiplexing Proxy
// Tests for the weighted quality score

#include <gtest/gtest.h>
#include "aceproxy/probe/quality_score.hpp"

#include <chrono>
#include <vector>

namespace aceproxy {
namespace probe {
namespace test {

using namespace std::chrono_literals;

namespace {

const core::WallTime kBase = core::WallTime(std::chrono::seconds(1700000000));

Metrics metricsOf(const std::vector<ProbeResult>& results) {
    auto metrics = Metrics::fromResults("hash", results);
    EXPECT_TRUE(metrics.isSuccess());
    return metrics.value();
}

ProbeResult ok(int64_t peers, int64_t speed, std::chrono::milliseconds latency) {
    return ProbeResult::reconstruct("hash", kBase, true, latency, peers, speed, "dl", "");
}

ProbeResult down() {
    return ProbeResult::reconstruct("hash", kBase, false, 0ms, 0, 0, "", "unavailable");
}

} // namespace

TEST(QualityScoreTest, WeightsSumToOne) {
    EXPECT_DOUBLE_EQ(UPTIME_WEIGHT + SPEED_WEIGHT + PEERS_WEIGHT + STABILITY_WEIGHT + LATENCY_WEIGHT, 1.0);
}

TEST(QualityScoreTest, PerfectStreamScoresNearOne) {
    Metrics metrics = metricsOf({ok(50, 400000, 500ms), ok(50, 400000, 500ms)});

    double score = computeQualityScore(metrics, 400000.0, 50.0);

    EXPECT_NEAR(score, 0.9975, 1e-9);
}

TEST(QualityScoreTest, AllUnavailableScoresZero) {
    Metrics metrics = metricsOf({down(), down(), down()});

    EXPECT_DOUBLE_EQ(computeQualityScore(metrics, 100000.0, 20.0), 0.0);
}

TEST(QualityScoreTest, ZeroCeilingsContributeNothing) {
    Metrics metrics = metricsOf({ok(0, 0, 0ms)});

    // Uptime and instant startup only.
    EXPECT_DOUBLE_EQ(computeQualityScore(metrics, 0.0, 0.0), UPTIME_WEIGHT + LATENCY_WEIGHT);
}

TEST(QualityScoreTest, SlowStartupClampsLatencyTerm) {
    Metrics metrics = metricsOf({ok(10, 1000, 20000ms)});

    double score = computeQualityScore(metrics, 1000.0, 10.0);

    EXPECT_NEAR(score, UPTIME_WEIGHT + SPEED_WEIGHT + PEERS_WEIGHT + STABILITY_WEIGHT, 1e-12);
}

TEST(QualityScoreTest, AboveCeilingClampsToUnit) {
    Metrics metrics = metricsOf({ok(100, 900000, 100ms)});

    double score = computeQualityScore(metrics, 1000.0, 1.0);

    EXPECT_LE(score, 1.0);
    EXPECT_GE(score, 0.0);
}

TEST(QualityScoreTest, AlwaysWithinUnitInterval) {
    const std::vector<std::vector<ProbeResult>> cases = {
        {ok(1, 10, 1ms)},
        {ok(5, 100, 9000ms), down()},
        {ok(3, 1, 0ms), ok(3, 1000000, 0ms), down(), down()},
        {down(), ok(1000, 5, 15000ms)},
    };
    for (const auto& results : cases) {
        Metrics metrics = metricsOf(results);
        for (double maxSpeed : {0.0, 1.0, 1e6}) {
            for (double maxPeers : {0.0, 2.0, 1e4}) {
                double score = computeQualityScore(metrics, maxSpeed, maxPeers);
                EXPECT_GE(score, 0.0);
                EXPECT_LE(score, 1.0);
            }
        }
    }
}

TEST(QualityScoreTest, MoreReliableStreamRanksHigher) {
    Metrics steady = metricsOf({ok(10, 1000, 1000ms), ok(10, 1000, 1000ms)});
    Metrics flaky = metricsOf({ok(10, 1000, 1000ms), down()});

    EXPECT_GT(computeQualityScore(steady, 1000.0, 10.0), computeQualityScore(flaky, 1000.0, 10.0));
}

} // namespace test
} // namespace probe
} // namespace aceproxy
