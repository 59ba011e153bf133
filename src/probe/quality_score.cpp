// AceProxy - AceStream Multiplexing Proxy
// Quality Score Implementation

#include "aceproxy/probe/quality_score.hpp"

#include <algorithm>

namespace aceproxy {
namespace probe {

namespace {

double clampUnit(double v) {
    return std::min(1.0, std::max(0.0, v));
}

} // namespace

double computeQualityScore(const Metrics& metrics, double maxSpeed, double maxPeers) {
    double normalizedSpeed = 0.0;
    if (maxSpeed > 0) {
        normalizedSpeed = clampUnit(metrics.avgDownloadSpeed() / maxSpeed);
    }

    double normalizedPeers = 0.0;
    if (maxPeers > 0) {
        normalizedPeers = clampUnit(metrics.avgPeerCount() / maxPeers);
    }

    double stability = 0.0;
    if (metrics.avgDownloadSpeed() > 0) {
        stability = clampUnit(1.0 - metrics.speedStdDev() / metrics.avgDownloadSpeed());
    }

    // Zero average latency with successes means "instant", not "unknown".
    double latency = 0.0;
    if (metrics.avgStartupLatencyMs() > 0) {
        latency = clampUnit(1.0 - metrics.avgStartupLatencyMs() / MAX_STARTUP_LATENCY_MS);
    } else if (metrics.successfulProbes() > 0) {
        latency = 1.0;
    }

    return metrics.uptimeRatio() * UPTIME_WEIGHT
         + normalizedSpeed * SPEED_WEIGHT
         + normalizedPeers * PEERS_WEIGHT
         + stability * STABILITY_WEIGHT
         + latency * LATENCY_WEIGHT;
}

} // namespace probe
} // namespace aceproxy
