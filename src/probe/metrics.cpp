// AceProxy - AceStream Multiplexing Proxy
// Probe Metrics Implementation

#include "aceproxy/probe/metrics.hpp"

#include <cmath>

namespace aceproxy {
namespace probe {

core::Result<Metrics, core::Error> Metrics::fromResults(
    const core::InfoHash& infoHash,
    const std::vector<ProbeResult>& results)
{
    if (results.empty()) {
        return core::Result<Metrics, core::Error>::error(
            core::Error(core::ErrorCode::NoProbeData, "no probe data available", infoHash));
    }

    int64_t successful = 0;
    int64_t totalPeers = 0;
    int64_t totalSpeed = 0;
    double totalLatencyMs = 0.0;
    std::vector<double> speeds;
    speeds.reserve(results.size());

    for (const auto& result : results) {
        if (!result.available()) {
            continue;
        }
        ++successful;
        totalPeers += result.peerCount();
        totalSpeed += result.downloadSpeed();
        totalLatencyMs += static_cast<double>(
            std::chrono::duration_cast<std::chrono::milliseconds>(result.startupLatency()).count());
        speeds.push_back(static_cast<double>(result.downloadSpeed()));
    }

    Metrics metrics;
    metrics.infoHash_ = infoHash;
    metrics.totalProbes_ = static_cast<int64_t>(results.size());
    metrics.successfulProbes_ = successful;
    metrics.uptimeRatio_ = static_cast<double>(successful) / static_cast<double>(results.size());
    metrics.failureRate_ = 1.0 - metrics.uptimeRatio_;

    if (successful > 0) {
        const double count = static_cast<double>(successful);
        metrics.avgPeerCount_ = static_cast<double>(totalPeers) / count;
        metrics.avgDownloadSpeed_ = static_cast<double>(totalSpeed) / count;
        metrics.avgStartupLatencyMs_ = totalLatencyMs / count;

        double sumSquaredDiff = 0.0;
        for (double speed : speeds) {
            double diff = speed - metrics.avgDownloadSpeed_;
            sumSquaredDiff += diff * diff;
        }
        metrics.speedStdDev_ = std::sqrt(sumSquaredDiff / count);
    }

    return core::Result<Metrics, core::Error>::success(metrics);
}

} // namespace probe
} // namespace aceproxy
