// AceProxy - AceStream Multiplexing Proxy
// Probe Metrics - Aggregate health of a stream over a probe window
//
// Responsibilities:
// - Reduce a set of probe results to uptime and failure ratios
// - Average peers, speed and startup latency over successful probes only
// - Compute the population standard deviation of download speed

#ifndef ACEPROXY_PROBE_METRICS_HPP
#define ACEPROXY_PROBE_METRICS_HPP

#include <cstdint>
#include <vector>

#include "aceproxy/core/error_codes.hpp"
#include "aceproxy/core/result.hpp"
#include "aceproxy/core/types.hpp"
#include "aceproxy/probe/probe_result.hpp"

namespace aceproxy {
namespace probe {

/**
 * @brief Derived statistics for one infohash. Never persisted.
 */
class Metrics {
public:
    /**
     * @brief Aggregate a non-empty set of results.
     *
     * @return NoProbeData if @p results is empty
     */
    static core::Result<Metrics, core::Error> fromResults(
        const core::InfoHash& infoHash,
        const std::vector<ProbeResult>& results
    );

    const core::InfoHash& infoHash() const { return infoHash_; }
    int64_t totalProbes() const { return totalProbes_; }
    int64_t successfulProbes() const { return successfulProbes_; }
    double uptimeRatio() const { return uptimeRatio_; }
    double avgPeerCount() const { return avgPeerCount_; }
    double avgDownloadSpeed() const { return avgDownloadSpeed_; }
    double speedStdDev() const { return speedStdDev_; }
    double failureRate() const { return failureRate_; }
    double avgStartupLatencyMs() const { return avgStartupLatencyMs_; }

private:
    Metrics() = default;

    core::InfoHash infoHash_;
    int64_t totalProbes_ = 0;
    int64_t successfulProbes_ = 0;
    double uptimeRatio_ = 0.0;
    double avgPeerCount_ = 0.0;
    double avgDownloadSpeed_ = 0.0;
    double speedStdDev_ = 0.0;
    double failureRate_ = 0.0;
    double avgStartupLatencyMs_ = 0.0;
};

} // namespace probe
} // namespace aceproxy

#endif // ACEPROXY_PROBE_METRICS_HPP
