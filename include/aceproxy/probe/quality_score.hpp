// AceProxy - AceStream Multiplexing Proxy
// Quality Score - Weighted ranking of a stream's metrics

#ifndef ACEPROXY_PROBE_QUALITY_SCORE_HPP
#define ACEPROXY_PROBE_QUALITY_SCORE_HPP

#include "aceproxy/probe/metrics.hpp"

namespace aceproxy {
namespace probe {

// Component weights, summing to 1.
constexpr double UPTIME_WEIGHT = 0.50;
constexpr double SPEED_WEIGHT = 0.20;
constexpr double PEERS_WEIGHT = 0.15;
constexpr double STABILITY_WEIGHT = 0.10;
constexpr double LATENCY_WEIGHT = 0.05;

/// Startup latency at or above which the latency component is zero.
constexpr double MAX_STARTUP_LATENCY_MS = 10000.0;

/**
 * @brief Score a stream in [0, 1].
 *
 * Speed and peers are normalised against ceilings, usually the best values
 * among the streams being compared. A ceiling of zero zeroes its component.
 */
double computeQualityScore(const Metrics& metrics, double maxSpeed, double maxPeers);

} // namespace probe
} // namespace aceproxy

#endif // ACEPROXY_PROBE_QUALITY_SCORE_HPP
