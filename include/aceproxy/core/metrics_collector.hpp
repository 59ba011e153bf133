// AceProxy - AceStream Multiplexing Proxy
// Metrics Collection Component
//
// Counts multiplexer activity for monitoring: live sessions, attached
// clients, upstream reconnections and failures, failed health checks.
// Exposed in the Prometheus text format.

#ifndef ACEPROXY_CORE_METRICS_COLLECTOR_HPP
#define ACEPROXY_CORE_METRICS_COLLECTOR_HPP

#include "aceproxy/core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace aceproxy {
namespace core {

/**
 * @brief Upstream error labels recorded by the relay.
 */
namespace upstream_error {
constexpr const char* kConnectionLost = "connection_lost";
constexpr const char* kRestartFailed = "restart_failed";
constexpr const char* kReconnectExhausted = "reconnect_exhausted";
} // namespace upstream_error

/**
 * @brief Metrics snapshot for atomic retrieval of all metrics.
 */
struct MetricsSnapshot {
    uint64_t streamsActive = 0;
    uint64_t clientsConnected = 0;

    /// content id -> reconnections
    std::map<ContentId, uint64_t> upstreamReconnections;
    /// (content id, error type) -> errors
    std::map<std::pair<ContentId, std::string>, uint64_t> upstreamErrors;

    uint64_t healthCheckFailures = 0;

    std::chrono::milliseconds uptime{0};
};

/**
 * @brief Process-wide counters of the proxy.
 *
 * Gauges follow session registry events, counters are bumped by the relay
 * and the health service.
 *
 * ## Thread Safety
 * All methods are thread-safe.
 *
 * ## Usage Example
 * @code
 * auto metrics = std::make_shared<MetricsCollector>();
 * metrics->incrementStreams();
 * metrics->recordUpstreamError("abc", upstream_error::kConnectionLost);
 * std::string body = metrics->exportPrometheus();
 * @endcode
 */
class MetricsCollector {
public:
    MetricsCollector();

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    // =========================================================================
    // Gauges
    // =========================================================================

    void incrementStreams();
    /// Never drops below zero.
    void decrementStreams();
    uint64_t getActiveStreams() const;

    void incrementClients();
    /// Never drops below zero.
    void decrementClients();
    uint64_t getConnectedClients() const;

    // =========================================================================
    // Counters
    // =========================================================================

    /**
     * @brief Count one upstream restart attempt for a content id.
     */
    void recordUpstreamReconnection(const ContentId& contentId);
    uint64_t getUpstreamReconnections(const ContentId& contentId) const;

    /**
     * @brief Count one upstream failure.
     *
     * @param errorType One of the upstream_error labels
     */
    void recordUpstreamError(const ContentId& contentId, const std::string& errorType);
    uint64_t getUpstreamErrors(const ContentId& contentId, const std::string& errorType) const;

    void recordHealthCheckFailure();
    uint64_t getHealthCheckFailures() const;

    // =========================================================================
    // Snapshot and Export
    // =========================================================================

    MetricsSnapshot takeSnapshot() const;

    std::chrono::milliseconds getUptime() const;

    /**
     * @brief Render every metric in the Prometheus text exposition format.
     */
    std::string exportPrometheus() const;

private:
    static void decrementFloor(std::atomic<uint64_t>& gauge);

    std::chrono::steady_clock::time_point startTime_;

    std::atomic<uint64_t> activeStreams_{0};
    std::atomic<uint64_t> connectedClients_{0};
    std::atomic<uint64_t> healthCheckFailures_{0};

    mutable std::mutex countersMutex_;
    std::map<ContentId, uint64_t> reconnections_;
    std::map<std::pair<ContentId, std::string>, uint64_t> upstreamErrors_;
};

} // namespace core
} // namespace aceproxy

#endif // ACEPROXY_CORE_METRICS_COLLECTOR_HPP
