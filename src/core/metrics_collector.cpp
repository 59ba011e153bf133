// AceProxy - AceStream Multiplexing Proxy
// Metrics Collection Component Implementation

#include "aceproxy/core/metrics_collector.hpp"

#include <sstream>

namespace aceproxy {
namespace core {

namespace {

/// Escapes a label value: backslash, double quote and newline.
std::string escapeLabel(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    return out;
}

void writeHeader(std::ostringstream& oss, const char* name, const char* help, const char* type) {
    oss << "# HELP " << name << " " << help << "\n";
    oss << "# TYPE " << name << " " << type << "\n";
}

} // namespace

MetricsCollector::MetricsCollector()
    : startTime_(std::chrono::steady_clock::now()) {
}

void MetricsCollector::decrementFloor(std::atomic<uint64_t>& gauge) {
    uint64_t current = gauge.load(std::memory_order_relaxed);
    while (current > 0) {
        if (gauge.compare_exchange_weak(current, current - 1, std::memory_order_relaxed)) {
            return;
        }
    }
}

// =============================================================================
// Gauges
// =============================================================================

void MetricsCollector::incrementStreams() {
    activeStreams_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::decrementStreams() {
    decrementFloor(activeStreams_);
}

uint64_t MetricsCollector::getActiveStreams() const {
    return activeStreams_.load(std::memory_order_relaxed);
}

void MetricsCollector::incrementClients() {
    connectedClients_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::decrementClients() {
    decrementFloor(connectedClients_);
}

uint64_t MetricsCollector::getConnectedClients() const {
    return connectedClients_.load(std::memory_order_relaxed);
}

// =============================================================================
// Counters
// =============================================================================

void MetricsCollector::recordUpstreamReconnection(const ContentId& contentId) {
    std::lock_guard<std::mutex> lock(countersMutex_);
    ++reconnections_[contentId];
}

uint64_t MetricsCollector::getUpstreamReconnections(const ContentId& contentId) const {
    std::lock_guard<std::mutex> lock(countersMutex_);
    auto it = reconnections_.find(contentId);
    return it == reconnections_.end() ? 0 : it->second;
}

void MetricsCollector::recordUpstreamError(const ContentId& contentId, const std::string& errorType) {
    std::lock_guard<std::mutex> lock(countersMutex_);
    ++upstreamErrors_[std::make_pair(contentId, errorType)];
}

uint64_t MetricsCollector::getUpstreamErrors(const ContentId& contentId, const std::string& errorType) const {
    std::lock_guard<std::mutex> lock(countersMutex_);
    auto it = upstreamErrors_.find(std::make_pair(contentId, errorType));
    return it == upstreamErrors_.end() ? 0 : it->second;
}

void MetricsCollector::recordHealthCheckFailure() {
    healthCheckFailures_.fetch_add(1, std::memory_order_relaxed);
}

uint64_t MetricsCollector::getHealthCheckFailures() const {
    return healthCheckFailures_.load(std::memory_order_relaxed);
}

// =============================================================================
// Snapshot and Export
// =============================================================================

MetricsSnapshot MetricsCollector::takeSnapshot() const {
    MetricsSnapshot snapshot;
    snapshot.streamsActive = activeStreams_.load(std::memory_order_relaxed);
    snapshot.clientsConnected = connectedClients_.load(std::memory_order_relaxed);
    snapshot.healthCheckFailures = healthCheckFailures_.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(countersMutex_);
        snapshot.upstreamReconnections = reconnections_;
        snapshot.upstreamErrors = upstreamErrors_;
    }
    snapshot.uptime = getUptime();
    return snapshot;
}

std::chrono::milliseconds MetricsCollector::getUptime() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime_);
}

std::string MetricsCollector::exportPrometheus() const {
    std::ostringstream oss;

    auto snapshot = takeSnapshot();

    writeHeader(oss, "aceproxy_streams_active", "Number of active streams", "gauge");
    oss << "aceproxy_streams_active " << snapshot.streamsActive << "\n";

    writeHeader(oss, "aceproxy_clients_connected", "Number of total clients connected", "gauge");
    oss << "aceproxy_clients_connected " << snapshot.clientsConnected << "\n";

    writeHeader(oss, "aceproxy_upstream_reconnections_total", "Total number of upstream reconnections",
                "counter");
    for (const auto& entry : snapshot.upstreamReconnections) {
        oss << "aceproxy_upstream_reconnections_total{content_id=\"" << escapeLabel(entry.first)
            << "\"} " << entry.second << "\n";
    }

    writeHeader(oss, "aceproxy_upstream_errors_total", "Total number of upstream errors", "counter");
    for (const auto& entry : snapshot.upstreamErrors) {
        oss << "aceproxy_upstream_errors_total{content_id=\"" << escapeLabel(entry.first.first)
            << "\",error_type=\"" << escapeLabel(entry.first.second) << "\"} " << entry.second << "\n";
    }

    writeHeader(oss, "aceproxy_health_check_failures_total", "Total number of health check failures",
                "counter");
    oss << "aceproxy_health_check_failures_total " << snapshot.healthCheckFailures << "\n";

    writeHeader(oss, "aceproxy_uptime_seconds", "Proxy uptime in seconds", "gauge");
    oss << "aceproxy_uptime_seconds " << (snapshot.uptime.count() / 1000.0) << "\n";

    return oss.str();
}

} // namespace core
} // namespace aceproxy
