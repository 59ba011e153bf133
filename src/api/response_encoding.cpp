// AceProxy - AceStream Multiplexing Proxy
// Response Encoding Implementation

#include "aceproxy/api/response_encoding.hpp"

#include <chrono>

namespace aceproxy {
namespace api {

namespace {

std::string componentStatus(const probe::ComponentHealth& health) {
    if (health.ok) {
        return "ok";
    }
    return health.error.empty() ? std::string("error") : "error: " + health.error;
}

} // namespace

void writeProbeResult(core::JsonWriter& json, const probe::ProbeResult& result) {
    json.beginObject()
        .key("info_hash").value(result.infoHash())
        .key("timestamp").value(core::formatRfc3339(result.timestamp()))
        .key("available").value(result.available())
        .key("startup_latency_ms").value(static_cast<int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(result.startupLatency()).count()))
        .key("peer_count").value(result.peerCount())
        .key("download_speed").value(result.downloadSpeed())
        .key("status").value(result.status());
    if (!result.errorMessage().empty()) {
        json.key("error_message").value(result.errorMessage());
    }
    json.endObject();
}

void writeMetrics(core::JsonWriter& json, const probe::Metrics& metrics) {
    json.beginObject()
        .key("info_hash").value(metrics.infoHash())
        .key("total_probes").value(metrics.totalProbes())
        .key("successful_probes").value(metrics.successfulProbes())
        .key("uptime_ratio").value(metrics.uptimeRatio())
        .key("avg_peer_count").value(metrics.avgPeerCount())
        .key("avg_download_speed").value(metrics.avgDownloadSpeed())
        .key("speed_std_dev").value(metrics.speedStdDev())
        .key("failure_rate").value(metrics.failureRate())
        .key("avg_startup_latency_ms").value(metrics.avgStartupLatencyMs())
        .endObject();
}

std::string encodeProbeResults(const std::vector<probe::ProbeResult>& results) {
    core::JsonWriter json;
    json.beginArray();
    for (const auto& result : results) {
        writeProbeResult(json, result);
    }
    json.endArray();
    return json.str();
}

std::string encodeMetrics(const probe::Metrics& metrics) {
    core::JsonWriter json;
    writeMetrics(json, metrics);
    return json.str();
}

std::string encodeQualityScores(const std::vector<probe::StreamQuality>& qualities) {
    core::JsonWriter json;
    json.beginArray();
    for (const auto& quality : qualities) {
        json.beginObject()
            .key("info_hash").value(quality.infoHash)
            .key("score").value(quality.score)
            .key("metrics");
        writeMetrics(json, quality.metrics);
        json.endObject();
    }
    json.endArray();
    return json.str();
}

std::string encodeActiveStreams(const std::vector<streaming::SessionSnapshot>& sessions) {
    core::JsonWriter json;
    json.beginObject().key("streams").beginArray();
    for (const auto& session : sessions) {
        json.beginObject()
            .key("info_hash").value(session.contentId)
            .key("client_count").value(static_cast<uint64_t>(session.clientCount))
            .key("pids").beginArray();
        for (const auto& pid : session.clientIds) {
            json.value(pid);
        }
        json.endArray().endObject();
    }
    json.endArray().endObject();
    return json.str();
}

std::string encodeHealth(const probe::HealthStatus& status) {
    core::JsonWriter json;
    json.beginObject()
        .key("status").value(status.statusString())
        .key("checks").beginObject()
            .key("database").value(componentStatus(status.database))
            .key("engine").value(componentStatus(status.engine))
        .endObject()
        .endObject();
    return json.str();
}

} // namespace api
} // namespace aceproxy
