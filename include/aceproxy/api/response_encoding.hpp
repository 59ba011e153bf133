// AceProxy - AceStream Multiplexing Proxy
// Response Encoding - JSON bodies of the HTTP API

#ifndef ACEPROXY_API_RESPONSE_ENCODING_HPP
#define ACEPROXY_API_RESPONSE_ENCODING_HPP

#include <string>
#include <vector>

#include "aceproxy/core/json.hpp"
#include "aceproxy/probe/health_service.hpp"
#include "aceproxy/probe/metrics.hpp"
#include "aceproxy/probe/probe_result.hpp"
#include "aceproxy/probe/probe_service.hpp"
#include "aceproxy/streaming/session_registry.hpp"

namespace aceproxy {
namespace api {

/// {info_hash, timestamp, available, startup_latency_ms, peer_count,
///  download_speed, status, error_message?}
void writeProbeResult(core::JsonWriter& json, const probe::ProbeResult& result);

void writeMetrics(core::JsonWriter& json, const probe::Metrics& metrics);

std::string encodeProbeResults(const std::vector<probe::ProbeResult>& results);
std::string encodeMetrics(const probe::Metrics& metrics);
std::string encodeQualityScores(const std::vector<probe::StreamQuality>& qualities);
std::string encodeActiveStreams(const std::vector<streaming::SessionSnapshot>& sessions);
std::string encodeHealth(const probe::HealthStatus& status);

} // namespace api
} // namespace aceproxy

#endif // ACEPROXY_API_RESPONSE_ENCODING_HPP
