// AceProxy - AceStream Multiplexing Proxy
// Probe Result Implementation

#include "aceproxy/probe/probe_result.hpp"

namespace aceproxy {
namespace probe {

core::Result<ProbeResult, core::Error> ProbeResult::create(
    const core::InfoHash& infoHash,
    core::WallTime timestamp,
    bool available,
    std::chrono::nanoseconds startupLatency,
    int64_t peerCount,
    int64_t downloadSpeed,
    std::string status,
    std::string errorMessage)
{
    core::InfoHash trimmed = core::trimWhitespace(infoHash);
    if (trimmed.empty()) {
        return core::Result<ProbeResult, core::Error>::error(
            core::Error(core::ErrorCode::EmptyInfoHash, "probe infohash cannot be empty"));
    }
    if (timestamp.time_since_epoch().count() == 0) {
        return core::Result<ProbeResult, core::Error>::error(
            core::Error(core::ErrorCode::InvalidTimestamp, "probe timestamp must not be zero", trimmed));
    }

    return core::Result<ProbeResult, core::Error>::success(reconstruct(
        std::move(trimmed), timestamp, available, startupLatency,
        peerCount, downloadSpeed, std::move(status), std::move(errorMessage)));
}

ProbeResult ProbeResult::reconstruct(
    core::InfoHash infoHash,
    core::WallTime timestamp,
    bool available,
    std::chrono::nanoseconds startupLatency,
    int64_t peerCount,
    int64_t downloadSpeed,
    std::string status,
    std::string errorMessage)
{
    ProbeResult result;
    result.infoHash_ = std::move(infoHash);
    result.timestamp_ = timestamp;
    result.available_ = available;
    result.startupLatency_ = startupLatency;
    result.peerCount_ = peerCount;
    result.downloadSpeed_ = downloadSpeed;
    result.status_ = std::move(status);
    result.errorMessage_ = std::move(errorMessage);
    return result;
}

} // namespace probe
} // namespace aceproxy
