// AceProxy - AceStream Multiplexing Proxy
// Probe Result - Immutable outcome of one stream health probe

#ifndef ACEPROXY_PROBE_PROBE_RESULT_HPP
#define ACEPROXY_PROBE_PROBE_RESULT_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "aceproxy/core/error_codes.hpp"
#include "aceproxy/core/result.hpp"
#include "aceproxy/core/types.hpp"

namespace aceproxy {
namespace probe {

/**
 * @brief One probe of one stream.
 *
 * Instances are immutable. create() validates its input; reconstruct()
 * trusts it and is meant for storage adapters rehydrating saved rows.
 */
class ProbeResult {
public:
    /**
     * @brief Build a validated result.
     *
     * The infohash is trimmed of surrounding whitespace.
     *
     * @return EmptyInfoHash if nothing is left after trimming,
     *         InvalidTimestamp for the zero time point
     */
    static core::Result<ProbeResult, core::Error> create(
        const core::InfoHash& infoHash,
        core::WallTime timestamp,
        bool available,
        std::chrono::nanoseconds startupLatency,
        int64_t peerCount,
        int64_t downloadSpeed,
        std::string status,
        std::string errorMessage
    );

    static ProbeResult reconstruct(
        core::InfoHash infoHash,
        core::WallTime timestamp,
        bool available,
        std::chrono::nanoseconds startupLatency,
        int64_t peerCount,
        int64_t downloadSpeed,
        std::string status,
        std::string errorMessage
    );

    const core::InfoHash& infoHash() const { return infoHash_; }
    core::WallTime timestamp() const { return timestamp_; }
    bool available() const { return available_; }
    std::chrono::nanoseconds startupLatency() const { return startupLatency_; }
    int64_t peerCount() const { return peerCount_; }
    int64_t downloadSpeed() const { return downloadSpeed_; }     ///< bytes per second
    const std::string& status() const { return status_; }
    const std::string& errorMessage() const { return errorMessage_; }

private:
    ProbeResult() = default;

    core::InfoHash infoHash_;
    core::WallTime timestamp_{};
    bool available_ = false;
    std::chrono::nanoseconds startupLatency_{0};
    int64_t peerCount_ = 0;
    int64_t downloadSpeed_ = 0;
    std::string status_;
    std::string errorMessage_;
};

} // namespace probe
} // namespace aceproxy

#endif // ACEPROXY_PROBE_PROBE_RESULT_HPP
