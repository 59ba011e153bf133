// AceProxy - AceStream Multiplexing Proxy
// AceStream Engine Port - Operations the proxy needs from the media engine
//
// Responsibilities:
// - Start and stop engine playback sessions keyed by PID
// - Fetch live statistics for a playback session
// - Relay a playback URL's bytes into a stream writer
// - Report engine reachability for health checks

#ifndef ACEPROXY_ENGINE_ACESTREAM_ENGINE_HPP
#define ACEPROXY_ENGINE_ACESTREAM_ENGINE_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "aceproxy/core/context.hpp"
#include "aceproxy/core/error_codes.hpp"
#include "aceproxy/core/result.hpp"
#include "aceproxy/core/types.hpp"
#include "aceproxy/streaming/stream_writer.hpp"

namespace aceproxy {
namespace engine {

/**
 * @brief Live statistics of one engine playback session.
 */
struct StreamStats {
    int64_t peers = 0;
    int64_t speedDown = 0;      ///< Download speed as reported by the engine
    int64_t speedUp = 0;
    int64_t downloaded = 0;     ///< Bytes
    int64_t uploaded = 0;       ///< Bytes
    std::string status;
};

/**
 * @brief Port to the AceStream engine.
 *
 * The engine holds one physical connection per content id; the PID
 * identifies the playback session on the engine side. Every call honours
 * the cancellation and deadline of its context.
 */
class IAceStreamEngine {
public:
    virtual ~IAceStreamEngine() = default;

    /**
     * @brief Start (or restart) playback of a content id.
     *
     * @return Playback URL serving the stream bytes
     */
    virtual core::Result<std::string, core::Error> startStream(
        core::Context& ctx,
        const core::ContentId& contentId,
        const core::ClientId& pid
    ) = 0;

    virtual core::Result<StreamStats, core::Error> getStats(
        core::Context& ctx,
        const core::ClientId& pid
    ) = 0;

    virtual core::Result<void, core::Error> stopStream(
        core::Context& ctx,
        const core::ClientId& pid
    ) = 0;

    /**
     * @brief Copy the playback URL's body into a destination.
     *
     * Returns success when the upstream ends normally. Fails with the
     * context error on cancellation, or with the transfer or write error.
     */
    virtual core::Result<void, core::Error> streamContent(
        core::Context& ctx,
        const std::string& streamUrl,
        streaming::IStreamWriter& destination,
        const core::ContentId& contentId,
        const core::ClientId& pid,
        std::chrono::milliseconds writeTimeout
    ) = 0;

    virtual core::Result<void, core::Error> ping(core::Context& ctx) = 0;
};

} // namespace engine
} // namespace aceproxy

#endif // ACEPROXY_ENGINE_ACESTREAM_ENGINE_HPP
