// AceProxy - AceStream Multiplexing Proxy
// AceStream HTTP Engine - Boost.Beast adapter for the engine's HTTP API
//
// Responsibilities:
// - Issue getstream / stat / stop / version requests against the engine
// - Bound each control call by its own timeout and the caller's context
// - Relay the playback URL's body into a stream writer until EOF
// - Translate transport, HTTP and engine-reported failures into core::Error

#ifndef ACEPROXY_ENGINE_ACESTREAM_HTTP_ENGINE_HPP
#define ACEPROXY_ENGINE_ACESTREAM_HTTP_ENGINE_HPP

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include "aceproxy/core/structured_logger.hpp"
#include "aceproxy/engine/acestream_engine.hpp"

namespace aceproxy {
namespace engine {

/// Maximum number of body characters quoted in error messages and logs.
constexpr size_t MAX_ERROR_BODY_LENGTH = 500;

/**
 * @brief Connection settings of the engine adapter.
 */
struct AceStreamHttpEngineConfig {
    std::string baseUrl = "http://localhost:6878";
    std::chrono::milliseconds startTimeout{30000};      ///< Engine may need time to find peers
    std::chrono::milliseconds statsTimeout{5000};
    std::chrono::milliseconds stopTimeout{5000};
    std::chrono::milliseconds pingTimeout{5000};
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::seconds stallTimeout{30};              ///< Abort a relay receiving no bytes this long
};

/**
 * @brief IAceStreamEngine over the engine's HTTP API using Boost.Beast.
 *
 * Each call opens its own connection on a private io_context, so the
 * adapter is safe to share between threads. Cancelling the caller's
 * context aborts the pending socket operation. Redirects are followed.
 */
class AceStreamHttpEngine : public IAceStreamEngine {
public:
    explicit AceStreamHttpEngine(
        AceStreamHttpEngineConfig config,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );
    ~AceStreamHttpEngine() override;

    AceStreamHttpEngine(const AceStreamHttpEngine&) = delete;
    AceStreamHttpEngine& operator=(const AceStreamHttpEngine&) = delete;

    core::Result<std::string, core::Error> startStream(
        core::Context& ctx,
        const core::ContentId& contentId,
        const core::ClientId& pid
    ) override;

    core::Result<StreamStats, core::Error> getStats(
        core::Context& ctx,
        const core::ClientId& pid
    ) override;

    core::Result<void, core::Error> stopStream(
        core::Context& ctx,
        const core::ClientId& pid
    ) override;

    core::Result<void, core::Error> streamContent(
        core::Context& ctx,
        const std::string& streamUrl,
        streaming::IStreamWriter& destination,
        const core::ContentId& contentId,
        const core::ClientId& pid,
        std::chrono::milliseconds writeTimeout
    ) override;

    core::Result<void, core::Error> ping(core::Context& ctx) override;

    // -------------------------------------------------------------------------
    // Response decoding (exposed for tests)
    // -------------------------------------------------------------------------

    /**
     * @brief Extract response.playback_url from a getstream body.
     */
    static core::Result<std::string, core::Error> parseStartResponse(const std::string& body);

    /**
     * @brief Extract the response object of a stat body.
     */
    static core::Result<StreamStats, core::Error> parseStatsResponse(const std::string& body);

    /**
     * @brief Reject bodies whose top-level "error" field is set.
     */
    static core::Result<void, core::Error> checkEngineError(const std::string& body);

    static std::string truncateBody(const std::string& body);

private:
    struct HttpResponse {
        long status = 0;
        std::string body;
    };

    core::Result<HttpResponse, core::Error> get(
        core::Context& ctx,
        const std::string& url,
        std::chrono::milliseconds timeout,
        const char* operation
    );

    std::string buildUrl(
        const std::string& path,
        const std::map<std::string, std::string>& params
    ) const;

    core::Result<void, core::Error> checkStatus(
        const HttpResponse& response,
        const std::string& url
    ) const;

    void logDebug(const std::string& message, const std::string& url, const core::ClientId& pid) const;

    AceStreamHttpEngineConfig config_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace engine
} // namespace aceproxy

#endif // ACEPROXY_ENGINE_ACESTREAM_HTTP_ENGINE_HPP
