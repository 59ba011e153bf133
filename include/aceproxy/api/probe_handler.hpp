// AceProxy - AceStream Multiplexing Proxy
// Probe Handler - Probe history, metrics, quality ranking and manual runs

#ifndef ACEPROXY_API_PROBE_HANDLER_HPP
#define ACEPROXY_API_PROBE_HANDLER_HPP

#include <memory>

#include "aceproxy/api/router.hpp"
#include "aceproxy/core/structured_logger.hpp"
#include "aceproxy/probe/probe_service.hpp"

namespace aceproxy {
namespace api {

/**
 * @brief HTTP front of the ProbeService.
 *
 * Routes:
 * - GET  /probes/{infoHash}          probe results in the window, newest first
 * - GET  /probes/{infoHash}/metrics  rolling metrics, 404 without data
 * - GET  /quality/{channelName}      streams of a channel ranked by score
 * - POST /probes/run                 run a probe cycle now
 *
 * Storage failures answer 500 without leaking their detail.
 */
class ProbeHandler {
public:
    ProbeHandler(
        std::shared_ptr<probe::ProbeService> service,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    void registerRoutes(Router& router);

    core::Result<void, core::Error> handleHistory(
        core::Context& ctx, const HttpRequest& request, IResponseWriter& writer);
    core::Result<void, core::Error> handleMetrics(
        core::Context& ctx, const HttpRequest& request, IResponseWriter& writer);
    core::Result<void, core::Error> handleQuality(
        core::Context& ctx, const HttpRequest& request, IResponseWriter& writer);
    core::Result<void, core::Error> handleRun(
        core::Context& ctx, const HttpRequest& request, IResponseWriter& writer);

private:
    core::Result<void, core::Error> internalError(
        IResponseWriter& writer,
        const std::string& what,
        const core::Error& error
    );

    std::shared_ptr<probe::ProbeService> service_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace api
} // namespace aceproxy

#endif // ACEPROXY_API_PROBE_HANDLER_HPP
