// AceProxy - AceStream Multiplexing Proxy
// Proxy Handler - /ace/getstream and /ace/streams endpoints

#ifndef ACEPROXY_API_PROXY_HANDLER_HPP
#define ACEPROXY_API_PROXY_HANDLER_HPP

#include <memory>

#include "aceproxy/api/router.hpp"
#include "aceproxy/core/structured_logger.hpp"
#include "aceproxy/streaming/proxy_service.hpp"

namespace aceproxy {
namespace api {

/**
 * @brief HTTP front of the ProxyService.
 *
 * GET /ace/getstream?id=<contentId> relays the stream as video/mpeg.
 * Failures before the first byte map to a JSON error: 400 for a missing
 * or invalid id, 503 when the engine is unavailable, 504 when a joined
 * session never became ready and 502 otherwise. Once bytes have been sent
 * a failure just ends the response.
 *
 * GET /ace/streams lists the live sessions.
 */
class ProxyHandler {
public:
    ProxyHandler(
        std::shared_ptr<streaming::ProxyService> proxy,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    void registerRoutes(Router& router);

    core::Result<void, core::Error> handleGetStream(
        core::Context& ctx,
        const HttpRequest& request,
        IResponseWriter& writer
    );

    core::Result<void, core::Error> handleActiveStreams(
        core::Context& ctx,
        const HttpRequest& request,
        IResponseWriter& writer
    );

    /**
     * @brief Status answered for a stream failure before any byte was sent.
     */
    static int statusForError(const core::Error& error);

private:
    std::shared_ptr<streaming::ProxyService> proxy_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace api
} // namespace aceproxy

#endif // ACEPROXY_API_PROXY_HANDLER_HPP
