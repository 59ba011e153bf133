// AceProxy - AceStream Multiplexing Proxy
// Health Handler Implementation

#include "aceproxy/api/health_handler.hpp"
#include "aceproxy/api/response_encoding.hpp"

namespace aceproxy {
namespace api {

HealthHandler::HealthHandler(
    std::shared_ptr<probe::HealthService> service,
    std::chrono::milliseconds checkTimeout)
    : service_(std::move(service))
    , checkTimeout_(checkTimeout)
{
}

void HealthHandler::registerRoutes(Router& router) {
    router.get("/health", [this](core::Context& ctx, const HttpRequest& req, IResponseWriter& w) {
        return handleHealth(ctx, req, w);
    });
}

core::Result<void, core::Error> HealthHandler::handleHealth(
    core::Context& ctx,
    const HttpRequest& /* request */,
    IResponseWriter& writer)
{
    auto checkCtx = core::Context::withTimeout(ctx, checkTimeout_);
    probe::HealthStatus status = service_->check(*checkCtx);
    return sendJson(writer, status.isHealthy() ? 200 : 503, encodeHealth(status));
}

} // namespace api
} // namespace aceproxy
