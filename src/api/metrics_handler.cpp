// AceProxy - AceStream Multiplexing Proxy
// Metrics Handler Implementation

#include "aceproxy/api/metrics_handler.hpp"

namespace aceproxy {
namespace api {

MetricsHandler::MetricsHandler(std::shared_ptr<core::MetricsCollector> metrics)
    : metrics_(std::move(metrics))
{
}

void MetricsHandler::registerRoutes(Router& router) {
    router.get("/metrics", [this](core::Context& ctx, const HttpRequest& req, IResponseWriter& w) {
        return handleMetrics(ctx, req, w);
    });
}

core::Result<void, core::Error> MetricsHandler::handleMetrics(
    core::Context& /* ctx */,
    const HttpRequest& /* request */,
    IResponseWriter& writer)
{
    return sendBody(writer, 200, kPrometheusContentType, metrics_->exportPrometheus());
}

} // namespace api
} // namespace aceproxy
