// AceProxy - AceStream Multiplexing Proxy
// Metrics Handler - GET /metrics

#ifndef ACEPROXY_API_METRICS_HANDLER_HPP
#define ACEPROXY_API_METRICS_HANDLER_HPP

#include <memory>

#include "aceproxy/api/router.hpp"
#include "aceproxy/core/metrics_collector.hpp"

namespace aceproxy {
namespace api {

/// Content type of the Prometheus text exposition format.
constexpr const char* kPrometheusContentType = "text/plain; version=0.0.4; charset=utf-8";

/**
 * @brief Serves the collector's counters for a Prometheus scraper.
 */
class MetricsHandler {
public:
    explicit MetricsHandler(std::shared_ptr<core::MetricsCollector> metrics);

    void registerRoutes(Router& router);

    core::Result<void, core::Error> handleMetrics(
        core::Context& ctx,
        const HttpRequest& request,
        IResponseWriter& writer
    );

private:
    std::shared_ptr<core::MetricsCollector> metrics_;
};

} // namespace api
} // namespace aceproxy

#endif // ACEPROXY_API_METRICS_HANDLER_HPP
