// AceProxy - AceStream Multiplexing Proxy
// Health Handler - GET /health

#ifndef ACEPROXY_API_HEALTH_HANDLER_HPP
#define ACEPROXY_API_HEALTH_HANDLER_HPP

#include <chrono>
#include <memory>

#include "aceproxy/api/router.hpp"
#include "aceproxy/probe/health_service.hpp"

namespace aceproxy {
namespace api {

/**
 * @brief Reports storage and engine reachability. 200 when both answer,
 *        503 otherwise.
 */
class HealthHandler {
public:
    explicit HealthHandler(
        std::shared_ptr<probe::HealthService> service,
        std::chrono::milliseconds checkTimeout = std::chrono::milliseconds(5000)
    );

    void registerRoutes(Router& router);

    core::Result<void, core::Error> handleHealth(
        core::Context& ctx,
        const HttpRequest& request,
        IResponseWriter& writer
    );

private:
    std::shared_ptr<probe::HealthService> service_;
    std::chrono::milliseconds checkTimeout_;
};

} // namespace api
} // namespace aceproxy

#endif // ACEPROXY_API_HEALTH_HANDLER_HPP
