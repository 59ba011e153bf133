// AceProxy - AceStream Multiplexing Proxy
// Health Service Implementation

#include "aceproxy/probe/health_service.hpp"

namespace aceproxy {
namespace probe {

namespace {

ComponentHealth toHealth(const core::Result<void, core::Error>& result) {
    ComponentHealth health;
    health.ok = result.isSuccess();
    if (!health.ok) {
        health.error = result.error().message;
    }
    return health;
}

} // namespace

HealthService::HealthService(
    std::shared_ptr<IProbeRepository> repository,
    std::shared_ptr<engine::IAceStreamEngine> engine,
    std::shared_ptr<core::MetricsCollector> metrics)
    : repository_(std::move(repository))
    , engine_(std::move(engine))
    , metrics_(std::move(metrics))
{
}

HealthStatus HealthService::check(core::Context& ctx) {
    HealthStatus status;
    status.database = toHealth(repository_->ping(ctx));
    status.engine = toHealth(engine_->ping(ctx));
    if (!status.isHealthy() && metrics_) {
        metrics_->recordHealthCheckFailure();
    }
    return status;
}

} // namespace probe
} // namespace aceproxy
