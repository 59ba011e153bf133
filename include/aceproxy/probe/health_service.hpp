// AceProxy - AceStream Multiplexing Proxy
// Health Service - Reachability of the proxy's dependencies

#ifndef ACEPROXY_PROBE_HEALTH_SERVICE_HPP
#define ACEPROXY_PROBE_HEALTH_SERVICE_HPP

#include <memory>
#include <string>

#include "aceproxy/core/context.hpp"
#include "aceproxy/core/metrics_collector.hpp"
#include "aceproxy/engine/acestream_engine.hpp"
#include "aceproxy/probe/probe_repository.hpp"

namespace aceproxy {
namespace probe {

struct ComponentHealth {
    bool ok = false;
    std::string error;      ///< Empty when ok

    const char* statusString() const { return ok ? "ok" : "error"; }
};

struct HealthStatus {
    ComponentHealth database;
    ComponentHealth engine;

    bool isHealthy() const { return database.ok && engine.ok; }
    const char* statusString() const { return isHealthy() ? "ok" : "degraded"; }
};

/**
 * @brief Pings the probe store and the engine. Every degraded check is
 *        counted as a health check failure when a collector is given.
 */
class HealthService {
public:
    HealthService(
        std::shared_ptr<IProbeRepository> repository,
        std::shared_ptr<engine::IAceStreamEngine> engine,
        std::shared_ptr<core::MetricsCollector> metrics = nullptr
    );

    HealthStatus check(core::Context& ctx);

private:
    std::shared_ptr<IProbeRepository> repository_;
    std::shared_ptr<engine::IAceStreamEngine> engine_;
    std::shared_ptr<core::MetricsCollector> metrics_;
};

} // namespace probe
} // namespace aceproxy

#endif // ACEPROXY_PROBE_HEALTH_SERVICE_HPP
