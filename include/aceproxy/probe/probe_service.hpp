// AceProxy - AceStream Multiplexing Proxy
// Probe Service - Health probing, metrics and quality ranking of streams
//
// Responsibilities:
// - Probe every catalogued stream through the engine and persist the outcome
// - Reduce recent probe results to metrics for one infohash
// - Rank the streams of a channel by quality score
// - Expire probe results older than twice the metrics window

#ifndef ACEPROXY_PROBE_PROBE_SERVICE_HPP
#define ACEPROXY_PROBE_PROBE_SERVICE_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "aceproxy/core/context.hpp"
#include "aceproxy/core/result.hpp"
#include "aceproxy/core/structured_logger.hpp"
#include "aceproxy/core/types.hpp"
#include "aceproxy/engine/acestream_engine.hpp"
#include "aceproxy/probe/metrics.hpp"
#include "aceproxy/probe/probe_repository.hpp"
#include "aceproxy/probe/probe_result.hpp"
#include "aceproxy/probe/stream_catalog.hpp"

namespace aceproxy {
namespace probe {

/**
 * @brief Ranked quality of one stream.
 */
struct StreamQuality {
    core::InfoHash infoHash;
    double score;
    Metrics metrics;
};

struct ProbeServiceConfig {
    std::chrono::milliseconds probeTimeout{30000};     ///< Bound on start + stats of one probe
    std::chrono::milliseconds stopTimeout{5000};       ///< Bound on the engine stop after a probe
    std::chrono::hours window{24};                     ///< Metrics window
};

/**
 * @brief Counts of one probe cycle.
 */
struct ProbeCycleSummary {
    size_t probed = 0;
    size_t failed = 0;
};

using WallClockFn = std::function<core::WallTime()>;

/**
 * @brief Application service behind probing and ranking.
 *
 * Probes run sequentially on the calling thread; the service holds no
 * mutable state of its own and is safe to share.
 */
class ProbeService {
public:
    ProbeService(
        std::shared_ptr<IProbeRepository> repository,
        std::shared_ptr<IStreamCatalog> catalog,
        std::shared_ptr<engine::IAceStreamEngine> engine,
        std::shared_ptr<core::StructuredLogger> logger = nullptr,
        ProbeServiceConfig config = ProbeServiceConfig{}
    );

    /**
     * @brief Probe every catalogued stream, then clean up old results.
     *
     * Individual probe failures are logged and skipped.
     *
     * @return the context error if cancelled mid-cycle, the catalog error
     *         if the stream list cannot be read
     */
    core::Result<ProbeCycleSummary, core::Error> probeAllStreams(core::Context& ctx);

    /**
     * @brief Probe one stream and persist the result.
     *
     * An engine failure is recorded as an unavailable result, not returned
     * as an error. Errors are validation or storage failures.
     */
    core::Result<ProbeResult, core::Error> probeStream(core::Context& ctx, const core::InfoHash& infoHash);

    /**
     * @return NoProbeData if no result falls inside the window
     */
    core::Result<Metrics, core::Error> getMetrics(core::Context& ctx, const core::InfoHash& infoHash);

    /**
     * @brief Score the channel's streams, best first.
     *
     * Streams without data in the window are omitted. Speed and peer
     * ceilings are the maxima among the scored streams of this call.
     */
    core::Result<std::vector<StreamQuality>, core::Error> getQualityScores(
        core::Context& ctx,
        const std::string& channelName
    );

    /**
     * @brief Results inside the window, newest first.
     */
    core::Result<std::vector<ProbeResult>, core::Error> getProbeHistory(
        core::Context& ctx,
        const core::InfoHash& infoHash
    );

    /**
     * @brief Delete results older than twice the window.
     */
    core::Result<void, core::Error> cleanup(core::Context& ctx);

    void setClock(WallClockFn clock);

    const ProbeServiceConfig& config() const { return config_; }

private:
    core::Result<ProbeResult, core::Error> persist(
        core::Context& ctx,
        core::Result<ProbeResult, core::Error> created
    );
    core::WallTime now() const;

    std::shared_ptr<IProbeRepository> repository_;
    std::shared_ptr<IStreamCatalog> catalog_;
    std::shared_ptr<engine::IAceStreamEngine> engine_;
    std::shared_ptr<core::StructuredLogger> logger_;
    ProbeServiceConfig config_;
    WallClockFn clock_;
};

} // namespace probe
} // namespace aceproxy

#endif // ACEPROXY_PROBE_PROBE_SERVICE_HPP
