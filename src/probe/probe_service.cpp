// AceProxy - AceStream Multiplexing Proxy
// Probe Service Implementation

#include "aceproxy/probe/probe_service.hpp"
#include "aceproxy/probe/quality_score.hpp"

#include <algorithm>

namespace aceproxy {
namespace probe {

namespace {
const char* const kCategory = "ProbeService";
}

ProbeService::ProbeService(
    std::shared_ptr<IProbeRepository> repository,
    std::shared_ptr<IStreamCatalog> catalog,
    std::shared_ptr<engine::IAceStreamEngine> engine,
    std::shared_ptr<core::StructuredLogger> logger,
    ProbeServiceConfig config)
    : repository_(std::move(repository))
    , catalog_(std::move(catalog))
    , engine_(std::move(engine))
    , logger_(std::move(logger))
    , config_(config)
{
}

void ProbeService::setClock(WallClockFn clock) {
    clock_ = std::move(clock);
}

core::WallTime ProbeService::now() const {
    return clock_ ? clock_() : core::SystemClock::now();
}

// =============================================================================
// Probing
// =============================================================================

core::Result<ProbeCycleSummary, core::Error> ProbeService::probeAllStreams(core::Context& ctx) {
    using ResultType = core::Result<ProbeCycleSummary, core::Error>;

    auto streams = catalog_->findAll(ctx);
    if (streams.isError()) {
        return ResultType::error(streams.error().wrap(streams.error().code, "failed to fetch streams"));
    }

    if (logger_) {
        core::LogContext logCtx;
        logCtx.with("stream_count", std::to_string(streams.value().size()));
        logger_->logWithContext(core::LogLevelConfig::Info, "Starting probe cycle", logCtx, kCategory);
    }

    ProbeCycleSummary summary;
    for (const auto& stream : streams.value()) {
        if (ctx.isDone()) {
            if (logger_) {
                core::LogContext logCtx;
                logCtx.with("probed", std::to_string(summary.probed))
                      .with("failed", std::to_string(summary.failed));
                logger_->logWithContext(core::LogLevelConfig::Info, "Probe cycle interrupted", logCtx, kCategory);
            }
            return ResultType::error(ctx.err());
        }

        auto probed = probeStream(ctx, stream.infoHash);
        if (probed.isError()) {
            ++summary.failed;
            if (logger_) {
                core::LogContext logCtx;
                logCtx.infoHash = stream.infoHash;
                logCtx.errorCode = static_cast<int32_t>(probed.error().code);
                logCtx.with("channel", stream.channelName).with("error", probed.error().message);
                logger_->logWithContext(core::LogLevelConfig::Warning, "Probe failed", logCtx, kCategory);
            }
        } else {
            ++summary.probed;
        }
    }

    if (logger_) {
        core::LogContext logCtx;
        logCtx.with("probed", std::to_string(summary.probed))
              .with("failed", std::to_string(summary.failed));
        logger_->logWithContext(core::LogLevelConfig::Info, "Probe cycle completed", logCtx, kCategory);
    }

    auto cleaned = cleanup(ctx);
    if (cleaned.isError() && logger_) {
        core::LogContext logCtx;
        logCtx.errorCode = static_cast<int32_t>(cleaned.error().code);
        logCtx.with("error", cleaned.error().message);
        logger_->logWithContext(core::LogLevelConfig::Error, "Probe cleanup failed", logCtx, kCategory);
    }

    return ResultType::success(summary);
}

core::Result<ProbeResult, core::Error> ProbeService::probeStream(
    core::Context& ctx,
    const core::InfoHash& infoHash)
{
    const core::ClientId pid = "probe-" + std::to_string(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            now().time_since_epoch()).count());

    auto probeCtx = core::Context::withTimeout(ctx, config_.probeTimeout);

    const auto startTime = core::SteadyClock::now();
    auto started = engine_->startStream(*probeCtx, infoHash, pid);
    if (started.isError()) {
        return persist(ctx, ProbeResult::create(
            infoHash, now(), false, std::chrono::nanoseconds(0), 0, 0, "", started.error().message));
    }

    const auto startupLatency = std::chrono::duration_cast<std::chrono::nanoseconds>(
        core::SteadyClock::now() - startTime);

    auto stats = engine_->getStats(*probeCtx, pid);

    // Stopped on its own deadline so an expired probe still releases the engine session.
    core::Context stopCtx(core::SteadyClock::now() + config_.stopTimeout);
    auto stopped = engine_->stopStream(stopCtx, pid);
    if (stopped.isError() && logger_) {
        core::LogContext logCtx;
        logCtx.infoHash = infoHash;
        logCtx.clientId = pid;
        logCtx.with("error", stopped.error().message);
        logger_->logWithContext(core::LogLevelConfig::Warning, "Failed to stop probe stream", logCtx, kCategory);
    }

    if (stats.isError()) {
        return persist(ctx, ProbeResult::create(
            infoHash, now(), true, startupLatency, 0, 0, "",
            "stats error: " + stats.error().message));
    }

    const engine::StreamStats& s = stats.value();
    auto saved = persist(ctx, ProbeResult::create(
        infoHash, now(), true, startupLatency, s.peers, s.speedDown, s.status, ""));

    if (saved.isSuccess() && logger_ && logger_->isEnabled(core::LogLevelConfig::Debug)) {
        core::LogContext logCtx;
        logCtx.infoHash = infoHash;
        logCtx.with("peers", std::to_string(s.peers))
              .with("speed_down", std::to_string(s.speedDown))
              .with("startup_latency_ms", std::to_string(
                  std::chrono::duration_cast<std::chrono::milliseconds>(startupLatency).count()));
        logger_->logWithContext(core::LogLevelConfig::Debug, "Probe completed", logCtx, kCategory);
    }
    return saved;
}

core::Result<ProbeResult, core::Error> ProbeService::persist(
    core::Context& ctx,
    core::Result<ProbeResult, core::Error> created)
{
    using ResultType = core::Result<ProbeResult, core::Error>;

    if (created.isError()) {
        return ResultType::error(created.error().wrap(created.error().code, "failed to create probe result"));
    }

    auto saved = repository_->save(ctx, created.value());
    if (saved.isError()) {
        return ResultType::error(saved.error().wrap(saved.error().code, "failed to save probe result"));
    }
    return created;
}

// =============================================================================
// Queries
// =============================================================================

core::Result<Metrics, core::Error> ProbeService::getMetrics(
    core::Context& ctx,
    const core::InfoHash& infoHash)
{
    auto results = repository_->findByInfoHashSince(ctx, infoHash, now() - config_.window);
    if (results.isError()) {
        return core::Result<Metrics, core::Error>::error(
            results.error().wrap(results.error().code, "failed to fetch probe results"));
    }
    return Metrics::fromResults(infoHash, results.value());
}

core::Result<std::vector<StreamQuality>, core::Error> ProbeService::getQualityScores(
    core::Context& ctx,
    const std::string& channelName)
{
    using ResultType = core::Result<std::vector<StreamQuality>, core::Error>;

    auto streams = catalog_->findByChannelName(ctx, channelName);
    if (streams.isError()) {
        return ResultType::error(streams.error().wrap(streams.error().code, "failed to fetch streams"));
    }

    std::vector<StreamQuality> qualities;
    double maxSpeed = 0.0;
    double maxPeers = 0.0;

    for (const auto& stream : streams.value()) {
        auto metrics = getMetrics(ctx, stream.infoHash);
        if (metrics.isError()) {
            continue;
        }
        maxSpeed = std::max(maxSpeed, metrics.value().avgDownloadSpeed());
        maxPeers = std::max(maxPeers, metrics.value().avgPeerCount());
        qualities.push_back(StreamQuality{stream.infoHash, 0.0, metrics.value()});
    }

    for (auto& quality : qualities) {
        quality.score = computeQualityScore(quality.metrics, maxSpeed, maxPeers);
    }

    std::stable_sort(qualities.begin(), qualities.end(),
        [](const StreamQuality& a, const StreamQuality& b) { return a.score > b.score; });

    return ResultType::success(std::move(qualities));
}

core::Result<std::vector<ProbeResult>, core::Error> ProbeService::getProbeHistory(
    core::Context& ctx,
    const core::InfoHash& infoHash)
{
    return repository_->findByInfoHashSince(ctx, infoHash, now() - config_.window);
}

core::Result<void, core::Error> ProbeService::cleanup(core::Context& ctx) {
    return repository_->deleteBefore(ctx, now() - 2 * config_.window);
}

} // namespace probe
} // namespace aceproxy
