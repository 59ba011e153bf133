// AceProxy - AceStream Multiplexing Proxy
// Proxy Service Implementation
//
// Session flow per client:
//   addClient -> (first client) engine start -> Ready -> relay thread
//             -> (later client) wait for Ready
//   subscribe to the broadcaster until the stream ends
//   relay end -> close broadcaster, session leaves Ready
//   removeClient -> (last client) cancel relay, close broadcaster, engine stop

#include "aceproxy/streaming/proxy_service.hpp"

#include <algorithm>
#include <optional>
#include <string>

namespace aceproxy {
namespace streaming {

namespace {

const char* const kCategory = "ProxyService";

/**
 * @brief Runs a callable when the enclosing scope exits.
 */
template<typename F>
class ScopeExit {
public:
    explicit ScopeExit(F fn) : fn_(std::move(fn)) {}
    ~ScopeExit() { fn_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    F fn_;
};

template<typename F>
ScopeExit<F> makeScopeExit(F fn) {
    return ScopeExit<F>(std::move(fn));
}

} // namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

ProxyService::ProxyService(
    std::shared_ptr<engine::IAceStreamEngine> engine,
    std::shared_ptr<SessionRegistry> registry,
    std::shared_ptr<core::StructuredLogger> logger,
    ProxyServiceConfig config,
    std::shared_ptr<core::MetricsCollector> metrics)
    : engine_(std::move(engine))
    , registry_(std::move(registry))
    , logger_(std::move(logger))
    , config_(config)
    , metrics_(std::move(metrics))
{
    if (!registry_) {
        registry_ = std::make_shared<SessionRegistry>();
    }

    if (metrics_) {
        std::shared_ptr<core::MetricsCollector> metrics = metrics_;
        registry_->setEventCallback([metrics](const SessionEvent& event) {
            switch (event.type) {
                case SessionEvent::Type::SessionCreated: metrics->incrementStreams(); break;
                case SessionEvent::Type::SessionRemoved: metrics->decrementStreams(); break;
                case SessionEvent::Type::ClientJoined:   metrics->incrementClients(); break;
                case SessionEvent::Type::ClientLeft:     metrics->decrementClients(); break;
            }
        });
    }
}

ProxyService::~ProxyService() {
    shutdown();
}

// =============================================================================
// Client Entry Point
// =============================================================================

core::Result<void, core::Error> ProxyService::streamToClient(
    core::Context& ctx,
    const core::ContentId& contentId,
    IStreamWriter& destination)
{
    if (contentId.empty()) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidContentId, "content id must not be empty"));
    }

    const core::ClientId pid = ClientIdGenerator::shared().next();
    log(core::LogLevelConfig::Info, "Client connecting to stream", contentId, pid);

    auto added = registry_->addClient(contentId, pid);
    std::shared_ptr<StreamSession> session = added.first;
    const bool isNew = added.second;

    auto cleanup = makeScopeExit([this, &contentId, &pid]() {
        cleanupClient(contentId, pid);
    });

    if (isNew) {
        log(core::LogLevelConfig::Info, "Starting new stream session", contentId, pid);
        auto started = startUpstream(ctx, session, pid);
        if (started.isError()) {
            log(core::LogLevelConfig::Error, "Failed to start engine stream", contentId, pid, &started.error());
            return started;
        }
    } else {
        log(core::LogLevelConfig::Debug, "Joining existing stream session", contentId, pid);
        auto ready = session->waitUntilReady(ctx, config_.readyTimeout);
        if (ready.isError()) {
            log(core::LogLevelConfig::Warning, "Stream not ready", contentId, pid, &ready.error());
            return ready;
        }
    }

    auto broadcaster = session->broadcaster();
    if (!broadcaster) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::StreamNotActive, "stream not active", contentId));
    }

    auto result = broadcaster->subscribe(ctx, pid, destination, config_.writeTimeout);
    if (result.isError()) {
        auto level = result.error().code == core::ErrorCode::Cancelled
            ? core::LogLevelConfig::Info
            : core::LogLevelConfig::Warning;
        log(level, "Client stream ended with error", contentId, pid, &result.error());
    } else {
        log(core::LogLevelConfig::Info, "Client stream ended", contentId, pid);
    }
    return result;
}

std::vector<SessionSnapshot> ProxyService::getActiveStreams() const {
    return registry_->getAllSessions();
}

// =============================================================================
// Upstream Management
// =============================================================================

core::Result<void, core::Error> ProxyService::startUpstream(
    core::Context& ctx,
    const std::shared_ptr<StreamSession>& session,
    const core::ClientId& pid)
{
    {
        std::lock_guard<std::mutex> lock(relaysMutex_);
        if (shuttingDown_) {
            core::Error err(core::ErrorCode::EngineUnavailable, "proxy is shutting down", session->contentId());
            session->markFailed(err);
            return core::Result<void, core::Error>::error(err);
        }
    }

    auto started = engine_->startStream(ctx, session->contentId(), pid);
    if (started.isError()) {
        core::Error err = started.error().wrap(core::ErrorCode::EngineUnavailable, "acestream engine unavailable");
        session->markFailed(err);
        return core::Result<void, core::Error>::error(err);
    }

    auto broadcaster = std::make_shared<Broadcaster>(config_.clientBufferChunks, logger_);
    // The creator is attached before the relay starts so it sees the first byte.
    broadcaster->addClient(pid);

    auto upstreamContext = std::make_shared<core::Context>();
    session->attachUpstream(broadcaster, upstreamContext);
    session->updateStreamUrl(started.value());

    bool launched = false;
    {
        std::lock_guard<std::mutex> lock(relaysMutex_);
        if (!shuttingDown_) {
            reapFinishedRelays();

            RelayThread relay;
            relay.context = upstreamContext;
            relay.done = std::make_shared<std::atomic<bool>>(false);
            auto done = relay.done;
            relay.thread = std::thread([this, session, broadcaster, upstreamContext, pid, done]() {
                relayLoop(session, broadcaster, upstreamContext, pid);
                done->store(true);
            });
            relays_.push_back(std::move(relay));
            launched = true;
        }
    }

    if (!launched) {
        broadcaster->close();
        core::Error err(core::ErrorCode::EngineUnavailable, "proxy is shutting down", session->contentId());
        session->markFailed(err);

        core::Context stopContext(core::SteadyClock::now() + config_.stopTimeout);
        auto stopped = engine_->stopStream(stopContext, pid);
        if (stopped.isError()) {
            log(core::LogLevelConfig::Error, "Failed to stop stream", session->contentId(), pid,
                &stopped.error());
        }
        return core::Result<void, core::Error>::error(err);
    }

    session->markReady(started.value(), pid);
    log(core::LogLevelConfig::Info, "Stream started", session->contentId(), pid);
    return core::Result<void, core::Error>::success();
}

void ProxyService::relayLoop(
    std::shared_ptr<StreamSession> session,
    std::shared_ptr<Broadcaster> broadcaster,
    std::shared_ptr<core::Context> upstreamContext,
    core::ClientId pid)
{
    const core::ContentId& contentId = session->contentId();
    std::optional<core::Error> lastError;
    const uint32_t maxAttempts = std::max<uint32_t>(config_.maxAttempts, 1);

    for (uint32_t attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (attempt > 1) {
            auto delay = config_.retryBaseDelay * (1LL << (attempt - 2));
            log(core::LogLevelConfig::Info,
                "Retrying stream in " + std::to_string(delay.count()) + "ms (attempt " +
                    std::to_string(attempt) + ")",
                contentId, pid);

            if (!upstreamContext->sleepFor(delay)) {
                endRelay(session, broadcaster, upstreamContext->err());
                return;
            }

            if (metrics_) {
                metrics_->recordUpstreamReconnection(contentId);
            }
            auto restarted = engine_->startStream(*upstreamContext, contentId, pid);
            if (restarted.isError()) {
                if (upstreamContext->isDone()) {
                    endRelay(session, broadcaster, upstreamContext->err());
                    return;
                }
                lastError = restarted.error();
                if (metrics_) {
                    metrics_->recordUpstreamError(contentId, core::upstream_error::kRestartFailed);
                }
                log(core::LogLevelConfig::Warning, "Stream restart failed", contentId, pid, &restarted.error());
                continue;
            }
            session->updateStreamUrl(restarted.value());
        }

        auto relayed = engine_->streamContent(
            *upstreamContext, session->streamUrl(), *broadcaster, contentId, pid, config_.writeTimeout);

        if (relayed.isSuccess()) {
            log(core::LogLevelConfig::Info, "Upstream stream ended", contentId, pid);
            endRelay(session, broadcaster, std::nullopt);
            return;
        }

        // Cancellation means the last client left or the proxy is stopping.
        if (upstreamContext->isDone()) {
            endRelay(session, broadcaster, upstreamContext->err());
            return;
        }

        lastError = relayed.error();
        if (metrics_) {
            metrics_->recordUpstreamError(contentId, core::upstream_error::kConnectionLost);
        }
        log(core::LogLevelConfig::Warning,
            "Stream content error on attempt " + std::to_string(attempt),
            contentId, pid, &relayed.error());
    }

    core::Error exhausted(
        core::ErrorCode::ReconnectExhausted,
        "stream failed after " + std::to_string(maxAttempts) + " attempts: " +
            (lastError ? lastError->message : std::string("unknown error")),
        contentId);
    if (metrics_) {
        metrics_->recordUpstreamError(contentId, core::upstream_error::kReconnectExhausted);
    }
    log(core::LogLevelConfig::Error, "Giving up on stream", contentId, pid, &exhausted);
    endRelay(session, broadcaster, exhausted);
}

void ProxyService::endRelay(
    const std::shared_ptr<StreamSession>& session,
    const std::shared_ptr<Broadcaster>& broadcaster,
    const std::optional<core::Error>& terminalError)
{
    session->markEnded(terminalError);
    broadcaster->close(terminalError);
}

void ProxyService::cleanupClient(const core::ContentId& contentId, const core::ClientId& pid) {
    log(core::LogLevelConfig::Info, "Client disconnected", contentId, pid);

    auto removal = registry_->removeClient(contentId, pid);
    if (!removal.found || !removal.wasLast) {
        return;
    }

    auto session = removal.session;
    session->markClosed();

    if (auto upstreamContext = session->upstreamContext()) {
        upstreamContext->cancel();
    }
    if (auto broadcaster = session->broadcaster()) {
        broadcaster->close();
    }

    if (!session->wasStarted()) {
        return;
    }

    // The stop is issued for the departing client's PID.
    log(core::LogLevelConfig::Info, "Last client disconnected, stopping stream", contentId, pid);

    core::Context stopContext(core::SteadyClock::now() + config_.stopTimeout);
    auto stopped = engine_->stopStream(stopContext, pid);
    if (stopped.isError()) {
        log(core::LogLevelConfig::Error, "Failed to stop stream", contentId, pid, &stopped.error());
    }
}

// =============================================================================
// Relay Thread Management
// =============================================================================

void ProxyService::reapFinishedRelays() {
    // Caller holds relaysMutex_.
    for (auto it = relays_.begin(); it != relays_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = relays_.erase(it);
        } else {
            ++it;
        }
    }
}

void ProxyService::shutdown() {
    std::vector<RelayThread> relays;
    {
        std::lock_guard<std::mutex> lock(relaysMutex_);
        shuttingDown_ = true;
        relays.swap(relays_);
    }

    for (auto& relay : relays) {
        relay.context->cancel();
    }
    for (auto& relay : relays) {
        if (relay.thread.joinable()) {
            relay.thread.join();
        }
    }
}

size_t ProxyService::activeRelayCount() const {
    std::lock_guard<std::mutex> lock(relaysMutex_);
    return static_cast<size_t>(std::count_if(relays_.begin(), relays_.end(),
        [](const RelayThread& relay) { return !relay.done->load(); }));
}

// =============================================================================
// Logging
// =============================================================================

void ProxyService::log(
    core::LogLevelConfig level,
    const std::string& message,
    const core::ContentId& contentId,
    const core::ClientId& clientId,
    const core::Error* error) const
{
    if (!logger_ || !logger_->isEnabled(level)) {
        return;
    }

    core::LogContext ctx;
    ctx.contentId = contentId;
    ctx.clientId = clientId;
    if (error) {
        ctx.errorCode = static_cast<int>(error->code);
        ctx.with("error", error->message);
    }
    logger_->logWithContext(level, message, ctx, kCategory);
}

} // namespace streaming
} // namespace aceproxy
