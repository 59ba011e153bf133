// AceProxy - AceStream Multiplexing Proxy
// Proxy Service - Multiplexes one engine connection per content id
//
// Responsibilities:
// - Start the engine stream on a content id's first client only
// - Let later clients join the running session and share its bytes
// - Relay upstream bytes into the session broadcaster with reconnection
// - Stop the engine stream when the last client leaves
// - Feed session gauges and upstream failure counters to the metrics collector

#ifndef ACEPROXY_STREAMING_PROXY_SERVICE_HPP
#define ACEPROXY_STREAMING_PROXY_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "aceproxy/core/context.hpp"
#include "aceproxy/core/metrics_collector.hpp"
#include "aceproxy/core/result.hpp"
#include "aceproxy/core/structured_logger.hpp"
#include "aceproxy/core/types.hpp"
#include "aceproxy/engine/acestream_engine.hpp"
#include "aceproxy/streaming/broadcaster.hpp"
#include "aceproxy/streaming/client_id_generator.hpp"
#include "aceproxy/streaming/session_registry.hpp"
#include "aceproxy/streaming/stream_writer.hpp"

namespace aceproxy {
namespace streaming {

/**
 * @brief Tunables of the proxy service.
 */
struct ProxyServiceConfig {
    std::chrono::milliseconds writeTimeout{10000};      ///< Per-write client deadline
    std::chrono::milliseconds readyTimeout{30000};      ///< Joining client wait bound
    uint32_t maxAttempts = 3;                           ///< Total upstream relay attempts
    std::chrono::milliseconds retryBaseDelay{2000};     ///< First backoff, doubled per retry
    std::chrono::milliseconds stopTimeout{5000};        ///< Bound on the engine stop call
    size_t clientBufferChunks = DEFAULT_CLIENT_BUFFER_CHUNKS;
};

/**
 * @brief Public entry point for client stream requests.
 *
 * Each request runs on its caller's thread and blocks in streamToClient()
 * until the stream ends. A single relay thread per session reads the
 * engine and feeds the session's Broadcaster.
 *
 * When given a MetricsCollector the service installs the registry's event
 * callback to keep the stream and client gauges current.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 */
class ProxyService {
public:
    ProxyService(
        std::shared_ptr<engine::IAceStreamEngine> engine,
        std::shared_ptr<SessionRegistry> registry,
        std::shared_ptr<core::StructuredLogger> logger = nullptr,
        ProxyServiceConfig config = ProxyServiceConfig{},
        std::shared_ptr<core::MetricsCollector> metrics = nullptr
    );
    ~ProxyService();

    ProxyService(const ProxyService&) = delete;
    ProxyService& operator=(const ProxyService&) = delete;

    /**
     * @brief Serve one client until the stream ends.
     *
     * @return success when the upstream ended normally; InvalidContentId for
     *         an empty id; EngineUnavailable when the engine start failed;
     *         Timeout when the session never became ready; the context error
     *         on cancellation; the write error of @p destination;
     *         ReconnectExhausted once the relay gave up; or StreamNotActive
     *         when joining a session whose upstream already ended.
     */
    core::Result<void, core::Error> streamToClient(
        core::Context& ctx,
        const core::ContentId& contentId,
        IStreamWriter& destination
    );

    std::vector<SessionSnapshot> getActiveStreams() const;

    /**
     * @brief Cancel every relay and wait for the relay threads. Idempotent.
     *
     * Subsequent stream requests fail with EngineUnavailable.
     */
    void shutdown();

    size_t activeRelayCount() const;

    const ProxyServiceConfig& config() const { return config_; }

private:
    struct RelayThread {
        std::thread thread;
        std::shared_ptr<core::Context> context;
        std::shared_ptr<std::atomic<bool>> done;
    };

    core::Result<void, core::Error> startUpstream(
        core::Context& ctx,
        const std::shared_ptr<StreamSession>& session,
        const core::ClientId& pid
    );

    void relayLoop(
        std::shared_ptr<StreamSession> session,
        std::shared_ptr<Broadcaster> broadcaster,
        std::shared_ptr<core::Context> upstreamContext,
        core::ClientId pid
    );

    /**
     * @brief Close the broadcaster and move the session out of Ready so
     *        later joiners are turned away.
     */
    void endRelay(
        const std::shared_ptr<StreamSession>& session,
        const std::shared_ptr<Broadcaster>& broadcaster,
        const std::optional<core::Error>& terminalError
    );

    void cleanupClient(const core::ContentId& contentId, const core::ClientId& pid);

    void reapFinishedRelays();

    void log(core::LogLevelConfig level, const std::string& message,
             const core::ContentId& contentId, const core::ClientId& clientId,
             const core::Error* error = nullptr) const;

    std::shared_ptr<engine::IAceStreamEngine> engine_;
    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<core::StructuredLogger> logger_;
    const ProxyServiceConfig config_;
    std::shared_ptr<core::MetricsCollector> metrics_;

    mutable std::mutex relaysMutex_;
    std::vector<RelayThread> relays_;
    bool shuttingDown_ = false;
};

} // namespace streaming
} // namespace aceproxy

#endif // ACEPROXY_STREAMING_PROXY_SERVICE_HPP
