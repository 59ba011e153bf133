// AceProxy - AceStream Multiplexing Proxy
// Stream Session - Per-content upstream state shared by attached clients
//
// Responsibilities:
// - Track the clients attached to one content id
// - Track readiness of the upstream connection and its playback URL
// - Let joining clients wait for readiness without polling
// - Hold the broadcaster and upstream context of the live relay

#ifndef ACEPROXY_STREAMING_STREAM_SESSION_HPP
#define ACEPROXY_STREAMING_STREAM_SESSION_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "aceproxy/core/context.hpp"
#include "aceproxy/core/result.hpp"
#include "aceproxy/core/types.hpp"

namespace aceproxy {
namespace streaming {

class Broadcaster;

// =============================================================================
// Session State Enumeration
// =============================================================================

/**
 * @brief Upstream lifecycle of a session.
 *
 * Starting -> Ready -> Closed, with Error as the terminal outcome of a
 * failed start. A session also closes when its relay ends while clients
 * are still draining.
 */
enum class SessionState {
    Starting,   ///< Created, engine start in flight
    Ready,      ///< Playback URL known, relay running
    Error,      ///< Engine start failed (terminal)
    Closed      ///< Last client left or the relay ended (terminal)
};

inline const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Starting: return "Starting";
        case SessionState::Ready:    return "Ready";
        case SessionState::Error:    return "Error";
        case SessionState::Closed:   return "Closed";
        default:                     return "Unknown";
    }
}

// =============================================================================
// Stream Session
// =============================================================================

/**
 * @brief Shared state for one content id.
 *
 * All fields are guarded by the session's own mutex. The registry lock is
 * never taken while that mutex is held.
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
class StreamSession {
public:
    explicit StreamSession(core::ContentId contentId);

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    const core::ContentId& contentId() const { return contentId_; }

    // -------------------------------------------------------------------------
    // Clients
    // -------------------------------------------------------------------------

    /**
     * @return false if the client was already attached
     */
    bool addClient(const core::ClientId& clientId);

    /**
     * @return Number of clients left after removal
     */
    size_t removeClient(const core::ClientId& clientId);

    size_t clientCount() const;
    std::vector<core::ClientId> clientIds() const;

    // -------------------------------------------------------------------------
    // Upstream State
    // -------------------------------------------------------------------------

    /**
     * @brief Starting -> Ready. Wakes every waiter.
     *
     * @param streamUrl Playback URL returned by the engine
     * @param anchorPid PID the engine start was issued with
     */
    void markReady(const std::string& streamUrl, const core::ClientId& anchorPid);

    /**
     * @brief Starting -> Error. Wakes every waiter with the error.
     */
    void markFailed(const core::Error& error);

    /**
     * @brief Any state -> Closed. Waiters still blocked see StreamNotActive.
     */
    void markClosed();

    /**
     * @brief Ready -> Closed once the relay has closed the broadcaster.
     *
     * Clients joining afterwards fail with @p terminalError, or with
     * StreamNotActive when the upstream ended normally.
     */
    void markEnded(const std::optional<core::Error>& terminalError);

    /**
     * @brief Replace the playback URL after an upstream restart.
     */
    void updateStreamUrl(const std::string& streamUrl);

    /**
     * @brief Block until the session is Ready.
     *
     * @return success once Ready; the recorded error if the start failed or
     *         the relay gave up; Timeout if @p timeout elapses; the context
     *         error if @p ctx finishes first; StreamNotActive if the session
     *         closed.
     */
    core::Result<void, core::Error> waitUntilReady(
        core::Context& ctx,
        std::chrono::milliseconds timeout
    );

    SessionState state() const;
    bool isReady() const;
    std::string streamUrl() const;
    std::optional<core::Error> lastError() const;

    /**
     * @brief PID the engine knows this session by, empty before Ready.
     */
    core::ClientId anchorPid() const;

    /**
     * @brief True once the engine start succeeded at least once.
     */
    bool wasStarted() const;

    // -------------------------------------------------------------------------
    // Relay
    // -------------------------------------------------------------------------

    void attachUpstream(
        std::shared_ptr<Broadcaster> broadcaster,
        std::shared_ptr<core::Context> upstreamContext
    );
    std::shared_ptr<Broadcaster> broadcaster() const;
    std::shared_ptr<core::Context> upstreamContext() const;

private:
    const core::ContentId contentId_;

    mutable std::mutex mutex_;
    std::condition_variable readyCv_;
    std::set<core::ClientId> clients_;
    SessionState state_ = SessionState::Starting;
    std::string streamUrl_;
    core::ClientId anchorPid_;
    std::optional<core::Error> lastError_;
    bool started_ = false;

    std::shared_ptr<Broadcaster> broadcaster_;
    std::shared_ptr<core::Context> upstreamContext_;
};

} // namespace streaming
} // namespace aceproxy

#endif // ACEPROXY_STREAMING_STREAM_SESSION_HPP
