// AceProxy - AceStream Multiplexing Proxy
// Session Registry - Content id to live session index
//
// Responsibilities:
// - Create a session on a content id's first client and delete it on its last
// - Guarantee at most one session per content id
// - Provide snapshots of active sessions for monitoring
// - Emit lifecycle events outside the registry lock

#ifndef ACEPROXY_STREAMING_SESSION_REGISTRY_HPP
#define ACEPROXY_STREAMING_SESSION_REGISTRY_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "aceproxy/core/types.hpp"
#include "aceproxy/streaming/stream_session.hpp"

namespace aceproxy {
namespace streaming {

// =============================================================================
// Snapshots and Events
// =============================================================================

/**
 * @brief Point-in-time view of one session.
 */
struct SessionSnapshot {
    core::ContentId contentId;
    size_t clientCount = 0;
    std::vector<core::ClientId> clientIds;
};

/**
 * @brief Outcome of removing a client.
 */
struct RemovalResult {
    bool found = false;                         ///< Client was attached
    bool wasLast = false;                       ///< Session was deleted
    std::shared_ptr<StreamSession> session;     ///< Session the client belonged to
};

/**
 * @brief Session lifecycle event.
 */
struct SessionEvent {
    enum class Type {
        SessionCreated,
        SessionRemoved,
        ClientJoined,
        ClientLeft
    };

    Type type;
    core::ContentId contentId;
    core::ClientId clientId;
};

using SessionEventCallback = std::function<void(const SessionEvent&)>;

// =============================================================================
// Session Registry
// =============================================================================

/**
 * @brief Index of live sessions keyed by content id.
 *
 * The registry mutex protects only the map. Lock order is registry then
 * session; a session never calls back into the registry.
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Event callbacks run without any registry lock held
 */
class SessionRegistry {
public:
    SessionRegistry() = default;
    ~SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Attach a client, creating the session if absent.
     *
     * @return The session and true if this call created it
     */
    std::pair<std::shared_ptr<StreamSession>, bool> addClient(
        const core::ContentId& contentId,
        const core::ClientId& clientId
    );

    /**
     * @brief Detach a client, deleting the session when it was the last.
     */
    RemovalResult removeClient(
        const core::ContentId& contentId,
        const core::ClientId& clientId
    );

    std::shared_ptr<StreamSession> find(const core::ContentId& contentId) const;

    std::vector<SessionSnapshot> getAllSessions() const;

    size_t sessionCount() const;

    void setEventCallback(SessionEventCallback callback);

private:
    void emitEvent(const SessionEvent& event);

    mutable std::shared_mutex sessionsMutex_;
    std::unordered_map<core::ContentId, std::shared_ptr<StreamSession>> sessions_;

    std::mutex callbackMutex_;
    SessionEventCallback eventCallback_;
};

} // namespace streaming
} // namespace aceproxy

#endif // ACEPROXY_STREAMING_SESSION_REGISTRY_HPP
