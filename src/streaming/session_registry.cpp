// AceProxy - AceStream Multiplexing Proxy
// Session Registry Implementation
//
// Thread-safe implementation of the session index with:
// - Concurrent lookups using shared_mutex (read/write locking)
// - Create-on-first-client and delete-on-last-client under one write lock
// - Lifecycle event emission after the lock is released

#include "aceproxy/streaming/session_registry.hpp"

namespace aceproxy {
namespace streaming {

// =============================================================================
// Client Attachment
// =============================================================================

std::pair<std::shared_ptr<StreamSession>, bool> SessionRegistry::addClient(
    const core::ContentId& contentId,
    const core::ClientId& clientId)
{
    std::shared_ptr<StreamSession> session;
    bool created = false;

    {
        std::unique_lock<std::shared_mutex> lock(sessionsMutex_);

        auto it = sessions_.find(contentId);
        if (it == sessions_.end()) {
            session = std::make_shared<StreamSession>(contentId);
            sessions_.emplace(contentId, session);
            created = true;
        } else {
            session = it->second;
        }

        // Attached before the lock is released so a concurrent removal of
        // another client cannot observe a zero count and delete the session.
        session->addClient(clientId);
    }

    if (created) {
        emitEvent(SessionEvent{SessionEvent::Type::SessionCreated, contentId, clientId});
    }
    emitEvent(SessionEvent{SessionEvent::Type::ClientJoined, contentId, clientId});

    return {session, created};
}

RemovalResult SessionRegistry::removeClient(
    const core::ContentId& contentId,
    const core::ClientId& clientId)
{
    RemovalResult result;

    {
        std::unique_lock<std::shared_mutex> lock(sessionsMutex_);

        auto it = sessions_.find(contentId);
        if (it == sessions_.end()) {
            return result;
        }

        result.found = true;
        result.session = it->second;

        if (it->second->removeClient(clientId) == 0) {
            sessions_.erase(it);
            result.wasLast = true;
        }
    }

    emitEvent(SessionEvent{SessionEvent::Type::ClientLeft, contentId, clientId});
    if (result.wasLast) {
        emitEvent(SessionEvent{SessionEvent::Type::SessionRemoved, contentId, clientId});
    }

    return result;
}

// =============================================================================
// Lookup
// =============================================================================

std::shared_ptr<StreamSession> SessionRegistry::find(const core::ContentId& contentId) const {
    std::shared_lock<std::shared_mutex> lock(sessionsMutex_);

    auto it = sessions_.find(contentId);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<SessionSnapshot> SessionRegistry::getAllSessions() const {
    std::vector<std::shared_ptr<StreamSession>> sessions;
    {
        std::shared_lock<std::shared_mutex> lock(sessionsMutex_);
        sessions.reserve(sessions_.size());
        for (const auto& entry : sessions_) {
            sessions.push_back(entry.second);
        }
    }

    std::vector<SessionSnapshot> snapshots;
    snapshots.reserve(sessions.size());
    for (const auto& session : sessions) {
        SessionSnapshot snapshot;
        snapshot.contentId = session->contentId();
        snapshot.clientIds = session->clientIds();
        snapshot.clientCount = snapshot.clientIds.size();
        snapshots.push_back(std::move(snapshot));
    }
    return snapshots;
}

size_t SessionRegistry::sessionCount() const {
    std::shared_lock<std::shared_mutex> lock(sessionsMutex_);
    return sessions_.size();
}

// =============================================================================
// Event Handling
// =============================================================================

void SessionRegistry::setEventCallback(SessionEventCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    eventCallback_ = std::move(callback);
}

void SessionRegistry::emitEvent(const SessionEvent& event) {
    SessionEventCallback callback;

    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = eventCallback_;
    }

    if (callback) {
        callback(event);
    }
}

} // namespace streaming
} // namespace aceproxy
