// AceProxy - AceStream Multiplexing Proxy
// Stream Session Implementation

#include "aceproxy/streaming/stream_session.hpp"

namespace aceproxy {
namespace streaming {

StreamSession::StreamSession(core::ContentId contentId)
    : contentId_(std::move(contentId)) {
}

// =============================================================================
// Clients
// =============================================================================

bool StreamSession::addClient(const core::ClientId& clientId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.insert(clientId).second;
}

size_t StreamSession::removeClient(const core::ClientId& clientId) {
    std::lock_guard<std::mutex> lock(mutex_);
    clients_.erase(clientId);
    return clients_.size();
}

size_t StreamSession::clientCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

std::vector<core::ClientId> StreamSession::clientIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<core::ClientId>(clients_.begin(), clients_.end());
}

// =============================================================================
// Upstream State
// =============================================================================

void StreamSession::markReady(const std::string& streamUrl, const core::ClientId& anchorPid) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Starting) {
            return;
        }
        state_ = SessionState::Ready;
        streamUrl_ = streamUrl;
        anchorPid_ = anchorPid;
        started_ = true;
    }
    readyCv_.notify_all();
}

void StreamSession::markFailed(const core::Error& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Closed) {
            return;
        }
        state_ = SessionState::Error;
        lastError_ = error;
    }
    readyCv_.notify_all();
}

void StreamSession::markClosed() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Closed;
    }
    readyCv_.notify_all();
}

void StreamSession::markEnded(const std::optional<core::Error>& terminalError) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Ready) {
            return;
        }
        state_ = SessionState::Closed;
        if (terminalError) {
            lastError_ = terminalError;
        }
    }
    readyCv_.notify_all();
}

void StreamSession::updateStreamUrl(const std::string& streamUrl) {
    std::lock_guard<std::mutex> lock(mutex_);
    streamUrl_ = streamUrl;
}

core::Result<void, core::Error> StreamSession::waitUntilReady(
    core::Context& ctx,
    std::chrono::milliseconds timeout)
{
    // Registered before locking: the listener takes mutex_ itself.
    core::CancelListenerGuard guard(ctx, [this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        readyCv_.notify_all();
    });

    const auto deadline = core::SteadyClock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        switch (state_) {
            case SessionState::Ready:
                return core::Result<void, core::Error>::success();
            case SessionState::Error:
                return core::Result<void, core::Error>::error(
                    lastError_ ? *lastError_
                               : core::Error(core::ErrorCode::EngineUnavailable, "stream start failed"));
            case SessionState::Closed:
                if (lastError_) {
                    return core::Result<void, core::Error>::error(*lastError_);
                }
                return core::Result<void, core::Error>::error(
                    core::Error(core::ErrorCode::StreamNotActive, "stream session closed", contentId_));
            case SessionState::Starting:
                break;
        }

        if (ctx.isDone()) {
            return core::Result<void, core::Error>::error(ctx.err());
        }

        auto waitUntil = deadline;
        auto ctxDeadline = ctx.deadline();
        if (ctxDeadline && *ctxDeadline < waitUntil) {
            waitUntil = *ctxDeadline;
        }

        if (readyCv_.wait_until(lock, waitUntil) == std::cv_status::timeout &&
            state_ == SessionState::Starting &&
            core::SteadyClock::now() >= deadline) {
            return core::Result<void, core::Error>::error(
                core::Error(core::ErrorCode::Timeout, "timeout waiting for stream to be ready", contentId_));
        }
    }
}

SessionState StreamSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool StreamSession::isReady() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::Ready;
}

std::string StreamSession::streamUrl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streamUrl_;
}

std::optional<core::Error> StreamSession::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

core::ClientId StreamSession::anchorPid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return anchorPid_;
}

bool StreamSession::wasStarted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

// =============================================================================
// Relay
// =============================================================================

void StreamSession::attachUpstream(
    std::shared_ptr<Broadcaster> broadcaster,
    std::shared_ptr<core::Context> upstreamContext)
{
    std::lock_guard<std::mutex> lock(mutex_);
    broadcaster_ = std::move(broadcaster);
    upstreamContext_ = std::move(upstreamContext);
}

std::shared_ptr<Broadcaster> StreamSession::broadcaster() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return broadcaster_;
}

std::shared_ptr<core::Context> StreamSession::upstreamContext() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return upstreamContext_;
}

} // namespace streaming
} // namespace aceproxy
