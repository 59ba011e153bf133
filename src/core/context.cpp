// AceProxy - AceStream Multiplexing Proxy
// Request Context Implementation

#include "aceproxy/core/context.hpp"

#include <algorithm>

namespace aceproxy {
namespace core {

Context::Context() = default;

Context::Context(Clock::time_point deadline)
    : deadline_(deadline) {
}

Context::Context(Context* parent, std::optional<Clock::time_point> deadline)
    : deadline_(deadline)
    , parent_(parent) {
}

Context::~Context() {
    if (parent_ != nullptr && parentListenerId_ != 0) {
        parent_->removeCancelListener(parentListenerId_);
    }
}

std::unique_ptr<Context> Context::withCancel(Context& parent) {
    std::unique_ptr<Context> child(new Context(&parent, parent.deadline()));
    Context* raw = child.get();
    child->parentListenerId_ = parent.addCancelListener([raw]() { raw->cancel(); });
    return child;
}

std::unique_ptr<Context> Context::withTimeout(Context& parent, Clock::duration timeout) {
    auto target = Clock::now() + timeout;
    auto parentDeadline = parent.deadline();
    if (parentDeadline && *parentDeadline < target) {
        target = *parentDeadline;
    }

    std::unique_ptr<Context> child(new Context(&parent, target));
    Context* raw = child.get();
    child->parentListenerId_ = parent.addCancelListener([raw]() { raw->cancel(); });
    return child;
}

void Context::cancel() {
    std::lock_guard<std::mutex> dispatchLock(dispatchMutex_);

    std::map<ListenerId, Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return;
        }
        cancelled_ = true;
        listeners.swap(listeners_);
    }
    cv_.notify_all();

    for (auto& entry : listeners) {
        if (entry.second) {
            entry.second();
        }
    }
}

bool Context::isDone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_ || deadlinePassed();
}

bool Context::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

Error Context::err() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        return Error(ErrorCode::Cancelled, "context cancelled");
    }
    if (deadlinePassed()) {
        return Error(ErrorCode::Timeout, "context deadline exceeded");
    }
    return Error(ErrorCode::Success);
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadline_;
}

bool Context::sleepFor(Clock::duration duration) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto target = Clock::now() + duration;
    bool cappedByDeadline = false;
    if (deadline_ && *deadline_ < target) {
        target = *deadline_;
        cappedByDeadline = true;
    }

    bool cancelled = cv_.wait_until(lock, target, [this]() { return cancelled_; });
    return !cancelled && !cappedByDeadline;
}

Context::ListenerId Context::addCancelListener(Listener listener) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            ListenerId id = nextListenerId_++;
            listeners_.emplace(id, std::move(listener));
            return id;
        }
    }

    if (listener) {
        listener();
    }
    return 0;
}

void Context::removeCancelListener(ListenerId id) {
    std::lock_guard<std::mutex> dispatchLock(dispatchMutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

bool Context::deadlinePassed() const {
    return deadline_ && Clock::now() >= *deadline_;
}

} // namespace core
} // namespace aceproxy
