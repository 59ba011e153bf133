// AceProxy - AceStream Multiplexing Proxy
// Client Buffer Implementation

#include "aceproxy/streaming/client_buffer.hpp"

namespace aceproxy {
namespace streaming {

ClientBuffer::ClientBuffer(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

bool ClientBuffer::tryPush(SharedChunk chunk) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || chunks_.size() >= capacity_) {
            return false;
        }
        chunks_.push_back(std::move(chunk));
    }
    cv_.notify_one();
    return true;
}

ClientBuffer::PopStatus ClientBuffer::pop(core::Context& ctx, SharedChunk& out) {
    // Registered before taking mutex_ and released after it, see Context.
    core::CancelListenerGuard wake(ctx, [this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    });

    auto deadline = ctx.deadline();
    std::unique_lock<std::mutex> lock(mutex_);

    auto ready = [this, &ctx]() {
        return !chunks_.empty() || closed_ || ctx.isDone();
    };

    if (deadline) {
        cv_.wait_until(lock, *deadline, ready);
    } else {
        cv_.wait(lock, ready);
    }

    if (ctx.isDone()) {
        return PopStatus::Cancelled;
    }
    if (!chunks_.empty()) {
        out = std::move(chunks_.front());
        chunks_.pop_front();
        return PopStatus::Chunk;
    }
    return PopStatus::Closed;
}

void ClientBuffer::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    cv_.notify_all();
}

bool ClientBuffer::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ClientBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

} // namespace streaming
} // namespace aceproxy
