// AceProxy - AceStream Multiplexing Proxy
// Client Buffer - Bounded per-client chunk queue
//
// Responsibilities:
// - Hold chunks for one client independently of every other client
// - Refuse (never block) pushes when full so the broadcaster can evict
// - Let the consumer drain what was queued before observing close
// - Wake a blocked consumer on close or context cancellation

#ifndef ACEPROXY_STREAMING_CLIENT_BUFFER_HPP
#define ACEPROXY_STREAMING_CLIENT_BUFFER_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

#include "aceproxy/core/context.hpp"
#include "aceproxy/core/types.hpp"

namespace aceproxy {
namespace streaming {

using SharedChunk = std::shared_ptr<const core::Chunk>;

/**
 * @brief Bounded FIFO of shared chunks with close semantics.
 *
 * Chunks are shared immutable buffers so one upstream read is copied
 * once no matter how many clients receive it.
 */
class ClientBuffer {
public:
    enum class PopStatus {
        Chunk,      ///< A chunk was dequeued
        Closed,     ///< Buffer closed and fully drained
        Cancelled   ///< Context finished before a chunk arrived
    };

    explicit ClientBuffer(size_t capacity);

    ClientBuffer(const ClientBuffer&) = delete;
    ClientBuffer& operator=(const ClientBuffer&) = delete;

    /**
     * @brief Enqueue without blocking.
     *
     * @return false if the buffer is full or closed
     */
    bool tryPush(SharedChunk chunk);

    /**
     * @brief Block until a chunk is available, the buffer is closed and
     *        drained, or the context finishes.
     */
    PopStatus pop(core::Context& ctx, SharedChunk& out);

    /**
     * @brief Close the buffer. Idempotent.
     */
    void close();

    bool isClosed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SharedChunk> chunks_;
    bool closed_ = false;
};

} // namespace streaming
} // namespace aceproxy

#endif // ACEPROXY_STREAMING_CLIENT_BUFFER_HPP
