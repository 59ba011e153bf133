// AceProxy - AceStream Multiplexing Proxy
// Broadcaster - Fans one upstream byte stream out to many clients
//
// Responsibilities:
// - Copy each upstream chunk once and enqueue it for every attached client
// - Evict clients whose buffers are full instead of stalling the upstream
// - Deliver chunks to each client strictly in write order
// - Propagate the upstream's terminal error to every subscriber on close

#ifndef ACEPROXY_STREAMING_BROADCASTER_HPP
#define ACEPROXY_STREAMING_BROADCASTER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "aceproxy/core/context.hpp"
#include "aceproxy/core/structured_logger.hpp"
#include "aceproxy/core/types.hpp"
#include "aceproxy/streaming/client_buffer.hpp"
#include "aceproxy/streaming/stream_writer.hpp"

namespace aceproxy {
namespace streaming {

/// Default per-client queue depth, in chunks.
constexpr size_t DEFAULT_CLIENT_BUFFER_CHUNKS = 128;

/**
 * @brief Delivery statistics for one broadcaster.
 */
struct BroadcastStats {
    uint64_t chunksWritten = 0;     ///< Upstream chunks accepted
    uint64_t bytesWritten = 0;      ///< Upstream bytes accepted
    uint64_t clientsEvicted = 0;    ///< Clients dropped for a full buffer
    size_t clientCount = 0;         ///< Currently attached clients
};

/**
 * @brief One-to-many fan-out with slow-client eviction.
 *
 * The upstream relay writes into the Broadcaster as an IStreamWriter; each
 * client drains its own ClientBuffer from subscribe(). The client map is
 * guarded by a single mutex that is never held across a client write or a
 * buffer wait.
 *
 * Thread Safety:
 * - All methods are thread-safe
 */
class Broadcaster : public IStreamWriter {
public:
    explicit Broadcaster(
        size_t clientBufferChunks = DEFAULT_CLIENT_BUFFER_CHUNKS,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );
    ~Broadcaster() override;

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    /**
     * @brief Fan a chunk out to every attached client.
     *
     * Never blocks on a client and always reports the full size as
     * written; delivery to lagging clients is best effort.
     */
    core::Result<size_t, core::Error> write(const uint8_t* data, size_t size) override;

    /**
     * @brief Pre-register a client buffer.
     *
     * Lets the session creator attach before the upstream relay starts so
     * it observes the stream from the first byte. subscribe() reuses the
     * buffer, and drains whatever was queued even after close(). No-op once
     * closed.
     */
    void addClient(const core::ClientId& clientId);

    /**
     * @brief Deliver chunks to a destination until the stream finishes.
     *
     * @return success when the upstream ended normally, the terminal error
     *         when it failed, the context error on cancellation, or the
     *         destination's write error. A client that was not attached
     *         before close() gets the terminal error or StreamNotActive.
     *         The client is always detached on return.
     */
    core::Result<void, core::Error> subscribe(
        core::Context& ctx,
        const core::ClientId& clientId,
        IStreamWriter& destination,
        std::chrono::milliseconds writeTimeout
    );

    /**
     * @brief Close the broadcaster and every client buffer. Idempotent.
     *
     * @param terminalError Error reported to subscribers, nullopt for a
     *        normal end of stream
     */
    void close(std::optional<core::Error> terminalError = std::nullopt);

    bool isClosed() const;
    std::optional<core::Error> terminalError() const;
    size_t clientCount() const;
    BroadcastStats getStats() const;

private:
    std::shared_ptr<ClientBuffer> attach(const core::ClientId& clientId, bool& alreadyClosed);
    void detach(const core::ClientId& clientId, const std::shared_ptr<ClientBuffer>& buffer);
    core::Result<void, core::Error> terminalResult() const;

    const size_t clientBufferChunks_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<core::ClientId, std::shared_ptr<ClientBuffer>> clients_;
    bool closed_ = false;
    std::optional<core::Error> terminalError_;

    std::atomic<uint64_t> chunksWritten_{0};
    std::atomic<uint64_t> bytesWritten_{0};
    std::atomic<uint64_t> clientsEvicted_{0};
};

} // namespace streaming
} // namespace aceproxy

#endif // ACEPROXY_STREAMING_BROADCASTER_HPP
