// AceProxy - AceStream Multiplexing Proxy
// Broadcaster Implementation

#include "aceproxy/streaming/broadcaster.hpp"
#include "aceproxy/streaming/timeout_writer.hpp"

#include <vector>

namespace aceproxy {
namespace streaming {

namespace {
const char* const kCategory = "Broadcaster";
}

// =============================================================================
// Constructor / Destructor
// =============================================================================

Broadcaster::Broadcaster(size_t clientBufferChunks, std::shared_ptr<core::StructuredLogger> logger)
    : clientBufferChunks_(clientBufferChunks == 0 ? DEFAULT_CLIENT_BUFFER_CHUNKS : clientBufferChunks)
    , logger_(std::move(logger)) {
}

Broadcaster::~Broadcaster() {
    close();
}

// =============================================================================
// Upstream Side
// =============================================================================

core::Result<size_t, core::Error> Broadcaster::write(const uint8_t* data, size_t size) {
    if (size == 0) {
        return core::Result<size_t, core::Error>::success(0);
    }

    // The relay reuses its read buffer, so take one private copy for all clients.
    auto chunk = std::make_shared<const core::Chunk>(data, data + size);

    std::vector<core::ClientId> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return core::Result<size_t, core::Error>::success(size);
        }

        for (auto it = clients_.begin(); it != clients_.end();) {
            if (it->second->tryPush(chunk)) {
                ++it;
                continue;
            }
            it->second->close();
            evicted.push_back(it->first);
            it = clients_.erase(it);
        }
    }

    chunksWritten_.fetch_add(1);
    bytesWritten_.fetch_add(size);

    if (!evicted.empty()) {
        clientsEvicted_.fetch_add(evicted.size());
        if (logger_) {
            for (const auto& clientId : evicted) {
                core::LogContext ctx;
                ctx.clientId = clientId;
                logger_->logWithContext(core::LogLevelConfig::Warning,
                                        "Evicted slow client: buffer full", ctx, kCategory);
            }
        }
    }

    return core::Result<size_t, core::Error>::success(size);
}

void Broadcaster::close(std::optional<core::Error> terminalError) {
    std::vector<std::shared_ptr<ClientBuffer>> buffers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        terminalError_ = std::move(terminalError);
        // Entries stay until their subscriber detaches so a pre-attached
        // client can still drain what it was sent.
        for (auto& entry : clients_) {
            buffers.push_back(entry.second);
        }
    }

    for (auto& buffer : buffers) {
        buffer->close();
    }
}

// =============================================================================
// Client Side
// =============================================================================

void Broadcaster::addClient(const core::ClientId& clientId) {
    bool alreadyClosed = false;
    attach(clientId, alreadyClosed);
}

core::Result<void, core::Error> Broadcaster::subscribe(
    core::Context& ctx,
    const core::ClientId& clientId,
    IStreamWriter& destination,
    std::chrono::milliseconds writeTimeout)
{
    bool alreadyClosed = false;
    auto buffer = attach(clientId, alreadyClosed);
    if (alreadyClosed) {
        auto terminal = terminalResult();
        if (terminal.isError()) {
            return terminal;
        }
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::StreamNotActive, "stream already ended"));
    }

    TimeoutWriter writer(destination, writeTimeout);
    core::Result<void, core::Error> outcome = core::Result<void, core::Error>::success();

    while (true) {
        SharedChunk chunk;
        auto status = buffer->pop(ctx, chunk);

        if (status == ClientBuffer::PopStatus::Cancelled) {
            outcome = core::Result<void, core::Error>::error(ctx.err());
            break;
        }
        if (status == ClientBuffer::PopStatus::Closed) {
            outcome = terminalResult();
            break;
        }

        auto written = writer.write(chunk->data(), chunk->size());
        if (written.isError()) {
            outcome = core::Result<void, core::Error>::error(written.error());
            break;
        }

        auto flushed = writer.flush();
        if (flushed.isError()) {
            outcome = flushed;
            break;
        }
    }

    detach(clientId, buffer);

    if (logger_ && logger_->isEnabled(core::LogLevelConfig::Debug)) {
        core::LogContext logCtx;
        logCtx.clientId = clientId;
        logCtx.with("bytes_written", std::to_string(writer.bytesWritten()));
        logger_->logWithContext(core::LogLevelConfig::Debug, "Subscriber detached", logCtx, kCategory);
    }

    return outcome;
}

std::shared_ptr<ClientBuffer> Broadcaster::attach(const core::ClientId& clientId, bool& alreadyClosed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(clientId);
    if (it != clients_.end()) {
        return it->second;
    }
    if (closed_) {
        alreadyClosed = true;
        return nullptr;
    }

    auto buffer = std::make_shared<ClientBuffer>(clientBufferChunks_);
    clients_.emplace(clientId, buffer);
    return buffer;
}

void Broadcaster::detach(const core::ClientId& clientId, const std::shared_ptr<ClientBuffer>& buffer) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(clientId);
        if (it != clients_.end() && it->second == buffer) {
            clients_.erase(it);
        }
    }
    buffer->close();
}

core::Result<void, core::Error> Broadcaster::terminalResult() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminalError_) {
        return core::Result<void, core::Error>::error(*terminalError_);
    }
    return core::Result<void, core::Error>::success();
}

// =============================================================================
// Queries
// =============================================================================

bool Broadcaster::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::optional<core::Error> Broadcaster::terminalError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminalError_;
}

size_t Broadcaster::clientCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

BroadcastStats Broadcaster::getStats() const {
    BroadcastStats stats;
    stats.chunksWritten = chunksWritten_.load();
    stats.bytesWritten = bytesWritten_.load();
    stats.clientsEvicted = clientsEvicted_.load();
    stats.clientCount = clientCount();
    return stats;
}

} // namespace streaming
} // namespace aceproxy
