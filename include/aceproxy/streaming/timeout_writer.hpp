// AceProxy - AceStream Multiplexing Proxy
// Timeout Writer - Per-write deadline enforcement for client destinations
//
// Responsibilities:
// - Arm the destination deadline before every write
// - Classify deadline failures as WriteTimeout so slow clients are detectable
// - Keep a running count of bytes actually delivered

#ifndef ACEPROXY_STREAMING_TIMEOUT_WRITER_HPP
#define ACEPROXY_STREAMING_TIMEOUT_WRITER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

#include "aceproxy/streaming/stream_writer.hpp"

namespace aceproxy {
namespace streaming {

/**
 * @brief Wraps a destination with a fixed per-write timeout.
 *
 * write() delivers the whole buffer or fails. On failure bytesWritten()
 * still includes the bytes the destination accepted before the error, and
 * the error context carries the same count.
 */
class TimeoutWriter : public IStreamWriter {
public:
    TimeoutWriter(IStreamWriter& destination, std::chrono::milliseconds timeout);

    core::Result<size_t, core::Error> write(const uint8_t* data, size_t size) override;

    bool supportsDeadline() const override { return false; }

    core::Result<void, core::Error> flush() override;

    uint64_t bytesWritten() const { return bytesWritten_.load(); }

    std::chrono::milliseconds timeout() const { return timeout_; }

    /**
     * @brief True if the error signals an elapsed deadline.
     *
     * Recognizes Timeout and WriteTimeout codes as well as messages that
     * mention "timeout" or "deadline" from writers that only report text.
     */
    static bool isTimeoutError(const core::Error& error);

private:
    IStreamWriter& destination_;
    std::chrono::milliseconds timeout_;
    std::atomic<uint64_t> bytesWritten_{0};
};

} // namespace streaming
} // namespace aceproxy

#endif // ACEPROXY_STREAMING_TIMEOUT_WRITER_HPP
