// AceProxy - AceStream Multiplexing Proxy
// Stream Writer - Destination abstraction for relayed bytes
//
// Every sink of stream bytes implements IStreamWriter: client HTTP
// responses, the per-session Broadcaster, and test recorders.

#ifndef ACEPROXY_STREAMING_STREAM_WRITER_HPP
#define ACEPROXY_STREAMING_STREAM_WRITER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "aceproxy/core/error_codes.hpp"
#include "aceproxy/core/result.hpp"

namespace aceproxy {
namespace streaming {

/**
 * @brief Byte sink with an optional per-write deadline.
 *
 * write() may accept fewer bytes than offered (a short write); callers that
 * need the whole buffer delivered loop, as TimeoutWriter does. A deadline
 * set through setWriteDeadline() applies to subsequent writes until
 * replaced. Writers that cannot enforce deadlines report
 * supportsDeadline() == false and ignore setWriteDeadline().
 */
class IStreamWriter {
public:
    virtual ~IStreamWriter() = default;

    /**
     * @brief Write bytes to the destination.
     *
     * @return Number of bytes accepted, or the failure. A Timeout code
     *         means the deadline elapsed before any byte was accepted.
     */
    virtual core::Result<size_t, core::Error> write(const uint8_t* data, size_t size) = 0;

    virtual bool supportsDeadline() const { return false; }

    virtual void setWriteDeadline(std::chrono::steady_clock::time_point /* deadline */) {}

    /**
     * @brief Push any buffered bytes to the underlying transport.
     */
    virtual core::Result<void, core::Error> flush() {
        return core::Result<void, core::Error>::success();
    }
};

} // namespace streaming
} // namespace aceproxy

#endif // ACEPROXY_STREAMING_STREAM_WRITER_HPP
