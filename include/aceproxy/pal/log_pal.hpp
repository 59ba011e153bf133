// AceProxy - AceStream Multiplexing Proxy
// Platform Abstraction Layer - Logging Interface
//
// Log sinks decouple the structured logger from where records end up:
// the console for containers, syslog for host installs, an in-memory sink
// in tests.

#ifndef ACEPROXY_PAL_LOG_PAL_HPP
#define ACEPROXY_PAL_LOG_PAL_HPP

#include "aceproxy/pal/pal_types.hpp"

#include <string>

namespace aceproxy {
namespace pal {

/**
 * @brief Interface for log output sinks.
 *
 * Sinks receive fully formatted records. Implementations must tolerate
 * concurrent write() calls; StructuredLogger serializes its own dispatch
 * but several loggers may share one sink.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write a log message.
     *
     * @param level Log level of the message
     * @param message Formatted log message
     * @param category Log category (e.g., "Proxy", "Probe")
     * @param context Source context (file, line, function)
     */
    virtual void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    /**
     * @brief Flush any buffered output.
     */
    virtual void flush() = 0;

    /**
     * @brief Get the sink name for debugging.
     */
    virtual std::string getName() const = 0;
};

} // namespace pal
} // namespace aceproxy

#endif // ACEPROXY_PAL_LOG_PAL_HPP
