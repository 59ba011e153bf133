// AceProxy - AceStream Multiplexing Proxy
// Platform Abstraction Layer - Common Types

#ifndef ACEPROXY_PAL_PAL_TYPES_HPP
#define ACEPROXY_PAL_PAL_TYPES_HPP

#include <cstdint>
#include <string>

namespace aceproxy {
namespace pal {

/**
 * @brief Severity levels understood by platform log sinks.
 */
enum class LogLevel : uint32_t {
    Trace = 0,      ///< Extremely detailed tracing information
    Debug = 1,      ///< Debug-level messages for development
    Info = 2,       ///< Informational messages about normal operation
    Warning = 3,    ///< Warning conditions that should be addressed
    Error = 4,      ///< Error conditions that affect operation
    Critical = 5,   ///< Critical conditions requiring immediate attention
    Off = 6         ///< Disable all logging
};

/**
 * @brief Source location attached to a log record.
 */
struct LogContext {
    const char* file = nullptr;     ///< Source file name
    int line = 0;                   ///< Source line number
    const char* function = nullptr; ///< Function name
};

} // namespace pal
} // namespace aceproxy

#endif // ACEPROXY_PAL_PAL_TYPES_HPP
