// AceProxy - AceStream Multiplexing Proxy
// Linux Log Sinks Implementation

#include "aceproxy/pal/linux/linux_log_sink.hpp"

#include <syslog.h>

namespace aceproxy {
namespace pal {
namespace linux {

// =============================================================================
// ConsoleLogSink
// =============================================================================

ConsoleLogSink::ConsoleLogSink(bool splitStreams)
    : splitStreams_(splitStreams) {
}

ConsoleLogSink::~ConsoleLogSink() {
    flush();
}

void ConsoleLogSink::write(
    LogLevel level,
    const std::string& message,
    const std::string& /* category */,
    const LogContext& /* context */
) {
    FILE* out = stdout;
    if (splitStreams_ && static_cast<uint32_t>(level) >= static_cast<uint32_t>(LogLevel::Warning)) {
        out = stderr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::fwrite(message.data(), 1, message.size(), out);
    std::fputc('\n', out);
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// =============================================================================
// SyslogLogSink
// =============================================================================

SyslogLogSink::SyslogLogSink(const char* ident) {
    openlog(ident, LOG_PID | LOG_NDELAY, LOG_USER);
}

SyslogLogSink::~SyslogLogSink() {
    closelog();
}

void SyslogLogSink::write(
    LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogContext& /* context */
) {
    if (level == LogLevel::Off) {
        return;
    }
    syslog(toSyslogPriority(level), "[%s] %s", category.c_str(), message.c_str());
}

int SyslogLogSink::toSyslogPriority(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
        case LogLevel::Debug:
            return LOG_DEBUG;
        case LogLevel::Info:
            return LOG_INFO;
        case LogLevel::Warning:
            return LOG_WARNING;
        case LogLevel::Error:
            return LOG_ERR;
        case LogLevel::Critical:
            return LOG_CRIT;
        case LogLevel::Off:
        default:
            return LOG_DEBUG;
    }
}

} // namespace linux
} // namespace pal
} // namespace aceproxy
