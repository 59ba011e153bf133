// AceProxy - AceStream Multiplexing Proxy
// Linux Log Sinks
//
// ConsoleLogSink writes one record per line to stdout (or stderr for
// warnings and above when split output is requested). SyslogLogSink routes
// records to syslog(3) under the "aceproxy" ident.

#ifndef ACEPROXY_PAL_LINUX_LINUX_LOG_SINK_HPP
#define ACEPROXY_PAL_LINUX_LINUX_LOG_SINK_HPP

#include "aceproxy/pal/log_pal.hpp"
#include "aceproxy/pal/pal_types.hpp"

#include <cstdio>
#include <mutex>
#include <string>

namespace aceproxy {
namespace pal {
namespace linux {

/**
 * @brief Console sink for containerized deployments.
 *
 * Records are already formatted by StructuredLogger, so the sink writes
 * them verbatim. A mutex keeps concurrent lines from interleaving.
 */
class ConsoleLogSink : public ILogSink {
public:
    /**
     * @param splitStreams Send Warning and above to stderr instead of stdout
     */
    explicit ConsoleLogSink(bool splitStreams = false);
    ~ConsoleLogSink() override;

    ConsoleLogSink(const ConsoleLogSink&) = delete;
    ConsoleLogSink& operator=(const ConsoleLogSink&) = delete;

    void write(LogLevel level, const std::string& message,
               const std::string& category, const LogContext& context) override;
    void flush() override;
    std::string getName() const override { return "console"; }

private:
    bool splitStreams_;
    std::mutex mutex_;
};

/**
 * @brief syslog(3) sink.
 *
 * Opens the log on construction and closes it on destruction; only one
 * instance should exist per process since openlog state is global.
 */
class SyslogLogSink : public ILogSink {
public:
    explicit SyslogLogSink(const char* ident = "aceproxy");
    ~SyslogLogSink() override;

    SyslogLogSink(const SyslogLogSink&) = delete;
    SyslogLogSink& operator=(const SyslogLogSink&) = delete;

    void write(LogLevel level, const std::string& message,
               const std::string& category, const LogContext& context) override;
    void flush() override {}
    std::string getName() const override { return "syslog"; }

private:
    static int toSyslogPriority(LogLevel level);
};

} // namespace linux
} // namespace pal
} // namespace aceproxy

#endif // ACEPROXY_PAL_LINUX_LINUX_LOG_SINK_HPP
