// AceProxy - AceStream Multiplexing Proxy
// Structured Logging Component
//
// Provides structured logging with JSON support for log aggregation systems.
//
// Responsibilities:
// - Configurable log levels (debug, info, warning, error)
// - Client lifecycle events with timestamps and client details
// - JSON line format for aggregation systems
// - Context fields on records (content id, client id, infohash, error code)

#ifndef ACEPROXY_CORE_STRUCTURED_LOGGER_HPP
#define ACEPROXY_CORE_STRUCTURED_LOGGER_HPP

#include "aceproxy/core/types.hpp"
#include "aceproxy/pal/log_pal.hpp"
#include "aceproxy/pal/pal_types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace aceproxy {
namespace core {

/**
 * @brief Configurable log levels.
 *
 * Messages below the configured level are filtered out.
 */
enum class LogLevelConfig {
    Debug = 0,    ///< Detailed debugging information
    Info = 1,     ///< Informational messages about normal operation
    Warning = 2,  ///< Warning conditions that should be addressed
    Error = 3     ///< Error conditions that affect operation
};

std::string logLevelToString(LogLevelConfig level);

/**
 * @brief Convert string to log level (case-insensitive).
 * @return Corresponding LogLevelConfig, defaults to Info for unknown
 */
LogLevelConfig stringToLogLevel(const std::string& str);

/**
 * @brief Client lifecycle events on the streaming endpoint.
 */
enum class ClientEventType {
    StreamRequested,  ///< Client asked for a content id
    StreamStarted,    ///< Client attached to a ready session
    StreamEnded,      ///< Client finished normally
    StreamFailed,     ///< Client finished with an error
    Evicted           ///< Client dropped for falling behind
};

std::string clientEventTypeToString(ClientEventType eventType);

/**
 * @brief Context attached to a structured record.
 *
 * Empty fields are omitted from the output.
 */
struct LogContext {
    std::string contentId;   ///< Requested content id
    std::string clientId;    ///< Client PID
    std::string infoHash;    ///< Probed stream infohash
    int32_t errorCode = 0;   ///< core::ErrorCode value, 0 if none
    std::vector<std::pair<std::string, std::string>> fields;  ///< Extra key/value pairs

    LogContext() = default;

    LogContext& with(std::string key, std::string value) {
        fields.emplace_back(std::move(key), std::move(value));
        return *this;
    }
};

/**
 * @brief Structured logger with JSON format support.
 *
 * ## Thread Safety
 * All methods are thread-safe. Lines from different threads may interleave
 * in order but never within a line.
 *
 * ## Usage Example
 * @code
 * auto logger = std::make_shared<StructuredLogger>();
 * logger->setLevel(LogLevelConfig::Info);
 * logger->setJsonFormat(true);
 * logger->addSink(std::make_shared<pal::linux::ConsoleLogSink>());
 *
 * logger->info("Server started", "Server");
 *
 * LogContext ctx;
 * ctx.contentId = "abc123";
 * ctx.clientId = "pid-17";
 * logger->errorWithContext("Engine start failed", ctx, "Proxy");
 * @endcode
 */
class StructuredLogger {
public:
    StructuredLogger();
    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&) = delete;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    void setLevel(LogLevelConfig level);
    LogLevelConfig getLevel() const;

    /**
     * @brief Enable or disable JSON line format.
     *
     * JSON records carry timestamp, level, category, message and any
     * context fields.
     */
    void setJsonFormat(bool enabled);
    bool isJsonFormat() const;

    /**
     * @brief True if a record at this level would be emitted.
     */
    bool isEnabled(LogLevelConfig level) const;

    // =========================================================================
    // Basic Logging Methods
    // =========================================================================

    void debug(const std::string& message, const std::string& category = "AceProxy");
    void info(const std::string& message, const std::string& category = "AceProxy");
    void warning(const std::string& message, const std::string& category = "AceProxy");
    void error(const std::string& message, const std::string& category = "AceProxy");

    /**
     * @brief Log a record with context fields at any level.
     */
    void logWithContext(
        LogLevelConfig level,
        const std::string& message,
        const LogContext& context,
        const std::string& category = "AceProxy"
    );

    /**
     * @brief Log an error with full context information.
     */
    void errorWithContext(
        const std::string& message,
        const LogContext& context,
        const std::string& category = "AceProxy"
    );

    // =========================================================================
    // Client Event Logging
    // =========================================================================

    /**
     * @brief Log a client lifecycle event at Info level.
     *
     * @param eventType Type of client event
     * @param client Remote address and user agent
     * @param contentId Content id the client requested
     */
    void logClientEvent(
        ClientEventType eventType,
        const ClientInfo& client,
        const std::string& contentId
    );

    // =========================================================================
    // Sink Management
    // =========================================================================

    void addSink(std::shared_ptr<pal::ILogSink> sink);
    void removeSink(std::shared_ptr<pal::ILogSink> sink);

    /**
     * @brief Flush all sinks.
     */
    void flush();

private:
    void dispatch(LogLevelConfig level, const std::string& formatted, const std::string& category);

    std::string formatMessage(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context = nullptr
    );

    std::string formatJson(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    );

    std::string formatPlainText(
        LogLevelConfig level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    );

    /**
     * @brief Current time in ISO 8601 format with milliseconds, UTC.
     */
    static std::string getTimestamp();

    static pal::LogLevel toPalLogLevel(LogLevelConfig level);

    std::atomic<LogLevelConfig> level_{LogLevelConfig::Info};
    std::atomic<bool> jsonFormat_{false};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<pal::ILogSink>> sinks_;
};

} // namespace core
} // namespace aceproxy

#endif // ACEPROXY_CORE_STRUCTURED_LOGGER_HPP
