// AceProxy - AceStream Multiplexing Proxy
// Structured Logging Component Implementation

#include "aceproxy/core/structured_logger.hpp"
#include "aceproxy/core/json.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace aceproxy {
namespace core {

// =============================================================================
// Helper Functions
// =============================================================================

std::string logLevelToString(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return "debug";
        case LogLevelConfig::Info:
            return "info";
        case LogLevelConfig::Warning:
            return "warning";
        case LogLevelConfig::Error:
            return "error";
        default:
            return "info";
    }
}

LogLevelConfig stringToLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevelConfig::Debug;
    } else if (lower == "info") {
        return LogLevelConfig::Info;
    } else if (lower == "warning" || lower == "warn") {
        return LogLevelConfig::Warning;
    } else if (lower == "error") {
        return LogLevelConfig::Error;
    }

    return LogLevelConfig::Info;
}

std::string clientEventTypeToString(ClientEventType eventType) {
    switch (eventType) {
        case ClientEventType::StreamRequested:
            return "stream_requested";
        case ClientEventType::StreamStarted:
            return "stream_started";
        case ClientEventType::StreamEnded:
            return "stream_ended";
        case ClientEventType::StreamFailed:
            return "stream_failed";
        case ClientEventType::Evicted:
            return "evicted";
        default:
            return "unknown";
    }
}

// =============================================================================
// StructuredLogger Implementation
// =============================================================================

StructuredLogger::StructuredLogger() = default;

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLevel(LogLevelConfig level) {
    level_.store(level);
}

LogLevelConfig StructuredLogger::getLevel() const {
    return level_.load();
}

void StructuredLogger::setJsonFormat(bool enabled) {
    jsonFormat_.store(enabled);
}

bool StructuredLogger::isJsonFormat() const {
    return jsonFormat_.load();
}

bool StructuredLogger::isEnabled(LogLevelConfig level) const {
    return static_cast<int>(level) >= static_cast<int>(level_.load());
}

void StructuredLogger::debug(const std::string& message, const std::string& category) {
    if (isEnabled(LogLevelConfig::Debug)) {
        dispatch(LogLevelConfig::Debug, formatMessage(LogLevelConfig::Debug, message, category), category);
    }
}

void StructuredLogger::info(const std::string& message, const std::string& category) {
    if (isEnabled(LogLevelConfig::Info)) {
        dispatch(LogLevelConfig::Info, formatMessage(LogLevelConfig::Info, message, category), category);
    }
}

void StructuredLogger::warning(const std::string& message, const std::string& category) {
    if (isEnabled(LogLevelConfig::Warning)) {
        dispatch(LogLevelConfig::Warning, formatMessage(LogLevelConfig::Warning, message, category), category);
    }
}

void StructuredLogger::error(const std::string& message, const std::string& category) {
    if (isEnabled(LogLevelConfig::Error)) {
        dispatch(LogLevelConfig::Error, formatMessage(LogLevelConfig::Error, message, category), category);
    }
}

void StructuredLogger::logWithContext(
    LogLevelConfig level,
    const std::string& message,
    const LogContext& context,
    const std::string& category)
{
    if (!isEnabled(level)) {
        return;
    }
    dispatch(level, formatMessage(level, message, category, &context), category);
}

void StructuredLogger::errorWithContext(
    const std::string& message,
    const LogContext& context,
    const std::string& category)
{
    logWithContext(LogLevelConfig::Error, message, context, category);
}

void StructuredLogger::logClientEvent(
    ClientEventType eventType,
    const ClientInfo& client,
    const std::string& contentId)
{
    if (!isEnabled(LogLevelConfig::Info)) {
        return;
    }

    const std::string category = "Client";
    std::ostringstream oss;

    if (jsonFormat_.load()) {
        oss << "{";
        oss << "\"timestamp\":\"" << getTimestamp() << "\"";
        oss << ",\"level\":\"info\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"event\":\"" << clientEventTypeToString(eventType) << "\"";
        oss << ",\"remote_addr\":\"" << escapeJson(client.ip) << "\"";
        oss << ",\"remote_port\":" << client.port;
        if (!client.userAgent.empty()) {
            oss << ",\"user_agent\":\"" << escapeJson(client.userAgent) << "\"";
        }
        if (!contentId.empty()) {
            oss << ",\"content_id\":\"" << escapeJson(contentId) << "\"";
        }
        oss << "}";
    } else {
        oss << "[" << getTimestamp() << "] ";
        oss << "[info] ";
        oss << "[" << category << "] ";
        oss << "Event: " << clientEventTypeToString(eventType);
        oss << ", Client: " << client.ip << ":" << client.port;
        if (!client.userAgent.empty()) {
            oss << ", UserAgent: " << client.userAgent;
        }
        if (!contentId.empty()) {
            oss << ", ContentId: " << contentId;
        }
    }

    dispatch(LogLevelConfig::Info, oss.str(), category);
}

void StructuredLogger::addSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void StructuredLogger::removeSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(
        std::remove(sinks_.begin(), sinks_.end(), sink),
        sinks_.end()
    );
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->flush();
        }
    }
}

void StructuredLogger::dispatch(
    LogLevelConfig level,
    const std::string& formatted,
    const std::string& category)
{
    pal::LogContext palContext;
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->write(toPalLogLevel(level), formatted, category, palContext);
        }
    }
}

std::string StructuredLogger::formatMessage(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context)
{
    if (jsonFormat_.load()) {
        return formatJson(level, message, category, context);
    }
    return formatPlainText(level, message, category, context);
}

std::string StructuredLogger::formatJson(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context)
{
    std::ostringstream oss;
    oss << "{";
    oss << "\"timestamp\":\"" << getTimestamp() << "\"";
    oss << ",\"level\":\"" << logLevelToString(level) << "\"";
    oss << ",\"category\":\"" << escapeJson(category) << "\"";
    oss << ",\"message\":\"" << escapeJson(message) << "\"";

    if (context) {
        if (!context->contentId.empty()) {
            oss << ",\"content_id\":\"" << escapeJson(context->contentId) << "\"";
        }
        if (!context->clientId.empty()) {
            oss << ",\"client_id\":\"" << escapeJson(context->clientId) << "\"";
        }
        if (!context->infoHash.empty()) {
            oss << ",\"infohash\":\"" << escapeJson(context->infoHash) << "\"";
        }
        if (context->errorCode != 0) {
            oss << ",\"error_code\":" << context->errorCode;
        }
        for (const auto& field : context->fields) {
            oss << ",\"" << escapeJson(field.first) << "\":\"" << escapeJson(field.second) << "\"";
        }
    }

    oss << "}";
    return oss.str();
}

std::string StructuredLogger::formatPlainText(
    LogLevelConfig level,
    const std::string& message,
    const std::string& category,
    const LogContext* context)
{
    std::ostringstream oss;
    oss << "[" << getTimestamp() << "] ";
    oss << "[" << logLevelToString(level) << "] ";
    oss << "[" << category << "] ";
    oss << message;

    if (context) {
        if (!context->contentId.empty()) {
            oss << " content_id=" << context->contentId;
        }
        if (!context->clientId.empty()) {
            oss << " client_id=" << context->clientId;
        }
        if (!context->infoHash.empty()) {
            oss << " infohash=" << context->infoHash;
        }
        if (context->errorCode != 0) {
            oss << " error_code=" << context->errorCode;
        }
        for (const auto& field : context->fields) {
            oss << " " << field.first << "=" << field.second;
        }
    }
    return oss.str();
}

std::string StructuredLogger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmBuf;
    gmtime_r(&timeT, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    oss << "Z";
    return oss.str();
}

pal::LogLevel StructuredLogger::toPalLogLevel(LogLevelConfig level) {
    switch (level) {
        case LogLevelConfig::Debug:
            return pal::LogLevel::Debug;
        case LogLevelConfig::Info:
            return pal::LogLevel::Info;
        case LogLevelConfig::Warning:
            return pal::LogLevel::Warning;
        case LogLevelConfig::Error:
            return pal::LogLevel::Error;
        default:
            return pal::LogLevel::Info;
    }
}

} // namespace core
} // namespace aceproxy
