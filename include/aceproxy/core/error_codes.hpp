// AceProxy - AceStream Multiplexing Proxy
// Common error codes and Error structure

#ifndef ACEPROXY_CORE_ERROR_CODES_HPP
#define ACEPROXY_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>

namespace aceproxy {
namespace core {

/**
 * @brief Error codes shared by every AceProxy layer.
 *
 * Codes are grouped in hundreds so that log aggregation can bucket them
 * by subsystem.
 */
enum class ErrorCode : uint32_t {
    // General errors (0-99)
    Success = 0,
    Unknown = 1,
    InvalidArgument = 2,
    InvalidState = 3,
    NotFound = 4,
    AlreadyExists = 5,

    // Timeout and cancellation (100-199)
    Timeout = 100,
    Cancelled = 101,

    // Network errors (200-299)
    NetworkError = 200,
    ConnectionFailed = 201,
    ConnectionClosed = 202,
    SendFailed = 203,
    ReceiveFailed = 204,
    BindFailed = 205,
    ListenFailed = 206,
    AcceptFailed = 207,
    AddressInUse = 208,
    ShortWrite = 209,

    // Stream session errors (300-399)
    InvalidContentId = 300,
    EngineUnavailable = 301,
    StreamNotActive = 302,
    WriteTimeout = 303,
    ReconnectExhausted = 304,
    StreamEnded = 305,

    // Upstream engine errors (400-499)
    EngineError = 400,
    EngineBadResponse = 401,

    // Probe domain errors (500-599)
    NoProbeData = 500,
    EmptyInfoHash = 501,
    InvalidTimestamp = 502,

    // Storage errors (600-699)
    StorageError = 600,
    StorageOpenFailed = 601,
    StorageQueryFailed = 602,

    // Configuration errors (700-799)
    ConfigError = 700,
    ConfigInvalid = 701,

    // I/O errors (900-999)
    IOError = 900,
    FileNotFound = 901,
};

/**
 * @brief Convert error code to human-readable string.
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::BindFailed: return "Bind failed";
        case ErrorCode::ListenFailed: return "Listen failed";
        case ErrorCode::AcceptFailed: return "Accept failed";
        case ErrorCode::AddressInUse: return "Address in use";
        case ErrorCode::ShortWrite: return "Short write";
        case ErrorCode::InvalidContentId: return "Invalid content id";
        case ErrorCode::EngineUnavailable: return "Engine unavailable";
        case ErrorCode::StreamNotActive: return "Stream not active";
        case ErrorCode::WriteTimeout: return "Write timeout";
        case ErrorCode::ReconnectExhausted: return "Reconnect attempts exhausted";
        case ErrorCode::StreamEnded: return "Stream ended";
        case ErrorCode::EngineError: return "Engine error";
        case ErrorCode::EngineBadResponse: return "Engine bad response";
        case ErrorCode::NoProbeData: return "No probe data";
        case ErrorCode::EmptyInfoHash: return "Empty infohash";
        case ErrorCode::InvalidTimestamp: return "Invalid timestamp";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::StorageOpenFailed: return "Storage open failed";
        case ErrorCode::StorageQueryFailed: return "Storage query failed";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::ConfigInvalid: return "Configuration invalid";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::FileNotFound: return "File not found";
        default: return "Unknown error code";
    }
}

/**
 * @brief Error structure containing error code, message, and optional context.
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error(ErrorCode c = ErrorCode::Unknown,
          std::string msg = "",
          std::string ctx = "")
        : code(c)
        , message(std::move(msg))
        , context(std::move(ctx)) {}

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == ErrorCode::Success;
    }

    /**
     * @brief Wrap this error under a new code, keeping the cause in the message.
     *
     * Produces "<prefix>: <cause message>" so the original failure survives
     * in logs and client-facing text.
     */
    [[nodiscard]] Error wrap(ErrorCode outer, const std::string& prefix) const {
        return Error(outer, prefix + ": " + message, context);
    }

    [[nodiscard]] std::string toString() const {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        return result;
    }
};

} // namespace core
} // namespace aceproxy

#endif // ACEPROXY_CORE_ERROR_CODES_HPP
