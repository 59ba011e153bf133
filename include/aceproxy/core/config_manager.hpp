// AceProxy - AceStream Multiplexing Proxy
// Configuration Manager - Handles configuration loading and validation
//
// Responsibilities:
// - Parse the JSON configuration file
// - Support ACEPROXY_* environment variable overrides for containers
// - Validate configuration on startup with field-level error messages
// - Apply sensible defaults when the configuration file is absent
// - Log effective configuration values during initialization

#ifndef ACEPROXY_CORE_CONFIG_MANAGER_HPP
#define ACEPROXY_CORE_CONFIG_MANAGER_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "aceproxy/core/result.hpp"
#include "aceproxy/core/structured_logger.hpp"

namespace aceproxy {
namespace core {

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief HTTP listener section.
 */
struct ServerConfig {
    uint16_t port = 8080;                 ///< HTTP port
    std::string bindAddress = "0.0.0.0";  ///< Bind address (default: all interfaces)
    uint32_t maxConnections = 256;        ///< Concurrent connection cap
    uint32_t requestTimeoutMs = 10000;    ///< Time allowed to receive request headers
};

/**
 * @brief AceStream engine HTTP API section.
 */
struct EngineConfig {
    std::string baseUrl = "http://localhost:6878";
    uint32_t startTimeoutMs = 30000;
    uint32_t statsTimeoutMs = 5000;
    uint32_t stopTimeoutMs = 5000;
    uint32_t pingTimeoutMs = 5000;
};

/**
 * @brief Session multiplexer section.
 */
struct ProxyConfig {
    uint32_t writeTimeoutMs = 10000;      ///< Per-write deadline for client sockets
    uint32_t readyTimeoutMs = 30000;      ///< Max wait for a joining client
    uint32_t maxAttempts = 3;             ///< Upstream relay attempts
    uint32_t retryBaseDelayMs = 2000;     ///< First backoff delay, doubled per retry
    uint32_t clientBufferChunks = 128;    ///< Per-client queue capacity
};

/**
 * @brief Health probing section.
 */
struct ProbeConfig {
    bool enabled = true;
    uint32_t intervalSeconds = 900;       ///< Delay between probe cycles
    uint32_t timeoutMs = 30000;           ///< Bound on a single probe
    uint32_t windowHours = 24;            ///< Rolling metrics window
};

struct StorageConfig {
    std::string dbPath = "aceproxy.db";   ///< SQLite database file, empty for in-memory storage
};

struct LoggingConfig {
    LogLevelConfig level = LogLevelConfig::Info;
    bool json = true;                     ///< JSON lines on stdout
    bool syslog = false;                  ///< Also send records to syslog
};

/**
 * @brief One catalogued stream available for probing and ranking.
 */
struct StreamEntryConfig {
    std::string infoHash;
    std::string channel;
};

/**
 * @brief Complete proxy configuration.
 */
struct Configuration {
    ServerConfig server;
    EngineConfig engine;
    ProxyConfig proxy;
    ProbeConfig probe;
    StorageConfig storage;
    LoggingConfig logging;
    std::vector<StreamEntryConfig> streams;
};

// =============================================================================
// Configuration Error
// =============================================================================

/**
 * @brief Configuration error with detailed information.
 */
struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;        ///< Field that caused the error (if applicable)

    ConfigError() = default;
    ConfigError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    ConfigError(Code c, std::string msg, std::string f)
        : code(c), message(std::move(msg)), field(std::move(f)) {}
};

// =============================================================================
// Configuration Manager
// =============================================================================

using ConfigLogCallback = std::function<void(const std::string&)>;

/**
 * @brief Loads and validates the proxy configuration.
 *
 * Precedence, lowest to highest: built-in defaults, the JSON file, then
 * ACEPROXY_* environment variables.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 *
 * Usage example:
 * @code
 * ConfigManager manager;
 * manager.setLogCallback([&](const std::string& msg) { logger->info(msg, "Config"); });
 *
 * auto result = manager.loadFromFile("aceproxy.json");
 * if (result.isError()) {
 *     manager.loadDefaults();
 * }
 * manager.applyEnvironmentOverrides();
 *
 * auto valid = manager.validate();
 * if (valid.isError()) {
 *     std::cerr << "Config error: " << valid.error().message;
 *     return 1;
 * }
 * Configuration config = manager.getConfig();
 * @endcode
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    // -------------------------------------------------------------------------
    // Configuration Loading
    // -------------------------------------------------------------------------

    /**
     * @brief Load configuration from a JSON file.
     */
    Result<void, ConfigError> loadFromFile(const std::string& filePath);

    /**
     * @brief Load configuration from a JSON string.
     *
     * Keys absent from the document keep their current values.
     */
    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);

    /**
     * @brief Reset to built-in defaults.
     */
    Result<void, ConfigError> loadDefaults();

    /**
     * @brief Apply ACEPROXY_* environment variables on top of the current values.
     *
     * Malformed values are logged and ignored.
     */
    void applyEnvironmentOverrides();

    /**
     * @brief Check cross-field constraints of the current configuration.
     */
    Result<void, ConfigError> validate() const;

    /**
     * @brief Snapshot of the current configuration.
     */
    Configuration getConfig() const;

    /**
     * @brief Effective configuration as pretty-printed JSON.
     */
    std::string dumpConfig() const;

    void setLogCallback(ConfigLogCallback callback);

private:
    Result<void, ConfigError> parseJson(const std::string& content);
    Result<std::string, ConfigError> readFile(const std::string& filePath) const;
    std::optional<LogLevelConfig> parseLogLevel(const std::string& level) const;
    std::optional<std::string> getEnvVar(const std::string& name) const;
    void log(const std::string& message) const;
    void logEffectiveConfig() const;

    mutable std::shared_mutex configMutex_;
    Configuration config_;

    mutable std::mutex logMutex_;
    ConfigLogCallback logCallback_;
};

} // namespace core
} // namespace aceproxy

#endif // ACEPROXY_CORE_CONFIG_MANAGER_HPP
