// AceProxy - AceStream Multiplexing Proxy
// Configuration Manager Implementation

#include "aceproxy/core/config_manager.hpp"
#include "aceproxy/core/json.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace aceproxy {
namespace core {

namespace {

using VoidResult = Result<void, ConfigError>;

ConfigError validationError(const std::string& field, const std::string& message) {
    return ConfigError(ConfigError::Code::ValidationError, field + " " + message, field);
}

/**
 * @brief Read an unsigned integer member, enforcing an inclusive range.
 *
 * Leaves target untouched when the key is absent.
 */
VoidResult readUint(const JsonValue& section, const std::string& sectionName,
                    const std::string& key, uint32_t minValue, uint32_t maxValue,
                    uint32_t& target) {
    if (!section.contains(key)) {
        return VoidResult::success();
    }
    const std::string field = sectionName + "." + key;
    const JsonValue& v = section[key];
    if (!v.isNumber()) {
        return VoidResult::error(validationError(field, "must be a number"));
    }
    int64_t n = v.getInt(-1);
    if (n < static_cast<int64_t>(minValue) || n > static_cast<int64_t>(maxValue)) {
        return VoidResult::error(validationError(field,
            "must be between " + std::to_string(minValue) + " and " + std::to_string(maxValue)));
    }
    target = static_cast<uint32_t>(n);
    return VoidResult::success();
}

VoidResult readString(const JsonValue& section, const std::string& sectionName,
                      const std::string& key, std::string& target) {
    if (!section.contains(key)) {
        return VoidResult::success();
    }
    const JsonValue& v = section[key];
    if (!v.isString()) {
        return VoidResult::error(validationError(sectionName + "." + key, "must be a string"));
    }
    target = v.stringValue;
    return VoidResult::success();
}

VoidResult readBool(const JsonValue& section, const std::string& sectionName,
                    const std::string& key, bool& target) {
    if (!section.contains(key)) {
        return VoidResult::success();
    }
    const JsonValue& v = section[key];
    if (!v.isBool()) {
        return VoidResult::error(validationError(sectionName + "." + key, "must be a boolean"));
    }
    target = v.boolValue;
    return VoidResult::success();
}

bool parseBoolFlag(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true" || value == "1" || value == "yes";
}

constexpr uint32_t kMaxMillis = 24u * 60u * 60u * 1000u;

} // anonymous namespace

#define ACEPROXY_CONFIG_TRY(expr)              \
    do {                                       \
        auto tryResult_ = (expr);              \
        if (tryResult_.isError()) {            \
            return tryResult_;                 \
        }                                      \
    } while (0)

// =============================================================================
// ConfigManager Implementation
// =============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

Result<void, ConfigError> ConfigManager::loadFromFile(const std::string& filePath) {
    auto contentResult = readFile(filePath);
    if (contentResult.isError()) {
        return Result<void, ConfigError>::error(contentResult.error());
    }

    log("Loading configuration from " + filePath);
    return loadFromJsonString(contentResult.value());
}

Result<void, ConfigError> ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    auto result = parseJson(jsonContent);
    if (result.isSuccess()) {
        logEffectiveConfig();
    }
    return result;
}

Result<void, ConfigError> ConfigManager::loadDefaults() {
    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = Configuration{};
    }

    log("Configuration loaded with default values");
    logEffectiveConfig();
    return Result<void, ConfigError>::success();
}

void ConfigManager::applyEnvironmentOverrides() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    if (auto val = getEnvVar("ACEPROXY_PORT")) {
        try {
            int port = std::stoi(*val);
            if (port <= 0 || port > 65535) {
                throw std::out_of_range("port");
            }
            config_.server.port = static_cast<uint16_t>(port);
            log("Environment override: ACEPROXY_PORT=" + *val);
        } catch (const std::exception&) {
            log("Warning: Invalid ACEPROXY_PORT value: " + *val);
        }
    }

    if (auto val = getEnvVar("ACEPROXY_BIND_ADDRESS")) {
        config_.server.bindAddress = *val;
        log("Environment override: ACEPROXY_BIND_ADDRESS=" + *val);
    }

    if (auto val = getEnvVar("ACEPROXY_MAX_CONNECTIONS")) {
        try {
            config_.server.maxConnections = static_cast<uint32_t>(std::stoul(*val));
            log("Environment override: ACEPROXY_MAX_CONNECTIONS=" + *val);
        } catch (const std::exception&) {
            log("Warning: Invalid ACEPROXY_MAX_CONNECTIONS value: " + *val);
        }
    }

    if (auto val = getEnvVar("ACEPROXY_ENGINE_URL")) {
        config_.engine.baseUrl = *val;
        log("Environment override: ACEPROXY_ENGINE_URL=" + *val);
    }

    if (auto val = getEnvVar("ACEPROXY_ENGINE_START_TIMEOUT_MS")) {
        try {
            config_.engine.startTimeoutMs = static_cast<uint32_t>(std::stoul(*val));
            log("Environment override: ACEPROXY_ENGINE_START_TIMEOUT_MS=" + *val);
        } catch (const std::exception&) {
            log("Warning: Invalid ACEPROXY_ENGINE_START_TIMEOUT_MS value: " + *val);
        }
    }

    if (auto val = getEnvVar("ACEPROXY_WRITE_TIMEOUT_MS")) {
        try {
            config_.proxy.writeTimeoutMs = static_cast<uint32_t>(std::stoul(*val));
            log("Environment override: ACEPROXY_WRITE_TIMEOUT_MS=" + *val);
        } catch (const std::exception&) {
            log("Warning: Invalid ACEPROXY_WRITE_TIMEOUT_MS value: " + *val);
        }
    }

    if (auto val = getEnvVar("ACEPROXY_PROBE_ENABLED")) {
        config_.probe.enabled = parseBoolFlag(*val);
        log("Environment override: ACEPROXY_PROBE_ENABLED=" + *val);
    }

    if (auto val = getEnvVar("ACEPROXY_PROBE_INTERVAL_SECONDS")) {
        try {
            config_.probe.intervalSeconds = static_cast<uint32_t>(std::stoul(*val));
            log("Environment override: ACEPROXY_PROBE_INTERVAL_SECONDS=" + *val);
        } catch (const std::exception&) {
            log("Warning: Invalid ACEPROXY_PROBE_INTERVAL_SECONDS value: " + *val);
        }
    }

    if (auto val = getEnvVar("ACEPROXY_DB_PATH")) {
        config_.storage.dbPath = *val;
        log("Environment override: ACEPROXY_DB_PATH=" + *val);
    }

    if (auto val = getEnvVar("ACEPROXY_LOG_LEVEL")) {
        if (auto level = parseLogLevel(*val)) {
            config_.logging.level = *level;
            log("Environment override: ACEPROXY_LOG_LEVEL=" + *val);
        } else {
            log("Warning: Invalid ACEPROXY_LOG_LEVEL value: " + *val);
        }
    }

    if (auto val = getEnvVar("ACEPROXY_LOG_JSON")) {
        config_.logging.json = parseBoolFlag(*val);
        log("Environment override: ACEPROXY_LOG_JSON=" + *val);
    }
}

Result<void, ConfigError> ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    if (config_.server.port == 0) {
        return VoidResult::error(validationError("server.port", "must be between 1 and 65535"));
    }
    if (config_.server.maxConnections == 0) {
        return VoidResult::error(validationError("server.maxConnections", "must be greater than 0"));
    }

    const std::string& url = config_.engine.baseUrl;
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        return VoidResult::error(validationError("engine.baseUrl", "must start with http:// or https://"));
    }
    if (config_.engine.startTimeoutMs == 0) {
        return VoidResult::error(validationError("engine.startTimeoutMs", "must be greater than 0"));
    }

    if (config_.proxy.writeTimeoutMs == 0) {
        return VoidResult::error(validationError("proxy.writeTimeoutMs", "must be greater than 0"));
    }
    if (config_.proxy.maxAttempts == 0) {
        return VoidResult::error(validationError("proxy.maxAttempts", "must be at least 1"));
    }
    if (config_.proxy.clientBufferChunks == 0) {
        return VoidResult::error(validationError("proxy.clientBufferChunks", "must be greater than 0"));
    }

    if (config_.probe.enabled && config_.probe.intervalSeconds == 0) {
        return VoidResult::error(validationError("probe.intervalSeconds", "must be greater than 0"));
    }
    if (config_.probe.windowHours == 0) {
        return VoidResult::error(validationError("probe.windowHours", "must be greater than 0"));
    }

    for (size_t i = 0; i < config_.streams.size(); ++i) {
        if (trimWhitespace(config_.streams[i].infoHash).empty()) {
            return VoidResult::error(validationError(
                "streams[" + std::to_string(i) + "].infoHash", "must not be empty"));
        }
    }

    return VoidResult::success();
}

Configuration ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

std::string ConfigManager::dumpConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    std::ostringstream ss;
    ss << "{\n";
    ss << "  \"server\": {\n";
    ss << "    \"port\": " << config_.server.port << ",\n";
    ss << "    \"bindAddress\": \"" << escapeJson(config_.server.bindAddress) << "\",\n";
    ss << "    \"maxConnections\": " << config_.server.maxConnections << ",\n";
    ss << "    \"requestTimeoutMs\": " << config_.server.requestTimeoutMs << "\n";
    ss << "  },\n";
    ss << "  \"engine\": {\n";
    ss << "    \"baseUrl\": \"" << escapeJson(config_.engine.baseUrl) << "\",\n";
    ss << "    \"startTimeoutMs\": " << config_.engine.startTimeoutMs << ",\n";
    ss << "    \"statsTimeoutMs\": " << config_.engine.statsTimeoutMs << ",\n";
    ss << "    \"stopTimeoutMs\": " << config_.engine.stopTimeoutMs << ",\n";
    ss << "    \"pingTimeoutMs\": " << config_.engine.pingTimeoutMs << "\n";
    ss << "  },\n";
    ss << "  \"proxy\": {\n";
    ss << "    \"writeTimeoutMs\": " << config_.proxy.writeTimeoutMs << ",\n";
    ss << "    \"readyTimeoutMs\": " << config_.proxy.readyTimeoutMs << ",\n";
    ss << "    \"maxAttempts\": " << config_.proxy.maxAttempts << ",\n";
    ss << "    \"retryBaseDelayMs\": " << config_.proxy.retryBaseDelayMs << ",\n";
    ss << "    \"clientBufferChunks\": " << config_.proxy.clientBufferChunks << "\n";
    ss << "  },\n";
    ss << "  \"probe\": {\n";
    ss << "    \"enabled\": " << (config_.probe.enabled ? "true" : "false") << ",\n";
    ss << "    \"intervalSeconds\": " << config_.probe.intervalSeconds << ",\n";
    ss << "    \"timeoutMs\": " << config_.probe.timeoutMs << ",\n";
    ss << "    \"windowHours\": " << config_.probe.windowHours << "\n";
    ss << "  },\n";
    ss << "  \"storage\": {\n";
    ss << "    \"dbPath\": \"" << escapeJson(config_.storage.dbPath) << "\"\n";
    ss << "  },\n";
    ss << "  \"logging\": {\n";
    ss << "    \"level\": \"" << logLevelToString(config_.logging.level) << "\",\n";
    ss << "    \"json\": " << (config_.logging.json ? "true" : "false") << ",\n";
    ss << "    \"syslog\": " << (config_.logging.syslog ? "true" : "false") << "\n";
    ss << "  },\n";
    ss << "  \"streams\": [";
    for (size_t i = 0; i < config_.streams.size(); ++i) {
        ss << (i == 0 ? "\n" : ",\n");
        ss << "    {\"infoHash\": \"" << escapeJson(config_.streams[i].infoHash)
           << "\", \"channel\": \"" << escapeJson(config_.streams[i].channel) << "\"}";
    }
    ss << (config_.streams.empty() ? "]\n" : "\n  ]\n");
    ss << "}\n";
    return ss.str();
}

void ConfigManager::setLogCallback(ConfigLogCallback callback) {
    std::lock_guard<std::mutex> lock(logMutex_);
    logCallback_ = std::move(callback);
}

// =============================================================================
// Private Implementation
// =============================================================================

Result<void, ConfigError> ConfigManager::parseJson(const std::string& content) {
    auto parsed = core::parseJson(content);
    if (parsed.isError()) {
        return VoidResult::error(ConfigError(ConfigError::Code::ParseError,
                                             parsed.error().message + " (" + parsed.error().context + ")"));
    }

    const JsonValue& root = parsed.value();
    if (!root.isObject()) {
        return VoidResult::error(ConfigError(ConfigError::Code::ParseError,
                                             "Configuration root must be an object"));
    }

    // Stage into a copy so a rejected document leaves the live config intact.
    Configuration next = getConfig();

    if (root.contains("server")) {
        const JsonValue& server = root["server"];
        uint32_t port = next.server.port;
        ACEPROXY_CONFIG_TRY(readUint(server, "server", "port", 1, 65535, port));
        next.server.port = static_cast<uint16_t>(port);
        ACEPROXY_CONFIG_TRY(readString(server, "server", "bindAddress", next.server.bindAddress));
        ACEPROXY_CONFIG_TRY(readUint(server, "server", "maxConnections", 1, 100000,
                                     next.server.maxConnections));
        ACEPROXY_CONFIG_TRY(readUint(server, "server", "requestTimeoutMs", 1, kMaxMillis,
                                     next.server.requestTimeoutMs));
    }

    if (root.contains("engine")) {
        const JsonValue& engine = root["engine"];
        ACEPROXY_CONFIG_TRY(readString(engine, "engine", "baseUrl", next.engine.baseUrl));
        ACEPROXY_CONFIG_TRY(readUint(engine, "engine", "startTimeoutMs", 1, kMaxMillis,
                                     next.engine.startTimeoutMs));
        ACEPROXY_CONFIG_TRY(readUint(engine, "engine", "statsTimeoutMs", 1, kMaxMillis,
                                     next.engine.statsTimeoutMs));
        ACEPROXY_CONFIG_TRY(readUint(engine, "engine", "stopTimeoutMs", 1, kMaxMillis,
                                     next.engine.stopTimeoutMs));
        ACEPROXY_CONFIG_TRY(readUint(engine, "engine", "pingTimeoutMs", 1, kMaxMillis,
                                     next.engine.pingTimeoutMs));
    }

    if (root.contains("proxy")) {
        const JsonValue& proxy = root["proxy"];
        ACEPROXY_CONFIG_TRY(readUint(proxy, "proxy", "writeTimeoutMs", 1, kMaxMillis,
                                     next.proxy.writeTimeoutMs));
        ACEPROXY_CONFIG_TRY(readUint(proxy, "proxy", "readyTimeoutMs", 1, kMaxMillis,
                                     next.proxy.readyTimeoutMs));
        ACEPROXY_CONFIG_TRY(readUint(proxy, "proxy", "maxAttempts", 1, 100,
                                     next.proxy.maxAttempts));
        ACEPROXY_CONFIG_TRY(readUint(proxy, "proxy", "retryBaseDelayMs", 0, kMaxMillis,
                                     next.proxy.retryBaseDelayMs));
        ACEPROXY_CONFIG_TRY(readUint(proxy, "proxy", "clientBufferChunks", 1, 65536,
                                     next.proxy.clientBufferChunks));
    }

    if (root.contains("probe")) {
        const JsonValue& probe = root["probe"];
        ACEPROXY_CONFIG_TRY(readBool(probe, "probe", "enabled", next.probe.enabled));
        ACEPROXY_CONFIG_TRY(readUint(probe, "probe", "intervalSeconds", 1, 7u * 24u * 3600u,
                                     next.probe.intervalSeconds));
        ACEPROXY_CONFIG_TRY(readUint(probe, "probe", "timeoutMs", 1, kMaxMillis,
                                     next.probe.timeoutMs));
        ACEPROXY_CONFIG_TRY(readUint(probe, "probe", "windowHours", 1, 24u * 365u,
                                     next.probe.windowHours));
    }

    if (root.contains("storage")) {
        ACEPROXY_CONFIG_TRY(readString(root["storage"], "storage", "dbPath", next.storage.dbPath));
    }

    if (root.contains("logging")) {
        const JsonValue& logging = root["logging"];
        if (logging.contains("level")) {
            std::string levelStr = logging["level"].getString();
            auto level = parseLogLevel(levelStr);
            if (!level) {
                return VoidResult::error(validationError("logging.level",
                    "invalid value '" + levelStr + "'. Valid values: debug, info, warning, error"));
            }
            next.logging.level = *level;
        }
        ACEPROXY_CONFIG_TRY(readBool(logging, "logging", "json", next.logging.json));
        ACEPROXY_CONFIG_TRY(readBool(logging, "logging", "syslog", next.logging.syslog));
    }

    if (root.contains("streams")) {
        const JsonValue& streams = root["streams"];
        if (!streams.isArray()) {
            return VoidResult::error(validationError("streams", "must be an array"));
        }
        next.streams.clear();
        for (size_t i = 0; i < streams.arrayValue.size(); ++i) {
            const JsonValue& entry = streams.arrayValue[i];
            const std::string field = "streams[" + std::to_string(i) + "]";
            if (!entry.isObject() || !entry["infoHash"].isString()) {
                return VoidResult::error(validationError(field + ".infoHash", "must be a string"));
            }
            StreamEntryConfig stream;
            stream.infoHash = entry["infoHash"].stringValue;
            stream.channel = entry["channel"].getString();
            next.streams.push_back(std::move(stream));
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = std::move(next);
    }

    return validate();
}

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::FileNotFound,
                        "Configuration file not found: " + filePath));
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    if (file.bad()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::IOError,
                        "Error reading configuration file: " + filePath));
    }

    return Result<std::string, ConfigError>::success(ss.str());
}

std::optional<LogLevelConfig> ConfigManager::parseLogLevel(const std::string& level) const {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevelConfig::Debug;
    if (lower == "info") return LogLevelConfig::Info;
    if (lower == "warning" || lower == "warn") return LogLevelConfig::Warning;
    if (lower == "error") return LogLevelConfig::Error;
    return std::nullopt;
}

void ConfigManager::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logCallback_) {
        logCallback_(message);
    }
}

void ConfigManager::logEffectiveConfig() const {
    Configuration snapshot = getConfig();
    log("Effective configuration:");
    log("  server.port: " + std::to_string(snapshot.server.port));
    log("  server.bindAddress: " + snapshot.server.bindAddress);
    log("  server.maxConnections: " + std::to_string(snapshot.server.maxConnections));
    log("  engine.baseUrl: " + snapshot.engine.baseUrl);
    log("  proxy.writeTimeoutMs: " + std::to_string(snapshot.proxy.writeTimeoutMs));
    log("  proxy.maxAttempts: " + std::to_string(snapshot.proxy.maxAttempts));
    log("  probe.enabled: " + std::string(snapshot.probe.enabled ? "true" : "false"));
    log("  probe.intervalSeconds: " + std::to_string(snapshot.probe.intervalSeconds));
    log("  storage.dbPath: " + snapshot.storage.dbPath);
    log("  logging.level: " + logLevelToString(snapshot.logging.level));
    log("  streams: " + std::to_string(snapshot.streams.size()));
}

std::optional<std::string> ConfigManager::getEnvVar(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace core
} // namespace aceproxy
