// AceProxy - AceStream Multiplexing Proxy
// Server entry point
//
// Usage: aceproxy [-c config.json] [-p port]
//
// Startup order: configuration, logging, storage, engine, services, HTTP
// server. SIGINT or SIGTERM stops everything in reverse order.

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "aceproxy/api/health_handler.hpp"
#include "aceproxy/api/http_server.hpp"
#include "aceproxy/api/metrics_handler.hpp"
#include "aceproxy/api/probe_handler.hpp"
#include "aceproxy/api/proxy_handler.hpp"
#include "aceproxy/core/config_manager.hpp"
#include "aceproxy/core/metrics_collector.hpp"
#include "aceproxy/core/structured_logger.hpp"
#include "aceproxy/engine/acestream_http_engine.hpp"
#include "aceproxy/pal/linux/linux_log_sink.hpp"
#include "aceproxy/probe/health_service.hpp"
#include "aceproxy/probe/probe_scheduler.hpp"
#include "aceproxy/probe/probe_service.hpp"
#include "aceproxy/probe/stream_catalog.hpp"
#include "aceproxy/storage/memory_probe_repository.hpp"
#include "aceproxy/storage/sqlite_probe_repository.hpp"
#include "aceproxy/streaming/proxy_service.hpp"
#include "aceproxy/streaming/session_registry.hpp"

using namespace aceproxy;

namespace {

const char* const kCategory = "Main";

struct CommandLine {
    std::string configPath;
    std::optional<uint16_t> port;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [-c config.json] [-p port]\n";
}

bool parseCommandLine(int argc, char* argv[], CommandLine& out) {
    int opt;
    while ((opt = getopt(argc, argv, "c:p:h")) != -1) {
        switch (opt) {
            case 'c':
                out.configPath = optarg;
                break;
            case 'p': {
                char* end = nullptr;
                long port = std::strtol(optarg, &end, 10);
                if (!end || *end != '\0' || port < 1 || port > 65535) {
                    std::cerr << "Invalid port: " << optarg << "\n";
                    return false;
                }
                out.port = static_cast<uint16_t>(port);
                break;
            }
            default:
                return false;
        }
    }
    return optind == argc;
}

std::shared_ptr<core::StructuredLogger> createLogger(const core::LoggingConfig& config) {
    auto logger = std::make_shared<core::StructuredLogger>();
    logger->setLevel(config.level);
    logger->setJsonFormat(config.json);
    logger->addSink(std::make_shared<pal::linux::ConsoleLogSink>());
    if (config.syslog) {
        logger->addSink(std::make_shared<pal::linux::SyslogLogSink>("aceproxy"));
    }
    return logger;
}

std::shared_ptr<probe::IProbeRepository> openRepository(
    const core::StorageConfig& config,
    const std::shared_ptr<core::StructuredLogger>& logger)
{
    if (config.dbPath.empty()) {
        logger->warning("No database path configured, probe results are kept in memory only", kCategory);
        return std::make_shared<storage::MemoryProbeRepository>();
    }

    auto opened = storage::SqliteProbeRepository::open(config.dbPath, logger);
    if (opened.isError()) {
        core::LogContext ctx;
        ctx.errorCode = static_cast<int32_t>(opened.error().code);
        ctx.with("error", opened.error().message).with("path", config.dbPath);
        logger->logWithContext(core::LogLevelConfig::Error, "Failed to open probe database", ctx, kCategory);
        return nullptr;
    }
    return std::shared_ptr<probe::IProbeRepository>(std::move(opened.value()));
}

/**
 * @brief Block until SIGINT or SIGTERM. The signals must already be blocked
 *        in every thread.
 */
int waitForShutdownSignal(const sigset_t& signals) {
    int signo = 0;
    while (sigwait(&signals, &signo) != 0) {
        // Interrupted; keep waiting.
    }
    return signo;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cli;
    if (!parseCommandLine(argc, argv, cli)) {
        printUsage(argv[0]);
        return 2;
    }

    // -------------------------------------------------------------------------
    // Configuration
    // -------------------------------------------------------------------------

    core::ConfigManager configManager;
    configManager.setLogCallback([](const std::string& line) {
        std::cerr << line << "\n";
    });

    auto loaded = cli.configPath.empty()
        ? configManager.loadDefaults()
        : configManager.loadFromFile(cli.configPath);
    if (loaded.isError()) {
        std::cerr << "Configuration error";
        if (!loaded.error().field.empty()) {
            std::cerr << " in " << loaded.error().field;
        }
        std::cerr << ": " << loaded.error().message << "\n";
        return 1;
    }
    configManager.applyEnvironmentOverrides();

    auto valid = configManager.validate();
    if (valid.isError()) {
        std::cerr << "Invalid configuration (" << valid.error().field << "): "
                  << valid.error().message << "\n";
        return 1;
    }

    core::Configuration config = configManager.getConfig();
    if (cli.port) {
        config.server.port = *cli.port;
    }

    // -------------------------------------------------------------------------
    // Logging and signals
    // -------------------------------------------------------------------------

    auto logger = createLogger(config.logging);

    // Block before any thread starts so every thread inherits the mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    signal(SIGPIPE, SIG_IGN);

    // -------------------------------------------------------------------------
    // Adapters
    // -------------------------------------------------------------------------

    auto repository = openRepository(config.storage, logger);
    if (!repository) {
        return 1;
    }

    std::vector<probe::StreamEntry> entries;
    for (const auto& stream : config.streams) {
        entries.push_back(probe::StreamEntry{stream.infoHash, stream.channel});
    }
    auto catalog = std::make_shared<probe::InMemoryStreamCatalog>(entries);

    engine::AceStreamHttpEngineConfig engineConfig;
    engineConfig.baseUrl = config.engine.baseUrl;
    engineConfig.startTimeout = std::chrono::milliseconds(config.engine.startTimeoutMs);
    engineConfig.statsTimeout = std::chrono::milliseconds(config.engine.statsTimeoutMs);
    engineConfig.stopTimeout = std::chrono::milliseconds(config.engine.stopTimeoutMs);
    engineConfig.pingTimeout = std::chrono::milliseconds(config.engine.pingTimeoutMs);
    auto engine = std::make_shared<engine::AceStreamHttpEngine>(engineConfig, logger);

    // -------------------------------------------------------------------------
    // Services
    // -------------------------------------------------------------------------

    auto metrics = std::make_shared<core::MetricsCollector>();

    streaming::ProxyServiceConfig proxyConfig;
    proxyConfig.writeTimeout = std::chrono::milliseconds(config.proxy.writeTimeoutMs);
    proxyConfig.readyTimeout = std::chrono::milliseconds(config.proxy.readyTimeoutMs);
    proxyConfig.maxAttempts = config.proxy.maxAttempts;
    proxyConfig.retryBaseDelay = std::chrono::milliseconds(config.proxy.retryBaseDelayMs);
    proxyConfig.stopTimeout = std::chrono::milliseconds(config.engine.stopTimeoutMs);
    proxyConfig.clientBufferChunks = config.proxy.clientBufferChunks;
    auto proxy = std::make_shared<streaming::ProxyService>(
        engine, std::make_shared<streaming::SessionRegistry>(), logger, proxyConfig, metrics);

    probe::ProbeServiceConfig probeConfig;
    probeConfig.probeTimeout = std::chrono::milliseconds(config.probe.timeoutMs);
    probeConfig.stopTimeout = std::chrono::milliseconds(config.engine.stopTimeoutMs);
    probeConfig.window = std::chrono::hours(config.probe.windowHours);
    auto probeService = std::make_shared<probe::ProbeService>(repository, catalog, engine, logger, probeConfig);

    auto healthService = std::make_shared<probe::HealthService>(repository, engine, metrics);

    std::unique_ptr<probe::ProbeScheduler> scheduler;
    if (config.probe.enabled) {
        scheduler.reset(new probe::ProbeScheduler(
            probeService, std::chrono::seconds(config.probe.intervalSeconds), logger));
    }

    // -------------------------------------------------------------------------
    // HTTP
    // -------------------------------------------------------------------------

    auto router = std::make_shared<api::Router>();
    api::ProxyHandler proxyHandler(proxy, logger);
    api::ProbeHandler probeHandler(probeService, logger);
    api::HealthHandler healthHandler(healthService);
    api::MetricsHandler metricsHandler(metrics);
    proxyHandler.registerRoutes(*router);
    probeHandler.registerRoutes(*router);
    healthHandler.registerRoutes(*router);
    metricsHandler.registerRoutes(*router);

    api::HttpServerConfig serverConfig;
    serverConfig.bindAddress = config.server.bindAddress;
    serverConfig.port = config.server.port;
    serverConfig.maxConnections = config.server.maxConnections;
    serverConfig.requestTimeout = std::chrono::milliseconds(config.server.requestTimeoutMs);
    serverConfig.writeTimeout = std::chrono::milliseconds(config.proxy.writeTimeoutMs);
    api::HttpServer server(serverConfig, router, logger);

    auto started = server.start();
    if (started.isError()) {
        core::LogContext ctx;
        ctx.errorCode = static_cast<int32_t>(started.error().code);
        ctx.with("error", started.error().message);
        logger->logWithContext(core::LogLevelConfig::Error, "Failed to start HTTP server", ctx, kCategory);
        return 1;
    }

    if (scheduler) {
        scheduler->start();
    }

    {
        core::LogContext ctx;
        ctx.with("port", std::to_string(server.port()))
           .with("engine", config.engine.baseUrl)
           .with("streams", std::to_string(catalog->size()))
           .with("probing", config.probe.enabled ? "true" : "false");
        logger->logWithContext(core::LogLevelConfig::Info, "AceProxy started", ctx, kCategory);
    }

    // -------------------------------------------------------------------------
    // Shutdown
    // -------------------------------------------------------------------------

    int received = waitForShutdownSignal(signals);
    logger->info(std::string("Received ") + (received == SIGINT ? "SIGINT" : "SIGTERM") +
                 ", shutting down", kCategory);

    if (scheduler) {
        scheduler->stop();
    }
    server.stop();
    proxy->shutdown();

    logger->info("AceProxy stopped", kCategory);
    logger->flush();
    return 0;
}
