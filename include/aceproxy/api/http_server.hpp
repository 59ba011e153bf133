// AceProxy - AceStream Multiplexing Proxy
// HTTP Server - Boost.Beast HTTP/1.x server with one thread per connection
//
// Responsibilities:
// - Accept connections up to a configured cap, answering 503 beyond it
// - Parse one request per connection with Beast within a request timeout
// - Dispatch through the Router with a per-connection cancellation context
// - Cancel that context when the client hangs up mid-response
// - Stop promptly, cancelling in-flight requests

#ifndef ACEPROXY_API_HTTP_SERVER_HPP
#define ACEPROXY_API_HTTP_SERVER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "aceproxy/api/connection_io.hpp"
#include "aceproxy/api/router.hpp"
#include "aceproxy/core/context.hpp"
#include "aceproxy/core/structured_logger.hpp"

namespace aceproxy {
namespace api {

// =============================================================================
// Server State
// =============================================================================

enum class ServerState {
    Stopped,
    Running,
    Stopping
};

inline const char* serverStateToString(ServerState state) {
    switch (state) {
        case ServerState::Stopped:  return "Stopped";
        case ServerState::Running:  return "Running";
        case ServerState::Stopping: return "Stopping";
        default:                    return "Unknown";
    }
}

// =============================================================================
// Configuration Types
// =============================================================================

struct HttpServerConfig {
    /// Address to bind to ("0.0.0.0" for all interfaces)
    std::string bindAddress = "0.0.0.0";
    /// Port to listen on (0 picks an ephemeral port)
    uint16_t port = 8080;
    /// Maximum concurrent connections
    uint32_t maxConnections = 256;
    /// Time allowed to receive a complete request
    std::chrono::milliseconds requestTimeout{10000};
    /// Deadline for writes not covered by a handler's own deadline
    std::chrono::milliseconds writeTimeout{10000};
    size_t maxHeaderBytes = 16 * 1024;
    size_t maxBodyBytes = 1024 * 1024;
    /// How often the accept loop re-checks for shutdown
    std::chrono::milliseconds acceptPollInterval{200};
};

struct HttpServerStats {
    uint32_t activeConnections = 0;
    uint64_t totalConnections = 0;
    uint64_t rejectedConnections = 0;
    uint64_t totalRequests = 0;
};

// =============================================================================
// HttpServer
// =============================================================================

/**
 * @brief HTTP/1.x server dispatching to a Router.
 *
 * Each accepted connection runs on its own thread and serves one request.
 * While a handler runs, the connection's IO loop keeps a read pending on
 * the socket and cancels the request context when the client hangs up, so
 * long-lived streaming handlers notice a departed client without writing
 * to it.
 *
 * ## Thread Safety
 * start(), stop() and getStats() may be called from any thread.
 */
class HttpServer {
public:
    HttpServer(
        HttpServerConfig config,
        std::shared_ptr<Router> router,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, listen and start the accept thread.
     */
    core::Result<void, core::Error> start();

    /**
     * @brief Stop accepting, cancel in-flight requests and join every thread.
     *
     * Idempotent.
     */
    void stop();

    ServerState state() const { return state_.load(); }
    bool isRunning() const { return state_.load() == ServerState::Running; }

    /// Bound port, valid after start().
    uint16_t port() const { return boundPort_.load(); }

    HttpServerStats getStats() const;

private:
    struct Connection {
        std::unique_ptr<ConnectionIo> io;
        core::ClientInfo client;
        std::shared_ptr<core::Context> context;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void acceptLoop();
    bool waitForAcceptable();
    void serveConnection(const std::shared_ptr<Connection>& conn);
    void rejectConnection(ConnectionIo& io, const core::ClientInfo& client);

    /// Status to answer with when the request cannot be read, 0 to close silently.
    struct ReadFailure {
        int status = 0;
        std::string message;
    };
    core::Result<HttpRequest, ReadFailure> readRequest(Connection& conn);
    void reapFinishedConnections();

    void logAccess(
        const HttpRequest& request,
        int status,
        uint64_t bytes,
        std::chrono::steady_clock::duration elapsed
    ) const;

    HttpServerConfig config_;
    std::shared_ptr<Router> router_;
    std::shared_ptr<core::StructuredLogger> logger_;

    std::atomic<ServerState> state_{ServerState::Stopped};
    std::atomic<uint16_t> boundPort_{0};
    boost::asio::io_context acceptIoc_;
    boost::asio::ip::tcp::acceptor acceptor_{acceptIoc_};
    std::thread acceptThread_;
    std::mutex lifecycleMutex_;

    mutable std::mutex connectionsMutex_;
    std::list<std::shared_ptr<Connection>> connections_;

    std::atomic<uint64_t> totalConnections_{0};
    std::atomic<uint64_t> rejectedConnections_{0};
    std::atomic<uint64_t> totalRequests_{0};
};

} // namespace api
} // namespace aceproxy

#endif // ACEPROXY_API_HTTP_SERVER_HPP
