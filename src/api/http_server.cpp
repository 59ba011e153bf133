// AceProxy - AceStream Multiplexing Proxy
// HTTP Server Implementation

#include "aceproxy/api/http_server.hpp"
#include "aceproxy/api/beast_response_writer.hpp"
#include "aceproxy/api/query_string.hpp"

#include <algorithm>
#include <cctype>

#include <boost/asio/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>

namespace aceproxy {
namespace api {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

const char* const kCategory = "HttpServer";
constexpr int kListenBacklog = 128;
constexpr std::chrono::milliseconds kRejectWriteTimeout{1000};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string toString(beast::string_view view) {
    return std::string(view.data(), view.size());
}

HttpRequest toHttpRequest(http::request<http::string_body>&& message, const core::ClientInfo& client) {
    HttpRequest request;
    request.method = toString(message.method_string());
    request.version = message.version() == 11 ? "HTTP/1.1" : "HTTP/1.0";

    std::string target = toString(message.target());
    auto question = target.find('?');
    if (question != std::string::npos) {
        request.rawQuery = target.substr(question + 1);
        target.resize(question);
    }
    request.path = target;
    request.query = parseQueryString(request.rawQuery);

    for (const auto& field : message) {
        request.headers[toLower(toString(field.name_string()))] = toString(field.value());
    }
    request.body = std::move(message.body());

    request.client = client;
    request.client.userAgent = request.header("user-agent");
    return request;
}

} // namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

HttpServer::HttpServer(
    HttpServerConfig config,
    std::shared_ptr<Router> router,
    std::shared_ptr<core::StructuredLogger> logger)
    : config_(std::move(config))
    , router_(std::move(router))
    , logger_(std::move(logger))
{
}

HttpServer::~HttpServer() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

core::Result<void, core::Error> HttpServer::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    if (state_.load() == ServerState::Running) {
        return core::Result<void, core::Error>::success();
    }

    const std::string where = "failed to listen on " + config_.bindAddress + ":" + std::to_string(config_.port);

    beast::error_code ec;
    auto address = asio::ip::make_address(config_.bindAddress, ec);
    if (ec) {
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::InvalidArgument, where + ": invalid bind address", config_.bindAddress));
    }
    tcp::endpoint endpoint(address, config_.port);

    auto fail = [this, &where](core::ErrorCode code, const beast::error_code& cause) {
        beast::error_code ignored;
        acceptor_.close(ignored);
        return core::Result<void, core::Error>::error(core::Error(code, where + ": " + cause.message()));
    };

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        return fail(core::ErrorCode::ListenFailed, ec);
    }
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
        return fail(core::ErrorCode::ListenFailed, ec);
    }
    acceptor_.bind(endpoint, ec);
    if (ec) {
        return fail(ec == asio::error::address_in_use ? core::ErrorCode::AddressInUse
                                                       : core::ErrorCode::BindFailed, ec);
    }
    acceptor_.listen(kListenBacklog, ec);
    if (ec) {
        return fail(core::ErrorCode::ListenFailed, ec);
    }
    acceptor_.non_blocking(true, ec);
    if (ec) {
        return fail(core::ErrorCode::ListenFailed, ec);
    }

    tcp::endpoint local = acceptor_.local_endpoint(ec);
    boundPort_.store(ec ? config_.port : local.port());

    state_.store(ServerState::Running);
    acceptThread_ = std::thread([this]() { acceptLoop(); });

    if (logger_) {
        core::LogContext ctx;
        ctx.with("address", config_.bindAddress)
           .with("port", std::to_string(boundPort_.load()))
           .with("max_connections", std::to_string(config_.maxConnections));
        logger_->logWithContext(core::LogLevelConfig::Info, "HTTP server listening", ctx, kCategory);
    }
    return core::Result<void, core::Error>::success();
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    if (state_.load() != ServerState::Running) {
        return;
    }
    state_.store(ServerState::Stopping);

    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    beast::error_code ignored;
    acceptor_.close(ignored);

    std::list<std::shared_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> connLock(connectionsMutex_);
        connections.swap(connections_);
    }

    // Cancelling the context aborts the connection's socket operations.
    for (auto& conn : connections) {
        conn->context->cancel();
    }
    for (auto& conn : connections) {
        if (conn->thread.joinable()) {
            conn->thread.join();
        }
    }
    connections.clear();

    state_.store(ServerState::Stopped);
    if (logger_) {
        logger_->info("HTTP server stopped", kCategory);
    }
}

HttpServerStats HttpServer::getStats() const {
    HttpServerStats stats;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (const auto& conn : connections_) {
            if (!conn->done.load()) {
                ++stats.activeConnections;
            }
        }
    }
    stats.totalConnections = totalConnections_.load();
    stats.rejectedConnections = rejectedConnections_.load();
    stats.totalRequests = totalRequests_.load();
    return stats;
}

// =============================================================================
// Accept Loop
// =============================================================================

bool HttpServer::waitForAcceptable() {
    bool ready = false;
    acceptor_.async_wait(tcp::acceptor::wait_read, [&ready](beast::error_code ec) {
        ready = !ec;
    });

    acceptIoc_.restart();
    acceptIoc_.run_for(config_.acceptPollInterval);
    if (!acceptIoc_.stopped()) {
        beast::error_code ignored;
        acceptor_.cancel(ignored);
        acceptIoc_.run();
    }
    return ready;
}

void HttpServer::acceptLoop() {
    while (state_.load() == ServerState::Running) {
        if (!waitForAcceptable()) {
            continue;
        }

        auto io = std::make_unique<ConnectionIo>();
        beast::error_code ec;
        acceptor_.accept(io->socket(), ec);
        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            continue;
        }
        if (ec) {
            if (logger_) {
                core::LogContext ctx;
                ctx.errorCode = static_cast<int32_t>(core::ErrorCode::AcceptFailed);
                ctx.with("error", ec.message());
                logger_->logWithContext(core::LogLevelConfig::Error, "Accept failed", ctx, kCategory);
            }
            continue;
        }

        core::ClientInfo client = io->peer();
        io->start();
        ++totalConnections_;

        std::lock_guard<std::mutex> lock(connectionsMutex_);
        reapFinishedConnections();

        if (connections_.size() >= config_.maxConnections) {
            ++rejectedConnections_;
            rejectConnection(*io, client);
            continue;
        }

        auto conn = std::make_shared<Connection>();
        conn->io = std::move(io);
        conn->client = client;
        conn->context = std::make_shared<core::Context>();
        conn->thread = std::thread([this, conn]() {
            serveConnection(conn);
            conn->done.store(true);
        });
        connections_.push_back(std::move(conn));
    }
}

void HttpServer::reapFinishedConnections() {
    // Caller holds connectionsMutex_.
    for (auto it = connections_.begin(); it != connections_.end();) {
        if ((*it)->done.load()) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            it = connections_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::rejectConnection(ConnectionIo& io, const core::ClientInfo& client) {
    BeastResponseWriter writer(io, 11, kRejectWriteTimeout);
    auto sent = sendError(writer, 503, "too many connections");
    io.close();

    if (logger_) {
        core::LogContext ctx;
        ctx.with("client_ip", client.ip)
           .with("max_connections", std::to_string(config_.maxConnections));
        if (sent.isError()) {
            ctx.with("error", sent.error().message);
        }
        logger_->logWithContext(core::LogLevelConfig::Warning, "Connection limit reached", ctx, kCategory);
    }
}

// =============================================================================
// Connection Handling
// =============================================================================

core::Result<HttpRequest, HttpServer::ReadFailure> HttpServer::readRequest(Connection& conn) {
    using ResultType = core::Result<HttpRequest, ReadFailure>;

    http::request_parser<http::string_body> parser;
    parser.header_limit(static_cast<std::uint32_t>(config_.maxHeaderBytes));
    parser.body_limit(config_.maxBodyBytes);
    beast::flat_buffer buffer;

    auto ec = conn.io->run([&parser, &buffer](tcp::socket& socket, ConnectionIo::Completion done) {
        http::async_read(socket, buffer, parser, [done](beast::error_code result, size_t) {
            done(result);
        });
    }, std::chrono::steady_clock::now() + config_.requestTimeout);

    if (!ec) {
        return ResultType::success(toHttpRequest(parser.release(), conn.client));
    }

    ReadFailure failure;
    failure.message = ec.message();
    if (ec == beast::error::timeout) {
        failure.status = 408;
        failure.message = "request timed out";
    } else if (ec == http::error::body_limit) {
        failure.status = 413;
        failure.message = "request body too large";
    } else if (ec == http::error::header_limit) {
        failure.status = 431;
        failure.message = "request header too large";
    } else if (ec == http::error::end_of_stream || ec == http::error::partial_message) {
        failure.status = 0;
    } else if (ec.category() == http::make_error_code(http::error::bad_target).category()) {
        failure.status = 400;
    }
    return ResultType::error(std::move(failure));
}

void HttpServer::serveConnection(const std::shared_ptr<Connection>& conn) {
    ConnectionIo& io = *conn->io;
    std::shared_ptr<core::Context> context = conn->context;

    {
        core::CancelListenerGuard abortOnCancel(*context, [&io]() { io.abort(); });
        auto request = readRequest(*conn);

        if (request.isError()) {
            const auto& failure = request.error();
            if (failure.status != 0) {
                BeastResponseWriter writer(io, 11, config_.writeTimeout);
                auto sent = sendError(writer, failure.status, failure.message);
                if (sent.isError() && logger_) {
                    logger_->debug("Failed to send error response: " + sent.error().message, kCategory);
                }
            } else if (logger_ && logger_->isEnabled(core::LogLevelConfig::Debug)) {
                core::LogContext ctx;
                ctx.with("client_ip", conn->client.ip).with("error", failure.message);
                logger_->logWithContext(core::LogLevelConfig::Debug, "Connection closed before request", ctx,
                                        kCategory);
            }
        } else {
            ++totalRequests_;
            HttpRequest& req = request.value();
            const auto startTime = std::chrono::steady_clock::now();

            io.watchForHangup([context]() { context->cancel(); });

            BeastResponseWriter writer(io, req.version == "HTTP/1.1" ? 11 : 10, config_.writeTimeout);
            auto dispatched = router_->dispatch(*context, req, writer);

            core::Result<void, core::Error> finished = core::Result<void, core::Error>::success();
            if (dispatched.isSuccess()) {
                finished = writer.finish();
            }

            const auto& failure = dispatched.isError() ? dispatched : finished;
            if (failure.isError() && logger_ && logger_->isEnabled(core::LogLevelConfig::Debug)) {
                core::LogContext ctx;
                ctx.errorCode = static_cast<int32_t>(failure.error().code);
                ctx.with("client_ip", req.client.ip)
                   .with("path", req.path)
                   .with("error", failure.error().message);
                logger_->logWithContext(core::LogLevelConfig::Debug, "Response not fully delivered", ctx,
                                        kCategory);
            }

            logAccess(req, writer.status(), writer.bodyBytesSent(),
                      std::chrono::steady_clock::now() - startTime);
        }
    }

    io.close();
}

void HttpServer::logAccess(
    const HttpRequest& request,
    int status,
    uint64_t bytes,
    std::chrono::steady_clock::duration elapsed) const
{
    if (!logger_ || !logger_->isEnabled(core::LogLevelConfig::Info)) {
        return;
    }

    core::LogContext ctx;
    ctx.with("method", request.method)
       .with("path", request.path)
       .with("status", std::to_string(status))
       .with("bytes", std::to_string(bytes))
       .with("duration_ms", std::to_string(
           std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()))
       .with("client_ip", request.client.ip);
    logger_->logWithContext(core::LogLevelConfig::Info, "HTTP request", ctx, kCategory);
}

} // namespace api
} // namespace aceproxy
