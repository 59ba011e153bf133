// AceProxy - AceStream Multiplexing Proxy
// AceStream HTTP Engine Implementation

#include "aceproxy/engine/acestream_http_engine.hpp"
#include "aceproxy/core/json.hpp"
#include "aceproxy/streaming/timeout_writer.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <vector>

namespace aceproxy {
namespace engine {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

const char* const kCategory = "AceStreamEngine";
const char* const kUserAgent = "AceProxy";
constexpr int kMaxRedirects = 5;
constexpr size_t kRelayBufferSize = 64 * 1024;

/**
 * @brief Host, port and request target of an http:// URL.
 */
struct UrlTarget {
    std::string host;
    std::string port;
    std::string path;
};

core::Result<UrlTarget, core::Error> parseHttpUrl(const std::string& url) {
    using ResultType = core::Result<UrlTarget, core::Error>;
    static const std::string scheme = "http://";

    if (url.compare(0, scheme.size(), scheme) != 0) {
        return ResultType::error(core::Error(core::ErrorCode::InvalidArgument, "unsupported URL", url));
    }

    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);

    UrlTarget target;
    target.path = slash == std::string::npos ? "/" : rest.substr(slash);
    target.port = "80";

    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            return ResultType::error(core::Error(core::ErrorCode::InvalidArgument, "malformed URL host", url));
        }
        target.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            target.port = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        target.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            target.port = authority.substr(colon + 1);
        }
    }

    if (target.host.empty() || target.port.empty()) {
        return ResultType::error(core::Error(core::ErrorCode::InvalidArgument, "malformed URL host", url));
    }
    return ResultType::success(std::move(target));
}

std::string resolveLocation(const UrlTarget& current, const std::string& location) {
    if (location.compare(0, 7, "http://") == 0 || location.compare(0, 8, "https://") == 0) {
        return location;
    }
    std::string base = "http://" + current.host + ":" + current.port;
    if (!location.empty() && location.front() == '/') {
        return base + location;
    }
    std::string dir = current.path.substr(0, current.path.rfind('/') + 1);
    return base + dir + location;
}

bool isRedirect(unsigned status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

http::request<http::empty_body> makeRequest(const UrlTarget& target) {
    http::request<http::empty_body> req{http::verb::get, target.path, 11};
    req.set(http::field::host, target.port == "80" ? target.host : target.host + ":" + target.port);
    req.set(http::field::user_agent, kUserAgent);
    return req;
}

/**
 * @brief One HTTP exchange with the engine.
 *
 * Every step is started asynchronously and driven on the calling thread
 * until it completes or its time budget runs out. Cancelling the caller's
 * context posts an abort into the private io_context, so a blocked step
 * returns operation_aborted promptly.
 */
class Transfer {
public:
    explicit Transfer(core::Context& ctx)
        : ctx_(ctx)
        , resolver_(ioc_)
        , stream_(ioc_)
        , cancelGuard_(ctx, [this]() { asio::post(ioc_, [this]() { abort(); }); })
    {}

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;

    beast::error_code connect(const UrlTarget& target, std::chrono::milliseconds timeout) {
        if (ctx_.isDone()) {
            return asio::error::operation_aborted;
        }

        auto deadline = core::SteadyClock::now() + timeout;
        beast::error_code result = asio::error::would_block;
        tcp::resolver::results_type endpoints;
        resolver_.async_resolve(target.host, target.port,
            [&](beast::error_code ec, tcp::resolver::results_type found) {
                result = ec;
                endpoints = std::move(found);
            });
        result = wait(result, timeout);
        if (result) {
            return result;
        }

        result = asio::error::would_block;
        stream_.async_connect(endpoints, [&](beast::error_code ec, const tcp::endpoint&) {
            result = ec;
        });
        return wait(result, remaining(deadline));
    }

    template <typename Request>
    beast::error_code send(const Request& request, std::chrono::milliseconds timeout) {
        if (ctx_.isDone()) {
            return asio::error::operation_aborted;
        }
        beast::error_code result = asio::error::would_block;
        http::async_write(stream_, request, [&](beast::error_code ec, size_t) { result = ec; });
        return wait(result, timeout);
    }

    template <typename Message>
    beast::error_code read(Message& message, std::chrono::milliseconds timeout) {
        if (ctx_.isDone()) {
            return asio::error::operation_aborted;
        }
        beast::error_code result = asio::error::would_block;
        http::async_read(stream_, buffer_, message, [&](beast::error_code ec, size_t) { result = ec; });
        return wait(result, timeout);
    }

    template <typename Parser>
    beast::error_code readHeader(Parser& parser, std::chrono::milliseconds timeout) {
        if (ctx_.isDone()) {
            return asio::error::operation_aborted;
        }
        beast::error_code result = asio::error::would_block;
        http::async_read_header(stream_, buffer_, parser, [&](beast::error_code ec, size_t) { result = ec; });
        return wait(result, timeout);
    }

    /**
     * @brief Fill the parser's buffer_body window, or reach end of message.
     */
    template <typename Parser>
    beast::error_code readBody(Parser& parser, std::chrono::milliseconds timeout) {
        beast::error_code ec = read(parser, timeout);
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        return ec;
    }

    static std::chrono::milliseconds remaining(core::TimePoint deadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - core::SteadyClock::now());
        return std::max(left, std::chrono::milliseconds(1));
    }

private:
    beast::error_code wait(beast::error_code& result, std::chrono::milliseconds timeout) {
        ioc_.restart();
        ioc_.run_for(timeout);
        if (result != asio::error::would_block) {
            return result;
        }

        // Budget exhausted: cancel the step and let its handler run.
        abort();
        ioc_.restart();
        ioc_.run();
        return beast::error::timeout;
    }

    void abort() {
        resolver_.cancel();
        stream_.cancel();
    }

    core::Context& ctx_;
    asio::io_context ioc_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    core::CancelListenerGuard cancelGuard_;
};

/**
 * @brief The tighter of an operation timeout and the context deadline.
 */
std::chrono::milliseconds effectiveTimeout(core::Context& ctx, std::chrono::milliseconds timeout) {
    auto deadline = ctx.deadline();
    if (!deadline) {
        return timeout;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline - core::SteadyClock::now());
    if (remaining < timeout) {
        return std::max(remaining, std::chrono::milliseconds(1));
    }
    return timeout;
}

core::Error contextError(core::Context& ctx) {
    core::Error err = ctx.err();
    if (err.isSuccess()) {
        return core::Error(core::ErrorCode::Cancelled, "transfer aborted");
    }
    return err;
}

core::Result<core::JsonValue, core::Error> decodeEnvelope(const std::string& body, const std::string& what) {
    auto parsed = core::parseJson(body);
    if (parsed.isError()) {
        return core::Result<core::JsonValue, core::Error>::error(
            parsed.error().wrap(core::ErrorCode::EngineBadResponse, "failed to decode " + what + " response"));
    }

    const core::JsonValue& root = parsed.value();
    if (root.contains("error") && !root["error"].isNull()) {
        const core::JsonValue& error = root["error"];
        std::string message = error.isString() ? error.stringValue : "unknown engine error";
        return core::Result<core::JsonValue, core::Error>::error(
            core::Error(core::ErrorCode::EngineError, "engine error: " + message));
    }

    return core::Result<core::JsonValue, core::Error>::success(std::move(parsed).value());
}

} // namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

AceStreamHttpEngine::AceStreamHttpEngine(
    AceStreamHttpEngineConfig config,
    std::shared_ptr<core::StructuredLogger> logger)
    : config_(std::move(config))
    , logger_(std::move(logger))
{
    while (!config_.baseUrl.empty() && config_.baseUrl.back() == '/') {
        config_.baseUrl.pop_back();
    }
}

AceStreamHttpEngine::~AceStreamHttpEngine() = default;

// =============================================================================
// Engine Operations
// =============================================================================

core::Result<std::string, core::Error> AceStreamHttpEngine::startStream(
    core::Context& ctx,
    const core::ContentId& contentId,
    const core::ClientId& pid)
{
    const std::string url = buildUrl("/ace/getstream", {
        {"id", contentId},
        {"pid", pid},
        {"format", "json"}
    });
    logDebug("Engine request", url, pid);

    auto response = get(ctx, url, config_.startTimeout, "start stream");
    if (response.isError()) {
        return core::Result<std::string, core::Error>::error(response.error());
    }

    auto status = checkStatus(response.value(), url);
    if (status.isError()) {
        return core::Result<std::string, core::Error>::error(status.error());
    }

    return parseStartResponse(response.value().body);
}

core::Result<StreamStats, core::Error> AceStreamHttpEngine::getStats(
    core::Context& ctx,
    const core::ClientId& pid)
{
    const std::string url = buildUrl("/ace/stat", {
        {"pid", pid},
        {"format", "json"}
    });
    logDebug("Engine request", url, pid);

    auto response = get(ctx, url, config_.statsTimeout, "get stats");
    if (response.isError()) {
        return core::Result<StreamStats, core::Error>::error(response.error());
    }

    auto status = checkStatus(response.value(), url);
    if (status.isError()) {
        return core::Result<StreamStats, core::Error>::error(status.error());
    }

    return parseStatsResponse(response.value().body);
}

core::Result<void, core::Error> AceStreamHttpEngine::stopStream(
    core::Context& ctx,
    const core::ClientId& pid)
{
    const std::string url = buildUrl("/ace/stop", {{"pid", pid}});
    logDebug("Engine request", url, pid);

    auto response = get(ctx, url, config_.stopTimeout, "stop stream");
    if (response.isError()) {
        return core::Result<void, core::Error>::error(response.error());
    }

    return checkStatus(response.value(), url);
}

core::Result<void, core::Error> AceStreamHttpEngine::ping(core::Context& ctx) {
    const std::string url = config_.baseUrl + "/webui/api/service?method=get_version";
    logDebug("Engine request", url, "");

    auto response = get(ctx, url, config_.pingTimeout, "ping");
    if (response.isError()) {
        return core::Result<void, core::Error>::error(
            response.error().wrap(response.error().code, "acestream engine not reachable"));
    }

    if (response.value().status != 200) {
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::EngineError,
            "acestream engine returned status " + std::to_string(response.value().status)));
    }
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> AceStreamHttpEngine::streamContent(
    core::Context& ctx,
    const std::string& streamUrl,
    streaming::IStreamWriter& destination,
    const core::ContentId& contentId,
    const core::ClientId& pid,
    std::chrono::milliseconds writeTimeout)
{
    if (ctx.isDone()) {
        return core::Result<void, core::Error>::error(contextError(ctx));
    }

    streaming::TimeoutWriter writer(destination, writeTimeout);

    if (logger_ && logger_->isEnabled(core::LogLevelConfig::Debug)) {
        core::LogContext logCtx;
        logCtx.contentId = contentId;
        logCtx.clientId = pid;
        logCtx.with("stream_url", streamUrl)
              .with("write_timeout_ms", std::to_string(writeTimeout.count()));
        logger_->logWithContext(core::LogLevelConfig::Debug, "Starting content stream", logCtx, kCategory);
    }

    auto logCompletion = [&](const std::string& reason, const core::Error* error) {
        if (!logger_) {
            return;
        }
        core::LogContext logCtx;
        logCtx.contentId = contentId;
        logCtx.clientId = pid;
        logCtx.with("stream_url", streamUrl)
              .with("bytes_written", std::to_string(writer.bytesWritten()))
              .with("reason", reason);
        if (error) {
            logCtx.errorCode = static_cast<int32_t>(error->code);
            logCtx.with("error", error->message);
        }
        logger_->logWithContext(core::LogLevelConfig::Info, "Content stream completed", logCtx, kCategory);
    };

    auto transportFailure = [&](const beast::error_code& ec) {
        if (ctx.isDone()) {
            core::Error err = contextError(ctx);
            logCompletion("canceled", &err);
            return core::Result<void, core::Error>::error(err);
        }
        core::Error err(core::ErrorCode::ConnectionFailed, "failed to stream content: " + ec.message());
        logCompletion("error", &err);
        return core::Result<void, core::Error>::error(err);
    };

    std::string current = streamUrl;
    for (int redirects = 0;; ++redirects) {
        auto target = parseHttpUrl(current);
        if (target.isError()) {
            core::Error err = target.error().wrap(core::ErrorCode::ConnectionFailed, "failed to stream content");
            logCompletion("error", &err);
            return core::Result<void, core::Error>::error(err);
        }

        Transfer transfer(ctx);
        http::response_parser<http::buffer_body> parser;
        parser.body_limit(boost::none);

        beast::error_code ec = transfer.connect(target.value(), config_.connectTimeout);
        if (!ec) {
            ec = transfer.send(makeRequest(target.value()), config_.connectTimeout);
        }
        if (!ec) {
            ec = transfer.readHeader(parser, effectiveTimeout(ctx, config_.stallTimeout));
        }
        if (ec) {
            return transportFailure(ec);
        }

        const unsigned status = parser.get().result_int();
        auto location = parser.get().find(http::field::location);
        if (isRedirect(status) && location != parser.get().end() && redirects < kMaxRedirects) {
            current = resolveLocation(target.value(), std::string(location->value().data(), location->value().size()));
            continue;
        }

        std::vector<char> buffer(kRelayBufferSize);

        // Error pages are kept for the log, never forwarded to clients.
        if (status != 200) {
            std::string errorBody;
            while (!parser.is_done() && errorBody.size() < MAX_ERROR_BODY_LENGTH) {
                parser.get().body().data = buffer.data();
                parser.get().body().size = buffer.size();
                ec = transfer.readBody(parser, effectiveTimeout(ctx, config_.stallTimeout));
                size_t n = buffer.size() - parser.get().body().size;
                errorBody.append(buffer.data(), std::min(n, MAX_ERROR_BODY_LENGTH - errorBody.size()));
                if (ec) {
                    break;
                }
            }

            if (logger_) {
                core::LogContext logCtx;
                logCtx.contentId = contentId;
                logCtx.clientId = pid;
                logCtx.with("status_code", std::to_string(status))
                      .with("body", errorBody)
                      .with("url", current);
                logger_->logWithContext(core::LogLevelConfig::Error, "Engine HTTP error", logCtx, kCategory);
            }
            return core::Result<void, core::Error>::error(core::Error(
                core::ErrorCode::EngineError, "stream returned status " + std::to_string(status)));
        }

        while (!parser.is_done()) {
            parser.get().body().data = buffer.data();
            parser.get().body().size = buffer.size();
            ec = transfer.readBody(parser, effectiveTimeout(ctx, config_.stallTimeout));

            size_t n = buffer.size() - parser.get().body().size;
            if (n > 0) {
                auto written = writer.write(reinterpret_cast<const uint8_t*>(buffer.data()), n);
                if (written.isError()) {
                    if (streaming::TimeoutWriter::isTimeoutError(written.error())) {
                        logCompletion("slow_client", &written.error());
                        return core::Result<void, core::Error>::error(written.error());
                    }
                    core::Error err = written.error().wrap(written.error().code, "failed to stream content");
                    logCompletion("error", &err);
                    return core::Result<void, core::Error>::error(err);
                }
            }

            if (ec) {
                return transportFailure(ec);
            }
        }

        logCompletion("EOF", nullptr);
        return core::Result<void, core::Error>::success();
    }
}


// =============================================================================
// Response Decoding
// =============================================================================

core::Result<std::string, core::Error> AceStreamHttpEngine::parseStartResponse(const std::string& body) {
    auto root = decodeEnvelope(body, "start stream");
    if (root.isError()) {
        return core::Result<std::string, core::Error>::error(root.error());
    }

    std::string url = root.value()["response"]["playback_url"].getString();
    if (url.empty()) {
        return core::Result<std::string, core::Error>::error(
            core::Error(core::ErrorCode::EngineBadResponse, "engine did not return a stream URL"));
    }
    return core::Result<std::string, core::Error>::success(url);
}

core::Result<StreamStats, core::Error> AceStreamHttpEngine::parseStatsResponse(const std::string& body) {
    auto root = decodeEnvelope(body, "stats");
    if (root.isError()) {
        return core::Result<StreamStats, core::Error>::error(root.error());
    }

    const core::JsonValue& response = root.value()["response"];
    StreamStats stats;
    stats.status = response["status"].getString();
    stats.peers = response["peers"].getInt();
    stats.speedDown = response["speed_down"].getInt();
    stats.speedUp = response["speed_up"].getInt();
    stats.downloaded = response["downloaded"].getInt();
    stats.uploaded = response["uploaded"].getInt();
    return core::Result<StreamStats, core::Error>::success(stats);
}

core::Result<void, core::Error> AceStreamHttpEngine::checkEngineError(const std::string& body) {
    auto root = decodeEnvelope(body, "engine");
    if (root.isError()) {
        return core::Result<void, core::Error>::error(root.error());
    }
    return core::Result<void, core::Error>::success();
}

std::string AceStreamHttpEngine::truncateBody(const std::string& body) {
    if (body.size() <= MAX_ERROR_BODY_LENGTH) {
        return body;
    }
    return body.substr(0, MAX_ERROR_BODY_LENGTH);
}


// =============================================================================
// HTTP Helpers
// =============================================================================

core::Result<AceStreamHttpEngine::HttpResponse, core::Error> AceStreamHttpEngine::get(
    core::Context& ctx,
    const std::string& url,
    std::chrono::milliseconds timeout,
    const char* operation)
{
    using ResultType = core::Result<HttpResponse, core::Error>;

    if (ctx.isDone()) {
        return ResultType::error(contextError(ctx));
    }

    const auto bound = effectiveTimeout(ctx, timeout);
    const auto deadline = core::SteadyClock::now() + bound;

    auto networkError = [&](const std::string& detail) {
        if (logger_) {
            core::LogContext logCtx;
            logCtx.with("operation", operation).with("url", url).with("error", detail);
            logger_->logWithContext(core::LogLevelConfig::Warning, "Engine network error", logCtx, kCategory);
        }
        return ResultType::error(core::Error(
            core::ErrorCode::ConnectionFailed, std::string("failed to ") + operation + ": " + detail));
    };

    std::string current = url;
    for (int redirects = 0;; ++redirects) {
        auto target = parseHttpUrl(current);
        if (target.isError()) {
            return networkError(target.error().message + " " + current);
        }

        Transfer transfer(ctx);
        http::response<http::string_body> res;

        beast::error_code ec = transfer.connect(
            target.value(), std::min(Transfer::remaining(deadline), config_.connectTimeout));
        if (!ec) {
            ec = transfer.send(makeRequest(target.value()), Transfer::remaining(deadline));
        }
        if (!ec) {
            ec = transfer.read(res, Transfer::remaining(deadline));
        }

        if (ec == beast::error::timeout && !ctx.isDone()) {
            if (logger_) {
                core::LogContext logCtx;
                logCtx.with("operation", operation).with("url", url);
                logger_->logWithContext(core::LogLevelConfig::Warning, "Engine operation timeout", logCtx, kCategory);
            }
            return ResultType::error(core::Error(
                core::ErrorCode::Timeout,
                std::string(operation) + " timed out after " + std::to_string(bound.count()) +
                    "ms: " + ec.message()));
        }
        if (ec && ctx.isDone()) {
            return ResultType::error(contextError(ctx));
        }
        if (ec) {
            return networkError(ec.message());
        }

        auto location = res.find(http::field::location);
        if (isRedirect(res.result_int()) && location != res.end() && redirects < kMaxRedirects) {
            current = resolveLocation(target.value(), std::string(location->value().data(), location->value().size()));
            continue;
        }

        HttpResponse response;
        response.status = static_cast<long>(res.result_int());
        response.body = std::move(res.body());
        return ResultType::success(std::move(response));
    }
}

std::string AceStreamHttpEngine::buildUrl(
    const std::string& path,
    const std::map<std::string, std::string>& params) const
{
    std::string url = config_.baseUrl + path;
    char separator = '?';

    for (const auto& param : params) {
        url += separator;
        url += param.first;
        url += '=';

        for (unsigned char c : param.second) {
            if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
                url += static_cast<char>(c);
            } else {
                char escaped[4];
                std::snprintf(escaped, sizeof(escaped), "%%%02X", c);
                url += escaped;
            }
        }
        separator = '&';
    }
    return url;
}

core::Result<void, core::Error> AceStreamHttpEngine::checkStatus(
    const HttpResponse& response,
    const std::string& url) const
{
    if (response.status == 200) {
        return core::Result<void, core::Error>::success();
    }

    const std::string body = truncateBody(response.body);
    if (logger_) {
        core::LogContext logCtx;
        logCtx.with("status_code", std::to_string(response.status))
              .with("body", body)
              .with("url", url);
        logger_->logWithContext(core::LogLevelConfig::Error, "Engine HTTP error", logCtx, kCategory);
    }

    return core::Result<void, core::Error>::error(core::Error(
        core::ErrorCode::EngineError,
        "engine returned status " + std::to_string(response.status) + ": " + body));
}

void AceStreamHttpEngine::logDebug(
    const std::string& message,
    const std::string& url,
    const core::ClientId& pid) const
{
    if (!logger_ || !logger_->isEnabled(core::LogLevelConfig::Debug)) {
        return;
    }
    core::LogContext logCtx;
    logCtx.clientId = pid;
    logCtx.with("method", "GET").with("url", url);
    logger_->logWithContext(core::LogLevelConfig::Debug, message, logCtx, kCategory);
}

} // namespace engine
} // namespace aceproxy
