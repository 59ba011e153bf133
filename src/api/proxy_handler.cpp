// AceProxy - AceStream Multiplexing Proxy
// Proxy Handler Implementation

#include "aceproxy/api/proxy_handler.hpp"
#include "aceproxy/api/response_encoding.hpp"

#include <chrono>

namespace aceproxy {
namespace api {

namespace {
const char* const kCategory = "ProxyHandler";
}

ProxyHandler::ProxyHandler(
    std::shared_ptr<streaming::ProxyService> proxy,
    std::shared_ptr<core::StructuredLogger> logger)
    : proxy_(std::move(proxy))
    , logger_(std::move(logger))
{
}

void ProxyHandler::registerRoutes(Router& router) {
    router.get("/ace/getstream", [this](core::Context& ctx, const HttpRequest& req, IResponseWriter& w) {
        return handleGetStream(ctx, req, w);
    });
    router.get("/ace/streams", [this](core::Context& ctx, const HttpRequest& req, IResponseWriter& w) {
        return handleActiveStreams(ctx, req, w);
    });
}

int ProxyHandler::statusForError(const core::Error& error) {
    switch (error.code) {
        case core::ErrorCode::InvalidContentId:
            return 400;
        case core::ErrorCode::EngineUnavailable:
            return 503;
        case core::ErrorCode::Timeout:
            return 504;
        default:
            return 502;
    }
}

core::Result<void, core::Error> ProxyHandler::handleGetStream(
    core::Context& ctx,
    const HttpRequest& request,
    IResponseWriter& writer)
{
    const std::string contentId = request.queryParam("id");
    if (contentId.empty()) {
        if (logger_) {
            core::LogContext logCtx;
            logCtx.with("remote_addr", request.client.ip).with("error", "missing content id");
            logger_->logWithContext(core::LogLevelConfig::Warning, "Validation error", logCtx, kCategory);
        }
        return sendError(writer, 400, "missing 'id' query parameter");
    }

    if (logger_) {
        logger_->logClientEvent(core::ClientEventType::StreamRequested, request.client, contentId);
    }

    writer.setHeader("Content-Type", "video/mpeg");
    writer.setHeader("Cache-Control", "no-cache, no-store, must-revalidate");
    writer.setHeader("Pragma", "no-cache");
    writer.setHeader("Expires", "0");

    const auto startTime = std::chrono::steady_clock::now();
    auto streamed = proxy_->streamToClient(ctx, contentId, writer);
    const auto durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime).count();

    if (streamed.isSuccess()) {
        if (logger_) {
            logger_->logClientEvent(core::ClientEventType::StreamEnded, request.client, contentId);
        }
        return core::Result<void, core::Error>::success();
    }

    const core::Error& error = streamed.error();
    if (logger_) {
        logger_->logClientEvent(core::ClientEventType::StreamFailed, request.client, contentId);

        core::LogContext logCtx;
        logCtx.contentId = contentId;
        logCtx.errorCode = static_cast<int32_t>(error.code);
        logCtx.with("remote_addr", request.client.ip)
              .with("duration_ms", std::to_string(durationMs))
              .with("error", error.message);
        auto level = error.code == core::ErrorCode::Cancelled
            ? core::LogLevelConfig::Info
            : core::LogLevelConfig::Error;
        logger_->logWithContext(level, "Stream request failed", logCtx, kCategory);
    }

    // The client is gone or already receiving video; nothing more can be said.
    if (writer.headersSent() || ctx.isDone()) {
        return core::Result<void, core::Error>::success();
    }

    const int status = statusForError(error);
    if (status == 503) {
        return sendError(writer, status, "acestream engine unavailable");
    }
    return sendError(writer, status, error.message);
}

core::Result<void, core::Error> ProxyHandler::handleActiveStreams(
    core::Context& /* ctx */,
    const HttpRequest& /* request */,
    IResponseWriter& writer)
{
    auto sessions = proxy_->getActiveStreams();
    if (logger_ && logger_->isEnabled(core::LogLevelConfig::Debug)) {
        core::LogContext logCtx;
        logCtx.with("stream_count", std::to_string(sessions.size()));
        logger_->logWithContext(core::LogLevelConfig::Debug, "Listing active streams", logCtx, kCategory);
    }
    return sendJson(writer, 200, encodeActiveStreams(sessions));
}

} // namespace api
} // namespace aceproxy
