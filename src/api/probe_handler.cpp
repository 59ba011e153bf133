// AceProxy - AceStream Multiplexing Proxy
// Probe Handler Implementation

#include "aceproxy/api/probe_handler.hpp"
#include "aceproxy/api/response_encoding.hpp"

namespace aceproxy {
namespace api {

namespace {
const char* const kCategory = "ProbeHandler";
}

ProbeHandler::ProbeHandler(
    std::shared_ptr<probe::ProbeService> service,
    std::shared_ptr<core::StructuredLogger> logger)
    : service_(std::move(service))
    , logger_(std::move(logger))
{
}

void ProbeHandler::registerRoutes(Router& router) {
    // /probes/run is registered first so it is not taken for an infohash.
    router.post("/probes/run", [this](core::Context& ctx, const HttpRequest& req, IResponseWriter& w) {
        return handleRun(ctx, req, w);
    });
    router.get("/probes/{infoHash}", [this](core::Context& ctx, const HttpRequest& req, IResponseWriter& w) {
        return handleHistory(ctx, req, w);
    });
    router.get("/probes/{infoHash}/metrics", [this](core::Context& ctx, const HttpRequest& req, IResponseWriter& w) {
        return handleMetrics(ctx, req, w);
    });
    router.get("/quality/{channelName}", [this](core::Context& ctx, const HttpRequest& req, IResponseWriter& w) {
        return handleQuality(ctx, req, w);
    });
}

core::Result<void, core::Error> ProbeHandler::handleHistory(
    core::Context& ctx,
    const HttpRequest& request,
    IResponseWriter& writer)
{
    auto results = service_->getProbeHistory(ctx, request.pathParam("infoHash"));
    if (results.isError()) {
        return internalError(writer, "Failed to load probe history", results.error());
    }
    return sendJson(writer, 200, encodeProbeResults(results.value()));
}

core::Result<void, core::Error> ProbeHandler::handleMetrics(
    core::Context& ctx,
    const HttpRequest& request,
    IResponseWriter& writer)
{
    auto metrics = service_->getMetrics(ctx, request.pathParam("infoHash"));
    if (metrics.isError()) {
        if (metrics.error().code == core::ErrorCode::NoProbeData) {
            return sendError(writer, 404, metrics.error().message);
        }
        return internalError(writer, "Failed to compute metrics", metrics.error());
    }
    return sendJson(writer, 200, encodeMetrics(metrics.value()));
}

core::Result<void, core::Error> ProbeHandler::handleQuality(
    core::Context& ctx,
    const HttpRequest& request,
    IResponseWriter& writer)
{
    auto scores = service_->getQualityScores(ctx, request.pathParam("channelName"));
    if (scores.isError()) {
        return internalError(writer, "Failed to compute quality scores", scores.error());
    }
    return sendJson(writer, 200, encodeQualityScores(scores.value()));
}

core::Result<void, core::Error> ProbeHandler::handleRun(
    core::Context& ctx,
    const HttpRequest& /* request */,
    IResponseWriter& writer)
{
    auto cycle = service_->probeAllStreams(ctx);
    if (cycle.isError()) {
        return sendError(writer, 500, "probe cycle failed: " + cycle.error().message);
    }

    core::JsonWriter json;
    json.beginObject()
        .key("status").value("completed")
        .key("probed").value(static_cast<uint64_t>(cycle.value().probed))
        .key("failed").value(static_cast<uint64_t>(cycle.value().failed))
        .endObject();
    return sendJson(writer, 200, json.str());
}

core::Result<void, core::Error> ProbeHandler::internalError(
    IResponseWriter& writer,
    const std::string& what,
    const core::Error& error)
{
    if (logger_) {
        core::LogContext logCtx;
        logCtx.errorCode = static_cast<int32_t>(error.code);
        logCtx.with("error", error.message);
        logger_->logWithContext(core::LogLevelConfig::Error, what, logCtx, kCategory);
    }
    return sendError(writer, 500, "internal server error");
}

} // namespace api
} // namespace aceproxy
