// AceProxy - AceStream Multiplexing Proxy
// Tests for the proxy, probe and health request handlers

#include <gtest/gtest.h>
#include "aceproxy/api/health_handler.hpp"
#include "aceproxy/api/metrics_handler.hpp"
#include "aceproxy/api/probe_handler.hpp"
#include "aceproxy/api/proxy_handler.hpp"
#include "aceproxy/core/json.hpp"
#include "aceproxy/probe/stream_catalog.hpp"
#include "aceproxy/storage/memory_probe_repository.hpp"
#include "support/test_doubles.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace aceproxy {
namespace api {
namespace test {

using namespace std::chrono_literals;
using aceproxy::test::FakeEngine;
using aceproxy::test::RecordingResponseWriter;

namespace {

HttpRequest makeRequest(const std::string& method, const std::string& path,
                        const std::map<std::string, std::string>& query = {}) {
    HttpRequest request;
    request.method = method;
    request.path = path;
    request.query = query;
    request.client.ip = "192.0.2.10";
    request.client.port = 51000;
    return request;
}

core::JsonValue parseBody(const RecordingResponseWriter& writer) {
    auto parsed = core::parseJson(writer.bodyText());
    EXPECT_TRUE(parsed.isSuccess()) << writer.bodyText();
    return parsed.isSuccess() ? parsed.value() : core::JsonValue();
}

} // namespace

// =============================================================================
// Proxy Handler Tests
// =============================================================================

class ProxyHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_shared<FakeEngine>();
        streaming::ProxyServiceConfig config;
        config.retryBaseDelay = 10ms;
        config.stopTimeout = 200ms;
        proxy_ = std::make_shared<streaming::ProxyService>(
            engine_, std::make_shared<streaming::SessionRegistry>(), nullptr, config);
        handler_ = std::make_unique<ProxyHandler>(proxy_);
        handler_->registerRoutes(router_);
    }

    void TearDown() override {
        handler_.reset();
        proxy_->shutdown();
        proxy_.reset();
    }

    core::Context ctx_;
    Router router_;
    std::shared_ptr<FakeEngine> engine_;
    std::shared_ptr<streaming::ProxyService> proxy_;
    std::unique_ptr<ProxyHandler> handler_;
};

TEST_F(ProxyHandlerTest, MissingIdIsBadRequest) {
    RecordingResponseWriter writer;
    auto request = makeRequest("GET", "/ace/getstream");

    ASSERT_TRUE(router_.dispatch(ctx_, request, writer).isSuccess());

    EXPECT_EQ(writer.status(), 400);
    EXPECT_EQ(writer.headers["Content-Type"], "application/json");
    EXPECT_EQ(parseBody(writer)["error"].getString(""), "missing 'id' query parameter");
    EXPECT_EQ(engine_->startCallCount(), 0);
}

TEST_F(ProxyHandlerTest, StreamsAsVideoMpeg) {
    RecordingResponseWriter writer;
    auto request = makeRequest("GET", "/ace/getstream", {{"id", "content-1"}});

    ASSERT_TRUE(router_.dispatch(ctx_, request, writer).isSuccess());

    EXPECT_EQ(writer.status(), 200);
    EXPECT_EQ(writer.headers["Content-Type"], "video/mpeg");
    EXPECT_EQ(writer.headers["Cache-Control"], "no-cache, no-store, must-revalidate");
    EXPECT_EQ(writer.headers["Pragma"], "no-cache");
    EXPECT_EQ(writer.headers["Expires"], "0");
    EXPECT_EQ(writer.bodyText(), "stream-bytes");
}

TEST_F(ProxyHandlerTest, EngineUnavailableIsServiceUnavailable) {
    engine_->startResults.push_back(core::Result<std::string, core::Error>::error(
        core::Error(core::ErrorCode::ConnectionFailed, "connection refused")));

    RecordingResponseWriter writer;
    auto request = makeRequest("GET", "/ace/getstream", {{"id", "content-1"}});

    ASSERT_TRUE(router_.dispatch(ctx_, request, writer).isSuccess());

    EXPECT_EQ(writer.status(), 503);
    EXPECT_EQ(writer.headers["Content-Type"], "application/json");
    EXPECT_EQ(parseBody(writer)["error"].getString(""), "acestream engine unavailable");
}

TEST_F(ProxyHandlerTest, FailureAfterFirstByteJustEnds) {
    engine_->setContentFn([](core::Context&, streaming::IStreamWriter& out, int) {
        const std::string part = "partial";
        auto written = out.write(reinterpret_cast<const uint8_t*>(part.data()), part.size());
        (void)written;
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::NetworkError, "upstream reset"));
    });

    RecordingResponseWriter writer;
    auto request = makeRequest("GET", "/ace/getstream", {{"id", "content-1"}});

    ASSERT_TRUE(router_.dispatch(ctx_, request, writer).isSuccess());

    EXPECT_EQ(writer.status(), 200);
    EXPECT_EQ(writer.headers["Content-Type"], "video/mpeg");
    EXPECT_EQ(writer.bodyText().find("partial"), 0u);
    EXPECT_EQ(writer.bodyText().find("error"), std::string::npos);
}

TEST_F(ProxyHandlerTest, JoiningEndedStreamIsBadGateway) {
    aceproxy::test::RecordingWriter slowOutput;
    slowOutput.writeDelay = 500ms;
    core::Context firstCtx;
    std::thread first([this, &firstCtx, &slowOutput]() {
        auto result = proxy_->streamToClient(firstCtx, "content-1", slowOutput);
        EXPECT_TRUE(result.isSuccess());
    });

    std::this_thread::sleep_for(150ms);
    RecordingResponseWriter writer;
    auto request = makeRequest("GET", "/ace/getstream", {{"id", "content-1"}});
    ASSERT_TRUE(router_.dispatch(ctx_, request, writer).isSuccess());
    first.join();

    EXPECT_EQ(writer.status(), 502);
    EXPECT_EQ(writer.headers["Content-Type"], "application/json");
    EXPECT_EQ(parseBody(writer)["error"].getString(""), "stream session closed");
    EXPECT_EQ(engine_->startCallCount(), 1);
    EXPECT_EQ(slowOutput.data(), "stream-bytes");
}

TEST_F(ProxyHandlerTest, ActiveStreamsListsNothingWhenIdle) {
    RecordingResponseWriter writer;
    auto request = makeRequest("GET", "/ace/streams");

    ASSERT_TRUE(router_.dispatch(ctx_, request, writer).isSuccess());

    EXPECT_EQ(writer.status(), 200);
    auto body = parseBody(writer);
    EXPECT_TRUE(body["streams"].isArray());
    EXPECT_TRUE(body["streams"].arrayValue.empty());
}

TEST(ProxyHandlerStatusTest, ErrorsMapToStatusCodes) {
    EXPECT_EQ(ProxyHandler::statusForError(core::Error(core::ErrorCode::InvalidContentId, "")), 400);
    EXPECT_EQ(ProxyHandler::statusForError(core::Error(core::ErrorCode::EngineUnavailable, "")), 503);
    EXPECT_EQ(ProxyHandler::statusForError(core::Error(core::ErrorCode::Timeout, "")), 504);
    EXPECT_EQ(ProxyHandler::statusForError(core::Error(core::ErrorCode::ReconnectExhausted, "")), 502);
    EXPECT_EQ(ProxyHandler::statusForError(core::Error(core::ErrorCode::StreamNotActive, "")), 502);
}

// =============================================================================
// Probe Handler Tests
// =============================================================================

class ProbeHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<storage::MemoryProbeRepository>();
        auto catalog = std::make_shared<probe::InMemoryStreamCatalog>(std::vector<probe::StreamEntry>{
            {"hash-a", "Sports HD"},
            {"hash-b", "Sports HD"},
        });
        engine_ = std::make_shared<FakeEngine>();
        engine_->stats.peers = 9;
        engine_->stats.speedDown = 512;
        engine_->stats.status = "dl";

        service_ = std::make_shared<probe::ProbeService>(repository_, catalog, engine_);
        handler_ = std::make_unique<ProbeHandler>(service_);
        handler_->registerRoutes(router_);
    }

    RecordingResponseWriter& dispatch(HttpRequest request) {
        writers_.push_back(std::make_unique<RecordingResponseWriter>());
        auto dispatched = router_.dispatch(ctx_, request, *writers_.back());
        EXPECT_TRUE(dispatched.isSuccess());
        return *writers_.back();
    }

    core::Context ctx_;
    Router router_;
    std::shared_ptr<storage::MemoryProbeRepository> repository_;
    std::shared_ptr<FakeEngine> engine_;
    std::shared_ptr<probe::ProbeService> service_;
    std::unique_ptr<ProbeHandler> handler_;
    std::vector<std::unique_ptr<RecordingResponseWriter>> writers_;
};

TEST_F(ProbeHandlerTest, RunReportsCycleSummary) {
    auto& writer = dispatch(makeRequest("POST", "/probes/run"));

    EXPECT_EQ(writer.status(), 200);
    auto body = parseBody(writer);
    EXPECT_EQ(body["status"].getString(""), "completed");
    EXPECT_EQ(body["probed"].getDouble(-1), 2.0);
    EXPECT_EQ(body["failed"].getDouble(-1), 0.0);
    EXPECT_EQ(repository_->size(), 2u);
}

TEST_F(ProbeHandlerTest, HistoryListsResultsAfterRun) {
    dispatch(makeRequest("POST", "/probes/run"));

    auto& writer = dispatch(makeRequest("GET", "/probes/hash-a"));

    EXPECT_EQ(writer.status(), 200);
    auto body = parseBody(writer);
    ASSERT_TRUE(body.isArray());
    ASSERT_EQ(body.arrayValue.size(), 1u);
    EXPECT_EQ(body.arrayValue[0]["info_hash"].getString(""), "hash-a");
    EXPECT_TRUE(body.arrayValue[0]["available"].getBool(false));
    EXPECT_EQ(body.arrayValue[0]["peer_count"].getDouble(0), 9.0);
    EXPECT_FALSE(body.arrayValue[0].contains("error_message"));
}

TEST_F(ProbeHandlerTest, MetricsWithoutDataIsNotFound) {
    auto& writer = dispatch(makeRequest("GET", "/probes/hash-a/metrics"));

    EXPECT_EQ(writer.status(), 404);
    EXPECT_EQ(parseBody(writer)["error"].getString(""), "no probe data available");
}

TEST_F(ProbeHandlerTest, MetricsAfterRun) {
    dispatch(makeRequest("POST", "/probes/run"));

    auto& writer = dispatch(makeRequest("GET", "/probes/hash-b/metrics"));

    EXPECT_EQ(writer.status(), 200);
    auto body = parseBody(writer);
    EXPECT_EQ(body["info_hash"].getString(""), "hash-b");
    EXPECT_EQ(body["total_probes"].getDouble(0), 1.0);
    EXPECT_EQ(body["uptime_ratio"].getDouble(0), 1.0);
    EXPECT_EQ(body["avg_download_speed"].getDouble(0), 512.0);
}

TEST_F(ProbeHandlerTest, QualityRanksChannel) {
    dispatch(makeRequest("POST", "/probes/run"));

    auto& writer = dispatch(makeRequest("GET", "/quality/Sports%20HD"));

    EXPECT_EQ(writer.status(), 200);
    auto body = parseBody(writer);
    ASSERT_TRUE(body.isArray());
    ASSERT_EQ(body.arrayValue.size(), 2u);
    EXPECT_GE(body.arrayValue[0]["score"].getDouble(-1), body.arrayValue[1]["score"].getDouble(-1));
    EXPECT_TRUE(body.arrayValue[0]["metrics"].isObject());
}

TEST_F(ProbeHandlerTest, StorageFailureHidesDetail) {
    ctx_.cancel();

    auto& writer = dispatch(makeRequest("GET", "/probes/hash-a"));

    EXPECT_EQ(writer.status(), 500);
    EXPECT_EQ(parseBody(writer)["error"].getString(""), "internal server error");
}

// =============================================================================
// Health Handler Tests
// =============================================================================

TEST(HealthHandlerTest, HealthyIsOk) {
    auto engine = std::make_shared<FakeEngine>();
    HealthHandler handler(std::make_shared<probe::HealthService>(
        std::make_shared<storage::MemoryProbeRepository>(), engine));
    core::Context ctx;
    RecordingResponseWriter writer;

    ASSERT_TRUE(handler.handleHealth(ctx, makeRequest("GET", "/health"), writer).isSuccess());

    EXPECT_EQ(writer.status(), 200);
    auto body = parseBody(writer);
    EXPECT_EQ(body["status"].getString(""), "ok");
    EXPECT_EQ(body["checks"]["database"].getString(""), "ok");
    EXPECT_EQ(body["checks"]["engine"].getString(""), "ok");
}

TEST(HealthHandlerTest, EngineDownIsServiceUnavailable) {
    auto engine = std::make_shared<FakeEngine>();
    engine->pingError = core::Error(core::ErrorCode::EngineUnavailable, "acestream engine not reachable");
    HealthHandler handler(std::make_shared<probe::HealthService>(
        std::make_shared<storage::MemoryProbeRepository>(), engine));
    core::Context ctx;
    RecordingResponseWriter writer;

    ASSERT_TRUE(handler.handleHealth(ctx, makeRequest("GET", "/health"), writer).isSuccess());

    EXPECT_EQ(writer.status(), 503);
    auto body = parseBody(writer);
    EXPECT_EQ(body["status"].getString(""), "degraded");
    EXPECT_EQ(body["checks"]["engine"].getString(""), "error: acestream engine not reachable");
}

// =============================================================================
// Metrics Handler Tests
// =============================================================================

TEST(MetricsHandlerTest, ServesPrometheusText) {
    auto metrics = std::make_shared<core::MetricsCollector>();
    metrics->incrementStreams();
    metrics->incrementClients();
    metrics->incrementClients();
    metrics->recordUpstreamReconnection("abc");
    metrics->recordUpstreamError("abc", core::upstream_error::kConnectionLost);
    metrics->recordHealthCheckFailure();

    MetricsHandler handler(metrics);
    Router router;
    handler.registerRoutes(router);
    core::Context ctx;
    RecordingResponseWriter writer;

    HttpRequest request = makeRequest("GET", "/metrics");
    ASSERT_TRUE(router.dispatch(ctx, request, writer).isSuccess());

    EXPECT_EQ(writer.status(), 200);
    EXPECT_EQ(writer.headers["Content-Type"], "text/plain; version=0.0.4; charset=utf-8");
    const std::string body = writer.bodyText();
    EXPECT_NE(body.find("aceproxy_streams_active 1\n"), std::string::npos) << body;
    EXPECT_NE(body.find("aceproxy_clients_connected 2\n"), std::string::npos);
    EXPECT_NE(body.find("aceproxy_upstream_reconnections_total{content_id=\"abc\"} 1\n"), std::string::npos);
    EXPECT_NE(body.find("aceproxy_upstream_errors_total{content_id=\"abc\",error_type=\"connection_lost\"} 1\n"),
              std::string::npos);
    EXPECT_NE(body.find("aceproxy_health_check_failures_total 1\n"), std::string::npos);
}

TEST(HealthHandlerTest, DegradedCheckShowsUpInMetrics) {
    auto engine = std::make_shared<FakeEngine>();
    engine->pingError = core::Error(core::ErrorCode::EngineUnavailable, "acestream engine not reachable");
    auto metrics = std::make_shared<core::MetricsCollector>();
    HealthHandler health(std::make_shared<probe::HealthService>(
        std::make_shared<storage::MemoryProbeRepository>(), engine, metrics));
    MetricsHandler handler(metrics);
    core::Context ctx;

    RecordingResponseWriter healthWriter;
    ASSERT_TRUE(health.handleHealth(ctx, makeRequest("GET", "/health"), healthWriter).isSuccess());
    RecordingResponseWriter metricsWriter;
    ASSERT_TRUE(handler.handleMetrics(ctx, makeRequest("GET", "/metrics"), metricsWriter).isSuccess());

    EXPECT_EQ(healthWriter.status(), 503);
    EXPECT_NE(metricsWriter.bodyText().find("aceproxy_health_check_failures_total 1\n"), std::string::npos);
}

} // namespace test
} // namespace api
} // namespace aceproxy
