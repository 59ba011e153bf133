// AceProxy - AceStream Multiplexing Proxy
// Tests for Router dispatch

#include <gtest/gtest.h>
#include "aceproxy/api/router.hpp"
#include "aceproxy/core/json.hpp"
#include "support/test_doubles.hpp"

#include <string>

namespace aceproxy {
namespace api {
namespace test {

using aceproxy::test::RecordingResponseWriter;

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        router_.get("/api/v1/streams/{infohash}/metrics",
            [this](core::Context&, const HttpRequest& request, IResponseWriter& writer) {
                lastHandler_ = "metrics";
                lastParam_ = request.pathParam("infohash");
                return sendJson(writer, 200, "{}");
            });
        router_.post("/api/v1/probes/run",
            [this](core::Context&, const HttpRequest&, IResponseWriter& writer) {
                lastHandler_ = "run";
                return sendJson(writer, 200, "{}");
            });
        router_.get("/api/v1/probes/run",
            [this](core::Context&, const HttpRequest&, IResponseWriter& writer) {
                lastHandler_ = "run-get";
                return sendJson(writer, 200, "{}");
            });
    }

    HttpRequest request(const std::string& method, const std::string& path) {
        HttpRequest req;
        req.method = method;
        req.path = path;
        return req;
    }

    core::Context ctx_;
    Router router_;
    std::string lastHandler_;
    std::string lastParam_;
};

TEST_F(RouterTest, DispatchesByMethodAndPath) {
    RecordingResponseWriter writer;
    auto req = request("POST", "/api/v1/probes/run");

    ASSERT_TRUE(router_.dispatch(ctx_, req, writer).isSuccess());
    EXPECT_EQ(lastHandler_, "run");
    EXPECT_EQ(writer.status(), 200);
    EXPECT_EQ(router_.routeCount(), 3u);
}

TEST_F(RouterTest, BindsDecodedPathParameters) {
    RecordingResponseWriter writer;
    auto req = request("GET", "/api/v1/streams/abc%20123/metrics");

    ASSERT_TRUE(router_.dispatch(ctx_, req, writer).isSuccess());
    EXPECT_EQ(lastHandler_, "metrics");
    EXPECT_EQ(lastParam_, "abc 123");
    EXPECT_EQ(req.pathParam("infohash"), "abc 123");
}

TEST_F(RouterTest, RepeatedSlashesAreIgnored) {
    RecordingResponseWriter writer;
    auto req = request("POST", "//api/v1//probes/run/");

    ASSERT_TRUE(router_.dispatch(ctx_, req, writer).isSuccess());
    EXPECT_EQ(lastHandler_, "run");
}

TEST_F(RouterTest, UnknownPathIsNotFound) {
    RecordingResponseWriter writer;
    auto req = request("GET", "/api/v1/streams");

    ASSERT_TRUE(router_.dispatch(ctx_, req, writer).isSuccess());
    EXPECT_EQ(writer.status(), 404);
    EXPECT_TRUE(lastHandler_.empty());

    auto body = core::parseJson(writer.bodyText());
    ASSERT_TRUE(body.isSuccess());
    EXPECT_EQ(body.value()["error"].getString(""), "not found");
}

TEST_F(RouterTest, WrongMethodListsAllowedMethods) {
    RecordingResponseWriter writer;
    auto req = request("DELETE", "/api/v1/probes/run");

    ASSERT_TRUE(router_.dispatch(ctx_, req, writer).isSuccess());
    EXPECT_EQ(writer.status(), 405);
    EXPECT_EQ(writer.headers["Allow"], "POST, GET");
}

TEST_F(RouterTest, EarlierRouteWins) {
    router_.get("/api/v1/streams/{other}/metrics",
        [this](core::Context&, const HttpRequest&, IResponseWriter& writer) {
            lastHandler_ = "shadowed";
            return sendJson(writer, 200, "{}");
        });

    RecordingResponseWriter writer;
    auto req = request("GET", "/api/v1/streams/x/metrics");

    ASSERT_TRUE(router_.dispatch(ctx_, req, writer).isSuccess());
    EXPECT_EQ(lastHandler_, "metrics");
}

} // namespace test
} // namespace api
} // namespace aceproxy
