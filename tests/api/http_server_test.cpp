// AceProxy - AceStream Multiplexing Proxy
// Tests for HttpServer over real loopback sockets

#include <gtest/gtest.h>
#include "aceproxy/api/http_server.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace aceproxy {
namespace api {
namespace test {

using namespace std::chrono_literals;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

using Client = std::shared_ptr<tcp::socket>;

/// Blocking loopback client; null when the connection is refused.
Client connectTo(asio::io_context& ioc, uint16_t port) {
    auto socket = std::make_shared<tcp::socket>(ioc);
    boost::system::error_code ec;
    socket->connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
    if (ec) {
        return nullptr;
    }
    return socket;
}

bool sendText(const Client& client, const std::string& text) {
    boost::system::error_code ec;
    asio::write(*client, asio::buffer(text), ec);
    return !ec;
}

/// Reads until the server closes its side.
std::string readAll(const Client& client) {
    std::string out;
    boost::system::error_code ec;
    asio::read(*client, asio::dynamic_buffer(out), ec);
    return out;
}

std::string bodyOf(const std::string& response) {
    size_t end = response.find("\r\n\r\n");
    return end == std::string::npos ? std::string() : response.substr(end + 4);
}

template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        router_ = std::make_shared<Router>();
        router_->get("/hello", [](core::Context&, const HttpRequest& req, IResponseWriter& w) {
            return sendJson(w, 200, "{\"name\":\"" + req.queryParam("name") + "\"}");
        });
        router_->get("/stream", [](core::Context&, const HttpRequest&, IResponseWriter& w) {
            w.setHeader("Content-Type", "video/mpeg");
            const std::string parts[] = {"hello", " world"};
            for (const auto& part : parts) {
                auto written = w.write(reinterpret_cast<const uint8_t*>(part.data()), part.size());
                if (written.isError()) {
                    return core::Result<void, core::Error>::error(written.error());
                }
            }
            return core::Result<void, core::Error>::success();
        });
        router_->post("/echo", [](core::Context&, const HttpRequest& req, IResponseWriter& w) {
            return sendJson(w, 200, req.body);
        });
        router_->get("/whoami", [](core::Context&, const HttpRequest& req, IResponseWriter& w) {
            return sendJson(w, 200, "{\"agent\":\"" + req.client.userAgent + "\",\"tag\":\"" +
                                        req.header("X-Tag") + "\",\"local\":" +
                                        (req.client.ip == "127.0.0.1" ? "true" : "false") + "}");
        });
        router_->get("/block", [this](core::Context& ctx, const HttpRequest&, IResponseWriter& w) {
            blockEntered_.store(true);
            if (!ctx.sleepFor(10s)) {
                blockCancelled_.store(true);
                return core::Result<void, core::Error>::success();
            }
            return sendJson(w, 200, "{}");
        });

        config_.bindAddress = "127.0.0.1";
        config_.port = 0;
        config_.acceptPollInterval = 20ms;
    }

    void TearDown() override {
        for (auto& client : clients_) {
            boost::system::error_code ignored;
            client->close(ignored);
        }
        if (server_) {
            server_->stop();
        }
    }

    void startServer() {
        server_ = std::make_unique<HttpServer>(config_, router_);
        auto started = server_->start();
        ASSERT_TRUE(started.isSuccess()) << started.error().toString();
        ASSERT_NE(server_->port(), 0);
    }

    Client open() {
        Client client = connectTo(ioc_, server_->port());
        EXPECT_NE(client, nullptr);
        if (client) {
            clients_.push_back(client);
        }
        return client;
    }

    std::string roundTrip(const std::string& raw) {
        Client client = open();
        if (!client || !sendText(client, raw)) {
            return std::string();
        }
        return readAll(client);
    }

    std::shared_ptr<Router> router_;
    HttpServerConfig config_;
    std::unique_ptr<HttpServer> server_;
    asio::io_context ioc_;
    std::vector<Client> clients_;
    std::atomic<bool> blockEntered_{false};
    std::atomic<bool> blockCancelled_{false};
};

// =============================================================================
// Lifecycle Tests
// =============================================================================

TEST_F(HttpServerTest, StartsOnEphemeralPort) {
    startServer();

    EXPECT_TRUE(server_->isRunning());
    EXPECT_EQ(server_->state(), ServerState::Running);
}

TEST_F(HttpServerTest, StopIsIdempotent) {
    startServer();

    server_->stop();
    server_->stop();

    EXPECT_EQ(server_->state(), ServerState::Stopped);
    EXPECT_EQ(connectTo(ioc_, server_->port()), nullptr);
}

TEST_F(HttpServerTest, SecondServerOnSamePortFails) {
    startServer();

    HttpServerConfig clash = config_;
    clash.port = server_->port();
    HttpServer other(clash, router_);

    auto started = other.start();
    EXPECT_TRUE(started.isError());
    EXPECT_FALSE(other.isRunning());
}

// =============================================================================
// Request Handling Tests
// =============================================================================

TEST_F(HttpServerTest, ServesJsonWithContentLength) {
    startServer();

    auto response = roundTrip("GET /hello?name=ace+proxy HTTP/1.1\r\nHost: localhost\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
    EXPECT_NE(response.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(response.find("Content-Length: 20\r\n"), std::string::npos);
    EXPECT_NE(response.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(response.find("Transfer-Encoding"), std::string::npos);
    EXPECT_EQ(bodyOf(response), "{\"name\":\"ace proxy\"}");
}

TEST_F(HttpServerTest, UnknownPathIsNotFound) {
    startServer();

    auto response = roundTrip("GET /nope HTTP/1.1\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u) << response;
    EXPECT_EQ(bodyOf(response), "{\"error\":\"not found\"}");
}

TEST_F(HttpServerTest, StreamedBodyIsChunkedOnHttp11) {
    startServer();

    auto response = roundTrip("GET /stream HTTP/1.1\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
    EXPECT_NE(response.find("Content-Type: video/mpeg\r\n"), std::string::npos);
    EXPECT_NE(response.find("Transfer-Encoding: chunked\r\n"), std::string::npos);
    EXPECT_EQ(bodyOf(response), "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
}

TEST_F(HttpServerTest, StreamedBodyIsRawOnHttp10) {
    startServer();

    auto response = roundTrip("GET /stream HTTP/1.0\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.0 200 OK\r\n", 0), 0u) << response;
    EXPECT_EQ(response.find("Transfer-Encoding"), std::string::npos);
    EXPECT_EQ(bodyOf(response), "hello world");
}

TEST_F(HttpServerTest, RequestBodyIsDelivered) {
    startServer();

    auto response = roundTrip("POST /echo HTTP/1.1\r\nContent-Length: 11\r\n\r\n{\"ok\":true}");

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
    EXPECT_EQ(bodyOf(response), "{\"ok\":true}");
}

TEST_F(HttpServerTest, MalformedRequestIsBadRequest) {
    startServer();

    auto response = roundTrip("BROKEN\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << response;
}

TEST_F(HttpServerTest, HeadersAreMatchedCaseInsensitively) {
    startServer();

    auto response = roundTrip("GET /whoami HTTP/1.1\r\nUSER-AGENT: VLC/3.0\r\nx-TAG: blue\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << response;
    EXPECT_EQ(bodyOf(response), "{\"agent\":\"VLC/3.0\",\"tag\":\"blue\",\"local\":true}");
}

TEST_F(HttpServerTest, UnsupportedVersionIsBadRequest) {
    startServer();

    auto response = roundTrip("GET /hello HTTP/2.0\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << response;
}

TEST_F(HttpServerTest, OversizedHeaderIsRejected) {
    config_.maxHeaderBytes = 64;
    startServer();

    auto response = roundTrip("GET /hello HTTP/1.1\r\nX-Padding: " + std::string(200, 'a') + "\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 431 Request Header Fields Too Large\r\n", 0), 0u) << response;
}

TEST_F(HttpServerTest, OversizedBodyIsRejected) {
    config_.maxBodyBytes = 8;
    startServer();

    auto response = roundTrip("POST /echo HTTP/1.1\r\nContent-Length: 100\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 413 Payload Too Large\r\n", 0), 0u) << response;
}

TEST_F(HttpServerTest, SlowRequestTimesOut) {
    config_.requestTimeout = 150ms;
    startServer();

    auto response = roundTrip("GET /hello HTTP/1.1\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 408 Request Timeout\r\n", 0), 0u) << response;
}

// =============================================================================
// Connection Management Tests
// =============================================================================

TEST_F(HttpServerTest, ClientHangupCancelsHandler) {
    startServer();

    Client client = connectTo(ioc_, server_->port());
    ASSERT_NE(client, nullptr);
    ASSERT_TRUE(sendText(client, "GET /block HTTP/1.1\r\n\r\n"));
    ASSERT_TRUE(waitUntil([this]() { return blockEntered_.load(); }, 2000ms));

    client->close();

    EXPECT_TRUE(waitUntil([this]() { return blockCancelled_.load(); }, 2000ms));
}

TEST_F(HttpServerTest, StopCancelsInFlightRequests) {
    startServer();

    Client client = open();
    ASSERT_NE(client, nullptr);
    ASSERT_TRUE(sendText(client, "GET /block HTTP/1.1\r\n\r\n"));
    ASSERT_TRUE(waitUntil([this]() { return blockEntered_.load(); }, 2000ms));

    auto begin = std::chrono::steady_clock::now();
    server_->stop();

    EXPECT_LT(std::chrono::steady_clock::now() - begin, 3s);
    EXPECT_TRUE(blockCancelled_.load());
}

TEST_F(HttpServerTest, ConnectionsBeyondLimitGetServiceUnavailable) {
    config_.maxConnections = 1;
    config_.requestTimeout = 5000ms;
    startServer();

    // Held open without a request so it occupies the only slot.
    Client idle = open();
    ASSERT_NE(idle, nullptr);
    ASSERT_TRUE(waitUntil([this]() { return server_->getStats().activeConnections == 1; }, 2000ms));

    auto response = roundTrip("GET /hello HTTP/1.1\r\n\r\n");

    EXPECT_EQ(response.rfind("HTTP/1.1 503 Service Unavailable\r\n", 0), 0u) << response;
    EXPECT_EQ(bodyOf(response), "{\"error\":\"too many connections\"}");
    EXPECT_EQ(server_->getStats().rejectedConnections, 1u);
}

TEST_F(HttpServerTest, StatsCountRequests) {
    startServer();

    roundTrip("GET /hello HTTP/1.1\r\n\r\n");
    roundTrip("GET /nope HTTP/1.1\r\n\r\n");

    auto stats = server_->getStats();
    EXPECT_EQ(stats.totalConnections, 2u);
    EXPECT_EQ(stats.totalRequests, 2u);
}

} // namespace test
} // namespace api
} // namespace aceproxy
