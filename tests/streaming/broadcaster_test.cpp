// AceProxy - AceStream Multiplexing Proxy
// Tests for Broadcaster fan-out and slow-client eviction

#include <gtest/gtest.h>
#include "aceproxy/streaming/broadcaster.hpp"
#include "support/test_doubles.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace aceproxy {
namespace streaming {
namespace test {

using namespace std::chrono_literals;
using aceproxy::test::CapturingLogSink;
using aceproxy::test::RecordingWriter;

namespace {

/**
 * @brief Destination that blocks every write until released.
 */
class GatedWriter : public IStreamWriter {
public:
    core::Result<size_t, core::Error> write(const uint8_t* /* data */, size_t size) override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return released_; });
        return core::Result<size_t, core::Error>::success(size);
    }

    bool waitUntilEntered(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return entered_; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool released_ = false;
};

} // namespace

// =============================================================================
// Test Fixtures
// =============================================================================

class BroadcasterTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = std::make_shared<core::StructuredLogger>();
        sink_ = std::make_shared<CapturingLogSink>();
        logger_->addSink(sink_);
    }

    void TearDown() override {
        joinSubscribers();
    }

    void joinSubscribers() {
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    void writeString(Broadcaster& broadcaster, const std::string& s) {
        auto result = broadcaster.write(reinterpret_cast<const uint8_t*>(s.data()), s.size());
        ASSERT_TRUE(result.isSuccess());
        EXPECT_EQ(result.value(), s.size());
    }

    void subscribeAsync(Broadcaster& broadcaster, core::Context& ctx, const core::ClientId& id,
                        IStreamWriter& destination, core::Result<void, core::Error>& outcome) {
        threads_.emplace_back([&broadcaster, &ctx, id, &destination, &outcome]() {
            outcome = broadcaster.subscribe(ctx, id, destination, 1000ms);
        });
    }

    std::shared_ptr<core::StructuredLogger> logger_;
    std::shared_ptr<CapturingLogSink> sink_;
    std::vector<std::thread> threads_;
};

// =============================================================================
// Delivery Tests
// =============================================================================

TEST_F(BroadcasterTest, WriteWithoutClientsSucceeds) {
    Broadcaster broadcaster(4, logger_);
    writeString(broadcaster, "nobody listening");

    auto stats = broadcaster.getStats();
    EXPECT_EQ(stats.chunksWritten, 1u);
    EXPECT_EQ(stats.bytesWritten, 16u);
    EXPECT_EQ(stats.clientCount, 0u);
}

TEST_F(BroadcasterTest, EveryClientReceivesChunksInOrder) {
    Broadcaster broadcaster(16, logger_);
    broadcaster.addClient("a");
    broadcaster.addClient("b");

    core::Context ctx;
    RecordingWriter outA;
    RecordingWriter outB;
    auto resultA = core::Result<void, core::Error>::success();
    auto resultB = core::Result<void, core::Error>::success();
    subscribeAsync(broadcaster, ctx, "a", outA, resultA);
    subscribeAsync(broadcaster, ctx, "b", outB, resultB);

    writeString(broadcaster, "one,");
    writeString(broadcaster, "two,");
    writeString(broadcaster, "three");

    ASSERT_TRUE(outA.waitForBytes(13, 2000ms));
    ASSERT_TRUE(outB.waitForBytes(13, 2000ms));
    EXPECT_EQ(outA.data(), "one,two,three");
    EXPECT_EQ(outB.data(), "one,two,three");

    broadcaster.close();
    joinSubscribers();
    EXPECT_TRUE(resultA.isSuccess());
    EXPECT_TRUE(resultB.isSuccess());
    EXPECT_EQ(broadcaster.clientCount(), 0u);
}

TEST_F(BroadcasterTest, PreAttachedClientDrainsBacklogAfterClose) {
    Broadcaster broadcaster(8, logger_);
    broadcaster.addClient("early");

    writeString(broadcaster, "first bytes");
    broadcaster.close();

    core::Context ctx;
    RecordingWriter out;
    auto result = broadcaster.subscribe(ctx, "early", out, 100ms);
    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(out.data(), "first bytes");
    EXPECT_EQ(broadcaster.clientCount(), 0u);
}

TEST_F(BroadcasterTest, LateSubscriberAfterCloseIsNotActive) {
    Broadcaster broadcaster(8, logger_);
    writeString(broadcaster, "missed");
    broadcaster.close();

    core::Context ctx;
    RecordingWriter out;
    auto result = broadcaster.subscribe(ctx, "late", out, 100ms);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::StreamNotActive);
    EXPECT_TRUE(out.data().empty());
}

TEST_F(BroadcasterTest, LateSubscriberSeesTerminalError) {
    Broadcaster broadcaster(8, logger_);
    broadcaster.close(core::Error(core::ErrorCode::ReconnectExhausted, "stream failed after 3 attempts"));

    core::Context ctx;
    RecordingWriter out;
    auto result = broadcaster.subscribe(ctx, "late", out, 100ms);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::ReconnectExhausted);
}

TEST_F(BroadcasterTest, BufferedChunksDrainAfterClose) {
    Broadcaster broadcaster(8, logger_);
    broadcaster.addClient("c");
    writeString(broadcaster, "abc");
    writeString(broadcaster, "def");

    core::Context ctx;
    RecordingWriter out;
    auto result = core::Result<void, core::Error>::success();
    subscribeAsync(broadcaster, ctx, "c", out, result);

    ASSERT_TRUE(out.waitForBytes(6, 2000ms));
    broadcaster.close();
    joinSubscribers();

    EXPECT_EQ(out.data(), "abcdef");
    EXPECT_TRUE(result.isSuccess());
}

// =============================================================================
// Eviction Tests
// =============================================================================

TEST_F(BroadcasterTest, SlowClientEvictedWithoutBlockingWriter) {
    Broadcaster broadcaster(2, logger_);
    broadcaster.addClient("slow");
    broadcaster.addClient("fast");

    core::Context ctx;
    GatedWriter slowOut;
    RecordingWriter fastOut;
    auto slowResult = core::Result<void, core::Error>::success();
    auto fastResult = core::Result<void, core::Error>::success();
    subscribeAsync(broadcaster, ctx, "slow", slowOut, slowResult);
    subscribeAsync(broadcaster, ctx, "fast", fastOut, fastResult);

    writeString(broadcaster, "0");
    EXPECT_TRUE(slowOut.waitUntilEntered(2000ms));

    // "slow" holds chunk 0 inside write; its queue fills up and it is dropped.
    auto start = std::chrono::steady_clock::now();
    for (char c = '1'; c <= '9'; ++c) {
        writeString(broadcaster, std::string(1, c));
        EXPECT_TRUE(fastOut.waitForBytes(static_cast<size_t>(c - '0') + 1, 1000ms));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    EXPECT_TRUE(fastOut.waitForBytes(10, 2000ms));
    EXPECT_EQ(fastOut.data(), "0123456789");

    auto stats = broadcaster.getStats();
    EXPECT_EQ(stats.clientsEvicted, 1u);
    EXPECT_EQ(stats.clientCount, 1u);
    EXPECT_TRUE(sink_->contains("Evicted slow client"));

    slowOut.release();
    broadcaster.close();
    joinSubscribers();
    EXPECT_TRUE(fastResult.isSuccess());
}

// =============================================================================
// Termination Tests
// =============================================================================

TEST_F(BroadcasterTest, TerminalErrorDeliveredToEveryClient) {
    Broadcaster broadcaster(8, logger_);
    broadcaster.addClient("x");
    broadcaster.addClient("y");

    core::Context ctx;
    RecordingWriter outX;
    RecordingWriter outY;
    auto resultX = core::Result<void, core::Error>::success();
    auto resultY = core::Result<void, core::Error>::success();
    subscribeAsync(broadcaster, ctx, "x", outX, resultX);
    subscribeAsync(broadcaster, ctx, "y", outY, resultY);

    broadcaster.close(core::Error(core::ErrorCode::ReconnectExhausted, "stream failed after 3 attempts"));
    joinSubscribers();

    ASSERT_TRUE(resultX.isError());
    ASSERT_TRUE(resultY.isError());
    EXPECT_EQ(resultX.error().code, core::ErrorCode::ReconnectExhausted);
    EXPECT_EQ(resultY.error().message, "stream failed after 3 attempts");
    ASSERT_TRUE(broadcaster.terminalError().has_value());
}

TEST_F(BroadcasterTest, CancelledSubscriberDetaches) {
    Broadcaster broadcaster(8, logger_);
    broadcaster.addClient("leaver");

    core::Context ctx;
    RecordingWriter out;
    auto result = core::Result<void, core::Error>::success();
    subscribeAsync(broadcaster, ctx, "leaver", out, result);

    ctx.cancel();
    joinSubscribers();

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::Cancelled);
    EXPECT_EQ(broadcaster.clientCount(), 0u);
    EXPECT_FALSE(broadcaster.isClosed());
}

TEST_F(BroadcasterTest, FailingDestinationEndsOnlyThatClient) {
    Broadcaster broadcaster(8, logger_);
    broadcaster.addClient("broken");
    broadcaster.addClient("healthy");

    core::Context ctx;
    RecordingWriter brokenOut;
    brokenOut.failWith = core::Error(core::ErrorCode::ConnectionClosed, "peer closed connection");
    RecordingWriter healthyOut;
    auto brokenResult = core::Result<void, core::Error>::success();
    auto healthyResult = core::Result<void, core::Error>::success();
    subscribeAsync(broadcaster, ctx, "broken", brokenOut, brokenResult);
    subscribeAsync(broadcaster, ctx, "healthy", healthyOut, healthyResult);

    writeString(broadcaster, "data");
    ASSERT_TRUE(healthyOut.waitForBytes(4, 2000ms));

    broadcaster.close();
    joinSubscribers();

    ASSERT_TRUE(brokenResult.isError());
    EXPECT_EQ(brokenResult.error().code, core::ErrorCode::ConnectionClosed);
    EXPECT_TRUE(healthyResult.isSuccess());
}

} // namespace test
} // namespace streaming
} // namespace aceproxy
