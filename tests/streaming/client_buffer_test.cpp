// AceProxy - AceStream Multiplexing Proxy
// Tests for ClientBuffer

#include <gtest/gtest.h>
#include "aceproxy/streaming/client_buffer.hpp"

#include <chrono>
#include <memory>
#include <thread>

namespace aceproxy {
namespace streaming {
namespace test {

using namespace std::chrono_literals;

namespace {

SharedChunk makeChunk(uint8_t value) {
    return std::make_shared<const core::Chunk>(1, value);
}

} // namespace

TEST(ClientBufferTest, PopsInPushOrder) {
    ClientBuffer buffer(4);
    core::Context ctx;

    ASSERT_TRUE(buffer.tryPush(makeChunk(1)));
    ASSERT_TRUE(buffer.tryPush(makeChunk(2)));

    SharedChunk out;
    ASSERT_EQ(buffer.pop(ctx, out), ClientBuffer::PopStatus::Chunk);
    EXPECT_EQ((*out)[0], 1);
    ASSERT_EQ(buffer.pop(ctx, out), ClientBuffer::PopStatus::Chunk);
    EXPECT_EQ((*out)[0], 2);
}

TEST(ClientBufferTest, RejectsPushWhenFull) {
    ClientBuffer buffer(2);

    EXPECT_TRUE(buffer.tryPush(makeChunk(1)));
    EXPECT_TRUE(buffer.tryPush(makeChunk(2)));
    EXPECT_FALSE(buffer.tryPush(makeChunk(3)));
    EXPECT_EQ(buffer.size(), 2u);
}

TEST(ClientBufferTest, ZeroCapacityClampedToOne) {
    ClientBuffer buffer(0);
    EXPECT_EQ(buffer.capacity(), 1u);
    EXPECT_TRUE(buffer.tryPush(makeChunk(1)));
    EXPECT_FALSE(buffer.tryPush(makeChunk(2)));
}

TEST(ClientBufferTest, ClosedBufferDrainsThenReportsClosed) {
    ClientBuffer buffer(4);
    core::Context ctx;
    ASSERT_TRUE(buffer.tryPush(makeChunk(9)));

    buffer.close();
    EXPECT_FALSE(buffer.tryPush(makeChunk(10)));

    SharedChunk out;
    EXPECT_EQ(buffer.pop(ctx, out), ClientBuffer::PopStatus::Chunk);
    EXPECT_EQ(buffer.pop(ctx, out), ClientBuffer::PopStatus::Closed);
}

TEST(ClientBufferTest, PopWakesOnPush) {
    ClientBuffer buffer(4);
    core::Context ctx;

    std::thread producer([&buffer]() {
        std::this_thread::sleep_for(20ms);
        buffer.tryPush(makeChunk(7));
    });

    SharedChunk out;
    EXPECT_EQ(buffer.pop(ctx, out), ClientBuffer::PopStatus::Chunk);
    EXPECT_EQ((*out)[0], 7);
    producer.join();
}

TEST(ClientBufferTest, PopWakesOnCancel) {
    ClientBuffer buffer(4);
    core::Context ctx;

    std::thread canceller([&ctx]() {
        std::this_thread::sleep_for(20ms);
        ctx.cancel();
    });

    SharedChunk out;
    EXPECT_EQ(buffer.pop(ctx, out), ClientBuffer::PopStatus::Cancelled);
    canceller.join();
}

TEST(ClientBufferTest, PopHonorsDeadline) {
    ClientBuffer buffer(4);
    core::Context ctx(core::Context::Clock::now() + 20ms);

    SharedChunk out;
    EXPECT_EQ(buffer.pop(ctx, out), ClientBuffer::PopStatus::Cancelled);
}

} // namespace test
} // namespace streaming
} // namespace aceproxy
