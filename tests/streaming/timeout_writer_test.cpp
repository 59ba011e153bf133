// AceProxy - AceStream Multiplexing Proxy
// Tests for TimeoutWriter

#include <gtest/gtest.h>
#include "aceproxy/streaming/timeout_writer.hpp"
#include "support/test_doubles.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <string>
#include <vector>

namespace aceproxy {
namespace streaming {
namespace test {

using namespace std::chrono_literals;
using aceproxy::test::RecordingWriter;

namespace {

/**
 * @brief Destination honoring deadlines that accepts a scripted number of bytes per call.
 */
class ScriptedDeadlineWriter : public IStreamWriter {
public:
    core::Result<size_t, core::Error> write(const uint8_t* data, size_t size) override {
        ++writes;
        if (acceptPerCall.empty()) {
            return core::Result<size_t, core::Error>::error(failure);
        }
        size_t n = std::min(acceptPerCall.front(), size);
        acceptPerCall.pop_front();
        received.append(reinterpret_cast<const char*>(data), n);
        return core::Result<size_t, core::Error>::success(n);
    }

    bool supportsDeadline() const override { return true; }

    void setWriteDeadline(std::chrono::steady_clock::time_point deadline) override {
        deadlines.push_back(deadline);
    }

    std::deque<size_t> acceptPerCall;
    core::Error failure{core::ErrorCode::Timeout, "write deadline exceeded"};
    std::vector<std::chrono::steady_clock::time_point> deadlines;
    std::string received;
    int writes = 0;
};

const uint8_t* bytes(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

} // namespace

// =============================================================================
// Pass-through Tests
// =============================================================================

TEST(TimeoutWriterTest, PassesDataThrough) {
    RecordingWriter destination;
    TimeoutWriter writer(destination, 100ms);

    const std::string payload = "transport stream packet";
    auto result = writer.write(bytes(payload), payload.size());

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value(), payload.size());
    EXPECT_EQ(destination.data(), payload);
    EXPECT_EQ(writer.bytesWritten(), payload.size());
}

TEST(TimeoutWriterTest, ContinuesAfterPartialWrites) {
    ScriptedDeadlineWriter destination;
    destination.acceptPerCall = {3, 4, 100};
    TimeoutWriter writer(destination, 100ms);

    const std::string payload = "0123456789";
    auto result = writer.write(bytes(payload), payload.size());

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(destination.received, payload);
    EXPECT_EQ(destination.writes, 3);
}

// =============================================================================
// Deadline Tests
// =============================================================================

TEST(TimeoutWriterTest, ArmsDeadlineBeforeEachWrite) {
    ScriptedDeadlineWriter destination;
    destination.acceptPerCall = {2, 2};
    TimeoutWriter writer(destination, 250ms);

    auto before = std::chrono::steady_clock::now();
    const std::string payload = "abcd";
    ASSERT_TRUE(writer.write(bytes(payload), payload.size()).isSuccess());

    ASSERT_EQ(destination.deadlines.size(), 2u);
    for (const auto& deadline : destination.deadlines) {
        EXPECT_GE(deadline, before + 250ms);
        EXPECT_LE(deadline, std::chrono::steady_clock::now() + 250ms);
    }
}

TEST(TimeoutWriterTest, TimeoutBecomesWriteTimeoutWithBytesWritten) {
    ScriptedDeadlineWriter destination;
    destination.acceptPerCall = {5};
    TimeoutWriter writer(destination, 10ms);

    const std::string payload = "0123456789";
    auto result = writer.write(bytes(payload), payload.size());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::WriteTimeout);
    EXPECT_EQ(result.error().context, "bytes_written=5");
    EXPECT_EQ(writer.bytesWritten(), 5u);
}

TEST(TimeoutWriterTest, OtherErrorsKeepTheirCode) {
    ScriptedDeadlineWriter destination;
    destination.failure = core::Error(core::ErrorCode::ConnectionClosed, "peer closed connection");
    TimeoutWriter writer(destination, 10ms);

    const std::string payload = "x";
    auto result = writer.write(bytes(payload), payload.size());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::ConnectionClosed);
}

TEST(TimeoutWriterTest, ZeroByteWriteIsShortWrite) {
    ScriptedDeadlineWriter destination;
    destination.acceptPerCall = {0};
    TimeoutWriter writer(destination, 10ms);

    const std::string payload = "x";
    auto result = writer.write(bytes(payload), payload.size());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::ShortWrite);
}

TEST(TimeoutWriterTest, RecognizesTimeoutMessages) {
    EXPECT_TRUE(TimeoutWriter::isTimeoutError(core::Error(core::ErrorCode::Timeout)));
    EXPECT_TRUE(TimeoutWriter::isTimeoutError(
        core::Error(core::ErrorCode::NetworkError, "i/o Deadline exceeded")));
    EXPECT_TRUE(TimeoutWriter::isTimeoutError(
        core::Error(core::ErrorCode::NetworkError, "operation timeout")));
    EXPECT_FALSE(TimeoutWriter::isTimeoutError(
        core::Error(core::ErrorCode::ConnectionClosed, "broken pipe")));
}

} // namespace test
} // namespace streaming
} // namespace aceproxy
