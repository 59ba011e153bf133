// AceProxy - AceStream Multiplexing Proxy
// Tests for Metrics Collection Component

#include <gtest/gtest.h>
#include "aceproxy/core/metrics_collector.hpp"

#include <thread>
#include <vector>

namespace aceproxy {
namespace core {
namespace test {

class MetricsCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        collector_ = std::make_unique<MetricsCollector>();
    }

    std::unique_ptr<MetricsCollector> collector_;
};

// =============================================================================
// Gauges
// =============================================================================

TEST_F(MetricsCollectorTest, TracksActiveStreams) {
    EXPECT_EQ(collector_->getActiveStreams(), 0u);

    collector_->incrementStreams();
    collector_->incrementStreams();
    EXPECT_EQ(collector_->getActiveStreams(), 2u);

    collector_->decrementStreams();
    EXPECT_EQ(collector_->getActiveStreams(), 1u);
}

TEST_F(MetricsCollectorTest, GaugesNeverGoNegative) {
    collector_->decrementStreams();
    collector_->decrementClients();

    EXPECT_EQ(collector_->getActiveStreams(), 0u);
    EXPECT_EQ(collector_->getConnectedClients(), 0u);
}

TEST_F(MetricsCollectorTest, ConcurrentClientUpdatesBalance) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 1000; ++i) {
                collector_->incrementClients();
            }
            for (int i = 0; i < 500; ++i) {
                collector_->decrementClients();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(collector_->getConnectedClients(), 2000u);
}

// =============================================================================
// Counters
// =============================================================================

TEST_F(MetricsCollectorTest, UpstreamCountersAreLabelled) {
    collector_->recordUpstreamReconnection("abc");
    collector_->recordUpstreamReconnection("abc");
    collector_->recordUpstreamReconnection("def");
    collector_->recordUpstreamError("abc", upstream_error::kConnectionLost);
    collector_->recordUpstreamError("abc", upstream_error::kReconnectExhausted);

    EXPECT_EQ(collector_->getUpstreamReconnections("abc"), 2u);
    EXPECT_EQ(collector_->getUpstreamReconnections("def"), 1u);
    EXPECT_EQ(collector_->getUpstreamReconnections("none"), 0u);
    EXPECT_EQ(collector_->getUpstreamErrors("abc", upstream_error::kConnectionLost), 1u);
    EXPECT_EQ(collector_->getUpstreamErrors("abc", upstream_error::kRestartFailed), 0u);

    auto snapshot = collector_->takeSnapshot();
    EXPECT_EQ(snapshot.upstreamReconnections.size(), 2u);
    EXPECT_EQ(snapshot.upstreamErrors.size(), 2u);
}

// =============================================================================
// Export
// =============================================================================

TEST_F(MetricsCollectorTest, ExportsPrometheusText) {
    collector_->incrementStreams();
    collector_->recordHealthCheckFailure();

    std::string text = collector_->exportPrometheus();

    EXPECT_NE(text.find("# TYPE aceproxy_streams_active gauge\n"), std::string::npos);
    EXPECT_NE(text.find("aceproxy_streams_active 1\n"), std::string::npos);
    EXPECT_NE(text.find("aceproxy_clients_connected 0\n"), std::string::npos);
    EXPECT_NE(text.find("# TYPE aceproxy_upstream_errors_total counter\n"), std::string::npos);
    EXPECT_NE(text.find("aceproxy_health_check_failures_total 1\n"), std::string::npos);
}

TEST_F(MetricsCollectorTest, LabelValuesAreEscaped) {
    collector_->recordUpstreamReconnection("a\"b\\c");

    std::string text = collector_->exportPrometheus();

    EXPECT_NE(text.find("aceproxy_upstream_reconnections_total{content_id=\"a\\\"b\\\\c\"} 1\n"),
              std::string::npos) << text;
}

} // namespace test
} // namespace core
} // namespace aceproxy
