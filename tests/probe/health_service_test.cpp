// AceProxy - AceStream Multiplexing Proxy
// Tests for HealthService

#include <gtest/gtest.h>
#include "aceproxy/probe/health_service.hpp"
#include "aceproxy/storage/memory_probe_repository.hpp"
#include "support/test_doubles.hpp"

#include <memory>

namespace aceproxy {
namespace probe {
namespace test {

using aceproxy::test::FakeEngine;

namespace {

class UnreachableRepository : public storage::MemoryProbeRepository {
public:
    core::Result<void, core::Error> ping(core::Context& /* ctx */) override {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::StorageQueryFailed, "database ping failed: disk I/O error"));
    }
};

} // namespace

TEST(HealthServiceTest, AllComponentsHealthy) {
    auto engine = std::make_shared<FakeEngine>();
    HealthService health(std::make_shared<storage::MemoryProbeRepository>(), engine);
    core::Context ctx;

    auto status = health.check(ctx);

    EXPECT_TRUE(status.isHealthy());
    EXPECT_STREQ(status.statusString(), "ok");
    EXPECT_STREQ(status.database.statusString(), "ok");
    EXPECT_STREQ(status.engine.statusString(), "ok");
    EXPECT_TRUE(status.engine.error.empty());
}

TEST(HealthServiceTest, EngineDownIsDegraded) {
    auto engine = std::make_shared<FakeEngine>();
    engine->pingError = core::Error(core::ErrorCode::EngineUnavailable, "acestream engine not reachable");
    HealthService health(std::make_shared<storage::MemoryProbeRepository>(), engine);
    core::Context ctx;

    auto status = health.check(ctx);

    EXPECT_FALSE(status.isHealthy());
    EXPECT_STREQ(status.statusString(), "degraded");
    EXPECT_TRUE(status.database.ok);
    EXPECT_FALSE(status.engine.ok);
    EXPECT_STREQ(status.engine.statusString(), "error");
    EXPECT_EQ(status.engine.error, "acestream engine not reachable");
}

TEST(HealthServiceTest, DatabaseDownIsDegraded) {
    HealthService health(std::make_shared<UnreachableRepository>(), std::make_shared<FakeEngine>());
    core::Context ctx;

    auto status = health.check(ctx);

    EXPECT_FALSE(status.isHealthy());
    EXPECT_FALSE(status.database.ok);
    EXPECT_EQ(status.database.error, "database ping failed: disk I/O error");
    EXPECT_TRUE(status.engine.ok);
}

TEST(HealthServiceTest, DegradedChecksAreCounted) {
    auto engine = std::make_shared<FakeEngine>();
    auto metrics = std::make_shared<core::MetricsCollector>();
    HealthService health(std::make_shared<storage::MemoryProbeRepository>(), engine, metrics);
    core::Context ctx;

    health.check(ctx);
    EXPECT_EQ(metrics->getHealthCheckFailures(), 0u);

    engine->pingError = core::Error(core::ErrorCode::EngineUnavailable, "acestream engine not reachable");
    health.check(ctx);
    health.check(ctx);
    EXPECT_EQ(metrics->getHealthCheckFailures(), 2u);
}

TEST(HealthServiceTest, CancelledContextFailsDatabaseCheck) {
    HealthService health(std::make_shared<storage::MemoryProbeRepository>(), std::make_shared<FakeEngine>());
    core::Context ctx;
    ctx.cancel();

    auto status = health.check(ctx);

    EXPECT_FALSE(status.database.ok);
    EXPECT_FALSE(status.database.error.empty());
}

} // namespace test
} // namespace probe
} // namespace aceproxy
