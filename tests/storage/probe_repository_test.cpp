// AceProxy - AceStream Multiplexing Proxy
// Tests for the probe repositories (SQLite and in-memory)

#include <gtest/gtest.h>
#include "aceproxy/storage/memory_probe_repository.hpp"
#include "aceproxy/storage/sqlite_probe_repository.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <unistd.h>

namespace aceproxy {
namespace storage {
namespace test {

using namespace std::chrono_literals;

namespace {

const core::WallTime kBase = core::WallTime(std::chrono::seconds(1700000000));

probe::ProbeResult resultAt(const core::InfoHash& hash, core::WallTime ts, int64_t peers) {
    return probe::ProbeResult::reconstruct(hash, ts, true, 1500ms, peers, 2048, "dl", "");
}

} // namespace

// =============================================================================
// Shared Behaviour
// =============================================================================

class ProbeRepositoryTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        if (GetParam() == "sqlite") {
            auto opened = SqliteProbeRepository::open(":memory:", nullptr);
            ASSERT_TRUE(opened.isSuccess()) << opened.error().toString();
            repository_ = std::move(opened).value();
        } else {
            repository_ = std::make_unique<MemoryProbeRepository>();
        }
    }

    void TearDown() override {
        repository_.reset();
    }

    void save(const probe::ProbeResult& result) {
        auto saved = repository_->save(ctx_, result);
        ASSERT_TRUE(saved.isSuccess()) << saved.error().toString();
    }

    core::Context ctx_;
    std::unique_ptr<probe::IProbeRepository> repository_;
};

TEST_P(ProbeRepositoryTest, SavedResultReadsBackIntact) {
    save(probe::ProbeResult::reconstruct("hash-a", kBase + 123456789ns, false, 0ns, 0, 0,
                                         "", "engine error: no peers"));

    auto found = repository_->findByInfoHash(ctx_, "hash-a");

    ASSERT_TRUE(found.isSuccess());
    ASSERT_EQ(found.value().size(), 1u);
    const auto& r = found.value()[0];
    EXPECT_EQ(r.infoHash(), "hash-a");
    EXPECT_EQ(r.timestamp(), kBase + 123456789ns);
    EXPECT_FALSE(r.available());
    EXPECT_EQ(r.errorMessage(), "engine error: no peers");
}

TEST_P(ProbeRepositoryTest, FindReturnsNewestFirst) {
    save(resultAt("hash-a", kBase + 1s, 1));
    save(resultAt("hash-a", kBase + 3s, 3));
    save(resultAt("hash-a", kBase + 2s, 2));

    auto found = repository_->findByInfoHash(ctx_, "hash-a");

    ASSERT_TRUE(found.isSuccess());
    ASSERT_EQ(found.value().size(), 3u);
    EXPECT_EQ(found.value()[0].peerCount(), 3);
    EXPECT_EQ(found.value()[1].peerCount(), 2);
    EXPECT_EQ(found.value()[2].peerCount(), 1);
    EXPECT_EQ(found.value()[0].startupLatency(), 1500ms);
    EXPECT_EQ(found.value()[0].downloadSpeed(), 2048);
}

TEST_P(ProbeRepositoryTest, FindFiltersByInfoHash) {
    save(resultAt("hash-a", kBase, 1));
    save(resultAt("hash-b", kBase, 2));

    auto found = repository_->findByInfoHash(ctx_, "hash-b");

    ASSERT_TRUE(found.isSuccess());
    ASSERT_EQ(found.value().size(), 1u);
    EXPECT_EQ(found.value()[0].infoHash(), "hash-b");

    auto missing = repository_->findByInfoHash(ctx_, "hash-z");
    ASSERT_TRUE(missing.isSuccess());
    EXPECT_TRUE(missing.value().empty());
}

TEST_P(ProbeRepositoryTest, SinceBoundIsInclusive) {
    save(resultAt("hash-a", kBase - 1ns, 1));
    save(resultAt("hash-a", kBase, 2));
    save(resultAt("hash-a", kBase + 1h, 3));

    auto found = repository_->findByInfoHashSince(ctx_, "hash-a", kBase);

    ASSERT_TRUE(found.isSuccess());
    ASSERT_EQ(found.value().size(), 2u);
    EXPECT_EQ(found.value()[0].peerCount(), 3);
    EXPECT_EQ(found.value()[1].peerCount(), 2);
}

TEST_P(ProbeRepositoryTest, DeleteBeforeIsExclusive) {
    save(resultAt("hash-a", kBase, 1));
    save(resultAt("hash-a", kBase + 1ns, 2));
    save(resultAt("hash-b", kBase - 1h, 3));

    ASSERT_TRUE(repository_->deleteBefore(ctx_, kBase + 1ns).isSuccess());

    auto a = repository_->findByInfoHash(ctx_, "hash-a");
    auto b = repository_->findByInfoHash(ctx_, "hash-b");
    ASSERT_TRUE(a.isSuccess());
    ASSERT_TRUE(b.isSuccess());
    ASSERT_EQ(a.value().size(), 1u);
    EXPECT_EQ(a.value()[0].peerCount(), 2);
    EXPECT_TRUE(b.value().empty());
}

TEST_P(ProbeRepositoryTest, PingSucceeds) {
    EXPECT_TRUE(repository_->ping(ctx_).isSuccess());
}

TEST_P(ProbeRepositoryTest, CancelledContextFailsEveryOperation) {
    save(resultAt("hash-a", kBase, 1));
    core::Context cancelled;
    cancelled.cancel();

    auto saved = repository_->save(cancelled, resultAt("hash-a", kBase, 2));
    auto found = repository_->findByInfoHash(cancelled, "hash-a");
    auto since = repository_->findByInfoHashSince(cancelled, "hash-a", kBase);
    auto deleted = repository_->deleteBefore(cancelled, kBase + 1h);
    auto pinged = repository_->ping(cancelled);

    ASSERT_TRUE(saved.isError());
    EXPECT_EQ(saved.error().code, core::ErrorCode::Cancelled);
    EXPECT_TRUE(found.isError());
    EXPECT_TRUE(since.isError());
    EXPECT_TRUE(deleted.isError());
    EXPECT_TRUE(pinged.isError());

    auto remaining = repository_->findByInfoHash(ctx_, "hash-a");
    ASSERT_TRUE(remaining.isSuccess());
    EXPECT_EQ(remaining.value().size(), 1u);
}

INSTANTIATE_TEST_SUITE_P(Backends, ProbeRepositoryTest,
                         ::testing::Values(std::string("sqlite"), std::string("memory")));

// =============================================================================
// SQLite Specifics
// =============================================================================

TEST(SqliteProbeRepositoryTest, ResultsPersistAcrossReopen) {
    const char* tmp = std::getenv("TMPDIR");
    std::string path = std::string(tmp ? tmp : "/tmp") +
                       "/aceproxy_probe_repo_" + std::to_string(getpid()) + ".db";
    core::Context ctx;

    {
        auto opened = SqliteProbeRepository::open(path, nullptr);
        ASSERT_TRUE(opened.isSuccess()) << opened.error().toString();
        ASSERT_TRUE(opened.value()->save(ctx, resultAt("hash-a", kBase, 7)).isSuccess());
    }
    {
        auto reopened = SqliteProbeRepository::open(path, nullptr);
        ASSERT_TRUE(reopened.isSuccess());
        auto found = reopened.value()->findByInfoHash(ctx, "hash-a");
        ASSERT_TRUE(found.isSuccess());
        ASSERT_EQ(found.value().size(), 1u);
        EXPECT_EQ(found.value()[0].peerCount(), 7);
    }

    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

TEST(SqliteProbeRepositoryTest, OpenFailsForUnwritableLocation) {
    auto opened = SqliteProbeRepository::open("/nonexistent-dir/aceproxy/probes.db", nullptr);

    ASSERT_TRUE(opened.isError());
    EXPECT_EQ(opened.error().code, core::ErrorCode::StorageOpenFailed);
    EXPECT_EQ(opened.error().context, "/nonexistent-dir/aceproxy/probes.db");
}

} // namespace test
} // namespace storage
} // namespace aceproxy
