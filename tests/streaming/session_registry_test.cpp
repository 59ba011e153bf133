// AceProxy - AceStream Multiplexing Proxy
// Tests for SessionRegistry

#include <gtest/gtest.h>
#include "aceproxy/streaming/session_registry.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace aceproxy {
namespace streaming {
namespace test {

class SessionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_unique<SessionRegistry>();
        registry_->setEventCallback([this](const SessionEvent& event) {
            std::lock_guard<std::mutex> lock(eventsMutex_);
            events_.push_back(event);
        });
    }

    void TearDown() override {
        registry_.reset();
    }

    std::vector<SessionEvent::Type> eventTypes() {
        std::lock_guard<std::mutex> lock(eventsMutex_);
        std::vector<SessionEvent::Type> types;
        for (const auto& event : events_) {
            types.push_back(event.type);
        }
        return types;
    }

    std::unique_ptr<SessionRegistry> registry_;
    std::mutex eventsMutex_;
    std::vector<SessionEvent> events_;
};

// =============================================================================
// Lifecycle Tests
// =============================================================================

TEST_F(SessionRegistryTest, FirstClientCreatesSession) {
    auto added = registry_->addClient("content", "client-1");

    ASSERT_NE(added.first, nullptr);
    EXPECT_TRUE(added.second);
    EXPECT_EQ(registry_->sessionCount(), 1u);
    EXPECT_EQ(registry_->find("content"), added.first);
}

TEST_F(SessionRegistryTest, SecondClientJoinsExistingSession) {
    auto first = registry_->addClient("content", "client-1");
    auto second = registry_->addClient("content", "client-2");

    EXPECT_FALSE(second.second);
    EXPECT_EQ(first.first, second.first);
    EXPECT_EQ(first.first->clientCount(), 2u);
}

TEST_F(SessionRegistryTest, LastClientRemovesSession) {
    registry_->addClient("content", "client-1");
    registry_->addClient("content", "client-2");

    auto removed = registry_->removeClient("content", "client-1");
    EXPECT_TRUE(removed.found);
    EXPECT_FALSE(removed.wasLast);
    EXPECT_NE(registry_->find("content"), nullptr);

    removed = registry_->removeClient("content", "client-2");
    EXPECT_TRUE(removed.found);
    EXPECT_TRUE(removed.wasLast);
    ASSERT_NE(removed.session, nullptr);
    EXPECT_EQ(removed.session->contentId(), "content");
    EXPECT_EQ(registry_->find("content"), nullptr);
    EXPECT_EQ(registry_->sessionCount(), 0u);
}

TEST_F(SessionRegistryTest, RemovingUnknownContentIsNoop) {
    auto removed = registry_->removeClient("nothing", "client-1");
    EXPECT_FALSE(removed.found);
    EXPECT_FALSE(removed.wasLast);
    EXPECT_EQ(removed.session, nullptr);
}

TEST_F(SessionRegistryTest, EmitsLifecycleEvents) {
    registry_->addClient("content", "client-1");
    registry_->removeClient("content", "client-1");

    std::vector<SessionEvent::Type> expected = {
        SessionEvent::Type::SessionCreated,
        SessionEvent::Type::ClientJoined,
        SessionEvent::Type::ClientLeft,
        SessionEvent::Type::SessionRemoved,
    };
    EXPECT_EQ(eventTypes(), expected);
}

TEST_F(SessionRegistryTest, SnapshotListsClients) {
    registry_->addClient("a", "c1");
    registry_->addClient("a", "c2");
    registry_->addClient("b", "c3");

    auto sessions = registry_->getAllSessions();
    ASSERT_EQ(sessions.size(), 2u);
    std::sort(sessions.begin(), sessions.end(),
              [](const SessionSnapshot& x, const SessionSnapshot& y) { return x.contentId < y.contentId; });
    EXPECT_EQ(sessions[0].contentId, "a");
    EXPECT_EQ(sessions[0].clientCount, 2u);
    EXPECT_EQ(sessions[1].clientIds, std::vector<core::ClientId>{"c3"});
}

// =============================================================================
// Concurrency Tests
// =============================================================================

TEST_F(SessionRegistryTest, ConcurrentJoinLeaveKeepsCountConsistent) {
    const int threadCount = 8;
    const int iterations = 200;
    std::atomic<int> created{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([this, t, iterations, &created]() {
            for (int i = 0; i < iterations; ++i) {
                std::string client = "client-" + std::to_string(t) + "-" + std::to_string(i);
                auto added = registry_->addClient("shared", client);
                if (added.second) {
                    ++created;
                }
                // A session present in the registry always has at least one client.
                auto session = registry_->find("shared");
                if (session) {
                    EXPECT_GT(session->clientCount(), 0u);
                }
                registry_->removeClient("shared", client);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry_->sessionCount(), 0u);
    EXPECT_GE(created.load(), 1);
}

} // namespace test
} // namespace streaming
} // namespace aceproxy
