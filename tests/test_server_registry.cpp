#include <gtest/gtest.h>
#include "server_registry.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace clb;
using namespace std::chrono_literals;

namespace {

ServerList make_servers(const std::string& prefix, int count) {
    ServerList servers;
    for (int i = 0; i < count; ++i) {
        servers.emplace_back(prefix + std::to_string(i), static_cast<uint16_t>(8080 + i));
    }
    return servers;
}

class ThrowingSource : public ServerSource {
public:
    std::expected<ServerList, Error> fetch(const std::string&) override {
        throw std::runtime_error("connection reset");
    }
};

class SlowSource : public ServerSource {
public:
    std::expected<ServerList, Error> fetch(const std::string&) override {
        std::this_thread::sleep_for(300ms);
        return make_servers("late", 1);
    }
};

// Blocks every fetch until released.
class HungSource : public ServerSource {
public:
    std::expected<ServerList, Error> fetch(const std::string&) override {
        fetches_.fetch_add(1);
        std::unique_lock lock(mutex_);
        released_cv_.wait(lock, [this] { return released_; });
        return make_servers("released", 2);
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            released_ = true;
        }
        released_cv_.notify_all();
    }

    int fetches() const { return fetches_.load(); }

private:
    std::mutex mutex_;
    std::condition_variable released_cv_;
    bool released_ = false;
    std::atomic<int> fetches_{0};
};

class NonStandardThrowingSource : public ServerSource {
public:
    std::expected<ServerList, Error> fetch(const std::string&) override {
        throw 42;
    }
};

} // namespace

class ServerRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = std::make_shared<test::MutableServerSource>(make_servers("host", 3));
        registry = std::make_unique<ServerRegistry>("orders", source, 500ms);
    }

    std::shared_ptr<test::MutableServerSource> source;
    std::unique_ptr<ServerRegistry> registry;
};

TEST_F(ServerRegistryTest, InitialSnapshotIsEmpty) {
    auto snapshot = registry->snapshot();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_TRUE(snapshot->empty());
    EXPECT_FALSE(registry->is_stale());
    EXPECT_EQ(registry->refresh_count(), 0u);
}

TEST_F(ServerRegistryTest, RefreshPublishesFullList) {
    auto snapshot = registry->refresh();
    ASSERT_EQ(snapshot->size(), 3u);
    EXPECT_EQ((*snapshot)[0].id(), "host0:8080");
    EXPECT_EQ((*snapshot)[2].id(), "host2:8082");
    EXPECT_EQ(registry->snapshot(), snapshot);
    EXPECT_EQ(registry->refresh_count(), 1u);
}

TEST_F(ServerRegistryTest, RefreshReplacesRatherThanMerges) {
    registry->refresh();
    source->set_servers(make_servers("other", 2));

    auto snapshot = registry->refresh();
    ASSERT_EQ(snapshot->size(), 2u);
    EXPECT_EQ((*snapshot)[0].host(), "other0");
    EXPECT_EQ((*snapshot)[1].host(), "other1");
}

TEST_F(ServerRegistryTest, OldSnapshotUnchangedAfterRefresh) {
    auto before = registry->refresh();
    source->set_servers(make_servers("other", 5));
    registry->refresh();

    ASSERT_EQ(before->size(), 3u);
    EXPECT_EQ((*before)[0].host(), "host0");
}

TEST_F(ServerRegistryTest, FailedFetchKeepsLastKnownSnapshot) {
    auto good = registry->refresh();
    source->set_failing(true);

    auto after = registry->refresh();
    EXPECT_EQ(after, good);
    EXPECT_EQ(after->size(), 3u);
    EXPECT_TRUE(registry->is_stale());

    auto error = registry->last_error();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, ErrorCode::DiscoveryUnavailable);
}

TEST_F(ServerRegistryTest, RecoversAfterFailure) {
    registry->refresh();
    source->set_failing(true);
    registry->refresh();
    ASSERT_TRUE(registry->is_stale());

    source->set_failing(false);
    source->set_servers(make_servers("back", 4));
    auto snapshot = registry->refresh();

    EXPECT_FALSE(registry->is_stale());
    EXPECT_EQ(snapshot->size(), 4u);
}

TEST_F(ServerRegistryTest, EmptyResultIsPublished) {
    registry->refresh();
    source->set_servers({});

    auto snapshot = registry->refresh();
    EXPECT_TRUE(snapshot->empty());
    EXPECT_FALSE(registry->is_stale());
}

TEST(ServerRegistryFailureTest, ThrowingSourceTreatedAsUnavailable) {
    ServerRegistry registry("orders", std::make_shared<ThrowingSource>(), 500ms);

    auto snapshot = registry.refresh();
    EXPECT_TRUE(snapshot->empty());
    EXPECT_TRUE(registry.is_stale());
    ASSERT_TRUE(registry.last_error().has_value());
    EXPECT_NE(registry.last_error()->message.find("connection reset"), std::string::npos);
}

TEST(ServerRegistryFailureTest, SlowFetchTimesOut) {
    ServerRegistry registry("orders", std::make_shared<SlowSource>(), 20ms);

    auto start = std::chrono::steady_clock::now();
    auto snapshot = registry.refresh();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 250ms);
    EXPECT_TRUE(snapshot->empty());
    EXPECT_TRUE(registry.is_stale());
    ASSERT_TRUE(registry.last_error().has_value());
    EXPECT_EQ(registry.last_error()->code, ErrorCode::DiscoveryUnavailable);
}

TEST(ServerRegistryFailureTest, HungBackendKeepsSingleOutstandingFetch) {
    auto source = std::make_shared<HungSource>();
    ServerRegistry registry("orders", source, 10ms);

    for (int i = 0; i < 20; ++i) {
        auto snapshot = registry.refresh();
        EXPECT_TRUE(snapshot->empty());
        EXPECT_TRUE(registry.is_stale());
    }
    EXPECT_EQ(source->fetches(), 1);

    source->release();
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (registry.snapshot()->empty() && std::chrono::steady_clock::now() < deadline) {
        registry.refresh();
    }

    // The outstanding fetch's result is used once it completes
    EXPECT_EQ(registry.snapshot()->size(), 2u);
    EXPECT_FALSE(registry.is_stale());
    EXPECT_EQ(source->fetches(), 1);
}

TEST(ServerRegistryFailureTest, NonStandardExceptionTreatedAsUnavailable) {
    ServerRegistry registry("orders", std::make_shared<NonStandardThrowingSource>(), 500ms);

    auto snapshot = registry.refresh();
    EXPECT_TRUE(snapshot->empty());
    EXPECT_TRUE(registry.is_stale());
    ASSERT_TRUE(registry.last_error().has_value());
    EXPECT_EQ(registry.last_error()->code, ErrorCode::DiscoveryUnavailable);
}

TEST(ServerRegistryFailureTest, NullSourceTreatedAsUnavailable) {
    ServerRegistry registry("orders", nullptr, 20ms);

    auto snapshot = registry.refresh();
    EXPECT_TRUE(snapshot->empty());
    EXPECT_TRUE(registry.is_stale());
}

TEST(ServerRegistryConcurrencyTest, ReadersSeeWholeSnapshots) {
    const ServerList old_servers = make_servers("old", 5);
    const ServerList new_servers = make_servers("new", 7);
    auto source = std::make_shared<test::MutableServerSource>(old_servers);
    ServerRegistry registry("orders", source, 500ms);
    registry.refresh();

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::atomic<int> reads{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            do {
                auto snapshot = registry.snapshot();
                const std::string prefix = snapshot->front().host().substr(0, 3);
                const size_t expected_size = prefix == "old" ? 5u : 7u;
                bool consistent = snapshot->size() == expected_size;
                for (const auto& server : *snapshot) {
                    consistent = consistent && server.host().compare(0, 3, prefix) == 0;
                }
                if (!consistent) {
                    torn.fetch_add(1);
                }
                reads.fetch_add(1);
            } while (!done.load());
        });
    }

    for (int i = 0; i < 200; ++i) {
        source->set_servers(i % 2 == 0 ? new_servers : old_servers);
        registry.refresh();
    }
    done.store(true);
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(torn.load(), 0);
    EXPECT_GT(reads.load(), 0);
}
