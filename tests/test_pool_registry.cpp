#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "h1_client/connection_factory.hpp"
#include "h1_client/connection_pool.hpp"
#include "h1_client/pool_registry.hpp"

using namespace h1_client;

namespace {

    class NeverUsedFactory : public ConnectionFactory {
       public:
        boost::asio::awaitable<Result<std::unique_ptr<Connection>>> create(
            const RemoteAddress&) override {
            co_return Result<std::unique_ptr<Connection>>::err(
                Error::Code::ConnectError, "not in this test");
        }
        RecycleResult recycle(Connection&) override {
            return RecycleResult::Unhealthy;
        }
    };

    PoolKey key(const char* ip, std::uint16_t port,
                std::string server_name = "") {
        return PoolKey{RemoteAddress(boost::asio::ip::make_address(ip), port),
                       std::move(server_name)};
    }

    struct RegistryFixture : ::testing::Test {
        boost::asio::io_context io;
        std::shared_ptr<ConnectionFactory> factory =
            std::make_shared<NeverUsedFactory>();
        std::atomic<int> pools_made{0};
    };

}  // namespace

TEST_F(RegistryFixture, SameKeyReturnsSamePool) {
    PoolRegistry registry([this](const PoolKey& k) {
        ++pools_made;
        return std::make_shared<ConnectionPool>(io.get_executor(), k, factory);
    });

    auto a = registry.get_or_create(key("127.0.0.1", 80));
    auto b = registry.get_or_create(key("127.0.0.1", 80));
    EXPECT_EQ(a, b);
    EXPECT_EQ(pools_made.load(), 1);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(a->key(), key("127.0.0.1", 80));
}

TEST_F(RegistryFixture, DistinctAddressesAndServerNamesGetDistinctPools) {
    PoolRegistry registry([this](const PoolKey& k) {
        ++pools_made;
        return std::make_shared<ConnectionPool>(io.get_executor(), k, factory);
    });

    auto a = registry.get_or_create(key("127.0.0.1", 80));
    auto b = registry.get_or_create(key("127.0.0.1", 81));
    auto c = registry.get_or_create(key("127.0.0.1", 443, "a.example"));
    auto d = registry.get_or_create(key("127.0.0.1", 443, "b.example"));

    EXPECT_NE(a, b);
    EXPECT_NE(c, d);
    EXPECT_EQ(registry.size(), 4u);

    auto all = registry.snapshot();
    ASSERT_EQ(all.size(), 4u);
    for (const auto& pool : {a, b, c, d}) {
        EXPECT_EQ(std::count(all.begin(), all.end(), pool), 1);
    }
}

TEST_F(RegistryFixture, FindDoesNotCreate) {
    PoolRegistry registry([this](const PoolKey& k) {
        ++pools_made;
        return std::make_shared<ConnectionPool>(io.get_executor(), k, factory);
    });

    EXPECT_EQ(registry.find(key("10.0.0.1", 80)), nullptr);
    EXPECT_EQ(pools_made.load(), 0);

    auto created = registry.get_or_create(key("10.0.0.1", 80));
    EXPECT_EQ(registry.find(key("10.0.0.1", 80)), created);
}

TEST_F(RegistryFixture, ConcurrentFirstUseConvergesOnOnePool) {
    PoolRegistry registry([this](const PoolKey& k) {
        ++pools_made;
        // Widen the race window.
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return std::make_shared<ConnectionPool>(io.get_executor(), k, factory);
    });

    constexpr int kThreads = 16;
    std::vector<std::shared_ptr<ConnectionPool>> seen(kThreads);
    std::vector<std::thread> threads;
    std::atomic<bool> go{false};

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) std::this_thread::yield();
            seen[i] = registry.get_or_create(key("127.0.0.1", 8080));
        });
    }
    go.store(true);
    for (auto& t : threads) t.join();

    EXPECT_EQ(pools_made.load(), 1);
    EXPECT_EQ(registry.size(), 1u);
    for (const auto& p : seen) EXPECT_EQ(p, seen.front());
}

TEST_F(RegistryFixture, FailedPoolConstructionLeavesNoEntry) {
    int calls = 0;
    PoolRegistry registry(
        [&](const PoolKey& k) -> std::shared_ptr<ConnectionPool> {
            if (calls++ == 0) throw std::runtime_error("boom");
            return std::make_shared<ConnectionPool>(io.get_executor(), k,
                                                    factory);
        });

    EXPECT_THROW(registry.get_or_create(key("127.0.0.1", 80)),
                 std::runtime_error);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_NE(registry.get_or_create(key("127.0.0.1", 80)), nullptr);
}

TEST(PoolRegistryTest, RejectsEmptyFactory) {
    EXPECT_THROW(PoolRegistry(PoolRegistry::factory_fn{}),
                 std::invalid_argument);
}
