#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "h1_client/connection_factory.hpp"
#include "h1_client/connection_pool.hpp"
#include "test_support.hpp"

using namespace h1_client;
using namespace h1_client_test;
using namespace std::chrono_literals;

namespace {

    // Hands out opened-but-unconnected sockets; health and failures are
    // scripted by the test.
    class FakeFactory : public ConnectionFactory {
       public:
        explicit FakeFactory(net::any_io_executor ex) : ex_(std::move(ex)) {}

        net::awaitable<Result<std::unique_ptr<Connection>>> create(
            const RemoteAddress&) override {
            ++create_calls;
            if (create_delay.count() > 0) {
                co_await sleep_for(create_delay);
            }
            if (fail_next > 0) {
                --fail_next;
                co_return Result<std::unique_ptr<Connection>>::err(
                    Error::Code::ConnectError, "connection refused");
            }
            auto conn = std::make_unique<Connection>(ex_);
            conn->socket().open(tcp::v4());
            co_return Result<std::unique_ptr<Connection>>::ok(std::move(conn));
        }

        RecycleResult recycle(Connection&) override {
            ++recycle_calls;
            return healthy ? RecycleResult::Healthy : RecycleResult::Unhealthy;
        }

        std::atomic<int> create_calls{0};
        std::atomic<int> recycle_calls{0};
        std::atomic<int> fail_next{0};
        std::atomic<bool> healthy{true};
        std::chrono::milliseconds create_delay{0};

       private:
        net::any_io_executor ex_;
    };

    PoolKey test_key() {
        return PoolKey{RemoteAddress(net::ip::make_address("127.0.0.1"), 80),
                       ""};
    }

    ConnectionPoolOptions options(std::size_t max,
                                  std::optional<std::chrono::milliseconds>
                                      wait = std::nullopt,
                                  std::optional<std::chrono::milliseconds>
                                      idle = std::nullopt) {
        ConnectionPoolOptions opt;
        opt.max_connections = max;
        opt.wait_timeout = wait;
        opt.idle_timeout = idle;
        return opt;
    }

    struct PoolFixture : ::testing::Test {
        IoThreadRunner runner;
        std::shared_ptr<FakeFactory> factory;

        PoolFixture() {
            runner.start();
            factory = std::make_shared<FakeFactory>(runner.executor());
        }

        std::unique_ptr<ConnectionPool> make_pool(ConnectionPoolOptions opt) {
            return std::make_unique<ConnectionPool>(runner.executor(),
                                                    test_key(), factory, opt);
        }

        ConnectionPool::Stats stats(ConnectionPool& pool) {
            return await_or_abort(runner.ioc(), pool.stats());
        }
    };

}  // namespace

TEST_F(PoolFixture, CreatesThenReusesIdle) {
    auto pool = make_pool(options(2));

    auto reused = await_or_abort(
        runner.ioc(), [&]() -> net::awaitable<bool> {
            auto l1 = co_await pool->acquire();
            if (!l1) co_return false;
            Connection* first = l1.value().get();
            l1.value().reset();

            auto l2 = co_await pool->acquire();
            if (!l2) co_return false;
            co_return l2.value().get() == first;
        }());

    EXPECT_TRUE(reused);
    EXPECT_EQ(factory->create_calls.load(), 1);
    EXPECT_EQ(factory->recycle_calls.load(), 1);
    EXPECT_EQ(pool->metrics().connection_reused.load(), 1u);

    auto s = stats(*pool);
    EXPECT_EQ(s.open, 1u);
    EXPECT_EQ(s.idle, 1u);
    EXPECT_EQ(s.in_use, 0u);
}

TEST_F(PoolFixture, ReusedConnectionCountsReuse) {
    auto pool = make_pool(options(1));

    auto reuse_count = await_or_abort(
        runner.ioc(), [&]() -> net::awaitable<std::size_t> {
            for (int i = 0; i < 3; ++i) {
                auto l = co_await pool->acquire();
                if (!l) co_return 0;
            }
            auto l = co_await pool->acquire();
            co_return l ? l.value()->reuse_count() : 0;
        }());

    EXPECT_EQ(reuse_count, 3u);
    EXPECT_EQ(factory->create_calls.load(), 1);
}

TEST_F(PoolFixture, WaiterSuspendsUntilRelease) {
    auto pool = make_pool(options(2));

    auto ok = await_or_abort(
        runner.ioc(), [&]() -> net::awaitable<bool> {
            auto l1 = co_await pool->acquire();
            auto l2 = co_await pool->acquire();
            if (!l1 || !l2) co_return false;
            Connection* first = l1.value().get();

            bool third_done = false;
            Connection* third = nullptr;
            net::co_spawn(
                co_await net::this_coro::executor,
                [&]() -> net::awaitable<void> {
                    auto l3 = co_await pool->acquire();
                    if (l3) third = l3.value().get();
                    third_done = true;
                },
                net::detached);

            co_await sleep_for(30ms);
            if (third_done) co_return false;

            auto s = co_await pool->stats();
            if (s.waiters != 1 || s.open != 2) co_return false;

            l1.value().reset();
            for (int i = 0; i < 100 && !third_done; ++i) {
                co_await sleep_for(5ms);
            }
            co_return third_done && third == first;
        }());

    EXPECT_TRUE(ok);
    EXPECT_EQ(factory->create_calls.load(), 2);
}

TEST_F(PoolFixture, WaitersAreServedInArrivalOrder) {
    auto pool = make_pool(options(1));

    auto order = await_or_abort(
        runner.ioc(), [&]() -> net::awaitable<std::vector<int>> {
            std::vector<int> served;
            int finished = 0;

            auto held = co_await pool->acquire();

            auto ex = co_await net::this_coro::executor;
            for (int id = 1; id <= 3; ++id) {
                net::co_spawn(
                    ex,
                    [&, id]() -> net::awaitable<void> {
                        auto l = co_await pool->acquire();
                        served.push_back(id);
                        co_await sleep_for(5ms);
                        ++finished;
                    },
                    net::detached);
                // Let each waiter enqueue before the next one starts.
                co_await sleep_for(10ms);
            }

            held.value().reset();
            for (int i = 0; i < 200 && finished < 3; ++i) {
                co_await sleep_for(5ms);
            }
            co_return served;
        }());

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(factory->create_calls.load(), 1);
}

TEST_F(PoolFixture, WaitTimeoutLeavesCountsUnchanged) {
    auto pool = make_pool(options(1, 40ms));

    auto ok = await_or_abort(
        runner.ioc(), [&]() -> net::awaitable<bool> {
            auto held = co_await pool->acquire();
            if (!held) co_return false;

            auto before = co_await pool->stats();

            auto timed_out = co_await pool->acquire();
            if (timed_out || timed_out.error().code != Error::Code::Timeout) {
                co_return false;
            }

            auto after = co_await pool->stats();
            co_return before.open == after.open &&
                before.in_use == after.in_use && after.waiters == 0;
        }());

    EXPECT_TRUE(ok);
    EXPECT_EQ(pool->metrics().acquire_timeout.load(), 1u);

    // The held connection went back to idle and can be reused.
    auto again = await_or_abort(runner.ioc(), pool->acquire());
    EXPECT_TRUE(again.has_value());
    EXPECT_EQ(factory->create_calls.load(), 1);
}

TEST_F(PoolFixture, UnhealthyIdleConnectionIsDiscarded) {
    auto pool = make_pool(options(1));

    {
        auto first = await_or_abort(runner.ioc(), pool->acquire());
        ASSERT_TRUE(first.has_value()) << first.error().message;
    }

    factory->healthy = false;

    auto second = await_or_abort(runner.ioc(), pool->acquire());
    ASSERT_TRUE(second.has_value()) << second.error().message;

    EXPECT_EQ(factory->create_calls.load(), 2);
    EXPECT_EQ(pool->metrics().connection_dropped_unhealthy.load(), 1u);

    auto s = stats(*pool);
    EXPECT_EQ(s.open, 1u);
    EXPECT_EQ(s.in_use, 1u);
}

TEST_F(PoolFixture, CreateFailureFreesTheSlot) {
    auto pool = make_pool(options(1));
    factory->fail_next = 1;

    auto failed = await_or_abort(runner.ioc(), pool->acquire());
    ASSERT_TRUE(failed.has_error());
    EXPECT_EQ(failed.error().code, Error::Code::ConnectError);

    auto s = stats(*pool);
    EXPECT_EQ(s.open, 0u);
    EXPECT_EQ(s.in_use, 0u);
    EXPECT_EQ(pool->metrics().connection_create_failed.load(), 1u);

    auto ok = await_or_abort(runner.ioc(), pool->acquire());
    EXPECT_TRUE(ok.has_value());
}

TEST_F(PoolFixture, CreateFailureWakesWaiter) {
    auto pool = make_pool(options(1));
    factory->fail_next = 1;
    factory->create_delay = 30ms;

    auto codes = await_or_abort(
        runner.ioc(), [&]() -> net::awaitable<std::vector<bool>> {
            std::vector<bool> results(2, false);
            int finished = 0;
            auto ex = co_await net::this_coro::executor;

            for (int i = 0; i < 2; ++i) {
                net::co_spawn(
                    ex,
                    [&, i]() -> net::awaitable<void> {
                        auto l = co_await pool->acquire();
                        results[i] = l.has_value();
                        ++finished;
                    },
                    net::detached);
            }
            for (int i = 0; i < 200 && finished < 2; ++i) {
                co_await sleep_for(5ms);
            }
            co_return results;
        }());

    // The first creator fails, the waiter behind it creates successfully.
    EXPECT_EQ(codes, (std::vector<bool>{false, true}));
    EXPECT_EQ(factory->create_calls.load(), 2);
}

TEST_F(PoolFixture, MarkBadDestroysOnRelease) {
    auto pool = make_pool(options(2));

    {
        auto lease = await_or_abort(runner.ioc(), pool->acquire());
        ASSERT_TRUE(lease.has_value());
        lease.value().mark_bad();
    }

    auto s = stats(*pool);
    EXPECT_EQ(s.open, 0u);
    EXPECT_EQ(s.idle, 0u);
    EXPECT_EQ(pool->metrics().connection_dropped_not_reusable.load(), 1u);
}

TEST_F(PoolFixture, ConnectionMarkedNotReusableIsDestroyed) {
    auto pool = make_pool(options(2));

    {
        auto lease = await_or_abort(runner.ioc(), pool->acquire());
        ASSERT_TRUE(lease.has_value());
        lease.value()->mark_not_reusable();
    }

    EXPECT_EQ(stats(*pool).open, 0u);
}

TEST_F(PoolFixture, ConcurrentAcquiresNeverExceedMax) {
    auto pool = make_pool(options(3));
    factory->create_delay = 10ms;

    auto peak = await_or_abort(
        runner.ioc(), [&]() -> net::awaitable<int> {
            int active = 0;
            int max_active = 0;
            int finished = 0;
            auto ex = co_await net::this_coro::executor;

            for (int i = 0; i < 12; ++i) {
                net::co_spawn(
                    ex,
                    [&]() -> net::awaitable<void> {
                        auto l = co_await pool->acquire();
                        if (l) {
                            ++active;
                            max_active = std::max(max_active, active);
                            co_await sleep_for(5ms);
                            --active;
                        }
                        ++finished;
                    },
                    net::detached);
            }
            for (int i = 0; i < 400 && finished < 12; ++i) {
                co_await sleep_for(5ms);
            }
            co_return max_active;
        }());

    EXPECT_LE(peak, 3);
    EXPECT_GE(peak, 1);
    EXPECT_LE(factory->create_calls.load(), 3);
    EXPECT_LE(stats(*pool).open, 3u);
}

TEST_F(PoolFixture, ShutdownFailsWaitersAndLaterAcquires) {
    auto pool = make_pool(options(1));

    auto ok = await_or_abort(
        runner.ioc(), [&]() -> net::awaitable<bool> {
            auto held = co_await pool->acquire();
            if (!held) co_return false;

            std::optional<Error::Code> waiter_code;
            net::co_spawn(
                co_await net::this_coro::executor,
                [&]() -> net::awaitable<void> {
                    auto l = co_await pool->acquire();
                    if (!l) waiter_code = l.error().code;
                },
                net::detached);
            co_await sleep_for(20ms);

            co_await pool->shutdown();
            for (int i = 0; i < 100 && !waiter_code; ++i) {
                co_await sleep_for(5ms);
            }
            if (waiter_code != Error::Code::PoolShutdown) co_return false;

            auto late = co_await pool->acquire();
            if (late || late.error().code != Error::Code::PoolShutdown) {
                co_return false;
            }

            // Released after shutdown: closed, not idled.
            held.value().reset();
            auto s = co_await pool->stats();
            co_return s.open == 0 && s.idle == 0;
        }());

    EXPECT_TRUE(ok);
}

TEST_F(PoolFixture, IdleTimeoutExpiresConnections) {
    auto pool = make_pool(options(2, std::nullopt, 20ms));

    {
        auto lease = await_or_abort(runner.ioc(), pool->acquire());
        ASSERT_TRUE(lease.has_value());
    }
    EXPECT_EQ(stats(*pool).idle, 1u);

    std::this_thread::sleep_for(60ms);

    auto dropped = await_or_abort(runner.ioc(), pool->reap_idle());
    EXPECT_EQ(dropped, 1u);
    EXPECT_EQ(stats(*pool).open, 0u);
    EXPECT_EQ(pool->metrics().connection_dropped_idle_timeout.load(), 1u);
}

TEST_F(PoolFixture, ExpiredIdleIsNotHandedOut) {
    auto pool = make_pool(options(2, std::nullopt, 20ms));

    {
        auto lease = await_or_abort(runner.ioc(), pool->acquire());
        ASSERT_TRUE(lease.has_value());
    }
    std::this_thread::sleep_for(60ms);

    auto lease = await_or_abort(runner.ioc(), pool->acquire());
    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(factory->create_calls.load(), 2);
    EXPECT_EQ(factory->recycle_calls.load(), 0);
}

TEST_F(PoolFixture, LeaseOutlivingPoolJustCloses) {
    auto pool = make_pool(options(1));

    auto lease = await_or_abort(runner.ioc(), pool->acquire());
    ASSERT_TRUE(lease.has_value());

    pool.reset();
    lease.value().reset();
    EXPECT_FALSE(static_cast<bool>(lease.value()));
}
