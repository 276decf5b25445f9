#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "h1_client/dispatcher.hpp"
#include "test_support.hpp"

using h1_client_test::HttpTestServer;
using h1_client_test::reply_with;

static void print_result(const char* label, int iters,
                         std::chrono::nanoseconds total,
                         std::chrono::nanoseconds min,
                         std::chrono::nanoseconds max) {
    const double total_ms =
        std::chrono::duration<double, std::milli>(total).count();
    const double avg_ms = total_ms / iters;
    const double min_ms =
        std::chrono::duration<double, std::milli>(min).count();
    const double max_ms =
        std::chrono::duration<double, std::milli>(max).count();

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        iters=" << iters << std::fixed
              << std::setprecision(2) << " total_ms=" << total_ms
              << " avg_ms=" << avg_ms << " min_ms=" << min_ms
              << " max_ms=" << max_ms << "\n";
}

template <std::size_t N>
static void print_rps(const char* label, int seconds, std::uint64_t total_reqs,
                      const std::array<std::atomic<std::uint32_t>, N>& per_sec,
                      std::size_t connections) {
    std::uint32_t peak = 0;
    for (const auto& v : per_sec) peak = std::max(peak, v.load());

    const double avg = seconds > 0 ? (double)total_reqs / (double)seconds : 0.0;

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        duration_s=" << seconds
              << " total_reqs=" << total_reqs << " avg_rps=" << std::fixed
              << std::setprecision(2) << avg << " peak_rps=" << peak
              << " connections=" << connections << "\n";
}

class DispatcherPerf : public ::testing::Test {
   protected:
    static void SetUpTestSuite() {
        server_ = new HttpTestServer(reply_with("OK"));
        url_ = server_->url("/health");
    }

    static void TearDownTestSuite() {
        delete server_;
        server_ = nullptr;
    }

    // Sequential GETs on one coroutine; returns false on the first failure.
    static bool run_sequential(const h1_client::DispatcherConfiguration& cfg,
                               int iters, const char* label) {
        using clock = std::chrono::steady_clock;

        boost::asio::io_context ioc(1);
        h1_client::Dispatcher dispatcher(ioc.get_executor(), cfg);

        std::chrono::nanoseconds total{0};
        std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
        std::chrono::nanoseconds max{0};
        bool success = true;

        boost::asio::co_spawn(
            ioc,
            [&]() -> boost::asio::awaitable<void> {
                // Warm-up
                auto warm = co_await dispatcher.get(url_);
                if (!warm || warm.value().status_code != 200) {
                    success = false;
                    co_return;
                }

                for (int i = 0; i < iters; ++i) {
                    const auto t0 = clock::now();
                    auto r = co_await dispatcher.get(url_);
                    const auto t1 = clock::now();

                    if (!r || r.value().status_code != 200) {
                        success = false;
                        break;
                    }

                    const auto dt =
                        std::chrono::duration_cast<std::chrono::nanoseconds>(
                            t1 - t0);
                    total += dt;
                    min = std::min(min, dt);
                    max = std::max(max, dt);
                }
                co_await dispatcher.shutdown();
            },
            boost::asio::detached);

        ioc.run();

        if (success) print_result(label, iters, total, min, max);
        return success;
    }

    static inline HttpTestServer* server_ = nullptr;
    static inline std::string url_;
};

TEST_F(DispatcherPerf, WarmKeepAliveSequential) {
    h1_client::DispatcherConfiguration cfg;
    cfg.tcp_no_delay = true;
    ASSERT_TRUE(
        run_sequential(cfg, 500, "Warm keep-alive (dispatcher -> local server)"));
}

TEST_F(DispatcherPerf, ConnectionPerRequestSequential) {
    h1_client::DispatcherConfiguration cfg;
    cfg.keep_alive = false;
    cfg.tcp_no_delay = true;
    ASSERT_TRUE(run_sequential(
        cfg, 200, "Connection per request (dispatcher -> local server)"));
}

TEST_F(DispatcherPerf, MaxRps5SecondsConcurrency16) {
    constexpr int seconds = 5;
    constexpr int concurrency = 16;

    h1_client::DispatcherConfiguration cfg;
    cfg.tcp_no_delay = true;
    cfg.max_connections_per_host = 8;

    const unsigned threads = std::max(2u, std::thread::hardware_concurrency());
    boost::asio::io_context ioc(static_cast<int>(threads));
    h1_client::Dispatcher dispatcher(ioc.get_executor(), cfg);

    std::array<std::atomic<std::uint32_t>, seconds + 1> per_sec{};
    std::atomic<std::uint64_t> total_reqs{0};
    std::atomic<std::uint64_t> failures{0};
    std::atomic<bool> run{true};
    std::atomic<int> finished{0};

    using clock = std::chrono::steady_clock;
    const auto start = clock::now();

    for (int i = 0; i < concurrency; ++i) {
        boost::asio::co_spawn(
            ioc,
            [&]() -> boost::asio::awaitable<void> {
                while (run.load(std::memory_order_relaxed)) {
                    auto r = co_await dispatcher.get(url_);
                    if (!r) {
                        failures.fetch_add(1, std::memory_order_relaxed);
                        continue;
                    }
                    const auto elapsed =
                        std::chrono::duration_cast<std::chrono::seconds>(
                            clock::now() - start)
                            .count();
                    if (elapsed < seconds) {
                        total_reqs.fetch_add(1, std::memory_order_relaxed);
                        per_sec[static_cast<std::size_t>(elapsed)].fetch_add(
                            1, std::memory_order_relaxed);
                    }
                }
                finished.fetch_add(1);
            },
            boost::asio::detached);
    }

    std::vector<std::thread> workers;
    for (unsigned i = 0; i < threads; ++i) {
        workers.emplace_back([&] { ioc.run(); });
    }

    std::this_thread::sleep_for(std::chrono::seconds(seconds));
    run = false;
    while (finished.load() < concurrency) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    auto pools = h1_client_test::await_or_abort(ioc, dispatcher.stats());
    ioc.stop();
    for (auto& t : workers) t.join();

    ASSERT_EQ(pools.size(), 1u);
    EXPECT_LE(pools[0].metrics.connection_created, 8u);
    EXPECT_EQ(failures.load(), 0u);

    print_rps("Max RPS over 5s (dispatcher, 16 coroutines, 8 connections)",
              seconds, total_reqs.load(), per_sec,
              static_cast<std::size_t>(pools[0].metrics.connection_created));
}
