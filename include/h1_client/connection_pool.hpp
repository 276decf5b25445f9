#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <utility>

#include "h1_client/connection.hpp"
#include "h1_client/connection_factory.hpp"
#include "h1_client/connection_pool_types.hpp"
#include "h1_client/remote_address.hpp"
#include "h1_client/result.hpp"

namespace h1_client {

    /**
     * @brief Bounded set of connections to one PoolKey.
     *
     * All state lives behind a strand; acquire() suspends the caller until
     * an idle connection passes ConnectionFactory::recycle or a new one can
     * be created without exceeding ConnectionPoolOptions::max_connections.
     * Waiters are served in arrival order.
     */
    class ConnectionPool {
       public:
        using executor_type = boost::asio::any_io_executor;
        using clock_type = std::chrono::steady_clock;
        using connection_ptr = std::unique_ptr<Connection>;

       private:
        struct IdleEntry {
            connection_ptr conn;
            clock_type::time_point last_used{};
        };

        struct Waiter {
            boost::asio::steady_timer timer;
            bool notified = false;

            template <typename Executor>
            explicit Waiter(const Executor& ex) : timer(ex) {}
        };

        // Shared state owned by the pool, referenced weakly by leases.
        struct State {
            executor_type ex;
            boost::asio::strand<executor_type> strand;
            PoolKey key;
            std::shared_ptr<ConnectionFactory> factory;
            ConnectionPoolOptions opt{};

            bool shutting_down = false;

            std::deque<IdleEntry> idle;
            std::size_t open = 0;
            std::size_t in_use = 0;
            std::deque<std::shared_ptr<Waiter>> waiters;
            // Woken but not yet resumed; they still have priority over
            // newcomers.
            std::size_t pending_wakeups = 0;
            std::uint64_t next_id = 1;

            ConnectionPoolMetrics metrics;

            State(executor_type ex_, PoolKey key_,
                  std::shared_ptr<ConnectionFactory> factory_,
                  ConnectionPoolOptions opt_)
                : ex(std::move(ex_)),
                  strand(boost::asio::make_strand(ex)),
                  key(std::move(key_)),
                  factory(std::move(factory_)),
                  opt(opt_) {}
        };

       public:
        /**
         * @brief Exclusive checkout of one connection.
         *
         * Destroying or resetting the lease hands the connection back to its
         * pool, which idles it or destroys it. If the pool is already gone
         * the connection is simply closed.
         */
        class Lease {
           public:
            Lease() = default;

            ~Lease() { reset(); }

            Lease(const Lease&) = delete;
            Lease& operator=(const Lease&) = delete;

            Lease(Lease&& other) noexcept
                : m_state(std::exchange(other.m_state, {})),
                  m_conn(std::move(other.m_conn)),
                  m_reusable(std::exchange(other.m_reusable, true)) {}

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    m_state = std::exchange(other.m_state, {});
                    m_conn = std::move(other.m_conn);
                    m_reusable = std::exchange(other.m_reusable, true);
                }
                return *this;
            }

            Connection* operator->() const noexcept { return m_conn.get(); }

            Connection& operator*() const noexcept { return *m_conn; }

            Connection* get() const noexcept { return m_conn.get(); }

            explicit operator bool() const noexcept {
                return static_cast<bool>(m_conn);
            }

            /// @brief Destroy the connection on release instead of idling it.
            void mark_bad() noexcept { m_reusable = false; }

            void reset() noexcept;

           private:
            friend class ConnectionPool;

            Lease(std::weak_ptr<State> st, connection_ptr c) noexcept
                : m_state(std::move(st)), m_conn(std::move(c)) {}

            std::weak_ptr<State> m_state;
            connection_ptr m_conn{};
            bool m_reusable{true};
        };

        struct Stats {
            std::size_t open = 0;
            std::size_t idle = 0;
            std::size_t in_use = 0;
            std::size_t waiters = 0;
        };

        ConnectionPool(executor_type ex, PoolKey key,
                       std::shared_ptr<ConnectionFactory> factory,
                       ConnectionPoolOptions opt = {});

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        ~ConnectionPool();

        const PoolKey& key() const noexcept { return m_state->key; }

        const ConnectionPoolOptions& options() const noexcept {
            return m_state->opt;
        }

        /// @brief Check out a connection, creating one if there is room.
        /// @return The factory's ConnectError or TlsError if creation fails,
        /// Timeout if the wait exceeds the configured bound, PoolShutdown
        /// once shutdown() has been called.
        boost::asio::awaitable<Result<Lease>> acquire();

        /// @brief Drop idle connections older than the idle timeout.
        /// @return Number of connections dropped.
        boost::asio::awaitable<std::size_t> reap_idle();

        /// @brief Fail every waiter with PoolShutdown and close idle
        /// connections. Checked-out connections close on release.
        boost::asio::awaitable<void> shutdown();

        boost::asio::awaitable<Stats> stats();

        const ConnectionPoolMetrics& metrics() const noexcept {
            return m_state->metrics;
        }

       private:
        // Strand-side result of one acquire. Error set means failure.
        struct AcquireOutcome {
            Lease lease;
            std::optional<Error> error;
        };

        static boost::asio::awaitable<AcquireOutcome> acquire_impl(
            std::shared_ptr<State> s);

        static std::size_t prune_expired(State& s, clock_type::time_point now);
        static void wake_one(State& s);
        static void close_connection(connection_ptr& c) noexcept;

        static void return_to_pool(std::shared_ptr<State> s,
                                   connection_ptr conn, bool reusable) noexcept;
        static void return_to_pool_on_strand(const std::shared_ptr<State>& s,
                                             connection_ptr conn,
                                             bool reusable);

       private:
        std::shared_ptr<State> m_state;
    };

    inline void ConnectionPool::Lease::reset() noexcept {
        if (!m_conn) return;

        auto st = m_state.lock();
        if (!st) {
            // Pool already gone; the Connection dtor closes the socket.
            m_conn.reset();
        } else {
            ConnectionPool::return_to_pool(std::move(st), std::move(m_conn),
                                           m_reusable);
        }

        m_reusable = true;
        m_state.reset();
    }

}  // namespace h1_client
