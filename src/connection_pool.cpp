#include "h1_client/connection_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace h1_client {

    ConnectionPool::ConnectionPool(executor_type ex, PoolKey key,
                                   std::shared_ptr<ConnectionFactory> factory,
                                   ConnectionPoolOptions opt)
        : m_state(std::make_shared<State>(std::move(ex), std::move(key),
                                          std::move(factory), opt)) {
        SPDLOG_DEBUG("pool {}: created (max {})", m_state->key.to_string(),
                     m_state->opt.max_connections);
    }

    ConnectionPool::~ConnectionPool() {
        auto s = std::move(m_state);
        if (!s) return;

        // Best-effort drain on the strand. Waiters hold their own reference
        // to the state and wake up with PoolShutdown.
        boost::asio::dispatch(s->strand, [s] {
            s->shutting_down = true;

            while (!s->waiters.empty()) wake_one(*s);

            while (!s->idle.empty()) {
                auto entry = std::move(s->idle.front());
                s->idle.pop_front();
                close_connection(entry.conn);
                if (s->open) --s->open;
            }
        });
    }

    boost::asio::awaitable<Result<ConnectionPool::Lease>>
    ConnectionPool::acquire() {
        auto s = m_state;

        auto outcome = co_await boost::asio::co_spawn(
            s->strand,
            [s]() -> boost::asio::awaitable<AcquireOutcome> {
                co_return co_await acquire_impl(s);
            },
            boost::asio::use_awaitable);

        if (outcome.error) {
            co_return Result<Lease>::err(std::move(*outcome.error));
        }
        co_return Result<Lease>::ok(std::move(outcome.lease));
    }

    boost::asio::awaitable<std::size_t> ConnectionPool::reap_idle() {
        auto s = m_state;

        co_return co_await boost::asio::co_spawn(
            s->strand,
            [s]() -> boost::asio::awaitable<std::size_t> {
                if (s->shutting_down) co_return 0;
                co_return prune_expired(*s, clock_type::now());
            },
            boost::asio::use_awaitable);
    }

    boost::asio::awaitable<void> ConnectionPool::shutdown() {
        auto s = m_state;

        co_await boost::asio::co_spawn(
            s->strand,
            [s]() -> boost::asio::awaitable<void> {
                if (s->shutting_down) co_return;
                s->shutting_down = true;

                SPDLOG_DEBUG("pool {}: shutting down ({} waiter(s), {} idle)",
                             s->key.to_string(), s->waiters.size(),
                             s->idle.size());

                while (!s->waiters.empty()) wake_one(*s);

                while (!s->idle.empty()) {
                    auto entry = std::move(s->idle.front());
                    s->idle.pop_front();
                    close_connection(entry.conn);
                    if (s->open) --s->open;
                }
                co_return;
            },
            boost::asio::use_awaitable);
    }

    boost::asio::awaitable<ConnectionPool::Stats> ConnectionPool::stats() {
        auto s = m_state;

        co_return co_await boost::asio::co_spawn(
            s->strand,
            [s]() -> boost::asio::awaitable<Stats> {
                Stats out{};
                out.open = s->open;
                out.idle = s->idle.size();
                out.in_use = s->in_use;
                out.waiters = s->waiters.size();
                co_return out;
            },
            boost::asio::use_awaitable);
    }

    // -------------------------
    // return path
    // -------------------------

    void ConnectionPool::return_to_pool(std::shared_ptr<State> s,
                                        connection_ptr conn,
                                        bool reusable) noexcept {
        if (!s || !conn) return;

        auto& strand = s->strand;
        boost::asio::post(strand, [s = std::move(s), conn = std::move(conn),
                                   reusable]() mutable {
            return_to_pool_on_strand(s, std::move(conn), reusable);
        });
    }

    void ConnectionPool::return_to_pool_on_strand(
        const std::shared_ptr<State>& s, connection_ptr conn, bool reusable) {
        if (s->in_use) --s->in_use;

        const bool keep = reusable && conn->reusable() && conn->is_open() &&
                          !s->shutting_down;

        if (keep) {
            SPDLOG_TRACE("pool {}: connection {} back to idle",
                         s->key.to_string(), conn->id());
            s->idle.push_back(IdleEntry{std::move(conn), clock_type::now()});
        } else {
            if (!reusable || !conn->reusable()) {
                ++s->metrics.connection_dropped_not_reusable;
            }
            SPDLOG_DEBUG("pool {}: closing connection {} on release",
                         s->key.to_string(), conn->id());
            close_connection(conn);
            if (s->open) --s->open;
        }

        wake_one(*s);
    }

    // -------------------------
    // acquire
    // -------------------------

    boost::asio::awaitable<ConnectionPool::AcquireOutcome>
    ConnectionPool::acquire_impl(std::shared_ptr<State> s) {
        AcquireOutcome out;
        bool woken = false;

        for (;;) {
            if (s->shutting_down) {
                ++s->metrics.acquire_shutdown;
                out.error = Error{Error::Code::PoolShutdown,
                                  "pool " + s->key.to_string() +
                                      " is shut down"};
                co_return out;
            }

            // Newcomers queue behind anyone already waiting.
            const bool must_queue =
                !woken && (!s->waiters.empty() || s->pending_wakeups > 0);

            if (!must_queue) {
                prune_expired(*s, clock_type::now());

                while (!s->idle.empty()) {
                    auto entry = std::move(s->idle.back());
                    s->idle.pop_back();

                    if (s->factory->recycle(*entry.conn) ==
                        RecycleResult::Unhealthy) {
                        ++s->metrics.connection_dropped_unhealthy;
                        SPDLOG_DEBUG(
                            "pool {}: discarding unhealthy connection {}",
                            s->key.to_string(), entry.conn->id());
                        close_connection(entry.conn);
                        if (s->open) --s->open;
                        continue;
                    }

                    ++s->in_use;
                    entry.conn->mark_reused();
                    ++s->metrics.connection_reused;
                    ++s->metrics.acquire_success;
                    SPDLOG_TRACE("pool {}: reusing connection {}",
                                 s->key.to_string(), entry.conn->id());
                    out.lease = Lease{std::weak_ptr<State>(s),
                                      std::move(entry.conn)};
                    co_return out;
                }

                if (s->open < s->opt.max_connections) {
                    // Reserve the slot before suspending in create().
                    ++s->open;
                    ++s->in_use;

                    auto created =
                        co_await s->factory->create(s->key.address);

                    if (!created) {
                        --s->open;
                        --s->in_use;
                        ++s->metrics.connection_create_failed;
                        SPDLOG_DEBUG("pool {}: create failed: {}",
                                     s->key.to_string(),
                                     created.error().message);
                        wake_one(*s);
                        out.error = std::move(created).error();
                        co_return out;
                    }

                    connection_ptr conn = std::move(created).value();
                    conn->assign_id(s->next_id++);
                    ++s->metrics.connection_created;

                    if (s->shutting_down) {
                        close_connection(conn);
                        --s->open;
                        --s->in_use;
                        continue;
                    }

                    ++s->metrics.acquire_success;
                    SPDLOG_DEBUG("pool {}: opened connection {} ({}/{})",
                                 s->key.to_string(), conn->id(), s->open,
                                 s->opt.max_connections);
                    out.lease =
                        Lease{std::weak_ptr<State>(s), std::move(conn)};
                    co_return out;
                }
            }

            auto waiter = std::make_shared<Waiter>(s->strand);
            if (s->opt.wait_timeout) {
                waiter->timer.expires_after(*s->opt.wait_timeout);
            } else {
                waiter->timer.expires_at(clock_type::time_point::max());
            }

            // A woken waiter that still found nothing keeps its place.
            if (woken) {
                s->waiters.push_front(waiter);
            } else {
                s->waiters.push_back(waiter);
            }

            boost::system::error_code ec;
            co_await waiter->timer.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));

            if (!waiter->notified) {
                // Timed out. Nothing was reserved for us, so only the queue
                // entry needs to go.
                auto it =
                    std::find(s->waiters.begin(), s->waiters.end(), waiter);
                if (it != s->waiters.end()) s->waiters.erase(it);

                ++s->metrics.acquire_timeout;
                out.error = Error{Error::Code::Timeout,
                                  "timed out waiting for a connection to " +
                                      s->key.to_string()};
                co_return out;
            }

            if (s->pending_wakeups) --s->pending_wakeups;
            woken = true;
        }
    }

    // -------------------------
    // utilities
    // -------------------------

    void ConnectionPool::wake_one(State& s) {
        while (!s.waiters.empty()) {
            auto w = std::move(s.waiters.front());
            s.waiters.pop_front();
            if (!w) continue;

            w->notified = true;
            ++s.pending_wakeups;
            w->timer.cancel();
            return;
        }
    }

    void ConnectionPool::close_connection(connection_ptr& c) noexcept {
        if (!c) return;
        c->close();
        c.reset();
    }

    std::size_t ConnectionPool::prune_expired(State& s,
                                              clock_type::time_point now) {
        if (!s.opt.idle_timeout) return 0;

        const auto ttl = *s.opt.idle_timeout;
        std::size_t dropped = 0;

        // Oldest entries sit at the front.
        while (!s.idle.empty()) {
            const auto age = now - s.idle.front().last_used;
            if (age <= ttl) break;

            auto entry = std::move(s.idle.front());
            s.idle.pop_front();
            close_connection(entry.conn);
            if (s.open) --s.open;

            ++s.metrics.connection_dropped_idle_timeout;
            ++dropped;
        }

        if (dropped) {
            SPDLOG_DEBUG("pool {}: dropped {} expired idle connection(s)",
                         s.key.to_string(), dropped);
            // Freed slots may unblock waiters.
            for (std::size_t i = 0; i < dropped; ++i) wake_one(s);
        }
        return dropped;
    }

}  // namespace h1_client
