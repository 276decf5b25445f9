#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace h1_client {

    /// @brief Outcome of the health probe run on an idle connection before
    /// it is handed out again.
    enum class RecycleResult {
        Healthy,   ///< Quiet and open, safe to reuse
        Unhealthy  ///< Closed, half-closed, or has stray bytes; destroy it
    };

    inline const char* to_string(RecycleResult r) {
        switch (r) {
            case RecycleResult::Healthy:
                return "Healthy";
            case RecycleResult::Unhealthy:
                return "Unhealthy";
        }
        return "Unknown";
    }

    /// @brief Limits for one ConnectionPool, taken from the
    /// DispatcherConfiguration that owns it.
    struct ConnectionPoolOptions {
        /** @brief Cap on idle plus checked-out connections. */
        std::size_t max_connections{50};
        /** @brief Bound on one acquire's wait for a free slot. */
        std::optional<std::chrono::milliseconds> wait_timeout;
        /** @brief Idle connections older than this are never reused. */
        std::optional<std::chrono::milliseconds> idle_timeout;
    };

    /// @brief Copyable view of ConnectionPoolMetrics at one point in time.
    struct ConnectionPoolMetricsSnapshot {
        std::uint64_t acquire_success = 0;
        std::uint64_t acquire_timeout = 0;
        std::uint64_t acquire_shutdown = 0;
        std::uint64_t connection_created = 0;
        std::uint64_t connection_create_failed = 0;
        std::uint64_t connection_reused = 0;
        std::uint64_t connection_dropped_unhealthy = 0;
        std::uint64_t connection_dropped_idle_timeout = 0;
        std::uint64_t connection_dropped_not_reusable = 0;
    };

    /// @brief Metrics for monitoring connection pool behavior
    struct ConnectionPoolMetrics {
        // Counters (cumulative)
        std::atomic<std::uint64_t> acquire_success{0};  ///< Successful acquires
        std::atomic<std::uint64_t> acquire_timeout{0};  ///< Pool wait timed out
        std::atomic<std::uint64_t> acquire_shutdown{0};  ///< Pool shutdown
        std::atomic<std::uint64_t> connection_created{0};  ///< New connections
        std::atomic<std::uint64_t> connection_create_failed{
            0};  ///< Dial or handshake failed
        std::atomic<std::uint64_t> connection_reused{0};  ///< Reused idle
        std::atomic<std::uint64_t> connection_dropped_unhealthy{
            0};  ///< Failed the recycle probe
        std::atomic<std::uint64_t> connection_dropped_idle_timeout{
            0};  ///< Idle longer than idle_timeout
        std::atomic<std::uint64_t> connection_dropped_not_reusable{
            0};  ///< Released after a failed or non keep-alive exchange

        ConnectionPoolMetricsSnapshot snapshot() const noexcept {
            ConnectionPoolMetricsSnapshot out;
            out.acquire_success = acquire_success.load();
            out.acquire_timeout = acquire_timeout.load();
            out.acquire_shutdown = acquire_shutdown.load();
            out.connection_created = connection_created.load();
            out.connection_create_failed = connection_create_failed.load();
            out.connection_reused = connection_reused.load();
            out.connection_dropped_unhealthy =
                connection_dropped_unhealthy.load();
            out.connection_dropped_idle_timeout =
                connection_dropped_idle_timeout.load();
            out.connection_dropped_not_reusable =
                connection_dropped_not_reusable.load();
            return out;
        }
    };

}  // namespace h1_client
