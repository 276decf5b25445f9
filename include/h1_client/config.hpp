#pragma once
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "h1_client/error.hpp"

namespace h1_client {

    /**
     * @brief TLS settings for https requests.
     *
     * With nothing but the defaults set, peers are verified against the
     * system trust store.
     */
    struct TlsConfiguration {
        /** @brief Whether to verify the peer certificate and host name. */
        bool verify_peer{true};

        /** @brief PEM bundle added to the trust store. */
        std::optional<std::string> ca_file;

        /** @brief Hashed certificate directory added to the trust store. */
        std::optional<std::string> ca_path;

        /**
         * @brief Caller-built context used as-is for every handshake.
         * @note When set, verify_peer, ca_file and ca_path are ignored.
         */
        std::shared_ptr<boost::asio::ssl::context> context;
    };

    /**
     * @brief Configuration for the Dispatcher.
     *
     * Immutable once the Dispatcher is built; every pool and connection
     * factory reads from the Dispatcher's copy.
     */
    struct DispatcherConfiguration {
        /** @brief Reuse connections across requests. */
        bool keep_alive{true};

        /** @brief Set TCP_NODELAY on every connection. */
        bool tcp_no_delay{false};

        /** @brief Bound on dial plus TLS handshake. Unbounded when unset. */
        std::optional<std::chrono::milliseconds> connect_timeout;

        /** @brief Maximum connections (idle + in use) per remote address. */
        std::size_t max_connections_per_host{50};

        /** @brief TLS settings. https is rejected when unset. */
        std::optional<TlsConfiguration> tls;

        /** @brief Bound on waiting for a pooled connection. */
        std::optional<std::chrono::milliseconds> pool_wait_timeout;

        /** @brief Idle connections older than this are discarded. */
        std::optional<std::chrono::milliseconds> idle_timeout;

        /** @brief Bound on one request/response exchange. */
        std::optional<std::chrono::milliseconds> exchange_timeout;

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"h1_client/1.0"};

        /** @brief Maximum size of response bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U * 1024U};
    };

    /// @brief Check a configuration for settings that can never succeed.
    /// @return The first problem found, or nullopt when the config is usable.
    inline std::optional<Error> validate_configuration(
        const DispatcherConfiguration& cfg) {
        if (cfg.max_connections_per_host == 0) {
            return Error{Error::Code::InvalidConfiguration,
                         "max_connections_per_host must be at least 1"};
        }
        if (cfg.connect_timeout && cfg.connect_timeout->count() <= 0) {
            return Error{Error::Code::InvalidConfiguration,
                         "connect_timeout must be positive"};
        }
        if (cfg.pool_wait_timeout && cfg.pool_wait_timeout->count() < 0) {
            return Error{Error::Code::InvalidConfiguration,
                         "pool_wait_timeout must not be negative"};
        }
        if (cfg.exchange_timeout && cfg.exchange_timeout->count() <= 0) {
            return Error{Error::Code::InvalidConfiguration,
                         "exchange_timeout must be positive"};
        }
        return std::nullopt;
    }

}  // namespace h1_client
