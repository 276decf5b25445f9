#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "h1_client/codec.hpp"
#include "h1_client/config.hpp"
#include "h1_client/connection_pool.hpp"
#include "h1_client/pool_registry.hpp"
#include "h1_client/request.hpp"
#include "h1_client/resolver.hpp"
#include "h1_client/response.hpp"
#include "h1_client/result.hpp"

namespace h1_client {

    /**
     * @brief Sends HTTP/1.x requests over pooled keep-alive connections.
     *
     * One pool per resolved address (per address and server name for
     * https). When a host resolves to several addresses they are tried in
     * order until one accepts the connection.
     *
     * Safe to share between coroutines running on any number of threads of
     * the same io_context.
     */
    class Dispatcher {
       public:
        using executor_type = boost::asio::any_io_executor;

        /// @brief Per-pool view returned by stats().
        struct PoolStats {
            PoolKey key;
            bool tls = false;
            ConnectionPool::Stats stats;
            ConnectionPoolMetricsSnapshot metrics;
        };

        /// @throws std::invalid_argument if @p cfg can never work.
        /// @throws std::runtime_error if the TLS trust store can't be loaded.
        explicit Dispatcher(executor_type ex, DispatcherConfiguration cfg = {},
                            std::shared_ptr<AddressResolver> resolver = nullptr,
                            std::shared_ptr<ProtocolCodec> codec = nullptr);

        Dispatcher(const Dispatcher&) = delete;
        Dispatcher& operator=(const Dispatcher&) = delete;

        ~Dispatcher() = default;

        executor_type get_executor() const noexcept { return m_ex; }

        const DispatcherConfiguration& configuration() const noexcept {
            return *m_cfg;
        }

        /// @brief Send @p req and wait for its response.
        ///
        /// Fails with Unknown for a method outside HttpMethod, and with
        /// InvalidUrl, InvalidScheme or MissingHost, before any lookup;
        /// ResolutionError when the host has no address; NoUsableAddress
        /// when every address refused the connection; Timeout or PoolShutdown from the pool; ProtocolError when the
        /// exchange itself failed. A failed exchange is never retried.
        boost::asio::awaitable<Result<Response>> send(Request req);

        boost::asio::awaitable<Result<Response>> get(std::string url);
        boost::asio::awaitable<Result<Response>> post(
            std::string url, std::string body,
            std::string content_type = "application/octet-stream");

        /// @brief Snapshot of every pool created so far.
        boost::asio::awaitable<std::vector<PoolStats>> stats();

        /// @brief Drop idle connections past idle_timeout in every pool.
        /// @return Number of connections dropped.
        boost::asio::awaitable<std::size_t> reap_idle();

        /// @brief Shut every pool down. Pending and later sends to existing
        /// pools fail with PoolShutdown.
        boost::asio::awaitable<void> shutdown();

        /// @brief Number of pools created so far, plaintext plus TLS.
        std::size_t pool_count() const;

       private:
        std::shared_ptr<ConnectionPool> make_http_pool(const PoolKey& key);
        std::shared_ptr<ConnectionPool> make_https_pool(const PoolKey& key);

        ConnectionPoolOptions pool_options() const;

        executor_type m_ex;
        std::shared_ptr<const DispatcherConfiguration> m_cfg;
        std::shared_ptr<AddressResolver> m_resolver;
        std::shared_ptr<ProtocolCodec> m_codec;
        std::shared_ptr<boost::asio::ssl::context> m_ssl_ctx;

        std::shared_ptr<ConnectionFactory> m_http_factory;
        PoolRegistry m_http_pools;
        std::optional<PoolRegistry> m_https_pools;
    };

}  // namespace h1_client
