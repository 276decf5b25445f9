#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>

#include "h1_client/config.hpp"
#include "h1_client/connection.hpp"
#include "h1_client/connection_pool_types.hpp"
#include "h1_client/remote_address.hpp"
#include "h1_client/result.hpp"

namespace h1_client {

    /**
     * @brief Creates connections for one scheme and decides whether an idle
     * one may be reused.
     *
     * A ConnectionPool owns one factory and calls it only from its strand.
     */
    class ConnectionFactory {
       public:
        virtual ~ConnectionFactory() = default;

        /// @brief Dial @p address and, for TLS, complete the handshake.
        /// @return ConnectError if the dial fails or times out, TlsError if
        /// the handshake does.
        virtual boost::asio::awaitable<Result<std::unique_ptr<Connection>>>
        create(const RemoteAddress& address) = 0;

        /// @brief Non-blocking health probe for an idle connection.
        virtual RecycleResult recycle(Connection& conn) = 0;
    };

    /// @brief Plaintext TCP connections.
    class PlainConnectionFactory : public ConnectionFactory {
       public:
        PlainConnectionFactory(
            boost::asio::any_io_executor ex,
            std::shared_ptr<const DispatcherConfiguration> cfg);

        boost::asio::awaitable<Result<std::unique_ptr<Connection>>> create(
            const RemoteAddress& address) override;

        RecycleResult recycle(Connection& conn) override;

       private:
        boost::asio::any_io_executor m_ex;
        std::shared_ptr<const DispatcherConfiguration> m_cfg;
    };

    /**
     * @brief TLS connections to one server name.
     *
     * SNI is sent for host names only. When the context verifies peers the
     * certificate must also match @p server_name.
     */
    class TlsConnectionFactory : public ConnectionFactory {
       public:
        TlsConnectionFactory(
            boost::asio::any_io_executor ex,
            std::shared_ptr<const DispatcherConfiguration> cfg,
            std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
            std::string server_name);

        boost::asio::awaitable<Result<std::unique_ptr<Connection>>> create(
            const RemoteAddress& address) override;

        RecycleResult recycle(Connection& conn) override;

        const std::string& server_name() const noexcept {
            return m_server_name;
        }

       private:
        boost::asio::any_io_executor m_ex;
        std::shared_ptr<const DispatcherConfiguration> m_cfg;
        std::shared_ptr<boost::asio::ssl::context> m_ssl_ctx;
        std::string m_server_name;
    };

    /// @brief The probe shared by both factories: peek one byte without
    /// blocking. Would-block means the peer is quiet and the connection is
    /// healthy; data, end-of-stream or any error mean it is not.
    RecycleResult probe_connection(Connection& conn, bool tcp_no_delay);

}  // namespace h1_client
