#include "h1_client/connection_factory.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include "h1_client/tls.hpp"

namespace h1_client {

    namespace {

        using tcp = boost::asio::ip::tcp;
        using connection_result = Result<std::unique_ptr<Connection>>;

        bool is_ip_literal(const std::string& host) {
            boost::system::error_code ec;
            boost::asio::ip::make_address(host, ec);
            return !ec;
        }

        // Dial under connect_timeout. The deadline is left armed so a TLS
        // handshake that follows runs against the same budget.
        boost::asio::awaitable<boost::system::error_code> dial(
            Connection& conn, const RemoteAddress& address,
            const DispatcherConfiguration& cfg) {
            boost::system::error_code ec;
            auto& stream = conn.transport();

            if (cfg.connect_timeout) stream.expires_after(*cfg.connect_timeout);

            co_await stream.async_connect(
                address.to_endpoint(),
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) co_return ec;

            conn.socket().set_option(tcp::no_delay(cfg.tcp_no_delay), ec);
            co_return ec;
        }

    }  // namespace

    RecycleResult probe_connection(Connection& conn, bool tcp_no_delay) {
        if (!conn.is_open()) return RecycleResult::Unhealthy;

        // Leftover bytes from the previous exchange would corrupt the next.
        if (conn.pending_bytes() > 0) return RecycleResult::Unhealthy;

        auto& sock = conn.socket();
        boost::system::error_code ec;

        const bool was_non_blocking = sock.non_blocking();
        sock.non_blocking(true, ec);
        if (ec) return RecycleResult::Unhealthy;

        char probe[1];
        const std::size_t n = sock.receive(boost::asio::buffer(probe),
                                           tcp::socket::message_peek, ec);

        boost::system::error_code restore_ec;
        sock.non_blocking(was_non_blocking, restore_ec);
        if (restore_ec) return RecycleResult::Unhealthy;

        if (ec != boost::asio::error::would_block) {
            if (ec) {
                SPDLOG_DEBUG("recycle: connection {} probe failed: {}",
                             conn.id(), ec.message());
            } else {
                SPDLOG_DEBUG("recycle: connection {} has {} unexpected byte(s)",
                             conn.id(), n);
            }
            return RecycleResult::Unhealthy;
        }

        sock.set_option(tcp::no_delay(tcp_no_delay), ec);
        if (ec) return RecycleResult::Unhealthy;

        return RecycleResult::Healthy;
    }

    PlainConnectionFactory::PlainConnectionFactory(
        boost::asio::any_io_executor ex,
        std::shared_ptr<const DispatcherConfiguration> cfg)
        : m_ex(std::move(ex)), m_cfg(std::move(cfg)) {}

    boost::asio::awaitable<connection_result> PlainConnectionFactory::create(
        const RemoteAddress& address) {
        auto conn = std::make_unique<Connection>(m_ex);

        auto ec = co_await dial(*conn, address, *m_cfg);
        if (ec) {
            co_return connection_result::err(
                Error::Code::ConnectError,
                "connect to " + address.to_string() + " failed: " +
                    ec.message());
        }

        conn->transport().expires_never();
        co_return connection_result::ok(std::move(conn));
    }

    RecycleResult PlainConnectionFactory::recycle(Connection& conn) {
        return probe_connection(conn, m_cfg->tcp_no_delay);
    }

    TlsConnectionFactory::TlsConnectionFactory(
        boost::asio::any_io_executor ex,
        std::shared_ptr<const DispatcherConfiguration> cfg,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        std::string server_name)
        : m_ex(std::move(ex)),
          m_cfg(std::move(cfg)),
          m_ssl_ctx(std::move(ssl_ctx)),
          m_server_name(std::move(server_name)) {}

    boost::asio::awaitable<connection_result> TlsConnectionFactory::create(
        const RemoteAddress& address) {
        auto conn = std::make_unique<Connection>(m_ex, *m_ssl_ctx);

        auto ec = co_await dial(*conn, address, *m_cfg);
        if (ec) {
            co_return connection_result::err(
                Error::Code::ConnectError,
                "connect to " + address.to_string() + " failed: " +
                    ec.message());
        }

        auto& stream = conn->tls();

        if (!is_ip_literal(m_server_name) &&
            !set_sni(stream, m_server_name, ec)) {
            co_return connection_result::err(
                Error::Code::TlsError,
                "setting SNI for " + m_server_name + " failed: " +
                    ec.message());
        }

        const int verify_mode =
            ::SSL_CTX_get_verify_mode(m_ssl_ctx->native_handle());
        if ((verify_mode & SSL_VERIFY_PEER) != 0) {
            stream.set_verify_callback(
                boost::asio::ssl::host_name_verification(m_server_name), ec);
            if (ec) {
                co_return connection_result::err(
                    Error::Code::TlsError,
                    "enabling host name verification failed: " +
                        ec.message());
            }
        }

        co_await stream.async_handshake(
            boost::asio::ssl::stream_base::client,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return connection_result::err(
                Error::Code::TlsError, "TLS handshake with " + m_server_name +
                                           " at " + address.to_string() +
                                           " failed: " + ec.message());
        }

        conn->transport().expires_never();
        co_return connection_result::ok(std::move(conn));
    }

    RecycleResult TlsConnectionFactory::recycle(Connection& conn) {
        return probe_connection(conn, m_cfg->tcp_no_delay);
    }

}  // namespace h1_client
