#include "h1_client/connection.hpp"

#include <openssl/ssl.h>

#include <boost/beast/core/stream_traits.hpp>

namespace h1_client {

    Connection::Connection(boost::asio::any_io_executor ex)
        : m_stream(std::in_place_type<PlainStream>, std::move(ex)) {}

    Connection::Connection(boost::asio::any_io_executor ex,
                           boost::asio::ssl::context& ssl_ctx)
        : m_stream(std::in_place_type<SecureStream>, std::move(ex), ssl_ctx) {}

    boost::beast::tcp_stream& Connection::transport() noexcept {
        return std::visit(
            [](auto& s) -> boost::beast::tcp_stream& {
                return boost::beast::get_lowest_layer(s);
            },
            m_stream);
    }

    bool Connection::is_open() const noexcept {
        return std::visit(
            [](auto const& s) -> bool {
                return boost::beast::get_lowest_layer(s).socket().is_open();
            },
            m_stream);
    }

    void Connection::close() noexcept {
        boost::system::error_code ec;
        auto& sock = transport().socket();
        if (!sock.is_open()) return;

        // No TLS shutdown, just drop the TCP connection.
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }

    std::optional<boost::asio::ip::tcp::endpoint> Connection::local_endpoint()
        const noexcept {
        return std::visit(
            [](auto const& s) -> std::optional<tcp::endpoint> {
                boost::system::error_code ec;
                auto ep =
                    boost::beast::get_lowest_layer(s).socket().local_endpoint(
                        ec);
                if (ec) return std::nullopt;
                return ep;
            },
            m_stream);
    }

    std::optional<boost::asio::ip::tcp::endpoint> Connection::remote_endpoint()
        const noexcept {
        return std::visit(
            [](auto const& s) -> std::optional<tcp::endpoint> {
                boost::system::error_code ec;
                auto ep =
                    boost::beast::get_lowest_layer(s).socket().remote_endpoint(
                        ec);
                if (ec) return std::nullopt;
                return ep;
            },
            m_stream);
    }

    std::size_t Connection::pending_bytes() const noexcept {
        std::size_t n = m_buffer.size();
        if (auto const* s = std::get_if<SecureStream>(&m_stream)) {
            // SSL_pending takes a non-const handle.
            auto* handle = const_cast<SecureStream*>(s)->native_handle();
            int pending = ::SSL_pending(handle);
            if (pending > 0) n += static_cast<std::size_t>(pending);
        }
        return n;
    }

}  // namespace h1_client
