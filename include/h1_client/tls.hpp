#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <memory>
#include <string>

#include "h1_client/config.hpp"

namespace h1_client {

    /// @brief Set the SNI host name on a client TLS stream.
    /// @return false with @p ec set if OpenSSL rejects the name.
    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Load the system trust store and require peer verification.
    /// @throws std::runtime_error if the default verify paths can't be set.
    void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context);

    /// @brief Build the client context every TLS handshake of a Dispatcher
    /// uses: the caller's own context if one is configured, otherwise a
    /// tls_client context with the configured trust store.
    /// @throws std::runtime_error if a CA file or path can't be loaded.
    std::shared_ptr<boost::asio::ssl::context> make_tls_context(
        const TlsConfiguration& tls);

}  // namespace h1_client
