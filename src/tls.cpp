#include "h1_client/tls.hpp"

#include <spdlog/spdlog.h>

#include <boost/system/system_error.hpp>
#include <stdexcept>

namespace h1_client {

    void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context) {
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }

        static_cast<void>(
            ssl_context.set_verify_mode(boost::asio::ssl::verify_peer));
    }

    std::shared_ptr<boost::asio::ssl::context> make_tls_context(
        const TlsConfiguration& tls) {
        if (tls.context) {
            SPDLOG_DEBUG("tls: using caller-provided ssl context");
            return tls.context;
        }

        auto ctx = std::make_shared<boost::asio::ssl::context>(
            boost::asio::ssl::context::tls_client);
        init_tls_on_ssl_context(*ctx);

        try {
            if (tls.ca_file) ctx->load_verify_file(*tls.ca_file);
            if (tls.ca_path) ctx->add_verify_path(*tls.ca_path);
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to load TLS trust store: ") + e.what());
        }

        ctx->set_verify_mode(tls.verify_peer ? boost::asio::ssl::verify_peer
                                             : boost::asio::ssl::verify_none);
        if (!tls.verify_peer) {
            SPDLOG_WARN("tls: peer verification disabled");
        }
        return ctx;
    }

}  // namespace h1_client
