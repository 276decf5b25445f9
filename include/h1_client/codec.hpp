#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "h1_client/config.hpp"
#include "h1_client/connection.hpp"
#include "h1_client/request.hpp"
#include "h1_client/response.hpp"
#include "h1_client/result.hpp"
#include "h1_client/url.hpp"

namespace h1_client {

    /**
     * @brief One HTTP/1.x request/response exchange over a checked-out
     * connection.
     *
     * Implementations mark the connection not reusable whenever it must not
     * go back to idle: a failed exchange, or a peer that disabled keep-alive.
     */
    class ProtocolCodec {
       public:
        virtual ~ProtocolCodec() = default;

        /// @return The response, or ProtocolError.
        virtual boost::asio::awaitable<Result<Response>> exchange(
            Connection& conn, const Request& req, const UrlComponents& url) = 0;
    };

    struct CodecSettings {
        std::string user_agent{"h1_client/1.0"};
        bool keep_alive{true};
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U *
                                   1024U};
        std::optional<std::chrono::milliseconds> exchange_timeout;

        static CodecSettings from(const DispatcherConfiguration& cfg) {
            CodecSettings out;
            out.user_agent = cfg.user_agent;
            out.keep_alive = cfg.keep_alive;
            out.max_body_bytes = cfg.max_body_bytes;
            out.exchange_timeout = cfg.exchange_timeout;
            return out;
        }
    };

    /// @brief HTTP/1.1 over Boost.Beast, reading with the connection's own
    /// buffer so pipelined leftovers stay visible to the health probe.
    class BeastHttpCodec : public ProtocolCodec {
       public:
        explicit BeastHttpCodec(CodecSettings settings = {});

        boost::asio::awaitable<Result<Response>> exchange(
            Connection& conn, const Request& req,
            const UrlComponents& url) override;

        const CodecSettings& settings() const noexcept { return m_settings; }

       private:
        template <typename Stream>
        boost::asio::awaitable<Result<Response>> exchange_on(
            Stream& stream, Connection& conn, const Request& req,
            const UrlComponents& url);

        CodecSettings m_settings;
    };

}  // namespace h1_client
