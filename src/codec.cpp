#include "h1_client/codec.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <string>

namespace h1_client {

    namespace {
        Result<Response> err_from_ec(Connection& conn, const char* what,
                                     const boost::system::error_code& ec) {
            conn.mark_not_reusable();
            return Result<Response>::err(
                Error::Code::ProtocolError,
                std::string(what) + " failed: " + ec.message());
        }

        Result<Response> body_too_large(Connection& conn, std::uint64_t size,
                                        std::size_t limit) {
            conn.mark_not_reusable();
            return Result<Response>::err(
                Error::Code::ProtocolError,
                "response body of " + std::to_string(size) +
                    " bytes exceeds the limit of " + std::to_string(limit));
        }
    }  // namespace

    BeastHttpCodec::BeastHttpCodec(CodecSettings settings)
        : m_settings(std::move(settings)) {}

    boost::asio::awaitable<Result<Response>> BeastHttpCodec::exchange(
        Connection& conn, const Request& req, const UrlComponents& url) {
        if (conn.secure()) {
            co_return co_await exchange_on(conn.tls(), conn, req, url);
        }
        co_return co_await exchange_on(conn.plain(), conn, req, url);
    }

    template <typename Stream>
    boost::asio::awaitable<Result<Response>> BeastHttpCodec::exchange_on(
        Stream& stream, Connection& conn, const Request& req,
        const UrlComponents& url) {
        namespace http = boost::beast::http;

        auto beast_req = prepare_beast_request(req, url, m_settings.user_agent,
                                               m_settings.keep_alive);

        auto& transport = conn.transport();
        if (m_settings.exchange_timeout) {
            transport.expires_after(*m_settings.exchange_timeout);
        }

        boost::system::error_code ec;
        co_await http::async_write(
            stream, beast_req,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) co_return err_from_ec(conn, "write", ec);

        http::response_parser<http::string_body> parser;
        parser.body_limit(m_settings.max_body_bytes);
        const bool head = req.method == HttpMethod::Head;
        if (head) parser.skip(true);

        co_await http::async_read_header(
            stream, conn.buffer(), parser,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) co_return err_from_ec(conn, "read header", ec);

        if (!head) {
            const auto declared = parser.content_length();
            if (declared && *declared > m_settings.max_body_bytes) {
                co_return body_too_large(conn, *declared,
                                         m_settings.max_body_bytes);
            }
        }

        // Chunked and close-delimited bodies only reveal their size as
        // they arrive.
        while (!parser.is_done()) {
            co_await http::async_read_some(
                stream, conn.buffer(), parser,
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec) co_return err_from_ec(conn, "read", ec);

            const auto received = parser.get().body().size();
            if (received > m_settings.max_body_bytes) {
                co_return body_too_large(conn, received,
                                         m_settings.max_body_bytes);
            }
        }

        transport.expires_never();

        if (!m_settings.keep_alive || !parser.get().keep_alive()) {
            SPDLOG_TRACE("codec: connection {} will close after this exchange",
                         conn.id());
            conn.mark_not_reusable();
        }

        co_return Result<Response>::ok(parse_beast_response(parser.release()));
    }

}  // namespace h1_client
