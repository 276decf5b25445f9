#pragma once
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>
#include <unordered_map>

#include "http_method.hpp"
#include "url.hpp"

namespace h1_client {

    struct Request {
        HttpMethod method{HttpMethod::Get};
        std::string url;
        std::unordered_map<std::string, std::string> headers;
        std::optional<std::string> body;

        /// Filled in by the Dispatcher once a connection is checked out.
        std::optional<boost::asio::ip::tcp::endpoint> local_addr;
        std::optional<boost::asio::ip::tcp::endpoint> peer_addr;
    };

    /// @brief Apply Request headers into a Boost.Beast header container.
    /// @note Uses `set()`, so duplicate keys overwrite previous values.
    inline void apply_request_headers(
        const std::unordered_map<std::string, std::string>& in,
        boost::beast::http::fields& out) {
        for (const auto& [k, v] : in) {
            out.set(k, v);
        }
    }

    /// @brief Build the wire request for one exchange.
    /// Caller headers override Host and User-Agent. Connection always
    /// reflects @p keep_alive so the pool and the peer agree on reuse.
    /// @pre to_beast_verb(req.method) is not verb::unknown
    inline boost::beast::http::request<boost::beast::http::string_body>
    prepare_beast_request(const Request& req, const UrlComponents& url,
                          const std::string& user_agent, bool keep_alive) {
        namespace http = boost::beast::http;
        http::request<http::string_body> beast_req;
        beast_req.version(11);
        beast_req.method(to_beast_verb(req.method));
        beast_req.target(url.target);

        std::string host = url.host.find(':') != std::string::npos
                               ? "[" + url.host + "]"
                               : url.host;
        if (url.port) host += ":" + std::to_string(*url.port);
        beast_req.set(http::field::host, host);
        beast_req.set(http::field::user_agent, user_agent);

        apply_request_headers(req.headers, beast_req.base());
        beast_req.set(http::field::connection,
                      keep_alive ? "keep-alive" : "close");

        if (req.body.has_value()) {
            beast_req.body() = *req.body;
            beast_req.prepare_payload();
        }
        return beast_req;
    }

}  // namespace h1_client
