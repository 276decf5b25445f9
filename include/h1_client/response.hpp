#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace h1_client {

    /**
     * @brief Represents an HTTP response.
     */
    struct Response {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{0};
        /** @brief HTTP version, 10 or 11. */
        unsigned version{11};
        /** @brief HTTP response headers. */
        std::unordered_map<std::string, std::string> headers;
        /** @brief HTTP response body as a string. */
        std::string body;
        /** @brief Socket addresses of the connection that carried it. */
        std::optional<boost::asio::ip::tcp::endpoint> local_addr;
        std::optional<boost::asio::ip::tcp::endpoint> peer_addr;
    };

    /// @brief Convert a Boost.Beast HTTP response to an h1_client::Response.
    /// @note If duplicate header keys occur, the first one wins.
    inline Response parse_beast_response(
        boost::beast::http::response<boost::beast::http::string_body>&&
            beast_res) {
        Response out;
        out.status_code = static_cast<int>(beast_res.result_int());
        out.version = beast_res.version();

        for (const auto& field : beast_res.base()) {
            out.headers.emplace(std::string(field.name_string()),
                                std::string(field.value()));
        }

        out.body = std::move(beast_res.body());
        return out;
    }

}  // namespace h1_client
