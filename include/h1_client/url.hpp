#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "result.hpp"

namespace h1_client {

    struct UrlComponents {
        // Lower-cased scheme, without "://".
        std::string scheme;
        // Host name or IP literal; IPv6 literals are stored without brackets.
        std::string host;
        // Port written in the URL, if any.
        std::optional<std::uint16_t> port;
        // Request target: path plus optional query, never empty.
        std::string target;

        bool https() const noexcept { return scheme == "https"; }
    };

    /// @brief Default port of a scheme this transport can speak.
    /// @return 80 for "http", 443 for "https", nullopt for anything else.
    inline std::optional<std::uint16_t> default_port(std::string_view scheme) {
        if (scheme == "http") return 80;
        if (scheme == "https") return 443;
        return std::nullopt;
    }

    namespace url_utils {

        inline bool is_scheme_char(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '+' ||
                   c == '-' || c == '.';
        }

        inline std::string to_lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        /// @brief Parse a decimal port in [1, 65535].
        inline std::optional<std::uint16_t> parse_port(std::string_view s) {
            if (s.empty() || s.size() > 5) return std::nullopt;
            std::uint32_t v = 0;
            for (char c : s) {
                if (c < '0' || c > '9') return std::nullopt;
                v = v * 10 + static_cast<std::uint32_t>(c - '0');
            }
            if (v == 0 || v > 65535) return std::nullopt;
            return static_cast<std::uint16_t>(v);
        }

        /// @brief Effective port: the explicit one, else the scheme default.
        inline std::optional<std::uint16_t> effective_port(
            const UrlComponents& u) {
            if (u.port) return u.port;
            return default_port(u.scheme);
        }

    }  // namespace url_utils

    /// @brief Parse an absolute URL into its components.
    /// @param url The URL string to parse.
    /// @return The components, or InvalidUrl / MissingHost.
    /// @note Any syntactically valid scheme is accepted here; whether the
    /// transport supports it is decided by the Dispatcher.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [](Error::Code code, std::string msg) {
            return Result<UrlComponents>::err(code, std::move(msg));
        };

        auto sep = url.find("://");
        if (sep == std::string_view::npos || sep == 0) {
            return make_err(Error::Code::InvalidUrl,
                            "URL must start with <scheme>://");
        }

        std::string_view scheme = url.substr(0, sep);
        if (!std::isalpha(static_cast<unsigned char>(scheme.front())) ||
            !std::all_of(scheme.begin(), scheme.end(),
                         url_utils::is_scheme_char)) {
            return make_err(Error::Code::InvalidUrl,
                            "URL has a malformed scheme");
        }

        std::string_view rest = url.substr(sep + 3);

        // Fragments are never sent on the wire.
        if (auto hash = rest.find('#'); hash != std::string_view::npos) {
            rest = rest.substr(0, hash);
        }

        // Split authority from path/query
        std::string_view authority = rest;
        std::string_view target;
        if (auto end = rest.find_first_of("/?");
            end != std::string_view::npos) {
            authority = rest.substr(0, end);
            target = rest.substr(end);
        }

        // Drop userinfo
        if (auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority = authority.substr(at + 1);
        }

        std::string_view host;
        std::string_view port;
        bool has_port = false;

        if (!authority.empty() && authority.front() == '[') {
            auto close = authority.find(']');
            if (close == std::string_view::npos) {
                return make_err(Error::Code::InvalidUrl,
                                "URL has an unterminated IPv6 literal");
            }
            host = authority.substr(1, close - 1);
            std::string_view after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return make_err(Error::Code::InvalidUrl,
                                    "URL has garbage after IPv6 literal");
                }
                port = after.substr(1);
                has_port = true;
            }
        } else if (auto colon = authority.rfind(':');
                   colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
            has_port = true;
        } else {
            host = authority;
        }

        if (host.empty()) {
            return make_err(Error::Code::MissingHost, "URL missing host");
        }

        UrlComponents out;
        out.scheme = url_utils::to_lower(scheme);
        out.host = url_utils::to_lower(host);

        if (has_port) {
            auto p = url_utils::parse_port(port);
            if (!p) {
                return make_err(Error::Code::InvalidUrl,
                                "URL has an invalid port");
            }
            out.port = *p;
        }

        if (target.empty()) {
            out.target = "/";
        } else if (target.front() == '?') {
            out.target = "/" + std::string(target);
        } else {
            out.target = std::string(target);
        }

        return Result<UrlComponents>::ok(std::move(out));
    }

}  // namespace h1_client
