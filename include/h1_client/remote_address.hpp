#pragma once

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace h1_client {

    /// @brief A resolved (ip, port) pair; the unit of pooling and failover.
    struct RemoteAddress {
        boost::asio::ip::address ip;
        std::uint16_t port{0};

        RemoteAddress() = default;
        RemoteAddress(boost::asio::ip::address ip_, std::uint16_t port_)
            : ip(std::move(ip_)), port(port_) {}
        explicit RemoteAddress(const boost::asio::ip::tcp::endpoint& ep)
            : ip(ep.address()), port(ep.port()) {}

        boost::asio::ip::tcp::endpoint to_endpoint() const {
            return {ip, port};
        }

        /// @brief "1.2.3.4:80" or "[::1]:80".
        std::string to_string() const {
            if (ip.is_v6()) {
                return "[" + ip.to_string() + "]:" + std::to_string(port);
            }
            return ip.to_string() + ":" + std::to_string(port);
        }

        friend bool operator==(RemoteAddress const& a,
                               RemoteAddress const& b) noexcept {
            return a.port == b.port && a.ip == b.ip;
        }
        friend bool operator!=(RemoteAddress const& a,
                               RemoteAddress const& b) noexcept {
            return !(a == b);
        }
    };

    /// @brief Registry key: the remote address, plus the TLS server name for
    /// https pools. Plaintext pools always use an empty server name.
    struct PoolKey {
        RemoteAddress address;
        std::string server_name;

        std::string to_string() const {
            if (server_name.empty()) return address.to_string();
            return server_name + "@" + address.to_string();
        }

        friend bool operator==(PoolKey const& a, PoolKey const& b) noexcept {
            return a.address == b.address && a.server_name == b.server_name;
        }
    };

    namespace detail {
        // FNV-1a, good enough for a handful of remote hosts.
        inline constexpr std::size_t kFnvOffset = 1469598103934665603ull;
        inline constexpr std::size_t kFnvPrime = 1099511628211ull;

        inline void fnv_mix(std::size_t& h, const unsigned char* p,
                            std::size_t n) noexcept {
            for (std::size_t i = 0; i < n; ++i) {
                h ^= p[i];
                h *= kFnvPrime;
            }
        }

        inline std::size_t hash_address(RemoteAddress const& a) noexcept {
            std::size_t h = kFnvOffset;
            if (a.ip.is_v4()) {
                auto bytes = a.ip.to_v4().to_bytes();
                fnv_mix(h, bytes.data(), bytes.size());
            } else {
                auto bytes = a.ip.to_v6().to_bytes();
                fnv_mix(h, bytes.data(), bytes.size());
            }
            const unsigned char port[2] = {
                static_cast<unsigned char>(a.port >> 8),
                static_cast<unsigned char>(a.port & 0xff)};
            fnv_mix(h, port, sizeof(port));
            return h;
        }
    }  // namespace detail

}  // namespace h1_client

namespace std {
    template <>
    struct hash<h1_client::RemoteAddress> {
        size_t operator()(h1_client::RemoteAddress const& a) const noexcept {
            return h1_client::detail::hash_address(a);
        }
    };

    template <>
    struct hash<h1_client::PoolKey> {
        size_t operator()(h1_client::PoolKey const& k) const noexcept {
            size_t h = h1_client::detail::hash_address(k.address);
            for (unsigned char c : std::string_view(k.server_name)) {
                h ^= c;
                h *= h1_client::detail::kFnvPrime;
            }
            return h;
        }
    };
}  // namespace std
