#include "h1_client/resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <stdexcept>

#include "h1_client/url.hpp"

namespace h1_client {

    using addresses_result = Result<std::vector<RemoteAddress>>;

    DnsResolver::DnsResolver(boost::asio::any_io_executor ex)
        : m_ex(std::move(ex)) {}

    boost::asio::awaitable<addresses_result> DnsResolver::resolve(
        const std::string& host, std::uint16_t port) {
        using tcp = boost::asio::ip::tcp;

        boost::system::error_code ec;
        tcp::resolver resolver(m_ex);
        auto results = co_await resolver.async_resolve(
            host, std::to_string(port),
            tcp::resolver::numeric_service,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            co_return addresses_result::err(
                Error::Code::ResolutionError,
                "failed to resolve " + host + ": " + ec.message());
        }

        std::vector<RemoteAddress> out;
        for (const auto& entry : results) {
            RemoteAddress addr(entry.endpoint());
            if (std::find(out.begin(), out.end(), addr) == out.end()) {
                out.push_back(addr);
            }
        }

        if (out.empty()) {
            co_return addresses_result::err(
                Error::Code::ResolutionError,
                "no addresses found for " + host);
        }

        SPDLOG_TRACE("resolver: {} -> {} address(es)", host, out.size());
        co_return addresses_result::ok(std::move(out));
    }

    void StaticResolver::add(const std::string& host,
                             const std::vector<std::string>& ips) {
        Entry entry;
        for (const auto& ip : ips) {
            boost::system::error_code ec;
            auto addr = boost::asio::ip::make_address(ip, ec);
            if (ec) {
                throw std::invalid_argument("not an IP address: " + ip);
            }
            entry.addresses.emplace_back(addr, std::uint16_t{0});
        }
        m_hosts[url_utils::to_lower(host)] = std::move(entry);
    }

    void StaticResolver::add(const std::string& host,
                             std::vector<RemoteAddress> addresses) {
        Entry entry;
        entry.addresses = std::move(addresses);
        entry.fixed_port = true;
        m_hosts[url_utils::to_lower(host)] = std::move(entry);
    }

    boost::asio::awaitable<addresses_result> StaticResolver::resolve(
        const std::string& host, std::uint16_t port) {
        ++m_calls;

        auto it = m_hosts.find(url_utils::to_lower(host));
        if (it == m_hosts.end() || it->second.addresses.empty()) {
            co_return addresses_result::err(Error::Code::ResolutionError,
                                            "no addresses found for " + host);
        }

        std::vector<RemoteAddress> out = it->second.addresses;
        if (!it->second.fixed_port) {
            for (auto& a : out) a.port = port;
        }
        co_return addresses_result::ok(std::move(out));
    }

}  // namespace h1_client
