#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "h1_client/remote_address.hpp"
#include "h1_client/result.hpp"

namespace h1_client {

    /**
     * @brief Turns a host name and port into the ordered list of addresses
     * the Dispatcher tries, first to last.
     */
    class AddressResolver {
       public:
        virtual ~AddressResolver() = default;

        /// @return At least one address, or ResolutionError.
        virtual boost::asio::awaitable<Result<std::vector<RemoteAddress>>>
        resolve(const std::string& host, std::uint16_t port) = 0;
    };

    /// @brief System resolver through boost::asio::ip::tcp::resolver.
    /// Keeps the resolver's order and drops duplicate addresses.
    class DnsResolver : public AddressResolver {
       public:
        explicit DnsResolver(boost::asio::any_io_executor ex);

        boost::asio::awaitable<Result<std::vector<RemoteAddress>>> resolve(
            const std::string& host, std::uint16_t port) override;

       private:
        boost::asio::any_io_executor m_ex;
    };

    /**
     * @brief Fixed host table, for host overrides and tests.
     *
     * Hosts are matched case-insensitively. Each entry's addresses take the
     * port passed to resolve() unless the entry was added with its own.
     */
    class StaticResolver : public AddressResolver {
       public:
        StaticResolver() = default;

        /// @brief Map @p host to IP literals (e.g. "127.0.0.1", "::1").
        /// @throws std::invalid_argument if a literal doesn't parse.
        void add(const std::string& host, const std::vector<std::string>& ips);

        /// @brief Map @p host to fixed addresses, ports included.
        void add(const std::string& host, std::vector<RemoteAddress> addresses);

        boost::asio::awaitable<Result<std::vector<RemoteAddress>>> resolve(
            const std::string& host, std::uint16_t port) override;

        /// @brief How many times resolve() has been called.
        std::size_t calls() const noexcept { return m_calls.load(); }

       private:
        struct Entry {
            std::vector<RemoteAddress> addresses;
            bool fixed_port = false;
        };

        std::unordered_map<std::string, Entry> m_hosts;
        std::atomic<std::size_t> m_calls{0};
    };

}  // namespace h1_client
