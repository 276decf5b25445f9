#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

namespace h1_client {

    using PlainStream = boost::beast::tcp_stream;
    using SecureStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    /**
     * @brief One pooled duplex byte stream: a raw TCP stream or a TLS session
     * over one.
     *
     * A Connection is checked out exclusively through a
     * ConnectionPool::Lease. It carries its own read buffer so bytes the
     * codec over-reads are never lost between exchanges.
     */
    class Connection {
       private:
        using tcp = boost::asio::ip::tcp;
        using Stream = std::variant<PlainStream, SecureStream>;

       public:
        using clock_type = std::chrono::steady_clock;

        /// @brief Unconnected plaintext stream.
        explicit Connection(boost::asio::any_io_executor ex);

        /// @brief Unconnected TLS stream using @p ssl_ctx for its handshake.
        Connection(boost::asio::any_io_executor ex,
                   boost::asio::ssl::context& ssl_ctx);

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        ~Connection() noexcept { close(); }

        bool secure() const noexcept {
            return std::holds_alternative<SecureStream>(m_stream);
        }

        /// @pre !secure()
        PlainStream& plain() { return std::get<PlainStream>(m_stream); }

        /// @pre secure()
        SecureStream& tls() { return std::get<SecureStream>(m_stream); }

        /// @brief The TCP layer, for deadlines and socket options.
        boost::beast::tcp_stream& transport() noexcept;

        tcp::socket& socket() noexcept { return transport().socket(); }

        bool is_open() const noexcept;

        /// @brief Close the socket (best-effort, no TLS close_notify).
        void close() noexcept;

        std::optional<tcp::endpoint> local_endpoint() const noexcept;
        std::optional<tcp::endpoint> remote_endpoint() const noexcept;

        boost::beast::flat_buffer& buffer() noexcept { return m_buffer; }

        /// @brief Bytes received but not yet consumed by any exchange,
        /// including decrypted bytes held inside the TLS session.
        std::size_t pending_bytes() const noexcept;

        std::uint64_t id() const noexcept { return m_id; }
        void assign_id(std::uint64_t id) noexcept { m_id = id; }

        clock_type::time_point created() const noexcept { return m_created; }

        std::size_t reuse_count() const noexcept { return m_reuse_count; }
        void mark_reused() noexcept { ++m_reuse_count; }

        /// @brief False once the last exchange failed or the peer asked to
        /// close; the pool then destroys the connection instead of idling it.
        bool reusable() const noexcept { return m_reusable; }
        void mark_not_reusable() noexcept { m_reusable = false; }

       private:
        Stream m_stream;
        boost::beast::flat_buffer m_buffer{};

        std::uint64_t m_id{0};
        clock_type::time_point m_created{clock_type::now()};
        std::size_t m_reuse_count{0};
        bool m_reusable{true};
    };

}  // namespace h1_client
