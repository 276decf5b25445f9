#include "h1_client/dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

#include "h1_client/tls.hpp"
#include "h1_client/url.hpp"

namespace h1_client {

    namespace {

        std::shared_ptr<const DispatcherConfiguration> validated(
            DispatcherConfiguration cfg) {
            if (auto problem = validate_configuration(cfg)) {
                throw std::invalid_argument(problem->message);
            }
            return std::make_shared<const DispatcherConfiguration>(
                std::move(cfg));
        }

        bool is_connect_failure(Error::Code code) noexcept {
            return code == Error::Code::ConnectError ||
                   code == Error::Code::TlsError;
        }

    }  // namespace

    Dispatcher::Dispatcher(executor_type ex, DispatcherConfiguration cfg,
                           std::shared_ptr<AddressResolver> resolver,
                           std::shared_ptr<ProtocolCodec> codec)
        : m_ex(std::move(ex)),
          m_cfg(validated(std::move(cfg))),
          m_resolver(resolver ? std::move(resolver)
                              : std::make_shared<DnsResolver>(m_ex)),
          m_codec(codec ? std::move(codec)
                        : std::make_shared<BeastHttpCodec>(
                              CodecSettings::from(*m_cfg))),
          m_http_factory(
              std::make_shared<PlainConnectionFactory>(m_ex, m_cfg)),
          m_http_pools([this](const PoolKey& key) {
              return make_http_pool(key);
          }) {
        if (m_cfg->tls) {
            m_ssl_ctx = make_tls_context(*m_cfg->tls);
            m_https_pools.emplace(
                [this](const PoolKey& key) { return make_https_pool(key); });
        }
    }

    ConnectionPoolOptions Dispatcher::pool_options() const {
        ConnectionPoolOptions opt;
        opt.max_connections = m_cfg->max_connections_per_host;
        opt.wait_timeout = m_cfg->pool_wait_timeout;
        opt.idle_timeout = m_cfg->idle_timeout;
        return opt;
    }

    std::shared_ptr<ConnectionPool> Dispatcher::make_http_pool(
        const PoolKey& key) {
        return std::make_shared<ConnectionPool>(m_ex, key, m_http_factory,
                                                pool_options());
    }

    std::shared_ptr<ConnectionPool> Dispatcher::make_https_pool(
        const PoolKey& key) {
        auto factory = std::make_shared<TlsConnectionFactory>(
            m_ex, m_cfg, m_ssl_ctx, key.server_name);
        return std::make_shared<ConnectionPool>(m_ex, key, std::move(factory),
                                                pool_options());
    }

    boost::asio::awaitable<Result<Response>> Dispatcher::send(Request req) {
        if (to_beast_verb(req.method) == boost::beast::http::verb::unknown) {
            co_return Result<Response>::err(Error::Code::Unknown,
                                            "unsupported HTTP method");
        }

        auto parsed = parse_url(req.url);
        if (!parsed) co_return parsed.forward_error<Response>();
        const UrlComponents url = std::move(parsed).value();

        const bool https = url.https();
        if (url.scheme != "http" && !https) {
            co_return Result<Response>::err(
                Error::Code::InvalidScheme,
                "invalid url scheme: " + url.scheme);
        }
        if (https && !m_https_pools) {
            co_return Result<Response>::err(
                Error::Code::InvalidScheme,
                "invalid url scheme: https requires a TLS configuration");
        }
        if (url.host.empty()) {
            co_return Result<Response>::err(Error::Code::MissingHost,
                                            "missing hostname");
        }

        const auto port = url_utils::effective_port(url);
        auto resolved = co_await m_resolver->resolve(url.host, *port);
        if (!resolved) co_return resolved.forward_error<Response>();
        const std::vector<RemoteAddress> candidates =
            std::move(resolved).value();

        PoolRegistry& registry = https ? *m_https_pools : m_http_pools;
        const std::string server_name = https ? url.host : std::string{};

        std::optional<ConnectionPool::Lease> lease;
        std::optional<Error> last_error;

        for (const auto& address : candidates) {
            // The registry hands back a counted handle; no registry lock is
            // held while acquire() is suspended.
            auto pool = registry.get_or_create(PoolKey{address, server_name});

            auto acquired = co_await pool->acquire();
            if (acquired) {
                lease.emplace(std::move(acquired).value());
                break;
            }

            Error& e = acquired.error();
            if (!is_connect_failure(e.code)) {
                co_return Result<Response>::err(std::move(e));
            }

            SPDLOG_DEBUG("dispatcher: {} unusable ({}), {}",
                         address.to_string(), e.message,
                         &address == &candidates.back() ? "giving up"
                                                        : "trying next");
            last_error = std::move(e);
        }

        if (!lease) {
            co_return Result<Response>::err(
                Error::Code::NoUsableAddress,
                "no usable address for " + url.host + ": " +
                    (last_error ? last_error->message
                                : std::string("nothing to try")));
        }

        req.local_addr = (*lease)->local_endpoint();
        req.peer_addr = (*lease)->remote_endpoint();

        auto res = co_await m_codec->exchange(**lease, req, url);
        if (!res) {
            lease->mark_bad();
            SPDLOG_DEBUG("dispatcher: exchange with {} failed: {}", url.host,
                         res.error().message);
            co_return res;
        }

        res.value().local_addr = req.local_addr;
        res.value().peer_addr = req.peer_addr;
        co_return res;
    }

    boost::asio::awaitable<Result<Response>> Dispatcher::get(std::string url) {
        Request req;
        req.method = HttpMethod::Get;
        req.url = std::move(url);
        co_return co_await send(std::move(req));
    }

    boost::asio::awaitable<Result<Response>> Dispatcher::post(
        std::string url, std::string body, std::string content_type) {
        Request req;
        req.method = HttpMethod::Post;
        req.url = std::move(url);
        req.headers["Content-Type"] = std::move(content_type);
        req.body = std::move(body);
        co_return co_await send(std::move(req));
    }

    boost::asio::awaitable<std::vector<Dispatcher::PoolStats>>
    Dispatcher::stats() {
        std::vector<PoolStats> out;

        std::vector<std::pair<std::shared_ptr<ConnectionPool>, bool>> pools;
        for (auto& pool : m_http_pools.snapshot()) {
            pools.emplace_back(std::move(pool), false);
        }
        if (m_https_pools) {
            for (auto& pool : m_https_pools->snapshot()) {
                pools.emplace_back(std::move(pool), true);
            }
        }

        for (const auto& [pool, tls] : pools) {
            PoolStats ps;
            ps.key = pool->key();
            ps.tls = tls;
            ps.stats = co_await pool->stats();
            ps.metrics = pool->metrics().snapshot();
            out.push_back(std::move(ps));
        }
        co_return out;
    }

    boost::asio::awaitable<std::size_t> Dispatcher::reap_idle() {
        std::size_t dropped = 0;
        for (const auto& pool : m_http_pools.snapshot()) {
            dropped += co_await pool->reap_idle();
        }
        if (m_https_pools) {
            for (const auto& pool : m_https_pools->snapshot()) {
                dropped += co_await pool->reap_idle();
            }
        }
        co_return dropped;
    }

    boost::asio::awaitable<void> Dispatcher::shutdown() {
        SPDLOG_DEBUG("dispatcher: shutting down {} pool(s)", pool_count());
        for (const auto& pool : m_http_pools.snapshot()) {
            co_await pool->shutdown();
        }
        if (m_https_pools) {
            for (const auto& pool : m_https_pools->snapshot()) {
                co_await pool->shutdown();
            }
        }
    }

    std::size_t Dispatcher::pool_count() const {
        return m_http_pools.size() + (m_https_pools ? m_https_pools->size() : 0);
    }

}  // namespace h1_client
