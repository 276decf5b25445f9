// h1_fetch: fetch one URL through a Dispatcher and print the exchange.
//
//   h1_fetch [--insecure] [--close] [-X METHOD] [-d BODY] URL
//
// Log levels come from SPDLOG_LEVEL, e.g. SPDLOG_LEVEL=debug.

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "h1_client/dispatcher.hpp"

namespace {

    void usage(const char* argv0) {
        std::cerr << "usage: " << argv0
                  << " [--insecure] [--close] [-X METHOD] [-d BODY] URL\n";
    }

    std::optional<h1_client::HttpMethod> parse_method(const std::string& m) {
        using h1_client::HttpMethod;
        if (m == "GET") return HttpMethod::Get;
        if (m == "POST") return HttpMethod::Post;
        if (m == "PUT") return HttpMethod::Put;
        if (m == "PATCH") return HttpMethod::Patch;
        if (m == "DELETE") return HttpMethod::Delete;
        if (m == "HEAD") return HttpMethod::Head;
        if (m == "OPTIONS") return HttpMethod::Options;
        return std::nullopt;
    }

    std::string endpoint_string(
        const std::optional<boost::asio::ip::tcp::endpoint>& ep) {
        if (!ep) return "-";
        return h1_client::RemoteAddress(*ep).to_string();
    }

}  // namespace

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    h1_client::DispatcherConfiguration cfg;
    cfg.tls = h1_client::TlsConfiguration{};
    cfg.connect_timeout = std::chrono::seconds(10);
    cfg.exchange_timeout = std::chrono::seconds(30);

    h1_client::Request req;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--insecure") {
            cfg.tls->verify_peer = false;
        } else if (arg == "--close") {
            cfg.keep_alive = false;
        } else if (arg == "-X" && i + 1 < argc) {
            auto m = parse_method(argv[++i]);
            if (!m) {
                std::cerr << "unsupported method: " << argv[i] << "\n";
                return 2;
            }
            req.method = *m;
        } else if (arg == "-d" && i + 1 < argc) {
            req.body = argv[++i];
            if (req.method == h1_client::HttpMethod::Get) {
                req.method = h1_client::HttpMethod::Post;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            usage(argv[0]);
            return 2;
        } else {
            req.url = arg;
        }
    }

    if (req.url.empty()) {
        usage(argv[0]);
        return 2;
    }

    boost::asio::io_context ioc(1);

    std::optional<h1_client::Dispatcher> dispatcher;
    try {
        dispatcher.emplace(ioc.get_executor(), cfg);
    } catch (const std::exception& e) {
        spdlog::error("h1_fetch: {}", e.what());
        return 2;
    }

    int rc = 1;
    boost::asio::co_spawn(
        ioc,
        [&]() -> boost::asio::awaitable<void> {
            auto r = co_await dispatcher->send(req);
            co_await dispatcher->shutdown();

            if (!r) {
                spdlog::error("h1_fetch: {}: {}",
                              h1_client::to_string(r.error().code),
                              r.error().message);
                co_return;
            }

            const auto& res = r.value();
            std::cout << "HTTP/" << res.version / 10 << "." << res.version % 10
                      << " " << res.status_code << "\n";
            std::cout << "local: " << endpoint_string(res.local_addr)
                      << " peer: " << endpoint_string(res.peer_addr) << "\n";
            for (const auto& [k, v] : res.headers) {
                std::cout << k << ": " << v << "\n";
            }
            std::cout << "\n" << res.body;
            if (!res.body.empty() && res.body.back() != '\n') std::cout << "\n";
            rc = 0;
        },
        boost::asio::detached);

    ioc.run();
    return rc;
}
