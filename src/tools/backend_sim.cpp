/**
 * FERRY - HTTP Load Balancer
 * Backend simulator - Demo backends for local testing
 *
 * Starts one HTTP listener per port:
 *   GET /health -> 200 "OK"
 *   /           -> 200 "Hello from port N"
 *   otherwise   -> 404
 *
 * Ports come from --port (repeatable); without any, from the backend URLs of
 * the balancer configuration (-c FILE / FERRY_BACKENDS).
 */

#include "balancer/backend.hpp"
#include "config/config.hpp"
#include "server/connection.hpp"
#include "server/server.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace asio = boost::asio;
namespace http = boost::beast::http;

using namespace ferry;

namespace {

server::HttpResponse simulate(std::uint16_t port, const server::HttpRequest& req) {
    auto path = req.path();
    if (path == "/health") {
        return server::HttpResponse{.status = http::status::ok, .body = "OK"};
    }
    if (path == "/") {
        return server::HttpResponse{
            .status = http::status::ok,
            .body = "Hello from port " + std::to_string(port)
        };
    }
    return server::HttpResponse{.status = http::status::not_found, .body = ""};
}

std::vector<std::uint16_t> ports_from_args(int argc, char* argv[]) {
    std::vector<std::uint16_t> ports;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        std::string value;
        if (arg == "--port" && i + 1 < argc) {
            value = argv[++i];
        } else if (arg.starts_with("--port=")) {
            value = arg.substr(7);
        } else {
            continue;
        }

        auto port = std::stoul(value);
        if (port == 0 || port > 65535) {
            throw std::runtime_error("Invalid --port value: " + value);
        }
        ports.push_back(static_cast<std::uint16_t>(port));
    }
    return ports;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto ports = ports_from_args(argc, argv);

        if (ports.empty()) {
            config::ConfigManager config_manager;
            if (!config_manager.load(argc, argv)) {
                return 0;
            }
            for (const auto& address : config_manager.get_config().backends) {
                ports.push_back(balancer::BackendAddress::parse(address).port);
            }
        }

        if (ports.empty()) {
            spdlog::error("No ports given (use --port P or configure backends)");
            return 1;
        }

        std::vector<std::unique_ptr<server::Server>> servers;
        for (std::size_t i = 0; i < ports.size(); ++i) {
            server::ServerConfig server_config;
            server_config.port = ports[i];
            server_config.thread_count = 1;
            server_config.bind_address = "127.0.0.1";
            server_config.name = "sim:" + std::to_string(ports[i]);
            server_config.handle_signals = (i == 0);

            auto port = ports[i];
            auto sim = std::make_unique<server::Server>(server_config);
            sim->start([port](asio::ip::tcp::socket socket) {
                server::handle_connection(std::move(socket), [port](const server::HttpRequest& req) {
                    return simulate(port, req);
                });
            });
            spdlog::info("Serving on port {}", port);
            servers.push_back(std::move(sim));
        }

        spdlog::info("Press Ctrl+C to exit...");

        // The first server owns SIGINT/SIGTERM; the rest follow it down
        servers.front()->wait();
        for (auto& sim : servers) {
            sim->stop();
            sim->wait();
        }
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
