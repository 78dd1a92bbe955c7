/**
 * FERRY - HTTP Load Balancer
 *
 * A C++20 HTTP load balancer: a fixed pool of backends, round-robin /
 * least-connections / random selection, and periodic health checks.
 */

#include "balancer/backend_pool.hpp"
#include "balancer/dispatcher.hpp"
#include "balancer/health_checker.hpp"
#include "balancer/selector.hpp"
#include "config/config.hpp"
#include "proxy/forwarder.hpp"
#include "server/connection.hpp"
#include "server/io_worker.hpp"
#include "server/server.hpp"
#include "util/event_log.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <thread>

namespace asio = boost::asio;
namespace http = boost::beast::http;

using namespace ferry;
namespace component = ferry::util::log_component;

namespace {

util::LogConfig make_log_config(const config::LogSettings& settings) {
    util::LogConfig log_config;
    log_config.level = util::Logger::parse_level(settings.level).value_or(util::LogLevel::Info);
    log_config.file_path = settings.file;
    log_config.max_file_size_mb = settings.max_file_size_mb;
    log_config.max_files = settings.max_files;
    log_config.enable_console = settings.enable_console;
    log_config.enable_colors = settings.enable_colors;
    return log_config;
}

std::size_t resolve_threads(std::size_t configured) {
    return configured > 0
        ? configured
        : std::max(1u, std::thread::hardware_concurrency());
}

server::HttpResponse serve_metrics(const server::HttpRequest& req) {
    if (req.path() == "/metrics" && req.method == http::verb::get) {
        return server::HttpResponse{
            .status = http::status::ok,
            .content_type = "text/plain; version=0.0.4; charset=utf-8",
            .body = util::Metrics::instance().render_prometheus()
        };
    }
    return server::HttpResponse{
        .status = http::status::not_found,
        .content_type = "text/plain",
        .body = "404 page not found\n"
    };
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Load configuration
        config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        auto config = config_manager.get_config();
        util::Logger::init(make_log_config(config.logging));

        FERRY_LOG_INFO(component::Server, "FERRY HTTP Load Balancer v0.1.0");
        FERRY_LOG_INFO(component::Config, "Configuration: port={}, threads={}, bind={}, algorithm={}, log_level={}",
                       config.server.port, resolve_threads(config.server.threads),
                       config.server.bind_address, config.algorithm,
                       util::Logger::level_to_string(make_log_config(config.logging).level));

        // Backend pool (fixed for the process lifetime)
        auto pool = balancer::BackendPool::from_addresses(config.backends);
        if (pool.empty()) {
            FERRY_LOG_WARN(component::Balancer, "No backends configured - every request will get 503");
        } else {
            FERRY_LOG_INFO(component::Balancer, "Backends configured:");
            for (const auto& backend : pool) {
                FERRY_LOG_INFO(component::Balancer, "  - {}", backend->address());
            }
        }

        auto algorithm = balancer::parse_algorithm(config.algorithm);

        // Metrics registry
        auto& metrics = util::Metrics::instance();
        metrics.init(config.backends, std::string(balancer::to_string(algorithm)));
        for (const auto& backend : pool) {
            backend->on_load_change([](const balancer::Backend& b, std::int32_t active) {
                util::Metrics::instance().set_active_connections(b.address(), active);
            });
        }

        // Optional persistent event log
        std::shared_ptr<util::EventLog> event_log;
        if (config.event_log.enabled) {
            event_log = std::make_shared<util::EventLog>(config.event_log.file);
        }

        // Proxy server
        server::ServerConfig server_config;
        server_config.port = config.server.port;
        server_config.thread_count = resolve_threads(config.server.threads);
        server_config.bind_address = config.server.bind_address;
        server_config.name = "proxy";

        server::Server proxy_server(server_config);

        // Health checker on its own thread: forwarding blocks the proxy workers
        server::IoWorker health_worker("health");
        balancer::HealthCheckConfig health_config;
        health_config.interval = std::chrono::milliseconds(config.health_check.interval_ms);
        health_config.timeout = std::chrono::milliseconds(config.health_check.timeout_ms);
        health_config.health_path = config.health_check.path;

        auto health_checker = std::make_shared<balancer::HealthChecker>(
            health_worker.context(), pool, health_config);

        health_checker->on_health_event([](const balancer::HealthEvent& event) {
            util::Logger::instance().health(event);
            util::Metrics::instance().observe_health(event);
        });
        if (event_log) {
            health_checker->on_health_event([event_log](const balancer::HealthEvent& event) {
                event_log->record_health(event);
            });
        }

        // Request forwarder and dispatcher
        proxy::ForwarderConfig forwarder_config;
        forwarder_config.connect_timeout = std::chrono::milliseconds(config.proxy.connect_timeout_ms);
        forwarder_config.request_timeout = std::chrono::milliseconds(config.proxy.request_timeout_ms);

        auto forwarder = std::make_shared<proxy::Forwarder>(forwarder_config);
        auto dispatcher = std::make_shared<balancer::Dispatcher>(
            pool, algorithm,
            [forwarder](const server::HttpRequest& req, const balancer::Backend& backend) {
                return forwarder->forward(req, backend);
            });

        dispatcher->on_request([](const balancer::RequestEvent& event) {
            util::Logger::instance().access(event);
            util::Metrics::instance().observe_request(event);
        });
        if (event_log) {
            dispatcher->on_request([event_log](const balancer::RequestEvent& event) {
                event_log->record_request(event);
            });
        }

        proxy_server.start([dispatcher](asio::ip::tcp::socket socket) {
            server::handle_connection(std::move(socket), [dispatcher](const server::HttpRequest& req) {
                return dispatcher->dispatch(req);
            });
        });

        // Metrics server (shutdown driven by the proxy server's signals)
        std::optional<server::Server> metrics_server;
        if (config.metrics.enabled) {
            server::ServerConfig metrics_config;
            metrics_config.port = config.metrics.port;
            metrics_config.thread_count = 1;
            metrics_config.bind_address = config.metrics.bind_address;
            metrics_config.name = "metrics";
            metrics_config.handle_signals = false;

            metrics_server.emplace(metrics_config);
            metrics_server->start([](asio::ip::tcp::socket socket) {
                server::handle_connection(std::move(socket), serve_metrics);
            });
            FERRY_LOG_INFO(component::Metrics, "Prometheus metrics on {}:{}/metrics",
                           config.metrics.bind_address, config.metrics.port);
        }

        if (!pool.empty()) {
            health_checker->start();
            FERRY_LOG_INFO(component::Health, "Health checker started for {} backends (interval={}ms, timeout={}ms)",
                           pool.size(), health_config.interval.count(), health_config.timeout.count());
        }

        FERRY_LOG_INFO(component::Server, "Load balancer listening on {}:{}",
                       config.server.bind_address, proxy_server.get_port());
        FERRY_LOG_INFO(component::Server, "Press Ctrl+C to stop");

        // Wait for shutdown (blocks until signal received)
        proxy_server.wait();

        health_checker->stop();
        health_worker.stop();
        if (metrics_server) {
            metrics_server->stop();
            metrics_server->wait();
        }
        if (event_log) {
            event_log->flush();
        }

        FERRY_LOG_INFO(component::Server, "Server stopped gracefully");
        util::Logger::instance().flush();
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
