/**
 * FERRY - HTTP Load Balancer
 * Server implementation - Listener, worker pool and shutdown
 */

#include "server/server.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace ferry::server {

Server::Server(const ServerConfig& config)
    : config_(config)
    , io_context_(static_cast<int>(config.thread_count))
    , work_guard_(asio::make_work_guard(io_context_))
    , acceptor_(io_context_)
    , signals_(io_context_)
{
}

Server::~Server() {
    stop();
    wait();
}

void Server::start(ConnectionHandler handler) {
    if (running_.exchange(true)) {
        spdlog::warn("Server[{}]: start() called twice, ignored", config_.name);
        return;
    }

    connection_handler_ = std::move(handler);

    open_acceptor();

    if (config_.handle_signals) {
        setup_signal_handling();
    }

    do_accept();

    thread_pool_.reserve(config_.thread_count);
    for (std::size_t i = 0; i < config_.thread_count; ++i) {
        thread_pool_.emplace_back([this](std::stop_token st) { run_io_context(st); });
    }

    spdlog::info("Server[{}]: Listening on {}:{} with {} threads",
                 config_.name, config_.bind_address, bound_port_.load(), config_.thread_count);
}

void Server::open_acceptor() {
    auto fail = [this](const char* step, const boost::system::error_code& ec) {
        spdlog::error("Server[{}]: {} {}:{} failed: {}",
                      config_.name, step, config_.bind_address, config_.port, ec.message());
        running_ = false;
        throw std::runtime_error(std::string(step) + " " + config_.bind_address + ":" +
                                 std::to_string(config_.port) + " failed: " + ec.message());
    };

    boost::system::error_code ec;
    auto address = asio::ip::make_address(config_.bind_address, ec);
    if (ec) fail("resolve", ec);

    tcp::endpoint endpoint(address, config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) fail("open", ec);

    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        spdlog::warn("Server[{}]: SO_REUSEADDR not set: {}", config_.name, ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) fail("bind", ec);

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) fail("listen", ec);

    auto local = acceptor_.local_endpoint(ec);
    bound_port_ = ec ? config_.port : local.port();
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    spdlog::info("Server[{}]: Shutting down ({} connections accepted)",
                 config_.name, connections_accepted_.load());

    boost::system::error_code ec;
    acceptor_.close(ec);
    signals_.cancel(ec);

    work_guard_.reset();
    for (auto& thread : thread_pool_) {
        thread.request_stop();
    }
    io_context_.stop();
}

void Server::wait() {
    for (auto& thread : thread_pool_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    if (!thread_pool_.empty()) {
        spdlog::debug("Server[{}]: Worker threads joined", config_.name);
    }
    thread_pool_.clear();
}

bool Server::is_running() const noexcept {
    return running_.load();
}

asio::io_context& Server::get_io_context() noexcept {
    return io_context_;
}

std::uint16_t Server::get_port() const noexcept {
    auto bound = bound_port_.load();
    return bound != 0 ? bound : config_.port;
}

void Server::run_io_context(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        try {
            io_context_.run();
            return;
        } catch (const std::exception& e) {
            // A throwing completion handler must not take the worker down
            spdlog::error("Server[{}]: Worker caught exception: {}", config_.name, e.what());
        }
    }
}

void Server::do_accept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (!running_ || ec == asio::error::operation_aborted) {
            return;
        }

        if (ec) {
            spdlog::error("Server[{}]: Accept failed: {}", config_.name, ec.message());
        } else {
            auto id = ++connections_accepted_;
            spdlog::trace("Server[{}]: Connection #{} accepted", config_.name, id);
            try {
                connection_handler_(std::move(socket));
            } catch (const std::exception& e) {
                spdlog::error("Server[{}]: Connection handler failed: {}", config_.name, e.what());
            }
        }

        do_accept();
    });
}

void Server::setup_signal_handling() {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);

    signals_.async_wait([this](boost::system::error_code ec, int signal_number) {
        if (ec) {
            return;
        }
        spdlog::info("Server[{}]: Received signal {}, stopping", config_.name, signal_number);
        stop();
    });
}

} // namespace ferry::server
