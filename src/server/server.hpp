/**
 * FERRY - HTTP Load Balancer
 * Server component - TCP listener with an io_context worker pool
 */

#ifndef FERRY_SERVER_SERVER_HPP
#define FERRY_SERVER_SERVER_HPP

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace ferry::server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * Listener configuration
 */
struct ServerConfig {
    std::uint16_t port{8000};
    std::size_t thread_count{std::thread::hardware_concurrency()};
    std::string bind_address{"0.0.0.0"};
    std::string name{"proxy"};     // Used in log lines
    bool handle_signals{true};     // Stop on SIGINT/SIGTERM
};

/**
 * Called on a worker thread for each accepted socket
 */
using ConnectionHandler = std::function<void(tcp::socket)>;

/**
 * Server - owns an io_context, its std::jthread workers and one acceptor
 *
 * The balancer runs two of these (proxy and metrics); only the proxy
 * listener installs the SIGINT/SIGTERM handler, and main stops the other.
 * Work posted to get_io_context() (health probes) shares the workers.
 */
class Server {
public:
    explicit Server(const ServerConfig& config);
    ~Server();

    // Non-copyable, non-movable (owns threads and io_context)
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    /**
     * Bind, listen and start the workers
     * @throws std::runtime_error if the address cannot be bound
     */
    void start(ConnectionHandler handler);

    /**
     * Close the acceptor and stop the io_context (idempotent)
     */
    void stop();

    /**
     * Join the workers; returns once stop() has run
     */
    void wait();

    bool is_running() const noexcept;

    asio::io_context& get_io_context() noexcept;

    /**
     * Get the port the server is listening on
     * (the bound port once started, so port 0 resolves to the ephemeral port)
     */
    std::uint16_t get_port() const noexcept;

private:
    void open_acceptor();
    void run_io_context(std::stop_token stop_token);
    void do_accept();
    void setup_signal_handling();

    ServerConfig config_;
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    tcp::acceptor acceptor_;
    asio::signal_set signals_;

    std::vector<std::jthread> thread_pool_;
    ConnectionHandler connection_handler_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
    std::atomic<std::uint64_t> connections_accepted_{0};
};

} // namespace ferry::server

#endif // FERRY_SERVER_SERVER_HPP
