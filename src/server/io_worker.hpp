/**
 * FERRY - HTTP Load Balancer
 * IoWorker component - an io_context driven by one dedicated std::jthread
 */

#ifndef FERRY_SERVER_IO_WORKER_HPP
#define FERRY_SERVER_IO_WORKER_HPP

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>

#include <stop_token>
#include <string>
#include <thread>

namespace ferry::server {

namespace asio = boost::asio;

/**
 * IoWorker - runs background timers (health checks) apart from the
 * proxy server's workers, which block inside Forwarder::forward
 */
class IoWorker {
public:
    explicit IoWorker(std::string name);
    ~IoWorker();

    IoWorker(const IoWorker&) = delete;
    IoWorker& operator=(const IoWorker&) = delete;
    IoWorker(IoWorker&&) = delete;
    IoWorker& operator=(IoWorker&&) = delete;

    asio::io_context& context() noexcept { return io_context_; }

    /**
     * Stop the io_context and join the thread. Idempotent.
     */
    void stop();

private:
    void run(std::stop_token stop_token);

    std::string name_;
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::jthread thread_;
};

} // namespace ferry::server

#endif // FERRY_SERVER_IO_WORKER_HPP
