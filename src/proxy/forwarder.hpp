/**
 * FERRY - HTTP Load Balancer
 * Request Forwarder - Forwards HTTP requests to backend servers
 */

#ifndef FERRY_PROXY_FORWARDER_HPP
#define FERRY_PROXY_FORWARDER_HPP

#include "balancer/backend.hpp"
#include "server/connection.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ferry::proxy {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

/**
 * Configuration for request forwarding
 */
struct ForwarderConfig {
    std::chrono::milliseconds connect_timeout{5000};    // Resolve + connect
    std::chrono::milliseconds request_timeout{30000};   // Send request + read full response
    bool add_forwarded_headers{true};                   // X-Forwarded-For/-Host/-Proto
    std::uint64_t max_response_body{64 * 1024 * 1024};  // Larger responses fail with 502
};

/**
 * Result of forwarding a request
 */
struct ForwardResult {
    bool success{false};
    server::HttpResponse response;
    std::string error_message;
    std::chrono::milliseconds latency{0};
};

/**
 * Request Forwarder - forwards HTTP requests to backend servers
 *
 * Features:
 * - One backend connection per request, closed afterwards
 * - Passes end-to-end headers through, strips hop-by-hop headers both ways
 * - Adds proxy headers (X-Forwarded-For, X-Forwarded-Host, X-Forwarded-Proto)
 * - Connect and request deadlines; 504 on timeout, 502 on any other failure
 *
 * forward() blocks the calling thread. The I/O runs on a private io_context so
 * the deadlines apply even though the caller waits synchronously.
 */
class Forwarder {
public:
    using Ptr = std::shared_ptr<Forwarder>;

    explicit Forwarder(const ForwarderConfig& config = {});
    ~Forwarder() = default;

    // Non-copyable
    Forwarder(const Forwarder&) = delete;
    Forwarder& operator=(const Forwarder&) = delete;

    /**
     * Forward a request to a backend
     * @param request The HTTP request to forward
     * @param backend The backend to forward to
     * @return ForwardResult with the backend response or an error response
     */
    ForwardResult forward(const server::HttpRequest& request, const balancer::Backend& backend);

    /**
     * Build the backend request with proxy headers
     */
    http::request<http::string_body> build_backend_request(
        const server::HttpRequest& request,
        const balancer::Backend& backend) const;

    /**
     * Convert a backend response into the response sent to the client
     */
    static server::HttpResponse parse_backend_response(
        const http::response<http::string_body>& response);

    /**
     * Hop-by-hop headers are never forwarded (RFC 7230 section 6.1)
     */
    static bool is_hop_by_hop(beast::string_view name);

    /**
     * 502/504 result with a JSON {"error": message} body
     */
    static ForwardResult error_result(http::status status, std::string message);

    const ForwarderConfig& config() const { return config_; }

private:
    ForwarderConfig config_;
};

} // namespace ferry::proxy

#endif // FERRY_PROXY_FORWARDER_HPP
