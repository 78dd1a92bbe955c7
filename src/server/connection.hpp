/**
 * FERRY - HTTP Load Balancer
 * Connection handler - Client-side HTTP/1.1 sessions with Boost.Beast
 */

#ifndef FERRY_SERVER_CONNECTION_HPP
#define FERRY_SERVER_CONNECTION_HPP

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ferry::server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

/**
 * Inbound request as seen by the balancer
 */
struct HttpRequest {
    http::verb method{http::verb::unknown};
    std::string method_string;  // Verbatim, also for methods Beast does not know
    std::string target;
    unsigned version{11};

    std::string host;
    std::string body;

    std::string client_ip;
    std::uint16_t client_port{0};

    // Message as received, for header forwarding
    http::request<http::string_body> raw_request;

    /**
     * Path component of the target (query string removed)
     */
    std::string path() const;

    /**
     * "ip:port" of the client, or empty when unknown
     */
    std::string client_address() const;
};

/**
 * Response returned by a request handler
 */
struct HttpResponse {
    http::status status{http::status::ok};
    std::string content_type{"text/plain"};  // Empty to omit Content-Type
    std::string body;

    // Extra headers, inserted in order (repeats allowed)
    std::vector<std::pair<std::string, std::string>> headers{};
};

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * Per-connection limits
 */
struct ConnectionLimits {
    std::chrono::seconds idle_timeout{30};
    std::uint64_t max_body_bytes{8 * 1024 * 1024};
};

/**
 * One client connection, served until the peer or the handler ends keep-alive
 *
 * Answers 400 for unparsable requests, 413 when the body exceeds the limit,
 * 505 for anything but HTTP/1.0 and 1.1, and 500 when the handler throws.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket socket, RequestHandler handler, ConnectionLimits limits = {});

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void start();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void reply_error(http::status status, const std::string& message);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);
    void close();

    HttpRequest to_http_request(const http::request<http::string_body>& req) const;
    http::response<http::string_body> to_beast_response(const HttpResponse& resp, unsigned version) const;

    static bool is_malformed(const beast::error_code& ec);
    static http::response<http::string_body> error_response(http::status status, const std::string& message);

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    http::response<http::string_body> response_;
    RequestHandler handler_;
    ConnectionLimits limits_;
    bool keep_alive_{false};
    std::uint64_t requests_served_{0};

    std::string client_ip_;
    std::uint16_t client_port_{0};
};

/**
 * Create and start a connection; for use with Server::start()
 */
void handle_connection(tcp::socket socket, RequestHandler handler, ConnectionLimits limits = {});

} // namespace ferry::server

#endif // FERRY_SERVER_CONNECTION_HPP
