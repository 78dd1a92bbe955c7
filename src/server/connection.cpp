/**
 * FERRY - HTTP Load Balancer
 * Connection implementation
 */

#include "server/connection.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ferry::server {

namespace {

constexpr const char* kServerHeader = "FERRY/0.1.0";

} // namespace

std::string HttpRequest::path() const {
    auto query = target.find('?');
    return query == std::string::npos ? target : target.substr(0, query);
}

std::string HttpRequest::client_address() const {
    if (client_ip.empty()) {
        return {};
    }
    return client_ip + ":" + std::to_string(client_port);
}

Connection::Connection(tcp::socket socket, RequestHandler handler, ConnectionLimits limits)
    : stream_(std::move(socket))
    , handler_(std::move(handler))
    , limits_(limits)
{
    beast::error_code ec;
    auto peer = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        client_ip_ = peer.address().to_string();
        client_port_ = peer.port();
    }
}

void Connection::start() {
    // Run the session on the socket's executor
    asio::dispatch(stream_.get_executor(),
                   beast::bind_front_handler(&Connection::do_read, shared_from_this()));
}

void Connection::do_read() {
    parser_.emplace();
    parser_->body_limit(limits_.max_body_bytes);

    stream_.expires_after(limits_.idle_timeout);
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&Connection::on_read, shared_from_this()));
}

void Connection::on_read(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
        close();
        return;
    }
    if (ec == http::error::body_limit) {
        spdlog::warn("Connection: {} sent a body over {} bytes", client_ip_, limits_.max_body_bytes);
        reply_error(http::status::payload_too_large, "Request body too large");
        return;
    }
    if (ec && is_malformed(ec)) {
        spdlog::warn("Connection: Malformed request from {} - {}", client_ip_, ec.message());
        reply_error(http::status::bad_request, "Malformed HTTP request: " + ec.message());
        return;
    }
    if (ec) {
        if (ec == beast::error::timeout) {
            spdlog::debug("Connection: {} idle timeout", client_ip_);
        } else if (ec != asio::error::operation_aborted) {
            spdlog::debug("Connection: Read error from {} - {}", client_ip_, ec.message());
        }
        close();
        return;
    }

    const auto& req = parser_->get();
    if (req.version() != 10 && req.version() != 11) {
        reply_error(http::status::http_version_not_supported,
                    "Only HTTP/1.0 and HTTP/1.1 are supported");
        return;
    }

    keep_alive_ = req.keep_alive();

    try {
        response_ = to_beast_response(handler_(to_http_request(req)), req.version());
    } catch (const std::exception& e) {
        spdlog::error("Connection: Handler failed for {} {} - {}",
                      std::string(req.method_string()), std::string(req.target()), e.what());
        response_ = error_response(http::status::internal_server_error, "Internal server error");
        response_.version(req.version());
    }

    do_write();
}

void Connection::reply_error(http::status status, const std::string& message) {
    keep_alive_ = false;
    response_ = error_response(status, message);
    do_write();
}

void Connection::do_write() {
    response_.keep_alive(keep_alive_);
    response_.prepare_payload();

    stream_.expires_after(limits_.idle_timeout);
    http::async_write(stream_, response_,
                      beast::bind_front_handler(&Connection::on_write, shared_from_this()));
}

void Connection::on_write(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        if (ec != asio::error::operation_aborted) {
            spdlog::debug("Connection: Write error to {} - {}", client_ip_, ec.message());
        }
        close();
        return;
    }

    ++requests_served_;
    if (!keep_alive_) {
        close();
        return;
    }

    response_ = {};
    do_read();
}

void Connection::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    // Shutdown on an already-closed socket is expected
    spdlog::trace("Connection: {}:{} closed after {} requests", client_ip_, client_port_, requests_served_);
}

HttpRequest Connection::to_http_request(const http::request<http::string_body>& req) const {
    HttpRequest parsed;
    parsed.method = req.method();
    parsed.method_string = std::string(req.method_string());
    parsed.target = std::string(req.target());
    parsed.version = req.version();
    parsed.body = req.body();
    if (auto it = req.find(http::field::host); it != req.end()) {
        parsed.host = std::string(it->value());
    }
    parsed.client_ip = client_ip_;
    parsed.client_port = client_port_;
    parsed.raw_request = req;
    return parsed;
}

http::response<http::string_body> Connection::to_beast_response(const HttpResponse& resp,
                                                                unsigned version) const {
    http::response<http::string_body> response{resp.status, version};
    response.set(http::field::server, kServerHeader);
    if (!resp.content_type.empty()) {
        response.set(http::field::content_type, resp.content_type);
    }
    // insert, not set: Set-Cookie and friends may repeat
    for (const auto& [name, value] : resp.headers) {
        response.insert(name, value);
    }
    response.body() = resp.body;
    return response;
}

bool Connection::is_malformed(const beast::error_code& ec) {
    return ec == http::error::bad_method ||
           ec == http::error::bad_target ||
           ec == http::error::bad_version ||
           ec == http::error::bad_field ||
           ec == http::error::bad_value ||
           ec == http::error::bad_content_length ||
           ec == http::error::bad_transfer_encoding ||
           ec == http::error::bad_chunk ||
           ec == http::error::bad_line_ending ||
           ec == http::error::partial_message;
}

http::response<http::string_body> Connection::error_response(http::status status,
                                                             const std::string& message) {
    http::response<http::string_body> response{status, 11};
    response.set(http::field::server, kServerHeader);
    response.set(http::field::content_type, "application/json");
    response.body() = nlohmann::json{{"error", message}}.dump();
    return response;
}

void handle_connection(tcp::socket socket, RequestHandler handler, ConnectionLimits limits) {
    std::make_shared<Connection>(std::move(socket), std::move(handler), limits)->start();
}

} // namespace ferry::server
