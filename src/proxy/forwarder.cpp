/**
 * FERRY - HTTP Load Balancer
 * Request Forwarder implementation
 */

#include "proxy/forwarder.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <set>

namespace ferry::proxy {

namespace {

/**
 * Header names listed in a Connection header are hop-by-hop for that message
 */
template<class Fields>
std::set<std::string> connection_tokens(const Fields& fields) {
    std::set<std::string> tokens;
    auto range = fields.equal_range(http::field::connection);
    for (auto it = range.first; it != range.second; ++it) {
        for (auto token : http::token_list{it->value()}) {
            std::string lower(token);
            for (auto& c : lower) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            tokens.insert(std::move(lower));
        }
    }
    return tokens;
}

bool listed_in(const std::set<std::string>& tokens, beast::string_view name) {
    std::string lower(name);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return tokens.count(lower) > 0;
}

} // namespace

Forwarder::Forwarder(const ForwarderConfig& config)
    : config_(config)
{
    spdlog::debug("Forwarder: Created with connect_timeout={}ms, request_timeout={}ms",
                  config_.connect_timeout.count(), config_.request_timeout.count());
}

ForwardResult Forwarder::forward(const server::HttpRequest& request, const balancer::Backend& backend) {
    auto start_time = std::chrono::steady_clock::now();
    auto elapsed = [&start_time]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
    };

    spdlog::debug("Forwarder: Forwarding {} {} to {}",
                  request.method_string, request.target, backend.address());

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve, bounded by the connect timeout
    beast::error_code ec;
    tcp::resolver::results_type endpoints;
    bool resolved = false;
    resolver.async_resolve(
        backend.host(), std::to_string(backend.port()),
        [&](beast::error_code resolve_ec, tcp::resolver::results_type results) {
            ec = resolve_ec;
            endpoints = std::move(results);
            resolved = true;
        });
    ioc.run_for(config_.connect_timeout);
    if (!resolved) {
        resolver.cancel();
        ioc.restart();
        ioc.run();
        ec = beast::error::timeout;
    }

    // Connect
    if (!ec) {
        stream.expires_after(config_.connect_timeout);
        stream.async_connect(endpoints, [&ec](beast::error_code connect_ec, const tcp::endpoint&) {
            ec = connect_ec;
        });
        ioc.restart();
        ioc.run();
    }

    if (ec) {
        auto result = ec == beast::error::timeout
            ? error_result(http::status::gateway_timeout, "Backend connect timed out")
            : error_result(http::status::bad_gateway, "Failed to connect to backend: " + ec.message());
        result.latency = elapsed();
        spdlog::warn("Forwarder: Failed to connect to {}: {}", backend.address(), ec.message());
        return result;
    }

    // Send the request and read the full response within the request timeout
    auto backend_request = build_backend_request(request, backend);
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(config_.max_response_body);
    if (request.method == http::verb::head) {
        parser.skip(true);  // No body follows a response to HEAD
    }

    stream.expires_after(config_.request_timeout);
    http::async_write(stream, backend_request, [&](beast::error_code write_ec, std::size_t) {
        if (write_ec) {
            ec = write_ec;
            return;
        }
        http::async_read(stream, buffer, parser, [&ec](beast::error_code read_ec, std::size_t) {
            ec = read_ec;
        });
    });
    ioc.restart();
    ioc.run();

    beast::error_code close_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, close_ec);
    stream.close();

    ForwardResult result;
    if (ec) {
        if (ec == beast::error::timeout) {
            result = error_result(http::status::gateway_timeout, "Backend request timed out");
            spdlog::warn("Forwarder: Timeout communicating with {}", backend.address());
        } else if (ec == http::error::body_limit) {
            result = error_result(http::status::bad_gateway, "Backend response too large");
            spdlog::warn("Forwarder: Response from {} exceeded {} bytes",
                         backend.address(), config_.max_response_body);
        } else {
            result = error_result(http::status::bad_gateway,
                                  "Backend communication error: " + ec.message());
            spdlog::warn("Forwarder: Error communicating with {}: {}", backend.address(), ec.message());
        }
        result.latency = elapsed();
        return result;
    }

    result.success = true;
    result.response = parse_backend_response(parser.get());
    result.latency = elapsed();

    spdlog::debug("Forwarder: Received {} response from {} in {}ms",
                  static_cast<int>(result.response.status), backend.address(), result.latency.count());
    return result;
}

http::request<http::string_body> Forwarder::build_backend_request(
    const server::HttpRequest& request,
    const balancer::Backend& backend) const
{
    const auto& raw = request.raw_request;

    http::request<http::string_body> backend_request;
    backend_request.version(11);
    if (request.method != http::verb::unknown) {
        backend_request.method(request.method);
    } else {
        backend_request.method_string(request.method_string);
    }
    backend_request.target(backend.base_path() + request.target);

    // End-to-end headers pass through unchanged
    auto tokens = connection_tokens(raw);
    for (const auto& field : raw) {
        if (is_hop_by_hop(field.name_string()) || listed_in(tokens, field.name_string())) {
            continue;
        }
        if (field.name() == http::field::host || field.name() == http::field::content_length) {
            continue;
        }
        backend_request.insert(field.name_string(), field.value());
    }

    backend_request.set(http::field::host, backend.authority());
    backend_request.set(http::field::connection, "close");

    if (config_.add_forwarded_headers) {
        if (!request.client_ip.empty()) {
            // X-Forwarded-For - append to existing if present
            std::string forwarded_for = request.client_ip;
            if (auto it = raw.find("X-Forwarded-For"); it != raw.end()) {
                forwarded_for = std::string(it->value()) + ", " + request.client_ip;
            }
            backend_request.set("X-Forwarded-For", forwarded_for);
        }
        if (!request.host.empty() && raw.find("X-Forwarded-Host") == raw.end()) {
            backend_request.set("X-Forwarded-Host", request.host);
        }
        if (raw.find("X-Forwarded-Proto") == raw.end()) {
            backend_request.set("X-Forwarded-Proto", "http");
        }
    }

    backend_request.body() = request.body;
    backend_request.prepare_payload();

    spdlog::debug("Forwarder: Built request - {} {} Host={} Content-Length={}",
                  std::string(backend_request.method_string()),
                  std::string(backend_request.target()),
                  std::string(backend_request[http::field::host]),
                  backend_request.body().size());

    return backend_request;
}

server::HttpResponse Forwarder::parse_backend_response(
    const http::response<http::string_body>& response)
{
    server::HttpResponse result;

    result.status = response.result();
    result.body = response.body();
    result.content_type.clear();

    if (auto it = response.find(http::field::content_type); it != response.end()) {
        result.content_type = std::string(it->value());
    }

    auto tokens = connection_tokens(response);
    for (const auto& header : response) {
        if (is_hop_by_hop(header.name_string()) || listed_in(tokens, header.name_string())) {
            continue;
        }
        // Content-Type handled separately, Content-Length recomputed, Server set by us
        if (header.name() == http::field::content_type ||
            header.name() == http::field::content_length ||
            header.name() == http::field::server) {
            continue;
        }

        result.headers.emplace_back(
            std::string(header.name_string()),
            std::string(header.value())
        );
    }

    return result;
}

ForwardResult Forwarder::error_result(http::status status, std::string message) {
    ForwardResult result;
    result.success = false;
    result.error_message = std::move(message);
    result.response.status = status;
    result.response.content_type = "application/json";
    result.response.body = nlohmann::json{{"error", result.error_message}}.dump();
    return result;
}

bool Forwarder::is_hop_by_hop(beast::string_view name) {
    static constexpr std::array<beast::string_view, 9> hop_by_hop = {
        "Connection",
        "Keep-Alive",
        "Proxy-Authenticate",
        "Proxy-Authorization",
        "Proxy-Connection",
        "TE",
        "Trailer",
        "Transfer-Encoding",
        "Upgrade",
    };

    for (const auto& header : hop_by_hop) {
        if (beast::iequals(name, header)) {
            return true;
        }
    }
    return false;
}

} // namespace ferry::proxy
