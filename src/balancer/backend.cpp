/**
 * FERRY - HTTP Load Balancer
 * Backend - Implementation
 */

#include "balancer/backend.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace ferry::balancer {

namespace {

constexpr std::uint16_t kDefaultHttpPort = 80;

std::uint16_t parse_port(const std::string& text, const std::string& address) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Invalid port in backend address: " + address);
    }
    auto value = std::stoul(text);
    if (value == 0 || value > 65535) {
        throw std::invalid_argument("Port out of range in backend address: " + address);
    }
    return static_cast<std::uint16_t>(value);
}

} // namespace

BackendAddress BackendAddress::parse(const std::string& address) {
    BackendAddress result;

    auto scheme_end = address.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw std::invalid_argument("Backend address must be an absolute URL (http://host:port): " + address);
    }

    result.scheme = address.substr(0, scheme_end);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (result.scheme != "http") {
        throw std::invalid_argument("Unsupported scheme '" + result.scheme + "' in backend address: " + address);
    }

    auto rest = address.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    auto authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        result.base_path = rest.substr(path_start);
        while (!result.base_path.empty() && result.base_path.back() == '/') {
            result.base_path.pop_back();
        }
    }

    if (authority.find_first_of("?#@ ") != std::string::npos) {
        throw std::invalid_argument("Invalid characters in backend address: " + address);
    }

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        // Bracketed IPv6 literal
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Unterminated IPv6 literal in backend address: " + address);
        }
        result.host = authority.substr(1, close - 1);
        auto tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                throw std::invalid_argument("Invalid authority in backend address: " + address);
            }
            port_text = tail.substr(1);
            result.port = parse_port(port_text, address);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            result.host = authority.substr(0, colon);
            result.port = parse_port(authority.substr(colon + 1), address);
        } else {
            result.host = authority;
        }
    }

    if (result.host.empty()) {
        throw std::invalid_argument("Missing host in backend address: " + address);
    }
    if (result.port == 0) {
        result.port = kDefaultHttpPort;
    }

    return result;
}

Backend::Backend(std::string address)
    : address_(std::move(address))
    , parsed_(BackendAddress::parse(address_))
{
    spdlog::debug("Backend created: {} (host={}, port={}, base_path='{}')",
                  address_, parsed_.host, parsed_.port, parsed_.base_path);
}

std::string Backend::authority() const {
    if (parsed_.host.find(':') != std::string::npos) {
        return "[" + parsed_.host + "]:" + std::to_string(parsed_.port);
    }
    return parsed_.host + ":" + std::to_string(parsed_.port);
}

void Backend::record_start() {
    request_count_.fetch_add(1, std::memory_order_relaxed);
    auto active = active_connections_.fetch_add(1, std::memory_order_acq_rel) + 1;
    notify_load(active);
}

void Backend::record_end() {
    auto active = active_connections_.fetch_sub(1, std::memory_order_acq_rel) - 1;
    if (active < 0) {
        spdlog::error("Backend {}: active connection count went negative ({})", address_, active);
    }
    notify_load(active);
}

bool Backend::is_alive() const {
    std::shared_lock lock(alive_mutex_);
    return alive_;
}

bool Backend::set_alive(bool alive) {
    std::unique_lock lock(alive_mutex_);
    bool previous = alive_;
    alive_ = alive;
    return previous;
}

void Backend::on_load_change(LoadObserver observer) {
    load_observer_ = std::move(observer);
}

void Backend::notify_load(std::int32_t active) const {
    if (!load_observer_) {
        return;
    }
    try {
        load_observer_(*this, active);
    } catch (const std::exception& e) {
        spdlog::error("Backend {}: load observer error: {}", address_, e.what());
    }
}

ActiveRequestGuard::ActiveRequestGuard(Backend& backend)
    : backend_(backend)
{
    backend_.record_start();
}

ActiveRequestGuard::~ActiveRequestGuard() {
    backend_.record_end();
}

} // namespace ferry::balancer
