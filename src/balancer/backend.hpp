/**
 * FERRY - HTTP Load Balancer
 * Backend - One upstream target with liveness and load counters
 */

#ifndef FERRY_BALANCER_BACKEND_HPP
#define FERRY_BALANCER_BACKEND_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>

namespace ferry::balancer {

/**
 * Parsed form of a backend address such as "http://localhost:9000/api"
 */
struct BackendAddress {
    std::string scheme;
    std::string host;
    std::uint16_t port{0};
    std::string base_path;  // Empty or starts with '/', no trailing slash

    /**
     * Parse an address, throwing std::invalid_argument when it is malformed
     */
    static BackendAddress parse(const std::string& address);
};

/**
 * Backend - a single upstream server
 *
 * Features:
 * - Immutable identity parsed at construction
 * - Liveness flag guarded by a shared_mutex (HealthChecker is the only writer)
 * - Lock-free active connection and request counters
 *
 * Invariant: active_connections() == record_start() calls - record_end() calls >= 0
 */
class Backend {
public:
    using Ptr = std::shared_ptr<Backend>;

    /**
     * Called after every change of the active connection count
     */
    using LoadObserver = std::function<void(const Backend& backend, std::int32_t active)>;

    /**
     * Create a backend from its address
     * @throws std::invalid_argument if the address cannot be parsed
     */
    explicit Backend(std::string address);

    // Non-copyable, non-movable (shared between threads by pointer)
    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    const std::string& address() const noexcept { return address_; }
    const std::string& scheme() const noexcept { return parsed_.scheme; }
    const std::string& host() const noexcept { return parsed_.host; }
    std::uint16_t port() const noexcept { return parsed_.port; }
    const std::string& base_path() const noexcept { return parsed_.base_path; }

    /**
     * "host:port" form used for the Host header
     */
    std::string authority() const;

    /**
     * Mark a request as dispatched to this backend
     */
    void record_start();

    /**
     * Mark a dispatched request as finished. Must pair with record_start().
     */
    void record_end();

    /**
     * Last known liveness; never waits on a health probe
     */
    bool is_alive() const;

    /**
     * Update liveness
     * @return Previous liveness value
     */
    bool set_alive(bool alive);

    std::int32_t active_connections() const noexcept {
        return active_connections_.load(std::memory_order_acquire);
    }

    std::uint64_t request_count() const noexcept {
        return request_count_.load(std::memory_order_relaxed);
    }

    /**
     * Install an observer for active connection changes (set once, before serving)
     */
    void on_load_change(LoadObserver observer);

private:
    void notify_load(std::int32_t active) const;

    const std::string address_;
    const BackendAddress parsed_;

    mutable std::shared_mutex alive_mutex_;
    bool alive_{true};  // Optimistic until the first probe completes

    std::atomic<std::int32_t> active_connections_{0};
    std::atomic<std::uint64_t> request_count_{0};

    LoadObserver load_observer_;
};

/**
 * RAII pairing of Backend::record_start() / Backend::record_end()
 *
 * The decrement runs on every exit path: normal return, error response,
 * exception or deadline expiry while forwarding.
 */
class ActiveRequestGuard {
public:
    explicit ActiveRequestGuard(Backend& backend);
    ~ActiveRequestGuard();

    ActiveRequestGuard(const ActiveRequestGuard&) = delete;
    ActiveRequestGuard& operator=(const ActiveRequestGuard&) = delete;

private:
    Backend& backend_;
};

} // namespace ferry::balancer

#endif // FERRY_BALANCER_BACKEND_HPP
