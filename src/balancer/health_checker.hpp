/**
 * FERRY - HTTP Load Balancer
 * Backend Health Monitoring - Periodic concurrent probes with per-probe timeouts
 */

#ifndef FERRY_BALANCER_HEALTH_CHECKER_HPP
#define FERRY_BALANCER_HEALTH_CHECKER_HPP

#include "balancer/backend_pool.hpp"
#include "balancer/events.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ferry::balancer {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

/**
 * Health check configuration
 */
struct HealthCheckConfig {
    std::chrono::milliseconds interval{5000};       // Check interval (default 5s)
    std::chrono::milliseconds timeout{2000};        // Probe timeout (default 2s)
    std::string health_path{"/health"};             // Health check endpoint
};

/**
 * Result of a single probe
 */
struct ProbeResult {
    bool alive{false};
    std::chrono::milliseconds latency{0};
    std::string detail;  // Failure reason or status, for logging
};

/**
 * Completion handler for a probe; must be invoked exactly once
 */
using ProbeHandler = std::function<void(const ProbeResult&)>;

/**
 * Asynchronous probe of one backend. The default issues GET <health_path>.
 */
using ProbeFunction = std::function<void(const Backend::Ptr& backend, ProbeHandler handler)>;

/**
 * Health checker - keeps Backend liveness up to date
 *
 * Features:
 * - One probe per backend per round, all rounds' probes run concurrently
 * - Each probe has its own deadline, so a hanging backend never delays the others
 * - ALIVE iff the probe answered 200 within the timeout; anything else is DEAD
 * - No retries within a round, the next round is the retry
 * - Reports every outcome to registered observers
 */
class HealthChecker : public std::enable_shared_from_this<HealthChecker> {
public:
    /**
     * Create a health checker
     * @param io_context Asio io_context for async operations
     * @param pool Backends to monitor
     * @param config Health check configuration
     * @param probe Probe override (nullptr uses the HTTP probe)
     */
    HealthChecker(asio::io_context& io_context, BackendPool pool,
                  const HealthCheckConfig& config = {}, ProbeFunction probe = nullptr);
    ~HealthChecker();

    // Non-copyable
    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    /**
     * Start periodic checking; the first round runs immediately
     */
    void start();

    /**
     * Stop periodic checking. Probes already in flight finish on their own deadline.
     */
    void stop();

    /**
     * Probe every backend once, now
     */
    void check_all();

    /**
     * Apply a probe result to a backend and report it
     */
    void handle_probe_result(const Backend::Ptr& backend, const ProbeResult& result);

    /**
     * Register an observer for every probe outcome
     */
    void on_health_event(HealthObserver observer);

    /**
     * Number of completed probes since construction
     */
    std::uint64_t probes_completed() const noexcept {
        return probes_completed_.load(std::memory_order_relaxed);
    }

    /**
     * Number of rounds whose every result has arrived
     */
    std::uint64_t rounds_completed() const noexcept {
        return rounds_completed_.load(std::memory_order_relaxed);
    }

    bool is_running() const noexcept { return running_.load(); }

    const HealthCheckConfig& get_config() const noexcept { return config_; }

private:
    /**
     * Schedule the next health check round
     */
    void schedule_health_check();

    /**
     * Default probe: GET health_path over a fresh connection
     */
    void probe_http(const Backend::Ptr& backend, ProbeHandler handler);

    asio::io_context& io_context_;
    asio::steady_timer timer_;
    std::mutex timer_mutex_;
    BackendPool pool_;
    HealthCheckConfig config_;
    ProbeFunction probe_;

    mutable std::mutex mutex_;  // Protects observers_
    std::vector<HealthObserver> observers_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> probes_completed_{0};
    std::atomic<std::uint64_t> rounds_completed_{0};
};

} // namespace ferry::balancer

#endif // FERRY_BALANCER_HEALTH_CHECKER_HPP
