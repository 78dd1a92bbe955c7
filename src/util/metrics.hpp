/**
 * FERRY - HTTP Load Balancer
 * Metrics - Thread-safe statistics collection for monitoring
 *
 * Provides:
 * - Request counters by backend, algorithm and status code
 * - Response duration histogram by backend and algorithm
 * - Per-backend gauges (active connections, health)
 * - Prometheus text exposition
 */

#ifndef FERRY_UTIL_METRICS_HPP
#define FERRY_UTIL_METRICS_HPP

#include "balancer/events.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::util {

/**
 * Upper bounds (seconds) of the response duration histogram buckets
 */
inline constexpr std::array<double, 9> kDurationBuckets = {
    0.01, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0
};

/**
 * Per-backend metrics
 */
struct BackendMetrics {
    std::string address;

    std::atomic<std::int64_t> active_connections{0};
    std::atomic<bool> healthy{true};
};

/**
 * Cumulative duration histogram for one {backend, algorithm} pair
 */
struct DurationHistogram {
    std::array<std::atomic<std::uint64_t>, kDurationBuckets.size()> buckets{};
    std::atomic<std::uint64_t> count{0};
    std::atomic<std::uint64_t> sum_ms{0};

    void observe(std::chrono::milliseconds latency);
};

/**
 * Metrics collector - centralized statistics tracking
 *
 * Counters are atomics; the label maps are guarded by a mutex only while
 * a series is looked up or created.
 */
class Metrics {
public:
    /**
     * Get the metrics instance (creates on first call)
     */
    static Metrics& instance();

    /**
     * Register the pool's backends and the active selection algorithm
     */
    void init(const std::vector<std::string>& backends, std::string algorithm);

    /**
     * Drop every series and restart the uptime clock
     */
    void reset();

    /**
     * Record a finished (or rejected) request
     */
    void observe_request(const balancer::RequestEvent& event);

    /**
     * Record a health probe outcome
     */
    void observe_health(const balancer::HealthEvent& event);

    /**
     * Update a backend's in-flight request gauge
     */
    void set_active_connections(const std::string& backend, std::int64_t value);

    /**
     * Render all series in the Prometheus text exposition format
     */
    std::string render_prometheus() const;

    /**
     * Get uptime in seconds
     */
    std::uint64_t uptime_seconds() const;

private:
    Metrics();
    ~Metrics() = default;

    // Non-copyable
    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    std::shared_ptr<BackendMetrics> backend_metrics(const std::string& address);
    std::shared_ptr<DurationHistogram> histogram(const std::string& backend);
    void count_request(const std::string& backend, int status);

    static std::string escape_label(std::string_view value);

    mutable std::mutex mutex_;
    std::string algorithm_{"roundrobin"};
    std::map<std::string, std::shared_ptr<BackendMetrics>> backends_;
    // {backend, status} -> count, for the configured algorithm
    std::map<std::pair<std::string, int>, std::shared_ptr<std::atomic<std::uint64_t>>> request_counts_;
    std::map<std::string, std::shared_ptr<DurationHistogram>> histograms_;

    std::atomic<std::chrono::steady_clock::rep> start_time_;
};

} // namespace ferry::util

#endif // FERRY_UTIL_METRICS_HPP
