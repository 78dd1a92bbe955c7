/**
 * FERRY - HTTP Load Balancer
 * Metrics Implementation
 */

#include "util/metrics.hpp"

#include <sstream>

namespace ferry::util {

namespace {

constexpr std::string_view kNoBackend = "none";

std::chrono::steady_clock::rep now_ticks() {
    return std::chrono::steady_clock::now().time_since_epoch().count();
}

} // namespace

void DurationHistogram::observe(std::chrono::milliseconds latency) {
    double seconds = static_cast<double>(latency.count()) / 1000.0;
    for (std::size_t i = 0; i < kDurationBuckets.size(); ++i) {
        if (seconds <= kDurationBuckets[i]) {
            buckets[i].fetch_add(1, std::memory_order_relaxed);
        }
    }
    count.fetch_add(1, std::memory_order_relaxed);
    sum_ms.fetch_add(static_cast<std::uint64_t>(latency.count()), std::memory_order_relaxed);
}

Metrics::Metrics()
    : start_time_(now_ticks())
{
}

Metrics& Metrics::instance() {
    static Metrics instance;
    return instance;
}

void Metrics::init(const std::vector<std::string>& backends, std::string algorithm) {
    std::lock_guard<std::mutex> lock(mutex_);

    algorithm_ = std::move(algorithm);
    for (const auto& address : backends) {
        if (backends_.find(address) == backends_.end()) {
            auto metrics = std::make_shared<BackendMetrics>();
            metrics->address = address;
            backends_.emplace(address, std::move(metrics));
        }
    }
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);

    backends_.clear();
    request_counts_.clear();
    histograms_.clear();
    algorithm_ = "roundrobin";
    start_time_.store(now_ticks(), std::memory_order_relaxed);
}

std::shared_ptr<BackendMetrics> Metrics::backend_metrics(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& metrics = backends_[address];
    if (!metrics) {
        metrics = std::make_shared<BackendMetrics>();
        metrics->address = address;
    }
    return metrics;
}

std::shared_ptr<DurationHistogram> Metrics::histogram(const std::string& backend) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& hist = histograms_[backend];
    if (!hist) {
        hist = std::make_shared<DurationHistogram>();
    }
    return hist;
}

void Metrics::count_request(const std::string& backend, int status) {
    std::shared_ptr<std::atomic<std::uint64_t>> counter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = request_counts_[{backend, status}];
        if (!slot) {
            slot = std::make_shared<std::atomic<std::uint64_t>>(0);
        }
        counter = slot;
    }
    counter->fetch_add(1, std::memory_order_relaxed);
}

void Metrics::observe_request(const balancer::RequestEvent& event) {
    if (event.backend_address.empty()) {
        count_request(std::string(kNoBackend), event.status_code);
        return;
    }

    count_request(event.backend_address, event.status_code);
    histogram(event.backend_address)->observe(event.latency);
}

void Metrics::observe_health(const balancer::HealthEvent& event) {
    backend_metrics(event.backend_address)->healthy.store(event.alive, std::memory_order_relaxed);
}

void Metrics::set_active_connections(const std::string& backend, std::int64_t value) {
    backend_metrics(backend)->active_connections.store(value, std::memory_order_relaxed);
}

std::uint64_t Metrics::uptime_seconds() const {
    auto start = std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(start_time_.load(std::memory_order_relaxed)));
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - start).count();
}

std::string Metrics::escape_label(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"':  escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            default:   escaped += c; break;
        }
    }
    return escaped;
}

std::string Metrics::render_prometheus() const {
    std::ostringstream out;

    std::lock_guard<std::mutex> lock(mutex_);
    auto algorithm = escape_label(algorithm_);

    out << "# HELP ferry_requests_total Total number of requests handled\n";
    out << "# TYPE ferry_requests_total counter\n";
    for (const auto& [key, counter] : request_counts_) {
        out << "ferry_requests_total{backend=\"" << escape_label(key.first)
            << "\",algorithm=\"" << algorithm
            << "\",status=\"" << key.second << "\"} "
            << counter->load(std::memory_order_relaxed) << "\n";
    }

    out << "# HELP ferry_response_duration_seconds Backend response time in seconds\n";
    out << "# TYPE ferry_response_duration_seconds histogram\n";
    for (const auto& [backend, hist] : histograms_) {
        auto labels = "backend=\"" + escape_label(backend) + "\",algorithm=\"" + algorithm + "\"";
        for (std::size_t i = 0; i < kDurationBuckets.size(); ++i) {
            out << "ferry_response_duration_seconds_bucket{" << labels
                << ",le=\"" << kDurationBuckets[i] << "\"} "
                << hist->buckets[i].load(std::memory_order_relaxed) << "\n";
        }
        auto count = hist->count.load(std::memory_order_relaxed);
        out << "ferry_response_duration_seconds_bucket{" << labels << ",le=\"+Inf\"} " << count << "\n";
        out << "ferry_response_duration_seconds_sum{" << labels << "} "
            << static_cast<double>(hist->sum_ms.load(std::memory_order_relaxed)) / 1000.0 << "\n";
        out << "ferry_response_duration_seconds_count{" << labels << "} " << count << "\n";
    }

    out << "# HELP ferry_active_connections Number of in-flight requests per backend\n";
    out << "# TYPE ferry_active_connections gauge\n";
    for (const auto& [address, metrics] : backends_) {
        out << "ferry_active_connections{backend=\"" << escape_label(address) << "\"} "
            << metrics->active_connections.load(std::memory_order_relaxed) << "\n";
    }

    out << "# HELP ferry_backend_health Backend health status (1 = alive, 0 = dead)\n";
    out << "# TYPE ferry_backend_health gauge\n";
    for (const auto& [address, metrics] : backends_) {
        out << "ferry_backend_health{backend=\"" << escape_label(address) << "\"} "
            << (metrics->healthy.load(std::memory_order_relaxed) ? 1 : 0) << "\n";
    }

    out << "# HELP ferry_uptime_seconds Seconds since the balancer started\n";
    out << "# TYPE ferry_uptime_seconds gauge\n";
    out << "ferry_uptime_seconds " << uptime_seconds() << "\n";

    return out.str();
}

} // namespace ferry::util
