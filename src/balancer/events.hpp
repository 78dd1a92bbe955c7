/**
 * FERRY - HTTP Load Balancer
 * Events - Records reported by the dispatcher and the health checker
 */

#ifndef FERRY_BALANCER_EVENTS_HPP
#define FERRY_BALANCER_EVENTS_HPP

#include <chrono>
#include <functional>
#include <string>

namespace ferry::balancer {

/**
 * Outcome of one proxied (or rejected) request
 */
struct RequestEvent {
    std::string client_addr;
    std::string method;
    std::string path;
    std::string backend_address;  // Empty when no backend was available
    std::chrono::milliseconds latency{0};
    int status_code{0};
};

/**
 * Outcome of one health probe
 */
struct HealthEvent {
    std::string backend_address;
    bool alive{false};
    std::chrono::milliseconds latency{0};
};

using RequestObserver = std::function<void(const RequestEvent&)>;
using HealthObserver = std::function<void(const HealthEvent&)>;

} // namespace ferry::balancer

#endif // FERRY_BALANCER_EVENTS_HPP
