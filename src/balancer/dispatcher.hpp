/**
 * FERRY - HTTP Load Balancer
 * Dispatcher - Per-request selection, forwarding and outcome reporting
 */

#ifndef FERRY_BALANCER_DISPATCHER_HPP
#define FERRY_BALANCER_DISPATCHER_HPP

#include "balancer/backend_pool.hpp"
#include "balancer/events.hpp"
#include "balancer/selector.hpp"
#include "proxy/forwarder.hpp"
#include "server/connection.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace ferry::balancer {

/**
 * Forwards a request to the chosen backend. Production code binds this to
 * proxy::Forwarder::forward; tests substitute their own.
 */
using ForwardFunction = std::function<proxy::ForwardResult(const server::HttpRequest&, const Backend&)>;

/**
 * Dispatcher - the per-request entry point
 *
 * 1. Ask the Selector for an alive backend
 * 2. None alive: answer 503 without touching any backend counters
 * 3. Otherwise record_start(), forward, record_end() on every exit path
 * 4. Report a RequestEvent to every observer
 *
 * A failed forward is reported as-is; the request is never retried on another backend.
 */
class Dispatcher {
public:
    /**
     * @param pool Backends to choose from (shares the Backend objects)
     * @param algorithm Selection algorithm used for every request
     * @param forward Proxy collaborator
     */
    Dispatcher(BackendPool pool, Algorithm algorithm, ForwardFunction forward);

    // Non-copyable (owns the round-robin cursor)
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * Handle one request
     *
     * Thread-safe: called concurrently from all server worker threads
     */
    server::HttpResponse dispatch(const server::HttpRequest& request);

    /**
     * Register an observer for request outcomes (before serving starts)
     */
    void on_request(RequestObserver observer);

    Algorithm algorithm() const noexcept { return algorithm_; }
    const BackendPool& pool() const noexcept { return pool_; }

private:
    void report(const RequestEvent& event);

    BackendPool pool_;
    Algorithm algorithm_;
    Selector selector_;
    ForwardFunction forward_;

    mutable std::mutex mutex_;  // Protects observers_
    std::vector<RequestObserver> observers_;
};

} // namespace ferry::balancer

#endif // FERRY_BALANCER_DISPATCHER_HPP
