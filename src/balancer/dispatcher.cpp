/**
 * FERRY - HTTP Load Balancer
 * Dispatcher - Implementation
 */

#include "balancer/dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace ferry::balancer {

namespace http = boost::beast::http;

Dispatcher::Dispatcher(BackendPool pool, Algorithm algorithm, ForwardFunction forward)
    : pool_(std::move(pool))
    , algorithm_(algorithm)
    , forward_(std::move(forward))
{
    if (!forward_) {
        throw std::invalid_argument("Dispatcher requires a forward function");
    }
    spdlog::info("Dispatcher configured with {} backends, algorithm={}",
                 pool_.size(), to_string(algorithm_));
}

void Dispatcher::on_request(RequestObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

server::HttpResponse Dispatcher::dispatch(const server::HttpRequest& request) {
    auto start_time = std::chrono::steady_clock::now();

    RequestEvent event{
        .client_addr = request.client_address(),
        .method = request.method_string,
        .path = request.path(),
        .backend_address = {},
        .latency = std::chrono::milliseconds{0},
        .status_code = 0
    };

    auto selection = selector_.select_backend(pool_, algorithm_);
    if (!selection) {
        spdlog::warn("No alive backends available - returning 503 for {} {}",
                     event.method, event.path);
        server::HttpResponse response{
            .status = http::status::service_unavailable,
            .content_type = "application/json",
            .body = R"({"error": "No healthy backends available"})"
        };

        event.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        event.status_code = static_cast<int>(response.status);
        report(event);
        return response;
    }

    auto& backend = *selection->backend;
    event.backend_address = backend.address();

    proxy::ForwardResult result;
    {
        ActiveRequestGuard guard(backend);
        try {
            result = forward_(request, backend);
        } catch (const std::exception& e) {
            spdlog::error("Dispatcher: forwarding to {} threw: {}", backend.address(), e.what());
            result.success = false;
            result.error_message = e.what();
            result.response = server::HttpResponse{
                .status = http::status::bad_gateway,
                .content_type = "application/json",
                .body = R"({"error": "Backend forwarding failed"})"
            };
        }
    }

    event.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    event.status_code = static_cast<int>(result.response.status);

    if (!result.success) {
        spdlog::warn("Forward to {} failed: {}", backend.address(), result.error_message);
    }
    spdlog::debug("{} {} -> {} ({}ms, status={})",
                  event.method, event.path, backend.address(),
                  event.latency.count(), event.status_code);

    report(event);
    return std::move(result.response);
}

void Dispatcher::report(const RequestEvent& event) {
    std::vector<RequestObserver> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers = observers_;
    }

    for (const auto& observer : observers) {
        try {
            observer(event);
        } catch (const std::exception& e) {
            spdlog::error("Request observer error: {}", e.what());
        }
    }
}

} // namespace ferry::balancer
