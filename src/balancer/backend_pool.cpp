/**
 * FERRY - HTTP Load Balancer
 * Backend Pool - Implementation
 */

#include "balancer/backend_pool.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace ferry::balancer {

BackendPool::BackendPool(std::vector<Backend::Ptr> backends)
    : backends_(std::move(backends))
{
    for (const auto& backend : backends_) {
        if (!backend) {
            throw std::invalid_argument("BackendPool: null backend");
        }
    }
}

BackendPool BackendPool::from_addresses(const std::vector<std::string>& addresses) {
    std::vector<Backend::Ptr> backends;
    backends.reserve(addresses.size());

    for (std::size_t i = 0; i < addresses.size(); ++i) {
        try {
            backends.push_back(std::make_shared<Backend>(addresses[i]));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("backends[" + std::to_string(i) + "]: " + e.what());
        }
    }

    spdlog::debug("BackendPool built with {} backends", backends.size());
    return BackendPool(std::move(backends));
}

const Backend::Ptr& BackendPool::at(std::size_t index) const {
    return backends_.at(index);
}

std::size_t BackendPool::alive_count() const {
    std::size_t count = 0;
    for (const auto& backend : backends_) {
        if (backend->is_alive()) {
            ++count;
        }
    }
    return count;
}

} // namespace ferry::balancer
