/**
 * FERRY - HTTP Load Balancer
 * Backend Pool - Ordered, fixed-membership collection of backends
 */

#ifndef FERRY_BALANCER_BACKEND_POOL_HPP
#define FERRY_BALANCER_BACKEND_POOL_HPP

#include "balancer/backend.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace ferry::balancer {

/**
 * BackendPool - membership is fixed at construction
 *
 * Readers need no locking: the vector is never modified after construction,
 * only the per-backend state it points to changes.
 */
class BackendPool {
public:
    using const_iterator = std::vector<Backend::Ptr>::const_iterator;

    BackendPool() = default;
    explicit BackendPool(std::vector<Backend::Ptr> backends);

    /**
     * Build a pool from backend addresses, preserving order
     * @throws std::invalid_argument on the first malformed address
     */
    static BackendPool from_addresses(const std::vector<std::string>& addresses);

    std::size_t size() const noexcept { return backends_.size(); }
    bool empty() const noexcept { return backends_.empty(); }

    /**
     * Indexed access (index must be < size())
     */
    const Backend::Ptr& operator[](std::size_t index) const { return backends_[index]; }

    /**
     * Bounds-checked access
     * @throws std::out_of_range
     */
    const Backend::Ptr& at(std::size_t index) const;

    const_iterator begin() const noexcept { return backends_.begin(); }
    const_iterator end() const noexcept { return backends_.end(); }

    /**
     * Number of backends currently marked alive
     */
    std::size_t alive_count() const;

private:
    std::vector<Backend::Ptr> backends_;
};

} // namespace ferry::balancer

#endif // FERRY_BALANCER_BACKEND_POOL_HPP
