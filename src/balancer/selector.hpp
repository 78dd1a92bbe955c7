/**
 * FERRY - HTTP Load Balancer
 * Selector - Round-robin, least-connections and random backend selection
 */

#ifndef FERRY_BALANCER_SELECTOR_HPP
#define FERRY_BALANCER_SELECTOR_HPP

#include "balancer/backend_pool.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::balancer {

/**
 * Selection algorithm
 */
enum class Algorithm {
    round_robin,
    least_conn,
    random
};

/**
 * Map a configured algorithm name to an Algorithm.
 * "roundrobin" and "leastconn" are recognized; any other value selects random.
 */
Algorithm parse_algorithm(std::string_view name);

/**
 * Configuration name of an algorithm ("roundrobin", "leastconn", "random")
 */
std::string_view to_string(Algorithm algorithm);

/**
 * Result of backend selection
 */
struct BackendSelection {
    Backend::Ptr backend;
    std::size_t index;  // Index in the pool for debugging/logging
};

/**
 * Selector - picks an alive backend from a pool
 *
 * Features:
 * - Thread-safe; the round-robin cursor is a single atomic counter
 * - Never mutates backend counters
 * - Returns nullopt when no backend in the pool is alive (including an empty pool)
 *
 * Algorithms:
 * - round_robin: cursor.fetch_add(1) % size is the starting index, scan forward
 *   circularly and return the first alive backend
 * - least_conn: alive backend with the fewest active connections, ties go to the
 *   earliest backend in pool order
 * - random: uniform samples, at most size() of them; if every sample was dead,
 *   scan circularly from a random offset so an alive backend is still found
 */
class Selector {
public:
    Selector() = default;

    // Non-copyable (owns the shared cursor)
    Selector(const Selector&) = delete;
    Selector& operator=(const Selector&) = delete;

    /**
     * Select a backend with the given algorithm
     * @return Selection if an alive backend exists, nullopt otherwise
     */
    std::optional<BackendSelection> select_backend(const BackendPool& pool, Algorithm algorithm);

    /**
     * Current round-robin cursor value (number of round-robin selections so far)
     */
    std::uint64_t cursor() const noexcept { return cursor_.load(std::memory_order_relaxed); }

private:
    std::optional<BackendSelection> select_round_robin(const BackendPool& pool);
    std::optional<BackendSelection> select_least_conn(const BackendPool& pool);
    std::optional<BackendSelection> select_random(const BackendPool& pool);

    std::atomic<std::uint64_t> cursor_{0};
};

} // namespace ferry::balancer

#endif // FERRY_BALANCER_SELECTOR_HPP
