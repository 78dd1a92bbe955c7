/**
 * FERRY - HTTP Load Balancer
 * Selector - Implementation of the selection algorithms
 */

#include "balancer/selector.hpp"

#include <spdlog/spdlog.h>

#include <limits>
#include <random>

namespace ferry::balancer {

namespace {

std::size_t random_index(std::size_t size) {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<std::size_t> dist(0, size - 1);
    return dist(rng);
}

} // namespace

Algorithm parse_algorithm(std::string_view name) {
    if (name == "roundrobin") return Algorithm::round_robin;
    if (name == "leastconn") return Algorithm::least_conn;
    if (name != "random") {
        spdlog::warn("Unknown balancing algorithm '{}', falling back to random", name);
    }
    return Algorithm::random;
}

std::string_view to_string(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::round_robin: return "roundrobin";
        case Algorithm::least_conn: return "leastconn";
        case Algorithm::random: return "random";
        default: return "random";
    }
}

std::optional<BackendSelection> Selector::select_backend(const BackendPool& pool, Algorithm algorithm) {
    if (pool.empty()) {
        spdlog::debug("Selector: No backends configured");
        return std::nullopt;
    }

    std::optional<BackendSelection> selection;
    switch (algorithm) {
        case Algorithm::round_robin:
            selection = select_round_robin(pool);
            break;
        case Algorithm::least_conn:
            selection = select_least_conn(pool);
            break;
        case Algorithm::random:
        default:
            selection = select_random(pool);
            break;
    }

    if (!selection) {
        spdlog::debug("Selector: No alive backends available ({})", to_string(algorithm));
        return std::nullopt;
    }

    spdlog::debug("Selector: Selected backend {} (index={}, algorithm={})",
                  selection->backend->address(), selection->index, to_string(algorithm));
    return selection;
}

std::optional<BackendSelection> Selector::select_round_robin(const BackendPool& pool) {
    const auto size = pool.size();
    const auto start = static_cast<std::size_t>(
        cursor_.fetch_add(1, std::memory_order_relaxed) % size);

    for (std::size_t step = 0; step < size; ++step) {
        auto index = (start + step) % size;
        if (pool[index]->is_alive()) {
            return BackendSelection{
                .backend = pool[index],
                .index = index
            };
        }
    }
    return std::nullopt;
}

std::optional<BackendSelection> Selector::select_least_conn(const BackendPool& pool) {
    std::optional<BackendSelection> selected;
    std::int32_t min_active = std::numeric_limits<std::int32_t>::max();

    // Each counter is read once; the scan is a per-backend snapshot, not a pool-wide one
    for (std::size_t i = 0; i < pool.size(); ++i) {
        const auto& backend = pool[i];
        if (!backend->is_alive()) {
            continue;
        }
        auto active = backend->active_connections();
        if (!selected || active < min_active) {
            min_active = active;
            selected = BackendSelection{
                .backend = backend,
                .index = i
            };
        }
    }
    return selected;
}

std::optional<BackendSelection> Selector::select_random(const BackendPool& pool) {
    const auto size = pool.size();

    for (std::size_t attempt = 0; attempt < size; ++attempt) {
        auto index = random_index(size);
        if (pool[index]->is_alive()) {
            return BackendSelection{
                .backend = pool[index],
                .index = index
            };
        }
    }

    // Every sample hit a dead backend; a full circular scan decides between
    // "some backend is alive" and NONE
    auto offset = random_index(size);
    for (std::size_t step = 0; step < size; ++step) {
        auto index = (offset + step) % size;
        if (pool[index]->is_alive()) {
            return BackendSelection{
                .backend = pool[index],
                .index = index
            };
        }
    }
    return std::nullopt;
}

} // namespace ferry::balancer
