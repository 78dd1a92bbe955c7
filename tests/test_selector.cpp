/**
 * FERRY - HTTP Load Balancer
 * Selector unit tests
 */

#include "balancer/selector.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <latch>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace ferry::balancer;

namespace {

BackendPool make_pool(std::size_t count) {
    std::vector<std::string> addresses;
    for (std::size_t i = 0; i < count; ++i) {
        addresses.push_back("http://localhost:" + std::to_string(9000 + i));
    }
    return BackendPool::from_addresses(addresses);
}

std::string pick(Selector& selector, const BackendPool& pool, Algorithm algorithm) {
    auto selection = selector.select_backend(pool, algorithm);
    return selection ? selection->backend->address() : std::string("NONE");
}

const std::string A = "http://localhost:9000";
const std::string B = "http://localhost:9001";
const std::string C = "http://localhost:9002";

} // namespace

TEST(AlgorithmTest, ParsesConfiguredNames) {
    EXPECT_EQ(parse_algorithm("roundrobin"), Algorithm::round_robin);
    EXPECT_EQ(parse_algorithm("leastconn"), Algorithm::least_conn);
    EXPECT_EQ(parse_algorithm("random"), Algorithm::random);
}

TEST(AlgorithmTest, UnknownNamesFallBackToRandom) {
    EXPECT_EQ(parse_algorithm(""), Algorithm::random);
    EXPECT_EQ(parse_algorithm("weighted"), Algorithm::random);
    EXPECT_EQ(parse_algorithm("RoundRobin"), Algorithm::random);
}

TEST(AlgorithmTest, ToStringMatchesConfigNames) {
    EXPECT_EQ(to_string(Algorithm::round_robin), "roundrobin");
    EXPECT_EQ(to_string(Algorithm::least_conn), "leastconn");
    EXPECT_EQ(to_string(Algorithm::random), "random");
}

TEST(SelectorTest, RoundRobinRotatesInPoolOrder) {
    auto pool = make_pool(3);
    Selector selector;

    std::vector<std::string> picks;
    for (int i = 0; i < 6; ++i) {
        picks.push_back(pick(selector, pool, Algorithm::round_robin));
    }

    EXPECT_EQ(picks, (std::vector<std::string>{A, B, C, A, B, C}));
    EXPECT_EQ(selector.cursor(), 6u);
}

TEST(SelectorTest, RoundRobinSkipsDeadBackends) {
    auto pool = make_pool(3);
    pool[1]->set_alive(false);
    Selector selector;

    std::vector<std::string> picks;
    for (int i = 0; i < 4; ++i) {
        picks.push_back(pick(selector, pool, Algorithm::round_robin));
    }

    // Cursor 1 lands on B (dead) and scans forward to C
    EXPECT_EQ(picks, (std::vector<std::string>{A, C, C, A}));
}

TEST(SelectorTest, RoundRobinIsFairUnderConcurrency) {
    constexpr std::size_t kBackends = 4;
    constexpr int kThreads = 8;
    constexpr int kCallsPerThread = 1000;

    auto pool = make_pool(kBackends);
    Selector selector;

    std::mutex mutex;
    std::map<std::string, int> counts;
    std::latch ready(kThreads);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            std::map<std::string, int> local;
            ready.arrive_and_wait();
            for (int i = 0; i < kCallsPerThread; ++i) {
                ++local[pick(selector, pool, Algorithm::round_robin)];
            }
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto& [address, count] : local) {
                counts[address] += count;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Every call drew a distinct cursor value, so each backend got exactly its share
    ASSERT_EQ(counts.size(), kBackends);
    for (const auto& [address, count] : counts) {
        EXPECT_EQ(count, kThreads * kCallsPerThread / static_cast<int>(kBackends)) << address;
    }
}

TEST(SelectorTest, RoundRobinConcurrentBurstCoversEveryBackendOnce) {
    constexpr std::size_t kBackends = 6;
    auto pool = make_pool(kBackends);
    Selector selector;

    std::mutex mutex;
    std::vector<std::string> picks;
    std::latch ready(kBackends);

    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < kBackends; ++t) {
        threads.emplace_back([&]() {
            ready.arrive_and_wait();
            auto address = pick(selector, pool, Algorithm::round_robin);
            std::lock_guard<std::mutex> lock(mutex);
            picks.push_back(address);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::sort(picks.begin(), picks.end());
    EXPECT_EQ(std::unique(picks.begin(), picks.end()), picks.end());
    EXPECT_EQ(picks.size(), kBackends);
}

TEST(SelectorTest, LeastConnPicksFewestActive) {
    auto pool = make_pool(3);
    pool[0]->record_start();
    pool[0]->record_start();
    pool[2]->record_start();
    Selector selector;

    EXPECT_EQ(pick(selector, pool, Algorithm::least_conn), B);
}

TEST(SelectorTest, LeastConnBreaksTiesByPoolOrder) {
    auto pool = make_pool(3);
    pool[0]->record_start();
    Selector selector;

    EXPECT_EQ(pick(selector, pool, Algorithm::least_conn), B);
    EXPECT_EQ(pick(selector, pool, Algorithm::least_conn), B);
}

TEST(SelectorTest, LeastConnIgnoresDeadBackends) {
    auto pool = make_pool(3);
    pool[0]->record_start();
    pool[0]->record_start();
    pool[1]->set_alive(false);
    pool[2]->record_start();
    Selector selector;

    EXPECT_EQ(pick(selector, pool, Algorithm::least_conn), C);
}

TEST(SelectorTest, LeastConnNeverBusierThanAliveMinimum) {
    auto pool = make_pool(5);
    Selector selector;
    std::mt19937 rng(42);

    for (int round = 0; round < 200; ++round) {
        for (const auto& backend : pool) {
            while (backend->active_connections() > 0) {
                backend->record_end();
            }
            int load = static_cast<int>(rng() % 5);
            for (int i = 0; i < load; ++i) {
                backend->record_start();
            }
            backend->set_alive(rng() % 4 != 0);
        }

        std::optional<std::int32_t> minimum;
        for (const auto& backend : pool) {
            if (backend->is_alive() &&
                (!minimum || backend->active_connections() < *minimum)) {
                minimum = backend->active_connections();
            }
        }

        auto selection = selector.select_backend(pool, Algorithm::least_conn);
        if (!minimum) {
            EXPECT_FALSE(selection.has_value());
            continue;
        }
        ASSERT_TRUE(selection.has_value());
        EXPECT_TRUE(selection->backend->is_alive());
        EXPECT_EQ(selection->backend->active_connections(), *minimum);
    }
}

TEST(SelectorTest, RandomAvoidsDeadBackend) {
    auto pool = make_pool(2);
    pool[1]->set_alive(false);
    Selector selector;

    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(pick(selector, pool, Algorithm::random), A);
    }
}

TEST(SelectorTest, RandomFindsSoleAliveBackendInLargePool) {
    auto pool = make_pool(50);
    for (const auto& backend : pool) {
        backend->set_alive(false);
    }
    pool[37]->set_alive(true);
    Selector selector;

    for (int i = 0; i < 100; ++i) {
        auto selection = selector.select_backend(pool, Algorithm::random);
        ASSERT_TRUE(selection.has_value());
        EXPECT_EQ(selection->index, 37u);
    }
}

TEST(SelectorTest, RandomReachesEveryAliveBackend) {
    auto pool = make_pool(3);
    Selector selector;

    std::map<std::string, int> counts;
    for (int i = 0; i < 1000; ++i) {
        ++counts[pick(selector, pool, Algorithm::random)];
    }

    EXPECT_EQ(counts.size(), 3u);
    EXPECT_EQ(counts.count("NONE"), 0u);
}

TEST(SelectorTest, AllDeadYieldsNoneForEveryAlgorithm) {
    auto pool = make_pool(3);
    for (const auto& backend : pool) {
        backend->set_alive(false);
    }
    Selector selector;

    for (auto algorithm : {Algorithm::round_robin, Algorithm::least_conn, Algorithm::random}) {
        EXPECT_FALSE(selector.select_backend(pool, algorithm).has_value()) << to_string(algorithm);
    }
}

TEST(SelectorTest, EmptyPoolYieldsNone) {
    auto pool = BackendPool::from_addresses({});
    Selector selector;

    for (auto algorithm : {Algorithm::round_robin, Algorithm::least_conn, Algorithm::random}) {
        EXPECT_FALSE(selector.select_backend(pool, algorithm).has_value()) << to_string(algorithm);
    }
}

TEST(SelectorTest, SelectionNeverTouchesCounters) {
    auto pool = make_pool(3);
    Selector selector;

    for (int i = 0; i < 30; ++i) {
        for (auto algorithm : {Algorithm::round_robin, Algorithm::least_conn, Algorithm::random}) {
            selector.select_backend(pool, algorithm);
        }
    }

    for (const auto& backend : pool) {
        EXPECT_EQ(backend->active_connections(), 0);
        EXPECT_EQ(backend->request_count(), 0u);
    }
}

TEST(SelectorTest, SelectionReportsPoolIndex) {
    auto pool = make_pool(3);
    Selector selector;

    for (std::size_t expected = 0; expected < 3; ++expected) {
        auto selection = selector.select_backend(pool, Algorithm::round_robin);
        ASSERT_TRUE(selection.has_value());
        EXPECT_EQ(selection->index, expected);
        EXPECT_EQ(selection->backend.get(), pool[expected].get());
    }
}
