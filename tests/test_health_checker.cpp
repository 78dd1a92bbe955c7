/**
 * FERRY - HTTP Load Balancer
 * HealthChecker unit tests
 */

#include "balancer/health_checker.hpp"
#include "proxy/forwarder.hpp"
#include "server/io_worker.hpp"

#include "local_http_server.hpp"
#include "log_capture.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ferry::balancer;
using namespace std::chrono_literals;

namespace {

/**
 * Probe with scripted outcomes; backends without a script answer alive
 */
class ScriptedProbe {
public:
    void set(const std::string& address, bool alive) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_[address] = alive;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    ProbeFunction function() {
        return [this](const Backend::Ptr& backend, ProbeHandler handler) {
            bool alive = true;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++calls_;
                if (auto it = outcomes_.find(backend->address()); it != outcomes_.end()) {
                    alive = it->second;
                }
            }
            handler(ProbeResult{
                .alive = alive,
                .latency = 1ms,
                .detail = alive ? "status 200" : "status 503"
            });
        };
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, bool> outcomes_;
    int calls_{0};
};

BackendPool make_pool(std::size_t count) {
    std::vector<std::string> addresses;
    for (std::size_t i = 0; i < count; ++i) {
        addresses.push_back("http://localhost:" + std::to_string(9000 + i));
    }
    return BackendPool::from_addresses(addresses);
}

} // namespace

class HealthCheckerTest : public ::testing::Test {
protected:
    asio::io_context ioc_;
    ScriptedProbe probe_;
    BackendPool pool_ = make_pool(3);

    std::shared_ptr<HealthChecker> make_checker(HealthCheckConfig config = {}) {
        return std::make_shared<HealthChecker>(ioc_, pool_, config, probe_.function());
    }
};

TEST_F(HealthCheckerTest, RepeatedSuccessKeepsBackendAlive) {
    auto checker = make_checker();

    for (int round = 0; round < 5; ++round) {
        checker->check_all();
        for (const auto& backend : pool_) {
            EXPECT_TRUE(backend->is_alive());
        }
    }
    EXPECT_EQ(checker->probes_completed(), 15u);
}

TEST_F(HealthCheckerTest, SingleFailureMarksDead) {
    auto checker = make_checker();
    probe_.set(pool_[1]->address(), false);

    checker->check_all();

    EXPECT_TRUE(pool_[0]->is_alive());
    EXPECT_FALSE(pool_[1]->is_alive());
    EXPECT_TRUE(pool_[2]->is_alive());
}

TEST_F(HealthCheckerTest, SingleSuccessRecoversDeadBackend) {
    auto checker = make_checker();
    probe_.set(pool_[0]->address(), false);
    checker->check_all();
    ASSERT_FALSE(pool_[0]->is_alive());

    probe_.set(pool_[0]->address(), true);
    checker->check_all();
    EXPECT_TRUE(pool_[0]->is_alive());
}

TEST_F(HealthCheckerTest, ProbeThatThrowsCountsAsDead) {
    auto checker = std::make_shared<HealthChecker>(
        ioc_, pool_, HealthCheckConfig{},
        [](const Backend::Ptr&, ProbeHandler) {
            throw std::runtime_error("cannot open socket");
        });

    checker->check_all();

    for (const auto& backend : pool_) {
        EXPECT_FALSE(backend->is_alive());
    }
    EXPECT_EQ(checker->probes_completed(), 3u);
}

TEST_F(HealthCheckerTest, ProbesOfOneRoundRunConcurrently) {
    std::vector<std::pair<Backend::Ptr, ProbeHandler>> pending;
    auto checker = std::make_shared<HealthChecker>(
        ioc_, pool_, HealthCheckConfig{},
        [&pending](const Backend::Ptr& backend, ProbeHandler handler) {
            pending.emplace_back(backend, std::move(handler));
        });

    checker->check_all();

    // Every probe was issued before any of them completed
    ASSERT_EQ(pending.size(), 3u);
    EXPECT_EQ(checker->probes_completed(), 0u);

    // Completion order does not matter
    pending[2].second(ProbeResult{.alive = false, .latency = 5ms, .detail = "timeout"});
    pending[0].second(ProbeResult{.alive = true, .latency = 1ms, .detail = "status 200"});
    pending[1].second(ProbeResult{.alive = true, .latency = 2ms, .detail = "status 200"});

    EXPECT_EQ(checker->probes_completed(), 3u);
    EXPECT_TRUE(pool_[0]->is_alive());
    EXPECT_TRUE(pool_[1]->is_alive());
    EXPECT_FALSE(pool_[2]->is_alive());
}

TEST_F(HealthCheckerTest, RoundSummaryWaitsForLastResult) {
    std::vector<ProbeHandler> pending;
    auto checker = std::make_shared<HealthChecker>(
        ioc_, pool_, HealthCheckConfig{},
        [&pending](const Backend::Ptr&, ProbeHandler handler) {
            pending.push_back(std::move(handler));
        });

    ferry::testing::LogCapture capture;
    checker->check_all();
    ASSERT_EQ(pending.size(), 3u);

    pending[0](ProbeResult{.alive = true, .latency = 1ms, .detail = "status 200"});
    pending[1](ProbeResult{.alive = false, .latency = 1ms, .detail = "status 503"});
    EXPECT_EQ(checker->rounds_completed(), 0u);
    EXPECT_EQ(capture.count("Health round complete"), 0u);

    pending[2](ProbeResult{.alive = false, .latency = 1ms, .detail = "timeout"});
    EXPECT_EQ(checker->rounds_completed(), 1u);
    EXPECT_EQ(capture.count("Health round complete: 1/3 backends alive"), 1u);
}

TEST_F(HealthCheckerTest, ObserversReceiveEveryOutcome) {
    auto checker = make_checker();
    probe_.set(pool_[2]->address(), false);

    std::vector<HealthEvent> events;
    checker->on_health_event([](const HealthEvent&) {
        throw std::runtime_error("broken observer");
    });
    checker->on_health_event([&events](const HealthEvent& event) {
        events.push_back(event);
    });

    checker->check_all();

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].backend_address, pool_[0]->address());
    EXPECT_TRUE(events[0].alive);
    EXPECT_EQ(events[2].backend_address, pool_[2]->address());
    EXPECT_FALSE(events[2].alive);
    EXPECT_EQ(events[2].latency, 1ms);
}

TEST_F(HealthCheckerTest, StartRunsFirstRoundImmediately) {
    HealthCheckConfig config;
    config.interval = 10s;
    config.timeout = 1s;
    auto checker = make_checker(config);

    checker->start();
    EXPECT_TRUE(checker->is_running());
    EXPECT_EQ(probe_.calls(), 3);

    checker->stop();
    EXPECT_FALSE(checker->is_running());
}

TEST_F(HealthCheckerTest, RepeatsEveryIntervalUntilStopped) {
    HealthCheckConfig config;
    config.interval = 20ms;
    config.timeout = 10ms;
    auto checker = make_checker(config);

    checker->start();
    ioc_.run_for(200ms);
    EXPECT_GE(probe_.calls(), 3 * 3);

    checker->stop();
    auto calls_at_stop = probe_.calls();
    ioc_.restart();
    ioc_.run_for(100ms);
    EXPECT_EQ(probe_.calls(), calls_at_stop);
}

TEST_F(HealthCheckerTest, StartAndStopAreIdempotent) {
    auto checker = make_checker();
    checker->start();
    checker->start();
    EXPECT_EQ(probe_.calls(), 3);

    checker->stop();
    EXPECT_NO_THROW(checker->stop());
}

TEST(HealthCheckerHttpTest, ProbesRealBackends) {
    ferry::testing::LocalHttpServer server(
        [](const ferry::server::HttpRequest& req) {
            auto path = req.path();
            if (path == "/health") {
                return ferry::server::HttpResponse{.status = http::status::ok, .body = "OK"};
            }
            if (path == "/slow/health") {
                std::this_thread::sleep_for(600ms);
                return ferry::server::HttpResponse{.status = http::status::ok, .body = "OK"};
            }
            if (path == "/sick/health") {
                return ferry::server::HttpResponse{.status = http::status::service_unavailable};
            }
            return ferry::server::HttpResponse{.status = http::status::not_found};
        },
        4);

    auto dead_url = "http://127.0.0.1:" + std::to_string(ferry::testing::closed_port());
    auto pool = BackendPool::from_addresses({
        server.url(),
        server.url("/sick"),
        server.url("/slow"),
        dead_url
    });

    HealthCheckConfig config;
    config.interval = 5s;
    config.timeout = 200ms;

    asio::io_context ioc;
    auto checker = std::make_shared<HealthChecker>(ioc, pool, config);

    std::map<std::string, HealthEvent> events;
    checker->on_health_event([&events](const HealthEvent& event) {
        events[event.backend_address] = event;
    });

    checker->check_all();
    ioc.run();

    EXPECT_EQ(checker->probes_completed(), 4u);
    EXPECT_TRUE(pool[0]->is_alive());
    EXPECT_FALSE(pool[1]->is_alive());
    EXPECT_FALSE(pool[2]->is_alive());
    EXPECT_FALSE(pool[3]->is_alive());

    // The hanging backend was cut off by its own deadline
    ASSERT_EQ(events.count(pool[2]->address()), 1u);
    EXPECT_LT(events[pool[2]->address()].latency, 500ms);
}

TEST(HealthCheckerHttpTest, BlockedProxyWorkerDoesNotDelayHealthChecks) {
    // Accepts into the backlog but never answers
    asio::io_context listener_ioc;
    tcp::acceptor hung(listener_ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    auto hung_url = "http://127.0.0.1:" + std::to_string(hung.local_endpoint().port());

    // One proxy worker, stuck forwarding to the hung backend
    asio::io_context proxy_ioc;
    auto guard = asio::make_work_guard(proxy_ioc);
    std::jthread proxy_worker([&proxy_ioc] { proxy_ioc.run(); });

    std::atomic<bool> forward_done{false};
    asio::post(proxy_ioc, [&forward_done, hung_url] {
        ferry::proxy::ForwarderConfig forwarder_config;
        forwarder_config.request_timeout = 1500ms;
        ferry::proxy::Forwarder forwarder(forwarder_config);

        ferry::server::HttpRequest request;
        request.method = http::verb::get;
        request.method_string = "GET";
        request.target = "/";
        request.raw_request.method(http::verb::get);
        request.raw_request.target("/");

        forwarder.forward(request, Backend(hung_url));
        forward_done = true;
    });
    std::this_thread::sleep_for(100ms);

    // Health checks on their own thread against a refused port
    ferry::server::IoWorker health_worker("health-test");
    auto pool = BackendPool::from_addresses({
        "http://127.0.0.1:" + std::to_string(ferry::testing::closed_port())
    });

    HealthCheckConfig config;
    config.interval = 5s;
    config.timeout = 200ms;
    auto checker = std::make_shared<HealthChecker>(health_worker.context(), pool, config);

    std::promise<HealthEvent> outcome;
    auto result = outcome.get_future();
    checker->on_health_event([&outcome](const HealthEvent& event) {
        outcome.set_value(event);
    });

    auto start = std::chrono::steady_clock::now();
    asio::post(health_worker.context(), [checker] { checker->check_all(); });

    ASSERT_EQ(result.wait_for(1000ms), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
    EXPECT_FALSE(result.get().alive);
    EXPECT_FALSE(pool[0]->is_alive());
    EXPECT_FALSE(forward_done.load());

    health_worker.stop();
    guard.reset();
    proxy_worker.join();
    EXPECT_TRUE(forward_done.load());
}
