/**
 * FERRY - HTTP Load Balancer
 * Dispatcher unit tests
 */

#include "balancer/dispatcher.hpp"

#include "log_capture.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ferry::balancer;
using ferry::proxy::ForwardResult;
using ferry::server::HttpRequest;
using ferry::server::HttpResponse;

namespace http = boost::beast::http;

namespace {

BackendPool make_pool(std::size_t count) {
    std::vector<std::string> addresses;
    for (std::size_t i = 0; i < count; ++i) {
        addresses.push_back("http://localhost:" + std::to_string(9000 + i));
    }
    return BackendPool::from_addresses(addresses);
}

HttpRequest make_request(const std::string& target = "/") {
    HttpRequest request;
    request.method = http::verb::get;
    request.method_string = "GET";
    request.target = target;
    request.client_ip = "192.168.1.10";
    request.client_port = 40000;
    return request;
}

ForwardResult ok_result(const Backend& backend) {
    ForwardResult result;
    result.success = true;
    result.response.status = http::status::ok;
    result.response.body = "Hello from " + backend.address();
    return result;
}

} // namespace

TEST(DispatcherTest, RequiresForwardFunction) {
    EXPECT_THROW(Dispatcher(make_pool(1), Algorithm::round_robin, nullptr), std::invalid_argument);
}

TEST(DispatcherTest, EmptyPoolAnswers503) {
    int forwards = 0;
    Dispatcher dispatcher(BackendPool::from_addresses({}), Algorithm::round_robin,
        [&forwards](const HttpRequest&, const Backend& backend) {
            ++forwards;
            return ok_result(backend);
        });

    std::vector<RequestEvent> events;
    dispatcher.on_request([&events](const RequestEvent& event) { events.push_back(event); });

    auto response = dispatcher.dispatch(make_request("/anything"));

    EXPECT_EQ(response.status, http::status::service_unavailable);
    EXPECT_NE(response.body.find("No healthy backends available"), std::string::npos);
    EXPECT_EQ(forwards, 0);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].status_code, 503);
    EXPECT_TRUE(events[0].backend_address.empty());
    EXPECT_EQ(events[0].path, "/anything");
}

TEST(DispatcherTest, AllDeadAnswers503WithoutTouchingCounters) {
    auto pool = make_pool(3);
    for (const auto& backend : pool) {
        backend->set_alive(false);
    }

    int forwards = 0;
    Dispatcher dispatcher(pool, Algorithm::least_conn,
        [&forwards](const HttpRequest&, const Backend& backend) {
            ++forwards;
            return ok_result(backend);
        });

    auto response = dispatcher.dispatch(make_request());

    EXPECT_EQ(response.status, http::status::service_unavailable);
    EXPECT_EQ(forwards, 0);
    for (const auto& backend : pool) {
        EXPECT_EQ(backend->active_connections(), 0);
        EXPECT_EQ(backend->request_count(), 0u);
    }
}

TEST(DispatcherTest, RejectedRequestLogsOneWarning) {
    auto pool = make_pool(2);
    for (const auto& backend : pool) {
        backend->set_alive(false);
    }
    Dispatcher dispatcher(pool, Algorithm::round_robin,
        [](const HttpRequest&, const Backend& backend) { return ok_result(backend); });

    ferry::testing::LogCapture capture;
    dispatcher.dispatch(make_request("/busy"));

    EXPECT_EQ(capture.count("[warning]"), 1u);
    EXPECT_EQ(capture.count("No alive backends available - returning 503 for GET /busy"), 1u);
    EXPECT_EQ(capture.count("[debug] Selector: No alive backends available"), 1u);
}

TEST(DispatcherTest, CountsRequestWhileForwarding) {
    auto pool = make_pool(1);
    std::int32_t active_during_forward = -1;

    Dispatcher dispatcher(pool, Algorithm::round_robin,
        [&active_during_forward](const HttpRequest&, const Backend& backend) {
            active_during_forward = backend.active_connections();
            return ok_result(backend);
        });

    auto response = dispatcher.dispatch(make_request());

    EXPECT_EQ(response.status, http::status::ok);
    EXPECT_EQ(response.body, "Hello from http://localhost:9000");
    EXPECT_EQ(active_during_forward, 1);
    EXPECT_EQ(pool[0]->active_connections(), 0);
    EXPECT_EQ(pool[0]->request_count(), 1u);
}

TEST(DispatcherTest, ReportsRequestOutcome) {
    auto pool = make_pool(1);
    Dispatcher dispatcher(pool, Algorithm::round_robin,
        [](const HttpRequest&, const Backend& backend) {
            auto result = ok_result(backend);
            result.response.status = http::status::created;
            return result;
        });

    std::vector<RequestEvent> events;
    dispatcher.on_request([&events](const RequestEvent& event) { events.push_back(event); });

    auto request = make_request("/items?page=2");
    request.method = http::verb::post;
    request.method_string = "POST";
    dispatcher.dispatch(request);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].client_addr, "192.168.1.10:40000");
    EXPECT_EQ(events[0].method, "POST");
    EXPECT_EQ(events[0].path, "/items");
    EXPECT_EQ(events[0].backend_address, "http://localhost:9000");
    EXPECT_EQ(events[0].status_code, 201);
    EXPECT_GE(events[0].latency.count(), 0);
}

TEST(DispatcherTest, ForwardFailureIsPassedThroughWithoutRetry) {
    auto pool = make_pool(2);
    std::vector<std::string> attempts;

    Dispatcher dispatcher(pool, Algorithm::round_robin,
        [&attempts](const HttpRequest&, const Backend& backend) {
            attempts.push_back(backend.address());
            ForwardResult result;
            result.success = false;
            result.error_message = "Backend request timed out";
            result.response.status = http::status::gateway_timeout;
            return result;
        });

    auto response = dispatcher.dispatch(make_request());

    EXPECT_EQ(response.status, http::status::gateway_timeout);
    EXPECT_EQ(attempts, (std::vector<std::string>{"http://localhost:9000"}));
    EXPECT_EQ(pool[0]->active_connections(), 0);
}

TEST(DispatcherTest, ThrowingForwardBecomes502AndReleasesCounter) {
    auto pool = make_pool(1);
    Dispatcher dispatcher(pool, Algorithm::round_robin,
        [](const HttpRequest&, const Backend&) -> ForwardResult {
            throw std::runtime_error("connection reset");
        });

    std::vector<RequestEvent> events;
    dispatcher.on_request([&events](const RequestEvent& event) { events.push_back(event); });

    auto response = dispatcher.dispatch(make_request());

    EXPECT_EQ(response.status, http::status::bad_gateway);
    EXPECT_EQ(pool[0]->active_connections(), 0);
    EXPECT_EQ(pool[0]->request_count(), 1u);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].status_code, 502);
}

TEST(DispatcherTest, RoundRobinAcrossRequests) {
    auto pool = make_pool(3);
    Dispatcher dispatcher(pool, Algorithm::round_robin,
        [](const HttpRequest&, const Backend& backend) { return ok_result(backend); });

    std::vector<std::string> bodies;
    for (int i = 0; i < 6; ++i) {
        bodies.push_back(dispatcher.dispatch(make_request()).body);
    }

    EXPECT_EQ(bodies, (std::vector<std::string>{
        "Hello from http://localhost:9000",
        "Hello from http://localhost:9001",
        "Hello from http://localhost:9002",
        "Hello from http://localhost:9000",
        "Hello from http://localhost:9001",
        "Hello from http://localhost:9002"
    }));
}

TEST(DispatcherTest, LeastConnPrefersIdleBackend) {
    auto pool = make_pool(3);
    pool[0]->record_start();
    pool[0]->record_start();
    pool[2]->record_start();

    Dispatcher dispatcher(pool, Algorithm::least_conn,
        [](const HttpRequest&, const Backend& backend) { return ok_result(backend); });

    EXPECT_EQ(dispatcher.dispatch(make_request()).body, "Hello from http://localhost:9001");
}

TEST(DispatcherTest, ThrowingObserverDoesNotAffectResponse) {
    auto pool = make_pool(1);
    Dispatcher dispatcher(pool, Algorithm::round_robin,
        [](const HttpRequest&, const Backend& backend) { return ok_result(backend); });

    int reached = 0;
    dispatcher.on_request([](const RequestEvent&) { throw std::runtime_error("sink down"); });
    dispatcher.on_request([&reached](const RequestEvent&) { ++reached; });

    EXPECT_EQ(dispatcher.dispatch(make_request()).status, http::status::ok);
    EXPECT_EQ(reached, 1);
}

TEST(DispatcherTest, ConcurrentDispatchKeepsCountersBalanced) {
    constexpr int kThreads = 8;
    constexpr int kRequests = 250;

    auto pool = make_pool(3);
    std::atomic<int> max_seen{0};

    Dispatcher dispatcher(pool, Algorithm::least_conn,
        [&max_seen](const HttpRequest&, const Backend& backend) {
            int active = backend.active_connections();
            int previous = max_seen.load();
            while (active > previous && !max_seen.compare_exchange_weak(previous, active)) {
            }
            std::this_thread::yield();
            return ok_result(backend);
        });

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&dispatcher]() {
            for (int i = 0; i < kRequests; ++i) {
                dispatcher.dispatch(make_request());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::uint64_t total = 0;
    for (const auto& backend : pool) {
        EXPECT_EQ(backend->active_connections(), 0);
        total += backend->request_count();
    }
    EXPECT_EQ(total, static_cast<std::uint64_t>(kThreads * kRequests));
    EXPECT_GE(max_seen.load(), 1);
    EXPECT_LE(max_seen.load(), kThreads);
}
