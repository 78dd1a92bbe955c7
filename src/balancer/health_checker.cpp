/**
 * FERRY - HTTP Load Balancer
 * Backend Health Monitoring - Implementation
 */

#include "balancer/health_checker.hpp"

namespace ferry::balancer {

HealthChecker::HealthChecker(asio::io_context& io_context, BackendPool pool,
                             const HealthCheckConfig& config, ProbeFunction probe)
    : io_context_(io_context)
    , timer_(io_context)
    , pool_(std::move(pool))
    , config_(config)
    , probe_(std::move(probe))
{
    if (!probe_) {
        probe_ = [this](const Backend::Ptr& backend, ProbeHandler handler) {
            probe_http(backend, std::move(handler));
        };
    }

    spdlog::debug("HealthChecker created for {} backends with interval={}ms, timeout={}ms, path={}",
                  pool_.size(), config_.interval.count(), config_.timeout.count(),
                  config_.health_path);
}

HealthChecker::~HealthChecker() {
    stop();
}

void HealthChecker::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    spdlog::info("HealthChecker started");
    check_all();
    schedule_health_check();
}

void HealthChecker::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    std::lock_guard<std::mutex> lock(timer_mutex_);
    timer_.cancel();
    spdlog::info("HealthChecker stopped");
}

void HealthChecker::on_health_event(HealthObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

void HealthChecker::schedule_health_check() {
    if (!running_) {
        return;
    }

    std::lock_guard<std::mutex> lock(timer_mutex_);
    timer_.expires_after(config_.interval);
    timer_.async_wait([self = shared_from_this()](boost::system::error_code ec) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::warn("Health check timer error: {}", ec.message());
            }
            return;
        }
        if (!self->running_) {
            return;
        }

        self->check_all();
        self->schedule_health_check();
    });
}

void HealthChecker::check_all() {
    // The last result of the round logs the summary
    auto pending = std::make_shared<std::atomic<std::size_t>>(pool_.size());
    auto complete = [self = shared_from_this(), pending](const Backend::Ptr& backend,
                                                         const ProbeResult& result) {
        self->handle_probe_result(backend, result);
        if (pending->fetch_sub(1) == 1) {
            self->rounds_completed_.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("Health round complete: {}/{} backends alive",
                          self->pool_.alive_count(), self->pool_.size());
        }
    };

    for (const auto& backend : pool_) {
        try {
            probe_(backend, [complete, backend](const ProbeResult& result) {
                complete(backend, result);
            });
        } catch (const std::exception& e) {
            spdlog::error("Health probe for {} could not start: {}", backend->address(), e.what());
            complete(backend, ProbeResult{
                .alive = false,
                .latency = std::chrono::milliseconds{0},
                .detail = e.what()
            });
        }
    }
}

void HealthChecker::probe_http(const Backend::Ptr& backend, ProbeHandler handler) {
    auto start_time = std::chrono::steady_clock::now();

    // All I/O objects of one probe share a strand; the deadline timer and the
    // request chain never run concurrently
    auto strand = asio::make_strand(io_context_);
    auto resolver = std::make_shared<tcp::resolver>(strand);
    auto stream = std::make_shared<beast::tcp_stream>(strand);
    auto deadline = std::make_shared<asio::steady_timer>(strand);
    auto finished = std::make_shared<bool>(false);

    auto finish = [handler = std::move(handler), stream, deadline, finished, start_time]
                  (bool alive, const std::string& detail) {
        if (*finished) {
            return;
        }
        *finished = true;

        deadline->cancel();
        beast::error_code ec;
        stream->socket().shutdown(tcp::socket::shutdown_both, ec);
        stream->close();

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        handler(ProbeResult{
            .alive = alive,
            .latency = elapsed,
            .detail = detail
        });
    };

    auto target = backend->base_path() + config_.health_path;
    auto timeout = config_.timeout;

    asio::dispatch(strand, [backend, resolver, stream, deadline, finished, finish, target, timeout]() {
        deadline->expires_after(timeout);
        deadline->async_wait([resolver, finish, timeout](boost::system::error_code ec) {
            if (ec) {
                return;  // Cancelled by finish()
            }
            resolver->cancel();
            finish(false, "timed out after " + std::to_string(timeout.count()) + "ms");
        });

        resolver->async_resolve(
            backend->host(),
            std::to_string(backend->port()),
            [backend, stream, finished, finish, target]
            (boost::system::error_code ec, tcp::resolver::results_type results) {
                if (*finished) {
                    return;
                }
                if (ec) {
                    finish(false, "resolve failed: " + ec.message());
                    return;
                }

                stream->async_connect(
                    results,
                    [backend, stream, finished, finish, target]
                    (boost::system::error_code ec, const tcp::endpoint&) {
                        if (*finished) {
                            return;
                        }
                        if (ec) {
                            finish(false, "connect failed: " + ec.message());
                            return;
                        }

                        auto req = std::make_shared<http::request<http::empty_body>>(
                            http::verb::get, target, 11);
                        req->set(http::field::host, backend->authority());
                        req->set(http::field::user_agent, "FERRY-HealthChecker/1.0");
                        req->set(http::field::connection, "close");

                        auto buffer = std::make_shared<beast::flat_buffer>();
                        auto res = std::make_shared<http::response<http::string_body>>();

                        http::async_write(
                            *stream,
                            *req,
                            [stream, finished, finish, req, buffer, res]
                            (boost::system::error_code ec, std::size_t) {
                                if (*finished) {
                                    return;
                                }
                                if (ec) {
                                    finish(false, "write failed: " + ec.message());
                                    return;
                                }

                                http::async_read(
                                    *stream,
                                    *buffer,
                                    *res,
                                    [finished, finish, buffer, res]
                                    (boost::system::error_code ec, std::size_t) {
                                        if (*finished) {
                                            return;
                                        }
                                        if (ec) {
                                            finish(false, "read failed: " + ec.message());
                                            return;
                                        }

                                        auto status = res->result_int();
                                        finish(status == 200, "status " + std::to_string(status));
                                    }
                                );
                            }
                        );
                    }
                );
            }
        );
    });
}

void HealthChecker::handle_probe_result(const Backend::Ptr& backend, const ProbeResult& result) {
    bool was_alive = backend->set_alive(result.alive);
    probes_completed_.fetch_add(1, std::memory_order_relaxed);

    if (was_alive != result.alive) {
        if (result.alive) {
            spdlog::info("Backend {} state changed: dead -> alive ({}, {}ms)",
                         backend->address(), result.detail, result.latency.count());
        } else {
            spdlog::warn("Backend {} state changed: alive -> dead ({}, {}ms)",
                         backend->address(), result.detail, result.latency.count());
        }
    } else {
        spdlog::debug("Health check for {}: {} ({}, {}ms)",
                      backend->address(), result.alive ? "alive" : "dead",
                      result.detail, result.latency.count());
    }

    HealthEvent event{
        .backend_address = backend->address(),
        .alive = result.alive,
        .latency = result.latency
    };

    // Copy observers to call outside the lock
    std::vector<HealthObserver> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers = observers_;
    }

    for (const auto& observer : observers) {
        try {
            observer(event);
        } catch (const std::exception& e) {
            spdlog::error("Health event observer error: {}", e.what());
        }
    }
}

} // namespace ferry::balancer
