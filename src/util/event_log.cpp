/**
 * FERRY - HTTP Load Balancer
 * EventLog Implementation
 */

#include "util/event_log.hpp"

#include <spdlog/fmt/chrono.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <ctime>

namespace ferry::util {

EventLog::EventLog(const std::string& path)
    : path_(path)
{
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_, false);
    sink->set_pattern("%v");

    // Not registered: several event logs may coexist (tests)
    logger_ = std::make_shared<spdlog::logger>("events", std::move(sink));
    logger_->set_level(spdlog::level::info);
    logger_->flush_on(spdlog::level::info);

    spdlog::info("Event log writing to {}", path_);
}

EventLog::~EventLog() {
    flush();
}

void EventLog::record_request(const balancer::RequestEvent& event) {
    write(to_json(event, std::chrono::system_clock::now()));
}

void EventLog::record_health(const balancer::HealthEvent& event) {
    write(to_json(event, std::chrono::system_clock::now()));
}

void EventLog::flush() {
    if (logger_) {
        logger_->flush();
    }
}

nlohmann::json EventLog::to_json(const balancer::RequestEvent& event,
                                 std::chrono::system_clock::time_point when) {
    return nlohmann::json{
        {"type", "request"},
        {"timestamp", format_timestamp(when)},
        {"client_ip", event.client_addr},
        {"method", event.method},
        {"path", event.path},
        {"backend", event.backend_address},
        {"response_time_ms", event.latency.count()},
        {"status_code", event.status_code}
    };
}

nlohmann::json EventLog::to_json(const balancer::HealthEvent& event,
                                 std::chrono::system_clock::time_point when) {
    return nlohmann::json{
        {"type", "health"},
        {"timestamp", format_timestamp(when)},
        {"backend", event.backend_address},
        {"is_alive", event.alive},
        {"response_time_ms", event.latency.count()}
    };
}

std::string EventLog::format_timestamp(std::chrono::system_clock::time_point when) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(seconds), millis);
}

void EventLog::write(const nlohmann::json& record) {
    try {
        logger_->info(record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (const std::exception& e) {
        spdlog::error("Event log write to {} failed: {}", path_, e.what());
    }
}

} // namespace ferry::util
