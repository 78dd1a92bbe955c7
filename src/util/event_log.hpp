/**
 * FERRY - HTTP Load Balancer
 * EventLog - Persistent JSON-lines record of requests and health probes
 */

#ifndef FERRY_UTIL_EVENT_LOG_HPP
#define FERRY_UTIL_EVENT_LOG_HPP

#include "balancer/events.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <string>

namespace ferry::util {

/**
 * EventLog - appends one JSON object per line to a file
 *
 * Request line:
 *   {"type":"request","timestamp":"...","client_ip":"...","method":"GET","path":"/",
 *    "backend":"http://...","response_time_ms":12,"status_code":200}
 * Health line:
 *   {"type":"health","timestamp":"...","backend":"http://...","is_alive":true,"response_time_ms":3}
 *
 * Recording never throws; write failures are logged.
 */
class EventLog {
public:
    /**
     * Open (append) the log file
     * @throws spdlog::spdlog_ex if the file cannot be opened
     */
    explicit EventLog(const std::string& path);
    ~EventLog();

    // Non-copyable
    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    void record_request(const balancer::RequestEvent& event);
    void record_health(const balancer::HealthEvent& event);

    void flush();

    const std::string& path() const noexcept { return path_; }

    /**
     * Build the JSON record for an event, stamped with the given time
     */
    static nlohmann::json to_json(const balancer::RequestEvent& event,
                                  std::chrono::system_clock::time_point when);
    static nlohmann::json to_json(const balancer::HealthEvent& event,
                                  std::chrono::system_clock::time_point when);

    /**
     * ISO-8601 UTC timestamp with millisecond precision
     */
    static std::string format_timestamp(std::chrono::system_clock::time_point when);

private:
    void write(const nlohmann::json& record);

    std::string path_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace ferry::util

#endif // FERRY_UTIL_EVENT_LOG_HPP
