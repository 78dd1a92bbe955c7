/**
 * FERRY - HTTP Load Balancer
 * Logger - spdlog setup, component tags, access and health lines
 */

#ifndef FERRY_UTIL_LOGGER_HPP
#define FERRY_UTIL_LOGGER_HPP

#include "balancer/events.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::util {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Sinks and level; built from config::LogSettings by main
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty: console only
    std::size_t max_file_size_mb{100}; // Rotation threshold
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Logger - process-wide spdlog front end
 *
 * Owns two spdlog loggers over the same sinks: "ferry" (also installed as
 * the spdlog default, so plain spdlog:: calls land in the same place) and
 * "access", which carries one line per request regardless of the level.
 */
class Logger {
public:
    /**
     * Configure sinks; only the first call (or instance()) takes effect
     */
    static void init(const LogConfig& config);

    /**
     * The logger, configured with defaults if init() was never called
     */
    static Logger& instance();

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * Case-insensitive; accepts the usual aliases (warning, err, fatal, none)
     */
    static std::optional<LogLevel> parse_level(std::string_view name);
    static std::string_view level_to_string(LogLevel level);

    /**
     * Write "[component] message" at the given level
     */
    template<typename... Args>
    void log(LogLevel level, std::string_view component,
             spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!logger_ || level == LogLevel::Off) return;
        auto spd_level = to_spdlog_level(level);
        if (!logger_->should_log(spd_level)) return;
        logger_->log(spd_level, "[{}] {}", component, fmt::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * Access line for a proxied or rejected request (WARN for 5xx)
     */
    void access(const balancer::RequestEvent& event);

    /**
     * Per-probe line at DEBUG
     */
    void health(const balancer::HealthEvent& event);

    /**
     * client "METHOD /path" status latency backend, "-" for missing fields
     */
    static std::string format_access(const balancer::RequestEvent& event);

    void flush();

private:
    Logger() = default;

    void configure(const LogConfig& config);

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> access_logger_;
    std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

#define FERRY_LOG_TRACE(component, ...) \
    ::ferry::util::Logger::instance().log(::ferry::util::LogLevel::Trace, component, __VA_ARGS__)
#define FERRY_LOG_DEBUG(component, ...) \
    ::ferry::util::Logger::instance().log(::ferry::util::LogLevel::Debug, component, __VA_ARGS__)
#define FERRY_LOG_INFO(component, ...) \
    ::ferry::util::Logger::instance().log(::ferry::util::LogLevel::Info, component, __VA_ARGS__)
#define FERRY_LOG_WARN(component, ...) \
    ::ferry::util::Logger::instance().log(::ferry::util::LogLevel::Warn, component, __VA_ARGS__)
#define FERRY_LOG_ERROR(component, ...) \
    ::ferry::util::Logger::instance().log(::ferry::util::LogLevel::Error, component, __VA_ARGS__)
#define FERRY_LOG_CRITICAL(component, ...) \
    ::ferry::util::Logger::instance().log(::ferry::util::LogLevel::Critical, component, __VA_ARGS__)

namespace log_component {
    constexpr std::string_view Server = "server";
    constexpr std::string_view Config = "config";
    constexpr std::string_view Balancer = "balancer";
    constexpr std::string_view Health = "health";
    constexpr std::string_view Proxy = "proxy";
    constexpr std::string_view Metrics = "metrics";
    constexpr std::string_view Events = "events";
}

} // namespace ferry::util

#endif // FERRY_UTIL_LOGGER_HPP
