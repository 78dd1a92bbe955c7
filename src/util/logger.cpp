/**
 * FERRY - HTTP Load Balancer
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <cctype>
#include <utility>
#include <vector>

namespace ferry::util {

namespace {

// Canonical name first; parse_level also accepts the aliases
constexpr std::array<std::pair<std::string_view, LogLevel>, 12> kLevelNames = {{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},
    {"error", LogLevel::Error},
    {"critical", LogLevel::Critical},
    {"off", LogLevel::Off},
    {"warning", LogLevel::Warn},
    {"err", LogLevel::Error},
    {"crit", LogLevel::Critical},
    {"fatal", LogLevel::Critical},
    {"none", LogLevel::Off},
}};

const char* or_dash(const std::string& value) {
    return value.empty() ? "-" : value.c_str();
}

} // namespace

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

void Logger::init(const LogConfig& config) {
    std::call_once(init_flag_, [&config]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
    });
}

Logger& Logger::instance() {
    init(LogConfig{});
    return *instance_;
}

Logger::~Logger() {
    flush();
    spdlog::shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>(
            config.enable_colors ? spdlog::color_mode::automatic : spdlog::color_mode::never);
        console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(std::move(console));
    }
    if (!config.file_path.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size_mb * 1024 * 1024, config.max_files);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(std::move(file));
    }

    logger_ = std::make_shared<spdlog::logger>("ferry", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog_level(config.level));
    logger_->flush_on(spdlog::level::warn);

    access_logger_ = std::make_shared<spdlog::logger>("access", sinks.begin(), sinks.end());
    access_logger_->set_level(config.level == LogLevel::Off ? spdlog::level::off : spdlog::level::info);
    access_logger_->flush_on(spdlog::level::info);

    spdlog::drop("ferry");
    spdlog::drop("access");
    spdlog::register_logger(access_logger_);
    spdlog::set_default_logger(logger_);
}

std::optional<LogLevel> Logger::parse_level(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    for (const auto& [candidate, level] : kLevelNames) {
        if (candidate == lower) {
            return level;
        }
    }
    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    for (const auto& [name, candidate] : kLevelNames) {
        if (candidate == level) {
            return name;
        }
    }
    return "unknown";
}

void Logger::access(const balancer::RequestEvent& event) {
    if (!access_logger_) return;
    access_logger_->log(event.status_code >= 500 ? spdlog::level::warn : spdlog::level::info,
                        format_access(event));
}

std::string Logger::format_access(const balancer::RequestEvent& event) {
    // 192.168.1.1:53122 "GET /index.html" 200 12ms http://localhost:9000
    return fmt::format(R"({} "{} {}" {} {}ms {})",
                       or_dash(event.client_addr), or_dash(event.method), or_dash(event.path),
                       event.status_code, event.latency.count(), or_dash(event.backend_address));
}

void Logger::health(const balancer::HealthEvent& event) {
    log(LogLevel::Debug, log_component::Health, "{} {} {}ms",
        event.backend_address, event.alive ? "alive" : "dead", event.latency.count());
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) logger_->flush();
    if (access_logger_) access_logger_->flush();
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace ferry::util
