/**
 * FERRY - HTTP Load Balancer
 * Configuration - JSON file, FERRY_* environment and command line
 */

#ifndef FERRY_CONFIG_CONFIG_HPP
#define FERRY_CONFIG_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::config {

/**
 * Proxy listener configuration
 */
struct ServerSettings {
    std::uint16_t port{8000};
    std::size_t threads{0};  // 0: one per hardware thread
    std::string bind_address{"0.0.0.0"};
};

/**
 * Health probe configuration
 */
struct HealthCheckSettings {
    std::int64_t interval_ms{5000};
    std::int64_t timeout_ms{2000};
    std::string path{"/health"};
};

/**
 * Backend forwarding configuration
 */
struct ProxySettings {
    std::int64_t connect_timeout_ms{5000};
    std::int64_t request_timeout_ms{30000};
};

/**
 * Prometheus endpoint configuration
 */
struct MetricsSettings {
    bool enabled{true};
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{2112};
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;  // Empty = console only
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Persistent request/health event log
 */
struct EventLogSettings {
    bool enabled{false};
    std::string file{"ferry_events.log"};
};

/**
 * Everything the balancer reads at startup
 */
struct Config {
    ServerSettings server;
    std::vector<std::string> backends;  // Backend base URLs, in pool order
    std::string algorithm{"roundrobin"};
    HealthCheckSettings health_check;
    ProxySettings proxy;
    MetricsSettings metrics;
    LogSettings logging;
    EventLogSettings event_log;

    /**
     * @throws std::runtime_error naming the first offending field
     */
    void validate() const;
};

/**
 * ConfigManager - builds the Config once at startup
 *
 * Layers, lowest first: defaults, JSON file (-c or FERRY_CONFIG),
 * FERRY_* environment, command line. The result is validated before
 * load() returns; the backend list is fixed from then on.
 */
class ConfigManager {
public:
    /**
     * @return false if --help was printed and the process should exit
     * @throws std::runtime_error for unreadable files, bad values or a
     *         configuration that fails Config::validate()
     */
    bool load(int argc, char* argv[]);

    const Config& get_config() const noexcept { return config_; }

    /**
     * The file that was loaded, or empty
     */
    const std::filesystem::path& get_config_path() const noexcept { return config_path_; }

    static void print_help(const char* program_name);

private:
    void load_from_file(const std::filesystem::path& path);
    void apply_environment_overrides();
    void apply_cli_overrides(int argc, char* argv[]);

    static std::optional<std::string> get_env(const std::string& name);

    Config config_;
    std::filesystem::path config_path_;
};

// nlohmann::json conversions; absent keys keep their defaults
void to_json(nlohmann::json& j, const ServerSettings& s);
void from_json(const nlohmann::json& j, ServerSettings& s);
void to_json(nlohmann::json& j, const HealthCheckSettings& h);
void from_json(const nlohmann::json& j, HealthCheckSettings& h);
void to_json(nlohmann::json& j, const ProxySettings& p);
void from_json(const nlohmann::json& j, ProxySettings& p);
void to_json(nlohmann::json& j, const MetricsSettings& m);
void from_json(const nlohmann::json& j, MetricsSettings& m);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const EventLogSettings& e);
void from_json(const nlohmann::json& j, EventLogSettings& e);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace ferry::config

#endif // FERRY_CONFIG_CONFIG_HPP
