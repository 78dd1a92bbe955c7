/**
 * FERRY - HTTP Load Balancer
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include "balancer/backend.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace ferry::config {

namespace {

/**
 * Parse a whole-string integer within [min, max]; a leading '-' never wraps
 */
std::int64_t parse_integer(const std::string& value, const std::string& source,
                           std::int64_t min, std::int64_t max) {
    std::int64_t number = 0;
    try {
        std::size_t consumed = 0;
        number = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + source + " value: " + value);
    }
    if (number < min || number > max) {
        throw std::runtime_error("Invalid " + source + " value (out of range): " + value);
    }
    return number;
}

std::uint16_t parse_port(const std::string& value, const std::string& source) {
    return static_cast<std::uint16_t>(
        parse_integer(value, source, 0, std::numeric_limits<std::uint16_t>::max()));
}

std::size_t parse_count(const std::string& value, const std::string& source) {
    return static_cast<std::size_t>(
        parse_integer(value, source, 0, std::numeric_limits<std::int64_t>::max()));
}

std::int64_t parse_millis(const std::string& value, const std::string& source) {
    try {
        std::size_t consumed = 0;
        auto millis = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return millis;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + source + " value: " + value);
    }
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::string trim(const std::string& value) {
    auto start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

/**
 * Match "--name VALUE", "-n VALUE", "--name=VALUE" or "-n=VALUE"; advances i past a separate value
 */
std::optional<std::string> option_value(int argc, char* argv[], int& i,
                                        const std::string& long_name,
                                        const std::string& short_name = {}) {
    std::string arg(argv[i]);
    for (const auto& name : {long_name, short_name}) {
        if (name.empty()) continue;
        if (arg == name) {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + name);
            }
            return std::string(argv[++i]);
        }
        if (arg.starts_with(name + "=")) {
            return arg.substr(name.size() + 1);
        }
    }
    return std::nullopt;
}

/**
 * Read an integer member as int64 and narrow it only after the range check
 */
std::int64_t json_integer(const nlohmann::json& j, const char* key,
                          std::int64_t min, std::int64_t max) {
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw std::runtime_error(std::string("Invalid \"") + key + "\" value: " + value.dump());
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw std::runtime_error(std::string("Invalid \"") + key + "\" value (out of range): " + value.dump());
    }
    auto number = value.get<std::int64_t>();
    if (number < min || number > max) {
        throw std::runtime_error(std::string("Invalid \"") + key + "\" value (out of range): " + value.dump());
    }
    return number;
}

constexpr std::int64_t kMaxPort = std::numeric_limits<std::uint16_t>::max();
constexpr std::int64_t kMaxCount = std::numeric_limits<std::int64_t>::max();

} // namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const ServerSettings& s) {
    j = nlohmann::json{
        {"port", s.port},
        {"threads", s.threads},
        {"bind_address", s.bind_address}
    };
}

void from_json(const nlohmann::json& j, ServerSettings& s) {
    if (j.contains("port")) s.port = static_cast<std::uint16_t>(json_integer(j, "port", 0, kMaxPort));
    if (j.contains("threads")) s.threads = static_cast<std::size_t>(json_integer(j, "threads", 0, kMaxCount));
    if (j.contains("bind_address")) j.at("bind_address").get_to(s.bind_address);
}

void to_json(nlohmann::json& j, const HealthCheckSettings& h) {
    j = nlohmann::json{
        {"interval_ms", h.interval_ms},
        {"timeout_ms", h.timeout_ms},
        {"path", h.path}
    };
}

void from_json(const nlohmann::json& j, HealthCheckSettings& h) {
    if (j.contains("interval_ms")) j.at("interval_ms").get_to(h.interval_ms);
    if (j.contains("timeout_ms")) j.at("timeout_ms").get_to(h.timeout_ms);
    if (j.contains("path")) j.at("path").get_to(h.path);
}

void to_json(nlohmann::json& j, const ProxySettings& p) {
    j = nlohmann::json{
        {"connect_timeout_ms", p.connect_timeout_ms},
        {"request_timeout_ms", p.request_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, ProxySettings& p) {
    if (j.contains("connect_timeout_ms")) j.at("connect_timeout_ms").get_to(p.connect_timeout_ms);
    if (j.contains("request_timeout_ms")) j.at("request_timeout_ms").get_to(p.request_timeout_ms);
}

void to_json(nlohmann::json& j, const MetricsSettings& m) {
    j = nlohmann::json{
        {"enabled", m.enabled},
        {"bind_address", m.bind_address},
        {"port", m.port}
    };
}

void from_json(const nlohmann::json& j, MetricsSettings& m) {
    if (j.contains("enabled")) j.at("enabled").get_to(m.enabled);
    if (j.contains("bind_address")) j.at("bind_address").get_to(m.bind_address);
    if (j.contains("port")) m.port = static_cast<std::uint16_t>(json_integer(j, "port", 0, kMaxPort));
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) {
        l.max_file_size_mb = static_cast<std::size_t>(json_integer(j, "max_file_size_mb", 0, kMaxCount));
    }
    if (j.contains("max_files")) l.max_files = static_cast<std::size_t>(json_integer(j, "max_files", 0, kMaxCount));
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const EventLogSettings& e) {
    j = nlohmann::json{
        {"enabled", e.enabled},
        {"file", e.file}
    };
}

void from_json(const nlohmann::json& j, EventLogSettings& e) {
    if (j.contains("enabled")) j.at("enabled").get_to(e.enabled);
    if (j.contains("file")) j.at("file").get_to(e.file);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"server", c.server},
        {"backends", c.backends},
        {"algorithm", c.algorithm},
        {"health_check", c.health_check},
        {"proxy", c.proxy},
        {"metrics", c.metrics},
        {"logging", c.logging},
        {"event_log", c.event_log}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) j.at("server").get_to(c.server);
    if (j.contains("backends")) j.at("backends").get_to(c.backends);
    if (j.contains("algorithm")) j.at("algorithm").get_to(c.algorithm);
    if (j.contains("health_check")) j.at("health_check").get_to(c.health_check);
    if (j.contains("proxy")) j.at("proxy").get_to(c.proxy);
    if (j.contains("metrics")) j.at("metrics").get_to(c.metrics);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("event_log")) j.at("event_log").get_to(c.event_log);
}

// Config validation
void Config::validate() const {
    // Validate server settings
    if (server.port == 0) {
        throw std::runtime_error("Configuration error: server.port must be non-zero");
    }
    if (server.bind_address.empty()) {
        throw std::runtime_error("Configuration error: server.bind_address cannot be empty");
    }

    // Validate backends
    for (std::size_t i = 0; i < backends.size(); ++i) {
        try {
            balancer::BackendAddress::parse(backends[i]);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("Configuration error: backends[" + std::to_string(i) + "]: " + e.what());
        }
    }

    // Validate health check settings
    if (health_check.interval_ms <= 0) {
        throw std::runtime_error("Configuration error: health_check.interval_ms must be positive");
    }
    if (health_check.timeout_ms <= 0) {
        throw std::runtime_error("Configuration error: health_check.timeout_ms must be positive");
    }
    if (health_check.timeout_ms >= health_check.interval_ms) {
        throw std::runtime_error("Configuration error: health_check.timeout_ms must be less than interval_ms");
    }
    if (health_check.path.empty() || health_check.path.front() != '/') {
        throw std::runtime_error("Configuration error: health_check.path must start with '/'");
    }

    // Validate proxy settings
    if (proxy.connect_timeout_ms <= 0 || proxy.request_timeout_ms <= 0) {
        throw std::runtime_error("Configuration error: proxy timeouts must be positive");
    }

    // Validate metrics settings
    if (metrics.enabled) {
        if (metrics.port == 0) {
            throw std::runtime_error("Configuration error: metrics.port must be non-zero");
        }
        if (metrics.port == server.port) {
            throw std::runtime_error("Configuration error: server.port and metrics.port must be different");
        }
        if (metrics.bind_address.empty()) {
            throw std::runtime_error("Configuration error: metrics.bind_address cannot be empty");
        }
    }

    // Validate logging settings
    if (!util::Logger::parse_level(logging.level)) {
        throw std::runtime_error("Configuration error: unknown logging.level '" + logging.level + "'");
    }

    if (event_log.enabled && event_log.file.empty()) {
        throw std::runtime_error("Configuration error: event_log.file cannot be empty when enabled");
    }

    spdlog::debug("Configuration validated successfully");
}

bool ConfigManager::load(int argc, char* argv[]) {
    // Start with defaults
    config_ = Config{};
    config_path_.clear();

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path_ = argv[++i];
        } else if (arg.starts_with("--config=")) {
            config_path_ = arg.substr(9);
        } else if (arg.starts_with("-c=")) {
            config_path_ = arg.substr(3);
        }
    }

    // Load from config file if specified
    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    // Apply environment variable overrides
    apply_environment_overrides();

    // Apply CLI overrides (highest precedence)
    apply_cli_overrides(argc, argv);

    // Validate final configuration
    config_.validate();

    spdlog::info("Configuration loaded successfully");
    return true;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "FERRY - HTTP Load Balancer\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  -p, --port PORT         Proxy listen port (default: 8000)\n"
              << "  -b, --bind ADDRESS      Bind address (default: 0.0.0.0)\n"
              << "  -t, --threads NUM       Number of I/O threads (default: CPU cores)\n"
              << "  --backend URL           Backend base URL (can be repeated)\n"
              << "  -a, --algorithm NAME    roundrobin, leastconn or random (default: roundrobin)\n"
              << "  --metrics-port PORT     Prometheus metrics port (default: 2112)\n"
              << "  --log-level LEVEL       trace/debug/info/warn/error/critical/off\n"
              << "\n"
              << "Environment Variables:\n"
              << "  FERRY_CONFIG              Path to configuration file\n"
              << "  FERRY_PORT                Proxy listen port\n"
              << "  FERRY_BIND                Bind address\n"
              << "  FERRY_THREADS             Number of I/O threads\n"
              << "  FERRY_BACKENDS            Comma-separated backend URLs\n"
              << "  FERRY_ALGORITHM           Selection algorithm\n"
              << "  FERRY_HEALTH_INTERVAL_MS  Health check interval in milliseconds\n"
              << "  FERRY_HEALTH_TIMEOUT_MS   Health probe timeout in milliseconds\n"
              << "  FERRY_HEALTH_PATH         Health probe path\n"
              << "  FERRY_METRICS_PORT        Prometheus metrics port\n"
              << "  FERRY_LOG_LEVEL           Log level\n"
              << "  FERRY_LOG_FILE            Log file path (stdout if not set)\n"
              << "  FERRY_EVENT_LOG           Event log file (enables the event log)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"server\": {\"bind_address\": \"0.0.0.0\", \"port\": 8000, \"threads\": 4},\n"
              << "    \"backends\": [\"http://localhost:9000\", \"http://localhost:9001\"],\n"
              << "    \"algorithm\": \"roundrobin\",\n"
              << "    \"health_check\": {\"interval_ms\": 5000, \"timeout_ms\": 2000, \"path\": \"/health\"},\n"
              << "    \"proxy\": {\"connect_timeout_ms\": 5000, \"request_timeout_ms\": 30000},\n"
              << "    \"metrics\": {\"enabled\": true, \"bind_address\": \"0.0.0.0\", \"port\": 2112},\n"
              << "    \"logging\": {\"level\": \"info\", \"file\": \"\"},\n"
              << "    \"event_log\": {\"enabled\": false, \"file\": \"ferry_events.log\"}\n"
              << "  }\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        spdlog::debug("Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    // Check for config file path from environment
    if (config_path_.empty()) {
        if (auto env = get_env("FERRY_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    // Server settings
    if (auto env = get_env("FERRY_PORT")) {
        config_.server.port = parse_port(*env, "FERRY_PORT");
        spdlog::debug("Applied FERRY_PORT={}", config_.server.port);
    }

    if (auto env = get_env("FERRY_BIND")) {
        config_.server.bind_address = *env;
        spdlog::debug("Applied FERRY_BIND={}", config_.server.bind_address);
    }

    if (auto env = get_env("FERRY_THREADS")) {
        config_.server.threads = parse_count(*env, "FERRY_THREADS");
        spdlog::debug("Applied FERRY_THREADS={}", config_.server.threads);
    }

    // Backends (comma-separated URLs)
    if (auto env = get_env("FERRY_BACKENDS")) {
        config_.backends.clear();
        std::istringstream stream(*env);
        std::string backend_str;

        while (std::getline(stream, backend_str, ',')) {
            backend_str = trim(backend_str);
            if (backend_str.empty()) continue;
            config_.backends.push_back(backend_str);
        }
        spdlog::debug("Applied FERRY_BACKENDS with {} backends", config_.backends.size());
    }

    if (auto env = get_env("FERRY_ALGORITHM")) {
        config_.algorithm = *env;
        spdlog::debug("Applied FERRY_ALGORITHM={}", config_.algorithm);
    }

    // Health check settings
    if (auto env = get_env("FERRY_HEALTH_INTERVAL_MS")) {
        config_.health_check.interval_ms = parse_millis(*env, "FERRY_HEALTH_INTERVAL_MS");
        spdlog::debug("Applied FERRY_HEALTH_INTERVAL_MS={}", config_.health_check.interval_ms);
    }

    if (auto env = get_env("FERRY_HEALTH_TIMEOUT_MS")) {
        config_.health_check.timeout_ms = parse_millis(*env, "FERRY_HEALTH_TIMEOUT_MS");
        spdlog::debug("Applied FERRY_HEALTH_TIMEOUT_MS={}", config_.health_check.timeout_ms);
    }

    if (auto env = get_env("FERRY_HEALTH_PATH")) {
        config_.health_check.path = *env;
        spdlog::debug("Applied FERRY_HEALTH_PATH={}", config_.health_check.path);
    }

    // Metrics settings
    if (auto env = get_env("FERRY_METRICS_PORT")) {
        config_.metrics.port = parse_port(*env, "FERRY_METRICS_PORT");
        spdlog::debug("Applied FERRY_METRICS_PORT={}", config_.metrics.port);
    }

    // Logging settings
    if (auto env = get_env("FERRY_LOG_LEVEL")) {
        config_.logging.level = *env;
        spdlog::debug("Applied FERRY_LOG_LEVEL={}", config_.logging.level);
    }

    if (auto env = get_env("FERRY_LOG_FILE")) {
        config_.logging.file = *env;
        spdlog::debug("Applied FERRY_LOG_FILE={}", config_.logging.file);
    }

    // Event log: a path enables it, "true" keeps the configured file, empty/"false" disables
    if (auto env = get_env("FERRY_EVENT_LOG")) {
        if (env->empty() || *env == "false" || *env == "0" || *env == "no" || *env == "off") {
            config_.event_log.enabled = false;
        } else {
            config_.event_log.enabled = true;
            if (!parse_bool(*env)) {
                config_.event_log.file = *env;
            }
        }
        spdlog::debug("Applied FERRY_EVENT_LOG={}", *env);
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    bool cli_backends = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        // Skip already processed args
        if (arg == "--help" || arg == "-h") continue;
        if (arg == "--config" || arg == "-c") { ++i; continue; }
        if (arg.starts_with("--config=") || arg.starts_with("-c=")) continue;

        if (auto value = option_value(argc, argv, i, "--port", "-p")) {
            config_.server.port = parse_port(*value, "--port");
        } else if (auto value = option_value(argc, argv, i, "--bind", "-b")) {
            config_.server.bind_address = *value;
        } else if (auto value = option_value(argc, argv, i, "--threads", "-t")) {
            config_.server.threads = parse_count(*value, "--threads");
        } else if (auto value = option_value(argc, argv, i, "--backend")) {
            // Backends given on the command line replace those from file/environment
            if (!cli_backends) {
                config_.backends.clear();
                cli_backends = true;
            }
            config_.backends.push_back(trim(*value));
        } else if (auto value = option_value(argc, argv, i, "--algorithm", "-a")) {
            config_.algorithm = *value;
        } else if (auto value = option_value(argc, argv, i, "--metrics-port")) {
            config_.metrics.port = parse_port(*value, "--metrics-port");
        } else if (auto value = option_value(argc, argv, i, "--log-level")) {
            config_.logging.level = *value;
        } else {
            spdlog::warn("Ignoring unknown argument: {}", arg);
        }
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace ferry::config
