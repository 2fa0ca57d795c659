/**
 * PORTWAY - API Gateway Request Kernel
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace portway::config {

namespace {

template <typename T>
T parse_number(std::string_view text, const std::string& what) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        throw ConfigError("Invalid " + what + " value: " + std::string(text));
    }
    return value;
}

template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = j.at(key).get<T>();
    }
}

} // anonymous namespace

// JSON serialization implementations
void from_json(const nlohmann::json& j, BackendConfig& b) {
    if (j.contains("host")) j.at("host").get_to(b.host);
    if (j.contains("port")) j.at("port").get_to(b.port);
    if (j.contains("weight")) j.at("weight").get_to(b.weight);
    get_optional(j, "timeout_ms", b.timeout_ms);
}

void from_json(const nlohmann::json& j, BackendGroupConfig& g) {
    if (j.contains("name")) j.at("name").get_to(g.name);
    if (j.contains("policy")) j.at("policy").get_to(g.policy);
    if (j.contains("on_no_healthy")) j.at("on_no_healthy").get_to(g.on_no_healthy);
    if (j.contains("failure_threshold")) j.at("failure_threshold").get_to(g.failure_threshold);
    if (j.contains("cooldown_ms")) j.at("cooldown_ms").get_to(g.cooldown_ms);
    if (j.contains("fail_on_5xx")) j.at("fail_on_5xx").get_to(g.fail_on_5xx);
    if (j.contains("backends")) j.at("backends").get_to(g.backends);
}

void from_json(const nlohmann::json& j, CertificateConfig& c) {
    if (j.contains("name")) j.at("name").get_to(c.name);
    if (j.contains("hosts")) j.at("hosts").get_to(c.hosts);
    if (j.contains("cert_file")) j.at("cert_file").get_to(c.cert_file);
    if (j.contains("key_file")) j.at("key_file").get_to(c.key_file);
    if (j.contains("cert_pem")) j.at("cert_pem").get_to(c.cert_pem);
    if (j.contains("key_pem")) j.at("key_pem").get_to(c.key_pem);
    if (j.contains("key_password")) j.at("key_password").get_to(c.key_password);
}

void from_json(const nlohmann::json& j, PluginConfig& p) {
    if (j.contains("type")) j.at("type").get_to(p.type);
    if (j.contains("options")) p.options = j.at("options");
}

void from_json(const nlohmann::json& j, ValueMatchConfig& v) {
    if (j.contains("name")) j.at("name").get_to(v.name);
    if (j.contains("value")) j.at("value").get_to(v.value);
    if (j.contains("type")) j.at("type").get_to(v.type);
}

void from_json(const nlohmann::json& j, PathMatchConfig& p) {
    if (j.contains("type")) j.at("type").get_to(p.type);
    if (j.contains("value")) j.at("value").get_to(p.value);
}

void from_json(const nlohmann::json& j, RouteConfig& r) {
    if (j.contains("name")) j.at("name").get_to(r.name);
    if (j.contains("hosts")) j.at("hosts").get_to(r.hosts);
    if (j.contains("path")) j.at("path").get_to(r.path);
    if (j.contains("method")) j.at("method").get_to(r.method);
    if (j.contains("headers")) j.at("headers").get_to(r.headers);
    if (j.contains("query")) j.at("query").get_to(r.query);
    if (j.contains("priority")) j.at("priority").get_to(r.priority);
    if (j.contains("plugins")) j.at("plugins").get_to(r.plugins);
    if (j.contains("backend_group")) j.at("backend_group").get_to(r.backend_group);
    get_optional(j, "timeout_ms", r.timeout_ms);
}

void from_json(const nlohmann::json& j, GatewayDefinition& g) {
    if (j.contains("certificates")) j.at("certificates").get_to(g.certificates);
    if (j.contains("backend_groups")) j.at("backend_groups").get_to(g.backend_groups);
    if (j.contains("default_plugins")) j.at("default_plugins").get_to(g.default_plugins);
    if (j.contains("routes")) j.at("routes").get_to(g.routes);
}

void from_json(const nlohmann::json& j, ListenerSettings& l) {
    if (j.contains("name")) j.at("name").get_to(l.name);
    if (j.contains("bind_address")) j.at("bind_address").get_to(l.bind_address);
    if (j.contains("port")) j.at("port").get_to(l.port);
    if (j.contains("tls")) j.at("tls").get_to(l.tls);
    if (j.contains("default_certificate")) j.at("default_certificate").get_to(l.default_certificate);
}

void from_json(const nlohmann::json& j, ServerSettings& s) {
    if (j.contains("threads")) j.at("threads").get_to(s.threads);
}

void from_json(const nlohmann::json& j, TimeoutSettings& t) {
    if (j.contains("connect_ms")) j.at("connect_ms").get_to(t.connect_ms);
    if (j.contains("io_ms")) j.at("io_ms").get_to(t.io_ms);
    if (j.contains("request_ms")) j.at("request_ms").get_to(t.request_ms);
}

void from_json(const nlohmann::json& j, RetrySettings& r) {
    if (j.contains("max_retries")) j.at("max_retries").get_to(r.max_retries);
    if (j.contains("budget_ratio")) j.at("budget_ratio").get_to(r.budget_ratio);
    if (j.contains("budget_cap")) j.at("budget_cap").get_to(r.budget_cap);
}

void from_json(const nlohmann::json& j, StoreSettings& s) {
    if (j.contains("enabled")) j.at("enabled").get_to(s.enabled);
    if (j.contains("host")) j.at("host").get_to(s.host);
    if (j.contains("port")) j.at("port").get_to(s.port);
    if (j.contains("password")) j.at("password").get_to(s.password);
    if (j.contains("timeout_ms")) j.at("timeout_ms").get_to(s.timeout_ms);
    if (j.contains("reconnect_backoff_ms")) j.at("reconnect_backoff_ms").get_to(s.reconnect_backoff_ms);
    if (j.contains("key_prefix")) j.at("key_prefix").get_to(s.key_prefix);
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) j.at("server").get_to(c.server);
    if (j.contains("listeners")) j.at("listeners").get_to(c.listeners);
    if (j.contains("timeouts")) j.at("timeouts").get_to(c.timeouts);
    if (j.contains("retry")) j.at("retry").get_to(c.retry);
    if (j.contains("rate_limit_store")) j.at("rate_limit_store").get_to(c.rate_limit_store);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    from_json(j, c.gateway);
}

std::chrono::milliseconds parse_duration(const nlohmann::json& value) {
    std::int64_t ms = 0;

    if (value.is_number_integer()) {
        ms = value.get<std::int64_t>();
    } else if (value.is_string()) {
        const auto text = value.get<std::string>();
        auto unit_pos = text.find_first_not_of("0123456789");
        if (unit_pos == 0) {
            throw ConfigError("Invalid duration: " + text);
        }
        auto count = parse_number<std::int64_t>(
            std::string_view(text).substr(0, unit_pos), "duration");
        std::string unit = unit_pos == std::string::npos ? "ms" : text.substr(unit_pos);

        if (unit == "ms") {
            ms = count;
        } else if (unit == "s") {
            ms = count * 1000;
        } else if (unit == "m") {
            ms = count * 60 * 1000;
        } else if (unit == "h") {
            ms = count * 60 * 60 * 1000;
        } else {
            throw ConfigError("Invalid duration unit '" + unit + "' in: " + text);
        }
    } else {
        throw ConfigError("Duration must be an integer (ms) or a string such as \"1s\"");
    }

    if (ms <= 0) {
        throw ConfigError("Duration must be positive");
    }
    return std::chrono::milliseconds(ms);
}

// Config validation
void Config::validate() const {
    if (listeners.empty()) {
        throw ConfigError("Configuration error: at least one listener is required");
    }

    std::set<std::string> names;
    std::set<std::pair<std::string, std::uint16_t>> endpoints;
    for (std::size_t i = 0; i < listeners.size(); ++i) {
        const auto& listener = listeners[i];
        const auto where = "listeners[" + std::to_string(i) + "]";
        if (listener.port == 0) {
            throw ConfigError("Configuration error: " + where + ".port must be non-zero");
        }
        if (listener.bind_address.empty()) {
            throw ConfigError("Configuration error: " + where + ".bind_address cannot be empty");
        }
        if (!names.insert(listener.name).second) {
            throw ConfigError("Configuration error: duplicate listener name '" + listener.name + "'");
        }
        if (!endpoints.emplace(listener.bind_address, listener.port).second) {
            throw ConfigError("Configuration error: " + where + " reuses " +
                              listener.bind_address + ":" + std::to_string(listener.port));
        }
    }

    if (timeouts.connect_ms == 0 || timeouts.io_ms == 0 || timeouts.request_ms == 0) {
        throw ConfigError("Configuration error: timeouts must be non-zero");
    }

    if (retry.budget_ratio < 0.0 || retry.budget_cap < 1.0) {
        throw ConfigError("Configuration error: retry.budget_ratio must be >= 0 and retry.budget_cap >= 1");
    }

    if (rate_limit_store.enabled) {
        if (rate_limit_store.host.empty()) {
            throw ConfigError("Configuration error: rate_limit_store.host cannot be empty");
        }
        if (rate_limit_store.port == 0) {
            throw ConfigError("Configuration error: rate_limit_store.port must be non-zero");
        }
        if (rate_limit_store.timeout_ms == 0) {
            throw ConfigError("Configuration error: rate_limit_store.timeout_ms must be non-zero");
        }
    }

    spdlog::debug("Configuration validated successfully");
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[]) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    // Start with defaults
    config_ = Config{};

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

    if (config_path_.empty()) {
        if (auto env = get_env("PORTWAY_CONFIG")) {
            config_path_ = *env;
        }
    }

    // Load from config file if specified
    if (!config_path_.empty()) {
        config_ = load_from_file(config_path_);
    }

    // Apply environment variable overrides
    apply_environment_overrides(config_);

    // Apply CLI overrides (highest precedence)
    apply_cli_overrides(argc, argv);

    // Validate final configuration
    config_.validate();

    spdlog::info("Configuration loaded successfully");
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ConfigManager::reload() {
    std::lock_guard<std::mutex> lock(config_mutex_);

    if (config_path_.empty()) {
        spdlog::warn("No configuration file specified, reload skipped");
        return;
    }

    spdlog::info("Reloading configuration from {}", config_path_.string());

    try {
        Config fresh = load_from_file(config_path_);
        apply_environment_overrides(fresh);
        reapply_cli_overrides(fresh);
        fresh.validate();

        // Callbacks build the new snapshot; a throw keeps the old one serving
        for (const auto& callback : reload_callbacks_) {
            callback(fresh.gateway);
        }

        // Only the gateway definition is live-reloadable
        config_.gateway = std::move(fresh.gateway);
        spdlog::info("Configuration reloaded: {} routes, {} certificates, {} backend groups",
                     config_.gateway.routes.size(),
                     config_.gateway.certificates.size(),
                     config_.gateway.backend_groups.size());

    } catch (const std::exception& e) {
        spdlog::error("Configuration reload failed, keeping previous configuration: {}", e.what());
    }
}

void ConfigManager::on_reload(ConfigReloadCallback callback) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    reload_callbacks_.push_back(std::move(callback));
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "PORTWAY - API Gateway Request Kernel\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  -p, --port PORT         Port of the first listener (default: 8080)\n"
              << "  -t, --threads NUM       Number of I/O threads (default: CPU cores)\n"
              << "  -b, --bind ADDRESS      Bind address for all listeners (default: 0.0.0.0)\n"
              << "\n"
              << "Environment Variables:\n"
              << "  PORTWAY_CONFIG          Path to configuration file\n"
              << "  PORTWAY_PORT            Port of the first listener\n"
              << "  PORTWAY_THREADS         Number of I/O threads\n"
              << "  PORTWAY_BIND            Bind address for all listeners\n"
              << "  PORTWAY_STORE_HOST      Rate-limit store host (enables the store)\n"
              << "  PORTWAY_STORE_PORT      Rate-limit store port\n"
              << "  PORTWAY_STORE_PASSWORD  Rate-limit store password\n"
              << "  PORTWAY_LOG_LEVEL       Log level (trace/debug/info/warn/error/critical/off)\n"
              << "  PORTWAY_LOG_FILE        Log file path (stdout if not set)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"server\": {\"threads\": 4},\n"
              << "    \"listeners\": [\n"
              << "      {\"name\": \"https\", \"port\": 8443, \"tls\": true, \"default_certificate\": \"main\"}\n"
              << "    ],\n"
              << "    \"timeouts\": {\"connect_ms\": 5000, \"io_ms\": 30000, \"request_ms\": 5000},\n"
              << "    \"retry\": {\"max_retries\": 1, \"budget_ratio\": 0.2},\n"
              << "    \"rate_limit_store\": {\"enabled\": true, \"host\": \"127.0.0.1\", \"port\": 6379},\n"
              << "    \"certificates\": [\n"
              << "      {\"name\": \"main\", \"hosts\": [\"*.example.com\"],\n"
              << "       \"cert_file\": \"server.crt\", \"key_file\": \"server.key\"}\n"
              << "    ],\n"
              << "    \"backend_groups\": [\n"
              << "      {\"name\": \"api\", \"policy\": \"round_robin\",\n"
              << "       \"backends\": [{\"host\": \"10.0.0.1\", \"port\": 8001, \"weight\": 1}]}\n"
              << "    ],\n"
              << "    \"routes\": [\n"
              << "      {\"name\": \"api\", \"hosts\": [\"api.example.com\"],\n"
              << "       \"path\": {\"type\": \"prefix\", \"value\": \"/v1\"},\n"
              << "       \"plugins\": [{\"type\": \"rate-limit\",\n"
              << "                    \"options\": {\"limit\": 100, \"window\": \"1s\"}}],\n"
              << "       \"backend_group\": \"api\"}\n"
              << "    ]\n"
              << "  }\n"
              << "\n"
              << "Send SIGHUP to reload routes, certificates and backend groups without restart.\n";
}

Config ConfigManager::parse(std::string_view text) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        return j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid JSON configuration: " + std::string(e.what()));
    }
}

Config ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    std::stringstream contents;
    contents << file.rdbuf();
    auto config = parse(contents.str());
    spdlog::debug("Loaded configuration from {}", path.string());
    return config;
}

void ConfigManager::apply_environment_overrides(Config& config) {
    if (auto env = get_env("PORTWAY_PORT")) {
        if (config.listeners.empty()) {
            config.listeners.emplace_back();
        }
        config.listeners.front().port = parse_number<std::uint16_t>(*env, "PORTWAY_PORT");
        spdlog::debug("Applied PORTWAY_PORT={}", config.listeners.front().port);
    }

    if (auto env = get_env("PORTWAY_THREADS")) {
        config.server.threads = parse_number<std::size_t>(*env, "PORTWAY_THREADS");
        spdlog::debug("Applied PORTWAY_THREADS={}", config.server.threads);
    }

    if (auto env = get_env("PORTWAY_BIND")) {
        for (auto& listener : config.listeners) {
            listener.bind_address = *env;
        }
        spdlog::debug("Applied PORTWAY_BIND={}", *env);
    }

    // Rate-limit store
    if (auto env = get_env("PORTWAY_STORE_HOST")) {
        config.rate_limit_store.host = *env;
        config.rate_limit_store.enabled = true;
        spdlog::debug("Applied PORTWAY_STORE_HOST={}", *env);
    }

    if (auto env = get_env("PORTWAY_STORE_PORT")) {
        config.rate_limit_store.port = parse_number<std::uint16_t>(*env, "PORTWAY_STORE_PORT");
        spdlog::debug("Applied PORTWAY_STORE_PORT={}", config.rate_limit_store.port);
    }

    if (auto env = get_env("PORTWAY_STORE_PASSWORD")) {
        config.rate_limit_store.password = *env;
        spdlog::debug("Applied PORTWAY_STORE_PASSWORD");
    }

    // Logging settings
    if (auto env = get_env("PORTWAY_LOG_LEVEL")) {
        config.logging.level = *env;
        spdlog::debug("Applied PORTWAY_LOG_LEVEL={}", config.logging.level);
    }

    if (auto env = get_env("PORTWAY_LOG_FILE")) {
        config.logging.file = *env;
        spdlog::debug("Applied PORTWAY_LOG_FILE={}", config.logging.file);
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        // Skip already processed args
        if (arg == "--help" || arg == "-h") continue;
        if (arg == "--config" || arg == "-c") { ++i; continue; }
        if (arg.starts_with("--config=") || arg.starts_with("-c=")) continue;

        // Port
        if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            cli_port_ = parse_number<std::uint16_t>(argv[++i], "--port");
        } else if (arg.starts_with("--port=")) {
            cli_port_ = parse_number<std::uint16_t>(arg.substr(7), "--port");
        }

        // Threads
        else if ((arg == "--threads" || arg == "-t") && i + 1 < argc) {
            cli_threads_ = parse_number<std::size_t>(argv[++i], "--threads");
        } else if (arg.starts_with("--threads=")) {
            cli_threads_ = parse_number<std::size_t>(arg.substr(10), "--threads");
        }

        // Bind address
        else if ((arg == "--bind" || arg == "-b") && i + 1 < argc) {
            cli_bind_address_ = argv[++i];
        } else if (arg.starts_with("--bind=")) {
            cli_bind_address_ = arg.substr(7);
        }

        // Unknown argument (not an error, might be handled elsewhere)
    }

    reapply_cli_overrides(config_);
}

void ConfigManager::reapply_cli_overrides(Config& config) const {
    if (cli_port_) {
        if (config.listeners.empty()) {
            config.listeners.emplace_back();
        }
        config.listeners.front().port = *cli_port_;
    }
    if (cli_threads_) {
        config.server.threads = *cli_threads_;
    }
    if (cli_bind_address_) {
        for (auto& listener : config.listeners) {
            listener.bind_address = *cli_bind_address_;
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

} // namespace portway::config
