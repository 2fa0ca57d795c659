/**
 * PORTWAY - API Gateway Request Kernel
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (PORTWAY_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 *
 * The file also carries the gateway definition (certificates, backend groups,
 * plugin defaults, routes). That part is hot-reloadable on SIGHUP; process
 * settings (listeners, threads, store) require a restart.
 */

#ifndef PORTWAY_CONFIG_CONFIG_HPP
#define PORTWAY_CONFIG_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace portway::config {

/**
 * Raised for malformed configuration: rejected at load or snapshot-build time
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Backend server configuration
 */
struct BackendConfig {
    std::string host{"localhost"};
    std::uint16_t port{8001};
    std::uint32_t weight{1};
    std::optional<std::uint32_t> timeout_ms;  // Falls back to the route timeout

    bool operator==(const BackendConfig&) const = default;
};

/**
 * Backend group - a named set of backends with a selection policy
 */
struct BackendGroupConfig {
    std::string name;
    std::string policy{"round_robin"};      // round_robin | weighted_random | random
    std::string on_no_healthy{"fail_open"}; // fail_open | fail
    std::uint32_t failure_threshold{3};
    std::uint32_t cooldown_ms{10000};
    bool fail_on_5xx{false};
    std::vector<BackendConfig> backends;
};

/**
 * Certificate entry - one key/cert pair served for a set of host patterns
 */
struct CertificateConfig {
    std::string name;
    std::vector<std::string> hosts;  // exact or leftmost wildcard ("*.example.com")
    std::string cert_file;
    std::string key_file;
    std::string cert_pem;            // Inline alternative to cert_file
    std::string key_pem;             // Inline alternative to key_file
    std::string key_password;
};

/**
 * Plugin instance configuration: a type tag plus free-form options
 */
struct PluginConfig {
    std::string type;
    nlohmann::json options = nlohmann::json::object();
};

/**
 * Header or query predicate
 */
struct ValueMatchConfig {
    std::string name;
    std::string value;
    std::string type{"exact"};  // exact | regex
};

/**
 * Path predicate
 */
struct PathMatchConfig {
    std::string type{"prefix"};  // exact | prefix | regex
    std::string value{"/"};
};

/**
 * Route configuration
 */
struct RouteConfig {
    std::string name;
    std::vector<std::string> hosts;  // empty = any host
    PathMatchConfig path;
    std::string method;              // empty = any method
    std::vector<ValueMatchConfig> headers;
    std::vector<ValueMatchConfig> query;
    std::int32_t priority{0};
    std::vector<PluginConfig> plugins;
    std::string backend_group;
    std::optional<std::uint32_t> timeout_ms;
};

/**
 * Hot-reloadable part of the configuration
 */
struct GatewayDefinition {
    std::vector<CertificateConfig> certificates;
    std::vector<BackendGroupConfig> backend_groups;
    std::vector<PluginConfig> default_plugins;
    std::vector<RouteConfig> routes;
};

/**
 * Listener configuration
 */
struct ListenerSettings {
    std::string name{"http"};
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{8080};
    bool tls{false};
    std::string default_certificate;  // Certificate entry name, used without SNI
};

/**
 * Server configuration
 */
struct ServerSettings {
    std::size_t threads{0};  // 0 = hardware_concurrency
};

/**
 * Upstream timeouts
 */
struct TimeoutSettings {
    std::uint32_t connect_ms{5000};
    std::uint32_t io_ms{30000};       // Per read/write
    std::uint32_t request_ms{5000};   // Overall request deadline unless the route overrides it
};

/**
 * Upstream retry policy
 */
struct RetrySettings {
    std::uint32_t max_retries{1};
    double budget_ratio{0.2};         // Retry tokens earned per request
    double budget_cap{100.0};
};

/**
 * Shared counter store for the distributed rate limiter
 */
struct StoreSettings {
    bool enabled{false};
    std::string host{"127.0.0.1"};
    std::uint16_t port{6379};
    std::string password;
    std::uint32_t timeout_ms{100};
    std::uint32_t reconnect_backoff_ms{1000};
    std::string key_prefix{"portway:rl:"};
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Complete application configuration
 */
struct Config {
    ServerSettings server;
    std::vector<ListenerSettings> listeners{ListenerSettings{}};
    TimeoutSettings timeouts;
    RetrySettings retry;
    StoreSettings rate_limit_store;
    LogSettings logging;
    GatewayDefinition gateway;

    /**
     * Validate process settings and throw ConfigError if invalid.
     * Gateway definition errors are reported by the snapshot builder.
     */
    void validate() const;
};

/**
 * Parse a duration option: integer milliseconds, or a string with a
 * ms/s/m/h suffix ("500ms", "1s", "2m").
 * @throws ConfigError on malformed or non-positive values
 */
std::chrono::milliseconds parse_duration(const nlohmann::json& value);

/**
 * Configuration reload callback type.
 * Throwing rejects the reload and keeps the previous configuration.
 */
using ConfigReloadCallback = std::function<void(const GatewayDefinition&)>;

/**
 * Configuration manager - handles loading, parsing, and hot-reload
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws ConfigError on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    /**
     * Reload configuration from file (called on SIGHUP)
     * Only the gateway definition is applied; other settings require restart.
     */
    void reload();

    /**
     * Register callback for configuration reload events
     */
    void on_reload(ConfigReloadCallback callback);

    /**
     * Get the configuration file path
     */
    std::filesystem::path get_config_path() const;

    /**
     * Print help message to stdout
     */
    static void print_help(const char* program_name);

    /**
     * Parse a configuration document (used by load and by tests)
     * @throws ConfigError on invalid JSON or mistyped fields
     */
    static Config parse(std::string_view text);

private:
    /**
     * Load configuration from JSON file
     */
    static Config load_from_file(const std::filesystem::path& path);

    /**
     * Apply environment variable overrides
     */
    void apply_environment_overrides(Config& config);

    /**
     * Apply command-line argument overrides
     */
    void apply_cli_overrides(int argc, char* argv[]);

    /**
     * Re-apply stored CLI overrides (reload path)
     */
    void reapply_cli_overrides(Config& config) const;

    /**
     * Get environment variable value
     */
    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
    std::vector<ConfigReloadCallback> reload_callbacks_;

    // CLI overrides (stored to preserve precedence on reload)
    std::optional<std::uint16_t> cli_port_;
    std::optional<std::size_t> cli_threads_;
    std::optional<std::string> cli_bind_address_;
};

// JSON serialization support
void from_json(const nlohmann::json& j, BackendConfig& b);
void from_json(const nlohmann::json& j, BackendGroupConfig& g);
void from_json(const nlohmann::json& j, CertificateConfig& c);
void from_json(const nlohmann::json& j, PluginConfig& p);
void from_json(const nlohmann::json& j, ValueMatchConfig& v);
void from_json(const nlohmann::json& j, PathMatchConfig& p);
void from_json(const nlohmann::json& j, RouteConfig& r);
void from_json(const nlohmann::json& j, GatewayDefinition& g);
void from_json(const nlohmann::json& j, ListenerSettings& l);
void from_json(const nlohmann::json& j, ServerSettings& s);
void from_json(const nlohmann::json& j, TimeoutSettings& t);
void from_json(const nlohmann::json& j, RetrySettings& r);
void from_json(const nlohmann::json& j, StoreSettings& s);
void from_json(const nlohmann::json& j, LogSettings& l);
void from_json(const nlohmann::json& j, Config& c);

} // namespace portway::config

#endif // PORTWAY_CONFIG_CONFIG_HPP
