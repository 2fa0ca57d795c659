/**
 * PORTWAY - API Gateway Request Kernel
 * Logger - Structured logging with spdlog
 *
 * Provides:
 * - Process-wide sinks (console and/or rotating file) for the default logger
 * - Access log: request id, client, method, path, route, status, latency,
 *   backend and rate-limit outcome
 * - Configurable log level via config/environment
 */

#ifndef PORTWAY_UTIL_LOGGER_HPP
#define PORTWAY_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace portway::util {

/**
 * Log level enumeration
 */
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
 * Logging configuration
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for stdout only
    std::size_t max_file_size_mb{100}; // Max size before rotation
    std::size_t max_files{5};          // Number of rotated files to keep
    bool enable_console{true};         // Log to stdout
    bool enable_colors{true};          // Colored console output
};

/**
 * Access log entry for one gateway request
 */
struct AccessLogEntry {
    std::string request_id;
    std::string client_ip;
    std::string listener;
    std::string method;
    std::string path;
    std::string route;          // Empty when no route matched
    unsigned status_code{0};
    std::size_t response_size{0};
    std::chrono::milliseconds latency{0};
    std::string backend;        // "host:port" of the last attempt
    std::string ratelimit;      // admit | deny | backend_unavailable
    std::string error;          // Error kind, if the request failed
};

/**
 * Logger class - owns the process-wide spdlog loggers
 *
 * Components log through the spdlog default logger, which this class
 * configures. Access entries go to a dedicated "access" logger that
 * shares the sinks.
 *
 * Note: Destructor is public to allow std::unique_ptr to clean up the singleton.
 * The singleton pattern is maintained by keeping the constructor private.
 */
class Logger {
public:
    /**
     * Initialize the logger with configuration
     * Must be called before any logging occurs
     */
    static void init(const LogConfig& config);

    /**
     * Get the logger instance (creates default if not initialized)
     */
    static Logger& instance();

    ~Logger();

    /**
     * Set the global log level
     */
    void set_level(LogLevel level);

    /**
     * Get the current log level
     */
    LogLevel get_level() const;

    /**
     * Parse log level from string (case-insensitive)
     * Valid values: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    /**
     * Convert log level to string
     */
    static std::string_view level_to_string(LogLevel level);

    /**
     * Format an access entry as one line
     */
    static std::string format_access(const AccessLogEntry& entry);

    /**
     * Log an HTTP access entry (dedicated access log format)
     */
    void access(const AccessLogEntry& entry);

    /**
     * Shutdown and flush all logs
     */
    void shutdown();

private:
    Logger() = default;

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> access_logger_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

} // namespace portway::util

#endif // PORTWAY_UTIL_LOGGER_HPP
