/**
 * PORTWAY - API Gateway Request Kernel
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <fmt/format.h>

#include <cctype>
#include <vector>

namespace portway::util {

// Static members
std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

void Logger::init(const LogConfig& config) {
    std::call_once(init_flag_, [&config]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
    });
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(LogConfig{});
    });
    return *instance_;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (config.enable_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.enable_colors) {
            console_sink->set_color_mode(spdlog::color_mode::never);
        }
        // Format: [timestamp] [level] message
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    // File sink with rotation
    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files);
        // Format: timestamp level message (no colors in file)
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }

    // Create main logger
    logger_ = std::make_shared<spdlog::logger>("portway", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog_level(config.level));
    logger_->flush_on(spdlog::level::warn);

    // Access logger shares the sinks
    access_logger_ = std::make_shared<spdlog::logger>("access", sinks.begin(), sinks.end());
    access_logger_->set_level(spdlog::level::info); // Access logs always at INFO
    access_logger_->flush_on(spdlog::level::info);

    current_level_.store(config.level, std::memory_order_relaxed);

    // Components log through the default logger
    spdlog::set_default_logger(logger_);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
    current_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return current_level_.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(std::string_view level_str) {
    std::string lower;
    lower.reserve(level_str.size());
    for (char c : level_str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error" || lower == "err") return LogLevel::Error;
    if (lower == "critical" || lower == "crit" || lower == "fatal") return LogLevel::Critical;
    if (lower == "off" || lower == "none") return LogLevel::Off;

    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warn:     return "warn";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
        default:                 return "unknown";
    }
}

std::string Logger::format_access(const AccessLogEntry& entry) {
    // Format: request_id client_ip listener "METHOD /path" status size latency route backend ratelimit error
    // Example: 9f2c... 192.168.1.1 https "GET /api/users" 200 512 12ms users 10.0.0.5:8001 admit -
    auto or_dash = [](const std::string& value) -> std::string_view {
        return value.empty() ? std::string_view("-") : std::string_view(value);
    };

    return fmt::format(
        R"({} {} {} "{} {}" {} {} {}ms {} {} {} {})",
        or_dash(entry.request_id),
        or_dash(entry.client_ip),
        or_dash(entry.listener),
        entry.method,
        entry.path,
        entry.status_code,
        entry.response_size,
        entry.latency.count(),
        or_dash(entry.route),
        or_dash(entry.backend),
        or_dash(entry.ratelimit),
        or_dash(entry.error)
    );
}

void Logger::access(const AccessLogEntry& entry) {
    if (!access_logger_) return;
    access_logger_->info(format_access(entry));
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
    if (access_logger_) {
        access_logger_->flush();
    }
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
        default:                 return spdlog::level::info;
    }
}

} // namespace portway::util
