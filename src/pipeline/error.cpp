/**
 * PORTWAY - API Gateway Request Kernel
 * Request errors implementation
 */

#include "pipeline/error.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace portway::pipeline {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::no_route: return "no_route";
        case ErrorKind::upstream: return "upstream_error";
        case ErrorKind::upstream_timeout: return "upstream_timeout";
        case ErrorKind::no_healthy_backend: return "no_healthy_backend";
        case ErrorKind::rate_limit_exceeded: return "rate_limit_exceeded";
        case ErrorKind::rate_limit_backend_unavailable: return "rate_limit_backend_unavailable";
        case ErrorKind::plugin: return "plugin_error";
        case ErrorKind::cancelled: return "cancelled";
    }
    return "unknown";
}

unsigned Error::status() const {
    switch (kind) {
        case ErrorKind::no_route: return 404;
        case ErrorKind::upstream: return 502;
        case ErrorKind::upstream_timeout: return 504;
        case ErrorKind::no_healthy_backend: return 503;
        case ErrorKind::rate_limit_exceeded: return 429;
        case ErrorKind::rate_limit_backend_unavailable: return 503;
        case ErrorKind::cancelled: return 499;
        case ErrorKind::plugin: break;
    }
    if (status_hint && *status_hint >= 400 && *status_hint <= 599) {
        return *status_hint;
    }
    return 500;
}

server::HttpResponse error_response(const Error& error, unsigned version) {
    nlohmann::json body = {
        {"error", std::string(to_string(error.kind))},
        {"message", error.message}
    };

    server::HttpResponse response = server::make_response(
        static_cast<server::http::status>(error.status()), version, body.dump(), "application/json");

    if (error.retry_after) {
        // Whole seconds, rounded up
        const auto seconds = (error.retry_after->count() + 999) / 1000;
        response.message.set(server::http::field::retry_after, std::to_string(std::max<long long>(seconds, 1)));
    }
    return response;
}

} // namespace portway::pipeline
