/**
 * PORTWAY - API Gateway Request Kernel
 * Request errors - per-request failure kinds and their HTTP mapping
 */

#ifndef PORTWAY_PIPELINE_ERROR_HPP
#define PORTWAY_PIPELINE_ERROR_HPP

#include "server/http_message.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace portway::pipeline {

enum class ErrorKind {
    no_route,                        // 404
    upstream,                        // 502
    upstream_timeout,                // 504
    no_healthy_backend,              // 503
    rate_limit_exceeded,             // 429
    rate_limit_backend_unavailable,  // 503
    plugin,                          // status hint or 500
    cancelled                        // client went away; response is discarded
};

std::string_view to_string(ErrorKind kind);

/**
 * A per-request error. Never thrown; converted into a response.
 */
struct Error {
    ErrorKind kind{ErrorKind::plugin};
    std::string message;
    std::optional<unsigned> status_hint;
    std::optional<std::chrono::milliseconds> retry_after;

    /**
     * HTTP status for this error
     */
    unsigned status() const;
};

/**
 * Well-formed JSON response for an error, with Retry-After when known
 */
server::HttpResponse error_response(const Error& error, unsigned version);

} // namespace portway::pipeline

#endif // PORTWAY_PIPELINE_ERROR_HPP
