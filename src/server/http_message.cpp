/**
 * PORTWAY - API Gateway Request Kernel
 * HTTP message helpers
 */

#include "server/http_message.hpp"

#include <nlohmann/json.hpp>

namespace portway::server {

HttpResponse make_response(http::status status, unsigned version,
                           std::string body, std::string_view content_type) {
    HttpResponse response;
    response.message = http::response<http::string_body>{status, version};
    response.message.set(http::field::server, server_name);
    response.message.set(http::field::content_type, content_type);
    response.message.body() = std::move(body);
    response.message.prepare_payload();
    return response;
}

HttpResponse make_error_response(http::status status, unsigned version, std::string_view message) {
    nlohmann::json body = {{"error", std::string(message)}};
    return make_response(status, version, body.dump(), "application/json");
}

} // namespace portway::server
