/**
 * PORTWAY - API Gateway Request Kernel
 * HTTP messages exchanged between listeners and the gateway
 */

#ifndef PORTWAY_SERVER_HTTP_MESSAGE_HPP
#define PORTWAY_SERVER_HTTP_MESSAGE_HPP

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace portway::server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

inline constexpr std::string_view server_name = "Portway/0.1.0";

/**
 * Parsed HTTP request plus connection information
 */
struct HttpRequest {
    http::request<http::string_body> message;

    // Client connection info
    std::string client_ip;
    std::uint16_t client_port{0};

    // Listener info
    std::string listener;
    bool tls{false};
    std::string sni;  // Server name from the TLS handshake, if any
};

/**
 * Upstream connection handed back after a 101 Switching Protocols.
 * leftover holds bytes the upstream sent after the response head.
 */
struct UpgradedStream {
    beast::tcp_stream stream;
    std::string leftover;
};

/**
 * HTTP response structure
 */
struct HttpResponse {
    http::response<http::string_body> message;

    // Set when the upstream switched protocols; the session relays raw bytes afterwards
    std::shared_ptr<UpgradedStream> upgraded;
};

/**
 * Completion callback: invoked exactly once, from any thread
 */
using ResponseCallback = std::function<void(HttpResponse)>;

/**
 * Cancels an in-flight request (client went away). Safe to call more than once.
 */
using CancelHandle = std::function<void()>;

/**
 * Request handler: starts processing and returns immediately
 */
using RequestHandler = std::function<CancelHandle(HttpRequest, ResponseCallback)>;

/**
 * Build a response with the gateway's Server header
 */
HttpResponse make_response(http::status status, unsigned version,
                           std::string body, std::string_view content_type = "text/plain");

/**
 * JSON error response: {"error": message}
 */
HttpResponse make_error_response(http::status status, unsigned version, std::string_view message);

} // namespace portway::server

#endif // PORTWAY_SERVER_HTTP_MESSAGE_HPP
