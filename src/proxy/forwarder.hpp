/**
 * PORTWAY - API Gateway Request Kernel
 * Request Forwarder - asynchronous upstream exchange with retries
 */

#ifndef PORTWAY_PROXY_FORWARDER_HPP
#define PORTWAY_PROXY_FORWARDER_HPP

#include "config/config.hpp"
#include "pipeline/executor.hpp"
#include "pipeline/request_context.hpp"
#include "proxy/retry_budget.hpp"
#include "server/http_message.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace portway::proxy {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

/**
 * Configuration for request forwarding
 */
struct ForwarderConfig {
    std::chrono::milliseconds connect_timeout{5000};  // Timeout for establishing connection
    std::chrono::milliseconds io_timeout{30000};      // Timeout for each write and read
    std::size_t max_retries{1};                       // Extra attempts after the first
    std::uint64_t body_limit{64 * 1024 * 1024};       // Largest upstream response body
};

/**
 * Request Forwarder - sends a request to a backend of the matched route's
 * group and delivers the response (or an error) to the pipeline.
 *
 * Features:
 * - Adds proxy headers (X-Forwarded-For, X-Real-IP, X-Forwarded-Host,
 *   X-Forwarded-Proto, X-Request-ID) and strips hop-by-hop headers
 * - Independent connect, per-operation and overall deadlines; the attempt
 *   deadline is the earlier of the request deadline and the backend timeout
 * - Passive health reports to the load balancer
 * - Retries on another backend: connect failures always, other failures
 *   only for idempotent methods, never past the request deadline, never
 *   for upgrades, and only while the retry budget has tokens
 * - Client cancellation closes the upstream socket immediately
 * - 101 Switching Protocols hands the upstream stream back for tunnelling
 */
class Forwarder : public std::enable_shared_from_this<Forwarder> {
public:
    using Ptr = std::shared_ptr<Forwarder>;

    Forwarder(asio::io_context& io_context,
              const ForwarderConfig& config,
              std::shared_ptr<RetryBudget> budget);

    // Non-copyable
    Forwarder(const Forwarder&) = delete;
    Forwarder& operator=(const Forwarder&) = delete;

    /**
     * Forward ctx's request. done is called exactly once.
     * Matches pipeline::UpstreamCall.
     */
    void forward(const std::shared_ptr<pipeline::RequestContext>& ctx,
                 pipeline::UpstreamCallback done);

    /**
     * Build the backend request with proxy headers
     */
    static http::request<http::string_body> build_backend_request(
        const pipeline::RequestContext& ctx,
        const config::BackendConfig& backend);

    /**
     * Prepare a backend response for the client
     */
    static void prepare_client_response(http::response<http::string_body>& response);

    /**
     * True for an HTTP/1.1 "Connection: upgrade" request with an Upgrade header
     */
    static bool is_upgrade_request(const http::request<http::string_body>& request);

    static bool is_idempotent(http::verb method);

    /**
     * Generate a unique request ID
     */
    static std::string generate_request_id();

    const ForwarderConfig& config() const { return config_; }

private:
    class Exchange;

    asio::io_context& io_context_;
    ForwarderConfig config_;
    std::shared_ptr<RetryBudget> budget_;
};

} // namespace portway::proxy

#endif // PORTWAY_PROXY_FORWARDER_HPP
