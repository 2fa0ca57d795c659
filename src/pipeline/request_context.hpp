/**
 * PORTWAY - API Gateway Request Kernel
 * Request Context - per-request state shared by the plugin chain
 */

#ifndef PORTWAY_PIPELINE_REQUEST_CONTEXT_HPP
#define PORTWAY_PIPELINE_REQUEST_CONTEXT_HPP

#include "pipeline/error.hpp"
#include "routing/request_target.hpp"
#include "server/http_message.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace portway::config {
struct ConfigSnapshot;
}

namespace portway::routing {
struct Route;
}

namespace portway::pipeline {

/**
 * Request Context
 *
 * Owned by the request's task; plugins may read and write it from their
 * hooks, which the executor runs one at a time. Only the cancellation
 * members are touched from other threads.
 */
class RequestContext {
public:
    using Clock = std::chrono::steady_clock;

    explicit RequestContext(server::HttpRequest request);

    // Non-copyable
    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    server::HttpRequest request;
    std::string host;                    // normalized
    std::string path;                    // decoded, without query
    std::vector<routing::Param> query;
    std::string request_id;

    std::shared_ptr<const config::ConfigSnapshot> snapshot;  // keeps route alive
    const routing::Route* route{nullptr};

    Clock::time_point started;
    Clock::time_point deadline;

    // Side data written by plugins ("ratelimit.outcome", "auth.user", ...)
    std::unordered_map<std::string, std::string> attributes;

    std::string backend;                 // "host:port" of the last attempt
    std::optional<Error> error;

    /**
     * Case-insensitive request header lookup
     */
    std::optional<std::string_view> header(std::string_view name) const;

    std::optional<std::string> query_param(std::string_view name) const;

    const std::string& client_ip() const { return request.client_ip; }

    bool expired() const { return Clock::now() >= deadline; }

    std::chrono::milliseconds time_left() const;

    /**
     * Mark cancelled and run the cancel hook, once
     */
    void cancel();

    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /**
     * Install the hook that aborts the current asynchronous step.
     * Runs immediately if the request is already cancelled.
     */
    void on_cancel(std::function<void()> hook);

    void clear_cancel_hook();

private:
    std::atomic<bool> cancelled_{false};
    std::mutex cancel_mutex_;
    std::function<void()> cancel_hook_;
};

} // namespace portway::pipeline

#endif // PORTWAY_PIPELINE_REQUEST_CONTEXT_HPP
