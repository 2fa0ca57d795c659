/**
 * PORTWAY - API Gateway Request Kernel
 * Request Context implementation
 */

#include "pipeline/request_context.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/beast/core/string.hpp>

namespace portway::pipeline {

RequestContext::RequestContext(server::HttpRequest req)
    : request(std::move(req))
    , started(Clock::now())
    , deadline(started)
{
    auto [decoded_path, raw_query] = routing::split_target(
        std::string_view(request.message.target().data(), request.message.target().size()));
    path = std::move(decoded_path);
    query = routing::parse_query(raw_query);
}

std::optional<std::string_view> RequestContext::header(std::string_view name) const {
    auto it = request.message.find(boost::beast::string_view(name.data(), name.size()));
    if (it == request.message.end()) {
        return std::nullopt;
    }
    return std::string_view(it->value().data(), it->value().size());
}

std::optional<std::string> RequestContext::query_param(std::string_view name) const {
    for (const auto& [key, value] : query) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::chrono::milliseconds RequestContext::time_left() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds{0};
}

void RequestContext::cancel() {
    std::function<void()> hook;
    {
        std::lock_guard lock(cancel_mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        hook = std::move(cancel_hook_);
        cancel_hook_ = nullptr;
    }
    if (hook) {
        hook();
    }
}

void RequestContext::on_cancel(std::function<void()> hook) {
    {
        std::lock_guard lock(cancel_mutex_);
        if (!cancelled_.load(std::memory_order_acquire)) {
            cancel_hook_ = std::move(hook);
            return;
        }
    }
    if (hook) {
        hook();
    }
}

void RequestContext::clear_cancel_hook() {
    std::lock_guard lock(cancel_mutex_);
    cancel_hook_ = nullptr;
}

} // namespace portway::pipeline
