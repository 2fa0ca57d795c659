/**
 * PORTWAY - API Gateway Request Kernel
 * Distributed Rate Limiter implementation
 */

#include "ratelimit/distributed_rate_limiter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace portway::ratelimit {

DistributedRateLimiter::DistributedRateLimiter(std::shared_ptr<CounterStore> store,
                                               const DistributedLimiterConfig& config,
                                               Clock clock)
    : store_(std::move(store))
    , config_(config)
    , clock_(std::move(clock))
{
}

void DistributedRateLimiter::async_check(std::string key, std::uint64_t limit,
                                         std::chrono::milliseconds window,
                                         DecisionHandler handler) {
    const std::int64_t window_ms = std::max<std::int64_t>(window.count(), 1);
    const auto pos = locate(clock_(), window_ms);

    WindowAdmission admission{
        .current_key = window_key(key, pos.index),
        .previous_key = window_key(key, pos.index - 1),
        .limit = limit,
        .window_ms = window_ms,
        .elapsed_ms = pos.elapsed,
        .ttl_ms = 2 * window_ms + config_.ttl_slack.count()
    };

    store_->async_admit(std::move(admission),
        [handler = std::move(handler), key = std::move(key), limit, window_ms, elapsed = pos.elapsed]
        (boost::system::error_code ec, AdmissionReply reply) {
            RateLimitDecision decision;
            decision.limit = limit;

            if (ec) {
                spdlog::warn("DistributedRateLimiter: Counter store unavailable for '{}': {}",
                             key, ec.message());
                decision.outcome = Outcome::backend_unavailable;
                handler(decision);
                return;
            }

            if (reply.admitted) {
                decision.outcome = Outcome::admit;
                decision.remaining = remaining(reply.counts, limit, window_ms, elapsed);
            } else {
                decision.outcome = Outcome::deny;
                decision.retry_after = retry_after(reply.counts, limit, window_ms, elapsed);
            }
            handler(decision);
        });
}

std::string DistributedRateLimiter::window_key(const std::string& key, std::int64_t index) const {
    // The hash tag keeps both windows of a key in one cluster slot
    return config_.key_prefix + "{" + key + "}:" + std::to_string(index);
}

} // namespace portway::ratelimit
