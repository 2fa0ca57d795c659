/**
 * PORTWAY - API Gateway Request Kernel
 * Distributed Rate Limiter - sliding window counters shared by a fleet
 */

#ifndef PORTWAY_RATELIMIT_DISTRIBUTED_RATE_LIMITER_HPP
#define PORTWAY_RATELIMIT_DISTRIBUTED_RATE_LIMITER_HPP

#include "ratelimit/counter_store.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "ratelimit/sliding_window.hpp"

#include <memory>
#include <string>

namespace portway::ratelimit {

/**
 * Distributed limiter configuration
 */
struct DistributedLimiterConfig {
    std::string key_prefix{"portway:rl:"};
    std::chrono::milliseconds ttl_slack{1000};  // Kept beyond two windows
};

/**
 * Distributed Rate Limiter
 *
 * Each fixed window is one store key, "<prefix>{<key>}:<window index>".
 * Window indexes come from the epoch clock, so every process agrees on
 * boundaries without coordination. The store performs the admission test
 * and the increment in one round trip; processes see one logical counter.
 *
 * A store failure yields Outcome::backend_unavailable. The caller decides
 * between fail-open and fail-closed.
 */
class DistributedRateLimiter : public RateLimiter {
public:
    DistributedRateLimiter(std::shared_ptr<CounterStore> store,
                           const DistributedLimiterConfig& config = {},
                           Clock clock = system_clock_ms);

    void async_check(std::string key, std::uint64_t limit,
                     std::chrono::milliseconds window,
                     DecisionHandler handler) override;

    /**
     * Store key for a limiter key and window index
     */
    std::string window_key(const std::string& key, std::int64_t index) const;

private:
    std::shared_ptr<CounterStore> store_;
    DistributedLimiterConfig config_;
    Clock clock_;
};

} // namespace portway::ratelimit

#endif // PORTWAY_RATELIMIT_DISTRIBUTED_RATE_LIMITER_HPP
