/**
 * PORTWAY - API Gateway Request Kernel
 * Rate Limiter - common admit/deny contract for local and distributed backends
 */

#ifndef PORTWAY_RATELIMIT_RATE_LIMITER_HPP
#define PORTWAY_RATELIMIT_RATE_LIMITER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace portway::ratelimit {

/**
 * Outcome of a rate-limit check
 */
enum class Outcome {
    admit,
    deny,                // Quota exhausted, retry_after is set
    backend_unavailable  // Counter store unreachable; caller applies its policy
};

inline std::string_view to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::admit: return "admit";
        case Outcome::deny: return "deny";
        case Outcome::backend_unavailable: return "backend_unavailable";
        default: return "unknown";
    }
}

/**
 * Result of a rate-limit check
 */
struct RateLimitDecision {
    Outcome outcome{Outcome::admit};
    std::chrono::milliseconds retry_after{0};
    std::uint64_t limit{0};
    std::uint64_t remaining{0};

    bool admitted() const noexcept { return outcome == Outcome::admit; }
};

using DecisionHandler = std::function<void(RateLimitDecision)>;

/**
 * Rate limiter interface
 *
 * check(key, limit, window) -> Admit | Deny(retry_after). The decision is
 * delivered through a handler so network-backed implementations never block
 * the calling thread; the local implementation invokes it inline.
 *
 * Implementations are shared by every request of every route and must be
 * safe for concurrent use.
 */
class RateLimiter {
public:
    virtual ~RateLimiter() = default;

    virtual void async_check(std::string key, std::uint64_t limit,
                             std::chrono::milliseconds window,
                             DecisionHandler handler) = 0;
};

} // namespace portway::ratelimit

#endif // PORTWAY_RATELIMIT_RATE_LIMITER_HPP
