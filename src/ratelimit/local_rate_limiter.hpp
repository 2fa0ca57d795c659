/**
 * PORTWAY - API Gateway Request Kernel
 * Local Rate Limiter - in-process sliding window counters
 */

#ifndef PORTWAY_RATELIMIT_LOCAL_RATE_LIMITER_HPP
#define PORTWAY_RATELIMIT_LOCAL_RATE_LIMITER_HPP

#include "ratelimit/rate_limiter.hpp"
#include "ratelimit/sliding_window.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace portway::ratelimit {

namespace asio = boost::asio;

/**
 * Local limiter configuration
 */
struct LocalLimiterConfig {
    std::size_t shard_count{64};
    std::uint32_t idle_windows{3};                   // Evict keys idle for this many windows
    std::uint32_t sweep_every{1024};                 // Lazy sweep of a shard after N checks
    std::chrono::milliseconds sweep_interval{30000}; // Periodic full sweep
};

/**
 * Local Rate Limiter
 *
 * Counters live in a map split into independently locked shards, so
 * concurrent checks serialize only when their keys hash to the same shard.
 * The window transition and the admission increment happen under the shard
 * lock as one step; no check observes an in-between state.
 *
 * Window state per key:
 * - counts never go negative
 * - the window start only advances; a wall clock stepping backwards is
 *   treated as the start of the stored window
 * - crossing one boundary shifts current into previous, crossing two or
 *   more resets both
 */
class LocalRateLimiter : public RateLimiter,
                         public std::enable_shared_from_this<LocalRateLimiter> {
public:
    explicit LocalRateLimiter(const LocalLimiterConfig& config = {},
                              Clock clock = system_clock_ms);
    ~LocalRateLimiter() override;

    // Non-copyable
    LocalRateLimiter(const LocalRateLimiter&) = delete;
    LocalRateLimiter& operator=(const LocalRateLimiter&) = delete;

    /**
     * Synchronous check-and-increment
     */
    RateLimitDecision check(const std::string& key, std::uint64_t limit,
                            std::chrono::milliseconds window);

    /**
     * RateLimiter contract; the handler runs inline
     */
    void async_check(std::string key, std::uint64_t limit,
                     std::chrono::milliseconds window,
                     DecisionHandler handler) override;

    /**
     * Evict keys idle for idle_windows windows
     * @return number of evicted keys
     */
    std::size_t sweep();

    /**
     * Number of tracked keys (all shards)
     */
    std::size_t size() const;

    /**
     * Start the periodic sweep on the given io_context.
     * Requires the limiter to be owned by a shared_ptr.
     */
    void start_sweeper(asio::io_context& io_context);

    /**
     * Stop the periodic sweep
     */
    void stop_sweeper();

private:
    struct WindowState {
        std::uint64_t previous{0};
        std::uint64_t current{0};
        std::int64_t window_index{0};
        std::int64_t window_ms{0};
        std::int64_t last_seen_ms{0};
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, WindowState> entries;
        std::uint32_t checks_since_sweep{0};
    };

    Shard& shard_for(const std::string& key);
    std::size_t sweep_shard(Shard& shard, std::int64_t now_ms);
    void schedule_sweep();

    LocalLimiterConfig config_;
    Clock clock_;
    std::vector<std::unique_ptr<Shard>> shards_;

    std::unique_ptr<asio::steady_timer> sweep_timer_;
    std::atomic<bool> sweeping_{false};
};

} // namespace portway::ratelimit

#endif // PORTWAY_RATELIMIT_LOCAL_RATE_LIMITER_HPP
