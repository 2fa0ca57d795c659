/**
 * PORTWAY - API Gateway Request Kernel
 * Sliding Window Counter - integer arithmetic shared by every limiter backend
 *
 * Two adjacent fixed windows aligned to multiples of W on the Unix epoch
 * approximate a sliding window:
 *
 *   estimate(t) = current + previous * (W - elapsed) / W
 *
 * A request is admitted iff
 *
 *   (current + 1) * W + previous * (W - elapsed) <= limit * W
 *
 * which is the same test without the division. Because admission only ever
 * increments `current`, at most `limit` requests are admitted per fixed
 * window, so any true sliding window of length W (which overlaps at most two
 * fixed windows) sees at most 2 * limit admissions. For traffic spread
 * uniformly over the previous window the estimate is exact and the bound is
 * `limit`.
 */

#ifndef PORTWAY_RATELIMIT_SLIDING_WINDOW_HPP
#define PORTWAY_RATELIMIT_SLIDING_WINDOW_HPP

#include <chrono>
#include <cstdint>
#include <functional>

namespace portway::ratelimit {

/**
 * Wall clock in milliseconds since the Unix epoch.
 * Injectable so tests (and every process of a fleet) agree on boundaries.
 */
using Clock = std::function<std::int64_t()>;

/**
 * Default clock based on std::chrono::system_clock
 */
std::int64_t system_clock_ms();

/**
 * Counts of the two windows the estimate is built from
 */
struct WindowCounts {
    std::uint64_t previous{0};
    std::uint64_t current{0};
};

/**
 * Position of an instant relative to the fixed window grid
 */
struct WindowPosition {
    std::int64_t index{0};    // now / W
    std::int64_t elapsed{0};  // now - index * W, in [0, W)
};

WindowPosition locate(std::int64_t now_ms, std::int64_t window_ms);

/**
 * True if one more request fits under the limit
 */
bool admits(const WindowCounts& counts, std::uint64_t limit,
            std::int64_t window_ms, std::int64_t elapsed_ms);

/**
 * Requests still admissible right now (floor of limit - estimate)
 */
std::uint64_t remaining(const WindowCounts& counts, std::uint64_t limit,
                        std::int64_t window_ms, std::int64_t elapsed_ms);

/**
 * Time until a denied request would be admitted, assuming no other traffic.
 * Always at least 1ms.
 */
std::chrono::milliseconds retry_after(const WindowCounts& counts, std::uint64_t limit,
                                      std::int64_t window_ms, std::int64_t elapsed_ms);

} // namespace portway::ratelimit

#endif // PORTWAY_RATELIMIT_SLIDING_WINDOW_HPP
