/**
 * PORTWAY - API Gateway Request Kernel
 * Sliding Window Counter implementation
 */

#include "ratelimit/sliding_window.hpp"

#include <algorithm>

namespace portway::ratelimit {

std::int64_t system_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

WindowPosition locate(std::int64_t now_ms, std::int64_t window_ms) {
    WindowPosition pos;
    pos.index = now_ms / window_ms;
    pos.elapsed = now_ms - pos.index * window_ms;
    if (pos.elapsed < 0) {
        // Pre-epoch clocks only show up in tests; keep elapsed in [0, W)
        pos.index -= 1;
        pos.elapsed += window_ms;
    }
    return pos;
}

bool admits(const WindowCounts& counts, std::uint64_t limit,
            std::int64_t window_ms, std::int64_t elapsed_ms) {
    const auto w = static_cast<std::uint64_t>(window_ms);
    const auto left = static_cast<std::uint64_t>(window_ms - std::clamp<std::int64_t>(elapsed_ms, 0, window_ms));
    return (counts.current + 1) * w + counts.previous * left <= limit * w;
}

std::uint64_t remaining(const WindowCounts& counts, std::uint64_t limit,
                        std::int64_t window_ms, std::int64_t elapsed_ms) {
    const auto w = static_cast<std::uint64_t>(window_ms);
    const auto left = static_cast<std::uint64_t>(window_ms - std::clamp<std::int64_t>(elapsed_ms, 0, window_ms));
    const auto used = counts.current * w + counts.previous * left;
    const auto capacity = limit * w;
    return used >= capacity ? 0 : (capacity - used) / w;
}

std::chrono::milliseconds retry_after(const WindowCounts& counts, std::uint64_t limit,
                                      std::int64_t window_ms, std::int64_t elapsed_ms) {
    const auto w = static_cast<std::int64_t>(window_ms);
    const auto e = std::clamp<std::int64_t>(elapsed_ms, 0, w);
    std::int64_t wait = 0;

    if (counts.current + 1 <= limit && counts.previous > 0) {
        // Still room in this window once the previous window's share decays:
        // previous * (W - e') <= (limit - current - 1) * W
        const auto slack = static_cast<std::int64_t>(
            (limit - counts.current - 1) * static_cast<std::uint64_t>(w) / counts.previous);
        const auto admit_at = w - std::min(slack, w);
        wait = admit_at - e;
    } else if (limit == 0) {
        wait = w - e;
    } else {
        // This window is full. In the next one `current` becomes `previous`:
        // current * (W - e') <= (limit - 1) * W
        const auto carried = std::max<std::uint64_t>(counts.current, 1);
        const auto slack = static_cast<std::int64_t>(
            (limit - 1) * static_cast<std::uint64_t>(w) / carried);
        wait = (w - e) + std::max<std::int64_t>(0, w - slack);
    }

    return std::chrono::milliseconds(std::max<std::int64_t>(wait, 1));
}

} // namespace portway::ratelimit
