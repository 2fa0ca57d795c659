/**
 * PORTWAY - API Gateway Request Kernel
 * Local Rate Limiter implementation
 */

#include "ratelimit/local_rate_limiter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace portway::ratelimit {

LocalRateLimiter::LocalRateLimiter(const LocalLimiterConfig& config, Clock clock)
    : config_(config)
    , clock_(std::move(clock))
{
    const auto shard_count = std::max<std::size_t>(config_.shard_count, 1);
    shards_.reserve(shard_count);
    for (std::size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
    spdlog::debug("LocalRateLimiter: {} shards, idle eviction after {} windows",
                  shard_count, config_.idle_windows);
}

LocalRateLimiter::~LocalRateLimiter() {
    stop_sweeper();
}

RateLimitDecision LocalRateLimiter::check(const std::string& key, std::uint64_t limit,
                                          std::chrono::milliseconds window) {
    const std::int64_t window_ms = std::max<std::int64_t>(window.count(), 1);
    const std::int64_t now = clock_();
    const auto pos = locate(now, window_ms);

    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    if (++shard.checks_since_sweep >= config_.sweep_every) {
        shard.checks_since_sweep = 0;
        sweep_shard(shard, now);
    }

    auto [it, inserted] = shard.entries.try_emplace(key);
    auto& state = it->second;

    if (inserted || state.window_ms != window_ms) {
        state = WindowState{
            .previous = 0,
            .current = 0,
            .window_index = pos.index,
            .window_ms = window_ms,
            .last_seen_ms = now
        };
    }

    std::int64_t elapsed = pos.elapsed;
    if (pos.index > state.window_index) {
        state.previous = (pos.index == state.window_index + 1) ? state.current : 0;
        state.current = 0;
        state.window_index = pos.index;
    } else if (pos.index < state.window_index) {
        // Clock went backwards: stay in the stored window
        elapsed = 0;
    }
    state.last_seen_ms = std::max(state.last_seen_ms, now);

    WindowCounts counts{.previous = state.previous, .current = state.current};

    RateLimitDecision decision;
    decision.limit = limit;

    if (admits(counts, limit, window_ms, elapsed)) {
        ++state.current;
        counts.current = state.current;
        decision.outcome = Outcome::admit;
        decision.remaining = remaining(counts, limit, window_ms, elapsed);
    } else {
        decision.outcome = Outcome::deny;
        decision.retry_after = retry_after(counts, limit, window_ms, elapsed);
        decision.remaining = 0;
    }

    return decision;
}

void LocalRateLimiter::async_check(std::string key, std::uint64_t limit,
                                   std::chrono::milliseconds window,
                                   DecisionHandler handler) {
    handler(check(key, limit, window));
}

std::size_t LocalRateLimiter::sweep() {
    const std::int64_t now = clock_();
    std::size_t evicted = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        evicted += sweep_shard(*shard, now);
    }
    if (evicted > 0) {
        spdlog::debug("LocalRateLimiter: Evicted {} idle keys", evicted);
    }
    return evicted;
}

std::size_t LocalRateLimiter::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

void LocalRateLimiter::start_sweeper(asio::io_context& io_context) {
    if (sweeping_.exchange(true)) {
        return;
    }
    sweep_timer_ = std::make_unique<asio::steady_timer>(io_context);
    schedule_sweep();
    spdlog::debug("LocalRateLimiter: Sweeper started (interval={}ms)",
                  config_.sweep_interval.count());
}

void LocalRateLimiter::stop_sweeper() {
    if (!sweeping_.exchange(false)) {
        return;
    }
    if (sweep_timer_) {
        sweep_timer_->cancel();
    }
}

LocalRateLimiter::Shard& LocalRateLimiter::shard_for(const std::string& key) {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

std::size_t LocalRateLimiter::sweep_shard(Shard& shard, std::int64_t now_ms) {
    return std::erase_if(shard.entries, [&](const auto& entry) {
        const auto& state = entry.second;
        const auto idle_limit = state.window_ms * static_cast<std::int64_t>(config_.idle_windows);
        return now_ms - state.last_seen_ms > idle_limit;
    });
}

void LocalRateLimiter::schedule_sweep() {
    if (!sweeping_) {
        return;
    }

    sweep_timer_->expires_after(config_.sweep_interval);
    sweep_timer_->async_wait([weak = weak_from_this()](boost::system::error_code ec) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::warn("LocalRateLimiter: Sweep timer error: {}", ec.message());
            }
            return;
        }
        if (auto self = weak.lock()) {
            self->sweep();
            self->schedule_sweep();
        }
    });
}

} // namespace portway::ratelimit
