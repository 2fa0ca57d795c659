/**
 * PORTWAY - API Gateway Request Kernel
 * Backend Health - passive failure tracking with a recovery cooldown
 */

#ifndef PORTWAY_BALANCER_BACKEND_HEALTH_HPP
#define PORTWAY_BALANCER_BACKEND_HEALTH_HPP

#include "config/config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace portway::balancer {

/**
 * Monotonic clock in milliseconds; injectable for tests
 */
using Clock = std::function<std::int64_t()>;

std::int64_t steady_clock_ms();

/**
 * Backend health state
 */
enum class BackendState {
    healthy,    // Eligible for selection
    unhealthy   // Failed repeatedly; skipped until its cooldown ends
};

/**
 * Convert BackendState to string for logging
 */
inline std::string to_string(BackendState state) {
    switch (state) {
        case BackendState::healthy: return "healthy";
        case BackendState::unhealthy: return "unhealthy";
        default: return "unknown";
    }
}

/**
 * Thresholds applied by a backend group
 */
struct HealthPolicy {
    std::uint32_t failure_threshold{3};         // Consecutive failures before unhealthy
    std::chrono::milliseconds cooldown{10000};  // Time spent unhealthy
};

/**
 * Health of one backend address, shared by every group and snapshot that
 * references it. Lock-free.
 *
 * After the cooldown the backend is eligible again but keeps its failure
 * count, so the next failure sends it straight back to unhealthy; the first
 * success clears it.
 */
class BackendHealth {
public:
    explicit BackendHealth(std::string key);

    // Non-copyable
    BackendHealth(const BackendHealth&) = delete;
    BackendHealth& operator=(const BackendHealth&) = delete;

    BackendState state(std::int64_t now_ms) const;

    bool is_healthy(std::int64_t now_ms) const {
        return state(now_ms) == BackendState::healthy;
    }

    /**
     * @return true if this failure moved the backend to unhealthy
     */
    bool record_failure(const HealthPolicy& policy, std::int64_t now_ms);

    /**
     * @return true if the backend had failures recorded before
     */
    bool record_success();

    std::uint32_t consecutive_failures() const {
        return consecutive_failures_.load(std::memory_order_relaxed);
    }

    const std::string& key() const { return key_; }

private:
    std::string key_;
    std::atomic<std::uint32_t> consecutive_failures_{0};
    std::atomic<std::int64_t> unhealthy_until_ms_{0};
};

/**
 * Registry of backend health keyed by "host:port".
 * Outlives snapshots so health survives a configuration reload.
 */
class HealthRegistry {
public:
    explicit HealthRegistry(Clock clock = steady_clock_ms);

    // Non-copyable
    HealthRegistry(const HealthRegistry&) = delete;
    HealthRegistry& operator=(const HealthRegistry&) = delete;

    /**
     * Get or create the health entry for a backend
     */
    std::shared_ptr<BackendHealth> get(const config::BackendConfig& backend);

    /**
     * Drop entries whose key is not in live (called after a reload)
     */
    std::size_t retain(const std::unordered_set<std::string>& live);

    std::size_t size() const;

    std::int64_t now() const { return clock_(); }

    static std::string backend_key(const config::BackendConfig& backend);

private:
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<BackendHealth>> entries_;
};

} // namespace portway::balancer

#endif // PORTWAY_BALANCER_BACKEND_HEALTH_HPP
