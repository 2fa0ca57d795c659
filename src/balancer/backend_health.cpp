/**
 * PORTWAY - API Gateway Request Kernel
 * Backend Health implementation
 */

#include "balancer/backend_health.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace portway::balancer {

std::int64_t steady_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

BackendHealth::BackendHealth(std::string key)
    : key_(std::move(key))
{
}

BackendState BackendHealth::state(std::int64_t now_ms) const {
    return now_ms < unhealthy_until_ms_.load(std::memory_order_acquire)
        ? BackendState::unhealthy
        : BackendState::healthy;
}

bool BackendHealth::record_failure(const HealthPolicy& policy, std::int64_t now_ms) {
    const auto failures = consecutive_failures_.fetch_add(1, std::memory_order_acq_rel) + 1;
    if (failures < std::max<std::uint32_t>(policy.failure_threshold, 1)) {
        return false;
    }

    const std::int64_t until = now_ms + policy.cooldown.count();
    auto previous = unhealthy_until_ms_.load(std::memory_order_acquire);
    while (previous < until) {
        if (unhealthy_until_ms_.compare_exchange_weak(previous, until, std::memory_order_acq_rel)) {
            return previous <= now_ms;
        }
    }
    return false;
}

bool BackendHealth::record_success() {
    unhealthy_until_ms_.store(0, std::memory_order_release);
    return consecutive_failures_.exchange(0, std::memory_order_acq_rel) > 0;
}

HealthRegistry::HealthRegistry(Clock clock)
    : clock_(std::move(clock))
{
}

std::shared_ptr<BackendHealth> HealthRegistry::get(const config::BackendConfig& backend) {
    auto key = backend_key(backend);
    std::lock_guard lock(mutex_);
    auto& entry = entries_[key];
    if (!entry) {
        entry = std::make_shared<BackendHealth>(key);
    }
    return entry;
}

std::size_t HealthRegistry::retain(const std::unordered_set<std::string>& live) {
    std::lock_guard lock(mutex_);
    const auto removed = std::erase_if(entries_, [&](const auto& entry) {
        return !live.contains(entry.first);
    });
    if (removed > 0) {
        spdlog::debug("HealthRegistry: Dropped {} retired backends", removed);
    }
    return removed;
}

std::size_t HealthRegistry::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::string HealthRegistry::backend_key(const config::BackendConfig& backend) {
    return backend.host + ":" + std::to_string(backend.port);
}

} // namespace portway::balancer
