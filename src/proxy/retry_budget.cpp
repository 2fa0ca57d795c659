/**
 * PORTWAY - API Gateway Request Kernel
 * Retry Budget implementation
 */

#include "proxy/retry_budget.hpp"

#include <algorithm>

namespace portway::proxy {

RetryBudget::RetryBudget(double ratio, double cap, double initial)
    : ratio_(static_cast<std::int64_t>(std::max(ratio, 0.0) * scale))
    , cap_(static_cast<std::int64_t>(std::max(cap, 0.0) * scale))
    , balance_(std::min(static_cast<std::int64_t>(std::max(initial, 0.0) * scale), cap_))
{
}

void RetryBudget::deposit() {
    auto current = balance_.load(std::memory_order_relaxed);
    while (current < cap_) {
        const auto next = std::min(current + ratio_, cap_);
        if (balance_.compare_exchange_weak(current, next, std::memory_order_relaxed)) {
            return;
        }
    }
}

bool RetryBudget::withdraw() {
    auto current = balance_.load(std::memory_order_relaxed);
    while (current >= scale) {
        if (balance_.compare_exchange_weak(current, current - scale, std::memory_order_relaxed)) {
            return true;
        }
    }
    return false;
}

double RetryBudget::tokens() const {
    return static_cast<double>(balance_.load(std::memory_order_relaxed)) / scale;
}

} // namespace portway::proxy
