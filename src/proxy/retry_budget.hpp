/**
 * PORTWAY - API Gateway Request Kernel
 * Retry Budget - caps retries to a fraction of request volume
 */

#ifndef PORTWAY_PROXY_RETRY_BUDGET_HPP
#define PORTWAY_PROXY_RETRY_BUDGET_HPP

#include <atomic>
#include <cstdint>

namespace portway::proxy {

/**
 * Token bucket shared by every request of the process.
 * Each first attempt deposits `ratio` tokens (up to `cap`); each retry
 * withdraws one. Under a backend-wide outage retries stay a bounded
 * fraction of traffic instead of multiplying it.
 */
class RetryBudget {
public:
    RetryBudget(double ratio, double cap, double initial = 10.0);

    // Non-copyable
    RetryBudget(const RetryBudget&) = delete;
    RetryBudget& operator=(const RetryBudget&) = delete;

    void deposit();

    /**
     * Take one token
     * @return false when the budget is exhausted
     */
    bool withdraw();

    double tokens() const;

private:
    static constexpr std::int64_t scale = 1000;  // milli-tokens

    std::int64_t ratio_;
    std::int64_t cap_;
    std::atomic<std::int64_t> balance_;
};

} // namespace portway::proxy

#endif // PORTWAY_PROXY_RETRY_BUDGET_HPP
