/**
 * PORTWAY - API Gateway Request Kernel
 * Distributed rate limiter tests
 */

#include "ratelimit/distributed_rate_limiter.hpp"
#include "ratelimit/local_rate_limiter.hpp"
#include "store/error.hpp"
#include "store/redis_counter_store.hpp"

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace portway::ratelimit;
using namespace std::chrono_literals;

namespace {

constexpr std::int64_t window_start = 1'700'000'000'000;

/**
 * In-memory store. It decodes the EVAL arguments the Redis store sends
 * and evaluates the script's admission test on them:
 *   (cur + 1) * window + prev * (window - elapsed) <= limit * window
 */
class MemoryCounterStore : public CounterStore {
public:
    void async_admit(WindowAdmission admission, AdmissionHandler handler) override {
        const auto command = portway::store::RedisCounterStore::admission_command(admission);
        const auto& current_key = command[3];
        const auto& previous_key = command[4];
        const auto limit = std::stoull(command[5]);
        const auto window = std::stoull(command[6]);
        const auto elapsed = std::stoull(command[7]);

        AdmissionReply reply;
        {
            std::lock_guard lock(mutex_);
            last_admission = admission;
            last_ttl_ms = std::stoll(command[8]);
            auto& current = counters[current_key];
            const auto previous = counters.count(previous_key) ? counters[previous_key] : 0;
            reply.admitted = (current + 1) * window + previous * (window - elapsed) <= limit * window;
            if (reply.admitted) {
                ++current;
            }
            reply.counts = WindowCounts{.previous = previous, .current = current};
        }
        handler({}, reply);
    }

    std::mutex mutex_;
    std::map<std::string, std::uint64_t> counters;
    WindowAdmission last_admission;
    std::int64_t last_ttl_ms{0};
};

/**
 * Store that is never reachable
 */
class UnreachableStore : public CounterStore {
public:
    void async_admit(WindowAdmission, AdmissionHandler handler) override {
        handler(portway::store::errc::backoff, AdmissionReply{});
    }
};

RateLimitDecision check_now(RateLimiter& limiter, const std::string& key,
                            std::uint64_t limit, std::chrono::milliseconds window) {
    RateLimitDecision result;
    bool called = false;
    limiter.async_check(key, limit, window, [&](RateLimitDecision decision) {
        result = decision;
        called = true;
    });
    EXPECT_TRUE(called);
    return result;
}

class DistributedRateLimiterTest : public ::testing::Test {
protected:
    std::shared_ptr<std::int64_t> now = std::make_shared<std::int64_t>(window_start);

    Clock clock() {
        auto shared = now;
        return [shared]() { return *shared; };
    }
};

} // anonymous namespace

TEST_F(DistributedRateLimiterTest, FiveAdmittedThenSixthDenied) {
    auto store = std::make_shared<MemoryCounterStore>();
    DistributedRateLimiter limiter(store, {}, clock());

    for (int i = 0; i < 5; ++i) {
        auto decision = check_now(limiter, "client", 5, 1s);
        EXPECT_EQ(decision.outcome, Outcome::admit);
        EXPECT_EQ(decision.remaining, static_cast<std::uint64_t>(4 - i));
    }
    auto denied = check_now(limiter, "client", 5, 1s);
    EXPECT_EQ(denied.outcome, Outcome::deny);
    EXPECT_EQ(denied.retry_after, 1200ms);
}

TEST_F(DistributedRateLimiterTest, KeysFollowTheWindowGrid) {
    auto store = std::make_shared<MemoryCounterStore>();
    DistributedRateLimiter limiter(store, DistributedLimiterConfig{.key_prefix = "rl:"}, clock());

    *now += 250;
    check_now(limiter, "route|ip:10.0.0.1", 5, 1s);

    const auto index = window_start / 1000;
    EXPECT_EQ(store->last_admission.current_key, "rl:{route|ip:10.0.0.1}:" + std::to_string(index));
    EXPECT_EQ(store->last_admission.previous_key, "rl:{route|ip:10.0.0.1}:" + std::to_string(index - 1));
    EXPECT_EQ(store->last_admission.elapsed_ms, 250);
    EXPECT_EQ(store->last_admission.window_ms, 1000);
    EXPECT_EQ(store->last_admission.ttl_ms, 3000);
    EXPECT_EQ(store->last_ttl_ms, 3000);
}

TEST_F(DistributedRateLimiterTest, SharedStoreIsOneLogicalCounter) {
    auto store = std::make_shared<MemoryCounterStore>();
    DistributedRateLimiter first(store, {}, clock());
    DistributedRateLimiter second(store, {}, clock());

    int admitted = 0;
    for (int i = 0; i < 10; ++i) {
        auto& limiter = (i % 2 == 0) ? first : second;
        if (check_now(limiter, "client", 6, 1s).admitted()) {
            ++admitted;
        }
    }
    EXPECT_EQ(admitted, 6);
}

TEST_F(DistributedRateLimiterTest, SameDecisionsAsLocalLimiter) {
    auto store = std::make_shared<MemoryCounterStore>();
    DistributedRateLimiter distributed(store, {}, clock());
    LocalRateLimiter local({}, clock());

    // Bursts and gaps across four windows
    const std::vector<std::int64_t> steps{0, 0, 0, 10, 90, 300, 0, 0, 650, 5, 5, 200,
                                          100, 0, 0, 0, 400, 1700, 0, 30, 30, 30};
    for (std::size_t i = 0; i < steps.size(); ++i) {
        *now += steps[i];
        auto expected = local.check("client", 4, 1s);
        auto actual = check_now(distributed, "client", 4, 1s);
        ASSERT_EQ(actual.outcome, expected.outcome) << "step " << i;
        EXPECT_EQ(actual.remaining, expected.remaining) << "step " << i;
        EXPECT_EQ(actual.retry_after, expected.retry_after) << "step " << i;
    }
}

TEST_F(DistributedRateLimiterTest, UnreachableStoreReportsBackendUnavailable) {
    DistributedRateLimiter limiter(std::make_shared<UnreachableStore>(), {}, clock());

    auto decision = check_now(limiter, "client", 5, 1s);
    EXPECT_EQ(decision.outcome, Outcome::backend_unavailable);
    EXPECT_FALSE(decision.admitted());
    EXPECT_EQ(decision.limit, 5u);
}
