/**
 * PORTWAY - API Gateway Request Kernel
 * Load balancer and backend health tests
 */

#include "balancer/load_balancer.hpp"

#include <gtest/gtest.h>

#include <map>
#include <memory>

using namespace portway;
using namespace portway::balancer;
using namespace std::chrono_literals;

namespace {

config::BackendConfig backend(std::string host, std::uint16_t port, std::uint32_t weight = 1) {
    return config::BackendConfig{.host = std::move(host), .port = port, .weight = weight, .timeout_ms = std::nullopt};
}

class LoadBalancerTest : public ::testing::Test {
protected:
    std::shared_ptr<std::int64_t> now = std::make_shared<std::int64_t>(1000);

    std::shared_ptr<HealthRegistry> registry =
        std::make_shared<HealthRegistry>([clock = now] { return *clock; });

    std::unique_ptr<LoadBalancer> make_balancer(std::vector<config::BackendConfig> backends,
                                                Policy policy = Policy::round_robin,
                                                NoHealthyPolicy on_no_healthy = NoHealthyPolicy::fail_open) {
        GroupSettings settings{
            .name = "api",
            .policy = policy,
            .on_no_healthy = on_no_healthy,
            .health = HealthPolicy{.failure_threshold = 2, .cooldown = 5000ms},
            .fail_on_5xx = true
        };
        return std::make_unique<LoadBalancer>(std::move(settings), backends, registry);
    }
};

} // anonymous namespace

TEST_F(LoadBalancerTest, EmptyGroupSelectsNothing) {
    auto lb = make_balancer({});
    EXPECT_FALSE(lb->select_backend().has_value());
}

TEST_F(LoadBalancerTest, SmoothWeightedRoundRobinInterleaves) {
    auto lb = make_balancer({backend("a", 1, 5), backend("b", 2, 1), backend("c", 3, 1)});
    EXPECT_EQ(lb->total_weight(), 7u);

    std::string sequence;
    for (int i = 0; i < 7; ++i) {
        auto selection = lb->select_backend();
        ASSERT_TRUE(selection.has_value());
        sequence += selection->backend.host;
    }
    EXPECT_EQ(sequence, "aabacaa");
}

TEST_F(LoadBalancerTest, EqualWeightsRotate) {
    auto lb = make_balancer({backend("a", 1), backend("b", 2), backend("c", 3)});
    std::map<std::string, int> counts;
    for (int i = 0; i < 30; ++i) {
        counts[lb->select_backend()->backend.host]++;
    }
    EXPECT_EQ(counts["a"], 10);
    EXPECT_EQ(counts["b"], 10);
    EXPECT_EQ(counts["c"], 10);
}

TEST_F(LoadBalancerTest, RandomPoliciesStayWithinGroup) {
    for (auto policy : {Policy::random, Policy::weighted_random}) {
        auto lb = make_balancer({backend("a", 1, 3), backend("b", 2, 1)}, policy);
        for (int i = 0; i < 50; ++i) {
            auto selection = lb->select_backend();
            ASSERT_TRUE(selection.has_value());
            EXPECT_LT(selection->index, 2u);
        }
    }
}

TEST_F(LoadBalancerTest, ExcludedBackendAvoidedWhileAlternativesExist) {
    auto lb = make_balancer({backend("a", 1), backend("b", 2)});
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(lb->select_backend({0})->backend.host, "b");
    }
    // Everything excluded: reuse rather than fail
    EXPECT_TRUE(lb->select_backend({0, 1}).has_value());
}

TEST_F(LoadBalancerTest, FailuresMarkUnhealthyUntilCooldownEnds) {
    auto lb = make_balancer({backend("a", 1), backend("b", 2)});

    lb->report_failure(0);
    EXPECT_EQ(lb->healthy_backend_count(), 2u);
    lb->report_failure(0);
    EXPECT_EQ(lb->healthy_backend_count(), 1u);

    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(lb->select_backend()->backend.host, "b");
    }

    *now += 5000;
    EXPECT_EQ(lb->healthy_backend_count(), 2u);

    // Still on probation: one more failure sends it back
    lb->report_failure(0);
    EXPECT_EQ(lb->healthy_backend_count(), 1u);

    *now += 5000;
    lb->report_success(0);
    lb->report_failure(0);
    EXPECT_EQ(lb->healthy_backend_count(), 2u);
}

TEST_F(LoadBalancerTest, ServerErrorsCountWhenConfigured) {
    auto lb = make_balancer({backend("a", 1), backend("b", 2)});
    lb->report_status(1, 503);
    lb->report_status(1, 500);
    EXPECT_EQ(lb->healthy_backend_count(), 1u);

    lb->report_status(0, 404);
    lb->report_status(0, 502);
    EXPECT_EQ(lb->healthy_backend_count(), 1u);
}

TEST_F(LoadBalancerTest, NoHealthyBackendsHonorsPolicy) {
    auto open = make_balancer({backend("a", 1), backend("b", 2)});
    for (std::size_t i = 0; i < 2; ++i) {
        open->report_failure(i);
        open->report_failure(i);
    }
    EXPECT_EQ(open->healthy_backend_count(), 0u);
    EXPECT_TRUE(open->select_backend().has_value());

    auto closed = make_balancer({backend("a", 1), backend("b", 2)},
                                Policy::round_robin, NoHealthyPolicy::fail);
    // Same addresses share health through the registry
    EXPECT_EQ(closed->healthy_backend_count(), 0u);
    EXPECT_FALSE(closed->select_backend().has_value());
}

TEST_F(LoadBalancerTest, RegistryRetainsOnlyLiveBackends) {
    auto lb = make_balancer({backend("a", 1), backend("b", 2)});
    EXPECT_EQ(registry->size(), 2u);
    EXPECT_EQ(HealthRegistry::backend_key(backend("a", 1)), "a:1");

    EXPECT_EQ(registry->retain({"a:1"}), 1u);
    EXPECT_EQ(registry->size(), 1u);
}

TEST(PolicyNamesTest, ParseKnownNames) {
    EXPECT_EQ(policy_from_string("round_robin"), Policy::round_robin);
    EXPECT_EQ(policy_from_string("weighted_random"), Policy::weighted_random);
    EXPECT_EQ(policy_from_string("random"), Policy::random);
    EXPECT_FALSE(policy_from_string("least_conn").has_value());
    EXPECT_EQ(no_healthy_policy_from_string("fail"), NoHealthyPolicy::fail);
    EXPECT_FALSE(no_healthy_policy_from_string("panic").has_value());
}
