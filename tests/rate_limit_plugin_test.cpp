/**
 * PORTWAY - API Gateway Request Kernel
 * Rate limit plugin tests
 */

#include "plugins/rate_limit_plugin.hpp"
#include "ratelimit/distributed_rate_limiter.hpp"
#include "ratelimit/local_rate_limiter.hpp"
#include "store/error.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

using namespace portway;
using namespace portway::plugins;
using namespace std::chrono_literals;
namespace http = server::http;

namespace {

/**
 * Limiter returning a fixed decision and recording the keys it saw
 */
class FixedLimiter : public ratelimit::RateLimiter {
public:
    explicit FixedLimiter(ratelimit::RateLimitDecision decision) : decision_(decision) {}

    void async_check(std::string key, std::uint64_t, std::chrono::milliseconds,
                     ratelimit::DecisionHandler handler) override {
        keys.push_back(std::move(key));
        handler(decision_);
    }

    std::vector<std::string> keys;

private:
    ratelimit::RateLimitDecision decision_;
};

/**
 * Counter store that is always unreachable
 */
class UnreachableStore : public ratelimit::CounterStore {
public:
    void async_admit(ratelimit::WindowAdmission, ratelimit::AdmissionHandler handler) override {
        handler(store::errc::backoff, ratelimit::AdmissionReply{});
    }
};

std::shared_ptr<pipeline::RequestContext> make_context(std::string client_ip = "10.0.0.7") {
    server::HttpRequest request;
    request.message.method(http::verb::get);
    request.message.target("/api/items");
    request.message.version(11);
    request.client_ip = std::move(client_ip);
    return std::make_shared<pipeline::RequestContext>(std::move(request));
}

RateLimitOptions options_for(const char* json) {
    return RateLimitOptions::parse(nlohmann::json::parse(json));
}

pipeline::HookResult run_request(pipeline::Plugin& plugin,
                                 const std::shared_ptr<pipeline::RequestContext>& ctx) {
    std::optional<pipeline::HookResult> result;
    plugin.on_request(ctx, [&](pipeline::HookResult r) { result = std::move(r); });
    EXPECT_TRUE(result.has_value());
    return result ? std::move(*result) : pipeline::HookResult::proceed();
}

} // anonymous namespace

TEST(RateLimitOptionsTest, ParsesDefaultsAndVariants) {
    auto defaults = options_for(R"({"limit": 5, "window": "1s"})");
    EXPECT_EQ(defaults.limit, 5u);
    EXPECT_EQ(defaults.window, 1000ms);
    EXPECT_EQ(defaults.key_source, KeySource::client_ip);
    EXPECT_FALSE(defaults.distributed);
    EXPECT_TRUE(defaults.fail_open);

    auto header = options_for(
        R"({"limit": 100, "window": 60000, "key_source": "header:X-Api-Key",
            "backend": "distributed", "on_backend_unavailable": "fail-closed"})");
    EXPECT_EQ(header.window, 60000ms);
    EXPECT_EQ(header.key_source, KeySource::header);
    EXPECT_EQ(header.header_name, "x-api-key");
    EXPECT_TRUE(header.distributed);
    EXPECT_FALSE(header.fail_open);

    EXPECT_EQ(options_for(R"({"limit": 1, "window": "2m", "key_source": "route"})").key_source,
              KeySource::route);
}

TEST(RateLimitOptionsTest, RejectsInvalidOptions) {
    EXPECT_THROW(options_for(R"({"window": "1s"})"), config::ConfigError);
    EXPECT_THROW(options_for(R"({"limit": 0, "window": "1s"})"), config::ConfigError);
    EXPECT_THROW(options_for(R"({"limit": "5", "window": "1s"})"), config::ConfigError);
    EXPECT_THROW(options_for(R"({"limit": 5})"), config::ConfigError);
    EXPECT_THROW(options_for(R"({"limit": 5, "window": "soon"})"), config::ConfigError);
    EXPECT_THROW(options_for(R"({"limit": 5, "window": "1s", "key_source": "cookie"})"), config::ConfigError);
    EXPECT_THROW(options_for(R"({"limit": 5, "window": "1s", "key_source": "header:"})"), config::ConfigError);
    EXPECT_THROW(options_for(R"({"limit": 5, "window": "1s", "backend": "memcached"})"), config::ConfigError);
    EXPECT_THROW(options_for(R"({"limit": 5, "window": "1s", "on_backend_unavailable": "ignore"})"),
                 config::ConfigError);
    EXPECT_THROW(options_for(R"([5])"), config::ConfigError);
}

TEST(RateLimitOptionsTest, RejectsLimitsThatOverflowTheWindowArithmetic) {
    // 2^51 / 1000 rounded down
    EXPECT_EQ(options_for(R"({"limit": 2251799813685, "window": "1s"})").limit, 2251799813685u);
    EXPECT_THROW(options_for(R"({"limit": 2251799813686, "window": "1s"})"), config::ConfigError);
    EXPECT_THROW(options_for(R"({"limit": 9223372036854775807, "window": "1h"})"), config::ConfigError);
}

TEST(RateLimitPluginTest, KeysCombineScopeAndIdentity) {
    auto limiter = std::make_shared<FixedLimiter>(ratelimit::RateLimitDecision{});
    auto ctx = make_context("10.0.0.7");
    ctx->request.message.set("X-Api-Key", "abc");

    RateLimitPlugin by_ip("route:orders#0", options_for(R"({"limit": 5, "window": "1s"})"), limiter);
    EXPECT_EQ(by_ip.key_for(*ctx), "route:orders#0|ip:10.0.0.7");

    RateLimitPlugin by_header("route:orders#1",
        options_for(R"({"limit": 5, "window": "1s", "key_source": "header:x-api-key"})"), limiter);
    EXPECT_EQ(by_header.key_for(*ctx), "route:orders#1|h:abc");

    // Missing header falls back to the client address
    EXPECT_EQ(by_header.key_for(*make_context("10.0.0.9")), "route:orders#1|ip:10.0.0.9");

    RateLimitPlugin by_route("global#0",
        options_for(R"({"limit": 5, "window": "1s", "key_source": "route"})"), limiter);
    EXPECT_EQ(by_route.key_for(*ctx), "global#0|*");
}

TEST(RateLimitPluginTest, FifthAdmittedSixthRejectedWithRetryAfter) {
    constexpr std::int64_t window_start = 1'700'000'000'000;
    auto limiter = std::make_shared<ratelimit::LocalRateLimiter>(
        ratelimit::LocalLimiterConfig{}, [] { return window_start; });
    RateLimitPlugin plugin("route:api#0", options_for(R"({"limit": 5, "window": "1s"})"), limiter);

    for (int i = 0; i < 5; ++i) {
        auto ctx = make_context();
        auto result = run_request(plugin, ctx);
        EXPECT_EQ(result.action, pipeline::HookResult::Action::proceed) << "request " << i;
        EXPECT_EQ(ctx->attributes["ratelimit.outcome"], "admit");

        auto response = server::make_response(http::status::ok, 11, "ok");
        std::optional<pipeline::HookResult> post;
        plugin.on_response(ctx, response, [&](pipeline::HookResult r) { post = std::move(r); });
        ASSERT_TRUE(post.has_value());
        EXPECT_EQ(response.message["X-RateLimit-Limit"], "5");
        EXPECT_EQ(response.message["X-RateLimit-Remaining"], std::to_string(4 - i));
    }

    auto ctx = make_context();
    auto result = run_request(plugin, ctx);
    ASSERT_EQ(result.action, pipeline::HookResult::Action::respond);
    const auto& denied = result.response->message;
    EXPECT_EQ(denied.result_int(), 429u);
    EXPECT_EQ(denied[http::field::retry_after], "2");
    EXPECT_EQ(denied["X-RateLimit-Limit"], "5");
    EXPECT_EQ(denied["X-RateLimit-Remaining"], "0");
    ASSERT_TRUE(ctx->error.has_value());
    EXPECT_EQ(ctx->error->kind, pipeline::ErrorKind::rate_limit_exceeded);
    EXPECT_EQ(ctx->error->retry_after, 1200ms);
    EXPECT_EQ(ctx->attributes["ratelimit.outcome"], "deny");
}

TEST(RateLimitPluginTest, UnavailableBackendFailsOpenByDefault) {
    auto limiter = std::make_shared<FixedLimiter>(
        ratelimit::RateLimitDecision{.outcome = ratelimit::Outcome::backend_unavailable});
    RateLimitPlugin plugin("route:api#0",
        options_for(R"({"limit": 5, "window": "1s", "backend": "distributed"})"), limiter);

    auto ctx = make_context();
    auto result = run_request(plugin, ctx);
    EXPECT_EQ(result.action, pipeline::HookResult::Action::proceed);
    EXPECT_FALSE(ctx->error.has_value());
    EXPECT_EQ(ctx->attributes["ratelimit.outcome"], "backend_unavailable");
}

TEST(RateLimitPluginTest, UnavailableBackendFailsClosedWith503) {
    auto limiter = std::make_shared<FixedLimiter>(
        ratelimit::RateLimitDecision{.outcome = ratelimit::Outcome::backend_unavailable});
    RateLimitPlugin plugin("route:api#0",
        options_for(R"({"limit": 5, "window": "1s", "backend": "distributed",
                        "on_backend_unavailable": "fail-closed"})"), limiter);

    auto ctx = make_context();
    auto result = run_request(plugin, ctx);
    ASSERT_EQ(result.action, pipeline::HookResult::Action::respond);
    EXPECT_EQ(result.response->message.result(), http::status::service_unavailable);
    ASSERT_TRUE(ctx->error.has_value());
    EXPECT_EQ(ctx->error->kind, pipeline::ErrorKind::rate_limit_backend_unavailable);
}

TEST(RateLimitPluginTest, RegistryRejectsDistributedWithoutStore) {
    pipeline::PluginRegistry registry;
    register_rate_limit_plugin(registry, RateLimitServices{
        .local = std::make_shared<FixedLimiter>(ratelimit::RateLimitDecision{}),
        .distributed = nullptr
    });
    EXPECT_TRUE(registry.contains(rate_limit_type));

    config::PluginConfig local{.type = rate_limit_type,
                               .options = nlohmann::json::parse(R"({"limit": 5, "window": "1s"})")};
    auto plugin = registry.create(local, "route:api#0");
    ASSERT_NE(plugin, nullptr);
    EXPECT_EQ(plugin->type(), "rate-limit");

    config::PluginConfig distributed{.type = rate_limit_type,
        .options = nlohmann::json::parse(R"({"limit": 5, "window": "1s", "backend": "distributed"})")};
    EXPECT_THROW(registry.create(distributed, "route:api#0"), config::ConfigError);

    config::PluginConfig unknown{.type = "jwt", .options = nlohmann::json::object()};
    EXPECT_THROW(registry.create(unknown, "route:api#0"), config::ConfigError);
}

TEST(RateLimitPluginTest, StoreOutageHonorsConfiguredPolicy) {
    auto limiter = std::make_shared<ratelimit::DistributedRateLimiter>(std::make_shared<UnreachableStore>());

    RateLimitPlugin open("route:api#0",
        options_for(R"({"limit": 1, "window": "1s", "backend": "distributed"})"), limiter);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(run_request(open, make_context()).action, pipeline::HookResult::Action::proceed);
    }

    RateLimitPlugin closed("route:api#1",
        options_for(R"({"limit": 1, "window": "1s", "backend": "distributed",
                        "on_backend_unavailable": "fail-closed"})"), limiter);
    auto ctx = make_context();
    EXPECT_EQ(run_request(closed, ctx).action, pipeline::HookResult::Action::respond);
    ASSERT_TRUE(ctx->error.has_value());
    EXPECT_EQ(ctx->error->kind, pipeline::ErrorKind::rate_limit_backend_unavailable);
}
