/**
 * PORTWAY - API Gateway Request Kernel
 * Configuration and snapshot builder tests
 */

#include "config/config.hpp"
#include "config/snapshot_builder.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace portway;
using namespace portway::config;
using namespace std::chrono_literals;

namespace {

namespace ssl = boost::asio::ssl;

/**
 * Plugin recording the scope it was built for
 */
class TagPlugin : public pipeline::Plugin {
public:
    explicit TagPlugin(std::string scope) : scope(std::move(scope)) {}

    std::string_view type() const override { return "tag"; }

    void on_request(const std::shared_ptr<pipeline::RequestContext>&, pipeline::HookCallback done) override {
        done(pipeline::HookResult::proceed());
    }

    std::string scope;
};

constexpr const char* gateway_document = R"({
    "server": {"threads": 2},
    "listeners": [
        {"name": "http", "port": 8080},
        {"name": "https", "port": 8443, "tls": true, "default_certificate": "fallback"}
    ],
    "timeouts": {"connect_ms": 1000, "io_ms": 2000, "request_ms": 3000},
    "retry": {"max_retries": 2, "budget_ratio": 0.1},
    "rate_limit_store": {"enabled": true, "host": "redis.internal", "port": 6380},
    "logging": {"level": "debug", "enable_colors": false},
    "certificates": [
        {"name": "wildcard", "hosts": ["*.example.com"], "cert_file": "wild.crt", "key_file": "wild.key"},
        {"name": "fallback", "hosts": [], "cert_pem": "PEM", "key_pem": "KEY"}
    ],
    "backend_groups": [
        {"name": "api", "policy": "weighted_random", "on_no_healthy": "fail",
         "failure_threshold": 5, "cooldown_ms": 2000, "fail_on_5xx": true,
         "backends": [{"host": "10.0.0.1", "port": 8001, "weight": 3, "timeout_ms": 250},
                      {"host": "10.0.0.2", "port": 8001}]}
    ],
    "default_plugins": [{"type": "tag"}],
    "routes": [
        {"name": "catch-all", "backend_group": "api"},
        {"name": "orders", "hosts": ["api.example.com"], "priority": 10,
         "path": {"type": "prefix", "value": "/orders"}, "method": "post",
         "headers": [{"name": "X-Tenant", "value": "^t-[0-9]+$", "type": "regex"}],
         "query": [{"name": "debug", "value": "1"}],
         "plugins": [{"type": "tag", "options": {"color": "blue"}}],
         "backend_group": "api", "timeout_ms": 1500}
    ]
})";

class SnapshotBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.add("tag", [](const PluginConfig&, const std::string& scope) {
            return std::make_shared<TagPlugin>(scope);
        });
    }

    SnapshotBuilder make_builder() {
        return SnapshotBuilder(registry, health, [this](const CertificateConfig& config) {
            loaded.push_back(config.name);
            if (config.cert_file == "missing.crt") {
                throw std::runtime_error("no such file");
            }
            return std::make_shared<ssl::context>(ssl::context::tls_server);
        });
    }

    GatewayDefinition definition() {
        return ConfigManager::parse(gateway_document).gateway;
    }

    pipeline::PluginRegistry registry;
    std::shared_ptr<balancer::HealthRegistry> health = std::make_shared<balancer::HealthRegistry>();
    std::vector<std::string> loaded;
};

} // anonymous namespace

TEST(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_NO_THROW(config.validate());
    ASSERT_EQ(config.listeners.size(), 1u);
    EXPECT_EQ(config.listeners.front().port, 8080);
    EXPECT_EQ(config.timeouts.request_ms, 5000u);
    EXPECT_FALSE(config.rate_limit_store.enabled);
}

TEST(ConfigTest, ParsesProcessSettings) {
    auto config = ConfigManager::parse(gateway_document);
    EXPECT_NO_THROW(config.validate());

    EXPECT_EQ(config.server.threads, 2u);
    ASSERT_EQ(config.listeners.size(), 2u);
    EXPECT_EQ(config.listeners[1].name, "https");
    EXPECT_TRUE(config.listeners[1].tls);
    EXPECT_EQ(config.listeners[1].default_certificate, "fallback");
    EXPECT_EQ(config.timeouts.io_ms, 2000u);
    EXPECT_EQ(config.retry.max_retries, 2u);
    EXPECT_DOUBLE_EQ(config.retry.budget_ratio, 0.1);
    EXPECT_TRUE(config.rate_limit_store.enabled);
    EXPECT_EQ(config.rate_limit_store.host, "redis.internal");
    EXPECT_EQ(config.rate_limit_store.port, 6380);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_FALSE(config.logging.enable_colors);
}

TEST(ConfigTest, ParsesGatewayDefinition) {
    auto gateway = ConfigManager::parse(gateway_document).gateway;

    ASSERT_EQ(gateway.certificates.size(), 2u);
    EXPECT_EQ(gateway.certificates[0].hosts, std::vector<std::string>{"*.example.com"});
    EXPECT_EQ(gateway.certificates[1].cert_pem, "PEM");

    ASSERT_EQ(gateway.backend_groups.size(), 1u);
    const auto& group = gateway.backend_groups[0];
    EXPECT_EQ(group.policy, "weighted_random");
    ASSERT_EQ(group.backends.size(), 2u);
    EXPECT_EQ(group.backends[0].weight, 3u);
    ASSERT_TRUE(group.backends[0].timeout_ms.has_value());
    EXPECT_EQ(*group.backends[0].timeout_ms, 250u);
    EXPECT_FALSE(group.backends[1].timeout_ms.has_value());

    ASSERT_EQ(gateway.routes.size(), 2u);
    const auto& orders = gateway.routes[1];
    EXPECT_EQ(orders.path.type, "prefix");
    EXPECT_EQ(orders.path.value, "/orders");
    ASSERT_EQ(orders.headers.size(), 1u);
    EXPECT_EQ(orders.headers[0].type, "regex");
    ASSERT_EQ(orders.plugins.size(), 1u);
    EXPECT_EQ(orders.plugins[0].options["color"], "blue");
    ASSERT_TRUE(orders.timeout_ms.has_value());
    EXPECT_EQ(*orders.timeout_ms, 1500u);
}

TEST(ConfigTest, RejectsMalformedDocuments) {
    EXPECT_THROW(ConfigManager::parse("{not json"), ConfigError);
    EXPECT_THROW(ConfigManager::parse(R"({"listeners": [{"port": "eighty"}]})"), ConfigError);
}

TEST(ConfigTest, ValidateRejectsBadProcessSettings) {
    auto with = [](const char* json) { return ConfigManager::parse(json); };

    EXPECT_THROW(with(R"({"listeners": []})").validate(), ConfigError);
    EXPECT_THROW(with(R"({"listeners": [{"port": 0}]})").validate(), ConfigError);
    EXPECT_THROW(with(R"({"listeners": [{"name": "a", "port": 80}, {"name": "a", "port": 81}]})").validate(),
                 ConfigError);
    EXPECT_THROW(with(R"({"listeners": [{"name": "a", "port": 80}, {"name": "b", "port": 80}]})").validate(),
                 ConfigError);
    EXPECT_THROW(with(R"({"timeouts": {"connect_ms": 0}})").validate(), ConfigError);
    EXPECT_THROW(with(R"({"retry": {"budget_cap": 0.5}})").validate(), ConfigError);
    EXPECT_THROW(with(R"({"rate_limit_store": {"enabled": true, "host": ""}})").validate(), ConfigError);
}

TEST(ConfigTest, ParsesDurations) {
    EXPECT_EQ(parse_duration(nlohmann::json(250)), 250ms);
    EXPECT_EQ(parse_duration(nlohmann::json("500ms")), 500ms);
    EXPECT_EQ(parse_duration(nlohmann::json("1500")), 1500ms);
    EXPECT_EQ(parse_duration(nlohmann::json("1s")), 1000ms);
    EXPECT_EQ(parse_duration(nlohmann::json("2m")), 120000ms);
    EXPECT_EQ(parse_duration(nlohmann::json("1h")), 3600000ms);

    EXPECT_THROW(parse_duration(nlohmann::json(0)), ConfigError);
    EXPECT_THROW(parse_duration(nlohmann::json(-5)), ConfigError);
    EXPECT_THROW(parse_duration(nlohmann::json("s")), ConfigError);
    EXPECT_THROW(parse_duration(nlohmann::json("5d")), ConfigError);
    EXPECT_THROW(parse_duration(nlohmann::json(1.5)), ConfigError);
}

TEST_F(SnapshotBuilderTest, BuildsCompiledSnapshot) {
    auto snapshot = make_builder().build(definition(), 7);

    EXPECT_EQ(snapshot->generation, 7u);
    EXPECT_EQ(loaded, (std::vector<std::string>{"wildcard", "fallback"}));
    ASSERT_EQ(snapshot->certificates.size(), 2u);
    EXPECT_EQ(snapshot->certificates[1].order, 1u);
    EXPECT_NE(snapshot->find_certificate("fallback"), nullptr);
    EXPECT_EQ(snapshot->find_certificate("missing"), nullptr);

    auto group = snapshot->find_backend_group("api");
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->backend_count(), 2u);
    EXPECT_EQ(group->settings().policy, balancer::Policy::weighted_random);
    EXPECT_EQ(group->settings().on_no_healthy, balancer::NoHealthyPolicy::fail);
    EXPECT_EQ(group->settings().health.cooldown, 2000ms);
    EXPECT_EQ(snapshot->find_backend_group("other"), nullptr);

    ASSERT_EQ(snapshot->default_plugins.size(), 1u);
    EXPECT_EQ(std::static_pointer_cast<TagPlugin>(snapshot->default_plugins[0])->scope, "global#0");

    // Higher priority first, declaration order otherwise
    ASSERT_EQ(snapshot->routes.size(), 2u);
    const auto& orders = snapshot->routes[0];
    EXPECT_EQ(orders.name, "orders");
    EXPECT_EQ(orders.order, 1u);
    EXPECT_EQ(orders.method, "POST");
    EXPECT_EQ(orders.path.kind, routing::PathKind::prefix);
    ASSERT_EQ(orders.headers.size(), 1u);
    EXPECT_EQ(orders.headers[0].name, "x-tenant");
    EXPECT_TRUE(orders.headers[0].pattern.has_value());
    ASSERT_TRUE(orders.timeout.has_value());
    EXPECT_EQ(*orders.timeout, 1500ms);
    ASSERT_EQ(orders.plugins.size(), 1u);
    EXPECT_EQ(std::static_pointer_cast<TagPlugin>(orders.plugins[0])->scope, "route:orders#0");

    const auto& catch_all = snapshot->routes[1];
    EXPECT_EQ(catch_all.name, "catch-all");
    ASSERT_EQ(catch_all.hosts.size(), 1u);
    EXPECT_FALSE(catch_all.timeout.has_value());
}

TEST_F(SnapshotBuilderTest, HealthSurvivesRebuildForLiveBackends) {
    auto builder = make_builder();
    builder.build(definition(), 1);
    EXPECT_EQ(health->size(), 2u);

    auto def = definition();
    def.backend_groups[0].backends.pop_back();
    builder.build(def, 2);
    EXPECT_EQ(health->size(), 1u);
}

TEST_F(SnapshotBuilderTest, RejectsInvalidDefinitions) {
    auto builder = make_builder();
    auto expect_rejected = [&](auto mutate) {
        auto def = definition();
        mutate(def);
        EXPECT_THROW(builder.build(def, 1), ConfigError);
    };

    expect_rejected([](GatewayDefinition& d) { d.routes[0].backend_group = "nowhere"; });
    expect_rejected([](GatewayDefinition& d) { d.routes[1].name = "catch-all"; });
    expect_rejected([](GatewayDefinition& d) { d.routes[0].path = PathMatchConfig{.type = "regex", .value = "(["}; });
    expect_rejected([](GatewayDefinition& d) { d.routes[0].path = PathMatchConfig{.type = "glob", .value = "/"}; });
    expect_rejected([](GatewayDefinition& d) { d.routes[0].path = PathMatchConfig{.type = "prefix", .value = "api"}; });
    expect_rejected([](GatewayDefinition& d) { d.routes[0].hosts = {"api.*.com"}; });
    expect_rejected([](GatewayDefinition& d) { d.routes[0].timeout_ms = 0u; });
    expect_rejected([](GatewayDefinition& d) { d.routes[1].headers[0].type = "glob"; });
    expect_rejected([](GatewayDefinition& d) { d.routes[1].plugins[0].type = "unknown"; });
    expect_rejected([](GatewayDefinition& d) { d.default_plugins[0].type = "unknown"; });
    expect_rejected([](GatewayDefinition& d) { d.backend_groups[0].policy = "least_conn"; });
    expect_rejected([](GatewayDefinition& d) { d.backend_groups[0].on_no_healthy = "panic"; });
    expect_rejected([](GatewayDefinition& d) { d.backend_groups[0].backends.clear(); });
    expect_rejected([](GatewayDefinition& d) { d.backend_groups[0].backends[0].weight = 0; });
    expect_rejected([](GatewayDefinition& d) { d.backend_groups.push_back(d.backend_groups[0]); });
    expect_rejected([](GatewayDefinition& d) { d.certificates[1].name = "wildcard"; });
    expect_rejected([](GatewayDefinition& d) { d.certificates[0].name.clear(); });
    expect_rejected([](GatewayDefinition& d) { d.certificates[0].cert_file = "missing.crt"; });
}
