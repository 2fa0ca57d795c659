/**
 * PORTWAY - API Gateway Request Kernel
 * Rate Limit Plugin implementation
 */

#include "plugins/rate_limit_plugin.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace portway::plugins {

namespace {

constexpr const char* attr_outcome = "ratelimit.outcome";
constexpr const char* attr_limit = "ratelimit.limit";
constexpr const char* attr_remaining = "ratelimit.remaining";

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string string_option(const nlohmann::json& options, const char* name, const char* fallback) {
    if (!options.contains(name)) {
        return fallback;
    }
    const auto& value = options.at(name);
    if (!value.is_string()) {
        throw config::ConfigError(std::string("rate-limit: '") + name + "' must be a string");
    }
    return value.get<std::string>();
}

} // anonymous namespace

RateLimitOptions RateLimitOptions::parse(const nlohmann::json& options) {
    RateLimitOptions result;

    if (!options.is_object()) {
        throw config::ConfigError("rate-limit: options must be an object");
    }

    if (!options.contains("limit") || !options.at("limit").is_number_integer()) {
        throw config::ConfigError("rate-limit: 'limit' must be an integer > 0");
    }
    const auto limit = options.at("limit").get<std::int64_t>();
    if (limit <= 0) {
        throw config::ConfigError("rate-limit: 'limit' must be an integer > 0");
    }
    result.limit = static_cast<std::uint64_t>(limit);

    if (!options.contains("window")) {
        throw config::ConfigError("rate-limit: 'window' is required");
    }
    result.window = config::parse_duration(options.at("window"));

    // Every term of the admission test, (2 * limit + 1) * window at most,
    // must stay exact in 64-bit integers and in the store's Lua numbers
    constexpr std::uint64_t max_weighted_limit = std::uint64_t{1} << 51;
    const auto window_ms = static_cast<std::uint64_t>(std::max<std::int64_t>(result.window.count(), 1));
    if (result.limit > max_weighted_limit / window_ms) {
        throw config::ConfigError("rate-limit: 'limit' x 'window' (ms) must not exceed 2^51");
    }

    const auto key_source = string_option(options, "key_source", "client-ip");
    if (key_source == "client-ip") {
        result.key_source = KeySource::client_ip;
    } else if (key_source == "route") {
        result.key_source = KeySource::route;
    } else if (key_source.starts_with("header:") && key_source.size() > 7) {
        result.key_source = KeySource::header;
        result.header_name = lowercase(key_source.substr(7));
    } else {
        throw config::ConfigError("rate-limit: unknown key_source '" + key_source + "'");
    }

    const auto backend = string_option(options, "backend", "local");
    if (backend == "local") {
        result.distributed = false;
    } else if (backend == "distributed") {
        result.distributed = true;
    } else {
        throw config::ConfigError("rate-limit: unknown backend '" + backend + "'");
    }

    const auto policy = string_option(options, "on_backend_unavailable", "fail-open");
    if (policy == "fail-open") {
        result.fail_open = true;
    } else if (policy == "fail-closed") {
        result.fail_open = false;
    } else {
        throw config::ConfigError("rate-limit: unknown on_backend_unavailable '" + policy + "'");
    }

    return result;
}

RateLimitPlugin::RateLimitPlugin(std::string scope, RateLimitOptions options,
                                 std::shared_ptr<ratelimit::RateLimiter> limiter)
    : scope_(std::move(scope))
    , options_(std::move(options))
    , limiter_(std::move(limiter))
{
}

std::string RateLimitPlugin::key_for(const pipeline::RequestContext& ctx) const {
    std::string identity;
    switch (options_.key_source) {
        case KeySource::route:
            identity = "*";
            break;
        case KeySource::header:
            if (auto value = ctx.header(options_.header_name); value && !value->empty()) {
                identity = "h:" + std::string(*value);
                break;
            }
            [[fallthrough]];
        case KeySource::client_ip:
            identity = "ip:" + ctx.client_ip();
            break;
    }
    return scope_ + "|" + identity;
}

void RateLimitPlugin::on_request(const std::shared_ptr<pipeline::RequestContext>& ctx,
                                 pipeline::HookCallback done) {
    const auto limit = options_.limit;
    const bool fail_open = options_.fail_open;
    auto key = key_for(*ctx);

    limiter_->async_check(key, limit, options_.window,
        [ctx, done = std::move(done), limit, fail_open, key](ratelimit::RateLimitDecision decision) {
            ctx->attributes[attr_outcome] = std::string(ratelimit::to_string(decision.outcome));

            switch (decision.outcome) {
                case ratelimit::Outcome::admit:
                    ctx->attributes[attr_limit] = std::to_string(limit);
                    ctx->attributes[attr_remaining] = std::to_string(decision.remaining);
                    done(pipeline::HookResult::proceed());
                    return;

                case ratelimit::Outcome::deny: {
                    pipeline::Error error{
                        .kind = pipeline::ErrorKind::rate_limit_exceeded,
                        .message = "rate limit exceeded",
                        .status_hint = 429,
                        .retry_after = decision.retry_after
                    };
                    auto response = pipeline::error_response(error, ctx->request.message.version());
                    response.message.set("X-RateLimit-Limit", std::to_string(limit));
                    response.message.set("X-RateLimit-Remaining", "0");
                    spdlog::debug("RateLimitPlugin: Denied '{}' (retry after {}ms)",
                                  key, decision.retry_after.count());
                    ctx->error = std::move(error);
                    done(pipeline::HookResult::respond(std::move(response)));
                    return;
                }

                case ratelimit::Outcome::backend_unavailable:
                    if (fail_open) {
                        spdlog::warn("RateLimitPlugin: Counter store unavailable, admitting '{}'", key);
                        done(pipeline::HookResult::proceed());
                        return;
                    }
                    {
                        pipeline::Error error{
                            .kind = pipeline::ErrorKind::rate_limit_backend_unavailable,
                            .message = "rate limit backend unavailable",
                            .status_hint = 503,
                            .retry_after = std::nullopt
                        };
                        auto response = pipeline::error_response(error, ctx->request.message.version());
                        ctx->error = std::move(error);
                        done(pipeline::HookResult::respond(std::move(response)));
                    }
                    return;
            }
        });
}

void RateLimitPlugin::on_response(const std::shared_ptr<pipeline::RequestContext>& ctx,
                                  server::HttpResponse& response,
                                  pipeline::HookCallback done) {
    auto limit = ctx->attributes.find(attr_limit);
    auto remaining = ctx->attributes.find(attr_remaining);
    if (limit != ctx->attributes.end() && remaining != ctx->attributes.end()) {
        response.message.set("X-RateLimit-Limit", limit->second);
        response.message.set("X-RateLimit-Remaining", remaining->second);
    }
    done(pipeline::HookResult::proceed());
}

void register_rate_limit_plugin(pipeline::PluginRegistry& registry, RateLimitServices services) {
    registry.add(rate_limit_type,
        [services = std::move(services)](const config::PluginConfig& config, const std::string& scope) {
            auto options = RateLimitOptions::parse(config.options);

            std::shared_ptr<ratelimit::RateLimiter> limiter = options.distributed
                ? services.distributed
                : services.local;
            if (!limiter) {
                throw config::ConfigError("rate-limit in " + scope +
                    ": backend 'distributed' requires rate_limit_store to be enabled");
            }

            return std::make_shared<RateLimitPlugin>(scope, std::move(options), std::move(limiter));
        });
}

} // namespace portway::plugins
