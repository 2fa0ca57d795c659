/**
 * PORTWAY - API Gateway Request Kernel
 * Rate Limit Plugin - sliding window quota per client identity
 */

#ifndef PORTWAY_PLUGINS_RATE_LIMIT_PLUGIN_HPP
#define PORTWAY_PLUGINS_RATE_LIMIT_PLUGIN_HPP

#include "pipeline/plugin.hpp"
#include "pipeline/plugin_registry.hpp"
#include "ratelimit/rate_limiter.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace portway::plugins {

inline constexpr const char* rate_limit_type = "rate-limit";

/**
 * Where the client identity comes from
 */
enum class KeySource {
    client_ip,
    header,  // Falls back to the client IP when the header is absent
    route    // One shared bucket for the whole route
};

/**
 * Parsed plugin options:
 *   {limit, window, key_source, backend, on_backend_unavailable}
 */
struct RateLimitOptions {
    std::uint64_t limit{0};
    std::chrono::milliseconds window{1000};
    KeySource key_source{KeySource::client_ip};
    std::string header_name;  // lowercase, for KeySource::header
    bool distributed{false};
    bool fail_open{true};

    /**
     * @throws config::ConfigError on missing or invalid options
     */
    static RateLimitOptions parse(const nlohmann::json& options);
};

/**
 * Limiters shared by every rate-limit plugin instance
 */
struct RateLimitServices {
    std::shared_ptr<ratelimit::RateLimiter> local;
    std::shared_ptr<ratelimit::RateLimiter> distributed;  // null when no store is configured
};

/**
 * Rate Limit Plugin
 *
 * Pre hook: check "<scope>|<identity>" against the configured limiter.
 *   admit                -> continue
 *   deny                 -> 429 with Retry-After, X-RateLimit-Limit, X-RateLimit-Remaining: 0
 *   backend unavailable  -> fail-open: continue with a warning
 *                           fail-closed: 503, distinct from a quota breach
 * Post hook: X-RateLimit-Limit and X-RateLimit-Remaining on admitted responses.
 *
 * An admitted increment is never rolled back, even if the request later fails.
 */
class RateLimitPlugin : public pipeline::Plugin {
public:
    RateLimitPlugin(std::string scope, RateLimitOptions options,
                    std::shared_ptr<ratelimit::RateLimiter> limiter);

    std::string_view type() const override { return rate_limit_type; }

    void on_request(const std::shared_ptr<pipeline::RequestContext>& ctx,
                    pipeline::HookCallback done) override;

    void on_response(const std::shared_ptr<pipeline::RequestContext>& ctx,
                     server::HttpResponse& response,
                     pipeline::HookCallback done) override;

    /**
     * Limiter key for a request
     */
    std::string key_for(const pipeline::RequestContext& ctx) const;

    const RateLimitOptions& options() const { return options_; }

private:
    std::string scope_;
    RateLimitOptions options_;
    std::shared_ptr<ratelimit::RateLimiter> limiter_;
};

/**
 * Register the "rate-limit" type with the registry
 */
void register_rate_limit_plugin(pipeline::PluginRegistry& registry, RateLimitServices services);

} // namespace portway::plugins

#endif // PORTWAY_PLUGINS_RATE_LIMIT_PLUGIN_HPP
