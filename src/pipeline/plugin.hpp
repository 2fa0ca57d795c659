/**
 * PORTWAY - API Gateway Request Kernel
 * Plugin - pre-request and post-response hook contract
 */

#ifndef PORTWAY_PIPELINE_PLUGIN_HPP
#define PORTWAY_PIPELINE_PLUGIN_HPP

#include "pipeline/error.hpp"
#include "pipeline/request_context.hpp"
#include "server/http_message.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace portway::pipeline {

/**
 * Outcome of one hook
 */
struct HookResult {
    enum class Action {
        proceed,  // Continue with the next hook
        respond,  // Short-circuit with response
        fail      // Stop with error (unless the plugin is skippable)
    };

    Action action{Action::proceed};
    std::optional<server::HttpResponse> response;
    std::optional<Error> error;

    static HookResult proceed() { return {}; }

    static HookResult respond(server::HttpResponse response) {
        return HookResult{.action = Action::respond, .response = std::move(response), .error = std::nullopt};
    }

    static HookResult fail(Error error) {
        return HookResult{.action = Action::fail, .response = std::nullopt, .error = std::move(error)};
    }
};

/**
 * Hook completion. Call exactly once, from any thread.
 */
using HookCallback = std::function<void(HookResult)>;

/**
 * Whether a failing plugin stops the request
 */
enum class FailurePolicy {
    fatal,
    skippable
};

/**
 * Plugin interface
 *
 * One instance serves every request of the route (or every route, for
 * global defaults) concurrently. Instance state must be safe under
 * concurrent use. Hooks must not block on I/O; finish them from the
 * completion handler of an asynchronous operation instead.
 */
class Plugin {
public:
    virtual ~Plugin() = default;

    /**
     * Type tag, as registered
     */
    virtual std::string_view type() const = 0;

    virtual FailurePolicy failure_policy() const { return FailurePolicy::fatal; }

    virtual void on_request(const std::shared_ptr<RequestContext>& ctx, HookCallback done) = 0;

    /**
     * response stays valid until done is called
     */
    virtual void on_response(const std::shared_ptr<RequestContext>& ctx,
                             server::HttpResponse& response, HookCallback done) {
        (void)ctx;
        (void)response;
        done(HookResult::proceed());
    }
};

using PluginPtr = std::shared_ptr<Plugin>;

} // namespace portway::pipeline

#endif // PORTWAY_PIPELINE_PLUGIN_HPP
