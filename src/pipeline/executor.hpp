/**
 * PORTWAY - API Gateway Request Kernel
 * Pipeline Executor - runs the plugin chain around exactly one upstream call
 */

#ifndef PORTWAY_PIPELINE_EXECUTOR_HPP
#define PORTWAY_PIPELINE_EXECUTOR_HPP

#include "pipeline/error.hpp"
#include "pipeline/plugin.hpp"
#include "pipeline/request_context.hpp"
#include "server/http_message.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace portway::pipeline {

/**
 * Result of the upstream call: a response or an error
 */
struct UpstreamResult {
    std::optional<server::HttpResponse> response;
    std::optional<Error> error;
};

using UpstreamCallback = std::function<void(UpstreamResult)>;

/**
 * The upstream call: select a backend, forward, deliver the result once
 */
using UpstreamCall = std::function<void(const std::shared_ptr<RequestContext>&, UpstreamCallback)>;

/**
 * Completion of a pipeline run. Always called exactly once.
 */
using PipelineCallback = std::function<void(server::HttpResponse)>;

/**
 * Pipeline Executor
 *
 * Order within one request:
 *   pre-request hooks in chain order
 *   -> one upstream call
 *   -> post-response hooks in chain order
 *
 * A pre hook that responds skips every later hook and the upstream call. A
 * failing hook stops the chain unless its plugin is skippable. Exceptions
 * escaping a hook become plugin errors. Deadline and cancellation are
 * checked before every step. Upstream errors are answered directly, without
 * post hooks.
 */
class Executor {
public:
    explicit Executor(UpstreamCall upstream);

    // Non-copyable
    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    void run(std::shared_ptr<RequestContext> ctx,
             std::vector<PluginPtr> chain,
             PipelineCallback done) const;

private:
    class Run;

    UpstreamCall upstream_;
};

} // namespace portway::pipeline

#endif // PORTWAY_PIPELINE_EXECUTOR_HPP
