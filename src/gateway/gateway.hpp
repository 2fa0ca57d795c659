/**
 * PORTWAY - API Gateway Request Kernel
 * Gateway - request entry point: route, plugin chain, upstream
 */

#ifndef PORTWAY_GATEWAY_GATEWAY_HPP
#define PORTWAY_GATEWAY_GATEWAY_HPP

#include "config/snapshot.hpp"
#include "pipeline/executor.hpp"
#include "pipeline/request_context.hpp"
#include "routing/router.hpp"
#include "server/http_message.hpp"

#include <chrono>
#include <memory>

namespace portway::gateway {

/**
 * Gateway settings
 */
struct GatewaySettings {
    std::chrono::milliseconds request_timeout{5000};  // Unless the route sets timeout_ms
};

/**
 * Gateway - handles one parsed request per call
 *
 * Flow:
 *   load the current snapshot (held by the request until it completes)
 *   -> match a route (404 without running any plugin when none matches)
 *   -> set the deadline
 *   -> run global default plugins, then the route's plugins, around the
 *      upstream call
 *   -> tag the response with X-Request-ID and write the access log
 *
 * handle() matches server::RequestHandler and returns the cancel handle the
 * session uses when the client disconnects.
 */
class Gateway {
public:
    Gateway(const config::SnapshotStore& store,
            pipeline::UpstreamCall upstream,
            const GatewaySettings& settings = {});

    // Non-copyable
    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    server::CancelHandle handle(server::HttpRequest request, server::ResponseCallback respond);

    /**
     * Router input for a prepared context
     */
    static routing::MatchInput match_input(const pipeline::RequestContext& ctx);

private:
    void complete(const std::shared_ptr<pipeline::RequestContext>& ctx,
                  server::HttpResponse response,
                  const server::ResponseCallback& respond) const;

    const config::SnapshotStore& store_;
    pipeline::Executor executor_;
    GatewaySettings settings_;
};

} // namespace portway::gateway

#endif // PORTWAY_GATEWAY_GATEWAY_HPP
