/**
 * PORTWAY - API Gateway Request Kernel
 * Gateway implementation
 */

#include "gateway/gateway.hpp"

#include "proxy/forwarder.hpp"
#include "routing/host_pattern.hpp"
#include "routing/route.hpp"
#include "util/logger.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace portway::gateway {

namespace http = boost::beast::http;

Gateway::Gateway(const config::SnapshotStore& store,
                 pipeline::UpstreamCall upstream,
                 const GatewaySettings& settings)
    : store_(store)
    , executor_(std::move(upstream))
    , settings_(settings)
{
}

routing::MatchInput Gateway::match_input(const pipeline::RequestContext& ctx) {
    routing::MatchInput input{
        .host = ctx.host,
        .path = ctx.path,
        .method = std::string(ctx.request.message.method_string()),
        .headers = {},
        .query = ctx.query
    };

    for (const auto& field : ctx.request.message) {
        std::string name(field.name_string().data(), field.name_string().size());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        input.headers.emplace_back(std::move(name),
                                   std::string(field.value().data(), field.value().size()));
    }
    return input;
}

server::CancelHandle Gateway::handle(server::HttpRequest request, server::ResponseCallback respond) {
    const unsigned version = request.message.version();
    auto ctx = std::make_shared<pipeline::RequestContext>(std::move(request));

    if (auto id = ctx->header("X-Request-ID"); id && !id->empty()) {
        ctx->request_id = std::string(*id);
    } else {
        ctx->request_id = proxy::Forwarder::generate_request_id();
    }

    if (auto host = ctx->header("Host"); host && !host->empty()) {
        ctx->host = routing::normalize_host(*host);
    } else {
        ctx->host = routing::normalize_host(ctx->request.sni);
    }

    ctx->snapshot = store_.current();
    if (!ctx->snapshot) {
        spdlog::error("Gateway: No configuration snapshot published");
        complete(ctx, server::make_error_response(http::status::service_unavailable, version,
                                                  "Gateway not configured"), respond);
        return {};
    }

    ctx->route = routing::Router::match(ctx->snapshot->routes, match_input(*ctx));
    if (!ctx->route) {
        ctx->error = pipeline::Error{
            .kind = pipeline::ErrorKind::no_route,
            .message = "no route matches " + ctx->host + ctx->path
        };
        spdlog::debug("Gateway: {} for request {}", ctx->error->message, ctx->request_id);
        complete(ctx, pipeline::error_response(*ctx->error, version), respond);
        return {};
    }

    const auto timeout = ctx->route->timeout ? *ctx->route->timeout : settings_.request_timeout;
    ctx->deadline = ctx->started + timeout;

    std::vector<pipeline::PluginPtr> chain;
    chain.reserve(ctx->snapshot->default_plugins.size() + ctx->route->plugins.size());
    chain.insert(chain.end(), ctx->snapshot->default_plugins.begin(), ctx->snapshot->default_plugins.end());
    chain.insert(chain.end(), ctx->route->plugins.begin(), ctx->route->plugins.end());

    spdlog::debug("Gateway: Request {} matched route '{}' ({} plugins)",
                  ctx->request_id, ctx->route->name, chain.size());

    executor_.run(ctx, std::move(chain),
        [this, ctx, respond](server::HttpResponse response) {
            complete(ctx, std::move(response), respond);
        });

    return [ctx]() { ctx->cancel(); };
}

void Gateway::complete(const std::shared_ptr<pipeline::RequestContext>& ctx,
                       server::HttpResponse response,
                       const server::ResponseCallback& respond) const {
    response.message.set("X-Request-ID", ctx->request_id);

    util::AccessLogEntry entry{
        .request_id = ctx->request_id,
        .client_ip = ctx->client_ip(),
        .listener = ctx->request.listener,
        .method = std::string(ctx->request.message.method_string()),
        .path = std::string(ctx->request.message.target()),
        .route = ctx->route ? ctx->route->name : std::string{},
        .status_code = response.message.result_int(),
        .response_size = response.message.body().size(),
        .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            pipeline::RequestContext::Clock::now() - ctx->started),
        .backend = ctx->backend,
        .ratelimit = {},
        .error = ctx->error ? std::string(pipeline::to_string(ctx->error->kind)) : std::string{}
    };
    if (auto it = ctx->attributes.find("ratelimit.outcome"); it != ctx->attributes.end()) {
        entry.ratelimit = it->second;
    }
    util::Logger::instance().access(entry);

    respond(std::move(response));
}

} // namespace portway::gateway
