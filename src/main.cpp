/**
 * PORTWAY - API Gateway Request Kernel
 *
 * A C++20 API gateway: TLS termination with SNI, routing, a pluggable
 * request pipeline with rate limiting, and load-balanced forwarding.
 */

#include "balancer/backend_health.hpp"
#include "config/config.hpp"
#include "config/snapshot.hpp"
#include "config/snapshot_builder.hpp"
#include "gateway/gateway.hpp"
#include "pipeline/plugin_registry.hpp"
#include "plugins/rate_limit_plugin.hpp"
#include "proxy/forwarder.hpp"
#include "proxy/retry_budget.hpp"
#include "ratelimit/distributed_rate_limiter.hpp"
#include "ratelimit/local_rate_limiter.hpp"
#include "server/listener.hpp"
#include "server/server.hpp"
#include "server/tls_context.hpp"
#include "server/tls_resolver.hpp"
#include "store/redis_client.hpp"
#include "store/redis_counter_store.hpp"
#include "util/logger.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

namespace asio = boost::asio;

namespace {

portway::util::LogConfig make_log_config(const portway::config::LogSettings& settings) {
    portway::util::LogConfig log_config;
    log_config.level = portway::util::Logger::parse_level(settings.level)
        .value_or(portway::util::LogLevel::Info);
    log_config.file_path = settings.file;
    log_config.max_file_size_mb = settings.max_file_size_mb;
    log_config.max_files = settings.max_files;
    log_config.enable_console = settings.enable_console;
    log_config.enable_colors = settings.enable_colors;
    return log_config;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace portway;

    try {
        // Load configuration
        config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        auto config = config_manager.get_config();

        util::Logger::init(make_log_config(config.logging));
        spdlog::info("PORTWAY API Gateway v0.1.0");

        server::ServerConfig server_config;
        server_config.thread_count = config.server.threads > 0
            ? config.server.threads
            : std::max(1u, std::thread::hardware_concurrency());

        spdlog::info("Configuration: threads={}, listeners={}, routes={}, backend groups={}",
                     server_config.thread_count, config.listeners.size(),
                     config.gateway.routes.size(), config.gateway.backend_groups.size());

        server::Server server(server_config);
        auto& io_context = server.get_io_context();

        // Passive health survives snapshot swaps
        auto health = std::make_shared<balancer::HealthRegistry>();

        // Rate limiters
        auto local_limiter = std::make_shared<ratelimit::LocalRateLimiter>();
        local_limiter->start_sweeper(io_context);

        plugins::RateLimitServices services{.local = local_limiter, .distributed = nullptr};
        std::shared_ptr<store::RedisClient> store_client;
        if (config.rate_limit_store.enabled) {
            const auto& store_settings = config.rate_limit_store;
            store_client = std::make_shared<store::RedisClient>(io_context, store::ClientConfig{
                .host = store_settings.host,
                .port = store_settings.port,
                .password = store_settings.password,
                .timeout = std::chrono::milliseconds(store_settings.timeout_ms),
                .reconnect_backoff = std::chrono::milliseconds(store_settings.reconnect_backoff_ms)
            });
            services.distributed = std::make_shared<ratelimit::DistributedRateLimiter>(
                std::make_shared<store::RedisCounterStore>(store_client),
                ratelimit::DistributedLimiterConfig{.key_prefix = store_settings.key_prefix});
            spdlog::info("Rate limit store: {}:{} (prefix '{}')",
                         store_settings.host, store_settings.port, store_settings.key_prefix);
        } else {
            spdlog::info("Rate limit store: disabled (distributed limits rejected)");
        }

        // Plugins
        pipeline::PluginRegistry registry;
        plugins::register_rate_limit_plugin(registry, services);

        // Build and publish the first snapshot; a ConfigError aborts startup
        config::SnapshotStore snapshots;
        config::SnapshotBuilder builder(registry, health, server::make_certificate_context);
        snapshots.publish(builder.build(config.gateway, snapshots.next_generation()));

        // Hot reload: a failing build keeps the previous snapshot
        config_manager.on_reload([&builder, &snapshots](const config::GatewayDefinition& definition) {
            snapshots.publish(builder.build(definition, snapshots.next_generation()));
        });

        // Upstream forwarding
        auto budget = std::make_shared<proxy::RetryBudget>(config.retry.budget_ratio, config.retry.budget_cap);
        auto forwarder = std::make_shared<proxy::Forwarder>(io_context, proxy::ForwarderConfig{
            .connect_timeout = std::chrono::milliseconds(config.timeouts.connect_ms),
            .io_timeout = std::chrono::milliseconds(config.timeouts.io_ms),
            .max_retries = config.retry.max_retries
        }, budget);

        gateway::Gateway gateway(
            snapshots,
            [forwarder](const std::shared_ptr<pipeline::RequestContext>& ctx, pipeline::UpstreamCallback done) {
                forwarder->forward(ctx, std::move(done));
            },
            gateway::GatewaySettings{
                .request_timeout = std::chrono::milliseconds(config.timeouts.request_ms)
            });

        server::RequestHandler handler = [&gateway](server::HttpRequest request, server::ResponseCallback respond) {
            return gateway.handle(std::move(request), std::move(respond));
        };

        // Listeners
        server::TlsResolver tls_resolver(snapshots);
        std::vector<std::unique_ptr<server::Listener>> listeners;
        for (const auto& listener_settings : config.listeners) {
            auto listener = std::make_unique<server::Listener>(
                io_context, listener_settings, handler, &tls_resolver);
            listener->start();
            listeners.push_back(std::move(listener));
        }

        server.start(
            [&config_manager]() {
                config_manager.reload();
            },
            [&listeners, &local_limiter, &store_client]() {
                for (auto& listener : listeners) {
                    listener->stop();
                }
                local_limiter->stop_sweeper();
                if (store_client) {
                    store_client->close();
                }
            }
        );

        spdlog::info("Server started successfully");
        spdlog::info("Press Ctrl+C to stop");

        // Wait for shutdown (blocks until signal received)
        server.wait();

        spdlog::info("Server stopped gracefully");
        util::Logger::instance().shutdown();
        return 0;

    } catch (const portway::config::ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
