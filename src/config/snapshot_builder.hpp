/**
 * PORTWAY - API Gateway Request Kernel
 * Snapshot Builder - compiles a gateway definition into a Config Snapshot
 */

#ifndef PORTWAY_CONFIG_SNAPSHOT_BUILDER_HPP
#define PORTWAY_CONFIG_SNAPSHOT_BUILDER_HPP

#include "balancer/backend_health.hpp"
#include "config/config.hpp"
#include "config/snapshot.hpp"
#include "pipeline/plugin_registry.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio/ssl.hpp>

#include <functional>
#include <memory>

namespace portway::config {

/**
 * Produces the OpenSSL context for one certificate entry
 */
using CertificateLoader =
    std::function<std::shared_ptr<boost::asio::ssl::context>(const CertificateConfig&)>;

/**
 * Snapshot Builder
 *
 * Validates everything a request or handshake could trip over later:
 * unknown backend groups, bad regexes and host patterns, duplicate names,
 * plugin options, unreadable certificates. Any problem throws ConfigError
 * and nothing is published, so the previous snapshot keeps serving.
 */
class SnapshotBuilder {
public:
    SnapshotBuilder(const pipeline::PluginRegistry& plugins,
                    std::shared_ptr<balancer::HealthRegistry> health,
                    CertificateLoader certificate_loader);

    /**
     * @throws ConfigError
     */
    std::shared_ptr<ConfigSnapshot> build(const GatewayDefinition& definition,
                                          std::uint64_t generation) const;

private:
    void build_certificates(const GatewayDefinition& definition, ConfigSnapshot& snapshot) const;
    void build_backend_groups(const GatewayDefinition& definition, ConfigSnapshot& snapshot) const;
    void build_routes(const GatewayDefinition& definition, ConfigSnapshot& snapshot) const;

    const pipeline::PluginRegistry& plugins_;
    std::shared_ptr<balancer::HealthRegistry> health_;
    CertificateLoader certificate_loader_;
};

} // namespace portway::config

#endif // PORTWAY_CONFIG_SNAPSHOT_BUILDER_HPP
