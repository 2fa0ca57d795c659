/**
 * PORTWAY - API Gateway Request Kernel
 * Config Snapshot implementation
 */

#include "config/snapshot.hpp"

#include <spdlog/spdlog.h>

namespace portway::config {

const CertificateEntry* ConfigSnapshot::find_certificate(std::string_view name) const {
    for (const auto& entry : certificates) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

std::shared_ptr<balancer::LoadBalancer> ConfigSnapshot::find_backend_group(const std::string& name) const {
    auto it = backend_groups.find(name);
    return it == backend_groups.end() ? nullptr : it->second;
}

void SnapshotStore::publish(SnapshotPtr snapshot) {
    if (!snapshot) {
        return;
    }
    const auto generation = snapshot->generation;
    const auto routes = snapshot->routes.size();
    const auto certificates = snapshot->certificates.size();
    current_.store(std::move(snapshot), std::memory_order_release);
    spdlog::info("SnapshotStore: Published generation {} ({} routes, {} certificates)",
                 generation, routes, certificates);
}

} // namespace portway::config
