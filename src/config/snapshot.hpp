/**
 * PORTWAY - API Gateway Request Kernel
 * Config Snapshot - immutable routing and certificate state, swapped atomically
 */

#ifndef PORTWAY_CONFIG_SNAPSHOT_HPP
#define PORTWAY_CONFIG_SNAPSHOT_HPP

#include "balancer/load_balancer.hpp"
#include "pipeline/plugin.hpp"
#include "routing/host_pattern.hpp"
#include "routing/route.hpp"

#include <utility>  // needed before Boost.Asio (awaitable.hpp uses std::exchange)
#include <boost/asio/ssl.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace portway::config {

/**
 * Certificate entry with its ready-to-use OpenSSL context
 */
struct CertificateEntry {
    std::string name;
    std::vector<routing::HostPattern> hosts;
    std::shared_ptr<boost::asio::ssl::context> context;
    std::size_t order{0};
};

/**
 * Config Snapshot
 *
 * Built once by the SnapshotBuilder and never modified after publication.
 * Requests and handshakes hold a shared_ptr to the snapshot they started
 * with, so an old snapshot stays alive until its last user finishes.
 */
struct ConfigSnapshot {
    std::uint64_t generation{0};
    std::vector<routing::Route> routes;  // sorted by priority (desc), then declaration order
    std::vector<CertificateEntry> certificates;
    std::unordered_map<std::string, std::shared_ptr<balancer::LoadBalancer>> backend_groups;
    std::vector<pipeline::PluginPtr> default_plugins;

    const CertificateEntry* find_certificate(std::string_view name) const;

    std::shared_ptr<balancer::LoadBalancer> find_backend_group(const std::string& name) const;
};

using SnapshotPtr = std::shared_ptr<const ConfigSnapshot>;

/**
 * Holder of the currently published snapshot.
 * current() is a lock-free atomic load; publish() an atomic store.
 */
class SnapshotStore {
public:
    SnapshotStore() = default;

    // Non-copyable
    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    SnapshotPtr current() const {
        return current_.load(std::memory_order_acquire);
    }

    /**
     * Replace the published snapshot. In-flight users keep the old one.
     */
    void publish(SnapshotPtr snapshot);

    /**
     * Generation number for the next snapshot to build
     */
    std::uint64_t next_generation() {
        return generation_.fetch_add(1, std::memory_order_relaxed) + 1;
    }

private:
    std::atomic<SnapshotPtr> current_;
    std::atomic<std::uint64_t> generation_{0};
};

} // namespace portway::config

#endif // PORTWAY_CONFIG_SNAPSHOT_HPP
