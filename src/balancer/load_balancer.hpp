/**
 * PORTWAY - API Gateway Request Kernel
 * Load Balancer - backend selection within one backend group
 */

#ifndef PORTWAY_BALANCER_LOAD_BALANCER_HPP
#define PORTWAY_BALANCER_LOAD_BALANCER_HPP

#include "config/config.hpp"
#include "balancer/backend_health.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portway::balancer {

/**
 * Selection policy among eligible backends
 */
enum class Policy {
    round_robin,      // Smooth weighted round-robin
    weighted_random,
    random
};

/**
 * What to do when every backend is unhealthy
 */
enum class NoHealthyPolicy {
    fail_open,  // Select among all backends
    fail        // Return no backend
};

std::optional<Policy> policy_from_string(std::string_view name);
std::optional<NoHealthyPolicy> no_healthy_policy_from_string(std::string_view name);

/**
 * Group-level settings
 */
struct GroupSettings {
    std::string name;
    Policy policy{Policy::round_robin};
    NoHealthyPolicy on_no_healthy{NoHealthyPolicy::fail_open};
    HealthPolicy health;
    bool fail_on_5xx{false};  // Count 5xx responses as failures
};

/**
 * Result of backend selection
 */
struct BackendSelection {
    config::BackendConfig backend;
    std::size_t index;  // Index in the group's backend list
};

/**
 * Load Balancer for one backend group
 *
 * The backend list is fixed at construction (a new balancer is built with
 * every snapshot); health lives in the shared HealthRegistry.
 *
 * Round-robin uses Smooth Weighted Round-Robin (SWRR):
 * 1. Each backend has an effective weight (current_weight) that changes each round
 * 2. On each selection, pick backend with highest current_weight
 * 3. Decrease selected backend's weight by total_weight
 * 4. Increase all backends' current_weight by their configured weight
 *
 * This ensures backends with weight [5, 1, 1] get selected in pattern like:
 * A, A, B, A, A, C, A (distributed, not A,A,A,A,A,B,C)
 */
class LoadBalancer {
public:
    LoadBalancer(GroupSettings settings,
                 const std::vector<config::BackendConfig>& backends,
                 std::shared_ptr<HealthRegistry> health);

    // Non-copyable
    LoadBalancer(const LoadBalancer&) = delete;
    LoadBalancer& operator=(const LoadBalancer&) = delete;

    /**
     * Select a backend, avoiding indexes in exclude when any alternative is eligible.
     * @return nullopt when the group is empty, or nothing is healthy under NoHealthyPolicy::fail
     *
     * Thread-safe: can be called from multiple threads concurrently
     */
    std::optional<BackendSelection> select_backend(const std::vector<std::size_t>& exclude = {});

    /**
     * Passive health reports from the forwarder
     */
    void report_success(std::size_t index);
    void report_failure(std::size_t index);

    /**
     * Report a completed response; 5xx counts as failure when fail_on_5xx is set
     */
    void report_status(std::size_t index, unsigned status);

    std::size_t backend_count() const { return backends_.size(); }
    std::size_t healthy_backend_count() const;
    std::uint32_t total_weight() const { return total_weight_; }

    const GroupSettings& settings() const { return settings_; }
    const std::string& name() const { return settings_.name; }

private:
    struct Slot {
        config::BackendConfig config;
        std::shared_ptr<BackendHealth> health;
        std::atomic<std::int64_t> current_weight{0};  // Mutable weight for SWRR
    };

    std::size_t pick_round_robin(const std::vector<std::size_t>& candidates);
    std::size_t pick_weighted_random(const std::vector<std::size_t>& candidates) const;
    std::size_t pick_random(const std::vector<std::size_t>& candidates) const;

    GroupSettings settings_;
    std::shared_ptr<HealthRegistry> health_;
    std::vector<std::unique_ptr<Slot>> backends_;
    std::uint32_t total_weight_{0};
};

} // namespace portway::balancer

#endif // PORTWAY_BALANCER_LOAD_BALANCER_HPP
