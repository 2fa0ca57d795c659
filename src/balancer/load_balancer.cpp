/**
 * PORTWAY - API Gateway Request Kernel
 * Load Balancer - Implementation of the selection policies
 */

#include "balancer/load_balancer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <random>

namespace portway::balancer {

namespace {

std::mt19937_64& thread_rng() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

} // anonymous namespace

std::optional<Policy> policy_from_string(std::string_view name) {
    if (name == "round_robin") return Policy::round_robin;
    if (name == "weighted_random") return Policy::weighted_random;
    if (name == "random") return Policy::random;
    return std::nullopt;
}

std::optional<NoHealthyPolicy> no_healthy_policy_from_string(std::string_view name) {
    if (name == "fail_open") return NoHealthyPolicy::fail_open;
    if (name == "fail") return NoHealthyPolicy::fail;
    return std::nullopt;
}

LoadBalancer::LoadBalancer(GroupSettings settings,
                           const std::vector<config::BackendConfig>& backends,
                           std::shared_ptr<HealthRegistry> health)
    : settings_(std::move(settings))
    , health_(std::move(health))
{
    backends_.reserve(backends.size());
    for (const auto& config : backends) {
        auto state = std::make_unique<Slot>();
        state->config = config;
        state->health = health_->get(config);
        total_weight_ += config.weight;
        backends_.push_back(std::move(state));
    }

    spdlog::debug("LoadBalancer: Group '{}' configured with {} backends, total_weight={}",
                  settings_.name, backends_.size(), total_weight_);
}

std::optional<BackendSelection> LoadBalancer::select_backend(const std::vector<std::size_t>& exclude) {
    if (backends_.empty()) {
        spdlog::warn("LoadBalancer: Group '{}' has no backends", settings_.name);
        return std::nullopt;
    }

    const auto now = health_->now();
    auto excluded = [&](std::size_t i) {
        return std::find(exclude.begin(), exclude.end(), i) != exclude.end();
    };

    std::vector<std::size_t> healthy;
    std::vector<std::size_t> candidates;
    healthy.reserve(backends_.size());
    for (std::size_t i = 0; i < backends_.size(); ++i) {
        if (backends_[i]->health->is_healthy(now)) {
            healthy.push_back(i);
            if (!excluded(i)) {
                candidates.push_back(i);
            }
        }
    }

    if (candidates.empty()) {
        candidates = healthy;
    }

    if (candidates.empty()) {
        if (settings_.on_no_healthy == NoHealthyPolicy::fail) {
            spdlog::warn("LoadBalancer: No healthy backends in group '{}'", settings_.name);
            return std::nullopt;
        }
        spdlog::warn("LoadBalancer: No healthy backends in group '{}', failing open", settings_.name);
        for (std::size_t i = 0; i < backends_.size(); ++i) {
            if (!excluded(i)) {
                candidates.push_back(i);
            }
        }
        if (candidates.empty()) {
            for (std::size_t i = 0; i < backends_.size(); ++i) {
                candidates.push_back(i);
            }
        }
    }

    std::size_t selected = 0;
    switch (settings_.policy) {
        case Policy::round_robin:
            selected = pick_round_robin(candidates);
            break;
        case Policy::weighted_random:
            selected = pick_weighted_random(candidates);
            break;
        case Policy::random:
            selected = pick_random(candidates);
            break;
    }

    const auto& backend = backends_[selected]->config;
    spdlog::debug("LoadBalancer: Selected backend {}:{} (group={}, index={}, weight={})",
                  backend.host, backend.port, settings_.name, selected, backend.weight);

    return BackendSelection{
        .backend = backend,
        .index = selected
    };
}

std::size_t LoadBalancer::pick_round_robin(const std::vector<std::size_t>& candidates) {
    // Lock-free SWRR over the eligible subset
    std::int64_t eligible_total = 0;
    for (auto i : candidates) {
        eligible_total += backends_[i]->config.weight;
    }

    std::size_t selected = candidates.front();
    std::int64_t max_weight = std::numeric_limits<std::int64_t>::min();

    for (auto i : candidates) {
        auto& backend = *backends_[i];
        const std::int64_t weight = backend.config.weight;
        const std::int64_t new_weight =
            backend.current_weight.fetch_add(weight, std::memory_order_acq_rel) + weight;

        if (new_weight > max_weight) {
            max_weight = new_weight;
            selected = i;
        }
    }

    backends_[selected]->current_weight.fetch_sub(eligible_total, std::memory_order_release);
    return selected;
}

std::size_t LoadBalancer::pick_weighted_random(const std::vector<std::size_t>& candidates) const {
    std::uint64_t total = 0;
    for (auto i : candidates) {
        total += backends_[i]->config.weight;
    }
    if (total == 0) {
        return pick_random(candidates);
    }

    std::uniform_int_distribution<std::uint64_t> dist(0, total - 1);
    auto point = dist(thread_rng());
    for (auto i : candidates) {
        const auto weight = backends_[i]->config.weight;
        if (point < weight) {
            return i;
        }
        point -= weight;
    }
    return candidates.back();
}

std::size_t LoadBalancer::pick_random(const std::vector<std::size_t>& candidates) const {
    std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
    return candidates[dist(thread_rng())];
}

void LoadBalancer::report_success(std::size_t index) {
    if (index >= backends_.size()) {
        return;
    }
    auto& backend = *backends_[index];
    if (backend.health->record_success()) {
        spdlog::debug("LoadBalancer: Backend {} recovered", backend.health->key());
    }
}

void LoadBalancer::report_failure(std::size_t index) {
    if (index >= backends_.size()) {
        return;
    }
    auto& backend = *backends_[index];
    if (backend.health->record_failure(settings_.health, health_->now())) {
        spdlog::warn("LoadBalancer: Backend {} state changed: {} -> {} (cooldown {}ms)",
                     backend.health->key(),
                     to_string(BackendState::healthy), to_string(BackendState::unhealthy),
                     settings_.health.cooldown.count());
    }
}

void LoadBalancer::report_status(std::size_t index, unsigned status) {
    if (status >= 500 && settings_.fail_on_5xx) {
        report_failure(index);
    } else {
        report_success(index);
    }
}

std::size_t LoadBalancer::healthy_backend_count() const {
    const auto now = health_->now();
    return static_cast<std::size_t>(std::count_if(backends_.begin(), backends_.end(),
        [now](const auto& backend) { return backend->health->is_healthy(now); }));
}

} // namespace portway::balancer
