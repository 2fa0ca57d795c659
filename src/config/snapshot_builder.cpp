/**
 * PORTWAY - API Gateway Request Kernel
 * Snapshot Builder implementation
 */

#include "config/snapshot_builder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace portway::config {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::regex compile_regex(const std::string& pattern, const std::string& where) {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw ConfigError("Invalid regex '" + pattern + "' in " + where + ": " + e.what());
    }
}

std::vector<routing::HostPattern> compile_hosts(const std::vector<std::string>& hosts,
                                                const std::string& where) {
    std::vector<routing::HostPattern> patterns;
    for (const auto& host : hosts) {
        try {
            patterns.push_back(routing::HostPattern::parse(host));
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string(e.what()) + " in " + where);
        }
    }
    return patterns;
}

routing::ValueMatch compile_value_match(const ValueMatchConfig& config, bool is_header,
                                        const std::string& where) {
    if (config.name.empty()) {
        throw ConfigError("Predicate without a name in " + where);
    }

    routing::ValueMatch match;
    match.name = is_header ? lowercase(config.name) : config.name;
    match.value = config.value;

    if (config.type == "regex") {
        match.pattern = compile_regex(config.value, where);
    } else if (config.type != "exact") {
        throw ConfigError("Unknown predicate type '" + config.type + "' in " + where);
    }
    return match;
}

routing::PathMatch compile_path(const PathMatchConfig& config, const std::string& where) {
    routing::PathMatch path;
    path.value = config.value;

    if (config.type == "exact") {
        path.kind = routing::PathKind::exact;
    } else if (config.type == "prefix") {
        path.kind = routing::PathKind::prefix;
    } else if (config.type == "regex") {
        path.kind = routing::PathKind::regex;
        path.pattern = compile_regex(config.value, where);
        return path;
    } else {
        throw ConfigError("Unknown path type '" + config.type + "' in " + where);
    }

    if (path.value.empty() || path.value.front() != '/') {
        throw ConfigError("Path '" + path.value + "' in " + where + " must start with '/'");
    }
    return path;
}

} // anonymous namespace

SnapshotBuilder::SnapshotBuilder(const pipeline::PluginRegistry& plugins,
                                 std::shared_ptr<balancer::HealthRegistry> health,
                                 CertificateLoader certificate_loader)
    : plugins_(plugins)
    , health_(std::move(health))
    , certificate_loader_(std::move(certificate_loader))
{
}

std::shared_ptr<ConfigSnapshot> SnapshotBuilder::build(const GatewayDefinition& definition,
                                                       std::uint64_t generation) const {
    auto snapshot = std::make_shared<ConfigSnapshot>();
    snapshot->generation = generation;

    build_certificates(definition, *snapshot);
    build_backend_groups(definition, *snapshot);

    for (std::size_t i = 0; i < definition.default_plugins.size(); ++i) {
        snapshot->default_plugins.push_back(
            plugins_.create(definition.default_plugins[i], "global#" + std::to_string(i)));
    }

    build_routes(definition, *snapshot);

    std::unordered_set<std::string> live;
    for (const auto& group : definition.backend_groups) {
        for (const auto& backend : group.backends) {
            live.insert(balancer::HealthRegistry::backend_key(backend));
        }
    }
    health_->retain(live);

    spdlog::info("SnapshotBuilder: Built generation {} ({} routes, {} backend groups, {} certificates)",
                 generation, snapshot->routes.size(), snapshot->backend_groups.size(),
                 snapshot->certificates.size());
    return snapshot;
}

void SnapshotBuilder::build_certificates(const GatewayDefinition& definition,
                                         ConfigSnapshot& snapshot) const {
    std::unordered_set<std::string> names;

    for (std::size_t i = 0; i < definition.certificates.size(); ++i) {
        const auto& config = definition.certificates[i];
        const std::string where = "certificate '" + config.name + "'";

        if (config.name.empty()) {
            throw ConfigError("Certificate #" + std::to_string(i) + " has no name");
        }
        if (!names.insert(config.name).second) {
            throw ConfigError("Duplicate certificate name '" + config.name + "'");
        }

        CertificateEntry entry;
        entry.name = config.name;
        entry.hosts = compile_hosts(config.hosts, where);
        entry.order = i;

        try {
            entry.context = certificate_loader_(config);
        } catch (const ConfigError&) {
            throw;
        } catch (const std::exception& e) {
            throw ConfigError("Failed to load " + where + ": " + e.what());
        }
        if (!entry.context) {
            throw ConfigError("Failed to load " + where);
        }

        snapshot.certificates.push_back(std::move(entry));
    }
}

void SnapshotBuilder::build_backend_groups(const GatewayDefinition& definition,
                                           ConfigSnapshot& snapshot) const {
    for (const auto& config : definition.backend_groups) {
        const std::string where = "backend group '" + config.name + "'";

        if (config.name.empty()) {
            throw ConfigError("Backend group without a name");
        }
        if (snapshot.backend_groups.contains(config.name)) {
            throw ConfigError("Duplicate backend group '" + config.name + "'");
        }
        if (config.backends.empty()) {
            throw ConfigError(where + " has no backends");
        }
        for (const auto& backend : config.backends) {
            if (backend.host.empty() || backend.port == 0) {
                throw ConfigError(where + " has a backend without host or port");
            }
            if (backend.weight == 0) {
                throw ConfigError(where + ": backend weight must be > 0");
            }
        }

        auto policy = balancer::policy_from_string(config.policy);
        if (!policy) {
            throw ConfigError(where + ": unknown policy '" + config.policy + "'");
        }
        auto on_no_healthy = balancer::no_healthy_policy_from_string(config.on_no_healthy);
        if (!on_no_healthy) {
            throw ConfigError(where + ": unknown on_no_healthy '" + config.on_no_healthy + "'");
        }

        balancer::GroupSettings settings{
            .name = config.name,
            .policy = *policy,
            .on_no_healthy = *on_no_healthy,
            .health = {
                .failure_threshold = std::max<std::uint32_t>(config.failure_threshold, 1),
                .cooldown = std::chrono::milliseconds(config.cooldown_ms)
            },
            .fail_on_5xx = config.fail_on_5xx
        };

        snapshot.backend_groups.emplace(
            config.name,
            std::make_shared<balancer::LoadBalancer>(std::move(settings), config.backends, health_));
    }
}

void SnapshotBuilder::build_routes(const GatewayDefinition& definition,
                                   ConfigSnapshot& snapshot) const {
    std::unordered_set<std::string> names;

    for (std::size_t i = 0; i < definition.routes.size(); ++i) {
        const auto& config = definition.routes[i];
        const std::string name = config.name.empty() ? "route#" + std::to_string(i) : config.name;
        const std::string where = "route '" + name + "'";

        if (!names.insert(name).second) {
            throw ConfigError("Duplicate route name '" + name + "'");
        }
        if (!snapshot.backend_groups.contains(config.backend_group)) {
            throw ConfigError(where + " references unknown backend group '" + config.backend_group + "'");
        }

        routing::Route route;
        route.name = name;
        route.hosts = compile_hosts(config.hosts.empty() ? std::vector<std::string>{"*"} : config.hosts, where);
        route.path = compile_path(config.path, where);
        route.method = config.method;
        std::transform(route.method.begin(), route.method.end(), route.method.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        for (const auto& header : config.headers) {
            route.headers.push_back(compile_value_match(header, true, where));
        }
        for (const auto& param : config.query) {
            route.query.push_back(compile_value_match(param, false, where));
        }
        route.priority = config.priority;
        route.order = i;
        route.backend_group = config.backend_group;
        if (config.timeout_ms) {
            if (*config.timeout_ms == 0) {
                throw ConfigError(where + ": timeout_ms must be > 0");
            }
            route.timeout = std::chrono::milliseconds(*config.timeout_ms);
        }

        for (std::size_t p = 0; p < config.plugins.size(); ++p) {
            route.plugins.push_back(
                plugins_.create(config.plugins[p], "route:" + name + "#" + std::to_string(p)));
        }

        snapshot.routes.push_back(std::move(route));
    }

    std::stable_sort(snapshot.routes.begin(), snapshot.routes.end(),
                     [](const routing::Route& a, const routing::Route& b) {
                         return a.priority > b.priority;
                     });
}

} // namespace portway::config
