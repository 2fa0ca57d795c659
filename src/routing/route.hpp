/**
 * PORTWAY - API Gateway Request Kernel
 * Route - compiled match predicates and the plugin chain of one route
 */

#ifndef PORTWAY_ROUTING_ROUTE_HPP
#define PORTWAY_ROUTING_ROUTE_HPP

#include "routing/host_pattern.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace portway::pipeline {
class Plugin;
}

namespace portway::routing {

enum class PathKind : std::uint8_t {
    regex,
    prefix,
    exact
};

/**
 * Path predicate
 */
struct PathMatch {
    PathKind kind{PathKind::prefix};
    std::string value{"/"};
    std::optional<std::regex> pattern;  // set for PathKind::regex

    /**
     * Exact compares the whole path. Prefix is segment aware: "/api" matches
     * "/api" and "/api/v1" but not "/apix". Regex must match the whole path.
     */
    bool matches(std::string_view path) const;

    /**
     * Ranking key: exact > prefix (longer first) > regex
     */
    std::uint64_t rank() const noexcept;
};

/**
 * Header or query predicate: exact value or whole-value regex
 */
struct ValueMatch {
    std::string name;  // lowercase for headers
    std::string value;
    std::optional<std::regex> pattern;

    bool matches(std::string_view candidate) const;
};

/**
 * A route as published in a snapshot. Immutable once built.
 */
struct Route {
    std::string name;
    std::vector<HostPattern> hosts;  // never empty; catch-all is HostPattern::parse("*")
    PathMatch path;
    std::string method;              // empty = any
    std::vector<ValueMatch> headers;
    std::vector<ValueMatch> query;
    std::int32_t priority{0};
    std::size_t order{0};            // declaration order

    std::vector<std::shared_ptr<pipeline::Plugin>> plugins;
    std::string backend_group;
    std::optional<std::chrono::milliseconds> timeout;

    /**
     * Highest host specificity among patterns matching host, or nullopt
     */
    std::optional<std::uint64_t> host_rank(std::string_view host) const;
};

} // namespace portway::routing

#endif // PORTWAY_ROUTING_ROUTE_HPP
