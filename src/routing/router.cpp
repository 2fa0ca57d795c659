/**
 * PORTWAY - API Gateway Request Kernel
 * Router implementation
 */

#include "routing/router.hpp"

#include <algorithm>
#include <limits>
#include <tuple>

namespace portway::routing {

namespace {

bool any_matches(const std::vector<Param>& params, const ValueMatch& predicate) {
    return std::any_of(params.begin(), params.end(), [&](const Param& param) {
        return param.first == predicate.name && predicate.matches(param.second);
    });
}

// Larger is better; declaration order is inverted so earlier routes win ties
using RankKey = std::tuple<std::uint64_t, std::uint64_t, std::int32_t, std::size_t>;

RankKey rank_key(std::uint64_t host_rank, const Route& route) {
    return {host_rank, route.path.rank(), route.priority,
            std::numeric_limits<std::size_t>::max() - route.order};
}

} // anonymous namespace

bool Router::predicates_hold(const Route& route, const MatchInput& input) {
    if (!route.method.empty() && route.method != input.method) {
        return false;
    }
    for (const auto& predicate : route.headers) {
        if (!any_matches(input.headers, predicate)) {
            return false;
        }
    }
    for (const auto& predicate : route.query) {
        if (!any_matches(input.query, predicate)) {
            return false;
        }
    }
    return true;
}

const Route* Router::match(const std::vector<Route>& routes, const MatchInput& input) {
    const Route* best = nullptr;
    RankKey best_key{};

    for (const auto& route : routes) {
        auto host_rank = route.host_rank(input.host);
        if (!host_rank) {
            continue;
        }
        if (!route.path.matches(input.path)) {
            continue;
        }
        if (!predicates_hold(route, input)) {
            continue;
        }

        auto key = rank_key(*host_rank, route);
        if (!best || key > best_key) {
            best = &route;
            best_key = key;
        }
    }

    return best;
}

} // namespace portway::routing
