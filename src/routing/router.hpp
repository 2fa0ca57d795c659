/**
 * PORTWAY - API Gateway Request Kernel
 * Router - selects the most specific route for a request
 */

#ifndef PORTWAY_ROUTING_ROUTER_HPP
#define PORTWAY_ROUTING_ROUTER_HPP

#include "routing/request_target.hpp"
#include "routing/route.hpp"

#include <string>
#include <vector>

namespace portway::routing {

/**
 * Request attributes the router looks at
 */
struct MatchInput {
    std::string host;            // normalize_host() applied
    std::string path;            // decoded, without query
    std::string method;
    std::vector<Param> headers;  // lowercase names
    std::vector<Param> query;
};

/**
 * Router
 *
 * Candidates whose host and path match are ranked by
 *   (host specificity, path rank, priority, declaration order)
 * and the best one whose method, header and query predicates all hold wins.
 * Predicates filter candidates; they never raise a route's rank.
 * Stateless: the same routes and input always give the same route.
 */
class Router {
public:
    /**
     * @return the matched route (owned by routes) or nullptr for no match
     */
    static const Route* match(const std::vector<Route>& routes, const MatchInput& input);

    /**
     * True if method, header and query predicates of route all hold
     */
    static bool predicates_hold(const Route& route, const MatchInput& input);
};

} // namespace portway::routing

#endif // PORTWAY_ROUTING_ROUTER_HPP
