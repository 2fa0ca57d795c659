/**
 * PORTWAY - API Gateway Request Kernel
 * Request target helpers - split and decode origin-form targets
 */

#ifndef PORTWAY_ROUTING_REQUEST_TARGET_HPP
#define PORTWAY_ROUTING_REQUEST_TARGET_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace portway::routing {

using Param = std::pair<std::string, std::string>;

/**
 * Percent-decode a string. With plus_as_space, '+' decodes to ' ' (query
 * strings). Malformed escapes are kept literally.
 */
std::string percent_decode(std::string_view text, bool plus_as_space = false);

/**
 * Split "/path?query" into its decoded path and raw query
 */
std::pair<std::string, std::string> split_target(std::string_view target);

/**
 * Parse "a=1&b=&c" into decoded name/value pairs, in order
 */
std::vector<Param> parse_query(std::string_view query);

} // namespace portway::routing

#endif // PORTWAY_ROUTING_REQUEST_TARGET_HPP
