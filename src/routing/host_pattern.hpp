/**
 * PORTWAY - API Gateway Request Kernel
 * Host Pattern - exact, leftmost-wildcard and catch-all host matching
 *
 * Shared by the router (route hosts) and the TLS resolver (certificate
 * hosts) so both rank names the same way.
 */

#ifndef PORTWAY_ROUTING_HOST_PATTERN_HPP
#define PORTWAY_ROUTING_HOST_PATTERN_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace portway::routing {

/**
 * Normalize a Host header or SNI name for matching:
 * lowercase, port stripped ("a.com:8080", "[::1]:443"), trailing dot removed.
 */
std::string normalize_host(std::string_view host);

class HostPattern {
public:
    enum class Kind : std::uint8_t {
        any,       // "*" or empty
        wildcard,  // "*.example.com"
        exact      // "api.example.com"
    };

    HostPattern() = default;

    /**
     * Parse a pattern. Only a single leftmost "*." label is accepted as a wildcard.
     * @throws std::invalid_argument on "*" appearing anywhere else
     */
    static HostPattern parse(std::string_view pattern);

    /**
     * Match a normalized host name.
     * A wildcard matches one or more labels in front of its suffix, never the
     * bare suffix itself.
     */
    bool matches(std::string_view host) const;

    /**
     * Match a name against a certificate host: a wildcard covers exactly
     * one label, as TLS clients check it.
     */
    bool matches_certificate_name(std::string_view host) const;

    /**
     * Ranking key: exact > wildcard (longer suffix first) > any
     */
    std::uint64_t specificity() const noexcept;

    Kind kind() const noexcept { return kind_; }
    const std::string& text() const noexcept { return text_; }

private:
    Kind kind_{Kind::any};
    std::string text_;    // normalized full pattern
    std::string suffix_;  // ".example.com" for wildcards
};

} // namespace portway::routing

#endif // PORTWAY_ROUTING_HOST_PATTERN_HPP
