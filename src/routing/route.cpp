/**
 * PORTWAY - API Gateway Request Kernel
 * Route implementation
 */

#include "routing/route.hpp"

namespace portway::routing {

bool PathMatch::matches(std::string_view path) const {
    switch (kind) {
        case PathKind::exact:
            return path == value;

        case PathKind::prefix:
            if (!path.starts_with(value)) {
                return false;
            }
            return path.size() == value.size()
                || value.ends_with('/')
                || path[value.size()] == '/';

        case PathKind::regex:
            return pattern && std::regex_match(path.begin(), path.end(), *pattern);
    }
    return false;
}

std::uint64_t PathMatch::rank() const noexcept {
    const auto kind_rank = static_cast<std::uint64_t>(kind) + 1;
    const auto length = kind == PathKind::regex ? 0 : value.size();
    return (kind_rank << 32) | length;
}

bool ValueMatch::matches(std::string_view candidate) const {
    if (pattern) {
        return std::regex_match(candidate.begin(), candidate.end(), *pattern);
    }
    return candidate == value;
}

std::optional<std::uint64_t> Route::host_rank(std::string_view host) const {
    std::optional<std::uint64_t> best;
    for (const auto& pattern : hosts) {
        if (pattern.matches(host)) {
            const auto rank = pattern.specificity();
            if (!best || rank > *best) {
                best = rank;
            }
        }
    }
    return best;
}

} // namespace portway::routing
