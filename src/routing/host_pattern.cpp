/**
 * PORTWAY - API Gateway Request Kernel
 * Host Pattern implementation
 */

#include "routing/host_pattern.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace portway::routing {

std::string normalize_host(std::string_view host) {
    if (!host.empty() && host.front() == '[') {
        // IPv6 literal: keep the bracketed address, drop any port
        auto close = host.find(']');
        if (close != std::string_view::npos) {
            host = host.substr(0, close + 1);
        }
    } else {
        auto colon = host.rfind(':');
        if (colon != std::string_view::npos && host.find(':') == colon) {
            host = host.substr(0, colon);
        }
    }

    if (!host.empty() && host.back() == '.') {
        host.remove_suffix(1);
    }

    std::string out(host);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

HostPattern HostPattern::parse(std::string_view pattern) {
    HostPattern result;
    const std::string normalized = normalize_host(pattern);

    if (normalized.empty() || normalized == "*") {
        result.kind_ = Kind::any;
        result.text_ = "*";
        return result;
    }

    if (normalized.starts_with("*.")) {
        const auto suffix = std::string_view(normalized).substr(1);
        if (suffix.size() < 2 || suffix.find('*') != std::string_view::npos) {
            throw std::invalid_argument("invalid wildcard host pattern '" + std::string(pattern) + "'");
        }
        result.kind_ = Kind::wildcard;
        result.text_ = normalized;
        result.suffix_ = std::string(suffix);
        return result;
    }

    if (normalized.find('*') != std::string::npos) {
        throw std::invalid_argument("wildcard must be the leftmost label in '" + std::string(pattern) + "'");
    }

    result.kind_ = Kind::exact;
    result.text_ = normalized;
    return result;
}

bool HostPattern::matches(std::string_view host) const {
    switch (kind_) {
        case Kind::any:
            return true;
        case Kind::exact:
            return host == text_;
        case Kind::wildcard:
            return host.size() > suffix_.size() && host.ends_with(suffix_);
    }
    return false;
}

bool HostPattern::matches_certificate_name(std::string_view host) const {
    if (kind_ != Kind::wildcard) {
        return matches(host);
    }
    if (!matches(host)) {
        return false;
    }
    auto label = host.substr(0, host.size() - suffix_.size());
    return label.find('.') == std::string_view::npos;
}

std::uint64_t HostPattern::specificity() const noexcept {
    switch (kind_) {
        case Kind::exact:
            return (std::uint64_t{2} << 32) | text_.size();
        case Kind::wildcard:
            return (std::uint64_t{1} << 32) | suffix_.size();
        case Kind::any:
            return 0;
    }
    return 0;
}

} // namespace portway::routing
