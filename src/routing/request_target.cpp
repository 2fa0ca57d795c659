/**
 * PORTWAY - API Gateway Request Kernel
 * Request target helpers implementation
 */

#include "routing/request_target.hpp"

namespace portway::routing {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string percent_decode(std::string_view text, bool plus_as_space) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            out += ' ';
            continue;
        }
        out += c;
    }
    return out;
}

std::pair<std::string, std::string> split_target(std::string_view target) {
    auto fragment = target.find('#');
    if (fragment != std::string_view::npos) {
        target = target.substr(0, fragment);
    }

    auto question = target.find('?');
    if (question == std::string_view::npos) {
        return {percent_decode(target), std::string{}};
    }
    return {percent_decode(target.substr(0, question)), std::string(target.substr(question + 1))};
}

std::vector<Param> parse_query(std::string_view query) {
    std::vector<Param> params;

    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        if (pair.empty()) {
            continue;
        }

        auto eq = pair.find('=');
        if (eq == std::string_view::npos) {
            params.emplace_back(percent_decode(pair, true), std::string{});
        } else {
            params.emplace_back(percent_decode(pair.substr(0, eq), true),
                                percent_decode(pair.substr(eq + 1), true));
        }
    }
    return params;
}

} // namespace portway::routing
