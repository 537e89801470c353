#include "gateway/tool_filter.hpp"

#include <algorithm>
#include <utility>

GatewayToolFilter::GatewayToolFilter(std::vector<std::string> allowed,
                                     std::vector<std::string> denied,
                                     bool                     deny_by_default)
    : allowed_{std::move(allowed)}
    , denied_{std::move(denied)}
    , deny_by_default_{deny_by_default}
{}

bool GatewayToolFilter::is_active() const noexcept {
    return !allowed_.empty() || !denied_.empty() || deny_by_default_;
}

bool GatewayToolFilter::is_allowed(std::string_view external_name) const {
    if (!is_active()) {
        return true;
    }

    const auto matches = [external_name](const std::string& pattern) {
        return glob_match(pattern, external_name);
    };

    if (std::any_of(denied_.begin(), denied_.end(), matches)) {
        return false;
    }
    if (!allowed_.empty()) {
        return std::any_of(allowed_.begin(), allowed_.end(), matches);
    }
    return !deny_by_default_;
}

bool glob_match(std::string_view pattern, std::string_view text) noexcept {
    // 반복형 백트래킹: 마지막 '*' 위치만 기억한다. O(|pattern| * |text|) 최악.
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star       = std::string_view::npos;
    std::size_t star_match = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star       = p++;
            star_match = t;
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            ++p;
            ++t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++star_match;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}
