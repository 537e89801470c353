#include "gateway/tool_name_service.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "catalog/catalog_snapshot.hpp"  // is_blank

ToolNameService::ToolNameService(std::string separator)
    : separator_{std::move(separator)}
{
    if (is_blank(separator_)) {
        throw std::invalid_argument("tool name separator cannot be blank");
    }
}

std::string ToolNameService::to_external_name(std::string_view namespace_prefix,
                                              std::string_view upstream_tool_name) const {
    if (namespace_prefix.empty()) {
        return std::string{upstream_tool_name};
    }
    std::string out;
    out.reserve(namespace_prefix.size() + separator_.size() + upstream_tool_name.size());
    out.append(namespace_prefix);
    out.append(separator_);
    out.append(upstream_tool_name);
    return out;
}

std::optional<std::string> ToolNameService::to_internal_name(std::string_view namespace_prefix,
                                                             std::string_view external_name) const {
    if (namespace_prefix.empty()) {
        if (is_blank(external_name)) {
            return std::nullopt;
        }
        return std::string{external_name};
    }

    const auto prefix_len = namespace_prefix.size() + separator_.size();
    if (external_name.size() <= prefix_len ||
        !external_name.starts_with(namespace_prefix) ||
        external_name.substr(namespace_prefix.size(), separator_.size()) != separator_) {
        return std::nullopt;
    }

    const auto internal = external_name.substr(prefix_len);
    if (is_blank(internal)) {
        return std::nullopt;
    }
    return std::string{internal};
}

bool ToolNameService::is_valid_prefix(std::string_view prefix) noexcept {
    if (prefix.empty()) {
        return false;
    }
    return std::all_of(prefix.begin(), prefix.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_' || c == '-';
    });
}
