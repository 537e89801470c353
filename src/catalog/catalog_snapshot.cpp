#include "catalog/catalog_snapshot.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

bool is_blank(std::string_view text) noexcept {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

const ToolDescriptor* CatalogSnapshot::find(std::string_view tool_name) const {
    if (is_blank(tool_name)) {
        return nullptr;
    }
    const auto it = tools.find(tool_name);
    if (it == tools.end()) {
        return nullptr;
    }
    return &it->second;
}

std::expected<void, std::string> CatalogSnapshot::validate() const {
    for (const auto& [name, descriptor] : tools) {
        if (is_blank(name)) {
            return std::unexpected(std::string{"catalog contains a blank tool name"});
        }
        if (name != descriptor.tool_name) {
            return std::unexpected(fmt::format(
                "catalog key '{}' does not match descriptor name '{}'", name, descriptor.tool_name));
        }
    }
    if (healthy_upstream_count > upstream_count) {
        return std::unexpected(fmt::format(
            "healthy upstream count {} exceeds upstream count {}",
            healthy_upstream_count, upstream_count));
    }
    return {};
}

std::shared_ptr<const CatalogSnapshot> CatalogSnapshot::empty() {
    auto snapshot        = std::make_shared<CatalogSnapshot>();
    snapshot->created_at = std::chrono::system_clock::now();
    return snapshot;
}
