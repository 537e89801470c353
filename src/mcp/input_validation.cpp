#include "mcp/input_validation.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace {

[[nodiscard]] bool is_tool_name_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '/' || c == '-';
}

}  // namespace

std::expected<void, std::string> validate_tool_name(std::string_view name, const InputLimits& limits) {
    if (name.empty()) {
        return std::unexpected(std::string{"Tool name cannot be null or empty."});
    }
    if (name.size() > limits.max_tool_name_length) {
        return std::unexpected(fmt::format("Tool name exceeds maximum length of {} characters.",
                                           limits.max_tool_name_length));
    }
    if (!std::all_of(name.begin(), name.end(), is_tool_name_char)) {
        return std::unexpected(std::string{
            "Tool name contains invalid characters. Allowed pattern: ^[a-zA-Z0-9_./-]+$"});
    }
    if (name.front() == '/' || name.back() == '/') {
        return std::unexpected(std::string{"Tool name cannot start or end with a forward slash."});
    }
    if (name.find("//") != std::string_view::npos) {
        return std::unexpected(std::string{"Tool name cannot contain consecutive forward slashes."});
    }
    return {};
}

std::size_t json_depth(const nlohmann::json& value, std::size_t limit) {
    if (!value.is_structured()) {
        return 0;
    }
    if (limit == 0) {
        return 1;
    }
    std::size_t deepest = 0;
    for (const auto& child : value) {
        deepest = std::max(deepest, json_depth(child, limit - 1));
        if (deepest >= limit) {
            break;
        }
    }
    return 1 + deepest;
}

std::expected<void, std::string> validate_arguments(const nlohmann::json& arguments, const InputLimits& limits) {
    if (!arguments.is_object()) {
        return std::unexpected(std::string{"Tool arguments must be a JSON object."});
    }

    const auto depth = json_depth(arguments, limits.max_arguments_depth);
    if (depth > limits.max_arguments_depth) {
        return std::unexpected(fmt::format("Arguments JSON depth exceeds maximum allowed depth of {}.",
                                           limits.max_arguments_depth));
    }
    if (arguments.size() > limits.max_arguments_properties) {
        return std::unexpected(fmt::format(
            "Arguments property count of {} exceeds maximum allowed count of {}.",
            arguments.size(), limits.max_arguments_properties));
    }
    return {};
}
