// ---------------------------------------------------------------------------
// gateway_config.cpp
//
// [알려진 한계]
// - default_headers 값은 스칼라 문자열만 허용한다. 중첩 구조는 무시된다.
// ---------------------------------------------------------------------------

#include "gateway/gateway_config.hpp"

#include <set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "catalog/catalog_snapshot.hpp"  // is_blank
#include "common/yaml_util.hpp"
#include "gateway/tool_name_service.hpp"

namespace {

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] HeaderList read_headers(const YAML::Node& node) {
    HeaderList headers;
    if (!node || !node.IsMap()) {
        return headers;
    }
    for (const auto& kv : node) {
        if (!kv.second.IsScalar()) {
            spdlog::warn("gateway_config: header '{}' is not a scalar, ignoring",
                         kv.first.as<std::string>());
            continue;
        }
        headers.emplace_back(kv.first.as<std::string>(), kv.second.as<std::string>());
    }
    return headers;
}

[[nodiscard]] std::expected<UpstreamConfig, std::string>
parse_upstream(const YAML::Node& node, std::size_t index) {
    if (!node.IsMap()) {
        return std::unexpected(fmt::format("gateway_config: upstreams[{}] must be a map", index));
    }

    UpstreamConfig upstream{};
    upstream.name             = read_string(node["name"], "");
    upstream.mcp_endpoint     = read_string(node["mcp_endpoint"], "");
    upstream.namespace_prefix = read_string(node["namespace_prefix"], "");
    upstream.enabled          = read_bool(node["enabled"], upstream.enabled);
    upstream.default_headers  = read_headers(node["default_headers"]);

    auto timeout = read_duration(node["request_timeout"], "request_timeout", upstream.request_timeout);
    if (!timeout) {
        return std::unexpected(fmt::format("gateway_config: upstreams[{}]: {}", index, timeout.error()));
    }
    upstream.request_timeout = *timeout;
    return upstream;
}

[[nodiscard]] std::expected<GatewayOptions, std::string> parse_options(const YAML::Node& root) {
    GatewayOptions options{};
    if (!root || root.IsNull()) {
        return options;
    }
    if (!root.IsMap()) {
        return std::unexpected(std::string{"gateway_config: top-level node is not a YAML map"});
    }

    auto refresh = read_duration(root["refresh_interval"], "refresh_interval", options.refresh_interval);
    if (!refresh) {
        return std::unexpected(fmt::format("gateway_config: {}", refresh.error()));
    }
    options.refresh_interval = *refresh;

    auto staleness = read_duration(root["staleness_bound"], "staleness_bound", options.staleness_bound);
    if (!staleness) {
        return std::unexpected(fmt::format("gateway_config: {}", staleness.error()));
    }
    options.staleness_bound = *staleness;

    options.tool_name_separator = read_string(root["tool_name_separator"], options.tool_name_separator);
    options.deny_by_default     = read_bool(root["deny_by_default"], options.deny_by_default);
    options.allowed_tools       = read_string_sequence(root["allowed_tools"]);
    options.denied_tools        = read_string_sequence(root["denied_tools"]);

    const YAML::Node upstreams = root["upstreams"];
    if (upstreams && !upstreams.IsNull()) {
        if (!upstreams.IsSequence()) {
            return std::unexpected(std::string{"gateway_config: 'upstreams' must be a sequence"});
        }
        std::size_t index = 0;
        for (const auto& node : upstreams) {
            auto upstream = parse_upstream(node, index++);
            if (!upstream) {
                return std::unexpected(upstream.error());
            }
            options.upstreams.push_back(std::move(*upstream));
        }
    }
    return options;
}

}  // namespace

std::expected<GatewayOptions, std::string>
GatewayConfigLoader::load_from_string(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml_text});
    } catch (const YAML::ParserException& e) {
        return std::unexpected(fmt::format(
            "gateway_config: YAML parse error at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.msg));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("gateway_config: YAML error: {}", e.what()));
    }

    std::expected<GatewayOptions, std::string> options;
    try {
        options = parse_options(root);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("gateway_config: error parsing options: {}", e.what()));
    }
    if (!options) {
        return options;
    }

    if (auto valid = validate_gateway_options(*options); !valid) {
        return std::unexpected(valid.error());
    }
    return options;
}

std::expected<GatewayOptions, std::string>
GatewayConfigLoader::load(const std::filesystem::path& config_path) {
    auto text = read_text_file(config_path);
    if (!text) {
        const std::string err = fmt::format("gateway_config: {}", text.error());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    auto options = load_from_string(*text);
    if (!options) {
        spdlog::error("{} ('{}')", options.error(), config_path.string());
        return options;
    }

    spdlog::info("gateway_config: loaded {} upstreams from '{}' (refresh every {}ms)",
                 options->upstreams.size(), config_path.string(),
                 options->refresh_interval.count());
    return options;
}

std::expected<void, std::string> validate_gateway_options(const GatewayOptions& options) {
    if (options.refresh_interval <= std::chrono::milliseconds::zero()) {
        return std::unexpected(std::string{"gateway_config: refresh_interval must be greater than zero"});
    }
    if (options.staleness_bound <= std::chrono::milliseconds::zero()) {
        return std::unexpected(std::string{"gateway_config: staleness_bound must be greater than zero"});
    }
    if (is_blank(options.tool_name_separator)) {
        return std::unexpected(std::string{"gateway_config: tool_name_separator cannot be blank"});
    }

    std::set<std::string, std::less<>> names;
    for (std::size_t i = 0; i < options.upstreams.size(); ++i) {
        const auto& upstream = options.upstreams[i];
        if (is_blank(upstream.name)) {
            return std::unexpected(fmt::format("gateway_config: upstreams[{}] has no name", i));
        }
        if (!names.insert(upstream.name).second) {
            return std::unexpected(fmt::format(
                "gateway_config: duplicate upstream name '{}'", upstream.name));
        }
        if (!upstream.namespace_prefix.empty() &&
            !ToolNameService::is_valid_prefix(upstream.namespace_prefix)) {
            return std::unexpected(fmt::format(
                "gateway_config: upstream '{}' has invalid namespace_prefix '{}' "
                "(letters, digits, '.', '_', '-' only)",
                upstream.name, upstream.namespace_prefix));
        }
        if (auto url = parse_http_url(upstream.mcp_endpoint); !url) {
            return std::unexpected(fmt::format(
                "gateway_config: upstream '{}': {}", upstream.name, url.error()));
        }
        if (upstream.request_timeout <= std::chrono::milliseconds::zero()) {
            return std::unexpected(fmt::format(
                "gateway_config: upstream '{}' request_timeout must be greater than zero",
                upstream.name));
        }
    }
    return {};
}
