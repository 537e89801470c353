#include "diagnostics/endpoint_inventory.hpp"

#include <cctype>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "common/yaml_util.hpp"

EndpointInventory::EndpointInventory(std::vector<LiveEndpoint> endpoints)
    : endpoints_{std::move(endpoints)}
{
    for (const auto& endpoint : endpoints_) {
        keys_.insert(endpoint_key(endpoint.http_method, endpoint.route_template));
    }
}

std::string EndpointInventory::endpoint_key(std::string_view http_method, std::string_view route_template) {
    std::string key;
    key.reserve(http_method.size() + route_template.size() + 1);
    key.append(http_method.empty() ? std::string_view{"GET"} : http_method);
    key += ':';
    key.append(route_template);
    for (auto& c : key) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return key;
}

bool EndpointInventory::contains(std::string_view http_method, std::string_view route_template) const {
    return keys_.contains(endpoint_key(http_method, route_template));
}

std::expected<EndpointInventory, std::string> EndpointInventory::load_from_string(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml_text});
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("endpoints: YAML parse error: {}", e.what()));
    }

    if (!root || root.IsNull()) {
        return EndpointInventory{};
    }
    if (!root.IsMap()) {
        return std::unexpected(std::string{"endpoints: root must be a map"});
    }

    const auto list = root["endpoints"];
    if (!list) {
        return EndpointInventory{};
    }
    if (!list.IsSequence()) {
        return std::unexpected(std::string{"endpoints: 'endpoints' must be a sequence"});
    }

    std::vector<LiveEndpoint> endpoints;
    endpoints.reserve(list.size());
    for (std::size_t i = 0; i < list.size(); ++i) {
        const auto item = list[i];
        if (!item.IsMap()) {
            return std::unexpected(fmt::format("endpoints[{}] must be a map", i));
        }
        LiveEndpoint endpoint{};
        endpoint.route_template = read_string(item["route"], "");
        if (endpoint.route_template.empty()) {
            return std::unexpected(fmt::format("endpoints[{}] has no route", i));
        }
        endpoint.http_method = read_string(item["method"], "GET");
        if (endpoint.http_method.empty()) {
            endpoint.http_method = "GET";
        }
        for (auto& c : endpoint.http_method) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        endpoint.display_name = read_string(item["display_name"], "");
        endpoints.push_back(std::move(endpoint));
    }
    return EndpointInventory{std::move(endpoints)};
}

std::expected<EndpointInventory, std::string> EndpointInventory::load(const std::filesystem::path& path) {
    auto text = read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto inventory = load_from_string(*text);
    if (inventory) {
        spdlog::info("[diagnostics] endpoint inventory loaded: {} endpoints from {}",
                     inventory->size(), path.string());
    }
    return inventory;
}
