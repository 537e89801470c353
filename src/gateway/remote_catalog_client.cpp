#include "gateway/remote_catalog_client.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <utility>

#include <boost/beast/http/verb.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/yaml_util.hpp"  // content_fingerprint
#include "net/http_client.hpp"

namespace {

[[nodiscard]] std::string make_request_id() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

[[nodiscard]] std::string describe_error(const nlohmann::json& error) {
    const auto code    = error.contains("code") ? error["code"].dump() : std::string{"?"};
    const auto message = error.contains("message") && error["message"].is_string()
                             ? error["message"].get<std::string>()
                             : std::string{"(no message)"};
    return fmt::format("upstream returned JSON-RPC error {}: {}", code, message);
}

}  // namespace

HttpCatalogClient::HttpCatalogClient(UpstreamConfig upstream)
    : upstream_{std::move(upstream)}
    , snapshot_{CatalogSnapshot::empty()}
{}

std::string HttpCatalogClient::build_tools_list_url(std::string_view mcp_endpoint) {
    std::string base{mcp_endpoint};
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    constexpr std::string_view kMcpSuffix = "/mcp";
    const bool ends_with_mcp =
        base.size() >= kMcpSuffix.size() &&
        std::equal(kMcpSuffix.begin(), kMcpSuffix.end(),
                   base.end() - static_cast<std::ptrdiff_t>(kMcpSuffix.size()),
                   [](char a, char b) {
                       return std::tolower(static_cast<unsigned char>(a)) ==
                              std::tolower(static_cast<unsigned char>(b));
                   });

    return ends_with_mcp ? base + "/v1" : base + "/mcp/v1";
}

std::expected<ToolMap, std::string>
HttpCatalogClient::parse_tools_list_response(std::string_view body, const UpstreamConfig& upstream) {
    const auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::unexpected(std::string{"malformed tools/list response"});
    }
    if (doc.contains("error") && !doc["error"].is_null()) {
        return std::unexpected(describe_error(doc["error"]));
    }

    const auto result = doc.find("result");
    if (result == doc.end() || !result->is_object()) {
        return std::unexpected(std::string{"tools/list response has no result object"});
    }
    const auto tools = result->find("tools");
    if (tools == result->end() || !tools->is_array()) {
        return std::unexpected(std::string{"tools/list response has no tools array"});
    }

    ToolMap map;
    for (const auto& tool : *tools) {
        if (!tool.is_object()) {
            spdlog::warn("[gateway] upstream '{}': skipping non-object tool", upstream.name);
            continue;
        }
        const auto name = tool.find("name");
        if (name == tool.end() || !name->is_string() || is_blank(name->get_ref<const std::string&>())) {
            spdlog::warn("[gateway] upstream '{}': skipping tool without name", upstream.name);
            continue;
        }

        const auto& tool_name = name->get_ref<const std::string&>();

        ToolDescriptor descriptor;
        descriptor.tool_name = tool_name;
        if (const auto desc = tool.find("description"); desc != tool.end() && desc->is_string()) {
            descriptor.description = desc->get<std::string>();
        }
        if (const auto schema = tool.find("inputSchema"); schema != tool.end() && schema->is_object()) {
            descriptor.input_schema = *schema;
        } else {
            descriptor.input_schema = default_input_schema();
        }
        descriptor.upstream = UpstreamRoute{
            .upstream_name      = upstream.name,
            .upstream_tool_name = tool_name,
            .mcp_endpoint       = upstream.mcp_endpoint,
            .request_timeout    = upstream.request_timeout,
            .default_headers    = upstream.default_headers,
        };

        if (!map.emplace(tool_name, std::move(descriptor)).second) {
            spdlog::warn("[gateway] upstream '{}': duplicate tool '{}' ignored",
                         upstream.name, tool_name);
        }
    }
    return map;
}

boost::asio::awaitable<CatalogSource::FetchResult>
HttpCatalogClient::async_ensure_fresh_snapshot(std::stop_token stop) {
    const nlohmann::json payload{
        {"jsonrpc", "2.0"},
        {"id",      make_request_id()},
        {"method",  "tools/list"},
        {"params",  nullptr},
    };

    HttpRequest request{};
    request.method       = boost::beast::http::verb::post;
    request.url          = build_tools_list_url(upstream_.mcp_endpoint);
    request.headers      = upstream_.default_headers;
    request.headers.emplace_back("Accept", "application/json");
    request.body         = payload.dump();
    request.content_type = "application/json";
    request.timeout      = upstream_.request_timeout;

    auto response = co_await async_http_request(std::move(request), stop);
    if (!response) {
        co_return std::unexpected(fmt::format("tools/list {}: {}",
                                              to_string(response.error().kind),
                                              response.error().message));
    }
    if (!response->ok()) {
        co_return std::unexpected(fmt::format("tools/list returned HTTP {}", response->status));
    }

    auto tools = parse_tools_list_response(response->body, upstream_);
    if (!tools) {
        co_return std::unexpected(tools.error());
    }

    auto snapshot            = std::make_shared<CatalogSnapshot>();
    snapshot->tools          = std::move(*tools);
    snapshot->source_version = content_fingerprint(response->body);
    snapshot->created_at     = std::chrono::system_clock::now();

    std::shared_ptr<const CatalogSnapshot> published = std::move(snapshot);
    snapshot_.store(published, std::memory_order_release);

    spdlog::debug("[gateway] upstream '{}' listed {} tools", upstream_.name, published->tool_count());
    co_return published;
}
