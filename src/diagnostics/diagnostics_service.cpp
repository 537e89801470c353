#include "diagnostics/diagnostics_service.hpp"

#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/types.hpp"  // format_iso8601
#include "mcp/json_rpc_handler.hpp"  // kServerVersion

namespace {

[[nodiscard]] nlohmann::json optional_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) {
        return nullptr;
    }
    return format_iso8601(*tp);
}

[[nodiscard]] nlohmann::json describe_tool(const ToolDescriptor& tool) {
    nlohmann::json summary{
        {"toolName",    tool.tool_name},
        {"description", tool.description},
    };
    if (tool.endpoint) {
        summary["routeTemplate"] = tool.endpoint->route_template;
        summary["httpMethod"]    = tool.endpoint->http_method;
        summary["operationId"]   = tool.endpoint->operation_id;
    }
    if (tool.effective_policy && tool.effective_policy->timeout_ms) {
        summary["timeoutMs"] = *tool.effective_policy->timeout_ms;
    }
    if (tool.upstream) {
        summary["upstream"]         = tool.upstream->upstream_name;
        summary["upstreamToolName"] = tool.upstream->upstream_tool_name;
    }
    return summary;
}

}  // namespace

const char* to_string(GapSeverity severity) noexcept {
    switch (severity) {
        case GapSeverity::kWarning: return "Warning";
        case GapSeverity::kError:   return "Error";
        default:                    return "Warning";
    }
}

std::vector<MappingGap> analyze_mapping_gaps(const PolicyDocument& document, const EndpointInventory& inventory) {
    std::vector<MappingGap> gaps;

    for (const auto& entry : document.entries) {
        if (!entry.enabled) {
            continue;
        }
        const std::string display_name = entry.tool_name.empty() ? std::string{"(unknown)"} : entry.tool_name;

        if (is_blank(entry.route_template)) {
            gaps.push_back(MappingGap{
                .gap_type    = "RouteNotSpecified",
                .tool_name   = entry.tool_name,
                .http_method = entry.http_method,
                .description = fmt::format("Tool '{}' does not specify a route template.", display_name),
                .severity    = GapSeverity::kWarning,
            });
            continue;
        }

        const std::string method = entry.http_method.empty() ? std::string{"GET"} : entry.http_method;
        if (!inventory.contains(method, entry.route_template)) {
            gaps.push_back(MappingGap{
                .gap_type       = "EndpointNotFound",
                .tool_name      = entry.tool_name,
                .expected_route = entry.route_template,
                .http_method    = method,
                .description    = fmt::format("Tool '{}' maps to {} {} which is not exposed by the backend.",
                                              display_name, method, entry.route_template),
                .severity       = GapSeverity::kError,
            });
        }
    }
    return gaps;
}

nlohmann::json to_json(const MappingGap& gap) {
    return nlohmann::json{
        {"gapType",       gap.gap_type},
        {"toolName",      gap.tool_name},
        {"expectedRoute", gap.expected_route.empty() ? nlohmann::json(nullptr) : nlohmann::json(gap.expected_route)},
        {"httpMethod",    gap.http_method},
        {"description",   gap.description},
        {"severity",      to_string(gap.severity)},
    };
}

nlohmann::json to_json(const UpstreamStatus& status) {
    return nlohmann::json{
        {"name",                status.name},
        {"mcpEndpoint",         status.mcp_endpoint},
        {"namespacePrefix",     status.namespace_prefix},
        {"enabled",             status.enabled},
        {"health",              to_string(status.health)},
        {"lastError",           status.last_error.empty() ? nlohmann::json(nullptr) : nlohmann::json(status.last_error)},
        {"lastSuccessUtc",      optional_time(status.last_success)},
        {"lastCheckUtc",        optional_time(status.last_check)},
        {"latencyMs",           status.latency.count()},
        {"consecutiveFailures", status.consecutive_failures},
        {"toolCount",           status.tool_count},
        {"servingStale",        status.serving_stale},
    };
}

nlohmann::json to_json(const RpcStatsSnapshot& stats) {
    return nlohmann::json{
        {"total_requests",    stats.total_requests},
        {"error_responses",   stats.error_responses},
        {"parse_errors",      stats.parse_errors},
        {"notifications",     stats.notifications},
        {"tool_calls",        stats.tool_calls},
        {"tool_failures",     stats.tool_failures},
        {"rps",               stats.rps},
        {"tool_failure_rate", stats.tool_failure_rate},
        {"captured_at",       format_iso8601(stats.captured_at)},
    };
}

nlohmann::json to_json(const CatalogProviderStatus& status) {
    nlohmann::json skipped = nlohmann::json::array();
    for (const auto& skip : status.last_skipped) {
        skipped.push_back(nlohmann::json{
            {"index",       skip.index},
            {"toolName",    skip.tool_name},
            {"operationId", skip.operation_id},
            {"reason",      skip.reason},
        });
    }
    return nlohmann::json{
        {"sourceVersion",       status.source_version},
        {"toolCount",           status.tool_count},
        {"lastError",           status.last_error.empty() ? nlohmann::json(nullptr) : nlohmann::json(status.last_error)},
        {"consecutiveFailures", status.consecutive_failures},
        {"rebuildCount",        status.rebuild_count},
        {"lastSuccessUtc",      optional_time(status.last_success)},
        {"skipped",             std::move(skipped)},
    };
}

DiagnosticsService::DiagnosticsService(DiagnosticsOptions options, DiagnosticsSources sources)
    : options_{std::move(options)}
    , sources_{std::move(sources)}
{
    if (!sources_.catalog) {
        throw std::invalid_argument("DiagnosticsService requires a catalog source");
    }
}

nlohmann::json DiagnosticsService::manifest() const {
    const auto snapshot = sources_.catalog->current_snapshot();

    nlohmann::json manifest{
        {"serviceName",          options_.service_name},
        {"version",              std::string{kServerVersion}},
        {"mcpHttpEndpoint",      options_.mcp_endpoint.empty() ? nlohmann::json(nullptr)
                                                               : nlohmann::json(options_.mcp_endpoint)},
        {"mode",                 sources_.gateway ? "gateway" : "local"},
        {"toolCount",            snapshot->tool_count()},
        {"policySourceVersion",  snapshot->source_version.empty() ? nlohmann::json(nullptr)
                                                                  : nlohmann::json(snapshot->source_version)},
        {"lastCatalogBuildUtc",  snapshot->created_at.time_since_epoch().count() == 0
                                     ? nlohmann::json(nullptr)
                                     : nlohmann::json(format_iso8601(snapshot->created_at))},
        {"upstreamCount",        snapshot->upstream_count},
        {"healthyUpstreamCount", snapshot->healthy_upstream_count},
    };
    spdlog::debug("[diagnostics] manifest generated: tools={} version={}",
                  snapshot->tool_count(), snapshot->source_version);
    return manifest;
}

std::vector<MappingGap> DiagnosticsService::mapping_gaps() const {
    if (!sources_.policy || !sources_.inventory) {
        return {};
    }
    auto document = sources_.policy->get(std::stop_token{});
    if (!document || !*document) {
        spdlog::warn("[diagnostics] gap analysis skipped, policy unavailable: {}",
                     document ? std::string{"empty document"} : document.error());
        return {};
    }
    return analyze_mapping_gaps(**document, *sources_.inventory);
}

nlohmann::json DiagnosticsService::diagnostics() const {
    const auto snapshot = sources_.catalog->current_snapshot();
    const auto gaps     = mapping_gaps();

    nlohmann::json gap_list = nlohmann::json::array();
    for (const auto& gap : gaps) {
        gap_list.push_back(to_json(gap));
    }

    nlohmann::json tools = nlohmann::json::array();
    for (const auto& [name, tool] : snapshot->tools) {
        tools.push_back(describe_tool(tool));
    }

    nlohmann::json document{
        {"timestampUtc",     format_iso8601(std::chrono::system_clock::now())},
        {"manifest",         manifest()},
        {"mappingGaps",      std::move(gap_list)},
        {"enabledToolCount", snapshot->tool_count()},
        {"enabledTools",     std::move(tools)},
    };

    if (sources_.gateway) {
        nlohmann::json upstreams = nlohmann::json::array();
        for (const auto& status : sources_.gateway->current_state()->upstreams) {
            upstreams.push_back(to_json(status));
        }
        document["upstreams"] = std::move(upstreams);
    }
    if (sources_.provider) {
        document["catalogProvider"] = to_json(sources_.provider->status());
    }
    if (sources_.stats) {
        document["rpc"] = to_json(sources_.stats->snapshot());
    }

    spdlog::info("[diagnostics] generated: tools={} gaps={}", snapshot->tool_count(), gaps.size());
    return document;
}

HealthReport DiagnosticsService::health() const {
    HealthReport report{};
    report.body = nlohmann::json{{"status", "ok"}};

    if (!sources_.gateway) {
        return report;
    }

    std::size_t enabled = 0;
    std::size_t healthy = 0;
    for (const auto& status : sources_.gateway->current_state()->upstreams) {
        if (!status.enabled) {
            continue;
        }
        ++enabled;
        if (status.healthy()) {
            ++healthy;
        }
    }
    report.body["upstreams"]        = enabled;
    report.body["healthyUpstreams"] = healthy;

    if (enabled > 0 && healthy == 0) {
        report.healthy        = false;
        report.body["status"] = "unhealthy";
        report.body["reason"] = "all upstreams are unhealthy";
    }
    return report;
}
