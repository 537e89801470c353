#include "catalog/catalog_builder.hpp"

#include <chrono>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

CatalogBuilder::CatalogBuilder()
    : engine_{make_catalog_rules()}
{}

ToolDescriptor CatalogBuilder::make_descriptor(const PolicyEntry& entry) {
    ToolDescriptor descriptor;
    descriptor.tool_name = entry.tool_name;

    // description 이 없으면 "METHOD route" 로 대체 (route 도 없으면 빈 값)
    if (!is_blank(entry.description)) {
        descriptor.description = entry.description;
    } else if (!entry.route_template.empty()) {
        descriptor.description = fmt::format("{} {}",
            entry.http_method.empty() ? "GET" : entry.http_method, entry.route_template);
    }

    descriptor.input_schema = entry.input_schema.is_object()
        ? entry.input_schema
        : default_input_schema();

    if (!entry.route_template.empty()) {
        descriptor.endpoint = EndpointDescriptor{
            .route_template = entry.route_template,
            .http_method    = entry.http_method.empty() ? std::string{"GET"} : entry.http_method,
            .operation_id   = entry.operation_id,
            .display_name   = entry.display_name,
        };
    }
    descriptor.effective_policy = entry;
    return descriptor;
}

CatalogBuildResult CatalogBuilder::build(const PolicyDocument&  document,
                                         const std::stop_token& stop) const
{
    ToolMap                    tools;
    std::vector<SkippedPolicy> skipped;

    CatalogBuildContext ctx;
    ctx.tools = &tools;

    for (std::size_t i = 0; i < document.entries.size(); ++i) {
        const PolicyEntry& entry = document.entries[i];
        ctx.reset_for(entry);
        engine_.execute(ctx, stop);

        if (ctx.should_skip) {
            spdlog::debug("[catalog] skip policy #{} tool='{}': {}",
                          i, entry.tool_name, ctx.skip_reason);
            skipped.push_back(SkippedPolicy{
                .index        = i,
                .tool_name    = entry.tool_name,
                .operation_id = entry.operation_id,
                .reason       = ctx.skip_reason,
            });
            continue;
        }

        tools.emplace(entry.tool_name, make_descriptor(entry));
    }

    auto snapshot            = std::make_shared<CatalogSnapshot>();
    snapshot->tools          = std::move(tools);
    snapshot->source_version = document.source_version;
    snapshot->created_at     = std::chrono::system_clock::now();

    spdlog::info("[catalog] built {} tools from {} policies (skipped {}), version='{}'",
                 snapshot->tool_count(), document.entries.size(), skipped.size(),
                 document.source_version);

    return CatalogBuildResult{
        .snapshot = std::move(snapshot),
        .skipped  = std::move(skipped),
    };
}
