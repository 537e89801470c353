#include "catalog/catalog_rules.hpp"

#include <fmt/format.h>

namespace {

[[nodiscard]] bool not_skipped(const CatalogBuildContext& ctx) {
    return !ctx.should_skip;
}

[[nodiscard]] Rule<CatalogBuildContext> enabled_validation_rule() {
    return Rule<CatalogBuildContext>{
        .order    = catalog_rules::kEnabledValidationOrder,
        .name     = std::string{catalog_rules::kEnabledValidationName},
        .is_match = [](const CatalogBuildContext&) { return true; },
        .apply    = [](CatalogBuildContext& ctx) {
            if (!ctx.entry->enabled) {
                ctx.mark_skip(std::string{catalog_rules::kReasonDisabled});
            }
        },
    };
}

[[nodiscard]] Rule<CatalogBuildContext> tool_name_validation_rule() {
    return Rule<CatalogBuildContext>{
        .order    = catalog_rules::kToolNameValidationOrder,
        .name     = std::string{catalog_rules::kToolNameValidationName},
        .is_match = not_skipped,
        .apply    = [](CatalogBuildContext& ctx) {
            if (is_blank(ctx.entry->tool_name)) {
                ctx.mark_skip(std::string{catalog_rules::kReasonNoToolName});
            }
        },
    };
}

[[nodiscard]] Rule<CatalogBuildContext> duplicate_detection_rule() {
    return Rule<CatalogBuildContext>{
        .order    = catalog_rules::kDuplicateDetectionOrder,
        .name     = std::string{catalog_rules::kDuplicateDetectionName},
        .is_match = not_skipped,
        .apply    = [](CatalogBuildContext& ctx) {
            if (ctx.tools->contains(ctx.entry->tool_name)) {
                ctx.mark_skip(fmt::format("Duplicate tool name '{}'", ctx.entry->tool_name));
            }
        },
    };
}

}  // namespace

std::vector<Rule<CatalogBuildContext>> make_catalog_rules() {
    std::vector<Rule<CatalogBuildContext>> rules;
    rules.reserve(3);
    rules.push_back(enabled_validation_rule());
    rules.push_back(tool_name_validation_rule());
    rules.push_back(duplicate_detection_rule());
    return rules;
}
