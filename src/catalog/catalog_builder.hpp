#pragma once

// ---------------------------------------------------------------------------
// catalog_builder.hpp
//
// 정책 문서를 RuleEngine + 카탈로그 규칙으로 평가하여 불변 CatalogSnapshot
// 을 만든다.
//
// [처리 규약]
// - 항목은 문서 순서대로 평가한다. 중복 이름은 첫 번째 항목이 이긴다.
// - 항목마다 컨텍스트의 skip 상태를 초기화한다.
// - 살아남은 항목마다 ToolDescriptor 를 정확히 하나 만든다.
// - skip 된 항목은 SkippedPolicy 로 보고되며 빌드를 중단하지 않는다.
// - 규칙 구현의 예상치 못한 예외, 취소(OperationCancelled)는 그대로 전파된다.
//
// 시간 O(entries), 공간 O(살아남은 entries).
// ---------------------------------------------------------------------------

#include "catalog/catalog_rules.hpp"
#include "catalog/catalog_snapshot.hpp"
#include "policy/policy_document.hpp"
#include "rules/rule_engine.hpp"

#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SkippedPolicy
//   index : 문서 내 항목 위치 (0 부터)
//   reason: "Policy is disabled" | "Policy has no tool name" |
//           "Duplicate tool name '<name>'"
// ---------------------------------------------------------------------------
struct SkippedPolicy {
    std::size_t index{0};
    std::string tool_name{};
    std::string operation_id{};
    std::string reason{};
};

struct CatalogBuildResult {
    std::shared_ptr<const CatalogSnapshot> snapshot{};
    std::vector<SkippedPolicy>             skipped{};
};

class CatalogBuilder {
public:
    CatalogBuilder();

    [[nodiscard]] CatalogBuildResult build(const PolicyDocument&  document,
                                           const std::stop_token& stop = {}) const;

    // make_descriptor
    //   규칙을 통과한 정책 항목을 도구 기술자로 변환한다.
    [[nodiscard]] static ToolDescriptor make_descriptor(const PolicyEntry& entry);

private:
    RuleEngine<CatalogBuildContext> engine_;
};
