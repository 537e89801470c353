#pragma once

// ---------------------------------------------------------------------------
// catalog_rules.hpp
//
// CatalogBuilder 가 정책 항목마다 실행하는 카탈로그 규칙.
//
// [규칙 순서]
//   100 EnabledValidation   : 항상 일치. enabled == false 이면 skip
//   200 ToolNameValidation  : 아직 skip 이 아닐 때만 일치. 빈/공백 이름이면 skip
//   300 DuplicateDetection  : 아직 skip 이 아닐 때만 일치. 이미 있는 이름이면 skip
//
// [skip 모델]
// 비활성/이름 없음/중복은 예외가 아니라 명시적 skip 결과다. 이 규칙들은
// 예상된 상황에서 예외를 던지지 않는다. skip 된 항목은 카탈로그에서
// 제외되고 사유와 함께 보고되며, 빌드는 계속 진행된다.
// ---------------------------------------------------------------------------

#include "catalog/catalog_snapshot.hpp"   // ToolMap
#include "policy/policy_document.hpp"     // PolicyEntry
#include "rules/rule_engine.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace catalog_rules {

inline constexpr std::int32_t kEnabledValidationOrder  = 100;
inline constexpr std::int32_t kToolNameValidationOrder = 200;
inline constexpr std::int32_t kDuplicateDetectionOrder = 300;

inline constexpr std::string_view kEnabledValidationName  = "EnabledValidation";
inline constexpr std::string_view kToolNameValidationName = "ToolNameValidation";
inline constexpr std::string_view kDuplicateDetectionName = "DuplicateDetection";

inline constexpr std::string_view kReasonDisabled   = "Policy is disabled";
inline constexpr std::string_view kReasonNoToolName = "Policy has no tool name";

}  // namespace catalog_rules

// ---------------------------------------------------------------------------
// CatalogBuildContext
//   항목 하나를 평가하는 동안의 가변 상태.
//   entry 와 tools 는 CatalogBuilder 가 소유한 객체를 가리킨다.
//   reset_for() 로 항목마다 skip 상태를 초기화한다.
// ---------------------------------------------------------------------------
struct CatalogBuildContext {
    const PolicyEntry* entry{nullptr};
    const ToolMap*     tools{nullptr};
    bool               should_skip{false};
    std::string        skip_reason{};

    void reset_for(const PolicyEntry& next) {
        entry       = &next;
        should_skip = false;
        skip_reason.clear();
    }

    void mark_skip(std::string reason) {
        should_skip = true;
        skip_reason = std::move(reason);
    }
};

// make_catalog_rules
//   위 세 규칙을 등록 순서대로 반환한다 (정렬은 RuleEngine 이 수행).
[[nodiscard]] std::vector<Rule<CatalogBuildContext>> make_catalog_rules();
