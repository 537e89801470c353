#pragma once

// ---------------------------------------------------------------------------
// policy_document.hpp
//
// 정책 문서 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/policy.yaml 에서 로드되거나, 테스트/임베딩
// 환경에서는 InMemoryPolicyProvider 로 직접 주입된다.
//
// [설계 원칙]
// - 모든 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - 문서는 fetch 후 불변이다. 새 fetch 는 새 문서를 만들며, 제자리 수정은
//   하지 않는다 (shared_ptr<const PolicyDocument> 로만 전달).
// - tool_name 의 유일성은 이 레이어에서 강제하지 않는다. 같은 문서에 중복
//   항목이 있을 수 있고, CatalogBuilder 가 문서 순서 기준으로 결정적으로
//   정리한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// ---------------------------------------------------------------------------
// AuthPropagationMode
//   호출자 자격 증명을 백엔드로 넘기는 방식.
//   kInfer 는 실행기 전역 설정(PROPAGATE_AUTHORIZATION)을 따른다.
// ---------------------------------------------------------------------------
enum class AuthPropagationMode : std::uint8_t {
    kInfer       = 0,
    kNone        = 1,
    kBearerToken = 2,  // Authorization 헤더 전달
    kCookies     = 3,  // Cookie 헤더 전달
};

enum class RateLimitStrategy : std::uint8_t {
    kFixedWindow = 0,
    kTokenBucket = 1,
};

// ---------------------------------------------------------------------------
// RateLimitPolicy
//   도구 하나에 대한 호출 빈도 제한.
//
//   kFixedWindow : window_ms 마다 permit_limit 회
//   kTokenBucket : 용량 permit_limit, refill_period_ms 마다 tokens_per_period 개 보충
//
//   대기열은 없다. 허용량을 넘은 호출은 즉시 거부된다.
// ---------------------------------------------------------------------------
struct RateLimitPolicy {
    RateLimitStrategy strategy{RateLimitStrategy::kFixedWindow};
    std::uint32_t     permit_limit{0};
    std::uint32_t     window_ms{0};
    std::uint32_t     tokens_per_period{1};
    std::uint32_t     refill_period_ms{0};

    bool operator==(const RateLimitPolicy&) const = default;
};

// ---------------------------------------------------------------------------
// PolicyEntry
//   도구로 노출할 백엔드 엔드포인트 하나에 대한 정책.
//
//   route_template : 백엔드 경로 템플릿 (예: "/api/orders/{id}")
//   http_method    : 대문자 HTTP 메서드. 비어 있으면 GET 으로 해석한다.
//   timeout_ms     : 도구 실행 타임아웃. 없으면 실행기 기본값.
//   input_schema   : 도구 입력 JSON Schema. null 이면 빈 object 스키마.
//   concurrency_limit : 동시에 실행 중인 호출 수 상한. 없으면 무제한.
//   rate_limit        : 호출 빈도 제한. 없으면 무제한.
//   auth_propagation  : 자격 증명 전달 방식.
// ---------------------------------------------------------------------------
struct PolicyEntry {
    std::string                  tool_name{};
    std::string                  route_template{};
    std::string                  http_method{"GET"};
    std::string                  operation_id{};
    std::string                  display_name{};
    std::string                  description{};
    bool                         enabled{true};
    std::optional<std::uint32_t> timeout_ms{};
    nlohmann::json               input_schema{};
    std::optional<std::uint32_t>   concurrency_limit{};
    std::optional<RateLimitPolicy> rate_limit{};
    AuthPropagationMode            auth_propagation{AuthPropagationMode::kInfer};
};

// ---------------------------------------------------------------------------
// PolicyDocument
//   PolicyConfigProvider 가 반환하는 정책 문서 루트.
//
//   source_version : 문서 버전/지문. CatalogProvider 는 이 값이 바뀔 때만
//                    카탈로그를 재구성한다. 문자열 비교(ordinal).
//   deny_by_default: true 이면 entries 에 명시된 엔드포인트만 도구가 된다.
// ---------------------------------------------------------------------------
struct PolicyDocument {
    std::vector<PolicyEntry> entries{};
    std::string              source_version{};
    bool                     deny_by_default{true};
};
