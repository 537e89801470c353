#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 파일(config/policy.yaml)을 PolicyDocument 로 파싱하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는 실패 시
//   기존 카탈로그를 유지해야 한다 (CatalogProvider 의 stale 유지 규약).
// - All-or-nothing: 부분적으로 파싱된 문서를 반환하지 않는다.
// - 문서에 version 키가 없으면 파일 내용의 지문을 source_version 으로 쓴다.
//   내용이 같으면 버전도 같으므로 불필요한 재구성이 일어나지 않는다.
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것.
//
// [YAML 형식]
//   version: "2025-01-15"        # 선택
//   deny_by_default: true        # 선택, 기본 true
//   tools:
//     - tool_name: orders.get
//       route_template: /api/orders/{id}
//       http_method: GET
//       operation_id: getOrder
//       display_name: Get order
//       description: Fetch one order
//       enabled: true
//       timeout_ms: 5000
//       input_schema: { type: object, properties: { id: { type: string } } }
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "policy/policy_document.hpp"

class PolicyLoader {
public:
    // load
    //   파일 없음, YAML 파싱 오류, 스키마 불일치(tools 가 sequence 가 아님,
    //   항목이 map 이 아님) 모두 실패로 처리한다.
    [[nodiscard]] static std::expected<PolicyDocument, std::string>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   문자열에서 직접 파싱한다 (테스트 및 임베딩 용).
    [[nodiscard]] static std::expected<PolicyDocument, std::string>
    load_from_string(std::string_view yaml_text);

    // validate
    //   로드된 문서의 운영상 경고 목록을 반환한다. 실패가 아니라 경고다.
    //   - allow-by-default 모드
    //   - deny-by-default 인데 항목이 하나도 없음 (빈 카탈로그)
    //   - route_template 이 없는 활성 항목
    [[nodiscard]] static std::vector<std::string> validate(const PolicyDocument& document);
};
