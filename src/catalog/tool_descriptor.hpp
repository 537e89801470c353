#pragma once

// ---------------------------------------------------------------------------
// tool_descriptor.hpp
//
// 카탈로그에 게시되는 도구 기술자 (불변 값 객체).
//
// [불변성]
// CatalogBuilder / GatewayAggregator 가 항목 하나당 정확히 한 번 생성한다.
// 생성 후에는 수정하지 않는다. 보강이 필요하면 새 기술자를 만든다.
// ---------------------------------------------------------------------------

#include "policy/policy_document.hpp"  // PolicyEntry

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

// ---------------------------------------------------------------------------
// EndpointDescriptor
//   도구를 실제로 수행하는 백엔드 엔드포인트.
// ---------------------------------------------------------------------------
struct EndpointDescriptor {
    std::string route_template{};
    std::string http_method{"GET"};
    std::string operation_id{};
    std::string display_name{};
};

// ---------------------------------------------------------------------------
// UpstreamRoute
//   게이트웨이 모드에서 도구가 속한 업스트림 MCP 서버로의 라우팅 정보.
//   upstream_tool_name 은 네임스페이스 접두사가 붙기 전 원래 이름이다.
// ---------------------------------------------------------------------------
struct UpstreamRoute {
    std::string                                      upstream_name{};
    std::string                                      upstream_tool_name{};
    std::string                                      mcp_endpoint{};
    std::chrono::milliseconds                        request_timeout{30000};
    std::vector<std::pair<std::string, std::string>> default_headers{};
};

// ---------------------------------------------------------------------------
// ToolDescriptor
//   endpoint         : 로컬 카탈로그 도구의 백엔드 엔드포인트
//   effective_policy : 이 도구를 만든 정책 항목 (타임아웃 등 실행 옵션 참조)
//   upstream         : 게이트웨이 카탈로그 도구의 업스트림 라우팅 정보
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string                       tool_name{};
    std::string                       description{};
    nlohmann::json                    input_schema{};
    std::optional<EndpointDescriptor> endpoint{};
    std::optional<PolicyEntry>        effective_policy{};
    std::optional<UpstreamRoute>      upstream{};
};

// default_input_schema
//   {"type":"object","properties":{}}
[[nodiscard]] inline nlohmann::json default_input_schema() {
    return nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}};
}
