#pragma once

// ---------------------------------------------------------------------------
// gateway_config.hpp
//
// 게이트웨이 모드 설정 (config/gateway.yaml).
//
// [YAML 형식]
//   refresh_interval: 5m          # 기본 5분
//   staleness_bound: 15m          # 기본 15분
//   tool_name_separator: "."
//   deny_by_default: false
//   allowed_tools: ["weather.*"]
//   denied_tools:  ["*.admin_*"]
//   upstreams:
//     - name: weather
//       mcp_endpoint: http://127.0.0.1:9001
//       namespace_prefix: weather
//       enabled: true
//       request_timeout: 30s
//       default_headers: { X-Api-Key: abc }
//
// [설계 원칙]
// - upstreams 의 나열 순서가 도구 이름 충돌 시 우선순위다 (앞이 이긴다).
// - 로드 실패와 검증 실패 모두 std::unexpected 로 반환한다.
// - refresh_interval 은 reload_options() 로 실행 중 교체할 수 있다.
// ---------------------------------------------------------------------------

#include "net/http_client.hpp"  // HeaderList

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

struct UpstreamConfig {
    std::string               name{};
    std::string               mcp_endpoint{};
    std::string               namespace_prefix{};
    bool                      enabled{true};
    std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};
    HeaderList                default_headers{};

    bool operator==(const UpstreamConfig&) const = default;
};

struct GatewayOptions {
    std::chrono::milliseconds   refresh_interval{std::chrono::minutes{5}};
    std::chrono::milliseconds   staleness_bound{std::chrono::minutes{15}};
    std::string                 tool_name_separator{"."};
    bool                        deny_by_default{false};
    std::vector<std::string>    allowed_tools{};
    std::vector<std::string>    denied_tools{};
    std::vector<UpstreamConfig> upstreams{};
};

class GatewayConfigLoader {
public:
    [[nodiscard]] static std::expected<GatewayOptions, std::string>
    load(const std::filesystem::path& config_path);

    [[nodiscard]] static std::expected<GatewayOptions, std::string>
    load_from_string(std::string_view yaml_text);
};

// validate_gateway_options
//   - refresh_interval / staleness_bound > 0, separator 비어 있지 않음
//   - upstream name 비어 있지 않고 유일
//   - namespace_prefix 는 비어 있거나 [A-Za-z0-9._-]+
//   - mcp_endpoint 는 http:// URL
//   - request_timeout > 0
[[nodiscard]] std::expected<void, std::string> validate_gateway_options(const GatewayOptions& options);
