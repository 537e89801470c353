#pragma once

// ---------------------------------------------------------------------------
// diagnostics_service.hpp
//
// 운영자용 읽기 전용 투영 (프로토콜의 일부가 아님).
//
//   manifest     : 서비스 이름/버전, MCP 엔드포인트, 도구 수, 정책 버전,
//                  카탈로그 빌드 시각, 업스트림 수
//   gap report   : 정책 항목 중 route 가 없거나(RouteNotSpecified / Warning)
//                  살아있는 엔드포인트 목록에 없는(EndpointNotFound / Error) 것
//   diagnostics  : 위 둘 + 도구 요약, 업스트림 상태, 공급자 상태, RPC 통계
//   health       : 설정된 업스트림이 모두 unhealthy 면 unhealthy
//
// [설계 원칙]
// - 모든 projection 은 현재 게시된 스냅샷/상태를 읽기만 한다.
// - 로컬 모드와 게이트웨이 모드의 구성 요소는 각각 nullptr 일 수 있다.
// ---------------------------------------------------------------------------

#include "catalog/catalog_provider.hpp"
#include "catalog/catalog_source.hpp"
#include "diagnostics/endpoint_inventory.hpp"
#include "gateway/gateway_aggregator.hpp"
#include "policy/policy_document.hpp"
#include "policy/policy_provider.hpp"
#include "stats/rpc_stats.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

enum class GapSeverity : std::uint8_t {
    kWarning = 0,
    kError   = 1,
};

[[nodiscard]] const char* to_string(GapSeverity severity) noexcept;

struct MappingGap {
    std::string gap_type{};        // "RouteNotSpecified" | "EndpointNotFound"
    std::string tool_name{};
    std::string expected_route{};
    std::string http_method{};
    std::string description{};
    GapSeverity severity{GapSeverity::kWarning};
};

// analyze_mapping_gaps
//   활성 정책 항목을 문서 순서대로 검사한다. 비활성 항목은 건너뛴다.
[[nodiscard]] std::vector<MappingGap> analyze_mapping_gaps(const PolicyDocument&    document,
                                                           const EndpointInventory& inventory);

struct DiagnosticsOptions {
    std::string service_name{"toolgate"};
    std::string mcp_endpoint{};  // HTTP 전송이 없으면 빈 값
};

struct DiagnosticsSources {
    std::shared_ptr<CatalogSource>           catalog{};
    std::shared_ptr<PolicyConfigProvider>    policy{};     // 로컬 모드
    std::shared_ptr<CatalogProvider>         provider{};   // 로컬 모드
    std::shared_ptr<GatewayAggregator>       gateway{};    // 게이트웨이 모드
    std::shared_ptr<const EndpointInventory> inventory{};
    std::shared_ptr<RpcStats>                stats{};
};

struct HealthReport {
    bool           healthy{true};
    nlohmann::json body{};
};

class DiagnosticsService {
public:
    DiagnosticsService(DiagnosticsOptions options, DiagnosticsSources sources);

    [[nodiscard]] nlohmann::json manifest() const;

    [[nodiscard]] std::vector<MappingGap> mapping_gaps() const;

    [[nodiscard]] nlohmann::json diagnostics() const;

    [[nodiscard]] HealthReport health() const;

    [[nodiscard]] const DiagnosticsOptions& options() const noexcept { return options_; }

private:
    DiagnosticsOptions options_;
    DiagnosticsSources sources_;
};

[[nodiscard]] nlohmann::json to_json(const MappingGap& gap);
[[nodiscard]] nlohmann::json to_json(const UpstreamStatus& status);
[[nodiscard]] nlohmann::json to_json(const RpcStatsSnapshot& stats);
[[nodiscard]] nlohmann::json to_json(const CatalogProviderStatus& status);
