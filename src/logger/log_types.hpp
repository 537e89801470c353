#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사(audit) 로그 레코드 타입 정의.
//
// [민감정보 취급 주의]
// - 도구 인자(arguments)와 결과 본문은 기록하지 않는다. 이름/상태/소요 시간만.
// - Authorization 헤더는 어떤 레코드에도 넣지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // TransportKind

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   감사 로거의 최소 출력 레벨. 환경변수 LOG_LEVEL 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// ToolCallLog
//   tools/call 한 건의 실행 결과.
//   성공은 info, 실패는 warn 레벨로 기록된다.
// ---------------------------------------------------------------------------
struct ToolCallLog {
    std::string                           request_id{};
    TransportKind                         transport{TransportKind::kStdio};
    std::string                           client_address{};
    std::string                           tool_name{};
    bool                                  success{false};
    std::string                           error_type{};   // 실패 시 "TIMEOUT", "HTTP_503" 등
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

// ---------------------------------------------------------------------------
// CatalogBuildLog
//   로컬 카탈로그 재구성 한 건.
// ---------------------------------------------------------------------------
struct CatalogBuildLog {
    std::string                           source_version{};
    std::size_t                           tool_count{0};
    std::size_t                           skipped_count{0};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

// ---------------------------------------------------------------------------
// GatewayRefreshLog
//   게이트웨이 refresh 사이클 한 건.
// ---------------------------------------------------------------------------
struct GatewayRefreshLog {
    std::size_t                           upstream_count{0};
    std::size_t                           healthy_upstream_count{0};
    std::size_t                           tool_count{0};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

[[nodiscard]] LogLevel parse_log_level(const std::string& text) noexcept;
