#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 감사(audit) 로거. 레코드마다 JSON 한 줄을 기록한다.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입으로 의존성을 명시한다.
// - stdout 은 stdio 전송 계층의 프로토콜 채널이다. 감사 로그는 stderr 와
//   rotating file 에만 쓴다.
// - 모든 필드는 snake_case JSON 키로 직렬화한다 (nlohmann::json).
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/common.h>

namespace spdlog {
class logger;
}

// diagnostic_log_level
//   LOG_LEVEL 문자열을 spdlog 레벨로. 대소문자 무시, "warn"/"err" 별칭 허용.
//   알 수 없는 값은 경고 후 info. off 로 떨어지지 않는다.
[[nodiscard]] spdlog::level::level_enum diagnostic_log_level(const std::string& text);

class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 감사 로그 파일 경로. 비어 있으면 stderr 만 사용한다.
    //   to_stderr : false 면 stderr 싱크를 붙이지 않는다 (테스트용).
    explicit StructuredLogger(LogLevel                     min_level,
                              const std::filesystem::path& log_path  = {},
                              bool                         to_stderr = true);

    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&)                 = delete;
    StructuredLogger& operator=(StructuredLogger&&)      = delete;

    void log_tool_call(const ToolCallLog& entry);
    void log_catalog_build(const CatalogBuildLog& entry);
    void log_gateway_refresh(const GatewayRefreshLog& entry);

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(min_level_);
    }
};
