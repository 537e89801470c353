#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// TransportKind
//   요청이 들어온 전송 계층. 로그/감사 기록과 실행 컨텍스트에 사용된다.
// ---------------------------------------------------------------------------
enum class TransportKind : std::uint8_t {
    kStdio = 0,  // 줄 단위 JSON-RPC (stdin/stdout)
    kHttp  = 1,  // HTTP POST /mcp
};

// ---------------------------------------------------------------------------
// CallContext
//   요청 하나를 식별하는 불변 컨텍스트.
//   transport 레이어가 생성하고 handler/executor/logger 레이어에 const-ref 로
//   전달한다.
//
//   authorization: HTTP Authorization 헤더 원문. 실행기가 전파 옵션을 켠
//                  경우에만 백엔드로 전달된다. 로그에 출력하지 말 것.
//   cookie       : HTTP Cookie 헤더 원문. auth_propagation 이 COOKIES 인
//                  도구에만 전달된다.
// ---------------------------------------------------------------------------
struct CallContext {
    TransportKind transport{TransportKind::kStdio};
    std::string   request_id{};        // JSON-RPC id 의 직렬화 문자열 ("null" 포함)
    std::string   client_address{};    // HTTP 클라이언트 주소 (stdio 는 빈 값)
    std::string   authorization{};     // Authorization 헤더 원문
    std::string   cookie{};            // Cookie 헤더 원문
    std::chrono::system_clock::time_point received_at{};
};

// ---------------------------------------------------------------------------
// OperationCancelled
//   std::stop_token 으로 취소가 요청되었을 때 동기 파이프라인이 던지는 예외.
//   일반 오류와 동일한 경로로 호출자까지 전파된다.
// ---------------------------------------------------------------------------
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled()
        : std::runtime_error("operation cancelled")
    {}
};

[[nodiscard]] inline const char* to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::kStdio: return "stdio";
        case TransportKind::kHttp:  return "http";
        default:                    return "unknown";
    }
}

// ---------------------------------------------------------------------------
// format_iso8601
//   system_clock 시각을 "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC) 로 포맷한다.
//   manifest, 진단 문서, 감사 로그가 같은 표기를 쓰도록 한 곳에 둔다.
// ---------------------------------------------------------------------------
[[nodiscard]] inline std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    const auto since_epoch = tp.time_since_epoch();
    const auto seconds     = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto millis      = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds);

    const std::time_t time_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_val, &tm_val);

    char buf[32]{};
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_val);
    std::string out{buf, n};
    out += '.';
    const auto ms = static_cast<int>(millis.count());
    out += static_cast<char>('0' + (ms / 100) % 10);
    out += static_cast<char>('0' + (ms / 10) % 10);
    out += static_cast<char>('0' + ms % 10);
    out += 'Z';
    return out;
}
