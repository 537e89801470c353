#pragma once

// ---------------------------------------------------------------------------
// tool_executor.hpp
//
// tools/call 의 실제 수행을 담당하는 실행기 인터페이스.
//
// [규약]
// - async_execute() 는 실행 실패를 예외가 아니라 ToolResult{success=false}
//   로 반환한다. JsonRpcHandler 는 이를 isError:true 결과로 감싼다.
// - 예외가 새어 나오더라도 handler 가 잡아서 같은 방식으로 처리한다.
// - error_type 은 기계가 읽는 분류 코드다.
//     NO_ENDPOINT   : 실행할 엔드포인트/업스트림 정보 없음
//     TIMEOUT       : deadline 초과
//     CANCELLED     : 호출자 취소
//     HTTP_ERROR    : 연결/전송 오류
//     HTTP_<status> : 2xx 가 아닌 응답 (5xx/408/429 는 transient)
//     CONCURRENCY_LIMIT : 도구별 동시 실행 슬롯을 대기 한도 안에 얻지 못함
//     RATE_LIMITED      : 도구별 호출 빈도 한도 초과
// ---------------------------------------------------------------------------

#include "catalog/tool_descriptor.hpp"
#include "common/types.hpp"

#include <boost/asio/awaitable.hpp>

#include <stop_token>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

// ---------------------------------------------------------------------------
// ToolResult
//   content : MCP content 배열 ([{"type":"text","text":...}, ...]).
//             실패 결과에서도 업스트림이 준 content 가 있으면 그대로 쓴다.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool           success{false};
    nlohmann::json content = nlohmann::json::array();
    std::string    error_message{};
    std::string    error_type{};
    bool           transient{false};

    [[nodiscard]] static ToolResult ok(nlohmann::json content) {
        ToolResult result;
        result.success = true;
        result.content = std::move(content);
        return result;
    }

    [[nodiscard]] static ToolResult failure(std::string error_type,
                                            std::string message,
                                            bool        transient) {
        ToolResult result;
        result.error_type    = std::move(error_type);
        result.error_message = std::move(message);
        result.transient     = transient;
        return result;
    }
};

// text_content
//   문자열 하나로 MCP content 배열을 만든다.
[[nodiscard]] inline nlohmann::json text_content(const std::string& text) {
    return nlohmann::json::array({nlohmann::json{{"type", "text"}, {"text", text}}});
}

class ToolExecutor {
public:
    virtual ~ToolExecutor() = default;

    // arguments 는 항상 object 다 (handler 가 검증 후 전달).
    // stop_token 은 코루틴 프레임에 복사되도록 값으로 받는다.
    virtual boost::asio::awaitable<ToolResult>
    async_execute(const ToolDescriptor& tool,
                  const nlohmann::json& arguments,
                  const CallContext&    context,
                  std::stop_token       stop) = 0;
};

// is_transient_status
//   재시도할 가치가 있는 HTTP 상태 코드인지 (5xx, 408, 429).
[[nodiscard]] constexpr bool is_transient_status(unsigned status) noexcept {
    return status >= 500 || status == 408 || status == 429;
}
