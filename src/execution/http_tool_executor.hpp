#pragma once

// ---------------------------------------------------------------------------
// http_tool_executor.hpp
//
// 로컬 카탈로그 도구를 백엔드 HTTP 엔드포인트 호출로 수행하는 실행기.
//
// [요청 구성]
// - route_template 의 {param} 자리표시자를 같은 이름의 인자로 치환한다.
//   이름 비교는 대소문자 무시, 값은 URL 인코딩. 인자가 없으면 자리표시자를
//   그대로 둔다.
// - 치환에 쓰이지 않은 인자 중 "body" 를 제외한 나머지는 query string 이 된다.
//   null 값은 생략한다.
// - POST/PUT/PATCH 이고 arguments.body 가 있으면 JSON 본문으로 보낸다.
// - 타임아웃: 정책 항목의 timeout_ms, 없으면 default_timeout.
// - 자격 증명 전달은 정책 항목의 auth_propagation 을 따른다.
//     INFER        : propagate_authorization 이 켜져 있으면 Authorization 전달
//     NONE         : 아무것도 전달하지 않음
//     BEARER_TOKEN : 전역 옵션과 무관하게 Authorization 전달
//     COOKIES      : Cookie 헤더만 전달
//
// [응답 처리]
// - 2xx: 본문을 text content 하나로 반환한다 (JSON 이면 compact 재직렬화).
// - 그 외: HTTP_<status> 실패. 본문 앞부분을 메시지에 포함한다.
// ---------------------------------------------------------------------------

#include "execution/tool_executor.hpp"

#include <chrono>
#include <string>
#include <string_view>

struct HttpToolExecutorOptions {
    std::string               base_url{"http://127.0.0.1:8080"};
    std::chrono::milliseconds default_timeout{std::chrono::seconds{30}};
    bool                      propagate_authorization{false};
    bool                      include_diagnostic_headers{true};
};

class HttpToolExecutor final : public ToolExecutor {
public:
    explicit HttpToolExecutor(HttpToolExecutorOptions options);

    boost::asio::awaitable<ToolResult>
    async_execute(const ToolDescriptor& tool,
                  const nlohmann::json& arguments,
                  const CallContext&    context,
                  std::stop_token       stop) override;

    [[nodiscard]] const HttpToolExecutorOptions& options() const noexcept { return options_; }

    // build_target
    //   route_template + arguments → "/path?query". 테스트에서 직접 검증한다.
    [[nodiscard]] static std::string build_target(std::string_view      route_template,
                                                  const nlohmann::json& arguments);

private:
    HttpToolExecutorOptions options_;

    [[nodiscard]] std::chrono::milliseconds timeout_for(const ToolDescriptor& tool) const;
};

// url_encode
//   RFC 3986 unreserved 문자 외에는 %XX 로 인코딩한다.
[[nodiscard]] std::string url_encode(std::string_view value);
