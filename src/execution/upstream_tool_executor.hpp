#pragma once

// ---------------------------------------------------------------------------
// upstream_tool_executor.hpp
//
// 게이트웨이 카탈로그 도구를 소유 업스트림 MCP 서버로 전달하는 실행기.
//
// [동작]
//   POST <mcp_endpoint>/mcp/v1
//   {"jsonrpc":"2.0","id":"<uuid>","method":"tools/call",
//    "params":{"name":<upstream_tool_name>,"arguments":{...}}}
//   업스트림 result 의 content / isError 를 그대로 돌려준다.
//   업스트림 JSON-RPC 오류는 UPSTREAM_RPC_ERROR, 응답 형식 오류는
//   UPSTREAM_PROTOCOL_ERROR 로 분류한다.
//
// [재시도]
//   HTTP 502/503/504, 연결 오류, 업스트림 timeout 은 retry_count 번까지 다시
//   보낸다. 시도 사이에는 base_delay * 2^n (max_delay 상한) 만큼 쉰다.
//   호출자 취소는 재시도하지 않으며, 대기 중 취소되면 CANCELLED 로 끝난다.
// ---------------------------------------------------------------------------

#include "execution/tool_executor.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

struct UpstreamRetryOptions {
    std::uint32_t             retry_count{1};
    std::chrono::milliseconds base_delay{100};
    std::chrono::milliseconds max_delay{1000};
};

class UpstreamToolExecutor final : public ToolExecutor {
public:
    explicit UpstreamToolExecutor(UpstreamRetryOptions retry = {});

    boost::asio::awaitable<ToolResult>
    async_execute(const ToolDescriptor& tool,
                  const nlohmann::json& arguments,
                  const CallContext&    context,
                  std::stop_token       stop) override;

    // parse_call_response
    //   업스트림 tools/call 응답 본문을 ToolResult 로 변환한다.
    [[nodiscard]] static ToolResult parse_call_response(std::string_view body);

    // is_retryable
    //   실패 결과가 재시도 대상인지 (502/503/504, HTTP_ERROR, TIMEOUT 중 transient).
    [[nodiscard]] static bool is_retryable(const ToolResult& result) noexcept;

    // backoff_delay
    //   attempt 번째 재시도(0부터) 전에 기다릴 시간.
    [[nodiscard]] std::chrono::milliseconds backoff_delay(std::uint32_t attempt) const noexcept;

private:
    UpstreamRetryOptions retry_;

    boost::asio::awaitable<ToolResult>
    call_once(const ToolDescriptor& tool, const std::string& body, std::stop_token stop);
};

// ---------------------------------------------------------------------------
// RoutingToolExecutor
//   descriptor.upstream 이 있으면 업스트림 실행기, 없으면 로컬(HTTP) 실행기로
//   보낸다. 어느 한쪽이 nullptr 이면 해당 종류의 도구는 NO_ENDPOINT.
// ---------------------------------------------------------------------------
class RoutingToolExecutor final : public ToolExecutor {
public:
    RoutingToolExecutor(std::shared_ptr<ToolExecutor> local,
                        std::shared_ptr<ToolExecutor> upstream);

    boost::asio::awaitable<ToolResult>
    async_execute(const ToolDescriptor& tool,
                  const nlohmann::json& arguments,
                  const CallContext&    context,
                  std::stop_token       stop) override;

private:
    std::shared_ptr<ToolExecutor> local_;
    std::shared_ptr<ToolExecutor> upstream_;
};
