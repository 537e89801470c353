#pragma once

// ---------------------------------------------------------------------------
// json_rpc_handler.hpp
//
// 전송 계층에 독립적인 MCP JSON-RPC 메서드 디스패처.
// stdio 루프와 HTTP 엔드포인트가 각자 하나씩 인스턴스를 갖는다.
//
// [지원 메서드]
//   initialize  → protocolVersion / serverInfo / capabilities
//   tools/list  → 카탈로그 스냅샷의 도구 목록 (이름순)
//   tools/call  → 입력 검증 → 도구 조회 → 실행기 호출 (정확히 1회)
//
// [오류 매핑]
//   -32700  JSON 파싱 실패 (id null)
//   -32600  봉투 오류 (object 아님, batch, jsonrpc != "2.0", method 없음 ...)
//   -32601  알 수 없는 메서드
//   -32602  tools/call 파라미터 오류, 도구 없음
//   -32001  도구 이름 형식 위반
//   -32603  처리 중 예기치 못한 예외
//   실행 실패는 JSON-RPC 오류가 아니라 result.isError = true 로 응답한다.
//
// [상태]
//   Uninitialized → Initialized. 정보용일 뿐이며 tools/* 는 initialize
//   이전에도 처리한다.
//
// [취소]
//   stop 요청으로 발생한 OperationCancelled 는 응답으로 바꾸지 않고
//   호출자(전송 계층)에게 그대로 전파한다.
// ---------------------------------------------------------------------------

#include "catalog/catalog_source.hpp"
#include "common/types.hpp"
#include "execution/tool_executor.hpp"
#include "logger/structured_logger.hpp"
#include "mcp/input_validation.hpp"
#include "mcp/json_rpc.hpp"
#include "stats/rpc_stats.hpp"

#include <boost/asio/awaitable.hpp>

#include <atomic>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

inline constexpr std::string_view kMcpProtocolVersion = "2024-11-05";
inline constexpr std::string_view kServerVersion      = "0.1.0";

struct JsonRpcHandlerOptions {
    std::string service_name{"toolgate"};
    InputLimits limits{};
};

class JsonRpcHandler {
public:
    JsonRpcHandler(std::shared_ptr<CatalogSource>    catalog,
                   std::shared_ptr<ToolExecutor>     executor,
                   JsonRpcHandlerOptions             options      = {},
                   std::shared_ptr<RpcStats>         stats        = nullptr,
                   std::shared_ptr<StructuredLogger> audit_logger = nullptr);

    ~JsonRpcHandler() = default;

    JsonRpcHandler(const JsonRpcHandler&)            = delete;
    JsonRpcHandler& operator=(const JsonRpcHandler&) = delete;
    JsonRpcHandler(JsonRpcHandler&&)                 = delete;
    JsonRpcHandler& operator=(JsonRpcHandler&&)      = delete;

    // handle_payload
    //   원문 한 건(stdio 한 줄, HTTP 본문)을 처리한다.
    //   알림이면 std::nullopt, 그 외에는 응답 JSON.
    boost::asio::awaitable<std::optional<nlohmann::json>>
    handle_payload(std::string_view payload, CallContext context, std::stop_token stop);

    // handle_message
    //   이미 파싱된 메시지를 처리한다.
    boost::asio::awaitable<std::optional<nlohmann::json>>
    handle_message(nlohmann::json message, CallContext context, std::stop_token stop);

    [[nodiscard]] bool initialized() const noexcept {
        return initialized_.load(std::memory_order_acquire);
    }

    [[nodiscard]] nlohmann::json initialize_result() const;

private:
    using MethodResult = std::expected<nlohmann::json, JsonRpcError>;

    std::shared_ptr<CatalogSource>    catalog_;
    std::shared_ptr<ToolExecutor>     executor_;
    JsonRpcHandlerOptions             options_;
    std::shared_ptr<RpcStats>         stats_;
    std::shared_ptr<StructuredLogger> audit_logger_;
    std::atomic<bool>                 initialized_{false};

    boost::asio::awaitable<MethodResult>
    dispatch(const JsonRpcRequest& request, const CallContext& context, std::stop_token stop);

    boost::asio::awaitable<MethodResult> handle_tools_list(std::stop_token stop);

    boost::asio::awaitable<MethodResult>
    handle_tools_call(const nlohmann::json& params, const CallContext& context, std::stop_token stop);

    // 가능한 한 최신 스냅샷. 갱신 실패 시 현재(stale) 스냅샷.
    boost::asio::awaitable<CatalogSource::SnapshotPtr> fresh_snapshot(std::stop_token stop);
};
