#pragma once

// ---------------------------------------------------------------------------
// json_rpc.hpp
//
// JSON-RPC 2.0 봉투(envelope) 코덱.
//
// [규약]
// - 응답은 result 와 error 중 정확히 하나를 갖고, 요청 id 를 그대로 되돌린다.
// - id 는 string / number / null 만 허용한다. id 멤버가 아예 없으면
//   알림(notification)이며 응답하지 않는다.
// - params 는 없거나 object / array 여야 한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace jsonrpc {

inline constexpr int kParseError     = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams  = -32602;
inline constexpr int kInternalError  = -32603;
inline constexpr int kInvalidToolName = -32001;

}  // namespace jsonrpc

struct JsonRpcError {
    int            code{jsonrpc::kInternalError};
    std::string    message{};
    nlohmann::json data{};  // null 이면 직렬화하지 않는다
};

// ---------------------------------------------------------------------------
// JsonRpcRequest
//   has_id == false 이면 알림. id 는 원본 JSON 값 (string/number/null).
// ---------------------------------------------------------------------------
struct JsonRpcRequest {
    nlohmann::json id{};
    bool           has_id{false};
    std::string    method{};
    nlohmann::json params{};

    [[nodiscard]] bool is_notification() const noexcept { return !has_id; }
};

// parse_request
//   이미 JSON 으로 파싱된 메시지를 검증한다. 실패 시 -32600 오류와, 가능하면
//   원래 id (없으면 null) 를 함께 돌려준다.
struct RequestParseFailure {
    JsonRpcError   error{};
    nlohmann::json id{};
};

[[nodiscard]] std::expected<JsonRpcRequest, RequestParseFailure>
parse_request(const nlohmann::json& message);

[[nodiscard]] nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result);
[[nodiscard]] nlohmann::json make_error(const nlohmann::json& id, const JsonRpcError& error);

// serialize
//   잘못된 UTF-8 은 U+FFFD 로 치환하여 직렬화한다 (예외 없음).
[[nodiscard]] std::string serialize(const nlohmann::json& message);

// id_to_string
//   로그/컨텍스트용 id 표현. null → "null".
[[nodiscard]] std::string id_to_string(const nlohmann::json& id);
