#include "mcp/json_rpc.hpp"

#include <utility>

namespace {

[[nodiscard]] bool valid_id(const nlohmann::json& id) noexcept {
    return id.is_string() || id.is_number() || id.is_null();
}

[[nodiscard]] RequestParseFailure invalid(std::string message, nlohmann::json id = nullptr) {
    return RequestParseFailure{
        .error = JsonRpcError{.code = jsonrpc::kInvalidRequest, .message = std::move(message)},
        .id    = std::move(id),
    };
}

}  // namespace

std::expected<JsonRpcRequest, RequestParseFailure> parse_request(const nlohmann::json& message) {
    if (message.is_array()) {
        return std::unexpected(invalid("Batch requests are not supported."));
    }
    if (!message.is_object()) {
        return std::unexpected(invalid("Request must be a JSON object."));
    }

    JsonRpcRequest request{};
    if (const auto id = message.find("id"); id != message.end()) {
        if (!valid_id(*id)) {
            return std::unexpected(invalid("Request id must be a string, number or null."));
        }
        request.id     = *id;
        request.has_id = true;
    }

    const auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() || version->get_ref<const std::string&>() != "2.0") {
        return std::unexpected(invalid("Invalid JSON-RPC version. Expected '2.0'.", request.id));
    }

    const auto method = message.find("method");
    if (method == message.end() || !method->is_string() || method->get_ref<const std::string&>().empty()) {
        return std::unexpected(invalid("Missing or invalid 'method'.", request.id));
    }
    request.method = method->get<std::string>();

    if (const auto params = message.find("params"); params != message.end()) {
        if (!params->is_object() && !params->is_array() && !params->is_null()) {
            return std::unexpected(invalid("Request params must be an object or array.", request.id));
        }
        request.params = *params;
    }
    return request;
}

nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result) {
    return nlohmann::json{
        {"jsonrpc", "2.0"},
        {"id",      id},
        {"result",  std::move(result)},
    };
}

nlohmann::json make_error(const nlohmann::json& id, const JsonRpcError& error) {
    nlohmann::json body{
        {"code",    error.code},
        {"message", error.message},
    };
    if (!error.data.is_null()) {
        body["data"] = error.data;
    }
    return nlohmann::json{
        {"jsonrpc", "2.0"},
        {"id",      id},
        {"error",   std::move(body)},
    };
}

std::string serialize(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string id_to_string(const nlohmann::json& id) {
    if (id.is_string()) {
        return id.get<std::string>();
    }
    return serialize(id);
}
