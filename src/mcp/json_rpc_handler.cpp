#include "mcp/json_rpc_handler.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr std::string_view kInitialize = "initialize";
constexpr std::string_view kToolsList  = "tools/list";
constexpr std::string_view kToolsCall  = "tools/call";

[[nodiscard]] JsonRpcError invalid_params(std::string message, nlohmann::json data = nullptr) {
    return JsonRpcError{
        .code    = jsonrpc::kInvalidParams,
        .message = std::move(message),
        .data    = std::move(data),
    };
}

[[nodiscard]] nlohmann::json describe_tool(const ToolDescriptor& tool) {
    return nlohmann::json{
        {"name",        tool.tool_name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema.is_object() ? tool.input_schema : default_input_schema()},
    };
}

[[nodiscard]] nlohmann::json call_result(const ToolResult& result, const std::string& tool_name) {
    if (result.success) {
        if (result.content.is_array()) {
            return nlohmann::json{{"content", result.content}, {"isError", false}};
        }
        if (result.content.is_null()) {
            return nlohmann::json{{"content", nlohmann::json::array()}, {"isError", false}};
        }
        // 배열이 아닌 결과는 버리지 않고 text content 하나로 감싼다.
        spdlog::warn("[rpc] tool '{}' returned non-array content ({}), wrapping as text",
                     tool_name, result.content.type_name());
        return nlohmann::json{
            {"content", text_content(result.content.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace))},
            {"isError", false},
        };
    }
    const bool has_content = result.content.is_array() && !result.content.empty();
    return nlohmann::json{
        {"content", has_content ? result.content : text_content(result.error_message)},
        {"isError", true},
    };
}

}  // namespace

JsonRpcHandler::JsonRpcHandler(std::shared_ptr<CatalogSource>    catalog,
                               std::shared_ptr<ToolExecutor>     executor,
                               JsonRpcHandlerOptions             options,
                               std::shared_ptr<RpcStats>         stats,
                               std::shared_ptr<StructuredLogger> audit_logger)
    : catalog_{std::move(catalog)}
    , executor_{std::move(executor)}
    , options_{std::move(options)}
    , stats_{std::move(stats)}
    , audit_logger_{std::move(audit_logger)}
{
    if (!catalog_) {
        throw std::invalid_argument("JsonRpcHandler requires a catalog source");
    }
    if (!executor_) {
        throw std::invalid_argument("JsonRpcHandler requires a tool executor");
    }
}

nlohmann::json JsonRpcHandler::initialize_result() const {
    return nlohmann::json{
        {"protocolVersion", std::string{kMcpProtocolVersion}},
        {"serverInfo",      {{"name", options_.service_name}, {"version", std::string{kServerVersion}}}},
        {"capabilities",    {{"tools", nlohmann::json::object()}}},
    };
}

boost::asio::awaitable<std::optional<nlohmann::json>>
JsonRpcHandler::handle_payload(std::string_view payload, CallContext context, std::stop_token stop) {
    auto message = nlohmann::json::parse(payload, nullptr, false);
    if (message.is_discarded()) {
        if (stats_) {
            stats_->on_request();
            stats_->on_parse_error();
            stats_->on_error();
        }
        spdlog::debug("[rpc] {} payload is not valid JSON ({} bytes)", to_string(context.transport), payload.size());
        co_return make_error(nullptr, JsonRpcError{.code = jsonrpc::kParseError,
                                                   .message = "Parse error: invalid JSON."});
    }
    co_return co_await handle_message(std::move(message), std::move(context), std::move(stop));
}

boost::asio::awaitable<std::optional<nlohmann::json>>
JsonRpcHandler::handle_message(nlohmann::json message, CallContext context, std::stop_token stop) {
    if (stats_) {
        stats_->on_request();
    }

    auto request = parse_request(message);
    if (!request) {
        if (stats_) {
            stats_->on_error();
        }
        spdlog::debug("[rpc] invalid request: {}", request.error().error.message);
        co_return make_error(request.error().id, request.error().error);
    }

    context.request_id = id_to_string(request->id);

    MethodResult outcome = std::unexpected(JsonRpcError{});
    try {
        outcome = co_await dispatch(*request, context, stop);
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("[rpc] method '{}' failed: {}", request->method, e.what());
        outcome = std::unexpected(JsonRpcError{.code    = jsonrpc::kInternalError,
                                               .message = "Internal error processing request."});
    }

    if (request->is_notification()) {
        if (stats_) {
            stats_->on_notification();
        }
        co_return std::nullopt;
    }

    if (!outcome) {
        if (stats_) {
            stats_->on_error();
        }
        co_return make_error(request->id, outcome.error());
    }
    co_return make_result(request->id, std::move(*outcome));
}

boost::asio::awaitable<JsonRpcHandler::MethodResult>
JsonRpcHandler::dispatch(const JsonRpcRequest& request, const CallContext& context, std::stop_token stop) {
    if (request.method == kInitialize) {
        if (!initialized_.exchange(true, std::memory_order_acq_rel)) {
            spdlog::info("[rpc] {} session initialized", to_string(context.transport));
        }
        co_return initialize_result();
    }
    if (request.method == kToolsList) {
        co_return co_await handle_tools_list(std::move(stop));
    }
    if (request.method == kToolsCall) {
        co_return co_await handle_tools_call(request.params, context, std::move(stop));
    }

    co_return std::unexpected(JsonRpcError{
        .code    = jsonrpc::kMethodNotFound,
        .message = fmt::format("Method '{}' not found. Supported methods: initialize, tools/list, tools/call.",
                               request.method),
    });
}

boost::asio::awaitable<CatalogSource::SnapshotPtr> JsonRpcHandler::fresh_snapshot(std::stop_token stop) {
    auto fetched = co_await catalog_->async_ensure_fresh_snapshot(std::move(stop));
    if (fetched && *fetched) {
        co_return *fetched;
    }
    if (!fetched) {
        spdlog::warn("[rpc] catalog refresh failed, serving current snapshot: {}", fetched.error());
    }
    co_return catalog_->current_snapshot();
}

boost::asio::awaitable<JsonRpcHandler::MethodResult> JsonRpcHandler::handle_tools_list(std::stop_token stop) {
    const auto snapshot = co_await fresh_snapshot(std::move(stop));

    nlohmann::json tools = nlohmann::json::array();
    for (const auto& [name, tool] : snapshot->tools) {
        tools.push_back(describe_tool(tool));
    }
    co_return nlohmann::json{{"tools", std::move(tools)}};
}

boost::asio::awaitable<JsonRpcHandler::MethodResult>
JsonRpcHandler::handle_tools_call(const nlohmann::json& params, const CallContext& context, std::stop_token stop) {
    if (!params.is_object()) {
        co_return std::unexpected(invalid_params("Invalid parameters format for tools/call request."));
    }

    const auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        co_return std::unexpected(invalid_params("Missing required 'name' parameter."));
    }
    const std::string tool_name = name_it->get<std::string>();

    if (auto valid = validate_tool_name(tool_name, options_.limits); !valid) {
        co_return std::unexpected(JsonRpcError{
            .code    = jsonrpc::kInvalidToolName,
            .message = valid.error(),
            .data    = tool_name,
        });
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (const auto args_it = params.find("arguments"); args_it != params.end() && !args_it->is_null()) {
        if (auto valid = validate_arguments(*args_it, options_.limits); !valid) {
            co_return std::unexpected(invalid_params(valid.error()));
        }
        arguments = *args_it;
    }

    const auto snapshot = co_await fresh_snapshot(stop);
    const ToolDescriptor* tool = snapshot->find(tool_name);
    if (tool == nullptr) {
        co_return std::unexpected(invalid_params(fmt::format("Tool '{}' not found.", tool_name), tool_name));
    }

    const auto started    = std::chrono::steady_clock::now();
    const auto started_at = std::chrono::system_clock::now();

    ToolResult result;
    try {
        result = co_await executor_->async_execute(*tool, arguments, context, stop);
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("[rpc] executor threw for tool '{}': {}", tool_name, e.what());
        result = ToolResult::failure("EXECUTION_ERROR", fmt::format("Tool execution failed: {}", e.what()), false);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (stats_) {
        stats_->on_tool_call(!result.success);
    }
    if (audit_logger_) {
        audit_logger_->log_tool_call(ToolCallLog{
            .request_id     = context.request_id,
            .transport      = context.transport,
            .client_address = context.client_address,
            .tool_name      = tool_name,
            .success        = result.success,
            .error_type     = result.error_type,
            .timestamp      = started_at,
            .duration       = elapsed,
        });
    }

    co_return call_result(result, tool_name);
}
