#include "execution/upstream_tool_executor.hpp"

#include <algorithm>
#include <memory>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "gateway/remote_catalog_client.hpp"  // build_tools_list_url
#include "net/http_client.hpp"

namespace {

[[nodiscard]] std::string make_request_id() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

// content 배열에서 첫 text 항목. 실패 메시지로 쓴다.
[[nodiscard]] std::string first_text(const nlohmann::json& content) {
    for (const auto& item : content) {
        if (item.is_object() && item.contains("text") && item["text"].is_string()) {
            return item["text"].get<std::string>();
        }
    }
    return "upstream tool reported an error";
}

// 재시도 전 대기. stop 이 요청되면 false.
boost::asio::awaitable<bool> wait_backoff(std::chrono::milliseconds delay, std::stop_token stop) {
    namespace asio = boost::asio;

    auto executor = co_await asio::this_coro::executor;
    auto timer    = std::make_shared<asio::steady_timer>(executor, delay);

    std::stop_callback on_stop{stop, [executor, timer]() {
        asio::post(executor, [timer]() { timer->cancel(); });
    }};

    boost::system::error_code ec;
    co_await timer->async_wait(asio::redirect_error(asio::use_awaitable, ec));
    co_return !stop.stop_requested();
}

}  // namespace

UpstreamToolExecutor::UpstreamToolExecutor(UpstreamRetryOptions retry)
    : retry_{retry}
{}

bool UpstreamToolExecutor::is_retryable(const ToolResult& result) noexcept {
    if (result.success || !result.transient) {
        return false;
    }
    return result.error_type == "HTTP_502" || result.error_type == "HTTP_503" ||
           result.error_type == "HTTP_504" || result.error_type == "HTTP_ERROR" ||
           result.error_type == "TIMEOUT";
}

std::chrono::milliseconds UpstreamToolExecutor::backoff_delay(std::uint32_t attempt) const noexcept {
    auto delay = retry_.base_delay;
    for (std::uint32_t i = 0; i < attempt && delay < retry_.max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, retry_.max_delay);
}

ToolResult UpstreamToolExecutor::parse_call_response(std::string_view body) {
    const auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return ToolResult::failure("UPSTREAM_PROTOCOL_ERROR", "Upstream returned a malformed response.", false);
    }

    if (const auto error = doc.find("error"); error != doc.end() && !error->is_null()) {
        const auto message = error->is_object() && error->contains("message") && (*error)["message"].is_string()
                                 ? (*error)["message"].get<std::string>()
                                 : std::string{"(no message)"};
        return ToolResult::failure("UPSTREAM_RPC_ERROR",
                                   fmt::format("Upstream returned an error: {}", message), false);
    }

    const auto result = doc.find("result");
    if (result == doc.end() || !result->is_object()) {
        return ToolResult::failure("UPSTREAM_PROTOCOL_ERROR", "Upstream response has no result.", false);
    }

    nlohmann::json content = nlohmann::json::array();
    if (const auto it = result->find("content"); it != result->end() && !it->is_null()) {
        content = it->is_array() ? *it
                                 : text_content(it->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }
    const bool is_error = result->value("isError", false);

    if (!is_error) {
        return ToolResult::ok(std::move(content));
    }
    auto failure    = ToolResult::failure("UPSTREAM_TOOL_ERROR", first_text(content), false);
    failure.content = std::move(content);
    return failure;
}

boost::asio::awaitable<ToolResult>
UpstreamToolExecutor::async_execute(const ToolDescriptor& tool,
                                    const nlohmann::json& arguments,
                                    const CallContext&    context,
                                    std::stop_token       stop) {
    if (!tool.upstream) {
        co_return ToolResult::failure(
            "NO_ENDPOINT", fmt::format("Tool '{}' has no upstream route.", tool.tool_name), false);
    }
    const auto& route = *tool.upstream;

    spdlog::debug("[executor] tool '{}' -> upstream '{}' as '{}' (request {})",
                  tool.tool_name, route.upstream_name, route.upstream_tool_name, context.request_id);

    for (std::uint32_t attempt = 0;; ++attempt) {
        const nlohmann::json payload{
            {"jsonrpc", "2.0"},
            {"id",      make_request_id()},
            {"method",  "tools/call"},
            {"params",  {{"name", route.upstream_tool_name}, {"arguments", arguments}}},
        };
        auto result = co_await call_once(
            tool, payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), stop);

        if (attempt >= retry_.retry_count || !is_retryable(result) || stop.stop_requested()) {
            co_return result;
        }

        const auto delay = backoff_delay(attempt);
        spdlog::warn("[executor] upstream '{}' tool '{}' failed with {} (attempt {}/{}), retrying in {}ms",
                     route.upstream_name, tool.tool_name, result.error_type, attempt + 1,
                     retry_.retry_count + 1, delay.count());
        if (!co_await wait_backoff(delay, stop)) {
            co_return ToolResult::failure("CANCELLED", "Tool execution was cancelled by client.", true);
        }
    }
}

boost::asio::awaitable<ToolResult>
UpstreamToolExecutor::call_once(const ToolDescriptor& tool, const std::string& body, std::stop_token stop) {
    const auto& route = *tool.upstream;

    HttpRequest request{};
    request.method       = boost::beast::http::verb::post;
    request.url          = HttpCatalogClient::build_tools_list_url(route.mcp_endpoint);
    request.headers      = route.default_headers;
    request.headers.emplace_back("Accept", "application/json");
    request.body         = body;
    request.content_type = "application/json";
    request.timeout      = route.request_timeout;

    auto response = co_await async_http_request(std::move(request), std::move(stop));
    if (!response) {
        const auto& error = response.error();
        switch (error.kind) {
            case HttpErrorKind::kTimeout:
                co_return ToolResult::failure(
                    "TIMEOUT",
                    fmt::format("Tool execution timed out after {}ms.", route.request_timeout.count()),
                    true);
            case HttpErrorKind::kCancelled:
                co_return ToolResult::failure("CANCELLED", "Tool execution was cancelled by client.", true);
            default:
                spdlog::warn("[executor] upstream '{}' call failed: {}", route.upstream_name, error.message);
                co_return ToolResult::failure(
                    "HTTP_ERROR", fmt::format("HTTP request failed: {}", error.message),
                    error.kind == HttpErrorKind::kTransport);
        }
    }

    if (!response->ok()) {
        spdlog::warn("[executor] upstream '{}' returned HTTP {}", route.upstream_name, response->status);
        co_return ToolResult::failure(
            fmt::format("HTTP_{}", response->status),
            fmt::format("Upstream '{}' returned HTTP {}.", route.upstream_name, response->status),
            is_transient_status(response->status));
    }

    co_return parse_call_response(response->body);
}

RoutingToolExecutor::RoutingToolExecutor(std::shared_ptr<ToolExecutor> local,
                                         std::shared_ptr<ToolExecutor> upstream)
    : local_{std::move(local)}
    , upstream_{std::move(upstream)}
{}

boost::asio::awaitable<ToolResult>
RoutingToolExecutor::async_execute(const ToolDescriptor& tool,
                                   const nlohmann::json& arguments,
                                   const CallContext&    context,
                                   std::stop_token       stop) {
    ToolExecutor* target = tool.upstream ? upstream_.get() : local_.get();
    if (target == nullptr) {
        co_return ToolResult::failure(
            "NO_ENDPOINT", fmt::format("Tool '{}' has no executor for its route.", tool.tool_name), false);
    }
    co_return co_await target->async_execute(tool, arguments, context, std::move(stop));
}
