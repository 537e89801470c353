// ---------------------------------------------------------------------------
// test_upstream_tool_executor.cpp
//
// UpstreamToolExecutor / RoutingToolExecutor 단위 테스트.
//
// [테스트 범위]
// - parse_call_response(): 정상 content, isError, JSON-RPC 오류, 형식 오류
// - async_execute(): 스텁 업스트림에 원래 도구 이름으로 tools/call 전달,
//   기본 헤더 포함, HTTP 오류 분류
// - 재시도: 503 뒤 성공하면 두 번째 응답, 계속 503 이면 한 번만 재시도,
//   429 / 500 은 재시도하지 않음, 대기 시간 상한
// - RoutingToolExecutor: upstream 유무로 실행기 선택, 실행기 없음 → NO_ENDPOINT
// ---------------------------------------------------------------------------

#include "execution/upstream_tool_executor.hpp"

#include "stub_http_server.hpp"

#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace asio = boost::asio;
using nlohmann::json;

namespace {

class TaggingExecutor final : public ToolExecutor {
public:
    explicit TaggingExecutor(std::string tag) : tag_{std::move(tag)} {}

    asio::awaitable<ToolResult> async_execute(const ToolDescriptor& tool, const json& /*arguments*/,
                                              const CallContext& /*context*/, std::stop_token /*stop*/) override {
        ++calls;
        co_return ToolResult::ok(text_content(tag_ + ":" + tool.tool_name));
    }

    int calls{0};

private:
    std::string tag_;
};

ToolDescriptor upstream_tool(std::string endpoint) {
    ToolDescriptor tool{};
    tool.tool_name    = "wx.forecast";
    tool.input_schema = default_input_schema();
    tool.upstream     = UpstreamRoute{
        .upstream_name      = "weather",
        .upstream_tool_name = "forecast",
        .mcp_endpoint       = std::move(endpoint),
        .request_timeout    = std::chrono::milliseconds{2000},
        .default_headers    = {{"X-Api-Key", "k1"}},
    };
    return tool;
}

ToolDescriptor local_tool() {
    ToolDescriptor tool{};
    tool.tool_name = "orders.get";
    tool.endpoint  = EndpointDescriptor{.route_template = "/api/orders/{id}"};
    return tool;
}

ToolResult run(asio::io_context& ioc, ToolExecutor& executor, ToolDescriptor tool, json arguments,
               StubHttpServer* server = nullptr) {
    auto task = [](ToolExecutor* exec, StubHttpServer* srv, ToolDescriptor t, json args)
        -> asio::awaitable<ToolResult> {
        auto result = co_await exec->async_execute(t, args, CallContext{.request_id = "7"}, {});
        if (srv != nullptr) {
            srv->stop();
        }
        co_return result;
    };
    auto future = asio::co_spawn(ioc, task(&executor, server, std::move(tool), std::move(arguments)),
                                 asio::use_future);
    ioc.run();
    ioc.restart();
    return future.get();
}

} // namespace

TEST(UpstreamCallResponse, SuccessfulContent_IsPassedThrough) {
    const auto result = UpstreamToolExecutor::parse_call_response(
        R"({"jsonrpc":"2.0","id":"x","result":{"content":[{"type":"text","text":"sunny"}]}})");
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0]["text"], "sunny");
}

TEST(UpstreamCallResponse, IsError_KeepsContentAndUsesFirstText) {
    const auto result = UpstreamToolExecutor::parse_call_response(
        R"({"result":{"isError":true,"content":[{"type":"image","data":"..."},{"type":"text","text":"city unknown"}]}})");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, "UPSTREAM_TOOL_ERROR");
    EXPECT_EQ(result.error_message, "city unknown");
    EXPECT_EQ(result.content.size(), 2u);
}

TEST(UpstreamCallResponse, JsonRpcError_IsRpcError) {
    const auto result = UpstreamToolExecutor::parse_call_response(
        R"({"jsonrpc":"2.0","id":"x","error":{"code":-32602,"message":"Unknown tool"}})");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, "UPSTREAM_RPC_ERROR");
    EXPECT_EQ(result.error_message, "Upstream returned an error: Unknown tool");
}

TEST(UpstreamCallResponse, MalformedBodies_AreProtocolErrors) {
    EXPECT_EQ(UpstreamToolExecutor::parse_call_response("nope").error_type, "UPSTREAM_PROTOCOL_ERROR");
    EXPECT_EQ(UpstreamToolExecutor::parse_call_response("[]").error_type, "UPSTREAM_PROTOCOL_ERROR");
    EXPECT_EQ(UpstreamToolExecutor::parse_call_response(R"({"result":"text"})").error_type,
              "UPSTREAM_PROTOCOL_ERROR");
}

TEST(UpstreamCallResponse, MissingContent_IsEmptyArray) {
    const auto result = UpstreamToolExecutor::parse_call_response(R"({"result":{}})");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.content.is_array());
    EXPECT_TRUE(result.content.empty());
}

TEST(UpstreamCallResponse, NonArrayContent_IsWrappedAsText) {
    const auto result = UpstreamToolExecutor::parse_call_response(R"({"result":{"content":"plain answer"}})");
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0]["text"], "\"plain answer\"");
}

TEST(UpstreamToolExecutor, ForwardsCallWithUpstreamToolName) {
    asio::io_context ioc;
    StubHttpServer   server{ioc, [](const StubRequest&) {
        return StubResponse{.body = R"({"jsonrpc":"2.0","id":"1","result":{"content":[{"type":"text","text":"18C"}]}})"};
    }};
    server.start();

    UpstreamToolExecutor executor;
    const auto result = run(ioc, executor, upstream_tool(server.url("/mcp")), json{{"city", "Seoul"}}, &server);

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.content[0]["text"], "18C");

    ASSERT_EQ(server.requests.size(), 1u);
    const auto& seen = server.requests.front();
    EXPECT_EQ(seen.target, "/mcp/v1");
    EXPECT_EQ(seen.header("X-Api-Key"), "k1");
    const auto payload = json::parse(seen.body);
    EXPECT_EQ(payload["method"], "tools/call");
    EXPECT_EQ(payload["params"]["name"], "forecast");
    EXPECT_EQ(payload["params"]["arguments"]["city"], "Seoul");
}

TEST(UpstreamToolExecutor, HttpFailure_IsClassifiedByStatus) {
    asio::io_context ioc;
    StubHttpServer   server{ioc, [](const StubRequest&) {
        return StubResponse{.status = 429, .body = "slow down", .content_type = "text/plain"};
    }};
    server.start();

    UpstreamToolExecutor executor;
    const auto result = run(ioc, executor, upstream_tool(server.url()), json::object(), &server);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, "HTTP_429");
    EXPECT_TRUE(result.transient);
    EXPECT_EQ(server.requests.front().target, "/mcp/v1");
}

TEST(UpstreamToolExecutor, Unavailable_RetriedOnceThenSucceeds) {
    asio::io_context ioc;
    int              served = 0;
    StubHttpServer   server{ioc, [&served](const StubRequest&) {
        if (served++ == 0) {
            return StubResponse{.status = 503, .body = "busy", .content_type = "text/plain"};
        }
        return StubResponse{.body = R"({"jsonrpc":"2.0","id":"2","result":{"content":[{"type":"text","text":"ok"}]}})"};
    }};
    server.start();

    UpstreamToolExecutor executor{UpstreamRetryOptions{.retry_count = 1, .base_delay = std::chrono::milliseconds{10}}};
    const auto result = run(ioc, executor, upstream_tool(server.url()), json::object(), &server);

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.content[0]["text"], "ok");
    ASSERT_EQ(server.requests.size(), 2u);
    // 재시도는 새 요청 id 를 쓴다
    EXPECT_NE(json::parse(server.requests[0].body)["id"], json::parse(server.requests[1].body)["id"]);
}

TEST(UpstreamToolExecutor, PersistentBadGateway_RetriesOnlyOnce) {
    asio::io_context ioc;
    StubHttpServer   server{ioc, [](const StubRequest&) {
        return StubResponse{.status = 502, .body = "bad gateway", .content_type = "text/plain"};
    }};
    server.start();

    UpstreamToolExecutor executor{UpstreamRetryOptions{.retry_count = 1, .base_delay = std::chrono::milliseconds{10}}};
    const auto result = run(ioc, executor, upstream_tool(server.url()), json::object(), &server);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_type, "HTTP_502");
    EXPECT_EQ(server.requests.size(), 2u);
}

TEST(UpstreamToolExecutor, InternalServerError_IsNotRetried) {
    asio::io_context ioc;
    StubHttpServer   server{ioc, [](const StubRequest&) {
        return StubResponse{.status = 500, .body = "boom", .content_type = "text/plain"};
    }};
    server.start();

    UpstreamToolExecutor executor{UpstreamRetryOptions{.retry_count = 3, .base_delay = std::chrono::milliseconds{10}}};
    const auto result = run(ioc, executor, upstream_tool(server.url()), json::object(), &server);

    EXPECT_EQ(result.error_type, "HTTP_500");
    EXPECT_TRUE(result.transient);
    EXPECT_EQ(server.requests.size(), 1u);
}

TEST(UpstreamToolExecutor, RetryPolicy_ClassificationAndBackoff) {
    EXPECT_TRUE(UpstreamToolExecutor::is_retryable(ToolResult::failure("HTTP_503", "", true)));
    EXPECT_TRUE(UpstreamToolExecutor::is_retryable(ToolResult::failure("HTTP_504", "", true)));
    EXPECT_TRUE(UpstreamToolExecutor::is_retryable(ToolResult::failure("TIMEOUT", "", true)));
    EXPECT_TRUE(UpstreamToolExecutor::is_retryable(ToolResult::failure("HTTP_ERROR", "", true)));
    EXPECT_FALSE(UpstreamToolExecutor::is_retryable(ToolResult::failure("HTTP_ERROR", "", false)));
    EXPECT_FALSE(UpstreamToolExecutor::is_retryable(ToolResult::failure("HTTP_429", "", true)));
    EXPECT_FALSE(UpstreamToolExecutor::is_retryable(ToolResult::failure("CANCELLED", "", true)));
    EXPECT_FALSE(UpstreamToolExecutor::is_retryable(ToolResult::ok(json::array())));

    const UpstreamToolExecutor executor{UpstreamRetryOptions{
        .retry_count = 5, .base_delay = std::chrono::milliseconds{100}, .max_delay = std::chrono::milliseconds{350}}};
    EXPECT_EQ(executor.backoff_delay(0), std::chrono::milliseconds{100});
    EXPECT_EQ(executor.backoff_delay(1), std::chrono::milliseconds{200});
    EXPECT_EQ(executor.backoff_delay(2), std::chrono::milliseconds{350});
    EXPECT_EQ(executor.backoff_delay(10), std::chrono::milliseconds{350});
}

TEST(UpstreamToolExecutor, ToolWithoutUpstream_ReturnsNoEndpoint) {
    asio::io_context     ioc;
    UpstreamToolExecutor executor;

    const auto result = run(ioc, executor, local_tool(), json::object());
    EXPECT_EQ(result.error_type, "NO_ENDPOINT");
}

TEST(RoutingToolExecutor, SelectsExecutorByRoute) {
    asio::io_context ioc;
    auto local    = std::make_shared<TaggingExecutor>("local");
    auto upstream = std::make_shared<TaggingExecutor>("upstream");
    RoutingToolExecutor router{local, upstream};

    EXPECT_EQ(run(ioc, router, local_tool(), json::object()).content[0]["text"], "local:orders.get");
    EXPECT_EQ(run(ioc, router, upstream_tool("http://weather/mcp"), json::object()).content[0]["text"],
              "upstream:wx.forecast");
    EXPECT_EQ(local->calls, 1);
    EXPECT_EQ(upstream->calls, 1);
}

TEST(RoutingToolExecutor, MissingExecutor_ReturnsNoEndpoint) {
    asio::io_context    ioc;
    RoutingToolExecutor local_only{std::make_shared<TaggingExecutor>("local"), nullptr};
    RoutingToolExecutor upstream_only{nullptr, std::make_shared<TaggingExecutor>("upstream")};

    EXPECT_EQ(run(ioc, local_only, upstream_tool("http://weather/mcp"), json::object()).error_type, "NO_ENDPOINT");
    EXPECT_EQ(run(ioc, upstream_only, local_tool(), json::object()).error_type, "NO_ENDPOINT");
    EXPECT_TRUE(run(ioc, local_only, local_tool(), json::object()).success);
}
