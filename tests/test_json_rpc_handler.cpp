// ---------------------------------------------------------------------------
// test_json_rpc_handler.cpp
//
// JsonRpcHandler 단위 테스트.
//
// [테스트 범위]
// - initialize 결과와 Initialized 상태 전이
// - tools/list: 이름순, inputSchema 포함
// - tools/call: 실행기 정확히 1회 호출, 실패는 isError:true 결과,
//   배열이 아닌 content 는 text 로 감싸서 보존
// - 오류 코드: -32700 / -32600 / -32601 / -32602 / -32001
// - 알림은 응답 없음
// - 카탈로그 갱신 실패 시 현재 스냅샷으로 응답
// - OperationCancelled 는 응답으로 바꾸지 않고 전파
// - RpcStats 카운터
// ---------------------------------------------------------------------------

#include "mcp/json_rpc_handler.hpp"

#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace asio = boost::asio;
using nlohmann::json;

namespace {

std::shared_ptr<const CatalogSnapshot> catalog_of(std::initializer_list<const char*> names) {
    auto snapshot            = std::make_shared<CatalogSnapshot>();
    snapshot->source_version = "test";
    for (const char* name : names) {
        ToolDescriptor tool{};
        tool.tool_name    = name;
        tool.description  = std::string{"describes "} + name;
        tool.input_schema = default_input_schema();
        snapshot->tools.emplace(name, std::move(tool));
    }
    return snapshot;
}

class StaticCatalog final : public CatalogSource {
public:
    explicit StaticCatalog(SnapshotPtr snapshot)
        : snapshot_{std::move(snapshot)}
    {}

    asio::awaitable<FetchResult> async_ensure_fresh_snapshot(std::stop_token /*stop*/) override {
        ++fetches;
        if (!fetch_error.empty()) {
            co_return std::unexpected(fetch_error);
        }
        co_return snapshot_;
    }

    [[nodiscard]] SnapshotPtr current_snapshot() const override { return snapshot_; }

    std::string fetch_error{};
    int         fetches{0};

private:
    SnapshotPtr snapshot_;
};

struct RecordedCall {
    std::string tool_name{};
    json        arguments{};
    std::string request_id{};
};

class RecordingExecutor final : public ToolExecutor {
public:
    asio::awaitable<ToolResult> async_execute(const ToolDescriptor& tool,
                                              const json&           arguments,
                                              const CallContext&    context,
                                              std::stop_token       /*stop*/) override {
        calls.push_back(RecordedCall{tool.tool_name, arguments, context.request_id});
        if (throw_cancel) {
            throw OperationCancelled{};
        }
        if (throw_error) {
            throw std::runtime_error("backend adapter crashed");
        }
        co_return next_result;
    }

    std::vector<RecordedCall> calls{};
    ToolResult                next_result = ToolResult::ok(text_content("done"));
    bool                      throw_error{false};
    bool                      throw_cancel{false};
};

class JsonRpcHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_  = std::make_shared<StaticCatalog>(catalog_of({"orders.list", "orders.get"}));
        executor_ = std::make_shared<RecordingExecutor>();
        stats_    = std::make_shared<RpcStats>();
        handler_  = std::make_unique<JsonRpcHandler>(catalog_, executor_, JsonRpcHandlerOptions{}, stats_);
    }

    std::optional<json> send(std::string_view payload) {
        CallContext context{};
        context.transport = TransportKind::kStdio;
        auto future = asio::co_spawn(ioc_, handler_->handle_payload(payload, context, {}), asio::use_future);
        ioc_.run();
        ioc_.restart();
        return future.get();
    }

    json call(std::string_view params) {
        const auto response = send(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":)" +
                                   std::string{params} + "}");
        EXPECT_TRUE(response.has_value());
        return response.value_or(json{});
    }

    asio::io_context                   ioc_;
    std::shared_ptr<StaticCatalog>     catalog_;
    std::shared_ptr<RecordingExecutor> executor_;
    std::shared_ptr<RpcStats>          stats_;
    std::unique_ptr<JsonRpcHandler>    handler_;
};

} // namespace

TEST_F(JsonRpcHandlerTest, Initialize_ReturnsServerInfo) {
    EXPECT_FALSE(handler_->initialized());

    const auto response = send(R"({"jsonrpc":"2.0","id":"init","method":"initialize","params":{}})");
    ASSERT_TRUE(response.has_value());

    const auto& result = (*response)["result"];
    EXPECT_EQ((*response)["id"], "init");
    EXPECT_EQ(result["protocolVersion"], "2024-11-05");
    EXPECT_EQ(result["serverInfo"]["name"], "toolgate");
    EXPECT_EQ(result["serverInfo"]["version"], "0.1.0");
    EXPECT_TRUE(result["capabilities"]["tools"].is_object());
    EXPECT_TRUE(handler_->initialized());
}

TEST_F(JsonRpcHandlerTest, ToolsList_BeforeInitialize_IsServed) {
    const auto response = send(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    ASSERT_TRUE(response.has_value());

    const auto& tools = (*response)["result"]["tools"];
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["name"], "orders.get");
    EXPECT_EQ(tools[1]["name"], "orders.list");
    EXPECT_EQ(tools[0]["description"], "describes orders.get");
    EXPECT_EQ(tools[0]["inputSchema"]["type"], "object");
}

TEST_F(JsonRpcHandlerTest, ToolsList_RefreshFailure_ServesCurrentSnapshot) {
    catalog_->fetch_error = "upstream down";

    const auto response = send(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["result"]["tools"].size(), 2u);
}

TEST_F(JsonRpcHandlerTest, ToolsCall_InvokesExecutorOnce) {
    const auto response = call(R"({"name":"orders.get","arguments":{"id":"42"}})");

    ASSERT_EQ(executor_->calls.size(), 1u);
    EXPECT_EQ(executor_->calls[0].tool_name, "orders.get");
    EXPECT_EQ(executor_->calls[0].arguments["id"], "42");
    EXPECT_EQ(executor_->calls[0].request_id, "1");

    EXPECT_EQ(response["result"]["isError"], false);
    EXPECT_EQ(response["result"]["content"][0]["text"], "done");
}

TEST_F(JsonRpcHandlerTest, ToolsCall_MissingArguments_PassesEmptyObject) {
    (void)call(R"({"name":"orders.list"})");

    ASSERT_EQ(executor_->calls.size(), 1u);
    EXPECT_TRUE(executor_->calls[0].arguments.is_object());
    EXPECT_TRUE(executor_->calls[0].arguments.empty());
}

TEST_F(JsonRpcHandlerTest, ToolsCall_NonArrayContent_IsWrappedAsText) {
    executor_->next_result = ToolResult::ok(json{{"answer", 42}});

    const auto response = call(R"({"name":"orders.get"})");

    EXPECT_EQ(response["result"]["isError"], false);
    ASSERT_EQ(response["result"]["content"].size(), 1u);
    EXPECT_EQ(response["result"]["content"][0]["type"], "text");
    EXPECT_EQ(json::parse(response["result"]["content"][0]["text"].get<std::string>()), (json{{"answer", 42}}));
}

TEST_F(JsonRpcHandlerTest, ToolsCall_NullContent_IsEmptyArray) {
    executor_->next_result = ToolResult::ok(nullptr);

    const auto response = call(R"({"name":"orders.get"})");

    EXPECT_EQ(response["result"]["isError"], false);
    EXPECT_TRUE(response["result"]["content"].is_array());
    EXPECT_TRUE(response["result"]["content"].empty());
}

TEST_F(JsonRpcHandlerTest, ToolsCall_ExecutionFailure_IsErrorResult) {
    executor_->next_result = ToolResult::failure("HTTP_503", "Backend returned 503", true);

    const auto response = call(R"({"name":"orders.get","arguments":{}})");

    EXPECT_FALSE(response.contains("error"));
    EXPECT_EQ(response["result"]["isError"], true);
    EXPECT_EQ(response["result"]["content"][0]["text"], "Backend returned 503");
    EXPECT_EQ(stats_->snapshot().tool_failures, 1u);
}

TEST_F(JsonRpcHandlerTest, ToolsCall_ExecutorThrows_IsErrorResult) {
    executor_->throw_error = true;

    const auto response = call(R"({"name":"orders.get"})");

    EXPECT_EQ(response["result"]["isError"], true);
    const auto text = response["result"]["content"][0]["text"].get<std::string>();
    EXPECT_NE(text.find("backend adapter crashed"), std::string::npos);
}

TEST_F(JsonRpcHandlerTest, ToolsCall_UnknownTool_IsInvalidParams) {
    const auto response = call(R"({"name":"orders.delete"})");

    EXPECT_EQ(response["error"]["code"], jsonrpc::kInvalidParams);
    EXPECT_EQ(response["error"]["data"], "orders.delete");
    EXPECT_TRUE(executor_->calls.empty());
}

TEST_F(JsonRpcHandlerTest, ToolsCall_MalformedName_IsInvalidToolName) {
    const auto response = call(R"({"name":"orders//get"})");

    EXPECT_EQ(response["error"]["code"], jsonrpc::kInvalidToolName);
    EXPECT_TRUE(executor_->calls.empty());
}

TEST_F(JsonRpcHandlerTest, ToolsCall_MissingName_IsInvalidParams) {
    EXPECT_EQ(call(R"({"arguments":{}})")["error"]["code"], jsonrpc::kInvalidParams);
    EXPECT_EQ(call(R"({"name":12})")["error"]["code"], jsonrpc::kInvalidParams);
    EXPECT_EQ(call(R"([1,2])")["error"]["code"], jsonrpc::kInvalidParams);
}

TEST_F(JsonRpcHandlerTest, ToolsCall_NonObjectArguments_IsInvalidParams) {
    const auto response = call(R"({"name":"orders.get","arguments":[1,2,3]})");
    EXPECT_EQ(response["error"]["code"], jsonrpc::kInvalidParams);
    EXPECT_TRUE(executor_->calls.empty());
}

TEST_F(JsonRpcHandlerTest, UnknownMethod_IsMethodNotFound) {
    const auto response = send(R"({"jsonrpc":"2.0","id":9,"method":"resources/list"})");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["id"], 9);
    EXPECT_EQ((*response)["error"]["code"], jsonrpc::kMethodNotFound);
}

TEST_F(JsonRpcHandlerTest, InvalidJson_IsParseErrorWithNullId) {
    const auto response = send("{not json");
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE((*response)["id"].is_null());
    EXPECT_EQ((*response)["error"]["code"], jsonrpc::kParseError);
    EXPECT_EQ(stats_->snapshot().parse_errors, 1u);
}

TEST_F(JsonRpcHandlerTest, InvalidEnvelope_IsInvalidRequest) {
    const auto response = send(R"({"jsonrpc":"2.0","id":5})");
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ((*response)["error"]["code"], jsonrpc::kInvalidRequest);
    EXPECT_EQ((*response)["id"], 5);
}

TEST_F(JsonRpcHandlerTest, Notification_ProducesNoResponse) {
    EXPECT_FALSE(send(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    EXPECT_FALSE(send(R"({"jsonrpc":"2.0","method":"tools/list"})").has_value());
    EXPECT_EQ(stats_->snapshot().notifications, 2u);
}

TEST_F(JsonRpcHandlerTest, CancelledExecution_Propagates) {
    executor_->throw_cancel = true;
    EXPECT_THROW((void)call(R"({"name":"orders.get"})"), OperationCancelled);
}

TEST_F(JsonRpcHandlerTest, Stats_CountRequestsAndErrors) {
    (void)send(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
    (void)send(R"({"jsonrpc":"2.0","id":2,"method":"nope"})");
    (void)call(R"({"name":"orders.get"})");

    const auto snapshot = stats_->snapshot();
    EXPECT_EQ(snapshot.total_requests, 3u);
    EXPECT_EQ(snapshot.error_responses, 1u);
    EXPECT_EQ(snapshot.tool_calls, 1u);
    EXPECT_EQ(snapshot.tool_failures, 0u);
}

TEST(JsonRpcHandler, NullDependencies_AreRejected) {
    auto catalog  = std::make_shared<StaticCatalog>(CatalogSnapshot::empty());
    auto executor = std::make_shared<RecordingExecutor>();
    EXPECT_THROW(JsonRpcHandler(nullptr, executor), std::invalid_argument);
    EXPECT_THROW(JsonRpcHandler(catalog, nullptr), std::invalid_argument);
}
