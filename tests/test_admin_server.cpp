// ---------------------------------------------------------------------------
// test_admin_server.cpp
//
// AdminServer 단위 테스트.
//
// [테스트 범위]
// - dispatch(): stats / manifest / diagnostics / refresh / policy_reload,
//   미지원 커맨드, command 필드 누락, JSON 아님, 모드별 미제공 커맨드
// - 소켓 경로: "stats" 왕복, 잘못된 프레임(0-length, 과대 length),
//   여러 클라이언트 동시 접속, run() 전 stop()
//
// [테스트 패턴]
// - dispatch() 는 전용 io_context 에서 co_spawn + use_future 로 구동한다.
// - 소켓 테스트는 임시 경로(/tmp/test_admin_<pid>_<N>.sock)를 쓰고
//   서버 io_context 를 백그라운드 스레드에서 돌린다.
//   클라이언트는 별도 io_context 의 동기 소켓을 쓴다.
//
// [프로토콜]
//   요청: [4byte LE 길이][JSON 바디]
//   응답: [4byte LE 길이][JSON 바디]
// ---------------------------------------------------------------------------

#include "stats/admin_server.hpp"

#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

namespace asio        = boost::asio;
using stream_protocol = asio::local::stream_protocol;
using nlohmann::json;

namespace {

std::filesystem::path temp_socket_path(const char* tag) {
    static std::atomic<int> counter{0};
    return std::filesystem::path("/tmp") /
           ("test_admin_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)) + "_" + tag +
            ".sock");
}

std::array<std::uint8_t, 4> encode_le4(std::uint32_t v) {
    return {
        static_cast<std::uint8_t>(v),
        static_cast<std::uint8_t>(v >> 8),
        static_cast<std::uint8_t>(v >> 16),
        static_cast<std::uint8_t>(v >> 24),
    };
}

std::uint32_t decode_le4(const std::array<std::uint8_t, 4>& b) {
    return static_cast<std::uint32_t>(b[0]) | (static_cast<std::uint32_t>(b[1]) << 8) |
           (static_cast<std::uint32_t>(b[2]) << 16) | (static_cast<std::uint32_t>(b[3]) << 24);
}

// ---------------------------------------------------------------------------
// AdminSyncClient
//   동기 UDS 클라이언트. 서버 ioc 와 분리된 자체 io_context 를 쓴다.
// ---------------------------------------------------------------------------
struct AdminSyncClient {
    asio::io_context        ioc;
    stream_protocol::socket sock{ioc};

    void connect(const std::filesystem::path& path) { sock.connect(stream_protocol::endpoint{path.string()}); }

    void send(std::string_view body) {
        const auto hdr = encode_le4(static_cast<std::uint32_t>(body.size()));
        std::array<asio::const_buffer, 2> bufs{
            asio::buffer(hdr),
            asio::buffer(body.data(), body.size()),
        };
        asio::write(sock, bufs);
    }

    // 서버가 응답 없이 닫으면 빈 문자열
    std::string recv() {
        std::array<std::uint8_t, 4> hdr{};
        boost::system::error_code   ec;
        asio::read(sock, asio::buffer(hdr), ec);
        if (ec) {
            return {};
        }
        const std::uint32_t len = decode_le4(hdr);
        if (len == 0 || len > 16u * 1024u * 1024u) {
            return {};
        }
        std::string body(len, '\0');
        asio::read(sock, asio::buffer(body), ec);
        if (ec) {
            return {};
        }
        return body;
    }

    void send_raw_header(std::uint32_t fake_len) {
        const auto                hdr = encode_le4(fake_len);
        boost::system::error_code ec;
        asio::write(sock, asio::buffer(hdr), ec);
    }
};

std::shared_ptr<DiagnosticsService> local_diagnostics() {
    PolicyDocument doc{};
    doc.source_version = "v7";
    PolicyEntry entry{};
    entry.tool_name      = "orders.get";
    entry.route_template = "/api/orders/{id}";
    doc.entries          = {entry};

    auto policy   = std::make_shared<InMemoryPolicyProvider>(std::move(doc));
    auto provider = std::make_shared<CatalogProvider>(policy);
    return std::make_shared<DiagnosticsService>(
        DiagnosticsOptions{.service_name = "orders-mcp"},
        DiagnosticsSources{.catalog = provider, .policy = policy, .provider = provider});
}

json dispatch(AdminServer& server, asio::io_context& ioc, std::string request) {
    auto future = asio::co_spawn(ioc, server.dispatch(std::move(request)), asio::use_future);
    ioc.run();
    ioc.restart();
    return future.get();
}

} // namespace

// ---------------------------------------------------------------------------
// dispatch() 단위 검증
// ---------------------------------------------------------------------------
class AdminDispatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        stats_       = std::make_shared<RpcStats>();
        diagnostics_ = local_diagnostics();
    }

    std::unique_ptr<AdminServer> make(AdminActions actions = {}) {
        return std::make_unique<AdminServer>(temp_socket_path("dispatch"), ioc_.get_executor(), stats_,
                                             diagnostics_, std::move(actions));
    }

    asio::io_context                    ioc_;
    std::shared_ptr<RpcStats>           stats_;
    std::shared_ptr<DiagnosticsService> diagnostics_;
};

TEST_F(AdminDispatchTest, Stats_ReturnsCounters) {
    stats_->on_request();
    stats_->on_request();
    stats_->on_tool_call(true);

    auto server = make();
    const auto resp = dispatch(*server, ioc_, R"({"command":"stats"})");

    EXPECT_EQ(resp["ok"], true);
    EXPECT_EQ(resp["payload"]["total_requests"], 2u);
    EXPECT_EQ(resp["payload"]["tool_calls"], 1u);
    EXPECT_EQ(resp["payload"]["tool_failures"], 1u);
}

TEST_F(AdminDispatchTest, ManifestAndDiagnostics) {
    auto server = make();

    const auto manifest = dispatch(*server, ioc_, R"({"command":"manifest"})");
    EXPECT_EQ(manifest["ok"], true);
    EXPECT_EQ(manifest["payload"]["serviceName"], "orders-mcp");

    const auto diagnostics = dispatch(*server, ioc_, R"({"command":"diagnostics"})");
    EXPECT_EQ(diagnostics["ok"], true);
    EXPECT_TRUE(diagnostics["payload"].contains("mappingGaps"));
}

TEST_F(AdminDispatchTest, RefreshAndPolicyReload_UseActions) {
    int reloads = 0;
    AdminActions actions{
        .refresh = []() -> asio::awaitable<std::expected<json, std::string>> {
            co_return json{{"refreshed", true}};
        },
        .policy_reload = [&reloads]() -> std::expected<json, std::string> {
            ++reloads;
            return std::unexpected(std::string{"policy file missing"});
        },
    };
    auto server = make(std::move(actions));

    const auto refresh = dispatch(*server, ioc_, R"({"command":"refresh"})");
    EXPECT_EQ(refresh["ok"], true);
    EXPECT_EQ(refresh["payload"]["refreshed"], true);

    const auto reload = dispatch(*server, ioc_, R"({"command":"policy_reload"})");
    EXPECT_EQ(reload["ok"], false);
    EXPECT_EQ(reload["error"], "policy file missing");
    EXPECT_EQ(reloads, 1);
}

TEST_F(AdminDispatchTest, ModeSpecificCommands_UnavailableWithoutActions) {
    auto server = make();

    const auto refresh = dispatch(*server, ioc_, R"({"command":"refresh"})");
    EXPECT_EQ(refresh["ok"], false);
    EXPECT_NE(refresh["error"].get<std::string>().find("not available"), std::string::npos);

    const auto reload = dispatch(*server, ioc_, R"({"command":"policy_reload"})");
    EXPECT_EQ(reload["ok"], false);
}

TEST_F(AdminDispatchTest, MalformedRequests_ReturnErrors) {
    auto server = make();

    EXPECT_EQ(dispatch(*server, ioc_, "not json")["ok"], false);
    EXPECT_EQ(dispatch(*server, ioc_, "[1]")["ok"], false);
    EXPECT_EQ(dispatch(*server, ioc_, R"({"version":1})")["ok"], false);
    EXPECT_EQ(dispatch(*server, ioc_, R"({"command":5})")["ok"], false);

    const auto unknown = dispatch(*server, ioc_, R"({"command":"xyz"})");
    EXPECT_EQ(unknown["ok"], false);
    EXPECT_EQ(unknown["error"], "unknown command 'xyz'");
}

TEST(AdminDispatch, NullStatsAndDiagnostics_ReportUnavailable) {
    asio::io_context ioc;
    AdminServer      server{temp_socket_path("null"), ioc.get_executor(), nullptr, nullptr};

    EXPECT_EQ(dispatch(server, ioc, R"({"command":"stats"})")["error"], "stats not available");
    EXPECT_EQ(dispatch(server, ioc, R"({"command":"manifest"})")["error"], "diagnostics not available");
}

// ---------------------------------------------------------------------------
// 소켓 경로 검증
// ---------------------------------------------------------------------------
class AdminServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        socket_path_ = temp_socket_path("srv");
        stats_       = std::make_shared<RpcStats>();
        server_      = std::make_unique<AdminServer>(socket_path_, ioc_.get_executor(), stats_, nullptr);
    }

    void TearDown() override {
        stop_server();
        std::error_code ec;
        std::filesystem::remove(socket_path_, ec);
    }

    void start_server() {
        asio::co_spawn(ioc_, server_->run(), asio::detached);
        server_thread_ = std::thread([this]() { ioc_.run(); });
    }

    void stop_server() {
        if (server_) {
            server_->stop();
        }
        ioc_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

    bool wait_for_socket(std::chrono::milliseconds timeout = std::chrono::seconds{2}) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (std::filesystem::exists(socket_path_)) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        return false;
    }

    std::filesystem::path        socket_path_;
    asio::io_context             ioc_;
    std::shared_ptr<RpcStats>    stats_;
    std::unique_ptr<AdminServer> server_;
    std::thread                  server_thread_;
};

TEST_F(AdminServerTest, StatsCommand_RoundTrip) {
    stats_->on_request();
    start_server();
    ASSERT_TRUE(wait_for_socket()) << "admin socket not created within 2s";

    AdminSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));
    client.send(R"({"command":"stats"})");

    const auto resp = client.recv();
    ASSERT_FALSE(resp.empty());
    const auto body = json::parse(resp);
    EXPECT_EQ(body["ok"], true);
    EXPECT_EQ(body["payload"]["total_requests"], 1u);
    EXPECT_TRUE(body["payload"].contains("tool_failure_rate"));
}

TEST_F(AdminServerTest, ZeroLengthFrame_ClosesWithoutResponse) {
    start_server();
    ASSERT_TRUE(wait_for_socket());

    AdminSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));
    client.send_raw_header(0u);

    EXPECT_TRUE(client.recv().empty());
}

TEST_F(AdminServerTest, OversizedFrame_ClosesWithoutResponse) {
    start_server();
    ASSERT_TRUE(wait_for_socket());

    AdminSyncClient client;
    ASSERT_NO_THROW(client.connect(socket_path_));
    client.send_raw_header(0xFFFFFFFFu);

    EXPECT_TRUE(client.recv().empty());
}

TEST_F(AdminServerTest, MultipleClients_Concurrent) {
    constexpr int kClientCount = 4;

    start_server();
    ASSERT_TRUE(wait_for_socket());

    std::vector<std::string> responses(static_cast<std::size_t>(kClientCount));
    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(kClientCount));

    for (int i = 0; i < kClientCount; ++i) {
        threads.emplace_back([this, i, &responses]() {
            AdminSyncClient client;
            try {
                client.connect(socket_path_);
                client.send(R"({"command":"stats"})");
                responses[static_cast<std::size_t>(i)] = client.recv();
            } catch (const std::exception& ex) {
                responses[static_cast<std::size_t>(i)] = std::string("EXCEPTION: ") + ex.what();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < kClientCount; ++i) {
        const auto& resp = responses[static_cast<std::size_t>(i)];
        EXPECT_NE(resp.find(R"("ok":true)"), std::string::npos) << "client " << i << ": " << resp;
    }
}

TEST_F(AdminServerTest, StopBeforeRun_RunReturnsImmediately) {
    server_->stop();

    auto done = asio::co_spawn(ioc_, server_->run(), asio::use_future);
    ioc_.run();
    EXPECT_NO_THROW(done.get());
    EXPECT_FALSE(std::filesystem::exists(socket_path_));
}
