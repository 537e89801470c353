#pragma once

#include "catalog/catalog_provider.hpp"
#include "diagnostics/diagnostics_service.hpp"
#include "execution/tool_executor.hpp"
#include "gateway/gateway_aggregator.hpp"
#include "logger/structured_logger.hpp"
#include "mcp/http_transport.hpp"
#include "mcp/json_rpc_handler.hpp"
#include "mcp/stdio_transport.hpp"
#include "policy/policy_provider.hpp"
#include "stats/admin_server.hpp"
#include "stats/rpc_stats.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

enum class ServerMode : std::uint8_t {
    kLocal   = 0,   // 정책 파일 → 로컬 카탈로그 → HTTP 백엔드
    kGateway = 1,   // N 개 업스트림 MCP 서버 집계
};

enum class TransportMode : std::uint8_t {
    kStdio = 0,
    kHttp  = 1,
    kBoth  = 2,
};

[[nodiscard]] std::expected<ServerMode, std::string>    parse_server_mode(std::string_view text);
[[nodiscard]] std::expected<TransportMode, std::string> parse_transport_mode(std::string_view text);

// ---------------------------------------------------------------------------
// ToolgateConfig
//   ToolgateServer 의 모든 설정 값을 담는다. 값은 main 에서 환경변수로 채운다.
//
//   policy_path         : 로컬 모드 정책 파일 (YAML)
//   endpoints_path      : 백엔드가 실제로 노출하는 엔드포인트 목록 (YAML, 선택)
//   gateway_config_path : 게이트웨이 모드 업스트림 설정 (YAML)
//   admin_socket_path   : 관리 소켓 경로. 비어 있으면 관리 소켓을 열지 않는다.
//   backend_base_url    : 로컬 모드 도구가 호출할 백엔드 주소
// ---------------------------------------------------------------------------
struct ToolgateConfig {
    ServerMode    mode{ServerMode::kLocal};
    TransportMode transport{TransportMode::kStdio};

    std::string   listen_address{"127.0.0.1"};
    std::uint16_t listen_port{8080};
    std::size_t   max_request_body_bytes{1024 * 1024};

    std::string policy_path{"config/policy.yaml"};
    std::string endpoints_path{};
    std::string gateway_config_path{"config/gateway.yaml"};
    std::string admin_socket_path{};
    std::string log_path{};
    std::string log_level{"info"};
    std::string service_name{"toolgate"};

    std::string               backend_base_url{"http://127.0.0.1:8080"};
    std::chrono::seconds      tool_timeout{30};
    std::chrono::milliseconds catalog_min_reload{1000};
    bool                      propagate_authorization{false};

    std::chrono::seconds shutdown_grace{5};
};

// ---------------------------------------------------------------------------
// ToolgateServer
//   구성 요소를 조립하고 수명을 관리하는 메인 서버.
//
//   사용 예:
//     ToolgateServer server(config);
//     server.start(io_ctx);   // 실패 시 예외
//     io_ctx.run();
//
// [시작 순서]
//   1. 구성 요소 생성 (모드별 카탈로그 공급원 + 실행기)
//   2. HTTP 전송 bind (실패 시 예외, 시작 실패)
//   3. 초기 카탈로그 구성: 로컬 빌드 또는 게이트웨이 refresh 한 사이클
//   4. 전송 계층, 관리 소켓, 게이트웨이 주기 루프 시작
//
// [시그널]
//   SIGTERM / SIGINT → stop()
//   SIGHUP           → reload(): 정책 파일 / 게이트웨이 설정 재로드
//
// [종료]
// stop() 은 공유 stop_source 를 요청하고 모든 구성 요소를 멈춘다.
// shutdown_grace 안에 남은 작업이 끝나지 않으면 io_context 를 멈춘다.
// stdio 전용 모드에서는 stdin EOF 가 곧 종료다.
// ---------------------------------------------------------------------------
class ToolgateServer {
public:
    explicit ToolgateServer(ToolgateConfig config);

    ~ToolgateServer() = default;

    ToolgateServer(const ToolgateServer&)            = delete;
    ToolgateServer& operator=(const ToolgateServer&) = delete;
    ToolgateServer(ToolgateServer&&)                 = delete;
    ToolgateServer& operator=(ToolgateServer&&)      = delete;

    void start(boost::asio::io_context& io_ctx);

    void stop();

    // reload
    //   SIGHUP 핸들러에서 호출. 실패하면 현재 설정을 유지하고 false.
    bool reload();

    [[nodiscard]] std::shared_ptr<JsonRpcHandler>  handler() const noexcept { return handler_; }
    [[nodiscard]] std::shared_ptr<CatalogSource>   catalog() const noexcept { return catalog_; }
    [[nodiscard]] std::shared_ptr<RpcStats>        stats() const noexcept { return stats_; }
    [[nodiscard]] const ToolgateConfig&            config() const noexcept { return config_; }

private:
    ToolgateConfig config_;
    bool           stopping_{false};

    boost::asio::io_context* io_ctx_{nullptr};
    std::stop_source         stop_source_{};

    std::shared_ptr<StructuredLogger>   audit_logger_{};
    std::shared_ptr<RpcStats>           stats_{};
    std::shared_ptr<FilePolicyProvider> policy_provider_{};
    std::shared_ptr<CatalogProvider>    catalog_provider_{};
    std::shared_ptr<GatewayAggregator>  gateway_{};
    std::shared_ptr<CatalogSource>      catalog_{};
    std::shared_ptr<ToolExecutor>       executor_{};
    std::shared_ptr<JsonRpcHandler>     handler_{};
    std::shared_ptr<DiagnosticsService> diagnostics_{};

    std::unique_ptr<StdioTransport> stdio_{};
    std::unique_ptr<HttpTransport>  http_{};
    std::unique_ptr<AdminServer>    admin_{};

    std::unique_ptr<boost::asio::signal_set>  stop_signals_{};
    std::unique_ptr<boost::asio::signal_set>  hup_signals_{};
    std::unique_ptr<boost::asio::steady_timer> grace_timer_{};

    // 실행 중인 최상위 코루틴 수. 종료 중 0 이 되면 grace 타이머를 취소한다.
    std::size_t active_tasks_{0};

    [[nodiscard]] bool uses_stdio() const noexcept { return config_.transport != TransportMode::kHttp; }
    [[nodiscard]] bool uses_http() const noexcept { return config_.transport != TransportMode::kStdio; }

    void build_components(boost::asio::io_context& io_ctx);
    void wait_hup();

    // startup
    //   초기 카탈로그 구성 후 전송 계층을 띄운다.
    boost::asio::awaitable<void> startup();

    boost::asio::awaitable<std::expected<nlohmann::json, std::string>> admin_refresh();
    [[nodiscard]] std::expected<nlohmann::json, std::string> admin_policy_reload();

    // spawn
    //   최상위 코루틴을 띄운다. 예외는 name 과 함께 로그로 남긴다.
    //   on_exit 는 완료 시 (정상/예외 모두) 호출된다.
    void spawn(boost::asio::awaitable<void> task, std::string name, std::function<void()> on_exit = {});

    void task_finished();
};
