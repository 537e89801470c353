#pragma once

// ---------------------------------------------------------------------------
// admin_server.hpp
//
// Unix Domain Socket 관리 서버. 운영 도구에 통계/진단을 노출하고
// 재로드를 트리거한다.
//
// [프로토콜: 길이 프리픽스 + JSON]
//   요청 프레임:  [4byte LE 길이][JSON 본문]   예: {"command": "stats"}
//   응답 프레임:  [4byte LE 길이][JSON 본문]
//     성공: {"ok": true,  "payload": ...}
//     실패: {"ok": false, "error": "<메시지>"}
//
// [지원 커맨드]
//   "stats"         RpcStatsSnapshot
//   "manifest"      DiagnosticsService::manifest()
//   "diagnostics"   DiagnosticsService::diagnostics()
//   "refresh"       게이트웨이 refresh 한 사이클 (진행 중이면 skipped)
//   "policy_reload" 로컬 정책 즉시 재로드
//
// 연결 하나에 요청 하나를 처리하고 닫는다.
//
// [격리 원칙]
// 관리 소켓의 I/O 실패는 로그만 남기고 데이터패스로 전파하지 않는다.
// ---------------------------------------------------------------------------

#include "diagnostics/diagnostics_service.hpp"
#include "stats/rpc_stats.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

// ---------------------------------------------------------------------------
// AdminActions
//   서버 구성에 따라 달라지는 커맨드 구현. 비어 있는 항목은
//   "command not available in this mode" 로 응답한다.
// ---------------------------------------------------------------------------
struct AdminActions {
    std::function<boost::asio::awaitable<std::expected<nlohmann::json, std::string>>()> refresh{};
    std::function<std::expected<nlohmann::json, std::string>()>                         policy_reload{};
};

class AdminServer {
public:
    // stats, diagnostics 는 nullptr 허용
    AdminServer(std::filesystem::path               socket_path,
                boost::asio::any_io_executor        executor,
                std::shared_ptr<RpcStats>           stats,
                std::shared_ptr<DiagnosticsService> diagnostics,
                AdminActions                        actions = {});

    ~AdminServer();

    AdminServer(const AdminServer&)            = delete;
    AdminServer& operator=(const AdminServer&) = delete;
    AdminServer(AdminServer&&)                 = delete;
    AdminServer& operator=(AdminServer&&)      = delete;

    // run
    //   이전 소켓 파일 제거 → bind/listen → accept 루프.
    //   bind 실패는 로그 후 co_return (서버 전체는 계속 동작).
    boost::asio::awaitable<void> run();

    void stop();

    // dispatch
    //   요청 JSON 텍스트 하나를 처리하여 응답 JSON 을 만든다.
    boost::asio::awaitable<nlohmann::json> dispatch(std::string request_text);

    [[nodiscard]] const std::filesystem::path& socket_path() const noexcept { return socket_path_; }

private:
    boost::asio::awaitable<void> handle_client(boost::asio::local::stream_protocol::socket socket);

    std::filesystem::path                        socket_path_;
    boost::asio::any_io_executor                 executor_;
    std::shared_ptr<RpcStats>                    stats_;
    std::shared_ptr<DiagnosticsService>          diagnostics_;
    AdminActions                                 actions_;
    boost::asio::local::stream_protocol::acceptor acceptor_;
    std::atomic<bool>                            stop_requested_{false};
};
