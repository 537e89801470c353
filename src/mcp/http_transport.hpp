#pragma once

// ---------------------------------------------------------------------------
// http_transport.hpp
//
// Boost.Beast 기반 HTTP/1.1 전송.
//
// [경로]
//   POST /mcp, POST /mcp/v1            JSON-RPC
//   GET  /health                       200 ok / 503 (모든 업스트림 unhealthy)
//   GET  /.well-known/toolgate/manifest
//   GET  /toolgate/diagnostics
//
// [JSON-RPC 상태 코드]
//   Content-Type 이 JSON 아님 → 415 + -32600
//   본문 > max_body_bytes     → 413 + -32602
//   JSON 파싱 실패            → 400 + -32700
//   알림                      → 202 (빈 본문)
//   그 외                     → 200 + 응답
//
// [동시성]
// 연결마다 세션 코루틴 하나. keep-alive 연결 안에서는 요청을 순서대로
// 처리하고, 연결들 사이에서는 동시에 처리된다.
//
// [수명]
// listen() 은 동기로 bind 한다. 실패하면 예외를 던지며 서버 시작은 실패한다.
// stop() 은 acceptor 와 열린 세션을 실행기에서 닫는다.
// ---------------------------------------------------------------------------

#include "diagnostics/diagnostics_service.hpp"
#include "mcp/json_rpc_handler.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <stop_token>
#include <string>

struct HttpTransportOptions {
    std::string          listen_address{"127.0.0.1"};
    std::uint16_t        port{8080};
    std::size_t          max_body_bytes{1024 * 1024};
    std::chrono::seconds idle_timeout{30};
};

// IncomingRequest
//   라우팅에 필요한 요청 정보만 뽑아낸 값. 소켓 없이 route() 를 시험할 수 있다.
struct IncomingRequest {
    boost::beast::http::verb method{boost::beast::http::verb::get};
    std::string              target{"/"};
    std::string              content_type{};
    std::string              body{};
    std::string              authorization{};
    std::string              cookie{};
    std::string              client_address{};
};

struct HttpReply {
    unsigned    status{200};
    std::string body{};
    std::string content_type{"application/json"};
};

class HttpTransport {
public:
    // diagnostics 는 nullptr 허용 (manifest/diagnostics 경로는 404)
    HttpTransport(boost::asio::any_io_executor        executor,
                  std::shared_ptr<JsonRpcHandler>     handler,
                  std::shared_ptr<DiagnosticsService> diagnostics,
                  HttpTransportOptions                options = {});

    ~HttpTransport() = default;

    HttpTransport(const HttpTransport&)            = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;
    HttpTransport(HttpTransport&&)                 = delete;
    HttpTransport& operator=(HttpTransport&&)      = delete;

    // listen
    //   bind + listen. 실패 시 boost::system::system_error.
    void listen();

    // run
    //   accept 루프. listen() 이 먼저 호출되어 있어야 한다.
    boost::asio::awaitable<void> run(std::stop_token stop = {});

    void stop();

    // route
    //   요청 하나를 처리하여 응답을 만든다.
    boost::asio::awaitable<HttpReply> route(IncomingRequest request, std::stop_token stop);

    // local_port
    //   실제로 bind 된 포트 (port 0 으로 listen 한 테스트용).
    [[nodiscard]] std::uint16_t local_port() const;

    [[nodiscard]] std::string mcp_endpoint_url() const;

private:
    boost::asio::any_io_executor        executor_;
    std::shared_ptr<JsonRpcHandler>     handler_;
    std::shared_ptr<DiagnosticsService> diagnostics_;
    HttpTransportOptions                options_;
    boost::asio::ip::tcp::acceptor      acceptor_;
    std::stop_source                    stop_source_{};

    // 실행기에서만 접근한다.
    std::map<std::uint64_t, std::shared_ptr<boost::beast::tcp_stream>> sessions_{};
    std::uint64_t                                                       next_session_id_{0};

    boost::asio::awaitable<void> session(std::uint64_t id, std::shared_ptr<boost::beast::tcp_stream> stream);

    boost::asio::awaitable<HttpReply> handle_rpc(IncomingRequest request, std::stop_token stop);

    [[nodiscard]] HttpReply handle_status_route(const std::string& path) const;
};
