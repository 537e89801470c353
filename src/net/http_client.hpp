#pragma once

// ---------------------------------------------------------------------------
// http_client.hpp
//
// Boost.Beast 기반 최소 HTTP/1.1 클라이언트 (요청당 연결 하나).
// 업스트림 카탈로그 조회(tools/list), 업스트림 도구 호출(tools/call),
// 백엔드 엔드포인트 호출에 공통으로 사용한다.
//
// [설계 원칙]
// - 코루틴 기반: async_http_request() 는 호출자의 실행기에서 동작한다.
// - 전체 요청에 단일 deadline 을 건다 (beast::tcp_stream::expires_after).
// - std::stop_token 으로 취소한다. stop_callback 은 소켓 cancel 을
//   실행기에 post 한다 (다른 스레드에서 소켓을 직접 만지지 않는다).
// - 오류는 예외가 아니라 std::expected<HttpResponse, HttpError> 로 반환한다.
//
// [알려진 한계]
// - http:// 만 지원한다 (TLS 없음).
// - DNS 해석에는 deadline 이 적용되지 않는다.
// ---------------------------------------------------------------------------

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    boost::beast::http::verb  method{boost::beast::http::verb::get};
    std::string               url{};
    HeaderList                headers{};
    std::string               body{};
    std::string               content_type{};
    std::chrono::milliseconds timeout{30000};
    std::size_t               body_limit{8 * 1024 * 1024};
};

struct HttpResponse {
    unsigned    status{0};
    std::string content_type{};
    std::string body{};

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

enum class HttpErrorKind : std::uint8_t {
    kInvalidUrl = 0,
    kTimeout    = 1,
    kCancelled  = 2,
    kTransport  = 3,
};

struct HttpError {
    HttpErrorKind kind{HttpErrorKind::kTransport};
    std::string   message{};
};

using HttpResult = std::expected<HttpResponse, HttpError>;

// ---------------------------------------------------------------------------
// ParsedUrl
//   "http://host[:port][/path][?query]" 분해 결과.
//   host_header 는 기본 포트(80)가 아니면 ":port" 를 포함한다.
// ---------------------------------------------------------------------------
struct ParsedUrl {
    std::string host{};
    std::string port{"80"};
    std::string target{"/"};
    std::string host_header{};
};

[[nodiscard]] std::expected<ParsedUrl, std::string> parse_http_url(std::string_view url);

// async_http_request
//   stop_token 은 코루틴 프레임에 복사되도록 값으로 받는다.
boost::asio::awaitable<HttpResult> async_http_request(HttpRequest request, std::stop_token stop);

[[nodiscard]] const char* to_string(HttpErrorKind kind) noexcept;
