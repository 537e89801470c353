#include "net/http_client.hpp"

#include <atomic>
#include <memory>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

namespace {

constexpr std::string_view kScheme = "http://";

[[nodiscard]] HttpError classify(const boost::system::error_code& ec,
                                 const std::atomic<bool>&         cancelled,
                                 std::string_view                 phase) {
    if (cancelled.load(std::memory_order_acquire)) {
        return HttpError{HttpErrorKind::kCancelled, fmt::format("{} cancelled", phase)};
    }
    if (ec == beast::error::timeout) {
        return HttpError{HttpErrorKind::kTimeout, fmt::format("{} timed out", phase)};
    }
    return HttpError{HttpErrorKind::kTransport, fmt::format("{} failed: {}", phase, ec.message())};
}

}  // namespace

const char* to_string(HttpErrorKind kind) noexcept {
    switch (kind) {
        case HttpErrorKind::kInvalidUrl: return "invalid_url";
        case HttpErrorKind::kTimeout:    return "timeout";
        case HttpErrorKind::kCancelled:  return "cancelled";
        case HttpErrorKind::kTransport:  return "transport";
        default:                         return "unknown";
    }
}

std::expected<ParsedUrl, std::string> parse_http_url(std::string_view url) {
    if (!url.starts_with(kScheme)) {
        return std::unexpected(fmt::format("unsupported URL '{}': only http:// is supported", url));
    }
    std::string_view rest = url.substr(kScheme.size());

    const auto path_pos = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, path_pos);
    std::string_view target    = path_pos == std::string_view::npos
                                     ? std::string_view{"/"}
                                     : rest.substr(path_pos);

    if (authority.empty()) {
        return std::unexpected(fmt::format("URL '{}' has no host", url));
    }

    ParsedUrl parsed{};
    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
        parsed.host = std::string{authority.substr(0, colon)};
        parsed.port = std::string{authority.substr(colon + 1)};
        if (parsed.port.empty() ||
            parsed.port.find_first_not_of("0123456789") != std::string::npos) {
            return std::unexpected(fmt::format("URL '{}' has an invalid port", url));
        }
    } else {
        parsed.host = std::string{authority};
    }
    if (parsed.host.empty()) {
        return std::unexpected(fmt::format("URL '{}' has no host", url));
    }

    parsed.target = std::string{target};
    if (parsed.target.front() == '?') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    parsed.host_header = parsed.port == "80" ? parsed.host
                                             : fmt::format("{}:{}", parsed.host, parsed.port);
    return parsed;
}

asio::awaitable<HttpResult> async_http_request(HttpRequest request, std::stop_token stop) {
    auto url = parse_http_url(request.url);
    if (!url) {
        co_return std::unexpected(HttpError{HttpErrorKind::kInvalidUrl, url.error()});
    }
    if (stop.stop_requested()) {
        co_return std::unexpected(HttpError{HttpErrorKind::kCancelled, "request cancelled"});
    }

    auto executor  = co_await asio::this_coro::executor;
    auto resolver  = std::make_shared<tcp::resolver>(executor);
    auto stream    = std::make_shared<beast::tcp_stream>(executor);
    auto cancelled = std::make_shared<std::atomic<bool>>(false);

    // stop 요청은 다른 스레드에서 올 수 있다. 소켓 조작은 실행기로 넘긴다.
    // 게시된 cancel 이 대기 중인 작업 없이 실행되면 효과가 없으므로, 각 단계가
    // 끝날 때마다 cancelled 를 확인하고 다음 단계를 시작하지 않는다.
    std::stop_callback on_stop{stop, [executor, resolver, stream, cancelled]() {
        cancelled->store(true, std::memory_order_release);
        asio::post(executor, [resolver, stream]() {
            resolver->cancel();
            stream->cancel();
        });
    }};

    boost::system::error_code ec;

    // 1. DNS 해석
    const auto endpoints = co_await resolver->async_resolve(
        url->host, url->port, asio::redirect_error(asio::use_awaitable, ec));
    if (ec || cancelled->load(std::memory_order_acquire)) {
        co_return std::unexpected(classify(ec, *cancelled, "resolve"));
    }

    // 2. 연결 ~ 응답 수신까지 단일 deadline
    stream->expires_after(request.timeout);
    co_await stream->async_connect(endpoints, asio::redirect_error(asio::use_awaitable, ec));
    if (ec || cancelled->load(std::memory_order_acquire)) {
        co_return std::unexpected(classify(ec, *cancelled, "connect"));
    }

    http::request<http::string_body> req{request.method, url->target, 11};
    req.set(http::field::host, url->host_header);
    req.set(http::field::user_agent, "toolgate/0.1.0");
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.body.empty()) {
        req.set(http::field::content_type,
                request.content_type.empty() ? std::string{"application/json"}
                                             : request.content_type);
        req.body() = std::move(request.body);
    }
    req.prepare_payload();

    co_await http::async_write(*stream, req, asio::redirect_error(asio::use_awaitable, ec));
    if (ec || cancelled->load(std::memory_order_acquire)) {
        co_return std::unexpected(classify(ec, *cancelled, "write"));
    }

    beast::flat_buffer                       buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(request.body_limit);
    co_await http::async_read(*stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(classify(ec, *cancelled, "read"));
    }

    auto& res = parser.get();
    HttpResponse response{};
    response.status       = res.result_int();
    const auto content_type = res[http::field::content_type];
    response.content_type.assign(content_type.data(), content_type.size());
    response.body         = std::move(res.body());

    boost::system::error_code shutdown_ec;
    stream->socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    if (shutdown_ec && shutdown_ec != beast::errc::not_connected) {
        spdlog::debug("[http] shutdown after response: {}", shutdown_ec.message());
    }

    co_return response;
}
