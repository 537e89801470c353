#include "mcp/http_transport.hpp"

#include <cctype>
#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = asio::ip::tcp;

namespace {

constexpr beast::string_view kServerHeader = "toolgate/0.1.0";

[[nodiscard]] std::string to_std(beast::string_view view) {
    return std::string{view.data(), view.size()};
}

[[nodiscard]] bool is_json_media_type(std::string_view content_type) {
    auto media = content_type.substr(0, content_type.find(';'));
    while (!media.empty() && media.back() == ' ') {
        media.remove_suffix(1);
    }
    std::string lowered{media};
    for (auto& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lowered == "application/json" || lowered.ends_with("+json");
}

[[nodiscard]] HttpReply json_reply(unsigned status, const nlohmann::json& body) {
    return HttpReply{.status = status, .body = serialize(body)};
}

[[nodiscard]] HttpReply rpc_error_reply(unsigned status, int code, std::string message) {
    return json_reply(status, make_error(nullptr, JsonRpcError{.code = code, .message = std::move(message)}));
}

[[nodiscard]] bool is_parse_error(const nlohmann::json& response) {
    const auto error = response.find("error");
    return error != response.end() && error->is_object() &&
           error->value("code", 0) == jsonrpc::kParseError;
}

}  // namespace

HttpTransport::HttpTransport(asio::any_io_executor               executor,
                             std::shared_ptr<JsonRpcHandler>     handler,
                             std::shared_ptr<DiagnosticsService> diagnostics,
                             HttpTransportOptions                options)
    : executor_{std::move(executor)}
    , handler_{std::move(handler)}
    , diagnostics_{std::move(diagnostics)}
    , options_{std::move(options)}
    , acceptor_{executor_}
{
    if (!handler_) {
        throw std::invalid_argument("HttpTransport requires a handler");
    }
}

void HttpTransport::listen() {
    const tcp::endpoint endpoint{asio::ip::make_address(options_.listen_address), options_.port};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);

    spdlog::info("[http] listening on {}:{}", options_.listen_address, local_port());
}

std::uint16_t HttpTransport::local_port() const {
    boost::system::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? options_.port : endpoint.port();
}

std::string HttpTransport::mcp_endpoint_url() const {
    return fmt::format("http://{}:{}/mcp", options_.listen_address, local_port());
}

void HttpTransport::stop() {
    if (!stop_source_.request_stop()) {
        return;
    }
    asio::post(executor_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        for (auto& [id, stream] : sessions_) {
            stream->socket().close(ec);
        }
        spdlog::info("[http] stopped, closed {} open sessions", sessions_.size());
    });
}

asio::awaitable<void> HttpTransport::run(std::stop_token stop) {
    std::stop_callback forward{stop, [this]() { this->stop(); }};
    const auto token = stop_source_.get_token();

    while (!token.stop_requested()) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, ec));

        if (ec) {
            if (ec == asio::error::operation_aborted || token.stop_requested()) {
                spdlog::info("[http] acceptor closed, stopping");
                break;
            }
            spdlog::warn("[http] accept error: {}", ec.message());
            continue;
        }

        const auto id = next_session_id_++;
        auto stream   = std::make_shared<beast::tcp_stream>(std::move(socket));
        sessions_.emplace(id, stream);

        asio::co_spawn(executor_, session(id, std::move(stream)),
            [this, id](std::exception_ptr error) {
                sessions_.erase(id);
                if (error) {
                    try {
                        std::rethrow_exception(error);
                    } catch (const std::exception& e) {
                        spdlog::error("[http] session {} failed: {}", id, e.what());
                    }
                }
            });
    }
}

asio::awaitable<void> HttpTransport::session(std::uint64_t id, std::shared_ptr<beast::tcp_stream> stream) {
    boost::system::error_code ec;
    const auto remote = stream->socket().remote_endpoint(ec);
    const std::string client_address =
        ec ? std::string{"unknown"} : fmt::format("{}:{}", remote.address().to_string(), remote.port());

    spdlog::debug("[http] session {} opened from {}", id, client_address);

    beast::flat_buffer buffer;
    const auto token = stop_source_.get_token();

    while (!token.stop_requested()) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(options_.max_body_bytes);

        stream->expires_after(options_.idle_timeout);
        co_await http::async_read(*stream, buffer, parser, asio::redirect_error(asio::use_awaitable, ec));

        if (ec == http::error::body_limit) {
            auto reply = rpc_error_reply(413, jsonrpc::kInvalidParams,
                                         fmt::format("Request body exceeds maximum allowed size of {} bytes.",
                                                     options_.max_body_bytes));
            http::response<http::string_body> res{http::status::payload_too_large, 11};
            res.set(http::field::server, kServerHeader);
            res.set(http::field::content_type, reply.content_type);
            res.keep_alive(false);
            res.body() = std::move(reply.body);
            res.prepare_payload();
            co_await http::async_write(*stream, res, asio::redirect_error(asio::use_awaitable, ec));
            break;
        }
        if (ec) {
            if (ec != http::error::end_of_stream && ec != asio::error::operation_aborted) {
                spdlog::debug("[http] session {} read ended: {}", id, ec.message());
            }
            break;
        }

        auto& req = parser.get();

        IncomingRequest incoming{};
        incoming.method         = req.method();
        incoming.target         = to_std(req.target());
        incoming.content_type   = to_std(req[http::field::content_type]);
        incoming.authorization  = to_std(req[http::field::authorization]);
        incoming.cookie         = to_std(req[http::field::cookie]);
        incoming.body           = std::move(req.body());
        incoming.client_address = client_address;

        const bool keep_alive = req.keep_alive();
        const auto version    = req.version();

        stream->expires_never();
        HttpReply reply = co_await route(std::move(incoming), token);

        http::response<http::string_body> res{static_cast<http::status>(reply.status), version};
        res.set(http::field::server, kServerHeader);
        if (!reply.body.empty()) {
            res.set(http::field::content_type, reply.content_type);
        }
        if (reply.status == 405) {
            res.set(http::field::allow, "POST");
        }
        res.keep_alive(keep_alive && !token.stop_requested());
        res.body() = std::move(reply.body);
        res.prepare_payload();

        const bool close_after = res.need_eof();

        stream->expires_after(options_.idle_timeout);
        co_await http::async_write(*stream, res, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            spdlog::debug("[http] session {} write failed: {}", id, ec.message());
            break;
        }
        if (close_after) {
            break;
        }
    }

    stream->socket().shutdown(tcp::socket::shutdown_send, ec);
    spdlog::debug("[http] session {} closed", id);
}

asio::awaitable<HttpReply> HttpTransport::route(IncomingRequest request, std::stop_token stop) {
    const std::string path = request.target.substr(0, request.target.find('?'));

    if (path == "/mcp" || path == "/mcp/v1") {
        if (request.method != http::verb::post) {
            co_return json_reply(405, nlohmann::json{{"error", "method not allowed"}});
        }
        co_return co_await handle_rpc(std::move(request), std::move(stop));
    }

    if (request.method != http::verb::get) {
        co_return json_reply(404, nlohmann::json{{"error", "not found"}});
    }
    co_return handle_status_route(path);
}

asio::awaitable<HttpReply> HttpTransport::handle_rpc(IncomingRequest request, std::stop_token stop) {
    if (!is_json_media_type(request.content_type)) {
        co_return rpc_error_reply(415, jsonrpc::kInvalidRequest,
                                  "Unsupported content type. Expected application/json.");
    }
    if (request.body.size() > options_.max_body_bytes) {
        co_return rpc_error_reply(413, jsonrpc::kInvalidParams,
                                  fmt::format("Request body exceeds maximum allowed size of {} bytes.",
                                              options_.max_body_bytes));
    }

    CallContext context{};
    context.transport      = TransportKind::kHttp;
    context.client_address = request.client_address;
    context.authorization  = request.authorization;
    context.cookie         = request.cookie;
    context.received_at    = std::chrono::system_clock::now();

    std::optional<nlohmann::json> response;
    bool                          cancelled = false;
    try {
        response = co_await handler_->handle_payload(request.body, std::move(context), std::move(stop));
    } catch (const OperationCancelled&) {
        cancelled = true;
    }

    if (cancelled) {
        co_return rpc_error_reply(503, jsonrpc::kInternalError, "Server is shutting down.");
    }
    if (!response) {
        co_return HttpReply{.status = 202, .body = {}};
    }
    co_return json_reply(is_parse_error(*response) ? 400 : 200, *response);
}

HttpReply HttpTransport::handle_status_route(const std::string& path) const {
    if (path == "/health") {
        if (!diagnostics_) {
            return json_reply(200, nlohmann::json{{"status", "ok"}});
        }
        const auto report = diagnostics_->health();
        return json_reply(report.healthy ? 200 : 503, report.body);
    }
    if (path == "/.well-known/toolgate/manifest" && diagnostics_) {
        return json_reply(200, diagnostics_->manifest());
    }
    if (path == "/toolgate/diagnostics" && diagnostics_) {
        return json_reply(200, diagnostics_->diagnostics());
    }
    return json_reply(404, nlohmann::json{{"error", "not found"}});
}
