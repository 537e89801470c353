#include "mcp/stdio_transport.hpp"

#include <cerrno>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace asio = boost::asio;

namespace {

[[nodiscard]] int duplicate_fd(int fd, const char* role) {
    const int copy = ::dup(fd);
    if (copy < 0) {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("stdio: dup() of {} fd {} failed", role, fd));
    }
    return copy;
}

}  // namespace

StdioTransport::StdioTransport(asio::any_io_executor           executor,
                               std::shared_ptr<JsonRpcHandler> handler,
                               StdioTransportOptions           options)
    : executor_{std::move(executor)}
    , handler_{std::move(handler)}
    , options_{options}
    , input_{executor_, duplicate_fd(options_.in_fd, "input")}
    , output_{executor_, duplicate_fd(options_.out_fd, "output")}
{
    if (!handler_) {
        throw std::invalid_argument("StdioTransport requires a handler");
    }
}

void StdioTransport::stop() {
    if (stop_source_.request_stop()) {
        asio::post(executor_, [this]() {
            boost::system::error_code ec;
            input_.cancel(ec);
            if (ec) {
                spdlog::debug("[stdio] cancel: {}", ec.message());
            }
        });
    }
}

asio::awaitable<void> StdioTransport::run(std::stop_token stop) {
    std::stop_callback forward{stop, [this]() { this->stop(); }};
    const auto token = stop_source_.get_token();

    spdlog::info("[stdio] transport started");

    std::string buffer;
    while (!token.stop_requested()) {
        boost::system::error_code ec;
        const std::size_t n = co_await asio::async_read_until(
            input_, asio::dynamic_buffer(buffer, options_.max_line_bytes), '\n',
            asio::redirect_error(asio::use_awaitable, ec));

        if (token.stop_requested()) {
            break;
        }

        if (ec == asio::error::eof) {
            // 개행 없이 끝난 마지막 줄
            if (!buffer.empty()) {
                co_await process_line(std::move(buffer));
            }
            spdlog::info("[stdio] end of input");
            break;
        }
        if (ec == asio::error::not_found) {
            // 줄 경계를 잃었으므로 세션을 닫되, 닫는 이유는 알려 준다.
            spdlog::error("[stdio] request line exceeds {} bytes, closing session", options_.max_line_bytes);
            (void)co_await write_response(make_error(
                nullptr, JsonRpcError{.code    = jsonrpc::kInvalidRequest,
                                      .message = fmt::format("Request line exceeds maximum allowed size of {} bytes.",
                                                             options_.max_line_bytes)}));
            break;
        }
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                spdlog::error("[stdio] read failed: {}", ec.message());
            }
            break;
        }

        std::string line = buffer.substr(0, n - 1);
        buffer.erase(0, n);

        if (!co_await process_line(std::move(line))) {
            break;
        }
    }

    spdlog::info("[stdio] transport stopped after {} messages", processed_lines());
}

asio::awaitable<bool> StdioTransport::process_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (is_blank(line)) {
        co_return true;
    }
    processed_lines_.fetch_add(1, std::memory_order_relaxed);

    CallContext context{};
    context.transport   = TransportKind::kStdio;
    context.received_at = std::chrono::system_clock::now();

    std::optional<nlohmann::json> response;
    try {
        response = co_await handler_->handle_payload(line, std::move(context), stop_source_.get_token());
    } catch (const OperationCancelled&) {
        spdlog::info("[stdio] request cancelled, no response written");
        co_return false;
    } catch (const std::exception& e) {
        spdlog::error("[stdio] handler failed: {}", e.what());
        response = make_error(nullptr, JsonRpcError{.code    = jsonrpc::kInternalError,
                                                    .message = "Internal error processing request."});
    }

    if (stop_source_.stop_requested()) {
        co_return false;
    }
    if (!response) {
        co_return true;
    }

    co_return co_await write_response(*response);
}

asio::awaitable<bool> StdioTransport::write_response(const nlohmann::json& response) {
    std::string out = serialize(response);
    out += '\n';

    boost::system::error_code ec;
    co_await asio::async_write(output_, asio::buffer(out), asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::error("[stdio] write failed: {}", ec.message());
        co_return false;
    }
    co_return true;
}
