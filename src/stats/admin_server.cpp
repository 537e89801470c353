// ---------------------------------------------------------------------------
// admin_server.cpp
//
// AdminServer 구현. 요청/응답 모두 4byte LE 길이 프리픽스 + JSON 바디.
// ---------------------------------------------------------------------------

#include "stats/admin_server.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>

#include <array>
#include <exception>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace asio = boost::asio;

namespace {

// 단일 요청의 최대 크기 (64KiB). 관리 커맨드는 작다.
constexpr std::uint32_t kMaxRequestSize = 64u * 1024u;

[[nodiscard]] nlohmann::json ok_response(nlohmann::json payload) {
    return nlohmann::json{{"ok", true}, {"payload", std::move(payload)}};
}

[[nodiscard]] nlohmann::json error_response(std::string message) {
    return nlohmann::json{{"ok", false}, {"error", std::move(message)}};
}

std::array<std::uint8_t, 4> encode_le4(std::uint32_t val) {
    return {
        static_cast<std::uint8_t>(val),
        static_cast<std::uint8_t>(val >> 8),
        static_cast<std::uint8_t>(val >> 16),
        static_cast<std::uint8_t>(val >> 24),
    };
}

std::uint32_t decode_le4(const std::array<std::uint8_t, 4>& buf) {
    return static_cast<std::uint32_t>(buf[0])
         | (static_cast<std::uint32_t>(buf[1]) << 8)
         | (static_cast<std::uint32_t>(buf[2]) << 16)
         | (static_cast<std::uint32_t>(buf[3]) << 24);
}

}  // namespace

AdminServer::AdminServer(std::filesystem::path               socket_path,
                         asio::any_io_executor               executor,
                         std::shared_ptr<RpcStats>           stats,
                         std::shared_ptr<DiagnosticsService> diagnostics,
                         AdminActions                        actions)
    : socket_path_{std::move(socket_path)}
    , executor_{std::move(executor)}
    , stats_{std::move(stats)}
    , diagnostics_{std::move(diagnostics)}
    , actions_{std::move(actions)}
    , acceptor_{executor_}
{}

AdminServer::~AdminServer() {
    stop_requested_.store(true, std::memory_order_release);
    boost::system::error_code ec;
    acceptor_.close(ec);

    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
}

void AdminServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    asio::post(executor_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec && ec != asio::error::bad_descriptor) {
            spdlog::warn("[admin] stop: acceptor close error: {}", ec.message());
        }
    });
}

asio::awaitable<void> AdminServer::run() {
    using stream_protocol = asio::local::stream_protocol;

    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec && fs_ec != std::make_error_code(std::errc::no_such_file_or_directory)) {
        spdlog::error("[admin] failed to remove old socket {}: {}", socket_path_.string(), fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (!ec) {
        acceptor_.bind(stream_protocol::endpoint{socket_path_.string()}, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        spdlog::error("[admin] cannot listen on {}: {}", socket_path_.string(), ec.message());
        co_return;
    }

    spdlog::info("[admin] listening on {}", socket_path_.string());

    while (!stop_requested_.load(std::memory_order_acquire)) {
        stream_protocol::socket client{executor_};
        co_await acceptor_.async_accept(client, asio::redirect_error(asio::use_awaitable, ec));

        if (ec) {
            if (ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor) {
                spdlog::info("[admin] accept loop stopped");
            } else {
                spdlog::error("[admin] accept error: {}", ec.message());
            }
            co_return;
        }

        asio::co_spawn(executor_, handle_client(std::move(client)),
            [](std::exception_ptr eptr) {
                if (eptr) {
                    try { std::rethrow_exception(eptr); }
                    catch (const std::exception& e) {
                        spdlog::warn("[admin] client handler error: {}", e.what());
                    }
                }
            });
    }
}

asio::awaitable<nlohmann::json> AdminServer::dispatch(std::string request_text) {
    const auto request = nlohmann::json::parse(request_text, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        co_return error_response("request is not a JSON object");
    }

    const auto command_it = request.find("command");
    if (command_it == request.end() || !command_it->is_string()) {
        co_return error_response("missing or malformed 'command' field");
    }
    const auto command = command_it->get<std::string>();

    if (command == "stats") {
        if (!stats_) {
            co_return error_response("stats not available");
        }
        co_return ok_response(to_json(stats_->snapshot()));
    }
    if (command == "manifest" || command == "diagnostics") {
        if (!diagnostics_) {
            co_return error_response("diagnostics not available");
        }
        co_return ok_response(command == "manifest" ? diagnostics_->manifest() : diagnostics_->diagnostics());
    }
    if (command == "refresh") {
        if (!actions_.refresh) {
            co_return error_response("command 'refresh' not available in this mode");
        }
        auto result = co_await actions_.refresh();
        co_return result ? ok_response(std::move(*result)) : error_response(std::move(result.error()));
    }
    if (command == "policy_reload") {
        if (!actions_.policy_reload) {
            co_return error_response("command 'policy_reload' not available in this mode");
        }
        auto result = actions_.policy_reload();
        co_return result ? ok_response(std::move(*result)) : error_response(std::move(result.error()));
    }

    spdlog::warn("[admin] unknown command '{}'", command);
    co_return error_response(fmt::format("unknown command '{}'", command));
}

asio::awaitable<void> AdminServer::handle_client(asio::local::stream_protocol::socket socket) {
    boost::system::error_code ec;

    std::array<std::uint8_t, 4> header{};
    co_await asio::async_read(socket, asio::buffer(header), asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        if (ec != asio::error::eof) {
            spdlog::warn("[admin] read header error: {}", ec.message());
        }
        co_return;
    }

    const std::uint32_t body_len = decode_le4(header);
    if (body_len == 0 || body_len > kMaxRequestSize) {
        spdlog::warn("[admin] invalid body length {}", body_len);
        co_return;
    }

    std::string body(body_len, '\0');
    co_await asio::async_read(socket, asio::buffer(body), asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::warn("[admin] read body error: {}", ec.message());
        co_return;
    }

    const auto response      = co_await dispatch(std::move(body));
    const auto response_body = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    const auto response_hdr  = encode_le4(static_cast<std::uint32_t>(response_body.size()));

    std::array<asio::const_buffer, 2> buffers{
        asio::buffer(response_hdr),
        asio::buffer(response_body),
    };
    const std::size_t written =
        co_await asio::async_write(socket, buffers, asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::warn("[admin] write error: {}", ec.message());
        co_return;
    }

    spdlog::debug("[admin] handled request, response_bytes={}", written);
}
