#include "server/toolgate_server.hpp"

#include "execution/http_tool_executor.hpp"
#include "execution/invocation_policy_executor.hpp"
#include "execution/upstream_tool_executor.hpp"
#include "gateway/gateway_config.hpp"

#include <boost/asio/co_spawn.hpp>

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <csignal>
#include <exception>
#include <stdexcept>
#include <utility>

// ---------------------------------------------------------------------------
// ToolgateServer 구현
//
// start() 흐름:
//   1. build_components: 감사 로거, 통계, 모드별 카탈로그 공급원, 실행기,
//      JSON-RPC 핸들러, 진단 서비스, 전송 계층 생성
//   2. HTTP bind (동기, 실패 시 예외)
//   3. 시그널 핸들러 등록
//   4. startup 코루틴: 초기 카탈로그 → 전송/관리 소켓/주기 루프 spawn
// ---------------------------------------------------------------------------

namespace asio = boost::asio;

namespace {

std::string lowered(std::string_view text) {
    std::string out{text};
    std::ranges::transform(out, out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

}  // namespace

std::expected<ServerMode, std::string> parse_server_mode(std::string_view text) {
    const auto value = lowered(text);
    if (value == "local") {
        return ServerMode::kLocal;
    }
    if (value == "gateway") {
        return ServerMode::kGateway;
    }
    return std::unexpected(fmt::format("unknown mode '{}', expected 'local' or 'gateway'", text));
}

std::expected<TransportMode, std::string> parse_transport_mode(std::string_view text) {
    const auto value = lowered(text);
    if (value == "stdio") {
        return TransportMode::kStdio;
    }
    if (value == "http") {
        return TransportMode::kHttp;
    }
    if (value == "both") {
        return TransportMode::kBoth;
    }
    return std::unexpected(fmt::format("unknown transport '{}', expected 'stdio', 'http' or 'both'", text));
}

ToolgateServer::ToolgateServer(ToolgateConfig config)
    : config_{std::move(config)}
{}

void ToolgateServer::build_components(asio::io_context& io_ctx) {
    audit_logger_ = std::make_shared<StructuredLogger>(parse_log_level(config_.log_level), config_.log_path);
    stats_        = std::make_shared<RpcStats>();

    std::shared_ptr<ToolExecutor> local_executor;
    std::shared_ptr<ToolExecutor> upstream_executor;

    if (config_.mode == ServerMode::kGateway) {
        auto options = GatewayConfigLoader::load(config_.gateway_config_path);
        if (!options) {
            throw std::runtime_error(fmt::format("gateway config {}: {}",
                                                 config_.gateway_config_path, options.error()));
        }
        spdlog::info("[server] gateway mode: {} upstreams, refresh every {}ms",
                     options->upstreams.size(), options->refresh_interval.count());

        gateway_ = std::make_shared<GatewayAggregator>(io_ctx.get_executor(), std::move(*options),
                                                       UpstreamSourceFactory{}, audit_logger_);
        catalog_          = gateway_;
        upstream_executor = std::make_shared<UpstreamToolExecutor>();
    } else {
        policy_provider_  = std::make_shared<FilePolicyProvider>(config_.policy_path);
        catalog_provider_ = std::make_shared<CatalogProvider>(
            policy_provider_,
            CatalogProviderOptions{.min_reload_interval = config_.catalog_min_reload},
            audit_logger_);
        catalog_ = catalog_provider_;

        // 실행 제한(동시성, 호출 빈도)을 통과한 호출만 백엔드로 간다.
        local_executor = std::make_shared<InvocationPolicyExecutor>(
            std::make_shared<HttpToolExecutor>(HttpToolExecutorOptions{
                .base_url                = config_.backend_base_url,
                .default_timeout         = config_.tool_timeout,
                .propagate_authorization = config_.propagate_authorization,
            }),
            InvocationPolicyOptions{.max_queue_wait = config_.tool_timeout});
        spdlog::info("[server] local mode: policy={} backend={}", config_.policy_path, config_.backend_base_url);
    }

    executor_ = std::make_shared<RoutingToolExecutor>(std::move(local_executor), std::move(upstream_executor));
    handler_  = std::make_shared<JsonRpcHandler>(catalog_, executor_,
                                                 JsonRpcHandlerOptions{.service_name = config_.service_name},
                                                 stats_, audit_logger_);

    std::shared_ptr<const EndpointInventory> inventory;
    if (!config_.endpoints_path.empty()) {
        auto loaded = EndpointInventory::load(config_.endpoints_path);
        if (loaded) {
            inventory = std::make_shared<const EndpointInventory>(std::move(*loaded));
        } else {
            spdlog::warn("[server] endpoint inventory unavailable, gap report disabled: {}", loaded.error());
        }
    }

    diagnostics_ = std::make_shared<DiagnosticsService>(
        DiagnosticsOptions{
            .service_name = config_.service_name,
            .mcp_endpoint = uses_http() ? fmt::format("http://{}:{}/mcp", config_.listen_address, config_.listen_port)
                                        : std::string{},
        },
        DiagnosticsSources{
            .catalog   = catalog_,
            .policy    = policy_provider_,
            .provider  = catalog_provider_,
            .gateway   = gateway_,
            .inventory = std::move(inventory),
            .stats     = stats_,
        });

    if (uses_stdio()) {
        stdio_ = std::make_unique<StdioTransport>(io_ctx.get_executor(), handler_);
    }
    if (uses_http()) {
        http_ = std::make_unique<HttpTransport>(io_ctx.get_executor(), handler_, diagnostics_,
                                                HttpTransportOptions{
                                                    .listen_address = config_.listen_address,
                                                    .port           = config_.listen_port,
                                                    .max_body_bytes = config_.max_request_body_bytes,
                                                });
    }
    if (!config_.admin_socket_path.empty()) {
        AdminActions actions{};
        if (gateway_) {
            actions.refresh = [this]() { return admin_refresh(); };
        }
        if (catalog_provider_) {
            actions.policy_reload = [this]() { return admin_policy_reload(); };
        }
        admin_ = std::make_unique<AdminServer>(config_.admin_socket_path, io_ctx.get_executor(),
                                               stats_, diagnostics_, std::move(actions));
    }
}

void ToolgateServer::start(asio::io_context& io_ctx) {
    io_ctx_ = &io_ctx;

    build_components(io_ctx);

    // bind 실패는 여기서 예외로 main 까지 올라간다.
    if (http_) {
        http_->listen();
    }

    stop_signals_ = std::make_unique<asio::signal_set>(io_ctx, SIGTERM, SIGINT);
    stop_signals_->async_wait([this](const boost::system::error_code& ec, int signum) {
        if (!ec) {
            spdlog::info("[server] signal {} received, shutting down", signum);
            stop();
        }
    });

    hup_signals_ = std::make_unique<asio::signal_set>(io_ctx, SIGHUP);
    wait_hup();

    spawn(startup(), "startup");
}

void ToolgateServer::wait_hup() {
    hup_signals_->async_wait([this](const boost::system::error_code& ec, int /*signum*/) {
        if (ec) {
            return;
        }
        spdlog::info("[server] SIGHUP received, reloading configuration");
        reload();
        if (!stopping_) {
            wait_hup();
        }
    });
}

asio::awaitable<void> ToolgateServer::startup() {
    const auto token = stop_source_.get_token();

    if (gateway_) {
        const bool published = co_await gateway_->refresh(token);
        const auto state     = gateway_->current_state();
        spdlog::info("[server] initial gateway refresh {}: tools={} upstreams={}",
                     published ? "completed" : "not published",
                     state->catalog->tool_count(), state->upstreams.size());
    } else {
        const auto snapshot = catalog_provider_->ensure_fresh_snapshot(token);
        spdlog::info("[server] initial catalog: tools={} version={}",
                     snapshot->tool_count(), snapshot->source_version);
    }

    if (token.stop_requested()) {
        co_return;
    }

    if (gateway_) {
        spawn(gateway_->run(token), "gateway");
    }
    if (http_) {
        spdlog::info("[server] MCP endpoint: {}", http_->mcp_endpoint_url());
        spawn(http_->run(token), "http");
    }
    if (admin_) {
        spawn(admin_->run(), "admin");
    }
    if (stdio_) {
        // stdio 전용이면 입력 종료가 곧 서버 종료
        spawn(stdio_->run(token), "stdio", [this]() {
            if (!uses_http()) {
                stop();
            }
        });
    }
}

void ToolgateServer::spawn(asio::awaitable<void> task, std::string name, std::function<void()> on_exit) {
    ++active_tasks_;
    asio::co_spawn(*io_ctx_, std::move(task),
        [this, name = std::move(name), on_exit = std::move(on_exit)](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const OperationCancelled&) {
                    spdlog::debug("[server] {} cancelled", name);
                }
                catch (const std::exception& e) {
                    spdlog::error("[server] {} failed: {}", name, e.what());
                }
            }
            if (on_exit) {
                on_exit();
            }
            task_finished();
        });
}

void ToolgateServer::task_finished() {
    --active_tasks_;
    if (stopping_ && active_tasks_ == 0 && grace_timer_) {
        spdlog::info("[server] all tasks finished");
        grace_timer_->cancel();
    }
}

void ToolgateServer::stop() {
    if (stopping_) {
        return;
    }
    stopping_ = true;

    spdlog::info("[server] stopping, active tasks: {}", active_tasks_);

    stop_source_.request_stop();
    if (stdio_) {
        stdio_->stop();
    }
    if (http_) {
        http_->stop();
    }
    if (admin_) {
        admin_->stop();
    }
    if (gateway_) {
        gateway_->stop();
    }

    boost::system::error_code ec;
    if (stop_signals_) {
        stop_signals_->cancel(ec);
    }
    if (hup_signals_) {
        hup_signals_->cancel(ec);
    }

    if (io_ctx_ == nullptr || active_tasks_ == 0) {
        return;
    }

    grace_timer_ = std::make_unique<asio::steady_timer>(*io_ctx_, config_.shutdown_grace);
    grace_timer_->async_wait([this](const boost::system::error_code& wait_ec) {
        if (!wait_ec) {
            spdlog::warn("[server] {} tasks still running after {}s, stopping io_context",
                         active_tasks_, config_.shutdown_grace.count());
            io_ctx_->stop();
        }
    });
}

bool ToolgateServer::reload() {
    if (stopping_) {
        return false;
    }

    if (gateway_) {
        auto options = GatewayConfigLoader::load(config_.gateway_config_path);
        if (!options) {
            spdlog::warn("[server] gateway reload failed (keeping current options): {}", options.error());
            return false;
        }
        spdlog::info("[server] gateway options reloaded: {} upstreams, refresh every {}ms",
                     options->upstreams.size(), options->refresh_interval.count());
        gateway_->reload_options(std::move(*options));
        return true;
    }

    auto result = admin_policy_reload();
    if (!result) {
        spdlog::warn("[server] policy reload failed (keeping current catalog): {}", result.error());
        return false;
    }
    return true;
}

asio::awaitable<std::expected<nlohmann::json, std::string>> ToolgateServer::admin_refresh() {
    const bool published = co_await gateway_->refresh(stop_source_.get_token());
    const auto state     = gateway_->current_state();

    std::size_t healthy = 0;
    for (const auto& upstream : state->upstreams) {
        if (upstream.healthy()) {
            ++healthy;
        }
    }
    co_return nlohmann::json{
        {"refreshed",        published},
        {"skipped",          !published && gateway_->refresh_in_progress()},
        {"toolCount",        state->catalog->tool_count()},
        {"upstreams",        state->upstreams.size()},
        {"healthyUpstreams", healthy},
    };
}

std::expected<nlohmann::json, std::string> ToolgateServer::admin_policy_reload() {
    policy_provider_->notify_changed();
    catalog_provider_->invalidate();

    auto result = catalog_provider_->reload(stop_source_.get_token());
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }
    const auto& snapshot = *result;
    spdlog::info("[server] policy reloaded: version={} tools={}", snapshot->source_version, snapshot->tool_count());
    return nlohmann::json{
        {"sourceVersion", snapshot->source_version},
        {"toolCount",     snapshot->tool_count()},
    };
}
