#include "common/env_util.hpp"
#include "logger/structured_logger.hpp"
#include "server/toolgate_server.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <string>

namespace {

// stdout 은 stdio 전송의 프로토콜 채널이므로 진단 로그는 stderr 로만 보낸다.
void init_logging(const std::string& level) {
    auto logger = spdlog::stderr_color_mt("toolgate");
    spdlog::set_default_logger(logger);
    spdlog::set_level(diagnostic_log_level(level));
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {
    const std::string log_level = env_str("LOG_LEVEL", "info");
    init_logging(log_level);

    // ── 설정 로드 (환경변수 우선, 기본값 fallback) ───────────────────────
    ToolgateConfig config;

    auto mode = parse_server_mode(env_str("TOOLGATE_MODE", "local"));
    if (!mode) {
        spdlog::critical("TOOLGATE_MODE: {}", mode.error());
        return EXIT_FAILURE;
    }
    auto transport = parse_transport_mode(env_str("TOOLGATE_TRANSPORT", "stdio"));
    if (!transport) {
        spdlog::critical("TOOLGATE_TRANSPORT: {}", transport.error());
        return EXIT_FAILURE;
    }

    config.mode                    = *mode;
    config.transport               = *transport;
    config.listen_address          = env_str("HTTP_LISTEN_ADDR",       "127.0.0.1");
    config.listen_port             = env_u16("HTTP_LISTEN_PORT",       8080);
    config.max_request_body_bytes  = env_u64("MAX_REQUEST_BODY_BYTES", 1024 * 1024);
    config.policy_path             = env_str("POLICY_PATH",            "config/policy.yaml");
    config.endpoints_path          = env_str("ENDPOINTS_PATH",         "");
    config.gateway_config_path     = env_str("GATEWAY_CONFIG_PATH",    "config/gateway.yaml");
    config.admin_socket_path       = env_str("ADMIN_SOCKET_PATH",      "");
    config.log_path                = env_str("LOG_PATH",               "");
    config.log_level               = log_level;
    config.service_name            = env_str("SERVICE_NAME",           "toolgate");
    config.backend_base_url        = env_str("BACKEND_BASE_URL",       "http://127.0.0.1:8080");
    config.tool_timeout            = std::chrono::seconds{env_u64("TOOL_TIMEOUT_SEC", 30)};
    config.catalog_min_reload      = std::chrono::milliseconds{env_u64("CATALOG_MIN_RELOAD_MS", 1000, true)};
    config.propagate_authorization = env_bool("PROPAGATE_AUTHORIZATION", false);

    spdlog::info("Starting toolgate ({})", config.service_name);
    spdlog::info("Mode: {}", config.mode == ServerMode::kGateway ? "gateway" : "local");
    if (config.transport != TransportMode::kStdio) {
        spdlog::info("HTTP: {}:{}", config.listen_address, config.listen_port);
    }
    spdlog::info("Log level: {}", config.log_level);

    // ── 서버 생성 및 실행 ───────────────────────────────────────────────
    try {
        boost::asio::io_context ioc;
        ToolgateServer server{config};
        server.start(ioc);
        ioc.run();
    } catch (const std::exception& e) {
        spdlog::critical("toolgate failed: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("toolgate stopped");
    return EXIT_SUCCESS;
}
