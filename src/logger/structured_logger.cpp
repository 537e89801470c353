// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
        default:               return spdlog::level::info;
    }
}

}  // namespace

LogLevel parse_log_level(const std::string& text) noexcept {
    std::string lowered = text;
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug" || lowered == "trace") {
        return LogLevel::kDebug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error" || lowered == "err") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

spdlog::level::level_enum diagnostic_log_level(const std::string& text) {
    std::string lowered = text;
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "warn") {
        return spdlog::level::warn;
    }
    if (lowered == "err") {
        return spdlog::level::err;
    }
    for (int level = spdlog::level::trace; level < spdlog::level::n_levels; ++level) {
        const auto name = spdlog::level::to_string_view(static_cast<spdlog::level::level_enum>(level));
        if (lowered == std::string_view{name.data(), name.size()}) {
            return static_cast<spdlog::level::level_enum>(level);
        }
    }
    spdlog::warn("unknown log level '{}', using info", text);
    return spdlog::level::info;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   bool                         to_stderr)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (to_stderr) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
        }

        if (!log_path_.empty()) {
            if (log_path_.has_parent_path()) {
                std::filesystem::create_directories(log_path_.parent_path());
            }
            // Rotating file sink (100MB, 3개 파일 유지)
            constexpr std::size_t kMaxFileSize = 100 * 1024 * 1024;
            constexpr std::size_t kMaxFiles    = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path_.string(), kMaxFileSize, kMaxFiles));
        }

        // 레지스트리에 등록하지 않는다 (여러 인스턴스가 같은 이름을 써도 충돌 없음)
        logger_ = std::make_shared<spdlog::logger>("toolgate.audit", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_tool_call: 성공 info / 실패 warn
// ---------------------------------------------------------------------------
void StructuredLogger::log_tool_call(const ToolCallLog& entry) {
    const LogLevel level = entry.success ? LogLevel::kInfo : LogLevel::kWarn;
    if (!logger_ || !enabled(level)) {
        return;
    }

    nlohmann::json json{
        {"event",          "tool_call"},
        {"request_id",     entry.request_id},
        {"transport",      to_string(entry.transport)},
        {"client_address", entry.client_address},
        {"tool_name",      entry.tool_name},
        {"success",        entry.success},
        {"timestamp",      format_iso8601(entry.timestamp)},
        {"duration_us",    entry.duration.count()},
    };
    if (!entry.success) {
        json["error_type"] = entry.error_type;
    }

    const auto line = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (entry.success) {
        logger_->info(line);
    } else {
        logger_->warn(line);
    }
}

void StructuredLogger::log_catalog_build(const CatalogBuildLog& entry) {
    if (!logger_ || !enabled(LogLevel::kInfo)) {
        return;
    }

    const nlohmann::json json{
        {"event",          "catalog_build"},
        {"source_version", entry.source_version},
        {"tool_count",     entry.tool_count},
        {"skipped_count",  entry.skipped_count},
        {"timestamp",      format_iso8601(entry.timestamp)},
        {"duration_us",    entry.duration.count()},
    };
    logger_->info(json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void StructuredLogger::log_gateway_refresh(const GatewayRefreshLog& entry) {
    if (!logger_ || !enabled(LogLevel::kInfo)) {
        return;
    }

    const nlohmann::json json{
        {"event",                  "gateway_refresh"},
        {"upstream_count",         entry.upstream_count},
        {"healthy_upstream_count", entry.healthy_upstream_count},
        {"tool_count",             entry.tool_count},
        {"timestamp",              format_iso8601(entry.timestamp)},
        {"duration_us",            entry.duration.count()},
    };
    logger_->info(json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}
