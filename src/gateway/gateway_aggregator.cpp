#include "gateway/gateway_aggregator.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/types.hpp"
#include "common/yaml_util.hpp"  // content_fingerprint
#include "gateway/remote_catalog_client.hpp"
#include "gateway/tool_filter.hpp"
#include "gateway/tool_name_service.hpp"

namespace asio = boost::asio;

namespace {

// ---------------------------------------------------------------------------
// RefreshGuard
//   in-progress 플래그의 scoped release. 예외/취소/정상 종료 모두에서 해제.
// ---------------------------------------------------------------------------
class RefreshGuard {
public:
    explicit RefreshGuard(std::atomic<bool>& flag) noexcept
        : flag_{flag}
    {}

    ~RefreshGuard() { flag_.store(false, std::memory_order_release); }

    RefreshGuard(const RefreshGuard&)            = delete;
    RefreshGuard& operator=(const RefreshGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

// 업스트림 하나의 조회 deadline 상태. 타이머 핸들러와 stop_callback 이 공유한다.
struct FetchDeadline {
    std::stop_source source{};
    bool             timed_out{false};
};

[[nodiscard]] std::shared_ptr<CatalogSource> make_http_source(const UpstreamConfig& config) {
    return std::make_shared<HttpCatalogClient>(config);
}

}  // namespace

const char* to_string(UpstreamHealth health) noexcept {
    switch (health) {
        case UpstreamHealth::kUnknown:   return "unknown";
        case UpstreamHealth::kHealthy:   return "healthy";
        case UpstreamHealth::kUnhealthy: return "unhealthy";
        default:                         return "unknown";
    }
}

GatewayAggregator::GatewayAggregator(asio::any_io_executor             executor,
                                     GatewayOptions                    options,
                                     UpstreamSourceFactory             factory,
                                     std::shared_ptr<StructuredLogger> audit_logger)
    : executor_{std::move(executor)}
    , factory_{factory ? std::move(factory) : UpstreamSourceFactory{make_http_source}}
    , audit_logger_{std::move(audit_logger)}
    , options_{std::move(options)}
{
    auto initial     = std::make_shared<GatewaySnapshot>();
    initial->catalog = CatalogSnapshot::empty();
    for (const auto& upstream : options_.upstreams) {
        initial->upstreams.push_back(UpstreamStatus{
            .name             = upstream.name,
            .mcp_endpoint     = upstream.mcp_endpoint,
            .namespace_prefix = upstream.namespace_prefix,
            .enabled          = upstream.enabled,
        });
    }
    state_.store(std::move(initial), std::memory_order_release);
}

GatewayOptions GatewayAggregator::options() const {
    std::lock_guard lock{mutex_};
    return options_;
}

void GatewayAggregator::reload_options(GatewayOptions options) {
    std::lock_guard lock{mutex_};
    spdlog::info("[gateway] options reloaded: {} upstreams, refresh every {}ms",
                 options.upstreams.size(), options.refresh_interval.count());
    options_ = std::move(options);
}

CatalogSource::SnapshotPtr GatewayAggregator::current_snapshot() const {
    return state_.load(std::memory_order_acquire)->catalog;
}

void GatewayAggregator::stop() {
    stop_source_.request_stop();

    std::shared_ptr<asio::steady_timer> timer;
    {
        std::lock_guard lock{mutex_};
        timer = wait_timer_;
    }
    if (timer) {
        asio::post(executor_, [timer]() { timer->cancel(); });
    }
}

// ---------------------------------------------------------------------------
// sync_records
//   현재 옵션에 맞춰 업스트림 레코드를 추가/교체/삭제한다.
//   설정이 바뀐 업스트림은 공급원을 새로 만들되 last-known-good 은 유지한다.
// ---------------------------------------------------------------------------
void GatewayAggregator::sync_records(const GatewayOptions& options) {
    for (auto it = records_.begin(); it != records_.end();) {
        const bool still_configured = std::any_of(
            options.upstreams.begin(), options.upstreams.end(),
            [&it](const UpstreamConfig& cfg) { return cfg.name == it->first; });
        if (still_configured) {
            ++it;
        } else {
            spdlog::info("[gateway] upstream '{}' removed from configuration", it->first);
            it = records_.erase(it);
        }
    }

    for (const auto& cfg : options.upstreams) {
        auto [it, inserted] = records_.try_emplace(cfg.name);
        UpstreamRecord& record = it->second;
        if (inserted || !record.source || record.config != cfg) {
            record.config = cfg;
            record.source = factory_(cfg);
        }
    }
}

asio::awaitable<bool> GatewayAggregator::refresh(std::stop_token stop) {
    bool expected = false;
    if (!in_progress_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        skipped_refreshes_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[gateway] refresh already in progress, request dropped");
        co_return false;
    }
    RefreshGuard guard{in_progress_};

    const auto started = std::chrono::steady_clock::now();
    const auto options = this->options();
    sync_records(options);

    std::vector<UpstreamRecord*> targets;
    for (const auto& cfg : options.upstreams) {
        if (cfg.enabled) {
            targets.push_back(&records_.at(cfg.name));
        }
    }

    co_await fetch_all(std::move(targets), options.refresh_interval, stop);

    if (stop.stop_requested()) {
        spdlog::info("[gateway] refresh cancelled before publish");
        co_return false;
    }

    auto published = merge(options);
    state_.store(published, std::memory_order_release);
    ever_refreshed_.store(true, std::memory_order_release);
    completed_refreshes_.fetch_add(1, std::memory_order_relaxed);

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    const auto& catalog = *published->catalog;
    spdlog::info("[gateway] snapshot published: tools={} upstreams={}/{} healthy ({}ms)",
                 catalog.tool_count(), catalog.healthy_upstream_count, catalog.upstream_count,
                 elapsed.count() / 1000);

    if (audit_logger_) {
        audit_logger_->log_gateway_refresh(GatewayRefreshLog{
            .upstream_count         = catalog.upstream_count,
            .healthy_upstream_count = catalog.healthy_upstream_count,
            .tool_count             = catalog.tool_count(),
            .timestamp              = catalog.created_at,
            .duration               = elapsed,
        });
    }
    co_return true;
}

// ---------------------------------------------------------------------------
// fetch_all
//   업스트림마다 fetch_one 을 co_spawn 하고 모두 끝날 때까지 기다린다.
//   완료 카운터가 0 이 되면 대기 타이머를 cancel 하여 깨운다.
// ---------------------------------------------------------------------------
asio::awaitable<void> GatewayAggregator::fetch_all(std::vector<UpstreamRecord*> targets,
                                                   std::chrono::milliseconds    interval,
                                                   std::stop_token              stop) {
    if (targets.empty()) {
        co_return;
    }

    auto executor  = co_await asio::this_coro::executor;
    auto done      = std::make_shared<asio::steady_timer>(executor,
                                                          asio::steady_timer::time_point::max());
    auto remaining = std::make_shared<std::size_t>(targets.size());

    for (UpstreamRecord* record : targets) {
        const auto deadline = std::min(record->config.request_timeout, interval);
        const std::string name = record->config.name;
        asio::co_spawn(executor, fetch_one(*record, deadline, stop),
            [done, remaining, name](std::exception_ptr error) {
                if (error) {
                    try {
                        std::rethrow_exception(error);
                    } catch (const std::exception& e) {
                        spdlog::error("[gateway] upstream '{}' fetch coroutine failed: {}", name, e.what());
                    }
                }
                if (--*remaining == 0) {
                    done->cancel();
                }
            });
    }

    // 모든 조회가 이미 끝났다면 기다리지 않는다 (cancel 이 대기 전에 호출된 경우).
    if (*remaining > 0) {
        boost::system::error_code ec;
        co_await done->async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
}

asio::awaitable<void> GatewayAggregator::fetch_one(UpstreamRecord&           record,
                                                   std::chrono::milliseconds deadline,
                                                   std::stop_token           stop) {
    auto executor = co_await asio::this_coro::executor;

    auto state = std::make_shared<FetchDeadline>();
    std::stop_callback link{stop, [state]() { state->source.request_stop(); }};

    auto timer = std::make_shared<asio::steady_timer>(executor, deadline);
    timer->async_wait([state](const boost::system::error_code& ec) {
        if (!ec) {
            state->timed_out = true;
            state->source.request_stop();
        }
    });

    const auto started = std::chrono::steady_clock::now();

    FetchResult result = std::unexpected(std::string{"no result"});
    std::string fault;
    try {
        result = co_await record.source->async_ensure_fresh_snapshot(state->source.get_token());
    } catch (const OperationCancelled&) {
        fault = "cancelled";
    } catch (const std::exception& e) {
        fault = fmt::format("unexpected error: {}", e.what());
    }
    timer->cancel();

    if (!fault.empty()) {
        result = std::unexpected(std::move(fault));
    }

    const auto now = std::chrono::system_clock::now();
    record.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!result && stop.stop_requested()) {
        // 종료 중: 업스트림 건강 상태를 오염시키지 않는다.
        co_return;
    }

    record.last_check = now;

    if (result && *result) {
        record.last_good            = *result;
        record.last_success         = now;
        record.last_error.clear();
        record.consecutive_failures = 0;
        spdlog::debug("[gateway] upstream '{}' healthy: {} tools in {}ms",
                      record.config.name, (*result)->tool_count(), record.latency.count());
        co_return;
    }

    record.consecutive_failures += 1;
    if (state->timed_out) {
        record.last_error = fmt::format("timed out after {}ms", deadline.count());
    } else if (!result) {
        record.last_error = result.error();
    } else {
        record.last_error = "source returned no snapshot";
    }
    spdlog::warn("[gateway] upstream '{}' fetch failed ({} consecutive){}: {}",
                 record.config.name, record.consecutive_failures,
                 record.last_good ? ", keeping last-known-good" : "",
                 record.last_error);
}

// ---------------------------------------------------------------------------
// merge
//   설정 순서대로 업스트림 스냅샷을 병합한다. 충돌 시 먼저 나온 쪽이 이긴다.
// ---------------------------------------------------------------------------
std::shared_ptr<const GatewaySnapshot> GatewayAggregator::merge(const GatewayOptions& options) const {
    const ToolNameService   names{options.tool_name_separator};
    const GatewayToolFilter filter{options.allowed_tools, options.denied_tools, options.deny_by_default};
    const auto              now = std::chrono::system_clock::now();

    auto state   = std::make_shared<GatewaySnapshot>();
    auto catalog = std::make_shared<CatalogSnapshot>();

    std::string version_seed;

    for (const auto& cfg : options.upstreams) {
        const auto it = records_.find(cfg.name);
        if (it == records_.end()) {
            continue;
        }
        const UpstreamRecord& record = it->second;

        UpstreamStatus status{
            .name                 = cfg.name,
            .mcp_endpoint         = cfg.mcp_endpoint,
            .namespace_prefix     = cfg.namespace_prefix,
            .enabled              = cfg.enabled,
            .last_error           = record.last_error,
            .last_success         = record.last_success,
            .last_check           = record.last_check,
            .latency              = record.latency,
            .consecutive_failures = record.consecutive_failures,
            .tool_count           = record.last_good ? record.last_good->tool_count() : 0,
        };

        if (!cfg.enabled) {
            state->upstreams.push_back(std::move(status));
            continue;
        }

        if (!record.last_check) {
            status.health = UpstreamHealth::kUnknown;
        } else if (record.consecutive_failures == 0 && record.last_success &&
                   now - *record.last_success <= options.staleness_bound) {
            status.health = UpstreamHealth::kHealthy;
        } else {
            status.health = UpstreamHealth::kUnhealthy;
        }
        status.serving_stale = record.consecutive_failures > 0 && record.last_good != nullptr;

        catalog->upstream_count += 1;
        if (status.healthy()) {
            catalog->healthy_upstream_count += 1;
        }

        if (record.last_good) {
            version_seed += fmt::format("{}={};", cfg.name, record.last_good->source_version);
            for (const auto& [upstream_name, descriptor] : record.last_good->tools) {
                std::string external = names.to_external_name(cfg.namespace_prefix, upstream_name);
                if (!filter.is_allowed(external)) {
                    spdlog::debug("[gateway] tool '{}' filtered out by gateway policy", external);
                    continue;
                }

                ToolDescriptor merged = descriptor;
                merged.tool_name = external;
                merged.upstream  = UpstreamRoute{
                    .upstream_name      = cfg.name,
                    .upstream_tool_name = upstream_name,
                    .mcp_endpoint       = cfg.mcp_endpoint,
                    .request_timeout    = cfg.request_timeout,
                    .default_headers    = cfg.default_headers,
                };

                if (const auto existing = catalog->tools.find(external); existing != catalog->tools.end()) {
                    spdlog::warn("[gateway] duplicate tool '{}' from upstream '{}' dropped, "
                                 "'{}' is listed first",
                                 external, cfg.name, existing->second.upstream->upstream_name);
                    continue;
                }
                catalog->tools.emplace(std::move(external), std::move(merged));
            }
        }

        state->upstreams.push_back(std::move(status));
    }

    catalog->source_version = content_fingerprint(version_seed);
    catalog->created_at     = now;
    state->catalog          = std::move(catalog);
    return state;
}

asio::awaitable<CatalogSource::FetchResult>
GatewayAggregator::async_ensure_fresh_snapshot(std::stop_token stop) {
    const auto current  = current_snapshot();
    const auto interval = options().refresh_interval;

    const bool stale = !ever_refreshed_.load(std::memory_order_acquire) ||
                       std::chrono::system_clock::now() - current->created_at >= interval;
    if (stale) {
        // 진행 중인 refresh 가 있으면 버려지고 현재 스냅샷을 그대로 쓴다.
        co_await refresh(stop);
    }
    co_return current_snapshot();
}

asio::awaitable<void> GatewayAggregator::run(std::stop_token stop) {
    auto timer = std::make_shared<asio::steady_timer>(executor_);
    {
        std::lock_guard lock{mutex_};
        wait_timer_ = timer;
    }

    std::stop_callback forward{stop, [this]() { this->stop(); }};
    const auto token = stop_source_.get_token();

    spdlog::info("[gateway] refresh loop started");

    while (!token.stop_requested()) {
        const auto interval = options().refresh_interval;
        timer->expires_after(interval);

        boost::system::error_code ec;
        co_await timer->async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (token.stop_requested()) {
            break;
        }
        if (ec && ec != asio::error::operation_aborted) {
            spdlog::warn("[gateway] refresh timer error: {}", ec.message());
        }

        try {
            co_await refresh(token);
        } catch (const std::exception& e) {
            spdlog::error("[gateway] refresh cycle failed: {}", e.what());
        }
    }

    {
        std::lock_guard lock{mutex_};
        wait_timer_.reset();
    }
    spdlog::info("[gateway] refresh loop stopped");
}
