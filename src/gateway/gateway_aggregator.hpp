#pragma once

// ---------------------------------------------------------------------------
// gateway_aggregator.hpp
//
// N 개 업스트림 MCP 서버의 카탈로그를 주기적으로 가져와 하나의 통합
// 카탈로그로 병합하는 게이트웨이 집계기. 자신도 CatalogSource 이다.
//
// [refresh 사이클]
//   1. in-progress 플래그를 non-blocking try-acquire. 이미 진행 중이면
//      이번 요청은 버리고 false 를 반환한다 (대기/큐잉 없음).
//   2. 활성 업스트림을 병렬로 조회한다. 업스트림마다
//      deadline = min(request_timeout, refresh_interval) 과 호출자 stop_token.
//   3. 성공 → Healthy + 스냅샷 저장. 실패 → Unhealthy, 마지막 정상 스냅샷
//      (last-known-good) 유지, 오류 기록. 업스트림 하나의 예외는 그 업스트림
//      에서 끝난다.
//   4. 설정된 upstreams 순서대로 병합한다. 같은 외부 이름이 여럿이면 먼저
//      나열된 업스트림이 이긴다 (fresh / last-known-good 무관).
//   5. 통합 스냅샷 + 업스트림 상태 목록을 한 번의 atomic 교체로 게시한다.
//   플래그는 어떤 경로로 빠져나가든 RefreshGuard 가 해제한다.
//
// [상태 전이]
//   Unknown → Healthy ⇄ Unhealthy
//   Healthy = 가장 최근 조회가 성공 && now - last_success <= staleness_bound
//
// [스레드 모델]
// 단일 스레드 io_context 를 가정한다. 업스트림 레코드는 refresh 를 잡은
// 코루틴만 수정한다. 읽는 쪽은 게시된 GatewaySnapshot 만 본다.
// ---------------------------------------------------------------------------

#include "catalog/catalog_source.hpp"
#include "gateway/gateway_config.hpp"
#include "logger/structured_logger.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

enum class UpstreamHealth : std::uint8_t {
    kUnknown   = 0,
    kHealthy   = 1,
    kUnhealthy = 2,
};

[[nodiscard]] const char* to_string(UpstreamHealth health) noexcept;

// ---------------------------------------------------------------------------
// UpstreamStatus
//   게시 시점의 업스트림 상태 사본 (진단/헬스 체크용).
//   tool_count     : 마지막 정상 스냅샷의 도구 수
//   serving_stale  : 최근 조회는 실패했지만 last-known-good 을 계속 병합 중
// ---------------------------------------------------------------------------
struct UpstreamStatus {
    std::string                                          name{};
    std::string                                          mcp_endpoint{};
    std::string                                          namespace_prefix{};
    bool                                                 enabled{true};
    UpstreamHealth                                       health{UpstreamHealth::kUnknown};
    std::string                                          last_error{};
    std::optional<std::chrono::system_clock::time_point> last_success{};
    std::optional<std::chrono::system_clock::time_point> last_check{};
    std::chrono::milliseconds                            latency{0};
    std::uint32_t                                        consecutive_failures{0};
    std::size_t                                          tool_count{0};
    bool                                                 serving_stale{false};

    [[nodiscard]] bool healthy() const noexcept { return health == UpstreamHealth::kHealthy; }
};

struct GatewaySnapshot {
    std::shared_ptr<const CatalogSnapshot> catalog{};
    std::vector<UpstreamStatus>            upstreams{};
};

// UpstreamSourceFactory
//   업스트림 설정 하나에 대한 CatalogSource 를 만든다.
//   기본값은 HttpCatalogClient. 테스트에서는 가짜 공급원을 주입한다.
using UpstreamSourceFactory =
    std::function<std::shared_ptr<CatalogSource>(const UpstreamConfig&)>;

class GatewayAggregator final : public CatalogSource {
public:
    GatewayAggregator(boost::asio::any_io_executor      executor,
                      GatewayOptions                    options,
                      UpstreamSourceFactory             factory      = {},
                      std::shared_ptr<StructuredLogger> audit_logger = nullptr);

    ~GatewayAggregator() override = default;

    GatewayAggregator(const GatewayAggregator&)            = delete;
    GatewayAggregator& operator=(const GatewayAggregator&) = delete;
    GatewayAggregator(GatewayAggregator&&)                 = delete;
    GatewayAggregator& operator=(GatewayAggregator&&)      = delete;

    // refresh
    //   한 사이클을 실행한다. 다른 refresh 가 진행 중이면 즉시 false.
    //   stop 이 요청되어 중단된 경우에도 false (게시하지 않음).
    boost::asio::awaitable<bool> refresh(std::stop_token stop);

    // run
    //   주기 루프. 매 사이클마다 현재 옵션의 refresh_interval 을 다시 읽는다.
    //   초기 refresh 는 서버 시작 시 호출자가 별도로 수행한다.
    boost::asio::awaitable<void> run(std::stop_token stop);

    // stop
    //   run 루프와 진행 중인 조회를 중단시킨다. 스레드 안전.
    void stop();

    // reload_options
    //   다음 사이클부터 새 옵션을 적용한다. 호출자가 validate 를 마친 값이어야 한다.
    void reload_options(GatewayOptions options);

    [[nodiscard]] GatewayOptions options() const;

    boost::asio::awaitable<FetchResult>
    async_ensure_fresh_snapshot(std::stop_token stop) override;

    [[nodiscard]] SnapshotPtr current_snapshot() const override;

    [[nodiscard]] std::shared_ptr<const GatewaySnapshot> current_state() const {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool refresh_in_progress() const noexcept {
        return in_progress_.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::uint64_t completed_refreshes() const noexcept {
        return completed_refreshes_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] std::uint64_t skipped_refreshes() const noexcept {
        return skipped_refreshes_.load(std::memory_order_relaxed);
    }

private:
    // UpstreamRecord
    //   refresh 사이클을 넘어 유지되는 업스트림별 상태. 이름으로 식별한다.
    struct UpstreamRecord {
        UpstreamConfig                                       config{};
        std::shared_ptr<CatalogSource>                       source{};
        std::shared_ptr<const CatalogSnapshot>               last_good{};
        std::string                                          last_error{};
        std::optional<std::chrono::system_clock::time_point> last_success{};
        std::optional<std::chrono::system_clock::time_point> last_check{};
        std::chrono::milliseconds                            latency{0};
        std::uint32_t                                        consecutive_failures{0};
    };

    boost::asio::any_io_executor      executor_;
    UpstreamSourceFactory             factory_;
    std::shared_ptr<StructuredLogger> audit_logger_;

    mutable std::mutex mutex_;
    GatewayOptions     options_;
    std::shared_ptr<boost::asio::steady_timer> wait_timer_{};

    std::map<std::string, UpstreamRecord, std::less<>> records_{};

    std::atomic<std::shared_ptr<const GatewaySnapshot>> state_;
    std::atomic<bool>                                   in_progress_{false};
    std::atomic<bool>                                   ever_refreshed_{false};
    std::atomic<std::uint64_t>                          completed_refreshes_{0};
    std::atomic<std::uint64_t>                          skipped_refreshes_{0};
    std::stop_source                                    stop_source_{};

    void sync_records(const GatewayOptions& options);

    boost::asio::awaitable<void> fetch_all(std::vector<UpstreamRecord*> targets,
                                           std::chrono::milliseconds    interval,
                                           std::stop_token              stop);

    boost::asio::awaitable<void> fetch_one(UpstreamRecord&           record,
                                           std::chrono::milliseconds deadline,
                                           std::stop_token           stop);

    [[nodiscard]] std::shared_ptr<const GatewaySnapshot> merge(const GatewayOptions& options) const;
};
