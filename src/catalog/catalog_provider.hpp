#pragma once

// ---------------------------------------------------------------------------
// catalog_provider.hpp
//
// 정책 문서 버전을 키로 하는 카탈로그 스냅샷 캐시.
//
// [동작]
// ensure_fresh_snapshot(stop):
//   1. 최소 재로드 간격 안이고 변경 신호도 없으면 캐시 스냅샷을 그대로 반환
//   2. 정책 문서를 가져온다 (PolicyConfigProvider::get)
//   3. source_version 이 캐시와 같으면 캐시 스냅샷 반환 (같은 인스턴스)
//   4. 다르면(또는 첫 사용) CatalogBuilder 로 빌드 → validate → atomic 교체
//
// [동시성]
// - current_snapshot() 은 atomic load 하나로 끝나며 절대 블록하지 않는다.
// - 재구성은 mutex_ 로 직렬화한다. 동시에 들어온 호출자는 앞선 재구성이
//   끝나길 기다린 뒤, 이미 갱신된 버전을 보고 같은 스냅샷을 반환한다.
//
// [실패 처리]
// - 문서 fetch 실패 / 스냅샷 validate 실패: 예외 없이 이전 스냅샷을 유지하고
//   반환한다. status() 의 last_error / consecutive_failures 로 드러난다.
// - 규칙 구현의 예상치 못한 예외와 취소(OperationCancelled)는 전파된다.
// ---------------------------------------------------------------------------

#include "catalog/catalog_builder.hpp"
#include "catalog/catalog_source.hpp"
#include "logger/structured_logger.hpp"
#include "policy/policy_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

struct CatalogProviderOptions {
    std::chrono::milliseconds min_reload_interval{1000};
};

// ---------------------------------------------------------------------------
// CatalogProviderStatus
//   진단/관리 소켓용 상태 사본.
// ---------------------------------------------------------------------------
struct CatalogProviderStatus {
    std::string                source_version{};
    std::size_t                tool_count{0};
    std::string                last_error{};
    std::uint32_t              consecutive_failures{0};
    std::uint64_t              rebuild_count{0};
    std::vector<SkippedPolicy> last_skipped{};
    std::optional<std::chrono::system_clock::time_point> last_success{};
};

class CatalogProvider final : public CatalogSource {
public:
    // audit_logger 는 nullptr 허용 (재구성 감사 기록 생략)
    CatalogProvider(std::shared_ptr<PolicyConfigProvider> policy_provider,
                    CatalogProviderOptions                options      = {},
                    std::shared_ptr<StructuredLogger>     audit_logger = nullptr);

    ~CatalogProvider() override = default;

    CatalogProvider(const CatalogProvider&)            = delete;
    CatalogProvider& operator=(const CatalogProvider&) = delete;
    CatalogProvider(CatalogProvider&&)                 = delete;
    CatalogProvider& operator=(CatalogProvider&&)      = delete;

    // ensure_fresh_snapshot
    //   항상 유효한 스냅샷을 반환한다 (fetch 실패 시 stale 또는 empty).
    [[nodiscard]] SnapshotPtr ensure_fresh_snapshot(const std::stop_token& stop = {});

    // reload
    //   최소 간격과 버전 비교를 무시하고 즉시 fetch + 빌드한다.
    //   실패 시 이전 스냅샷을 유지하고 std::unexpected(사유) 를 반환한다.
    [[nodiscard]] FetchResult reload(const std::stop_token& stop = {});

    boost::asio::awaitable<FetchResult>
    async_ensure_fresh_snapshot(std::stop_token stop) override;

    [[nodiscard]] SnapshotPtr current_snapshot() const override {
        return snapshot_.load(std::memory_order_acquire);
    }

    // invalidate
    //   다음 ensure_fresh_snapshot() 이 간격과 무관하게 문서를 가져오게 한다.
    void invalidate() noexcept { invalidated_.store(true, std::memory_order_release); }

    [[nodiscard]] CatalogProviderStatus status() const;

private:
    using Clock = std::chrono::steady_clock;

    std::shared_ptr<PolicyConfigProvider> policy_provider_;
    std::shared_ptr<PolicyChangeSignal>   change_signal_;
    CatalogProviderOptions                options_;
    CatalogBuilder                        builder_;
    std::shared_ptr<StructuredLogger>     audit_logger_;

    std::atomic<std::shared_ptr<const CatalogSnapshot>> snapshot_;
    std::atomic<bool>                                   invalidated_{false};

    // 아래 상태는 mutex_ 로 보호된다.
    mutable std::mutex                 mutex_;
    std::optional<std::string>         cached_version_{};
    std::optional<Clock::time_point>   last_fetch_{};
    std::uint64_t                      seen_generation_{0};
    CatalogProviderStatus              status_{};

    // refresh_locked
    //   mutex_ 를 잡은 상태에서 fetch + (필요 시) 빌드. force 면 버전 비교 생략.
    FetchResult refresh_locked(const std::stop_token& stop, bool force);

    void record_failure_locked(std::string error);
};
