#include "catalog/catalog_provider.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/types.hpp"

CatalogProvider::CatalogProvider(std::shared_ptr<PolicyConfigProvider> policy_provider,
                                 CatalogProviderOptions                options,
                                 std::shared_ptr<StructuredLogger>     audit_logger)
    : policy_provider_{std::move(policy_provider)}
    , options_{options}
    , audit_logger_{std::move(audit_logger)}
    , snapshot_{CatalogSnapshot::empty()}
{
    if (!policy_provider_) {
        throw std::invalid_argument("CatalogProvider requires a policy provider");
    }
    change_signal_ = policy_provider_->watch();
    if (change_signal_) {
        seen_generation_ = change_signal_->generation();
    }
}

CatalogSource::SnapshotPtr CatalogProvider::ensure_fresh_snapshot(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw OperationCancelled{};
    }

    std::lock_guard lock{mutex_};

    const auto now = Clock::now();

    std::uint64_t generation = seen_generation_;
    if (change_signal_) {
        generation = change_signal_->generation();
    }
    const bool signalled   = generation != seen_generation_;
    const bool invalidated = invalidated_.exchange(false, std::memory_order_acq_rel);

    // 최소 재로드 간격: 변경 신호나 invalidate 가 없으면 캐시 스냅샷 그대로
    if (!signalled && !invalidated && last_fetch_ &&
        now - *last_fetch_ < options_.min_reload_interval) {
        return current_snapshot();
    }
    seen_generation_ = generation;

    auto result = refresh_locked(stop, false);
    if (!result) {
        return current_snapshot();
    }
    return *result;
}

CatalogSource::FetchResult CatalogProvider::reload(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw OperationCancelled{};
    }

    std::lock_guard lock{mutex_};
    invalidated_.store(false, std::memory_order_release);
    if (change_signal_) {
        seen_generation_ = change_signal_->generation();
    }
    return refresh_locked(stop, true);
}

boost::asio::awaitable<CatalogSource::FetchResult>
CatalogProvider::async_ensure_fresh_snapshot(std::stop_token stop) {
    // 정책 fetch 는 로컬 파일/메모리 접근이므로 실행기 스레드에서 동기로 처리한다.
    co_return ensure_fresh_snapshot(stop);
}

CatalogProviderStatus CatalogProvider::status() const {
    std::lock_guard lock{mutex_};
    return status_;
}

CatalogSource::FetchResult CatalogProvider::refresh_locked(const std::stop_token& stop, bool force) {
    last_fetch_ = Clock::now();

    auto document = policy_provider_->get(stop);
    if (!document) {
        record_failure_locked(document.error());
        return std::unexpected(status_.last_error);
    }
    if (!*document) {
        record_failure_locked("policy provider returned no document");
        return std::unexpected(status_.last_error);
    }

    const PolicyDocument& doc = **document;
    if (!force && cached_version_ && *cached_version_ == doc.source_version) {
        spdlog::debug("[catalog] policy version '{}' unchanged, keeping snapshot",
                      doc.source_version);
        status_.consecutive_failures = 0;
        status_.last_error.clear();
        return current_snapshot();
    }

    const auto started = std::chrono::steady_clock::now();
    auto built = builder_.build(doc, stop);

    if (auto valid = built.snapshot->validate(); !valid) {
        record_failure_locked(fmt::format("built snapshot is invalid: {}", valid.error()));
        return std::unexpected(status_.last_error);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    snapshot_.store(built.snapshot, std::memory_order_release);
    cached_version_ = doc.source_version;

    status_.source_version       = doc.source_version;
    status_.tool_count           = built.snapshot->tool_count();
    status_.last_error.clear();
    status_.consecutive_failures = 0;
    status_.rebuild_count       += 1;
    status_.last_success         = std::chrono::system_clock::now();
    status_.last_skipped         = built.skipped;

    spdlog::info("[catalog] snapshot published: version='{}' tools={} skipped={}",
                 doc.source_version, built.snapshot->tool_count(), built.skipped.size());

    if (audit_logger_) {
        audit_logger_->log_catalog_build(CatalogBuildLog{
            .source_version = doc.source_version,
            .tool_count     = built.snapshot->tool_count(),
            .skipped_count  = built.skipped.size(),
            .timestamp      = built.snapshot->created_at,
            .duration       = elapsed,
        });
    }
    return built.snapshot;
}

void CatalogProvider::record_failure_locked(std::string error) {
    status_.consecutive_failures += 1;
    status_.last_error = std::move(error);
    spdlog::warn("[catalog] policy fetch failed ({} consecutive), serving stale snapshot "
                 "version='{}': {}",
                 status_.consecutive_failures,
                 cached_version_.value_or("none"), status_.last_error);
}
