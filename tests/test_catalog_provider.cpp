// ---------------------------------------------------------------------------
// test_catalog_provider.cpp
//
// CatalogProvider 단위 테스트.
//
// [테스트 범위]
// - 첫 사용 시 빌드, 같은 버전이면 같은 스냅샷 인스턴스 반환
// - 버전이 바뀌면 재구성
// - fetch 실패 시 stale 스냅샷 유지 + status 에 오류 기록
// - 최소 재로드 간격 안에서는 fetch 하지 않음, 변경 신호/invalidate 는 간격 무시
// - reload() 는 버전이 같아도 강제 재구성
// - async_ensure_fresh_snapshot 코루틴 경로
// - 재구성 중에도 읽는 스레드는 항상 일관된 스냅샷(버전과 도구 수가 맞음)을 본다
//
// [테스트 패턴]
// 스냅샷 동일성은 shared_ptr 주소 비교로 확인한다.
// ---------------------------------------------------------------------------

#include "catalog/catalog_provider.hpp"

#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

PolicyDocument document(std::string version, std::initializer_list<const char*> names) {
    PolicyDocument doc{};
    doc.source_version = std::move(version);
    for (const char* name : names) {
        PolicyEntry e{};
        e.tool_name      = name;
        e.route_template = "/api/" + std::string{name};
        doc.entries.push_back(e);
    }
    return doc;
}

// ScriptedPolicyProvider
//   미리 정한 결과를 순서대로 돌려준다. 마지막 결과는 계속 반복한다.
class ScriptedPolicyProvider final : public PolicyConfigProvider {
public:
    using Result = std::expected<DocumentPtr, std::string>;

    void push(PolicyDocument doc) {
        results_.emplace_back(std::make_shared<const PolicyDocument>(std::move(doc)));
    }
    void push_failure(std::string error) {
        results_.emplace_back(std::unexpected(std::move(error)));
    }

    Result get(const std::stop_token& /*stop*/) override {
        ++calls;
        Result result = results_.front();
        if (results_.size() > 1) {
            results_.pop_front();
        }
        return result;
    }

    int calls{0};

private:
    std::deque<Result> results_{};
};

CatalogProviderOptions no_throttle() {
    return CatalogProviderOptions{.min_reload_interval = std::chrono::milliseconds{0}};
}

} // namespace

TEST(CatalogProvider, InitialSnapshot_IsEmptyUntilFirstUse) {
    auto policy = std::make_shared<InMemoryPolicyProvider>(document("v1", {"a"}));
    CatalogProvider provider{policy, no_throttle()};

    EXPECT_EQ(provider.current_snapshot()->tool_count(), 0u);

    const auto snapshot = provider.ensure_fresh_snapshot();
    EXPECT_EQ(snapshot->tool_count(), 1u);
    EXPECT_EQ(provider.current_snapshot(), snapshot);
}

TEST(CatalogProvider, SameVersion_ReturnsSameInstance) {
    auto policy = std::make_shared<InMemoryPolicyProvider>(document("v1", {"a", "b"}));
    CatalogProvider provider{policy, no_throttle()};

    const auto first  = provider.ensure_fresh_snapshot();
    const auto second = provider.ensure_fresh_snapshot();

    EXPECT_EQ(first, second);
    EXPECT_EQ(provider.status().rebuild_count, 1u);
}

TEST(CatalogProvider, VersionChange_Rebuilds) {
    auto policy = std::make_shared<InMemoryPolicyProvider>(document("v1", {"a"}));
    CatalogProvider provider{policy, no_throttle()};

    const auto first = provider.ensure_fresh_snapshot();
    policy->update(document("v2", {"a", "b"}));
    const auto second = provider.ensure_fresh_snapshot();

    EXPECT_NE(first, second);
    EXPECT_EQ(second->tool_count(), 2u);
    EXPECT_EQ(second->source_version, "v2");
    EXPECT_EQ(provider.status().rebuild_count, 2u);
}

TEST(CatalogProvider, FetchFailure_KeepsStaleSnapshot) {
    auto policy = std::make_shared<ScriptedPolicyProvider>();
    policy->push(document("v1", {"a"}));
    policy->push_failure("disk on fire");

    CatalogProvider provider{policy, no_throttle()};

    const auto good  = provider.ensure_fresh_snapshot();
    const auto stale = provider.ensure_fresh_snapshot();

    EXPECT_EQ(good, stale);
    EXPECT_EQ(stale->source_version, "v1");

    const auto status = provider.status();
    EXPECT_EQ(status.last_error, "disk on fire");
    EXPECT_EQ(status.consecutive_failures, 1u);
    EXPECT_EQ(status.source_version, "v1");
}

TEST(CatalogProvider, FailureBeforeFirstBuild_ServesEmptySnapshot) {
    auto policy = std::make_shared<ScriptedPolicyProvider>();
    policy->push_failure("missing file");

    CatalogProvider provider{policy, no_throttle()};
    const auto snapshot = provider.ensure_fresh_snapshot();

    ASSERT_NE(snapshot, nullptr);
    EXPECT_EQ(snapshot->tool_count(), 0u);
    EXPECT_EQ(provider.status().consecutive_failures, 1u);
}

TEST(CatalogProvider, RecoveryAfterFailure_ClearsError) {
    auto policy = std::make_shared<ScriptedPolicyProvider>();
    policy->push_failure("transient");
    policy->push(document("v1", {"a"}));

    CatalogProvider provider{policy, no_throttle()};
    (void)provider.ensure_fresh_snapshot();
    const auto snapshot = provider.ensure_fresh_snapshot();

    EXPECT_EQ(snapshot->tool_count(), 1u);
    EXPECT_TRUE(provider.status().last_error.empty());
    EXPECT_EQ(provider.status().consecutive_failures, 0u);
}

TEST(CatalogProvider, WithinReloadInterval_DoesNotFetch) {
    auto policy = std::make_shared<ScriptedPolicyProvider>();
    policy->push(document("v1", {"a"}));

    CatalogProvider provider{policy, CatalogProviderOptions{.min_reload_interval = std::chrono::hours{1}}};
    (void)provider.ensure_fresh_snapshot();
    (void)provider.ensure_fresh_snapshot();
    (void)provider.ensure_fresh_snapshot();

    EXPECT_EQ(policy->calls, 1);
}

TEST(CatalogProvider, ChangeSignal_BypassesReloadInterval) {
    auto policy = std::make_shared<InMemoryPolicyProvider>(document("v1", {"a"}));
    CatalogProvider provider{policy, CatalogProviderOptions{.min_reload_interval = std::chrono::hours{1}}};

    (void)provider.ensure_fresh_snapshot();
    policy->update(document("v2", {"a", "b", "c"}));

    EXPECT_EQ(provider.ensure_fresh_snapshot()->tool_count(), 3u);
}

TEST(CatalogProvider, Invalidate_BypassesReloadInterval) {
    auto policy = std::make_shared<ScriptedPolicyProvider>();
    policy->push(document("v1", {"a"}));
    policy->push(document("v2", {"a", "b"}));

    CatalogProvider provider{policy, CatalogProviderOptions{.min_reload_interval = std::chrono::hours{1}}};
    (void)provider.ensure_fresh_snapshot();

    provider.invalidate();
    EXPECT_EQ(provider.ensure_fresh_snapshot()->source_version, "v2");
    EXPECT_EQ(policy->calls, 2);
}

TEST(CatalogProvider, Reload_ForcesRebuildOnSameVersion) {
    auto policy = std::make_shared<InMemoryPolicyProvider>(document("v1", {"a"}));
    CatalogProvider provider{policy, no_throttle()};

    const auto first  = provider.ensure_fresh_snapshot();
    const auto forced = provider.reload();

    ASSERT_TRUE(forced.has_value());
    EXPECT_NE(first, *forced);
    EXPECT_EQ(provider.status().rebuild_count, 2u);
}

TEST(CatalogProvider, Reload_FailureReturnsErrorAndKeepsSnapshot) {
    auto policy = std::make_shared<ScriptedPolicyProvider>();
    policy->push(document("v1", {"a"}));
    policy->push_failure("parse error");

    CatalogProvider provider{policy, no_throttle()};
    const auto good = provider.ensure_fresh_snapshot();

    const auto result = provider.reload();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), "parse error");
    EXPECT_EQ(provider.current_snapshot(), good);
}

TEST(CatalogProvider, SkippedEntries_ReportedInStatus) {
    PolicyDocument doc = document("v1", {"a", "a"});
    auto policy = std::make_shared<InMemoryPolicyProvider>(doc);
    CatalogProvider provider{policy, no_throttle()};

    (void)provider.ensure_fresh_snapshot();

    const auto status = provider.status();
    EXPECT_EQ(status.tool_count, 1u);
    ASSERT_EQ(status.last_skipped.size(), 1u);
    EXPECT_EQ(status.last_skipped[0].reason, "Duplicate tool name 'a'");
}

TEST(CatalogProvider, StopRequested_Throws) {
    auto policy = std::make_shared<InMemoryPolicyProvider>(document("v1", {"a"}));
    CatalogProvider provider{policy, no_throttle()};

    std::stop_source source;
    source.request_stop();
    EXPECT_THROW((void)provider.ensure_fresh_snapshot(source.get_token()), OperationCancelled);
}

TEST(CatalogProvider, NullPolicyProvider_IsRejected) {
    EXPECT_THROW(CatalogProvider(nullptr), std::invalid_argument);
}

TEST(CatalogProvider, AsyncEnsureFresh_ReturnsSnapshot) {
    auto policy   = std::make_shared<InMemoryPolicyProvider>(document("v1", {"a", "b"}));
    auto provider = std::make_shared<CatalogProvider>(policy, no_throttle());

    boost::asio::io_context ioc;
    auto future = boost::asio::co_spawn(ioc, provider->async_ensure_fresh_snapshot({}), boost::asio::use_future);
    ioc.run();

    const auto result = future.get();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)->tool_count(), 2u);
}

// ---------------------------------------------------------------------------
// ConcurrentReaders_SeeConsistentSnapshots
//   쓰는 스레드가 v1(도구 1개)/v2(도구 3개)를 번갈아 게시하는 동안 읽는 스레드들은
//   current_snapshot() 을 반복한다. 한 스냅샷 안에서 source_version 과 도구 수가
//   항상 짝이 맞아야 하고, 읽는 도중 도구 수가 바뀌어서도 안 된다.
// ---------------------------------------------------------------------------
TEST(CatalogProvider, ConcurrentReaders_SeeConsistentSnapshots) {
    constexpr int kReaders = 4;
    constexpr int kSwaps   = 500;

    auto policy = std::make_shared<InMemoryPolicyProvider>(document("v1", {"a"}));
    CatalogProvider provider{policy, no_throttle()};
    (void)provider.ensure_fresh_snapshot();

    std::atomic<bool>        done{false};
    std::atomic<int>         inconsistent{0};
    std::atomic<long>        reads{0};
    std::vector<std::thread> readers;
    readers.reserve(kReaders);

    for (int r = 0; r < kReaders; ++r) {
        readers.emplace_back([&]() {
            while (!done.load(std::memory_order_acquire)) {
                const auto snapshot = provider.current_snapshot();
                const auto before   = snapshot->tool_count();
                const auto walked   = static_cast<std::size_t>(
                    std::distance(snapshot->tools.begin(), snapshot->tools.end()));
                const auto expected = snapshot->source_version == "v1" ? 1u
                                    : snapshot->source_version == "v2" ? 3u
                                                                       : 0u;
                if (expected == 0u || before != expected || walked != expected ||
                    snapshot->tool_count() != before) {
                    inconsistent.fetch_add(1, std::memory_order_relaxed);
                }
                reads.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }

    while (reads.load(std::memory_order_relaxed) == 0) {
        std::this_thread::yield();
    }

    for (int i = 0; i < kSwaps; ++i) {
        if (i % 2 == 0) {
            policy->update(document("v2", {"a", "b", "c"}));
        } else {
            policy->update(document("v1", {"a"}));
        }
        const auto published = provider.ensure_fresh_snapshot();
        EXPECT_EQ(published->source_version, i % 2 == 0 ? "v2" : "v1");
    }

    done.store(true, std::memory_order_release);
    for (auto& reader : readers) {
        reader.join();
    }

    EXPECT_EQ(inconsistent.load(), 0);
    EXPECT_GT(reads.load(), 0);
    EXPECT_EQ(provider.status().rebuild_count, static_cast<std::uint64_t>(kSwaps + 1));
}
