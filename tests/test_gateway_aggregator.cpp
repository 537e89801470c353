// ---------------------------------------------------------------------------
// test_gateway_aggregator.cpp
//
// GatewayAggregator 단위 테스트.
//
// [테스트 범위]
// - 업스트림 병합: namespace_prefix 적용, UpstreamRoute 기록
// - 이름 충돌 시 설정상 먼저 나열된 업스트림이 이김
// - 조회 실패 시 last-known-good 유지 (serving_stale, Unhealthy)
// - 진행 중인 refresh 가 있으면 두 번째 요청은 즉시 버려짐
// - 업스트림별 deadline 초과 → "timed out"
// - 비활성 업스트림은 조회하지 않음
// - 게이트웨이 필터, reload_options, run 루프 종료
//
// [테스트 패턴]
// FakeSource 를 UpstreamSourceFactory 로 주입한다. 코루틴은
// co_spawn + use_future + io_context::run() 으로 끝까지 돌린다.
// ---------------------------------------------------------------------------

#include "gateway/gateway_aggregator.hpp"

#include "common/types.hpp"

#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <deque>
#include <initializer_list>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace asio = boost::asio;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<const CatalogSnapshot> snapshot_of(std::string version,
                                                   std::initializer_list<const char*> names) {
    auto snapshot            = std::make_shared<CatalogSnapshot>();
    snapshot->source_version = std::move(version);
    snapshot->created_at     = std::chrono::system_clock::now();
    for (const char* name : names) {
        ToolDescriptor tool{};
        tool.tool_name    = name;
        tool.description  = std::string{"tool "} + name;
        tool.input_schema = default_input_schema();
        snapshot->tools.emplace(name, std::move(tool));
    }
    return snapshot;
}

// FakeSource
//   미리 정한 결과를 순서대로 돌려준다 (마지막 결과는 반복).
//   delay 동안 stop_token 을 존중하며 대기한다.
class FakeSource final : public CatalogSource {
public:
    void push(std::shared_ptr<const CatalogSnapshot> snapshot) { results_.emplace_back(std::move(snapshot)); }
    void push_failure(std::string error) { results_.emplace_back(std::unexpected(std::move(error))); }

    asio::awaitable<FetchResult> async_ensure_fresh_snapshot(std::stop_token stop) override {
        ++calls;
        if (delay > 0ms) {
            auto executor = co_await asio::this_coro::executor;
            asio::steady_timer timer{executor, delay};
            std::stop_callback cancel{stop, [&timer]() { timer.cancel(); }};

            boost::system::error_code ec;
            co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
            if (stop.stop_requested()) {
                throw OperationCancelled{};
            }
        }
        if (throw_error) {
            throw std::runtime_error("upstream exploded");
        }
        if (results_.empty()) {
            co_return std::unexpected(std::string{"no scripted result"});
        }
        FetchResult result = results_.front();
        if (results_.size() > 1) {
            results_.pop_front();
        }
        co_return result;
    }

    [[nodiscard]] SnapshotPtr current_snapshot() const override { return CatalogSnapshot::empty(); }

    std::chrono::milliseconds delay{0};
    bool                      throw_error{false};
    int                       calls{0};

private:
    std::deque<FetchResult> results_{};
};

class GatewayAggregatorTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeSource> source(const std::string& name) {
        auto& slot = sources_[name];
        if (!slot) {
            slot = std::make_shared<FakeSource>();
        }
        return slot;
    }

    UpstreamSourceFactory factory() {
        return [this](const UpstreamConfig& cfg) -> std::shared_ptr<CatalogSource> {
            return source(cfg.name);
        };
    }

    std::unique_ptr<GatewayAggregator> make(GatewayOptions options) {
        return std::make_unique<GatewayAggregator>(ioc_.get_executor(), std::move(options), factory());
    }

    template <typename T>
    T run(asio::awaitable<T> task) {
        auto future = asio::co_spawn(ioc_, std::move(task), asio::use_future);
        ioc_.run();
        ioc_.restart();
        return future.get();
    }

    static UpstreamConfig upstream(std::string name, std::string prefix = {}) {
        UpstreamConfig cfg{};
        cfg.name             = std::move(name);
        cfg.mcp_endpoint     = "http://127.0.0.1:9000/mcp";
        cfg.namespace_prefix = std::move(prefix);
        return cfg;
    }

    asio::io_context ioc_;

private:
    std::map<std::string, std::shared_ptr<FakeSource>> sources_{};
};

const UpstreamStatus* find_status(const GatewaySnapshot& state, std::string_view name) {
    for (const auto& status : state.upstreams) {
        if (status.name == name) {
            return &status;
        }
    }
    return nullptr;
}

} // namespace

TEST_F(GatewayAggregatorTest, InitialState_ListsUpstreamsAsUnknown) {
    GatewayOptions options{};
    options.upstreams = {upstream("weather"), upstream("search")};
    auto aggregator   = make(options);

    const auto state = aggregator->current_state();
    EXPECT_EQ(state->catalog->tool_count(), 0u);
    ASSERT_EQ(state->upstreams.size(), 2u);
    EXPECT_EQ(state->upstreams[0].health, UpstreamHealth::kUnknown);
    EXPECT_EQ(aggregator->completed_refreshes(), 0u);
}

TEST_F(GatewayAggregatorTest, Refresh_MergesWithNamespacePrefix) {
    source("weather")->push(snapshot_of("w1", {"forecast", "alerts"}));
    source("search")->push(snapshot_of("s1", {"query"}));

    GatewayOptions options{};
    options.upstreams = {upstream("weather", "weather"), upstream("search")};
    auto aggregator   = make(options);

    ASSERT_TRUE(run(aggregator->refresh({})));

    const auto catalog = aggregator->current_snapshot();
    EXPECT_EQ(catalog->tool_count(), 3u);
    EXPECT_EQ(catalog->upstream_count, 2u);
    EXPECT_EQ(catalog->healthy_upstream_count, 2u);
    EXPECT_TRUE(catalog->validate().has_value());

    const auto* forecast = catalog->find("weather.forecast");
    ASSERT_NE(forecast, nullptr);
    ASSERT_TRUE(forecast->upstream.has_value());
    EXPECT_EQ(forecast->upstream->upstream_name, "weather");
    EXPECT_EQ(forecast->upstream->upstream_tool_name, "forecast");
    EXPECT_NE(catalog->find("query"), nullptr);
    EXPECT_EQ(catalog->find("forecast"), nullptr);

    const auto* status = find_status(*aggregator->current_state(), "weather");
    ASSERT_NE(status, nullptr);
    EXPECT_TRUE(status->healthy());
    EXPECT_EQ(status->tool_count, 2u);
    EXPECT_EQ(aggregator->completed_refreshes(), 1u);
}

TEST_F(GatewayAggregatorTest, NameCollision_FirstConfiguredUpstreamWins) {
    source("primary")->push(snapshot_of("p1", {"lookup"}));
    source("secondary")->push(snapshot_of("s1", {"lookup", "extra"}));

    GatewayOptions options{};
    options.upstreams = {upstream("primary"), upstream("secondary")};
    auto aggregator   = make(options);
    ASSERT_TRUE(run(aggregator->refresh({})));

    const auto catalog = aggregator->current_snapshot();
    EXPECT_EQ(catalog->tool_count(), 2u);
    EXPECT_EQ(catalog->find("lookup")->upstream->upstream_name, "primary");

    // 순서를 바꾸면 우선순위도 바뀐다.
    options.upstreams = {upstream("secondary"), upstream("primary")};
    aggregator->reload_options(options);
    ASSERT_TRUE(run(aggregator->refresh({})));
    EXPECT_EQ(aggregator->current_snapshot()->find("lookup")->upstream->upstream_name, "secondary");
}

TEST_F(GatewayAggregatorTest, FailedUpstream_KeepsLastKnownGood) {
    auto weather = source("weather");
    weather->push(snapshot_of("w1", {"forecast"}));
    weather->push_failure("connection refused");

    GatewayOptions options{};
    options.upstreams = {upstream("weather")};
    auto aggregator   = make(options);

    ASSERT_TRUE(run(aggregator->refresh({})));
    ASSERT_TRUE(run(aggregator->refresh({})));

    const auto state = aggregator->current_state();
    EXPECT_NE(state->catalog->find("forecast"), nullptr);
    EXPECT_EQ(state->catalog->healthy_upstream_count, 0u);

    const auto* status = find_status(*state, "weather");
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->health, UpstreamHealth::kUnhealthy);
    EXPECT_TRUE(status->serving_stale);
    EXPECT_EQ(status->consecutive_failures, 1u);
    EXPECT_EQ(status->last_error, "connection refused");
    EXPECT_TRUE(status->last_success.has_value());
}

TEST_F(GatewayAggregatorTest, FailureWithoutHistory_ContributesNoTools) {
    source("broken")->push_failure("dns failure");
    source("ok")->push(snapshot_of("o1", {"ping"}));

    GatewayOptions options{};
    options.upstreams = {upstream("broken"), upstream("ok")};
    auto aggregator   = make(options);
    ASSERT_TRUE(run(aggregator->refresh({})));

    const auto state = aggregator->current_state();
    EXPECT_EQ(state->catalog->tool_count(), 1u);
    EXPECT_EQ(state->catalog->upstream_count, 2u);
    EXPECT_EQ(state->catalog->healthy_upstream_count, 1u);

    const auto* broken = find_status(*state, "broken");
    ASSERT_NE(broken, nullptr);
    EXPECT_EQ(broken->health, UpstreamHealth::kUnhealthy);
    EXPECT_FALSE(broken->serving_stale);
}

TEST_F(GatewayAggregatorTest, ThrowingUpstream_IsIsolated) {
    source("bad")->throw_error = true;
    source("good")->push(snapshot_of("g1", {"ping"}));

    GatewayOptions options{};
    options.upstreams = {upstream("bad"), upstream("good")};
    auto aggregator   = make(options);
    ASSERT_TRUE(run(aggregator->refresh({})));

    const auto state = aggregator->current_state();
    EXPECT_NE(state->catalog->find("ping"), nullptr);
    const auto* bad = find_status(*state, "bad");
    ASSERT_NE(bad, nullptr);
    EXPECT_NE(bad->last_error.find("upstream exploded"), std::string::npos);
}

TEST_F(GatewayAggregatorTest, ConcurrentRefresh_SecondRequestIsDropped) {
    auto slow   = source("slow");
    slow->delay = 50ms;
    slow->push(snapshot_of("s1", {"tool"}));

    GatewayOptions options{};
    options.upstreams = {upstream("slow")};
    auto aggregator   = make(options);

    auto first  = asio::co_spawn(ioc_, aggregator->refresh({}), asio::use_future);
    auto second = asio::co_spawn(ioc_, aggregator->refresh({}), asio::use_future);
    ioc_.run();

    EXPECT_TRUE(first.get());
    EXPECT_FALSE(second.get());
    EXPECT_EQ(slow->calls, 1);
    EXPECT_EQ(aggregator->skipped_refreshes(), 1u);
    EXPECT_EQ(aggregator->completed_refreshes(), 1u);
    EXPECT_FALSE(aggregator->refresh_in_progress());
}

TEST_F(GatewayAggregatorTest, UpstreamsAreFetchedInParallel) {
    for (const char* name : {"a", "b", "c"}) {
        auto s   = source(name);
        s->delay = 150ms;
        s->push(snapshot_of(name, {name}));
    }

    GatewayOptions options{};
    options.upstreams = {upstream("a"), upstream("b"), upstream("c")};
    auto aggregator   = make(options);

    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(run(aggregator->refresh({})));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(aggregator->current_snapshot()->tool_count(), 3u);
    EXPECT_LT(elapsed, 400ms);
}

TEST_F(GatewayAggregatorTest, SlowUpstream_TimesOut) {
    auto slow   = source("slow");
    slow->delay = 5s;
    slow->push(snapshot_of("s1", {"tool"}));

    auto cfg            = upstream("slow");
    cfg.request_timeout = 30ms;
    GatewayOptions options{};
    options.upstreams = {cfg};
    auto aggregator   = make(options);

    ASSERT_TRUE(run(aggregator->refresh({})));

    const auto* status = find_status(*aggregator->current_state(), "slow");
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->health, UpstreamHealth::kUnhealthy);
    EXPECT_NE(status->last_error.find("timed out"), std::string::npos);
}

TEST_F(GatewayAggregatorTest, DisabledUpstream_IsNotFetched) {
    auto off = source("off");
    off->push(snapshot_of("x", {"hidden"}));

    auto cfg    = upstream("off");
    cfg.enabled = false;
    GatewayOptions options{};
    options.upstreams = {cfg};
    auto aggregator   = make(options);

    ASSERT_TRUE(run(aggregator->refresh({})));

    EXPECT_EQ(off->calls, 0);
    const auto state = aggregator->current_state();
    EXPECT_EQ(state->catalog->tool_count(), 0u);
    EXPECT_EQ(state->catalog->upstream_count, 0u);
    ASSERT_EQ(state->upstreams.size(), 1u);
    EXPECT_FALSE(state->upstreams[0].enabled);
}

TEST_F(GatewayAggregatorTest, ToolFilter_HidesDeniedTools) {
    source("ops")->push(snapshot_of("o1", {"status", "admin_reset"}));

    GatewayOptions options{};
    options.upstreams    = {upstream("ops", "ops")};
    options.denied_tools = {"*.admin_*"};
    auto aggregator      = make(options);
    ASSERT_TRUE(run(aggregator->refresh({})));

    const auto catalog = aggregator->current_snapshot();
    EXPECT_NE(catalog->find("ops.status"), nullptr);
    EXPECT_EQ(catalog->find("ops.admin_reset"), nullptr);
}

TEST_F(GatewayAggregatorTest, ReloadOptions_AppliesOnNextCycle) {
    source("a")->push(snapshot_of("a1", {"one"}));
    source("b")->push(snapshot_of("b1", {"two"}));

    GatewayOptions options{};
    options.upstreams = {upstream("a")};
    auto aggregator   = make(options);
    ASSERT_TRUE(run(aggregator->refresh({})));
    EXPECT_EQ(aggregator->current_snapshot()->tool_count(), 1u);

    options.upstreams        = {upstream("a"), upstream("b")};
    options.refresh_interval = 10s;
    aggregator->reload_options(options);
    EXPECT_EQ(aggregator->options().refresh_interval, 10s);

    ASSERT_TRUE(run(aggregator->refresh({})));
    EXPECT_EQ(aggregator->current_snapshot()->tool_count(), 2u);

    // 설정에서 빠진 업스트림은 다음 사이클에서 사라진다.
    options.upstreams = {upstream("b")};
    aggregator->reload_options(options);
    ASSERT_TRUE(run(aggregator->refresh({})));
    EXPECT_EQ(aggregator->current_snapshot()->find("one"), nullptr);
    EXPECT_EQ(aggregator->current_state()->upstreams.size(), 1u);
}

TEST_F(GatewayAggregatorTest, StopRequested_DoesNotPublish) {
    source("a")->push(snapshot_of("a1", {"one"}));

    GatewayOptions options{};
    options.upstreams = {upstream("a")};
    auto aggregator   = make(options);

    std::stop_source stop;
    stop.request_stop();
    EXPECT_FALSE(run(aggregator->refresh(stop.get_token())));
    EXPECT_EQ(aggregator->current_snapshot()->tool_count(), 0u);
    EXPECT_EQ(aggregator->completed_refreshes(), 0u);
}

TEST_F(GatewayAggregatorTest, EnsureFresh_RefreshesOnFirstUse) {
    source("a")->push(snapshot_of("a1", {"one"}));

    GatewayOptions options{};
    options.upstreams = {upstream("a")};
    auto aggregator   = make(options);

    const auto result = run(aggregator->async_ensure_fresh_snapshot({}));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)->tool_count(), 1u);

    // refresh_interval 안에서는 다시 조회하지 않는다.
    (void)run(aggregator->async_ensure_fresh_snapshot({}));
    EXPECT_EQ(source("a")->calls, 1);
}

TEST_F(GatewayAggregatorTest, RunLoop_RefreshesUntilStopped) {
    source("a")->push(snapshot_of("a1", {"one"}));

    GatewayOptions options{};
    options.upstreams        = {upstream("a")};
    options.refresh_interval = 20ms;
    auto aggregator          = make(options);

    auto loop = asio::co_spawn(ioc_, aggregator->run({}), asio::use_future);

    asio::steady_timer stopper{ioc_, 150ms};
    stopper.async_wait([&aggregator](const boost::system::error_code&) { aggregator->stop(); });

    ioc_.run();
    loop.get();

    EXPECT_GE(aggregator->completed_refreshes(), 2u);
    EXPECT_NE(aggregator->current_snapshot()->find("one"), nullptr);
}

TEST(UpstreamHealth, ToString) {
    EXPECT_STREQ(to_string(UpstreamHealth::kUnknown), "unknown");
    EXPECT_STREQ(to_string(UpstreamHealth::kHealthy), "healthy");
    EXPECT_STREQ(to_string(UpstreamHealth::kUnhealthy), "unhealthy");
}
