#pragma once

// ---------------------------------------------------------------------------
// rpc_stats.hpp
//
// JSON-RPC 처리 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_request / on_error / on_parse_error / on_tool_call:
//   stdio 루프와 HTTP 세션 코루틴에서 concurrent 호출 안전 (atomic 사용).
// - snapshot():
//   관리 소켓/진단 경로에서 호출. 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 갱신 실패가 요청 처리 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// RpcStatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   rps               : 시작 이후 평균 초당 요청 수
//   tool_failure_rate : tool_failures / tool_calls (tool_calls == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct RpcStatsSnapshot {
    std::uint64_t                         total_requests{0};
    std::uint64_t                         error_responses{0};
    std::uint64_t                         parse_errors{0};
    std::uint64_t                         notifications{0};
    std::uint64_t                         tool_calls{0};
    std::uint64_t                         tool_failures{0};
    double                                rps{0.0};
    double                                tool_failure_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class RpcStats {
public:
    RpcStats() noexcept
        : started_at_{std::chrono::system_clock::now()}
    {}

    ~RpcStats() = default;

    RpcStats(const RpcStats&)            = delete;
    RpcStats& operator=(const RpcStats&) = delete;
    RpcStats(RpcStats&&)                 = delete;
    RpcStats& operator=(RpcStats&&)      = delete;

    void on_request() noexcept { total_requests_.fetch_add(1, std::memory_order_relaxed); }

    // on_error
    //   JSON-RPC error 응답을 보냈을 때 (-32700 포함).
    void on_error() noexcept { error_responses_.fetch_add(1, std::memory_order_relaxed); }

    void on_parse_error() noexcept { parse_errors_.fetch_add(1, std::memory_order_relaxed); }

    void on_notification() noexcept { notifications_.fetch_add(1, std::memory_order_relaxed); }

    // on_tool_call
    //   실행기 호출 완료 시. failed: isError:true 로 응답한 경우
    void on_tool_call(bool failed) noexcept {
        tool_calls_.fetch_add(1, std::memory_order_relaxed);
        if (failed) {
            tool_failures_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] RpcStatsSnapshot snapshot() const noexcept {
        const auto now      = std::chrono::system_clock::now();
        const auto requests = total_requests_.load(std::memory_order_relaxed);
        const auto calls    = tool_calls_.load(std::memory_order_relaxed);
        const auto failures = tool_failures_.load(std::memory_order_relaxed);

        const double elapsed_sec = std::chrono::duration<double>(now - started_at_).count();

        double rps = 0.0;
        if (elapsed_sec > 0.0) {
            rps = static_cast<double>(requests) / elapsed_sec;
        }

        double failure_rate = 0.0;
        if (calls > 0) {
            failure_rate = static_cast<double>(failures) / static_cast<double>(calls);
        }

        return RpcStatsSnapshot{
            .total_requests    = requests,
            .error_responses   = error_responses_.load(std::memory_order_relaxed),
            .parse_errors      = parse_errors_.load(std::memory_order_relaxed),
            .notifications     = notifications_.load(std::memory_order_relaxed),
            .tool_calls        = calls,
            .tool_failures     = failures,
            .rps               = rps,
            .tool_failure_rate = failure_rate,
            .captured_at       = now,
        };
    }

private:
    std::atomic<std::uint64_t>                  total_requests_{0};
    std::atomic<std::uint64_t>                  error_responses_{0};
    std::atomic<std::uint64_t>                  parse_errors_{0};
    std::atomic<std::uint64_t>                  notifications_{0};
    std::atomic<std::uint64_t>                  tool_calls_{0};
    std::atomic<std::uint64_t>                  tool_failures_{0};
    const std::chrono::system_clock::time_point started_at_;
};
