#pragma once

// ---------------------------------------------------------------------------
// invocation_policy_executor.hpp
//
// 정책 항목의 실행 제한(concurrency_limit, rate_limit)을 적용한 뒤 내부
// 실행기로 넘기는 래퍼.
//
// [동작]
// 1. concurrency_limit : 도구별 슬롯. 슬롯이 없으면 max_queue_wait 까지
//                        대기하고, 그래도 없으면 CONCURRENCY_LIMIT 실패.
// 2. rate_limit        : 도구별 한도. 초과하면 즉시 RATE_LIMITED 실패.
// 3. 내부 실행기 호출. 슬롯은 호출이 끝나면 반납한다.
//
// 거부도 다른 실행 실패처럼 ToolResult{success=false} 이므로 handler 는
// isError:true 결과로 응답한다. effective_policy 가 없는 도구(게이트웨이
// 도구 등)는 그대로 통과한다.
//
// [알려진 한계]
// - 도구별 상태는 정책이 바뀌면(한도 값 변경) 새로 만든다. 바뀌기 전에 잡힌
//   슬롯은 이전 상태에 반납된다.
// - rate_limit 은 대기열이 없다.
// ---------------------------------------------------------------------------

#include "execution/tool_executor.hpp"
#include "policy/policy_document.hpp"

#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// ---------------------------------------------------------------------------
// ConcurrencyGate
//   코루틴용 계수 세마포어. 대기자는 steady_timer 하나씩을 갖고, release()
//   가 맨 앞 대기자에게 슬롯을 넘긴 뒤 그 타이머를 깨운다.
// ---------------------------------------------------------------------------
class ConcurrencyGate {
public:
    explicit ConcurrencyGate(std::uint32_t limit);

    ConcurrencyGate(const ConcurrencyGate&)            = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    // acquire
    //   슬롯을 얻으면 true. max_wait 초과 또는 stop 요청이면 false.
    boost::asio::awaitable<bool> acquire(std::chrono::milliseconds max_wait, std::stop_token stop);
    void release();

    [[nodiscard]] std::uint32_t limit() const noexcept { return limit_; }
    [[nodiscard]] std::uint32_t in_use() const;
    [[nodiscard]] std::size_t   waiting() const;

private:
    struct Waiter {
        std::shared_ptr<boost::asio::steady_timer> timer{};
        bool                                       granted{false};
    };

    const std::uint32_t                  limit_;
    mutable std::mutex                   mutex_;
    std::uint32_t                        in_use_{0};
    std::deque<std::shared_ptr<Waiter>>  waiters_{};
};

// ---------------------------------------------------------------------------
// RateLimiter
//   fixed window 또는 token bucket. 시각을 인자로 받아 테스트에서 시간을
//   직접 진행시킬 수 있다. token bucket 은 가득 찬 상태로 시작한다.
// ---------------------------------------------------------------------------
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(RateLimitPolicy policy, Clock::time_point now = Clock::now());

    RateLimiter(const RateLimiter&)            = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    [[nodiscard]] bool try_acquire(Clock::time_point now = Clock::now());

    [[nodiscard]] const RateLimitPolicy& policy() const noexcept { return policy_; }

private:
    const RateLimitPolicy policy_;
    std::mutex            mutex_;
    Clock::time_point     window_start_;
    std::uint32_t         used_{0};
    std::uint32_t         tokens_{0};
};

struct InvocationPolicyOptions {
    std::chrono::milliseconds max_queue_wait{std::chrono::seconds{30}};
};

class InvocationPolicyExecutor final : public ToolExecutor {
public:
    explicit InvocationPolicyExecutor(std::shared_ptr<ToolExecutor> inner,
                                      InvocationPolicyOptions       options = {});

    boost::asio::awaitable<ToolResult>
    async_execute(const ToolDescriptor& tool,
                  const nlohmann::json& arguments,
                  const CallContext&    context,
                  std::stop_token       stop) override;

private:
    std::shared_ptr<ToolExecutor> inner_;
    InvocationPolicyOptions       options_;

    std::mutex                                                        mutex_;
    std::unordered_map<std::string, std::shared_ptr<ConcurrencyGate>> gates_{};
    std::unordered_map<std::string, std::shared_ptr<RateLimiter>>     limiters_{};

    [[nodiscard]] std::shared_ptr<ConcurrencyGate> gate_for(const std::string& tool_name, std::uint32_t limit);
    [[nodiscard]] std::shared_ptr<RateLimiter>     limiter_for(const std::string&     tool_name,
                                                               const RateLimitPolicy& policy);
};
