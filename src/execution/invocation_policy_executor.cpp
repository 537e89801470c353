#include "execution/invocation_policy_executor.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace asio = boost::asio;

namespace {

// 코루틴 프레임이 끝날 때(예외 포함) 슬롯을 반납한다.
class SlotGuard {
public:
    explicit SlotGuard(std::shared_ptr<ConcurrencyGate> gate)
        : gate_{std::move(gate)}
    {}
    ~SlotGuard() {
        if (gate_) {
            gate_->release();
        }
    }

    SlotGuard(const SlotGuard&)            = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    std::shared_ptr<ConcurrencyGate> gate_;
};

}  // namespace

// ---------------------------------------------------------------------------
// ConcurrencyGate
// ---------------------------------------------------------------------------
ConcurrencyGate::ConcurrencyGate(std::uint32_t limit)
    : limit_{limit}
{
    if (limit_ == 0) {
        throw std::invalid_argument("ConcurrencyGate: limit must be positive");
    }
}

asio::awaitable<bool> ConcurrencyGate::acquire(std::chrono::milliseconds max_wait, std::stop_token stop) {
    if (stop.stop_requested()) {
        co_return false;
    }

    auto executor = co_await asio::this_coro::executor;
    auto waiter   = std::make_shared<Waiter>();
    {
        std::lock_guard lock{mutex_};
        if (in_use_ < limit_ && waiters_.empty()) {
            ++in_use_;
            co_return true;
        }
        waiter->timer = std::make_shared<asio::steady_timer>(executor, max_wait);
        waiters_.push_back(waiter);
    }

    std::stop_callback on_stop{stop, [executor, timer = waiter->timer]() {
        asio::post(executor, [timer]() { timer->cancel(); });
    }};

    boost::system::error_code ec;
    co_await waiter->timer->async_wait(asio::redirect_error(asio::use_awaitable, ec));

    bool granted = false;
    {
        std::lock_guard lock{mutex_};
        granted = waiter->granted;
        if (!granted) {
            std::erase(waiters_, waiter);
        }
    }
    if (granted && stop.stop_requested()) {
        release();
        co_return false;
    }
    co_return granted;
}

void ConcurrencyGate::release() {
    std::shared_ptr<Waiter> next;
    {
        std::lock_guard lock{mutex_};
        if (waiters_.empty()) {
            if (in_use_ > 0) {
                --in_use_;
            }
            return;
        }
        // 슬롯을 그대로 넘긴다. in_use_ 는 변하지 않는다.
        next = waiters_.front();
        waiters_.pop_front();
        next->granted = true;
    }
    auto timer = next->timer;
    asio::post(timer->get_executor(), [timer]() { timer->cancel(); });
}

std::uint32_t ConcurrencyGate::in_use() const {
    std::lock_guard lock{mutex_};
    return in_use_;
}

std::size_t ConcurrencyGate::waiting() const {
    std::lock_guard lock{mutex_};
    return waiters_.size();
}

// ---------------------------------------------------------------------------
// RateLimiter
// ---------------------------------------------------------------------------
RateLimiter::RateLimiter(RateLimitPolicy policy, Clock::time_point now)
    : policy_{policy}
    , window_start_{now}
    , tokens_{policy.permit_limit}
{}

bool RateLimiter::try_acquire(Clock::time_point now) {
    std::lock_guard lock{mutex_};

    if (policy_.strategy == RateLimitStrategy::kTokenBucket) {
        const auto period = std::chrono::milliseconds{std::max<std::uint32_t>(policy_.refill_period_ms, 1)};
        if (now > window_start_) {
            const auto periods = (now - window_start_) / period;
            if (periods > 0) {
                const auto refill = static_cast<std::uint64_t>(periods) * policy_.tokens_per_period;
                tokens_ = static_cast<std::uint32_t>(
                    std::min<std::uint64_t>(policy_.permit_limit, tokens_ + refill));
                window_start_ += period * periods;
            }
        }
        if (tokens_ == 0) {
            return false;
        }
        --tokens_;
        return true;
    }

    const auto window = std::chrono::milliseconds{std::max<std::uint32_t>(policy_.window_ms, 1)};
    if (now - window_start_ >= window) {
        window_start_ += window * ((now - window_start_) / window);
        used_ = 0;
    }
    if (used_ >= policy_.permit_limit) {
        return false;
    }
    ++used_;
    return true;
}

// ---------------------------------------------------------------------------
// InvocationPolicyExecutor
// ---------------------------------------------------------------------------
InvocationPolicyExecutor::InvocationPolicyExecutor(std::shared_ptr<ToolExecutor> inner,
                                                   InvocationPolicyOptions       options)
    : inner_{std::move(inner)}
    , options_{options}
{
    if (!inner_) {
        throw std::invalid_argument("InvocationPolicyExecutor: inner executor must not be null");
    }
}

std::shared_ptr<ConcurrencyGate>
InvocationPolicyExecutor::gate_for(const std::string& tool_name, std::uint32_t limit) {
    std::lock_guard lock{mutex_};
    auto& gate = gates_[tool_name];
    if (!gate || gate->limit() != limit) {
        gate = std::make_shared<ConcurrencyGate>(limit);
    }
    return gate;
}

std::shared_ptr<RateLimiter>
InvocationPolicyExecutor::limiter_for(const std::string& tool_name, const RateLimitPolicy& policy) {
    std::lock_guard lock{mutex_};
    auto& limiter = limiters_[tool_name];
    if (!limiter || limiter->policy() != policy) {
        limiter = std::make_shared<RateLimiter>(policy);
    }
    return limiter;
}

asio::awaitable<ToolResult>
InvocationPolicyExecutor::async_execute(const ToolDescriptor& tool,
                                        const nlohmann::json& arguments,
                                        const CallContext&    context,
                                        std::stop_token       stop) {
    if (!tool.effective_policy) {
        co_return co_await inner_->async_execute(tool, arguments, context, std::move(stop));
    }
    const auto& policy = *tool.effective_policy;

    std::shared_ptr<ConcurrencyGate> held;
    if (policy.concurrency_limit && *policy.concurrency_limit > 0) {
        auto gate = gate_for(tool.tool_name, *policy.concurrency_limit);
        if (!co_await gate->acquire(options_.max_queue_wait, stop)) {
            if (stop.stop_requested()) {
                co_return ToolResult::failure("CANCELLED", "Tool execution was cancelled by client.", true);
            }
            spdlog::warn("[policy] tool '{}' concurrency slot not acquired within {}ms (limit {})",
                         tool.tool_name, options_.max_queue_wait.count(), gate->limit());
            co_return ToolResult::failure(
                "CONCURRENCY_LIMIT",
                fmt::format("Failed to acquire concurrency slot for tool '{}' within {}ms.",
                            tool.tool_name, options_.max_queue_wait.count()),
                true);
        }
        held = std::move(gate);
    }
    SlotGuard slot{std::move(held)};

    if (policy.rate_limit) {
        auto limiter = limiter_for(tool.tool_name, *policy.rate_limit);
        if (!limiter->try_acquire()) {
            spdlog::warn("[policy] tool '{}' rate limit exceeded (request {})", tool.tool_name, context.request_id);
            co_return ToolResult::failure(
                "RATE_LIMITED",
                fmt::format("Rate limit exceeded for tool '{}'. Please retry later.", tool.tool_name),
                true);
        }
    }

    co_return co_await inner_->async_execute(tool, arguments, context, std::move(stop));
}
