#pragma once

// ---------------------------------------------------------------------------
// rule_engine.hpp
//
// 순서가 정해진 predicate + action 규칙을 하나의 가변 컨텍스트에 대해
// 실행하는 범용 규칙 엔진 (헤더 전용 템플릿).
//
// [실행 규약]
// - 규칙은 order 오름차순으로 실행된다. 생성 시 한 번만 정렬한다.
// - order 가 같으면 등록 순서를 유지한다 (std::stable_sort).
// - is_match(ctx) == false 인 규칙은 apply 하지 않고 건너뛴다.
// - apply 가 던진 예외는 남은 규칙을 중단하고 그대로 호출자에게 전파된다.
//   (래핑/삼킴 금지)
// - 각 규칙 실행 전에 stop_token 을 확인하고, 취소 요청 시
//   OperationCancelled 를 던진다. 전파 경로는 일반 예외와 동일하다.
//
// [결정성]
// 같은 규칙 집합과 같은 컨텍스트에 대해 항상 같은 순서, 같은 결과를 낸다.
// 규칙 목록은 생성 후 불변이므로 execute() 는 concurrent 호출에 안전하다
// (컨텍스트는 호출자별로 분리되어 있어야 한다).
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // OperationCancelled

#include <algorithm>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Rule
//   order    : 실행 순서 (작을수록 먼저)
//   name     : 진단/로그용 식별자
//   is_match : 비어 있으면 항상 일치로 간주
//   apply    : 필수. 비어 있으면 RuleEngine 생성 시 std::invalid_argument
// ---------------------------------------------------------------------------
template <typename Context>
struct Rule {
    std::int32_t                        order{0};
    std::string                         name{};
    std::function<bool(const Context&)> is_match{};
    std::function<void(Context&)>       apply{};
};

// ---------------------------------------------------------------------------
// RuleEngine
// ---------------------------------------------------------------------------
template <typename Context>
class RuleEngine {
public:
    explicit RuleEngine(std::vector<Rule<Context>> rules)
        : rules_{std::move(rules)}
    {
        for (const auto& rule : rules_) {
            if (!rule.apply) {
                throw std::invalid_argument("rule '" + rule.name + "' has no apply action");
            }
        }
        std::stable_sort(rules_.begin(), rules_.end(),
                         [](const Rule<Context>& lhs, const Rule<Context>& rhs) {
                             return lhs.order < rhs.order;
                         });
    }

    ~RuleEngine() = default;

    RuleEngine(const RuleEngine&)            = default;
    RuleEngine& operator=(const RuleEngine&) = default;
    RuleEngine(RuleEngine&&)                 = default;
    RuleEngine& operator=(RuleEngine&&)      = default;

    // execute
    //   ctx 에 대해 정렬된 규칙을 순서대로 실행한다.
    //   예외: apply 가 던진 예외 그대로, 또는 취소 시 OperationCancelled.
    void execute(Context& ctx, const std::stop_token& stop = {}) const {
        for (const auto& rule : rules_) {
            if (stop.stop_requested()) {
                throw OperationCancelled{};
            }
            if (rule.is_match && !rule.is_match(ctx)) {
                continue;
            }
            rule.apply(ctx);
        }
    }

    // rules
    //   정렬이 끝난 실행 순서 그대로의 규칙 목록 (진단/테스트용).
    [[nodiscard]] const std::vector<Rule<Context>>& rules() const noexcept {
        return rules_;
    }

private:
    std::vector<Rule<Context>> rules_;
};
