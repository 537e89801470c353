#pragma once

// ---------------------------------------------------------------------------
// tool_filter.hpp
//
// 게이트웨이 도구 노출 필터 (외부 이름 기준).
//
// [판정 순서]
//   1. 필터 비활성 (패턴 없음 + deny_by_default=false) → 허용
//   2. denied_tools 패턴 하나라도 일치 → 거부
//   3. allowed_tools 가 있으면: 하나라도 일치해야 허용
//   4. allowed_tools 가 없으면: !deny_by_default
//
// 패턴은 '*' 와일드카드(0 글자 이상)만 지원하는 glob 이며 대소문자를 구분한다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

class GatewayToolFilter {
public:
    GatewayToolFilter() = default;
    GatewayToolFilter(std::vector<std::string> allowed,
                      std::vector<std::string> denied,
                      bool                     deny_by_default);

    [[nodiscard]] bool is_active() const noexcept;
    [[nodiscard]] bool is_allowed(std::string_view external_name) const;

private:
    std::vector<std::string> allowed_{};
    std::vector<std::string> denied_{};
    bool                     deny_by_default_{false};
};

// glob_match
//   '*' 는 임의 길이 문자열과 일치한다. 나머지 문자는 정확히 일치해야 한다.
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view text) noexcept;
