#pragma once

// ---------------------------------------------------------------------------
// tool_name_service.hpp
//
// 업스트림 도구 이름 <-> 게이트웨이 외부 이름 변환.
//   외부 이름 = namespace_prefix + separator + 업스트림 도구 이름
//   prefix 가 비어 있으면 업스트림 이름을 그대로 쓴다.
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <string_view>

class ToolNameService {
public:
    // separator 가 비어 있거나 공백뿐이면 std::invalid_argument
    explicit ToolNameService(std::string separator = ".");

    [[nodiscard]] std::string to_external_name(std::string_view namespace_prefix,
                                               std::string_view upstream_tool_name) const;

    // to_internal_name
    //   external_name 이 prefix + separator 로 시작하면 나머지 부분을 반환한다.
    //   나머지가 비어 있거나 접두사가 다르면 std::nullopt.
    [[nodiscard]] std::optional<std::string> to_internal_name(std::string_view namespace_prefix,
                                                              std::string_view external_name) const;

    [[nodiscard]] const std::string& separator() const noexcept { return separator_; }

    // is_valid_prefix
    //   비어 있지 않고 ASCII 영문자/숫자/'.'/'_'/'-' 로만 구성.
    [[nodiscard]] static bool is_valid_prefix(std::string_view prefix) noexcept;

private:
    std::string separator_;
};
