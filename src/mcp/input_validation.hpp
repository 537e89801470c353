#pragma once

// ---------------------------------------------------------------------------
// input_validation.hpp
//
// tools/call 입력 검증.
//
// [도구 이름]
//   [A-Za-z0-9_./-]+, 최대 256자, '/' 로 시작/끝나지 않음, "//" 없음.
//   위반 시 handler 는 -32001 로 응답한다.
//
// [인자]
//   object 여야 하고, 중첩 깊이 <= 32, 최상위 속성 수 <= 256.
//   위반 시 -32602.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

struct InputLimits {
    std::size_t max_tool_name_length{256};
    std::size_t max_arguments_depth{32};
    std::size_t max_arguments_properties{256};
};

[[nodiscard]] std::expected<void, std::string>
validate_tool_name(std::string_view name, const InputLimits& limits = {});

[[nodiscard]] std::expected<void, std::string>
validate_arguments(const nlohmann::json& arguments, const InputLimits& limits = {});

// json_depth
//   스칼라 0, 빈 object/array 1, 그 외 1 + 자식 최대 깊이.
//   limit 를 넘는 순간 탐색을 멈추고 limit + 1 을 반환한다.
[[nodiscard]] std::size_t json_depth(const nlohmann::json& value, std::size_t limit);
