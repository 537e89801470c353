#pragma once

// ---------------------------------------------------------------------------
// env_util.hpp
//
// 환경변수 읽기 헬퍼. main() 의 설정 로드가 사용한다.
// 값이 없거나 잘못되면 경고를 남기고 기본값을 돌려준다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>

[[nodiscard]] std::string   env_str(const char* name, std::string default_val);
[[nodiscard]] std::uint16_t env_u16(const char* name, std::uint16_t default_val);

// env_u64
//   allow_zero 가 false 면 0 이하는 기본값으로 대체한다.
//   0 이 "끄기" 를 뜻하는 설정(CATALOG_MIN_RELOAD_MS 등)은 allow_zero = true.
[[nodiscard]] std::uint64_t env_u64(const char* name, std::uint64_t default_val, bool allow_zero = false);

[[nodiscard]] bool env_bool(const char* name, bool default_val);
