#pragma once

// ---------------------------------------------------------------------------
// yaml_util.hpp
//
// 설정 로더(policy / gateway / endpoints)가 공유하는 yaml-cpp 헬퍼.
//
// [설계 원칙]
// - read_* 헬퍼는 노드가 없거나 타입이 맞지 않으면 fallback 을 반환한다.
//   필수 필드 검증은 각 로더가 담당한다.
// - 파일 원문은 로그에 출력하지 않는다. 오류 메시지에는 키 이름만 담는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

[[nodiscard]] std::string   read_string(const YAML::Node& node, const std::string& fallback);
[[nodiscard]] bool          read_bool(const YAML::Node& node, bool fallback);
[[nodiscard]] std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback);
[[nodiscard]] std::optional<std::uint32_t> read_optional_uint32(const YAML::Node& node);

// parse_duration
//   "250ms", "30s", "5m", "1h" 또는 단위 없는 정수(초)를 밀리초로 변환한다.
//   형식이 잘못되면 std::nullopt.
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_duration(std::string_view raw);

// read_duration
//   노드가 없으면 fallback, 형식 오류면 std::unexpected(key 설명).
[[nodiscard]] std::expected<std::chrono::milliseconds, std::string>
read_duration(const YAML::Node& node, std::string_view key, std::chrono::milliseconds fallback);

// yaml_to_json
//   YAML 노드를 nlohmann::json 으로 변환한다 (input_schema 등).
//   따옴표로 감싼 스칼라는 문자열, 나머지는 null/bool/정수/실수/문자열 순으로 해석.
[[nodiscard]] nlohmann::json yaml_to_json(const YAML::Node& node);

// read_text_file
//   파일 전체를 문자열로 읽는다. 실패 시 std::unexpected(사유).
[[nodiscard]] std::expected<std::string, std::string> read_text_file(const std::filesystem::path& path);

// content_fingerprint
//   FNV-1a 64bit 지문. 명시적 버전이 없는 문서의 source_version 으로 쓴다.
//   예: "fnv1a-9c3b1f0d2a7e4c11"
[[nodiscard]] std::string content_fingerprint(std::string_view content);
