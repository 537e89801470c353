// ---------------------------------------------------------------------------
// yaml_util.cpp
//
// [알려진 한계]
// - parse_duration 은 정수 값만 지원한다 ("1.5s" 불가).
// - yaml_to_json 은 앵커/별칭을 yaml-cpp 가 풀어 준 결과를 그대로 변환한다.
// ---------------------------------------------------------------------------

#include "common/yaml_util.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

std::optional<std::uint32_t> read_optional_uint32(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

std::optional<std::chrono::milliseconds> parse_duration(std::string_view raw) {
    if (raw.empty()) {
        return std::nullopt;
    }
    const char* begin = raw.data();
    const char* end   = raw.data() + raw.size();

    std::uint64_t value{0};
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr == begin) {
        return std::nullopt;
    }

    const std::string_view unit{ptr, static_cast<std::size_t>(end - ptr)};
    std::uint64_t          factor{0};
    if (unit.empty() || unit == "s") {
        factor = 1000;
    } else if (unit == "ms") {
        factor = 1;
    } else if (unit == "m") {
        factor = 60 * 1000;
    } else if (unit == "h") {
        factor = 60 * 60 * 1000;
    } else {
        return std::nullopt;
    }

    // 밀리초 표현 범위를 넘는 값은 형식 오류로 취급한다.
    constexpr auto kMaxMillis = static_cast<std::uint64_t>(std::chrono::milliseconds::max().count());
    if (value > kMaxMillis / factor) {
        return std::nullopt;
    }
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(value * factor)};
}

std::expected<std::chrono::milliseconds, std::string>
read_duration(const YAML::Node& node, std::string_view key, std::chrono::milliseconds fallback) {
    if (!node) {
        return fallback;
    }
    const auto raw    = read_string(node, "");
    const auto parsed = parse_duration(raw);
    if (!parsed) {
        return std::unexpected(fmt::format("invalid duration for '{}': '{}'", key, raw));
    }
    return *parsed;
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return nullptr;
    }
    if (node.IsSequence()) {
        auto out = nlohmann::json::array();
        for (const auto& item : node) {
            out.push_back(yaml_to_json(item));
        }
        return out;
    }
    if (node.IsMap()) {
        auto out = nlohmann::json::object();
        for (const auto& kv : node) {
            out[kv.first.as<std::string>()] = yaml_to_json(kv.second);
        }
        return out;
    }

    const std::string& text = node.Scalar();
    // 따옴표 스칼라는 태그가 "!" 이다. 타입 추론 없이 문자열로 유지한다.
    if (node.Tag() == "!") {
        return text;
    }
    if (text == "~" || text == "null") {
        return nullptr;
    }
    if (text == "true") {
        return true;
    }
    if (text == "false") {
        return false;
    }

    const char* begin = text.data();
    const char* end   = text.data() + text.size();

    std::int64_t integer{0};
    if (auto [ptr, ec] = std::from_chars(begin, end, integer); ec == std::errc{} && ptr == end) {
        return integer;
    }
    double real{0.0};
    if (auto [ptr, ec] = std::from_chars(begin, end, real); ec == std::errc{} && ptr == end) {
        return real;
    }
    return text;
}

std::expected<std::string, std::string> read_text_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(fmt::format("file not found: {}", path.string()));
    }

    std::ifstream in{path, std::ios::binary};
    if (!in) {
        return std::unexpected(fmt::format("cannot open file: {}", path.string()));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(fmt::format("read error: {}", path.string()));
    }
    return buf.str();
}

std::string content_fingerprint(std::string_view content) {
    constexpr std::uint64_t kOffsetBasis = 14695981039346656037ULL;
    constexpr std::uint64_t kPrime       = 1099511628211ULL;

    std::uint64_t hash = kOffsetBasis;
    for (const char c : content) {
        hash ^= static_cast<std::uint8_t>(c);
        hash *= kPrime;
    }
    return fmt::format("fnv1a-{:016x}", hash);
}
