// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 파일을 로드하여 PolicyDocument 로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 문서를 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다.
// - http_method 는 대문자로 정규화한다. 빈 값은 GET.
// - 실행 정책(concurrency_limit, rate_limit, auth_propagation) 값이 잘못되면
//   해당 항목을 건너뛰지 않고 문서 전체를 거부한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [알려진 한계]
// - input_schema 는 구조만 변환하며 JSON Schema 로서의 유효성은 검사하지
//   않는다. object 가 아니면 CatalogBuilder 가 기본 스키마로 대체한다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "common/yaml_util.hpp"

namespace {

[[nodiscard]] std::string to_upper(std::string value) {
    std::ranges::transform(value, value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

[[nodiscard]] std::expected<AuthPropagationMode, std::string>
parse_auth_propagation(const YAML::Node& node) {
    const auto raw = to_upper(read_string(node, ""));
    if (raw.empty() || raw == "INFER") {
        return AuthPropagationMode::kInfer;
    }
    if (raw == "NONE") {
        return AuthPropagationMode::kNone;
    }
    if (raw == "BEARER_TOKEN" || raw == "BEARERTOKEN" || raw == "BEARER") {
        return AuthPropagationMode::kBearerToken;
    }
    if (raw == "COOKIES" || raw == "COOKIE") {
        return AuthPropagationMode::kCookies;
    }
    return std::unexpected(fmt::format("unknown auth_propagation '{}'", read_string(node, "")));
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: rate_limit 블록 파싱
//   strategy 생략 시 fixed_window. permit_limit 는 양수여야 하고,
//   fixed_window 는 window_ms, token_bucket 은 refill_period_ms 가 필요하다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<RateLimitPolicy, std::string>
parse_rate_limit(const YAML::Node& node) {
    if (!node.IsMap()) {
        return std::unexpected(std::string{"rate_limit must be a map"});
    }

    RateLimitPolicy policy{};
    const auto strategy = to_upper(read_string(node["strategy"], ""));
    if (strategy.empty() || strategy == "FIXED_WINDOW" || strategy == "FIXEDWINDOW") {
        policy.strategy = RateLimitStrategy::kFixedWindow;
    } else if (strategy == "TOKEN_BUCKET" || strategy == "TOKENBUCKET") {
        policy.strategy = RateLimitStrategy::kTokenBucket;
    } else {
        return std::unexpected(fmt::format("unsupported rate_limit strategy '{}'",
                                           read_string(node["strategy"], "")));
    }

    policy.permit_limit      = read_uint32(node["permit_limit"], 0);
    policy.window_ms         = read_uint32(node["window_ms"], 0);
    policy.tokens_per_period = read_uint32(node["tokens_per_period"], 1);
    policy.refill_period_ms  = read_uint32(node["refill_period_ms"], 0);

    if (policy.permit_limit == 0) {
        return std::unexpected(std::string{"rate_limit.permit_limit must be greater than zero"});
    }
    if (policy.strategy == RateLimitStrategy::kFixedWindow && policy.window_ms == 0) {
        return std::unexpected(std::string{"rate_limit.window_ms must be greater than zero"});
    }
    if (policy.strategy == RateLimitStrategy::kTokenBucket) {
        if (policy.refill_period_ms == 0) {
            return std::unexpected(std::string{"rate_limit.refill_period_ms must be greater than zero"});
        }
        if (policy.tokens_per_period == 0) {
            return std::unexpected(std::string{"rate_limit.tokens_per_period must be greater than zero"});
        }
    }
    return policy;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: tools[] 항목 하나 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<PolicyEntry, std::string> parse_entry(const YAML::Node& node) {
    PolicyEntry entry{};
    entry.tool_name      = read_string(node["tool_name"], "");
    entry.route_template = read_string(node["route_template"], "");
    entry.operation_id   = read_string(node["operation_id"], "");
    entry.display_name   = read_string(node["display_name"], "");
    entry.description    = read_string(node["description"], "");
    entry.enabled        = read_bool(node["enabled"], entry.enabled);
    entry.timeout_ms     = read_optional_uint32(node["timeout_ms"]);

    const auto method = to_upper(read_string(node["http_method"], ""));
    entry.http_method = method.empty() ? std::string{"GET"} : method;

    if (const auto schema = node["input_schema"]; schema && !schema.IsNull()) {
        entry.input_schema = yaml_to_json(schema);
        if (!entry.input_schema.is_object()) {
            spdlog::warn("policy_loader: input_schema of tool '{}' is not a map, "
                         "default schema will be used", entry.tool_name);
        }
    }

    if (const auto limit = node["concurrency_limit"]; limit && !limit.IsNull()) {
        entry.concurrency_limit = read_optional_uint32(limit);
        if (!entry.concurrency_limit || *entry.concurrency_limit == 0) {
            return std::unexpected(std::string{"concurrency_limit must be a positive integer"});
        }
    }

    if (const auto rate = node["rate_limit"]; rate && !rate.IsNull()) {
        auto policy = parse_rate_limit(rate);
        if (!policy) {
            return std::unexpected(policy.error());
        }
        entry.rate_limit = *policy;
    }

    auto auth = parse_auth_propagation(node["auth_propagation"]);
    if (!auth) {
        return std::unexpected(auth.error());
    }
    entry.auth_propagation = *auth;
    return entry;
}

[[nodiscard]] std::expected<PolicyDocument, std::string>
parse_document(const YAML::Node& root, std::string_view raw_text) {
    if (!root || root.IsNull()) {
        // 빈 파일: 항목 없는 deny-by-default 문서
        PolicyDocument empty{};
        empty.source_version = content_fingerprint(raw_text);
        return empty;
    }
    if (!root.IsMap()) {
        return std::unexpected(std::string{"policy_loader: top-level node is not a YAML map"});
    }

    PolicyDocument doc{};
    doc.deny_by_default = read_bool(root["deny_by_default"], doc.deny_by_default);
    doc.source_version  = read_string(root["version"], "");
    if (doc.source_version.empty()) {
        doc.source_version = content_fingerprint(raw_text);
    }

    const YAML::Node tools = root["tools"];
    if (!tools || tools.IsNull()) {
        return doc;
    }
    if (!tools.IsSequence()) {
        return std::unexpected(std::string{"policy_loader: 'tools' must be a sequence"});
    }

    doc.entries.reserve(tools.size());
    std::size_t index = 0;
    for (const auto& node : tools) {
        if (!node.IsMap()) {
            return std::unexpected(fmt::format(
                "policy_loader: tools[{}] must be a map", index));
        }
        auto entry = parse_entry(node);
        if (!entry) {
            return std::unexpected(fmt::format(
                "policy_loader: tools[{}]: {}", index, entry.error()));
        }
        doc.entries.push_back(std::move(*entry));
        ++index;
    }
    return doc;
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load_from_string 구현
// ---------------------------------------------------------------------------
std::expected<PolicyDocument, std::string>
PolicyLoader::load_from_string(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml_text});
    } catch (const YAML::ParserException& e) {
        return std::unexpected(fmt::format(
            "policy_loader: YAML parse error at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.msg));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("policy_loader: YAML error: {}", e.what()));
    }

    try {
        return parse_document(root, yaml_text);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "policy_loader: error parsing 'tools' section: {}", e.what()));
    }
}

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<PolicyDocument, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 2. 원문 읽기 (지문 계산에 원문이 필요하므로 LoadFile 대신 직접 읽는다)
    auto text = read_text_file(canonical_path);
    if (!text) {
        const std::string err = fmt::format("policy_loader: {}", text.error());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 파싱
    auto doc = load_from_string(*text);
    if (!doc) {
        spdlog::error("{} ('{}')", doc.error(), canonical_path.string());
        return doc;
    }

    for (const auto& warning : validate(*doc)) {
        spdlog::warn("policy_loader: {}", warning);
    }

    spdlog::info("policy_loader: loaded {} policy entries from '{}' (version='{}')",
                 doc->entries.size(), canonical_path.string(), doc->source_version);
    return doc;
}

// ---------------------------------------------------------------------------
// PolicyLoader::validate 구현
// ---------------------------------------------------------------------------
std::vector<std::string> PolicyLoader::validate(const PolicyDocument& document) {
    std::vector<std::string> warnings;

    if (!document.deny_by_default) {
        warnings.emplace_back(
            "deny_by_default is false: allow-by-default mode is not supported, "
            "only listed tools are exposed");
    } else if (document.entries.empty()) {
        warnings.emplace_back("deny_by_default with no tools: catalog will be empty");
    }

    for (std::size_t i = 0; i < document.entries.size(); ++i) {
        const auto& entry = document.entries[i];
        if (entry.enabled && entry.route_template.empty()) {
            warnings.push_back(fmt::format(
                "tools[{}] '{}' has no route_template", i, entry.tool_name));
        }
    }
    return warnings;
}
