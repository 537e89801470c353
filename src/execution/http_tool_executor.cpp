#include "execution/http_tool_executor.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>
#include <vector>

#include <boost/beast/http/verb.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "net/http_client.hpp"

namespace http = boost::beast::http;

namespace {

constexpr std::size_t kErrorBodyPreview = 512;

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// 인자 값을 경로/쿼리용 문자열로. null 은 표현하지 않는다.
[[nodiscard]] std::optional<std::string> argument_text(const nlohmann::json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

[[nodiscard]] bool method_has_body(http::verb verb) noexcept {
    return verb == http::verb::post || verb == http::verb::put || verb == http::verb::patch;
}

[[nodiscard]] bool is_json_content_type(std::string_view content_type) noexcept {
    const auto semi = content_type.find(';');
    auto media = content_type.substr(0, semi);
    while (!media.empty() && media.back() == ' ') {
        media.remove_suffix(1);
    }
    return iequals(media, "application/json") ||
           (media.size() > 5 && iequals(media.substr(media.size() - 5), "+json"));
}

}  // namespace

std::string url_encode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += fmt::format("%{:02X}", uc);
        }
    }
    return out;
}

HttpToolExecutor::HttpToolExecutor(HttpToolExecutorOptions options)
    : options_{std::move(options)}
{
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
        options_.base_url.pop_back();
    }
}

std::string HttpToolExecutor::build_target(std::string_view      route_template,
                                           const nlohmann::json& arguments) {
    std::string              path;
    std::vector<std::string> used_keys;
    path.reserve(route_template.size());

    std::size_t i = 0;
    while (i < route_template.size()) {
        if (route_template[i] == '{') {
            const auto close = route_template.find('}', i);
            if (close != std::string_view::npos && close > i + 1) {
                const auto param = route_template.substr(i + 1, close - i - 1);

                const nlohmann::json* match = nullptr;
                std::string           match_key;
                if (arguments.is_object()) {
                    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
                        if (iequals(it.key(), param)) {
                            match     = &it.value();
                            match_key = it.key();
                            break;
                        }
                    }
                }

                if (match != nullptr) {
                    path += url_encode(argument_text(*match).value_or(std::string{}));
                    used_keys.push_back(std::move(match_key));
                } else {
                    path.append(route_template.substr(i, close - i + 1));
                }
                i = close + 1;
                continue;
            }
        }
        path += route_template[i];
        ++i;
    }

    std::string query;
    if (arguments.is_object()) {
        for (auto it = arguments.begin(); it != arguments.end(); ++it) {
            if (it.key() == "body" ||
                std::find(used_keys.begin(), used_keys.end(), it.key()) != used_keys.end()) {
                continue;
            }
            const auto text = argument_text(it.value());
            if (!text) {
                continue;
            }
            query += query.empty() ? '?' : '&';
            query += url_encode(it.key());
            query += '=';
            query += url_encode(*text);
        }
    }

    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    return path + query;
}

std::chrono::milliseconds HttpToolExecutor::timeout_for(const ToolDescriptor& tool) const {
    if (tool.effective_policy && tool.effective_policy->timeout_ms) {
        return std::chrono::milliseconds{*tool.effective_policy->timeout_ms};
    }
    return options_.default_timeout;
}

boost::asio::awaitable<ToolResult>
HttpToolExecutor::async_execute(const ToolDescriptor& tool,
                                const nlohmann::json& arguments,
                                const CallContext&    context,
                                std::stop_token       stop) {
    if (!tool.endpoint || tool.endpoint->route_template.empty()) {
        spdlog::error("[executor] tool '{}' has no configured endpoint", tool.tool_name);
        co_return ToolResult::failure(
            "NO_ENDPOINT", fmt::format("Tool '{}' has no configured endpoint.", tool.tool_name), false);
    }

    const auto& endpoint = *tool.endpoint;
    const auto  verb     = http::string_to_verb(endpoint.http_method.empty() ? "GET"
                                                                              : endpoint.http_method);
    if (verb == http::verb::unknown) {
        co_return ToolResult::failure(
            "HTTP_ERROR",
            fmt::format("Tool '{}' has unsupported HTTP method '{}'.", tool.tool_name, endpoint.http_method),
            false);
    }

    const auto timeout = timeout_for(tool);

    HttpRequest request{};
    request.method  = verb;
    request.url     = options_.base_url + build_target(endpoint.route_template, arguments);
    request.timeout = timeout;
    request.headers.emplace_back("Accept", "application/json, text/plain;q=0.9, */*;q=0.5");

    if (method_has_body(verb) && arguments.is_object()) {
        if (const auto body = arguments.find("body"); body != arguments.end() && !body->is_null()) {
            request.body         = body->dump();
            request.content_type = "application/json";
        }
    }
    switch (tool.effective_policy ? tool.effective_policy->auth_propagation : AuthPropagationMode::kInfer) {
    case AuthPropagationMode::kNone:
        break;
    case AuthPropagationMode::kBearerToken:
        if (!context.authorization.empty()) {
            request.headers.emplace_back("Authorization", context.authorization);
        }
        break;
    case AuthPropagationMode::kCookies:
        if (!context.cookie.empty()) {
            request.headers.emplace_back("Cookie", context.cookie);
        }
        break;
    case AuthPropagationMode::kInfer:
        if (options_.propagate_authorization && !context.authorization.empty()) {
            request.headers.emplace_back("Authorization", context.authorization);
        }
        break;
    }
    if (options_.include_diagnostic_headers) {
        request.headers.emplace_back("X-Toolgate-Tool-Name", tool.tool_name);
        request.headers.emplace_back("X-Toolgate-Request-Id", context.request_id);
    }

    spdlog::debug("[executor] tool '{}' -> {} {}", tool.tool_name, endpoint.http_method, request.url);

    auto response = co_await async_http_request(std::move(request), stop);
    if (!response) {
        const auto& error = response.error();
        switch (error.kind) {
            case HttpErrorKind::kTimeout:
                spdlog::warn("[executor] tool '{}' timed out after {}ms", tool.tool_name, timeout.count());
                co_return ToolResult::failure(
                    "TIMEOUT", fmt::format("Tool execution timed out after {}ms.", timeout.count()), true);
            case HttpErrorKind::kCancelled:
                spdlog::info("[executor] tool '{}' cancelled by caller", tool.tool_name);
                co_return ToolResult::failure("CANCELLED", "Tool execution was cancelled by client.", true);
            case HttpErrorKind::kInvalidUrl:
                co_return ToolResult::failure(
                    "HTTP_ERROR", fmt::format("HTTP request failed: {}", error.message), false);
            case HttpErrorKind::kTransport:
            default:
                spdlog::error("[executor] tool '{}' request failed: {}", tool.tool_name, error.message);
                co_return ToolResult::failure(
                    "HTTP_ERROR", fmt::format("HTTP request failed: {}", error.message), true);
        }
    }

    if (!response->ok()) {
        const auto preview = response->body.substr(0, kErrorBodyPreview);
        spdlog::warn("[executor] tool '{}' returned HTTP {}", tool.tool_name, response->status);
        co_return ToolResult::failure(
            fmt::format("HTTP_{}", response->status),
            fmt::format("Tool execution failed with HTTP {}: {}", response->status, preview),
            is_transient_status(response->status));
    }

    if (is_json_content_type(response->content_type)) {
        const auto doc = nlohmann::json::parse(response->body, nullptr, false);
        if (!doc.is_discarded()) {
            co_return ToolResult::ok(text_content(doc.dump()));
        }
        // 선언과 달리 JSON 이 아니면 원문 그대로 돌려준다.
    }
    co_return ToolResult::ok(text_content(response->body));
}
