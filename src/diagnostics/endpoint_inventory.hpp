#pragma once

// ---------------------------------------------------------------------------
// endpoint_inventory.hpp
//
// 백엔드가 실제로 제공하는 엔드포인트 목록 (config/endpoints.yaml).
// 진단의 gap 분석에서 정책 항목의 route 가 살아있는지 확인하는 데 쓴다.
//
// [YAML 형식]
//   endpoints:
//     - method: GET
//       route: /api/orders/{id}
//       display_name: Get order
//
// [조회 규칙]
//   키는 "METHOD:route" 이며 대소문자를 구분하지 않는다. method 가 비어
//   있으면 GET.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

struct LiveEndpoint {
    std::string http_method{"GET"};
    std::string route_template{};
    std::string display_name{};
};

class EndpointInventory {
public:
    EndpointInventory() = default;
    explicit EndpointInventory(std::vector<LiveEndpoint> endpoints);

    [[nodiscard]] static std::expected<EndpointInventory, std::string>
    load(const std::filesystem::path& path);

    [[nodiscard]] static std::expected<EndpointInventory, std::string>
    load_from_string(std::string_view yaml_text);

    [[nodiscard]] bool contains(std::string_view http_method, std::string_view route_template) const;

    [[nodiscard]] const std::vector<LiveEndpoint>& endpoints() const noexcept { return endpoints_; }
    [[nodiscard]] std::size_t size() const noexcept { return endpoints_.size(); }

    // endpoint_key
    //   "GET:/api/orders/{id}" 형태의 정규화(소문자) 키.
    [[nodiscard]] static std::string endpoint_key(std::string_view http_method, std::string_view route_template);

private:
    std::vector<LiveEndpoint> endpoints_{};
    std::set<std::string, std::less<>> keys_{};
};
