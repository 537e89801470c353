#pragma once

// ---------------------------------------------------------------------------
// catalog_snapshot.hpp
//
// 특정 시점의 도구 카탈로그 (불변 값 객체).
//
// [게시 규약]
// - 스냅샷은 std::shared_ptr<const CatalogSnapshot> 로만 공유된다.
// - "현재" 스냅샷 교체는 단일 atomic 포인터 교체이며 제자리 수정은 없다.
//   읽는 쪽은 load() 로 얻은 로컬 shared_ptr 로 일관된 시점 뷰를 유지한다.
// - upstream_count / healthy_upstream_count 는 게이트웨이 집계 스냅샷에서만
//   의미가 있고, 로컬 카탈로그에서는 0 이다.
// ---------------------------------------------------------------------------

#include "catalog/tool_descriptor.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

using ToolMap = std::map<std::string, ToolDescriptor, std::less<>>;

struct CatalogSnapshot {
    ToolMap                               tools{};
    std::string                           source_version{};
    std::chrono::system_clock::time_point created_at{};
    std::size_t                           upstream_count{0};
    std::size_t                           healthy_upstream_count{0};

    // find
    //   이름으로 도구를 찾는다. 빈 이름/공백 이름은 항상 nullptr.
    [[nodiscard]] const ToolDescriptor* find(std::string_view tool_name) const;

    [[nodiscard]] std::size_t tool_count() const noexcept { return tools.size(); }

    // validate
    //   키와 descriptor.tool_name 일치, 빈 이름 없음, healthy <= upstream 을 확인한다.
    [[nodiscard]] std::expected<void, std::string> validate() const;

    // empty
    //   도구가 없는 스냅샷. 캐시 초기값으로 사용한다.
    [[nodiscard]] static std::shared_ptr<const CatalogSnapshot> empty();
};

// is_blank
//   빈 문자열이거나 ASCII 공백으로만 이루어져 있으면 true.
[[nodiscard]] bool is_blank(std::string_view text) noexcept;
