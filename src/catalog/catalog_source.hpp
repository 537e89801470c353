#pragma once

// ---------------------------------------------------------------------------
// catalog_source.hpp
//
// 카탈로그 스냅샷 공급원의 공통 인터페이스.
// 로컬 CatalogProvider, 업스트림 하나를 바라보는 HttpCatalogClient,
// 그리고 N 개 업스트림을 합치는 GatewayAggregator 가 모두 이 인터페이스를
// 구현한다. JsonRpcHandler 는 어떤 공급원인지 알 필요가 없다.
//
// [규약]
// - current_snapshot() 은 절대 블록하지 않으며 nullptr 를 반환하지 않는다.
// - async_ensure_fresh_snapshot() 실패 시 std::unexpected(사유).
//   실패해도 current_snapshot() 은 이전(stale) 스냅샷을 계속 반환한다.
// - stop 이 요청되면 OperationCancelled 가 전파될 수 있다.
// ---------------------------------------------------------------------------

#include "catalog/catalog_snapshot.hpp"

#include <boost/asio/awaitable.hpp>

#include <expected>
#include <memory>
#include <stop_token>
#include <string>

class CatalogSource {
public:
    using SnapshotPtr = std::shared_ptr<const CatalogSnapshot>;
    using FetchResult = std::expected<SnapshotPtr, std::string>;

    virtual ~CatalogSource() = default;

    // stop_token 은 코루틴 프레임에 복사되도록 값으로 받는다.
    virtual boost::asio::awaitable<FetchResult>
    async_ensure_fresh_snapshot(std::stop_token stop) = 0;

    [[nodiscard]] virtual SnapshotPtr current_snapshot() const = 0;
};
