#pragma once

// ---------------------------------------------------------------------------
// remote_catalog_client.hpp
//
// 업스트림 MCP 서버 하나의 tools/list 를 HTTP 로 가져오는 CatalogSource.
//
// [동작]
// - async_ensure_fresh_snapshot() 호출마다 tools/list 를 한 번 POST 한다.
//   호출 빈도는 GatewayAggregator 가 결정한다.
// - 성공 시 스냅샷을 atomic 교체한다. 실패 시 이전 스냅샷을 유지하고
//   std::unexpected(사유) 를 반환한다.
// - 스냅샷의 키는 업스트림 원래 도구 이름이다. 네임스페이스 접두사는
//   GatewayAggregator 가 병합 시 붙인다.
//
// [요청 형식]
//   POST <endpoint>/mcp/v1   (endpoint 가 이미 /mcp 로 끝나면 /v1 만 붙인다)
//   {"jsonrpc":"2.0","id":"<uuid>","method":"tools/list","params":null}
// ---------------------------------------------------------------------------

#include "catalog/catalog_source.hpp"
#include "gateway/gateway_config.hpp"

#include <atomic>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

class HttpCatalogClient final : public CatalogSource {
public:
    explicit HttpCatalogClient(UpstreamConfig upstream);

    ~HttpCatalogClient() override = default;

    HttpCatalogClient(const HttpCatalogClient&)            = delete;
    HttpCatalogClient& operator=(const HttpCatalogClient&) = delete;
    HttpCatalogClient(HttpCatalogClient&&)                 = delete;
    HttpCatalogClient& operator=(HttpCatalogClient&&)      = delete;

    boost::asio::awaitable<FetchResult>
    async_ensure_fresh_snapshot(std::stop_token stop) override;

    [[nodiscard]] SnapshotPtr current_snapshot() const override {
        return snapshot_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const UpstreamConfig& upstream() const noexcept { return upstream_; }

    [[nodiscard]] static std::string build_tools_list_url(std::string_view mcp_endpoint);

    // parse_tools_list_response
    //   JSON-RPC 응답 본문에서 result.tools[] 를 읽어 ToolMap 을 만든다.
    //   object 가 아니거나 name 이 없는 항목은 건너뛴다. 같은 이름은 첫 항목이 이긴다.
    [[nodiscard]] static std::expected<ToolMap, std::string>
    parse_tools_list_response(std::string_view body, const UpstreamConfig& upstream);

private:
    UpstreamConfig                                      upstream_;
    std::atomic<std::shared_ptr<const CatalogSnapshot>> snapshot_;
};
