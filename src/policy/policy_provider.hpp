#pragma once

// ---------------------------------------------------------------------------
// policy_provider.hpp
//
// PolicyConfigProvider: 현재 PolicyDocument 를 공급하는 추상 인터페이스와
// 두 가지 구현 (메모리, YAML 파일).
//
// [설계 원칙]
// - get() 은 호출 시점의 문서를 반환한다. CatalogProvider 는 반환된 문서의
//   source_version 을 보고 재구성 여부를 결정한다 (poll-on-use).
// - watch() 의 변경 신호는 최적화일 뿐이다. 신호가 없어도 get() 결과는
//   항상 최신이어야 한다.
// - 문서는 shared_ptr<const PolicyDocument> 로만 전달한다 (불변).
// ---------------------------------------------------------------------------

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

#include "policy/policy_document.hpp"

// ---------------------------------------------------------------------------
// PolicyChangeSignal
//   단조 증가하는 세대 번호. 공급자는 변경 시 notify() 로 증가시키고,
//   소비자는 마지막으로 본 세대와 비교한다.
// ---------------------------------------------------------------------------
class PolicyChangeSignal {
public:
    void notify() noexcept { generation_.fetch_add(1, std::memory_order_acq_rel); }

    [[nodiscard]] std::uint64_t generation() const noexcept {
        return generation_.load(std::memory_order_acquire);
    }

private:
    std::atomic<std::uint64_t> generation_{0};
};

class PolicyConfigProvider {
public:
    using DocumentPtr = std::shared_ptr<const PolicyDocument>;

    virtual ~PolicyConfigProvider() = default;

    // get
    //   현재 정책 문서를 반환한다. 실패 시 std::unexpected(사유).
    //   stop 이 요청된 상태면 OperationCancelled 를 던진다.
    [[nodiscard]] virtual std::expected<DocumentPtr, std::string>
    get(const std::stop_token& stop) = 0;

    // watch
    //   변경 신호. 지원하지 않는 공급자는 nullptr 를 반환한다.
    [[nodiscard]] virtual std::shared_ptr<PolicyChangeSignal> watch() { return nullptr; }
};

// ---------------------------------------------------------------------------
// InMemoryPolicyProvider
//   테스트 및 임베딩 환경용. update() 로 문서를 교체하면 변경 신호가 울린다.
// ---------------------------------------------------------------------------
class InMemoryPolicyProvider final : public PolicyConfigProvider {
public:
    explicit InMemoryPolicyProvider(PolicyDocument document = {});

    [[nodiscard]] std::expected<DocumentPtr, std::string>
    get(const std::stop_token& stop) override;

    [[nodiscard]] std::shared_ptr<PolicyChangeSignal> watch() override { return signal_; }

    void update(PolicyDocument document);

    [[nodiscard]] std::uint64_t fetch_count() const noexcept {
        return fetch_count_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<std::shared_ptr<const PolicyDocument>> document_;
    std::shared_ptr<PolicyChangeSignal>                signal_;
    std::atomic<std::uint64_t>                         fetch_count_{0};
};

// ---------------------------------------------------------------------------
// FilePolicyProvider
//   YAML 파일을 PolicyLoader 로 읽는다.
//   파일의 mtime/size 가 바뀌지 않았으면 캐시된 문서를 그대로 반환한다.
//   notify_changed() 는 SIGHUP 등 외부 트리거에서 호출되며, 캐시를 버리고
//   변경 신호를 울린다.
// ---------------------------------------------------------------------------
class FilePolicyProvider final : public PolicyConfigProvider {
public:
    explicit FilePolicyProvider(std::filesystem::path path);

    [[nodiscard]] std::expected<DocumentPtr, std::string>
    get(const std::stop_token& stop) override;

    [[nodiscard]] std::shared_ptr<PolicyChangeSignal> watch() override { return signal_; }

    void notify_changed();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct FileStamp {
        std::filesystem::file_time_type mtime{};
        std::uintmax_t                  size{0};

        bool operator==(const FileStamp&) const = default;
    };

    std::filesystem::path               path_;
    std::shared_ptr<PolicyChangeSignal> signal_;

    std::mutex               mutex_;
    DocumentPtr              cached_;
    std::optional<FileStamp> stamp_;
};
