#include "policy/policy_provider.hpp"

#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/types.hpp"
#include "policy/policy_loader.hpp"

// ---------------------------------------------------------------------------
// InMemoryPolicyProvider
// ---------------------------------------------------------------------------
InMemoryPolicyProvider::InMemoryPolicyProvider(PolicyDocument document)
    : document_{std::make_shared<const PolicyDocument>(std::move(document))}
    , signal_{std::make_shared<PolicyChangeSignal>()}
{}

std::expected<PolicyConfigProvider::DocumentPtr, std::string>
InMemoryPolicyProvider::get(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw OperationCancelled{};
    }
    fetch_count_.fetch_add(1, std::memory_order_relaxed);
    return document_.load(std::memory_order_acquire);
}

void InMemoryPolicyProvider::update(PolicyDocument document) {
    document_.store(std::make_shared<const PolicyDocument>(std::move(document)),
                    std::memory_order_release);
    signal_->notify();
}

// ---------------------------------------------------------------------------
// FilePolicyProvider
// ---------------------------------------------------------------------------
FilePolicyProvider::FilePolicyProvider(std::filesystem::path path)
    : path_{std::move(path)}
    , signal_{std::make_shared<PolicyChangeSignal>()}
{}

std::expected<PolicyConfigProvider::DocumentPtr, std::string>
FilePolicyProvider::get(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw OperationCancelled{};
    }

    std::error_code ec;
    FileStamp current{};
    current.mtime = std::filesystem::last_write_time(path_, ec);
    if (!ec) {
        current.size = std::filesystem::file_size(path_, ec);
    }
    if (ec) {
        return std::unexpected(fmt::format(
            "policy file '{}' is not accessible: {}", path_.string(), ec.message()));
    }

    std::lock_guard lock{mutex_};
    if (cached_ && stamp_ && *stamp_ == current) {
        return cached_;
    }

    auto loaded = PolicyLoader::load(path_);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }

    cached_ = std::make_shared<const PolicyDocument>(std::move(*loaded));
    stamp_  = current;
    return cached_;
}

void FilePolicyProvider::notify_changed() {
    {
        std::lock_guard lock{mutex_};
        stamp_.reset();
    }
    spdlog::info("[policy] change notified for '{}'", path_.string());
    signal_->notify();
}
