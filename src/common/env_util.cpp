#include "common/env_util.hpp"

#include <cstdlib>
#include <exception>

#include <spdlog/spdlog.h>

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

std::uint16_t env_u16(const char* name, std::uint16_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    try {
        const int parsed = std::stoi(val);
        if (parsed < 0 || parsed > 65535) {
            spdlog::warn("env {}: value {} out of range, using default {}", name, parsed, default_val);
            return default_val;
        }
        return static_cast<std::uint16_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
}

std::uint64_t env_u64(const char* name, std::uint64_t default_val, bool allow_zero) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    try {
        const long long parsed = std::stoll(val);
        if (parsed < 0 || (parsed == 0 && !allow_zero)) {
            spdlog::warn("env {}: {} value {}, using default {}", name,
                         parsed < 0 ? "negative" : "zero", parsed, default_val);
            return default_val;
        }
        return static_cast<std::uint64_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
}

bool env_bool(const char* name, bool default_val) {
    const std::string val = env_str(name, "");
    if (val.empty()) {
        return default_val;
    }
    return val == "1" || val == "true" || val == "yes" || val == "on";
}
