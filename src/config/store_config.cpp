// Copyright 2025 Strata Project
// SPDX-License-Identifier: GPL-3.0-or-later

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cstdlib>
#include <system_error>
#include <strata/config/config_helpers.h>
#include <strata/config/store_config.h>

namespace strata::config {

namespace {

Error invalidValue(const std::string& section, const std::string& key, const std::string& value) {
    return Error{ErrorCode::ValidationError,
                 fmt::format("config: invalid value for {}.{}: '{}'", section, key, value)};
}

Result<void> readSize(const std::filesystem::path& path, const std::string& key, size_t& out) {
    auto raw = parse_config_value(path, "pool", key);
    if (raw.empty()) {
        return {};
    }
    auto value = parse_uint(raw);
    if (!value) {
        return invalidValue("pool", key, raw);
    }
    out = static_cast<size_t>(*value);
    return {};
}

Result<void> readMillis(const std::filesystem::path& path, const std::string& key,
                        std::chrono::milliseconds& out) {
    auto raw = parse_config_value(path, "pool", key);
    if (raw.empty()) {
        return {};
    }
    auto value = parse_ms(raw);
    if (!value) {
        return invalidValue("pool", key, raw);
    }
    out = *value;
    return {};
}

} // namespace

Result<void> validateStoreConfig(const StoreConfig& config) {
    if (config.database.empty()) {
        return Error{ErrorCode::ValidationError, "config: store.database must not be empty"};
    }
    const auto& pool = config.pool;
    if (pool.maxConnections > 0 && pool.minConnections > pool.maxConnections) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("config: pool.min_size ({}) exceeds pool.max_size ({})",
                                 pool.minConnections, pool.maxConnections)};
    }
    return {};
}

Result<StoreConfig> loadStoreConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::NotFound,
                     fmt::format("config: file not found: {}", path.string())};
    }

    StoreConfig config;

    if (auto name = parse_config_value(path, "store", "database"); !name.empty()) {
        config.database = name;
    }

    if (auto enabled = parse_config_value(path, "pool", "enabled"); !enabled.empty()) {
        auto flag = parse_bool(enabled);
        if (!flag) {
            return invalidValue("pool", "enabled", enabled);
        }
        config.poolEnabled = *flag;
    }

    if (auto r = readSize(path, "min_size", config.pool.minConnections); !r) {
        return r.error();
    }
    if (auto r = readSize(path, "max_size", config.pool.maxConnections); !r) {
        return r.error();
    }
    if (auto r = readMillis(path, "idle_timeout_ms", config.pool.idleTimeout); !r) {
        return r.error();
    }
    if (auto r = readMillis(path, "wait_timeout_ms", config.pool.waitTimeout); !r) {
        return r.error();
    }

    if (const char* env = std::getenv(kDatabaseEnvVar); env && *env) {
        spdlog::debug("config: database '{}' overridden by {}", env, kDatabaseEnvVar);
        config.database = env;
    }

    if (auto r = validateStoreConfig(config); !r) {
        return r.error();
    }
    return config;
}

} // namespace strata::config
