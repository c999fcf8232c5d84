#pragma once

#include <filesystem>
#include <string>
#include <strata/core/types.h>
#include <strata/store/connection_pool.h>

namespace strata::config {

/**
 * @brief Store connection settings loaded from config.toml
 *
 * @code
 * [store]
 * database = "inventory"
 *
 * [pool]
 * enabled = true
 * min_size = 2
 * max_size = 10
 * idle_timeout_ms = 300000
 * wait_timeout_ms = 10000
 * @endcode
 */
struct StoreConfig {
    std::string database = "strata";
    bool poolEnabled = false;
    store::ConnectionPoolConfig pool;
};

/// Environment variable that overrides `[store] database`
inline constexpr const char* kDatabaseEnvVar = "STRATA_DATABASE";

/**
 * @brief Load and validate store settings
 *
 * Keys absent from the file keep their defaults. A missing file is NotFound;
 * unparseable values and a pool whose min_size exceeds max_size are
 * ValidationError.
 */
Result<StoreConfig> loadStoreConfig(const std::filesystem::path& path);

/**
 * @brief Check the pool shape of an already populated config
 */
Result<void> validateStoreConfig(const StoreConfig& config);

} // namespace strata::config
