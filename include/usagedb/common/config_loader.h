#ifndef USAGEDB_COMMON_CONFIG_LOADER_H_
#define USAGEDB_COMMON_CONFIG_LOADER_H_

#include <string>

#include <spdlog/spdlog.h>

#include "usagedb/core/config.h"
#include "usagedb/core/result.h"

namespace usagedb {
namespace common {

/**
 * @brief Everything an application needs to open both engines
 */
struct UsageDbConfig {
    core::StorageConfig storage;
    core::QueryEngineConfig query;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

/**
 * @brief Reads UsageDbConfig from JSON
 *
 * Format (every key optional, unknown keys ignored):
 * ```
 * {
 *   "logLevel": "debug",
 *   "storage": {"baseDir", "bucketStrategy", "compressionEnabled",
 *               "compressionLevel", "encryptionEnabled", "backupEnabled",
 *               "maxRetentionDays", "maxFileSize"},
 *   "query": {"baseDir", "slowQueryThresholdMs", "optimizeThresholdMs",
 *             "historyLimit", "indexSuggestionThreshold",
 *             "cache": {"enabled", "maxSize", "ttl", "keyFields",
 *                       "invalidateOnWrite"}}
 * }
 * ```
 */
class ConfigLoader {
public:
    /**
     * @brief Parse JSON text
     * @return INVALID_ARGUMENT for malformed JSON, a value of the wrong
     *         type, an out of range value or an unsupported bucket strategy
     */
    static core::Result<UsageDbConfig> parse(const std::string& json);

    /**
     * @brief Read and parse a file; NOT_FOUND when it does not exist
     */
    static core::Result<UsageDbConfig> load_file(const std::string& path);
};

} // namespace common
} // namespace usagedb

#endif // USAGEDB_COMMON_CONFIG_LOADER_H_
