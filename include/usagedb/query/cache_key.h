#ifndef USAGEDB_QUERY_CACHE_KEY_H_
#define USAGEDB_QUERY_CACHE_KEY_H_

#include <string>
#include <vector>

#include "usagedb/query/types.h"

namespace usagedb {
namespace query {

/**
 * @brief Canonical JSON text of a query: {"filters": [...], "options": {...}}
 *
 * Filters are stably ordered by field name so their order does not matter;
 * sort and select keep the caller's order.
 */
std::string QuerySignature(const std::vector<QueryFilter>& filters, const QueryOptions& options);

/**
 * @brief 32-bit string hash (hash * 31 + unit) rendered in base 36
 *
 * The signature is read as UTF-8 and hashed over its UTF-16 code units, so
 * characters outside the BMP contribute a surrogate pair. Negative hashes
 * carry a leading '-'.
 */
std::string HashSignature(const std::string& signature);

/**
 * @brief HashSignature(QuerySignature(filters, options))
 */
std::string CacheKeyFor(const std::vector<QueryFilter>& filters, const QueryOptions& options);

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_CACHE_KEY_H_
