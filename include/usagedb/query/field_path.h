#ifndef USAGEDB_QUERY_FIELD_PATH_H_
#define USAGEDB_QUERY_FIELD_PATH_H_

#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace usagedb {
namespace query {

/**
 * @brief Split "a.b.c" into its segments
 */
std::vector<std::string> SplitFieldPath(const std::string& path);

/**
 * @brief Resolve a dot separated path inside a JSON value
 * @return The value, or nullptr (undefined) when a segment is missing or an
 *         intermediate value is not an object
 */
const rapidjson::Value* ResolveField(const rapidjson::Value& root, const std::string& path);

/**
 * @brief Assign value at path, creating (or replacing non-object)
 *        intermediate objects. A null value pointer leaves the leaf absent.
 */
void SetField(rapidjson::Value& root, const std::string& path, const rapidjson::Value* value,
              rapidjson::Document::AllocatorType& allocator);

/**
 * @brief Strict equality: same JSON type and same value
 *
 * Numbers compare by value regardless of integer or floating storage.
 * Arrays and objects never compare equal. nullptr is undefined and equals
 * only nullptr.
 */
bool StrictEquals(const rapidjson::Value* a, const rapidjson::Value* b);

/**
 * @brief String form of a value for grouping and mixed type ordering
 *
 * undefined -> "undefined", null -> "null", integral numbers without a
 * fraction, arrays comma joined, objects "[object Object]".
 */
std::string DisplayString(const rapidjson::Value* value);

/**
 * @brief Three way ordering used by sorting
 *
 * Two numbers compare numerically, two strings lexically, other strictly
 * unequal pairs by their display strings.
 */
int CompareValues(const rapidjson::Value* a, const rapidjson::Value* b);

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_FIELD_PATH_H_
