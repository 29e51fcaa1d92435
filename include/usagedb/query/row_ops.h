#ifndef USAGEDB_QUERY_ROW_OPS_H_
#define USAGEDB_QUERY_ROW_OPS_H_

#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "usagedb/query/types.h"

namespace usagedb {
namespace query {

/**
 * @brief Evaluate one filter against a row
 *
 * eq/ne are strict. gt/gte/lt/lte need numbers on both sides. in/nin need
 * an array operand (false otherwise, also for nin). exists means present and
 * not null. regex needs a string field and a string pattern; an invalid
 * pattern never matches. between needs a two element array and a numeric
 * field and is inclusive. UNKNOWN passes every row.
 *
 * @param logger Receives debug messages for unknown operators and bad
 *               patterns; may be null
 */
bool EvaluateFilter(const rapidjson::Value& row, const QueryFilter& filter, spdlog::logger* logger = nullptr);

/**
 * @brief Keep rows that satisfy every filter
 */
std::vector<Row> ApplyFilters(const std::vector<Row>& rows, const std::vector<QueryFilter>& filters,
                              spdlog::logger* logger = nullptr);

/**
 * @brief Stable multi-key sort; the first key that differs decides
 */
void ApplySorting(std::vector<Row>& rows, const std::vector<SortSpec>& sort);

/**
 * @brief Replace every row with an object holding only the selected paths
 *
 * Paths missing from a row are left out of its projection.
 */
std::vector<Row> ApplyProjection(const std::vector<Row>& rows, const std::vector<std::string>& fields);

/**
 * @brief Group rows by the display strings of the group_by fields
 *
 * Emits one row per group, in first-seen order, holding each group field as
 * a string plus one "<field>_<aggregation>" value per entry. sum/avg/min/max
 * consider numeric values only and yield 0 when there are none. An empty
 * group_by returns rows unchanged.
 */
std::vector<Row> PerformGrouping(const std::vector<Row>& rows, const std::vector<GroupBySpec>& group_by);

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_ROW_OPS_H_
