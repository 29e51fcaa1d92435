#ifndef USAGEDB_QUERY_QUERY_BUILDER_H_
#define USAGEDB_QUERY_QUERY_BUILDER_H_

#include <optional>
#include <string>
#include <vector>

#include "usagedb/core/result.h"
#include "usagedb/query/types.h"

namespace usagedb {
namespace query {

class QueryEngine;

/**
 * @brief Fluent request accumulator bound to a QueryEngine
 *
 * Usage:
 * ```
 * auto rows = engine.create_query()
 *                 .time_range(start, end)
 *                 .where("requestCount", FilterOperator::GT, 10)
 *                 .order_by("totalCost", SortDirection::DESC)
 *                 .limit(5)
 *                 .execute();
 * ```
 * The builder must not outlive its engine.
 */
class QueryBuilder {
public:
    explicit QueryBuilder(QueryEngine& engine);

    QueryBuilder& time_range(core::Timestamp start, core::Timestamp end);

    QueryBuilder& where(QueryFilter filter);

    template <typename T>
    QueryBuilder& where(const std::string& field, FilterOperator op, const T& value) {
        return where(Where(field, op, value));
    }

    QueryBuilder& where_and(std::vector<QueryFilter> filters);

    /**
     * @brief Adds the filters with AND semantics, exactly like where_and
     */
    QueryBuilder& where_or(std::vector<QueryFilter> filters);

    QueryBuilder& order_by(const std::string& field, SortDirection direction = SortDirection::ASC);
    QueryBuilder& group_by(const std::string& field, GroupAggregation aggregation);
    QueryBuilder& limit(size_t count);
    QueryBuilder& skip(size_t count);
    QueryBuilder& select(std::vector<std::string> fields);

    /**
     * @brief Run the query and return the page of rows
     */
    core::Result<std::vector<Row>> execute() const;

    /**
     * @brief Number of matching rows, ignoring sort, skip, limit and select
     */
    core::Result<size_t> count() const;

    /**
     * @brief Run aggregate_query with the accumulated group-by specs
     */
    core::Result<AggregateQueryResult> aggregate(
        std::optional<core::AggregationWindow> window = std::nullopt) const;

    QueryPlan explain() const;

    const std::vector<QueryFilter>& filters() const { return filters_; }
    QueryOptions options() const;

private:
    QueryEngine& engine_;
    std::vector<QueryFilter> filters_;
    std::vector<SortSpec> sorts_;
    std::vector<GroupBySpec> groups_;
    std::optional<size_t> limit_;
    std::optional<size_t> skip_;
    std::vector<std::string> select_;
    std::optional<core::TimeRange> range_;
};

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_QUERY_BUILDER_H_
