#ifndef USAGEDB_QUERY_TYPES_H_
#define USAGEDB_QUERY_TYPES_H_

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "usagedb/core/types.h"
#include "usagedb/query/aggregation_engine.h"

namespace usagedb {
namespace query {

/**
 * @brief One result row, the JSON form of a data point or of a projection
 *
 * Rows are immutable and shared between cached results and callers.
 */
using Row = std::shared_ptr<const rapidjson::Document>;

enum class FilterOperator {
    EQ,
    NE,
    GT,
    GTE,
    LT,
    LTE,
    IN,
    NIN,
    EXISTS,
    REGEX,
    BETWEEN,
    UNKNOWN     // Any other operator name; evaluates to true
};

const char* FilterOperatorName(FilterOperator op);

/**
 * @brief Map "eq", "gte", ... to the enum; unrecognized names map to UNKNOWN
 */
FilterOperator ParseFilterOperator(const std::string& name);

/**
 * @brief {field, operator, value} condition on a row
 *
 * field is a dot separated path into the row. value holds the JSON operand:
 * a scalar for comparisons, an array for in/nin/between, a pattern string
 * for regex. Filters are combined with AND.
 */
struct QueryFilter {
    std::string field;
    FilterOperator op = FilterOperator::EQ;
    rapidjson::Document value;
    bool case_sensitive = false;   // regex only

    QueryFilter() = default;
    QueryFilter(std::string f, FilterOperator o) : field(std::move(f)), op(o) {}
    QueryFilter(const QueryFilter& other);
    QueryFilter& operator=(const QueryFilter& other);
    QueryFilter(QueryFilter&& other) = default;
    QueryFilter& operator=(QueryFilter&& other) = default;
};

// Convenience constructors for filters
QueryFilter Where(const std::string& field, FilterOperator op, int value);
QueryFilter Where(const std::string& field, FilterOperator op, int64_t value);
QueryFilter Where(const std::string& field, FilterOperator op, double value);
QueryFilter Where(const std::string& field, FilterOperator op, bool value);
QueryFilter Where(const std::string& field, FilterOperator op, const char* value);
QueryFilter Where(const std::string& field, FilterOperator op, const std::string& value);
QueryFilter Where(const std::string& field, FilterOperator op, const std::vector<double>& values);
QueryFilter Where(const std::string& field, FilterOperator op, const std::vector<std::string>& values);
QueryFilter Where(const std::string& field, FilterOperator op, const rapidjson::Value& value);
QueryFilter WhereExists(const std::string& field);
QueryFilter WhereRegex(const std::string& field, const std::string& pattern, bool case_sensitive = false);

enum class SortDirection {
    ASC,
    DESC
};

struct SortSpec {
    std::string field;
    SortDirection direction = SortDirection::ASC;
};

enum class GroupAggregation {
    COUNT,
    SUM,
    AVG,
    MIN,
    MAX
};

const char* GroupAggregationName(GroupAggregation agg);
GroupAggregation ParseGroupAggregation(const std::string& name);

/**
 * @brief Group rows by field and fold field with the aggregation
 */
struct GroupBySpec {
    std::string field;
    GroupAggregation aggregation = GroupAggregation::COUNT;
};

/**
 * @brief Options of a row query
 *
 * A limit or skip of 0 is the same as none. An empty select returns whole
 * rows. Without a time range the query covers [0, now].
 */
struct QueryOptions {
    std::vector<SortSpec> sort;
    std::optional<size_t> limit;
    std::optional<size_t> skip;
    std::vector<std::string> select;
    std::optional<core::TimeRange> time_range;
};

struct AggregateOptions {
    std::optional<core::TimeRange> time_range;
    std::optional<core::AggregationWindow> window;
};

/**
 * @brief Filters plus options, as stored by saved queries and templates
 */
struct QueryRequest {
    std::vector<QueryFilter> filters;
    QueryOptions options;
};

enum class IndexType {
    BTREE,
    HASH,
    TEXT,
    COMPOUND
};

const char* IndexTypeName(IndexType type);
IndexType ParseIndexType(const std::string& name);

/**
 * @brief Planning hint on a row field; nothing is physically indexed
 */
struct IndexSpec {
    std::string field;
    IndexType type = IndexType::BTREE;
    bool unique = false;
    bool sparse = false;
    bool background = true;

    bool operator==(const IndexSpec& other) const {
        return field == other.field && type == other.type && unique == other.unique &&
               sparse == other.sparse && background == other.background;
    }
};

struct QueryExecutionStats {
    int64_t execution_time_ms = 0;
    uint64_t rows_scanned = 0;
    uint64_t rows_returned = 0;
    uint64_t bucket_access = 1;
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
    uint64_t index_seeks = 0;
    uint64_t full_scans = 1;
    std::vector<std::string> indexed_fields;   // filter fields credited with a seek
};

struct QueryResult {
    std::vector<Row> rows;
    size_t total_count = 0;    // matching rows before skip/limit
    bool has_more = false;     // a limit was given and exactly limit rows came back
    QueryExecutionStats stats;
};

/**
 * @brief Output of aggregate_query
 *
 * Windowed aggregations fill windows; group-by aggregations fill rows.
 */
struct AggregateQueryResult {
    std::vector<Row> rows;
    std::vector<AggregationResult> windows;
    size_t total_count = 0;
    QueryExecutionStats stats;
};

struct QueryPlan {
    double estimated_cost = 0;
    std::vector<std::string> indexes_used;
    uint64_t buckets_scan = 1;
    std::vector<std::string> filter_order;
    bool sort_required = false;
    bool aggregation_required = false;
};

struct QueryEngineStats {
    uint64_t total_queries = 0;
    double average_execution_time = 0.0;
    double cache_hit_ratio = 0.0;
    uint64_t slow_queries = 0;
    std::map<std::string, uint64_t> index_utilization;
};

struct OptimizationReport {
    std::vector<IndexSpec> suggested_indexes;
    std::vector<std::string> slow_queries;
    std::vector<std::string> optimization_recommendations;
};

/**
 * @brief Partial cache configuration; unset members keep their value
 */
struct CacheConfigUpdate {
    std::optional<bool> enabled;
    std::optional<size_t> max_size;
    std::optional<core::Duration> ttl;
    std::optional<std::vector<std::string>> key_fields;
    std::optional<bool> invalidate_on_write;
};

struct SavedQuery {
    std::string id;
    std::string name;
    std::string description;
    QueryRequest request;
    core::Timestamp created_at = 0;
    std::optional<core::Timestamp> last_executed;
};

/**
 * @brief Parameterized query
 *
 * A filter value that is exactly the string "{{name}}" is replaced by the
 * parameter called name when the template is instantiated. Every name in
 * parameters must be supplied.
 */
struct QueryTemplate {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> parameters;
    QueryRequest request;
};

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_TYPES_H_
