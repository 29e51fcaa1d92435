#include "usagedb/query/query_builder.h"

#include "usagedb/query/query_engine.h"

namespace usagedb {
namespace query {

QueryBuilder::QueryBuilder(QueryEngine& engine) : engine_(engine) {}

QueryBuilder& QueryBuilder::time_range(core::Timestamp start, core::Timestamp end) {
    range_ = core::TimeRange(start, end);
    return *this;
}

QueryBuilder& QueryBuilder::where(QueryFilter filter) {
    filters_.push_back(std::move(filter));
    return *this;
}

QueryBuilder& QueryBuilder::where_and(std::vector<QueryFilter> filters) {
    for (auto& filter : filters) {
        filters_.push_back(std::move(filter));
    }
    return *this;
}

QueryBuilder& QueryBuilder::where_or(std::vector<QueryFilter> filters) {
    // No OR grouping in the engine; the filters join the conjunction
    return where_and(std::move(filters));
}

QueryBuilder& QueryBuilder::order_by(const std::string& field, SortDirection direction) {
    sorts_.push_back(SortSpec{field, direction});
    return *this;
}

QueryBuilder& QueryBuilder::group_by(const std::string& field, GroupAggregation aggregation) {
    groups_.push_back(GroupBySpec{field, aggregation});
    return *this;
}

QueryBuilder& QueryBuilder::limit(size_t count) {
    limit_ = count;
    return *this;
}

QueryBuilder& QueryBuilder::skip(size_t count) {
    skip_ = count;
    return *this;
}

QueryBuilder& QueryBuilder::select(std::vector<std::string> fields) {
    select_ = std::move(fields);
    return *this;
}

QueryOptions QueryBuilder::options() const {
    QueryOptions options;
    options.sort = sorts_;
    options.limit = limit_;
    options.skip = skip_;
    options.select = select_;
    options.time_range = range_;
    return options;
}

core::Result<std::vector<Row>> QueryBuilder::execute() const {
    auto result = engine_.query(filters_, options());
    if (!result.ok()) {
        return core::Result<std::vector<Row>>::error(result.error(), result.code());
    }
    return result.value().rows;
}

core::Result<size_t> QueryBuilder::count() const {
    QueryOptions options;
    options.time_range = range_;
    auto result = engine_.query(filters_, options);
    if (!result.ok()) {
        return core::Result<size_t>::error(result.error(), result.code());
    }
    return result.value().total_count;
}

core::Result<AggregateQueryResult> QueryBuilder::aggregate(std::optional<core::AggregationWindow> window) const {
    AggregateOptions options;
    options.time_range = range_;
    options.window = window;
    return engine_.aggregate_query(filters_, groups_, options);
}

QueryPlan QueryBuilder::explain() const {
    QueryOptions options;
    options.sort = sorts_;
    options.limit = limit_;
    options.skip = skip_;
    options.time_range = range_;
    return engine_.explain_query(filters_, options);
}

} // namespace query
} // namespace usagedb
