#include "usagedb/query/query_engine.h"

#include <algorithm>
#include <chrono>
#include <filesystem>

#include <spdlog/fmt/fmt.h>

#include "usagedb/common/logger.h"
#include "usagedb/query/cache_key.h"
#include "usagedb/query/row_ops.h"
#include "usagedb/storage/file_util.h"
#include "usagedb/storage/point_codec.h"

namespace usagedb {
namespace query {

namespace fs = std::filesystem;

namespace {

using Code = core::Error::Code;
using SteadyClock = std::chrono::steady_clock;

int64_t ElapsedMs(SteadyClock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start).count();
}

core::Result<std::vector<Row>> PointsToRows(const std::vector<core::UsageDataPoint>& points) {
    std::vector<Row> rows;
    rows.reserve(points.size());
    for (const auto& point : points) {
        auto doc = std::make_shared<rapidjson::Document>();
        auto status = storage::PointCodec::to_json(point, *doc, doc->GetAllocator());
        if (!status.ok()) {
            return core::Result<std::vector<Row>>::error(status.error(), status.code());
        }
        rows.push_back(std::move(doc));
    }
    return rows;
}

core::Result<std::vector<core::UsageDataPoint>> RowsToPoints(const std::vector<Row>& rows) {
    std::vector<core::UsageDataPoint> points;
    points.reserve(rows.size());
    for (const auto& row : rows) {
        auto point = storage::PointCodec::from_json(*row);
        if (!point.ok()) {
            return core::Result<std::vector<core::UsageDataPoint>>::error(point.error(), point.code());
        }
        points.push_back(point.take_value());
    }
    return points;
}

} // namespace

QueryEngine::QueryEngine(std::shared_ptr<storage::UsageStorage> storage,
                         std::shared_ptr<AggregationEngine> aggregation,
                         core::QueryEngineConfig config,
                         std::shared_ptr<spdlog::logger> logger,
                         std::unique_ptr<CostEstimator> estimator)
    : storage_(std::move(storage)),
      aggregation_(std::move(aggregation)),
      config_(std::move(config)),
      logger_(logger ? std::move(logger) : common::MakeLogger("query")),
      estimator_(std::move(estimator)),
      indexes_((fs::path(config_.base_dir) / "indexes" / "indexes.json").string()),
      saved_((fs::path(config_.base_dir) / "saved-queries").string()),
      cache_(config_.cache.max_size, config_.cache.ttl, config_.clock),
      initialized_(false) {
    if (!storage_) {
        throw core::InvalidArgumentError("QueryEngine needs a storage backend");
    }
    if (!config_.clock) {
        config_.clock = core::SystemClock();
    }
    if (!estimator_) {
        estimator_ = std::make_unique<HeuristicCostEstimator>();
    }
    auto status = init();
    if (!status.ok()) {
        logger_->warn("Query engine catalogs not loaded, retrying on first use: {}", status.error());
    }
}

core::Result<void> QueryEngine::init() {
    if (initialized_) {
        return core::Result<void>();
    }
    const fs::path base(config_.base_dir);
    for (const auto& dir : {base / "indexes", base / "query-cache", base / "saved-queries"}) {
        auto status = storage::EnsureDirectory(dir.string());
        if (!status.ok()) {
            logger_->error("Failed to initialize query engine: {}", status.error());
            return status;
        }
    }

    auto status = indexes_.load();
    if (!status.ok()) {
        logger_->error("Failed to load indexes: {}", status.error());
        return status;
    }
    status = saved_.load();
    if (!status.ok()) {
        logger_->error("Failed to load saved queries: {}", status.error());
        return status;
    }

    initialized_ = true;
    logger_->info("Query engine initialized with {} indexes, {} saved queries, {} templates",
                  indexes_.size(), saved_.list_queries().size(), saved_.list_templates().size());
    return core::Result<void>();
}

QueryBuilder QueryEngine::create_query() {
    return QueryBuilder(*this);
}

core::Result<QueryResult> QueryEngine::query(const std::vector<QueryFilter>& filters, const QueryOptions& options) {
    using R = core::Result<QueryResult>;
    auto start = SteadyClock::now();
    auto status = init();
    if (!status.ok()) {
        return R::error(status.error(), status.code());
    }

    const std::string key = CacheKeyFor(filters, options);
    if (config_.cache.enabled) {
        if (auto cached = cache_.get(key)) {
            QueryResult result = *cached;
            QueryExecutionStats stats;
            stats.execution_time_ms = ElapsedMs(start);
            stats.rows_returned = result.rows.size();
            stats.bucket_access = 0;
            stats.full_scans = 0;
            stats.cache_hits = 1;
            result.stats = stats;
            track_execution(key, stats);
            logger_->debug("Query {} served from cache", key);
            return result;
        }
    }

    const core::TimeRange range = options.time_range ? *options.time_range : core::TimeRange(0, now());
    auto points = storage_->query(storage::QueryRange(range.start, range.end));
    if (!points.ok()) {
        logger_->error("Query {} failed reading storage: {}", key, points.error());
        return R::error(points.error(), points.code());
    }
    auto rows = PointsToRows(points.value());
    if (!rows.ok()) {
        return R::error(rows.error(), rows.code());
    }

    std::vector<Row> data = ApplyFilters(rows.value(), filters, logger_.get());
    ApplySorting(data, options.sort);
    const size_t total_count = data.size();

    const size_t skip = options.skip.value_or(0);
    const size_t limit = options.limit.value_or(0);
    size_t begin = std::min(skip, data.size());
    size_t end = limit > 0 ? std::min(data.size(), begin + limit) : data.size();
    data = std::vector<Row>(data.begin() + begin, data.begin() + end);
    data = ApplyProjection(data, options.select);

    QueryResult result;
    result.rows = std::move(data);
    result.total_count = total_count;
    result.has_more = limit > 0 && result.rows.size() == limit;

    QueryExecutionStats& stats = result.stats;
    stats.rows_scanned = total_count;
    stats.rows_returned = result.rows.size();
    stats.cache_misses = 1;
    for (const auto& filter : filters) {
        if (indexes_.contains(filter.field)) {
            stats.index_seeks++;
            stats.indexed_fields.push_back(filter.field);
        }
    }
    stats.execution_time_ms = ElapsedMs(start);

    if (config_.cache.enabled) {
        cache_.put(key, std::make_shared<const QueryResult>(result));
    }
    track_execution(key, stats);

    if (stats.execution_time_ms > config_.slow_query_threshold_ms) {
        logger_->warn("Slow query {}: {}ms, {} rows scanned", key, stats.execution_time_ms, stats.rows_scanned);
    }
    return result;
}

core::Result<AggregateQueryResult> QueryEngine::aggregate_query(const std::vector<QueryFilter>& filters,
                                                                const std::vector<GroupBySpec>& group_by,
                                                                const AggregateOptions& options) {
    using R = core::Result<AggregateQueryResult>;
    auto start = SteadyClock::now();

    QueryOptions raw_options;
    raw_options.time_range = options.time_range;
    auto raw = query(filters, raw_options);
    if (!raw.ok()) {
        return R::error(raw.error(), raw.code());
    }

    AggregateQueryResult result;
    result.stats = raw.value().stats;
    const auto& rows = raw.value().rows;
    if (rows.empty()) {
        result.stats.execution_time_ms = ElapsedMs(start);
        return result;
    }

    if (options.window) {
        if (!aggregation_) {
            return R::error("No aggregation engine configured for windowed aggregation", Code::INVALID_ARGUMENT);
        }
        auto points = RowsToPoints(rows);
        if (!points.ok()) {
            return R::error(points.error(), points.code());
        }

        AggregationConfig config;
        config.windows = {*options.window};
        auto windows = aggregation_->aggregate(points.value(), config);
        if (!windows.ok()) {
            logger_->error("Aggregation over {} points failed: {}", points.value().size(), windows.error());
            return R::error(windows.error(), windows.code());
        }
        result.windows = windows.take_value();
        result.total_count = result.windows.size();
    } else {
        result.rows = PerformGrouping(rows, group_by);
        result.total_count = result.rows.size();
    }
    result.stats.execution_time_ms = ElapsedMs(start);
    return result;
}

QueryPlan QueryEngine::explain_query(const std::vector<QueryFilter>& filters, const QueryOptions& options) const {
    return estimator_->explain(filters, options, indexes_);
}

core::Result<void> QueryEngine::create_index(const IndexSpec& spec) {
    auto status = init();
    if (!status.ok()) {
        return status;
    }
    if (spec.field.empty()) {
        return core::Result<void>::error("Index needs a field", Code::INVALID_ARGUMENT);
    }
    indexes_.put(spec);
    status = indexes_.save();
    if (!status.ok()) {
        return status;
    }
    logger_->info("Created index on field: {}", spec.field);
    return core::Result<void>();
}

core::Result<void> QueryEngine::drop_index(const std::string& field) {
    auto status = init();
    if (!status.ok()) {
        return status;
    }
    indexes_.erase(field);
    status = indexes_.save();
    if (!status.ok()) {
        return status;
    }
    logger_->info("Dropped index on field: {}", field);
    return core::Result<void>();
}

std::vector<IndexSpec> QueryEngine::list_indexes() const {
    return indexes_.list();
}

void QueryEngine::track_execution(const std::string& key, const QueryExecutionStats& stats) {
    auto& executions = history_[key];
    executions.push_back(stats);
    while (executions.size() > config_.history_limit) {
        executions.pop_front();
    }
}

QueryEngineStats QueryEngine::get_stats() const {
    QueryEngineStats stats;
    int64_t total_time = 0;
    uint64_t cache_hits = 0;
    uint64_t cache_requests = 0;
    std::map<std::string, uint64_t> seeks;

    for (const auto& [key, executions] : history_) {
        for (const auto& execution : executions) {
            stats.total_queries++;
            total_time += execution.execution_time_ms;
            cache_hits += execution.cache_hits;
            cache_requests += execution.cache_hits + execution.cache_misses;
            if (execution.execution_time_ms > config_.slow_query_threshold_ms) {
                stats.slow_queries++;
            }
            for (const auto& field : execution.indexed_fields) {
                seeks[field]++;
            }
        }
    }

    if (stats.total_queries > 0) {
        stats.average_execution_time = static_cast<double>(total_time) / static_cast<double>(stats.total_queries);
    }
    if (cache_requests > 0) {
        stats.cache_hit_ratio = static_cast<double>(cache_hits) / static_cast<double>(cache_requests);
    }
    for (const auto& spec : indexes_.list()) {
        auto it = seeks.find(spec.field);
        stats.index_utilization[spec.field] = it == seeks.end() ? 0 : it->second;
    }
    return stats;
}

OptimizationReport QueryEngine::optimize() const {
    OptimizationReport report;

    for (const auto& [key, executions] : history_) {
        if (executions.empty()) {
            continue;
        }
        double total = 0;
        for (const auto& execution : executions) {
            total += static_cast<double>(execution.execution_time_ms);
        }
        const double average = total / static_cast<double>(executions.size());
        if (average > static_cast<double>(config_.optimize_threshold_ms)) {
            report.slow_queries.push_back(key);
            report.optimization_recommendations.push_back(
                fmt::format("Query {} averages {:.2f}ms - consider adding indexes", key, average));
        }
    }

    if (get_stats().total_queries > config_.index_suggestion_threshold) {
        IndexSpec timestamp;
        timestamp.field = "timestamp";
        timestamp.type = IndexType::BTREE;
        report.suggested_indexes.push_back(timestamp);

        IndexSpec session;
        session.field = "sessionId";
        session.type = IndexType::HASH;
        session.sparse = true;
        report.suggested_indexes.push_back(session);
    }
    return report;
}

void QueryEngine::clear_cache() {
    cache_.clear();
    logger_->info("Query cache cleared");
}

void QueryEngine::configure_cache(const CacheConfigUpdate& update) {
    auto& cache = config_.cache;
    if (update.enabled) {
        cache.enabled = *update.enabled;
    }
    if (update.max_size) {
        cache_.set_max_size(*update.max_size);
        cache.max_size = *update.max_size;
    }
    if (update.ttl) {
        cache.ttl = *update.ttl;
        cache_.set_ttl(cache.ttl);
    }
    if (update.key_fields) {
        cache.key_fields = *update.key_fields;
    }
    if (update.invalidate_on_write) {
        cache.invalidate_on_write = *update.invalidate_on_write;
    }
    if (!update.enabled.value_or(false)) {
        clear_cache();
    }
    logger_->info("Cache configuration updated (enabled={}, max_size={}, ttl={}ms)",
                  cache.enabled, cache.max_size, cache.ttl);
}

void QueryEngine::notify_write() {
    if (config_.cache.invalidate_on_write && cache_.size() > 0) {
        logger_->debug("Storage changed, dropping {} cached results", cache_.size());
        cache_.clear();
    }
}

core::Result<void> QueryEngine::save_query(const SavedQuery& query) {
    auto status = init();
    if (!status.ok()) {
        return status;
    }
    SavedQuery stored = query;
    if (stored.created_at == 0) {
        stored.created_at = now();
    }
    return saved_.save_query(stored);
}

core::Result<SavedQuery> QueryEngine::get_saved_query(const std::string& id) const {
    const SavedQuery* query = saved_.find_query(id);
    if (!query) {
        return core::Result<SavedQuery>::error("No saved query " + id, Code::NOT_FOUND);
    }
    return *query;
}

std::vector<SavedQuery> QueryEngine::list_saved_queries() const {
    return saved_.list_queries();
}

core::Result<void> QueryEngine::delete_saved_query(const std::string& id) {
    auto status = init();
    if (!status.ok()) {
        return status;
    }
    return saved_.delete_query(id);
}

core::Result<QueryResult> QueryEngine::execute_saved_query(const std::string& id) {
    using R = core::Result<QueryResult>;
    auto status = init();
    if (!status.ok()) {
        return R::error(status.error(), status.code());
    }
    const SavedQuery* saved = saved_.find_query(id);
    if (!saved) {
        return R::error("No saved query " + id, Code::NOT_FOUND);
    }
    const QueryRequest request = saved->request;
    auto result = query(request.filters, request.options);
    if (!result.ok()) {
        return result;
    }
    auto marked = saved_.mark_executed(id, now());
    if (!marked.ok()) {
        logger_->warn("Failed to record execution of saved query {}: {}", id, marked.error());
    }
    return result;
}

core::Result<void> QueryEngine::save_template(const QueryTemplate& tmpl) {
    auto status = init();
    if (!status.ok()) {
        return status;
    }
    return saved_.save_template(tmpl);
}

std::vector<QueryTemplate> QueryEngine::list_templates() const {
    return saved_.list_templates();
}

core::Result<QueryRequest> QueryEngine::instantiate_template(const std::string& id,
                                                             const rapidjson::Value& params) const {
    return saved_.instantiate(id, params);
}

std::unique_ptr<QueryEngine> CreateQueryEngine(std::shared_ptr<storage::UsageStorage> storage,
                                               std::shared_ptr<AggregationEngine> aggregation,
                                               const core::QueryEngineConfig& config,
                                               std::shared_ptr<spdlog::logger> logger) {
    return std::make_unique<QueryEngine>(std::move(storage), std::move(aggregation), config, std::move(logger));
}

} // namespace query
} // namespace usagedb
