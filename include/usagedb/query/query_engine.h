#ifndef USAGEDB_QUERY_QUERY_ENGINE_H_
#define USAGEDB_QUERY_QUERY_ENGINE_H_

#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <rapidjson/document.h>
#include <spdlog/logger.h>

#include "usagedb/core/config.h"
#include "usagedb/core/result.h"
#include "usagedb/query/aggregation_engine.h"
#include "usagedb/query/cost_estimator.h"
#include "usagedb/query/index_catalog.h"
#include "usagedb/query/query_builder.h"
#include "usagedb/query/query_cache.h"
#include "usagedb/query/saved_query_store.h"
#include "usagedb/query/types.h"
#include "usagedb/storage/storage.h"

namespace usagedb {
namespace query {

/**
 * @brief Filtering, sorting, grouping and paging over a UsageStorage
 *
 * Rows are the JSON form of stored points. Results are cached by query
 * signature (see CacheKeyFor) and every execution is recorded per signature
 * for get_stats() and optimize(). Index specs only influence planning and
 * statistics.
 *
 * Layout under config.base_dir:
 *   indexes/indexes.json
 *   query-cache/                     reserved
 *   saved-queries/saved-queries.json
 *   saved-queries/templates.json
 *
 * Not thread safe.
 */
class QueryEngine {
public:
    /**
     * @param storage     Source of points; required
     * @param aggregation Used for windowed aggregate queries; may be null,
     *                    in which case those queries fail
     * @param estimator   Cost model for explain_query; defaults to
     *                    HeuristicCostEstimator
     *
     * Loads the persisted index and saved-query catalogs. A load failure is
     * logged and retried by the next operation that calls init().
     */
    QueryEngine(std::shared_ptr<storage::UsageStorage> storage,
                std::shared_ptr<AggregationEngine> aggregation,
                core::QueryEngineConfig config = core::QueryEngineConfig::Default(),
                std::shared_ptr<spdlog::logger> logger = nullptr,
                std::unique_ptr<CostEstimator> estimator = nullptr);

    QueryEngine(const QueryEngine&) = delete;
    QueryEngine& operator=(const QueryEngine&) = delete;

    /**
     * @brief Create the directory layout and load the catalogs
     *
     * Called by the constructor and again by operations that touch
     * persisted state until it succeeds.
     */
    core::Result<void> init();

    QueryBuilder create_query();

    /**
     * @brief Filter, sort, page and project rows of the time range
     *
     * A live cached result for the same signature is returned without
     * reading storage.
     */
    core::Result<QueryResult> query(const std::vector<QueryFilter>& filters,
                                    const QueryOptions& options = QueryOptions());

    /**
     * @brief Aggregate the filtered rows of the time range
     *
     * With a window the points go to the AggregationEngine; without one the
     * rows are grouped by group_by (see PerformGrouping).
     */
    core::Result<AggregateQueryResult> aggregate_query(const std::vector<QueryFilter>& filters,
                                                       const std::vector<GroupBySpec>& group_by,
                                                       const AggregateOptions& options = AggregateOptions());

    QueryPlan explain_query(const std::vector<QueryFilter>& filters,
                            const QueryOptions& options = QueryOptions()) const;

    core::Result<void> create_index(const IndexSpec& spec);
    core::Result<void> drop_index(const std::string& field);
    std::vector<IndexSpec> list_indexes() const;

    QueryEngineStats get_stats() const;
    OptimizationReport optimize() const;

    void clear_cache();

    /**
     * @brief Merge update into the cache configuration
     *
     * Unless the update explicitly enables the cache, the cache is cleared.
     * @throws core::InvalidArgumentError for a max_size of 0
     */
    void configure_cache(const CacheConfigUpdate& update);

    /**
     * @brief Tell the engine that storage changed underneath it
     *
     * Clears the cache when invalidate_on_write is set.
     */
    void notify_write();

    // Saved queries and templates
    core::Result<void> save_query(const SavedQuery& query);
    core::Result<SavedQuery> get_saved_query(const std::string& id) const;
    std::vector<SavedQuery> list_saved_queries() const;
    core::Result<void> delete_saved_query(const std::string& id);
    core::Result<QueryResult> execute_saved_query(const std::string& id);

    core::Result<void> save_template(const QueryTemplate& tmpl);
    std::vector<QueryTemplate> list_templates() const;
    core::Result<QueryRequest> instantiate_template(const std::string& id, const rapidjson::Value& params) const;

    const core::CacheConfig& cache_config() const { return config_.cache; }
    size_t cache_size() const { return cache_.size(); }
    const core::QueryEngineConfig& config() const { return config_; }

private:
    void track_execution(const std::string& key, const QueryExecutionStats& stats);
    core::Timestamp now() const { return config_.clock(); }

    std::shared_ptr<storage::UsageStorage> storage_;
    std::shared_ptr<AggregationEngine> aggregation_;
    core::QueryEngineConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<CostEstimator> estimator_;

    IndexCatalog indexes_;
    SavedQueryStore saved_;
    QueryCache cache_;
    std::map<std::string, std::deque<QueryExecutionStats>> history_;
    bool initialized_;
};

/**
 * @brief Create a query engine over storage
 */
std::unique_ptr<QueryEngine> CreateQueryEngine(std::shared_ptr<storage::UsageStorage> storage,
                                               std::shared_ptr<AggregationEngine> aggregation,
                                               const core::QueryEngineConfig& config,
                                               std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_QUERY_ENGINE_H_
