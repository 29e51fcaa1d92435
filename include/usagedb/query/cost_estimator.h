#ifndef USAGEDB_QUERY_COST_ESTIMATOR_H_
#define USAGEDB_QUERY_COST_ESTIMATOR_H_

#include <vector>

#include "usagedb/query/index_catalog.h"
#include "usagedb/query/types.h"

namespace usagedb {
namespace query {

/**
 * @brief Produces the plan reported by QueryEngine::explain_query
 */
class CostEstimator {
public:
    virtual ~CostEstimator() = default;

    virtual QueryPlan explain(const std::vector<QueryFilter>& filters,
                              const QueryOptions& options,
                              const IndexCatalog& indexes) const = 0;
};

/**
 * @brief Fixed heuristic model
 *
 * Base cost 1000, -200 per filter on an indexed field, +100 per sort key,
 * capped at limit * 10 when a limit is set, never below 10. Filters are
 * evaluated in the order given.
 */
class HeuristicCostEstimator : public CostEstimator {
public:
    static constexpr double kBaseCost = 1000;
    static constexpr double kIndexedFilterCredit = 200;
    static constexpr double kSortKeyCost = 100;
    static constexpr double kLimitRowCost = 10;
    static constexpr double kMinimumCost = 10;

    QueryPlan explain(const std::vector<QueryFilter>& filters,
                      const QueryOptions& options,
                      const IndexCatalog& indexes) const override;
};

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_COST_ESTIMATOR_H_
