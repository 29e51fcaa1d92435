#include "usagedb/query/cost_estimator.h"

#include <algorithm>

namespace usagedb {
namespace query {

QueryPlan HeuristicCostEstimator::explain(const std::vector<QueryFilter>& filters,
                                          const QueryOptions& options,
                                          const IndexCatalog& indexes) const {
    QueryPlan plan;
    double cost = kBaseCost;

    for (const auto& filter : filters) {
        plan.filter_order.push_back(filter.field);
        if (indexes.contains(filter.field)) {
            plan.indexes_used.push_back(filter.field);
            cost -= kIndexedFilterCredit;
        }
    }

    cost += kSortKeyCost * static_cast<double>(options.sort.size());
    if (options.limit && *options.limit > 0) {
        cost = std::min(cost, kLimitRowCost * static_cast<double>(*options.limit));
    }

    plan.estimated_cost = std::max(cost, kMinimumCost);
    plan.buckets_scan = 1;
    plan.sort_required = !options.sort.empty();
    plan.aggregation_required = false;
    return plan;
}

} // namespace query
} // namespace usagedb
