#ifndef USAGEDB_QUERY_AGGREGATION_ENGINE_H_
#define USAGEDB_QUERY_AGGREGATION_ENGINE_H_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "usagedb/core/result.h"
#include "usagedb/core/types.h"

namespace usagedb {
namespace query {

/**
 * @brief Settings handed to an AggregationEngine
 */
struct AggregationConfig {
    std::vector<core::AggregationWindow> windows;
    bool calculate_percentiles = true;
    std::vector<int> percentile_levels = {25, 50, 75, 90, 95, 99};
    double confidence_level = 0.95;
    bool track_feature_distribution = true;
    bool track_time_patterns = true;
    bool include_advanced_stats = true;
    size_t batch_size = 1000;
    size_t min_data_points = 1;
    bool outlier_detection = false;
    double outlier_threshold = 2.0;
};

struct StatisticalSummary {
    double mean = 0.0;
    double median = 0.0;
    double min = 0.0;
    double max = 0.0;
    double std_dev = 0.0;
    double sum = 0.0;
    uint64_t count = 0;
    std::map<int, double> percentiles;   // level -> value
};

/**
 * @brief Statistics of the points in one window
 */
struct AggregationResult {
    core::AggregationWindow window = core::AggregationWindow::DAY;
    core::Timestamp window_start = 0;
    core::Timestamp window_end = 0;
    uint64_t data_points = 0;
    StatisticalSummary cost;
    StatisticalSummary requests;
    StatisticalSummary usage_percentage;
    uint64_t session_count = 0;
    std::map<std::string, uint64_t> feature_distribution;
};

/**
 * @brief Statistical rollups over usage points, supplied by the embedder
 *
 * QueryEngine::aggregate_query delegates windowed aggregations here.
 */
class AggregationEngine {
public:
    virtual ~AggregationEngine() = default;

    virtual core::Result<std::vector<AggregationResult>> aggregate(
        const std::vector<core::UsageDataPoint>& points,
        const AggregationConfig& config) = 0;
};

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_AGGREGATION_ENGINE_H_
