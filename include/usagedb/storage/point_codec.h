#ifndef USAGEDB_STORAGE_POINT_CODEC_H_
#define USAGEDB_STORAGE_POINT_CODEC_H_

#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "usagedb/core/result.h"
#include "usagedb/core/types.h"

namespace usagedb {
namespace storage {

/**
 * @brief JSON representation of usage data points
 *
 * Field names: timestamp, date, requestCount, totalCost, dailyLimit,
 * usagePercentage, resetTime, sessionId, features, metadata. Optional fields
 * are omitted when absent.
 */
class PointCodec {
public:
    /**
     * @brief Encode a point array as the contents of a bucket file
     * @param pretty Indent with two spaces, as bucket files are written
     * @return JSON text, or INVALID_ARGUMENT when a point carries metadata
     *         that is not a JSON object
     */
    static core::Result<std::string> encode(const std::vector<core::UsageDataPoint>& points, bool pretty = true);

    /**
     * @brief Decode the contents of a bucket file
     * @return Points, or DATA_CORRUPTION when the text is not an array of points
     */
    static core::Result<std::vector<core::UsageDataPoint>> decode(const std::string& json);

    /**
     * @brief Build the JSON object for a single point
     */
    static core::Result<void> to_json(const core::UsageDataPoint& point,
                                      rapidjson::Value& out,
                                      rapidjson::Document::AllocatorType& allocator);

    /**
     * @brief Read a single point from a JSON object
     */
    static core::Result<core::UsageDataPoint> from_json(const rapidjson::Value& value);
};

} // namespace storage
} // namespace usagedb

#endif // USAGEDB_STORAGE_POINT_CODEC_H_
