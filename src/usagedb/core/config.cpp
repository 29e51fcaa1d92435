#include "usagedb/core/config.h"

#include "usagedb/core/error.h"

namespace usagedb {
namespace core {

const char* BucketStrategyName(BucketStrategy strategy) {
    switch (strategy) {
        case BucketStrategy::DAILY: return "daily";
        case BucketStrategy::WEEKLY: return "weekly";
        case BucketStrategy::MONTHLY: return "monthly";
    }
    return "daily";
}

BucketStrategy ParseBucketStrategy(const std::string& name) {
    if (name == "daily") return BucketStrategy::DAILY;
    if (name == "weekly") return BucketStrategy::WEEKLY;
    if (name == "monthly") return BucketStrategy::MONTHLY;
    throw InvalidArgumentError("Unsupported bucket strategy: " + name);
}

} // namespace core
} // namespace usagedb
