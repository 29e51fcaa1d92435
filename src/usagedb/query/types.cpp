#include "usagedb/query/types.h"

#include "usagedb/core/error.h"

namespace usagedb {
namespace query {

QueryFilter::QueryFilter(const QueryFilter& other)
    : field(other.field), op(other.op), case_sensitive(other.case_sensitive) {
    value.CopyFrom(other.value, value.GetAllocator());
}

QueryFilter& QueryFilter::operator=(const QueryFilter& other) {
    if (this != &other) {
        field = other.field;
        op = other.op;
        case_sensitive = other.case_sensitive;
        value.CopyFrom(other.value, value.GetAllocator());
    }
    return *this;
}

const char* FilterOperatorName(FilterOperator op) {
    switch (op) {
        case FilterOperator::EQ: return "eq";
        case FilterOperator::NE: return "ne";
        case FilterOperator::GT: return "gt";
        case FilterOperator::GTE: return "gte";
        case FilterOperator::LT: return "lt";
        case FilterOperator::LTE: return "lte";
        case FilterOperator::IN: return "in";
        case FilterOperator::NIN: return "nin";
        case FilterOperator::EXISTS: return "exists";
        case FilterOperator::REGEX: return "regex";
        case FilterOperator::BETWEEN: return "between";
        case FilterOperator::UNKNOWN: return "unknown";
    }
    return "unknown";
}

FilterOperator ParseFilterOperator(const std::string& name) {
    static const std::map<std::string, FilterOperator> kOperators = {
        {"eq", FilterOperator::EQ},         {"ne", FilterOperator::NE},
        {"gt", FilterOperator::GT},         {"gte", FilterOperator::GTE},
        {"lt", FilterOperator::LT},         {"lte", FilterOperator::LTE},
        {"in", FilterOperator::IN},         {"nin", FilterOperator::NIN},
        {"exists", FilterOperator::EXISTS}, {"regex", FilterOperator::REGEX},
        {"between", FilterOperator::BETWEEN},
    };
    auto it = kOperators.find(name);
    return it == kOperators.end() ? FilterOperator::UNKNOWN : it->second;
}

QueryFilter Where(const std::string& field, FilterOperator op, int value) {
    QueryFilter filter(field, op);
    filter.value.SetInt64(value);
    return filter;
}

QueryFilter Where(const std::string& field, FilterOperator op, int64_t value) {
    QueryFilter filter(field, op);
    filter.value.SetInt64(value);
    return filter;
}

QueryFilter Where(const std::string& field, FilterOperator op, double value) {
    QueryFilter filter(field, op);
    filter.value.SetDouble(value);
    return filter;
}

QueryFilter Where(const std::string& field, FilterOperator op, bool value) {
    QueryFilter filter(field, op);
    filter.value.SetBool(value);
    return filter;
}

QueryFilter Where(const std::string& field, FilterOperator op, const char* value) {
    return Where(field, op, std::string(value));
}

QueryFilter Where(const std::string& field, FilterOperator op, const std::string& value) {
    QueryFilter filter(field, op);
    filter.value.SetString(value.c_str(), static_cast<rapidjson::SizeType>(value.size()),
                           filter.value.GetAllocator());
    return filter;
}

QueryFilter Where(const std::string& field, FilterOperator op, const std::vector<double>& values) {
    QueryFilter filter(field, op);
    auto& allocator = filter.value.GetAllocator();
    filter.value.SetArray();
    for (double v : values) {
        filter.value.PushBack(v, allocator);
    }
    return filter;
}

QueryFilter Where(const std::string& field, FilterOperator op, const std::vector<std::string>& values) {
    QueryFilter filter(field, op);
    auto& allocator = filter.value.GetAllocator();
    filter.value.SetArray();
    for (const auto& v : values) {
        filter.value.PushBack(rapidjson::Value(v.c_str(), allocator).Move(), allocator);
    }
    return filter;
}

QueryFilter Where(const std::string& field, FilterOperator op, const rapidjson::Value& value) {
    QueryFilter filter(field, op);
    filter.value.CopyFrom(value, filter.value.GetAllocator());
    return filter;
}

QueryFilter WhereExists(const std::string& field) {
    QueryFilter filter(field, FilterOperator::EXISTS);
    filter.value.SetBool(true);
    return filter;
}

QueryFilter WhereRegex(const std::string& field, const std::string& pattern, bool case_sensitive) {
    QueryFilter filter = Where(field, FilterOperator::REGEX, pattern);
    filter.case_sensitive = case_sensitive;
    return filter;
}

const char* GroupAggregationName(GroupAggregation agg) {
    switch (agg) {
        case GroupAggregation::COUNT: return "count";
        case GroupAggregation::SUM: return "sum";
        case GroupAggregation::AVG: return "avg";
        case GroupAggregation::MIN: return "min";
        case GroupAggregation::MAX: return "max";
    }
    return "count";
}

GroupAggregation ParseGroupAggregation(const std::string& name) {
    if (name == "count") return GroupAggregation::COUNT;
    if (name == "sum") return GroupAggregation::SUM;
    if (name == "avg") return GroupAggregation::AVG;
    if (name == "min") return GroupAggregation::MIN;
    if (name == "max") return GroupAggregation::MAX;
    throw core::InvalidArgumentError("Unsupported aggregation: " + name);
}

const char* IndexTypeName(IndexType type) {
    switch (type) {
        case IndexType::BTREE: return "btree";
        case IndexType::HASH: return "hash";
        case IndexType::TEXT: return "text";
        case IndexType::COMPOUND: return "compound";
    }
    return "btree";
}

IndexType ParseIndexType(const std::string& name) {
    if (name == "btree") return IndexType::BTREE;
    if (name == "hash") return IndexType::HASH;
    if (name == "text") return IndexType::TEXT;
    if (name == "compound") return IndexType::COMPOUND;
    throw core::InvalidArgumentError("Unsupported index type: " + name);
}

} // namespace query
} // namespace usagedb
