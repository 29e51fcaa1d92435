#include "usagedb/query/row_ops.h"

#include <algorithm>
#include <map>
#include <regex>

#include "usagedb/query/field_path.h"

namespace usagedb {
namespace query {

namespace {

double Number(const rapidjson::Value& v) {
    if (v.IsInt64()) {
        return static_cast<double>(v.GetInt64());
    }
    if (v.IsUint64()) {
        return static_cast<double>(v.GetUint64());
    }
    return v.GetDouble();
}

bool CompareNumbers(const rapidjson::Value* field, const rapidjson::Value& operand, FilterOperator op) {
    if (!field || !field->IsNumber() || !operand.IsNumber()) {
        return false;
    }
    const double lhs = Number(*field);
    const double rhs = Number(operand);
    switch (op) {
        case FilterOperator::GT: return lhs > rhs;
        case FilterOperator::GTE: return lhs >= rhs;
        case FilterOperator::LT: return lhs < rhs;
        case FilterOperator::LTE: return lhs <= rhs;
        default: return false;
    }
}

bool Contains(const rapidjson::Value& array, const rapidjson::Value* field) {
    for (const auto& element : array.GetArray()) {
        if (StrictEquals(&element, field)) {
            return true;
        }
    }
    return false;
}

bool MatchesRegex(const rapidjson::Value* field, const QueryFilter& filter, spdlog::logger* logger) {
    if (!field || !field->IsString() || !filter.value.IsString()) {
        return false;
    }
    auto flags = std::regex::ECMAScript;
    if (!filter.case_sensitive) {
        flags |= std::regex::icase;
    }
    try {
        std::regex pattern(filter.value.GetString(), flags);
        return std::regex_search(field->GetString(), pattern);
    } catch (const std::regex_error& e) {
        if (logger) {
            logger->debug("Invalid regex '{}' on field {}: {}", filter.value.GetString(), filter.field, e.what());
        }
        return false;
    }
}

std::shared_ptr<rapidjson::Document> NewObjectRow() {
    auto doc = std::make_shared<rapidjson::Document>();
    doc->SetObject();
    return doc;
}

} // namespace

bool EvaluateFilter(const rapidjson::Value& row, const QueryFilter& filter, spdlog::logger* logger) {
    const rapidjson::Value* field = ResolveField(row, filter.field);
    const rapidjson::Value& operand = filter.value;

    switch (filter.op) {
        case FilterOperator::EQ:
            return StrictEquals(field, &operand);
        case FilterOperator::NE:
            return !StrictEquals(field, &operand);
        case FilterOperator::GT:
        case FilterOperator::GTE:
        case FilterOperator::LT:
        case FilterOperator::LTE:
            return CompareNumbers(field, operand, filter.op);
        case FilterOperator::IN:
            return operand.IsArray() && Contains(operand, field);
        case FilterOperator::NIN:
            return operand.IsArray() && !Contains(operand, field);
        case FilterOperator::EXISTS:
            return field != nullptr && !field->IsNull();
        case FilterOperator::REGEX:
            return MatchesRegex(field, filter, logger);
        case FilterOperator::BETWEEN:
            if (operand.IsArray() && operand.Size() == 2 && field && field->IsNumber() &&
                operand[0].IsNumber() && operand[1].IsNumber()) {
                const double v = Number(*field);
                return v >= Number(operand[0]) && v <= Number(operand[1]);
            }
            return false;
        case FilterOperator::UNKNOWN:
            if (logger) {
                logger->debug("Unknown operator on field {}, filter passes", filter.field);
            }
            return true;
    }
    return true;
}

std::vector<Row> ApplyFilters(const std::vector<Row>& rows, const std::vector<QueryFilter>& filters,
                              spdlog::logger* logger) {
    if (filters.empty()) {
        return rows;
    }
    std::vector<Row> kept;
    for (const auto& row : rows) {
        bool pass = std::all_of(filters.begin(), filters.end(), [&](const QueryFilter& filter) {
            return EvaluateFilter(*row, filter, logger);
        });
        if (pass) {
            kept.push_back(row);
        }
    }
    return kept;
}

void ApplySorting(std::vector<Row>& rows, const std::vector<SortSpec>& sort) {
    if (sort.empty()) {
        return;
    }
    std::stable_sort(rows.begin(), rows.end(), [&sort](const Row& a, const Row& b) {
        for (const auto& spec : sort) {
            int c = CompareValues(ResolveField(*a, spec.field), ResolveField(*b, spec.field));
            if (c != 0) {
                return spec.direction == SortDirection::DESC ? c > 0 : c < 0;
            }
        }
        return false;
    });
}

std::vector<Row> ApplyProjection(const std::vector<Row>& rows, const std::vector<std::string>& fields) {
    if (fields.empty()) {
        return rows;
    }
    std::vector<Row> projected;
    projected.reserve(rows.size());
    for (const auto& row : rows) {
        auto doc = NewObjectRow();
        for (const auto& field : fields) {
            SetField(*doc, field, ResolveField(*row, field), doc->GetAllocator());
        }
        projected.push_back(std::move(doc));
    }
    return projected;
}

std::vector<Row> PerformGrouping(const std::vector<Row>& rows, const std::vector<GroupBySpec>& group_by) {
    if (group_by.empty()) {
        return rows;
    }

    struct Group {
        std::vector<std::string> key_parts;
        std::vector<Row> members;
    };
    std::vector<Group> groups;
    std::map<std::string, size_t> positions;

    for (const auto& row : rows) {
        std::vector<std::string> parts;
        std::string key;
        for (size_t i = 0; i < group_by.size(); ++i) {
            parts.push_back(DisplayString(ResolveField(*row, group_by[i].field)));
            key += (i == 0 ? "" : "|") + parts.back();
        }
        auto it = positions.find(key);
        if (it == positions.end()) {
            positions.emplace(key, groups.size());
            groups.push_back(Group{std::move(parts), {}});
            groups.back().members.push_back(row);
        } else {
            groups[it->second].members.push_back(row);
        }
    }

    std::vector<Row> results;
    results.reserve(groups.size());
    for (const auto& group : groups) {
        auto doc = NewObjectRow();
        auto& allocator = doc->GetAllocator();

        for (size_t i = 0; i < group_by.size(); ++i) {
            rapidjson::Value value(group.key_parts[i].c_str(), allocator);
            SetField(*doc, group_by[i].field, &value, allocator);
        }

        for (const auto& spec : group_by) {
            std::vector<double> values;
            for (const auto& member : group.members) {
                const rapidjson::Value* v = ResolveField(*member, spec.field);
                if (v && v->IsNumber()) {
                    values.push_back(Number(*v));
                }
            }

            double result = 0.0;
            switch (spec.aggregation) {
                case GroupAggregation::COUNT:
                    result = static_cast<double>(group.members.size());
                    break;
                case GroupAggregation::SUM:
                    for (double v : values) {
                        result += v;
                    }
                    break;
                case GroupAggregation::AVG:
                    for (double v : values) {
                        result += v;
                    }
                    result = values.empty() ? 0.0 : result / static_cast<double>(values.size());
                    break;
                case GroupAggregation::MIN:
                    result = values.empty() ? 0.0 : *std::min_element(values.begin(), values.end());
                    break;
                case GroupAggregation::MAX:
                    result = values.empty() ? 0.0 : *std::max_element(values.begin(), values.end());
                    break;
            }

            const std::string column = spec.field + "_" + GroupAggregationName(spec.aggregation);
            rapidjson::Value value;
            if (spec.aggregation == GroupAggregation::COUNT) {
                value.SetUint64(group.members.size());
            } else {
                value.SetDouble(result);
            }
            doc->RemoveMember(column.c_str());
            doc->AddMember(rapidjson::Value(column.c_str(), allocator).Move(), value, allocator);
        }
        results.push_back(std::move(doc));
    }
    return results;
}

} // namespace query
} // namespace usagedb
