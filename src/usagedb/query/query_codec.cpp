#include "usagedb/query/query_codec.h"

#include <string>

#include "usagedb/core/error.h"

namespace usagedb {
namespace query {

namespace {

using Code = core::Error::Code;

rapidjson::Value Str(const std::string& s, QueryCodec::Allocator& allocator) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator);
}

const rapidjson::Value* Member(const rapidjson::Value& object, const char* name) {
    auto it = object.FindMember(name);
    return it == object.MemberEnd() ? nullptr : &it->value;
}

bool ReadString(const rapidjson::Value& object, const char* name, std::string& out) {
    const auto* v = Member(object, name);
    if (!v || !v->IsString()) {
        return false;
    }
    out.assign(v->GetString(), v->GetStringLength());
    return true;
}

// Optional string member; absent leaves out untouched
bool ReadOptionalString(const rapidjson::Value& object, const char* name, std::string& out) {
    const auto* v = Member(object, name);
    if (!v) {
        return true;
    }
    return ReadString(object, name, out);
}

bool ReadSize(const rapidjson::Value& value, size_t& out) {
    if (value.IsUint64()) {
        out = static_cast<size_t>(value.GetUint64());
        return true;
    }
    return false;
}

bool ReadBool(const rapidjson::Value& object, const char* name, bool& out) {
    const auto* v = Member(object, name);
    if (!v) {
        return true;
    }
    if (!v->IsBool()) {
        return false;
    }
    out = v->GetBool();
    return true;
}

bool ReadTimestamp(const rapidjson::Value& value, core::Timestamp& out) {
    if (value.IsInt64()) {
        out = value.GetInt64();
        return true;
    }
    if (value.IsNumber()) {
        out = static_cast<core::Timestamp>(value.GetDouble());
        return true;
    }
    return false;
}

template <typename T>
core::Result<T> Corrupt(const std::string& what) {
    return core::Result<T>::from_error(core::CorruptionError(what));
}

} // namespace

void QueryCodec::filter_to_json(const QueryFilter& filter, rapidjson::Value& out, Allocator& allocator) {
    out.SetObject();
    out.AddMember("field", Str(filter.field, allocator).Move(), allocator);
    out.AddMember("operator", rapidjson::StringRef(FilterOperatorName(filter.op)), allocator);
    rapidjson::Value value(filter.value, allocator);
    out.AddMember("value", value, allocator);
    if (filter.op == FilterOperator::REGEX) {
        out.AddMember("caseSensitive", filter.case_sensitive, allocator);
    }
}

core::Result<QueryFilter> QueryCodec::filter_from_json(const rapidjson::Value& value) {
    if (!value.IsObject()) {
        return Corrupt<QueryFilter>("filter is not an object");
    }
    QueryFilter filter;
    std::string op;
    if (!ReadString(value, "field", filter.field) || !ReadString(value, "operator", op)) {
        return Corrupt<QueryFilter>("filter needs string field and operator");
    }
    filter.op = ParseFilterOperator(op);
    if (const auto* operand = Member(value, "value")) {
        filter.value.CopyFrom(*operand, filter.value.GetAllocator());
    }
    if (!ReadBool(value, "caseSensitive", filter.case_sensitive)) {
        return Corrupt<QueryFilter>("caseSensitive must be a boolean");
    }
    return filter;
}

void QueryCodec::options_to_json(const QueryOptions& options, rapidjson::Value& out, Allocator& allocator) {
    out.SetObject();

    rapidjson::Value sort(rapidjson::kArrayType);
    for (const auto& spec : options.sort) {
        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("field", Str(spec.field, allocator).Move(), allocator);
        entry.AddMember("direction",
                        rapidjson::StringRef(spec.direction == SortDirection::DESC ? "desc" : "asc"), allocator);
        sort.PushBack(entry, allocator);
    }
    out.AddMember("sort", sort, allocator);

    if (options.limit) {
        out.AddMember("limit", static_cast<uint64_t>(*options.limit), allocator);
    }
    if (options.skip) {
        out.AddMember("skip", static_cast<uint64_t>(*options.skip), allocator);
    }

    rapidjson::Value select(rapidjson::kArrayType);
    for (const auto& field : options.select) {
        select.PushBack(Str(field, allocator).Move(), allocator);
    }
    out.AddMember("select", select, allocator);

    rapidjson::Value range(rapidjson::kObjectType);
    if (options.time_range) {
        range.AddMember("start", options.time_range->start, allocator);
        range.AddMember("end", options.time_range->end, allocator);
    }
    out.AddMember("timeRange", range, allocator);
}

core::Result<QueryOptions> QueryCodec::options_from_json(const rapidjson::Value& value) {
    if (!value.IsObject()) {
        return Corrupt<QueryOptions>("options is not an object");
    }
    QueryOptions options;

    if (const auto* sort = Member(value, "sort")) {
        if (!sort->IsArray()) {
            return Corrupt<QueryOptions>("sort must be an array");
        }
        for (const auto& entry : sort->GetArray()) {
            SortSpec spec;
            std::string direction = "asc";
            if (!entry.IsObject() || !ReadString(entry, "field", spec.field) ||
                !ReadOptionalString(entry, "direction", direction)) {
                return Corrupt<QueryOptions>("sort entries need a string field");
            }
            if (direction != "asc" && direction != "desc") {
                return Corrupt<QueryOptions>("sort direction must be asc or desc");
            }
            spec.direction = direction == "desc" ? SortDirection::DESC : SortDirection::ASC;
            options.sort.push_back(std::move(spec));
        }
    }

    if (const auto* limit = Member(value, "limit")) {
        size_t n = 0;
        if (!ReadSize(*limit, n)) {
            return Corrupt<QueryOptions>("limit must be a non-negative integer");
        }
        options.limit = n;
    }
    if (const auto* skip = Member(value, "skip")) {
        size_t n = 0;
        if (!ReadSize(*skip, n)) {
            return Corrupt<QueryOptions>("skip must be a non-negative integer");
        }
        options.skip = n;
    }

    if (const auto* select = Member(value, "select")) {
        if (!select->IsArray()) {
            return Corrupt<QueryOptions>("select must be an array");
        }
        for (const auto& field : select->GetArray()) {
            if (!field.IsString()) {
                return Corrupt<QueryOptions>("select entries must be strings");
            }
            options.select.emplace_back(field.GetString(), field.GetStringLength());
        }
    }

    if (const auto* range = Member(value, "timeRange")) {
        if (!range->IsObject()) {
            return Corrupt<QueryOptions>("timeRange must be an object");
        }
        const auto* start = Member(*range, "start");
        const auto* end = Member(*range, "end");
        if (start || end) {
            core::TimeRange tr;
            if (!start || !end || !ReadTimestamp(*start, tr.start) || !ReadTimestamp(*end, tr.end)) {
                return Corrupt<QueryOptions>("timeRange needs numeric start and end");
            }
            options.time_range = tr;
        }
    }
    return options;
}

void QueryCodec::request_to_json(const QueryRequest& request, rapidjson::Value& out, Allocator& allocator) {
    out.SetObject();
    rapidjson::Value filters(rapidjson::kArrayType);
    for (const auto& filter : request.filters) {
        rapidjson::Value entry;
        filter_to_json(filter, entry, allocator);
        filters.PushBack(entry, allocator);
    }
    out.AddMember("filters", filters, allocator);

    rapidjson::Value options;
    options_to_json(request.options, options, allocator);
    out.AddMember("options", options, allocator);
}

core::Result<QueryRequest> QueryCodec::request_from_json(const rapidjson::Value& value) {
    if (!value.IsObject()) {
        return Corrupt<QueryRequest>("query is not an object");
    }
    QueryRequest request;
    if (const auto* filters = Member(value, "filters")) {
        if (!filters->IsArray()) {
            return Corrupt<QueryRequest>("filters must be an array");
        }
        for (const auto& entry : filters->GetArray()) {
            auto filter = filter_from_json(entry);
            if (!filter.ok()) {
                return Corrupt<QueryRequest>(filter.error());
            }
            request.filters.push_back(filter.take_value());
        }
    }
    if (const auto* options = Member(value, "options")) {
        auto parsed = options_from_json(*options);
        if (!parsed.ok()) {
            return Corrupt<QueryRequest>(parsed.error());
        }
        request.options = parsed.take_value();
    }
    return request;
}

void QueryCodec::index_to_json(const IndexSpec& spec, rapidjson::Value& out, Allocator& allocator) {
    out.SetObject();
    out.AddMember("field", Str(spec.field, allocator).Move(), allocator);
    out.AddMember("type", rapidjson::StringRef(IndexTypeName(spec.type)), allocator);
    out.AddMember("unique", spec.unique, allocator);
    out.AddMember("sparse", spec.sparse, allocator);
    out.AddMember("background", spec.background, allocator);
}

core::Result<IndexSpec> QueryCodec::index_from_json(const rapidjson::Value& value) {
    if (!value.IsObject()) {
        return Corrupt<IndexSpec>("index spec is not an object");
    }
    IndexSpec spec;
    std::string type = IndexTypeName(spec.type);
    if (!ReadString(value, "field", spec.field) || !ReadOptionalString(value, "type", type)) {
        return Corrupt<IndexSpec>("index spec needs a string field");
    }
    try {
        spec.type = ParseIndexType(type);
    } catch (const core::InvalidArgumentError& e) {
        return Corrupt<IndexSpec>(e.what());
    }
    if (!ReadBool(value, "unique", spec.unique) || !ReadBool(value, "sparse", spec.sparse) ||
        !ReadBool(value, "background", spec.background)) {
        return Corrupt<IndexSpec>("index flags must be booleans");
    }
    return spec;
}

void QueryCodec::saved_query_to_json(const SavedQuery& query, rapidjson::Value& out, Allocator& allocator) {
    request_to_json(query.request, out, allocator);
    out.AddMember("id", Str(query.id, allocator).Move(), allocator);
    out.AddMember("name", Str(query.name, allocator).Move(), allocator);
    out.AddMember("description", Str(query.description, allocator).Move(), allocator);
    out.AddMember("createdAt", query.created_at, allocator);
    if (query.last_executed) {
        out.AddMember("lastExecuted", *query.last_executed, allocator);
    }
}

core::Result<SavedQuery> QueryCodec::saved_query_from_json(const rapidjson::Value& value) {
    auto request = request_from_json(value);
    if (!request.ok()) {
        return Corrupt<SavedQuery>(request.error());
    }
    SavedQuery query;
    query.request = request.take_value();
    if (!ReadString(value, "id", query.id) || !ReadOptionalString(value, "name", query.name) ||
        !ReadOptionalString(value, "description", query.description)) {
        return Corrupt<SavedQuery>("saved query needs a string id");
    }
    if (const auto* created = Member(value, "createdAt")) {
        if (!ReadTimestamp(*created, query.created_at)) {
            return Corrupt<SavedQuery>("createdAt must be a number");
        }
    }
    if (const auto* executed = Member(value, "lastExecuted")) {
        core::Timestamp ts = 0;
        if (!ReadTimestamp(*executed, ts)) {
            return Corrupt<SavedQuery>("lastExecuted must be a number");
        }
        query.last_executed = ts;
    }
    return query;
}

void QueryCodec::template_to_json(const QueryTemplate& tmpl, rapidjson::Value& out, Allocator& allocator) {
    request_to_json(tmpl.request, out, allocator);
    out.AddMember("id", Str(tmpl.id, allocator).Move(), allocator);
    out.AddMember("name", Str(tmpl.name, allocator).Move(), allocator);
    out.AddMember("description", Str(tmpl.description, allocator).Move(), allocator);
    rapidjson::Value parameters(rapidjson::kArrayType);
    for (const auto& parameter : tmpl.parameters) {
        parameters.PushBack(Str(parameter, allocator).Move(), allocator);
    }
    out.AddMember("parameters", parameters, allocator);
}

core::Result<QueryTemplate> QueryCodec::template_from_json(const rapidjson::Value& value) {
    auto request = request_from_json(value);
    if (!request.ok()) {
        return Corrupt<QueryTemplate>(request.error());
    }
    QueryTemplate tmpl;
    tmpl.request = request.take_value();
    if (!ReadString(value, "id", tmpl.id) || !ReadOptionalString(value, "name", tmpl.name) ||
        !ReadOptionalString(value, "description", tmpl.description)) {
        return Corrupt<QueryTemplate>("template needs a string id");
    }
    if (const auto* parameters = Member(value, "parameters")) {
        if (!parameters->IsArray()) {
            return Corrupt<QueryTemplate>("parameters must be an array");
        }
        for (const auto& parameter : parameters->GetArray()) {
            if (!parameter.IsString()) {
                return Corrupt<QueryTemplate>("parameters must be strings");
            }
            tmpl.parameters.emplace_back(parameter.GetString(), parameter.GetStringLength());
        }
    }
    return tmpl;
}

} // namespace query
} // namespace usagedb
