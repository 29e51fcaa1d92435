#include "usagedb/query/saved_query_store.h"

#include <filesystem>

#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "usagedb/query/query_codec.h"
#include "usagedb/storage/file_util.h"

namespace usagedb {
namespace query {

namespace {

using Code = core::Error::Code;

// Reads an object keyed by id whose values decode with from_json
template <typename T, typename Decoder>
core::Result<void> LoadKeyed(const std::string& path, std::map<std::string, T>& out, Decoder from_json) {
    out.clear();
    auto contents = storage::ReadWholeFile(path);
    if (!contents.ok()) {
        if (contents.code() == Code::NOT_FOUND) {
            return core::Result<void>();
        }
        return core::Result<void>::error(contents.error(), contents.code());
    }

    rapidjson::Document doc;
    doc.Parse(contents.value().c_str(), contents.value().size());
    if (doc.HasParseError()) {
        return core::Result<void>::from_error(
            core::CorruptionError(path + ": " + rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return core::Result<void>::from_error(core::CorruptionError(path + ": not an object"));
    }

    std::map<std::string, T> loaded;
    for (const auto& member : doc.GetObject()) {
        auto item = from_json(member.value);
        if (!item.ok()) {
            return core::Result<void>::error(path + ": " + item.error(), item.code());
        }
        loaded.emplace(member.name.GetString(), item.take_value());
    }
    out = std::move(loaded);
    return core::Result<void>();
}

template <typename T, typename Encoder>
core::Result<void> WriteKeyed(const std::string& path, const std::map<std::string, T>& items, Encoder to_json) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();
    for (const auto& [id, item] : items) {
        rapidjson::Value entry;
        to_json(item, entry, allocator);
        doc.AddMember(rapidjson::Value(id.c_str(), allocator).Move(), entry, allocator);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);
    return storage::WriteWholeFile(path, std::string(buffer.GetString(), buffer.GetSize()));
}

// "{{name}}" -> name
bool PlaceholderName(const rapidjson::Value& value, std::string& name) {
    if (!value.IsString()) {
        return false;
    }
    std::string text(value.GetString(), value.GetStringLength());
    if (text.size() < 5 || text.compare(0, 2, "{{") != 0 || text.compare(text.size() - 2, 2, "}}") != 0) {
        return false;
    }
    name = text.substr(2, text.size() - 4);
    return true;
}

core::Result<void> Substitute(rapidjson::Value& value, const rapidjson::Value& params,
                              rapidjson::Document::AllocatorType& allocator) {
    std::string name;
    if (PlaceholderName(value, name)) {
        auto it = params.FindMember(name.c_str());
        if (it == params.MemberEnd()) {
            return core::Result<void>::error("Missing template parameter: " + name, Code::INVALID_ARGUMENT);
        }
        value.CopyFrom(it->value, allocator);
        return core::Result<void>();
    }
    if (value.IsArray()) {
        for (auto& element : value.GetArray()) {
            auto status = Substitute(element, params, allocator);
            if (!status.ok()) {
                return status;
            }
        }
    }
    return core::Result<void>();
}

} // namespace

SavedQueryStore::SavedQueryStore(std::string directory)
    : queries_path_((std::filesystem::path(directory) / "saved-queries.json").string()),
      templates_path_((std::filesystem::path(directory) / "templates.json").string()) {}

core::Result<void> SavedQueryStore::load() {
    auto status = LoadKeyed(queries_path_, queries_, &QueryCodec::saved_query_from_json);
    if (!status.ok()) {
        return status;
    }
    return LoadKeyed(templates_path_, templates_, &QueryCodec::template_from_json);
}

core::Result<void> SavedQueryStore::write_queries() const {
    return WriteKeyed(queries_path_, queries_, &QueryCodec::saved_query_to_json);
}

core::Result<void> SavedQueryStore::write_templates() const {
    return WriteKeyed(templates_path_, templates_, &QueryCodec::template_to_json);
}

core::Result<void> SavedQueryStore::save_query(const SavedQuery& query) {
    if (query.id.empty()) {
        return core::Result<void>::error("Saved query needs an id", Code::INVALID_ARGUMENT);
    }
    queries_[query.id] = query;
    return write_queries();
}

const SavedQuery* SavedQueryStore::find_query(const std::string& id) const {
    auto it = queries_.find(id);
    return it == queries_.end() ? nullptr : &it->second;
}

std::vector<SavedQuery> SavedQueryStore::list_queries() const {
    std::vector<SavedQuery> result;
    for (const auto& [id, query] : queries_) {
        result.push_back(query);
    }
    return result;
}

core::Result<void> SavedQueryStore::delete_query(const std::string& id) {
    if (queries_.erase(id) == 0) {
        return core::Result<void>::from_error(core::NotFoundError("No saved query " + id));
    }
    return write_queries();
}

core::Result<void> SavedQueryStore::mark_executed(const std::string& id, core::Timestamp when) {
    auto it = queries_.find(id);
    if (it == queries_.end()) {
        return core::Result<void>::from_error(core::NotFoundError("No saved query " + id));
    }
    it->second.last_executed = when;
    return write_queries();
}

core::Result<void> SavedQueryStore::save_template(const QueryTemplate& tmpl) {
    if (tmpl.id.empty()) {
        return core::Result<void>::error("Template needs an id", Code::INVALID_ARGUMENT);
    }
    templates_[tmpl.id] = tmpl;
    return write_templates();
}

const QueryTemplate* SavedQueryStore::find_template(const std::string& id) const {
    auto it = templates_.find(id);
    return it == templates_.end() ? nullptr : &it->second;
}

std::vector<QueryTemplate> SavedQueryStore::list_templates() const {
    std::vector<QueryTemplate> result;
    for (const auto& [id, tmpl] : templates_) {
        result.push_back(tmpl);
    }
    return result;
}

core::Result<QueryRequest> SavedQueryStore::instantiate(const std::string& id, const rapidjson::Value& params) const {
    using R = core::Result<QueryRequest>;
    const QueryTemplate* tmpl = find_template(id);
    if (!tmpl) {
        return R::from_error(core::NotFoundError("No query template " + id));
    }
    if (!params.IsObject()) {
        return R::error("Template parameters must be an object", Code::INVALID_ARGUMENT);
    }
    for (const auto& parameter : tmpl->parameters) {
        if (!params.HasMember(parameter.c_str())) {
            return R::error("Missing template parameter: " + parameter, Code::INVALID_ARGUMENT);
        }
    }

    QueryRequest request = tmpl->request;
    for (auto& filter : request.filters) {
        auto status = Substitute(filter.value, params, filter.value.GetAllocator());
        if (!status.ok()) {
            return R::error(status.error(), status.code());
        }
    }
    return request;
}

} // namespace query
} // namespace usagedb
