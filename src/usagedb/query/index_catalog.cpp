#include "usagedb/query/index_catalog.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "usagedb/query/query_codec.h"
#include "usagedb/storage/file_util.h"

namespace usagedb {
namespace query {

using Code = core::Error::Code;

IndexCatalog::IndexCatalog(std::string path) : path_(std::move(path)) {}

core::Result<void> IndexCatalog::load() {
    specs_.clear();
    auto contents = storage::ReadWholeFile(path_);
    if (!contents.ok()) {
        if (contents.code() == Code::NOT_FOUND) {
            return core::Result<void>();
        }
        return core::Result<void>::error(contents.error(), contents.code());
    }

    rapidjson::Document doc;
    doc.Parse(contents.value().c_str(), contents.value().size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return core::Result<void>::from_error(
            core::CorruptionError("Malformed index catalog " + path_ + ": " +
                                  (doc.HasParseError() ? rapidjson::GetParseError_En(doc.GetParseError())
                                                       : "not an object")));
    }

    std::map<std::string, IndexSpec> loaded;
    for (const auto& member : doc.GetObject()) {
        auto spec = QueryCodec::index_from_json(member.value);
        if (!spec.ok()) {
            return core::Result<void>::error(path_ + ": " + spec.error(), spec.code());
        }
        loaded[member.name.GetString()] = spec.take_value();
    }
    specs_ = std::move(loaded);
    return core::Result<void>();
}

core::Result<void> IndexCatalog::save() const {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();
    for (const auto& [field, spec] : specs_) {
        rapidjson::Value entry;
        QueryCodec::index_to_json(spec, entry, allocator);
        doc.AddMember(rapidjson::Value(field.c_str(), allocator).Move(), entry, allocator);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);
    return storage::WriteWholeFile(path_, std::string(buffer.GetString(), buffer.GetSize()));
}

void IndexCatalog::put(const IndexSpec& spec) {
    specs_[spec.field] = spec;
}

bool IndexCatalog::erase(const std::string& field) {
    return specs_.erase(field) > 0;
}

std::vector<IndexSpec> IndexCatalog::list() const {
    std::vector<IndexSpec> result;
    result.reserve(specs_.size());
    for (const auto& [field, spec] : specs_) {
        result.push_back(spec);
    }
    return result;
}

} // namespace query
} // namespace usagedb
