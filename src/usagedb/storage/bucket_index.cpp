#include "usagedb/storage/bucket_index.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "usagedb/storage/file_util.h"

namespace usagedb {
namespace storage {

namespace {

using Code = core::Error::Code;

core::Result<StorageBucket> BucketFromJson(const std::string& key, const rapidjson::Value& value) {
    using R = core::Result<StorageBucket>;
    auto bad = [&key](const std::string& what) {
        return R::from_error(core::CorruptionError("Index entry " + key + ": " + what));
    };
    if (!value.IsObject()) {
        return bad("descriptor is not an object");
    }

    StorageBucket bucket;
    auto range = value.FindMember("timeRange");
    if (range == value.MemberEnd() || !range->value.IsObject()) {
        return bad("missing timeRange");
    }
    auto start = range->value.FindMember("start");
    auto end = range->value.FindMember("end");
    if (start == range->value.MemberEnd() || !start->value.IsNumber() ||
        end == range->value.MemberEnd() || !end->value.IsNumber()) {
        return bad("timeRange needs numeric start and end");
    }
    bucket.time_range.start = start->value.IsInt64() ? start->value.GetInt64()
                                                     : static_cast<int64_t>(start->value.GetDouble());
    bucket.time_range.end = end->value.IsInt64() ? end->value.GetInt64()
                                                 : static_cast<int64_t>(end->value.GetDouble());

    auto granularity = value.FindMember("granularity");
    if (granularity == value.MemberEnd() || !granularity->value.IsString()) {
        return bad("missing granularity");
    }
    try {
        bucket.granularity = core::ParseGranularity(granularity->value.GetString());
    } catch (const core::InvalidArgumentError& e) {
        return bad(e.what());
    }

    auto file_path = value.FindMember("filePath");
    if (file_path == value.MemberEnd() || !file_path->value.IsString()) {
        return bad("missing filePath");
    }
    bucket.file_path = file_path->value.GetString();

    auto level = value.FindMember("compressionLevel");
    if (level != value.MemberEnd()) {
        if (!level->value.IsInt()) {
            return bad("compressionLevel must be an integer");
        }
        bucket.compression_level = level->value.GetInt();
    }

    auto encrypted = value.FindMember("encrypted");
    if (encrypted != value.MemberEnd()) {
        if (!encrypted->value.IsBool()) {
            return bad("encrypted must be a boolean");
        }
        bucket.encrypted = encrypted->value.GetBool();
    }
    return bucket;
}

} // namespace

BucketIndex::BucketIndex(std::string index_path) : index_path_(std::move(index_path)) {}

core::Result<void> BucketIndex::load() {
    buckets_.clear();

    auto contents = ReadWholeFile(index_path_);
    if (!contents.ok()) {
        if (contents.code() == Code::NOT_FOUND) {
            return core::Result<void>();
        }
        return core::Result<void>::error(contents.error(), contents.code());
    }

    rapidjson::Document doc;
    doc.Parse(contents.value().c_str(), contents.value().size());
    if (doc.HasParseError()) {
        return core::Result<void>::from_error(core::CorruptionError(
            "Malformed bucket index " + index_path_ + ": " + rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return core::Result<void>::from_error(
            core::CorruptionError("Bucket index " + index_path_ + " is not an object"));
    }

    auto entries = doc.FindMember("buckets");
    if (entries == doc.MemberEnd()) {
        return core::Result<void>();
    }
    if (!entries->value.IsArray()) {
        return core::Result<void>::from_error(core::CorruptionError("Bucket index buckets must be an array"));
    }

    Map loaded;
    for (const auto& entry : entries->value.GetArray()) {
        if (!entry.IsArray() || entry.Size() != 2 || !entry[0].IsString()) {
            return core::Result<void>::from_error(
                core::CorruptionError("Bucket index entries must be [key, bucket] pairs"));
        }
        std::string key = entry[0].GetString();
        auto bucket = BucketFromJson(key, entry[1]);
        if (!bucket.ok()) {
            return core::Result<void>::error(bucket.error(), bucket.code());
        }
        loaded[key] = bucket.take_value();
    }
    buckets_ = std::move(loaded);
    return core::Result<void>();
}

core::Result<void> BucketIndex::save(core::Timestamp now) const {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    rapidjson::Value entries(rapidjson::kArrayType);
    for (const auto& [key, bucket] : buckets_) {
        rapidjson::Value range(rapidjson::kObjectType);
        range.AddMember("start", bucket.time_range.start, allocator);
        range.AddMember("end", bucket.time_range.end, allocator);

        rapidjson::Value descriptor(rapidjson::kObjectType);
        descriptor.AddMember("timeRange", range, allocator);
        descriptor.AddMember("granularity",
                             rapidjson::StringRef(core::GranularityName(bucket.granularity)), allocator);
        descriptor.AddMember("filePath", rapidjson::Value(bucket.file_path.c_str(), allocator).Move(), allocator);
        descriptor.AddMember("compressionLevel", bucket.compression_level, allocator);
        descriptor.AddMember("encrypted", bucket.encrypted, allocator);

        rapidjson::Value pair(rapidjson::kArrayType);
        pair.PushBack(rapidjson::Value(key.c_str(), allocator).Move(), allocator);
        pair.PushBack(descriptor, allocator);
        entries.PushBack(pair, allocator);
    }
    doc.AddMember("buckets", entries, allocator);
    doc.AddMember("lastUpdated", now, allocator);
    doc.AddMember("version", rapidjson::StringRef(kVersion), allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);
    return WriteWholeFile(index_path_, std::string(buffer.GetString(), buffer.GetSize()));
}

const StorageBucket* BucketIndex::find(const std::string& key) const {
    auto it = buckets_.find(key);
    return it == buckets_.end() ? nullptr : &it->second;
}

StorageBucket* BucketIndex::find(const std::string& key) {
    auto it = buckets_.find(key);
    return it == buckets_.end() ? nullptr : &it->second;
}

void BucketIndex::put(const std::string& key, StorageBucket bucket) {
    buckets_[key] = std::move(bucket);
}

bool BucketIndex::erase(const std::string& key) {
    return buckets_.erase(key) > 0;
}

void BucketIndex::clear() {
    buckets_.clear();
}

std::vector<std::pair<std::string, StorageBucket>> BucketIndex::intersecting(const core::TimeRange& range) const {
    std::vector<std::pair<std::string, StorageBucket>> result;
    for (const auto& [key, bucket] : buckets_) {
        if (bucket.time_range.start <= range.end && bucket.time_range.end >= range.start) {
            result.emplace_back(key, bucket);
        }
    }
    return result;
}

} // namespace storage
} // namespace usagedb
