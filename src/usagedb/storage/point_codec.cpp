#include "usagedb/storage/point_codec.h"

#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace usagedb {
namespace storage {

namespace {

using Code = core::Error::Code;

bool ReadInt64(const rapidjson::Value& obj, const char* name, int64_t& out) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        return true;
    }
    if (it->value.IsInt64()) {
        out = it->value.GetInt64();
        return true;
    }
    if (it->value.IsNumber()) {
        out = static_cast<int64_t>(it->value.GetDouble());
        return true;
    }
    return false;
}

bool ReadDouble(const rapidjson::Value& obj, const char* name, double& out) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        return true;
    }
    if (!it->value.IsNumber()) {
        return false;
    }
    out = it->value.GetDouble();
    return true;
}

bool ReadString(const rapidjson::Value& obj, const char* name, std::string& out) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        return true;
    }
    if (!it->value.IsString()) {
        return false;
    }
    out.assign(it->value.GetString(), it->value.GetStringLength());
    return true;
}

} // namespace

core::Result<void> PointCodec::to_json(const core::UsageDataPoint& point,
                                       rapidjson::Value& out,
                                       rapidjson::Document::AllocatorType& allocator) {
    out.SetObject();
    out.AddMember("timestamp", point.timestamp, allocator);
    out.AddMember("date", rapidjson::Value(point.date.c_str(), allocator).Move(), allocator);
    out.AddMember("requestCount", point.request_count, allocator);
    out.AddMember("totalCost", point.total_cost, allocator);
    out.AddMember("dailyLimit", point.daily_limit, allocator);
    out.AddMember("usagePercentage", point.usage_percentage, allocator);
    out.AddMember("resetTime", rapidjson::Value(point.reset_time.c_str(), allocator).Move(), allocator);
    if (point.session_id) {
        out.AddMember("sessionId", rapidjson::Value(point.session_id->c_str(), allocator).Move(), allocator);
    }
    if (point.features) {
        rapidjson::Value features(rapidjson::kArrayType);
        for (const auto& feature : *point.features) {
            features.PushBack(rapidjson::Value(feature.c_str(), allocator).Move(), allocator);
        }
        out.AddMember("features", features, allocator);
    }
    if (point.metadata_json) {
        rapidjson::Document metadata;
        metadata.Parse(point.metadata_json->c_str());
        if (metadata.HasParseError() || !metadata.IsObject()) {
            return core::Result<void>::error("Point metadata at " + std::to_string(point.timestamp) +
                                             " is not a JSON object", Code::INVALID_ARGUMENT);
        }
        rapidjson::Value copy(metadata, allocator);
        out.AddMember("metadata", copy, allocator);
    }
    return core::Result<void>();
}

core::Result<core::UsageDataPoint> PointCodec::from_json(const rapidjson::Value& value) {
    using R = core::Result<core::UsageDataPoint>;
    if (!value.IsObject()) {
        return R::from_error(core::CorruptionError("Data point is not an object"));
    }
    auto ts = value.FindMember("timestamp");
    if (ts == value.MemberEnd() || !ts->value.IsNumber()) {
        return R::from_error(core::CorruptionError("Data point has no numeric timestamp"));
    }

    core::UsageDataPoint point;
    bool ok = ReadInt64(value, "timestamp", point.timestamp) &&
              ReadString(value, "date", point.date) &&
              ReadInt64(value, "requestCount", point.request_count) &&
              ReadDouble(value, "totalCost", point.total_cost) &&
              ReadInt64(value, "dailyLimit", point.daily_limit) &&
              ReadDouble(value, "usagePercentage", point.usage_percentage) &&
              ReadString(value, "resetTime", point.reset_time);
    if (!ok) {
        return R::from_error(
            core::CorruptionError("Data point at " + std::to_string(point.timestamp) + " has a mistyped field"));
    }

    auto session = value.FindMember("sessionId");
    if (session != value.MemberEnd() && !session->value.IsNull()) {
        if (!session->value.IsString()) {
            return R::from_error(core::CorruptionError("sessionId must be a string"));
        }
        point.session_id = std::string(session->value.GetString(), session->value.GetStringLength());
    }

    auto features = value.FindMember("features");
    if (features != value.MemberEnd() && !features->value.IsNull()) {
        if (!features->value.IsArray()) {
            return R::from_error(core::CorruptionError("features must be an array"));
        }
        std::vector<std::string> list;
        for (const auto& feature : features->value.GetArray()) {
            if (!feature.IsString()) {
                return R::from_error(core::CorruptionError("features must contain strings"));
            }
            list.emplace_back(feature.GetString(), feature.GetStringLength());
        }
        point.features = std::move(list);
    }

    auto metadata = value.FindMember("metadata");
    if (metadata != value.MemberEnd() && !metadata->value.IsNull()) {
        if (!metadata->value.IsObject()) {
            return R::from_error(core::CorruptionError("metadata must be an object"));
        }
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        metadata->value.Accept(writer);
        point.metadata_json = std::string(buffer.GetString(), buffer.GetSize());
    }
    return point;
}

core::Result<std::string> PointCodec::encode(const std::vector<core::UsageDataPoint>& points, bool pretty) {
    rapidjson::Document doc;
    doc.SetArray();
    auto& allocator = doc.GetAllocator();
    for (const auto& point : points) {
        rapidjson::Value value;
        auto status = to_json(point, value, allocator);
        if (!status.ok()) {
            return core::Result<std::string>::error(status.error(), status.code());
        }
        doc.PushBack(value, allocator);
    }

    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

core::Result<std::vector<core::UsageDataPoint>> PointCodec::decode(const std::string& json) {
    using R = core::Result<std::vector<core::UsageDataPoint>>;
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return R::from_error(core::CorruptionError("Malformed bucket JSON at offset " +
                                                   std::to_string(doc.GetErrorOffset()) + ": " +
                                                   rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsArray()) {
        return R::from_error(core::CorruptionError("Bucket file is not a JSON array"));
    }

    std::vector<core::UsageDataPoint> points;
    points.reserve(doc.Size());
    for (const auto& value : doc.GetArray()) {
        auto point = from_json(value);
        if (!point.ok()) {
            return R::error(point.error(), point.code());
        }
        points.push_back(point.take_value());
    }
    return points;
}

} // namespace storage
} // namespace usagedb
