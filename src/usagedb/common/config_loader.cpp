#include "usagedb/common/config_loader.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "usagedb/storage/file_util.h"

namespace usagedb {
namespace common {

namespace {

using Code = core::Error::Code;

class Reader {
public:
    Reader(const rapidjson::Value& object, std::string section)
        : object_(object), section_(std::move(section)) {}

    const rapidjson::Value* find(const char* name) const {
        auto it = object_.FindMember(name);
        return it == object_.MemberEnd() ? nullptr : &it->value;
    }

    void string(const char* name, std::string& out) {
        if (const auto* v = find(name)) {
            if (!v->IsString()) {
                fail(name, "a string");
                return;
            }
            out.assign(v->GetString(), v->GetStringLength());
        }
    }

    void boolean(const char* name, bool& out) {
        if (const auto* v = find(name)) {
            if (!v->IsBool()) {
                fail(name, "a boolean");
                return;
            }
            out = v->GetBool();
        }
    }

    template <typename T>
    void integer(const char* name, T& out, int64_t min) {
        if (const auto* v = find(name)) {
            if (!v->IsInt64() || v->GetInt64() < min) {
                fail(name, "an integer >= " + std::to_string(min));
                return;
            }
            out = static_cast<T>(v->GetInt64());
        }
    }

    void strings(const char* name, std::vector<std::string>& out) {
        if (const auto* v = find(name)) {
            if (!v->IsArray()) {
                fail(name, "an array of strings");
                return;
            }
            std::vector<std::string> values;
            for (const auto& element : v->GetArray()) {
                if (!element.IsString()) {
                    fail(name, "an array of strings");
                    return;
                }
                values.emplace_back(element.GetString(), element.GetStringLength());
            }
            out = std::move(values);
        }
    }

    bool ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }

private:
    void fail(const char* name, const std::string& expected) {
        if (error_.empty()) {
            error_ = section_ + "." + name + " must be " + expected;
        }
    }

    const rapidjson::Value& object_;
    std::string section_;
    std::string error_;
};

core::Result<void> ReadStorage(const rapidjson::Value& value, core::StorageConfig& config) {
    if (!value.IsObject()) {
        return core::Result<void>::error("storage must be an object", Code::INVALID_ARGUMENT);
    }
    Reader reader(value, "storage");
    std::string strategy;
    reader.string("baseDir", config.base_dir);
    reader.string("bucketStrategy", strategy);
    reader.boolean("compressionEnabled", config.compression_enabled);
    reader.integer("compressionLevel", config.compression_level, 0);
    reader.boolean("encryptionEnabled", config.encryption_enabled);
    reader.boolean("backupEnabled", config.backup_enabled);
    reader.integer("maxRetentionDays", config.max_retention_days, 0);
    reader.integer("maxFileSize", config.max_file_size, 0);
    if (!reader.ok()) {
        return core::Result<void>::error(reader.error(), Code::INVALID_ARGUMENT);
    }
    if (config.compression_level > 9) {
        return core::Result<void>::error("storage.compressionLevel must be between 0 and 9", Code::INVALID_ARGUMENT);
    }
    if (!strategy.empty()) {
        try {
            config.bucket_strategy = core::ParseBucketStrategy(strategy);
        } catch (const core::InvalidArgumentError& e) {
            return core::Result<void>::from_error(e);
        }
    }
    return core::Result<void>();
}

core::Result<void> ReadQuery(const rapidjson::Value& value, core::QueryEngineConfig& config) {
    if (!value.IsObject()) {
        return core::Result<void>::error("query must be an object", Code::INVALID_ARGUMENT);
    }
    Reader reader(value, "query");
    reader.string("baseDir", config.base_dir);
    reader.integer("slowQueryThresholdMs", config.slow_query_threshold_ms, 0);
    reader.integer("optimizeThresholdMs", config.optimize_threshold_ms, 0);
    reader.integer("historyLimit", config.history_limit, 1);
    reader.integer("indexSuggestionThreshold", config.index_suggestion_threshold, 0);
    if (!reader.ok()) {
        return core::Result<void>::error(reader.error(), Code::INVALID_ARGUMENT);
    }

    if (const auto* cache = reader.find("cache")) {
        if (!cache->IsObject()) {
            return core::Result<void>::error("query.cache must be an object", Code::INVALID_ARGUMENT);
        }
        Reader cache_reader(*cache, "query.cache");
        cache_reader.boolean("enabled", config.cache.enabled);
        cache_reader.integer("maxSize", config.cache.max_size, 1);
        cache_reader.integer("ttl", config.cache.ttl, 0);
        cache_reader.strings("keyFields", config.cache.key_fields);
        cache_reader.boolean("invalidateOnWrite", config.cache.invalidate_on_write);
        if (!cache_reader.ok()) {
            return core::Result<void>::error(cache_reader.error(), Code::INVALID_ARGUMENT);
        }
    }
    return core::Result<void>();
}

} // namespace

core::Result<UsageDbConfig> ConfigLoader::parse(const std::string& json) {
    using R = core::Result<UsageDbConfig>;
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return R::error(std::string("Malformed config: ") + rapidjson::GetParseError_En(doc.GetParseError()),
                        Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return R::error("Config must be a JSON object", Code::INVALID_ARGUMENT);
    }

    UsageDbConfig config;
    auto level = doc.FindMember("logLevel");
    if (level != doc.MemberEnd()) {
        if (!level->value.IsString()) {
            return R::error("logLevel must be a string", Code::INVALID_ARGUMENT);
        }
        const std::string name = level->value.GetString();
        config.log_level = spdlog::level::from_str(name);
        if (config.log_level == spdlog::level::off && name != "off") {
            return R::error("Unknown logLevel: " + name, Code::INVALID_ARGUMENT);
        }
    }

    auto storage = doc.FindMember("storage");
    if (storage != doc.MemberEnd()) {
        auto status = ReadStorage(storage->value, config.storage);
        if (!status.ok()) {
            return R::error(status.error(), status.code());
        }
    }

    auto query = doc.FindMember("query");
    if (query != doc.MemberEnd()) {
        auto status = ReadQuery(query->value, config.query);
        if (!status.ok()) {
            return R::error(status.error(), status.code());
        }
    }
    return config;
}

core::Result<UsageDbConfig> ConfigLoader::load_file(const std::string& path) {
    auto contents = storage::ReadWholeFile(path);
    if (!contents.ok()) {
        return core::Result<UsageDbConfig>::error(contents.error(), contents.code());
    }
    auto config = parse(contents.value());
    if (!config.ok()) {
        return core::Result<UsageDbConfig>::error(path + ": " + config.error(), config.code());
    }
    return config;
}

} // namespace common
} // namespace usagedb
