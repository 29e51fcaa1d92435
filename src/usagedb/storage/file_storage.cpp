/**
 * @file file_storage.cpp
 * @brief Bucketed, file backed storage for usage data points
 *
 * Points are grouped into time buckets (daily, weekly or monthly). Each
 * bucket is one JSON file holding the bucket's points in ascending timestamp
 * order; buckets older than a week can be rewritten gzip compressed by
 * compact(). The bucket catalog lives in index.json and is saved whenever a
 * bucket is created, compressed or purged.
 */

#include "usagedb/storage/file_storage.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <map>

#include "usagedb/common/logger.h"
#include "usagedb/core/time_util.h"
#include "usagedb/storage/file_util.h"
#include "usagedb/storage/point_codec.h"

namespace usagedb {
namespace storage {

namespace fs = std::filesystem;

namespace {

using Code = core::Error::Code;
using SteadyClock = std::chrono::steady_clock;

int64_t ElapsedMs(SteadyClock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start).count();
}

bool ByTimestamp(const core::UsageDataPoint& a, const core::UsageDataPoint& b) {
    return a.timestamp < b.timestamp;
}

core::TimeRange WindowBounds(core::Timestamp ts, core::AggregationWindow window) {
    switch (window) {
        case core::AggregationWindow::HOUR: {
            auto start = core::StartOfHour(ts);
            return core::TimeRange(start, start + core::kMillisPerHour);
        }
        case core::AggregationWindow::DAY: {
            auto start = core::StartOfDay(ts);
            return core::TimeRange(start, start + core::kMillisPerDay);
        }
        case core::AggregationWindow::WEEK: {
            auto start = core::StartOfWeek(ts);
            return core::TimeRange(start, start + core::kMillisPerWeek);
        }
        case core::AggregationWindow::MONTH: {
            auto start = core::StartOfMonth(ts);
            return core::TimeRange(start, core::AddMonths(start, 1));
        }
    }
    auto start = core::StartOfDay(ts);
    return core::TimeRange(start, start + core::kMillisPerDay);
}

// Copies every regular file below from into to, keeping relative paths.
core::Result<size_t> CopyTree(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    size_t copied = 0;
    fs::create_directories(to, ec);
    if (ec) {
        return core::Result<size_t>::error("Failed to create " + to.string() + ": " + ec.message(), Code::IO);
    }
    if (!fs::exists(from, ec)) {
        return copied;
    }
    for (fs::recursive_directory_iterator it(from, ec), end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto relative = fs::relative(it->path(), from, ec);
        if (ec) {
            break;
        }
        const auto target = to / relative;
        if (it->is_directory(ec)) {
            fs::create_directories(target, ec);
        } else if (it->is_regular_file(ec)) {
            fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing, ec);
            if (!ec) {
                ++copied;
            }
        }
        if (ec) {
            break;
        }
    }
    if (ec) {
        return core::Result<size_t>::error("Failed to copy " + from.string() + " to " + to.string() + ": " +
                                           ec.message(), Code::IO);
    }
    return copied;
}

} // namespace

FileBasedStorage::FileBasedStorage(core::StorageConfig config, std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      logger_(logger ? std::move(logger) : common::MakeLogger("storage")),
      buckets_dir_((fs::path(config_.base_dir) / "buckets").string()),
      backups_dir_((fs::path(config_.base_dir) / "backups").string()),
      index_((fs::path(config_.base_dir) / "index.json").string()),
      compressor_(config_.compression_level),
      initialized_(false),
      last_compaction_(0),
      last_backup_(0) {
    if (!config_.clock) {
        config_.clock = core::SystemClock();
    }
}

core::Result<void> FileBasedStorage::init() {
    if (initialized_) {
        return core::Result<void>();
    }
    auto start = SteadyClock::now();

    for (const auto& dir : {config_.base_dir, buckets_dir_, backups_dir_}) {
        auto status = EnsureDirectory(dir);
        if (!status.ok()) {
            logger_->error("Failed to initialize storage: {}", status.error());
            return status;
        }
    }

    auto status = index_.load();
    if (!status.ok()) {
        logger_->error("Failed to load bucket index: {}", status.error());
        return status;
    }

    initialized_ = true;
    logger_->info("Loaded {} buckets from index", index_.size());
    logger_->info("Storage initialized in {}ms ({} strategy, base {})", ElapsedMs(start),
                  core::BucketStrategyName(config_.bucket_strategy), config_.base_dir);
    return core::Result<void>();
}

std::string FileBasedStorage::bucket_key(core::Timestamp ts) const {
    return BucketKeyFor(config_.bucket_strategy, ts);
}

std::string FileBasedStorage::bucket_file_path(const std::string& key) const {
    return (fs::path(buckets_dir_) / (key + ".json")).string();
}

core::Result<std::string> FileBasedStorage::get_or_create_bucket(core::Timestamp ts) {
    std::string key = bucket_key(ts);
    if (index_.find(key)) {
        return key;
    }

    auto range = DecodeBucketKey(config_.bucket_strategy, key);
    if (!range.ok()) {
        return core::Result<std::string>::from_error(core::InternalError(range.error()));
    }

    const core::Duration age = now() - ts;
    StorageBucket bucket;
    bucket.time_range = range.value();
    bucket.granularity = GranularityForAge(age);
    bucket.file_path = bucket_file_path(key);
    if (config_.compression_enabled && IsCompressionEligible(age)) {
        bucket.compression_level =
            config_.compression_level > 0 ? config_.compression_level : kDefaultCompressionLevel;
    }
    bucket.encrypted = config_.encryption_enabled;
    index_.put(key, bucket);

    auto status = index_.save(now());
    if (!status.ok()) {
        index_.erase(key);
        return core::Result<std::string>::error(status.error(), status.code());
    }
    logger_->debug("Created bucket {} ({} granularity, compression level {})", key,
                   core::GranularityName(bucket.granularity), bucket.compression_level);
    return key;
}

core::Result<std::string> FileBasedStorage::read_bucket_raw(const StorageBucket& bucket) const {
    auto contents = ReadWholeFile(bucket.active_path());
    if (!contents.ok()) {
        return contents;
    }
    if (!bucket.compressed()) {
        return contents;
    }
    auto raw = compressor_.decompress(contents.value());
    if (!raw.ok()) {
        return core::Result<std::string>::error(bucket.active_path() + ": " + raw.error(), raw.code());
    }
    return raw;
}

core::Result<std::vector<core::UsageDataPoint>> FileBasedStorage::read_bucket(const StorageBucket& bucket) const {
    using R = core::Result<std::vector<core::UsageDataPoint>>;
    auto raw = read_bucket_raw(bucket);
    if (!raw.ok()) {
        if (raw.code() == Code::NOT_FOUND) {
            return std::vector<core::UsageDataPoint>();
        }
        return R::error(raw.error(), raw.code());
    }
    auto points = PointCodec::decode(raw.value());
    if (!points.ok()) {
        return R::error(bucket.active_path() + ": " + points.error(), points.code());
    }
    return points;
}

core::Result<void> FileBasedStorage::write_bucket(const StorageBucket& bucket,
                                                  const std::vector<core::UsageDataPoint>& points) const {
    auto json = PointCodec::encode(points);
    if (!json.ok()) {
        return core::Result<void>::error(json.error(), json.code());
    }

    if (config_.max_file_size > 0 && json.value().size() > config_.max_file_size) {
        logger_->warn("Bucket {} holds {} bytes, exceeds max file size {}", bucket.file_path, json.value().size(),
                      config_.max_file_size);
    }

    if (bucket.compressed()) {
        int level = std::min(bucket.compression_level, 9);
        auto compressed = GzipCompressor(level).compress(json.value());
        if (!compressed.ok()) {
            return core::Result<void>::error(compressed.error(), compressed.code());
        }
        auto status = WriteWholeFile(bucket.active_path(), compressed.value());
        if (!status.ok()) {
            return status;
        }
    } else {
        auto status = WriteWholeFile(bucket.active_path(), json.value());
        if (!status.ok()) {
            return status;
        }
    }
    // Only one representation of a bucket may exist on disk
    return RemoveFileIfExists(bucket.inactive_path());
}

StorageOperationResult FileBasedStorage::store(const core::UsageDataPoint& point) {
    auto start = SteadyClock::now();
    auto status = init();
    if (!status.ok()) {
        return StorageOperationResult::Failure(status.error(), status.code(), ElapsedMs(start));
    }

    auto key = get_or_create_bucket(point.timestamp);
    if (!key.ok()) {
        logger_->error("Failed to store point at {}: {}", point.timestamp, key.error());
        return StorageOperationResult::Failure(key.error(), key.code(), ElapsedMs(start));
    }
    const StorageBucket bucket = *index_.find(key.value());

    auto existing = read_bucket(bucket);
    if (!existing.ok()) {
        logger_->error("Failed to read bucket {}: {}", key.value(), existing.error());
        return StorageOperationResult::Failure(existing.error(), existing.code(), ElapsedMs(start));
    }
    auto& points = existing.value();
    // After any point with the same timestamp, so equal timestamps keep arrival order
    auto pos = std::upper_bound(points.begin(), points.end(), point, ByTimestamp);
    points.insert(pos, point);

    auto written = write_bucket(bucket, points);
    if (!written.ok()) {
        logger_->error("Failed to write bucket {}: {}", key.value(), written.error());
        return StorageOperationResult::Failure(written.error(), written.code(), ElapsedMs(start));
    }
    return StorageOperationResult::Ok(1, ElapsedMs(start));
}

StorageOperationResult FileBasedStorage::store_batch(const std::vector<core::UsageDataPoint>& points) {
    auto start = SteadyClock::now();
    auto status = init();
    if (!status.ok()) {
        return StorageOperationResult::Failure(status.error(), status.code(), ElapsedMs(start));
    }

    std::map<std::string, std::vector<core::UsageDataPoint>> groups;
    for (const auto& point : points) {
        groups[bucket_key(point.timestamp)].push_back(point);
    }

    uint64_t affected = 0;
    for (auto& [key_hint, group] : groups) {
        auto key = get_or_create_bucket(group.front().timestamp);
        if (!key.ok()) {
            logger_->error("Batch store failed creating bucket {}: {}", key_hint, key.error());
            return StorageOperationResult::Failure(key.error(), key.code(), ElapsedMs(start));
        }
        const StorageBucket bucket = *index_.find(key.value());

        auto existing = read_bucket(bucket);
        if (!existing.ok()) {
            logger_->error("Batch store failed reading bucket {}: {}", key.value(), existing.error());
            return StorageOperationResult::Failure(existing.error(), existing.code(), ElapsedMs(start));
        }
        auto merged = existing.take_value();
        merged.insert(merged.end(), group.begin(), group.end());
        std::stable_sort(merged.begin(), merged.end(), ByTimestamp);

        auto written = write_bucket(bucket, merged);
        if (!written.ok()) {
            logger_->error("Batch store failed writing bucket {}: {}", key.value(), written.error());
            return StorageOperationResult::Failure(written.error(), written.code(), ElapsedMs(start));
        }
        affected += group.size();
    }
    logger_->debug("Stored {} points across {} buckets", affected, groups.size());
    return StorageOperationResult::Ok(affected, ElapsedMs(start));
}

core::Result<std::vector<core::UsageDataPoint>> FileBasedStorage::query(const QueryRange& range) {
    using R = core::Result<std::vector<core::UsageDataPoint>>;
    auto status = init();
    if (!status.ok()) {
        return R::error(status.error(), status.code());
    }

    std::vector<core::UsageDataPoint> results;
    const core::TimeRange window(range.start, range.end);
    for (const auto& [key, bucket] : index_.intersecting(window)) {
        auto points = read_bucket(bucket);
        if (!points.ok()) {
            logger_->error("Query failed reading bucket {}: {}", key, points.error());
            return R::error(points.error(), points.code());
        }
        for (auto& point : points.value()) {
            if (window.contains(point.timestamp)) {
                results.push_back(std::move(point));
            }
        }
    }
    std::stable_sort(results.begin(), results.end(), ByTimestamp);

    const size_t begin = std::min(range.offset, results.size());
    size_t end = results.size();
    if (range.limit) {
        end = std::min(end, begin + *range.limit);
    }
    if (begin > 0 || end < results.size()) {
        results = std::vector<core::UsageDataPoint>(
            std::make_move_iterator(results.begin() + begin),
            std::make_move_iterator(results.begin() + end));
    }
    return results;
}

core::Result<std::vector<AggregatedUsage>> FileBasedStorage::query_aggregated(
    const QueryRange& range, core::AggregationWindow window) {
    using R = core::Result<std::vector<AggregatedUsage>>;
    auto raw = query(range);
    if (!raw.ok()) {
        return R::error(raw.error(), raw.code());
    }

    std::map<core::Timestamp, AggregatedUsage> windows;
    for (const auto& point : raw.value()) {
        const auto bounds = WindowBounds(point.timestamp, window);
        auto it = windows.find(bounds.start);
        if (it == windows.end()) {
            AggregatedUsage usage;
            usage.time_window = window;
            usage.window_start = bounds.start;
            usage.window_end = bounds.end;
            it = windows.emplace(bounds.start, std::move(usage)).first;
        }

        auto& agg = it->second;
        agg.total_requests += point.request_count;
        agg.total_cost += point.total_cost;
        agg.peak_usage = std::max(agg.peak_usage, point.usage_percentage);
        agg.data_points++;
        // Approximation: distinct session ids are not tracked, the running
        // point count stands in for them.
        if (point.session_id) {
            agg.unique_sessions = std::max(agg.unique_sessions, agg.data_points);
        }
        if (point.features) {
            for (const auto& feature : *point.features) {
                if (std::find(agg.features_used.begin(), agg.features_used.end(), feature) ==
                    agg.features_used.end()) {
                    agg.features_used.push_back(feature);
                }
            }
        }
    }

    std::vector<AggregatedUsage> result;
    result.reserve(windows.size());
    for (auto& [window_start, agg] : windows) {
        if (agg.data_points > 0) {
            agg.average_usage = static_cast<double>(agg.total_requests) / static_cast<double>(agg.data_points);
        }
        result.push_back(std::move(agg));
    }
    return result;
}

core::Result<StorageStats> FileBasedStorage::get_stats() {
    using R = core::Result<StorageStats>;
    auto status = init();
    if (!status.ok()) {
        return R::error(status.error(), status.code());
    }

    StorageStats stats;
    core::Timestamp oldest = now();
    core::Timestamp newest = 0;
    for (const auto& [key, bucket] : index_.buckets()) {
        stats.storage_buckets.emplace_back(key, bucket);
        if (bucket.compressed()) {
            stats.compressed_buckets++;
        }

        auto size = FileSize(bucket.active_path());
        if (!size.ok()) {
            if (size.code() == Code::NOT_FOUND) {
                continue;
            }
            return R::error(size.error(), size.code());
        }
        auto raw = read_bucket_raw(bucket);
        if (!raw.ok()) {
            if (raw.code() == Code::NOT_FOUND) {
                continue;
            }
            return R::error(raw.error(), raw.code());
        }
        auto points = PointCodec::decode(raw.value());
        if (!points.ok()) {
            return R::error(bucket.active_path() + ": " + points.error(), points.code());
        }

        stats.total_file_size += size.value();
        stats.total_uncompressed_size += raw.value().size();
        const auto& data = points.value();
        stats.total_data_points += data.size();
        if (!data.empty()) {
            oldest = std::min(oldest, data.front().timestamp);
            newest = std::max(newest, data.back().timestamp);
        }
    }

    if (stats.total_data_points > 0) {
        stats.oldest_record = oldest;
        stats.newest_record = newest;
        const double days = static_cast<double>(newest - oldest) / static_cast<double>(core::kMillisPerDay);
        if (days > 0) {
            stats.average_data_points_per_day = static_cast<double>(stats.total_data_points) / days;
        }
    }
    if (stats.total_uncompressed_size > 0) {
        stats.compression_ratio =
            static_cast<double>(stats.total_file_size) / static_cast<double>(stats.total_uncompressed_size);
    }
    stats.last_compaction = last_compaction_;
    stats.last_backup = last_backup_;
    return stats;
}

StorageOperationResult FileBasedStorage::compact() {
    auto start = SteadyClock::now();
    auto status = init();
    if (!status.ok()) {
        return StorageOperationResult::Failure(status.error(), status.code(), ElapsedMs(start));
    }

    uint64_t affected = 0;
    size_t compacted = 0;
    if (config_.compression_enabled) {
        for (const auto& [key, snapshot] : index_.buckets()) {
            if (snapshot.compressed() || !IsCompressionEligible(now() - snapshot.time_range.start)) {
                continue;
            }
            auto points = read_bucket(snapshot);
            if (!points.ok()) {
                logger_->error("Compaction failed reading bucket {}: {}", key, points.error());
                return StorageOperationResult::Failure(points.error(), points.code(), ElapsedMs(start));
            }

            StorageBucket compressed = snapshot;
            compressed.compression_level = config_.compression_level > 0 ? config_.compression_level
                                                                         : kDefaultCompressionLevel;
            auto written = write_bucket(compressed, points.value());
            if (!written.ok()) {
                logger_->error("Compaction failed writing bucket {}: {}", key, written.error());
                return StorageOperationResult::Failure(written.error(), written.code(), ElapsedMs(start));
            }
            index_.find(key)->compression_level = compressed.compression_level;
            affected += points.value().size();
            compacted++;
        }
    }

    auto saved = index_.save(now());
    if (!saved.ok()) {
        return StorageOperationResult::Failure(saved.error(), saved.code(), ElapsedMs(start));
    }
    last_compaction_ = now();
    logger_->info("Compacted {} buckets ({} points)", compacted, affected);
    return StorageOperationResult::Ok(affected, ElapsedMs(start));
}

StorageOperationResult FileBasedStorage::purge_old_data(core::Timestamp older_than) {
    auto start = SteadyClock::now();
    auto status = init();
    if (!status.ok()) {
        return StorageOperationResult::Failure(status.error(), status.code(), ElapsedMs(start));
    }

    std::vector<std::pair<std::string, StorageBucket>> doomed;
    for (const auto& [key, bucket] : index_.buckets()) {
        if (bucket.time_range.end < older_than) {
            doomed.emplace_back(key, bucket);
        }
    }

    uint64_t affected = 0;
    for (const auto& [key, bucket] : doomed) {
        auto points = read_bucket(bucket);
        if (!points.ok()) {
            logger_->warn("Failed to delete bucket {}: {}", key, points.error());
            continue;
        }
        auto removed_plain = RemoveFileIfExists(bucket.file_path);
        auto removed_gz = RemoveFileIfExists(bucket.file_path + ".gz");
        if (!removed_plain.ok() || !removed_gz.ok()) {
            logger_->warn("Failed to delete bucket {}: {}", key,
                          removed_plain.ok() ? removed_gz.error() : removed_plain.error());
            continue;
        }
        index_.erase(key);
        affected += points.value().size();
    }

    auto saved = index_.save(now());
    if (!saved.ok()) {
        return StorageOperationResult::Failure(saved.error(), saved.code(), ElapsedMs(start));
    }
    logger_->info("Purged {} points older than {}", affected, core::FormatIsoTimestamp(older_than));
    return StorageOperationResult::Ok(affected, ElapsedMs(start));
}

StorageOperationResult FileBasedStorage::enforce_retention() {
    return purge_old_data(now() - config_.max_retention_days * core::kMillisPerDay);
}

StorageOperationResult FileBasedStorage::backup(const std::string& path) {
    auto start = SteadyClock::now();
    auto status = init();
    if (!status.ok()) {
        return StorageOperationResult::Failure(status.error(), status.code(), ElapsedMs(start));
    }
    if (!config_.backup_enabled) {
        return StorageOperationResult::Failure("Backups are disabled", Code::INVALID_ARGUMENT, ElapsedMs(start));
    }

    // Make sure the copied index reflects the in-memory catalog
    auto saved = index_.save(now());
    if (!saved.ok()) {
        return StorageOperationResult::Failure(saved.error(), saved.code(), ElapsedMs(start));
    }

    const fs::path target(path);
    auto copied = CopyTree(buckets_dir_, target / "buckets");
    if (!copied.ok()) {
        logger_->error("Backup to {} failed: {}", path, copied.error());
        return StorageOperationResult::Failure(copied.error(), copied.code(), ElapsedMs(start));
    }
    std::error_code ec;
    fs::copy_file(index_.path(), target / "index.json", fs::copy_options::overwrite_existing, ec);
    if (ec) {
        logger_->error("Backup to {} failed copying index: {}", path, ec.message());
        return StorageOperationResult::Failure("Failed to copy index: " + ec.message(), Code::IO, ElapsedMs(start));
    }

    last_backup_ = now();
    logger_->info("Backed up {} bucket files to {}", copied.value(), path);
    return StorageOperationResult::Ok(copied.value(), ElapsedMs(start));
}

StorageOperationResult FileBasedStorage::restore(const std::string& path) {
    auto start = SteadyClock::now();
    auto status = init();
    if (!status.ok()) {
        return StorageOperationResult::Failure(status.error(), status.code(), ElapsedMs(start));
    }

    const fs::path source(path);
    std::error_code ec;
    if (!fs::exists(source / "index.json", ec)) {
        return StorageOperationResult::Failure("No backup index at " + (source / "index.json").string(),
                                               Code::NOT_FOUND, ElapsedMs(start));
    }

    if (fs::equivalent(source, config_.base_dir, ec)) {
        return StorageOperationResult::Failure("Cannot restore " + config_.base_dir + " onto itself",
                                               Code::INVALID_ARGUMENT, ElapsedMs(start));
    }

    // Validate the backup before touching live data
    BucketIndex restored((source / "index.json").string());
    auto loaded = restored.load();
    if (!loaded.ok()) {
        logger_->error("Restore from {} rejected: {}", path, loaded.error());
        return StorageOperationResult::Failure(loaded.error(), loaded.code(), ElapsedMs(start));
    }
    for (const auto& [key, bucket] : restored.buckets()) {
        auto range = DecodeBucketKey(config_.bucket_strategy, key);
        if (!range.ok() || !(range.value() == bucket.time_range)) {
            const std::string reason = "Backup bucket " + key + " does not match the " +
                                       core::BucketStrategyName(config_.bucket_strategy) + " bucket strategy";
            logger_->error("Restore from {} rejected: {}", path, reason);
            return StorageOperationResult::Failure(reason, Code::INVALID_ARGUMENT, ElapsedMs(start));
        }
    }

    // Copy into a staging directory, then swap it in
    const std::string staging_dir = buckets_dir_ + ".restoring";
    const std::string retired_dir = buckets_dir_ + ".old";
    fs::remove_all(staging_dir, ec);
    fs::remove_all(retired_dir, ec);
    auto copied = CopyTree(source / "buckets", staging_dir);
    if (!copied.ok()) {
        logger_->error("Restore from {} failed: {}", path, copied.error());
        fs::remove_all(staging_dir, ec);
        return StorageOperationResult::Failure(copied.error(), copied.code(), ElapsedMs(start));
    }

    fs::rename(buckets_dir_, retired_dir, ec);
    if (ec) {
        const std::string reason = "Failed to move aside " + buckets_dir_ + ": " + ec.message();
        fs::remove_all(staging_dir, ec);
        return StorageOperationResult::Failure(reason, Code::IO, ElapsedMs(start));
    }
    fs::rename(staging_dir, buckets_dir_, ec);
    if (ec) {
        const std::string reason = "Failed to install restored buckets: " + ec.message();
        std::error_code rollback_ec;
        fs::rename(retired_dir, buckets_dir_, rollback_ec);
        if (rollback_ec) {
            logger_->error("Failed to roll back {}: {}", buckets_dir_, rollback_ec.message());
        }
        fs::remove_all(staging_dir, rollback_ec);
        return StorageOperationResult::Failure(reason, Code::IO, ElapsedMs(start));
    }
    fs::remove_all(retired_dir, ec);
    if (ec) {
        logger_->warn("Failed to remove {}: {}", retired_dir, ec.message());
    }

    index_.clear();
    for (const auto& [key, bucket] : restored.buckets()) {
        StorageBucket rebased = bucket;
        rebased.file_path = bucket_file_path(key);
        index_.put(key, rebased);
    }
    auto saved = index_.save(now());
    if (!saved.ok()) {
        return StorageOperationResult::Failure(saved.error(), saved.code(), ElapsedMs(start));
    }

    logger_->info("Restored {} bucket files from {}", copied.value(), path);
    return StorageOperationResult::Ok(copied.value(), ElapsedMs(start));
}

void FileBasedStorage::close() {
    index_.clear();
    initialized_ = false;
}

std::unique_ptr<FileBasedStorage> CreateFileBasedStorage(const core::StorageConfig& config,
                                                         std::shared_ptr<spdlog::logger> logger) {
    return std::make_unique<FileBasedStorage>(config, std::move(logger));
}

} // namespace storage
} // namespace usagedb
