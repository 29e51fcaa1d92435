#include "usagedb/query/query_cache.h"

#include <iterator>

#include "usagedb/core/error.h"

namespace usagedb {
namespace query {

QueryCache::QueryCache(size_t max_size, core::Duration ttl, core::Clock clock)
    : max_size_(max_size), ttl_(ttl), clock_(clock ? std::move(clock) : core::SystemClock()) {
    if (max_size_ == 0) {
        throw core::InvalidArgumentError("Query cache size must be positive");
    }
}

QueryCache::Entry QueryCache::get(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        miss_count_++;
        return nullptr;
    }

    auto entry = it->second;
    if (clock_() - entry->cached_at >= ttl_) {
        // Stale; drop it so the caller's fresh result takes its place
        entries_.erase(entry);
        index_.erase(it);
        miss_count_++;
        return nullptr;
    }
    hit_count_++;
    return entry->result;
}

void QueryCache::put(const std::string& key, Entry result) {
    remove(key);
    entries_.push_back(CacheEntry{key, std::move(result), clock_()});
    index_[key] = std::prev(entries_.end());
    evict_overflow();
}

bool QueryCache::remove(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(it->second);
    index_.erase(it);
    return true;
}

void QueryCache::clear() {
    entries_.clear();
    index_.clear();
}

void QueryCache::set_max_size(size_t max_size) {
    if (max_size == 0) {
        throw core::InvalidArgumentError("Query cache size must be positive");
    }
    max_size_ = max_size;
    evict_overflow();
}

void QueryCache::set_ttl(core::Duration ttl) {
    ttl_ = ttl;
}

std::vector<std::string> QueryCache::keys() const {
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& entry : entries_) {
        keys.push_back(entry.key);
    }
    return keys;
}

void QueryCache::evict_overflow() {
    while (entries_.size() > max_size_) {
        index_.erase(entries_.front().key);
        entries_.pop_front();
    }
}

} // namespace query
} // namespace usagedb
