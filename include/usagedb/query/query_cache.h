#ifndef USAGEDB_QUERY_QUERY_CACHE_H_
#define USAGEDB_QUERY_QUERY_CACHE_H_

#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "usagedb/core/types.h"
#include "usagedb/query/types.h"

namespace usagedb {
namespace query {

/**
 * @brief Bounded TTL cache of query results keyed by query signature
 *
 * Entries are valid while now - cached_at < ttl. Expired entries are never
 * returned and are dropped when looked up. When the cache holds more than
 * max_size entries the oldest insertions are evicted first; re-inserting a
 * key counts as a new insertion. Not thread safe.
 */
class QueryCache {
public:
    using Entry = std::shared_ptr<const QueryResult>;

    /**
     * @param max_size Maximum number of entries
     * @param ttl      Entry lifetime in milliseconds
     * @param clock    Source of the insertion and lookup time
     * @throws core::InvalidArgumentError when max_size is 0
     */
    QueryCache(size_t max_size, core::Duration ttl, core::Clock clock);

    QueryCache(const QueryCache&) = delete;
    QueryCache& operator=(const QueryCache&) = delete;

    /**
     * @brief Look up a live entry
     * @return The cached result, or nullptr when absent or expired
     */
    Entry get(const std::string& key);

    /**
     * @brief Insert or replace an entry stamped with the current time
     */
    void put(const std::string& key, Entry result);

    bool remove(const std::string& key);
    void clear();

    /**
     * @brief Change the capacity, evicting the oldest entries if needed
     * @throws core::InvalidArgumentError when max_size is 0
     */
    void set_max_size(size_t max_size);
    void set_ttl(core::Duration ttl);

    size_t size() const { return entries_.size(); }
    size_t max_size() const { return max_size_; }
    core::Duration ttl() const { return ttl_; }

    uint64_t hit_count() const { return hit_count_; }
    uint64_t miss_count() const { return miss_count_; }

    /**
     * @brief Keys from oldest to newest insertion
     */
    std::vector<std::string> keys() const;

private:
    struct CacheEntry {
        std::string key;
        Entry result;
        core::Timestamp cached_at;
    };

    using InsertionList = std::list<CacheEntry>;
    using CacheMap = std::unordered_map<std::string, InsertionList::iterator>;

    void evict_overflow();

    size_t max_size_;
    core::Duration ttl_;
    core::Clock clock_;
    InsertionList entries_;
    CacheMap index_;

    uint64_t hit_count_ = 0;
    uint64_t miss_count_ = 0;
};

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_QUERY_CACHE_H_
