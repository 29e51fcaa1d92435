#ifndef USAGEDB_QUERY_INDEX_CATALOG_H_
#define USAGEDB_QUERY_INDEX_CATALOG_H_

#include <map>
#include <string>
#include <vector>

#include "usagedb/core/result.h"
#include "usagedb/query/types.h"

namespace usagedb {
namespace query {

/**
 * @brief Registered index specs, persisted as an object keyed by field
 */
class IndexCatalog {
public:
    explicit IndexCatalog(std::string path);

    /**
     * @brief Replace the catalog with the file contents
     *
     * A missing file yields an empty catalog, malformed content
     * DATA_CORRUPTION.
     */
    core::Result<void> load();
    core::Result<void> save() const;

    /**
     * @brief Register spec, replacing any spec on the same field
     */
    void put(const IndexSpec& spec);
    bool erase(const std::string& field);
    bool contains(const std::string& field) const { return specs_.count(field) > 0; }

    std::vector<IndexSpec> list() const;
    size_t size() const { return specs_.size(); }

private:
    std::string path_;
    std::map<std::string, IndexSpec> specs_;
};

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_INDEX_CATALOG_H_
