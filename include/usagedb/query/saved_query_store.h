#ifndef USAGEDB_QUERY_SAVED_QUERY_STORE_H_
#define USAGEDB_QUERY_SAVED_QUERY_STORE_H_

#include <map>
#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "usagedb/core/result.h"
#include "usagedb/query/types.h"

namespace usagedb {
namespace query {

/**
 * @brief Named queries and query templates
 *
 * Persisted under one directory as saved-queries.json and templates.json,
 * each an object keyed by id. Every mutation rewrites its file.
 */
class SavedQueryStore {
public:
    explicit SavedQueryStore(std::string directory);

    /**
     * @brief Load both files; missing files are empty, malformed ones
     *        DATA_CORRUPTION
     */
    core::Result<void> load();

    core::Result<void> save_query(const SavedQuery& query);
    const SavedQuery* find_query(const std::string& id) const;
    std::vector<SavedQuery> list_queries() const;

    /**
     * @return NOT_FOUND when no query has this id
     */
    core::Result<void> delete_query(const std::string& id);

    /**
     * @brief Stamp last_executed on a saved query and persist it
     */
    core::Result<void> mark_executed(const std::string& id, core::Timestamp when);

    core::Result<void> save_template(const QueryTemplate& tmpl);
    const QueryTemplate* find_template(const std::string& id) const;
    std::vector<QueryTemplate> list_templates() const;

    /**
     * @brief Substitute params (a JSON object) into a template's filters
     * @return INVALID_ARGUMENT when a declared parameter is missing,
     *         NOT_FOUND for an unknown template
     */
    core::Result<QueryRequest> instantiate(const std::string& id, const rapidjson::Value& params) const;

private:
    core::Result<void> write_queries() const;
    core::Result<void> write_templates() const;

    std::string queries_path_;
    std::string templates_path_;
    std::map<std::string, SavedQuery> queries_;
    std::map<std::string, QueryTemplate> templates_;
};

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_SAVED_QUERY_STORE_H_
