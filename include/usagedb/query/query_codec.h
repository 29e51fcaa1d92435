#ifndef USAGEDB_QUERY_QUERY_CODEC_H_
#define USAGEDB_QUERY_QUERY_CODEC_H_

#include <rapidjson/document.h>

#include "usagedb/core/result.h"
#include "usagedb/query/types.h"

namespace usagedb {
namespace query {

/**
 * @brief JSON forms of query requests, index specs and saved queries
 *
 * Filter:  {"field", "operator", "value", "caseSensitive"?}
 * Options: {"sort": [{"field", "direction"}], "limit"?, "skip"?,
 *           "select": [...], "timeRange"?: {"start", "end"}}
 * Index:   {"field", "type", "unique", "sparse", "background"}
 *
 * Decoders report malformed input as DATA_CORRUPTION, since they read
 * files written by the engine.
 */
class QueryCodec {
public:
    using Allocator = rapidjson::Document::AllocatorType;

    static void filter_to_json(const QueryFilter& filter, rapidjson::Value& out, Allocator& allocator);
    static core::Result<QueryFilter> filter_from_json(const rapidjson::Value& value);

    static void options_to_json(const QueryOptions& options, rapidjson::Value& out, Allocator& allocator);
    static core::Result<QueryOptions> options_from_json(const rapidjson::Value& value);

    static void request_to_json(const QueryRequest& request, rapidjson::Value& out, Allocator& allocator);
    static core::Result<QueryRequest> request_from_json(const rapidjson::Value& value);

    static void index_to_json(const IndexSpec& spec, rapidjson::Value& out, Allocator& allocator);
    static core::Result<IndexSpec> index_from_json(const rapidjson::Value& value);

    static void saved_query_to_json(const SavedQuery& query, rapidjson::Value& out, Allocator& allocator);
    static core::Result<SavedQuery> saved_query_from_json(const rapidjson::Value& value);

    static void template_to_json(const QueryTemplate& tmpl, rapidjson::Value& out, Allocator& allocator);
    static core::Result<QueryTemplate> template_from_json(const rapidjson::Value& value);
};

} // namespace query
} // namespace usagedb

#endif // USAGEDB_QUERY_QUERY_CODEC_H_
