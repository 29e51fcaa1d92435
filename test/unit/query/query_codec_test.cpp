#include <gtest/gtest.h>

#include "usagedb/query/query_codec.h"

namespace usagedb {
namespace query {
namespace {

rapidjson::Document Parse(const char* json) {
    rapidjson::Document doc;
    doc.Parse(json);
    return doc;
}

TEST(QueryCodecTest, DecodesSavedQueryFile) {
    auto doc = Parse(R"({
        "id": "expensive-sessions",
        "name": "Expensive sessions",
        "description": "Sessions above a dollar",
        "createdAt": 1704067200000,
        "filters": [
            {"field": "totalCost", "operator": "gt", "value": 1},
            {"field": "resetTime", "operator": "regex", "value": "T00", "caseSensitive": true}
        ],
        "options": {"sort": [{"field": "totalCost", "direction": "desc"}], "limit": 20,
                    "select": ["sessionId", "totalCost"], "timeRange": {"start": 10, "end": 20}}
    })");
    auto query = QueryCodec::saved_query_from_json(doc);
    ASSERT_TRUE(query.ok()) << query.error();

    const SavedQuery& saved = query.value();
    EXPECT_EQ(saved.id, "expensive-sessions");
    EXPECT_EQ(saved.created_at, 1704067200000);
    EXPECT_FALSE(saved.last_executed.has_value());
    ASSERT_EQ(saved.request.filters.size(), 2u);
    EXPECT_EQ(saved.request.filters[0].op, FilterOperator::GT);
    EXPECT_EQ(saved.request.filters[0].value.GetInt(), 1);
    EXPECT_TRUE(saved.request.filters[1].case_sensitive);

    const QueryOptions& options = saved.request.options;
    ASSERT_EQ(options.sort.size(), 1u);
    EXPECT_EQ(options.sort[0].direction, SortDirection::DESC);
    EXPECT_EQ(options.limit, std::optional<size_t>(20));
    EXPECT_FALSE(options.skip.has_value());
    EXPECT_EQ(options.select, (std::vector<std::string>{"sessionId", "totalCost"}));
    ASSERT_TRUE(options.time_range.has_value());
    EXPECT_EQ(options.time_range->end, 20);
}

TEST(QueryCodecTest, EmptyTimeRangeMeansNone) {
    auto doc = Parse(R"({"sort": [], "select": [], "timeRange": {}})");
    auto options = QueryCodec::options_from_json(doc);
    ASSERT_TRUE(options.ok());
    EXPECT_FALSE(options.value().time_range.has_value());
}

TEST(QueryCodecTest, EncodesRegexFlagOnlyForRegex) {
    rapidjson::Document doc;
    rapidjson::Value regex;
    QueryCodec::filter_to_json(WhereRegex("model", "^large", true), regex, doc.GetAllocator());
    EXPECT_TRUE(regex["caseSensitive"].GetBool());

    rapidjson::Value eq;
    QueryCodec::filter_to_json(Where("model", FilterOperator::EQ, "x"), eq, doc.GetAllocator());
    EXPECT_FALSE(eq.HasMember("caseSensitive"));
    EXPECT_STREQ(eq["operator"].GetString(), "eq");
}

TEST(QueryCodecTest, IndexSpecDefaults) {
    auto doc = Parse(R"({"field": "sessionId"})");
    auto spec = QueryCodec::index_from_json(doc);
    ASSERT_TRUE(spec.ok());
    EXPECT_EQ(spec.value().type, IndexType::BTREE);
    EXPECT_FALSE(spec.value().unique);
    EXPECT_TRUE(spec.value().background);

    auto hash = Parse(R"({"field": "sessionId", "type": "hash", "sparse": true})");
    auto hashed = QueryCodec::index_from_json(hash);
    ASSERT_TRUE(hashed.ok());
    EXPECT_EQ(hashed.value().type, IndexType::HASH);
    EXPECT_TRUE(hashed.value().sparse);
}

TEST(QueryCodecTest, RejectsMalformedDocuments) {
    EXPECT_EQ(QueryCodec::filter_from_json(Parse(R"({"field": 1, "operator": "eq"})")).code(),
              core::Error::Code::DATA_CORRUPTION);
    EXPECT_EQ(QueryCodec::options_from_json(Parse(R"({"limit": -1})")).code(), core::Error::Code::DATA_CORRUPTION);
    EXPECT_EQ(QueryCodec::options_from_json(Parse(R"({"sort": [{"field": "a", "direction": "up"}]})")).code(),
              core::Error::Code::DATA_CORRUPTION);
    EXPECT_EQ(QueryCodec::options_from_json(Parse(R"({"timeRange": {"start": 1}})")).code(),
              core::Error::Code::DATA_CORRUPTION);
    EXPECT_EQ(QueryCodec::index_from_json(Parse(R"({"field": "a", "type": "spatial"})")).code(),
              core::Error::Code::DATA_CORRUPTION);
    EXPECT_EQ(QueryCodec::template_from_json(Parse(R"({"id": "t", "parameters": "min"})")).code(),
              core::Error::Code::DATA_CORRUPTION);
    EXPECT_EQ(QueryCodec::saved_query_from_json(Parse(R"({"name": "no id"})")).code(),
              core::Error::Code::DATA_CORRUPTION);
}

TEST(QueryCodecTest, UnknownOperatorSurvivesDecoding) {
    auto filter = QueryCodec::filter_from_json(Parse(R"({"field": "a", "operator": "near", "value": 1})"));
    ASSERT_TRUE(filter.ok());
    EXPECT_EQ(filter.value().op, FilterOperator::UNKNOWN);
}

} // namespace
} // namespace query
} // namespace usagedb
