#include <gtest/gtest.h>

#include "usagedb/query/field_path.h"
#include "usagedb/query/row_ops.h"

namespace usagedb {
namespace query {
namespace {

Row MakeRow(const char* json) {
    auto doc = std::make_shared<rapidjson::Document>();
    doc->Parse(json);
    return doc;
}

std::vector<Row> SampleRows() {
    return {
        MakeRow(R"({"id": 1, "totalCost": 0.5, "sessionId": "alpha", "model": "Large-2", "meta": {"tier": "pro"}})"),
        MakeRow(R"({"id": 2, "totalCost": 2.0, "sessionId": "beta", "model": "small-1"})"),
        MakeRow(R"({"id": 3, "totalCost": 5, "sessionId": "alpha", "model": "large-3", "meta": {"tier": "free"}})"),
        MakeRow(R"({"id": 4, "totalCost": 7.5, "sessionId": null, "model": "medium"})"),
    };
}

std::vector<int64_t> Ids(const std::vector<Row>& rows) {
    std::vector<int64_t> ids;
    for (const auto& row : rows) {
        const rapidjson::Value* id = ResolveField(*row, "id");
        ids.push_back(id ? id->GetInt64() : -1);
    }
    return ids;
}

std::vector<int64_t> Filtered(const QueryFilter& filter) {
    return Ids(ApplyFilters(SampleRows(), {filter}));
}

TEST(RowFilterTest, Equality) {
    EXPECT_EQ(Filtered(Where("sessionId", FilterOperator::EQ, "alpha")), (std::vector<int64_t>{1, 3}));
    EXPECT_EQ(Filtered(Where("totalCost", FilterOperator::EQ, 5)), (std::vector<int64_t>{3}));
    EXPECT_EQ(Filtered(Where("totalCost", FilterOperator::EQ, 2)), (std::vector<int64_t>{2}));
    // Strict: a number never equals a string
    EXPECT_TRUE(Filtered(Where("totalCost", FilterOperator::EQ, "5")).empty());
    EXPECT_EQ(Filtered(Where("sessionId", FilterOperator::NE, "alpha")), (std::vector<int64_t>{2, 4}));
    EXPECT_EQ(Filtered(Where("meta.tier", FilterOperator::EQ, "pro")), (std::vector<int64_t>{1}));
}

TEST(RowFilterTest, NumericComparisons) {
    EXPECT_EQ(Filtered(Where("totalCost", FilterOperator::GT, 2.0)), (std::vector<int64_t>{3, 4}));
    EXPECT_EQ(Filtered(Where("totalCost", FilterOperator::GTE, 2.0)), (std::vector<int64_t>{2, 3, 4}));
    EXPECT_EQ(Filtered(Where("totalCost", FilterOperator::LT, 2.0)), (std::vector<int64_t>{1}));
    EXPECT_EQ(Filtered(Where("totalCost", FilterOperator::LTE, 2.0)), (std::vector<int64_t>{1, 2}));
    // Non-numeric field values never compare
    EXPECT_TRUE(Filtered(Where("sessionId", FilterOperator::GT, 0)).empty());
    EXPECT_TRUE(Filtered(Where("missing", FilterOperator::LT, 100)).empty());
}

TEST(RowFilterTest, BetweenIsInclusive) {
    EXPECT_EQ(Filtered(Where("totalCost", FilterOperator::BETWEEN, std::vector<double>{2.0, 5.0})),
              (std::vector<int64_t>{2, 3}));
    EXPECT_EQ(Filtered(Where("totalCost", FilterOperator::BETWEEN, std::vector<double>{5.0, 5.0})),
              (std::vector<int64_t>{3}));
    EXPECT_TRUE(Filtered(Where("totalCost", FilterOperator::BETWEEN, std::vector<double>{5.0})).empty());
    EXPECT_TRUE(Filtered(Where("totalCost", FilterOperator::BETWEEN, 5.0)).empty());
}

TEST(RowFilterTest, InAndNotIn) {
    EXPECT_EQ(Filtered(Where("sessionId", FilterOperator::IN, std::vector<std::string>{"beta", "gamma"})),
              (std::vector<int64_t>{2}));
    EXPECT_EQ(Filtered(Where("sessionId", FilterOperator::NIN, std::vector<std::string>{"beta"})),
              (std::vector<int64_t>{1, 3, 4}));
    // Empty arrays: nothing is in, everything is not in
    EXPECT_TRUE(Filtered(Where("sessionId", FilterOperator::IN, std::vector<std::string>{})).empty());
    EXPECT_EQ(Filtered(Where("sessionId", FilterOperator::NIN, std::vector<std::string>{})).size(), 4u);
    // A non-array operand matches nothing
    EXPECT_TRUE(Filtered(Where("sessionId", FilterOperator::IN, "alpha")).empty());
    EXPECT_TRUE(Filtered(Where("sessionId", FilterOperator::NIN, "alpha")).empty());
}

TEST(RowFilterTest, Exists) {
    EXPECT_EQ(Filtered(WhereExists("meta")), (std::vector<int64_t>{1, 3}));
    // null counts as absent
    EXPECT_EQ(Filtered(WhereExists("sessionId")), (std::vector<int64_t>{1, 2, 3}));
}

TEST(RowFilterTest, RegexCaseHandling) {
    EXPECT_EQ(Filtered(WhereRegex("model", "^large")), (std::vector<int64_t>{1, 3}));
    EXPECT_EQ(Filtered(WhereRegex("model", "^large", true)), (std::vector<int64_t>{3}));
    EXPECT_EQ(Filtered(WhereRegex("model", "-\\d$")), (std::vector<int64_t>{1, 2, 3}));
    // Invalid patterns and non-string fields never match
    EXPECT_TRUE(Filtered(WhereRegex("model", "([unclosed")).empty());
    EXPECT_TRUE(Filtered(WhereRegex("totalCost", ".*")).empty());
}

TEST(RowFilterTest, UnknownOperatorPasses) {
    QueryFilter filter = Where("totalCost", FilterOperator::UNKNOWN, 1);
    EXPECT_EQ(Filtered(filter).size(), 4u);
    EXPECT_EQ(ParseFilterOperator("near"), FilterOperator::UNKNOWN);
    EXPECT_EQ(ParseFilterOperator("between"), FilterOperator::BETWEEN);
}

TEST(RowFilterTest, FiltersAreConjunctive) {
    auto rows = ApplyFilters(SampleRows(), {Where("sessionId", FilterOperator::EQ, "alpha"),
                                            Where("totalCost", FilterOperator::GT, 1.0)});
    EXPECT_EQ(Ids(rows), (std::vector<int64_t>{3}));
    EXPECT_EQ(ApplyFilters(SampleRows(), {}).size(), 4u);
}

TEST(RowSortTest, MultiKeyAndStable) {
    auto rows = SampleRows();
    ApplySorting(rows, {SortSpec{"totalCost", SortDirection::DESC}});
    EXPECT_EQ(Ids(rows), (std::vector<int64_t>{4, 3, 2, 1}));

    rows = SampleRows();
    ApplySorting(rows, {SortSpec{"sessionId", SortDirection::ASC}, SortSpec{"totalCost", SortDirection::DESC}});
    // null sorts by its display string "null"
    EXPECT_EQ(Ids(rows), (std::vector<int64_t>{3, 1, 2, 4}));

    rows = SampleRows();
    ApplySorting(rows, {SortSpec{"missing", SortDirection::ASC}});
    EXPECT_EQ(Ids(rows), (std::vector<int64_t>{1, 2, 3, 4}));
}

TEST(RowProjectionTest, SelectsNestedFields) {
    auto rows = ApplyProjection(SampleRows(), {"id", "meta.tier"});
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_EQ(rows[0]->MemberCount(), 2u);
    EXPECT_STREQ(ResolveField(*rows[0], "meta.tier")->GetString(), "pro");
    EXPECT_EQ(ResolveField(*rows[0], "totalCost"), nullptr);
    // Missing source field stays absent
    EXPECT_EQ(ResolveField(*rows[1], "meta.tier"), nullptr);

    EXPECT_EQ(ApplyProjection(SampleRows(), {}).size(), 4u);
}

TEST(RowGroupingTest, OneRowPerGroupInFirstSeenOrder) {
    auto groups = PerformGrouping(SampleRows(), {GroupBySpec{"sessionId", GroupAggregation::COUNT}});
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_STREQ((*groups[0])["sessionId"].GetString(), "alpha");
    EXPECT_EQ((*groups[0])["sessionId_count"].GetUint64(), 2u);
    EXPECT_STREQ((*groups[1])["sessionId"].GetString(), "beta");
    EXPECT_STREQ((*groups[2])["sessionId"].GetString(), "null");
}

TEST(RowGroupingTest, NumericAggregations) {
    auto rows = SampleRows();
    auto sum = PerformGrouping(rows, {GroupBySpec{"sessionId", GroupAggregation::SUM}});
    EXPECT_DOUBLE_EQ((*sum[0])["sessionId_sum"].GetDouble(), 0.0);

    auto cost_sum = PerformGrouping(rows, {GroupBySpec{"totalCost", GroupAggregation::SUM}});
    ASSERT_EQ(cost_sum.size(), 4u);
    EXPECT_STREQ((*cost_sum[0])["totalCost"].GetString(), "0.5");
    EXPECT_DOUBLE_EQ((*cost_sum[0])["totalCost_sum"].GetDouble(), 0.5);

    auto by_model = PerformGrouping(
        {MakeRow(R"({"m": "a", "v": 1})"), MakeRow(R"({"m": "a", "v": 3})"), MakeRow(R"({"m": "b", "v": 10})")},
        {GroupBySpec{"m", GroupAggregation::COUNT}});
    ASSERT_EQ(by_model.size(), 2u);
    EXPECT_EQ((*by_model[0])["m_count"].GetUint64(), 2u);
    EXPECT_EQ((*by_model[1])["m_count"].GetUint64(), 1u);
}

TEST(RowGroupingTest, AggregationNames) {
    EXPECT_EQ(ParseGroupAggregation("avg"), GroupAggregation::AVG);
    EXPECT_STREQ(GroupAggregationName(GroupAggregation::MAX), "max");
    EXPECT_THROW(ParseGroupAggregation("median"), core::InvalidArgumentError);
}

} // namespace
} // namespace query
} // namespace usagedb
