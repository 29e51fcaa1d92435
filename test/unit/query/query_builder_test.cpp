#include <gtest/gtest.h>

#include "usagedb/common/logger.h"
#include "usagedb/query/query_engine.h"
#include "test_util/temp_dir.h"
#include "test_util/usage_fixtures.h"

namespace usagedb {
namespace query {
namespace {

using testutil::Jan;

class QueryBuilderTest : public ::testing::Test {
protected:
    QueryBuilderTest() : dir_("usagedb_builder"), storage_(std::make_shared<testutil::InMemoryStorage>()) {
        for (int day = 1; day <= 6; ++day) {
            auto point = testutil::MakePoint(Jan(day, 12), day * 1.5, day * 10);
            point.session_id = day % 2 == 0 ? "even" : "odd";
            storage_->store(point);
        }
        core::QueryEngineConfig config;
        config.base_dir = (dir_.path() / "engine").string();
        auto now = std::make_shared<core::Timestamp>(Jan(20));
        config.clock = testutil::FixedClock(now);
        engine_ = std::make_unique<QueryEngine>(storage_, nullptr, config, common::MakeNullLogger());
    }

    testutil::ScopedTestDir dir_;
    std::shared_ptr<testutil::InMemoryStorage> storage_;
    std::unique_ptr<QueryEngine> engine_;
};

TEST_F(QueryBuilderTest, ChainsIntoOneQuery) {
    auto rows = engine_->create_query()
                    .time_range(Jan(2), Jan(6))
                    .where("requestCount", FilterOperator::GT, 20)
                    .order_by("totalCost", SortDirection::DESC)
                    .limit(2)
                    .select({"requestCount"})
                    .execute();
    ASSERT_TRUE(rows.ok()) << rows.error();
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ((*rows.value()[0])["requestCount"].GetInt64(), 50);
    EXPECT_EQ((*rows.value()[1])["requestCount"].GetInt64(), 40);
    EXPECT_FALSE(rows.value()[0]->HasMember("totalCost"));
}

TEST_F(QueryBuilderTest, OptionsReflectCalls) {
    auto builder = engine_->create_query();
    builder.where("sessionId", FilterOperator::EQ, std::string("odd")).skip(1).limit(0);
    auto options = builder.options();
    EXPECT_EQ(options.skip, std::optional<size_t>(1));
    EXPECT_EQ(options.limit, std::optional<size_t>(0));
    EXPECT_FALSE(options.time_range.has_value());
    ASSERT_EQ(builder.filters().size(), 1u);
    EXPECT_EQ(builder.filters()[0].field, "sessionId");

    // A zero limit returns everything after the skip
    auto rows = builder.execute();
    ASSERT_TRUE(rows.ok());
    EXPECT_EQ(rows.value().size(), 2u);
}

TEST_F(QueryBuilderTest, WhereOrJoinsTheConjunction) {
    auto builder = engine_->create_query();
    builder.where_or({Where("sessionId", FilterOperator::EQ, "even"), Where("totalCost", FilterOperator::GT, 5.0)});
    auto count = builder.count();
    ASSERT_TRUE(count.ok());
    // Only days 4 and 6 are even and above 5.0
    EXPECT_EQ(count.value(), 2u);
}

TEST_F(QueryBuilderTest, CountIgnoresPaging) {
    auto count = engine_->create_query()
                     .where("sessionId", FilterOperator::EQ, "odd")
                     .order_by("totalCost")
                     .limit(1)
                     .skip(1)
                     .count();
    ASSERT_TRUE(count.ok());
    EXPECT_EQ(count.value(), 3u);
}

TEST_F(QueryBuilderTest, AggregateUsesGroupBy) {
    auto result = engine_->create_query()
                      .group_by("sessionId", GroupAggregation::COUNT)
                      .aggregate();
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().rows.size(), 2u);
    EXPECT_STREQ((*result.value().rows[0])["sessionId"].GetString(), "odd");
    EXPECT_EQ((*result.value().rows[0])["sessionId_count"].GetUint64(), 3u);

    // No aggregation engine behind this query engine
    auto windowed = engine_->create_query().aggregate(core::AggregationWindow::DAY);
    EXPECT_EQ(windowed.code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST_F(QueryBuilderTest, ExplainSeesSortAndLimit) {
    auto plan = engine_->create_query()
                    .where("totalCost", FilterOperator::GT, 1.0)
                    .order_by("timestamp")
                    .limit(3)
                    .explain();
    EXPECT_TRUE(plan.sort_required);
    EXPECT_DOUBLE_EQ(plan.estimated_cost, 30);
    EXPECT_EQ(plan.filter_order, (std::vector<std::string>{"totalCost"}));
}

} // namespace
} // namespace query
} // namespace usagedb
