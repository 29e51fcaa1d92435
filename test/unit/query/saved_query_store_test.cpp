#include <gtest/gtest.h>

#include <fstream>

#include "usagedb/query/index_catalog.h"
#include "usagedb/query/saved_query_store.h"
#include "test_util/temp_dir.h"

namespace usagedb {
namespace query {
namespace {

rapidjson::Document Params(const char* json) {
    rapidjson::Document doc;
    doc.Parse(json);
    return doc;
}

QueryTemplate CostTemplate() {
    QueryTemplate tmpl;
    tmpl.id = "cost-between";
    tmpl.name = "Cost between";
    tmpl.parameters = {"min", "max", "session"};

    rapidjson::Document range;
    range.Parse(R"(["{{min}}", "{{max}}"])");
    tmpl.request.filters.push_back(Where("totalCost", FilterOperator::BETWEEN, range));
    tmpl.request.filters.push_back(Where("sessionId", FilterOperator::EQ, "{{session}}"));
    tmpl.request.filters.push_back(Where("date", FilterOperator::EQ, "{{ not a placeholder"));
    tmpl.request.options.limit = 50;
    return tmpl;
}

class SavedQueryStoreTest : public ::testing::Test {
protected:
    SavedQueryStoreTest() : dir_("usagedb_saved") {}

    testutil::ScopedTestDir dir_;
};

TEST_F(SavedQueryStoreTest, QueriesPersistAcrossInstances) {
    {
        SavedQueryStore store(dir_.str());
        ASSERT_TRUE(store.load().ok());

        SavedQuery query;
        query.id = "daily";
        query.name = "Daily spend";
        query.created_at = 42;
        query.request.filters.push_back(Where("totalCost", FilterOperator::GT, 0.5));
        ASSERT_TRUE(store.save_query(query).ok());
        ASSERT_TRUE(store.mark_executed("daily", 99).ok());
    }

    SavedQueryStore reloaded(dir_.str());
    ASSERT_TRUE(reloaded.load().ok());
    const SavedQuery* query = reloaded.find_query("daily");
    ASSERT_NE(query, nullptr);
    EXPECT_EQ(query->name, "Daily spend");
    EXPECT_EQ(query->created_at, 42);
    EXPECT_EQ(query->last_executed, std::optional<core::Timestamp>(99));
    ASSERT_EQ(query->request.filters.size(), 1u);
    EXPECT_DOUBLE_EQ(query->request.filters[0].value.GetDouble(), 0.5);
}

TEST_F(SavedQueryStoreTest, DeleteAndMissingIds) {
    SavedQueryStore store(dir_.str());
    ASSERT_TRUE(store.load().ok());

    SavedQuery query;
    query.id = "q";
    ASSERT_TRUE(store.save_query(query).ok());
    ASSERT_TRUE(store.delete_query("q").ok());
    EXPECT_EQ(store.find_query("q"), nullptr);

    EXPECT_EQ(store.delete_query("q").code(), core::Error::Code::NOT_FOUND);
    EXPECT_EQ(store.mark_executed("q", 1).code(), core::Error::Code::NOT_FOUND);

    SavedQuery unnamed;
    EXPECT_EQ(store.save_query(unnamed).code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST_F(SavedQueryStoreTest, InstantiateSubstitutesPlaceholders) {
    SavedQueryStore store(dir_.str());
    ASSERT_TRUE(store.load().ok());
    ASSERT_TRUE(store.save_template(CostTemplate()).ok());

    auto params = Params(R"({"min": 1.5, "max": 10, "session": "s-7"})");
    auto request = store.instantiate("cost-between", params);
    ASSERT_TRUE(request.ok()) << request.error();

    const auto& filters = request.value().filters;
    ASSERT_EQ(filters.size(), 3u);
    ASSERT_TRUE(filters[0].value.IsArray());
    EXPECT_DOUBLE_EQ(filters[0].value[0].GetDouble(), 1.5);
    EXPECT_EQ(filters[0].value[1].GetInt(), 10);
    EXPECT_STREQ(filters[1].value.GetString(), "s-7");
    EXPECT_STREQ(filters[2].value.GetString(), "{{ not a placeholder");
    EXPECT_EQ(request.value().options.limit, std::optional<size_t>(50));

    // The stored template is untouched
    EXPECT_STREQ(store.find_template("cost-between")->request.filters[1].value.GetString(), "{{session}}");
}

TEST_F(SavedQueryStoreTest, InstantiateErrors) {
    SavedQueryStore store(dir_.str());
    ASSERT_TRUE(store.load().ok());
    ASSERT_TRUE(store.save_template(CostTemplate()).ok());

    auto missing = store.instantiate("cost-between", Params(R"({"min": 1, "max": 2})"));
    EXPECT_EQ(missing.code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_NE(missing.error().find("session"), std::string::npos);

    EXPECT_EQ(store.instantiate("cost-between", Params("[]")).code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(store.instantiate("nope", Params("{}")).code(), core::Error::Code::NOT_FOUND);
}

TEST_F(SavedQueryStoreTest, TemplatesPersist) {
    {
        SavedQueryStore store(dir_.str());
        ASSERT_TRUE(store.load().ok());
        ASSERT_TRUE(store.save_template(CostTemplate()).ok());
    }
    SavedQueryStore reloaded(dir_.str());
    ASSERT_TRUE(reloaded.load().ok());
    auto templates = reloaded.list_templates();
    ASSERT_EQ(templates.size(), 1u);
    EXPECT_EQ(templates[0].parameters, (std::vector<std::string>{"min", "max", "session"}));
}

TEST_F(SavedQueryStoreTest, CorruptFileIsReported) {
    {
        std::ofstream out(dir_.path() / "saved-queries.json");
        out << R"({"q": {"filters": "nope", "id": "q"}})";
    }
    SavedQueryStore store(dir_.str());
    auto status = store.load();
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.code(), core::Error::Code::DATA_CORRUPTION);
}

TEST_F(SavedQueryStoreTest, IndexCatalogPersists) {
    const std::string path = (dir_.path() / "indexes.json").string();
    {
        IndexCatalog catalog(path);
        ASSERT_TRUE(catalog.load().ok());
        IndexSpec spec;
        spec.field = "sessionId";
        spec.type = IndexType::HASH;
        spec.sparse = true;
        catalog.put(spec);
        spec.field = "timestamp";
        spec.type = IndexType::BTREE;
        catalog.put(spec);
        EXPECT_TRUE(catalog.erase("timestamp"));
        ASSERT_TRUE(catalog.save().ok());
    }
    IndexCatalog reloaded(path);
    ASSERT_TRUE(reloaded.load().ok());
    ASSERT_EQ(reloaded.size(), 1u);
    EXPECT_TRUE(reloaded.contains("sessionId"));
    EXPECT_EQ(reloaded.list()[0].type, IndexType::HASH);
    EXPECT_TRUE(reloaded.list()[0].sparse);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "[1]";
    }
    EXPECT_EQ(reloaded.load().code(), core::Error::Code::DATA_CORRUPTION);
}

} // namespace
} // namespace query
} // namespace usagedb
