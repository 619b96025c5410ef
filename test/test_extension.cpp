#include <gtest/gtest.h>
#include "duckdb.hpp"
#include "geodna_extension.hpp"

#include <memory>
#include <string>
#include <vector>

class GeodnaExtensionTest : public ::testing::Test {
protected:
    void SetUp() override {
        db = std::unique_ptr<duckdb::DuckDB>(new duckdb::DuckDB(nullptr));
        db->LoadExtension<duckdb::GeodnaExtension>();
        con = std::unique_ptr<duckdb::Connection>(new duckdb::Connection(*db));
    }

    // Runs a single-value query and returns the value at (0, 0).
    duckdb::Value QueryValue(const std::string &sql) {
        auto result = con->Query(sql);
        if (result->HasError()) {
            ADD_FAILURE() << sql << ": " << result->GetError();
            return duckdb::Value();
        }
        return result->GetValue(0, 0);
    }

    std::vector<std::string> ListStrings(const duckdb::Value &list) {
        std::vector<std::string> items;
        for (const duckdb::Value &item : duckdb::ListValue::GetChildren(list)) {
            items.push_back(item.ToString());
        }
        return items;
    }

    std::unique_ptr<duckdb::DuckDB> db;
    std::unique_ptr<duckdb::Connection> con;
};

TEST_F(GeodnaExtensionTest, EncodeUsesDefaultPrecision) {
    duckdb::Value code = QueryValue("SELECT geodna_encode(-41.28889560699463, 174.7772455215454)");
    EXPECT_EQ(code.ToString(), "etctttagatagtgacagtcta");
}

TEST_F(GeodnaExtensionTest, EncodeFollowsPrecisionSetting) {
    auto set = con->Query("SET geodna_default_precision = 8");
    ASSERT_FALSE(set->HasError()) << set->GetError();

    duckdb::Value code = QueryValue("SELECT geodna_encode(-41.28889560699463, 174.7772455215454)");
    EXPECT_EQ(code.ToString(), "etctttag");

    // An explicit precision still wins.
    code = QueryValue("SELECT geodna_encode(-41.28889560699463, 174.7772455215454, 12)");
    EXPECT_EQ(code.ToString(), "etctttagatag");
}

TEST_F(GeodnaExtensionTest, EncodeReportsBadPrecision) {
    auto result = con->Query("SELECT geodna_encode(0.0, 0.0, 0)");
    ASSERT_TRUE(result->HasError());
    EXPECT_NE(result->GetError().find("geodna_encode"), std::string::npos);
}

TEST_F(GeodnaExtensionTest, ReduceSkipsNullItems) {
    duckdb::Value reduced = QueryValue("SELECT geodna_reduce(['etcg', 'etca', 'etct', 'etcc', NULL])");
    std::vector<std::string> expected = {"etc"};
    EXPECT_EQ(ListStrings(reduced), expected);
}

TEST_F(GeodnaExtensionTest, ReduceKeepsRowsApart) {
    auto result = con->Query("SELECT geodna_reduce(codes) FROM (VALUES "
                             "(1, ['etcg', 'etca', 'etct', 'etcc']), "
                             "(2, ['wgt', NULL, 'ega']), "
                             "(3, ['ega', 'egt', 'egg', 'egc', 'eg'])) t(id, codes) ORDER BY id");
    ASSERT_FALSE(result->HasError()) << result->GetError();
    ASSERT_EQ(result->RowCount(), 3u);

    std::vector<std::string> first = {"etc"};
    std::vector<std::string> second = {"wgt", "ega"};
    std::vector<std::string> third = {"eg"};
    EXPECT_EQ(ListStrings(result->GetValue(0, 0)), first);
    EXPECT_EQ(ListStrings(result->GetValue(0, 1)), second);
    EXPECT_EQ(ListStrings(result->GetValue(0, 2)), third);
}

TEST_F(GeodnaExtensionTest, DecodeAndDistance) {
    duckdb::Value point = QueryValue("SELECT geodna_decode('etctttagatagtgacagtcta')");
    std::vector<duckdb::Value> latlng = duckdb::ListValue::GetChildren(point);
    ASSERT_EQ(latlng.size(), 2u);
    EXPECT_EQ(latlng[0].GetValue<double>(), -41.28889560699463);
    EXPECT_EQ(latlng[1].GetValue<double>(), 174.7772455215454);

    duckdb::Value km = QueryValue("SELECT geodna_distance_km('etctttagatagtgacagtcta', 'etcttgctagcttagt')");
    EXPECT_NEAR(km.GetValue<double>(), 124.856, 0.01);
}
