/**
 * @file test_field_aliases.cpp
 * @brief Unit tests for declarative attribute alias resolution
 */

#include <gtest/gtest.h>

#include "core/EnrichmentErrors.hpp"
#include "core/FieldAliasTable.hpp"

using namespace geoenrich;
using json = nlohmann::json;

class FieldAliasTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        table_.add("name", {"NAME", "Name", "FEATURE_NAME"});
        table_.add("status", {"STATUS"});
    }

    FieldAliasTable table_;
};

TEST_F(FieldAliasTableTest, FirstAliasInOrderWins) {
    json attributes = {{"FEATURE_NAME", "second"}, {"NAME", "first"}};
    EXPECT_EQ("first", table_.resolve(attributes, "name").value().get<std::string>());
}

TEST_F(FieldAliasTableTest, NullAndEmptyCountAsAbsent) {
    json attributes = {{"NAME", nullptr}, {"Name", ""}, {"FEATURE_NAME", "Pine Hill"}};
    EXPECT_EQ("Pine Hill", table_.resolve(attributes, "name").value().get<std::string>());
}

TEST_F(FieldAliasTableTest, CaseInsensitiveFallback) {
    json attributes = {{"feature_name", "Brook"}};
    EXPECT_EQ("Brook", table_.resolve(attributes, "name").value().get<std::string>());
}

TEST_F(FieldAliasTableTest, ExactMatchPreferredOverCaseVariant) {
    json attributes = {{"name", "lower"}, {"FEATURE_NAME", "exact"}};
    EXPECT_EQ("exact", table_.resolve(attributes, "name").value().get<std::string>());
}

TEST_F(FieldAliasTableTest, UnknownCanonicalOrMissingValue) {
    json attributes = {{"NAME", "x"}};
    EXPECT_FALSE(table_.resolve(attributes, "height").has_value());
    EXPECT_FALSE(table_.resolve(attributes, "status").has_value());
}

TEST_F(FieldAliasTableTest, ResolveAllKeepsNonStringValues) {
    json attributes = {{"NAME", "Station 7"}, {"STATUS", 3}};
    auto resolved = table_.resolve_all(attributes);
    ASSERT_EQ(2u, resolved.size());
    EXPECT_EQ(3, resolved.at("status").get<int>());
}

TEST(FieldAliasTableJsonTest, StringOrArrayValues) {
    auto table = FieldAliasTable::from_json(json::parse(R"({"name": ["NAME", "LABEL"], "type": "TYPE"})"));
    ASSERT_EQ(2u, table.entries().size());
    EXPECT_EQ(std::vector<std::string>({"NAME", "LABEL"}), table.entries().at("name"));
    EXPECT_EQ(std::vector<std::string>({"TYPE"}), table.entries().at("type"));
}

TEST(FieldAliasTableJsonTest, InvalidShapesRejected) {
    EXPECT_THROW(FieldAliasTable::from_json(json::array()), ConfigurationError);
    EXPECT_THROW(FieldAliasTable::from_json(json::parse(R"({"name": 5})")), ConfigurationError);
    EXPECT_THROW(FieldAliasTable::from_json(json::parse(R"({"name": ["A", 1]})")), ConfigurationError);
}
