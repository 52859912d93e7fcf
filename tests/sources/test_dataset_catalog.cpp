/**
 * @file test_dataset_catalog.cpp
 * @brief Unit tests for dataset catalog loading and validation
 */

#include <gtest/gtest.h>

#include "core/EnrichmentErrors.hpp"
#include "sources/DatasetCatalog.hpp"

using namespace geoenrich;
using json = nlohmann::json;

TEST(DatasetCatalogTest, MinimalEntryGetsDefaults) {
    auto config = DatasetCatalog::parse_dataset(json::parse(R"({"id": "parks", "url": "https://x.test/0/"})"));
    EXPECT_EQ("parks", config.id);
    EXPECT_EQ("parks", config.label);
    EXPECT_EQ("https://x.test/0", config.url);
    EXPECT_EQ(2000, config.page_size);
    EXPECT_EQ(50000, config.max_offset);
    EXPECT_DOUBLE_EQ(5.0, config.radius_cap_miles);
    EXPECT_TRUE(config.containing);
    EXPECT_TRUE(config.nearby);
    EXPECT_TRUE(config.identity_fields.empty());
    EXPECT_EQ("name", config.label_field);
}

TEST(DatasetCatalogTest, DefaultRadiusNeverExceedsCap) {
    auto config = DatasetCatalog::parse_dataset(
        json::parse(R"({"id": "hydrants", "url": "https://x.test/0", "radius_cap_miles": 1})"));
    EXPECT_DOUBLE_EQ(1.0, config.default_radius_miles);
}

TEST(DatasetCatalogTest, InvalidEntriesRejected) {
    EXPECT_THROW(DatasetCatalog::parse_dataset(json::parse(R"({"url": "https://x.test"})")), ConfigurationError);
    EXPECT_THROW(DatasetCatalog::parse_dataset(json::parse(R"({"id": "a", "url": "ftp://x"})")), ConfigurationError);
    EXPECT_THROW(DatasetCatalog::parse_dataset(
                     json::parse(R"({"id": "a", "url": "https://x", "page_size": 0})")), ConfigurationError);
    EXPECT_THROW(DatasetCatalog::parse_dataset(
                     json::parse(R"({"id": "a", "url": "https://x", "containing": false, "nearby": false})")),
                 ConfigurationError);
    EXPECT_THROW(DatasetCatalog::parse_dataset(
                     json::parse(R"({"id": "a", "url": "https://x", "page_size": "big"})")), ConfigurationError);
}

TEST(DatasetCatalogTest, DuplicateIdsRejected) {
    json doc = json::parse(R"({"datasets": [
        {"id": "a", "url": "https://x.test/0"},
        {"id": "a", "url": "https://x.test/1"}
    ]})");
    EXPECT_THROW(DatasetCatalog::from_json(doc), ConfigurationError);
}

TEST(DatasetCatalogTest, BareArrayAccepted) {
    auto catalog = DatasetCatalog::from_json(json::parse(R"([
        {"id": "a", "url": "https://x.test/0"},
        {"id": "b", "url": "https://x.test/1", "identity_fields": ["SITE_ID"]}
    ])"));
    EXPECT_EQ(2u, catalog.size());
    EXPECT_EQ(std::vector<std::string>({"a", "b"}), catalog.ids());
    ASSERT_NE(nullptr, catalog.find("b"));
    EXPECT_EQ("SITE_ID", catalog.find("b")->identity_fields.at(0));
    EXPECT_EQ(nullptr, catalog.find("c"));
}

TEST(DatasetCatalogTest, ShippedCatalogLoads) {
    auto catalog = DatasetCatalog::load_from_file(std::string(GEOENRICH_SOURCE_DIR) + "/config/datasets.json");
    EXPECT_GE(catalog.size(), 8u);
    for (const auto& dataset : catalog.datasets()) {
        EXPECT_FALSE(dataset.field_aliases.empty()) << dataset.id;
        EXPECT_LE(dataset.default_radius_miles, dataset.radius_cap_miles) << dataset.id;
    }
    EXPECT_TRUE(catalog.contains("nh_geographic_names"));
}

TEST(DatasetCatalogTest, MissingFileIsConfigurationError) {
    EXPECT_THROW(DatasetCatalog::load_from_file("/nonexistent/datasets.json"), ConfigurationError);
}
