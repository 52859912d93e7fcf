/**
 * @file test_result_exporter.cpp
 * @brief Unit tests for GDAL/OGR vector export
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/EnrichmentErrors.hpp"
#include "export/ResultExporter.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

using namespace geoenrich;
using ::testing::UnorderedElementsAre;

namespace {

std::filesystem::path scratch_file(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / "geo_enrich_tests";
    std::filesystem::create_directories(dir);
    return dir / name;
}

AnnotatedFeature school(const std::string& id, double lat, double lon, double miles) {
    AnnotatedFeature feature;
    feature.identity = id;
    feature.source_id = "nh_schools";
    feature.geometry = PointGeometry{Coordinate(lat, lon)};
    feature.distance_miles = miles;
    feature.attributes.canonical["name"] = "School " + id;
    return feature;
}

AnnotatedFeature town(const std::string& id) {
    AnnotatedFeature feature;
    feature.identity = id;
    feature.source_id = "nh_towns";
    feature.is_containing = true;
    feature.geometry = PolygonGeometry{{{
        Coordinate(42.9, -71.6), Coordinate(43.1, -71.6), Coordinate(43.1, -71.4),
        Coordinate(42.9, -71.4), Coordinate(42.9, -71.6)
    }}};
    return feature;
}

} // namespace

// =============================================================================
// Format selection
// =============================================================================

TEST(ResultExporterTest, FormatFromExtension) {
    EXPECT_EQ(ResultExporter::Format::GEOJSON, ResultExporter::format_for("out/result.geojson"));
    EXPECT_EQ(ResultExporter::Format::GEOJSON, ResultExporter::format_for("result.JSON"));
    EXPECT_EQ(ResultExporter::Format::GEOPACKAGE, ResultExporter::format_for("result.gpkg"));
    EXPECT_EQ(ResultExporter::Format::SHAPEFILE, ResultExporter::format_for("result.shp"));
    EXPECT_THROW(ResultExporter::format_for("result.kml"), ConfigurationError);
    EXPECT_THROW(ResultExporter::format_for("result"), ConfigurationError);
}

TEST(ResultExporterTest, DriverNames) {
    EXPECT_EQ("GeoJSON", ResultExporter::driver_name(ResultExporter::Format::GEOJSON));
    EXPECT_EQ("GPKG", ResultExporter::driver_name(ResultExporter::Format::GEOPACKAGE));
    EXPECT_EQ("ESRI Shapefile", ResultExporter::driver_name(ResultExporter::Format::SHAPEFILE));
}

// =============================================================================
// Export
// =============================================================================

TEST(ResultExporterTest, WritesGeoJsonWithAttributes) {
    std::map<std::string, ResultSet> result_sets;
    result_sets["nh_towns"].containing.push_back(town("concord"));
    result_sets["nh_schools"].nearby.push_back(school("12", 43.01, -71.5, 0.6912));

    const auto path = scratch_file("export.geojson");
    ResultExporter exporter;
    ASSERT_TRUE(exporter.export_results(result_sets, path.string()));

    std::ifstream in(path);
    nlohmann::json collection = nlohmann::json::parse(in);
    ASSERT_EQ(2u, collection["features"].size());

    std::vector<std::string> labels;
    for (const auto& feature : collection["features"]) {
        labels.push_back(feature["properties"]["label"].get<std::string>());
        if (feature["properties"]["identity"] == "12") {
            EXPECT_DOUBLE_EQ(0.69, feature["properties"]["distance_mi"].get<double>());
            EXPECT_EQ(0, feature["properties"]["containing"].get<int>());
            EXPECT_EQ("Point", feature["geometry"]["type"].get<std::string>());
            EXPECT_DOUBLE_EQ(-71.5, feature["geometry"]["coordinates"][0].get<double>());
        } else {
            EXPECT_EQ(1, feature["properties"]["containing"].get<int>());
            EXPECT_EQ("Polygon", feature["geometry"]["type"].get<std::string>());
        }
    }
    EXPECT_THAT(labels, UnorderedElementsAre("School 12", "concord"));
}

TEST(ResultExporterTest, OverwritesExistingFile) {
    const auto path = scratch_file("overwrite.geojson");
    ResultExporter exporter;
    ASSERT_TRUE(exporter.export_features({school("1", 43.0, -71.5, 0.1), school("2", 43.0, -71.5, 0.2)},
                                         path.string()));
    ASSERT_TRUE(exporter.export_features({school("3", 43.0, -71.5, 0.3)}, path.string()));

    std::ifstream in(path);
    nlohmann::json collection = nlohmann::json::parse(in);
    EXPECT_EQ(1u, collection["features"].size());
}

TEST(ResultExporterTest, ShapefileSplitsByGeometryKind) {
    const auto path = scratch_file("split.shp");
    ResultExporter exporter;
    ASSERT_TRUE(exporter.export_features({school("1", 43.0, -71.5, 0.1), town("concord")}, path.string()));

    EXPECT_TRUE(std::filesystem::exists(scratch_file("split_points.shp")));
    EXPECT_TRUE(std::filesystem::exists(scratch_file("split_polygons.shp")));
    EXPECT_FALSE(std::filesystem::exists(scratch_file("split_lines.shp")));
}
